#pragma once
#include "json2.hpp"
#include "../http/http_handler.hpp"
#include <memory>

namespace lrpc::json2 {

/// http::Codec speaking JSON-RPC 2.0:
///
///     server.Post("/rpc", http::http_handler(std::make_shared<json2::Codec>(), mux));
///
/// Handler failures become error objects: a json2::Error is sent as-is, any
/// other error as {code: -32000, message: what()}.
class Codec : public http::Codec {
public:
    /// Throws ParseError if the body is not a request object.
    [[nodiscard]] std::unique_ptr<Call> new_call(Context ctx,
                                                 httplib::Response& res,
                                                 const httplib::Request& req) override;

    /// Throws TransportError if the call was not produced by new_call behind
    /// http_handler.
    void respond(Call& call, const Result& result) override;
};

/// The parsed request behind a context produced by Codec::new_call, or nullptr.
[[nodiscard]] const Request* context_request(const Context& ctx);

/// Map a handler failure to the error object sent on the wire.
[[nodiscard]] Error to_error(const Failure& failure);

} // namespace lrpc::json2
