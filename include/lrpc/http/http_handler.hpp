#pragma once
#include "../call.hpp"
#include "../context.hpp"
#include "../handler.hpp"
#include "../result.hpp"
#include <chrono>
#include <exception>
#include <functional>
#include <memory>

// Forward declarations to avoid including heavy httplib header
namespace httplib {
    struct Request;
    struct Response;
}

namespace lrpc::http {

/// Translates HTTP exchanges to Calls and Results back to HTTP, following
/// one wire protocol.
class Codec {
public:
    virtual ~Codec() = default;

    /// Build a Call for an incoming request. The Call's context must be ctx
    /// or derived from it. Any exception is reported to the client as a 400.
    [[nodiscard]] virtual std::unique_ptr<Call> new_call(Context ctx,
                                                         httplib::Response& res,
                                                         const httplib::Request& req) = 0;

    /// Encode result onto the response found through context_response().
    /// Any exception is reported to the client as a 500.
    virtual void respond(Call& call, const Result& result) = 0;
};

using HttpHandlerFunc = std::function<void(const httplib::Request&, httplib::Response&)>;
using ErrorCallback = std::function<void(std::exception_ptr)>;

struct HttpHandlerOptions {
    /// Deadline applied to each request context; zero means none.
    std::chrono::milliseconds request_timeout{0};
    /// Invoked for every request answered with a 400 or 500.
    ErrorCallback on_error;
};

/// Combine a codec and a handler into an httplib route handler:
///
///     server.Post("/rpc", http_handler(std::make_shared<json2::Codec>(), mux));
[[nodiscard]] HttpHandlerFunc http_handler(std::shared_ptr<Codec> codec,
                                           std::shared_ptr<Handler> handler,
                                           HttpHandlerOptions opts = {});

/// The request a context built by http_handler belongs to, or nullptr.
[[nodiscard]] const httplib::Request* context_request(const Context& ctx);

/// The response a context built by http_handler writes to, or nullptr.
[[nodiscard]] httplib::Response* context_response(const Context& ctx);

} // namespace lrpc::http
