#include "lrpc/json2/codec.hpp"
#include "lrpc/error.hpp"

#include <httplib.h>

#include <string>
#include <utility>

namespace lrpc::json2 {

namespace {

struct RequestKey {
    using type = std::shared_ptr<const Request>;
};

constexpr const char* kJsonContentType = "application/json; charset=utf-8";

class JsonCall : public Call {
public:
    JsonCall(Context ctx, std::shared_ptr<const Request> req)
        : ctx_(std::move(ctx))
        , req_(std::move(req)) {}

    const Context& context() const override { return ctx_; }
    const std::string& method() const override { return req_->method; }

protected:
    void unmarshal_into(ArgsSink& sink) override {
        if (consumed_) {
            throw DecodeError("params already unmarshalled");
        }
        consumed_ = true;
        sink.decode(req_->params ? req_->params->parse() : nlohmann::json(nullptr));
    }

private:
    Context ctx_;
    std::shared_ptr<const Request> req_;
    bool consumed_{false};
};

} // anonymous namespace

std::unique_ptr<Call> Codec::new_call(Context ctx,
                                      httplib::Response& /*res*/,
                                      const httplib::Request& req) {
    auto parsed = std::make_shared<const Request>(parse_request(req.body));
    ctx = ctx.with_value<RequestKey>(parsed);
    return std::make_unique<JsonCall>(std::move(ctx), std::move(parsed));
}

void Codec::respond(Call& call, const Result& result) {
    httplib::Response* res = http::context_response(call.context());
    if (!res) {
        throw TransportError("call context carries no HTTP response");
    }
    const Request* req = context_request(call.context());
    if (!req) {
        throw TransportError("call context carries no JSON-RPC request");
    }

    Response resp;
    resp.id = req->id.value_or(RawMessage());
    if (const auto* failure = std::get_if<Failure>(&result)) {
        resp.error = to_error(*failure);
    } else {
        resp.result = std::get<nlohmann::json>(result);
    }

    res->set_content(encode(resp), kJsonContentType);
}

const Request* context_request(const Context& ctx) {
    const auto* req = ctx.value<RequestKey>();
    return req ? req->get() : nullptr;
}

Error to_error(const Failure& failure) {
    if (auto err = failure.as<Error>()) {
        return *err;
    }
    return Error(ErrCode::Server, failure.message());
}

} // namespace lrpc::json2
