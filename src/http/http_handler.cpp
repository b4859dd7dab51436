#include "lrpc/http/http_handler.hpp"
#include "lrpc/error.hpp"

#include <httplib.h>

#include <stdexcept>
#include <string>
#include <utility>

namespace lrpc::http {

namespace {

struct RequestKey {
    using type = const httplib::Request*;
};

struct ResponseKey {
    using type = httplib::Response*;
};

constexpr const char* kTextContentType = "text/plain; charset=utf-8";

// Cancels the request context once the exchange is over.
class CancelOnExit {
public:
    explicit CancelOnExit(const Context& ctx) : ctx_(ctx) {}
    ~CancelOnExit() { ctx_.cancel(); }

    CancelOnExit(const CancelOnExit&) = delete;
    CancelOnExit& operator=(const CancelOnExit&) = delete;

private:
    const Context& ctx_;
};

void report(const ErrorCallback& on_error, std::exception_ptr e) {
    if (on_error) on_error(std::move(e));
}

void write_error(httplib::Response& res, int status, const std::string& message) {
    res.status = status;
    res.set_content(message + "\n", kTextContentType);
}

} // anonymous namespace

HttpHandlerFunc http_handler(std::shared_ptr<Codec> codec,
                             std::shared_ptr<Handler> handler,
                             HttpHandlerOptions opts) {
    if (!codec || !handler) {
        throw std::invalid_argument("http_handler requires a codec and a handler");
    }

    return [codec = std::move(codec), handler = std::move(handler), opts = std::move(opts)](
               const httplib::Request& req, httplib::Response& res) {
        Context ctx = Context::background().with_cancel();
        CancelOnExit guard(ctx);
        if (opts.request_timeout.count() > 0) {
            ctx = ctx.with_timeout(opts.request_timeout);
        }
        ctx = ctx.with_value<RequestKey>(&req).with_value<ResponseKey>(&res);

        std::unique_ptr<Call> call;
        try {
            call = codec->new_call(ctx, res, req);
        } catch (const std::exception& e) {
            write_error(res, 400, e.what());
            report(opts.on_error, std::current_exception());
            return;
        }
        if (!call) {
            write_error(res, 400, "codec produced no call");
            report(opts.on_error, std::make_exception_ptr(TransportError("codec produced no call")));
            return;
        }

        Result result;
        try {
            result = handler->serve(*call);
        } catch (const std::exception&) {
            result = Failure(std::current_exception());
        }

        try {
            codec->respond(*call, result);
        } catch (const std::exception& e) {
            // Part of the response may already be written; this is best effort.
            write_error(res, 500, e.what());
            report(opts.on_error, std::current_exception());
        }
    };
}

const httplib::Request* context_request(const Context& ctx) {
    const auto* req = ctx.value<RequestKey>();
    return req ? *req : nullptr;
}

httplib::Response* context_response(const Context& ctx) {
    const auto* res = ctx.value<ResponseKey>();
    return res ? *res : nullptr;
}

} // namespace lrpc::http
