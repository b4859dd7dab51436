#include "lrpc/handler.hpp"
#include "lrpc/error.hpp"
#include <stdexcept>

namespace lrpc {

HandlerFunc::HandlerFunc(HandlerFunction fn)
    : fn_(std::move(fn)) {
}

Result HandlerFunc::serve(Call& call) {
    return fn_(call);
}

ServeMux& ServeMux::handle(const std::string& method, std::shared_ptr<Handler> handler) {
    if (!handler) {
        throw std::invalid_argument("ServeMux: null handler for method '" + method + "'");
    }
    handlers_[method] = std::move(handler);
    return *this;
}

ServeMux& ServeMux::handle_func(const std::string& method, HandlerFunction fn) {
    if (!fn) {
        throw std::invalid_argument("ServeMux: empty function for method '" + method + "'");
    }
    return handle(method, std::make_shared<HandlerFunc>(std::move(fn)));
}

Result ServeMux::serve(Call& call) {
    auto it = handlers_.find(call.method());
    if (it == handlers_.end()) {
        return Failure(MethodNotFoundError{});
    }
    return it->second->serve(call);
}

bool ServeMux::has_handler(const std::string& method) const {
    return handlers_.count(method) > 0;
}

} // namespace lrpc
