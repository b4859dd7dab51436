#include "lrpc/call.hpp"

namespace lrpc {

void DirectCall::unmarshal_into(ArgsSink& sink) {
    if (sink.type() == args_.type()) {
        sink.assign(args_);
        return;
    }
    if (sink.type() == typeid(nlohmann::json) && encode_) {
        nlohmann::json encoded;
        try {
            encoded = encode_();
        } catch (const nlohmann::json::exception& e) {
            throw DecodeError(e.what());
        }
        sink.decode(encoded);
        return;
    }
    if (const auto* j = std::any_cast<nlohmann::json>(&args_)) {
        sink.decode(*j);
        return;
    }
    throw NotAssignableError(args_.type(), sink.type());
}

} // namespace lrpc
