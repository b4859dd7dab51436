#include "lrpc/result.hpp"
#include <stdexcept>

namespace lrpc {

Failure::Failure(std::exception_ptr error)
    : error_(std::move(error)) {
    if (!error_) {
        throw std::invalid_argument("Failure requires a non-null exception");
    }
    // message() and as<E>() only look through std::exception.
    try {
        std::rethrow_exception(error_);
    } catch (const std::exception&) {
        return;
    } catch (...) {
        throw std::invalid_argument("Failure requires a std::exception-derived error");
    }
}

std::string Failure::message() const {
    try {
        std::rethrow_exception(error_);
    } catch (const std::exception& e) {
        return e.what();
    }
    return {};
}

} // namespace lrpc
