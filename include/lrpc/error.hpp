#pragma once
#include <stdexcept>
#include <string>
#include <typeinfo>

namespace lrpc {

class LrpcError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Raised when a request envelope is not valid JSON or has the wrong shape.
class ParseError : public LrpcError {
public:
    using LrpcError::LrpcError;
};

/// Raised when call arguments cannot be decoded into the requested type.
class DecodeError : public LrpcError {
public:
    using LrpcError::LrpcError;
};

/// Raised by DirectCall when the destination type cannot hold the stored arguments.
class NotAssignableError : public LrpcError {
public:
    NotAssignableError(const std::type_info& from, const std::type_info& to)
        : LrpcError(std::string("type isn't assignable: ") + from.name() + " to " + to.name()) {}
};

/// Returned by ServeMux for methods nobody registered.
class MethodNotFoundError : public LrpcError {
public:
    MethodNotFoundError() : LrpcError("method not found") {}
};

class TransportError : public LrpcError {
public:
    using LrpcError::LrpcError;
};

} // namespace lrpc
