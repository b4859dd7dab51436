#pragma once
#include "call.hpp"
#include "result.hpp"
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>

namespace lrpc {

/// Processes a Call and produces its result. Errors are returned as a
/// Failure rather than thrown.
class Handler {
public:
    virtual ~Handler() = default;
    virtual Result serve(Call& call) = 0;
};

using HandlerFunction = std::function<Result(Call&)>;

/// Adapts a plain function to the Handler interface.
class HandlerFunc : public Handler {
public:
    explicit HandlerFunc(HandlerFunction fn);

    Result serve(Call& call) override;

private:
    HandlerFunction fn_;
};

/// Routes calls to the Handler registered for their method name. Lookups
/// are exact string matches; unknown methods yield MethodNotFoundError.
///
/// Registration returns the mux so it can be chained:
///
///     auto mux = std::make_shared<ServeMux>();
///     mux->handle_func("Echo", echo).handle("Sum", sum_handler);
///
/// Not synchronised: finish registering before serving.
class ServeMux : public Handler {
public:
    /// Register handler for method, replacing any earlier registration.
    /// Throws std::invalid_argument for a null handler.
    ServeMux& handle(const std::string& method, std::shared_ptr<Handler> handler);

    ServeMux& handle_func(const std::string& method, HandlerFunction fn);

    Result serve(Call& call) override;

    [[nodiscard]] bool has_handler(const std::string& method) const;

private:
    std::unordered_map<std::string, std::shared_ptr<Handler>> handlers_;
};

} // namespace lrpc
