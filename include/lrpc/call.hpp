#pragma once
#include "context.hpp"
#include "error.hpp"
#include "result.hpp"
#include <any>
#include <functional>
#include <optional>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <nlohmann/json.hpp>

namespace lrpc {

namespace detail {

template <typename T, typename = void>
struct is_json_decodable : std::false_type {};

template <typename T>
struct is_json_decodable<T, std::void_t<decltype(std::declval<const nlohmann::json&>().template get<T>())>>
    : std::true_type {};

template <typename T, typename = void>
struct is_json_encodable : std::false_type {};

template <typename T>
struct is_json_encodable<T, std::void_t<decltype(nlohmann::json(std::declval<const T&>()))>>
    : std::true_type {};

} // namespace detail

/// Destination slot for call arguments. A Call implementation picks whichever
/// operation matches the form its arguments are stored in.
class ArgsSink {
public:
    virtual ~ArgsSink() = default;

    [[nodiscard]] virtual const std::type_info& type() const noexcept = 0;

    /// Copy a value of exactly type(). Throws NotAssignableError otherwise.
    virtual void assign(const std::any& value) = 0;

    /// Decode from JSON. Throws DecodeError on malformed input or type mismatch.
    virtual void decode(const nlohmann::json& value) = 0;
};

template <typename T>
class TypedArgsSink final : public ArgsSink {
public:
    explicit TypedArgsSink(T& out) : out_(out) {}

    const std::type_info& type() const noexcept override { return typeid(T); }

    void assign(const std::any& value) override {
        const T* v = std::any_cast<T>(&value);
        if (!v) throw NotAssignableError(value.type(), typeid(T));
        out_ = *v;
    }

    void decode(const nlohmann::json& value) override {
        if constexpr (detail::is_json_decodable<T>::value) {
            try {
                out_ = value.get<T>();
            } catch (const nlohmann::json::exception& e) {
                throw DecodeError(e.what());
            }
        } else {
            (void)value;
            throw DecodeError(std::string("type cannot be decoded from JSON: ") + typeid(T).name());
        }
    }

private:
    T& out_;
};

/// An RPC invocation currently being processed.
class Call {
public:
    virtual ~Call() = default;

    /// The same Context object is returned on every call.
    [[nodiscard]] virtual const Context& context() const = 0;

    [[nodiscard]] virtual const std::string& method() const = 0;

    /// Decode the call's arguments into out. Returns the DecodeError or
    /// NotAssignableError as a Failure instead of throwing it. Call at most
    /// once per Call.
    template <typename T>
    [[nodiscard]] std::optional<Failure> unmarshal_args(T& out) {
        TypedArgsSink<T> sink(out);
        try {
            unmarshal_into(sink);
        } catch (const LrpcError&) {
            return Failure(std::current_exception());
        }
        return std::nullopt;
    }

protected:
    virtual void unmarshal_into(ArgsSink& sink) = 0;
};

/// Call implementation holding already-typed arguments, for invoking a
/// Handler in-process without any transport:
///
///     DirectCall call(ctx.with_timeout(5s), "Echo", 42);
///     Result r = handler.serve(call);
///
/// Arguments can be unmarshalled into the exact argument type, into
/// nlohmann::json when the arguments are JSON-serializable, or, when the
/// arguments are themselves a nlohmann::json, into anything JSON-decodable.
class DirectCall : public Call {
public:
    template <typename Args>
    DirectCall(std::string method, Args args)
        : DirectCall(Context::background(), std::move(method), std::move(args)) {}

    template <typename Args>
    DirectCall(Context ctx, std::string method, Args args)
        : ctx_(std::move(ctx))
        , method_(std::move(method)) {
        if constexpr (detail::is_json_encodable<Args>::value) {
            encode_ = [args]() { return nlohmann::json(args); };
        }
        args_ = std::move(args);
    }

    const Context& context() const override { return ctx_; }
    const std::string& method() const override { return method_; }

protected:
    void unmarshal_into(ArgsSink& sink) override;

private:
    Context ctx_;
    std::string method_;
    std::any args_;
    std::function<nlohmann::json()> encode_;
};

} // namespace lrpc
