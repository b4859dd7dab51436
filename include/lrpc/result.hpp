#pragma once
#include <exception>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <nlohmann/json.hpp>

namespace lrpc {

/// Error alternative of a Result. Holds any std::exception-derived error by
/// value, so handlers can return errors without throwing them.
class Failure {
public:
    /// Throws std::invalid_argument for a null exception_ptr or one that does
    /// not hold a std::exception.
    explicit Failure(std::exception_ptr error);

    template <typename E,
              typename = std::enable_if_t<std::is_base_of_v<std::exception, std::decay_t<E>>>>
    Failure(E&& error)
        : error_(std::make_exception_ptr(std::forward<E>(error))) {}

    /// The error's what() text.
    [[nodiscard]] std::string message() const;

    template <typename E>
    [[nodiscard]] bool is() const {
        return as<E>().has_value();
    }

    /// A copy of the error if it is an E (or derives from it).
    template <typename E>
    [[nodiscard]] std::optional<E> as() const {
        try {
            std::rethrow_exception(error_);
        } catch (const E& e) {
            return e;
        } catch (const std::exception&) {
        }
        return std::nullopt;
    }

    [[noreturn]] void rethrow() const { std::rethrow_exception(error_); }

    [[nodiscard]] const std::exception_ptr& exception() const noexcept { return error_; }

private:
    std::exception_ptr error_;
};

using Result = std::variant<nlohmann::json, Failure>;

inline bool is_failure(const Result& r) noexcept {
    return std::holds_alternative<Failure>(r);
}

} // namespace lrpc
