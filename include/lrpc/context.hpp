#pragma once
#include <any>
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <typeindex>
#include <typeinfo>

namespace lrpc {

/// Request-scoped context: cancellation, an optional deadline, and values
/// attached under key types.
///
/// A Context is an immutable chain of nodes; the with_* methods return a new
/// Context layered on top of this one. Copies share the chain, so cancelling
/// one copy is observed by every copy and by every context derived from it.
///
/// Keys are types exposing the stored value type:
///
///     struct UserKey { using type = std::string; };
///     auto ctx = Context::background().with_value<UserKey>("alice");
///     const std::string* user = ctx.value<UserKey>();
class Context {
public:
    using Clock = std::chrono::steady_clock;

    /// An empty context: never cancelled, no deadline, no values.
    Context() = default;

    static Context background() { return Context(); }

    [[nodiscard]] Context with_cancel() const;
    [[nodiscard]] Context with_deadline(Clock::time_point deadline) const;
    [[nodiscard]] Context with_timeout(Clock::duration timeout) const;

    template <typename Key>
    [[nodiscard]] Context with_value(typename Key::type value) const {
        auto node = std::make_shared<Node>();
        node->parent = node_;
        node->key = std::type_index(typeid(Key));
        node->value = std::move(value);
        return Context(std::move(node));
    }

    /// Returns the innermost value stored under Key, or nullptr.
    template <typename Key>
    [[nodiscard]] const typename Key::type* value() const {
        const std::any* v = find(std::type_index(typeid(Key)));
        return v ? std::any_cast<typename Key::type>(v) : nullptr;
    }

    /// Cancel the innermost cancellable scope. No-op on a context without one.
    void cancel() const;

    [[nodiscard]] bool cancelled() const;

    /// Earliest deadline along the chain.
    [[nodiscard]] std::optional<Clock::time_point> deadline() const;

    /// True once cancelled or past the deadline.
    [[nodiscard]] bool done() const;

private:
    struct Node {
        std::shared_ptr<const Node> parent;
        std::optional<std::type_index> key;
        std::any value;
        std::shared_ptr<std::atomic<bool>> cancel_flag;
        std::optional<Clock::time_point> deadline;
    };

    explicit Context(std::shared_ptr<const Node> node) : node_(std::move(node)) {}

    const std::any* find(std::type_index key) const;

    std::shared_ptr<const Node> node_;
};

} // namespace lrpc
