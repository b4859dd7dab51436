#include "lrpc/context.hpp"

namespace lrpc {

Context Context::with_cancel() const {
    auto node = std::make_shared<Node>();
    node->parent = node_;
    node->cancel_flag = std::make_shared<std::atomic<bool>>(false);
    return Context(std::move(node));
}

Context Context::with_deadline(Clock::time_point deadline) const {
    auto node = std::make_shared<Node>();
    node->parent = node_;
    node->deadline = deadline;
    return Context(std::move(node));
}

Context Context::with_timeout(Clock::duration timeout) const {
    return with_deadline(Clock::now() + timeout);
}

void Context::cancel() const {
    for (const Node* n = node_.get(); n; n = n->parent.get()) {
        if (n->cancel_flag) {
            n->cancel_flag->store(true);
            return;
        }
    }
}

bool Context::cancelled() const {
    for (const Node* n = node_.get(); n; n = n->parent.get()) {
        if (n->cancel_flag && n->cancel_flag->load()) return true;
    }
    return false;
}

std::optional<Context::Clock::time_point> Context::deadline() const {
    std::optional<Clock::time_point> earliest;
    for (const Node* n = node_.get(); n; n = n->parent.get()) {
        if (n->deadline && (!earliest || *n->deadline < *earliest)) {
            earliest = n->deadline;
        }
    }
    return earliest;
}

bool Context::done() const {
    if (cancelled()) return true;
    auto d = deadline();
    return d && Clock::now() >= *d;
}

const std::any* Context::find(std::type_index key) const {
    for (const Node* n = node_.get(); n; n = n->parent.get()) {
        if (n->key && *n->key == key) return &n->value;
    }
    return nullptr;
}

} // namespace lrpc
