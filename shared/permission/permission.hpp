#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "result.h"
#include "caller_context.hpp"

namespace permission {

using Predicate = std::function<bool(const chat::CallerContext&)>;

enum class NodeKind { Leaf, And, Or, Not };

// Binary combinators accepted by merge()
enum class Combinator { And, Or };

/**
 * Immutable handle to a node of a permission expression tree.
 *
 * Copies share the node, and node identity is what And/Or child sets
 * deduplicate on: allOf(p, p) has a single child.
 * A default constructed handle is empty and never grants.
 */
class Permission {
public:
    Permission() = default;

    static Permission leaf(std::string name, Predicate predicate);

    [[nodiscard]] bool empty() const noexcept { return node_ == nullptr; }
    [[nodiscard]] NodeKind kind() const noexcept;
    // leaf label; empty for combinators
    [[nodiscard]] const std::string& name() const noexcept;
    [[nodiscard]] std::vector<Permission> children() const;

    [[nodiscard]] bool evaluate(const chat::CallerContext& context) const;

    // "(UserName(alice) & ~GroupAdmin)"
    [[nodiscard]] std::string describe() const;

    bool operator==(const Permission& other) const noexcept { return node_ == other.node_; }
    bool operator!=(const Permission& other) const noexcept { return node_ != other.node_; }

private:
    struct Node;
    explicit Permission(std::shared_ptr<const Node> node) : node_(std::move(node)) {}

    std::shared_ptr<const Node> node_;

    friend Permission negate(const Permission& permission);
    friend Result<Permission> merge(const Permission& lhs, const Permission& rhs, Combinator op);
    friend Result<Permission> combine(const std::vector<Permission>& permissions, Combinator op);
};

Permission negate(const Permission& permission);

// lhs op rhs. An operand that is already an op-node contributes its children
// instead of being nested; And and Or never flatten into each other.
// Fails with PermissionConstructionError for an unsupported combinator or an empty operand.
Result<Permission> merge(const Permission& lhs, const Permission& rhs, Combinator op);

// Folds the list left to right with merge(). An empty list is a PermissionConstructionError.
Result<Permission> combine(const std::vector<Permission>& permissions, Combinator op);

Permission allOf(const Permission& lhs, const Permission& rhs);
Permission anyOf(const Permission& lhs, const Permission& rhs);

inline bool evaluate(const Permission& permission, const chat::CallerContext& context) {
    return permission.evaluate(context);
}

} // namespace permission
