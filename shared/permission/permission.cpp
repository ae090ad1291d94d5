#include "permission.hpp"

#include <algorithm>

namespace permission {

struct Permission::Node {
    NodeKind kind = NodeKind::Leaf;
    std::string name;
    Predicate predicate;
    // insertion ordered, unique by identity
    std::vector<std::shared_ptr<const Node>> children;
};

Permission Permission::leaf(std::string name, Predicate predicate) {
    auto node = std::make_shared<Node>();
    node->kind = NodeKind::Leaf;
    node->name = std::move(name);
    node->predicate = std::move(predicate);
    return Permission(std::move(node));
}

NodeKind Permission::kind() const noexcept {
    return node_ ? node_->kind : NodeKind::Leaf;
}

const std::string& Permission::name() const noexcept {
    static const std::string none;
    return node_ ? node_->name : none;
}

std::vector<Permission> Permission::children() const {
    std::vector<Permission> out;
    if (!node_) return out;
    out.reserve(node_->children.size());
    for (const auto& child : node_->children) {
        out.push_back(Permission(child));
    }
    return out;
}

bool Permission::evaluate(const chat::CallerContext& context) const {
    if (!node_) return false;

    switch (node_->kind) {
        case NodeKind::Leaf:
            return node_->predicate ? node_->predicate(context) : false;
        case NodeKind::Not:
            return !Permission(node_->children.front()).evaluate(context);
        case NodeKind::And:
            return std::all_of(node_->children.begin(), node_->children.end(),
                [&context](const std::shared_ptr<const Node>& child) {
                    return Permission(child).evaluate(context);
                });
        case NodeKind::Or:
            return std::any_of(node_->children.begin(), node_->children.end(),
                [&context](const std::shared_ptr<const Node>& child) {
                    return Permission(child).evaluate(context);
                });
    }
    return false;
}

std::string Permission::describe() const {
    if (!node_) return "<empty>";

    switch (node_->kind) {
        case NodeKind::Leaf:
            return node_->name;
        case NodeKind::Not:
            return "~" + Permission(node_->children.front()).describe();
        case NodeKind::And:
        case NodeKind::Or: {
            const char* separator = node_->kind == NodeKind::And ? " & " : " | ";
            std::string out = "(";
            for (size_t i = 0; i < node_->children.size(); ++i) {
                if (i > 0) out += separator;
                out += Permission(node_->children[i]).describe();
            }
            return out + ")";
        }
    }
    return "<invalid>";
}

Permission negate(const Permission& permission) {
    auto node = std::make_shared<Permission::Node>();
    node->kind = NodeKind::Not;
    node->name.clear();
    if (permission.node_) node->children.push_back(permission.node_);
    else node->children.push_back(Permission::leaf("<empty>", Predicate()).node_);
    return Permission(std::move(node));
}

Result<Permission> merge(const Permission& lhs, const Permission& rhs, Combinator op) {
    NodeKind kind;
    switch (op) {
        case Combinator::And: kind = NodeKind::And; break;
        case Combinator::Or:  kind = NodeKind::Or;  break;
        default:
            return Result<Permission>::Error(ResultCode::PermissionConstructionError,
                "only And and Or combinators are supported");
    }
    if (lhs.empty() || rhs.empty()) {
        return Result<Permission>::Error(ResultCode::PermissionConstructionError,
            "cannot combine an empty permission");
    }

    auto node = std::make_shared<Permission::Node>();
    node->kind = kind;

    auto& children = node->children;
    for (const Permission* operand : { &lhs, &rhs }) {
        std::vector<std::shared_ptr<const Permission::Node>> joining;
        if (operand->node_->kind == kind) joining = operand->node_->children;
        else joining.push_back(operand->node_);

        for (const auto& child : joining) {
            if (std::find(children.begin(), children.end(), child) == children.end()) {
                children.push_back(child);
            }
        }
    }
    return Result<Permission>::OK(Permission(std::move(node)));
}

Result<Permission> combine(const std::vector<Permission>& permissions, Combinator op) {
    if (permissions.empty()) {
        return Result<Permission>::Error(ResultCode::PermissionConstructionError,
            "a combined permission needs at least one operand");
    }
    if (op != Combinator::And && op != Combinator::Or) {
        return Result<Permission>::Error(ResultCode::PermissionConstructionError,
            "only And and Or combinators are supported");
    }
    if (permissions.size() == 1) {
        if (permissions.front().empty()) {
            return Result<Permission>::Error(ResultCode::PermissionConstructionError,
                "cannot combine an empty permission");
        }
        return Result<Permission>::OK(permissions.front());
    }

    Permission folded = permissions.front();
    for (size_t i = 1; i < permissions.size(); ++i) {
        auto merged = merge(folded, permissions[i], op);
        if (!merged) return merged;
        folded = merged.value();
    }
    return Result<Permission>::OK(folded);
}

// An empty operand is the identity here, so these never fail.
Permission allOf(const Permission& lhs, const Permission& rhs) {
    if (lhs.empty()) return rhs;
    if (rhs.empty()) return lhs;
    return merge(lhs, rhs, Combinator::And).value();
}

Permission anyOf(const Permission& lhs, const Permission& rhs) {
    if (lhs.empty()) return rhs;
    if (rhs.empty()) return lhs;
    return merge(lhs, rhs, Combinator::Or).value();
}

} // namespace permission
