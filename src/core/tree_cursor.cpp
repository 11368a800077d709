#include "wrapindent/core/tree_cursor.hpp"

namespace wrapindent {

TreeCursor::TreeCursor(const SyntaxTree& tree, NodeId span_root)
    : tree_(&tree), span_root_(span_root), current_(span_root) {
    // Fail early on an id this tree never issued
    static_cast<void>(tree_->node(span_root_));
}

auto TreeCursor::advance() -> void {
    if (!current_) {
        return;
    }

    if (auto child = tree_->node(*current_).first_child) {
        current_ = child;
        return;
    }
    current_ = step_past(*current_);
}

auto TreeCursor::skip_subtree() -> void {
    if (!current_) {
        return;
    }
    current_ = step_past(*current_);
}

auto TreeCursor::step_past(NodeId id) const -> std::optional<NodeId> {
    std::optional<NodeId> node = id;

    while (node && *node != span_root_) {
        const auto& current = tree_->node(*node);
        if (current.next_sibling) {
            return current.next_sibling;
        }
        node = current.parent;
    }
    return std::nullopt;
}

} // namespace wrapindent
