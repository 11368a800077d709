#pragma once

#include "wrapindent/core/syntax_tree.hpp"
#include <optional>

namespace wrapindent {

// Depth-first, document-order walk over the subtree of span_root.
// Starts at span_root itself and never leaves its subtree.
class TreeCursor {
public:
    TreeCursor(const SyntaxTree& tree, NodeId span_root);

    auto done() const -> bool { return !current_.has_value(); }

    // Precondition: !done()
    auto current() const -> NodeId { return *current_; }

    // First child, else next sibling, else the nearest ancestor's next sibling
    auto advance() -> void;

    // Moves to whatever follows the current node's subtree
    auto skip_subtree() -> void;

private:
    auto step_past(NodeId id) const -> std::optional<NodeId>;

    const SyntaxTree* tree_;
    NodeId span_root_;
    std::optional<NodeId> current_;
};

} // namespace wrapindent
