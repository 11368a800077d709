#pragma once

#include "wrapindent/core/syntax_tree.hpp"
#include <map>
#include <optional>

namespace wrapindent {

// Source line -> leftmost node on that line, walked in ascending line order
using LineMap = std::map<int, NodeId>;

// Pure functions building the per-line view of a header span

// Makes id the representative of its line unless the current one sits
// strictly further left. Column ties replace.
auto record_first_node(const SyntaxTree& tree, LineMap& lines, NodeId id) -> void;

// Representatives of every line from first_node up to (excluding) last_node.
// Type bodies nested in the span are skipped with their whole subtree.
auto collect_first_nodes(const SyntaxTree& tree, NodeId first_node,
                         std::optional<NodeId> last_node) -> LineMap;

// Last token of the contiguous run of annotation clauses that starts at the
// clause owning at_node
auto find_last_annotation_node(const SyntaxTree& tree, NodeId at_node) -> NodeId;

// True when node is before or at the position of limit
auto is_at_or_before(const SyntaxNode& node, const SyntaxNode& limit) -> bool;

} // namespace wrapindent
