#include "wrapindent/core/line_map.hpp"
#include "wrapindent/core/tree_cursor.hpp"

namespace wrapindent {

auto record_first_node(const SyntaxTree& tree, LineMap& lines, NodeId id) -> void {
    const auto& node = tree.node(id);
    auto it = lines.find(node.line);

    if (it == lines.end()) {
        lines.emplace(node.line, id);
    } else if (tree.node(it->second).column >= node.column) {
        it->second = id;
    }
}

auto collect_first_nodes(const SyntaxTree& tree, NodeId first_node,
                         std::optional<NodeId> last_node) -> LineMap {
    LineMap lines;

    TreeCursor cursor(tree, first_node);
    while (!cursor.done() && cursor.current() != last_node) {
        NodeId id = cursor.current();

        // Nested class/enum bodies are a scope of their own
        if (tree.node(id).kind == NodeKind::TYPE_BODY) {
            cursor.skip_subtree();
            continue;
        }

        record_first_node(tree, lines, id);
        cursor.advance();
    }

    return lines;
}

auto find_last_annotation_node(const SyntaxTree& tree, NodeId at_node) -> NodeId {
    auto clause = tree.node(at_node).parent;
    if (!clause) {
        return at_node;
    }

    auto next = tree.node(*clause).next_sibling;
    while (next && tree.node(*next).kind == NodeKind::ANNOTATION_CLAUSE) {
        clause = next;
        next = tree.node(*clause).next_sibling;
    }

    return tree.node(*clause).last_child.value_or(*clause);
}

auto is_at_or_before(const SyntaxNode& node, const SyntaxNode& limit) -> bool {
    return node.line < limit.line || (node.line == limit.line && node.column <= limit.column);
}

} // namespace wrapindent
