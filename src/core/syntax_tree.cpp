#include "wrapindent/core/syntax_tree.hpp"
#include "wrapindent/core/tree_cursor.hpp"
#include <stdexcept>
#include <unordered_map>

namespace wrapindent {

auto SyntaxTree::add_root(NodeKind kind, std::string type_name, std::string text, int line,
                          int column) -> NodeId {
    if (root_) {
        throw std::logic_error("syntax tree already has a root");
    }

    NodeId id = nodes_.size();
    nodes_.push_back(SyntaxNode{.kind = kind,
                                .type_name = std::move(type_name),
                                .text = std::move(text),
                                .line = line,
                                .column = column,
                                .parent = std::nullopt,
                                .first_child = std::nullopt,
                                .last_child = std::nullopt,
                                .previous_sibling = std::nullopt,
                                .next_sibling = std::nullopt});
    root_ = id;
    return id;
}

auto SyntaxTree::add_child(NodeId parent, NodeKind kind, std::string type_name, std::string text,
                           int line, int column) -> NodeId {
    // Validates parent before the arena grows
    auto previous = node(parent).last_child;

    NodeId id = nodes_.size();
    nodes_.push_back(SyntaxNode{.kind = kind,
                                .type_name = std::move(type_name),
                                .text = std::move(text),
                                .line = line,
                                .column = column,
                                .parent = parent,
                                .first_child = std::nullopt,
                                .last_child = std::nullopt,
                                .previous_sibling = previous,
                                .next_sibling = std::nullopt});

    auto& parent_node = nodes_[parent];
    if (previous) {
        nodes_[*previous].next_sibling = id;
    } else {
        parent_node.first_child = id;
    }
    parent_node.last_child = id;

    return id;
}

auto SyntaxTree::node(NodeId id) const -> const SyntaxNode& {
    return nodes_.at(id);
}

auto kind_from_type_name(std::string_view type_name) -> NodeKind {
    static const std::unordered_map<std::string_view, NodeKind> kinds{
        {"AT", NodeKind::ANNOTATION_MARKER},
        {"LITERAL_IF", NodeKind::IF_CONSTRUCT},
        {"LITERAL_ELSE", NodeKind::ELSE_CONSTRUCT},
        {"RCURLY", NodeKind::CLOSE_BRACE},
        {"RPAREN", NodeKind::CLOSE_PAREN},
        {"ARRAY_INIT", NodeKind::ARRAY_INITIALIZER},
        {"OBJBLOCK", NodeKind::TYPE_BODY},
        {"MODIFIERS", NodeKind::MODIFIER_LIST},
        {"ANNOTATION", NodeKind::ANNOTATION_CLAUSE},
        {"SLIST", NodeKind::BLOCK}};

    auto it = kinds.find(type_name);
    return it != kinds.end() ? it->second : NodeKind::OTHER;
}

auto find_nodes(const SyntaxTree& tree, const std::unordered_set<std::string>& type_names)
    -> std::vector<NodeId> {
    std::vector<NodeId> found;
    if (!tree.root()) {
        return found;
    }

    for (TreeCursor cursor(tree, *tree.root()); !cursor.done(); cursor.advance()) {
        if (type_names.contains(tree.node(cursor.current()).type_name)) {
            found.push_back(cursor.current());
        }
    }
    return found;
}

} // namespace wrapindent
