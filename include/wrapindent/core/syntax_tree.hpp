#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace wrapindent {

// Index of a node inside its SyntaxTree arena
using NodeId = std::size_t;

// Token kinds the line-wrap verifier distinguishes
enum class NodeKind {
    ANNOTATION_MARKER,  // AT
    IF_CONSTRUCT,       // LITERAL_IF
    ELSE_CONSTRUCT,     // LITERAL_ELSE
    CLOSE_BRACE,        // RCURLY
    CLOSE_PAREN,        // RPAREN
    ARRAY_INITIALIZER,  // ARRAY_INIT
    TYPE_BODY,          // OBJBLOCK
    MODIFIER_LIST,      // MODIFIERS
    ANNOTATION_CLAUSE,  // ANNOTATION
    BLOCK,              // SLIST
    OTHER
};

struct SyntaxNode {
    NodeKind kind{NodeKind::OTHER};
    std::string type_name;  // Collaborator's token type, e.g. "METHOD_DEF"
    std::string text;
    int line{};
    int column{};

    std::optional<NodeId> parent;
    std::optional<NodeId> first_child;
    std::optional<NodeId> last_child;
    std::optional<NodeId> previous_sibling;
    std::optional<NodeId> next_sibling;
};

// Arena-owned tree. Links are indices, so nodes never own each other and the
// builder keeps parent/child/sibling links consistent.
class SyntaxTree {
public:
    auto add_root(NodeKind kind, std::string type_name, std::string text, int line, int column)
        -> NodeId;

    // Appends a new node as the last child of parent
    auto add_child(NodeId parent, NodeKind kind, std::string type_name, std::string text,
                   int line, int column) -> NodeId;

    // Throws std::out_of_range for an id not issued by this tree
    auto node(NodeId id) const -> const SyntaxNode&;

    auto root() const -> std::optional<NodeId> { return root_; }
    auto size() const -> std::size_t { return nodes_.size(); }
    auto empty() const -> bool { return nodes_.empty(); }

private:
    std::vector<SyntaxNode> nodes_;
    std::optional<NodeId> root_;
};

// Maps a collaborator token type name onto the verifier's vocabulary
auto kind_from_type_name(std::string_view type_name) -> NodeKind;

// All nodes whose type name is in type_names, in document order
auto find_nodes(const SyntaxTree& tree, const std::unordered_set<std::string>& type_names)
    -> std::vector<NodeId>;

} // namespace wrapindent
