#pragma once

#include "wrapindent/core/diagnostic.hpp"
#include "wrapindent/core/line_map.hpp"
#include "wrapindent/core/syntax_tree.hpp"
#include "wrapindent/interfaces.hpp"
#include <optional>

namespace wrapindent {

struct WrapConfig {
    int wrap_indent_width = 4;  // Extra columns required on continuation lines
    bool strict_mode = false;   // true: exact column, false: at least the column
};

// Checks line-wrapping inside a declaration or expression header: every line
// of the header after the first must start at the header's column plus the
// wrap indent, closing delimiters must align with the header itself.
class LineWrapVerifier {
public:
    // Throws std::invalid_argument for a negative wrap indent
    LineWrapVerifier(const SyntaxTree& tree, NodeId first_node, const WrapConfig& config);

    // Reports every misplaced line to sink, in ascending line order.
    // Safe to call repeatedly; each call works on its own line map.
    auto check_indentation(IDiagnosticSink& sink) const -> void;

    auto first_node() const -> NodeId { return first_node_; }
    auto last_node() const -> std::optional<NodeId> { return last_node_; }
    auto indent_level() const -> int { return config_.wrap_indent_width; }

    // Expected column of continuation lines relative to the header root
    auto current_indentation() const -> int;

    // The token right before the root's trailing body/terminator
    static auto find_last_node(const SyntaxTree& tree, NodeId first_node) -> std::optional<NodeId>;

private:
    auto first_node_indent(NodeId node) const -> int;
    auto check_annotation_indentation(NodeId at_node, LineMap& lines, IDiagnosticSink& sink) const
        -> void;
    auto log_warning_message(NodeId node, int required_column, IDiagnosticSink& sink) const
        -> void;

    const SyntaxTree* tree_;
    NodeId first_node_;
    std::optional<NodeId> last_node_;
    WrapConfig config_;
};

} // namespace wrapindent
