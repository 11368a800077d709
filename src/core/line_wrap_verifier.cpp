#include "wrapindent/core/line_wrap_verifier.hpp"
#include <stdexcept>

namespace wrapindent {

namespace {

auto is_closing_delimiter(NodeKind kind) -> bool {
    return kind == NodeKind::CLOSE_BRACE || kind == NodeKind::CLOSE_PAREN
           || kind == NodeKind::ARRAY_INITIALIZER;
}

// The "else" owning node when node is the "if" of a cascaded "else if"
auto cascaded_else(const SyntaxTree& tree, NodeId node) -> std::optional<NodeId> {
    const auto& current = tree.node(node);
    if (current.kind != NodeKind::IF_CONSTRUCT || !current.parent) {
        return std::nullopt;
    }
    if (tree.node(*current.parent).kind != NodeKind::ELSE_CONSTRUCT) {
        return std::nullopt;
    }
    return current.parent;
}

} // namespace

LineWrapVerifier::LineWrapVerifier(const SyntaxTree& tree, NodeId first_node,
                                   const WrapConfig& config)
    : tree_(&tree), first_node_(first_node), last_node_(find_last_node(tree, first_node)),
      config_(config) {
    if (config_.wrap_indent_width < 0) {
        throw std::invalid_argument("wrap indent width must not be negative");
    }
}

auto LineWrapVerifier::find_last_node(const SyntaxTree& tree, NodeId first_node)
    -> std::optional<NodeId> {
    auto last_child = tree.node(first_node).last_child;
    if (!last_child) {
        return std::nullopt;
    }
    return tree.node(*last_child).previous_sibling;
}

auto LineWrapVerifier::current_indentation() const -> int {
    return tree_->node(first_node_).column + config_.wrap_indent_width;
}

auto LineWrapVerifier::check_indentation(IDiagnosticSink& sink) const -> void {
    auto lines = collect_first_nodes(*tree_, first_node_, last_node_);
    if (lines.empty()) {
        // A type body handed in as the root has no header of its own
        return;
    }

    NodeId first_node = lines.begin()->second;
    if (tree_->node(first_node).kind == NodeKind::ANNOTATION_MARKER) {
        check_annotation_indentation(first_node, lines, sink);
    }

    // The first line anchors the header and is checked by the caller's own rule
    lines.erase(lines.begin());
    const int first_node_indent_level = first_node_indent(first_node);
    const int current_indent = first_node_indent_level + config_.wrap_indent_width;

    for (const auto& entry : lines) {
        NodeId id = entry.second;
        const auto& node = tree_->node(id);

        if (is_closing_delimiter(node.kind)) {
            log_warning_message(id, first_node_indent_level, sink);
        } else if (auto else_node = cascaded_else(*tree_, id)) {
            log_warning_message(*else_node, current_indent, sink);
        } else {
            log_warning_message(id, current_indent, sink);
        }
    }
}

auto LineWrapVerifier::first_node_indent(NodeId node) const -> int {
    auto else_node = cascaded_else(*tree_, node);
    if (!else_node) {
        return tree_->node(node).column;
    }

    // "} else if" anchors to the closing brace of the preceding block
    const auto& else_construct = tree_->node(*else_node);
    if (else_construct.previous_sibling) {
        const auto& block = tree_->node(*else_construct.previous_sibling);
        if (block.kind == NodeKind::BLOCK && block.last_child) {
            const auto& rcurly = tree_->node(*block.last_child);
            if (rcurly.line == tree_->node(node).line) {
                return rcurly.column;
            }
        }
    }
    return else_construct.column;
}

auto LineWrapVerifier::check_annotation_indentation(NodeId at_node, LineMap& lines,
                                                    IDiagnosticSink& sink) const -> void {
    const int first_node_indent_level = tree_->node(at_node).column;
    const int current_indent = first_node_indent_level + config_.wrap_indent_width;
    const auto& last_annotation = tree_->node(find_last_annotation_node(*tree_, at_node));

    auto it = lines.begin();
    while (it != lines.end() && lines.size() > 1) {
        const auto& node = tree_->node(it->second);
        if (!is_at_or_before(node, last_annotation)) {
            break;
        }

        // A new top-level annotation starts at the header column
        bool starts_annotation = false;
        if (node.kind == NodeKind::ANNOTATION_MARKER && node.parent) {
            auto grandparent = tree_->node(*node.parent).parent;
            starts_annotation
                = grandparent && tree_->node(*grandparent).kind == NodeKind::MODIFIER_LIST;
        }

        log_warning_message(it->second,
                            starts_annotation ? first_node_indent_level : current_indent, sink);
        it = lines.erase(it);
    }
}

auto LineWrapVerifier::log_warning_message(NodeId id, int required_column,
                                           IDiagnosticSink& sink) const -> void {
    const auto& node = tree_->node(id);
    const bool misplaced = config_.strict_mode ? node.column != required_column
                                               : node.column < required_column;
    if (!misplaced) {
        return;
    }

    sink.report(Diagnostic{.line = node.line,
                           .actual_column = node.column,
                           .required_column = required_column,
                           .token_text = node.text,
                           .message_key = INDENTATION_ERROR_KEY});
}

} // namespace wrapindent
