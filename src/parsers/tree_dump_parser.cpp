#include "wrapindent/parsers/tree_dump_parser.hpp"
#include "wrapindent/string_utils.hpp"
#include <sstream>
#include <vector>

namespace wrapindent {

namespace {

auto parse_error(size_t line_number, const std::string& reason) -> ParseResult {
    return ParseResult{.tree = std::nullopt,
                       .error_message = "line " + std::to_string(line_number) + ": " + reason};
}

} // namespace

auto TreeDumpParser::parse_tree(const std::string& tree_dump) -> ParseResult {
    SyntaxTree tree;
    std::vector<NodeId> ancestors;  // ancestors[d] is the latest node at depth d

    std::istringstream iss(tree_dump);
    std::string raw_line;
    size_t line_number = 0;

    while (std::getline(iss, raw_line)) {
        ++line_number;
        auto line = StringUtils::trim_right(raw_line);
        if (line.empty()) {
            continue;
        }

        auto parsed = parse_single_line(line);
        if (!parsed) {
            return parse_error(line_number, "malformed tree line '" + line + "'");
        }

        auto kind = kind_from_type_name(parsed->type_name);
        if (parsed->depth == 0) {
            if (tree.root()) {
                return parse_error(line_number, "second root node " + parsed->type_name);
            }
            ancestors.push_back(tree.add_root(kind, std::move(parsed->type_name),
                                              std::move(parsed->text), parsed->line,
                                              parsed->column));
            continue;
        }

        if (parsed->depth > ancestors.size()) {
            return parse_error(line_number, "node " + parsed->type_name + " has no parent");
        }

        ancestors.resize(parsed->depth);
        ancestors.push_back(tree.add_child(ancestors.back(), kind, std::move(parsed->type_name),
                                           std::move(parsed->text), parsed->line,
                                           parsed->column));
    }

    if (!tree.root()) {
        return ParseResult{.tree = std::nullopt, .error_message = "no tree nodes found"};
    }

    return ParseResult{.tree = std::move(tree), .error_message = ""};
}

auto TreeDumpParser::parse_single_line(const std::string& line) -> std::optional<DumpLine> {
    std::smatch match;
    if (!std::regex_match(line, match, node_pattern_)) {
        return std::nullopt;
    }

    const bool has_marker = match[2].matched;
    const size_t prefix_groups = match[1].length() / 4;
    if (!has_marker && prefix_groups > 0) {
        return std::nullopt;
    }

    try {
        DumpLine dump_line{.depth = prefix_groups + (has_marker ? 1 : 0),
                           .type_name = match[3].str(),
                           .text = match[4].str(),
                           .line = std::stoi(match[5].str()),
                           .column = std::stoi(match[6].str())};
        return dump_line;
    } catch (const std::exception&) {
        // Position out of int range
        return std::nullopt;
    }
}

} // namespace wrapindent
