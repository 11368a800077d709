#pragma once

#include "wrapindent/core/syntax_tree.hpp"
#include "wrapindent/interfaces.hpp"
#include <optional>
#include <regex>
#include <string>

namespace wrapindent {

struct ParseResult {
    std::optional<SyntaxTree> tree;
    std::string error_message;  // Set when tree is empty

    auto ok() const -> bool { return tree.has_value(); }
};

// Reads the AST dump printed by the Java style checker:
//
//   CLASS_DEF -> CLASS_DEF [1:0]
//   |--MODIFIERS -> MODIFIERS [1:0]
//   |   `--LITERAL_PUBLIC -> public [1:0]
//   `--IDENT -> Foo [1:13]
class TreeDumpParser : public ITreeParser {
public:
    auto parse_tree(const std::string& tree_dump) -> ParseResult override;

private:
    struct DumpLine {
        size_t depth{};
        std::string type_name;
        std::string text;
        int line{};
        int column{};
    };

    auto parse_single_line(const std::string& line) -> std::optional<DumpLine>;

    // Prefix groups of "|   " or four spaces, then "|--" or "`--" for every non-root node
    static inline const std::regex node_pattern_{
        R"(^((?:\|   |    )*)(\|--|`--)?([A-Za-z_][A-Za-z0-9_]*) -> (.*) \[(\d+):(\d+)\]$)"};
};

} // namespace wrapindent
