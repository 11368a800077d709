#include "wrapindent/application/wrapindent_app.hpp"
#include "wrapindent/parsers/tree_dump_parser.hpp"
#include "wrapindent/string_utils.hpp"
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

namespace wrapindent {

namespace {

auto count_of(size_t count, const std::string& noun) -> std::string {
    return std::to_string(count) + " " + noun + (count == 1 ? "" : "s");
}

} // namespace

auto default_header_types() -> std::vector<std::string> {
    return {"CLASS_DEF",  "INTERFACE_DEF", "ENUM_DEF",    "METHOD_DEF",   "CTOR_DEF",
            "VARIABLE_DEF", "LITERAL_IF",  "LITERAL_FOR", "LITERAL_WHILE"};
}

auto usage_text() -> std::string {
    std::ostringstream oss;
    oss << "Usage: wrapindent [options]\n";
    oss << "  -i, --input <file>        Read the AST dump from file (default: stdin)\n";
    oss << "  -w, --wrap-indent <n>     Extra indentation of wrapped lines (default: 4)\n";
    oss << "      --strict              Require the exact column instead of a minimum\n";
    oss << "      --headers <A,B,...>   Token types checked as wrapped headers\n";
    oss << "  -h, --help                Show this help\n";
    oss << "\nExamples:\n";
    oss << "  checkstyle -t Foo.java | wrapindent             # Piped AST dump\n";
    oss << "  wrapindent -i foo.ast --strict -w 8             # Exact 8-column wraps\n";
    oss << "  wrapindent -i foo.ast --headers METHOD_DEF      # Method headers only\n";
    return oss.str();
}

auto parse_args(int argc, const char* const argv[]) -> ParsedArgs {
    ParsedArgs parsed;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        const bool has_value = i + 1 < argc;

        if ((arg == "-i" || arg == "--input") && has_value) {
            parsed.config.input_file = argv[++i];
        } else if ((arg == "-w" || arg == "--wrap-indent") && has_value) {
            std::string value = argv[++i];
            try {
                size_t consumed = 0;
                int width = std::stoi(value, &consumed);
                if (consumed != value.size() || width < 0) {
                    throw std::invalid_argument(value);
                }
                parsed.config.wrap.wrap_indent_width = width;
            } catch (const std::exception&) {
                parsed.outcome = ArgsOutcome::ERROR;
                parsed.error_message = "Invalid wrap indent '" + value
                                       + "', expected a non-negative integer";
                return parsed;
            }
        } else if (arg == "--strict") {
            parsed.config.wrap.strict_mode = true;
        } else if (arg == "--headers" && has_value) {
            parsed.config.header_types = StringUtils::split(argv[++i], ',');
            if (parsed.config.header_types.empty()) {
                parsed.outcome = ArgsOutcome::ERROR;
                parsed.error_message = "--headers needs at least one token type";
                return parsed;
            }
        } else if (arg == "-h" || arg == "--help") {
            parsed.outcome = ArgsOutcome::HELP;
            return parsed;
        } else {
            parsed.outcome = ArgsOutcome::ERROR;
            parsed.error_message = "Unknown or incomplete option '" + arg + "'";
            return parsed;
        }
    }

    return parsed;
}

auto format_diagnostic(const Diagnostic& diagnostic) -> std::string {
    std::ostringstream oss;
    oss << diagnostic.line << ": '" << diagnostic.token_text
        << "' has incorrect indentation level " << diagnostic.actual_column
        << ", expected level should be " << diagnostic.required_column << ". ["
        << diagnostic.message_key << "]";
    return oss.str();
}

WrapIndentApp::WrapIndentApp(std::unique_ptr<IFileSystem> filesystem,
                             std::unique_ptr<ITreeParser> parser)
    : filesystem_(std::move(filesystem)), parser_(std::move(parser)) {}

auto WrapIndentApp::run(const Config& config) -> int {
    auto input = load_input(config);
    if (!input) {
        return EXIT_INPUT_ERROR;
    }

    auto result = parser_->parse_tree(*input);
    if (!result.ok()) {
        std::cerr << "Error: Could not parse AST dump: " << result.error_message << "\n";
        return EXIT_INPUT_ERROR;
    }
    const SyntaxTree& tree = *result.tree;

    std::unordered_set<std::string> header_types(config.header_types.begin(),
                                                 config.header_types.end());
    auto roots = find_nodes(tree, header_types);
    if (roots.empty()) {
        std::cout << "No headers found.\n";
        return EXIT_CLEAN;
    }

    std::cout << "Found " << count_of(roots.size(), "header") << ".\n";

    auto report = check_headers(tree, roots, config.wrap);
    for (const auto& diagnostic : report.diagnostics) {
        std::cout << format_diagnostic(diagnostic) << "\n";
    }
    show_summary(report);

    return report.diagnostics.empty() ? EXIT_CLEAN : EXIT_VIOLATIONS;
}

auto WrapIndentApp::load_input(const Config& config) -> std::optional<std::string> {
    if (config.input_file == "-") {
        // Read from stdin
        std::string line;
        std::ostringstream oss;
        while (std::getline(std::cin, line)) {
            oss << line << '\n';
        }
        return oss.str();
    }

    if (!filesystem_->file_exists(config.input_file)) {
        std::cerr << "Error: Input file not found: " << config.input_file << "\n";
        return std::nullopt;
    }

    auto content = filesystem_->read_file(config.input_file);
    if (!content) {
        std::cerr << "Error: Could not read " << config.input_file << "\n";
    }
    return content;
}

auto WrapIndentApp::check_headers(const SyntaxTree& tree, const std::vector<NodeId>& roots,
                                  const WrapConfig& wrap) -> CheckReport {
    CheckReport report;
    std::unordered_set<std::string> reported;  // Nested headers may repeat a finding

    for (NodeId root : roots) {
        const auto& node = tree.node(root);

        // Without a trailing body there is no header to split off
        if (!node.first_child || node.first_child == node.last_child) {
            ++report.skipped;
            continue;
        }

        CollectingSink sink;
        LineWrapVerifier verifier(tree, root, wrap);
        verifier.check_indentation(sink);

        for (const auto& diagnostic : sink.diagnostics()) {
            if (reported.insert(diagnostic_key(diagnostic)).second) {
                report.diagnostics.push_back(diagnostic);
            }
        }
        ++report.checked;
    }

    return report;
}

auto WrapIndentApp::show_summary(const CheckReport& report) -> void {
    std::cout << "Checked " << count_of(report.checked, "header");
    if (report.skipped > 0) {
        std::cout << " (skipped " << report.skipped << " without a body)";
    }
    std::cout << ", found " << count_of(report.diagnostics.size(), "indentation error") << ".\n";
}

} // namespace wrapindent
