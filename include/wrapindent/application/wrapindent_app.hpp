#pragma once

#include "wrapindent/core/diagnostic.hpp"
#include "wrapindent/core/line_wrap_verifier.hpp"
#include "wrapindent/core/syntax_tree.hpp"
#include "wrapindent/interfaces.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace wrapindent {

// Token types checked as line-wrapped headers when --headers is not given
auto default_header_types() -> std::vector<std::string>;

struct Config {
    std::string input_file = "-";  // stdin by default
    WrapConfig wrap;
    std::vector<std::string> header_types = default_header_types();
};

enum class ArgsOutcome {
    RUN,   // Config is ready
    HELP,  // -h/--help requested
    ERROR  // Bad arguments, see error_message
};

struct ParsedArgs {
    ArgsOutcome outcome{ArgsOutcome::RUN};
    Config config;
    std::string error_message;
};

auto parse_args(int argc, const char* const argv[]) -> ParsedArgs;
auto usage_text() -> std::string;

// Human readable line for one diagnostic
auto format_diagnostic(const Diagnostic& diagnostic) -> std::string;

// Exit codes
inline constexpr int EXIT_CLEAN = 0;
inline constexpr int EXIT_VIOLATIONS = 1;
inline constexpr int EXIT_INPUT_ERROR = 2;

struct CheckReport {
    std::vector<Diagnostic> diagnostics;  // Exact repeats from nested headers removed
    size_t checked{};
    size_t skipped{};
};

class WrapIndentApp {
private:
    std::unique_ptr<IFileSystem> filesystem_;
    std::unique_ptr<ITreeParser> parser_;

public:
    WrapIndentApp(std::unique_ptr<IFileSystem> filesystem, std::unique_ptr<ITreeParser> parser);

    auto run(const Config& config) -> int;

private:
    auto load_input(const Config& config) -> std::optional<std::string>;
    auto check_headers(const SyntaxTree& tree, const std::vector<NodeId>& roots,
                       const WrapConfig& wrap) -> CheckReport;
    auto show_summary(const CheckReport& report) -> void;
};

} // namespace wrapindent
