#include "wrapindent/core/diagnostic.hpp"
#include <sstream>

namespace wrapindent {

auto diagnostic_key(const Diagnostic& diagnostic) -> std::string {
    std::ostringstream oss;
    oss << diagnostic.line << ":" << diagnostic.actual_column << ":" << diagnostic.required_column
        << ":" << diagnostic.token_text << ":" << diagnostic.message_key;
    return oss.str();
}

auto CollectingSink::report(const Diagnostic& diagnostic) -> void {
    diagnostics_.push_back(diagnostic);
}

} // namespace wrapindent
