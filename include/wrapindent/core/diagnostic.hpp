#pragma once

#include "wrapindent/interfaces.hpp"
#include <string>
#include <vector>

namespace wrapindent {

inline constexpr const char* INDENTATION_ERROR_KEY = "indentation.error";

struct Diagnostic {
    int line{};
    int actual_column{};
    int required_column{};
    std::string token_text;
    std::string message_key{INDENTATION_ERROR_KEY};

    auto operator==(const Diagnostic& other) const -> bool = default;
};

// Generate unique key for diagnostic identification; equal keys mean equal diagnostics
auto diagnostic_key(const Diagnostic& diagnostic) -> std::string;

// Keeps every reported diagnostic in arrival order
class CollectingSink : public IDiagnosticSink {
public:
    auto report(const Diagnostic& diagnostic) -> void override;

    auto diagnostics() const -> const std::vector<Diagnostic>& { return diagnostics_; }
    auto clear() -> void { diagnostics_.clear(); }

private:
    std::vector<Diagnostic> diagnostics_;
};

} // namespace wrapindent
