#pragma once

#include <optional>
#include <string>

namespace wrapindent {

// Forward declarations
struct Diagnostic;
struct ParseResult;

// Abstract interfaces for dependency injection
class IDiagnosticSink {
public:
    virtual ~IDiagnosticSink() = default;
    virtual auto report(const Diagnostic& diagnostic) -> void = 0;
};

class IFileSystem {
public:
    virtual ~IFileSystem() = default;
    virtual auto read_file(const std::string& path) -> std::optional<std::string> = 0;
    virtual auto file_exists(const std::string& path) -> bool = 0;
};

class ITreeParser {
public:
    virtual ~ITreeParser() = default;
    virtual auto parse_tree(const std::string& tree_dump) -> ParseResult = 0;
};

} // namespace wrapindent
