#pragma once

#include "wrapindent/interfaces.hpp"
#include <optional>
#include <string>

namespace wrapindent {

class FileSystem : public IFileSystem {
public:
    auto read_file(const std::string& path) -> std::optional<std::string> override;
    auto file_exists(const std::string& path) -> bool override;
};

} // namespace wrapindent
