#include "wrapindent/io/file_system.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

namespace wrapindent {

auto FileSystem::read_file(const std::string& path) -> std::optional<std::string> {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    if (file.bad()) {
        return std::nullopt;
    }
    return oss.str();
}

auto FileSystem::file_exists(const std::string& path) -> bool {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

} // namespace wrapindent
