#include "wrapindent/string_utils.hpp"

namespace wrapindent {

auto StringUtils::trim(std::string_view text) -> std::string {
    auto start = text.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) {
        return "";
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return std::string(text.substr(start, end - start + 1));
}

auto StringUtils::trim_right(std::string_view text) -> std::string {
    auto end = text.find_last_not_of(" \t\r\n");
    if (end == std::string_view::npos) {
        return "";
    }
    return std::string(text.substr(0, end + 1));
}

auto StringUtils::split(std::string_view text, char delimiter) -> std::vector<std::string> {
    std::vector<std::string> pieces;
    size_t start = 0;

    while (start <= text.size()) {
        auto end = text.find(delimiter, start);
        if (end == std::string_view::npos) {
            end = text.size();
        }

        auto piece = trim(text.substr(start, end - start));
        if (!piece.empty()) {
            pieces.push_back(std::move(piece));
        }
        start = end + 1;
    }

    return pieces;
}

} // namespace wrapindent
