#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace wrapindent {

class StringUtils {
public:
    // Strip leading and trailing whitespace
    static auto trim(std::string_view text) -> std::string;

    // Strip trailing whitespace only; leading indentation is significant in tree dumps
    static auto trim_right(std::string_view text) -> std::string;

    // Split on delimiter, trimming each piece and dropping empty ones
    static auto split(std::string_view text, char delimiter) -> std::vector<std::string>;
};

} // namespace wrapindent
