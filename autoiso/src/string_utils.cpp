#include "autoiso/string_utils.hpp"

#include <cctype>  // for tolower

namespace autoiso::utils {

auto make_multiline_view(std::string_view str, bool reverse, char delim) noexcept -> std::vector<std::string_view> {
    std::vector<std::string_view> lines{};
    std::ranges::for_each(utils::make_split_view(str, delim), [&](auto&& rng) { lines.emplace_back(rng); });
    if (reverse) {
        std::ranges::reverse(lines);
    }
    return lines;
}

auto make_multiline(std::string_view str, char delim) noexcept -> std::vector<std::string> {
    std::vector<std::string> lines{};
    std::ranges::for_each(utils::make_split_view(str, delim), [&](auto&& rng) { lines.emplace_back(rng); });
    return lines;
}

auto join(const std::vector<std::string>& lines, std::string_view delim) noexcept -> std::string {
    std::string res{};
    bool first{true};
    for (const auto& line : lines) {
        if (!first) {
            res += delim;
        }
        res += line;
        first = false;
    }
    return res;
}

auto to_lower(std::string_view str) noexcept -> std::string {
    std::string res{str};
    std::ranges::transform(res, res.begin(), [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return res;
}

}  // namespace autoiso::utils
