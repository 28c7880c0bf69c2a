#ifndef FILE_UTILS_HPP
#define FILE_UTILS_HPP

#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view

namespace autoiso::file_utils {

auto read_whole_file(std::string_view filepath) noexcept -> std::string;

// If the file doesn't exist, then it create one and write into it.
// If the file exists already, then it will overwrite file content with provided data.
auto create_file_for_overwrite(std::string_view filepath, std::string_view data) noexcept -> bool;

// Writes into a temporary sibling first and renames it over the target.
auto write_file_atomic(std::string_view filepath, std::string_view data) noexcept -> bool;

// Reads first line of a sysfs attribute. sysfs files report size 0, so this can't use read_whole_file.
auto read_sysfs_value(std::string_view filepath) noexcept -> std::optional<std::string>;

}  // namespace autoiso::file_utils

#endif  // FILE_UTILS_HPP
