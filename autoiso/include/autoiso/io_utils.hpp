#ifndef IO_UTILS_HPP
#define IO_UTILS_HPP

#include <string>       // for string
#include <string_view>  // for string_view

namespace autoiso::utils {

auto safe_getenv(const char* env_name) noexcept -> std::string_view;

/// @brief Runs command through the shell and captures its stdout.
/// @param command The command line.
/// @return The output with a single trailing newline stripped.
auto exec(std::string_view command) noexcept -> std::string;

/// @brief Runs command through the shell.
/// @return true when the command exited with status 0.
auto exec_checked(std::string_view command) noexcept -> bool;

/// @brief Quotes an argument for safe use inside a POSIX shell command line.
auto shell_quote(std::string_view arg) noexcept -> std::string;

}  // namespace autoiso::utils

#endif  // IO_UTILS_HPP
