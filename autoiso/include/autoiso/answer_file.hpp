#ifndef ANSWER_FILE_HPP
#define ANSWER_FILE_HPP

#include "autoiso/installer_config.hpp"

#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view

namespace autoiso::answer {

struct RenderOptions final {
    /// ISO-8601 timestamp written as a leading comment. The only volatile part of the output.
    std::optional<std::string> generated_at{};
};

/// @brief Renders the unattended installer answer file.
/// Output is deterministic for equal configurations: tables [global], [network]
/// and [disk-setup] with keys in fixed order, absent optional fields omitted.
/// @param config Validated configuration.
/// @param opts Rendering options.
/// @return The answer file as TOML text.
[[nodiscard]] auto render_answer_file(const InstallerConfig& config, const RenderOptions& opts = {}) noexcept -> std::string;

/// @brief Renders auto-installer-mode.toml.
/// Without url the installer reads answer.toml from the ISO, otherwise it fetches it over http.
[[nodiscard]] auto render_auto_installer_mode(std::optional<std::string_view> answer_url) noexcept -> std::string;

/// @brief Reads a rendered answer file back.
/// @return The configuration, or std::nullopt if the text is not a valid answer file.
[[nodiscard]] auto parse_answer_file(std::string_view content) noexcept -> std::optional<InstallerConfig>;

/// Quotes string as TOML basic string.
[[nodiscard]] auto toml_quote(std::string_view str) noexcept -> std::string;

}  // namespace autoiso::answer

#endif  // ANSWER_FILE_HPP
