#ifndef IMAGE_TOOL_HPP
#define IMAGE_TOOL_HPP

#include "autoiso/job.hpp"

#include <cstdint>      // for uint8_t
#include <expected>     // for expected
#include <filesystem>   // for path
#include <functional>   // for function
#include <optional>     // for optional
#include <stop_token>   // for stop_token
#include <string>       // for string
#include <string_view>  // for string_view

namespace autoiso::iso {

struct ImageBuildRequest final {
    std::string job_id{};
    std::filesystem::path base_iso{};
    /// Scratch directory owned by this build.
    std::filesystem::path work_dir{};
    std::filesystem::path output_iso{};
    std::string answer_file{};
    std::string auto_installer_mode{};
};

/// Tool progress in percent with a short description.
using ProgressCallback = std::function<void(std::uint8_t, std::string_view)>;

// Produces a bootable image from the base ISO and the rendered files
class ImageTool {
 public:
    virtual ~ImageTool() = default;

    [[nodiscard]] virtual auto name() const noexcept -> std::string_view = 0;

    /// @brief Builds request.output_iso.
    /// Must return promptly once stop is requested.
    virtual auto build(const ImageBuildRequest& request, const ProgressCallback& on_progress,
        std::stop_token stop_token) noexcept -> std::expected<void, job::BuildError> = 0;
};

/// Remasters the base ISO with xorriso, adding answer.toml, auto-installer-mode.toml
/// and the auto-installer-capable flag at the image root.
class XorrisoImageTool final : public ImageTool {
 public:
    explicit XorrisoImageTool(std::string executable = "xorriso") noexcept : m_executable(std::move(executable)) { }

    [[nodiscard]] auto name() const noexcept -> std::string_view override { return m_executable; }

    auto build(const ImageBuildRequest& request, const ProgressCallback& on_progress,
        std::stop_token stop_token) noexcept -> std::expected<void, job::BuildError> override;

 private:
    std::string m_executable;
};

/// Extracts percentage from a line like "xorriso : UPDATE :  42.17% done".
[[nodiscard]] auto parse_xorriso_progress(std::string_view line) noexcept -> std::optional<std::uint8_t>;

}  // namespace autoiso::iso

#endif  // IMAGE_TOOL_HPP
