#include "autoiso/image_tool.hpp"
#include "autoiso/file_utils.hpp"
#include "autoiso/subprocess.hpp"

#include <charconv>     // for from_chars
#include <string_view>  // for string_view
#include <vector>       // for vector

#include <ctre.hpp>  // for ctre::search

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace fs = std::filesystem;

namespace autoiso::iso {

auto parse_xorriso_progress(std::string_view line) noexcept -> std::optional<std::uint8_t> {
    if (!line.contains("UPDATE"sv)) {
        return std::nullopt;
    }
    auto match = ctre::search<R"(([0-9]{1,3})(\.[0-9]+)?% done)">(line);
    if (!match) {
        return std::nullopt;
    }
    const auto percent_str = match.get<1>().to_view();
    std::uint32_t percent{};
    const auto [ptr, ec] = std::from_chars(percent_str.data(), percent_str.data() + percent_str.size(), percent);
    if (ec != std::errc{} || percent > 100) {
        return std::nullopt;
    }
    return static_cast<std::uint8_t>(percent);
}

auto XorrisoImageTool::build(const ImageBuildRequest& request, const ProgressCallback& on_progress,
    std::stop_token stop_token) noexcept -> std::expected<void, job::BuildError> {
    std::error_code err{};
    if (!fs::is_regular_file(request.base_iso, err)) {
        return std::unexpected(job::BuildError{"build", fmt::format(FMT_COMPILE("base ISO '{}' not found"), request.base_iso.string())});
    }

    const auto staging = request.work_dir / "staging";
    fs::create_directories(staging, err);
    if (err) {
        return std::unexpected(job::BuildError{"build", fmt::format(FMT_COMPILE("cannot create '{}': {}"), staging.string(), err.message())});
    }

    const auto answer_path = staging / "answer.toml";
    const auto mode_path   = staging / "auto-installer-mode.toml";
    const auto flag_path   = staging / "auto-installer-capable";
    if (!file_utils::create_file_for_overwrite(answer_path.string(), request.answer_file)
        || !file_utils::create_file_for_overwrite(mode_path.string(), request.auto_installer_mode)
        || !file_utils::create_file_for_overwrite(flag_path.string(), ""sv)) {
        return std::unexpected(job::BuildError{"build", "failed to write staging files"});
    }

    fs::remove(request.output_iso, err);

    const std::vector<std::string> cmd{
        m_executable,
        "-indev", request.base_iso.string(),
        "-outdev", request.output_iso.string(),
        "-map", answer_path.string(), "/answer.toml",
        "-map", mode_path.string(), "/auto-installer-mode.toml",
        "-map", flag_path.string(), "/auto-installer-capable",
        "-boot_image", "any", "replay"};

    on_progress(0, "Remastering installer image"sv);
    utils::SubProcess child{};
    const auto exit_code = utils::exec_follow(cmd, child, [&on_progress](std::string_view line) {
        if (auto percent = parse_xorriso_progress(line)) {
            on_progress(*percent, "Writing image"sv);
        }
    }, stop_token);

    if (stop_token.stop_requested()) {
        return std::unexpected(job::BuildError{"build", "cancelled"});
    }
    if (!exit_code) {
        return std::unexpected(job::BuildError{"build", fmt::format(FMT_COMPILE("failed to run '{}'"), m_executable)});
    }
    if (*exit_code != 0) {
        spdlog::error("{} exited with {}:\n{}", m_executable, *exit_code, child.get_log_tail(20));
        return std::unexpected(job::BuildError{"build", fmt::format(FMT_COMPILE("{} exited with code {}"), m_executable, *exit_code)});
    }
    if (!fs::is_regular_file(request.output_iso, err) || fs::file_size(request.output_iso, err) == 0) {
        return std::unexpected(job::BuildError{"build", "image tool produced no output"});
    }
    on_progress(100, "Image written"sv);
    return {};
}

}  // namespace autoiso::iso
