#include "autoiso/answer_patch.hpp"
#include "autoiso/file_utils.hpp"

#include <filesystem>   // for exists, copy_file
#include <string_view>  // for string_view

#include <ctre.hpp>  // for ctre::starts_with

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace fs = std::filesystem;

namespace {

auto patch_line(std::string_view line, std::string_view mac_line, std::string_view disk_line) noexcept -> std::string {
    if (auto match = ctre::starts_with<R"(\s*filter\.ID_NET_NAME_MAC\s*=\s*"[^"]*")">(line)) {
        return fmt::format(FMT_COMPILE("{}{}"), mac_line, line.substr(match.to_view().size()));
    }
    if (auto match = ctre::starts_with<R"(\s*disk-list\s*=\s*\[[^\]]*\])">(line)) {
        return fmt::format(FMT_COMPILE("{}{}"), disk_line, line.substr(match.to_view().size()));
    }
    return std::string{line};
}

}  // namespace

namespace autoiso::discovery {

auto patch_answer_content(std::string_view content, std::string_view mac, std::string_view disk_path) noexcept -> std::string {
    const auto& mac_line  = fmt::format(FMT_COMPILE("filter.ID_NET_NAME_MAC = \"*{}\""), mac);
    const auto& disk_line = fmt::format(FMT_COMPILE("disk-list = [\"{}\"]"), disk_path);

    std::string res{};
    res.reserve(content.size() + 32);
    while (!content.empty()) {
        const auto eol  = content.find('\n');
        const auto line = content.substr(0, eol);
        res += patch_line(line, mac_line, disk_line);
        if (eol == std::string_view::npos) {
            break;
        }
        res += '\n';
        content.remove_prefix(eol + 1);
    }
    return res;
}

auto patch_answer_file(std::string_view answer_path, std::string_view mac, std::string_view disk_path) noexcept -> PatchResult {
    std::error_code err{};
    if (!fs::is_regular_file(answer_path, err)) {
        spdlog::warn("WARNING: Answer file {} not found, skipping update", answer_path);
        return PatchResult::FileMissing;
    }

    const auto& content = file_utils::read_whole_file(answer_path);
    const auto backup   = fmt::format(FMT_COMPILE("{}.bak"), answer_path);
    if (!file_utils::create_file_for_overwrite(backup, content)) {
        spdlog::error("Failed to write backup {}", backup);
        return PatchResult::Failed;
    }

    const auto& patched = patch_answer_content(content, mac, disk_path);
    if (!file_utils::create_file_for_overwrite(answer_path, patched)) {
        spdlog::error("Failed to update answer file {}", answer_path);
        return PatchResult::Failed;
    }
    spdlog::info("Patched {} with disk {} and NIC MAC {}", answer_path, disk_path, mac);
    return PatchResult::Patched;
}

}  // namespace autoiso::discovery
