#ifndef ANSWER_PATCH_HPP
#define ANSWER_PATCH_HPP

#include <cstdint>      // for uint8_t
#include <string>       // for string
#include <string_view>  // for string_view

namespace autoiso::discovery {

enum class PatchResult : std::uint8_t {
    Patched,
    FileMissing,
    Failed
};

/// @brief Replaces the management NIC filter and disk list of an answer file.
/// Only lines starting with `filter.ID_NET_NAME_MAC = "..."` and `disk-list = [...]` change,
/// the matched part is replaced and the rest of the line is kept.
/// @param content Answer file text.
/// @param mac MAC of the management NIC, written as "*<mac>".
/// @param disk_path Installation disk, e.g. /dev/nvme0n1.
[[nodiscard]] auto patch_answer_content(std::string_view content, std::string_view mac, std::string_view disk_path) noexcept -> std::string;

/// @brief Patches the answer file in place, keeping the original as <file>.bak.
/// @return FileMissing when there is nothing to patch.
auto patch_answer_file(std::string_view answer_path, std::string_view mac, std::string_view disk_path) noexcept -> PatchResult;

}  // namespace autoiso::discovery

#endif  // ANSWER_PATCH_HPP
