#ifndef ISO_BUILDER_HPP
#define ISO_BUILDER_HPP

#include "autoiso/artifact_store.hpp"
#include "autoiso/image_tool.hpp"
#include "autoiso/job.hpp"
#include "autoiso/progress_channel.hpp"

#include <cstdint>     // for uint8_t
#include <filesystem>  // for path
#include <memory>      // for shared_ptr
#include <optional>    // for optional
#include <stop_token>  // for stop_token
#include <string>      // for string

namespace autoiso::iso {

struct BuildSettings final {
    std::filesystem::path base_iso{};
    std::filesystem::path work_dir{"/tmp/autoiso"};
    /// Base URL the installer fetches answers from, "<answer_url>/<jobId>". Unset embeds answer.toml.
    std::optional<std::string> answer_url{};
};

/// Maps image tool progress 0-100 onto the build milestone 10-95.
[[nodiscard]] constexpr auto map_tool_progress(std::uint8_t tool_percent) noexcept -> std::uint8_t {
    if (tool_percent > 100) {
        tool_percent = 100;
    }
    return static_cast<std::uint8_t>(10U + (tool_percent * 85U) / 100U);
}

/// @brief Runs a single build job to a terminal state.
/// Milestones: render answer file (0-10), build image (10-95), store artifacts (95-100).
/// The job's progress channel is closed with the final event in every case.
/// @param job The job, in Pending state.
/// @param channel The job's progress channel.
/// @param store Artifact store shared by all jobs.
/// @param tool Image tool.
/// @param settings Build settings.
/// @param stop_token Cancellation, observed between milestones and by the tool.
void run_build(const std::shared_ptr<job::BuildJob>& job, const std::shared_ptr<progress::ProgressChannel>& channel,
    store::ArtifactStore& store, ImageTool& tool, const BuildSettings& settings, std::stop_token stop_token) noexcept;

/// Closing event matching the job's terminal state.
[[nodiscard]] auto make_final_event(const job::JobSnapshot& snapshot) noexcept -> progress::ProgressEvent;

}  // namespace autoiso::iso

#endif  // ISO_BUILDER_HPP
