#ifndef JOB_HPP
#define JOB_HPP

#include "autoiso/installer_config.hpp"

#include <chrono>       // for system_clock, steady_clock
#include <cstdint>      // for uint8_t
#include <mutex>        // for mutex
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view

namespace autoiso::job {

enum class JobStatus : std::uint8_t {
    Pending,
    Rendering,
    Building,
    Complete,
    Failed,
    Cancelled
};

/// Failure of a build stage, becomes the job's error detail.
struct BuildError final {
    std::string stage{};
    std::string message{};
};

/// Point-in-time copy of a job, safe to hand to other threads.
struct JobSnapshot final {
    std::string id{};
    JobStatus status{JobStatus::Pending};
    std::uint8_t progress{};
    std::string status_message{};
    std::chrono::system_clock::time_point created_at{};
    std::optional<std::string> artifact_ref{};
    std::optional<std::string> error_detail{};
};

[[nodiscard]] auto job_status_to_string(JobStatus status) noexcept -> std::string_view;

/// Complete, Failed and Cancelled are terminal.
[[nodiscard]] constexpr auto is_terminal(JobStatus status) noexcept -> bool {
    return status == JobStatus::Complete || status == JobStatus::Failed || status == JobStatus::Cancelled;
}

/// @brief Job state machine.
/// Pending -> Rendering -> Building -> Complete | Failed, Cancelled from any non-terminal state.
/// Rendering may fail directly.
[[nodiscard]] auto can_transition(JobStatus from, JobStatus to) noexcept -> bool;

/// Generates random UUID v4 text.
[[nodiscard]] auto make_job_id() noexcept -> std::string;

/// Checks for canonical UUID text (8-4-4-4-12 hex digits).
[[nodiscard]] auto is_valid_job_id(std::string_view job_id) noexcept -> bool;

/// Formats time point as ISO-8601 UTC, e.g. 2024-05-01T12:00:00Z.
[[nodiscard]] auto format_timestamp(std::chrono::system_clock::time_point time_point) noexcept -> std::string;

/// Serializes snapshot as JSON object.
[[nodiscard]] auto job_snapshot_to_json(const JobSnapshot& snapshot) noexcept -> std::string;

// Build job, every mutation goes through the state machine
class BuildJob final {
 public:
    BuildJob(std::string id, InstallerConfig config) noexcept;

    // explicitly deleted
    BuildJob(const BuildJob&)         = delete;
    auto operator=(const BuildJob&) = delete;

    [[nodiscard]] auto id() const noexcept -> const std::string& { return m_id; }
    [[nodiscard]] auto config() const noexcept -> const InstallerConfig& { return m_config; }

    /// @brief Moves the job to another state.
    /// @return false when the state machine forbids the transition.
    auto transition(JobStatus to, std::string_view message) noexcept -> bool;

    /// @brief Raises progress. Lower values and updates of terminal jobs are refused.
    /// @return true when progress was stored.
    auto set_progress(std::uint8_t progress, std::string_view message) noexcept -> bool;

    /// Marks the job Complete with progress 100.
    auto complete(std::string artifact_ref) noexcept -> bool;

    /// Marks the job Failed.
    auto fail(const BuildError& error) noexcept -> bool;

    [[nodiscard]] auto status() const noexcept -> JobStatus;
    [[nodiscard]] auto snapshot() const noexcept -> JobSnapshot;

    /// Time of the last accepted update, used to detect stalled builds.
    [[nodiscard]] auto last_update() const noexcept -> std::chrono::steady_clock::time_point;

 private:
    auto transition_locked(JobStatus to, std::string_view message) noexcept -> bool;

    const std::string m_id;
    const InstallerConfig m_config;

    mutable std::mutex m_mutex;
    JobStatus m_status{JobStatus::Pending};
    std::uint8_t m_progress{};
    std::string m_status_message{"Job created"};
    std::chrono::system_clock::time_point m_created_at{std::chrono::system_clock::now()};
    std::chrono::steady_clock::time_point m_last_update{std::chrono::steady_clock::now()};
    std::optional<std::string> m_artifact_ref{};
    std::optional<std::string> m_error_detail{};
};

}  // namespace autoiso::job

#endif  // JOB_HPP
