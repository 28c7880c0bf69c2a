#ifndef JOB_ORCHESTRATOR_HPP
#define JOB_ORCHESTRATOR_HPP

#include "autoiso/artifact_store.hpp"
#include "autoiso/image_tool.hpp"
#include "autoiso/installer_config.hpp"
#include "autoiso/iso_builder.hpp"
#include "autoiso/job.hpp"
#include "autoiso/progress_channel.hpp"

#include <atomic>              // for atomic_bool
#include <chrono>              // for seconds
#include <condition_variable>  // for condition_variable_any
#include <cstdint>             // for uint8_t
#include <expected>            // for expected
#include <map>                 // for map
#include <memory>              // for shared_ptr, unique_ptr
#include <mutex>               // for mutex
#include <optional>            // for optional
#include <string>              // for string
#include <string_view>         // for string_view
#include <thread>              // for jthread
#include <vector>              // for vector

namespace autoiso::job {

struct OrchestratorSettings final {
    std::size_t max_jobs{5};
    /// Non-terminal jobs without progress for this long are failed. Zero disables the watchdog.
    std::chrono::seconds stall_timeout{600};
    /// Period of the housekeeping thread: stall checks and releasing finished workers.
    std::chrono::milliseconds watchdog_interval{1000};
    iso::BuildSettings build{};
};

enum class CreateErrorKind : std::uint8_t {
    Invalid,
    TooManyJobs
};

struct CreateError final {
    CreateErrorKind kind{CreateErrorKind::Invalid};
    std::string message{};
    FieldErrors fields{};
};

enum class CancelResult : std::uint8_t {
    Cancelled,
    NotFound,
    AlreadyFinished
};

/// @brief Owns build jobs and their workers.
/// Every accepted job gets its own worker thread. Jobs share only the artifact store.
/// Once a worker exits its thread and channel are released, the final snapshot stays
/// until the job is deleted.
class JobOrchestrator final {
 public:
    JobOrchestrator(store::ArtifactStore& store, std::unique_ptr<iso::ImageTool> tool, OrchestratorSettings settings) noexcept;
    ~JobOrchestrator();

    // explicitly deleted
    JobOrchestrator(const JobOrchestrator&)   = delete;
    auto operator=(const JobOrchestrator&) = delete;

    /// @brief Validates the configuration and starts a build.
    /// @return New job id, returned before the build makes progress.
    auto create_job(const InstallerConfig& config) noexcept -> std::expected<std::string, CreateError>;

    /// Parses JSON request body, then as create_job(config).
    auto create_job(std::string_view json_body) noexcept -> std::expected<std::string, CreateError>;

    [[nodiscard]] auto get_job(std::string_view job_id) const noexcept -> std::optional<JobSnapshot>;
    [[nodiscard]] auto list_jobs() const noexcept -> std::vector<JobSnapshot>;

    /// Advisory cancel, the worker stops at its next checkpoint.
    auto cancel_job(std::string_view job_id) noexcept -> CancelResult;

    /// Cancels the job if needed and removes it with its artifacts.
    /// @return false when neither a job nor artifacts existed.
    auto delete_job(std::string_view job_id) noexcept -> bool;

    /// @brief Subscription to the job's progress, std::nullopt for unknown jobs.
    /// A released job yields a closed stream carrying only its final event.
    [[nodiscard]] auto subscribe(std::string_view job_id) noexcept -> std::optional<progress::Subscription>;

    [[nodiscard]] auto active_job_count() const noexcept -> std::size_t;

    /// Fails jobs that made no progress within stall_timeout.
    /// @return Number of jobs failed.
    auto check_stalled_jobs() noexcept -> std::size_t;

    /// Joins exited workers and drops their channels.
    /// @return Number of jobs released.
    auto reap_finished_jobs() noexcept -> std::size_t;

    /// Jobs still holding a worker thread.
    [[nodiscard]] auto worker_count() const noexcept -> std::size_t;
    [[nodiscard]] auto channel_count() const noexcept -> std::size_t { return m_hub.size(); }

    [[nodiscard]] auto store() noexcept -> store::ArtifactStore& { return m_store; }

 private:
    struct Entry {
        std::shared_ptr<BuildJob> job{};
        std::shared_ptr<progress::ProgressChannel> channel{};
        std::jthread worker{};
        std::shared_ptr<std::atomic_bool> done{};
    };

    auto active_job_count_locked() const noexcept -> std::size_t;
    auto reap_finished_locked() noexcept -> std::size_t;
    void watchdog_loop(std::stop_token stop_token) noexcept;

    store::ArtifactStore& m_store;
    std::unique_ptr<iso::ImageTool> m_tool;
    const OrchestratorSettings m_settings;
    progress::ProgressHub m_hub{};

    mutable std::mutex m_mutex;
    std::map<std::string, Entry, std::less<>> m_jobs{};
    /// Final snapshots of released jobs.
    std::map<std::string, JobSnapshot, std::less<>> m_finished{};

    std::mutex m_watchdog_mutex;
    std::condition_variable_any m_watchdog_cv;
    std::jthread m_watchdog{};
};

}  // namespace autoiso::job

#endif  // JOB_ORCHESTRATOR_HPP
