#include "autoiso/job_orchestrator.hpp"
#include "autoiso/validator.hpp"

#include <algorithm>    // for count_if
#include <string_view>  // for string_view

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace autoiso::job {

JobOrchestrator::JobOrchestrator(store::ArtifactStore& store, std::unique_ptr<iso::ImageTool> tool, OrchestratorSettings settings) noexcept
  : m_store(store), m_tool(std::move(tool)), m_settings(std::move(settings)) {
    m_watchdog = std::jthread([this](std::stop_token stop_token) { watchdog_loop(stop_token); });
}

JobOrchestrator::~JobOrchestrator() {
    m_watchdog.request_stop();
    if (m_watchdog.joinable()) {
        m_watchdog.join();
    }

    // workers must not outlive the store and the tool
    std::map<std::string, Entry, std::less<>> jobs{};
    {
        const std::lock_guard<std::mutex> lock(m_mutex);
        jobs = std::move(m_jobs);
    }
    for (auto& [job_id, entry] : jobs) {
        entry.worker.request_stop();
    }
    jobs.clear();
}

auto JobOrchestrator::create_job(std::string_view json_body) noexcept -> std::expected<std::string, CreateError> {
    auto config = parse_installer_config(json_body);
    if (!config) {
        return std::unexpected(CreateError{
            .kind    = CreateErrorKind::Invalid,
            .message = format_field_errors(config.error()),
            .fields  = std::move(config.error()),
        });
    }
    return create_job(*config);
}

auto JobOrchestrator::create_job(const InstallerConfig& config) noexcept -> std::expected<std::string, CreateError> {
    auto validated = validator::validate_installer_config(config);
    if (!validated) {
        spdlog::warn("Rejected configuration: {}", format_field_errors(validated.error()));
        return std::unexpected(CreateError{
            .kind    = CreateErrorKind::Invalid,
            .message = format_field_errors(validated.error()),
            .fields  = std::move(validated.error()),
        });
    }

    const std::lock_guard<std::mutex> lock(m_mutex);
    reap_finished_locked();
    if (active_job_count_locked() >= m_settings.max_jobs) {
        spdlog::warn("Rejected job: {} jobs already running", m_settings.max_jobs);
        return std::unexpected(CreateError{
            .kind    = CreateErrorKind::TooManyJobs,
            .message = "Maximum number of concurrent jobs reached.",
            .fields  = {},
        });
    }

    auto job_id = make_job_id();
    while (m_jobs.contains(job_id) || m_finished.contains(job_id)) {
        job_id = make_job_id();
    }

    auto job     = std::make_shared<BuildJob>(job_id, std::move(*validated));
    auto channel = m_hub.channel(job_id);
    auto done    = std::make_shared<std::atomic_bool>(false);
    auto& entry  = m_jobs[job_id];
    entry.job     = job;
    entry.channel = channel;
    entry.done    = done;
    entry.worker  = std::jthread([this, job, channel, done](std::stop_token stop_token) {
        iso::run_build(job, channel, m_store, *m_tool, m_settings.build, stop_token);
        done->store(true);
    });

    spdlog::info("[job {}] created for {}", job_id, job->config().identity.fqdn);
    return job_id;
}

auto JobOrchestrator::get_job(std::string_view job_id) const noexcept -> std::optional<JobSnapshot> {
    const std::lock_guard<std::mutex> lock(m_mutex);
    if (const auto it = m_jobs.find(job_id); it != m_jobs.end()) {
        return it->second.job->snapshot();
    }
    if (const auto it = m_finished.find(job_id); it != m_finished.end()) {
        return it->second;
    }
    return std::nullopt;
}

auto JobOrchestrator::list_jobs() const noexcept -> std::vector<JobSnapshot> {
    std::vector<JobSnapshot> snapshots{};
    {
        const std::lock_guard<std::mutex> lock(m_mutex);
        snapshots.reserve(m_jobs.size() + m_finished.size());
        for (const auto& [job_id, entry] : m_jobs) {
            snapshots.emplace_back(entry.job->snapshot());
        }
        for (const auto& [job_id, snapshot] : m_finished) {
            snapshots.emplace_back(snapshot);
        }
    }
    std::ranges::sort(snapshots, {}, &JobSnapshot::created_at);
    return snapshots;
}

auto JobOrchestrator::cancel_job(std::string_view job_id) noexcept -> CancelResult {
    const std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_jobs.find(job_id);
    if (it == m_jobs.end()) {
        return m_finished.contains(job_id) ? CancelResult::AlreadyFinished : CancelResult::NotFound;
    }
    auto& entry = it->second;
    if (!entry.job->transition(JobStatus::Cancelled, "Build cancelled"sv)) {
        return CancelResult::AlreadyFinished;
    }
    spdlog::info("[job {}] cancel requested", job_id);
    entry.worker.request_stop();
    return CancelResult::Cancelled;
}

auto JobOrchestrator::delete_job(std::string_view job_id) noexcept -> bool {
    std::optional<Entry> entry{};
    bool had_job{};
    {
        const std::lock_guard<std::mutex> lock(m_mutex);
        if (auto it = m_jobs.find(job_id); it != m_jobs.end()) {
            entry = std::move(it->second);
            m_jobs.erase(it);
        } else if (auto finished = m_finished.find(job_id); finished != m_finished.end()) {
            m_finished.erase(finished);
            had_job = true;
        }
    }

    had_job = had_job || entry.has_value();
    if (entry.has_value()) {
        entry->job->transition(JobStatus::Cancelled, "Job deleted"sv);
        entry->worker.request_stop();
        // joins the worker before artifacts go away
        entry.reset();
        m_hub.remove(job_id);
    }
    const bool had_artifacts = m_store.remove(job_id);
    return had_job || had_artifacts;
}

auto JobOrchestrator::subscribe(std::string_view job_id) noexcept -> std::optional<progress::Subscription> {
    if (auto channel = m_hub.find(job_id)) {
        return channel->subscribe();
    }
    std::optional<JobSnapshot> snapshot{};
    {
        const std::lock_guard<std::mutex> lock(m_mutex);
        if (const auto it = m_finished.find(job_id); it != m_finished.end()) {
            snapshot = it->second;
        }
    }
    if (!snapshot) {
        return std::nullopt;
    }
    // replays the closing event of a released job
    auto channel = progress::ProgressChannel::create();
    channel->close(iso::make_final_event(*snapshot));
    return channel->subscribe();
}

auto JobOrchestrator::active_job_count() const noexcept -> std::size_t {
    const std::lock_guard<std::mutex> lock(m_mutex);
    return active_job_count_locked();
}

auto JobOrchestrator::active_job_count_locked() const noexcept -> std::size_t {
    return static_cast<std::size_t>(std::ranges::count_if(m_jobs, [](auto&& pair) {
        return !is_terminal(pair.second.job->status());
    }));
}

auto JobOrchestrator::check_stalled_jobs() noexcept -> std::size_t {
    if (m_settings.stall_timeout.count() <= 0) {
        return 0;
    }
    const auto now = std::chrono::steady_clock::now();
    std::size_t stalled{};

    const std::lock_guard<std::mutex> lock(m_mutex);
    for (auto& [job_id, entry] : m_jobs) {
        if (is_terminal(entry.job->status()) || now - entry.job->last_update() < m_settings.stall_timeout) {
            continue;
        }
        const auto message = fmt::format(FMT_COMPILE("no progress for {}s"), m_settings.stall_timeout.count());
        if (entry.job->fail(BuildError{"watchdog", message})) {
            spdlog::error("[job {}] build stalled, {}", job_id, message);
            entry.worker.request_stop();
            ++stalled;
        }
    }
    return stalled;
}

auto JobOrchestrator::reap_finished_jobs() noexcept -> std::size_t {
    const std::lock_guard<std::mutex> lock(m_mutex);
    return reap_finished_locked();
}

auto JobOrchestrator::reap_finished_locked() noexcept -> std::size_t {
    std::size_t reaped{};
    for (auto it = m_jobs.begin(); it != m_jobs.end();) {
        auto& entry = it->second;
        if (!entry.done->load()) {
            ++it;
            continue;
        }
        // the worker has returned, join is immediate
        if (entry.worker.joinable()) {
            entry.worker.join();
        }
        m_hub.remove(it->first);
        m_finished.insert_or_assign(it->first, entry.job->snapshot());
        spdlog::debug("[job {}] worker released", it->first);
        it = m_jobs.erase(it);
        ++reaped;
    }
    return reaped;
}

auto JobOrchestrator::worker_count() const noexcept -> std::size_t {
    const std::lock_guard<std::mutex> lock(m_mutex);
    return m_jobs.size();
}

void JobOrchestrator::watchdog_loop(std::stop_token stop_token) noexcept {
    while (!stop_token.stop_requested()) {
        {
            std::unique_lock<std::mutex> lock(m_watchdog_mutex);
            m_watchdog_cv.wait_for(lock, stop_token, m_settings.watchdog_interval, [] { return false; });
        }
        if (stop_token.stop_requested()) {
            break;
        }
        check_stalled_jobs();
        reap_finished_jobs();
    }
}

}  // namespace autoiso::job
