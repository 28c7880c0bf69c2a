#include "autoiso/job.hpp"

#include <algorithm>    // for min
#include <ctime>        // for time_t
#include <random>       // for random_device, mt19937_64
#include <string_view>  // for string_view

#include <ctre.hpp>  // for ctre::match

#include <fmt/chrono.h>
#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wold-style-cast"
#elif defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wuseless-cast"
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#if defined(__clang__)
#pragma clang diagnostic pop
#elif defined(__GNUC__)
#pragma GCC diagnostic pop
#endif

using namespace std::string_view_literals;

namespace autoiso::job {

auto job_status_to_string(JobStatus status) noexcept -> std::string_view {
    switch (status) {
    case JobStatus::Pending:
        return "pending"sv;
    case JobStatus::Rendering:
        return "rendering"sv;
    case JobStatus::Building:
        return "building"sv;
    case JobStatus::Complete:
        return "complete"sv;
    case JobStatus::Failed:
        return "failed"sv;
    case JobStatus::Cancelled:
        return "cancelled"sv;
    }
    return "unknown"sv;
}

auto can_transition(JobStatus from, JobStatus to) noexcept -> bool {
    if (is_terminal(from)) {
        return false;
    }
    if (to == JobStatus::Cancelled) {
        return true;
    }
    switch (from) {
    case JobStatus::Pending:
        return to == JobStatus::Rendering || to == JobStatus::Failed;
    case JobStatus::Rendering:
        return to == JobStatus::Building || to == JobStatus::Failed;
    case JobStatus::Building:
        return to == JobStatus::Complete || to == JobStatus::Failed;
    default:
        return false;
    }
}

auto make_job_id() noexcept -> std::string {
    static thread_local std::mt19937_64 engine{std::random_device{}()};
    std::uniform_int_distribution<std::uint64_t> dist{};

    auto high = dist(engine);
    auto low  = dist(engine);
    // version 4, variant 10xx
    high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    low  = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    return fmt::format(FMT_COMPILE("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}"),
        high >> 32U, (high >> 16U) & 0xFFFFU, high & 0xFFFFU,
        low >> 48U, low & 0xFFFFFFFFFFFFULL);
}

auto is_valid_job_id(std::string_view job_id) noexcept -> bool {
    return static_cast<bool>(ctre::match<"[0-9a-fA-F]{8}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{12}">(job_id));
}

auto format_timestamp(std::chrono::system_clock::time_point time_point) noexcept -> std::string {
    const std::time_t time = std::chrono::system_clock::to_time_t(time_point);
    return fmt::format("{:%Y-%m-%dT%H:%M:%SZ}", fmt::gmtime(time));
}

auto job_snapshot_to_json(const JobSnapshot& snapshot) noexcept -> std::string {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);

    const auto write_string = [&writer](std::string_view str) {
        writer.String(str.data(), static_cast<rapidjson::SizeType>(str.size()));
    };

    writer.StartObject();
    writer.Key("jobId");
    write_string(snapshot.id);
    writer.Key("status");
    write_string(job_status_to_string(snapshot.status));
    writer.Key("progress");
    writer.Uint(snapshot.progress);
    writer.Key("statusMessage");
    write_string(snapshot.status_message);
    writer.Key("createdAt");
    write_string(format_timestamp(snapshot.created_at));
    if (snapshot.artifact_ref.has_value()) {
        writer.Key("artifactRef");
        write_string(*snapshot.artifact_ref);
    }
    if (snapshot.error_detail.has_value()) {
        writer.Key("errorDetail");
        write_string(*snapshot.error_detail);
    }
    writer.EndObject();
    return {buffer.GetString(), buffer.GetSize()};
}

BuildJob::BuildJob(std::string id, InstallerConfig config) noexcept
  : m_id(std::move(id)), m_config(std::move(config)) { }

auto BuildJob::transition(JobStatus to, std::string_view message) noexcept -> bool {
    const std::lock_guard<std::mutex> lock(m_mutex);
    return transition_locked(to, message);
}

auto BuildJob::transition_locked(JobStatus to, std::string_view message) noexcept -> bool {
    if (!can_transition(m_status, to)) {
        spdlog::warn("[job {}] refused transition {} -> {}", m_id, job_status_to_string(m_status), job_status_to_string(to));
        return false;
    }
    spdlog::debug("[job {}] {} -> {}", m_id, job_status_to_string(m_status), job_status_to_string(to));
    m_status         = to;
    m_status_message = message;
    m_last_update    = std::chrono::steady_clock::now();
    return true;
}

auto BuildJob::set_progress(std::uint8_t progress, std::string_view message) noexcept -> bool {
    const std::lock_guard<std::mutex> lock(m_mutex);
    if (is_terminal(m_status)) {
        return false;
    }
    progress = std::min<std::uint8_t>(progress, 100);
    if (progress < m_progress) {
        return false;
    }
    m_progress       = progress;
    m_status_message = message;
    m_last_update    = std::chrono::steady_clock::now();
    return true;
}

auto BuildJob::complete(std::string artifact_ref) noexcept -> bool {
    const std::lock_guard<std::mutex> lock(m_mutex);
    if (!transition_locked(JobStatus::Complete, "ISO build complete"sv)) {
        return false;
    }
    m_progress     = 100;
    m_artifact_ref = std::move(artifact_ref);
    return true;
}

auto BuildJob::fail(const BuildError& error) noexcept -> bool {
    const std::lock_guard<std::mutex> lock(m_mutex);
    auto detail = fmt::format(FMT_COMPILE("{}: {}"), error.stage, error.message);
    if (!transition_locked(JobStatus::Failed, detail)) {
        return false;
    }
    m_error_detail = std::move(detail);
    return true;
}

auto BuildJob::status() const noexcept -> JobStatus {
    const std::lock_guard<std::mutex> lock(m_mutex);
    return m_status;
}

auto BuildJob::snapshot() const noexcept -> JobSnapshot {
    const std::lock_guard<std::mutex> lock(m_mutex);
    return JobSnapshot{
        .id             = m_id,
        .status         = m_status,
        .progress       = m_progress,
        .status_message = m_status_message,
        .created_at     = m_created_at,
        .artifact_ref   = m_artifact_ref,
        .error_detail   = m_error_detail,
    };
}

auto BuildJob::last_update() const noexcept -> std::chrono::steady_clock::time_point {
    const std::lock_guard<std::mutex> lock(m_mutex);
    return m_last_update;
}

}  // namespace autoiso::job
