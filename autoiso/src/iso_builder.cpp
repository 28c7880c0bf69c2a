#include "autoiso/iso_builder.hpp"
#include "autoiso/answer_file.hpp"

#include <chrono>       // for system_clock
#include <string_view>  // for string_view

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace fs = std::filesystem;

namespace {

using autoiso::job::BuildJob;
using autoiso::job::JobStatus;
using autoiso::progress::EventKind;
using autoiso::progress::ProgressChannel;
using autoiso::progress::ProgressEvent;

void publish_status(const BuildJob& job, ProgressChannel& channel, std::string_view message) noexcept {
    const auto snapshot = job.snapshot();
    channel.publish(ProgressEvent{
        .job_id   = snapshot.id,
        .kind     = EventKind::Status,
        .progress = snapshot.progress,
        .status   = std::string{autoiso::job::job_status_to_string(snapshot.status)},
        .message  = std::string{message},
    });
}

void publish_progress(BuildJob& job, ProgressChannel& channel, std::uint8_t progress, std::string_view message) noexcept {
    if (!job.set_progress(progress, message)) {
        return;
    }
    channel.publish(ProgressEvent{
        .job_id   = job.id(),
        .kind     = EventKind::Progress,
        .progress = progress,
        .status   = std::string{autoiso::job::job_status_to_string(job.status())},
        .message  = std::string{message},
    });
}

// Moves the job along or gives up when it was already finished elsewhere.
auto advance(BuildJob& job, ProgressChannel& channel, JobStatus to, std::string_view message) noexcept -> bool {
    if (!job.transition(to, message)) {
        return false;
    }
    publish_status(job, channel, message);
    return true;
}

void finish(BuildJob& job, ProgressChannel& channel, std::stop_token stop_token) noexcept {
    if (stop_token.stop_requested()) {
        // no-op when cancel or the watchdog already finished the job
        job.transition(JobStatus::Cancelled, "Build cancelled"sv);
    }
    const auto snapshot = job.snapshot();
    spdlog::info("[job {}] finished: {}", snapshot.id, autoiso::job::job_status_to_string(snapshot.status));
    channel.close(autoiso::iso::make_final_event(snapshot));
}

}  // namespace

namespace autoiso::iso {

auto make_final_event(const job::JobSnapshot& snapshot) noexcept -> progress::ProgressEvent {
    progress::ProgressEvent event{
        .job_id   = snapshot.id,
        .kind     = EventKind::Status,
        .progress = snapshot.progress,
        .status   = std::string{job::job_status_to_string(snapshot.status)},
        .message  = snapshot.status_message,
    };
    if (snapshot.status == JobStatus::Complete) {
        event.kind     = EventKind::Progress;
        event.progress = 100;
    } else if (snapshot.status == JobStatus::Failed) {
        event.kind    = EventKind::Error;
        event.message = snapshot.error_detail.value_or(snapshot.status_message);
    }
    return event;
}

void run_build(const std::shared_ptr<job::BuildJob>& job, const std::shared_ptr<progress::ProgressChannel>& channel,
    store::ArtifactStore& store, ImageTool& tool, const BuildSettings& settings, std::stop_token stop_token) noexcept {
    const auto& job_id = job->id();
    spdlog::info("[job {}] build started with {}", job_id, tool.name());

    const auto fail = [&](job::BuildError error) {
        spdlog::error("[job {}] {} failed: {}", job_id, error.stage, error.message);
        job->fail(error);
    };

    // render
    if (stop_token.stop_requested() || !advance(*job, *channel, JobStatus::Rendering, "Rendering answer file"sv)) {
        finish(*job, *channel, stop_token);
        return;
    }
    publish_progress(*job, *channel, 0, "Rendering answer file"sv);

    const auto answer_file = answer::render_answer_file(job->config(),
        answer::RenderOptions{.generated_at = job::format_timestamp(std::chrono::system_clock::now())});
    if (!store.put_answer(job_id, answer_file)) {
        fail(job::BuildError{"render", "failed to store answer file"});
        finish(*job, *channel, stop_token);
        return;
    }
    std::optional<std::string> answer_url{};
    if (settings.answer_url.has_value()) {
        answer_url = fmt::format(FMT_COMPILE("{}/{}"), *settings.answer_url, job_id);
    }
    publish_progress(*job, *channel, 10, "Answer file rendered"sv);

    // build image
    if (stop_token.stop_requested() || !advance(*job, *channel, JobStatus::Building, "Building ISO"sv)) {
        finish(*job, *channel, stop_token);
        return;
    }

    const auto work_dir = settings.work_dir / fmt::format(FMT_COMPILE("job-{}"), job_id);
    const ImageBuildRequest request{
        .job_id              = job_id,
        .base_iso            = settings.base_iso,
        .work_dir            = work_dir,
        .output_iso          = work_dir / store::ArtifactStore::image_file_name(job_id),
        .answer_file         = answer_file,
        .auto_installer_mode = answer::render_auto_installer_mode(answer_url),
    };

    std::error_code err{};
    fs::create_directories(work_dir, err);
    if (err) {
        fail(job::BuildError{"build", fmt::format(FMT_COMPILE("cannot create work dir '{}': {}"), work_dir.string(), err.message())});
        finish(*job, *channel, stop_token);
        return;
    }

    auto built = tool.build(request, [&](std::uint8_t percent, std::string_view message) {
        publish_progress(*job, *channel, map_tool_progress(percent), message);
    }, stop_token);

    if (built && !stop_token.stop_requested()) {
        // finalize
        publish_progress(*job, *channel, 95, "Storing ISO"sv);
        if (auto image = store.put_image(job_id, request.output_iso)) {
            if (job->complete(image->string())) {
                spdlog::info("[job {}] ISO stored at {}", job_id, image->string());
            }
        } else {
            fail(job::BuildError{"finalize", "failed to store ISO"});
        }
    } else if (!built && !stop_token.stop_requested()) {
        fail(built.error());
    }

    fs::remove_all(work_dir, err);
    if (err) {
        spdlog::warn("[job {}] failed to clean '{}': {}", job_id, work_dir.string(), err.message());
    }
    finish(*job, *channel, stop_token);
}

}  // namespace autoiso::iso
