#include "doctest_compatibility.h"
#include "fake_image_tool.hpp"

#include "autoiso/artifact_store.hpp"
#include "autoiso/job.hpp"
#include "autoiso/job_orchestrator.hpp"
#include "autoiso/logger.hpp"
#include "autoiso/progress_channel.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using namespace std::string_view_literals;

using autoiso::job::CancelResult;
using autoiso::job::CreateErrorKind;
using autoiso::job::JobStatus;
using autoiso::progress::EventKind;
using autoiso::progress::ProgressEvent;

namespace {

auto drain(autoiso::progress::Subscription& subscription) -> std::vector<ProgressEvent> {
    std::vector<ProgressEvent> events{};
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds{10};
    while (!subscription.finished() && std::chrono::steady_clock::now() < deadline) {
        if (auto event = subscription.receive_for(std::chrono::milliseconds{100})) {
            events.emplace_back(std::move(*event));
        }
    }
    return events;
}

auto make_settings(const fs::path& root) -> autoiso::job::OrchestratorSettings {
    autoiso::job::OrchestratorSettings settings{};
    settings.stall_timeout      = std::chrono::seconds{0};
    settings.build.base_iso     = root / "base.iso";
    settings.build.work_dir     = root / "work";
    return settings;
}

}  // namespace

TEST_CASE("build pipeline test")
{
    autoiso::logger::set_logger(autoiso::logger::make_noop_logger());

    const auto root = fs::temp_directory_path() / "autoiso-unit-pipeline";
    fs::remove_all(root);

    autoiso::store::ArtifactStore store{root / "store"};
    REQUIRE(store.init());

    SECTION("dhcp config end to end")
    {
        auto settings             = make_settings(root);
        settings.build.answer_url = "http://10.0.4.2:33008/api/answer-file";

        auto tool           = std::make_unique<test::FakeImageTool>();
        auto* const fake    = tool.get();
        autoiso::job::JobOrchestrator orchestrator{store, std::move(tool), settings};

        const auto job_id = orchestrator.create_job(test::make_dhcp_config());
        REQUIRE(job_id.has_value());
        REQUIRE(autoiso::job::is_valid_job_id(*job_id));

        auto subscription = orchestrator.subscribe(*job_id);
        REQUIRE(subscription.has_value());
        const auto events = drain(*subscription);
        REQUIRE(subscription->finished());
        REQUIRE_FALSE(events.empty());

        const auto& last = events.back();
        REQUIRE(last.kind == EventKind::Progress);
        REQUIRE_EQ(last.progress, 100);
        REQUIRE_EQ(last.status, "complete");
        REQUIRE_EQ(last.job_id, *job_id);

        std::uint8_t previous{};
        for (const auto& event : events) {
            REQUIRE(event.kind != EventKind::Error);
            REQUIRE(event.progress >= previous);
            previous = event.progress;
        }

        const auto snapshot = orchestrator.get_job(*job_id);
        REQUIRE(snapshot.has_value());
        REQUIRE(snapshot->status == JobStatus::Complete);
        REQUIRE_EQ(snapshot->progress, 100);
        REQUIRE(snapshot->artifact_ref.has_value());
        REQUIRE_FALSE(snapshot->error_detail.has_value());

        const auto answer = store.read_answer(*job_id);
        REQUIRE(answer.has_value());
        REQUIRE(answer->contains("host.example.com"));
        REQUIRE(answer->contains("# generated-at:"));

        const auto image = store.image_path(*job_id);
        REQUIRE(image.has_value());
        REQUIRE(fs::exists(*image));

        const auto request = fake->last_request();
        REQUIRE(request.has_value());
        REQUIRE_EQ(request->job_id, *job_id);
        REQUIRE_EQ(request->answer_file, *answer);
        REQUIRE(request->auto_installer_mode.contains("http://10.0.4.2:33008/api/answer-file/" + *job_id));

        // finished jobs stay listed
        REQUIRE_EQ(orchestrator.list_jobs().size(), 1);
        REQUIRE_EQ(orchestrator.active_job_count(), 0);
        REQUIRE(orchestrator.cancel_job(*job_id) == CancelResult::AlreadyFinished);
    }

    SECTION("invalid config creates no job")
    {
        autoiso::job::JobOrchestrator orchestrator{store, std::make_unique<test::FakeImageTool>(), make_settings(root)};

        auto config           = test::make_dhcp_config("not a hostname");
        config.network.source = autoiso::NetworkSource::StaticFromAnswer;

        const auto result = orchestrator.create_job(config);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().kind == CreateErrorKind::Invalid);
        REQUIRE(result.error().fields.contains("global.fqdn"));
        REQUIRE_FALSE(result.error().message.empty());
        REQUIRE(orchestrator.list_jobs().empty());
        REQUIRE(store.list_job_ids().empty());

        const auto from_json = orchestrator.create_job("{not json"sv);
        REQUIRE_FALSE(from_json.has_value());
        REQUIRE(from_json.error().kind == CreateErrorKind::Invalid);
        REQUIRE(orchestrator.list_jobs().empty());
    }

    SECTION("tool failure fails the job")
    {
        autoiso::job::JobOrchestrator orchestrator{store,
            std::make_unique<test::FakeImageTool>(test::ToolBehavior::Fail), make_settings(root)};

        const auto job_id = orchestrator.create_job(test::make_dhcp_config());
        REQUIRE(job_id.has_value());

        auto subscription = orchestrator.subscribe(*job_id);
        REQUIRE(subscription.has_value());
        const auto events = drain(*subscription);
        REQUIRE_FALSE(events.empty());
        REQUIRE(events.back().kind == EventKind::Error);
        REQUIRE_EQ(events.back().status, "failed");
        REQUIRE_EQ(events.back().message, "build: boom");

        const auto snapshot = orchestrator.get_job(*job_id);
        REQUIRE(snapshot.has_value());
        REQUIRE(snapshot->status == JobStatus::Failed);
        REQUIRE_EQ(snapshot->error_detail.value_or(""), "build: boom");
        REQUIRE_FALSE(store.image_path(*job_id).has_value());
    }

    SECTION("cancel running build")
    {
        auto tool        = std::make_unique<test::FakeImageTool>(test::ToolBehavior::Block);
        auto* const fake = tool.get();
        autoiso::job::JobOrchestrator orchestrator{store, std::move(tool), make_settings(root)};

        const auto job_id = orchestrator.create_job(test::make_dhcp_config());
        REQUIRE(job_id.has_value());
        auto subscription = orchestrator.subscribe(*job_id);
        REQUIRE(subscription.has_value());

        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds{10};
        while (!fake->started() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds{5});
        }
        REQUIRE(fake->started());
        REQUIRE(orchestrator.get_job(*job_id)->status == JobStatus::Building);
        REQUIRE_EQ(orchestrator.active_job_count(), 1);

        REQUIRE(orchestrator.cancel_job(*job_id) == CancelResult::Cancelled);
        REQUIRE(orchestrator.cancel_job(*job_id) == CancelResult::AlreadyFinished);
        REQUIRE(orchestrator.cancel_job("00000000-0000-4000-8000-000000000000"sv) == CancelResult::NotFound);

        const auto events = drain(*subscription);
        REQUIRE(subscription->finished());
        REQUIRE_FALSE(events.empty());
        REQUIRE_EQ(events.back().status, "cancelled");

        const auto snapshot = orchestrator.get_job(*job_id);
        REQUIRE(snapshot.has_value());
        REQUIRE(snapshot->status == JobStatus::Cancelled);
        REQUIRE_FALSE(store.image_path(*job_id).has_value());
        REQUIRE_EQ(orchestrator.active_job_count(), 0);
    }

    SECTION("concurrent job limit")
    {
        auto settings     = make_settings(root);
        settings.max_jobs = 1;
        autoiso::job::JobOrchestrator orchestrator{store,
            std::make_unique<test::FakeImageTool>(test::ToolBehavior::Block), settings};

        const auto first = orchestrator.create_job(test::make_dhcp_config());
        REQUIRE(first.has_value());

        const auto second = orchestrator.create_job(test::make_dhcp_config("other.example.com"));
        REQUIRE_FALSE(second.has_value());
        REQUIRE(second.error().kind == CreateErrorKind::TooManyJobs);
        REQUIRE_EQ(orchestrator.list_jobs().size(), 1);

        REQUIRE(orchestrator.cancel_job(*first) == CancelResult::Cancelled);
        const auto third = orchestrator.create_job(test::make_dhcp_config("third.example.com"));
        REQUIRE(third.has_value());
        REQUIRE(orchestrator.delete_job(*third));
        REQUIRE(orchestrator.delete_job(*first));
    }

    SECTION("delete removes job and artifacts")
    {
        autoiso::job::JobOrchestrator orchestrator{store, std::make_unique<test::FakeImageTool>(), make_settings(root)};

        const auto job_id = orchestrator.create_job(test::make_dhcp_config());
        REQUIRE(job_id.has_value());
        const auto snapshot = test::wait_until_terminal(orchestrator, *job_id);
        REQUIRE(snapshot.has_value());
        REQUIRE(snapshot->status == JobStatus::Complete);
        REQUIRE(store.contains(*job_id));

        REQUIRE(orchestrator.delete_job(*job_id));
        REQUIRE_FALSE(store.contains(*job_id));
        REQUIRE_FALSE(orchestrator.get_job(*job_id).has_value());
        REQUIRE_FALSE(orchestrator.subscribe(*job_id).has_value());
        REQUIRE_FALSE(orchestrator.delete_job(*job_id));
    }

    SECTION("stalled build is failed by the watchdog")
    {
        auto settings              = make_settings(root);
        settings.stall_timeout     = std::chrono::seconds{1};
        settings.watchdog_interval = std::chrono::milliseconds{50};
        autoiso::job::JobOrchestrator orchestrator{store,
            std::make_unique<test::FakeImageTool>(test::ToolBehavior::Block), settings};

        const auto job_id = orchestrator.create_job(test::make_dhcp_config());
        REQUIRE(job_id.has_value());

        const auto snapshot = test::wait_until_terminal(orchestrator, *job_id);
        REQUIRE(snapshot.has_value());
        REQUIRE(snapshot->status == JobStatus::Failed);
        REQUIRE_EQ(snapshot->error_detail.value_or(""), "watchdog: no progress for 1s");
    }

    SECTION("finished workers are released")
    {
        auto settings              = make_settings(root);
        settings.watchdog_interval = std::chrono::milliseconds{20};
        autoiso::job::JobOrchestrator orchestrator{store, std::make_unique<test::FakeImageTool>(), settings};

        std::vector<std::string> job_ids{};
        for (const auto* fqdn : {"one.example.com", "two.example.com", "three.example.com"}) {
            const auto job_id = orchestrator.create_job(test::make_dhcp_config(fqdn));
            REQUIRE(job_id.has_value());
            REQUIRE(test::wait_until_terminal(orchestrator, *job_id).has_value());
            job_ids.emplace_back(*job_id);
        }

        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds{10};
        while (orchestrator.worker_count() != 0 && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds{5});
        }
        REQUIRE_EQ(orchestrator.worker_count(), 0);
        REQUIRE_EQ(orchestrator.channel_count(), 0);
        REQUIRE_EQ(orchestrator.reap_finished_jobs(), 0);

        // history survives the release
        REQUIRE_EQ(orchestrator.list_jobs().size(), 3);
        for (const auto& job_id : job_ids) {
            const auto snapshot = orchestrator.get_job(job_id);
            REQUIRE(snapshot.has_value());
            REQUIRE(snapshot->status == JobStatus::Complete);
            REQUIRE(orchestrator.cancel_job(job_id) == CancelResult::AlreadyFinished);
        }

        auto subscription = orchestrator.subscribe(job_ids.front());
        REQUIRE(subscription.has_value());
        const auto events = drain(*subscription);
        REQUIRE_EQ(events.size(), 1);
        REQUIRE(events.front().kind == EventKind::Progress);
        REQUIRE_EQ(events.front().progress, 100);
        REQUIRE_EQ(events.front().status, "complete");
        REQUIRE_EQ(orchestrator.channel_count(), 0);

        REQUIRE(orchestrator.delete_job(job_ids.front()));
        REQUIRE_FALSE(orchestrator.get_job(job_ids.front()).has_value());
        REQUIRE_FALSE(orchestrator.subscribe(job_ids.front()).has_value());
        REQUIRE_FALSE(store.contains(job_ids.front()));
        REQUIRE_EQ(orchestrator.list_jobs().size(), 2);
    }

    fs::remove_all(root);
}
