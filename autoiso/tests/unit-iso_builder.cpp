#include "doctest_compatibility.h"

#include "autoiso/iso_builder.hpp"
#include "autoiso/job.hpp"

#include <string_view>

using namespace std::string_view_literals;
using autoiso::job::JobStatus;
using autoiso::progress::EventKind;

TEST_CASE("tool progress mapping test")
{
    static_assert(autoiso::iso::map_tool_progress(0) == 10);
    static_assert(autoiso::iso::map_tool_progress(50) == 52);
    static_assert(autoiso::iso::map_tool_progress(100) == 95);
    static_assert(autoiso::iso::map_tool_progress(250) == 95);

    std::uint8_t last{};
    for (std::uint32_t percent = 0; percent <= 100; ++percent) {
        const auto mapped = autoiso::iso::map_tool_progress(static_cast<std::uint8_t>(percent));
        REQUIRE(mapped >= last);
        last = mapped;
    }
}

TEST_CASE("final event test")
{
    autoiso::job::JobSnapshot snapshot{};
    snapshot.id             = "123e4567-e89b-42d3-a456-426614174000";
    snapshot.progress       = 40;
    snapshot.status_message = "Building ISO";

    SECTION("complete")
    {
        snapshot.status         = JobStatus::Complete;
        snapshot.progress       = 100;
        snapshot.status_message = "ISO build complete";
        const auto event        = autoiso::iso::make_final_event(snapshot);
        REQUIRE_EQ(event.kind, EventKind::Progress);
        REQUIRE_EQ(event.progress, 100);
        REQUIRE_EQ(event.status, "complete");
        REQUIRE_EQ(event.job_id, snapshot.id);
    }
    SECTION("failed")
    {
        snapshot.status       = JobStatus::Failed;
        snapshot.error_detail = "build: xorriso exited with code 5";
        const auto event      = autoiso::iso::make_final_event(snapshot);
        REQUIRE_EQ(event.kind, EventKind::Error);
        REQUIRE_EQ(event.progress, 40);
        REQUIRE_EQ(event.message, "build: xorriso exited with code 5");
    }
    SECTION("cancelled")
    {
        snapshot.status         = JobStatus::Cancelled;
        snapshot.status_message = "Cancelled by user";
        const auto event        = autoiso::iso::make_final_event(snapshot);
        REQUIRE_EQ(event.kind, EventKind::Status);
        REQUIRE_EQ(event.status, "cancelled");
        REQUIRE_EQ(event.message, "Cancelled by user");
    }
}
