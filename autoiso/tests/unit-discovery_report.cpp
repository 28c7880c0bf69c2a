#include "doctest_compatibility.h"

#include "autoiso/discovery_report.hpp"

#include <string_view>

using namespace std::string_view_literals;

TEST_CASE("discovery report json test")
{
    using autoiso::discovery::DiscoveryReport;

    const DiscoveryReport report{.disk = "/dev/nvme0n1", .mgmt_nic = "eno1"};
    REQUIRE_EQ(autoiso::discovery::discovery_report_to_json(report), R"({"disk":"/dev/nvme0n1","mgmt_nic":"eno1"})");

    SECTION("parse")
    {
        const auto parsed = autoiso::discovery::parse_discovery_report(R"({"mgmt_nic": "eno1", "disk": "/dev/nvme0n1", "extra": 1})"sv);
        REQUIRE(parsed.has_value());
        REQUIRE(*parsed == report);
    }
    SECTION("missing or empty fields")
    {
        REQUIRE_FALSE(autoiso::discovery::parse_discovery_report(R"({"disk": "/dev/sda"})"sv).has_value());
        REQUIRE_FALSE(autoiso::discovery::parse_discovery_report(R"({"disk": "", "mgmt_nic": "eno1"})"sv).has_value());
        REQUIRE_FALSE(autoiso::discovery::parse_discovery_report(R"({"disk": 1, "mgmt_nic": "eno1"})"sv).has_value());
        REQUIRE_FALSE(autoiso::discovery::parse_discovery_report("not json"sv).has_value());
    }
}

TEST_CASE("bootstrap network defaults test")
{
    const autoiso::discovery::BootstrapNetwork network{};
    REQUIRE_EQ(network.address, "10.0.4.254/24");
    REQUIRE_EQ(network.gateway, "10.0.4.1");
    REQUIRE_EQ(network.dns, "10.0.4.1");
}
