#include "autoiso/discovery_report.hpp"
#include "autoiso/file_utils.hpp"
#include "autoiso/io_utils.hpp"

#include <chrono>       // for chrono_literals
#include <string_view>  // for string_view

#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wold-style-cast"
#elif defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wuseless-cast"
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#if defined(__clang__)
#pragma clang diagnostic pop
#elif defined(__GNUC__)
#pragma GCC diagnostic pop
#endif

#include <cpr/api.h>
#include <cpr/body.h>
#include <cpr/cprtypes.h>
#include <cpr/response.h>
#include <cpr/timeout.h>

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace autoiso::discovery {

auto discovery_report_to_json(const DiscoveryReport& report) noexcept -> std::string {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);

    writer.StartObject();
    writer.Key("disk");
    writer.String(report.disk.c_str(), static_cast<rapidjson::SizeType>(report.disk.size()));
    writer.Key("mgmt_nic");
    writer.String(report.mgmt_nic.c_str(), static_cast<rapidjson::SizeType>(report.mgmt_nic.size()));
    writer.EndObject();
    return {buffer.GetString(), buffer.GetSize()};
}

auto parse_discovery_report(std::string_view json_content) noexcept -> std::optional<DiscoveryReport> {
    rapidjson::Document doc;
    doc.Parse(json_content.data(), json_content.size());
    if (doc.HasParseError() || !doc.IsObject()) {
        return std::nullopt;
    }
    if (!doc.HasMember("disk") || !doc["disk"].IsString() || !doc.HasMember("mgmt_nic") || !doc["mgmt_nic"].IsString()) {
        return std::nullopt;
    }
    DiscoveryReport report{
        .disk     = doc["disk"].GetString(),
        .mgmt_nic = doc["mgmt_nic"].GetString(),
    };
    if (report.disk.empty() || report.mgmt_nic.empty()) {
        return std::nullopt;
    }
    return report;
}

auto bring_up_network(std::string_view nic_name, const BootstrapNetwork& network) noexcept -> bool {
    const auto& nic = utils::shell_quote(nic_name);
    if (!utils::exec_checked(fmt::format(FMT_COMPILE("ip link set dev {} up"), nic))) {
        spdlog::error("Failed to set {} up", nic_name);
        return false;
    }
    if (!utils::exec_checked(fmt::format(FMT_COMPILE("ip addr add {} dev {}"), utils::shell_quote(network.address), nic))) {
        spdlog::error("Failed to add {} to {}", network.address, nic_name);
        return false;
    }
    if (!utils::exec_checked(fmt::format(FMT_COMPILE("ip route add default via {}"), utils::shell_quote(network.gateway)))) {
        spdlog::error("Failed to add default route via {}", network.gateway);
        return false;
    }
    if (!file_utils::create_file_for_overwrite(network.resolv_conf, fmt::format(FMT_COMPILE("nameserver {}\n"), network.dns))) {
        spdlog::error("Failed to write {}", network.resolv_conf);
        return false;
    }
    return true;
}

auto send_discovery_report(std::string_view callback_url, const DiscoveryReport& report) noexcept
    -> std::expected<void, DiscoveryError> {
    using namespace std::chrono_literals;

    auto timeout  = cpr::Timeout{30s};
    auto response = cpr::Post(cpr::Url{callback_url}, cpr::Body{discovery_report_to_json(report)},
        cpr::Header{{"Content-Type", "application/json"}}, timeout);
    if (response.status_code != 200) {
        spdlog::error("HTTP code: {}", response.status_code);
        if (!response.error.message.empty()) {
            spdlog::error("{}", response.error.message);
        }
        if (!response.text.empty()) {
            spdlog::error("{}", response.text);
        }
        return std::unexpected(DiscoveryError::CallbackFailed);
    }
    spdlog::info("Reported disk {} and management NIC {} to {}", report.disk, report.mgmt_nic, callback_url);
    return {};
}

}  // namespace autoiso::discovery
