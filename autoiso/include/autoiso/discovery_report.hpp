#ifndef DISCOVERY_REPORT_HPP
#define DISCOVERY_REPORT_HPP

#include "autoiso/hw_discovery.hpp"

#include <expected>     // for expected
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view

namespace autoiso::discovery {

/// Temporary addressing of the management NIC before installation.
struct BootstrapNetwork final {
    std::string address{"10.0.4.254/24"};
    std::string gateway{"10.0.4.1"};
    std::string dns{"10.0.4.1"};
    std::string resolv_conf{"/etc/resolv.conf"};
};

/// What the agent tells the config server.
struct DiscoveryReport final {
    std::string disk{};
    std::string mgmt_nic{};

    bool operator==(const DiscoveryReport&) const = default;
};

/// Serializes as {"disk":"...","mgmt_nic":"..."}.
[[nodiscard]] auto discovery_report_to_json(const DiscoveryReport& report) noexcept -> std::string;

/// Parses the callback body, std::nullopt when either field is missing or empty.
[[nodiscard]] auto parse_discovery_report(std::string_view json_content) noexcept -> std::optional<DiscoveryReport>;

/// @brief Brings the NIC up with the bootstrap address, default route and resolver.
auto bring_up_network(std::string_view nic_name, const BootstrapNetwork& network) noexcept -> bool;

/// @brief POSTs the report to the config server.
/// @return CallbackFailed unless the server answers 200.
auto send_discovery_report(std::string_view callback_url, const DiscoveryReport& report) noexcept
    -> std::expected<void, DiscoveryError>;

}  // namespace autoiso::discovery

#endif  // DISCOVERY_REPORT_HPP
