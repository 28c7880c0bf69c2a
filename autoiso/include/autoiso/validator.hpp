#ifndef VALIDATOR_HPP
#define VALIDATOR_HPP

#include "autoiso/installer_config.hpp"

#include <cstdint>      // for uint32_t, uint8_t
#include <expected>     // for expected
#include <optional>     // for optional
#include <span>         // for span
#include <string>       // for string
#include <string_view>  // for string_view

namespace autoiso::validator {

/// Result of a single field check, carries the reason on failure.
using ValidationResult = std::expected<void, std::string>;

struct Cidr final {
    std::uint32_t address{};
    std::uint8_t prefix{24};
};

/// Parses dotted-quad IPv4 address into host byte order.
[[nodiscard]] auto parse_ipv4(std::string_view address) noexcept -> std::optional<std::uint32_t>;

/// Parses "a.b.c.d[/prefix]". Missing prefix means /24.
[[nodiscard]] auto parse_cidr(std::string_view cidr) noexcept -> std::optional<Cidr>;

/// Network mask for the prefix length. Prefix 0 gives 0.
[[nodiscard]] constexpr auto prefix_mask(std::uint8_t prefix) noexcept -> std::uint32_t {
    if (prefix == 0) {
        return 0U;
    }
    return ~std::uint32_t{0} << (32U - prefix);
}

/// Estimated password entropy in bits: length * log2(pool size).
[[nodiscard]] auto password_entropy(std::string_view password) noexcept -> double;

/// Requires at least 12 characters and more than 80 bits of entropy.
[[nodiscard]] auto validate_password(std::string_view password) noexcept -> ValidationResult;

[[nodiscard]] auto validate_fqdn(std::string_view fqdn) noexcept -> ValidationResult;
[[nodiscard]] auto validate_email(std::string_view email) noexcept -> ValidationResult;
[[nodiscard]] auto validate_country(std::string_view country) noexcept -> ValidationResult;
[[nodiscard]] auto validate_timezone(std::string_view timezone) noexcept -> ValidationResult;
[[nodiscard]] auto validate_keyboard(std::string_view keyboard) noexcept -> ValidationResult;
[[nodiscard]] auto validate_root_password_hash(std::string_view hash) noexcept -> ValidationResult;
[[nodiscard]] auto validate_mac_filter(std::string_view filter) noexcept -> ValidationResult;

/// Keyboard layouts known to the installer.
[[nodiscard]] auto available_keyboards() noexcept -> std::span<const std::string_view>;

/// @brief Validates network settings.
/// DHCP is always valid and comes back with cidr, gateway and dns cleared.
/// Static settings need cidr, gateway inside the cidr network and unique IPv4 dns servers.
/// @param network The settings to check.
/// @return Normalized settings, or errors keyed by field.
[[nodiscard]] auto validate_network(const NetworkConfig& network) noexcept
    -> std::expected<NetworkConfig, FieldErrors>;

/// Checks filesystem, raid level against disk count, and disk paths.
[[nodiscard]] auto validate_disk_setup(const DiskSetupConfig& disk_setup) noexcept
    -> std::expected<DiskSetupConfig, FieldErrors>;

[[nodiscard]] auto validate_identity(const IdentityConfig& identity) noexcept
    -> std::expected<IdentityConfig, FieldErrors>;

/// @brief Validates a complete configuration, collecting every field error.
/// @return Normalized configuration, or all errors keyed like "global.fqdn" or "network.gateway".
[[nodiscard]] auto validate_installer_config(const InstallerConfig& config) noexcept
    -> std::expected<InstallerConfig, FieldErrors>;

}  // namespace autoiso::validator

#endif  // VALIDATOR_HPP
