#ifndef INSTALLER_CONFIG_HPP
#define INSTALLER_CONFIG_HPP

#include <cstdint>      // for uint8_t
#include <expected>     // for expected
#include <map>          // for map
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace autoiso {

/// Field name -> human readable reason.
using FieldErrors = std::map<std::string, std::string>;

/// Where the installed system takes its management network settings from.
enum class NetworkSource : std::uint8_t {
    Dhcp,
    StaticFromAnswer
};

/// Filesystems the installer can put on the target disks.
enum class Filesystem : std::uint8_t {
    Ext4,
    Xfs,
    Zfs,
    Btrfs
};

/// Management network settings.
/// With Dhcp source cidr, gateway and dns are always empty.
struct NetworkConfig final {
    NetworkSource source{NetworkSource::Dhcp};
    std::optional<std::string> cidr{};
    std::optional<std::string> gateway{};
    std::vector<std::string> dns{};
    /// Interface filter, patched with the discovered MAC at boot time.
    std::string mac_filter{"*00:11:22:33:44:55"};

    bool operator==(const NetworkConfig&) const = default;
};

/// Identity of the installed host.
struct IdentityConfig final {
    std::string fqdn{};
    std::string email{"root@localhost"};
    std::string country{"us"};
    std::string timezone{"America/New_York"};
    std::string keyboard_layout{"en-us"};
    /// crypt(3) SHA-512 hash, the plaintext never reaches this structure.
    std::string root_password_hash{};

    bool operator==(const IdentityConfig&) const = default;
};

/// Target disk layout.
struct DiskSetupConfig final {
    Filesystem filesystem{Filesystem::Zfs};
    std::optional<std::string> zfs_raid{"raid0"};
    std::optional<std::string> btrfs_raid{};
    /// Patched with the discovered disk at boot time.
    std::vector<std::string> disk_list{"/dev/sda"};

    bool operator==(const DiskSetupConfig&) const = default;
};

/// Complete machine configuration submitted by the user.
struct InstallerConfig final {
    IdentityConfig identity{};
    NetworkConfig network{};
    DiskSetupConfig disk_setup{};

    bool operator==(const InstallerConfig&) const = default;
};

/// Converts a submitted network source ("dhcp", "from-dhcp", "static", "from-answer").
[[nodiscard]] auto network_source_from_string(std::string_view source_str) noexcept
    -> std::optional<NetworkSource>;

/// Converts NetworkSource to the installer's spelling.
[[nodiscard]] auto network_source_to_string(NetworkSource source) noexcept -> std::string_view;

/// Converts a string to Filesystem.
[[nodiscard]] auto filesystem_from_string(std::string_view fs_str) noexcept
    -> std::optional<Filesystem>;

/// Converts Filesystem to string.
[[nodiscard]] auto filesystem_to_string(Filesystem fs) noexcept -> std::string_view;

/// Parses a submitted configuration from JSON.
/// Identity fields are read from a "global" object when present, from the root object otherwise.
/// A plaintext "root-password" is checked for strength and replaced by its hash.
/// @param json_content The JSON request body.
/// @return InstallerConfig on success, or errors keyed by field.
[[nodiscard]] auto parse_installer_config(std::string_view json_content) noexcept
    -> std::expected<InstallerConfig, FieldErrors>;

/// Joins field errors into a single line, e.g. "global.fqdn: invalid FQDN; network.dns: ...".
[[nodiscard]] auto format_field_errors(const FieldErrors& errors) noexcept -> std::string;

/// Hashes a password into crypt(3) SHA-512 form through openssl.
[[nodiscard]] auto hash_root_password(std::string_view password) noexcept -> std::optional<std::string>;

}  // namespace autoiso

#endif  // INSTALLER_CONFIG_HPP
