#ifndef HW_DISCOVERY_HPP
#define HW_DISCOVERY_HPP

#include <cstdint>      // for uint64_t, uint8_t
#include <expected>     // for expected
#include <filesystem>   // for path
#include <functional>   // for function
#include <optional>     // for optional
#include <span>         // for span
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace autoiso::discovery {

/// Minimum size of an installation disk in GB.
inline constexpr std::uint64_t MIN_DISK_SIZE_GB = 20;

struct BlockDeviceInfo final {
    std::string name{};
    /// Size in 512-byte sectors as reported by sysfs.
    std::uint64_t size_sectors{};
    /// Unset when queue/rotational could not be read.
    std::optional<bool> rotational{};
    bool removable{};

    [[nodiscard]] constexpr auto size_gb() const noexcept -> std::uint64_t { return size_sectors / 2 / 1024 / 1024; }

    bool operator==(const BlockDeviceInfo&) const = default;
};

struct NetInterfaceInfo final {
    std::string name{};
    /// Resolved /sys/class/net/<name>.
    std::string resolved_path{};
    /// Resolved device link, unset for interfaces without one (bridges, bonds).
    std::optional<std::string> device_path{};
    bool has_physical_slot{};
    /// udev assigned ID_NET_NAME_ONBOARD.
    bool udev_onboard{};
    std::string mac{};

    bool operator==(const NetInterfaceInfo&) const = default;
};

/// How to choose among qualifying disks of the same tier.
enum class DiskTieBreak : std::uint8_t {
    Smallest,
    FirstEnumerated
};

enum class DiscoveryError : std::uint8_t {
    NoDisk,
    NoNic,
    NoMac,
    NetworkBringUp,
    CallbackFailed
};

struct DiscoveredHardware final {
    std::string disk_path{};
    std::string nic_name{};
    std::string nic_mac{};
};

/// Message printed on standard error for the failure.
[[nodiscard]] auto discovery_error_message(DiscoveryError error) noexcept -> std::string_view;

/// Tells whether udev assigned an onboard name to the interface.
using OnboardQuery = std::function<bool(std::string_view)>;

/// Runs `udevadm info -q property` for the interface and looks for ID_NET_NAME_ONBOARD.
[[nodiscard]] auto udev_has_onboard_name(std::string_view interface_name) noexcept -> bool;

/// Loop, ram, floppy and optical devices are never installation targets.
[[nodiscard]] auto is_ignored_block_device(std::string_view name) noexcept -> bool;

/// @brief Picks the installation disk.
/// Only non-removable disks of at least 20 GB qualify. Non-rotational disks win over
/// rotational ones, then any qualifying disk is taken.
/// @param devices Devices in enumeration order.
/// @param tie_break Choice within the winning tier.
[[nodiscard]] auto select_disk(std::span<const BlockDeviceInfo> devices, DiskTieBreak tie_break = DiskTieBreak::Smallest) noexcept
    -> std::optional<BlockDeviceInfo>;

/// Interfaces that may be picked as management NIC, in enumeration order.
/// udev onboard interfaces when there are any, chipset-root PCI devices otherwise.
[[nodiscard]] auto onboard_nic_candidates(std::span<const NetInterfaceInfo> interfaces) noexcept -> std::vector<NetInterfaceInfo>;

/// @brief Picks the management NIC, the first onboard candidate.
[[nodiscard]] auto select_nic(std::span<const NetInterfaceInfo> interfaces) noexcept -> std::optional<NetInterfaceInfo>;

/// Reads <sysfs_root>/block/*, sorted by name.
[[nodiscard]] auto enumerate_block_devices(const std::filesystem::path& sysfs_root) noexcept -> std::vector<BlockDeviceInfo>;

/// Reads <sysfs_root>/class/net/*, sorted by name.
[[nodiscard]] auto enumerate_net_interfaces(const std::filesystem::path& sysfs_root, const OnboardQuery& onboard_query) noexcept
    -> std::vector<NetInterfaceInfo>;

/// @brief Enumerates hardware and selects disk and management NIC.
/// @return The selection, or NoDisk / NoNic.
[[nodiscard]] auto discover_hardware(const std::filesystem::path& sysfs_root, DiskTieBreak tie_break,
    const OnboardQuery& onboard_query = udev_has_onboard_name) noexcept -> std::expected<DiscoveredHardware, DiscoveryError>;

}  // namespace autoiso::discovery

#endif  // HW_DISCOVERY_HPP
