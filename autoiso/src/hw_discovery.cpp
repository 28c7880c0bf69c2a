#include "autoiso/hw_discovery.hpp"
#include "autoiso/file_utils.hpp"
#include "autoiso/io_utils.hpp"
#include "autoiso/string_utils.hpp"

#include <algorithm>    // for sort, any_of
#include <charconv>     // for from_chars
#include <string_view>  // for string_view

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace fs = std::filesystem;

namespace {

auto read_number(const fs::path& path) noexcept -> std::optional<std::uint64_t> {
    auto value = autoiso::file_utils::read_sysfs_value(path.string());
    if (!value) {
        return std::nullopt;
    }
    const auto trimmed = autoiso::utils::trim(*value);
    std::uint64_t number{};
    const auto [ptr, ec] = std::from_chars(trimmed.data(), trimmed.data() + trimmed.size(), number);
    if (trimmed.empty() || ec != std::errc{}) {
        return std::nullopt;
    }
    return number;
}

auto pick_in_tier(std::span<const autoiso::discovery::BlockDeviceInfo> devices, std::optional<bool> required_rotational,
    autoiso::discovery::DiskTieBreak tie_break) noexcept -> std::optional<autoiso::discovery::BlockDeviceInfo> {
    std::optional<autoiso::discovery::BlockDeviceInfo> chosen{};
    for (const auto& device : devices) {
        if (autoiso::discovery::is_ignored_block_device(device.name)) {
            continue;
        }
        if (device.removable || device.size_gb() < autoiso::discovery::MIN_DISK_SIZE_GB) {
            continue;
        }
        if (required_rotational.has_value() && device.rotational != required_rotational) {
            continue;
        }
        if (tie_break == autoiso::discovery::DiskTieBreak::FirstEnumerated) {
            return device;
        }
        // strictly smaller, equal sizes keep the first one
        if (!chosen || device.size_gb() < chosen->size_gb()) {
            chosen = device;
        }
    }
    return chosen;
}

}  // namespace

namespace autoiso::discovery {

auto discovery_error_message(DiscoveryError error) noexcept -> std::string_view {
    switch (error) {
    case DiscoveryError::NoDisk:
        return "ERROR: No suitable disk found"sv;
    case DiscoveryError::NoNic:
        return "ERROR: No onboard NIC found"sv;
    case DiscoveryError::NoMac:
        return "ERROR: Failed to get MAC address for management NIC"sv;
    case DiscoveryError::NetworkBringUp:
        return "ERROR: Failed to bring up management network"sv;
    case DiscoveryError::CallbackFailed:
        return "ERROR: Failed to contact config server"sv;
    }
    return "ERROR: Discovery failed"sv;
}

auto udev_has_onboard_name(std::string_view interface_name) noexcept -> bool {
    const auto& properties = utils::exec(fmt::format(FMT_COMPILE("udevadm info -q property -p {} 2>/dev/null"),
        utils::shell_quote(fmt::format(FMT_COMPILE("/sys/class/net/{}"), interface_name))));
    const auto& lines = utils::make_multiline_view(properties);
    return std::ranges::any_of(lines, [](std::string_view line) { return line.starts_with("ID_NET_NAME_ONBOARD="sv); });
}

auto is_ignored_block_device(std::string_view name) noexcept -> bool {
    return name.starts_with("loop"sv) || name.starts_with("ram"sv) || name.starts_with("fd"sv) || name.starts_with("sr"sv);
}

auto select_disk(std::span<const BlockDeviceInfo> devices, DiskTieBreak tie_break) noexcept -> std::optional<BlockDeviceInfo> {
    if (auto ssd = pick_in_tier(devices, false, tie_break)) {
        return ssd;
    }
    if (auto hdd = pick_in_tier(devices, true, tie_break)) {
        return hdd;
    }
    return pick_in_tier(devices, std::nullopt, tie_break);
}

auto onboard_nic_candidates(std::span<const NetInterfaceInfo> interfaces) noexcept -> std::vector<NetInterfaceInfo> {
    const auto is_physical = [](const NetInterfaceInfo& iface) {
        return iface.name != "lo"sv && !iface.resolved_path.contains("/devices/virtual/net/"sv);
    };

    std::vector<NetInterfaceInfo> candidates{};
    for (const auto& iface : interfaces) {
        if (is_physical(iface) && iface.udev_onboard) {
            candidates.push_back(iface);
        }
    }
    if (!candidates.empty()) {
        return candidates;
    }

    // chipset-root heuristic, PCI devices on bus 00 that don't sit in a slot
    for (const auto& iface : interfaces) {
        if (!is_physical(iface) || !iface.device_path.has_value()) {
            continue;
        }
        if (iface.device_path->contains("0000:00:"sv) && !iface.has_physical_slot) {
            candidates.push_back(iface);
        }
    }
    return candidates;
}

auto select_nic(std::span<const NetInterfaceInfo> interfaces) noexcept -> std::optional<NetInterfaceInfo> {
    auto candidates = onboard_nic_candidates(interfaces);
    if (candidates.empty()) {
        return std::nullopt;
    }
    return std::move(candidates.front());
}

auto enumerate_block_devices(const fs::path& sysfs_root) noexcept -> std::vector<BlockDeviceInfo> {
    std::vector<BlockDeviceInfo> devices{};
    std::error_code err{};
    for (const auto& entry : fs::directory_iterator{sysfs_root / "block", err}) {
        const auto& dev_path = entry.path();
        BlockDeviceInfo device{.name = dev_path.filename().string()};

        device.size_sectors = read_number(dev_path / "size").value_or(0);
        device.removable    = read_number(dev_path / "removable").value_or(0) != 0;
        if (auto rota = read_number(dev_path / "queue" / "rotational")) {
            device.rotational = (*rota != 0);
        }
        devices.emplace_back(std::move(device));
    }
    if (err) {
        spdlog::error("Failed to list block devices under '{}': {}", sysfs_root.string(), err.message());
    }
    std::ranges::sort(devices, {}, &BlockDeviceInfo::name);
    return devices;
}

auto enumerate_net_interfaces(const fs::path& sysfs_root, const OnboardQuery& onboard_query) noexcept -> std::vector<NetInterfaceInfo> {
    std::vector<NetInterfaceInfo> interfaces{};
    std::error_code err{};
    for (const auto& entry : fs::directory_iterator{sysfs_root / "class" / "net", err}) {
        NetInterfaceInfo iface{.name = entry.path().filename().string()};

        std::error_code path_err{};
        const auto resolved = fs::canonical(entry.path(), path_err);
        iface.resolved_path = path_err ? entry.path().string() : resolved.string();

        const auto device_link = entry.path() / "device";
        if (fs::exists(device_link, path_err)) {
            const auto device = fs::canonical(device_link, path_err);
            if (!path_err) {
                iface.device_path = device.string();
                const auto slot   = file_utils::read_sysfs_value((device / "physical_slot").string());
                iface.has_physical_slot = slot.has_value() && !utils::trim(*slot).empty();
            }
        }

        iface.mac = file_utils::read_sysfs_value((entry.path() / "address").string()).value_or("");
        if (onboard_query && iface.name != "lo"sv) {
            iface.udev_onboard = onboard_query(iface.name);
        }
        interfaces.emplace_back(std::move(iface));
    }
    if (err) {
        spdlog::error("Failed to list network interfaces under '{}': {}", sysfs_root.string(), err.message());
    }
    std::ranges::sort(interfaces, {}, &NetInterfaceInfo::name);
    return interfaces;
}

auto discover_hardware(const fs::path& sysfs_root, DiskTieBreak tie_break, const OnboardQuery& onboard_query) noexcept
    -> std::expected<DiscoveredHardware, DiscoveryError> {
    const auto devices = enumerate_block_devices(sysfs_root);
    const auto disk    = select_disk(devices, tie_break);
    if (!disk) {
        return std::unexpected(DiscoveryError::NoDisk);
    }

    const auto interfaces = enumerate_net_interfaces(sysfs_root, onboard_query);
    const auto nic        = select_nic(interfaces);
    if (!nic) {
        return std::unexpected(DiscoveryError::NoNic);
    }

    DiscoveredHardware hardware{
        .disk_path = fmt::format(FMT_COMPILE("/dev/{}"), disk->name),
        .nic_name  = nic->name,
        .nic_mac   = std::string{utils::trim(nic->mac)},
    };
    spdlog::info("Selected disk {} ({} GB), management NIC {} ({})", hardware.disk_path, disk->size_gb(), hardware.nic_name, hardware.nic_mac);
    return hardware;
}

}  // namespace autoiso::discovery
