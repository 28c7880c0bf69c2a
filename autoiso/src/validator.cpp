#include "autoiso/validator.hpp"
#include "autoiso/string_utils.hpp"

#include <algorithm>    // for any_of, find
#include <array>        // for array
#include <charconv>     // for from_chars
#include <cmath>        // for log2
#include <ranges>       // for ranges::*
#include <set>          // for set
#include <string_view>  // for string_view

#include <ctre.hpp>  // for ctre::match

#include <fmt/compile.h>
#include <fmt/format.h>

using namespace std::string_view_literals;

namespace {

constexpr std::array keyboards{
    "de"sv, "de-ch"sv, "dk"sv, "en-gb"sv, "en-us"sv, "es"sv, "fi"sv, "fr"sv, "fr-be"sv,
    "fr-ca"sv, "fr-ch"sv, "hu"sv, "is"sv, "it"sv, "jp"sv, "lt"sv, "mk"sv, "nl"sv,
    "no"sv, "pl"sv, "pt"sv, "pt-br"sv, "se"sv, "si"sv, "tr"sv};

constexpr auto special_chars = R"(!@#$%^&*(),.?":{}|<>)"sv;

struct RaidMinimum final {
    std::string_view level;
    std::size_t min_disks;
};

constexpr std::array zfs_raid_levels{
    RaidMinimum{"raid0"sv, 1}, RaidMinimum{"raid1"sv, 2}, RaidMinimum{"raid10"sv, 2},
    RaidMinimum{"raidz-1"sv, 3}, RaidMinimum{"raidz-2"sv, 4}, RaidMinimum{"raidz-3"sv, 5}};

constexpr std::array btrfs_raid_levels{
    RaidMinimum{"raid0"sv, 1}, RaidMinimum{"raid1"sv, 2}, RaidMinimum{"raid10"sv, 2}};

constexpr std::size_t max_disk_count = 10;

template <std::size_t N>
auto find_raid_minimum(const std::array<RaidMinimum, N>& levels, std::string_view level) noexcept -> std::optional<std::size_t> {
    const auto it = std::ranges::find(levels, level, &RaidMinimum::level);
    if (it == levels.end()) {
        return std::nullopt;
    }
    return it->min_disks;
}

auto parse_octet(std::string_view part) noexcept -> std::optional<std::uint32_t> {
    if (part.empty() || part.size() > 3) {
        return std::nullopt;
    }
    std::uint32_t value{};
    const auto [ptr, ec] = std::from_chars(part.data(), part.data() + part.size(), value);
    if (ec != std::errc{} || ptr != part.data() + part.size() || value > 255) {
        return std::nullopt;
    }
    return value;
}

auto check_raid(std::string_view fs_name, std::string_view level, std::size_t min_disks, std::size_t disk_count) noexcept
    -> autoiso::validator::ValidationResult {
    if (disk_count < min_disks) {
        return std::unexpected(fmt::format(FMT_COMPILE("{} {} needs at least {} disks, got {}"), fs_name, level, min_disks, disk_count));
    }
    return {};
}

}  // namespace

namespace autoiso::validator {

auto parse_ipv4(std::string_view address) noexcept -> std::optional<std::uint32_t> {
    std::uint32_t result{};
    for (std::size_t octets = 0; octets < 4; ++octets) {
        const auto dot        = address.find('.');
        const bool last_octet = octets == 3;
        // exactly three dots, the last octet runs to the end of input
        if (last_octet != (dot == std::string_view::npos)) {
            return std::nullopt;
        }
        auto octet = parse_octet(address.substr(0, dot));
        if (!octet) {
            return std::nullopt;
        }
        result = (result << 8U) | *octet;
        if (!last_octet) {
            address.remove_prefix(dot + 1);
        }
    }
    return result;
}

auto parse_cidr(std::string_view cidr) noexcept -> std::optional<Cidr> {
    cidr = utils::trim(cidr);
    Cidr res{};
    const auto slash = cidr.find('/');
    if (slash != std::string_view::npos) {
        const auto prefix_str = cidr.substr(slash + 1);
        std::uint32_t prefix{};
        const auto [ptr, ec] = std::from_chars(prefix_str.data(), prefix_str.data() + prefix_str.size(), prefix);
        if (prefix_str.empty() || ec != std::errc{} || ptr != prefix_str.data() + prefix_str.size() || prefix > 32) {
            return std::nullopt;
        }
        res.prefix = static_cast<std::uint8_t>(prefix);
        cidr       = cidr.substr(0, slash);
    }
    auto address = parse_ipv4(cidr);
    if (!address) {
        return std::nullopt;
    }
    res.address = *address;
    return res;
}

auto password_entropy(std::string_view password) noexcept -> double {
    std::uint32_t pool_size{};
    if (std::ranges::any_of(password, [](char ch) { return ch >= '0' && ch <= '9'; })) {
        pool_size += 10;
    }
    if (std::ranges::any_of(password, [](char ch) { return ch >= 'a' && ch <= 'z'; })) {
        pool_size += 26;
    }
    if (std::ranges::any_of(password, [](char ch) { return ch >= 'A' && ch <= 'Z'; })) {
        pool_size += 26;
    }
    if (std::ranges::any_of(password, [](char ch) { return special_chars.contains(ch); })) {
        pool_size += 20;
    }
    if (pool_size == 0) {
        return 0.0;
    }
    return static_cast<double>(password.size()) * std::log2(static_cast<double>(pool_size));
}

auto validate_password(std::string_view password) noexcept -> ValidationResult {
    if (password.size() < 12) {
        return std::unexpected("Password must be at least 12 characters long");
    }
    if (password_entropy(password) <= 80.0) {
        return std::unexpected("Password has low entropy, mix digits, letters of both cases and symbols");
    }
    return {};
}

auto validate_fqdn(std::string_view fqdn) noexcept -> ValidationResult {
    if (fqdn.empty()) {
        return std::unexpected("FQDN is required");
    }
    if (fqdn.size() > 253) {
        return std::unexpected("FQDN must not exceed 253 characters");
    }
    std::size_t label_count{};
    std::string_view last_label{};
    for (auto&& label : fqdn | std::ranges::views::split('.')) {
        const std::string_view label_view{label.begin(), label.end()};
        if (!ctre::match<"[a-zA-Z0-9]([a-zA-Z0-9-]{0,61}[a-zA-Z0-9])?">(label_view)) {
            return std::unexpected(fmt::format(FMT_COMPILE("Invalid FQDN label '{}'"), label_view));
        }
        last_label = label_view;
        ++label_count;
    }
    if (label_count < 2) {
        return std::unexpected("FQDN must contain a host name and a domain, e.g. pve.example.com");
    }
    if (!ctre::match<"[a-zA-Z]{2,63}">(last_label)) {
        return std::unexpected("FQDN must end with an alphabetic top-level domain");
    }
    return {};
}

auto validate_email(std::string_view email) noexcept -> ValidationResult {
    if (email == "root@localhost"sv) {
        return {};
    }
    if (!ctre::match<R"([^\s@]+@[^\s@]+\.[^\s@]+)">(email)) {
        return std::unexpected(fmt::format(FMT_COMPILE("Invalid email address '{}'"), email));
    }
    return {};
}

auto validate_country(std::string_view country) noexcept -> ValidationResult {
    if (!ctre::match<"[a-z]{2}">(country)) {
        return std::unexpected(fmt::format(FMT_COMPILE("Invalid country code '{}', expected two lowercase letters"), country));
    }
    return {};
}

auto validate_timezone(std::string_view timezone) noexcept -> ValidationResult {
    if (timezone == "UTC"sv) {
        return {};
    }
    if (!ctre::match<R"([A-Za-z_]+(/[A-Za-z0-9_+\-]+)+)">(timezone)) {
        return std::unexpected(fmt::format(FMT_COMPILE("Invalid timezone '{}', expected Region/City"), timezone));
    }
    return {};
}

auto validate_keyboard(std::string_view keyboard) noexcept -> ValidationResult {
    if (std::ranges::find(keyboards, keyboard) == keyboards.end()) {
        return std::unexpected(fmt::format(FMT_COMPILE("Unknown keyboard layout '{}'"), keyboard));
    }
    return {};
}

auto validate_root_password_hash(std::string_view hash) noexcept -> ValidationResult {
    if (hash.empty()) {
        return std::unexpected("Root password is required");
    }
    if (!ctre::match<R"(\$6\$(rounds=[0-9]+\$)?[./A-Za-z0-9]{1,16}\$[./A-Za-z0-9]{86})">(hash)) {
        return std::unexpected("Root password hash must be a SHA-512 crypt hash");
    }
    return {};
}

auto validate_mac_filter(std::string_view filter) noexcept -> ValidationResult {
    if (!ctre::match<R"(\*?[0-9a-fA-F]{2}(:[0-9a-fA-F]{2}){5})">(filter)) {
        return std::unexpected(fmt::format(FMT_COMPILE("Invalid MAC filter '{}', expected *xx:xx:xx:xx:xx:xx"), filter));
    }
    return {};
}

auto available_keyboards() noexcept -> std::span<const std::string_view> {
    return keyboards;
}

auto validate_network(const NetworkConfig& network) noexcept -> std::expected<NetworkConfig, FieldErrors> {
    NetworkConfig res{};
    res.source = network.source;
    FieldErrors errors{};

    res.mac_filter = utils::trim(network.mac_filter);
    if (auto mac_ok = validate_mac_filter(res.mac_filter); !mac_ok) {
        errors.emplace("network.filter.ID_NET_NAME_MAC", std::move(mac_ok.error()));
    }

    if (network.source == NetworkSource::Dhcp) {
        if (!errors.empty()) {
            return std::unexpected(std::move(errors));
        }
        return res;
    }

    std::optional<Cidr> cidr{};
    if (!network.cidr || utils::trim(*network.cidr).empty()) {
        errors.emplace("network.cidr", "CIDR is required for static network");
    } else {
        res.cidr = std::string{utils::trim(*network.cidr)};
        cidr     = parse_cidr(*res.cidr);
        if (!cidr) {
            errors.emplace("network.cidr", fmt::format(FMT_COMPILE("Invalid CIDR '{}'"), *res.cidr));
        }
    }

    if (!network.gateway || utils::trim(*network.gateway).empty()) {
        errors.emplace("network.gateway", "Gateway is required for static network");
    } else {
        res.gateway  = std::string{utils::trim(*network.gateway)};
        auto gateway = parse_ipv4(*res.gateway);
        if (!gateway) {
            errors.emplace("network.gateway", fmt::format(FMT_COMPILE("Invalid gateway address '{}'"), *res.gateway));
        } else if (cidr) {
            const auto mask = prefix_mask(cidr->prefix);
            if ((cidr->address & mask) != (*gateway & mask)) {
                errors.emplace("network.gateway", fmt::format(FMT_COMPILE("Gateway {} is not within network {}"), *res.gateway, *res.cidr));
            }
        }
    }

    if (network.dns.empty()) {
        errors.emplace("network.dns", "At least one DNS server is required for static network");
    } else {
        std::set<std::uint32_t> seen{};
        for (const auto& entry : network.dns) {
            const auto dns = utils::trim(entry);
            auto address   = parse_ipv4(dns);
            if (!address) {
                errors.emplace("network.dns", fmt::format(FMT_COMPILE("Invalid DNS server '{}'"), dns));
                break;
            }
            if (!seen.insert(*address).second) {
                errors.emplace("network.dns", fmt::format(FMT_COMPILE("Duplicate DNS server '{}'"), dns));
                break;
            }
            res.dns.emplace_back(dns);
        }
    }

    if (!errors.empty()) {
        return std::unexpected(std::move(errors));
    }
    return res;
}

auto validate_disk_setup(const DiskSetupConfig& disk_setup) noexcept -> std::expected<DiskSetupConfig, FieldErrors> {
    DiskSetupConfig res{disk_setup};
    FieldErrors errors{};

    const auto disk_count = disk_setup.disk_list.size();
    if (disk_count == 0 || disk_count > max_disk_count) {
        errors.emplace("disk-setup.disk-list", fmt::format(FMT_COMPILE("Between 1 and {} disks are required, got {}"), max_disk_count, disk_count));
    }
    std::set<std::string_view> seen{};
    for (const auto& disk : disk_setup.disk_list) {
        if (!ctre::match<"/dev/[a-zA-Z0-9]+">(disk)) {
            errors.emplace("disk-setup.disk-list", fmt::format(FMT_COMPILE("Invalid disk path '{}'"), disk));
            break;
        }
        if (!seen.insert(disk).second) {
            errors.emplace("disk-setup.disk-list", fmt::format(FMT_COMPILE("Duplicate disk '{}'"), disk));
            break;
        }
    }

    if (disk_setup.filesystem != Filesystem::Zfs) {
        res.zfs_raid.reset();
    }
    if (disk_setup.filesystem != Filesystem::Btrfs) {
        res.btrfs_raid.reset();
    }

    if (disk_setup.filesystem == Filesystem::Zfs) {
        const auto level = disk_setup.zfs_raid.value_or("raid0");
        res.zfs_raid     = level;
        if (auto min_disks = find_raid_minimum(zfs_raid_levels, level); !min_disks) {
            errors.emplace("disk-setup.zfs.raid", fmt::format(FMT_COMPILE("Unknown ZFS raid level '{}'"), level));
        } else if (auto raid_ok = check_raid("ZFS"sv, level, *min_disks, disk_count); !raid_ok) {
            errors.emplace("disk-setup.zfs.raid", std::move(raid_ok.error()));
        }
    } else if (disk_setup.filesystem == Filesystem::Btrfs && disk_setup.btrfs_raid) {
        const auto& level = *disk_setup.btrfs_raid;
        if (auto min_disks = find_raid_minimum(btrfs_raid_levels, level); !min_disks) {
            errors.emplace("disk-setup.btrfs.raid", fmt::format(FMT_COMPILE("Unknown Btrfs raid level '{}'"), level));
        } else if (auto raid_ok = check_raid("Btrfs"sv, level, *min_disks, disk_count); !raid_ok) {
            errors.emplace("disk-setup.btrfs.raid", std::move(raid_ok.error()));
        }
    }

    if (!errors.empty()) {
        return std::unexpected(std::move(errors));
    }
    return res;
}

auto validate_identity(const IdentityConfig& identity) noexcept -> std::expected<IdentityConfig, FieldErrors> {
    IdentityConfig res{identity};
    res.fqdn     = utils::trim(identity.fqdn);
    res.email    = utils::trim(identity.email);
    res.country  = utils::trim(identity.country);
    res.timezone = utils::trim(identity.timezone);

    FieldErrors errors{};
    const auto record = [&errors](std::string_view field, ValidationResult&& result) {
        if (!result) {
            errors.emplace(field, std::move(result.error()));
        }
    };
    record("global.fqdn"sv, validate_fqdn(res.fqdn));
    record("global.mailto"sv, validate_email(res.email));
    record("global.country"sv, validate_country(res.country));
    record("global.timezone"sv, validate_timezone(res.timezone));
    record("global.keyboard"sv, validate_keyboard(res.keyboard_layout));
    record("global.root-password-hashed"sv, validate_root_password_hash(res.root_password_hash));

    if (!errors.empty()) {
        return std::unexpected(std::move(errors));
    }
    return res;
}

auto validate_installer_config(const InstallerConfig& config) noexcept -> std::expected<InstallerConfig, FieldErrors> {
    InstallerConfig res{};
    FieldErrors errors{};

    if (auto identity = validate_identity(config.identity)) {
        res.identity = std::move(*identity);
    } else {
        errors.merge(identity.error());
    }
    if (auto network = validate_network(config.network)) {
        res.network = std::move(*network);
    } else {
        errors.merge(network.error());
    }
    if (auto disk_setup = validate_disk_setup(config.disk_setup)) {
        res.disk_setup = std::move(*disk_setup);
    } else {
        errors.merge(disk_setup.error());
    }

    if (!errors.empty()) {
        return std::unexpected(std::move(errors));
    }
    return res;
}

}  // namespace autoiso::validator
