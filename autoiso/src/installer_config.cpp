#include "autoiso/installer_config.hpp"
#include "autoiso/string_utils.hpp"
#include "autoiso/subprocess.hpp"
#include "autoiso/validator.hpp"

#include <expected>     // for expected, unexpected
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
#include <rapidjson/error/en.h>

#if defined(__clang__)
#pragma clang diagnostic pop
#elif defined(__GNUC__)
#pragma GCC diagnostic pop
#endif

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace {

/// Reads the first present key among the aliases.
/// Records an error when the member exists but is not a string.
auto read_string(const rapidjson::Value& obj, std::initializer_list<std::string_view> keys,
    std::string_view field, autoiso::FieldErrors& errors) noexcept -> std::optional<std::string> {
    for (const auto key : keys) {
        const auto member = obj.FindMember(rapidjson::StringRef(key.data(), static_cast<rapidjson::SizeType>(key.size())));
        if (member == obj.MemberEnd() || member->value.IsNull()) {
            continue;
        }
        if (!member->value.IsString()) {
            errors.emplace(field, fmt::format(FMT_COMPILE("'{}' must be a string"), key));
            return std::nullopt;
        }
        return std::string{member->value.GetString(), member->value.GetStringLength()};
    }
    return std::nullopt;
}

auto find_object(const rapidjson::Value& obj, std::string_view key) noexcept -> const rapidjson::Value* {
    const auto member = obj.FindMember(rapidjson::StringRef(key.data(), static_cast<rapidjson::SizeType>(key.size())));
    if (member == obj.MemberEnd() || !member->value.IsObject()) {
        return nullptr;
    }
    return &member->value;
}

void parse_identity(const rapidjson::Value& obj, autoiso::IdentityConfig& identity, autoiso::FieldErrors& errors) noexcept {
    if (auto fqdn = read_string(obj, {"fqdn"sv}, "global.fqdn"sv, errors)) {
        identity.fqdn = autoiso::utils::trim(*fqdn);
    } else if (!errors.contains("global.fqdn")) {
        errors.emplace("global.fqdn", "'fqdn' is required");
    }
    if (auto email = read_string(obj, {"mailto"sv, "email"sv}, "global.mailto"sv, errors)) {
        identity.email = autoiso::utils::trim(*email);
    }
    if (auto country = read_string(obj, {"country"sv}, "global.country"sv, errors)) {
        identity.country = autoiso::utils::to_lower(autoiso::utils::trim(*country));
    }
    if (auto timezone = read_string(obj, {"timezone"sv}, "global.timezone"sv, errors)) {
        identity.timezone = autoiso::utils::trim(*timezone);
    }
    if (auto keyboard = read_string(obj, {"keyboard"sv, "keyboardLayout"sv}, "global.keyboard"sv, errors)) {
        identity.keyboard_layout = autoiso::utils::trim(*keyboard);
    }

    if (auto hash = read_string(obj, {"root-password-hashed"sv, "rootPasswordHash"sv}, "global.root-password-hashed"sv, errors)) {
        identity.root_password_hash = std::move(*hash);
        return;
    }

    // The plaintext is checked and hashed here, and dropped right after.
    auto password = read_string(obj, {"root-password"sv}, "global.root-password"sv, errors);
    if (!password) {
        if (!errors.contains("global.root-password")) {
            errors.emplace("global.root-password-hashed", "root password is required");
        }
        return;
    }
    if (auto strong = autoiso::validator::validate_password(*password); !strong) {
        errors.emplace("global.root-password", strong.error());
        return;
    }
    auto hashed = autoiso::hash_root_password(*password);
    if (!hashed) {
        errors.emplace("global.root-password", "failed to hash root password");
        return;
    }
    identity.root_password_hash = std::move(*hashed);
}

void parse_network(const rapidjson::Value& obj, autoiso::NetworkConfig& network, autoiso::FieldErrors& errors) noexcept {
    if (auto source_str = read_string(obj, {"source"sv}, "network.source"sv, errors)) {
        auto source = autoiso::network_source_from_string(autoiso::utils::trim(*source_str));
        if (!source) {
            errors.emplace("network.source", fmt::format(FMT_COMPILE("Invalid network source '{}'. Valid sources: dhcp, static"), *source_str));
            return;
        }
        network.source = *source;
    }

    if (auto cidr = read_string(obj, {"cidr"sv}, "network.cidr"sv, errors)) {
        network.cidr = std::string{autoiso::utils::trim(*cidr)};
    }
    if (auto gateway = read_string(obj, {"gateway"sv}, "network.gateway"sv, errors)) {
        network.gateway = std::string{autoiso::utils::trim(*gateway)};
    }
    if (auto mac_filter = read_string(obj, {"filter.ID_NET_NAME_MAC"sv, "macFilter"sv}, "network.filter.ID_NET_NAME_MAC"sv, errors)) {
        network.mac_filter = autoiso::utils::trim(*mac_filter);
    }

    const auto dns_member = obj.FindMember("dns");
    if (dns_member == obj.MemberEnd() || dns_member->value.IsNull()) {
        return;
    }
    const auto& dns_value = dns_member->value;
    if (dns_value.IsString()) {
        for (auto&& entry : autoiso::utils::make_split_view(std::string_view{dns_value.GetString(), dns_value.GetStringLength()}, ',')) {
            network.dns.emplace_back(autoiso::utils::trim(entry));
        }
    } else if (dns_value.IsArray()) {
        for (const auto& entry : dns_value.GetArray()) {
            if (!entry.IsString()) {
                errors.emplace("network.dns", "'dns' entries must be strings");
                return;
            }
            network.dns.emplace_back(autoiso::utils::trim(entry.GetString()));
        }
    } else {
        errors.emplace("network.dns", "'dns' must be a string or an array of strings");
    }
}

void parse_disk_setup(const rapidjson::Value& obj, autoiso::DiskSetupConfig& disk_setup, autoiso::FieldErrors& errors) noexcept {
    if (auto fs_str = read_string(obj, {"filesystem"sv}, "disk-setup.filesystem"sv, errors)) {
        auto fs = autoiso::filesystem_from_string(*fs_str);
        if (!fs) {
            errors.emplace("disk-setup.filesystem", fmt::format(FMT_COMPILE("Invalid filesystem '{}'. Valid filesystems: ext4, xfs, zfs, btrfs"), *fs_str));
            return;
        }
        disk_setup.filesystem = *fs;
    }

    // raid level only makes sense for the selected filesystem
    disk_setup.zfs_raid.reset();
    disk_setup.btrfs_raid.reset();
    if (auto zfs_raid = read_string(obj, {"zfs.raid"sv}, "disk-setup.zfs.raid"sv, errors)) {
        disk_setup.zfs_raid = std::move(zfs_raid);
    } else if (disk_setup.filesystem == autoiso::Filesystem::Zfs) {
        disk_setup.zfs_raid = "raid0";
    }
    if (auto btrfs_raid = read_string(obj, {"btrfs.raid"sv}, "disk-setup.btrfs.raid"sv, errors)) {
        disk_setup.btrfs_raid = std::move(btrfs_raid);
    }

    const auto disk_member = obj.FindMember("disk-list");
    if (disk_member == obj.MemberEnd() || disk_member->value.IsNull()) {
        return;
    }
    if (!disk_member->value.IsArray()) {
        errors.emplace("disk-setup.disk-list", "'disk-list' must be an array of strings");
        return;
    }
    disk_setup.disk_list.clear();
    for (const auto& entry : disk_member->value.GetArray()) {
        if (!entry.IsString()) {
            errors.emplace("disk-setup.disk-list", "'disk-list' entries must be strings");
            return;
        }
        disk_setup.disk_list.emplace_back(entry.GetString(), entry.GetStringLength());
    }
}

}  // namespace

namespace autoiso {

auto network_source_from_string(std::string_view source_str) noexcept -> std::optional<NetworkSource> {
    if (source_str == "dhcp"sv || source_str == "from-dhcp"sv) {
        return NetworkSource::Dhcp;
    }
    if (source_str == "static"sv || source_str == "from-answer"sv) {
        return NetworkSource::StaticFromAnswer;
    }
    return std::nullopt;
}

auto network_source_to_string(NetworkSource source) noexcept -> std::string_view {
    switch (source) {
    case NetworkSource::Dhcp:
        return "from-dhcp"sv;
    case NetworkSource::StaticFromAnswer:
        return "from-answer"sv;
    }
    return "from-dhcp"sv;
}

auto filesystem_from_string(std::string_view fs_str) noexcept -> std::optional<Filesystem> {
    if (fs_str == "ext4"sv) {
        return Filesystem::Ext4;
    }
    if (fs_str == "xfs"sv) {
        return Filesystem::Xfs;
    }
    if (fs_str == "zfs"sv) {
        return Filesystem::Zfs;
    }
    if (fs_str == "btrfs"sv) {
        return Filesystem::Btrfs;
    }
    return std::nullopt;
}

auto filesystem_to_string(Filesystem fs) noexcept -> std::string_view {
    switch (fs) {
    case Filesystem::Ext4:
        return "ext4"sv;
    case Filesystem::Xfs:
        return "xfs"sv;
    case Filesystem::Zfs:
        return "zfs"sv;
    case Filesystem::Btrfs:
        return "btrfs"sv;
    }
    return "unknown"sv;
}

auto parse_installer_config(std::string_view json_content) noexcept
    -> std::expected<InstallerConfig, FieldErrors> {
    rapidjson::Document doc;
    doc.Parse(json_content.data(), json_content.size());
    if (doc.HasParseError()) {
        return std::unexpected(FieldErrors{{"body", fmt::format(FMT_COMPILE("JSON parse error at offset {}: {}"),
                                                       doc.GetErrorOffset(), rapidjson::GetParseError_En(doc.GetParseError()))}});
    }
    if (!doc.IsObject()) {
        return std::unexpected(FieldErrors{{"body", "JSON root must be an object"}});
    }

    InstallerConfig config{};
    FieldErrors errors{};

    const auto* global = find_object(doc, "global"sv);
    parse_identity(global != nullptr ? *global : doc, config.identity, errors);

    if (const auto* network = find_object(doc, "network"sv)) {
        parse_network(*network, config.network, errors);
    }
    if (const auto* disk_setup = find_object(doc, "disk-setup"sv)) {
        parse_disk_setup(*disk_setup, config.disk_setup, errors);
    }

    if (!errors.empty()) {
        return std::unexpected(std::move(errors));
    }
    return config;
}

auto format_field_errors(const FieldErrors& errors) noexcept -> std::string {
    std::string res{};
    for (const auto& [field, reason] : errors) {
        if (!res.empty()) {
            res += "; ";
        }
        res += fmt::format(FMT_COMPILE("{}: {}"), field, reason);
    }
    return res;
}

auto hash_root_password(std::string_view password) noexcept -> std::optional<std::string> {
    // the password travels over stdin, never through argv
    const auto output = utils::exec_with_input({"openssl", "passwd", "-6", "-stdin"}, password);
    if (!output) {
        return std::nullopt;
    }
    const auto hashed = utils::trim(*output);
    if (!hashed.starts_with("$6$"sv)) {
        spdlog::error("openssl passwd did not return a SHA-512 crypt hash");
        return std::nullopt;
    }
    return std::string{hashed};
}

}  // namespace autoiso
