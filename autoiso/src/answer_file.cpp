#include "autoiso/answer_file.hpp"
#include "autoiso/string_utils.hpp"

#include <string_view>  // for string_view

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

#define TOML_EXCEPTIONS 0  // disable exceptions
#include <toml++/toml.h>

using namespace std::string_view_literals;

namespace {

auto quote_list(const std::vector<std::string>& values) noexcept -> std::string {
    std::string res{"["};
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i != 0) {
            res += ", ";
        }
        res += autoiso::answer::toml_quote(values[i]);
    }
    res += ']';
    return res;
}

inline auto read_string(const toml::node_view<const toml::node>& node) noexcept -> std::optional<std::string> {
    if (auto value = node.value<std::string_view>()) {
        return std::string{*value};
    }
    return std::nullopt;
}

}  // namespace

namespace autoiso::answer {

auto toml_quote(std::string_view str) noexcept -> std::string {
    std::string res{"\""};
    for (const char ch : str) {
        switch (ch) {
        case '"':
            res += "\\\"";
            break;
        case '\\':
            res += "\\\\";
            break;
        case '\n':
            res += "\\n";
            break;
        case '\t':
            res += "\\t";
            break;
        case '\r':
            res += "\\r";
            break;
        default:
            if (static_cast<unsigned char>(ch) < 0x20 || ch == 0x7f) {
                res += fmt::format(FMT_COMPILE("\\u{:04X}"), static_cast<unsigned char>(ch));
            } else {
                res += ch;
            }
            break;
        }
    }
    res += '"';
    return res;
}

auto render_answer_file(const InstallerConfig& config, const RenderOptions& opts) noexcept -> std::string {
    std::string content{};
    if (opts.generated_at.has_value()) {
        content += fmt::format(FMT_COMPILE("# generated-at: {}\n"), *opts.generated_at);
    }

    const auto& identity = config.identity;
    content += "[global]\n";
    content += fmt::format(FMT_COMPILE("keyboard = {}\n"), toml_quote(identity.keyboard_layout));
    content += fmt::format(FMT_COMPILE("country = {}\n"), toml_quote(identity.country));
    content += fmt::format(FMT_COMPILE("fqdn = {}\n"), toml_quote(identity.fqdn));
    content += fmt::format(FMT_COMPILE("mailto = {}\n"), toml_quote(identity.email));
    content += fmt::format(FMT_COMPILE("timezone = {}\n"), toml_quote(identity.timezone));
    content += fmt::format(FMT_COMPILE("root-password-hashed = {}\n"), toml_quote(identity.root_password_hash));

    const auto& network = config.network;
    content += "\n[network]\n";
    content += fmt::format(FMT_COMPILE("source = {}\n"), toml_quote(network_source_to_string(network.source)));
    if (network.source == NetworkSource::StaticFromAnswer) {
        if (network.cidr.has_value()) {
            content += fmt::format(FMT_COMPILE("cidr = {}\n"), toml_quote(*network.cidr));
        }
        if (network.gateway.has_value()) {
            content += fmt::format(FMT_COMPILE("gateway = {}\n"), toml_quote(*network.gateway));
        }
        if (!network.dns.empty()) {
            content += fmt::format(FMT_COMPILE("dns = {}\n"), toml_quote(utils::join(network.dns, ",")));
        }
    }
    content += fmt::format(FMT_COMPILE("filter.ID_NET_NAME_MAC = {}\n"), toml_quote(network.mac_filter));

    const auto& disk_setup = config.disk_setup;
    content += "\n[disk-setup]\n";
    content += fmt::format(FMT_COMPILE("filesystem = {}\n"), toml_quote(filesystem_to_string(disk_setup.filesystem)));
    if (disk_setup.filesystem == Filesystem::Zfs && disk_setup.zfs_raid.has_value()) {
        content += fmt::format(FMT_COMPILE("zfs.raid = {}\n"), toml_quote(*disk_setup.zfs_raid));
    }
    if (disk_setup.filesystem == Filesystem::Btrfs && disk_setup.btrfs_raid.has_value()) {
        content += fmt::format(FMT_COMPILE("btrfs.raid = {}\n"), toml_quote(*disk_setup.btrfs_raid));
    }
    content += fmt::format(FMT_COMPILE("disk-list = {}\n"), quote_list(disk_setup.disk_list));

    return content;
}

auto render_auto_installer_mode(std::optional<std::string_view> answer_url) noexcept -> std::string {
    if (!answer_url.has_value()) {
        return "mode = \"iso\"\n";
    }
    return fmt::format(FMT_COMPILE("mode = \"http\"\n\n[http]\nurl = {}\n"), toml_quote(*answer_url));
}

auto parse_answer_file(std::string_view content) noexcept -> std::optional<InstallerConfig> {
    toml::parse_result answer = toml::parse(content);
    if (answer.failed()) {
        spdlog::error("Failed to parse answer file: {}", answer.error().description());
        return std::nullopt;
    }
    const auto& answer_table = std::move(answer).table();

    InstallerConfig config{};

    const auto global = answer_table["global"sv];
    if (!global.is_table()) {
        spdlog::error("Answer file has no [global] table");
        return std::nullopt;
    }
    config.identity.fqdn               = read_string(global["fqdn"sv]).value_or("");
    config.identity.email              = read_string(global["mailto"sv]).value_or(config.identity.email);
    config.identity.country            = read_string(global["country"sv]).value_or(config.identity.country);
    config.identity.timezone           = read_string(global["timezone"sv]).value_or(config.identity.timezone);
    config.identity.keyboard_layout    = read_string(global["keyboard"sv]).value_or(config.identity.keyboard_layout);
    config.identity.root_password_hash = read_string(global["root-password-hashed"sv]).value_or("");

    const auto network = answer_table["network"sv];
    if (network.is_table()) {
        auto source = network_source_from_string(read_string(network["source"sv]).value_or("from-dhcp"));
        if (!source) {
            spdlog::error("Answer file has unknown network source");
            return std::nullopt;
        }
        config.network.source  = *source;
        config.network.cidr    = read_string(network["cidr"sv]);
        config.network.gateway = read_string(network["gateway"sv]);
        if (auto dns = read_string(network["dns"sv])) {
            for (auto&& entry : utils::make_split_view(*dns, ',')) {
                config.network.dns.emplace_back(utils::trim(entry));
            }
        }
        config.network.mac_filter = read_string(network["filter"sv]["ID_NET_NAME_MAC"sv]).value_or(config.network.mac_filter);
    }

    const auto disk_setup = answer_table["disk-setup"sv];
    if (disk_setup.is_table()) {
        auto filesystem = filesystem_from_string(read_string(disk_setup["filesystem"sv]).value_or("zfs"));
        if (!filesystem) {
            spdlog::error("Answer file has unknown filesystem");
            return std::nullopt;
        }
        config.disk_setup.filesystem = *filesystem;
        config.disk_setup.zfs_raid   = read_string(disk_setup["zfs"sv]["raid"sv]);
        config.disk_setup.btrfs_raid = read_string(disk_setup["btrfs"sv]["raid"sv]);
        if (const auto* disk_list = disk_setup["disk-list"sv].as_array()) {
            config.disk_setup.disk_list.clear();
            for (const auto& node_el : *disk_list) {
                if (auto disk = node_el.value<std::string_view>()) {
                    config.disk_setup.disk_list.emplace_back(*disk);
                }
            }
        }
    }
    return config;
}

}  // namespace autoiso::answer
