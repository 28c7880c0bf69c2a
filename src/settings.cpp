#include "settings.hpp"

// import autoiso
#include "autoiso/file_utils.hpp"
#include "autoiso/io_utils.hpp"

#include <charconv>    // for from_chars
#include <filesystem>  // for exists

#include <spdlog/spdlog.h>

#define TOML_EXCEPTIONS 0  // disable exceptions
#include <toml++/toml.h>

using namespace std::string_view_literals;

namespace fs = std::filesystem;

static constexpr auto DEFAULT_CONFIG_PATH = "/etc/autoiso/server.toml"sv;

namespace {

template <typename T>
auto parse_number(std::string_view str) noexcept -> std::optional<T> {
    T value{};
    const auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
    if (str.empty() || ec != std::errc{} || ptr != str.data() + str.size()) {
        return std::nullopt;
    }
    return value;
}

inline void read_string(const toml::node_view<const toml::node>& node, std::string& out) noexcept {
    if (auto value = node.value<std::string_view>()) {
        out = *value;
    }
}

}  // namespace

namespace server {

auto parse_log_level(std::string_view level_str) noexcept -> std::optional<spdlog::level::level_enum> {
    const auto level = spdlog::level::from_str(std::string{level_str});
    // from_str falls back to off for unknown names
    if (level == spdlog::level::off && level_str != "off"sv) {
        return std::nullopt;
    }
    return level;
}

auto parse_settings(std::string_view config_content) noexcept -> std::optional<Settings> {
    toml::parse_result config = toml::parse(config_content);
    if (config.failed()) {
        spdlog::error("Failed to parse settings: {}", config.error().description());
        return std::nullopt;
    }
    const auto& config_table = std::move(config).table();

    Settings settings{};
    read_string(config_table["server"]["address"], settings.address);
    if (auto port = config_table["server"]["port"].value<std::int64_t>()) {
        if (*port <= 0 || *port > 65535) {
            spdlog::error("Invalid server.port {}", *port);
            return std::nullopt;
        }
        settings.port = static_cast<std::uint16_t>(*port);
    }

    read_string(config_table["storage"]["data_dir"], settings.data_dir);
    if (auto retention = config_table["storage"]["retention_days"].value<std::int64_t>()) {
        if (*retention < 0) {
            spdlog::error("Invalid storage.retention_days {}", *retention);
            return std::nullopt;
        }
        settings.retention_days = static_cast<std::uint32_t>(*retention);
    }

    read_string(config_table["build"]["base_iso"], settings.base_iso);
    read_string(config_table["build"]["image_tool"], settings.image_tool);
    read_string(config_table["build"]["work_dir"], settings.work_dir);
    if (auto max_jobs = config_table["build"]["max_jobs"].value<std::int64_t>()) {
        if (*max_jobs <= 0) {
            spdlog::error("Invalid build.max_jobs {}", *max_jobs);
            return std::nullopt;
        }
        settings.max_jobs = static_cast<std::size_t>(*max_jobs);
    }
    if (auto stall_timeout = config_table["build"]["stall_timeout_secs"].value<std::int64_t>()) {
        settings.stall_timeout = std::chrono::seconds{*stall_timeout < 0 ? 0 : *stall_timeout};
    }
    if (auto answer_url = config_table["build"]["answer_url"].value<std::string_view>()) {
        settings.answer_url = std::string{*answer_url};
    }

    read_string(config_table["log"]["file"], settings.log_file);
    if (auto level_str = config_table["log"]["level"].value<std::string_view>()) {
        auto level = parse_log_level(*level_str);
        if (!level) {
            spdlog::error("Invalid log.level '{}'", *level_str);
            return std::nullopt;
        }
        settings.log_level = *level;
    }
    return settings;
}

auto apply_env_overrides(Settings& settings) noexcept -> bool {
    if (const auto port_str = autoiso::utils::safe_getenv("AUTOISO_PORT"); !port_str.empty()) {
        auto port = parse_number<std::uint16_t>(port_str);
        if (!port || *port == 0) {
            spdlog::error("Invalid AUTOISO_PORT '{}'", port_str);
            return false;
        }
        settings.port = *port;
    }
    if (const auto data_dir = autoiso::utils::safe_getenv("AUTOISO_DATA_DIR"); !data_dir.empty()) {
        settings.data_dir = data_dir;
    }
    if (const auto level_str = autoiso::utils::safe_getenv("AUTOISO_LOG_LEVEL"); !level_str.empty()) {
        auto level = parse_log_level(level_str);
        if (!level) {
            spdlog::error("Invalid AUTOISO_LOG_LEVEL '{}'", level_str);
            return false;
        }
        settings.log_level = *level;
    }
    return true;
}

auto load_settings(std::optional<std::string_view> config_path) noexcept -> std::optional<Settings> {
    std::string path{DEFAULT_CONFIG_PATH};
    if (config_path.has_value()) {
        path = *config_path;
    } else if (auto env_path = autoiso::utils::safe_getenv("AUTOISO_CONFIG"); !env_path.empty()) {
        path = std::move(env_path);
    }

    std::optional<Settings> settings{};
    std::error_code err{};
    if (fs::exists(path, err)) {
        settings = parse_settings(autoiso::file_utils::read_whole_file(path));
    } else if (config_path.has_value()) {
        spdlog::error("Settings file '{}' not found", path);
        return std::nullopt;
    } else {
        settings = Settings{};
    }

    if (!settings || !apply_env_overrides(*settings)) {
        return std::nullopt;
    }
    return settings;
}

auto make_orchestrator_settings(const Settings& settings) noexcept -> autoiso::job::OrchestratorSettings {
    autoiso::job::OrchestratorSettings orchestrator_settings{};
    orchestrator_settings.max_jobs            = settings.max_jobs;
    orchestrator_settings.stall_timeout       = settings.stall_timeout;
    orchestrator_settings.build.base_iso      = settings.base_iso;
    orchestrator_settings.build.work_dir      = settings.work_dir;
    orchestrator_settings.build.answer_url    = settings.answer_url;
    return orchestrator_settings;
}

}  // namespace server
