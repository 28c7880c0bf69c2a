#ifndef SETTINGS_HPP
#define SETTINGS_HPP

#include <chrono>       // for seconds
#include <cstdint>      // for uint16_t
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view

// import autoiso
#include "autoiso/job_orchestrator.hpp"

#include <spdlog/common.h>  // for level_enum

namespace server {

struct Settings final {
    // [server]
    std::string address{"0.0.0.0"};
    std::uint16_t port{33008};

    // [storage]
    std::string data_dir{"/var/lib/autoiso"};
    /// Artifacts older than this many days are pruned at startup, 0 keeps everything.
    std::uint32_t retention_days{0};

    // [build]
    std::string base_iso{"/var/lib/autoiso/base/proxmox-ve.iso"};
    std::string image_tool{"xorriso"};
    std::string work_dir{"/var/tmp/autoiso"};
    std::size_t max_jobs{5};
    std::chrono::seconds stall_timeout{600};
    std::optional<std::string> answer_url{};

    // [log]
    std::string log_file{"/tmp/autoiso-server.log"};
    spdlog::level::level_enum log_level{spdlog::level::info};
};

/// Converts "trace".."off" to spdlog level.
auto parse_log_level(std::string_view level_str) noexcept -> std::optional<spdlog::level::level_enum>;

/// @brief Parses settings from TOML, absent keys keep their defaults.
/// @return std::nullopt on syntax errors or invalid values.
auto parse_settings(std::string_view config_content) noexcept -> std::optional<Settings>;

/// Applies AUTOISO_PORT, AUTOISO_DATA_DIR and AUTOISO_LOG_LEVEL.
auto apply_env_overrides(Settings& settings) noexcept -> bool;

/// @brief Loads settings file, a missing file means defaults.
/// @param config_path Explicit path, otherwise AUTOISO_CONFIG, otherwise /etc/autoiso/server.toml.
auto load_settings(std::optional<std::string_view> config_path) noexcept -> std::optional<Settings>;

/// Orchestrator settings derived from [build].
auto make_orchestrator_settings(const Settings& settings) noexcept -> autoiso::job::OrchestratorSettings;

}  // namespace server

#endif  // SETTINGS_HPP
