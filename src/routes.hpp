#ifndef ROUTES_HPP
#define ROUTES_HPP

// import autoiso
#include "autoiso/installer_data.hpp"
#include "autoiso/job.hpp"
#include "autoiso/job_orchestrator.hpp"
#include "autoiso/progress_channel.hpp"

#include <filesystem>   // for path
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view

namespace server {

struct Request final {
    std::string method{};
    std::string target{};
    std::string body{};
};

struct Response final {
    unsigned status{200};
    std::string content_type{"application/json"};
    std::string body{};
    /// When set, the file is streamed instead of body.
    std::optional<std::filesystem::path> file_path{};
    std::string download_name{};
};

/// @brief Maps REST requests onto the job orchestrator.
/// Knows nothing about sockets, the HTTP server owns the transport.
class Router final {
 public:
    Router(autoiso::job::JobOrchestrator& orchestrator, autoiso::installer_data::InstallerData installer_data) noexcept
      : m_orchestrator(orchestrator), m_installer_data(std::move(installer_data)) { }

    [[nodiscard]] auto handle(const Request& request) noexcept -> Response;

    [[nodiscard]] auto orchestrator() noexcept -> autoiso::job::JobOrchestrator& { return m_orchestrator; }

 private:
    auto handle_create_iso(const Request& request) noexcept -> Response;
    auto handle_answer_file(std::string_view job_id) noexcept -> Response;
    auto handle_iso_download(std::string_view job_id) noexcept -> Response;
    auto handle_job(std::string_view job_id) noexcept -> Response;
    auto handle_cancel(std::string_view job_id) noexcept -> Response;
    auto handle_delete(std::string_view job_id) noexcept -> Response;
    auto handle_device_discovery(const Request& request) noexcept -> Response;

    autoiso::job::JobOrchestrator& m_orchestrator;
    const autoiso::installer_data::InstallerData m_installer_data;
};

/// Path of request target without query string.
[[nodiscard]] auto target_path(std::string_view target) noexcept -> std::string_view;

/// Builds {"status":bool,"message":"..."} body.
[[nodiscard]] auto make_status_body(bool status, std::string_view message) noexcept -> std::string;

/// Reads the job id from a WebSocket subscribe message {"jobId":"..."}.
[[nodiscard]] auto parse_ws_subscribe(std::string_view message) noexcept -> std::optional<std::string>;

/// First event sent to a WebSocket viewer, describes the current job state.
[[nodiscard]] auto make_snapshot_event(const autoiso::job::JobSnapshot& snapshot) noexcept -> autoiso::progress::ProgressEvent;

}  // namespace server

#endif  // ROUTES_HPP
