#include "routes.hpp"

// import autoiso
#include "autoiso/artifact_store.hpp"
#include "autoiso/discovery_report.hpp"
#include "autoiso/string_utils.hpp"

#include <vector>  // for vector

#include <ctre.hpp>  // for ctre::match

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wold-style-cast"
#elif defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wuseless-cast"
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#if defined(__clang__)
#pragma clang diagnostic pop
#elif defined(__GNUC__)
#pragma GCC diagnostic pop
#endif

using namespace std::string_view_literals;

namespace {

auto json_response(unsigned status, std::string body) noexcept -> server::Response {
    return server::Response{.status = status, .content_type = "application/json", .body = std::move(body)};
}

auto not_found(std::string_view message) noexcept -> server::Response {
    return json_response(404, server::make_status_body(false, message));
}

auto make_created_body(std::string_view job_id) noexcept -> std::string {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    writer.StartObject();
    writer.Key("status");
    writer.Bool(true);
    writer.Key("jobId");
    writer.String(job_id.data(), static_cast<rapidjson::SizeType>(job_id.size()));
    writer.EndObject();
    return buffer.GetString();
}

auto make_create_error_body(const autoiso::job::CreateError& error) noexcept -> std::string {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    writer.StartObject();
    writer.Key("status");
    writer.Bool(false);
    writer.Key("error");
    writer.String(error.message.c_str(), static_cast<rapidjson::SizeType>(error.message.size()));
    writer.Key("fields");
    writer.StartObject();
    for (const auto& [field, message] : error.fields) {
        writer.Key(field.c_str(), static_cast<rapidjson::SizeType>(field.size()));
        writer.String(message.c_str(), static_cast<rapidjson::SizeType>(message.size()));
    }
    writer.EndObject();
    writer.EndObject();
    return buffer.GetString();
}

}  // namespace

namespace server {

auto target_path(std::string_view target) noexcept -> std::string_view {
    const auto query_pos = target.find('?');
    if (query_pos != std::string_view::npos) {
        target.remove_suffix(target.size() - query_pos);
    }
    // tolerate trailing slash
    if (target.size() > 1 && target.back() == '/') {
        target.remove_suffix(1);
    }
    return target;
}

auto make_status_body(bool status, std::string_view message) noexcept -> std::string {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    writer.StartObject();
    writer.Key("status");
    writer.Bool(status);
    writer.Key("message");
    writer.String(message.data(), static_cast<rapidjson::SizeType>(message.size()));
    writer.EndObject();
    return buffer.GetString();
}

auto parse_ws_subscribe(std::string_view message) noexcept -> std::optional<std::string> {
    rapidjson::Document document;
    document.Parse(message.data(), message.size());
    if (document.HasParseError() || !document.IsObject()) {
        spdlog::debug("Malformed websocket message: {}", message);
        return std::nullopt;
    }
    const auto it = document.FindMember("jobId");
    if (it == document.MemberEnd() || !it->value.IsString()) {
        return std::nullopt;
    }
    return std::string{it->value.GetString(), it->value.GetStringLength()};
}

auto make_snapshot_event(const autoiso::job::JobSnapshot& snapshot) noexcept -> autoiso::progress::ProgressEvent {
    using autoiso::progress::EventKind;

    auto kind = EventKind::Status;
    if (snapshot.status == autoiso::job::JobStatus::Failed) {
        kind = EventKind::Error;
    }
    return autoiso::progress::ProgressEvent{
        .job_id   = snapshot.id,
        .kind     = kind,
        .progress = snapshot.progress,
        .status   = std::string{autoiso::job::job_status_to_string(snapshot.status)},
        .message  = fmt::format(FMT_COMPILE("Job {} reattached or initialized"), snapshot.id),
    };
}

auto Router::handle(const Request& request) noexcept -> Response {
    const auto path     = target_path(request.target);
    const auto& method = request.method;
    spdlog::debug("{} {}", method, path);

    if (method == "GET"sv && (path == "/api/installer/data"sv || path == "/api/installer-data"sv)) {
        return json_response(200, autoiso::installer_data::installer_data_to_json(m_installer_data));
    }
    if (method == "POST"sv && path == "/api/installer/iso"sv) {
        return handle_create_iso(request);
    }
    if (method == "POST"sv && path == "/api/device_discovery"sv) {
        return handle_device_discovery(request);
    }
    if (method == "GET"sv && path == "/api/jobs"sv) {
        std::vector<std::string> jobs_json{};
        for (const auto& snapshot : m_orchestrator.list_jobs()) {
            jobs_json.emplace_back(autoiso::job::job_snapshot_to_json(snapshot));
        }
        return json_response(200, fmt::format(FMT_COMPILE("[{}]"), autoiso::utils::join(jobs_json, ",")));
    }

    if (auto match = ctre::match<"/api/answer-file/([^/]+)">(path); match && method == "GET"sv) {
        return handle_answer_file(match.get<1>().to_view());
    }
    if (auto match = ctre::match<"/api/iso-download/([^/]+)">(path); match && method == "GET"sv) {
        return handle_iso_download(match.get<1>().to_view());
    }
    if (auto match = ctre::match<"/api/delete-iso/([^/]+)">(path); match && method == "DELETE"sv) {
        return handle_delete(match.get<1>().to_view());
    }
    if (auto match = ctre::match<"/api/jobs/([^/]+)/cancel">(path); match && method == "POST"sv) {
        return handle_cancel(match.get<1>().to_view());
    }
    if (auto match = ctre::match<"/api/jobs/([^/]+)">(path); match && method == "GET"sv) {
        return handle_job(match.get<1>().to_view());
    }

    spdlog::debug("No route for {} {}", method, path);
    return not_found("Not found");
}

auto Router::handle_create_iso(const Request& request) noexcept -> Response {
    auto job_id = m_orchestrator.create_job(std::string_view{request.body});
    if (!job_id) {
        const auto& error = job_id.error();
        if (error.kind == autoiso::job::CreateErrorKind::TooManyJobs) {
            spdlog::warn("Rejected build request: {}", error.message);
            return json_response(429, make_create_error_body(error));
        }
        spdlog::info("Invalid build request: {}", error.message);
        return json_response(400, make_create_error_body(error));
    }
    spdlog::info("Accepted build request, job {}", *job_id);
    return json_response(201, make_created_body(*job_id));
}

auto Router::handle_answer_file(std::string_view job_id) noexcept -> Response {
    auto content = m_orchestrator.store().read_answer(job_id);
    if (!content) {
        return not_found("Answer file not found");
    }
    return Response{.status = 200, .content_type = "text/plain; charset=utf-8", .body = std::move(*content)};
}

auto Router::handle_iso_download(std::string_view job_id) noexcept -> Response {
    auto image_path = m_orchestrator.store().image_path(job_id);
    if (!image_path) {
        return not_found("ISO not found");
    }
    return Response{
        .status        = 200,
        .content_type  = "application/octet-stream",
        .body          = {},
        .file_path     = std::move(*image_path),
        .download_name = autoiso::store::ArtifactStore::image_file_name(job_id),
    };
}

auto Router::handle_job(std::string_view job_id) noexcept -> Response {
    auto snapshot = m_orchestrator.get_job(job_id);
    if (!snapshot) {
        return not_found("Job not found");
    }
    return json_response(200, autoiso::job::job_snapshot_to_json(*snapshot));
}

auto Router::handle_cancel(std::string_view job_id) noexcept -> Response {
    using autoiso::job::CancelResult;

    switch (m_orchestrator.cancel_job(job_id)) {
    case CancelResult::Cancelled:
        return json_response(200, make_status_body(true, "Job cancelled"));
    case CancelResult::AlreadyFinished:
        return json_response(409, make_status_body(false, "Job already finished"));
    case CancelResult::NotFound:
        break;
    }
    return not_found("Job not found");
}

auto Router::handle_delete(std::string_view job_id) noexcept -> Response {
    if (!m_orchestrator.delete_job(job_id)) {
        return not_found("ISO not found");
    }
    spdlog::info("Deleted job {}", job_id);
    return json_response(200, make_status_body(true, "ISO deleted"));
}

auto Router::handle_device_discovery(const Request& request) noexcept -> Response {
    auto report = autoiso::discovery::parse_discovery_report(request.body);
    if (!report) {
        return json_response(400, make_status_body(false, "Expected disk and mgmt_nic"));
    }
    spdlog::info("Device discovery: disk={} mgmt_nic={}", report->disk, report->mgmt_nic);
    return json_response(200, make_status_body(true, "Received"));
}

}  // namespace server
