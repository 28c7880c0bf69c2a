#include "http_server.hpp"

#include <chrono>   // for seconds
#include <csignal>  // for SIGINT, SIGTERM
#include <utility>  // for move

#include <boost/asio/ip/address.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::chrono_literals;

namespace beast     = boost::beast;
namespace http      = beast::http;
namespace websocket = beast::websocket;
namespace net       = boost::asio;

namespace {

constexpr auto SERVER_NAME      = "autoiso-server";
constexpr auto BODY_LIMIT       = 1024 * 1024;
constexpr auto WS_POLL_INTERVAL = 1000ms;

// Errors of a peer going away are not worth more than a debug line
auto is_disconnect(const beast::error_code& ec) noexcept -> bool {
    return ec == http::error::end_of_stream || ec == net::error::eof || ec == net::error::connection_reset
        || ec == net::error::broken_pipe || ec == net::error::operation_aborted || ec == websocket::error::closed;
}

}  // namespace

namespace server {

HttpServer::HttpServer(Router& router) noexcept
  : m_router(router), m_acceptor(m_ioc), m_signals(m_ioc, SIGINT, SIGTERM) { }

HttpServer::~HttpServer() {
    stop();
    shutdown_sessions();
}

auto HttpServer::listen(std::string_view address, std::uint16_t port) noexcept -> bool {
    beast::error_code ec{};
    const auto listen_address = net::ip::make_address(std::string{address}, ec);
    if (ec) {
        spdlog::error("Invalid listen address '{}': {}", address, ec.message());
        return false;
    }
    const tcp::endpoint endpoint{listen_address, port};

    m_acceptor.open(endpoint.protocol(), ec);
    if (ec) {
        spdlog::error("Failed to open acceptor: {}", ec.message());
        return false;
    }
    m_acceptor.set_option(net::socket_base::reuse_address(true), ec);
    if (ec) {
        spdlog::warn("Failed to set reuse_address: {}", ec.message());
    }
    m_acceptor.bind(endpoint, ec);
    if (ec) {
        spdlog::error("Failed to bind {}:{}: {}", address, port, ec.message());
        return false;
    }
    m_acceptor.listen(net::socket_base::max_listen_connections, ec);
    if (ec) {
        spdlog::error("Failed to listen: {}", ec.message());
        return false;
    }
    spdlog::info("Listening on {}:{}", address, this->port());
    return true;
}

auto HttpServer::port() const noexcept -> std::uint16_t {
    beast::error_code ec{};
    const auto endpoint = m_acceptor.local_endpoint(ec);
    if (ec) {
        return 0;
    }
    return endpoint.port();
}

void HttpServer::run() noexcept {
    m_signals.async_wait([this](const beast::error_code& ec, int signal_number) {
        if (ec) {
            return;
        }
        spdlog::info("Received signal {}, shutting down", signal_number);
        stop();
    });
    do_accept();
    m_ioc.run();
    shutdown_sessions();
    spdlog::info("Server stopped");
}

void HttpServer::stop() noexcept {
    net::post(m_ioc, [this] {
        beast::error_code ec{};
        m_acceptor.close(ec);
        m_signals.cancel(ec);
    });
}

void HttpServer::do_accept() noexcept {
    m_acceptor.async_accept([this](const beast::error_code& ec, tcp::socket socket) {
        if (ec) {
            if (ec != net::error::operation_aborted) {
                spdlog::error("Accept failed: {}", ec.message());
            }
            return;
        }
        reap_sessions();
        start_session(std::move(socket));
        do_accept();
    });
}

void HttpServer::start_session(tcp::socket socket) noexcept {
    auto session_socket = std::make_shared<tcp::socket>(std::move(socket));
    auto done           = std::make_shared<std::atomic_bool>(false);

    std::lock_guard<std::mutex> lock(m_sessions_mutex);
    m_sessions.emplace_back(Session{
        .socket = session_socket,
        .done   = done,
        .thread = std::jthread([this, session_socket, done](std::stop_token stop_token) {
            do_session(*session_socket, stop_token);
            done->store(true);
        }),
    });
}

void HttpServer::reap_sessions() noexcept {
    std::lock_guard<std::mutex> lock(m_sessions_mutex);
    m_sessions.remove_if([](const Session& session) { return session.done->load(); });
}

void HttpServer::shutdown_sessions() noexcept {
    std::list<Session> sessions{};
    {
        std::lock_guard<std::mutex> lock(m_sessions_mutex);
        sessions.swap(m_sessions);
    }
    for (auto& session : sessions) {
        session.thread.request_stop();
        // wakes up a blocking read on the session thread
        beast::error_code ec{};
        session.socket->shutdown(tcp::socket::shutdown_both, ec);
    }
    // jthreads join here
    sessions.clear();
}

void HttpServer::do_session(tcp::socket& socket, std::stop_token stop_token) noexcept {
    beast::error_code ec{};
    beast::flat_buffer buffer{};

    while (!stop_token.stop_requested()) {
        http::request_parser<http::string_body> parser{};
        parser.body_limit(BODY_LIMIT);
        http::read(socket, buffer, parser, ec);
        if (ec) {
            if (is_disconnect(ec)) {
                spdlog::debug("Connection closed: {}", ec.message());
            } else {
                spdlog::warn("Failed to read request: {}", ec.message());
            }
            break;
        }
        auto request = parser.release();

        if (websocket::is_upgrade(request)) {
            do_websocket(socket, std::move(request), stop_token);
            return;
        }

        const auto response = m_router.handle(Request{
            .method = std::string{request.method_string().data(), request.method_string().size()},
            .target = std::string{request.target().data(), request.target().size()},
            .body   = std::move(request.body()),
        });

        if (response.file_path.has_value()) {
            http::file_body::value_type body{};
            body.open(response.file_path->c_str(), beast::file_mode::scan, ec);
            if (ec) {
                spdlog::error("Failed to open {}: {}", response.file_path->string(), ec.message());
                http::response<http::string_body> error_response{http::status::internal_server_error, request.version()};
                error_response.set(http::field::server, SERVER_NAME);
                error_response.set(http::field::content_type, "application/json");
                error_response.body() = make_status_body(false, "Failed to read artifact");
                error_response.prepare_payload();
                http::write(socket, error_response, ec);
                break;
            }
            http::response<http::file_body> file_response{http::status::ok, request.version()};
            file_response.set(http::field::server, SERVER_NAME);
            file_response.set(http::field::content_type, response.content_type);
            file_response.set(http::field::content_disposition,
                fmt::format(FMT_COMPILE("attachment; filename=\"{}\""), response.download_name));
            file_response.keep_alive(request.keep_alive());
            file_response.body() = std::move(body);
            file_response.prepare_payload();
            http::write(socket, file_response, ec);
        } else {
            http::response<http::string_body> string_response{static_cast<http::status>(response.status), request.version()};
            string_response.set(http::field::server, SERVER_NAME);
            string_response.set(http::field::content_type, response.content_type);
            string_response.keep_alive(request.keep_alive());
            string_response.body() = response.body;
            string_response.prepare_payload();
            http::write(socket, string_response, ec);
        }

        if (ec) {
            spdlog::warn("Failed to write response: {}", ec.message());
            break;
        }
        if (!request.keep_alive()) {
            break;
        }
    }
    socket.shutdown(tcp::socket::shutdown_send, ec);
}

void HttpServer::do_websocket(tcp::socket& socket, HttpRequest request, std::stop_token stop_token) noexcept {
    const std::string_view target{request.target().data(), request.target().size()};
    if (target_path(target) != "/api/ws/iso") {
        spdlog::debug("Websocket upgrade for unknown path {}", target);
        return;
    }

    beast::error_code ec{};
    websocket::stream<tcp::socket&> ws{socket};
    ws.set_option(websocket::stream_base::decorator([](websocket::response_type& response) {
        response.set(http::field::server, SERVER_NAME);
    }));
    ws.accept(request, ec);
    if (ec) {
        spdlog::warn("Websocket handshake failed: {}", ec.message());
        return;
    }

    beast::flat_buffer buffer{};
    ws.read(buffer, ec);
    if (ec) {
        spdlog::debug("Websocket closed before subscribing: {}", ec.message());
        return;
    }
    const auto job_id = parse_ws_subscribe(beast::buffers_to_string(buffer.data()));

    auto& orchestrator = m_router.orchestrator();
    // subscribe before taking the snapshot so no event falls in between
    auto subscription = job_id ? orchestrator.subscribe(*job_id) : std::nullopt;
    auto snapshot     = job_id ? orchestrator.get_job(*job_id) : std::nullopt;
    if (!subscription || !snapshot) {
        spdlog::info("Websocket subscribe for unknown job");
        ws.close(websocket::close_reason{websocket::close_code::policy_error, "Unknown job"}, ec);
        return;
    }
    spdlog::debug("Websocket viewer attached to job {}", *job_id);

    ws.text(true);
    // a finished job only replays its closing event
    if (!autoiso::job::is_terminal(snapshot->status)) {
        ws.write(net::buffer(autoiso::progress::event_to_json(make_snapshot_event(*snapshot))), ec);
    }

    while (!ec && !stop_token.stop_requested()) {
        auto event = subscription->receive_for(WS_POLL_INTERVAL);
        if (event.has_value()) {
            ws.write(net::buffer(autoiso::progress::event_to_json(*event)), ec);
        } else if (subscription->finished()) {
            break;
        }
    }
    if (ec) {
        // viewer went away, the build keeps running
        spdlog::debug("Websocket viewer of job {} detached: {}", *job_id, ec.message());
        return;
    }
    ws.close(websocket::close_code::normal, ec);
}

}  // namespace server
