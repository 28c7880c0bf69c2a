#ifndef HTTP_SERVER_HPP
#define HTTP_SERVER_HPP

#include "routes.hpp"

#include <atomic>       // for atomic_bool
#include <cstdint>      // for uint16_t
#include <list>         // for list
#include <memory>       // for shared_ptr
#include <mutex>        // for mutex
#include <string_view>  // for string_view
#include <thread>       // for jthread

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>

namespace server {

/// @brief HTTP/WebSocket front of the router.
/// Connections are accepted on one io_context, every connection is then served
/// synchronously on its own thread. SIGINT/SIGTERM stop the server.
class HttpServer final {
 public:
    explicit HttpServer(Router& router) noexcept;
    ~HttpServer();

    // explicitly deleted
    HttpServer(const HttpServer&)      = delete;
    auto operator=(const HttpServer&) = delete;

    /// @brief Binds the listening socket.
    /// Port 0 picks a free port, see port().
    auto listen(std::string_view address, std::uint16_t port) noexcept -> bool;

    /// Accepts connections until stop() or a termination signal.
    void run() noexcept;

    /// Thread-safe, makes run() return after closing every connection.
    void stop() noexcept;

    [[nodiscard]] auto port() const noexcept -> std::uint16_t;

 private:
    using tcp         = boost::asio::ip::tcp;
    using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;

    struct Session {
        std::shared_ptr<tcp::socket> socket{};
        std::shared_ptr<std::atomic_bool> done{};
        std::jthread thread{};
    };

    void do_accept() noexcept;
    void start_session(tcp::socket socket) noexcept;
    void do_session(tcp::socket& socket, std::stop_token stop_token) noexcept;
    void do_websocket(tcp::socket& socket, HttpRequest request, std::stop_token stop_token) noexcept;
    void reap_sessions() noexcept;
    void shutdown_sessions() noexcept;

    Router& m_router;
    boost::asio::io_context m_ioc{1};
    tcp::acceptor m_acceptor;
    boost::asio::signal_set m_signals;

    std::mutex m_sessions_mutex;
    std::list<Session> m_sessions{};
};

}  // namespace server

#endif  // HTTP_SERVER_HPP
