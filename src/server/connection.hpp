/**
 * VOXRELAY - Realtime Voice Gateway
 * Connection handler - HTTP/1.1 request parsing with Boost.Beast
 *
 * Serves plain HTTP requests through a RequestHandler and hands WebSocket
 * upgrade requests (stream plus the upgrade request) to an UpgradeHandler.
 */

#ifndef VOXRELAY_SERVER_CONNECTION_HPP
#define VOXRELAY_SERVER_CONNECTION_HPP

#include <utility>  // before Boost.Asio: awaitable.hpp uses std::exchange
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace voxrelay::server {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

/**
 * Parsed HTTP request information
 */
struct HttpRequest {
    http::verb method{http::verb::unknown};
    std::string target;
    unsigned version{11};  // HTTP/1.1 = 11
    std::string body;

    // Client connection info
    std::string client_ip;
    std::uint16_t client_port{0};
};

/**
 * HTTP response structure
 */
struct HttpResponse {
    http::status status{http::status::ok};
    std::string content_type{"text/plain"};
    std::string body;

    // Additional headers (optional)
    std::vector<std::pair<std::string, std::string>> headers{};
};

/**
 * Request handler callback type
 */
using RequestHandler = std::function<HttpResponse(const HttpRequest&)>;

/**
 * Upgrade handler callback type
 * Takes ownership of the stream; the request is the client's upgrade request.
 */
using UpgradeHandler = std::function<void(beast::tcp_stream, http::request<http::string_body>,
                                          std::string client_ip)>;

/**
 * Connection class - manages a single HTTP/1.1 client connection
 *
 * Supports keep-alive, POST bodies and WebSocket upgrade on upgrade_path.
 */
class Connection : public std::enable_shared_from_this<Connection> {
public:
    Connection(tcp::socket socket, RequestHandler handler,
               UpgradeHandler upgrade_handler = nullptr,
               std::string upgrade_path = "/ws/voice");

    ~Connection() = default;

    // Non-copyable, non-movable
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;
    Connection(Connection&&) = delete;
    Connection& operator=(Connection&&) = delete;

    /**
     * Start processing the connection asynchronously
     */
    void start();

    /**
     * Close the connection gracefully
     */
    void close();

private:
    void do_read();
    void on_read(beast::error_code ec, std::size_t bytes_transferred);
    void do_write();
    void on_write(beast::error_code ec, std::size_t bytes_transferred);

    HttpRequest parse_request(const http::request<http::string_body>& req) const;
    http::response<http::string_body> build_response(const HttpResponse& resp) const;
    http::response<http::string_body> build_error_response(http::status status,
                                                           const std::string& message) const;

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> request_;
    http::response<http::string_body> response_;
    RequestHandler handler_;
    UpgradeHandler upgrade_handler_;
    std::string upgrade_path_;
    bool keep_alive_{false};

    // Client connection info (captured at connection time)
    std::string client_ip_;
    std::uint16_t client_port_{0};
};

/**
 * Create and start a connection
 * Helper function for use with Server::start()
 */
void handle_connection(tcp::socket socket, RequestHandler handler,
                       UpgradeHandler upgrade_handler = nullptr);

} // namespace voxrelay::server

#endif // VOXRELAY_SERVER_CONNECTION_HPP
