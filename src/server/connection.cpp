/**
 * VOXRELAY - Realtime Voice Gateway
 * Connection implementation - HTTP/1.1 request parsing with Boost.Beast
 */

#include "server/connection.hpp"

#include "util/logger.hpp"

#include <boost/beast/websocket.hpp>

#include <nlohmann/json.hpp>

#include <chrono>

namespace voxrelay::server {

namespace websocket = beast::websocket;
using util::log_component::Session;

namespace {
constexpr auto http_timeout = std::chrono::seconds(30);
constexpr const char* server_name = "VOXRELAY/0.1.0";
} // namespace

Connection::Connection(tcp::socket socket, RequestHandler handler,
                       UpgradeHandler upgrade_handler, std::string upgrade_path)
    : stream_(std::move(socket))
    , handler_(std::move(handler))
    , upgrade_handler_(std::move(upgrade_handler))
    , upgrade_path_(std::move(upgrade_path))
{
    beast::error_code ec;
    auto endpoint = stream_.socket().remote_endpoint(ec);
    if (!ec) {
        client_ip_ = endpoint.address().to_string();
        client_port_ = endpoint.port();
    }
}

void Connection::start() {
    asio::dispatch(
        stream_.get_executor(),
        beast::bind_front_handler(&Connection::do_read, shared_from_this())
    );
}

void Connection::close() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_both, ec);
    // Socket may already be closed
}

void Connection::do_read() {
    request_ = {};
    stream_.expires_after(http_timeout);

    http::async_read(
        stream_,
        buffer_,
        request_,
        beast::bind_front_handler(&Connection::on_read, shared_from_this())
    );
}

void Connection::on_read(beast::error_code ec, std::size_t bytes_transferred) {
    boost::ignore_unused(bytes_transferred);

    if (ec == http::error::end_of_stream) {
        VOXRELAY_LOG_TRACE(Session, "HTTP client closed connection");
        close();
        return;
    }

    if (ec) {
        if (ec == beast::error::timeout) {
            VOXRELAY_LOG_DEBUG(Session, "HTTP read timeout");
        } else if (ec != asio::error::operation_aborted) {
            if (ec == http::error::bad_method ||
                ec == http::error::bad_target ||
                ec == http::error::bad_version ||
                ec == http::error::bad_content_length ||
                ec == http::error::partial_message) {
                VOXRELAY_LOG_WARN(Session, "Malformed HTTP request - {}", ec.message());
                response_ = build_error_response(http::status::bad_request,
                                                 "Malformed HTTP request: " + ec.message());
                do_write();
                return;
            }
            VOXRELAY_LOG_DEBUG(Session, "HTTP read error - {}", ec.message());
        }
        close();
        return;
    }

    VOXRELAY_LOG_DEBUG(Session, "{} {} HTTP/{}.{}",
                       std::string(http::to_string(request_.method())),
                       std::string(request_.target()),
                       request_.version() / 10, request_.version() % 10);

    if (websocket::is_upgrade(request_)) {
        if (upgrade_handler_ && request_.target() == upgrade_path_) {
            // The session owns the stream from here on
            stream_.expires_never();
            upgrade_handler_(std::move(stream_), std::move(request_), client_ip_);
            return;
        }
        keep_alive_ = false;
        response_ = build_error_response(http::status::not_found, "No WebSocket endpoint at this path");
        do_write();
        return;
    }

    if (request_.version() != 10 && request_.version() != 11) {
        VOXRELAY_LOG_WARN(Session, "Unsupported HTTP version {}.{}",
                          request_.version() / 10, request_.version() % 10);
        response_ = build_error_response(http::status::http_version_not_supported,
                                         "Only HTTP/1.0 and HTTP/1.1 are supported");
        do_write();
        return;
    }

    keep_alive_ = request_.keep_alive();

    try {
        HttpResponse resp = handler_(parse_request(request_));
        response_ = build_response(resp);
    } catch (const std::exception& e) {
        VOXRELAY_LOG_ERROR(Session, "HTTP handler exception - {}", e.what());
        response_ = build_error_response(http::status::internal_server_error, "Internal server error");
    }

    do_write();
}

void Connection::do_write() {
    response_.set(http::field::connection, keep_alive_ ? "keep-alive" : "close");
    response_.prepare_payload();
    stream_.expires_after(http_timeout);

    http::async_write(
        stream_,
        response_,
        beast::bind_front_handler(&Connection::on_write, shared_from_this())
    );
}

void Connection::on_write(beast::error_code ec, std::size_t bytes_transferred) {
    boost::ignore_unused(bytes_transferred);

    if (ec) {
        if (ec != asio::error::operation_aborted) {
            VOXRELAY_LOG_DEBUG(Session, "HTTP write error - {}", ec.message());
        }
        close();
        return;
    }

    VOXRELAY_LOG_TRACE(Session, "Sent {} response", static_cast<int>(response_.result()));

    if (!keep_alive_) {
        close();
        return;
    }

    response_ = {};
    do_read();
}

HttpRequest Connection::parse_request(const http::request<http::string_body>& req) const {
    HttpRequest parsed;
    parsed.method = req.method();
    parsed.target = std::string(req.target());
    parsed.version = req.version();
    parsed.body = req.body();
    parsed.client_ip = client_ip_;
    parsed.client_port = client_port_;
    return parsed;
}

http::response<http::string_body> Connection::build_response(const HttpResponse& resp) const {
    http::response<http::string_body> response{resp.status, request_.version()};

    response.set(http::field::server, server_name);
    response.set(http::field::content_type, resp.content_type);

    for (const auto& [name, value] : resp.headers) {
        response.set(name, value);
    }

    response.body() = resp.body;
    return response;
}

http::response<http::string_body> Connection::build_error_response(
    http::status status, const std::string& message) const
{
    http::response<http::string_body> response{status, request_.version() ? request_.version() : 11};

    response.set(http::field::server, server_name);
    response.set(http::field::content_type, "application/json");
    response.body() = nlohmann::json{{"error", message}}.dump();

    return response;
}

void handle_connection(tcp::socket socket, RequestHandler handler, UpgradeHandler upgrade_handler) {
    std::make_shared<Connection>(std::move(socket), std::move(handler),
                                 std::move(upgrade_handler))->start();
}

} // namespace voxrelay::server
