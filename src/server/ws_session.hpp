/**
 * VOXRELAY - Realtime Voice Gateway
 * WebSocket Session - One voice client on /ws/voice
 *
 * Reads one JSON frame at a time, runs it through the pipeline on the
 * worker pool, writes the response, then reads the next frame. Responses
 * therefore keep request order within a session. Request-level failures
 * become error frames; the session stays open.
 */

#ifndef VOXRELAY_SERVER_WS_SESSION_HPP
#define VOXRELAY_SERVER_WS_SESSION_HPP

#include "pipeline/dispatcher.hpp"
#include "util/logger.hpp"
#include "util/stats.hpp"

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace voxrelay::server {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;

/**
 * Shared services every session uses; owned by main and outliving all sessions
 */
struct SessionServices {
    pipeline::PipelineDispatcher& dispatcher;
    util::Stats& stats;
    asio::thread_pool& workers;
    std::size_t max_message_bytes{16 * 1024 * 1024};
};

/**
 * Result of handling one frame, produced on a worker thread
 */
struct FrameOutcome {
    std::string payload;
    util::MessageLogEntry log;
};

/**
 * Decode, dispatch and encode one client frame
 *
 * Never throws; malformed frames and internal failures become error frames.
 */
FrameOutcome process_frame(pipeline::PipelineDispatcher& dispatcher, util::Stats& stats,
                           const std::string& frame);

class WsSession : public std::enable_shared_from_this<WsSession> {
public:
    WsSession(beast::tcp_stream stream, std::string client_ip, SessionServices& services);

    ~WsSession();

    WsSession(const WsSession&) = delete;
    WsSession& operator=(const WsSession&) = delete;

    /**
     * Complete the WebSocket handshake and start reading frames
     */
    void run(http::request<http::string_body> upgrade_request);

    const std::string& id() const noexcept { return session_id_; }

private:
    void on_accept(beast::error_code ec);
    void do_read();
    void on_read(beast::error_code ec, std::size_t bytes_transferred);
    void dispatch_frame(std::string frame);
    void send(FrameOutcome outcome);
    void on_write(beast::error_code ec, std::size_t bytes_transferred);

    websocket::stream<beast::tcp_stream> ws_;
    beast::flat_buffer buffer_;
    SessionServices& services_;
    util::ConnectionGuard connection_guard_;

    std::string session_id_;
    std::string client_ip_;
    std::string outgoing_;
    util::MessageLogEntry pending_log_;
    std::chrono::steady_clock::time_point started_at_;
    std::uint64_t messages_{0};
};

/**
 * Start a session for an accepted upgrade request
 */
void start_ws_session(beast::tcp_stream stream, http::request<http::string_body> upgrade_request,
                      std::string client_ip, SessionServices& services);

} // namespace voxrelay::server

#endif // VOXRELAY_SERVER_WS_SESSION_HPP
