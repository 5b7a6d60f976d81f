/**
 * VOXRELAY - Realtime Voice Gateway
 * WebSocket Session implementation
 */

#include "server/ws_session.hpp"

#include "pipeline/errors.hpp"
#include "pipeline/message_codec.hpp"

#include <variant>

namespace voxrelay::server {

using util::log_component::Session;

FrameOutcome process_frame(pipeline::PipelineDispatcher& dispatcher, util::Stats& stats,
                           const std::string& frame) {
    const auto start = std::chrono::steady_clock::now();

    FrameOutcome outcome;
    outcome.log.request_size = frame.size();

    pipeline::PipelineResponse response;
    try {
        auto request = pipeline::parse_request(frame);
        outcome.log.message_type = std::string(pipeline::request_kind(request));
        response = dispatcher.handle(request);
    } catch (const pipeline::ValidationError& e) {
        outcome.log.message_type = "invalid";
        stats.request_failed();
        response = pipeline::FailureResponse{e.what()};
    } catch (const std::exception& e) {
        VOXRELAY_LOG_ERROR(Session, "Frame handling failed: {}", e.what());
        stats.request_failed();
        response = pipeline::FailureResponse{"Internal error"};
    }

    if (auto* audio = std::get_if<pipeline::AudioResponse>(&response)) {
        outcome.log.cache_hit = audio->cached;
    }
    outcome.log.outcome = std::string(pipeline::response_kind(response));

    try {
        outcome.payload = pipeline::serialize_response(response);
    } catch (const std::exception& e) {
        VOXRELAY_LOG_ERROR(Session, "Response serialization failed: {}", e.what());
        outcome.payload = pipeline::serialize_response(pipeline::FailureResponse{"Internal error"});
        outcome.log.outcome = "error";
    }

    outcome.log.response_size = outcome.payload.size();
    outcome.log.latency = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    return outcome;
}

WsSession::WsSession(beast::tcp_stream stream, std::string client_ip, SessionServices& services)
    : ws_(std::move(stream))
    , services_(services)
    , connection_guard_(services.stats)
    , session_id_(util::RequestContext::generate_id())
    , client_ip_(std::move(client_ip))
    , started_at_(std::chrono::steady_clock::now())
{
    pending_log_.session_id = session_id_;
    pending_log_.client_ip = client_ip_;
}

WsSession::~WsSession() {
    auto duration = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - started_at_);
    VOXRELAY_LOG_INFO(Session, "Session {} closed after {}s, {} messages",
                      session_id_, duration.count(), messages_);
}

void WsSession::run(http::request<http::string_body> upgrade_request) {
    ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
    ws_.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
        res.set(http::field::server, "VOXRELAY/0.1.0");
    }));
    ws_.read_message_max(services_.max_message_bytes);

    ws_.async_accept(
        upgrade_request,
        beast::bind_front_handler(&WsSession::on_accept, shared_from_this())
    );
}

void WsSession::on_accept(beast::error_code ec) {
    if (ec) {
        VOXRELAY_LOG_WARN(Session, "WebSocket handshake failed from {}: {}", client_ip_, ec.message());
        return;
    }

    VOXRELAY_LOG_INFO(Session, "Session {} opened from {}", session_id_, client_ip_);
    do_read();
}

void WsSession::do_read() {
    ws_.async_read(
        buffer_,
        beast::bind_front_handler(&WsSession::on_read, shared_from_this())
    );
}

void WsSession::on_read(beast::error_code ec, std::size_t bytes_transferred) {
    boost::ignore_unused(bytes_transferred);

    if (ec) {
        if (ec == websocket::error::closed) {
            VOXRELAY_LOG_DEBUG(Session, "Session {}: client closed", session_id_);
        } else if (ec == websocket::error::message_too_big) {
            VOXRELAY_LOG_WARN(Session, "Session {}: frame exceeds {} bytes, closing",
                              session_id_, services_.max_message_bytes);
        } else if (ec != asio::error::operation_aborted) {
            VOXRELAY_LOG_DEBUG(Session, "Session {}: read error - {}", session_id_, ec.message());
        }
        return;
    }

    std::string frame = beast::buffers_to_string(buffer_.data());
    buffer_.consume(buffer_.size());
    ++messages_;

    dispatch_frame(std::move(frame));
}

void WsSession::dispatch_frame(std::string frame) {
    // Pipeline work may block on backends and backoff sleeps; keep it off the I/O threads
    asio::post(services_.workers, [self = shared_from_this(), frame = std::move(frame)]() {
        util::RequestContext context(self->session_id_);
        auto outcome = process_frame(self->services_.dispatcher, self->services_.stats, frame);

        asio::post(self->ws_.get_executor(), [self, outcome = std::move(outcome)]() mutable {
            self->send(std::move(outcome));
        });
    });
}

void WsSession::send(FrameOutcome outcome) {
    outgoing_ = std::move(outcome.payload);

    pending_log_.message_type = std::move(outcome.log.message_type);
    pending_log_.outcome = std::move(outcome.log.outcome);
    pending_log_.request_size = outcome.log.request_size;
    pending_log_.response_size = outcome.log.response_size;
    pending_log_.latency = outcome.log.latency;
    pending_log_.cache_hit = outcome.log.cache_hit;

    ws_.text(true);
    ws_.async_write(
        asio::buffer(outgoing_),
        beast::bind_front_handler(&WsSession::on_write, shared_from_this())
    );
}

void WsSession::on_write(beast::error_code ec, std::size_t bytes_transferred) {
    boost::ignore_unused(bytes_transferred);

    util::Logger::instance().message(pending_log_);

    if (ec) {
        // Client went away while the request was in flight; the response is dropped
        if (ec != asio::error::operation_aborted) {
            VOXRELAY_LOG_DEBUG(Session, "Session {}: write error - {}", session_id_, ec.message());
        }
        return;
    }

    outgoing_.clear();
    do_read();
}

void start_ws_session(beast::tcp_stream stream, http::request<http::string_body> upgrade_request,
                      std::string client_ip, SessionServices& services) {
    std::make_shared<WsSession>(std::move(stream), std::move(client_ip), services)
        ->run(std::move(upgrade_request));
}

} // namespace voxrelay::server
