/**
 * VOXRELAY - Realtime Voice Gateway
 * Server implementation - Async I/O foundation with graceful shutdown
 */

#include "server/server.hpp"

#include "util/logger.hpp"

#include <stdexcept>

namespace voxrelay::server {

namespace {
constexpr std::string_view log_tag = util::log_component::Server;
} // namespace

Server::Server(const ServerConfig& config)
    : config_(config)
    , io_context_(static_cast<int>(config.thread_count))
    , work_guard_(asio::make_work_guard(io_context_))
    , acceptor_(io_context_)
    , signals_(io_context_)
{
    if (config_.thread_count == 0) {
        config_.thread_count = 1;
    }
    VOXRELAY_LOG_DEBUG(log_tag, "Initializing with {} I/O threads on {}:{}",
                       config_.thread_count, config_.bind_address, config_.port);
}

Server::~Server() {
    stop();
    wait();
}

void Server::start(ConnectionHandler handler, ReloadHandler reload_handler) {
    if (running_.exchange(true)) {
        VOXRELAY_LOG_WARN(log_tag, "Already running, ignoring start request");
        return;
    }

    connection_handler_ = std::move(handler);
    reload_handler_ = std::move(reload_handler);

    setup_signal_handling();

    boost::system::error_code ec;
    auto address = asio::ip::make_address(config_.bind_address, ec);
    if (ec) {
        running_ = false;
        throw std::runtime_error("Invalid bind address '" + config_.bind_address + "': " + ec.message());
    }
    tcp::endpoint endpoint(address, config_.port);

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
        VOXRELAY_LOG_ERROR(log_tag, "Failed to open acceptor: {}", ec.message());
        running_ = false;
        throw std::runtime_error("Failed to open acceptor: " + ec.message());
    }

    acceptor_.set_option(tcp::acceptor::reuse_address(true), ec);
    if (ec) {
        VOXRELAY_LOG_WARN(log_tag, "Failed to set reuse_address: {}", ec.message());
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
        VOXRELAY_LOG_ERROR(log_tag, "Failed to bind to {}:{}: {}",
                           config_.bind_address, config_.port, ec.message());
        running_ = false;
        throw std::runtime_error("Failed to bind: " + ec.message());
    }

    acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    if (ec) {
        VOXRELAY_LOG_ERROR(log_tag, "Failed to listen: {}", ec.message());
        running_ = false;
        throw std::runtime_error("Failed to listen: " + ec.message());
    }

    bound_port_ = acceptor_.local_endpoint().port();
    VOXRELAY_LOG_INFO(log_tag, "Listening on {}:{}", config_.bind_address, bound_port_.load());

    do_accept();

    thread_pool_.reserve(config_.thread_count);
    for (std::size_t i = 0; i < config_.thread_count; ++i) {
        thread_pool_.emplace_back([this](std::stop_token st) {
            run_io_context(st);
        });
    }

    VOXRELAY_LOG_INFO(log_tag, "Started with {} I/O threads", config_.thread_count);
}

void Server::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    VOXRELAY_LOG_INFO(log_tag, "Initiating graceful shutdown...");

    boost::system::error_code ec;
    acceptor_.close(ec);
    if (ec) {
        VOXRELAY_LOG_WARN(log_tag, "Error closing acceptor: {}", ec.message());
    }

    signals_.cancel(ec);

    work_guard_.reset();

    for (auto& thread : thread_pool_) {
        thread.request_stop();
    }

    // Interrupts open sessions; in-flight pipeline work finishes on the worker pool
    io_context_.stop();

    VOXRELAY_LOG_INFO(log_tag, "Shutdown initiated, waiting for threads...");
}

void Server::wait() {
    for (auto& thread : thread_pool_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    if (!thread_pool_.empty()) {
        VOXRELAY_LOG_INFO(log_tag, "All I/O threads terminated");
    }
    thread_pool_.clear();
}

bool Server::is_running() const noexcept {
    return running_.load();
}

asio::io_context& Server::get_io_context() noexcept {
    return io_context_;
}

std::uint16_t Server::get_port() const noexcept {
    auto bound = bound_port_.load();
    return bound != 0 ? bound : config_.port;
}

void Server::run_io_context(std::stop_token stop_token) {
    VOXRELAY_LOG_DEBUG(log_tag, "I/O thread started");

    while (!stop_token.stop_requested()) {
        try {
            io_context_.run();
            break;
        } catch (const std::exception& e) {
            VOXRELAY_LOG_ERROR(log_tag, "Exception in I/O thread: {}", e.what());
        }
    }

    VOXRELAY_LOG_DEBUG(log_tag, "I/O thread exiting");
}

void Server::do_accept() {
    if (!running_) {
        return;
    }

    acceptor_.async_accept(
        asio::make_strand(io_context_),
        [this](boost::system::error_code ec, tcp::socket socket) {
            if (!running_) {
                return;
            }

            if (ec) {
                if (ec != asio::error::operation_aborted) {
                    VOXRELAY_LOG_ERROR(log_tag, "Accept error: {}", ec.message());
                    do_accept();
                }
                return;
            }

            ++connections_accepted_;
            auto remote = socket.remote_endpoint(ec);
            if (!ec) {
                VOXRELAY_LOG_DEBUG(log_tag, "Connection #{} accepted from {}:{}",
                                   connections_accepted_.load(),
                                   remote.address().to_string(), remote.port());
            }

            if (connection_handler_) {
                try {
                    connection_handler_(std::move(socket));
                } catch (const std::exception& e) {
                    VOXRELAY_LOG_ERROR(log_tag, "Connection handler exception: {}", e.what());
                }
            }

            do_accept();
        }
    );
}

void Server::setup_signal_handling() {
    signals_.add(SIGINT);
    signals_.add(SIGTERM);
    signals_.add(SIGHUP);

    signals_.async_wait([this](boost::system::error_code ec, int signal_number) {
        if (ec) {
            if (ec != asio::error::operation_aborted) {
                VOXRELAY_LOG_DEBUG(log_tag, "Signal handler error: {}", ec.message());
            }
            return;
        }

        // SIGHUP triggers config reload, not shutdown
        if (signal_number == SIGHUP) {
            VOXRELAY_LOG_INFO(log_tag, "Received SIGHUP - reloading configuration");
            if (reload_handler_) {
                try {
                    reload_handler_();
                } catch (const std::exception& e) {
                    VOXRELAY_LOG_ERROR(log_tag, "Config reload failed: {}", e.what());
                }
            }
            setup_signal_handling();
            return;
        }

        VOXRELAY_LOG_INFO(log_tag, "Received signal {} - initiating shutdown", signal_number);
        stop();
    });
}

} // namespace voxrelay::server
