/**
 * VOXRELAY - Realtime Voice Gateway
 * Server component - Async I/O foundation with graceful shutdown
 */

#ifndef VOXRELAY_SERVER_SERVER_HPP
#define VOXRELAY_SERVER_SERVER_HPP

#include <utility>  // before Boost.Asio: awaitable.hpp uses std::exchange
#include <boost/asio.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace voxrelay::server {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

/**
 * Server configuration for async I/O foundation
 */
struct ServerConfig {
    std::uint16_t port{8000};
    std::size_t thread_count{std::thread::hardware_concurrency()};
    std::string bind_address{"0.0.0.0"};
};

/**
 * Connection handler type - called when a new connection is accepted
 */
using ConnectionHandler = std::function<void(tcp::socket)>;

/**
 * Reload handler type - called on SIGHUP
 */
using ReloadHandler = std::function<void()>;

/**
 * Main server class - manages io_context, thread pool, and TCP acceptor
 *
 * Uses std::jthread with stop_token for graceful shutdown.
 * SIGINT/SIGTERM stop the server; SIGHUP invokes the reload handler.
 * Each accepted socket is bound to its own strand.
 */
class Server {
public:
    explicit Server(const ServerConfig& config);
    ~Server();

    // Non-copyable, non-movable (owns threads and io_context)
    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;
    Server(Server&&) = delete;
    Server& operator=(Server&&) = delete;

    /**
     * Start the server - begins accepting connections
     * @param handler Callback invoked for each accepted connection
     * @param reload_handler Optional callback invoked on SIGHUP
     * @throws std::runtime_error if the listener cannot be opened
     */
    void start(ConnectionHandler handler, ReloadHandler reload_handler = nullptr);

    /**
     * Request graceful shutdown
     * Stops accepting new connections and stops the I/O threads.
     */
    void stop();

    /**
     * Block until server stops
     */
    void wait();

    bool is_running() const noexcept;

    asio::io_context& get_io_context() noexcept;

    /**
     * Port the server is listening on (resolved when configured as 0)
     */
    std::uint16_t get_port() const noexcept;

private:
    void run_io_context(std::stop_token stop_token);
    void do_accept();
    void setup_signal_handling();

    ServerConfig config_;
    asio::io_context io_context_;
    asio::executor_work_guard<asio::io_context::executor_type> work_guard_;
    tcp::acceptor acceptor_;
    asio::signal_set signals_;

    std::vector<std::jthread> thread_pool_;
    ConnectionHandler connection_handler_;
    ReloadHandler reload_handler_;

    std::atomic<bool> running_{false};
    std::atomic<std::uint16_t> bound_port_{0};
    std::atomic<std::uint64_t> connections_accepted_{0};
};

} // namespace voxrelay::server

#endif // VOXRELAY_SERVER_SERVER_HPP
