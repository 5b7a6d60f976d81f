/**
 * VOXRELAY - Realtime Voice Gateway
 * Logger - Component-tagged logging with spdlog
 *
 * Every line carries the component that wrote it and, when a session is
 * active on the calling thread, that session's id:
 *
 *   [2024-05-01 12:00:00.123] [warn] [breaker] [3f2a9c01d4e5b6a7] synthesis: failure recorded (3/5)
 *
 * A second "message" logger writes one line per client frame handled.
 */

#ifndef VOXRELAY_UTIL_LOGGER_HPP
#define VOXRELAY_UTIL_LOGGER_HPP

#include <spdlog/spdlog.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace voxrelay::util {

enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Off
};

struct LogConfig {
    LogLevel level{LogLevel::Info};
    std::string file_path;             // Empty for console only
    std::size_t max_file_size_mb{100};
    std::size_t max_files{5};
    bool enable_console{true};
    bool enable_colors{true};
};

/**
 * One handled client frame
 */
struct MessageLogEntry {
    std::string session_id;
    std::string client_ip;
    std::string message_type;     // As sent by the client, may be unknown
    std::string outcome;          // "audio", "transcript", "error"
    std::size_t request_size{0};
    std::size_t response_size{0};
    std::chrono::milliseconds latency{0};
    bool cache_hit{false};
};

class Logger {
public:
    /**
     * Apply configuration, replacing the default console sink if something
     * was logged before startup finished
     */
    static void init(const LogConfig& config);

    static Logger& instance();

    ~Logger();

    void set_level(LogLevel level);

    /**
     * Case-insensitive; accepts trace, debug, info, warn, error, off
     */
    static std::optional<LogLevel> parse_level(std::string_view level_str);

    template<typename... Args>
    void trace(std::string_view component, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(spdlog::level::trace, component, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(std::string_view component, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(spdlog::level::debug, component, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(std::string_view component, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(spdlog::level::info, component, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(std::string_view component, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(spdlog::level::warn, component, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(std::string_view component, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(spdlog::level::err, component, fmt, std::forward<Args>(args)...);
    }

    void message(const MessageLogEntry& entry);

    void flush();

    void shutdown();

private:
    Logger() = default;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void configure(const LogConfig& config);

    // Session id of the current thread, "-" outside a session
    static std::string_view session_tag();

    template<typename... Args>
    void log(spdlog::level::level_enum level, std::string_view component,
             spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (!logger_ || !logger_->should_log(level)) return;

        logger_->log(level, "[{}] [{}] {}", component, session_tag(),
                     fmt::format(fmt, std::forward<Args>(args)...));
    }

    static spdlog::level::level_enum to_spdlog_level(LogLevel level);

    std::shared_ptr<spdlog::logger> logger_;
    std::shared_ptr<spdlog::logger> message_logger_;
    mutable std::mutex mutex_;

    static std::unique_ptr<Logger> instance_;
    static std::once_flag init_flag_;
};

/**
 * Binds a session id to the current thread for the lifetime of the object
 *
 * Pipeline work for a session runs on a shared worker pool, so the id is set
 * around each job rather than per thread.
 */
class RequestContext {
public:
    explicit RequestContext(std::string session_id);
    ~RequestContext();

    RequestContext(const RequestContext&) = delete;
    RequestContext& operator=(const RequestContext&) = delete;

    const std::string& id() const { return session_id_; }

    /**
     * Session bound to this thread, empty if none
     */
    static const std::string& current_id();

    /**
     * Random 16-character hex id
     */
    static std::string generate_id();

private:
    std::string session_id_;
    std::string previous_id_;
};

#define VOXRELAY_LOG_TRACE(component, ...) \
    ::voxrelay::util::Logger::instance().trace(component, __VA_ARGS__)
#define VOXRELAY_LOG_DEBUG(component, ...) \
    ::voxrelay::util::Logger::instance().debug(component, __VA_ARGS__)
#define VOXRELAY_LOG_INFO(component, ...) \
    ::voxrelay::util::Logger::instance().info(component, __VA_ARGS__)
#define VOXRELAY_LOG_WARN(component, ...) \
    ::voxrelay::util::Logger::instance().warn(component, __VA_ARGS__)
#define VOXRELAY_LOG_ERROR(component, ...) \
    ::voxrelay::util::Logger::instance().error(component, __VA_ARGS__)

namespace log_component {
    constexpr std::string_view Server = "server";
    constexpr std::string_view Config = "config";
    constexpr std::string_view Session = "session";
    constexpr std::string_view Cache = "cache";
    constexpr std::string_view Breaker = "breaker";
    constexpr std::string_view Retry = "retry";
    constexpr std::string_view Pipeline = "pipeline";
    constexpr std::string_view Backend = "backend";
    constexpr std::string_view Audio = "audio";
}

} // namespace voxrelay::util

#endif // VOXRELAY_UTIL_LOGGER_HPP
