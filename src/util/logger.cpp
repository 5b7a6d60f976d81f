/**
 * VOXRELAY - Realtime Voice Gateway
 * Logger Implementation
 */

#include "util/logger.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <random>
#include <vector>

namespace voxrelay::util {

std::unique_ptr<Logger> Logger::instance_;
std::once_flag Logger::init_flag_;

namespace {

thread_local std::string tl_session_id;

constexpr const char* line_pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
constexpr const char* file_pattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] %v";

} // namespace

void Logger::init(const LogConfig& config) {
    bool created = false;
    std::call_once(init_flag_, [&config, &created]() {
        instance_ = std::unique_ptr<Logger>(new Logger());
        instance_->configure(config);
        created = true;
    });

    if (!created) {
        instance_->configure(config);
    }
}

Logger& Logger::instance() {
    std::call_once(init_flag_, []() {
        instance_ = std::unique_ptr<Logger>(new Logger());
        instance_->configure(LogConfig{});
    });
    return *instance_;
}

Logger::~Logger() {
    shutdown();
}

void Logger::configure(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<spdlog::sink_ptr> sinks;

    if (config.enable_console) {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        if (!config.enable_colors) {
            console_sink->set_color_mode(spdlog::color_mode::never);
        }
        console_sink->set_pattern(line_pattern);
        sinks.push_back(console_sink);
    }

    if (!config.file_path.empty()) {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.file_path,
            config.max_file_size_mb * 1024 * 1024,
            config.max_files);
        file_sink->set_pattern(file_pattern);
        sinks.push_back(file_sink);
    }

    logger_ = std::make_shared<spdlog::logger>("voxrelay", sinks.begin(), sinks.end());
    logger_->set_level(to_spdlog_level(config.level));
    logger_->flush_on(spdlog::level::warn);

    // Frame log ignores the level; it is the per-message audit trail
    message_logger_ = std::make_shared<spdlog::logger>("message", sinks.begin(), sinks.end());
    message_logger_->set_level(spdlog::level::info);
    message_logger_->flush_on(spdlog::level::info);

    spdlog::drop("voxrelay");
    spdlog::drop("message");
    spdlog::register_logger(logger_);
    spdlog::register_logger(message_logger_);
    spdlog::set_default_logger(logger_);
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (logger_) {
        logger_->set_level(to_spdlog_level(level));
    }
}

std::optional<LogLevel> Logger::parse_level(std::string_view level_str) {
    std::string lower(level_str);
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (lower == "trace") return LogLevel::Trace;
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    if (lower == "off") return LogLevel::Off;

    return std::nullopt;
}

std::string_view Logger::session_tag() {
    return tl_session_id.empty() ? std::string_view("-") : std::string_view(tl_session_id);
}

void Logger::message(const MessageLogEntry& entry) {
    if (!message_logger_) return;

    // 3f2a9c01d4e5b6a7 192.168.1.1 "text" audio 24 48213 153ms HIT
    message_logger_->info(
        R"({} {} "{}" {} {} {} {}ms {})",
        entry.session_id.empty() ? "-" : entry.session_id,
        entry.client_ip.empty() ? "-" : entry.client_ip,
        entry.message_type.empty() ? "-" : entry.message_type,
        entry.outcome,
        entry.request_size,
        entry.response_size,
        entry.latency.count(),
        entry.cache_hit ? "HIT" : "MISS"
    );
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (logger_) {
        logger_->flush();
    }
    if (message_logger_) {
        message_logger_->flush();
    }
}

void Logger::shutdown() {
    flush();
    spdlog::shutdown();
}

spdlog::level::level_enum Logger::to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return spdlog::level::trace;
        case LogLevel::Debug: return spdlog::level::debug;
        case LogLevel::Info:  return spdlog::level::info;
        case LogLevel::Warn:  return spdlog::level::warn;
        case LogLevel::Error: return spdlog::level::err;
        case LogLevel::Off:   return spdlog::level::off;
    }
    return spdlog::level::info;
}

RequestContext::RequestContext(std::string session_id)
    : session_id_(std::move(session_id))
    , previous_id_(tl_session_id)
{
    tl_session_id = session_id_;
}

RequestContext::~RequestContext() {
    tl_session_id = std::move(previous_id_);
}

const std::string& RequestContext::current_id() {
    return tl_session_id;
}

std::string RequestContext::generate_id() {
    static thread_local std::mt19937_64 rng(std::random_device{}());
    static constexpr char hex_chars[] = "0123456789abcdef";

    std::uint64_t value = rng();
    std::string id(16, '0');
    for (std::size_t i = 0; i < id.size(); ++i) {
        id[i] = hex_chars[(value >> (i * 4)) & 0xF];
    }
    return id;
}

} // namespace voxrelay::util
