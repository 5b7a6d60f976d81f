/**
 * VOXRELAY - Realtime Voice Gateway
 * Configuration System - Supports JSON file, environment variables, and CLI args
 *
 * Configuration hierarchy (highest precedence first):
 * 1. Command-line arguments
 * 2. Environment variables (VOXRELAY_*)
 * 3. Configuration file (JSON)
 * 4. Default values
 */

#ifndef VOXRELAY_CONFIG_CONFIG_HPP
#define VOXRELAY_CONFIG_CONFIG_HPP

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace voxrelay::config {

/**
 * Server configuration
 */
struct ServerSettings {
    std::uint16_t port{8000};
    std::size_t threads{0};          // I/O threads, 0 = hardware_concurrency
    std::size_t worker_threads{0};   // Pipeline workers, 0 = 2 * hardware_concurrency
    std::string bind_address{"0.0.0.0"};
    std::size_t max_message_bytes{16 * 1024 * 1024};
};

/**
 * Cache configuration
 */
struct CacheSettings {
    bool enabled{true};
    std::size_t max_size_mb{512};
    std::uint32_t ttl_seconds{3600};
};

/**
 * Circuit breaker configuration (synthesis backend)
 */
struct BreakerSettings {
    std::uint32_t failure_threshold{5};
    std::uint32_t recovery_timeout_seconds{60};
    std::uint32_t success_threshold{2};
    std::uint32_t half_open_max_calls{1};
};

/**
 * Retry configuration (synthesis backend)
 */
struct RetrySettings {
    std::uint32_t max_attempts{3};
    double min_wait_seconds{1.0};
    double multiplier{2.0};
    double max_wait_seconds{10.0};
};

/**
 * Backend endpoint
 */
struct EndpointSettings {
    std::string host{"127.0.0.1"};
    std::uint16_t port{8001};
    std::string path{"/"};
    std::uint32_t timeout_ms{30000};
    std::string api_key;
    std::string api_key_header{"xi-api-key"};
};

/**
 * Audio post-processing
 */
struct AudioSettings {
    bool post_process{true};
    double target_dbfs{-20.0};
    bool compress{false};
    double compress_threshold_db{-20.0};
    double compress_ratio{4.0};
};

/**
 * Logging configuration
 */
struct LogSettings {
    std::string level{"info"};
    std::string file;                  // Empty for stdout only
    std::size_t max_file_size_mb{100};
    std::size_t max_files{5};
    bool enable_console{true};
    bool enable_colors{true};
};

/**
 * Complete application configuration
 */
struct Config {
    ServerSettings server;
    CacheSettings cache;
    BreakerSettings circuit_breaker;
    RetrySettings retry;
    EndpointSettings synthesis{"127.0.0.1", 8001, "/v1/synthesize", 30000, "", "xi-api-key"};
    EndpointSettings transcription{"127.0.0.1", 8002, "/v1/transcribe", 60000, "", "xi-api-key"};
    AudioSettings audio;
    LogSettings logging;

    /**
     * Validate configuration and throw if invalid
     */
    void validate() const;
};

/**
 * Configuration reload callback type
 */
using ConfigReloadCallback = std::function<void(const Config&)>;

/**
 * Configuration manager - handles loading, parsing, and reload
 */
class ConfigManager {
public:
    ConfigManager();
    ~ConfigManager();

    // Non-copyable
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    /**
     * Parse command-line arguments and load configuration
     *
     * @return true if configuration loaded successfully, false if --help was requested
     * @throws std::runtime_error on configuration errors
     */
    bool load(int argc, char* argv[]);

    /**
     * Get the current configuration (thread-safe)
     */
    Config get_config() const;

    /**
     * Reload configuration from file (called on SIGHUP)
     *
     * Listeners receive the new configuration; only settings that can change
     * at runtime (logging level) are applied by them. A failed reload keeps
     * the current configuration.
     */
    void reload();

    /**
     * Register callback for configuration reload events
     */
    void on_reload(ConfigReloadCallback callback);

    std::filesystem::path get_config_path() const;

    static void print_help(const char* program_name);

private:
    void load_from_file(const std::filesystem::path& path);

    void apply_environment_overrides();

    void apply_cli_overrides(int argc, char* argv[]);

    /**
     * Re-apply stored CLI values after a reload
     */
    void reapply_cli_overrides();

    static std::optional<std::string> get_env(const std::string& name);

    mutable std::mutex config_mutex_;
    Config config_;
    std::filesystem::path config_path_;
    std::vector<ConfigReloadCallback> reload_callbacks_;

    // CLI overrides (stored to preserve precedence on reload)
    std::optional<std::uint16_t> cli_port_;
    std::optional<std::size_t> cli_threads_;
    std::optional<std::size_t> cli_worker_threads_;
    std::optional<std::string> cli_bind_address_;
    std::optional<std::string> cli_log_level_;
    std::optional<std::string> cli_synthesis_;
    std::optional<std::string> cli_transcription_;
    bool cli_no_cache_{false};
};

/**
 * Parse "host:port" into an endpoint
 *
 * @throws std::runtime_error on a malformed value
 */
void parse_host_port(const std::string& value, EndpointSettings& endpoint);

// JSON serialization support
void to_json(nlohmann::json& j, const ServerSettings& s);
void from_json(const nlohmann::json& j, ServerSettings& s);
void to_json(nlohmann::json& j, const CacheSettings& c);
void from_json(const nlohmann::json& j, CacheSettings& c);
void to_json(nlohmann::json& j, const BreakerSettings& b);
void from_json(const nlohmann::json& j, BreakerSettings& b);
void to_json(nlohmann::json& j, const RetrySettings& r);
void from_json(const nlohmann::json& j, RetrySettings& r);
void to_json(nlohmann::json& j, const EndpointSettings& e);
void from_json(const nlohmann::json& j, EndpointSettings& e);
void to_json(nlohmann::json& j, const AudioSettings& a);
void from_json(const nlohmann::json& j, AudioSettings& a);
void to_json(nlohmann::json& j, const LogSettings& l);
void from_json(const nlohmann::json& j, LogSettings& l);
void to_json(nlohmann::json& j, const Config& c);
void from_json(const nlohmann::json& j, Config& c);

} // namespace voxrelay::config

#endif // VOXRELAY_CONFIG_CONFIG_HPP
