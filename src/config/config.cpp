/**
 * VOXRELAY - Realtime Voice Gateway
 * Configuration System Implementation
 */

#include "config/config.hpp"

#include "util/logger.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace voxrelay::config {

namespace {

template <typename T>
void read_field(const nlohmann::json& j, const char* name, T& target) {
    if (j.contains(name)) {
        j.at(name).get_to(target);
    }
}

/**
 * Parse an unsigned integer option, rejecting trailing junk and overflow
 */
template <typename T>
T parse_unsigned(const std::string& value, const std::string& option) {
    try {
        std::size_t consumed = 0;
        unsigned long long parsed = std::stoull(value, &consumed);
        if (consumed != value.size() || value.find('-') != std::string::npos ||
            parsed > std::numeric_limits<T>::max()) {
            throw std::invalid_argument(value);
        }
        return static_cast<T>(parsed);
    } catch (const std::logic_error&) {
        throw std::runtime_error("Invalid " + option + " value: " + value);
    }
}

double parse_double(const std::string& value, const std::string& option) {
    try {
        std::size_t consumed = 0;
        double parsed = std::stod(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw std::runtime_error("Invalid " + option + " value: " + value);
    }
}

bool parse_bool(const std::string& value) {
    return value == "true" || value == "1" || value == "yes";
}

/**
 * Match "--name value" or "--name=value"; advances i past a separate value
 */
std::optional<std::string> option_value(int argc, char* argv[], int& i,
                                        const std::string& long_name,
                                        const std::string& short_name = {}) {
    std::string arg(argv[i]);
    if ((arg == long_name || (!short_name.empty() && arg == short_name)) && i + 1 < argc) {
        return std::string(argv[++i]);
    }
    if (arg.starts_with(long_name + "=")) {
        return arg.substr(long_name.size() + 1);
    }
    return std::nullopt;
}

} // namespace

// JSON serialization implementations
void to_json(nlohmann::json& j, const ServerSettings& s) {
    j = nlohmann::json{
        {"port", s.port},
        {"threads", s.threads},
        {"worker_threads", s.worker_threads},
        {"bind_address", s.bind_address},
        {"max_message_bytes", s.max_message_bytes}
    };
}

void from_json(const nlohmann::json& j, ServerSettings& s) {
    read_field(j, "port", s.port);
    read_field(j, "threads", s.threads);
    read_field(j, "worker_threads", s.worker_threads);
    read_field(j, "bind_address", s.bind_address);
    read_field(j, "max_message_bytes", s.max_message_bytes);
}

void to_json(nlohmann::json& j, const CacheSettings& c) {
    j = nlohmann::json{
        {"enabled", c.enabled},
        {"max_size_mb", c.max_size_mb},
        {"ttl_seconds", c.ttl_seconds}
    };
}

void from_json(const nlohmann::json& j, CacheSettings& c) {
    read_field(j, "enabled", c.enabled);
    read_field(j, "max_size_mb", c.max_size_mb);
    read_field(j, "ttl_seconds", c.ttl_seconds);
}

void to_json(nlohmann::json& j, const BreakerSettings& b) {
    j = nlohmann::json{
        {"failure_threshold", b.failure_threshold},
        {"recovery_timeout_seconds", b.recovery_timeout_seconds},
        {"success_threshold", b.success_threshold},
        {"half_open_max_calls", b.half_open_max_calls}
    };
}

void from_json(const nlohmann::json& j, BreakerSettings& b) {
    read_field(j, "failure_threshold", b.failure_threshold);
    read_field(j, "recovery_timeout_seconds", b.recovery_timeout_seconds);
    read_field(j, "success_threshold", b.success_threshold);
    read_field(j, "half_open_max_calls", b.half_open_max_calls);
}

void to_json(nlohmann::json& j, const RetrySettings& r) {
    j = nlohmann::json{
        {"max_attempts", r.max_attempts},
        {"min_wait_seconds", r.min_wait_seconds},
        {"multiplier", r.multiplier},
        {"max_wait_seconds", r.max_wait_seconds}
    };
}

void from_json(const nlohmann::json& j, RetrySettings& r) {
    read_field(j, "max_attempts", r.max_attempts);
    read_field(j, "min_wait_seconds", r.min_wait_seconds);
    read_field(j, "multiplier", r.multiplier);
    read_field(j, "max_wait_seconds", r.max_wait_seconds);
}

void to_json(nlohmann::json& j, const EndpointSettings& e) {
    // api_key is never written back out
    j = nlohmann::json{
        {"host", e.host},
        {"port", e.port},
        {"path", e.path},
        {"timeout_ms", e.timeout_ms},
        {"api_key_header", e.api_key_header}
    };
}

void from_json(const nlohmann::json& j, EndpointSettings& e) {
    read_field(j, "host", e.host);
    read_field(j, "port", e.port);
    read_field(j, "path", e.path);
    read_field(j, "timeout_ms", e.timeout_ms);
    read_field(j, "api_key", e.api_key);
    read_field(j, "api_key_header", e.api_key_header);
}

void to_json(nlohmann::json& j, const AudioSettings& a) {
    j = nlohmann::json{
        {"post_process", a.post_process},
        {"target_dbfs", a.target_dbfs},
        {"compress", a.compress},
        {"compress_threshold_db", a.compress_threshold_db},
        {"compress_ratio", a.compress_ratio}
    };
}

void from_json(const nlohmann::json& j, AudioSettings& a) {
    read_field(j, "post_process", a.post_process);
    read_field(j, "target_dbfs", a.target_dbfs);
    read_field(j, "compress", a.compress);
    read_field(j, "compress_threshold_db", a.compress_threshold_db);
    read_field(j, "compress_ratio", a.compress_ratio);
}

void to_json(nlohmann::json& j, const LogSettings& l) {
    j = nlohmann::json{
        {"level", l.level},
        {"file", l.file},
        {"max_file_size_mb", l.max_file_size_mb},
        {"max_files", l.max_files},
        {"enable_console", l.enable_console},
        {"enable_colors", l.enable_colors}
    };
}

void from_json(const nlohmann::json& j, LogSettings& l) {
    read_field(j, "level", l.level);
    read_field(j, "file", l.file);
    read_field(j, "max_file_size_mb", l.max_file_size_mb);
    read_field(j, "max_files", l.max_files);
    read_field(j, "enable_console", l.enable_console);
    read_field(j, "enable_colors", l.enable_colors);
}

void to_json(nlohmann::json& j, const Config& c) {
    j = nlohmann::json{
        {"server", c.server},
        {"cache", c.cache},
        {"circuit_breaker", c.circuit_breaker},
        {"retry", c.retry},
        {"synthesis", c.synthesis},
        {"transcription", c.transcription},
        {"audio", c.audio},
        {"logging", c.logging}
    };
}

void from_json(const nlohmann::json& j, Config& c) {
    read_field(j, "server", c.server);
    read_field(j, "cache", c.cache);
    read_field(j, "circuit_breaker", c.circuit_breaker);
    read_field(j, "retry", c.retry);
    read_field(j, "synthesis", c.synthesis);
    read_field(j, "transcription", c.transcription);
    read_field(j, "audio", c.audio);
    read_field(j, "logging", c.logging);
}

void parse_host_port(const std::string& value, EndpointSettings& endpoint) {
    auto colon_pos = value.rfind(':');
    if (colon_pos == std::string::npos || colon_pos == 0) {
        throw std::runtime_error("Invalid endpoint format (expected host:port): " + value);
    }
    endpoint.host = value.substr(0, colon_pos);
    endpoint.port = parse_unsigned<std::uint16_t>(value.substr(colon_pos + 1), "endpoint port");
}

// Config validation
void Config::validate() const {
    if (server.port == 0) {
        throw std::runtime_error("Configuration error: server.port must be non-zero");
    }
    if (server.bind_address.empty()) {
        throw std::runtime_error("Configuration error: server.bind_address cannot be empty");
    }
    if (server.max_message_bytes == 0) {
        throw std::runtime_error("Configuration error: server.max_message_bytes must be non-zero");
    }

    if (cache.enabled && cache.max_size_mb == 0) {
        throw std::runtime_error("Configuration error: cache.max_size_mb must be non-zero when cache is enabled");
    }
    if (cache.enabled && cache.ttl_seconds == 0) {
        throw std::runtime_error("Configuration error: cache.ttl_seconds must be non-zero when cache is enabled");
    }

    if (circuit_breaker.failure_threshold == 0) {
        throw std::runtime_error("Configuration error: circuit_breaker.failure_threshold must be non-zero");
    }
    if (circuit_breaker.success_threshold == 0) {
        throw std::runtime_error("Configuration error: circuit_breaker.success_threshold must be non-zero");
    }
    if (circuit_breaker.half_open_max_calls == 0) {
        throw std::runtime_error("Configuration error: circuit_breaker.half_open_max_calls must be non-zero");
    }

    if (retry.max_attempts == 0) {
        throw std::runtime_error("Configuration error: retry.max_attempts must be at least 1");
    }
    if (retry.min_wait_seconds < 0.0 || retry.max_wait_seconds < retry.min_wait_seconds) {
        throw std::runtime_error("Configuration error: retry waits must satisfy 0 <= min_wait_seconds <= max_wait_seconds");
    }
    if (retry.multiplier < 1.0) {
        throw std::runtime_error("Configuration error: retry.multiplier must be >= 1");
    }

    for (const auto& [name, endpoint] : {std::pair{"synthesis", &synthesis},
                                          std::pair{"transcription", &transcription}}) {
        if (endpoint->host.empty()) {
            throw std::runtime_error(std::string("Configuration error: ") + name + ".host cannot be empty");
        }
        if (endpoint->port == 0) {
            throw std::runtime_error(std::string("Configuration error: ") + name + ".port must be non-zero");
        }
        if (endpoint->path.empty() || endpoint->path.front() != '/') {
            throw std::runtime_error(std::string("Configuration error: ") + name + ".path must start with '/'");
        }
        if (endpoint->timeout_ms == 0) {
            throw std::runtime_error(std::string("Configuration error: ") + name + ".timeout_ms must be non-zero");
        }
    }

    if (audio.target_dbfs > 0.0) {
        throw std::runtime_error("Configuration error: audio.target_dbfs must be <= 0");
    }
    if (audio.compress && audio.compress_ratio < 1.0) {
        throw std::runtime_error("Configuration error: audio.compress_ratio must be >= 1");
    }

    if (!util::Logger::parse_level(logging.level)) {
        throw std::runtime_error("Configuration error: logging.level is not a valid level: " + logging.level);
    }

    VOXRELAY_LOG_DEBUG(util::log_component::Config, "Configuration validated successfully");
}

// ConfigManager implementation
ConfigManager::ConfigManager() = default;
ConfigManager::~ConfigManager() = default;

bool ConfigManager::load(int argc, char* argv[]) {
    std::lock_guard<std::mutex> lock(config_mutex_);

    // Start with defaults
    config_ = Config{};

    // First pass: look for --help or --config
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);

        if (arg == "--help" || arg == "-h") {
            print_help(argv[0]);
            return false;
        }

        if (auto value = option_value(argc, argv, i, "--config", "-c")) {
            config_path_ = *value;
        }
    }

    if (!config_path_.empty()) {
        load_from_file(config_path_);
    }

    apply_environment_overrides();

    // Highest precedence
    apply_cli_overrides(argc, argv);

    config_.validate();

    VOXRELAY_LOG_INFO(util::log_component::Config, "Configuration loaded successfully");
    return true;
}

Config ConfigManager::get_config() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_;
}

void ConfigManager::reload() {
    std::vector<ConfigReloadCallback> callbacks;
    Config reloaded;
    {
        std::lock_guard<std::mutex> lock(config_mutex_);

        if (config_path_.empty()) {
            VOXRELAY_LOG_WARN(util::log_component::Config, "No configuration file specified, reload skipped");
            return;
        }

        VOXRELAY_LOG_INFO(util::log_component::Config, "Reloading configuration from {}", config_path_.string());

        auto previous = config_;
        try {
            load_from_file(config_path_);
            apply_environment_overrides();
            reapply_cli_overrides();
            config_.validate();
        } catch (const std::exception& e) {
            VOXRELAY_LOG_ERROR(util::log_component::Config, "Configuration reload failed, keeping current settings: {}", e.what());
            config_ = previous;
            return;
        }

        reloaded = config_;
        callbacks = reload_callbacks_;
    }

    VOXRELAY_LOG_INFO(util::log_component::Config, "Configuration reloaded, notifying {} listeners", callbacks.size());
    for (const auto& callback : callbacks) {
        callback(reloaded);
    }
}

void ConfigManager::on_reload(ConfigReloadCallback callback) {
    std::lock_guard<std::mutex> lock(config_mutex_);
    reload_callbacks_.push_back(std::move(callback));
}

std::filesystem::path ConfigManager::get_config_path() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_path_;
}

void ConfigManager::print_help(const char* program_name) {
    std::cout << "VOXRELAY - Realtime Voice Gateway\n"
              << "\n"
              << "Usage: " << program_name << " [OPTIONS]\n"
              << "\n"
              << "Options:\n"
              << "  -h, --help                 Show this help message and exit\n"
              << "  -c, --config FILE          Path to JSON configuration file\n"
              << "  -p, --port PORT            Server port (default: 8000)\n"
              << "  -t, --threads NUM          Number of I/O threads (default: CPU cores)\n"
              << "  -w, --workers NUM          Number of pipeline workers (default: 2x CPU cores)\n"
              << "  -b, --bind ADDRESS         Bind address (default: 0.0.0.0)\n"
              << "  --synthesis HOST:PORT      Synthesis backend\n"
              << "  --transcription HOST:PORT  Transcription backend\n"
              << "  --log-level LEVEL          Log level (trace/debug/info/warn/error/off)\n"
              << "  --no-cache                 Disable the audio cache\n"
              << "\n"
              << "Environment Variables:\n"
              << "  VOXRELAY_CONFIG                   Path to configuration file\n"
              << "  VOXRELAY_PORT                     Server port\n"
              << "  VOXRELAY_THREADS                  Number of I/O threads\n"
              << "  VOXRELAY_WORKER_THREADS           Number of pipeline workers\n"
              << "  VOXRELAY_BIND                     Bind address\n"
              << "  VOXRELAY_CACHE_ENABLED            Enable/disable cache (true/false)\n"
              << "  VOXRELAY_CACHE_SIZE_MB            Cache size in MB\n"
              << "  VOXRELAY_CACHE_TTL                Cache TTL in seconds\n"
              << "  VOXRELAY_BREAKER_THRESHOLD        Failures before the breaker opens\n"
              << "  VOXRELAY_BREAKER_RECOVERY         Seconds before a half-open probe\n"
              << "  VOXRELAY_RETRY_MAX_ATTEMPTS       Synthesis attempts per request\n"
              << "  VOXRELAY_SYNTHESIS                Synthesis backend (host:port)\n"
              << "  VOXRELAY_SYNTHESIS_API_KEY        Synthesis API key\n"
              << "  VOXRELAY_TRANSCRIPTION            Transcription backend (host:port)\n"
              << "  VOXRELAY_TRANSCRIPTION_API_KEY    Transcription API key\n"
              << "  VOXRELAY_TARGET_DBFS              Normalization target in dBFS\n"
              << "  VOXRELAY_LOG_LEVEL                Log level\n"
              << "  VOXRELAY_LOG_FILE                 Log file path (stdout if not set)\n"
              << "\n"
              << "Configuration Precedence (highest to lowest):\n"
              << "  1. Command-line arguments\n"
              << "  2. Environment variables\n"
              << "  3. Configuration file\n"
              << "  4. Default values\n"
              << "\n"
              << "Configuration File Format (JSON):\n"
              << "  {\n"
              << "    \"server\": {\"port\": 8000, \"threads\": 4, \"worker_threads\": 8},\n"
              << "    \"cache\": {\"enabled\": true, \"max_size_mb\": 512, \"ttl_seconds\": 3600},\n"
              << "    \"circuit_breaker\": {\"failure_threshold\": 5, \"recovery_timeout_seconds\": 60,\n"
              << "                        \"success_threshold\": 2, \"half_open_max_calls\": 1},\n"
              << "    \"retry\": {\"max_attempts\": 3, \"min_wait_seconds\": 1, \"multiplier\": 2,\n"
              << "              \"max_wait_seconds\": 10},\n"
              << "    \"synthesis\": {\"host\": \"127.0.0.1\", \"port\": 8001, \"path\": \"/v1/synthesize\",\n"
              << "                  \"timeout_ms\": 30000, \"api_key\": \"...\"},\n"
              << "    \"transcription\": {\"host\": \"127.0.0.1\", \"port\": 8002, \"path\": \"/v1/transcribe\"},\n"
              << "    \"audio\": {\"post_process\": true, \"target_dbfs\": -20, \"compress\": false},\n"
              << "    \"logging\": {\"level\": \"info\", \"file\": \"\"}\n"
              << "  }\n"
              << "\n"
              << "Send SIGHUP to reload the configuration file (log level applies at runtime).\n";
}

void ConfigManager::load_from_file(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        throw std::runtime_error("Configuration file not found: " + path.string());
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open configuration file: " + path.string());
    }

    try {
        nlohmann::json j = nlohmann::json::parse(file);
        config_ = j.get<Config>();
        VOXRELAY_LOG_DEBUG(util::log_component::Config, "Loaded configuration from {}", path.string());
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Invalid JSON in configuration file: " + std::string(e.what()));
    }
}

void ConfigManager::apply_environment_overrides() {
    if (config_path_.empty()) {
        if (auto env = get_env("VOXRELAY_CONFIG")) {
            config_path_ = *env;
            if (!config_path_.empty()) {
                load_from_file(config_path_);
            }
        }
    }

    // Server settings
    if (auto env = get_env("VOXRELAY_PORT")) {
        config_.server.port = parse_unsigned<std::uint16_t>(*env, "VOXRELAY_PORT");
    }
    if (auto env = get_env("VOXRELAY_THREADS")) {
        config_.server.threads = parse_unsigned<std::size_t>(*env, "VOXRELAY_THREADS");
    }
    if (auto env = get_env("VOXRELAY_WORKER_THREADS")) {
        config_.server.worker_threads = parse_unsigned<std::size_t>(*env, "VOXRELAY_WORKER_THREADS");
    }
    if (auto env = get_env("VOXRELAY_BIND")) {
        config_.server.bind_address = *env;
    }

    // Cache settings
    if (auto env = get_env("VOXRELAY_CACHE_ENABLED")) {
        config_.cache.enabled = parse_bool(*env);
    }
    if (auto env = get_env("VOXRELAY_CACHE_SIZE_MB")) {
        config_.cache.max_size_mb = parse_unsigned<std::size_t>(*env, "VOXRELAY_CACHE_SIZE_MB");
    }
    if (auto env = get_env("VOXRELAY_CACHE_TTL")) {
        config_.cache.ttl_seconds = parse_unsigned<std::uint32_t>(*env, "VOXRELAY_CACHE_TTL");
    }

    // Resilience
    if (auto env = get_env("VOXRELAY_BREAKER_THRESHOLD")) {
        config_.circuit_breaker.failure_threshold =
            parse_unsigned<std::uint32_t>(*env, "VOXRELAY_BREAKER_THRESHOLD");
    }
    if (auto env = get_env("VOXRELAY_BREAKER_RECOVERY")) {
        config_.circuit_breaker.recovery_timeout_seconds =
            parse_unsigned<std::uint32_t>(*env, "VOXRELAY_BREAKER_RECOVERY");
    }
    if (auto env = get_env("VOXRELAY_RETRY_MAX_ATTEMPTS")) {
        config_.retry.max_attempts = parse_unsigned<std::uint32_t>(*env, "VOXRELAY_RETRY_MAX_ATTEMPTS");
    }

    // Backends
    if (auto env = get_env("VOXRELAY_SYNTHESIS")) {
        parse_host_port(*env, config_.synthesis);
    }
    if (auto env = get_env("VOXRELAY_SYNTHESIS_API_KEY")) {
        config_.synthesis.api_key = *env;
    }
    if (auto env = get_env("VOXRELAY_TRANSCRIPTION")) {
        parse_host_port(*env, config_.transcription);
    }
    if (auto env = get_env("VOXRELAY_TRANSCRIPTION_API_KEY")) {
        config_.transcription.api_key = *env;
    }

    // Audio
    if (auto env = get_env("VOXRELAY_TARGET_DBFS")) {
        config_.audio.target_dbfs = parse_double(*env, "VOXRELAY_TARGET_DBFS");
    }

    // Logging settings
    if (auto env = get_env("VOXRELAY_LOG_LEVEL")) {
        config_.logging.level = *env;
    }
    if (auto env = get_env("VOXRELAY_LOG_FILE")) {
        config_.logging.file = *env;
    }
}

void ConfigManager::apply_cli_overrides(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);

        if (option_value(argc, argv, i, "--config", "-c")) {
            continue;
        }

        if (auto value = option_value(argc, argv, i, "--port", "-p")) {
            cli_port_ = parse_unsigned<std::uint16_t>(*value, "--port");
        } else if (auto value = option_value(argc, argv, i, "--threads", "-t")) {
            cli_threads_ = parse_unsigned<std::size_t>(*value, "--threads");
        } else if (auto value = option_value(argc, argv, i, "--workers", "-w")) {
            cli_worker_threads_ = parse_unsigned<std::size_t>(*value, "--workers");
        } else if (auto value = option_value(argc, argv, i, "--bind", "-b")) {
            cli_bind_address_ = *value;
        } else if (auto value = option_value(argc, argv, i, "--synthesis")) {
            cli_synthesis_ = *value;
        } else if (auto value = option_value(argc, argv, i, "--transcription")) {
            cli_transcription_ = *value;
        } else if (auto value = option_value(argc, argv, i, "--log-level")) {
            cli_log_level_ = *value;
        } else if (arg == "--no-cache") {
            cli_no_cache_ = true;
        }

        // Unknown argument (not an error, might be handled elsewhere)
    }

    reapply_cli_overrides();
}

void ConfigManager::reapply_cli_overrides() {
    if (cli_port_) config_.server.port = *cli_port_;
    if (cli_threads_) config_.server.threads = *cli_threads_;
    if (cli_worker_threads_) config_.server.worker_threads = *cli_worker_threads_;
    if (cli_bind_address_) config_.server.bind_address = *cli_bind_address_;
    if (cli_synthesis_) parse_host_port(*cli_synthesis_, config_.synthesis);
    if (cli_transcription_) parse_host_port(*cli_transcription_, config_.transcription);
    if (cli_log_level_) config_.logging.level = *cli_log_level_;
    if (cli_no_cache_) config_.cache.enabled = false;
}

std::optional<std::string> ConfigManager::get_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value) {
        return std::string(value);
    }
    return std::nullopt;
}

} // namespace voxrelay::config
