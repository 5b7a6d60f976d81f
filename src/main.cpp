/**
 * VOXRELAY - Realtime Voice Gateway
 *
 * A C++20 WebSocket gateway that fronts speech synthesis and transcription
 * backends with caching, retries and a circuit breaker.
 */

#include "audio/post_processor.hpp"
#include "audio/sentiment.hpp"
#include "backend/http_synthesis.hpp"
#include "backend/http_transcription.hpp"
#include "breaker/circuit_breaker.hpp"
#include "cache/audio_cache.hpp"
#include "cache/lru_cache.hpp"
#include "config/config.hpp"
#include "pipeline/dispatcher.hpp"
#include "retry/backoff.hpp"
#include "server/connection.hpp"
#include "server/routes.hpp"
#include "server/server.hpp"
#include "server/ws_session.hpp"
#include "util/logger.hpp"
#include "util/stats.hpp"

#include <boost/asio.hpp>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>
#include <memory>
#include <thread>

namespace asio = boost::asio;

namespace {

constexpr std::string_view log_tag = voxrelay::util::log_component::Server;

voxrelay::util::LogConfig to_log_config(const voxrelay::config::LogSettings& settings) {
    voxrelay::util::LogConfig log_config;
    log_config.level = voxrelay::util::Logger::parse_level(settings.level)
                           .value_or(voxrelay::util::LogLevel::Info);
    log_config.file_path = settings.file;
    log_config.max_file_size_mb = settings.max_file_size_mb;
    log_config.max_files = settings.max_files;
    log_config.enable_console = settings.enable_console;
    log_config.enable_colors = settings.enable_colors;
    return log_config;
}

std::chrono::milliseconds to_millis(double seconds) {
    return std::chrono::milliseconds(static_cast<std::int64_t>(std::llround(seconds * 1000.0)));
}

voxrelay::backend::EndpointConfig to_endpoint(const voxrelay::config::EndpointSettings& settings) {
    voxrelay::backend::EndpointConfig endpoint;
    endpoint.host = settings.host;
    endpoint.port = settings.port;
    endpoint.path = settings.path;
    endpoint.timeout = std::chrono::milliseconds(settings.timeout_ms);
    endpoint.api_key = settings.api_key;
    endpoint.api_key_header = settings.api_key_header;
    return endpoint;
}

std::size_t resolve_threads(std::size_t configured, std::size_t per_core) {
    if (configured > 0) {
        return configured;
    }
    return per_core * std::max(1u, std::thread::hardware_concurrency());
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace voxrelay;

    try {
        config::ConfigManager config_manager;
        if (!config_manager.load(argc, argv)) {
            // --help was requested
            return 0;
        }

        auto config = config_manager.get_config();
        util::Logger::init(to_log_config(config.logging));

        VOXRELAY_LOG_INFO(log_tag, "VOXRELAY Realtime Voice Gateway v0.1.0");

        // Shared counters and the cache layer
        auto stats = std::make_shared<util::Stats>();

        cache::LruCacheConfig store_config;
        store_config.max_size_bytes = config.cache.max_size_mb * 1024 * 1024;
        auto store = std::make_shared<cache::LruCache>(store_config);

        cache::AudioCacheConfig cache_config;
        cache_config.enabled = config.cache.enabled;
        cache_config.ttl = std::chrono::seconds(config.cache.ttl_seconds);
        auto audio_cache = std::make_shared<cache::AudioCache>(store, *stats, cache_config);

        // Resilience for the synthesis backend
        breaker::CircuitBreakerConfig breaker_config;
        breaker_config.failure_threshold = config.circuit_breaker.failure_threshold;
        breaker_config.recovery_timeout = std::chrono::seconds(config.circuit_breaker.recovery_timeout_seconds);
        breaker_config.success_threshold = config.circuit_breaker.success_threshold;
        breaker_config.half_open_max_calls = config.circuit_breaker.half_open_max_calls;
        auto circuit_breaker = std::make_shared<breaker::CircuitBreaker>(breaker_config);

        circuit_breaker->on_state_change([](breaker::BreakerState old_state, breaker::BreakerState new_state) {
            VOXRELAY_LOG_WARN(util::log_component::Breaker, "Synthesis breaker: {} -> {}",
                              breaker::to_string(old_state), breaker::to_string(new_state));
        });

        retry::BackoffConfig backoff_config;
        backoff_config.min_wait = to_millis(config.retry.min_wait_seconds);
        backoff_config.multiplier = config.retry.multiplier;
        backoff_config.max_wait = to_millis(config.retry.max_wait_seconds);
        backoff_config.max_attempts = config.retry.max_attempts;

        pipeline::PipelineContext context;
        context.stats = stats;
        context.cache = audio_cache;
        context.breaker = circuit_breaker;
        context.backoff = retry::BackoffPolicy(backoff_config);
        context.synthesis = std::make_shared<backend::HttpSynthesisBackend>(to_endpoint(config.synthesis));
        context.transcription = std::make_shared<backend::HttpTranscriptionBackend>(to_endpoint(config.transcription));
        context.sentiment = std::make_shared<audio::LexiconSentimentScorer>();

        if (config.audio.post_process) {
            audio::PostProcessorConfig post_config;
            post_config.target_dbfs = config.audio.target_dbfs;
            post_config.compress = config.audio.compress;
            post_config.compress_threshold_db = config.audio.compress_threshold_db;
            post_config.compress_ratio = config.audio.compress_ratio;
            context.post_processor = std::make_shared<audio::WavPostProcessor>(post_config);
        }

        VOXRELAY_LOG_INFO(log_tag, "Synthesis backend: {}:{}{} (timeout={}ms)",
                          config.synthesis.host, config.synthesis.port,
                          config.synthesis.path, config.synthesis.timeout_ms);
        VOXRELAY_LOG_INFO(log_tag, "Transcription backend: {}:{}{} (timeout={}ms)",
                          config.transcription.host, config.transcription.port,
                          config.transcription.path, config.transcription.timeout_ms);

        pipeline::PipelineDispatcher dispatcher(std::move(context));

        // Pipeline work blocks on backends; it runs here, never on I/O threads
        const auto worker_count = resolve_threads(config.server.worker_threads, 2);
        asio::thread_pool workers(worker_count);

        server::SessionServices services{dispatcher, *stats, workers, config.server.max_message_bytes};

        server::ServerConfig server_config;
        server_config.port = config.server.port;
        server_config.thread_count = resolve_threads(config.server.threads, 1);
        server_config.bind_address = config.server.bind_address;

        VOXRELAY_LOG_INFO(log_tag, "Configuration: port={}, io_threads={}, workers={}, bind={}",
                          server_config.port, server_config.thread_count, worker_count,
                          server_config.bind_address);

        config_manager.on_reload([](const config::Config& reloaded) {
            auto level = util::Logger::parse_level(reloaded.logging.level);
            if (level) {
                util::Logger::instance().set_level(*level);
                VOXRELAY_LOG_INFO(util::log_component::Config, "Log level set to {}",
                                  reloaded.logging.level);
            }
        });

        server::Server server(server_config);

        auto routes = server::make_routes(dispatcher);
        server.start(
            [routes, &services](asio::ip::tcp::socket socket) {
                server::handle_connection(
                    std::move(socket), routes,
                    [&services](boost::beast::tcp_stream stream,
                                boost::beast::http::request<boost::beast::http::string_body> request,
                                std::string client_ip) {
                        server::start_ws_session(std::move(stream), std::move(request),
                                                 std::move(client_ip), services);
                    });
            },
            [&config_manager]() {
                config_manager.reload();
            }
        );

        VOXRELAY_LOG_INFO(log_tag, "Listening on {}:{}, WebSocket endpoint /ws/voice",
                          server_config.bind_address, server.get_port());

        // Blocks until SIGINT/SIGTERM
        server.wait();

        // Let in-flight pipeline work finish before the dispatcher goes away
        workers.join();

        VOXRELAY_LOG_INFO(log_tag, "Server stopped gracefully");
        util::Logger::instance().shutdown();
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
