/**
 * VOXRELAY - Realtime Voice Gateway
 * Pipeline Dispatcher - Routes client requests through cache, breaker and backends
 *
 * Synthesis: validate -> cache lookup -> [miss] breaker(retry(backend))
 *            -> post-process -> cache write -> sentiment
 * Transcription: validate -> backend -> sentiment
 *
 * Every failure comes back as a FailureResponse; handle() never throws.
 * Concurrent misses for the same cache key share one backend call.
 */

#ifndef VOXRELAY_PIPELINE_DISPATCHER_HPP
#define VOXRELAY_PIPELINE_DISPATCHER_HPP

#include "backend/interfaces.hpp"
#include "breaker/circuit_breaker.hpp"
#include "cache/audio_cache.hpp"
#include "cache/cache_key.hpp"
#include "pipeline/types.hpp"
#include "retry/backoff.hpp"
#include "util/clock.hpp"
#include "util/stats.hpp"

#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace voxrelay::pipeline {

/**
 * Shared state and collaborators for all sessions
 *
 * Built once at startup and handed to the dispatcher. The clock and
 * sleeper must outlive the dispatcher.
 */
struct PipelineContext {
    std::shared_ptr<util::Stats> stats;
    std::shared_ptr<cache::AudioCache> cache;
    std::shared_ptr<breaker::CircuitBreaker> breaker;
    retry::BackoffPolicy backoff;

    std::shared_ptr<backend::SynthesisBackend> synthesis;
    std::shared_ptr<backend::TranscriptionBackend> transcription;
    std::shared_ptr<const backend::SentimentScorer> sentiment;
    std::shared_ptr<const backend::AudioPostProcessor> post_processor;  // Optional

    const util::Clock* clock{&util::steady_clock()};
    util::Sleeper* sleeper{&util::thread_sleeper()};
};

/**
 * Readiness report for the health endpoint
 */
struct HealthStatus {
    bool cache_reachable{false};
    breaker::BreakerState breaker_state{breaker::BreakerState::closed};
};

class PipelineDispatcher {
public:
    /**
     * @throws std::invalid_argument if a required collaborator is missing
     */
    explicit PipelineDispatcher(PipelineContext context);

    // Non-copyable
    PipelineDispatcher(const PipelineDispatcher&) = delete;
    PipelineDispatcher& operator=(const PipelineDispatcher&) = delete;

    PipelineResponse handle(const PipelineRequest& request);

    /**
     * Counter snapshot including the current breaker state
     */
    util::StatsSnapshot stats() const;

    HealthStatus health() const;

    cache::AudioCacheStats cache_stats() const;

    breaker::BreakerStatus breaker_status() const;

    /**
     * Force the synthesis breaker back to CLOSED (operator action)
     */
    void reset_breaker();

private:
    PipelineResponse synthesize(const SynthesisRequest& request);
    PipelineResponse transcribe(const TranscriptionRequest& request);
    PipelineResponse reject(const UnknownRequest& request);

    /**
     * Produce audio for a cache miss, joining an in-flight call for the same key
     */
    backend::SynthesisResult produce(const cache::CacheKey& key, const std::string& text);

    /**
     * Backend call under breaker and retry, then post-process and cache
     *
     * Retries run inside the breaker, so an exhausted request is one breaker
     * failure. Half-open trial calls skip the retry loop and reach the backend once.
     */
    backend::SynthesisResult synthesize_and_store(const cache::CacheKey& key,
                                                  const std::string& text);

    backend::Sentiment score(std::string_view text) const;

    std::chrono::milliseconds elapsed_since(util::Clock::time_point start) const;

    FailureResponse fail(std::string message);

    PipelineContext context_;

    std::mutex inflight_mutex_;
    std::unordered_map<cache::CacheKey, std::shared_future<backend::SynthesisResult>,
                       cache::CacheKeyHash> inflight_;
};

} // namespace voxrelay::pipeline

#endif // VOXRELAY_PIPELINE_DISPATCHER_HPP
