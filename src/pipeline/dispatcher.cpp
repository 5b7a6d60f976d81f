/**
 * VOXRELAY - Realtime Voice Gateway
 * Pipeline Dispatcher - Implementation
 */

#include "pipeline/dispatcher.hpp"

#include "pipeline/errors.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <stdexcept>
#include <utility>
#include <variant>

namespace voxrelay::pipeline {

using util::log_component::Pipeline;

namespace {

bool is_blank(std::string_view text) {
    return std::all_of(text.begin(), text.end(), [](unsigned char c) {
        return std::isspace(c) != 0;
    });
}

} // namespace

PipelineDispatcher::PipelineDispatcher(PipelineContext context)
    : context_(std::move(context))
{
    if (!context_.stats || !context_.cache || !context_.breaker) {
        throw std::invalid_argument("Pipeline context requires stats, cache and breaker");
    }
    if (!context_.synthesis || !context_.transcription || !context_.sentiment) {
        throw std::invalid_argument("Pipeline context requires synthesis, transcription and sentiment");
    }
    if (!context_.clock || !context_.sleeper) {
        throw std::invalid_argument("Pipeline context requires a clock and a sleeper");
    }

    VOXRELAY_LOG_INFO(Pipeline, "Dispatcher ready: cache={}, retry_attempts={}, post_processing={}",
                      context_.cache->is_enabled() ? "enabled" : "disabled",
                      context_.backoff.max_attempts(),
                      context_.post_processor ? "on" : "off");
}

PipelineResponse PipelineDispatcher::handle(const PipelineRequest& request) {
    return std::visit(overloaded{
        [this](const SynthesisRequest& r) { return synthesize(r); },
        [this](const TranscriptionRequest& r) { return transcribe(r); },
        [this](const UnknownRequest& r) { return reject(r); }
    }, request);
}

PipelineResponse PipelineDispatcher::synthesize(const SynthesisRequest& request) {
    context_.stats->synthesis_request();
    const auto start = context_.clock->now();

    if (is_blank(request.text)) {
        return fail("Empty text");
    }

    try {
        const auto key = cache::generate_cache_key(request.text);

        if (auto entry = context_.cache->get(key)) {
            AudioResponse response;
            response.audio = std::move(entry->audio);
            response.duration = entry->duration;
            response.cached = true;
            response.sentiment = score(request.text);
            response.latency = elapsed_since(start);
            return response;
        }

        auto result = produce(key, request.text);

        AudioResponse response;
        response.audio = std::move(result.audio);
        response.duration = result.duration;
        response.cached = false;
        response.sentiment = score(request.text);
        response.latency = elapsed_since(start);
        return response;

    } catch (const BreakerOpenError& e) {
        VOXRELAY_LOG_WARN(Pipeline, "Synthesis short-circuited: {}", e.what());
        return fail("synthesis unavailable: circuit open");
    } catch (const BackendError& e) {
        VOXRELAY_LOG_ERROR(Pipeline, "Synthesis failed ({}): {}", to_string(e.category()), e.what());
        return fail("synthesis failed: " + std::string(to_string(e.category())) + " backend error");
    } catch (const std::exception& e) {
        VOXRELAY_LOG_ERROR(Pipeline, "Synthesis failed unexpectedly: {}", e.what());
        return fail("synthesis failed: internal error");
    }
}

backend::SynthesisResult PipelineDispatcher::produce(const cache::CacheKey& key,
                                                     const std::string& text) {
    std::promise<backend::SynthesisResult> promise;
    std::shared_future<backend::SynthesisResult> shared;
    bool leader = false;

    {
        std::lock_guard<std::mutex> lock(inflight_mutex_);
        auto it = inflight_.find(key);
        if (it != inflight_.end()) {
            shared = it->second;
        } else {
            shared = promise.get_future().share();
            inflight_.emplace(key, shared);
            leader = true;
        }
    }

    if (!leader) {
        VOXRELAY_LOG_DEBUG(Pipeline, "Joining in-flight synthesis: key={}", key.to_string());
        // Rethrows the leader's failure
        return shared.get();
    }

    try {
        auto result = synthesize_and_store(key, text);
        promise.set_value(result);
        {
            std::lock_guard<std::mutex> lock(inflight_mutex_);
            inflight_.erase(key);
        }
        return result;
    } catch (...) {
        promise.set_exception(std::current_exception());
        {
            std::lock_guard<std::mutex> lock(inflight_mutex_);
            inflight_.erase(key);
        }
        throw;
    }
}

backend::SynthesisResult PipelineDispatcher::synthesize_and_store(const cache::CacheKey& key,
                                                                  const std::string& text) {
    auto result = context_.breaker->execute([&](breaker::Admission admission) {
        // A half-open trial call gets a single attempt; its outcome decides the circuit
        if (admission == breaker::Admission::trial) {
            return context_.synthesis->synthesize(text);
        }
        return context_.backoff.run([&] {
            return context_.synthesis->synthesize(text);
        }, *context_.sleeper, "synthesis");
    });

    if (result.duration < 0.0) {
        result.duration = 0.0;
    }

    if (context_.post_processor) {
        result.audio = context_.post_processor->normalize(result.audio);
    }

    cache::CacheEntry entry;
    entry.key = key;
    entry.audio = result.audio;
    entry.duration = result.duration;
    entry.created_at = std::chrono::system_clock::now();
    entry.ttl = context_.cache->ttl();
    context_.cache->put(key, entry);

    return result;
}

PipelineResponse PipelineDispatcher::transcribe(const TranscriptionRequest& request) {
    context_.stats->transcription_request();
    const auto start = context_.clock->now();

    if (request.audio.empty()) {
        return fail("Empty audio data");
    }

    try {
        auto result = context_.transcription->transcribe(request.audio, request.language);

        TranscriptResponse response;
        response.sentiment = score(result.text);
        response.text = std::move(result.text);
        response.language = std::move(result.language);
        response.language_probability = result.language_probability;
        response.duration = result.duration;
        response.segments = std::move(result.segments);
        response.latency = elapsed_since(start);
        return response;

    } catch (const BackendError& e) {
        VOXRELAY_LOG_ERROR(Pipeline, "Transcription failed ({}): {}", to_string(e.category()), e.what());
        return fail("service error: " + std::string(to_string(e.category())));
    } catch (const ValidationError& e) {
        VOXRELAY_LOG_WARN(Pipeline, "Transcription rejected input: {}", e.what());
        return fail("service error: validation");
    } catch (const std::exception& e) {
        VOXRELAY_LOG_ERROR(Pipeline, "Transcription failed unexpectedly: {}", e.what());
        return fail("service error: internal");
    }
}

PipelineResponse PipelineDispatcher::reject(const UnknownRequest& request) {
    VOXRELAY_LOG_DEBUG(Pipeline, "Unknown message type: '{}'", request.type);
    return fail("Invalid message type");
}

backend::Sentiment PipelineDispatcher::score(std::string_view text) const {
    return context_.sentiment->score(text);
}

std::chrono::milliseconds PipelineDispatcher::elapsed_since(util::Clock::time_point start) const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(context_.clock->now() - start);
}

FailureResponse PipelineDispatcher::fail(std::string message) {
    context_.stats->request_failed();
    return FailureResponse{std::move(message)};
}

util::StatsSnapshot PipelineDispatcher::stats() const {
    auto snapshot = context_.stats->snapshot();
    auto status = context_.breaker->status();
    snapshot.breaker_state = std::string(breaker::to_string(status.state));
    snapshot.breaker_failures = status.failure_count;
    return snapshot;
}

HealthStatus PipelineDispatcher::health() const {
    HealthStatus health;
    health.cache_reachable = context_.cache->reachable();
    health.breaker_state = context_.breaker->state();
    return health;
}

cache::AudioCacheStats PipelineDispatcher::cache_stats() const {
    return context_.cache->stats();
}

breaker::BreakerStatus PipelineDispatcher::breaker_status() const {
    return context_.breaker->status();
}

void PipelineDispatcher::reset_breaker() {
    VOXRELAY_LOG_INFO(Pipeline, "Manual circuit breaker reset requested");
    context_.breaker->reset();
}

} // namespace voxrelay::pipeline
