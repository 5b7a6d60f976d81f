/**
 * VOXRELAY - Realtime Voice Gateway
 * Message Codec - Implementation
 */

#include "pipeline/message_codec.hpp"

#include "pipeline/errors.hpp"
#include "util/base64.hpp"

#include <cmath>
#include <variant>

namespace voxrelay::pipeline {

using json = nlohmann::json;

namespace {

/**
 * Optional string field; absent and null read as empty
 */
std::string string_field(const json& message, const char* name) {
    auto it = message.find(name);
    if (it == message.end() || it->is_null()) {
        return {};
    }
    if (!it->is_string()) {
        throw ValidationError("Invalid message format");
    }
    return it->get<std::string>();
}

json segments_json(const std::vector<backend::TranscriptSegment>& segments) {
    json array = json::array();
    for (const auto& segment : segments) {
        array.push_back({
            {"start", segment.start},
            {"end", segment.end},
            {"text", segment.text},
            {"confidence", segment.confidence}
        });
    }
    return array;
}

} // namespace

PipelineRequest parse_request(std::string_view frame) {
    json message = json::parse(frame.begin(), frame.end(), nullptr, false);
    if (message.is_discarded() || !message.is_object()) {
        throw ValidationError("Invalid JSON");
    }

    auto type_it = message.find("type");
    std::string type = (type_it != message.end() && type_it->is_string())
        ? type_it->get<std::string>()
        : std::string{};

    if (type == "text") {
        return SynthesisRequest{string_field(message, "text")};
    }

    if (type == "audio") {
        TranscriptionRequest request;
        auto encoded = string_field(message, "audio");
        if (!encoded.empty()) {
            auto decoded = util::base64::decode(encoded);
            if (!decoded) {
                throw ValidationError("Invalid audio encoding");
            }
            request.audio = std::move(*decoded);
        }
        auto language = string_field(message, "language");
        if (!language.empty()) {
            request.language = std::move(language);
        }
        return request;
    }

    return UnknownRequest{std::move(type)};
}

json to_json(const backend::Sentiment& sentiment) {
    return {
        {"polarity", sentiment.polarity},
        {"subjectivity", sentiment.subjectivity},
        {"label", sentiment.label}
    };
}

json to_json(const PipelineResponse& response) {
    return std::visit(overloaded{
        [](const AudioResponse& audio) -> json {
            return {
                {"type", "audio"},
                {"audio", util::base64::encode(audio.audio)},
                {"duration", audio.duration},
                {"latency_ms", audio.latency.count()},
                {"cached", audio.cached},
                {"sentiment", to_json(audio.sentiment)}
            };
        },
        [](const TranscriptResponse& transcript) -> json {
            return {
                {"type", "transcript"},
                {"text", transcript.text},
                {"language", transcript.language},
                {"language_probability", transcript.language_probability},
                {"duration", transcript.duration},
                {"segments", segments_json(transcript.segments)},
                {"latency_ms", transcript.latency.count()},
                {"sentiment", to_json(transcript.sentiment)}
            };
        },
        [](const FailureResponse& failure) -> json {
            return {
                {"type", "error"},
                {"message", failure.message}
            };
        }
    }, response);
}

std::string serialize_response(const PipelineResponse& response) {
    return to_json(response).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

json to_json(const HealthStatus& health) {
    return {
        {"status", health.cache_reachable ? "healthy" : "degraded"},
        {"cache_reachable", health.cache_reachable},
        {"circuit_breaker", std::string(breaker::to_string(health.breaker_state))}
    };
}

json stats_report(const util::StatsSnapshot& snapshot,
                  const cache::AudioCacheStats& cache,
                  const breaker::BreakerStatus& breaker) {
    json report = snapshot.to_json();

    report["cache_stats"] = {
        {"hits", cache.hits},
        {"misses", cache.misses},
        {"writes", cache.writes},
        {"store_errors", cache.store_errors},
        {"hit_rate", std::round(cache.hit_rate() * 10000.0) / 100.0},
        {"reduction_percentage", std::round(cache.reduction_percentage() * 100.0) / 100.0},
        {"entries", cache.store.entries},
        {"size_bytes", cache.store.size_bytes},
        {"max_size_bytes", cache.store.max_size_bytes},
        {"evictions", cache.store.evictions},
        {"expired", cache.store.expired}
    };

    report["circuit_breaker"] = {
        {"name", breaker.name},
        {"state", std::string(breaker::to_string(breaker.state))},
        {"failures", breaker.failure_count},
        {"successes", breaker.success_count},
        {"rejected", breaker.rejected_count},
        {"time_until_retry_ms", breaker.time_until_retry.count()}
    };

    return report;
}

} // namespace voxrelay::pipeline
