/**
 * VOXRELAY - Realtime Voice Gateway
 * Message Codec - JSON wire format for WebSocket frames and HTTP reports
 *
 * Inbound:  {"type":"text","text":"..."}
 *           {"type":"audio","audio":"<base64>","language":"en"}
 * Outbound: {"type":"audio",...} | {"type":"transcript",...} | {"type":"error","message":"..."}
 *
 * Audio bytes travel base64-encoded in both directions.
 */

#ifndef VOXRELAY_PIPELINE_MESSAGE_CODEC_HPP
#define VOXRELAY_PIPELINE_MESSAGE_CODEC_HPP

#include "breaker/circuit_breaker.hpp"
#include "cache/audio_cache.hpp"
#include "pipeline/dispatcher.hpp"
#include "pipeline/types.hpp"
#include "util/stats.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace voxrelay::pipeline {

/**
 * Parse one client frame into a request
 *
 * A well-formed frame with an unrecognized "type" yields UnknownRequest.
 *
 * @throws ValidationError "Invalid JSON" if the frame is not a JSON object,
 *         "Invalid message format" if a known kind has mistyped fields,
 *         "Invalid audio encoding" if the audio is not valid base64
 */
PipelineRequest parse_request(std::string_view frame);

/**
 * Serialize a response frame
 */
std::string serialize_response(const PipelineResponse& response);

nlohmann::json to_json(const PipelineResponse& response);

nlohmann::json to_json(const backend::Sentiment& sentiment);

nlohmann::json to_json(const HealthStatus& health);

/**
 * Full /stats report: counters, cache layer detail and breaker status
 */
nlohmann::json stats_report(const util::StatsSnapshot& snapshot,
                            const cache::AudioCacheStats& cache,
                            const breaker::BreakerStatus& breaker);

} // namespace voxrelay::pipeline

#endif // VOXRELAY_PIPELINE_MESSAGE_CODEC_HPP
