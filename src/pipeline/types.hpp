/**
 * VOXRELAY - Realtime Voice Gateway
 * Pipeline Types - Request and response sum types
 *
 * Both are closed std::variants and every consumer visits them
 * exhaustively, so adding a kind is a compile-time change.
 */

#ifndef VOXRELAY_PIPELINE_TYPES_HPP
#define VOXRELAY_PIPELINE_TYPES_HPP

#include "backend/interfaces.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace voxrelay::pipeline {

// Requests

struct SynthesisRequest {
    std::string text;
};

struct TranscriptionRequest {
    std::string audio;                      // Raw audio bytes
    std::optional<std::string> language;    // Optional language hint
};

/**
 * A message whose kind is not one the pipeline serves
 */
struct UnknownRequest {
    std::string type;
};

using PipelineRequest = std::variant<SynthesisRequest, TranscriptionRequest, UnknownRequest>;

// Responses

struct AudioResponse {
    std::string audio;
    double duration{0.0};
    bool cached{false};
    backend::Sentiment sentiment;
    std::chrono::milliseconds latency{0};
};

struct TranscriptResponse {
    std::string text;
    std::string language;
    double language_probability{0.0};
    double duration{0.0};
    std::vector<backend::TranscriptSegment> segments;
    backend::Sentiment sentiment;
    std::chrono::milliseconds latency{0};
};

struct FailureResponse {
    std::string message;
};

using PipelineResponse = std::variant<AudioResponse, TranscriptResponse, FailureResponse>;

/**
 * Visitor helper for std::visit over the sum types
 */
template <typename... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};

template <typename... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

/**
 * Wire name of a request kind, for logging
 */
inline std::string_view request_kind(const PipelineRequest& request) {
    return std::visit(overloaded{
        [](const SynthesisRequest&) -> std::string_view { return "text"; },
        [](const TranscriptionRequest&) -> std::string_view { return "audio"; },
        [](const UnknownRequest& unknown) -> std::string_view { return unknown.type; }
    }, request);
}

inline std::string_view response_kind(const PipelineResponse& response) {
    return std::visit(overloaded{
        [](const AudioResponse&) -> std::string_view { return "audio"; },
        [](const TranscriptResponse&) -> std::string_view { return "transcript"; },
        [](const FailureResponse&) -> std::string_view { return "error"; }
    }, response);
}

} // namespace voxrelay::pipeline

#endif // VOXRELAY_PIPELINE_TYPES_HPP
