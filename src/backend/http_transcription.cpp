/**
 * VOXRELAY - Realtime Voice Gateway
 * HTTP Transcription Backend implementation
 */

#include "backend/http_transcription.hpp"

#include "pipeline/errors.hpp"
#include "util/logger.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>

namespace voxrelay::backend {

using util::log_component::Backend;

namespace {

bool valid_language_code(const std::string& code) {
    return !code.empty() && code.size() <= 16 &&
           std::all_of(code.begin(), code.end(), [](unsigned char c) {
               return std::isalnum(c) || c == '-' || c == '_';
           });
}

} // namespace

HttpTranscriptionBackend::HttpTranscriptionBackend(EndpointConfig config)
    : client_(std::move(config), "transcription")
{
}

TranscriptionResult HttpTranscriptionBackend::transcribe(
    const std::string& audio, const std::optional<std::string>& language_hint) {
    std::string query;
    if (language_hint) {
        if (!valid_language_code(*language_hint)) {
            throw pipeline::ValidationError("Invalid language hint");
        }
        query = "language=" + *language_hint;
    }

    VOXRELAY_LOG_DEBUG(Backend, "transcription: {} bytes, language={}",
                       audio.size(), language_hint.value_or("auto"));
    auto response = client_.post(audio, "application/octet-stream", query);
    return parse_response(response.body);
}

TranscriptionResult HttpTranscriptionBackend::parse_response(const std::string& body) {
    auto j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        throw pipeline::PermanentBackendError("transcription backend returned malformed JSON");
    }

    try {
        TranscriptionResult result;
        result.text = j.value("text", std::string{});
        result.language = j.value("language", std::string{});
        result.language_probability = j.value("language_probability", 0.0);
        result.duration = j.value("duration", 0.0);

        if (auto it = j.find("segments"); it != j.end() && it->is_array()) {
            for (const auto& s : *it) {
                TranscriptSegment segment;
                segment.start = s.value("start", 0.0);
                segment.end = s.value("end", 0.0);
                segment.text = s.value("text", std::string{});
                if (s.contains("confidence")) {
                    segment.confidence = s.at("confidence").get<double>();
                } else if (s.contains("avg_logprob")) {
                    segment.confidence = std::exp(s.at("avg_logprob").get<double>());
                }
                result.segments.push_back(std::move(segment));
            }
        }

        // Whisper-style servers may only return segments
        if (result.text.empty() && !result.segments.empty()) {
            for (const auto& segment : result.segments) {
                if (!result.text.empty()) {
                    result.text += ' ';
                }
                result.text += segment.text;
            }
        }

        return result;
    } catch (const nlohmann::json::exception& e) {
        throw pipeline::PermanentBackendError(
            std::string("transcription backend returned unexpected fields: ") + e.what());
    }
}

} // namespace voxrelay::backend
