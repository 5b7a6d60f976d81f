/**
 * VOXRELAY - Realtime Voice Gateway
 * HTTP Synthesis Backend implementation
 */

#include "backend/http_synthesis.hpp"

#include "audio/post_processor.hpp"
#include "pipeline/errors.hpp"
#include "util/base64.hpp"
#include "util/logger.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>

namespace voxrelay::backend {

using util::log_component::Backend;

HttpSynthesisBackend::HttpSynthesisBackend(EndpointConfig config)
    : client_(std::move(config), "synthesis")
{
}

SynthesisResult HttpSynthesisBackend::synthesize(const std::string& text) {
    nlohmann::json body = {{"text", text}};

    VOXRELAY_LOG_DEBUG(Backend, "synthesis: {} chars", text.size());
    auto response = client_.post(body.dump(), "application/json");
    return parse_response(response);
}

SynthesisResult HttpSynthesisBackend::parse_response(const HttpResult& response) {
    SynthesisResult result;

    if (response.content_type.rfind("application/json", 0) == 0) {
        auto j = nlohmann::json::parse(response.body, nullptr, false);
        if (j.is_discarded() || !j.is_object() || !j.contains("audio") || !j["audio"].is_string()) {
            throw pipeline::PermanentBackendError("synthesis backend returned malformed JSON");
        }
        auto audio = util::base64::decode(j["audio"].get<std::string>());
        if (!audio) {
            throw pipeline::PermanentBackendError("synthesis backend returned invalid base64 audio");
        }
        result.audio = std::move(*audio);
        if (auto it = j.find("duration"); it != j.end() && it->is_number()) {
            result.duration = it->get<double>();
        }
    } else {
        result.audio = response.body;
        auto header = response.header("X-Audio-Duration");
        if (!header.empty()) {
            char* end = nullptr;
            double parsed = std::strtod(header.c_str(), &end);
            if (end != header.c_str()) {
                result.duration = parsed;
            }
        }
    }

    if (result.audio.empty()) {
        throw pipeline::PermanentBackendError("synthesis backend returned no audio");
    }

    if (result.duration <= 0.0) {
        if (auto wav = audio::parse_wav(result.audio)) {
            result.duration = wav->duration_seconds();
        }
    }
    if (result.duration < 0.0) {
        result.duration = 0.0;
    }

    return result;
}

} // namespace voxrelay::backend
