/**
 * VOXRELAY - Realtime Voice Gateway
 * HTTP Synthesis Backend - Text-to-speech over HTTP
 *
 * Request:  POST {"text": "..."} (application/json)
 * Response: either raw audio (audio/* content type, duration in the
 *           X-Audio-Duration header or derived from a WAV header), or
 *           JSON {"audio": "<base64>", "duration": 1.25}
 */

#ifndef VOXRELAY_BACKEND_HTTP_SYNTHESIS_HPP
#define VOXRELAY_BACKEND_HTTP_SYNTHESIS_HPP

#include "backend/http_client.hpp"
#include "backend/interfaces.hpp"

namespace voxrelay::backend {

class HttpSynthesisBackend final : public SynthesisBackend {
public:
    explicit HttpSynthesisBackend(EndpointConfig config);

    SynthesisResult synthesize(const std::string& text) override;

    /**
     * Decode a 2xx response body
     *
     * @throws pipeline::PermanentBackendError if the body is not usable audio
     */
    static SynthesisResult parse_response(const HttpResult& response);

private:
    HttpClient client_;
};

} // namespace voxrelay::backend

#endif // VOXRELAY_BACKEND_HTTP_SYNTHESIS_HPP
