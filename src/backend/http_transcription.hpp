/**
 * VOXRELAY - Realtime Voice Gateway
 * HTTP Transcription Backend - Speech-to-text over HTTP
 *
 * Request:  POST raw audio (application/octet-stream), ?language=xx when hinted
 * Response: JSON {"text", "language", "language_probability", "duration",
 *           "segments": [{"start", "end", "text", "confidence" | "avg_logprob"}]}
 */

#ifndef VOXRELAY_BACKEND_HTTP_TRANSCRIPTION_HPP
#define VOXRELAY_BACKEND_HTTP_TRANSCRIPTION_HPP

#include "backend/http_client.hpp"
#include "backend/interfaces.hpp"

namespace voxrelay::backend {

class HttpTranscriptionBackend final : public TranscriptionBackend {
public:
    explicit HttpTranscriptionBackend(EndpointConfig config);

    TranscriptionResult transcribe(const std::string& audio,
                                   const std::optional<std::string>& language_hint) override;

    /**
     * @throws pipeline::PermanentBackendError on a malformed body
     */
    static TranscriptionResult parse_response(const std::string& body);

private:
    HttpClient client_;
};

} // namespace voxrelay::backend

#endif // VOXRELAY_BACKEND_HTTP_TRANSCRIPTION_HPP
