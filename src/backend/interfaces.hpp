/**
 * VOXRELAY - Realtime Voice Gateway
 * Collaborator Interfaces - Contracts the pipeline consumes
 *
 * Backends throw pipeline::TransientBackendError or
 * pipeline::PermanentBackendError; scorers and post-processors do not fail.
 */

#ifndef VOXRELAY_BACKEND_INTERFACES_HPP
#define VOXRELAY_BACKEND_INTERFACES_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace voxrelay::backend {

struct SynthesisResult {
    std::string audio;      // Encoded audio bytes
    double duration{0.0};   // Seconds
};

struct TranscriptSegment {
    double start{0.0};
    double end{0.0};
    std::string text;
    double confidence{0.0};
};

struct TranscriptionResult {
    std::string text;
    std::string language;
    double language_probability{0.0};
    double duration{0.0};
    std::vector<TranscriptSegment> segments;
};

/**
 * Sentiment of a piece of text
 */
struct Sentiment {
    double polarity{0.0};       // [-1, 1]
    double subjectivity{0.0};   // [0, 1]
    std::string label{"neutral"};
};

class SynthesisBackend {
public:
    virtual ~SynthesisBackend() = default;

    virtual SynthesisResult synthesize(const std::string& text) = 0;
};

class TranscriptionBackend {
public:
    virtual ~TranscriptionBackend() = default;

    virtual TranscriptionResult transcribe(const std::string& audio,
                                           const std::optional<std::string>& language_hint) = 0;
};

class SentimentScorer {
public:
    virtual ~SentimentScorer() = default;

    virtual Sentiment score(std::string_view text) const = 0;
};

class AudioPostProcessor {
public:
    virtual ~AudioPostProcessor() = default;

    /**
     * Produce the final audio that is cached and sent to clients
     */
    virtual std::string normalize(const std::string& audio) const = 0;
};

} // namespace voxrelay::backend

#endif // VOXRELAY_BACKEND_INTERFACES_HPP
