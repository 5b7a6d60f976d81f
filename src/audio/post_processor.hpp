/**
 * VOXRELAY - Realtime Voice Gateway
 * Post Processor - Loudness normalization for synthesized speech
 *
 * Works on 16-bit PCM WAV (RIFF/WAVE, format tag 1):
 * - RMS gain to a target dBFS (default -20)
 * - Optional static dynamic-range compression above a threshold
 *
 * Anything else (compressed formats, truncated headers, silence) is
 * returned unchanged.
 */

#ifndef VOXRELAY_AUDIO_POST_PROCESSOR_HPP
#define VOXRELAY_AUDIO_POST_PROCESSOR_HPP

#include "backend/interfaces.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace voxrelay::audio {

struct PostProcessorConfig {
    double target_dbfs{-20.0};
    bool compress{false};
    double compress_threshold_db{-20.0};
    double compress_ratio{4.0};
};

/**
 * Location of the PCM payload inside a WAV buffer
 */
struct WavInfo {
    std::uint16_t channels{0};
    std::uint32_t sample_rate{0};
    std::uint16_t bits_per_sample{0};
    std::size_t data_offset{0};
    std::size_t data_size{0};

    double duration_seconds() const;
};

/**
 * Parse a 16-bit PCM WAV header
 *
 * @return Layout, or std::nullopt if the buffer is not 16-bit PCM WAV
 */
std::optional<WavInfo> parse_wav(const std::string& audio);

/**
 * RMS level of a 16-bit PCM WAV in dBFS
 *
 * @return Level, or std::nullopt if unparseable or silent
 */
std::optional<double> rms_dbfs(const std::string& audio);

class WavPostProcessor final : public backend::AudioPostProcessor {
public:
    explicit WavPostProcessor(const PostProcessorConfig& config = {});

    std::string normalize(const std::string& audio) const override;

    const PostProcessorConfig& config() const noexcept { return config_; }

private:
    PostProcessorConfig config_;
};

} // namespace voxrelay::audio

#endif // VOXRELAY_AUDIO_POST_PROCESSOR_HPP
