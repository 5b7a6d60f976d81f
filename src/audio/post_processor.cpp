/**
 * VOXRELAY - Realtime Voice Gateway
 * Post Processor - Implementation
 */

#include "audio/post_processor.hpp"

#include "util/logger.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <limits>

namespace voxrelay::audio {

using util::log_component::Audio;

namespace {

constexpr double full_scale = 32768.0;
constexpr std::uint16_t pcm_format = 1;

std::uint16_t read_u16(const std::string& buf, std::size_t offset) {
    return static_cast<std::uint16_t>(static_cast<unsigned char>(buf[offset])) |
           static_cast<std::uint16_t>(static_cast<unsigned char>(buf[offset + 1]) << 8);
}

std::uint32_t read_u32(const std::string& buf, std::size_t offset) {
    return static_cast<std::uint32_t>(read_u16(buf, offset)) |
           (static_cast<std::uint32_t>(read_u16(buf, offset + 2)) << 16);
}

std::int16_t read_sample(const std::string& buf, std::size_t offset) {
    return static_cast<std::int16_t>(read_u16(buf, offset));
}

void write_sample(std::string& buf, std::size_t offset, std::int16_t sample) {
    auto value = static_cast<std::uint16_t>(sample);
    buf[offset] = static_cast<char>(value & 0xFF);
    buf[offset + 1] = static_cast<char>((value >> 8) & 0xFF);
}

std::int16_t clip(double value) {
    value = std::round(value);
    value = std::clamp(value,
                       static_cast<double>(std::numeric_limits<std::int16_t>::min()),
                       static_cast<double>(std::numeric_limits<std::int16_t>::max()));
    return static_cast<std::int16_t>(value);
}

double to_db(double amplitude) {
    return 20.0 * std::log10(amplitude);
}

double from_db(double db) {
    return std::pow(10.0, db / 20.0);
}

} // namespace

double WavInfo::duration_seconds() const {
    auto bytes_per_second = static_cast<double>(sample_rate) * channels * (bits_per_sample / 8);
    return bytes_per_second > 0.0 ? static_cast<double>(data_size) / bytes_per_second : 0.0;
}

std::optional<WavInfo> parse_wav(const std::string& audio) {
    if (audio.size() < 12 ||
        std::memcmp(audio.data(), "RIFF", 4) != 0 ||
        std::memcmp(audio.data() + 8, "WAVE", 4) != 0) {
        return std::nullopt;
    }

    WavInfo info;
    bool have_format = false;
    std::size_t offset = 12;

    while (offset + 8 <= audio.size()) {
        const char* id = audio.data() + offset;
        std::size_t chunk_size = read_u32(audio, offset + 4);
        std::size_t body = offset + 8;

        if (std::memcmp(id, "fmt ", 4) == 0) {
            if (chunk_size < 16 || body + 16 > audio.size()) {
                return std::nullopt;
            }
            if (read_u16(audio, body) != pcm_format) {
                return std::nullopt;
            }
            info.channels = read_u16(audio, body + 2);
            info.sample_rate = read_u32(audio, body + 4);
            info.bits_per_sample = read_u16(audio, body + 14);
            if (info.bits_per_sample != 16 || info.channels == 0) {
                return std::nullopt;
            }
            have_format = true;
        } else if (std::memcmp(id, "data", 4) == 0) {
            if (!have_format) {
                return std::nullopt;
            }
            info.data_offset = body;
            // Streamed WAVs may carry a placeholder size; clamp to what arrived
            info.data_size = std::min(chunk_size, audio.size() - body);
            info.data_size -= info.data_size % 2;
            return info;
        }

        // Chunks are word-aligned
        offset = body + chunk_size + (chunk_size % 2);
    }

    return std::nullopt;
}

std::optional<double> rms_dbfs(const std::string& audio) {
    auto info = parse_wav(audio);
    if (!info || info->data_size == 0) {
        return std::nullopt;
    }

    double sum_squares = 0.0;
    std::size_t count = info->data_size / 2;
    for (std::size_t i = 0; i < count; ++i) {
        double sample = read_sample(audio, info->data_offset + i * 2);
        sum_squares += sample * sample;
    }

    double rms = std::sqrt(sum_squares / static_cast<double>(count));
    if (rms <= 0.0) {
        return std::nullopt;
    }
    return to_db(rms / full_scale);
}

WavPostProcessor::WavPostProcessor(const PostProcessorConfig& config)
    : config_(config)
{
    VOXRELAY_LOG_INFO(Audio, "Audio post-processor initialized: target={:.1f} dBFS, compress={}",
                      config_.target_dbfs, config_.compress);
}

std::string WavPostProcessor::normalize(const std::string& audio) const {
    auto info = parse_wav(audio);
    if (!info) {
        VOXRELAY_LOG_DEBUG(Audio, "Audio is not 16-bit PCM WAV, passing through ({} bytes)", audio.size());
        return audio;
    }

    auto current = rms_dbfs(audio);
    if (!current) {
        VOXRELAY_LOG_DEBUG(Audio, "Silent audio, passing through");
        return audio;
    }

    std::string output = audio;
    const double gain = from_db(config_.target_dbfs - *current);
    const double threshold = from_db(config_.compress_threshold_db) * full_scale;
    const bool compress = config_.compress && config_.compress_ratio > 1.0;
    const std::size_t count = info->data_size / 2;

    for (std::size_t i = 0; i < count; ++i) {
        std::size_t offset = info->data_offset + i * 2;
        double sample = read_sample(output, offset) * gain;

        if (compress) {
            double magnitude = std::abs(sample);
            if (magnitude > threshold) {
                double over_db = to_db(magnitude / threshold);
                double reduced = threshold * from_db(over_db / config_.compress_ratio);
                sample = sample < 0.0 ? -reduced : reduced;
            }
        }

        write_sample(output, offset, clip(sample));
    }

    VOXRELAY_LOG_DEBUG(Audio, "Audio normalized: {:.1f} dBFS -> {:.1f} dBFS (gain: {:.1f} dB)",
                       *current, config_.target_dbfs, config_.target_dbfs - *current);
    return output;
}

} // namespace voxrelay::audio
