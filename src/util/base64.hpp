/**
 * VOXRELAY - Realtime Voice Gateway
 * Base64 - RFC 4648 codec for audio payloads in JSON frames
 */

#ifndef VOXRELAY_UTIL_BASE64_HPP
#define VOXRELAY_UTIL_BASE64_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace voxrelay::util::base64 {

/**
 * Encode raw bytes with the standard alphabet and '=' padding
 */
std::string encode(std::string_view bytes);

/**
 * Decode a padded base64 string
 *
 * @return Decoded bytes, or std::nullopt if the input is not valid base64
 */
std::optional<std::string> decode(std::string_view encoded);

std::size_t encoded_size(std::size_t input_length);

} // namespace voxrelay::util::base64

#endif // VOXRELAY_UTIL_BASE64_HPP
