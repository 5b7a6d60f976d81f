/**
 * VOXRELAY - Realtime Voice Gateway
 * Base64 - Implementation
 */

#include "util/base64.hpp"

#include <array>
#include <cstdint>

namespace voxrelay::util::base64 {

namespace {

constexpr char encode_table[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

constexpr std::uint8_t invalid = 0xFF;

constexpr std::array<std::uint8_t, 256> make_decode_table() {
    std::array<std::uint8_t, 256> table{};
    for (auto& value : table) {
        value = invalid;
    }
    for (std::uint8_t i = 0; i < 64; ++i) {
        table[static_cast<unsigned char>(encode_table[i])] = i;
    }
    return table;
}

constexpr auto decode_table = make_decode_table();

} // namespace

std::size_t encoded_size(std::size_t input_length) {
    return ((input_length + 2) / 3) * 4;
}

std::string encode(std::string_view bytes) {
    std::string result;
    result.reserve(encoded_size(bytes.size()));

    auto byte = [&](std::size_t i) {
        return static_cast<std::uint32_t>(static_cast<unsigned char>(bytes[i]));
    };

    std::size_t i = 0;
    while (i + 3 <= bytes.size()) {
        std::uint32_t triple = (byte(i) << 16) | (byte(i + 1) << 8) | byte(i + 2);
        result += encode_table[(triple >> 18) & 0x3F];
        result += encode_table[(triple >> 12) & 0x3F];
        result += encode_table[(triple >> 6) & 0x3F];
        result += encode_table[triple & 0x3F];
        i += 3;
    }

    std::size_t remaining = bytes.size() - i;
    if (remaining == 1) {
        std::uint32_t value = byte(i) << 16;
        result += encode_table[(value >> 18) & 0x3F];
        result += encode_table[(value >> 12) & 0x3F];
        result += "==";
    } else if (remaining == 2) {
        std::uint32_t value = (byte(i) << 16) | (byte(i + 1) << 8);
        result += encode_table[(value >> 18) & 0x3F];
        result += encode_table[(value >> 12) & 0x3F];
        result += encode_table[(value >> 6) & 0x3F];
        result += '=';
    }

    return result;
}

std::optional<std::string> decode(std::string_view encoded) {
    if (encoded.size() % 4 != 0) {
        return std::nullopt;
    }

    std::string result;
    result.reserve((encoded.size() / 4) * 3);

    for (std::size_t i = 0; i < encoded.size(); i += 4) {
        const bool last = i + 4 == encoded.size();
        const bool pad2 = encoded[i + 2] == '=';
        const bool pad3 = encoded[i + 3] == '=';

        // Padding only in the final quantum, and never "x=y"
        if ((pad2 || pad3) && !last) {
            return std::nullopt;
        }
        if (pad2 && !pad3) {
            return std::nullopt;
        }

        std::uint8_t a = decode_table[static_cast<unsigned char>(encoded[i])];
        std::uint8_t b = decode_table[static_cast<unsigned char>(encoded[i + 1])];
        std::uint8_t c = pad2 ? 0 : decode_table[static_cast<unsigned char>(encoded[i + 2])];
        std::uint8_t d = pad3 ? 0 : decode_table[static_cast<unsigned char>(encoded[i + 3])];

        if (a == invalid || b == invalid || c == invalid || d == invalid) {
            return std::nullopt;
        }

        std::uint32_t triple = (static_cast<std::uint32_t>(a) << 18) |
                               (static_cast<std::uint32_t>(b) << 12) |
                               (static_cast<std::uint32_t>(c) << 6) |
                               static_cast<std::uint32_t>(d);

        result += static_cast<char>((triple >> 16) & 0xFF);
        if (!pad2) {
            result += static_cast<char>((triple >> 8) & 0xFF);
        }
        if (!pad3) {
            result += static_cast<char>(triple & 0xFF);
        }
    }

    return result;
}

} // namespace voxrelay::util::base64
