#include "base64_decoder.h"
#include "../pipeline_errors.h"

#include <cstddef>
#include <cstdint>

namespace voicecast {
namespace audio {

namespace {

constexpr uint8_t kInvalid = 0xFF;

// 0xFF marks bytes outside the standard alphabet; '=' is handled separately.
constexpr uint8_t kDecodeTable[256] = {
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,   62, 0xFF, 0xFF, 0xFF,   63,
      52,   53,   54,   55,   56,   57,   58,   59,   60,   61, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0xFF,    0,    1,    2,    3,    4,    5,    6,    7,    8,    9,   10,   11,   12,   13,   14,
      15,   16,   17,   18,   19,   20,   21,   22,   23,   24,   25, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0xFF,   26,   27,   28,   29,   30,   31,   32,   33,   34,   35,   36,   37,   38,   39,   40,
      41,   42,   43,   44,   45,   46,   47,   48,   49,   50,   51, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
};

bool is_ascii_whitespace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\f' || c == '\r';
}

} // namespace

RawByteBuffer decode_base64(const std::string& text) {
    std::string compact;
    compact.reserve(text.size());
    for (char c : text) {
        if (!is_ascii_whitespace(c)) {
            compact.push_back(c);
        }
    }

    // Up to two '=' may terminate a complete final group.
    if (compact.size() % 4 == 0) {
        for (int i = 0; i < 2 && !compact.empty() && compact.back() == '='; ++i) {
            compact.pop_back();
        }
    }

    if (compact.size() % 4 == 1) {
        throw MalformedEncodingError("base64 payload has a truncated final group (" +
                                     std::to_string(compact.size()) + " significant characters)");
    }

    RawByteBuffer out;
    out.reserve((compact.size() / 4) * 3 + 2);

    uint32_t accumulator = 0;
    int bits = 0;
    for (std::size_t i = 0; i < compact.size(); ++i) {
        const uint8_t value = kDecodeTable[static_cast<unsigned char>(compact[i])];
        if (value == kInvalid) {
            throw MalformedEncodingError("invalid base64 character at offset " + std::to_string(i));
        }
        accumulator = (accumulator << 6) | value;
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<uint8_t>((accumulator >> bits) & 0xFF));
        }
    }
    // Leftover bits of a partial group carry no data and are dropped.
    return out;
}

PCM16Buffer pcm16_from_bytes(const RawByteBuffer& bytes, int sample_rate, int channels) {
    if (channels < 1) {
        throw ContractViolation("pcm16_from_bytes requires channels >= 1");
    }
    if (sample_rate <= 0) {
        throw ContractViolation("pcm16_from_bytes requires sample_rate > 0");
    }
    if (bytes.size() % 2 != 0) {
        throw MalformedEncodingError("PCM16 payload has an odd byte count (" + std::to_string(bytes.size()) + ")");
    }

    PCM16Buffer pcm;
    pcm.channel_count = channels;
    pcm.sample_rate = sample_rate;
    const std::size_t sample_count = bytes.size() / 2;
    if (sample_count % static_cast<std::size_t>(channels) != 0) {
        throw MalformedEncodingError("PCM16 payload of " + std::to_string(sample_count) +
                                     " samples is not a whole number of " + std::to_string(channels) + "-channel frames");
    }
    pcm.samples.resize(sample_count);
    for (std::size_t i = 0; i < sample_count; ++i) {
        const uint16_t lo = bytes[i * 2];
        const uint16_t hi = bytes[i * 2 + 1];
        pcm.samples[i] = static_cast<int16_t>(static_cast<uint16_t>(lo | (hi << 8)));
    }
    return pcm;
}

} // namespace audio
} // namespace voicecast
