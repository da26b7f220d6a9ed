#include "wav_encoder.h"
#include "base64_decoder.h"
#include "../pipeline_errors.h"

#include <cstdint>
#include <cstring>
#include <limits>
#include <string>

namespace voicecast {
namespace audio {

namespace {

constexpr uint16_t kWaveFormatPcm = 1;
constexpr uint32_t kFmtChunkSize = 16;

void write_tag(uint8_t* dst, const char* tag) {
    std::memcpy(dst, tag, 4);
}

void write_le16(uint8_t* dst, uint16_t value) {
    dst[0] = static_cast<uint8_t>(value & 0xFF);
    dst[1] = static_cast<uint8_t>((value >> 8) & 0xFF);
}

void write_le32(uint8_t* dst, uint32_t value) {
    dst[0] = static_cast<uint8_t>(value & 0xFF);
    dst[1] = static_cast<uint8_t>((value >> 8) & 0xFF);
    dst[2] = static_cast<uint8_t>((value >> 16) & 0xFF);
    dst[3] = static_cast<uint8_t>((value >> 24) & 0xFF);
}

} // namespace

WavBlob encode_wav(const PCM16Buffer& pcm) {
    if (pcm.channel_count < 1) {
        throw ContractViolation("encode_wav requires channel_count >= 1");
    }
    if (pcm.sample_rate <= 0) {
        throw ContractViolation("encode_wav requires sample_rate > 0");
    }
    if (pcm.channel_count > std::numeric_limits<uint16_t>::max() / 2) {
        throw ContractViolation("encode_wav channel_count " + std::to_string(pcm.channel_count) + " exceeds the WAV header range");
    }
    if (pcm.samples.size() % static_cast<std::size_t>(pcm.channel_count) != 0) {
        throw ContractViolation("encode_wav sample count is not a whole number of frames");
    }

    const uint64_t data_size = static_cast<uint64_t>(pcm.samples.size()) * 2;
    if (data_size + 36 > std::numeric_limits<uint32_t>::max()) {
        throw ContractViolation("encode_wav data of " + std::to_string(data_size) + " bytes exceeds the RIFF size limit");
    }

    const uint16_t channels = static_cast<uint16_t>(pcm.channel_count);
    const uint16_t block_align = static_cast<uint16_t>(channels * 2);
    const uint64_t byte_rate = static_cast<uint64_t>(pcm.sample_rate) * block_align;
    if (byte_rate > std::numeric_limits<uint32_t>::max()) {
        throw ContractViolation("encode_wav byte rate exceeds the WAV header range");
    }

    WavBlob blob(WAV_HEADER_SIZE + static_cast<std::size_t>(data_size));
    uint8_t* header = blob.data();

    // RIFF header
    write_tag(header + 0, "RIFF");
    write_le32(header + 4, static_cast<uint32_t>(36 + data_size));
    write_tag(header + 8, "WAVE");

    // fmt sub-chunk
    write_tag(header + 12, "fmt ");
    write_le32(header + 16, kFmtChunkSize);
    write_le16(header + 20, kWaveFormatPcm);
    write_le16(header + 22, channels);
    write_le32(header + 24, static_cast<uint32_t>(pcm.sample_rate));
    write_le32(header + 28, static_cast<uint32_t>(byte_rate));
    write_le16(header + 32, block_align);
    write_le16(header + 34, static_cast<uint16_t>(PCM16_BITS_PER_SAMPLE));

    // data sub-chunk
    write_tag(header + 36, "data");
    write_le32(header + 40, static_cast<uint32_t>(data_size));

    uint8_t* out = blob.data() + WAV_HEADER_SIZE;
    for (std::size_t i = 0; i < pcm.samples.size(); ++i) {
        write_le16(out + i * 2, static_cast<uint16_t>(pcm.samples[i]));
    }
    return blob;
}

WavBlob encode_wav_from_bytes(const RawByteBuffer& pcm_bytes, int sample_rate, int channels) {
    return encode_wav(pcm16_from_bytes(pcm_bytes, sample_rate, channels));
}

} // namespace audio
} // namespace voicecast
