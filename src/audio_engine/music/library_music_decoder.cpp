/**
 * @file library_music_decoder.cpp
 * @brief Implementation of WAV parsing, MP3 decoding (LAME hip) and resampling.
 */
#include "library_music_decoder.h"
#include "../pipeline_errors.h"
#include "../utils/cpp_logger.h"

#include <lame/lame.h>

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <limits>
#include <memory>
#include <string>
#include <type_traits>
#include <vector>

namespace voicecast {
namespace audio {

namespace {

constexpr uint16_t kWaveFormatPcm = 0x0001;
constexpr uint16_t kWaveFormatIeeeFloat = 0x0003;
constexpr uint16_t kWaveFormatExtensible = 0xFFFE;

// hip_decode1 returns at most one MPEG frame (1152 samples per channel).
constexpr std::size_t kHipPcmCapacity = 4608;

uint16_t read_le16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t read_le32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) |
           (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

int32_t read_le24_signed(const uint8_t* p) {
    int32_t v = static_cast<int32_t>(static_cast<uint32_t>(p[0]) |
                                     (static_cast<uint32_t>(p[1]) << 8) |
                                     (static_cast<uint32_t>(p[2]) << 16));
    if (v & 0x00800000) {
        v |= static_cast<int32_t>(0xFF000000); // sign extend
    }
    return v;
}

bool has_tag(const RawByteBuffer& bytes, std::size_t offset, const char* tag) {
    return bytes.size() >= offset + 4 && std::memcmp(bytes.data() + offset, tag, 4) == 0;
}

/** Returns the offset of the first byte after a leading ID3v2 tag, or 0. */
std::size_t skip_id3v2(const RawByteBuffer& bytes) {
    if (bytes.size() < 10 || bytes[0] != 'I' || bytes[1] != 'D' || bytes[2] != '3') {
        return 0;
    }
    // Tag size is a 28-bit syncsafe integer excluding the 10-byte header.
    const std::size_t size = (static_cast<std::size_t>(bytes[6] & 0x7F) << 21) |
                             (static_cast<std::size_t>(bytes[7] & 0x7F) << 14) |
                             (static_cast<std::size_t>(bytes[8] & 0x7F) << 7) |
                             static_cast<std::size_t>(bytes[9] & 0x7F);
    const bool has_footer = (bytes[5] & 0x10) != 0;
    const std::size_t end = 10 + size + (has_footer ? 10 : 0);
    return std::min(end, bytes.size());
}

bool is_mpeg_frame_sync(const RawByteBuffer& bytes, std::size_t offset) {
    return bytes.size() >= offset + 2 && bytes[offset] == 0xFF && (bytes[offset + 1] & 0xE0) == 0xE0;
}

struct WavFormat {
    uint16_t format_tag = 0;
    uint16_t channels = 0;
    uint32_t sample_rate = 0;
    uint16_t bits_per_sample = 0;
};

float decode_wav_sample(const uint8_t* p, const WavFormat& fmt) {
    if (fmt.format_tag == kWaveFormatIeeeFloat) {
        if (fmt.bits_per_sample == 32) {
            uint32_t raw = read_le32(p);
            float value;
            std::memcpy(&value, &raw, sizeof(value));
            return value;
        }
        uint64_t raw = static_cast<uint64_t>(read_le32(p)) | (static_cast<uint64_t>(read_le32(p + 4)) << 32);
        double value;
        std::memcpy(&value, &raw, sizeof(value));
        return static_cast<float>(value);
    }
    switch (fmt.bits_per_sample) {
        case 8:
            return (static_cast<int>(p[0]) - 128) / 128.0f;
        case 16:
            return static_cast<float>(static_cast<int16_t>(read_le16(p))) / 32768.0f;
        case 24:
            return static_cast<float>(read_le24_signed(p)) / 8388608.0f;
        default:
            return static_cast<float>(static_cast<double>(static_cast<int32_t>(read_le32(p))) / 2147483648.0);
    }
}

} // namespace

MusicContainer detect_music_container(const RawByteBuffer& bytes) {
    if (has_tag(bytes, 0, "RIFF") && has_tag(bytes, 8, "WAVE")) {
        return MusicContainer::WAV;
    }
    const std::size_t audio_start = skip_id3v2(bytes);
    if (audio_start > 0 || is_mpeg_frame_sync(bytes, 0)) {
        return MusicContainer::MP3;
    }
    return MusicContainer::UNKNOWN;
}

FloatAudioBuffer decode_wav_file(const RawByteBuffer& bytes, std::size_t max_frames) {
    if (!(has_tag(bytes, 0, "RIFF") && has_tag(bytes, 8, "WAVE"))) {
        throw MusicDecodeError("Music file is not a RIFF/WAVE file");
    }

    WavFormat fmt;
    bool have_fmt = false;
    std::size_t data_offset = 0;
    std::size_t data_size = 0;
    bool have_data = false;

    std::size_t offset = 12;
    while (offset + 8 <= bytes.size()) {
        const uint8_t* chunk = bytes.data() + offset;
        const std::size_t chunk_size = read_le32(chunk + 4);
        const std::size_t body = offset + 8;

        if (std::memcmp(chunk, "fmt ", 4) == 0) {
            if (chunk_size < 16 || body + 16 > bytes.size()) {
                throw MusicDecodeError("WAV fmt chunk is truncated");
            }
            const uint8_t* f = bytes.data() + body;
            fmt.format_tag = read_le16(f);
            fmt.channels = read_le16(f + 2);
            fmt.sample_rate = read_le32(f + 4);
            fmt.bits_per_sample = read_le16(f + 14);
            if (fmt.format_tag == kWaveFormatExtensible) {
                // cbSize(2) validBits(2) channelMask(4) then the SubFormat GUID
                if (chunk_size < 40 || body + 40 > bytes.size()) {
                    throw MusicDecodeError("WAV extensible fmt chunk is truncated");
                }
                fmt.format_tag = read_le16(f + 24);
            }
            have_fmt = true;
        } else if (std::memcmp(chunk, "data", 4) == 0) {
            data_offset = body;
            data_size = std::min(chunk_size, bytes.size() - body);
            have_data = true;
            break;
        }

        // Chunks are word aligned.
        offset = body + chunk_size + (chunk_size & 1);
    }

    if (!have_fmt) {
        throw MusicDecodeError("WAV file has no fmt chunk");
    }
    if (!have_data) {
        throw MusicDecodeError("WAV file has no data chunk");
    }
    if (fmt.channels == 0 || fmt.sample_rate == 0) {
        throw MusicDecodeError("WAV file declares zero channels or a zero sample rate");
    }
    if (fmt.sample_rate > static_cast<uint32_t>(std::numeric_limits<int>::max())) {
        throw MusicDecodeError("WAV file declares an out of range sample rate (" +
                               std::to_string(fmt.sample_rate) + " Hz)");
    }

    const bool pcm_ok = fmt.format_tag == kWaveFormatPcm &&
                        (fmt.bits_per_sample == 8 || fmt.bits_per_sample == 16 ||
                         fmt.bits_per_sample == 24 || fmt.bits_per_sample == 32);
    const bool float_ok = fmt.format_tag == kWaveFormatIeeeFloat &&
                          (fmt.bits_per_sample == 32 || fmt.bits_per_sample == 64);
    if (!pcm_ok && !float_ok) {
        throw MusicDecodeError("Unsupported WAV encoding (format " + std::to_string(fmt.format_tag) +
                               ", " + std::to_string(fmt.bits_per_sample) + " bits)");
    }

    const std::size_t bytes_per_sample = fmt.bits_per_sample / 8;
    const std::size_t bytes_per_frame = bytes_per_sample * fmt.channels;
    const std::size_t frames = data_size / bytes_per_frame;
    if (frames > max_frames) {
        throw MusicDecodeError("WAV file is too long (" + std::to_string(frames) + " frames)");
    }

    FloatAudioBuffer out = FloatAudioBuffer::silent(fmt.channels, frames, static_cast<int>(fmt.sample_rate));
    const uint8_t* p = bytes.data() + data_offset;
    for (std::size_t i = 0; i < frames; ++i) {
        for (std::size_t c = 0; c < fmt.channels; ++c) {
            out.channels[c][i] = decode_wav_sample(p, fmt);
            p += bytes_per_sample;
        }
    }

    LOG_CPP_DEBUG("[MusicDecoder] WAV: %u ch, %u Hz, %u bits, %zu frames",
                  static_cast<unsigned>(fmt.channels), static_cast<unsigned>(fmt.sample_rate),
                  static_cast<unsigned>(fmt.bits_per_sample), frames);
    return out;
}

FloatAudioBuffer decode_mp3_file(const RawByteBuffer& bytes, std::size_t feed_chunk_bytes, std::size_t max_frames) {
    std::unique_ptr<std::remove_pointer<hip_t>::type, decltype(&hip_decode_exit)> hip(hip_decode_init(), &hip_decode_exit);
    if (!hip) {
        throw MusicDecodeError("hip_decode_init() failed");
    }

    std::vector<short> pcm_left(kHipPcmCapacity);
    std::vector<short> pcm_right(kHipPcmCapacity);
    mp3data_struct mp3data;
    std::memset(&mp3data, 0, sizeof(mp3data));

    std::vector<float> left;
    std::vector<float> right;
    int channels = 0;
    int sample_rate = 0;
    bool stream_error = false;

    // hip buffers partial frames internally, so the input may be fed in slices.
    RawByteBuffer scratch(bytes.begin() + static_cast<std::ptrdiff_t>(skip_id3v2(bytes)), bytes.end());
    const std::size_t chunk_bytes = sanitize_mp3_feed_chunk_bytes(feed_chunk_bytes);

    std::size_t offset = 0;
    while (offset < scratch.size() && !stream_error) {
        const std::size_t len = std::min(chunk_bytes, scratch.size() - offset);
        unsigned char* input = scratch.data() + offset;
        offset += len;

        int ret = hip_decode1_headers(hip.get(), input, len, pcm_left.data(), pcm_right.data(), &mp3data);
        while (ret != 0) {
            if (ret < 0) {
                stream_error = true;
                break;
            }
            if (!mp3data.header_parsed || mp3data.stereo < 1 || mp3data.samplerate <= 0) {
                throw MusicDecodeError("MP3 decoder produced samples without a valid header");
            }
            if (channels == 0) {
                channels = mp3data.stereo >= 2 ? 2 : 1;
                sample_rate = mp3data.samplerate;
            }
            const std::size_t produced = static_cast<std::size_t>(std::min<int>(ret, static_cast<int>(kHipPcmCapacity)));
            for (std::size_t i = 0; i < produced; ++i) {
                left.push_back(static_cast<float>(pcm_left[i]) / 32768.0f);
                if (channels == 2) {
                    right.push_back(static_cast<float>(pcm_right[i]) / 32768.0f);
                }
            }
            if (left.size() > max_frames) {
                throw MusicDecodeError("MP3 file is too long (more than " + std::to_string(max_frames) + " frames)");
            }
            // Drain frames still buffered inside hip.
            ret = hip_decode1_headers(hip.get(), input, 0, pcm_left.data(), pcm_right.data(), &mp3data);
        }
    }

    if (left.empty()) {
        throw MusicDecodeError(stream_error ? "MP3 stream could not be decoded"
                                            : "MP3 stream contains no decodable frames");
    }
    if (stream_error) {
        LOG_CPP_WARNING("[MusicDecoder] MP3 decode stopped early after %zu frames (corrupt or trailing data).", left.size());
    }

    FloatAudioBuffer out;
    out.sample_rate = sample_rate;
    out.frame_count = left.size();
    out.channels.push_back(std::move(left));
    if (channels == 2) {
        right.resize(out.frame_count, 0.0f);
        out.channels.push_back(std::move(right));
    }

    LOG_CPP_DEBUG("[MusicDecoder] MP3: %d ch, %d Hz, %zu frames", channels, sample_rate, out.frame_count);
    return out;
}

LibraryMusicDecoder::LibraryMusicDecoder(std::shared_ptr<PipelineSettings> settings)
    : settings_(resolve_settings(settings)),
      resampler_(settings_->decoder_tuning.resampler_quality) {}

FloatAudioBuffer LibraryMusicDecoder::decode(const RawByteBuffer& encoded, int target_sample_rate) const {
    if (target_sample_rate <= 0) {
        throw ContractViolation("LibraryMusicDecoder::decode requires target_sample_rate > 0");
    }
    if (encoded.empty()) {
        throw MusicDecodeError("Music file is empty");
    }

    const DecoderTuning& tuning = settings_->decoder_tuning;
    const std::size_t max_frames = sanitize_max_decoded_frames(tuning.max_decoded_frames);
    FloatAudioBuffer native;
    switch (detect_music_container(encoded)) {
        case MusicContainer::WAV:
            native = decode_wav_file(encoded, max_frames);
            break;
        case MusicContainer::MP3:
            native = decode_mp3_file(encoded, tuning.mp3_feed_chunk_bytes, max_frames);
            break;
        case MusicContainer::UNKNOWN:
            throw MusicDecodeError("Unable to decode audio data: unrecognized music file format");
    }

    if (native.frame_count == 0) {
        throw MusicDecodeError("Music file contains no audio frames");
    }

    FloatAudioBuffer resampled = resampler_.resample(native, target_sample_rate);
    if (resampled.frame_count == 0) {
        throw MusicDecodeError("Music file is too short to resample");
    }
    LOG_CPP_INFO("[MusicDecoder] Decoded music: %d ch, %zu frames @ %d Hz (native %d Hz)",
                 resampled.channel_count(), resampled.frame_count, resampled.sample_rate, native.sample_rate);
    return resampled;
}

} // namespace audio
} // namespace voicecast
