/**
 * @file audio_types.h
 * @brief Defines core data structures for the audio assembly pipeline.
 * @details Every pipeline stage consumes one of these values and produces a new
 *          one; none of them is mutated once a stage has handed it on.
 */
#ifndef VOICECAST_AUDIO_TYPES_H
#define VOICECAST_AUDIO_TYPES_H

#include <vector>
#include <string>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include "audio_constants.h"

namespace voicecast {
namespace audio {

/** @brief Owned bytes, e.g. a decoded base64 payload or a fetched music file. */
using RawByteBuffer = std::vector<uint8_t>;

/** @brief A finished RIFF/WAVE file: 44-byte header followed by PCM16 data. */
using WavBlob = std::vector<uint8_t>;

/**
 * @struct PCM16Buffer
 * @brief Interleaved signed 16-bit samples tagged with their format.
 * @details `samples.size()` is always a multiple of `channel_count`.
 */
struct PCM16Buffer {
    /** @brief Interleaved samples (L,R,L,R,... for stereo). */
    std::vector<int16_t> samples;
    /** @brief Number of interleaved channels. */
    int channel_count = 1;
    /** @brief Sample rate in Hz. */
    int sample_rate = 0;

    /** @brief Samples per channel. */
    std::size_t frame_count() const {
        return channel_count > 0 ? samples.size() / static_cast<std::size_t>(channel_count) : 0;
    }
};

/**
 * @struct FloatAudioBuffer
 * @brief Planar floating point audio, nominally in [-1.0, 1.0].
 * @details Every entry of `channels` holds exactly `frame_count` samples. Used as
 *          the working representation of the mixer and the music decoder.
 */
struct FloatAudioBuffer {
    /** @brief One sample vector per channel. */
    std::vector<std::vector<float>> channels;
    /** @brief Samples per channel. */
    std::size_t frame_count = 0;
    /** @brief Sample rate in Hz. */
    int sample_rate = 0;

    int channel_count() const { return static_cast<int>(channels.size()); }

    /**
     * @brief Creates a zero-filled buffer.
     * @param channel_count Number of channels.
     * @param frames Samples per channel.
     * @param rate Sample rate in Hz.
     */
    static FloatAudioBuffer silent(int channel_count, std::size_t frames, int rate) {
        FloatAudioBuffer buffer;
        buffer.channels.assign(static_cast<std::size_t>(channel_count > 0 ? channel_count : 0),
                               std::vector<float>(frames, 0.0f));
        buffer.frame_count = frames;
        buffer.sample_rate = rate;
        return buffer;
    }
};

/**
 * @struct MixConfig
 * @brief Parameters of one speech + music mix.
 */
struct MixConfig {
    /** @brief Linear gain applied to the music before summation. */
    float music_gain = DEFAULT_MUSIC_GAIN;
    /** @brief Output sample rate; speech must already be at this rate. */
    int target_sample_rate = SPEECH_SAMPLE_RATE;
    /** @brief Output channel count. */
    int target_channel_count = MIX_OUTPUT_CHANNELS;
};

/**
 * @enum MusicSourceKind
 * @brief Where the background track of an assembly comes from.
 */
enum class MusicSourceKind {
    NONE,       ///< No background music; speech is encoded directly.
    URL,        ///< An http:// or https:// URL.
    LOCAL_FILE, ///< A filesystem path or file:// URL.
    IN_MEMORY   ///< Bytes handed over by the caller (an uploaded file).
};

/**
 * @struct MusicSelection
 * @brief The caller's background music choice for a single assembly.
 */
struct MusicSelection {
    MusicSourceKind kind = MusicSourceKind::NONE;
    /** @brief URL or path for URL / LOCAL_FILE selections. */
    std::string location;
    /** @brief File contents for IN_MEMORY selections. */
    RawByteBuffer data;
    /** @brief Music gain for this assembly. */
    float volume = DEFAULT_MUSIC_GAIN;

    bool has_music() const { return kind != MusicSourceKind::NONE; }

    /**
     * @brief Builds a selection from a UI value.
     * @details An empty string or "none" selects no music, http(s) URLs select a
     *          network track and anything else is treated as a local file.
     */
    static MusicSelection from_value(const std::string& value, float volume = DEFAULT_MUSIC_GAIN);

    /** @brief Builds an IN_MEMORY selection from uploaded bytes. */
    static MusicSelection from_bytes(RawByteBuffer bytes, float volume = DEFAULT_MUSIC_GAIN);

    /** @brief Human readable description for log messages. */
    std::string describe() const;
};

/**
 * @class CancellationToken
 * @brief A flag the caller raises to abandon an in-flight assembly.
 */
class CancellationToken {
public:
    CancellationToken() = default;
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel() { cancelled_.store(true, std::memory_order_release); }
    bool is_cancelled() const { return cancelled_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> cancelled_{false};
};

} // namespace audio
} // namespace voicecast

#endif // VOICECAST_AUDIO_TYPES_H
