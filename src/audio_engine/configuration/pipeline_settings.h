#ifndef VOICECAST_PIPELINE_SETTINGS_H
#define VOICECAST_PIPELINE_SETTINGS_H

#include <cstddef>
#include <memory>
#include <string>

#include "../audio_constants.h"

namespace voicecast {
namespace audio {

inline constexpr long kDefaultConnectTimeoutMs = 10000;
inline constexpr long kDefaultTotalTimeoutMs = 60000;
inline constexpr std::size_t kDefaultMaxDownloadBytes = 64 * 1024 * 1024;
inline constexpr std::size_t kDefaultMp3FeedChunkBytes = 4096;
inline constexpr std::size_t kDefaultMaxDecodedFrames = 48000 * 60 * 30; // 30 minutes at 48kHz

class PipelineSettings;

/**
 * @enum ResamplerQuality
 * @brief Converter used when decoded music is brought to the mix rate.
 * @details Mirrors the libsamplerate converter types without leaking its header.
 */
enum class ResamplerQuality {
    SINC_BEST,
    SINC_MEDIUM,
    SINC_FASTEST,
    ZERO_ORDER_HOLD,
    LINEAR
};

struct SpeechFormat {
    int sample_rate = SPEECH_SAMPLE_RATE;
    int channels = SPEECH_CHANNELS;
};

struct MixerTuning {
    int target_sample_rate = SPEECH_SAMPLE_RATE;
    int target_channels = MIX_OUTPUT_CHANNELS;
    float default_music_gain = DEFAULT_MUSIC_GAIN;
    float max_music_gain = 1.0f;                  // The UI slider stops at 0.5
};

struct FetchTuning {
    long connect_timeout_ms = kDefaultConnectTimeoutMs;
    long total_timeout_ms = kDefaultTotalTimeoutMs;  // 0 disables the overall deadline
    std::size_t max_download_bytes = kDefaultMaxDownloadBytes;
    bool follow_redirects = true;
    long max_redirects = 5;
    std::string user_agent = "voicecast-audio-engine/1.0";
};

struct DecoderTuning {
    ResamplerQuality resampler_quality = ResamplerQuality::SINC_MEDIUM;
    std::size_t mp3_feed_chunk_bytes = kDefaultMp3FeedChunkBytes;
    std::size_t max_decoded_frames = kDefaultMaxDecodedFrames;
};

class PipelineSettings {
public:
    SpeechFormat speech;
    MixerTuning mixer_tuning;
    FetchTuning fetch_tuning;
    DecoderTuning decoder_tuning;
};

inline long sanitize_timeout_ms(long configured, long fallback) {
    return configured >= 0 ? configured : fallback;
}

inline std::size_t sanitize_max_download_bytes(std::size_t configured) {
    return configured > 0 ? configured : kDefaultMaxDownloadBytes;
}

inline std::size_t sanitize_mp3_feed_chunk_bytes(std::size_t configured) {
    return configured > 0 ? configured : kDefaultMp3FeedChunkBytes;
}

inline std::size_t sanitize_max_decoded_frames(std::size_t configured) {
    return configured > 0 ? configured : kDefaultMaxDecodedFrames;
}

inline int sanitize_sample_rate(int configured, int fallback) {
    return configured > 0 ? configured : fallback;
}

inline std::shared_ptr<PipelineSettings> resolve_settings(const std::shared_ptr<PipelineSettings>& settings) {
    return settings ? settings : std::make_shared<PipelineSettings>();
}

} // namespace audio
} // namespace voicecast

#endif // VOICECAST_PIPELINE_SETTINGS_H
