/**
 * @file track_mixer.cpp
 * @brief Implementation of the speech and music mixer.
 */
#include "track_mixer.h"
#include "../codec/sample_converter.h"
#include "../pipeline_errors.h"
#include "../utils/cpp_logger.h"

#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace voicecast {
namespace audio {

namespace {

constexpr float kSqrtHalf = 0.7071067811865476f;

void validate_mix_config(const MixConfig& config) {
    if (config.target_sample_rate <= 0) {
        throw ContractViolation("MixConfig.target_sample_rate must be positive");
    }
    if (config.target_channel_count != MIX_OUTPUT_CHANNELS) {
        throw ContractViolation("TrackMixer only renders " + std::to_string(MIX_OUTPUT_CHANNELS) +
                                "-channel output, got " + std::to_string(config.target_channel_count));
    }
    if (!std::isfinite(config.music_gain) || config.music_gain < 0.0f) {
        throw ContractViolation("MixConfig.music_gain must be a finite, non-negative value");
    }
}

} // namespace

FloatAudioBuffer downmix_to_stereo(const FloatAudioBuffer& input) {
    const int in_channels = input.channel_count();
    if (in_channels < 1) {
        throw ContractViolation("downmix_to_stereo requires at least one channel");
    }

    FloatAudioBuffer out = FloatAudioBuffer::silent(2, input.frame_count, input.sample_rate);
    std::vector<float>& left = out.channels[0];
    std::vector<float>& right = out.channels[1];

    switch (in_channels) {
        case 1: // Mono -> Both
            left = input.channels[0];
            right = input.channels[0];
            break;
        case 4: // Quad: FL FR BL BR
            for (std::size_t i = 0; i < input.frame_count; ++i) {
                left[i] = 0.5f * (input.channels[0][i] + input.channels[2][i]);
                right[i] = 0.5f * (input.channels[1][i] + input.channels[3][i]);
            }
            break;
        case 6: // 5.1: FL FR C LFE BL BR, LFE dropped
            for (std::size_t i = 0; i < input.frame_count; ++i) {
                const float center = input.channels[2][i];
                left[i] = input.channels[0][i] + kSqrtHalf * (center + input.channels[4][i]);
                right[i] = input.channels[1][i] + kSqrtHalf * (center + input.channels[5][i]);
            }
            break;
        default: // Stereo, and anything without a defined fold-down: first two channels
            left = input.channels[0];
            right = input.channels[1];
            break;
    }
    return out;
}

TrackMixer::TrackMixer(std::shared_ptr<IMusicDecoder> decoder) : decoder_(std::move(decoder)) {
    if (!decoder_) {
        throw std::invalid_argument("TrackMixer requires a music decoder");
    }
}

PCM16Buffer TrackMixer::mix(const PCM16Buffer& speech, const RawByteBuffer& music, const MixConfig& config) const {
    validate_mix_config(config);
    if (speech.sample_rate != config.target_sample_rate) {
        throw ContractViolation("Speech is at " + std::to_string(speech.sample_rate) +
                                " Hz but the mix target is " + std::to_string(config.target_sample_rate) + " Hz");
    }

    FloatAudioBuffer speech_float = pcm16_to_float(speech);
    FloatAudioBuffer music_float = decoder_->decode(music, config.target_sample_rate);
    FloatAudioBuffer mixed = render(speech_float, music_float, config);
    return float_to_pcm16(mixed);
}

FloatAudioBuffer TrackMixer::render(const FloatAudioBuffer& speech,
                                    const FloatAudioBuffer& music,
                                    const MixConfig& config) {
    validate_mix_config(config);
    if (speech.sample_rate != config.target_sample_rate) {
        throw ContractViolation("Speech is at " + std::to_string(speech.sample_rate) +
                                " Hz but the mix target is " + std::to_string(config.target_sample_rate) + " Hz");
    }
    if (music.sample_rate != config.target_sample_rate) {
        throw ContractViolation("Music is at " + std::to_string(music.sample_rate) +
                                " Hz but the mix target is " + std::to_string(config.target_sample_rate) + " Hz");
    }
    if (music.frame_count == 0 || music.channel_count() < 1) {
        throw MusicDecodeError("Background music decoded to zero frames");
    }

    const FloatAudioBuffer speech_stereo = downmix_to_stereo(speech);
    const FloatAudioBuffer music_stereo = downmix_to_stereo(music);

    const std::size_t frames = speech.frame_count;
    const std::size_t music_frames = music.frame_count;
    const float gain = config.music_gain;

    FloatAudioBuffer out = FloatAudioBuffer::silent(MIX_OUTPUT_CHANNELS, frames, config.target_sample_rate);
    for (std::size_t c = 0; c < out.channels.size(); ++c) {
        const std::vector<float>& s = speech_stereo.channels[c];
        const std::vector<float>& m = music_stereo.channels[c];
        std::vector<float>& dst = out.channels[c];
        std::size_t j = 0; // i % music_frames
        for (std::size_t i = 0; i < frames; ++i) {
            dst[i] = s[i] + gain * m[j];
            if (++j == music_frames) {
                j = 0;
            }
        }
    }

    LOG_CPP_DEBUG("[TrackMixer] Rendered %zu frames (music %zu frames, %d ch, gain %.3f)",
                  frames, music_frames, music.channel_count(), static_cast<double>(gain));
    return out;
}

} // namespace audio
} // namespace voicecast
