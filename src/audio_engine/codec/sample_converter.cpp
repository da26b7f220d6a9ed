#include "sample_converter.h"
#include "../pipeline_errors.h"

#include <cmath>
#include <cstddef>
#include <string>

namespace voicecast {
namespace audio {

int16_t float_sample_to_pcm16(float sample) {
    if (std::isnan(sample)) {
        return 0;
    }
    double clamped = static_cast<double>(sample);
    if (clamped > 1.0) clamped = 1.0;
    if (clamped < -1.0) clamped = -1.0;
    const double scaled = clamped < 0.0 ? clamped * 32768.0 : clamped * 32767.0;
    // static_cast truncates toward zero; the clamp keeps the result in range.
    return static_cast<int16_t>(static_cast<int32_t>(scaled));
}

FloatAudioBuffer pcm16_to_float(const PCM16Buffer& buffer) {
    if (buffer.channel_count < 1) {
        throw ContractViolation("pcm16_to_float requires channel_count >= 1");
    }
    const std::size_t channels = static_cast<std::size_t>(buffer.channel_count);
    if (buffer.samples.size() % channels != 0) {
        throw ContractViolation("PCM16 buffer of " + std::to_string(buffer.samples.size()) +
                                " samples is not a whole number of frames");
    }

    const std::size_t frames = buffer.samples.size() / channels;
    FloatAudioBuffer out = FloatAudioBuffer::silent(buffer.channel_count, frames, buffer.sample_rate);
    for (std::size_t c = 0; c < channels; ++c) {
        std::vector<float>& dst = out.channels[c];
        for (std::size_t i = 0; i < frames; ++i) {
            dst[i] = static_cast<float>(buffer.samples[i * channels + c]) / 32768.0f;
        }
    }
    return out;
}

PCM16Buffer float_to_pcm16(const FloatAudioBuffer& buffer) {
    if (buffer.channels.empty()) {
        throw ContractViolation("float_to_pcm16 requires at least one channel");
    }
    for (const auto& channel : buffer.channels) {
        if (channel.size() != buffer.frame_count) {
            throw ContractViolation("float buffer channel holds " + std::to_string(channel.size()) +
                                    " samples, expected " + std::to_string(buffer.frame_count));
        }
    }

    const std::size_t channels = buffer.channels.size();
    PCM16Buffer out;
    out.channel_count = static_cast<int>(channels);
    out.sample_rate = buffer.sample_rate;
    out.samples.resize(buffer.frame_count * channels);
    for (std::size_t i = 0; i < buffer.frame_count; ++i) {
        for (std::size_t c = 0; c < channels; ++c) {
            out.samples[i * channels + c] = float_sample_to_pcm16(buffer.channels[c][i]);
        }
    }
    return out;
}

} // namespace audio
} // namespace voicecast
