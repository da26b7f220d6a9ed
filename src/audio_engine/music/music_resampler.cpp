#include "music_resampler.h"
#include "../pipeline_errors.h"
#include "../utils/cpp_logger.h"

#include <samplerate.h>

#include <cmath>
#include <memory>
#include <string>

namespace voicecast {
namespace audio {

namespace {

int to_converter_type(ResamplerQuality quality) {
    switch (quality) {
        case ResamplerQuality::SINC_BEST:       return SRC_SINC_BEST_QUALITY;
        case ResamplerQuality::SINC_MEDIUM:     return SRC_SINC_MEDIUM_QUALITY;
        case ResamplerQuality::SINC_FASTEST:    return SRC_SINC_FASTEST;
        case ResamplerQuality::ZERO_ORDER_HOLD: return SRC_ZERO_ORDER_HOLD;
        case ResamplerQuality::LINEAR:          return SRC_LINEAR;
    }
    return SRC_SINC_MEDIUM_QUALITY;
}

} // namespace

MusicResampler::MusicResampler(ResamplerQuality quality) : quality_(quality) {}

FloatAudioBuffer MusicResampler::resample(const FloatAudioBuffer& input, int target_sample_rate) const {
    if (input.sample_rate <= 0 || target_sample_rate <= 0) {
        throw ContractViolation("MusicResampler requires positive sample rates");
    }
    if (input.sample_rate == target_sample_rate) {
        return input;
    }

    const int channels = input.channel_count();
    if (channels < 1) {
        throw ContractViolation("MusicResampler requires at least one channel");
    }
    if (input.frame_count == 0) {
        return FloatAudioBuffer::silent(channels, 0, target_sample_rate);
    }

    const double ratio = static_cast<double>(target_sample_rate) / static_cast<double>(input.sample_rate);
    if (!src_is_valid_ratio(ratio)) {
        throw MusicDecodeError("Cannot resample music from " + std::to_string(input.sample_rate) +
                               " Hz to " + std::to_string(target_sample_rate) + " Hz");
    }

    const std::size_t ch = static_cast<std::size_t>(channels);
    std::vector<float> interleaved(input.frame_count * ch);
    for (std::size_t i = 0; i < input.frame_count; ++i) {
        for (std::size_t c = 0; c < ch; ++c) {
            interleaved[i * ch + c] = input.channels[c][i];
        }
    }

    int error = 0;
    std::unique_ptr<SRC_STATE, decltype(&src_delete)> state(
        src_new(to_converter_type(quality_), channels, &error), &src_delete);
    if (!state) {
        throw MusicDecodeError(std::string("Error creating libsamplerate converter: ") + src_strerror(error));
    }

    std::size_t capacity = static_cast<std::size_t>(std::ceil(static_cast<double>(input.frame_count) * ratio)) + 64;
    std::vector<float> output(capacity * ch);
    std::size_t input_frames_consumed = 0;
    std::size_t output_frames_generated = 0;

    while (true) {
        if (output_frames_generated >= capacity) {
            capacity *= 2;
            output.resize(capacity * ch);
        }

        SRC_DATA src_data = {};
        src_data.data_in = interleaved.data() + input_frames_consumed * ch;
        src_data.input_frames = static_cast<long>(input.frame_count - input_frames_consumed);
        src_data.data_out = output.data() + output_frames_generated * ch;
        src_data.output_frames = static_cast<long>(capacity - output_frames_generated);
        src_data.src_ratio = ratio;
        src_data.end_of_input = 1;

        error = src_process(state.get(), &src_data);
        if (error != 0) {
            LOG_CPP_DEBUG("[MusicResampler] libsamplerate error: %s", src_strerror(error));
            throw MusicDecodeError(std::string("Music resampling failed: ") + src_strerror(error));
        }

        input_frames_consumed += static_cast<std::size_t>(src_data.input_frames_used);
        output_frames_generated += static_cast<std::size_t>(src_data.output_frames_gen);

        if (src_data.input_frames_used == 0 && src_data.output_frames_gen == 0) {
            break; // Converter fully drained
        }
    }

    FloatAudioBuffer out = FloatAudioBuffer::silent(channels, output_frames_generated, target_sample_rate);
    for (std::size_t i = 0; i < output_frames_generated; ++i) {
        for (std::size_t c = 0; c < ch; ++c) {
            out.channels[c][i] = output[i * ch + c];
        }
    }

    LOG_CPP_DEBUG("[MusicResampler] %zu frames @ %d Hz -> %zu frames @ %d Hz",
                  input.frame_count, input.sample_rate, output_frames_generated, target_sample_rate);
    return out;
}

} // namespace audio
} // namespace voicecast
