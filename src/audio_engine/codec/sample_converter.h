/**
 * @file sample_converter.h
 * @brief Conversion between interleaved PCM16 and planar float audio.
 * @details The float to PCM16 direction scales negative samples by 32768 and
 *          positive samples by 32767 so that +1.0 lands on the largest positive
 *          int16 instead of overflowing. As a consequence a positive sample that
 *          goes int16 -> float -> int16 comes back one LSB lower; zero and
 *          negative samples come back unchanged.
 */
#ifndef VOICECAST_SAMPLE_CONVERTER_H
#define VOICECAST_SAMPLE_CONVERTER_H

#include "../audio_types.h"

namespace voicecast {
namespace audio {

/**
 * @brief De-interleaves PCM16 samples into float channels, `s / 32768`.
 * @throws ContractViolation if the buffer's channel count is < 1 or its sample
 *         count is not a whole number of frames.
 */
FloatAudioBuffer pcm16_to_float(const PCM16Buffer& buffer);

/**
 * @brief Clamps, scales and re-interleaves float channels into PCM16.
 * @details Samples outside [-1, 1] are clipped, never wrapped. Scaled values are
 *          truncated toward zero. NaN becomes 0.
 * @throws ContractViolation if the buffer has no channels or a channel's length
 *         differs from `frame_count`.
 */
PCM16Buffer float_to_pcm16(const FloatAudioBuffer& buffer);

/** @brief Converts one float sample with the clamping and scaling rules above. */
int16_t float_sample_to_pcm16(float sample);

} // namespace audio
} // namespace voicecast

#endif // VOICECAST_SAMPLE_CONVERTER_H
