/**
 * @file audio_constants.h
 * @brief Defines constants used throughout the audio engine.
 * @details Centralizes the fixed audio formats of the assembly pipeline: the
 *          format the speech provider delivers, the mix output format and the
 *          canonical WAV header geometry.
 */
#ifndef VOICECAST_AUDIO_CONSTANTS_H
#define VOICECAST_AUDIO_CONSTANTS_H

#include <cstddef>

namespace voicecast {
/**
 * @namespace audio
 * @brief The main namespace for all audio processing components in voicecast.
 */
namespace audio {

/**
 * @brief Sample rate of the speech stream produced by the speech provider.
 * @details Speech is never resampled, so this is also the rate of every mix.
 */
constexpr int SPEECH_SAMPLE_RATE = 24000;

/** @brief Channel count of the speech stream. */
constexpr int SPEECH_CHANNELS = 1;

/** @brief Channel count of a mixed (speech + music) render. */
constexpr int MIX_OUTPUT_CHANNELS = 2;

/** @brief Music gain used when the caller does not pick one. */
constexpr float DEFAULT_MUSIC_GAIN = 0.15f;

/** @brief Size of the canonical RIFF/WAVE header written by the encoder. */
constexpr std::size_t WAV_HEADER_SIZE = 44;

/** @brief Bits per sample of every PCM buffer the pipeline emits. */
constexpr int PCM16_BITS_PER_SAMPLE = 16;

/** @brief Selection value meaning "no background music". */
constexpr const char* MUSIC_SELECTION_NONE = "none";

} // namespace audio
} // namespace voicecast

#endif // VOICECAST_AUDIO_CONSTANTS_H
