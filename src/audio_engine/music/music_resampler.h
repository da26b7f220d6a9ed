/**
 * @file music_resampler.h
 * @brief Sample rate conversion of decoded music using libsamplerate.
 */
#ifndef VOICECAST_MUSIC_RESAMPLER_H
#define VOICECAST_MUSIC_RESAMPLER_H

#include "../audio_types.h"
#include "../configuration/pipeline_settings.h"

namespace voicecast {
namespace audio {

/**
 * @class MusicResampler
 * @brief Converts a whole FloatAudioBuffer to another sample rate in one pass.
 * @details A fresh converter state is created per call, so instances hold no
 *          audio state between calls.
 */
class MusicResampler {
public:
    explicit MusicResampler(ResamplerQuality quality = ResamplerQuality::SINC_MEDIUM);

    /**
     * @brief Resamples `input` to `target_sample_rate`.
     * @details Returns a copy when the rates already match. The output holds
     *          approximately `frame_count * target / source` frames.
     * @throws MusicDecodeError if libsamplerate reports an error.
     * @throws ContractViolation if either rate is not positive.
     */
    FloatAudioBuffer resample(const FloatAudioBuffer& input, int target_sample_rate) const;

private:
    ResamplerQuality quality_;
};

} // namespace audio
} // namespace voicecast

#endif // VOICECAST_MUSIC_RESAMPLER_H
