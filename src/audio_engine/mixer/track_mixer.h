/**
 * @file track_mixer.h
 * @brief Blends speech with a looped, gained background track.
 */
#ifndef VOICECAST_TRACK_MIXER_H
#define VOICECAST_TRACK_MIXER_H

#include "../audio_types.h"
#include "../music/music_decoder.h"

#include <memory>

namespace voicecast {
namespace audio {

/**
 * @brief Folds a planar buffer down to two channels.
 * @details Mono is duplicated, stereo is passed through, quad and 5.1 use the
 *          "speakers" down-mix coefficients, other layouts keep their first two
 *          channels.
 */
FloatAudioBuffer downmix_to_stereo(const FloatAudioBuffer& input);

/**
 * @class TrackMixer
 * @brief Renders speech plus background music into stereo PCM16.
 * @details The output is always exactly as long as the speech. Music shorter than
 *          the speech is looped from its first frame, longer music is cut.
 *          Nothing limits the sum; samples past full scale clip in float_to_pcm16.
 */
class TrackMixer {
public:
    /**
     * @param decoder Decoder for the music bytes. Must not be null.
     * @throws std::invalid_argument if decoder is null.
     */
    explicit TrackMixer(std::shared_ptr<IMusicDecoder> decoder);

    /**
     * @brief Decodes `music` and mixes it under `speech`.
     * @param speech Speech samples at `config.target_sample_rate`.
     * @param music Encoded music file.
     * @param config Gain and output format.
     * @return Interleaved PCM16 with `config.target_channel_count` channels.
     * @throws ContractViolation if the speech rate differs from the target rate,
     *         or the config is invalid.
     * @throws MusicDecodeError if the music cannot be decoded or is empty.
     */
    PCM16Buffer mix(const PCM16Buffer& speech, const RawByteBuffer& music, const MixConfig& config) const;

    /**
     * @brief Sums speech and `gain * music` frame by frame in float.
     * @details Both inputs must already be at `config.target_sample_rate`.
     */
    static FloatAudioBuffer render(const FloatAudioBuffer& speech,
                                   const FloatAudioBuffer& music,
                                   const MixConfig& config);

private:
    std::shared_ptr<IMusicDecoder> decoder_;
};

} // namespace audio
} // namespace voicecast

#endif // VOICECAST_TRACK_MIXER_H
