/**
 * @file music_decoder.h
 * @brief Defines the IMusicDecoder interface for background track decoding.
 */
#pragma once

#include "../audio_types.h"

namespace voicecast {
namespace audio {

/**
 * @class IMusicDecoder
 * @brief An interface for classes that turn encoded music files into float audio.
 * @details Implementations own resampling: the returned buffer is always at the
 *          requested rate, with whatever channel count the file carries.
 */
class IMusicDecoder {
public:
    /**
     * @brief Virtual destructor.
     */
    virtual ~IMusicDecoder() = default;

    /**
     * @brief Decodes a complete music file.
     * @param encoded The file contents.
     * @param target_sample_rate The rate the returned buffer must be at.
     * @return Planar float audio with at least one frame.
     * @throws MusicDecodeError if the bytes are not a supported, non-empty audio file.
     */
    virtual FloatAudioBuffer decode(const RawByteBuffer& encoded, int target_sample_rate) const = 0;
};

} // namespace audio
} // namespace voicecast
