/**
 * @file library_music_decoder.h
 * @brief IMusicDecoder for WAV and MP3 background tracks.
 * @details WAV files are parsed in-process; MP3 files are decoded with LAME's hip
 *          decoder. The decoded audio is brought to the requested rate with
 *          MusicResampler.
 */
#ifndef VOICECAST_LIBRARY_MUSIC_DECODER_H
#define VOICECAST_LIBRARY_MUSIC_DECODER_H

#include "music_decoder.h"
#include "music_resampler.h"
#include "../configuration/pipeline_settings.h"

#include <memory>

namespace voicecast {
namespace audio {

/**
 * @enum MusicContainer
 * @brief Containers recognized by `detect_music_container`.
 */
enum class MusicContainer {
    UNKNOWN,
    WAV,
    MP3
};

/**
 * @brief Identifies the container of a music file from its leading bytes.
 * @details RIFF/WAVE magic selects WAV; an ID3v2 tag or an MPEG audio frame sync
 *          selects MP3.
 */
MusicContainer detect_music_container(const RawByteBuffer& bytes);

/**
 * @brief Parses a RIFF/WAVE file into float audio at its native rate.
 * @details Supports integer PCM at 8, 16, 24 and 32 bits, IEEE float at 32 and 64
 *          bits, and WAVE_FORMAT_EXTENSIBLE wrappers of either. A data chunk that
 *          claims more bytes than the file holds is read up to the end of file.
 * @throws MusicDecodeError for anything else.
 */
FloatAudioBuffer decode_wav_file(const RawByteBuffer& bytes, std::size_t max_frames);

/**
 * @brief Decodes an MPEG-1/2 layer III stream into float audio at its native rate.
 * @throws MusicDecodeError if no frame can be decoded.
 */
FloatAudioBuffer decode_mp3_file(const RawByteBuffer& bytes, std::size_t feed_chunk_bytes, std::size_t max_frames);

class LibraryMusicDecoder : public IMusicDecoder {
public:
    explicit LibraryMusicDecoder(std::shared_ptr<PipelineSettings> settings);
    ~LibraryMusicDecoder() override = default;

    FloatAudioBuffer decode(const RawByteBuffer& encoded, int target_sample_rate) const override;

private:
    std::shared_ptr<PipelineSettings> settings_;
    MusicResampler resampler_;
};

} // namespace audio
} // namespace voicecast

#endif // VOICECAST_LIBRARY_MUSIC_DECODER_H
