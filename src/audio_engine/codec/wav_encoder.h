/**
 * @file wav_encoder.h
 * @brief Serializes PCM16 buffers into canonical 44-byte-header RIFF/WAVE files.
 */
#ifndef VOICECAST_WAV_ENCODER_H
#define VOICECAST_WAV_ENCODER_H

#include "../audio_types.h"

namespace voicecast {
namespace audio {

/**
 * @brief Encodes a PCM16 buffer as a WAV file.
 * @details Header fields are little-endian: ChunkSize = 36 + dataSize,
 *          ByteRate = rate * channels * 2, BlockAlign = channels * 2,
 *          dataSize = sample_count * 2.
 * @param pcm The interleaved samples and their format.
 * @return A blob of exactly `44 + pcm.samples.size() * 2` bytes.
 * @throws ContractViolation if `channel_count` < 1, `sample_rate` <= 0, the sample
 *         count is not a whole number of frames, or the data does not fit the
 *         32-bit RIFF size fields.
 */
WavBlob encode_wav(const PCM16Buffer& pcm);

/**
 * @brief Encodes raw little-endian PCM16 bytes as a WAV file.
 * @throws MalformedEncodingError if the bytes do not form whole samples/frames.
 * @throws ContractViolation for an invalid channel count or sample rate.
 */
WavBlob encode_wav_from_bytes(const RawByteBuffer& pcm_bytes, int sample_rate, int channels);

} // namespace audio
} // namespace voicecast

#endif // VOICECAST_WAV_ENCODER_H
