/**
 * @file base64_decoder.h
 * @brief Decoding of the transport-encoded speech payload.
 */
#ifndef VOICECAST_BASE64_DECODER_H
#define VOICECAST_BASE64_DECODER_H

#include <string>
#include "../audio_types.h"

namespace voicecast {
namespace audio {

/**
 * @brief Decodes standard-alphabet base64 text into bytes.
 * @details Follows the forgiving rules browsers apply in `atob`: ASCII whitespace
 *          is skipped and trailing `=` padding is optional.
 * @param text The base64 text.
 * @return The decoded bytes.
 * @throws MalformedEncodingError on characters outside the alphabet, misplaced
 *         padding or a truncated final group.
 */
RawByteBuffer decode_base64(const std::string& text);

/**
 * @brief Reinterprets little-endian bytes as interleaved PCM16 samples.
 * @param bytes Raw sample bytes, two per sample.
 * @param sample_rate Sample rate to tag the buffer with.
 * @param channels Interleaved channel count.
 * @throws MalformedEncodingError if the byte count is odd or the sample count is
 *         not a whole number of frames.
 * @throws ContractViolation if `channels` < 1 or `sample_rate` <= 0.
 */
PCM16Buffer pcm16_from_bytes(const RawByteBuffer& bytes, int sample_rate, int channels);

} // namespace audio
} // namespace voicecast

#endif // VOICECAST_BASE64_DECODER_H
