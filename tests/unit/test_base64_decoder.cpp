/**
 * Tests for base64 speech payload decoding and PCM16 reinterpretation.
 */
#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "codec/base64_decoder.h"
#include "pipeline_errors.h"

using namespace voicecast::audio;

class Base64DecoderTest : public ::testing::Test {
protected:
    static std::string as_string(const RawByteBuffer& bytes) {
        return std::string(bytes.begin(), bytes.end());
    }
};

// ============================================================================
// decode_base64
// ============================================================================

TEST_F(Base64DecoderTest, DecodesPaddedInput) {
    EXPECT_EQ(as_string(decode_base64("SGVsbG8=")), "Hello");
    EXPECT_EQ(as_string(decode_base64("SGVsbA==")), "Hell");
    EXPECT_EQ(as_string(decode_base64("SGVs")), "Hel");
}

TEST_F(Base64DecoderTest, PaddingIsOptional) {
    EXPECT_EQ(as_string(decode_base64("SGVsbG8")), "Hello");
    EXPECT_EQ(as_string(decode_base64("SGVsbA")), "Hell");
}

TEST_F(Base64DecoderTest, IgnoresAsciiWhitespace) {
    EXPECT_EQ(as_string(decode_base64(" SGVs\nbG8=\r\n")), "Hello");
    EXPECT_EQ(as_string(decode_base64("S G V s\tb G 8 =")), "Hello");
}

TEST_F(Base64DecoderTest, EmptyInputDecodesToNothing) {
    EXPECT_TRUE(decode_base64("").empty());
    EXPECT_TRUE(decode_base64("  \n").empty());
}

TEST_F(Base64DecoderTest, DecodesFullByteRange) {
    RawByteBuffer bytes = decode_base64("AAECA/z9/v8=");
    ASSERT_EQ(bytes.size(), 8u);
    EXPECT_EQ(bytes[0], 0x00);
    EXPECT_EQ(bytes[1], 0x01);
    EXPECT_EQ(bytes[2], 0x02);
    EXPECT_EQ(bytes[3], 0x03);
    EXPECT_EQ(bytes[4], 0xFC);
    EXPECT_EQ(bytes[5], 0xFD);
    EXPECT_EQ(bytes[6], 0xFE);
    EXPECT_EQ(bytes[7], 0xFF);
}

TEST_F(Base64DecoderTest, RejectsCharactersOutsideAlphabet) {
    EXPECT_THROW(decode_base64("SGV*bG8="), MalformedEncodingError);
    EXPECT_THROW(decode_base64("SGVsbG8-"), MalformedEncodingError); // URL-safe alphabet is not accepted
    EXPECT_THROW(decode_base64("SGVsbG8_"), MalformedEncodingError);
}

TEST_F(Base64DecoderTest, RejectsPaddingInsideTheText) {
    EXPECT_THROW(decode_base64("SG=sbG8="), MalformedEncodingError);
    EXPECT_THROW(decode_base64("SGVsbG8=SGVs"), MalformedEncodingError);
}

TEST_F(Base64DecoderTest, RejectsTruncatedFinalGroup) {
    EXPECT_THROW(decode_base64("A"), MalformedEncodingError);
    EXPECT_THROW(decode_base64("SGVsb"), MalformedEncodingError);
    EXPECT_THROW(decode_base64("SGVsbG8=="), MalformedEncodingError);
}

TEST_F(Base64DecoderTest, MalformedErrorIsAPipelineError) {
    try {
        decode_base64("not base64!");
        FAIL() << "expected MalformedEncodingError";
    } catch (const PipelineError& e) {
        EXPECT_NE(std::string(e.what()).find("offset"), std::string::npos);
    }
}

// ============================================================================
// pcm16_from_bytes
// ============================================================================

TEST_F(Base64DecoderTest, BytesAreReadLittleEndian) {
    RawByteBuffer bytes = {0x01, 0x00, 0xFF, 0xFF, 0x00, 0x80, 0xFF, 0x7F};
    PCM16Buffer pcm = pcm16_from_bytes(bytes, 24000, 1);
    ASSERT_EQ(pcm.samples.size(), 4u);
    EXPECT_EQ(pcm.samples[0], 1);
    EXPECT_EQ(pcm.samples[1], -1);
    EXPECT_EQ(pcm.samples[2], -32768);
    EXPECT_EQ(pcm.samples[3], 32767);
    EXPECT_EQ(pcm.sample_rate, 24000);
    EXPECT_EQ(pcm.channel_count, 1);
    EXPECT_EQ(pcm.frame_count(), 4u);
}

TEST_F(Base64DecoderTest, OddByteCountIsMalformed) {
    RawByteBuffer bytes = {0x01, 0x00, 0x02};
    EXPECT_THROW(pcm16_from_bytes(bytes, 24000, 1), MalformedEncodingError);
}

TEST_F(Base64DecoderTest, PartialFrameIsMalformed) {
    RawByteBuffer bytes(6, 0); // three samples cannot form stereo frames
    EXPECT_THROW(pcm16_from_bytes(bytes, 24000, 2), MalformedEncodingError);
    EXPECT_NO_THROW(pcm16_from_bytes(bytes, 24000, 3));
}

TEST_F(Base64DecoderTest, InvalidFormatIsContractViolation) {
    RawByteBuffer bytes(4, 0);
    EXPECT_THROW(pcm16_from_bytes(bytes, 24000, 0), ContractViolation);
    EXPECT_THROW(pcm16_from_bytes(bytes, 0, 1), ContractViolation);
}

TEST_F(Base64DecoderTest, DecodesSpeechPayloadEndToEnd) {
    // "AQD//w==" is {0x01, 0x00, 0xFF, 0xFF}
    PCM16Buffer pcm = pcm16_from_bytes(decode_base64("AQD//w=="), 24000, 1);
    ASSERT_EQ(pcm.samples.size(), 2u);
    EXPECT_EQ(pcm.samples[0], 1);
    EXPECT_EQ(pcm.samples[1], -1);
}
