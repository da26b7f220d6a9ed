/**
 * Tests for the speech + background music mixer: looping, gain, channel
 * mapping and clipping behaviour.
 */
#include <gtest/gtest.h>
#include <limits>
#include <memory>
#include <stdexcept>
#include <vector>

#include "codec/sample_converter.h"
#include "mixer/track_mixer.h"
#include "mocks/mock_music_source.h"
#include "pipeline_errors.h"

using namespace voicecast::audio;
using voicecast::audio::testing::MockMusicDecoder;

class TrackMixerTest : public ::testing::Test {
protected:
    std::shared_ptr<MockMusicDecoder> decoder;
    std::unique_ptr<TrackMixer> mixer;
    MixConfig config;

    void SetUp() override {
        decoder = std::make_shared<MockMusicDecoder>();
        mixer = std::make_unique<TrackMixer>(decoder);
        config.music_gain = 0.5f;
        config.target_sample_rate = 24000;
        config.target_channel_count = 2;
    }

    static FloatAudioBuffer ramp(int channels, std::size_t frames, float start, float step, int rate = 24000) {
        FloatAudioBuffer buffer = FloatAudioBuffer::silent(channels, frames, rate);
        for (int c = 0; c < channels; ++c) {
            for (std::size_t i = 0; i < frames; ++i) {
                buffer.channels[c][i] = start + step * static_cast<float>(i) + 0.01f * static_cast<float>(c);
            }
        }
        return buffer;
    }

    static PCM16Buffer constant_speech(int16_t value, std::size_t frames) {
        PCM16Buffer pcm;
        pcm.samples.assign(frames, value);
        pcm.channel_count = 1;
        pcm.sample_rate = 24000;
        return pcm;
    }
};

// ============================================================================
// Length and looping
// ============================================================================

TEST_F(TrackMixerTest, OutputLengthFollowsSpeech) {
    FloatAudioBuffer speech = ramp(1, 100, 0.0f, 0.001f);
    for (std::size_t music_frames : {33u, 100u, 300u}) {
        FloatAudioBuffer music = ramp(1, music_frames, 0.1f, 0.001f);
        FloatAudioBuffer out = TrackMixer::render(speech, music, config);
        EXPECT_EQ(out.frame_count, 100u) << "music frames " << music_frames;
        EXPECT_EQ(out.channel_count(), 2);
        EXPECT_EQ(out.sample_rate, 24000);
    }
}

TEST_F(TrackMixerTest, ShortMusicLoopsFromItsFirstFrame) {
    FloatAudioBuffer speech = FloatAudioBuffer::silent(1, 10, 24000);
    FloatAudioBuffer music = FloatAudioBuffer::silent(1, 3, 24000);
    music.channels[0] = {0.1f, 0.2f, 0.3f};

    FloatAudioBuffer out = TrackMixer::render(speech, music, config);
    ASSERT_EQ(out.frame_count, 10u);
    for (std::size_t i = 0; i < 10; ++i) {
        EXPECT_FLOAT_EQ(out.channels[0][i], 0.5f * music.channels[0][i % 3]) << "frame " << i;
        EXPECT_FLOAT_EQ(out.channels[1][i], 0.5f * music.channels[0][i % 3]) << "frame " << i;
    }
}

TEST_F(TrackMixerTest, LongMusicIsTruncated) {
    FloatAudioBuffer speech = ramp(1, 4, 0.0f, 0.1f);
    FloatAudioBuffer music = ramp(1, 12, -0.5f, 0.05f);

    FloatAudioBuffer out = TrackMixer::render(speech, music, config);
    ASSERT_EQ(out.frame_count, 4u);
    for (std::size_t i = 0; i < 4; ++i) {
        EXPECT_FLOAT_EQ(out.channels[0][i], speech.channels[0][i] + 0.5f * music.channels[0][i]);
    }
}

TEST_F(TrackMixerTest, EmptySpeechGivesEmptyOutput) {
    FloatAudioBuffer speech = FloatAudioBuffer::silent(1, 0, 24000);
    FloatAudioBuffer music = ramp(1, 8, 0.1f, 0.0f);
    FloatAudioBuffer out = TrackMixer::render(speech, music, config);
    EXPECT_EQ(out.frame_count, 0u);
    EXPECT_EQ(out.channel_count(), 2);
}

// ============================================================================
// Gain
// ============================================================================

TEST_F(TrackMixerTest, SilentSpeechScalesLinearlyWithGain) {
    FloatAudioBuffer speech = FloatAudioBuffer::silent(1, 16, 24000);
    FloatAudioBuffer music = ramp(1, 5, -0.4f, 0.17f);

    MixConfig single = config;
    single.music_gain = 0.2f;
    MixConfig doubled = config;
    doubled.music_gain = 0.4f;

    FloatAudioBuffer a = TrackMixer::render(speech, music, single);
    FloatAudioBuffer b = TrackMixer::render(speech, music, doubled);
    for (int c = 0; c < 2; ++c) {
        for (std::size_t i = 0; i < 16; ++i) {
            EXPECT_FLOAT_EQ(b.channels[c][i], 2.0f * a.channels[c][i]);
        }
    }
}

TEST_F(TrackMixerTest, ZeroGainLeavesSpeechUntouched) {
    config.music_gain = 0.0f;
    FloatAudioBuffer speech = ramp(1, 8, -0.3f, 0.07f);
    FloatAudioBuffer music = ramp(1, 3, 0.9f, 0.0f);

    FloatAudioBuffer out = TrackMixer::render(speech, music, config);
    for (std::size_t i = 0; i < 8; ++i) {
        EXPECT_FLOAT_EQ(out.channels[0][i], speech.channels[0][i]);
        EXPECT_FLOAT_EQ(out.channels[1][i], speech.channels[0][i]);
    }
}

TEST_F(TrackMixerTest, SumIsNotLimitedInFloat) {
    config.music_gain = 1.0f;
    FloatAudioBuffer speech = ramp(1, 4, 0.9f, 0.0f);
    FloatAudioBuffer music = ramp(1, 4, 0.9f, 0.0f);
    FloatAudioBuffer out = TrackMixer::render(speech, music, config);
    EXPECT_FLOAT_EQ(out.channels[0][0], 1.8f);
}

TEST_F(TrackMixerTest, RejectsInvalidGain) {
    FloatAudioBuffer speech = FloatAudioBuffer::silent(1, 4, 24000);
    FloatAudioBuffer music = FloatAudioBuffer::silent(1, 4, 24000);
    config.music_gain = -0.1f;
    EXPECT_THROW(TrackMixer::render(speech, music, config), ContractViolation);
    config.music_gain = std::numeric_limits<float>::quiet_NaN();
    EXPECT_THROW(TrackMixer::render(speech, music, config), ContractViolation);
}

// ============================================================================
// Channel mapping
// ============================================================================

TEST_F(TrackMixerTest, StereoMusicMapsChannelForChannel) {
    FloatAudioBuffer speech = FloatAudioBuffer::silent(1, 4, 24000);
    FloatAudioBuffer music = FloatAudioBuffer::silent(2, 4, 24000);
    music.channels[0] = {0.2f, 0.2f, 0.2f, 0.2f};
    music.channels[1] = {-0.4f, -0.4f, -0.4f, -0.4f};

    FloatAudioBuffer out = TrackMixer::render(speech, music, config);
    for (std::size_t i = 0; i < 4; ++i) {
        EXPECT_FLOAT_EQ(out.channels[0][i], 0.1f);
        EXPECT_FLOAT_EQ(out.channels[1][i], -0.2f);
    }
}

TEST_F(TrackMixerTest, QuadMusicFoldsFrontAndBack) {
    FloatAudioBuffer quad = FloatAudioBuffer::silent(4, 1, 24000);
    quad.channels[0] = {0.4f};  // FL
    quad.channels[1] = {0.2f};  // FR
    quad.channels[2] = {0.2f};  // BL
    quad.channels[3] = {-0.2f}; // BR

    FloatAudioBuffer stereo = downmix_to_stereo(quad);
    ASSERT_EQ(stereo.channel_count(), 2);
    EXPECT_FLOAT_EQ(stereo.channels[0][0], 0.3f);
    EXPECT_FLOAT_EQ(stereo.channels[1][0], 0.0f);
}

TEST_F(TrackMixerTest, SurroundMusicFoldsCenterAndSurrounds) {
    FloatAudioBuffer surround = FloatAudioBuffer::silent(6, 1, 24000);
    surround.channels[0] = {0.1f};  // FL
    surround.channels[1] = {0.2f};  // FR
    surround.channels[2] = {0.3f};  // C
    surround.channels[3] = {0.9f};  // LFE, dropped
    surround.channels[4] = {0.1f};  // SL
    surround.channels[5] = {-0.1f}; // SR

    FloatAudioBuffer stereo = downmix_to_stereo(surround);
    const float k = 0.7071067811865476f;
    EXPECT_NEAR(stereo.channels[0][0], 0.1f + k * (0.3f + 0.1f), 1e-6f);
    EXPECT_NEAR(stereo.channels[1][0], 0.2f + k * (0.3f - 0.1f), 1e-6f);
}

TEST_F(TrackMixerTest, UnknownLayoutKeepsFirstTwoChannels) {
    FloatAudioBuffer three = FloatAudioBuffer::silent(3, 1, 24000);
    three.channels[0] = {0.25f};
    three.channels[1] = {-0.25f};
    three.channels[2] = {1.0f};

    FloatAudioBuffer stereo = downmix_to_stereo(three);
    EXPECT_FLOAT_EQ(stereo.channels[0][0], 0.25f);
    EXPECT_FLOAT_EQ(stereo.channels[1][0], -0.25f);
}

// ============================================================================
// mix(): decoder hand-off, PCM16 output and contracts
// ============================================================================

TEST_F(TrackMixerTest, MixDecodesAtTargetRateAndReturnsStereoPcm) {
    RawByteBuffer music_bytes = {1, 2, 3};
    PCM16Buffer out = mixer->mix(constant_speech(0, 8), music_bytes, config);

    EXPECT_EQ(decoder->decode_count(), 1);
    EXPECT_EQ(decoder->last_input_size(), 3u);
    EXPECT_EQ(out.channel_count, 2);
    EXPECT_EQ(out.sample_rate, 24000);
    ASSERT_EQ(out.frame_count(), 8u);

    // Mock music is {0.5, -0.5, 0.25, -0.25} looped, gain 0.5
    EXPECT_EQ(out.samples[0], float_sample_to_pcm16(0.25f));
    EXPECT_EQ(out.samples[1], float_sample_to_pcm16(0.25f));
    EXPECT_EQ(out.samples[2], float_sample_to_pcm16(-0.25f));
    EXPECT_EQ(out.samples[8], float_sample_to_pcm16(0.25f)); // frame 4 wraps to music frame 0
}

TEST_F(TrackMixerTest, MixClipsOnlyAtConversion) {
    FloatAudioBuffer loud = FloatAudioBuffer::silent(1, 1, 0);
    loud.channels[0] = {0.9f};
    decoder->set_buffer(loud);
    config.music_gain = 1.0f;

    PCM16Buffer out = mixer->mix(constant_speech(29491, 4), RawByteBuffer{0}, config); // ~0.9
    for (int16_t s : out.samples) {
        EXPECT_EQ(s, 32767);
    }
}

TEST_F(TrackMixerTest, MixIsDeterministic) {
    PCM16Buffer speech = constant_speech(1234, 50);
    PCM16Buffer a = mixer->mix(speech, RawByteBuffer{0}, config);
    PCM16Buffer b = mixer->mix(speech, RawByteBuffer{0}, config);
    EXPECT_EQ(a.samples, b.samples);
}

TEST_F(TrackMixerTest, SpeechRateMustMatchTarget) {
    PCM16Buffer speech = constant_speech(0, 8);
    speech.sample_rate = 22050;
    EXPECT_THROW(mixer->mix(speech, RawByteBuffer{0}, config), ContractViolation);
    EXPECT_EQ(decoder->decode_count(), 0);
}

TEST_F(TrackMixerTest, EmptyMusicIsADecodeError) {
    decoder->set_buffer(FloatAudioBuffer::silent(2, 0, 0));
    EXPECT_THROW(mixer->mix(constant_speech(0, 8), RawByteBuffer{0}, config), MusicDecodeError);
}

TEST_F(TrackMixerTest, DecoderFailurePropagates) {
    decoder->set_fail_decode(true);
    EXPECT_THROW(mixer->mix(constant_speech(0, 8), RawByteBuffer{0}, config), MusicDecodeError);
}

TEST_F(TrackMixerTest, NullDecoderIsRejected) {
    EXPECT_THROW(TrackMixer(nullptr), std::invalid_argument);
}
