/**
 * Tests for MusicSelection parsing and CancellationToken.
 */
#include <gtest/gtest.h>
#include <thread>

#include "audio_types.h"

using namespace voicecast::audio;

TEST(MusicSelectionTest, NoneValues) {
    EXPECT_EQ(MusicSelection::from_value("").kind, MusicSourceKind::NONE);
    EXPECT_EQ(MusicSelection::from_value("none").kind, MusicSourceKind::NONE);
    EXPECT_FALSE(MusicSelection::from_value("none").has_music());
    EXPECT_EQ(MusicSelection().kind, MusicSourceKind::NONE);
}

TEST(MusicSelectionTest, UrlValues) {
    MusicSelection http = MusicSelection::from_value("http://example.com/a.mp3", 0.3f);
    EXPECT_EQ(http.kind, MusicSourceKind::URL);
    EXPECT_EQ(http.location, "http://example.com/a.mp3");
    EXPECT_FLOAT_EQ(http.volume, 0.3f);
    EXPECT_TRUE(http.has_music());

    EXPECT_EQ(MusicSelection::from_value("https://example.com/b.wav").kind, MusicSourceKind::URL);
}

TEST(MusicSelectionTest, AnythingElseIsALocalFile) {
    EXPECT_EQ(MusicSelection::from_value("/srv/music/calm.mp3").kind, MusicSourceKind::LOCAL_FILE);
    EXPECT_EQ(MusicSelection::from_value("file:///srv/music/calm.mp3").kind, MusicSourceKind::LOCAL_FILE);
    EXPECT_EQ(MusicSelection::from_value("None").kind, MusicSourceKind::LOCAL_FILE);
}

TEST(MusicSelectionTest, DefaultVolume) {
    EXPECT_FLOAT_EQ(MusicSelection::from_value("x.mp3").volume, DEFAULT_MUSIC_GAIN);
    EXPECT_FLOAT_EQ(DEFAULT_MUSIC_GAIN, 0.15f);
}

TEST(MusicSelectionTest, FromBytes) {
    MusicSelection upload = MusicSelection::from_bytes(RawByteBuffer{9, 8, 7}, 0.5f);
    EXPECT_EQ(upload.kind, MusicSourceKind::IN_MEMORY);
    EXPECT_EQ(upload.data.size(), 3u);
    EXPECT_FLOAT_EQ(upload.volume, 0.5f);
    EXPECT_EQ(upload.describe(), "upload(3 bytes)");
}

TEST(MusicSelectionTest, Describe) {
    EXPECT_EQ(MusicSelection::from_value("none").describe(), "none");
    EXPECT_EQ(MusicSelection::from_value("https://h/a.mp3").describe(), "url:https://h/a.mp3");
    EXPECT_EQ(MusicSelection::from_value("/a.wav").describe(), "file:/a.wav");
}

TEST(CancellationTokenTest, CancelIsVisibleAcrossThreads) {
    CancellationToken token;
    EXPECT_FALSE(token.is_cancelled());
    std::thread t([&token]() { token.cancel(); });
    t.join();
    EXPECT_TRUE(token.is_cancelled());
}
