/**
 * Tests for MusicSourceFetcher: local files, uploads, unreachable URLs and
 * abort handling.
 */
#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <memory>
#include <string>

#include "music/music_source_fetcher.h"
#include "pipeline_errors.h"

using namespace voicecast::audio;

class MusicFetcherTest : public ::testing::Test {
protected:
    std::shared_ptr<PipelineSettings> settings;
    std::unique_ptr<MusicSourceFetcher> fetcher;
    std::string temp_path;

    void SetUp() override {
        settings = std::make_shared<PipelineSettings>();
        settings->fetch_tuning.connect_timeout_ms = 2000;
        settings->fetch_tuning.total_timeout_ms = 5000;
        fetcher = std::make_unique<MusicSourceFetcher>(settings);

        temp_path = ::testing::TempDir() + "voicecast_fetch_test.bin";
        std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
        const char content[] = "0123456789";
        out.write(content, 10);
    }

    void TearDown() override {
        std::remove(temp_path.c_str());
    }

    static FetchAbortCheck never() {
        return []() { return false; };
    }
};

// ============================================================================
// Local files
// ============================================================================

TEST_F(MusicFetcherTest, ReadsPlainPath) {
    RawByteBuffer bytes = fetcher->fetch(MusicSelection::from_value(temp_path), never());
    ASSERT_EQ(bytes.size(), 10u);
    EXPECT_EQ(bytes.front(), '0');
    EXPECT_EQ(bytes.back(), '9');
}

TEST_F(MusicFetcherTest, ReadsFileUrl) {
    MusicSelection selection = MusicSelection::from_value("file://" + temp_path);
    EXPECT_EQ(selection.kind, MusicSourceKind::LOCAL_FILE);
    EXPECT_EQ(fetcher->fetch(selection, never()).size(), 10u);
}

TEST_F(MusicFetcherTest, MissingFileIsAFetchError) {
    MusicSelection selection = MusicSelection::from_value(temp_path + ".missing");
    EXPECT_THROW(fetcher->fetch(selection, never()), MusicFetchError);
}

TEST_F(MusicFetcherTest, FileLargerThanLimitIsAFetchError) {
    settings->fetch_tuning.max_download_bytes = 4;
    EXPECT_THROW(fetcher->fetch(MusicSelection::from_value(temp_path), never()), MusicFetchError);
}

TEST_F(MusicFetcherTest, EmptyAbortCheckIsAllowed) {
    EXPECT_EQ(fetcher->fetch(MusicSelection::from_value(temp_path), FetchAbortCheck()).size(), 10u);
}

TEST_F(MusicFetcherTest, AbortedFileReadIsCancelled) {
    FetchAbortCheck always = []() { return true; };
    EXPECT_THROW(fetcher->fetch(MusicSelection::from_value(temp_path), always), AssemblyCancelledError);
}

TEST_F(MusicFetcherTest, LocalPathStripsFileScheme) {
    EXPECT_EQ(local_path_from_location("/music/a.mp3"), "/music/a.mp3");
    EXPECT_EQ(local_path_from_location("file:///music/a.mp3"), "/music/a.mp3");
    EXPECT_EQ(local_path_from_location("file://localhost/music/a.mp3"), "/music/a.mp3");
    EXPECT_EQ(local_path_from_location("relative/b.wav"), "relative/b.wav");
}

// ============================================================================
// Uploads
// ============================================================================

TEST_F(MusicFetcherTest, UploadedBytesAreReturnedAsIs) {
    RawByteBuffer data = {1, 2, 3, 4};
    EXPECT_EQ(fetcher->fetch(MusicSelection::from_bytes(data), never()), data);
}

TEST_F(MusicFetcherTest, EmptyUploadIsAFetchError) {
    EXPECT_THROW(fetcher->fetch(MusicSelection::from_bytes(RawByteBuffer{}), never()), MusicFetchError);
}

TEST_F(MusicFetcherTest, NoSelectionIsAContractViolation) {
    EXPECT_THROW(fetcher->fetch(MusicSelection::from_value("none"), never()), ContractViolation);
}

// ============================================================================
// Network
// ============================================================================

TEST_F(MusicFetcherTest, UnreachableUrlIsAFetchError) {
    // Port 9 (discard) is not expected to be listening on loopback.
    MusicSelection selection = MusicSelection::from_value("http://127.0.0.1:9/music.mp3");
    ASSERT_EQ(selection.kind, MusicSourceKind::URL);
    try {
        fetcher->fetch(selection, never());
        FAIL() << "expected MusicFetchError";
    } catch (const MusicFetchError& e) {
        EXPECT_NE(std::string(e.what()).find("Failed to fetch music file"), std::string::npos);
    }
}
