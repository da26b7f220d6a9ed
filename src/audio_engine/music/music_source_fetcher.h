/**
 * @file music_source_fetcher.h
 * @brief IMusicFetcher implementation for URLs, local files and uploads.
 */
#ifndef VOICECAST_MUSIC_SOURCE_FETCHER_H
#define VOICECAST_MUSIC_SOURCE_FETCHER_H

#include "music_fetcher.h"
#include "../configuration/pipeline_settings.h"

#include <memory>
#include <string>

namespace voicecast {
namespace audio {

/**
 * @class MusicSourceFetcher
 * @brief Retrieves music over http(s) with libcurl or from the local filesystem.
 * @details Each fetch uses its own curl easy handle, so one fetcher may serve
 *          concurrent assemblies. Connect and total timeouts and the download cap
 *          come from `PipelineSettings::fetch_tuning`.
 */
class MusicSourceFetcher : public IMusicFetcher {
public:
    explicit MusicSourceFetcher(std::shared_ptr<PipelineSettings> settings);
    ~MusicSourceFetcher() override = default;

    MusicSourceFetcher(const MusicSourceFetcher&) = delete;
    MusicSourceFetcher& operator=(const MusicSourceFetcher&) = delete;

    RawByteBuffer fetch(const MusicSelection& selection, const FetchAbortCheck& should_abort) override;

private:
    RawByteBuffer fetch_url(const std::string& url, const FetchAbortCheck& should_abort);
    RawByteBuffer fetch_file(const std::string& location, const FetchAbortCheck& should_abort);

    std::shared_ptr<PipelineSettings> settings_;
};

/**
 * @brief Strips a `file://` scheme (and an optional `localhost` host) from a location.
 * @return The filesystem path the location refers to.
 */
std::string local_path_from_location(const std::string& location);

} // namespace audio
} // namespace voicecast

#endif // VOICECAST_MUSIC_SOURCE_FETCHER_H
