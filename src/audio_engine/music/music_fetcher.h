/**
 * @file music_fetcher.h
 * @brief Defines the IMusicFetcher interface for background track retrieval.
 * @details Retrieval is the slow, blocking half of a mix: the orchestrator runs
 *          it on its own task while the speech payload is being decoded.
 */
#pragma once

#include <functional>
#include "../audio_types.h"

namespace voicecast {
namespace audio {

/**
 * @brief Polled by a fetch in progress; returning true asks the fetch to stop.
 */
using FetchAbortCheck = std::function<bool()>;

/**
 * @class IMusicFetcher
 * @brief An interface for classes that retrieve background music bytes.
 */
class IMusicFetcher {
public:
    /**
     * @brief Virtual destructor.
     */
    virtual ~IMusicFetcher() = default;

    /**
     * @brief Retrieves the raw (still encoded) bytes of a music selection.
     * @param selection A selection whose kind is not NONE.
     * @param should_abort Optional abort check, polled while the fetch runs.
     * @return The complete file contents.
     * @throws MusicFetchError if the source cannot be retrieved or times out.
     * @throws AssemblyCancelledError if `should_abort` returned true.
     */
    virtual RawByteBuffer fetch(const MusicSelection& selection, const FetchAbortCheck& should_abort) = 0;
};

} // namespace audio
} // namespace voicecast
