/**
 * @file pipeline_orchestrator.h
 * @brief Top-level entry point that turns a speech payload into a WAV file.
 */
#ifndef VOICECAST_PIPELINE_ORCHESTRATOR_H
#define VOICECAST_PIPELINE_ORCHESTRATOR_H

#include "../audio_types.h"
#include "../configuration/pipeline_settings.h"
#include "../mixer/track_mixer.h"
#include "../music/music_decoder.h"
#include "../music/music_fetcher.h"

#include <memory>
#include <string>

namespace voicecast {
namespace audio {

/**
 * @class PipelineOrchestrator
 * @brief Runs decode, optional mix and encode for one speech payload.
 * @details Without music the speech is written as a mono WAV at the speech rate.
 *          With music, the track is fetched on a separate task while the speech
 *          is decoded, then mixed and written as a stereo WAV.
 *
 *          `assemble` does not modify the orchestrator, so one instance may serve
 *          concurrent calls provided the injected collaborators allow it.
 */
class PipelineOrchestrator {
public:
    /**
     * @param settings Pipeline settings; defaults are used when null.
     * @param fetcher Music fetcher; a MusicSourceFetcher is created when null.
     * @param decoder Music decoder; a LibraryMusicDecoder is created when null.
     */
    explicit PipelineOrchestrator(std::shared_ptr<PipelineSettings> settings,
                                  std::shared_ptr<IMusicFetcher> fetcher = nullptr,
                                  std::shared_ptr<IMusicDecoder> decoder = nullptr);

    PipelineOrchestrator(const PipelineOrchestrator&) = delete;
    PipelineOrchestrator& operator=(const PipelineOrchestrator&) = delete;

    /**
     * @brief Builds a WAV file from base64 speech and an optional background track.
     * @param speech_payload Base64 encoded little-endian PCM16 speech.
     * @param selection Background music choice; `kind == NONE` skips mixing.
     * @param token Optional cancellation token polled between stages.
     * @return The complete WAV file.
     * @throws MalformedEncodingError if the payload is empty or malformed.
     * @throws MusicFetchError if the music cannot be retrieved.
     * @throws MusicDecodeError if the music cannot be decoded.
     * @throws AssemblyCancelledError if `token` was cancelled.
     * @throws ContractViolation if the selection volume is out of range.
     */
    WavBlob assemble(const std::string& speech_payload,
                     const MusicSelection& selection,
                     const CancellationToken* token = nullptr) const;

    std::shared_ptr<PipelineSettings> settings() const { return settings_; }

private:
    PCM16Buffer decode_speech(const std::string& speech_payload) const;
    WavBlob assemble_direct(const std::string& speech_payload, const CancellationToken* token) const;
    WavBlob assemble_mixed(const std::string& speech_payload,
                           const MusicSelection& selection,
                           const CancellationToken* token) const;
    MixConfig build_mix_config(const MusicSelection& selection) const;

    std::shared_ptr<PipelineSettings> settings_;
    std::shared_ptr<IMusicFetcher> fetcher_;
    std::shared_ptr<IMusicDecoder> decoder_;
    TrackMixer mixer_;
};

} // namespace audio
} // namespace voicecast

#endif // VOICECAST_PIPELINE_ORCHESTRATOR_H
