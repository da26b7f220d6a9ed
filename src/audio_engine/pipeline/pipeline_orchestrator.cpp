/**
 * @file pipeline_orchestrator.cpp
 * @brief Implementation of the audio assembly pipeline.
 */
#include "pipeline_orchestrator.h"
#include "../codec/base64_decoder.h"
#include "../codec/wav_encoder.h"
#include "../music/library_music_decoder.h"
#include "../music/music_source_fetcher.h"
#include "../pipeline_errors.h"
#include "../utils/cpp_logger.h"

#include <atomic>
#include <cmath>
#include <exception>
#include <future>
#include <utility>

namespace voicecast {
namespace audio {

namespace {

void throw_if_cancelled(const CancellationToken* token, const char* stage) {
    if (token && token->is_cancelled()) {
        throw AssemblyCancelledError(std::string("Audio assembly cancelled before ") + stage);
    }
}

std::shared_ptr<IMusicFetcher> default_fetcher(std::shared_ptr<IMusicFetcher> fetcher,
                                               const std::shared_ptr<PipelineSettings>& settings) {
    return fetcher ? std::move(fetcher) : std::make_shared<MusicSourceFetcher>(settings);
}

std::shared_ptr<IMusicDecoder> default_decoder(std::shared_ptr<IMusicDecoder> decoder,
                                               const std::shared_ptr<PipelineSettings>& settings) {
    return decoder ? std::move(decoder) : std::make_shared<LibraryMusicDecoder>(settings);
}

} // namespace

PipelineOrchestrator::PipelineOrchestrator(std::shared_ptr<PipelineSettings> settings,
                                           std::shared_ptr<IMusicFetcher> fetcher,
                                           std::shared_ptr<IMusicDecoder> decoder)
    : settings_(resolve_settings(settings)),
      fetcher_(default_fetcher(std::move(fetcher), settings_)),
      decoder_(default_decoder(std::move(decoder), settings_)),
      mixer_(decoder_) {
    LOG_CPP_INFO("[Pipeline] Orchestrator ready (speech %d Hz/%d ch, mix %d Hz/%d ch)",
                 settings_->speech.sample_rate, settings_->speech.channels,
                 settings_->mixer_tuning.target_sample_rate, settings_->mixer_tuning.target_channels);
}

WavBlob PipelineOrchestrator::assemble(const std::string& speech_payload,
                                       const MusicSelection& selection,
                                       const CancellationToken* token) const {
    try {
        throw_if_cancelled(token, "decoding speech");
        if (!selection.has_music()) {
            return assemble_direct(speech_payload, token);
        }
        return assemble_mixed(speech_payload, selection, token);
    } catch (const AssemblyCancelledError& e) {
        LOG_CPP_WARNING("[Pipeline] %s", e.what());
        throw;
    } catch (const PipelineError& e) {
        LOG_CPP_ERROR("[Pipeline] Assembly failed (music: %s): %s", selection.describe().c_str(), e.what());
        throw;
    } catch (const ContractViolation& e) {
        LOG_CPP_ERROR("[Pipeline] Invalid assembly request: %s", e.what());
        throw;
    }
}

PCM16Buffer PipelineOrchestrator::decode_speech(const std::string& speech_payload) const {
    if (speech_payload.empty()) {
        throw MalformedEncodingError("received empty audio data");
    }
    RawByteBuffer bytes = decode_base64(speech_payload);
    if (bytes.empty()) {
        throw MalformedEncodingError("received empty audio data");
    }
    const SpeechFormat& speech = settings_->speech;
    return pcm16_from_bytes(bytes,
                            sanitize_sample_rate(speech.sample_rate, SPEECH_SAMPLE_RATE),
                            speech.channels > 0 ? speech.channels : SPEECH_CHANNELS);
}

WavBlob PipelineOrchestrator::assemble_direct(const std::string& speech_payload,
                                              const CancellationToken* token) const {
    PCM16Buffer speech = decode_speech(speech_payload);
    throw_if_cancelled(token, "encoding WAV");
    WavBlob wav = encode_wav(speech);
    LOG_CPP_INFO("[Pipeline] Assembled %zu frames without music (%zu bytes)", speech.frame_count(), wav.size());
    return wav;
}

MixConfig PipelineOrchestrator::build_mix_config(const MusicSelection& selection) const {
    const MixerTuning& tuning = settings_->mixer_tuning;
    if (!std::isfinite(selection.volume) || selection.volume < 0.0f || selection.volume > tuning.max_music_gain) {
        throw ContractViolation("Music volume " + std::to_string(selection.volume) + " is outside [0, " +
                                std::to_string(tuning.max_music_gain) + "]");
    }
    MixConfig config;
    config.music_gain = selection.volume;
    config.target_sample_rate = sanitize_sample_rate(tuning.target_sample_rate, SPEECH_SAMPLE_RATE);
    config.target_channel_count = tuning.target_channels > 0 ? tuning.target_channels : MIX_OUTPUT_CHANNELS;
    return config;
}

WavBlob PipelineOrchestrator::assemble_mixed(const std::string& speech_payload,
                                             const MusicSelection& selection,
                                             const CancellationToken* token) const {
    const MixConfig config = build_mix_config(selection);

    // Set when the speech stage fails so the fetch stops early.
    auto abort_fetch = std::make_shared<std::atomic<bool>>(false);
    FetchAbortCheck should_abort = [abort_fetch, token]() {
        return abort_fetch->load(std::memory_order_acquire) || (token && token->is_cancelled());
    };

    std::shared_ptr<IMusicFetcher> fetcher = fetcher_;
    std::future<RawByteBuffer> music_future = std::async(std::launch::async,
        [fetcher, selection, should_abort]() {
            return fetcher->fetch(selection, should_abort);
        });

    PCM16Buffer speech;
    try {
        speech = decode_speech(speech_payload);
        throw_if_cancelled(token, "mixing");
    } catch (...) {
        abort_fetch->store(true, std::memory_order_release);
        music_future.wait();
        throw;
    }

    RawByteBuffer music = music_future.get();
    throw_if_cancelled(token, "mixing");
    LOG_CPP_DEBUG("[Pipeline] Fetched %zu bytes of music (%s)", music.size(), selection.describe().c_str());

    PCM16Buffer mixed = mixer_.mix(speech, music, config);
    throw_if_cancelled(token, "encoding WAV");

    WavBlob wav = encode_wav(mixed);
    LOG_CPP_INFO("[Pipeline] Assembled %zu frames with music %s at gain %.3f (%zu bytes)",
                 mixed.frame_count(), selection.describe().c_str(), static_cast<double>(config.music_gain), wav.size());
    return wav;
}

} // namespace audio
} // namespace voicecast
