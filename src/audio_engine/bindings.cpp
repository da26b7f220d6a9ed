/**
 * @file bindings.cpp
 * @brief Defines the Python module for the voicecast C++ audio engine.
 * @details This file uses pybind11 to create the `voicecast_audio_engine` Python module.
 *          The binding functions below are called in dependency order: logger,
 *          exceptions, audio types, settings, then the pipeline itself.
 */
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "audio_types.h"
#include "audio_constants.h"
#include "pipeline_errors.h"
#include "codec/base64_decoder.h"
#include "codec/wav_encoder.h"
#include "configuration/pipeline_settings.h"
#include "pipeline/pipeline_orchestrator.h"
#include "utils/cpp_logger.h"

#include <memory>
#include <string>
#include <tuple>
#include <vector>

namespace py = pybind11;
using namespace voicecast;

namespace {

py::bytes to_py_bytes(const std::vector<uint8_t>& data) {
    return py::bytes(reinterpret_cast<const char*>(data.data()), data.size());
}

audio::RawByteBuffer from_py_bytes(const py::bytes& data) {
    std::string raw = data; // copies out of the Python object
    return audio::RawByteBuffer(raw.begin(), raw.end());
}

void bind_logger(py::module_& m) {
    using namespace audio::logging;
    py::enum_<LogLevel>(m, "LogLevel_CPP")
        .value("DEBUG", LogLevel::DEBUG)
        .value("INFO", LogLevel::INFO)
        .value("WARNING", LogLevel::WARNING)
        .value("ERROR", LogLevel::ERR)
        .export_values();

    m.def("get_cpp_log_messages", [](int timeout_ms) {
        std::vector<std::tuple<LogLevel, std::string, std::string, int>> entries_tuples;
        std::vector<LogEntry> cpp_entries;

        {
            py::gil_scoped_release release_gil;
            cpp_entries = retrieve_log_entries(timeout_ms);
        }

        for (const auto& entry : cpp_entries) {
            entries_tuples.emplace_back(entry.level, entry.message, entry.filename, entry.line_number);
        }
        return entries_tuples;
    }, py::arg("timeout_ms") = 100,
       "Retrieves buffered C++ log messages, blocking until messages are available or timeout occurs (in ms). Returns a list of (level, message, filename, line) tuples.");

    m.def("shutdown_cpp_logger", &shutdown_cpp_logger,
          "Signals the C++ logger to prepare for shutdown, unblocking any waiting log retrieval calls.");

    m.def("set_cpp_log_level", &set_cpp_log_level,
          py::arg("level"),
          "Sets the C++ global log level.");
}

void bind_errors(py::module_& m) {
    // Translators run newest first, so subclasses are registered after the base.
    auto& pipeline_error = py::register_exception<audio::PipelineError>(m, "PipelineError", PyExc_RuntimeError);
    py::register_exception<audio::MalformedEncodingError>(m, "MalformedEncodingError", pipeline_error.ptr());
    py::register_exception<audio::MusicFetchError>(m, "MusicFetchError", pipeline_error.ptr());
    py::register_exception<audio::MusicDecodeError>(m, "MusicDecodeError", pipeline_error.ptr());
    py::register_exception<audio::AssemblyCancelledError>(m, "AssemblyCancelledError", pipeline_error.ptr());
    py::register_exception<audio::ContractViolation>(m, "ContractViolation", PyExc_ValueError);
}

void bind_audio_types(py::module_& m) {
    py::enum_<audio::MusicSourceKind>(m, "MusicSourceKind")
        .value("NONE", audio::MusicSourceKind::NONE)
        .value("URL", audio::MusicSourceKind::URL)
        .value("LOCAL_FILE", audio::MusicSourceKind::LOCAL_FILE)
        .value("IN_MEMORY", audio::MusicSourceKind::IN_MEMORY);

    py::class_<audio::MusicSelection>(m, "MusicSelection", "Background music choice for one assembly")
        .def(py::init<>())
        .def_readwrite("kind", &audio::MusicSelection::kind)
        .def_readwrite("location", &audio::MusicSelection::location)
        .def_readwrite("volume", &audio::MusicSelection::volume)
        .def_property_readonly("has_music", &audio::MusicSelection::has_music)
        .def_static("from_value", &audio::MusicSelection::from_value,
                    py::arg("value"), py::arg("volume") = audio::DEFAULT_MUSIC_GAIN,
                    "Builds a selection from a UI value: '' or 'none', an http(s) URL, or a file path.")
        .def_static("from_bytes", [](const py::bytes& data, float volume) {
            return audio::MusicSelection::from_bytes(from_py_bytes(data), volume);
        }, py::arg("data"), py::arg("volume") = audio::DEFAULT_MUSIC_GAIN,
           "Builds a selection from the contents of an uploaded music file.")
        .def("__repr__", [](const audio::MusicSelection& self) {
            return "<MusicSelection " + self.describe() + ">";
        });

    py::class_<audio::CancellationToken, std::shared_ptr<audio::CancellationToken>>(m, "CancellationToken")
        .def(py::init<>())
        .def("cancel", &audio::CancellationToken::cancel)
        .def_property_readonly("is_cancelled", &audio::CancellationToken::is_cancelled);
}

void bind_settings(py::module_& m) {
    py::enum_<audio::ResamplerQuality>(m, "ResamplerQuality")
        .value("SINC_BEST", audio::ResamplerQuality::SINC_BEST)
        .value("SINC_MEDIUM", audio::ResamplerQuality::SINC_MEDIUM)
        .value("SINC_FASTEST", audio::ResamplerQuality::SINC_FASTEST)
        .value("ZERO_ORDER_HOLD", audio::ResamplerQuality::ZERO_ORDER_HOLD)
        .value("LINEAR", audio::ResamplerQuality::LINEAR);

    py::class_<audio::SpeechFormat>(m, "SpeechFormat")
        .def(py::init<>())
        .def_readwrite("sample_rate", &audio::SpeechFormat::sample_rate)
        .def_readwrite("channels", &audio::SpeechFormat::channels);

    py::class_<audio::MixerTuning>(m, "MixerTuning")
        .def(py::init<>())
        .def_readwrite("target_sample_rate", &audio::MixerTuning::target_sample_rate)
        .def_readwrite("target_channels", &audio::MixerTuning::target_channels)
        .def_readwrite("default_music_gain", &audio::MixerTuning::default_music_gain)
        .def_readwrite("max_music_gain", &audio::MixerTuning::max_music_gain);

    py::class_<audio::FetchTuning>(m, "FetchTuning")
        .def(py::init<>())
        .def_readwrite("connect_timeout_ms", &audio::FetchTuning::connect_timeout_ms)
        .def_readwrite("total_timeout_ms", &audio::FetchTuning::total_timeout_ms)
        .def_readwrite("max_download_bytes", &audio::FetchTuning::max_download_bytes)
        .def_readwrite("follow_redirects", &audio::FetchTuning::follow_redirects)
        .def_readwrite("max_redirects", &audio::FetchTuning::max_redirects)
        .def_readwrite("user_agent", &audio::FetchTuning::user_agent);

    py::class_<audio::DecoderTuning>(m, "DecoderTuning")
        .def(py::init<>())
        .def_readwrite("resampler_quality", &audio::DecoderTuning::resampler_quality)
        .def_readwrite("mp3_feed_chunk_bytes", &audio::DecoderTuning::mp3_feed_chunk_bytes)
        .def_readwrite("max_decoded_frames", &audio::DecoderTuning::max_decoded_frames);

    py::class_<audio::PipelineSettings, std::shared_ptr<audio::PipelineSettings>>(m, "PipelineSettings")
        .def(py::init<>())
        .def_readwrite("speech", &audio::PipelineSettings::speech)
        .def_readwrite("mixer_tuning", &audio::PipelineSettings::mixer_tuning)
        .def_readwrite("fetch_tuning", &audio::PipelineSettings::fetch_tuning)
        .def_readwrite("decoder_tuning", &audio::PipelineSettings::decoder_tuning);
}

void bind_pipeline(py::module_& m) {
    py::class_<audio::PipelineOrchestrator, std::shared_ptr<audio::PipelineOrchestrator>>(
        m, "PipelineOrchestrator", "Turns base64 speech into a WAV file, optionally mixed with background music")
        .def(py::init([](std::shared_ptr<audio::PipelineSettings> settings) {
            return std::make_shared<audio::PipelineOrchestrator>(std::move(settings));
        }), py::arg("settings") = nullptr)
        .def("assemble", [](const audio::PipelineOrchestrator& self,
                            const std::string& payload,
                            const audio::MusicSelection& selection,
                            std::shared_ptr<audio::CancellationToken> token) {
            audio::WavBlob wav;
            {
                py::gil_scoped_release release_gil;
                wav = self.assemble(payload, selection, token.get());
            }
            return to_py_bytes(wav);
        }, py::arg("payload"), py::arg("selection"), py::arg("token") = nullptr,
           "Assembles a WAV file. Releases the GIL for the whole call.")
        .def_property_readonly("settings", &audio::PipelineOrchestrator::settings);

    m.def("pcm_to_wav", [](const py::bytes& pcm, int sample_rate, int channels) {
        audio::RawByteBuffer bytes = from_py_bytes(pcm);
        return to_py_bytes(audio::encode_wav_from_bytes(bytes, sample_rate, channels));
    }, py::arg("pcm"), py::arg("sample_rate") = audio::SPEECH_SAMPLE_RATE, py::arg("channels") = audio::SPEECH_CHANNELS,
       "Wraps little-endian PCM16 bytes in a 44-byte WAV header.");

    m.def("decode_base64", [](const std::string& text) {
        return to_py_bytes(audio::decode_base64(text));
    }, py::arg("text"), "Decodes base64 the way browsers' atob does.");
}

} // namespace

/**
 * @brief The main entry point for the pybind11 module definition.
 * @param m A `py::module_` object representing the Python module being created.
 */
PYBIND11_MODULE(voicecast_audio_engine, m) {
    m.doc() = "voicecast C++ audio assembly engine";

    // 1. Logger has no dependencies on other bound types
    bind_logger(m);

    // 2. Exceptions before anything that can raise them
    bind_errors(m);

    // 3. Audio types and settings are used by the pipeline bindings
    bind_audio_types(m);
    bind_settings(m);

    // 4. Pipeline
    bind_pipeline(m);

    // --- Bind Global Constants ---
    m.attr("SPEECH_SAMPLE_RATE") = py::int_(audio::SPEECH_SAMPLE_RATE);
    m.attr("DEFAULT_MUSIC_GAIN") = py::float_(audio::DEFAULT_MUSIC_GAIN);
}
