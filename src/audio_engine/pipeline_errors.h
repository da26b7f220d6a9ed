/**
 * @file pipeline_errors.h
 * @brief Exception types raised by the audio assembly pipeline.
 * @details `PipelineError` and its subclasses are failures a caller can react to
 *          (show a message, retry, fall back to unmixed speech).
 *          `ContractViolation` signals a caller bug such as an invalid channel
 *          count or sample rate and is not meant to be handled at runtime.
 */
#ifndef VOICECAST_PIPELINE_ERRORS_H
#define VOICECAST_PIPELINE_ERRORS_H

#include <stdexcept>
#include <string>

namespace voicecast {
namespace audio {

/** @brief Base class of all recoverable pipeline failures. */
class PipelineError : public std::runtime_error {
public:
    explicit PipelineError(const std::string& what) : std::runtime_error(what) {}
};

/** @brief The speech payload is not valid base64 or not valid PCM16. */
class MalformedEncodingError : public PipelineError {
public:
    explicit MalformedEncodingError(const std::string& what) : PipelineError(what) {}
};

/** @brief The music source could not be retrieved (including timeouts). */
class MusicFetchError : public PipelineError {
public:
    explicit MusicFetchError(const std::string& what) : PipelineError(what) {}
};

/** @brief The retrieved music bytes could not be decoded as audio. */
class MusicDecodeError : public PipelineError {
public:
    explicit MusicDecodeError(const std::string& what) : PipelineError(what) {}
};

/** @brief The caller abandoned the assembly through its CancellationToken. */
class AssemblyCancelledError : public PipelineError {
public:
    explicit AssemblyCancelledError(const std::string& what) : PipelineError(what) {}
};

/** @brief A component was handed parameters its contract forbids. */
class ContractViolation : public std::invalid_argument {
public:
    explicit ContractViolation(const std::string& what) : std::invalid_argument(what) {}
};

} // namespace audio
} // namespace voicecast

#endif // VOICECAST_PIPELINE_ERRORS_H
