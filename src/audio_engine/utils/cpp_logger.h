/**
 * @file cpp_logger.h
 * @brief Defines the logging framework for the voicecast audio engine.
 * @details Log messages produced by the C++ pipeline are queued in-process and
 *          retrieved in batches by the Python layer (see bindings.cpp). The file
 *          provides log levels, the log entry structure and the LOG_CPP_* macros.
 */
#ifndef VOICECAST_CPP_LOGGER_H
#define VOICECAST_CPP_LOGGER_H

#include <string>
#include <vector>
#include <atomic>

namespace voicecast {
namespace audio {
namespace logging {

/**
 * @enum LogLevel
 * @brief Defines the severity levels for log messages.
 */
enum class LogLevel {
    DEBUG,   ///< Detailed information, typically of interest only when diagnosing problems.
    INFO,    ///< Confirmation that things are working as expected.
    WARNING, ///< Something unexpected happened, or a call was abandoned.
    ERR      ///< A pipeline call failed.
};

/** @brief Global atomic variable to hold the current log level. */
extern std::atomic<LogLevel> current_log_level;

/**
 * @struct LogEntry
 * @brief Represents a single log message.
 */
struct LogEntry {
    LogLevel level;         ///< The severity level of the log message.
    std::string message;    ///< The log message content.
    std::string filename;   ///< The source file where the log was generated.
    int line_number;        ///< The line number in the source file.
};

/**
 * @brief Retrieves the currently buffered log entries.
 * @details Blocks until messages are available, shutdown is requested or the
 *          timeout expires. At most 100 entries are returned per call.
 * @param timeout_ms The maximum time to wait in milliseconds.
 * @return A vector of `LogEntry` objects, empty on timeout.
 */
std::vector<LogEntry> retrieve_log_entries(int timeout_ms = 100);

/**
 * @brief Signals the logger to prepare for shutdown.
 * @details Unblocks any thread waiting in `retrieve_log_entries`. Messages logged
 *          after this call are discarded.
 */
void shutdown_cpp_logger();

/**
 * @brief Sets the global log level.
 * @param level Messages below this level are ignored.
 */
void set_cpp_log_level(LogLevel level);

/**
 * @brief Formats a printf-style message and appends it to the log queue.
 * @param level The log level.
 * @param file The source file name.
 * @param line The source line number.
 * @param format The printf-style format string.
 * @param ... Arguments for the format string.
 */
void log_message(LogLevel level, const char* file, int line, const char* format, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 4, 5)))
#endif
    ;

/**
 * @brief Extracts the base filename from a full path.
 * @param path The full path to the file.
 * @return A pointer into `path` at the start of the base filename.
 */
const char* get_base_filename(const char* path);

} // namespace logging
} // namespace audio
} // namespace voicecast

/**
 * @def LOG_CPP_BASE
 * @brief A base macro for logging. Not intended for direct use.
 */
#define LOG_CPP_BASE(level, fmt, ...) \
    voicecast::audio::logging::log_message( \
        level, \
        voicecast::audio::logging::get_base_filename(__FILE__), \
        __LINE__, \
        fmt, \
        ##__VA_ARGS__)

/** @def LOG_CPP_DEBUG(fmt, ...) @brief Logs a message at the DEBUG level. */
#define LOG_CPP_DEBUG(fmt, ...)   LOG_CPP_BASE(voicecast::audio::logging::LogLevel::DEBUG, fmt, ##__VA_ARGS__)
/** @def LOG_CPP_INFO(fmt, ...) @brief Logs a message at the INFO level. */
#define LOG_CPP_INFO(fmt, ...)    LOG_CPP_BASE(voicecast::audio::logging::LogLevel::INFO, fmt, ##__VA_ARGS__)
/** @def LOG_CPP_WARNING(fmt, ...) @brief Logs a message at the WARNING level. */
#define LOG_CPP_WARNING(fmt, ...) LOG_CPP_BASE(voicecast::audio::logging::LogLevel::WARNING, fmt, ##__VA_ARGS__)
/** @def LOG_CPP_ERROR(fmt, ...) @brief Logs a message at the ERROR level. */
#define LOG_CPP_ERROR(fmt, ...)   LOG_CPP_BASE(voicecast::audio::logging::LogLevel::ERR, fmt, ##__VA_ARGS__)

#endif // VOICECAST_CPP_LOGGER_H
