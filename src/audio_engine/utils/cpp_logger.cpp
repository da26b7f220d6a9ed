#include "cpp_logger.h"
#include <iostream>
#include <string>
#include <vector>
#include <deque>
#include <mutex>
#include <cstdarg> // For va_list, va_start, va_end
#include <cstdio>  // For vsnprintf
#include <cstring> // For strrchr

#include <chrono> // For std::chrono::milliseconds
#include <algorithm> // For std::min
#include <condition_variable> // For std::condition_variable

namespace voicecast {
namespace audio {
namespace logging {

std::atomic<LogLevel> current_log_level{LogLevel::INFO};

namespace { // Anonymous namespace for internal linkage
    std::deque<LogEntry> internal_log_queue;
    std::mutex internal_log_queue_mutex;
    std::condition_variable internal_log_queue_cv;
    const size_t MAX_LOG_QUEUE_SIZE = 2048; // Max number of log entries in queue
    const size_t MAX_BATCH_SIZE = 100;
    bool shutdown_requested = false;
    bool overflow_message_logged_since_clear = false; // To prevent spamming overflow messages
}

void set_cpp_log_level(LogLevel level) {
    current_log_level.store(level, std::memory_order_relaxed);
}

const char* get_base_filename(const char* path) {
    if (!path) {
        return "";
    }
    const char* last_slash = strrchr(path, '/');
    const char* last_backslash = strrchr(path, '\\');

    const char* base = nullptr;
    if (last_slash && last_backslash) {
        base = (last_slash > last_backslash) ? last_slash + 1 : last_backslash + 1;
    } else if (last_slash) {
        base = last_slash + 1;
    } else if (last_backslash) {
        base = last_backslash + 1;
    } else {
        base = path; // No slashes, path is filename
    }
    return base;
}

void log_message(LogLevel level, const char* file, int line, const char* format, ...) {
    if (static_cast<int>(level) < static_cast<int>(current_log_level.load(std::memory_order_relaxed))) {
        return;
    }

    std::vector<char> buffer(1024);
    va_list args;
    va_start(args, format);
    int needed = vsnprintf(buffer.data(), buffer.size(), format, args);
    va_end(args);

    if (needed < 0) {
        std::cerr << "CppLogger: Encoding error in log_message for file " << (file ? file : "unknown_file") << ":" << line << std::endl;
        return;
    }

    if (static_cast<size_t>(needed) >= buffer.size()) {
        buffer.resize(static_cast<size_t>(needed) + 1);
        va_start(args, format);
        vsnprintf(buffer.data(), buffer.size(), format, args);
        va_end(args);
    }

    LogEntry new_entry;
    new_entry.level = level;
    new_entry.message = std::string(buffer.data());
    new_entry.filename = (file ? std::string(file) : "unknown_file");
    new_entry.line_number = line;

    {
        std::unique_lock<std::mutex> lock(internal_log_queue_mutex);
        if (shutdown_requested) {
            return;
        }

        if (internal_log_queue.size() >= MAX_LOG_QUEUE_SIZE) {
            internal_log_queue.pop_front(); // Drop oldest
            if (!overflow_message_logged_since_clear) {
                internal_log_queue.pop_front(); // Room for the notice
                LogEntry overflow_entry;
                overflow_entry.level = LogLevel::WARNING;
                overflow_entry.message = "C++ log queue overflow. Oldest messages dropped.";
                overflow_entry.filename = "cpp_logger.cpp";
                overflow_entry.line_number = __LINE__;
                internal_log_queue.push_back(std::move(overflow_entry));
                overflow_message_logged_since_clear = true;
            }
        }
        internal_log_queue.push_back(std::move(new_entry));
        lock.unlock();
        internal_log_queue_cv.notify_one();
    }
}

std::vector<LogEntry> retrieve_log_entries(int timeout_ms) {
    std::vector<LogEntry> batch;
    std::unique_lock<std::mutex> lock(internal_log_queue_mutex);

    if (!internal_log_queue_cv.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                                         []{ return !internal_log_queue.empty() || shutdown_requested; })) {
        return batch;
    }

    if (shutdown_requested && internal_log_queue.empty()) {
        return batch;
    }

    // Bound the batch so the lock is not held for long when the queue is large.
    size_t items_to_grab = std::min(internal_log_queue.size(), MAX_BATCH_SIZE);
    batch.reserve(items_to_grab);

    for (size_t i = 0; i < items_to_grab && !internal_log_queue.empty(); ++i) {
        batch.push_back(std::move(internal_log_queue.front()));
        internal_log_queue.pop_front();
    }

    if (overflow_message_logged_since_clear && internal_log_queue.size() < (MAX_LOG_QUEUE_SIZE / 2)) {
        overflow_message_logged_since_clear = false;
    }

    return batch;
}

void shutdown_cpp_logger() {
    std::unique_lock<std::mutex> lock(internal_log_queue_mutex);
    shutdown_requested = true;
    lock.unlock();
    internal_log_queue_cv.notify_all();
}

} // namespace logging
} // namespace audio
} // namespace voicecast
