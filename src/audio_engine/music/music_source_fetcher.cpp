/**
 * @file music_source_fetcher.cpp
 * @brief Implementation of music retrieval over libcurl and the filesystem.
 */
#include "music_source_fetcher.h"
#include "../pipeline_errors.h"
#include "../utils/cpp_logger.h"

#include <curl/curl.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <mutex>
#include <utility>

namespace voicecast {
namespace audio {

namespace {

std::once_flag g_curl_init_once;
CURLcode g_curl_init_result = CURLE_OK;

void ensure_curl_initialized() {
    std::call_once(g_curl_init_once, []() {
        g_curl_init_result = curl_global_init(CURL_GLOBAL_DEFAULT);
    });
    if (g_curl_init_result != CURLE_OK) {
        throw MusicFetchError(std::string("libcurl initialization failed: ") + curl_easy_strerror(g_curl_init_result));
    }
}

struct TransferState {
    RawByteBuffer body;
    std::size_t max_bytes = 0;
    bool size_exceeded = false;
    const FetchAbortCheck* should_abort = nullptr;
    bool aborted = false;
};

size_t write_body(char* data, size_t size, size_t nmemb, void* userdata) {
    auto* state = static_cast<TransferState*>(userdata);
    const size_t incoming = size * nmemb;
    if (state->body.size() + incoming > state->max_bytes) {
        state->size_exceeded = true;
        return 0; // Makes libcurl fail the transfer with CURLE_WRITE_ERROR
    }
    state->body.insert(state->body.end(),
                       reinterpret_cast<const uint8_t*>(data),
                       reinterpret_cast<const uint8_t*>(data) + incoming);
    return incoming;
}

int on_transfer_progress(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* state = static_cast<TransferState*>(clientp);
    if (state->should_abort && *state->should_abort && (*state->should_abort)()) {
        state->aborted = true;
        return 1;
    }
    return 0;
}

template <typename T>
void set_option(CURL* handle, CURLoption option, T value, const char* name) {
    CURLcode rc = curl_easy_setopt(handle, option, value);
    if (rc != CURLE_OK) {
        throw MusicFetchError(std::string("Failed to configure music download (") + name + "): " + curl_easy_strerror(rc));
    }
}

bool abort_requested(const FetchAbortCheck& should_abort) {
    return should_abort && should_abort();
}

} // namespace

std::string local_path_from_location(const std::string& location) {
    static const std::string kFileScheme = "file://";
    if (location.rfind(kFileScheme, 0) != 0) {
        return location;
    }
    std::string rest = location.substr(kFileScheme.size());
    static const std::string kLocalhost = "localhost";
    if (rest.rfind(kLocalhost, 0) == 0) {
        rest = rest.substr(kLocalhost.size());
    }
    return rest;
}

MusicSourceFetcher::MusicSourceFetcher(std::shared_ptr<PipelineSettings> settings)
    : settings_(resolve_settings(settings)) {}

RawByteBuffer MusicSourceFetcher::fetch(const MusicSelection& selection, const FetchAbortCheck& should_abort) {
    switch (selection.kind) {
        case MusicSourceKind::URL:
            return fetch_url(selection.location, should_abort);
        case MusicSourceKind::LOCAL_FILE:
            return fetch_file(selection.location, should_abort);
        case MusicSourceKind::IN_MEMORY:
            if (selection.data.empty()) {
                throw MusicFetchError("Custom music was selected but no file was uploaded.");
            }
            if (selection.data.size() > sanitize_max_download_bytes(settings_->fetch_tuning.max_download_bytes)) {
                throw MusicFetchError("Uploaded music file exceeds the size limit.");
            }
            LOG_CPP_DEBUG("[MusicFetcher] Using uploaded music (%zu bytes).", selection.data.size());
            return selection.data;
        case MusicSourceKind::NONE:
            break;
    }
    throw ContractViolation("MusicSourceFetcher::fetch called without a music selection");
}

RawByteBuffer MusicSourceFetcher::fetch_url(const std::string& url, const FetchAbortCheck& should_abort) {
    ensure_curl_initialized();
    const FetchTuning& tuning = settings_->fetch_tuning;

    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> handle(curl_easy_init(), &curl_easy_cleanup);
    if (!handle) {
        throw MusicFetchError("Failed to fetch music file: curl_easy_init() failed");
    }

    TransferState state;
    state.max_bytes = sanitize_max_download_bytes(tuning.max_download_bytes);
    state.should_abort = &should_abort;

    char error_buffer[CURL_ERROR_SIZE];
    error_buffer[0] = '\0';

    CURL* curl = handle.get();
    set_option(curl, CURLOPT_URL, url.c_str(), "url");
    set_option(curl, CURLOPT_ERRORBUFFER, error_buffer, "error buffer");
    set_option(curl, CURLOPT_WRITEFUNCTION, &write_body, "write function");
    set_option(curl, CURLOPT_WRITEDATA, static_cast<void*>(&state), "write data");
    set_option(curl, CURLOPT_XFERINFOFUNCTION, &on_transfer_progress, "progress function");
    set_option(curl, CURLOPT_XFERINFODATA, static_cast<void*>(&state), "progress data");
    set_option(curl, CURLOPT_NOPROGRESS, 0L, "progress");
    set_option(curl, CURLOPT_NOSIGNAL, 1L, "nosignal");
    set_option(curl, CURLOPT_FAILONERROR, 1L, "fail on error");
    set_option(curl, CURLOPT_CONNECTTIMEOUT_MS, sanitize_timeout_ms(tuning.connect_timeout_ms, kDefaultConnectTimeoutMs), "connect timeout");
    set_option(curl, CURLOPT_TIMEOUT_MS, sanitize_timeout_ms(tuning.total_timeout_ms, kDefaultTotalTimeoutMs), "timeout");
    set_option(curl, CURLOPT_FOLLOWLOCATION, tuning.follow_redirects ? 1L : 0L, "follow location");
    set_option(curl, CURLOPT_MAXREDIRS, tuning.max_redirects, "max redirects");
    set_option(curl, CURLOPT_USERAGENT, tuning.user_agent.c_str(), "user agent");

    LOG_CPP_INFO("[MusicFetcher] Downloading music from %s", url.c_str());
    CURLcode rc = curl_easy_perform(curl);

    if (state.aborted || rc == CURLE_ABORTED_BY_CALLBACK) {
        LOG_CPP_WARNING("[MusicFetcher] Download of %s abandoned.", url.c_str());
        throw AssemblyCancelledError("Music download was cancelled.");
    }
    if (state.size_exceeded) {
        throw MusicFetchError("Failed to fetch music file: response exceeds " + std::to_string(state.max_bytes) + " bytes");
    }
    if (rc != CURLE_OK) {
        long status = 0;
        if (rc == CURLE_HTTP_RETURNED_ERROR &&
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status) == CURLE_OK && status > 0) {
            throw MusicFetchError("Failed to fetch music file: HTTP status " + std::to_string(status));
        }
        const std::string detail = error_buffer[0] != '\0' ? std::string(error_buffer) : std::string(curl_easy_strerror(rc));
        throw MusicFetchError("Failed to fetch music file: " + detail);
    }

    long status = 0;
    if (curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status) == CURLE_OK && status >= 300) {
        throw MusicFetchError("Failed to fetch music file: HTTP status " + std::to_string(status));
    }

    LOG_CPP_INFO("[MusicFetcher] Downloaded %zu bytes from %s", state.body.size(), url.c_str());
    return std::move(state.body);
}

RawByteBuffer MusicSourceFetcher::fetch_file(const std::string& location, const FetchAbortCheck& should_abort) {
    if (abort_requested(should_abort)) {
        throw AssemblyCancelledError("Music file read was cancelled.");
    }

    const std::string path = local_path_from_location(location);
    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in.is_open()) {
        throw MusicFetchError("Failed to open music file '" + path + "': " + std::strerror(errno));
    }

    const std::streamoff size = in.tellg();
    if (size < 0) {
        throw MusicFetchError("Failed to determine the size of music file '" + path + "'");
    }
    const std::size_t max_bytes = sanitize_max_download_bytes(settings_->fetch_tuning.max_download_bytes);
    if (static_cast<std::size_t>(size) > max_bytes) {
        throw MusicFetchError("Music file '" + path + "' exceeds " + std::to_string(max_bytes) + " bytes");
    }

    RawByteBuffer bytes(static_cast<std::size_t>(size));
    in.seekg(0, std::ios::beg);
    if (!bytes.empty() && !in.read(reinterpret_cast<char*>(bytes.data()), size)) {
        throw MusicFetchError("Failed to read music file '" + path + "'");
    }

    if (abort_requested(should_abort)) {
        throw AssemblyCancelledError("Music file read was cancelled.");
    }
    LOG_CPP_DEBUG("[MusicFetcher] Read %zu bytes from %s", bytes.size(), path.c_str());
    return bytes;
}

} // namespace audio
} // namespace voicecast
