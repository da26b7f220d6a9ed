#include "audio_types.h"

#include <utility>

namespace voicecast {
namespace audio {

namespace {

bool starts_with(const std::string& value, const char* prefix) {
    return value.rfind(prefix, 0) == 0;
}

} // namespace

MusicSelection MusicSelection::from_value(const std::string& value, float volume) {
    MusicSelection selection;
    selection.volume = volume;
    if (value.empty() || value == MUSIC_SELECTION_NONE) {
        selection.kind = MusicSourceKind::NONE;
        return selection;
    }
    selection.location = value;
    if (starts_with(value, "http://") || starts_with(value, "https://")) {
        selection.kind = MusicSourceKind::URL;
    } else {
        selection.kind = MusicSourceKind::LOCAL_FILE;
    }
    return selection;
}

MusicSelection MusicSelection::from_bytes(RawByteBuffer bytes, float volume) {
    MusicSelection selection;
    selection.kind = MusicSourceKind::IN_MEMORY;
    selection.location = "upload";
    selection.data = std::move(bytes);
    selection.volume = volume;
    return selection;
}

std::string MusicSelection::describe() const {
    switch (kind) {
        case MusicSourceKind::NONE:
            return "none";
        case MusicSourceKind::URL:
            return "url:" + location;
        case MusicSourceKind::LOCAL_FILE:
            return "file:" + location;
        case MusicSourceKind::IN_MEMORY:
            return "upload(" + std::to_string(data.size()) + " bytes)";
    }
    return "unknown";
}

} // namespace audio
} // namespace voicecast
