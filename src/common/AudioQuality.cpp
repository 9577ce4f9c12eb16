#include "AudioQuality.hpp"

namespace call_capture {

const AudioQuality& AudioQuality::HighQuality() {
    static const AudioQuality quality{Preset::HighQuality, 48000, 128000, 2};
    return quality;
}

const AudioQuality& AudioQuality::Standard() {
    static const AudioQuality quality{Preset::Standard, 44100, 64000, 1};
    return quality;
}

const AudioQuality& AudioQuality::SpaceSaving() {
    static const AudioQuality quality{Preset::SpaceSaving, 22050, 32000, 1};
    return quality;
}

std::optional<AudioQuality> AudioQuality::FromName(const std::string& name) {
    if (name == "HIGH_QUALITY") return HighQuality();
    if (name == "STANDARD") return Standard();
    if (name == "SPACE_SAVING") return SpaceSaving();
    return std::nullopt;
}

std::string AudioQuality::Name() const {
    switch (preset) {
        case Preset::HighQuality: return "HIGH_QUALITY";
        case Preset::Standard: return "STANDARD";
        case Preset::SpaceSaving: return "SPACE_SAVING";
    }
    return "UNKNOWN";
}

bool AudioQuality::IsSupported() const {
    return sampleRate > 0 && bitRate > 0 && channels >= 1 && channels <= 2;
}

int64_t AudioQuality::EstimatedBytesPerMinute() const {
    return static_cast<int64_t>(bitRate) * 60 / 8;
}

} // namespace call_capture
