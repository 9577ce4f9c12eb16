#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace call_capture {

// Capture format preset. The three presets below are fixed values that
// downstream storage estimation relies on.
struct AudioQuality {
    enum class Preset {
        HighQuality,
        Standard,
        SpaceSaving
    };

    Preset preset;
    unsigned int sampleRate;
    unsigned int bitRate;
    unsigned int channels;

    static const AudioQuality& HighQuality();
    static const AudioQuality& Standard();
    static const AudioQuality& SpaceSaving();

    // "HIGH_QUALITY", "STANDARD" or "SPACE_SAVING"
    static std::optional<AudioQuality> FromName(const std::string& name);

    std::string Name() const;
    bool IsSupported() const;
    int64_t EstimatedBytesPerMinute() const;

    bool operator==(const AudioQuality& other) const {
        return preset == other.preset;
    }
    bool operator!=(const AudioQuality& other) const { return !(*this == other); }
};

} // namespace call_capture
