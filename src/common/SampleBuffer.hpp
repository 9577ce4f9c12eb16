#pragma once

#include <cmath>
#include <cstdint>
#include <vector>

namespace call_capture {

constexpr int16_t kSampleMax = 32767;
constexpr int16_t kSampleMin = -32768;
constexpr double kFullScale = 32767.0;

// Interleaved 16-bit PCM with its format. Stages take buffers by const
// reference and return new ones.
struct SampleBuffer {
    std::vector<int16_t> samples;
    unsigned int sampleRate = 44100;
    unsigned int channels = 1;

    size_t Frames() const { return channels == 0 ? 0 : samples.size() / channels; }
    bool Empty() const { return samples.empty(); }

    int64_t DurationMs() const {
        if (sampleRate == 0) return 0;
        return static_cast<int64_t>(Frames()) * 1000 / sampleRate;
    }
};

// Hard clip to the int16 range, rounding to the nearest integer
inline int16_t ClampToSample(double value) {
    if (value >= static_cast<double>(kSampleMax)) return kSampleMax;
    if (value <= static_cast<double>(kSampleMin)) return kSampleMin;
    return static_cast<int16_t>(std::lround(value));
}

} // namespace call_capture
