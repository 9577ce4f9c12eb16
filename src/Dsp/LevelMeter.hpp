#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace call_capture {

// Stateless loudness measurements over a window of samples
class LevelMeter {
public:
    // sqrt(mean(sample^2)) / 32768, 0 for an empty window. Always in [0, 1].
    static float Rms(const int16_t* samples, size_t count);
    static float Rms(const std::vector<int16_t>& samples);

    // max(|sample|) / 32768
    static float Peak(const std::vector<int16_t>& samples);

    // Level in dBFS, floored at kSilenceDb
    static float ToDbfs(float level);

    static constexpr float kSilenceDb = -96.0f;
};

} // namespace call_capture
