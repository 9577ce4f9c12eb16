#include "LevelMeter.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace call_capture {

float LevelMeter::Rms(const int16_t* samples, size_t count) {
    if (samples == nullptr || count == 0) {
        return 0.0f;
    }

    double sumOfSquares = 0.0;
    for (size_t i = 0; i < count; ++i) {
        const double sample = samples[i];
        sumOfSquares += sample * sample;
    }

    const double rms = std::sqrt(sumOfSquares / static_cast<double>(count));
    return static_cast<float>(std::min(1.0, rms / 32768.0));
}

float LevelMeter::Rms(const std::vector<int16_t>& samples) {
    return Rms(samples.data(), samples.size());
}

float LevelMeter::Peak(const std::vector<int16_t>& samples) {
    int peak = 0;
    for (int16_t sample : samples) {
        peak = std::max(peak, std::abs(static_cast<int>(sample)));
    }
    return static_cast<float>(peak) / 32768.0f;
}

float LevelMeter::ToDbfs(float level) {
    if (level <= 0.0f) {
        return kSilenceDb;
    }
    return std::max(kSilenceDb, 20.0f * std::log10(level));
}

} // namespace call_capture
