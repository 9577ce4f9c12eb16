#include "Normalizer.hpp"
#include "../common/SampleBuffer.hpp"

#include <algorithm>
#include <cstdlib>

namespace call_capture {

int Normalizer::PeakAmplitude(const std::vector<int16_t>& samples) {
    int peak = 0;
    for (int16_t sample : samples) {
        peak = std::max(peak, std::abs(static_cast<int>(sample)));
    }
    return peak;
}

std::vector<int16_t> Normalizer::Normalize(const std::vector<int16_t>& samples) {
    const int peak = PeakAmplitude(samples);
    if (peak == 0) {
        return samples;
    }

    const double factor = kFullScale / peak;
    std::vector<int16_t> result(samples.size());
    for (size_t i = 0; i < samples.size(); ++i) {
        result[i] = ClampToSample(samples[i] * factor);
    }
    return result;
}

} // namespace call_capture
