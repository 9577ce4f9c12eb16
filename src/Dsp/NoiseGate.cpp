#include "NoiseGate.hpp"
#include "../common/SampleBuffer.hpp"

#include <cstdlib>
#include <stdexcept>

namespace call_capture {

NoiseGate::NoiseGate(float thresholdRatio, float reduction)
    : _threshold(kFullScale * thresholdRatio)
    , _reduction(reduction) {
    if (thresholdRatio < 0.0f || thresholdRatio > 1.0f) {
        throw std::invalid_argument("Noise gate threshold ratio must be in [0, 1]");
    }
    if (reduction < 0.0f || reduction > 1.0f) {
        throw std::invalid_argument("Noise gate reduction must be in [0, 1]");
    }
}

std::vector<int16_t> NoiseGate::Process(const std::vector<int16_t>& samples) const {
    std::vector<int16_t> result(samples);
    for (int16_t& sample : result) {
        if (std::abs(static_cast<int>(sample)) < _threshold) {
            sample = ClampToSample(sample * static_cast<double>(_reduction));
        }
    }
    return result;
}

} // namespace call_capture
