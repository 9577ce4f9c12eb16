#include "DynamicRangeCompressor.hpp"
#include "../common/SampleBuffer.hpp"

#include <cstdlib>
#include <stdexcept>

namespace call_capture {

DynamicRangeCompressor::DynamicRangeCompressor(float thresholdRatio, float ratio,
                                               float attackMs, float releaseMs)
    : _threshold(kFullScale * thresholdRatio)
    , _ratio(ratio)
    , _attackMs(attackMs)
    , _releaseMs(releaseMs) {
    if (thresholdRatio < 0.0f || thresholdRatio > 1.0f) {
        throw std::invalid_argument("Compressor threshold ratio must be in [0, 1]");
    }
    if (ratio < 1.0f) {
        throw std::invalid_argument("Compressor ratio must be at least 1");
    }
}

std::vector<int16_t> DynamicRangeCompressor::Process(const std::vector<int16_t>& samples) const {
    std::vector<int16_t> result(samples);
    for (int16_t& sample : result) {
        const int value = sample;
        const double amplitude = std::abs(value);
        if (amplitude > _threshold) {
            const double compressed = _threshold + (amplitude - _threshold) / _ratio;
            sample = ClampToSample(value >= 0 ? compressed : -compressed);
        }
    }
    return result;
}

} // namespace call_capture
