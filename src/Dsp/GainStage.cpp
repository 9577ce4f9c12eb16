#include "GainStage.hpp"
#include "../common/SampleBuffer.hpp"

#include <cmath>

namespace call_capture {

double GainStage::DbToLinear(float gainDb) {
    return std::pow(10.0, static_cast<double>(gainDb) / 20.0);
}

void GainStage::ApplyGain(const int16_t* in, int16_t* out, size_t count, float gainDb) {
    const double linear = DbToLinear(gainDb);
    for (size_t i = 0; i < count; ++i) {
        out[i] = ClampToSample(in[i] * linear);
    }
}

std::vector<int16_t> GainStage::ApplyGain(const std::vector<int16_t>& samples, float gainDb) {
    std::vector<int16_t> result(samples.size());
    ApplyGain(samples.data(), result.data(), samples.size(), gainDb);
    return result;
}

} // namespace call_capture
