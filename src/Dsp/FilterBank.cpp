#include "FilterBank.hpp"
#include "../common/SampleBuffer.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace call_capture {

namespace {

struct RcTerms {
    double rc;
    double dt;
};

RcTerms ComputeRc(float cutoffHz, unsigned int sampleRate, unsigned int channels) {
    if (!(cutoffHz > 0.0f)) {
        throw std::invalid_argument("Filter cutoff must be positive");
    }
    if (sampleRate == 0 || channels == 0) {
        throw std::invalid_argument("Filter needs a sample rate and channel count");
    }
    return {1.0 / (2.0 * M_PI * cutoffHz), 1.0 / sampleRate};
}

// The recursion runs on the unrounded output; feeding back the rounded
// sample stalls the decay a few LSB away from zero.
double ClampToRange(double value) {
    return std::min(static_cast<double>(kSampleMax), std::max(static_cast<double>(kSampleMin), value));
}

} // namespace

std::vector<int16_t> FilterBank::LowPass(const std::vector<int16_t>& samples, float cutoffHz,
                                         unsigned int sampleRate, unsigned int channels) {
    const RcTerms terms = ComputeRc(cutoffHz, sampleRate, channels);
    if (samples.empty()) {
        return {};
    }

    const double alpha = terms.dt / (terms.rc + terms.dt);
    std::vector<int16_t> filtered(samples.size());

    for (size_t ch = 0; ch < channels && ch < samples.size(); ++ch) {
        filtered[ch] = samples[ch];
        double previous = samples[ch];
        for (size_t i = ch + channels; i < samples.size(); i += channels) {
            previous = ClampToRange(alpha * samples[i] + (1.0 - alpha) * previous);
            filtered[i] = ClampToSample(previous);
        }
    }
    return filtered;
}

std::vector<int16_t> FilterBank::HighPass(const std::vector<int16_t>& samples, float cutoffHz,
                                          unsigned int sampleRate, unsigned int channels) {
    const RcTerms terms = ComputeRc(cutoffHz, sampleRate, channels);
    if (samples.empty()) {
        return {};
    }

    const double alpha = terms.rc / (terms.rc + terms.dt);
    std::vector<int16_t> filtered(samples.size());

    for (size_t ch = 0; ch < channels && ch < samples.size(); ++ch) {
        filtered[ch] = samples[ch];
        double previous = samples[ch];
        for (size_t i = ch + channels; i < samples.size(); i += channels) {
            previous = ClampToRange(alpha * (previous + samples[i] - samples[i - channels]));
            filtered[i] = ClampToSample(previous);
        }
    }
    return filtered;
}

} // namespace call_capture
