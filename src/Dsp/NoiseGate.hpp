#pragma once

#include <cstdint>
#include <vector>

namespace call_capture {

/**
 * Instantaneous noise gate.
 *
 * Samples whose magnitude is below thresholdRatio * 32767 are multiplied by
 * the reduction factor, everything else passes through. There is no
 * attack/release envelope, so a signal hovering around the threshold can
 * produce audible clicks.
 */
class NoiseGate {
public:
    explicit NoiseGate(float thresholdRatio = 0.01f, float reduction = 0.3f);

    std::vector<int16_t> Process(const std::vector<int16_t>& samples) const;

    double GetThreshold() const { return _threshold; }
    float GetReduction() const { return _reduction; }

private:
    double _threshold;
    float _reduction;
};

} // namespace call_capture
