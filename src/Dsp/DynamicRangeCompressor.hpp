#pragma once

#include <cstdint>
#include <vector>

namespace call_capture {

// Hard-knee compressor applied sample by sample. The part of |sample| above
// thresholdRatio * 32767 is divided by the ratio; the sign is preserved.
//
// Attack and release are kept as configuration only: gain is computed per
// sample with no envelope follower, so they do not change the output.
class DynamicRangeCompressor {
public:
    explicit DynamicRangeCompressor(float thresholdRatio = 0.7f, float ratio = 4.0f,
                                    float attackMs = 5.0f, float releaseMs = 50.0f);

    std::vector<int16_t> Process(const std::vector<int16_t>& samples) const;

    double GetThreshold() const { return _threshold; }
    float GetRatio() const { return _ratio; }
    float GetAttackMs() const { return _attackMs; }
    float GetReleaseMs() const { return _releaseMs; }

private:
    double _threshold;
    float _ratio;
    float _attackMs;
    float _releaseMs;
};

} // namespace call_capture
