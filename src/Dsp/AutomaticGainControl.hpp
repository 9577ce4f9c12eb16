#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace call_capture {

// Single-shot AGC: measures the RMS of a window and applies the gain that
// brings it to the target level, limited to +/- maxGainDb.
class AutomaticGainControl {
public:
    explicit AutomaticGainControl(float targetLevel = 0.5f, float maxGainDb = 20.0f);

    // 0 dB for a silent window
    float RequiredGainDb(float currentLevel) const;

    std::vector<int16_t> Process(const std::vector<int16_t>& samples) const;

    // Chunk variant used on the capture thread. in and out may alias.
    // Returns the gain that was applied.
    float Process(const int16_t* in, int16_t* out, size_t count) const;

    float GetTargetLevel() const { return _targetLevel; }
    float GetMaxGainDb() const { return _maxGainDb; }

private:
    float _targetLevel;
    float _maxGainDb;
};

} // namespace call_capture
