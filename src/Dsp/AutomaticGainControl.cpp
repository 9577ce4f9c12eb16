#include "AutomaticGainControl.hpp"
#include "GainStage.hpp"
#include "LevelMeter.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace call_capture {

AutomaticGainControl::AutomaticGainControl(float targetLevel, float maxGainDb)
    : _targetLevel(targetLevel)
    , _maxGainDb(maxGainDb) {
    if (!(targetLevel > 0.0f && targetLevel <= 1.0f)) {
        throw std::invalid_argument("AGC target level must be in (0, 1]");
    }
    if (maxGainDb < 0.0f) {
        throw std::invalid_argument("AGC max gain must not be negative");
    }
}

float AutomaticGainControl::RequiredGainDb(float currentLevel) const {
    if (currentLevel <= 0.0f) {
        return 0.0f;
    }
    const float requiredDb = 20.0f * std::log10(_targetLevel / currentLevel);
    return std::clamp(requiredDb, -_maxGainDb, _maxGainDb);
}

std::vector<int16_t> AutomaticGainControl::Process(const std::vector<int16_t>& samples) const {
    const float currentLevel = LevelMeter::Rms(samples);
    if (currentLevel <= 0.0f) {
        return samples;
    }
    return GainStage::ApplyGain(samples, RequiredGainDb(currentLevel));
}

float AutomaticGainControl::Process(const int16_t* in, int16_t* out, size_t count) const {
    const float currentLevel = LevelMeter::Rms(in, count);
    if (currentLevel <= 0.0f) {
        if (in != out) {
            std::copy(in, in + count, out);
        }
        return 0.0f;
    }
    const float gainDb = RequiredGainDb(currentLevel);
    GainStage::ApplyGain(in, out, count, gainDb);
    return gainDb;
}

} // namespace call_capture
