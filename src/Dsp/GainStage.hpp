#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace call_capture {

// Linear gain with a hard clip to the int16 range. There is no soft knee or
// look-ahead: samples pushed past full scale are truncated to 32767 / -32768.
class GainStage {
public:
    static double DbToLinear(float gainDb);

    // in and out may point to the same storage
    static void ApplyGain(const int16_t* in, int16_t* out, size_t count, float gainDb);

    static std::vector<int16_t> ApplyGain(const std::vector<int16_t>& samples, float gainDb);
};

} // namespace call_capture
