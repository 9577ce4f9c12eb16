#pragma once

#include <cstdint>
#include <vector>

namespace call_capture {

// Peak normalization to full scale. Needs the whole buffer: one pass to find
// the peak, one to scale.
class Normalizer {
public:
    // Returns the input unchanged when it is empty or silent
    static std::vector<int16_t> Normalize(const std::vector<int16_t>& samples);

    static int PeakAmplitude(const std::vector<int16_t>& samples);
};

} // namespace call_capture
