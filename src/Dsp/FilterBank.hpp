#pragma once

#include <cstdint>
#include <vector>

namespace call_capture {

/**
 * First-order RC filters.
 *
 * Each channel of an interleaved buffer is filtered independently. The first
 * frame is copied through unchanged and every output is clamped to the int16
 * range. An empty input yields an empty output.
 */
class FilterBank {
public:
    static constexpr unsigned int kDefaultSampleRate = 44100;

    /**
     * out[i] = alpha * in[i] + (1 - alpha) * out[i - 1]
     * with rc = 1 / (2 * pi * cutoff), dt = 1 / sampleRate, alpha = dt / (rc + dt)
     */
    static std::vector<int16_t> LowPass(const std::vector<int16_t>& samples, float cutoffHz,
                                        unsigned int sampleRate = kDefaultSampleRate,
                                        unsigned int channels = 1);

    /**
     * out[i] = alpha * (out[i - 1] + in[i] - in[i - 1])
     * with alpha = rc / (rc + dt)
     */
    static std::vector<int16_t> HighPass(const std::vector<int16_t>& samples, float cutoffHz,
                                         unsigned int sampleRate = kDefaultSampleRate,
                                         unsigned int channels = 1);
};

} // namespace call_capture
