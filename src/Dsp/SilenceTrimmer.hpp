#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace call_capture {

// Shortens long silent stretches. A frame is silent when every channel is
// below thresholdRatio * 32767. The first minSilenceMs of each silent run is
// kept verbatim; the remainder of the run is dropped until a non-silent
// frame resets the run.
class SilenceTrimmer {
public:
    explicit SilenceTrimmer(float thresholdRatio = 0.02f, unsigned int minSilenceMs = 500);

    std::vector<int16_t> Trim(const std::vector<int16_t>& samples,
                              unsigned int sampleRate = 44100,
                              unsigned int channels = 1) const;

    // Frames of silence kept per run
    size_t MinRunFrames(unsigned int sampleRate) const;

    double GetThreshold() const { return _threshold; }
    unsigned int GetMinSilenceMs() const { return _minSilenceMs; }

private:
    bool IsSilentFrame(const int16_t* frame, unsigned int channels) const;

    double _threshold;
    unsigned int _minSilenceMs;
};

} // namespace call_capture
