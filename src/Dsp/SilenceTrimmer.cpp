#include "SilenceTrimmer.hpp"
#include "../common/SampleBuffer.hpp"

#include <cstdlib>
#include <stdexcept>

namespace call_capture {

SilenceTrimmer::SilenceTrimmer(float thresholdRatio, unsigned int minSilenceMs)
    : _threshold(kFullScale * thresholdRatio)
    , _minSilenceMs(minSilenceMs) {
    if (thresholdRatio < 0.0f || thresholdRatio > 1.0f) {
        throw std::invalid_argument("Silence threshold ratio must be in [0, 1]");
    }
}

size_t SilenceTrimmer::MinRunFrames(unsigned int sampleRate) const {
    return static_cast<size_t>(static_cast<uint64_t>(_minSilenceMs) * sampleRate / 1000);
}

bool SilenceTrimmer::IsSilentFrame(const int16_t* frame, unsigned int channels) const {
    for (unsigned int ch = 0; ch < channels; ++ch) {
        if (std::abs(static_cast<int>(frame[ch])) >= _threshold) {
            return false;
        }
    }
    return true;
}

std::vector<int16_t> SilenceTrimmer::Trim(const std::vector<int16_t>& samples,
                                          unsigned int sampleRate,
                                          unsigned int channels) const {
    if (channels == 0) {
        throw std::invalid_argument("Silence trimmer needs at least one channel");
    }

    const size_t minRun = MinRunFrames(sampleRate);
    const size_t frames = samples.size() / channels;

    std::vector<int16_t> result;
    result.reserve(samples.size());

    size_t silentRun = 0;
    for (size_t f = 0; f < frames; ++f) {
        const int16_t* frame = samples.data() + f * channels;
        if (IsSilentFrame(frame, channels)) {
            if (silentRun >= minRun) {
                continue;
            }
            ++silentRun;
        } else {
            silentRun = 0;
        }
        result.insert(result.end(), frame, frame + channels);
    }

    // Trailing partial frame of a malformed interleaved buffer is kept as is
    result.insert(result.end(), samples.begin() + frames * channels, samples.end());
    return result;
}

} // namespace call_capture
