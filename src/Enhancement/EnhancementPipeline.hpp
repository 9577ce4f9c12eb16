#pragma once

#include <string>

#include "EnhancementConfig.hpp"
#include "../common/AudioQuality.hpp"
#include "../common/SampleBuffer.hpp"

namespace call_capture {

/**
 * Fixed-order enhancement chain:
 *   NoiseGate -> DynamicRangeCompressor -> GainStage -> Normalizer
 *
 * Each stage runs only when enabled in the config (the gain stage when
 * targetGainDb is non-zero). Stages run one after another on the calling
 * thread; an instance is not meant to be shared between threads.
 */
class EnhancementPipeline {
public:
    // In-memory chain. Throws std::invalid_argument for out-of-range stage
    // parameters.
    SampleBuffer Process(const SampleBuffer& input, const EnhancementConfig& config) const;

    /**
     * Reads inputFile, runs the chain and writes outputFile.
     *
     * The input file is never modified. The output is written through a
     * temporary file and only appears once it is complete. Returns false,
     * leaving no output behind, when the input is missing, unreadable or
     * empty, or the output cannot be written.
     */
    bool Enhance(const std::string& inputFile, const std::string& outputFile,
                 const EnhancementConfig& config,
                 const AudioQuality& quality = AudioQuality::Standard());
};

} // namespace call_capture
