#pragma once

namespace call_capture {

struct NoiseGateParams {
    float thresholdRatio = 0.01f;
    float reduction = 0.3f;
};

struct CompressorParams {
    float thresholdRatio = 0.7f;
    float ratio = 4.0f;
    float attackMs = 5.0f;
    float releaseMs = 50.0f;
};

// Which stages run in one enhancement pass, and with what parameters.
// Passed by value; never changed while a pass is running.
struct EnhancementConfig {
    bool noiseReduction = true;
    bool compression = true;
    bool normalization = true;
    float targetGainDb = 0.0f;

    NoiseGateParams noiseGate;
    CompressorParams compressor;

    static EnhancementConfig NormalizeOnly() {
        EnhancementConfig config;
        config.noiseReduction = false;
        config.compression = false;
        config.normalization = true;
        config.targetGainDb = 0.0f;
        return config;
    }
};

} // namespace call_capture
