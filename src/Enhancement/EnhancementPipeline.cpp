#include "EnhancementPipeline.hpp"
#include "../Dsp/DynamicRangeCompressor.hpp"
#include "../Dsp/GainStage.hpp"
#include "../Dsp/NoiseGate.hpp"
#include "../Dsp/Normalizer.hpp"
#include "../PcmFile/PcmFile.hpp"
#include "../SavingWorkers/PcmWorker.hpp"
#include "../common/debug_log.hpp"

#include <stdexcept>

namespace call_capture {

SampleBuffer EnhancementPipeline::Process(const SampleBuffer& input,
                                          const EnhancementConfig& config) const {
    SampleBuffer output = input;

    if (config.noiseReduction) {
        NoiseGate gate(config.noiseGate.thresholdRatio, config.noiseGate.reduction);
        output.samples = gate.Process(output.samples);
        DEBUG_LOG("Noise reduction applied" << DEBUG_LOG_ENDL);
    }

    if (config.compression) {
        DynamicRangeCompressor compressor(config.compressor.thresholdRatio,
                                          config.compressor.ratio,
                                          config.compressor.attackMs,
                                          config.compressor.releaseMs);
        output.samples = compressor.Process(output.samples);
        DEBUG_LOG("Dynamic range compression applied" << DEBUG_LOG_ENDL);
    }

    if (config.targetGainDb != 0.0f) {
        output.samples = GainStage::ApplyGain(output.samples, config.targetGainDb);
        DEBUG_LOG("Gain adjustment applied: " << config.targetGainDb << "dB" << DEBUG_LOG_ENDL);
    }

    if (config.normalization) {
        output.samples = Normalizer::Normalize(output.samples);
        DEBUG_LOG("Audio normalization applied" << DEBUG_LOG_ENDL);
    }

    return output;
}

bool EnhancementPipeline::Enhance(const std::string& inputFile, const std::string& outputFile,
                                  const EnhancementConfig& config, const AudioQuality& quality) {
    DEBUG_LOG("Starting audio enhancement for: " << inputFile << DEBUG_LOG_ENDL);

    SampleBuffer input;
    try {
        input = ReadPcmFile(inputFile, quality);
    } catch (const PcmFileException& e) {
        ERROR_LOG("Failed to read audio data: " << e.what());
        return false;
    }

    if (input.Empty()) {
        ERROR_LOG("No audio data in " << inputFile);
        return false;
    }

    SampleBuffer enhanced;
    try {
        enhanced = Process(input, config);
    } catch (const std::invalid_argument& e) {
        ERROR_LOG("Invalid enhancement parameters: " << e.what());
        return false;
    }

    PcmWorker worker(outputFile);
    worker.SetSampleRate(enhanced.sampleRate);
    worker.SetChannels(enhanced.channels);
    worker.SetAudioData(std::move(enhanced.samples));
    if (!worker.Save()) {
        ERROR_LOG("Failed to write enhanced audio data to " << outputFile);
        return false;
    }

    DEBUG_LOG("Audio enhancement completed successfully" << DEBUG_LOG_ENDL);
    return true;
}

} // namespace call_capture
