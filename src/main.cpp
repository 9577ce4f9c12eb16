#include "AudioRecorder/AudioRecorder.hpp"
#include "CaptureController/CaptureController.hpp"
#include "Config/ConfigManager.hpp"
#include "Dsp/FilterBank.hpp"
#include "Dsp/LevelMeter.hpp"
#include "Dsp/SilenceTrimmer.hpp"
#include "Enhancement/EnhancementPipeline.hpp"
#include "PcmFile/PcmFile.hpp"
#include "SavingWorkers/PcmWorker.hpp"
#include "common/debug_log.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace call_capture;

class CallCaptureApplication {
public:
    explicit CallCaptureApplication(std::vector<std::string> args)
        : _args(std::move(args)) {}

    int Run() {
        if (_args.empty()) {
            PrintHelp();
            return 1;
        }

        const std::string& command = _args[0];
        if (command == "help" || command == "--help") {
            PrintHelp();
            return 0;
        }
        if (command == "record") return Record();
        if (command == "enhance") return Enhance();
        if (command == "normalize") return Normalize();
        if (command == "trim") return Trim();
        if (command == "filter") return Filter();
        if (command == "level") return Level();

        std::cout << "Unknown command: " << command << std::endl;
        PrintHelp();
        return 1;
    }

private:
    // Loads the optional config.json expected at args[index]
    bool LoadConfig(size_t index) {
        if (_args.size() <= index) {
            _config.LoadDefaults();
            return true;
        }
        try {
            if (!_config.Load(_args[index])) {
                std::cerr << "Cannot open config file: " << _args[index] << std::endl;
                return false;
            }
        } catch (const ConfigException& e) {
            std::cerr << "Invalid config " << _args[index] << ": " << e.what() << std::endl;
            return false;
        }
        return true;
    }

    bool ExpectArgs(size_t minCount, size_t maxCount) const {
        if (_args.size() < minCount || _args.size() > maxCount) {
            std::cerr << "Wrong number of arguments for " << _args[0] << std::endl;
            return false;
        }
        return true;
    }

    int Record() {
        if (!ExpectArgs(3, 4) || !LoadConfig(3)) {
            return 1;
        }

        int seconds = 0;
        try {
            seconds = std::stoi(_args[1]);
        } catch (const std::logic_error&) {
            std::cerr << "Invalid duration: " << _args[1] << std::endl;
            return 1;
        }
        if (seconds <= 0) {
            std::cerr << "Duration must be positive" << std::endl;
            return 1;
        }

        const AppConfig config = _config.GetConfig();
        std::unique_ptr<CaptureController> controllerPtr;
        try {
            controllerPtr = std::make_unique<CaptureController>(std::make_unique<AudioRecorder>(),
                                                                config);
        } catch (const std::invalid_argument& e) {
            std::cerr << "Invalid capture settings: " << e.what() << std::endl;
            return 1;
        }
        CaptureController& controller = *controllerPtr;

        if (!controller.InitializeAudioCapture(config.quality)) {
            PrintLastError(controller);
            return 1;
        }
        if (!controller.StartCapture(_args[2])) {
            PrintLastError(controller);
            return 1;
        }

        std::cout << "Recording " << seconds << " s with " << config.quality.Name()
                  << " quality..." << std::endl;

        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(seconds);
        while (std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(500));
            std::optional<float> level = controller.GetCurrentAudioLevel();
            if (level) {
                DEBUG_LOG("[LEVEL] " << LevelMeter::ToDbfs(*level) << " dBFS, "
                          << controller.GetCurrentDuration() << " ms" << DEBUG_LOG_ENDL);
            }
        }

        std::optional<ProcessingResult> result = controller.StopCapture();
        if (!result) {
            PrintLastError(controller);
            return 1;
        }
        if (result->IsError()) {
            std::cerr << "Recording failed (" << ToString(result->Error().kind)
                      << "): " << result->Error().message << std::endl;
            return 1;
        }

        const ProcessingSuccess& success = result->Success();
        std::cout << "Saved " << success.outputFile << ": " << success.durationMs << " ms, "
                  << success.fileSizeBytes << " bytes" << std::endl;
        return 0;
    }

    int Enhance() {
        if (!ExpectArgs(3, 4) || !LoadConfig(3)) {
            return 1;
        }

        const AppConfig config = _config.GetConfig();
        EnhancementPipeline pipeline;
        if (!pipeline.Enhance(_args[1], _args[2], config.enhancement, config.quality)) {
            std::cerr << "Enhancement failed for " << _args[1] << std::endl;
            return 1;
        }
        std::cout << "Enhanced audio written to " << _args[2] << std::endl;
        return 0;
    }

    int Normalize() {
        if (!ExpectArgs(2, 3) || !LoadConfig(2)) {
            return 1;
        }

        const AppConfig config = _config.GetConfig();
        EnhancementPipeline pipeline;
        if (!pipeline.Enhance(_args[1], _args[1], EnhancementConfig::NormalizeOnly(),
                              config.quality)) {
            std::cerr << "Normalization failed for " << _args[1] << std::endl;
            return 1;
        }
        std::cout << "Normalized " << _args[1] << std::endl;
        return 0;
    }

    int Trim() {
        if (!ExpectArgs(3, 4) || !LoadConfig(3)) {
            return 1;
        }

        const AppConfig config = _config.GetConfig();
        SampleBuffer buffer;
        if (!ReadInput(_args[1], config.quality, buffer)) {
            return 1;
        }

        std::vector<int16_t> trimmed;
        try {
            SilenceTrimmer trimmer(config.silenceTrim.thresholdRatio,
                                   config.silenceTrim.minSilenceMs);
            trimmed = trimmer.Trim(buffer.samples, buffer.sampleRate, buffer.channels);
        } catch (const std::invalid_argument& e) {
            std::cerr << "Trim failed: " << e.what() << std::endl;
            return 1;
        }
        std::cout << "Removed " << (buffer.samples.size() - trimmed.size())
                  << " samples of silence" << std::endl;

        return WriteOutput(_args[2], buffer.sampleRate, buffer.channels, std::move(trimmed));
    }

    int Filter() {
        if (!ExpectArgs(5, 6) || !LoadConfig(5)) {
            return 1;
        }

        const std::string& kind = _args[1];
        if (kind != "lowpass" && kind != "highpass") {
            std::cerr << "Unknown filter: " << kind << std::endl;
            return 1;
        }

        float cutoffHz = 0.0f;
        try {
            cutoffHz = std::stof(_args[2]);
        } catch (const std::logic_error&) {
            std::cerr << "Invalid cutoff: " << _args[2] << std::endl;
            return 1;
        }

        const AppConfig config = _config.GetConfig();
        SampleBuffer buffer;
        if (!ReadInput(_args[3], config.quality, buffer)) {
            return 1;
        }

        std::vector<int16_t> filtered;
        try {
            filtered = kind == "lowpass"
                ? FilterBank::LowPass(buffer.samples, cutoffHz, buffer.sampleRate, buffer.channels)
                : FilterBank::HighPass(buffer.samples, cutoffHz, buffer.sampleRate, buffer.channels);
        } catch (const std::invalid_argument& e) {
            std::cerr << "Filter failed: " << e.what() << std::endl;
            return 1;
        }

        return WriteOutput(_args[4], buffer.sampleRate, buffer.channels, std::move(filtered));
    }

    int Level() {
        if (!ExpectArgs(2, 3) || !LoadConfig(2)) {
            return 1;
        }

        const AppConfig config = _config.GetConfig();
        SampleBuffer buffer;
        if (!ReadInput(_args[1], config.quality, buffer)) {
            return 1;
        }

        const float rms = LevelMeter::Rms(buffer.samples);
        const float peak = LevelMeter::Peak(buffer.samples);
        std::cout << "Duration: " << buffer.DurationMs() << " ms" << std::endl;
        std::cout << "RMS:      " << rms << " (" << LevelMeter::ToDbfs(rms) << " dBFS)" << std::endl;
        std::cout << "Peak:     " << peak << " (" << LevelMeter::ToDbfs(peak) << " dBFS)" << std::endl;
        return 0;
    }

    bool ReadInput(const std::string& path, const AudioQuality& quality, SampleBuffer& buffer) {
        try {
            buffer = ReadPcmFile(path, quality);
        } catch (const PcmFileException& e) {
            std::cerr << e.what() << std::endl;
            return false;
        }
        if (buffer.Empty()) {
            std::cerr << "No audio in " << path << std::endl;
            return false;
        }
        return true;
    }

    int WriteOutput(const std::string& path, unsigned int sampleRate, unsigned int channels,
                    std::vector<int16_t> samples) {
        PcmWorker worker(path);
        worker.SetSampleRate(sampleRate);
        worker.SetChannels(channels);
        worker.SetAudioData(std::move(samples));
        if (!worker.Save()) {
            std::optional<ProcessingError> error = worker.GetLastError();
            std::cerr << "Could not write " << path;
            if (error) {
                std::cerr << " (" << ToString(error->kind) << "): " << error->message;
            }
            std::cerr << std::endl;
            return 1;
        }
        std::cout << "Written " << path << std::endl;
        return 0;
    }

    void PrintLastError(const CaptureController& controller) {
        std::optional<ProcessingError> error = controller.GetLastError();
        if (error) {
            std::cerr << "[" << ToString(controller.GetProcessingStatus()) << "] "
                      << ToString(error->kind) << ": " << error->message << std::endl;
        } else {
            std::cerr << "Operation rejected in state "
                      << ToString(controller.GetProcessingStatus()) << std::endl;
        }
    }

    void PrintHelp() {
        std::cout << "\n=== CallCapture ===" << std::endl;
        std::cout << "Commands:" << std::endl;
        std::cout << "  record <seconds> <target.pcm> [config.json]" << std::endl;
        std::cout << "  enhance <input.pcm> <output.pcm> [config.json]" << std::endl;
        std::cout << "  normalize <file.pcm> [config.json]" << std::endl;
        std::cout << "  trim <input.pcm> <output.pcm> [config.json]" << std::endl;
        std::cout << "  filter <lowpass|highpass> <cutoffHz> <input.pcm> <output.pcm> [config.json]"
                  << std::endl;
        std::cout << "  level <file.pcm> [config.json]" << std::endl;
        std::cout << "\nFiles are headerless 16-bit little-endian PCM in the configured quality."
                  << std::endl;
    }

    std::vector<std::string> _args;
    ConfigManager _config;
};

int main(int argc, char* argv[]) {
    CallCaptureApplication app(std::vector<std::string>(argv + 1, argv + argc));
    return app.Run();
}
