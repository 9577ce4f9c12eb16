#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "../AudioRecorder/ICaptureDevice.hpp"
#include "../Config/ConfigManager.hpp"
#include "../Dsp/AutomaticGainControl.hpp"
#include "../Enhancement/EnhancementPipeline.hpp"
#include "../common/ProcessingResult.hpp"
#include "../common/SampleBuffer.hpp"

namespace call_capture {

enum class ProcessingState {
    Idle,
    Initializing,
    Capturing,
    Paused,
    Processing,
    Enhancing,
    Finalizing,
    Error
};

const char* ToString(ProcessingState state);

/**
 * Owns one capture session at a time.
 *
 * Lifecycle: InitializeAudioCapture -> StartCapture -> (Pause/Resume)* ->
 * StopCapture. While capturing, every buffer from the device is metered,
 * optionally gained, and appended to "<target>.capture". StopCapture reads
 * that file back, runs the enhancement chain and writes the result to the
 * target.
 *
 * Control methods are meant to be called from one thread; buffers arrive on
 * the device thread. None of the control methods throw: failures move the
 * controller to Error and are available from GetLastError().
 */
class CaptureController {
public:
    static constexpr float kMaxRealtimeGainDb = 20.0f;

    explicit CaptureController(std::unique_ptr<ICaptureDevice> device,
                               AppConfig config = AppConfig{});
    ~CaptureController();

    CaptureController(const CaptureController&) = delete;
    CaptureController& operator=(const CaptureController&) = delete;

    bool InitializeAudioCapture(const AudioQuality& quality);
    bool StartCapture(const std::string& target);
    bool PauseCapture();
    bool ResumeCapture();

    // std::nullopt when there is no session to stop
    std::optional<ProcessingResult> StopCapture();

    // Offline helpers, rejected while a session is active
    bool ApplyAudioEnhancement(const std::string& inputFile, const std::string& outputFile);
    bool NormalizeAudio(const std::string& file);

    // Gain applied to every captured buffer, clamped to +/- kMaxRealtimeGainDb
    bool ApplyRealtimeGain(float gainDb);

    // RMS of the last captured buffer, only while capturing
    std::optional<float> GetCurrentAudioLevel() const;
    int64_t GetCurrentDuration() const;
    bool IsCapturing() const;
    ProcessingState GetProcessingStatus() const;
    std::optional<ProcessingError> GetLastError() const;

    // Finalizes a running session, then closes the device. A failed
    // finalization leaves the controller in Error.
    void Release();

    static std::string CaptureFileFor(const std::string& target) { return target + ".capture"; }

private:
    class DeviceLease;
    struct CaptureSession;

    void OnBuffer(const int16_t* samples, size_t numSamples, unsigned int sampleRate);

    SampleBuffer FinalizeBuffer(const SampleBuffer& captured) const;
    AudioQuality ActiveQuality() const;

    std::unique_ptr<CaptureSession> TakeSession();
    void SetError(ErrorKind kind, const std::string& message);
    void FailSession(ErrorKind kind, const std::string& message);
    ProcessingResult FailStop(ErrorKind kind, const std::string& message);

    std::unique_ptr<ICaptureDevice> _device;
    AppConfig _config;
    EnhancementPipeline _pipeline;
    AutomaticGainControl _agc;

    std::atomic<ProcessingState> _state;
    bool _initialized;
    std::optional<AudioQuality> _quality;

    std::atomic<float> _realtimeGainDb;
    std::atomic<float> _currentLevel;
    std::atomic<int64_t> _framesCaptured;

    std::unique_ptr<CaptureSession> _session;
    std::vector<int16_t> _chunkScratch;
    mutable std::mutex _session_mutex;

    std::optional<ProcessingError> _lastError;
    mutable std::mutex _error_mutex;
};

} // namespace call_capture
