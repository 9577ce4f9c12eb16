#include "CaptureController.hpp"
#include "../Dsp/FilterBank.hpp"
#include "../Dsp/GainStage.hpp"
#include "../Dsp/LevelMeter.hpp"
#include "../Dsp/SilenceTrimmer.hpp"
#include "../PcmFile/PcmFile.hpp"
#include "../SavingWorkers/PcmWorker.hpp"
#include "../common/debug_log.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;

namespace call_capture {

const char* ToString(ProcessingState state) {
    switch (state) {
        case ProcessingState::Idle: return "IDLE";
        case ProcessingState::Initializing: return "INITIALIZING";
        case ProcessingState::Capturing: return "CAPTURING";
        case ProcessingState::Paused: return "PAUSED";
        case ProcessingState::Processing: return "PROCESSING";
        case ProcessingState::Enhancing: return "ENHANCING";
        case ProcessingState::Finalizing: return "FINALIZING";
        case ProcessingState::Error: return "ERROR";
    }
    return "UNKNOWN";
}

// Keeps the device stream open for as long as the session lives. Release()
// stops and closes it exactly once.
class CaptureController::DeviceLease {
public:
    DeviceLease(ICaptureDevice& device, const AudioQuality& quality, BufferCallback callback)
        : _device(&device) {
        _device->Open(quality, std::move(callback));
    }

    ~DeviceLease() { Release(); }

    DeviceLease(const DeviceLease&) = delete;
    DeviceLease& operator=(const DeviceLease&) = delete;

    void Release() noexcept {
        if (!_device) {
            return;
        }
        ICaptureDevice* device = _device;
        _device = nullptr;

        try {
            device->Stop();
        } catch (const CaptureDeviceException& e) {
            ERROR_LOG("Error stopping capture device: " << e.what());
        }
        try {
            device->Close();
        } catch (const CaptureDeviceException& e) {
            ERROR_LOG("Error closing capture device: " << e.what());
        }
    }

private:
    ICaptureDevice* _device;
};

// Declaration order matters: the lease is destroyed first, so no buffer can
// reach the writer after it is closed.
struct CaptureController::CaptureSession {
    CaptureSession(std::string targetPath, const AudioQuality& sessionQuality)
        : target(std::move(targetPath))
        , captureFile(CaptureFileFor(target))
        , quality(sessionQuality)
        , writer(captureFile, quality.sampleRate, quality.channels) {}

    std::string target;
    std::string captureFile;
    AudioQuality quality;
    PcmFileWriter writer;
    std::unique_ptr<DeviceLease> lease;
    bool writeFailed = false;
};

CaptureController::CaptureController(std::unique_ptr<ICaptureDevice> device, AppConfig config)
    : _device(std::move(device))
    , _config(std::move(config))
    , _agc(_config.agc.targetLevel, _config.agc.maxGainDb)
    , _state(ProcessingState::Idle)
    , _initialized(false)
    , _realtimeGainDb(0.0f)
    , _currentLevel(-1.0f)
    , _framesCaptured(0) {
    if (!_device) {
        throw std::invalid_argument("CaptureController needs a capture device");
    }
}

CaptureController::~CaptureController() {
    // Tear down without finalizing; the raw capture file stays on disk
    std::unique_ptr<CaptureSession> session = TakeSession();
    session.reset();
}

bool CaptureController::InitializeAudioCapture(const AudioQuality& quality) {
    const ProcessingState state = _state.load();
    if (state != ProcessingState::Idle && state != ProcessingState::Error) {
        DEBUG_LOG("Initialize rejected in state " << ToString(state) << DEBUG_LOG_ENDL);
        return false;
    }

    DEBUG_LOG("Initializing audio capture with quality: " << quality.Name() << DEBUG_LOG_ENDL);
    _state = ProcessingState::Initializing;
    _initialized = false;

    try {
        _device->Probe(quality);
    } catch (const CaptureDeviceException& e) {
        ERROR_LOG("Audio capture initialization failed: " << e.what());
        SetError(e.Kind(), e.what());
        return false;
    }

    _quality = quality;
    _initialized = true;
    _state = ProcessingState::Idle;
    DEBUG_LOG("Audio capture initialized" << DEBUG_LOG_ENDL);
    return true;
}

bool CaptureController::StartCapture(const std::string& target) {
    const ProcessingState state = _state.load();
    if (state != ProcessingState::Idle && state != ProcessingState::Error) {
        DEBUG_LOG("Already capturing audio, start rejected" << DEBUG_LOG_ENDL);
        return false;
    }
    if (!_initialized || !_quality) {
        ERROR_LOG("Audio capture not initialized");
        return false;
    }

    DEBUG_LOG("Starting capture to: " << target << DEBUG_LOG_ENDL);

    std::error_code ec;
    fs::path parent = fs::path(target).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
    }

    std::unique_ptr<CaptureSession> session;
    try {
        session = std::make_unique<CaptureSession>(target, *_quality);
    } catch (const PcmFileException& e) {
        ERROR_LOG("Failed to create capture file: " << e.what());
        FailSession(ErrorKind::FileCreationFailed, e.what());
        return false;
    }

    try {
        session->lease = std::make_unique<DeviceLease>(
            *_device, *_quality,
            [this](const int16_t* samples, size_t numSamples, unsigned int sampleRate) {
                OnBuffer(samples, numSamples, sampleRate);
            });
    } catch (const CaptureDeviceException& e) {
        ERROR_LOG("Failed to open capture device: " << e.what());
        const std::string captureFile = session->captureFile;
        session.reset();
        fs::remove(captureFile, ec);
        FailSession(e.Kind(), e.what());
        return false;
    }

    _framesCaptured = 0;
    _currentLevel = -1.0f;
    {
        std::lock_guard<std::mutex> lock(_session_mutex);
        _session = std::move(session);
    }
    _state = ProcessingState::Capturing;

    try {
        _device->Start();
    } catch (const CaptureDeviceException& e) {
        ERROR_LOG("Failed to start capture: " << e.what());
        std::unique_ptr<CaptureSession> failed = TakeSession();
        const std::string captureFile = failed->captureFile;
        failed.reset();
        fs::remove(captureFile, ec);
        FailSession(e.Kind(), e.what());
        return false;
    }

    DEBUG_LOG("Capture started" << DEBUG_LOG_ENDL);
    return true;
}

void CaptureController::OnBuffer(const int16_t* samples, size_t numSamples,
                                 unsigned int sampleRate) {
    if (_state.load() != ProcessingState::Capturing || samples == nullptr || numSamples == 0) {
        return;
    }

    std::lock_guard<std::mutex> lock(_session_mutex);
    if (!_session || _state.load() != ProcessingState::Capturing) {
        return;
    }

    if (sampleRate != _session->quality.sampleRate) {
        DEBUG_LOG("Unexpected buffer rate " << sampleRate << " Hz" << DEBUG_LOG_ENDL);
    }

    _currentLevel = LevelMeter::Rms(samples, numSamples);
    _framesCaptured += static_cast<int64_t>(numSamples / _session->quality.channels);

    const int16_t* output = samples;
    const float gainDb = _realtimeGainDb.load();
    if (_config.agc.realtime) {
        _chunkScratch.resize(numSamples);
        _agc.Process(samples, _chunkScratch.data(), numSamples);
        output = _chunkScratch.data();
    } else if (gainDb != 0.0f) {
        _chunkScratch.resize(numSamples);
        GainStage::ApplyGain(samples, _chunkScratch.data(), numSamples, gainDb);
        output = _chunkScratch.data();
    }

    if (!_session->writeFailed && !_session->writer.Write(output, numSamples)) {
        ERROR_LOG("Failed to append captured audio to " << _session->captureFile);
        _session->writeFailed = true;
    }
}

bool CaptureController::PauseCapture() {
    if (_state.load() != ProcessingState::Capturing) {
        return false;
    }

    _state = ProcessingState::Paused;
    try {
        _device->Stop();
    } catch (const CaptureDeviceException& e) {
        ERROR_LOG("Failed to pause capture: " << e.what());
        _state = ProcessingState::Capturing;
        return false;
    }

    DEBUG_LOG("Capture paused" << DEBUG_LOG_ENDL);
    return true;
}

bool CaptureController::ResumeCapture() {
    if (_state.load() != ProcessingState::Paused) {
        return false;
    }

    try {
        _device->Start();
    } catch (const CaptureDeviceException& e) {
        ERROR_LOG("Failed to resume capture: " << e.what());
        return false;
    }

    _state = ProcessingState::Capturing;
    DEBUG_LOG("Capture resumed" << DEBUG_LOG_ENDL);
    return true;
}

std::optional<ProcessingResult> CaptureController::StopCapture() {
    const ProcessingState state = _state.load();
    if (state != ProcessingState::Capturing && state != ProcessingState::Paused) {
        DEBUG_LOG("Not currently capturing audio" << DEBUG_LOG_ENDL);
        return std::nullopt;
    }

    DEBUG_LOG("Stopping capture" << DEBUG_LOG_ENDL);
    _state = ProcessingState::Processing;

    std::unique_ptr<CaptureSession> session = TakeSession();
    if (!session) {
        return FailStop(ErrorKind::Unknown, "Capture session disappeared");
    }
    session->lease->Release();

    const AudioQuality quality = session->quality;
    const int64_t durationMs = _framesCaptured.load() * 1000 / quality.sampleRate;

    if (session->writeFailed) {
        return FailStop(ErrorKind::EncodingFailed,
                        "Could not write captured audio to " + session->captureFile);
    }
    try {
        session->writer.Close();
    } catch (const PcmFileException& e) {
        return FailStop(ErrorKind::EncodingFailed, e.what());
    }

    SampleBuffer captured;
    try {
        captured = ReadPcmFile(session->captureFile, quality);
    } catch (const PcmFileException& e) {
        return FailStop(ErrorKind::AudioProcessingFailed, e.what());
    }
    if (captured.Empty()) {
        return FailStop(ErrorKind::AudioProcessingFailed, "No audio was captured");
    }

    _state = ProcessingState::Enhancing;
    SampleBuffer enhanced;
    try {
        enhanced = FinalizeBuffer(captured);
    } catch (const std::invalid_argument& e) {
        return FailStop(ErrorKind::AudioProcessingFailed, e.what());
    }
    if (enhanced.Empty()) {
        return FailStop(ErrorKind::AudioProcessingFailed, "Enhancement produced no audio");
    }

    _state = ProcessingState::Finalizing;
    PcmWorker worker(session->target);
    worker.SetSampleRate(enhanced.sampleRate);
    worker.SetChannels(enhanced.channels);
    worker.SetAudioData(std::move(enhanced.samples));
    if (!worker.Save()) {
        std::optional<ProcessingError> error = worker.GetLastError();
        return FailStop(error ? error->kind : ErrorKind::Unknown,
                        error ? error->message : "Could not write " + session->target);
    }

    std::error_code ec;
    if (!_config.keepRawCapture) {
        fs::remove(session->captureFile, ec);
    }
    const auto fileSize = fs::file_size(session->target, ec);
    if (ec) {
        return FailStop(ErrorKind::FileCreationFailed, "Output file not created: " + ec.message());
    }

    _state = ProcessingState::Idle;
    DEBUG_LOG("Capture completed. Duration: " << durationMs << "ms, Size: " << fileSize
              << " bytes" << DEBUG_LOG_ENDL);

    return ProcessingResult(ProcessingSuccess{session->target, durationMs,
                                              static_cast<int64_t>(fileSize), quality});
}

SampleBuffer CaptureController::FinalizeBuffer(const SampleBuffer& captured) const {
    SampleBuffer buffer = captured;

    if (_config.filters.highPassHz > 0.0f) {
        buffer.samples = FilterBank::HighPass(buffer.samples, _config.filters.highPassHz,
                                              buffer.sampleRate, buffer.channels);
    }
    if (_config.filters.lowPassHz > 0.0f) {
        buffer.samples = FilterBank::LowPass(buffer.samples, _config.filters.lowPassHz,
                                             buffer.sampleRate, buffer.channels);
    }

    buffer = _pipeline.Process(buffer, _config.enhancement);

    if (_config.silenceTrim.enabled) {
        SilenceTrimmer trimmer(_config.silenceTrim.thresholdRatio, _config.silenceTrim.minSilenceMs);
        buffer.samples = trimmer.Trim(buffer.samples, buffer.sampleRate, buffer.channels);
    }
    return buffer;
}

bool CaptureController::ApplyAudioEnhancement(const std::string& inputFile,
                                              const std::string& outputFile) {
    const ProcessingState state = _state.load();
    if (state != ProcessingState::Idle && state != ProcessingState::Error) {
        DEBUG_LOG("Enhancement rejected in state " << ToString(state) << DEBUG_LOG_ENDL);
        return false;
    }

    _state = ProcessingState::Enhancing;
    if (!_pipeline.Enhance(inputFile, outputFile, _config.enhancement, ActiveQuality())) {
        SetError(ErrorKind::AudioProcessingFailed, "Could not enhance " + inputFile);
        return false;
    }

    _state = ProcessingState::Idle;
    return true;
}

bool CaptureController::NormalizeAudio(const std::string& file) {
    const ProcessingState state = _state.load();
    if (state != ProcessingState::Idle && state != ProcessingState::Error) {
        DEBUG_LOG("Normalization rejected in state " << ToString(state) << DEBUG_LOG_ENDL);
        return false;
    }

    _state = ProcessingState::Processing;
    if (!_pipeline.Enhance(file, file, EnhancementConfig::NormalizeOnly(), ActiveQuality())) {
        SetError(ErrorKind::AudioProcessingFailed, "Could not normalize " + file);
        return false;
    }

    _state = ProcessingState::Idle;
    DEBUG_LOG("Audio normalization completed" << DEBUG_LOG_ENDL);
    return true;
}

bool CaptureController::ApplyRealtimeGain(float gainDb) {
    if (std::isnan(gainDb)) {
        return false;
    }
    const float clamped = std::clamp(gainDb, -kMaxRealtimeGainDb, kMaxRealtimeGainDb);
    _realtimeGainDb = clamped;
    DEBUG_LOG("Realtime gain set to: " << clamped << " dB" << DEBUG_LOG_ENDL);
    return true;
}

std::optional<float> CaptureController::GetCurrentAudioLevel() const {
    if (_state.load() != ProcessingState::Capturing) {
        return std::nullopt;
    }
    const float level = _currentLevel.load();
    if (level < 0.0f) {
        return std::nullopt;
    }
    return level;
}

int64_t CaptureController::GetCurrentDuration() const {
    const ProcessingState state = _state.load();
    if (state != ProcessingState::Capturing && state != ProcessingState::Paused) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(_session_mutex);
    if (!_session) {
        return 0;
    }
    return _framesCaptured.load() * 1000 / _session->quality.sampleRate;
}

bool CaptureController::IsCapturing() const {
    return _state.load() == ProcessingState::Capturing;
}

ProcessingState CaptureController::GetProcessingStatus() const {
    return _state.load();
}

std::optional<ProcessingError> CaptureController::GetLastError() const {
    std::lock_guard<std::mutex> lock(_error_mutex);
    return _lastError;
}

void CaptureController::Release() {
    DEBUG_LOG("Releasing audio capture resources" << DEBUG_LOG_ENDL);

    bool finalizationFailed = false;
    const ProcessingState state = _state.load();
    if (state == ProcessingState::Capturing || state == ProcessingState::Paused) {
        std::optional<ProcessingResult> result = StopCapture();
        if (result && result->IsError()) {
            ERROR_LOG("Session finalization failed during release: " << result->Error().message);
            finalizationFailed = true;
        }
    }

    std::unique_ptr<CaptureSession> session = TakeSession();
    session.reset();

    _initialized = false;
    _quality.reset();
    if (!finalizationFailed) {
        _state = ProcessingState::Idle;
    }
}

AudioQuality CaptureController::ActiveQuality() const {
    return _quality ? *_quality : _config.quality;
}

std::unique_ptr<CaptureController::CaptureSession> CaptureController::TakeSession() {
    std::lock_guard<std::mutex> lock(_session_mutex);
    return std::move(_session);
}

void CaptureController::SetError(ErrorKind kind, const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(_error_mutex);
        _lastError = ProcessingError{kind, message};
    }
    _state = ProcessingState::Error;
}

void CaptureController::FailSession(ErrorKind kind, const std::string& message) {
    _initialized = false;
    SetError(kind, message);
}

ProcessingResult CaptureController::FailStop(ErrorKind kind, const std::string& message) {
    ERROR_LOG("Capture finalization failed (" << ToString(kind) << "): " << message);
    FailSession(kind, message);
    return ProcessingResult::Failure(kind, message);
}

} // namespace call_capture
