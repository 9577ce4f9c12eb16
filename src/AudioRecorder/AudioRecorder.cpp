#include "AudioRecorder.hpp"
#include "../common/debug_log.hpp"

#include <algorithm>
#include <vector>

namespace call_capture {

namespace {

int record(void* /*outputBuffer*/, void* inputBuffer, unsigned int nBufferFrames,
           double /*streamTime*/, RtAudioStreamStatus status, void* userData)
{
    RecordData* data = static_cast<RecordData*>(userData);

    if (status) {
        DEBUG_LOG("Stream overflow detected!" << DEBUG_LOG_ENDL);
    }

    if (data->isRecording && inputBuffer && data->onBuffer) {
        const int16_t* inputSamples = static_cast<const int16_t*>(inputBuffer);
        data->onBuffer(inputSamples, static_cast<size_t>(nBufferFrames) * data->channels,
                       data->sampleRate);
    }

    return 0;
}

ErrorKind KindFor(RtAudioErrorType error) {
    switch (error) {
        case RTAUDIO_NO_DEVICES_FOUND:
        case RTAUDIO_INVALID_DEVICE:
        case RTAUDIO_DEVICE_DISCONNECT:
            return ErrorKind::SourceUnavailable;
        case RTAUDIO_INVALID_PARAMETER:
        case RTAUDIO_INVALID_USE:
            return ErrorKind::InitializationFailed;
        default:
            return ErrorKind::HardwareError;
    }
}

} // namespace

AudioRecorder::AudioRecorder()
    : _audio(std::make_unique<RtAudio>())
    , _buffer_frames(256) {
    _parameters.deviceId = 0;
    _parameters.nChannels = 1;
    _parameters.firstChannel = 0;
}

AudioRecorder::~AudioRecorder() {
    Close();
}

unsigned int AudioRecorder::SelectInputDevice(const AudioQuality& quality) {
    if (!quality.IsSupported()) {
        throw CaptureDeviceException(ErrorKind::InitializationFailed,
                                     "Unsupported audio quality " + quality.Name());
    }

    std::vector<unsigned int> deviceIds = _audio->getDeviceIds();
    if (deviceIds.empty()) {
        throw CaptureDeviceException(ErrorKind::SourceUnavailable, "No audio devices found");
    }

    DEBUG_LOG("Available audio devices:" << DEBUG_LOG_ENDL);
    for (unsigned int id : deviceIds) {
        RtAudio::DeviceInfo info = _audio->getDeviceInfo(id);
        DEBUG_LOG("Device " << id << ": " << info.name
                  << " (input channels: " << info.inputChannels << ")" << DEBUG_LOG_ENDL);
    }

    unsigned int device = _audio->getDefaultInputDevice();
    RtAudio::DeviceInfo info = _audio->getDeviceInfo(device);

    if (info.inputChannels < 1) {
        DEBUG_LOG("Default device has no input channels! Searching for alternative..." << DEBUG_LOG_ENDL);
        for (unsigned int id : deviceIds) {
            RtAudio::DeviceInfo candidate = _audio->getDeviceInfo(id);
            if (candidate.inputChannels > 0) {
                device = id;
                info = candidate;
                break;
            }
        }
    }

    if (info.inputChannels < 1) {
        throw CaptureDeviceException(ErrorKind::SourceUnavailable, "No input devices found!");
    }

    if (info.inputChannels < quality.channels) {
        throw CaptureDeviceException(ErrorKind::InitializationFailed,
                                     info.name + " has " + std::to_string(info.inputChannels) +
                                     " input channels, " + quality.Name() + " needs " +
                                     std::to_string(quality.channels));
    }

    const bool sampleRateSupported =
        std::find(info.sampleRates.begin(), info.sampleRates.end(), quality.sampleRate) !=
        info.sampleRates.end();
    if (!sampleRateSupported) {
        throw CaptureDeviceException(ErrorKind::InitializationFailed,
                                     info.name + " does not support " +
                                     std::to_string(quality.sampleRate) + " Hz");
    }

    DEBUG_LOG("Using input device: " << info.name << DEBUG_LOG_ENDL);
    return device;
}

void AudioRecorder::Probe(const AudioQuality& quality) {
    std::lock_guard<std::mutex> lock(_stream_mutex);
    SelectInputDevice(quality);
}

void AudioRecorder::Open(const AudioQuality& quality, BufferCallback callback) {
    std::lock_guard<std::mutex> lock(_stream_mutex);

    if (_audio->isStreamOpen()) {
        throw CaptureDeviceException(ErrorKind::HardwareError, "Capture stream is already open");
    }

    _parameters.deviceId = SelectInputDevice(quality);
    _parameters.nChannels = quality.channels;
    _parameters.firstChannel = 0;

    _record_data.isRecording = false;
    _record_data.sampleRate = quality.sampleRate;
    _record_data.channels = quality.channels;
    _record_data.onBuffer = std::move(callback);

    unsigned int bufferFrames = _buffer_frames;

    DEBUG_LOG("Opening stream: " << quality.sampleRate << " Hz, " << quality.channels
              << " ch, " << bufferFrames << " frames, SINT16" << DEBUG_LOG_ENDL);

    RtAudioErrorType error = _audio->openStream(nullptr, &_parameters, RTAUDIO_SINT16,
                                                quality.sampleRate, &bufferFrames,
                                                &record, &_record_data);
    if (error != RTAUDIO_NO_ERROR) {
        _record_data.onBuffer = nullptr;
        throw CaptureDeviceException(KindFor(error),
                                     "Error opening stream: " + _audio->getErrorText());
    }

    _buffer_frames = bufferFrames;
    DEBUG_LOG("Stream opened successfully with SINT16!" << DEBUG_LOG_ENDL);
}

void AudioRecorder::Start() {
    std::lock_guard<std::mutex> lock(_stream_mutex);

    if (!_audio->isStreamOpen()) {
        throw CaptureDeviceException(ErrorKind::HardwareError, "Capture stream is not open");
    }
    if (_audio->isStreamRunning()) {
        return;
    }

    _record_data.isRecording = true;
    RtAudioErrorType error = _audio->startStream();
    if (error != RTAUDIO_NO_ERROR) {
        _record_data.isRecording = false;
        throw CaptureDeviceException(KindFor(error),
                                     "Error starting stream: " + _audio->getErrorText());
    }
}

void AudioRecorder::Stop() {
    std::lock_guard<std::mutex> lock(_stream_mutex);

    _record_data.isRecording = false;
    if (_audio->isStreamRunning()) {
        RtAudioErrorType error = _audio->stopStream();
        if (error != RTAUDIO_NO_ERROR && error != RTAUDIO_WARNING) {
            throw CaptureDeviceException(KindFor(error),
                                         "Error stopping stream: " + _audio->getErrorText());
        }
    }
}

void AudioRecorder::Close() {
    std::lock_guard<std::mutex> lock(_stream_mutex);

    _record_data.isRecording = false;
    if (_audio->isStreamRunning()) {
        _audio->abortStream();
    }
    if (_audio->isStreamOpen()) {
        _audio->closeStream();
    }
    _record_data.onBuffer = nullptr;
}

bool AudioRecorder::IsOpen() const {
    std::lock_guard<std::mutex> lock(_stream_mutex);
    return _audio->isStreamOpen();
}

bool AudioRecorder::IsRunning() const {
    std::lock_guard<std::mutex> lock(_stream_mutex);
    return _audio->isStreamRunning();
}

} // namespace call_capture
