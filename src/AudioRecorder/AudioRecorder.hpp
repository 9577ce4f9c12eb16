#pragma once

#include <RtAudio.h>

#include <memory>
#include <mutex>

#include "ICaptureDevice.hpp"
#include "RecordData.hpp"

namespace call_capture {

// ICaptureDevice backed by RtAudio on the default input device (or the
// first device that has input channels).
class AudioRecorder : public ICaptureDevice {
public:
    AudioRecorder();
    ~AudioRecorder() override;

    void Probe(const AudioQuality& quality) override;
    void Open(const AudioQuality& quality, BufferCallback callback) override;
    void Start() override;
    void Stop() override;
    void Close() override;

    bool IsOpen() const override;
    bool IsRunning() const override;

    unsigned int GetBufferFrames() const { return _buffer_frames; }

private:
    unsigned int SelectInputDevice(const AudioQuality& quality);

    std::unique_ptr<RtAudio> _audio;
    RtAudio::StreamParameters _parameters;
    RecordData _record_data;
    unsigned int _buffer_frames;
    mutable std::mutex _stream_mutex;
};

} // namespace call_capture
