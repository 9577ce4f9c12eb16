#pragma once

#include <atomic>
#include <functional>

#include "ICaptureDevice.hpp"

namespace call_capture {

// Shared with the RtAudio callback through its userData pointer
struct RecordData {
    std::atomic<bool> isRecording{false};
    unsigned int sampleRate = 0;
    unsigned int channels = 1;

    BufferCallback onBuffer;
};

} // namespace call_capture
