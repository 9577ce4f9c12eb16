#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>

#include "../common/AudioQuality.hpp"
#include "../common/ProcessingResult.hpp"

namespace call_capture {

class CaptureDeviceException : public std::runtime_error {
public:
    CaptureDeviceException(ErrorKind kind, const std::string& message)
        : std::runtime_error(message)
        , _kind(kind) {}

    ErrorKind Kind() const { return _kind; }

private:
    ErrorKind _kind;
};

// Called from the device thread for each captured buffer:
// (interleaved samples, numSamples, sampleRate)
using BufferCallback = std::function<void(const int16_t*, size_t, unsigned int)>;

/**
 * Source of captured PCM.
 *
 * Probe() checks that a stream in the requested format could be opened and
 * must return without waiting on the device. Open/Start/Stop/Close manage
 * the stream itself. All failures throw CaptureDeviceException.
 */
class ICaptureDevice {
public:
    virtual ~ICaptureDevice() = default;

    virtual void Probe(const AudioQuality& quality) = 0;

    virtual void Open(const AudioQuality& quality, BufferCallback callback) = 0;
    virtual void Start() = 0;

    // Stop() returns once no callback is running anymore
    virtual void Stop() = 0;
    virtual void Close() = 0;

    virtual bool IsOpen() const = 0;
    virtual bool IsRunning() const = 0;
};

} // namespace call_capture
