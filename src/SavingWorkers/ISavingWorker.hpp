#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "../common/ProcessingResult.hpp"

namespace call_capture {

class SavingWorkerException : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Persists a finished buffer. Save() returns false on I/O failure and records
// the reason in GetLastError(); a missing sample rate is a programming error
// and throws SavingWorkerException.
class ISavingWorker {
public:
    virtual ~ISavingWorker() = default;

    void SetSampleRate(unsigned int sampleRate) {
        _sampleRate = sampleRate;
        _setter_called = true;
    }
    void SetChannels(unsigned int channels) { _channels = channels; }
    void SetAudioData(std::vector<int16_t> audioData) { _audioData = std::move(audioData); }

    virtual bool Save() = 0;

    std::optional<ProcessingError> GetLastError() const { return _lastError; }

protected:
    void Fail(ErrorKind kind, std::string message) {
        _lastError = ProcessingError{kind, std::move(message)};
    }

    std::vector<int16_t> _audioData;
    unsigned int _sampleRate = 0;
    unsigned int _channels = 1;
    bool _setter_called = false;
    std::optional<ProcessingError> _lastError;
};

} // namespace call_capture
