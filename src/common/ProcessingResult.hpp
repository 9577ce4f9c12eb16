#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <variant>

#include "AudioQuality.hpp"

namespace call_capture {

enum class ErrorKind {
    InitializationFailed,
    SourceUnavailable,
    PermissionDenied,
    InsufficientStorage,
    EncodingFailed,
    FileCreationFailed,
    HardwareError,
    AudioProcessingFailed,
    Unknown
};

const char* ToString(ErrorKind kind);

struct ProcessingSuccess {
    std::string outputFile;
    int64_t durationMs;
    int64_t fileSizeBytes;
    AudioQuality quality;
};

struct ProcessingError {
    ErrorKind kind;
    std::string message;
};

// Terminal value of a capture session or an enhancement run
class ProcessingResult {
public:
    ProcessingResult(ProcessingSuccess success) : _value(std::move(success)) {}
    ProcessingResult(ProcessingError error) : _value(std::move(error)) {}

    static ProcessingResult Failure(ErrorKind kind, std::string message) {
        return ProcessingResult(ProcessingError{kind, std::move(message)});
    }

    bool IsSuccess() const { return std::holds_alternative<ProcessingSuccess>(_value); }
    bool IsError() const { return std::holds_alternative<ProcessingError>(_value); }

    // Throws std::bad_variant_access when the other alternative is held
    const ProcessingSuccess& Success() const { return std::get<ProcessingSuccess>(_value); }
    const ProcessingError& Error() const { return std::get<ProcessingError>(_value); }

private:
    std::variant<ProcessingSuccess, ProcessingError> _value;
};

} // namespace call_capture
