#include "ProcessingResult.hpp"

namespace call_capture {

const char* ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InitializationFailed: return "InitializationFailed";
        case ErrorKind::SourceUnavailable: return "SourceUnavailable";
        case ErrorKind::PermissionDenied: return "PermissionDenied";
        case ErrorKind::InsufficientStorage: return "InsufficientStorage";
        case ErrorKind::EncodingFailed: return "EncodingFailed";
        case ErrorKind::FileCreationFailed: return "FileCreationFailed";
        case ErrorKind::HardwareError: return "HardwareError";
        case ErrorKind::AudioProcessingFailed: return "AudioProcessingFailed";
        case ErrorKind::Unknown: return "Unknown";
    }
    return "Unknown";
}

} // namespace call_capture
