#include "PcmWorker.hpp"
#include "../PcmFile/PcmFile.hpp"
#include "../common/debug_log.hpp"

#include <filesystem>
#include <memory>
#include <system_error>

namespace fs = std::filesystem;

namespace call_capture {

PcmWorker::PcmWorker(std::string filename)
    : _filename(std::move(filename)) {
}

bool PcmWorker::HasSpaceFor(uintmax_t bytes) {
    std::error_code ec;
    fs::path parent = fs::absolute(_filename, ec).parent_path();
    if (ec) {
        // Let the write itself report the problem
        return true;
    }
    fs::space_info space = fs::space(parent, ec);
    if (ec) {
        return true;
    }
    return space.available >= bytes;
}

bool PcmWorker::Save() {
    if (!_setter_called) {
        throw SavingWorkerException("Sample rate must be specified");
    }
    _lastError.reset();

    if (_audioData.empty()) {
        DEBUG_LOG("No audio data to save!" << DEBUG_LOG_ENDL);
        Fail(ErrorKind::EncodingFailed, "No audio data to save");
        return false;
    }

    const uintmax_t bytes = _audioData.size() * sizeof(int16_t);
    if (!HasSpaceFor(bytes)) {
        ERROR_LOG("Not enough free space for " << bytes << " bytes at " << _filename);
        Fail(ErrorKind::InsufficientStorage, "Not enough free space to write " + _filename);
        return false;
    }

    const std::string tempFilename = GetTempFilename();
    std::error_code ec;

    std::unique_ptr<PcmFileWriter> writer;
    try {
        writer = std::make_unique<PcmFileWriter>(tempFilename, _sampleRate, _channels);
    } catch (const PcmFileException& e) {
        ERROR_LOG("Error saving " << _filename << ": " << e.what());
        Fail(ErrorKind::FileCreationFailed, e.what());
        return false;
    }

    bool written = writer->Write(_audioData.data(), _audioData.size());
    if (written) {
        try {
            writer->Close();
        } catch (const PcmFileException& e) {
            ERROR_LOG(e.what());
            written = false;
        }
    }
    writer.reset();

    if (!written) {
        fs::remove(tempFilename, ec);
        Fail(ErrorKind::EncodingFailed, "Could not write samples to " + tempFilename);
        return false;
    }

    fs::rename(tempFilename, _filename, ec);
    if (ec) {
        ERROR_LOG("Could not move " << tempFilename << " to " << _filename << ": " << ec.message());
        std::error_code removeEc;
        fs::remove(tempFilename, removeEc);
        Fail(ErrorKind::FileCreationFailed, "Could not create " + _filename + ": " + ec.message());
        return false;
    }

    DEBUG_LOG("Successfully saved " << _audioData.size() << " samples to " << _filename << DEBUG_LOG_ENDL);
    return true;
}

} // namespace call_capture
