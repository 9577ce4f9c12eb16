#pragma once

#include <string>

#include "ISavingWorker.hpp"

namespace call_capture {

// Writes the buffer as raw PCM to "<filename>.tmp" and renames it over
// filename once everything is on disk, so a failed save never leaves a
// partial file at the destination.
class PcmWorker : public ISavingWorker {
public:
    explicit PcmWorker(std::string filename);

    bool Save() override;

    const std::string& GetFilename() const { return _filename; }
    std::string GetTempFilename() const { return _filename + ".tmp"; }

private:
    bool HasSpaceFor(uintmax_t bytes);

    std::string _filename;
};

} // namespace call_capture
