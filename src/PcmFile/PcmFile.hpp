#pragma once

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>

#include "sndfile.h"

#include "../common/AudioQuality.hpp"
#include "../common/SampleBuffer.hpp"

namespace call_capture {

class PcmFileException : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct SndfileDeleter {
    void operator()(SNDFILE* file) const noexcept;
};

using SndfilePtr = std::unique_ptr<SNDFILE, SndfileDeleter>;

// Headerless 16-bit little-endian PCM, interleaved. The format is not stored
// in the file, so readers must be told the sample rate and channel count.
SF_INFO MakeRawPcmInfo(unsigned int sampleRate, unsigned int channels);

// Reads the whole file. Throws PcmFileException if it is missing or unreadable.
SampleBuffer ReadPcmFile(const std::string& path, unsigned int sampleRate, unsigned int channels);
SampleBuffer ReadPcmFile(const std::string& path, const AudioQuality& quality);

// Streams chunks into a raw PCM file. The file is closed on destruction.
class PcmFileWriter {
public:
    // Throws PcmFileException if the file cannot be created
    PcmFileWriter(const std::string& path, unsigned int sampleRate, unsigned int channels);
    ~PcmFileWriter();

    PcmFileWriter(const PcmFileWriter&) = delete;
    PcmFileWriter& operator=(const PcmFileWriter&) = delete;

    // count is in samples and must be a whole number of frames
    bool Write(const int16_t* samples, size_t count);

    // Flushes and closes. Throws PcmFileException when the close fails.
    void Close();

    bool IsOpen() const { return static_cast<bool>(_file); }
    int64_t SamplesWritten() const { return _samplesWritten; }
    const std::string& GetPath() const { return _path; }

private:
    std::string _path;
    unsigned int _channels;
    SndfilePtr _file;
    int64_t _samplesWritten;
};

} // namespace call_capture
