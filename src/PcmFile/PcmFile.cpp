#include "PcmFile.hpp"
#include "../common/debug_log.hpp"

#include <filesystem>
#include <vector>

namespace call_capture {

void SndfileDeleter::operator()(SNDFILE* file) const noexcept {
    if (file) {
        sf_close(file);
    }
}

SF_INFO MakeRawPcmInfo(unsigned int sampleRate, unsigned int channels) {
    SF_INFO sfinfo{};
    sfinfo.samplerate = static_cast<int>(sampleRate);
    sfinfo.channels = static_cast<int>(channels);
    sfinfo.format = SF_FORMAT_RAW | SF_FORMAT_PCM_16 | SF_ENDIAN_LITTLE;
    return sfinfo;
}

SampleBuffer ReadPcmFile(const std::string& path, unsigned int sampleRate, unsigned int channels) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw PcmFileException("No such PCM file: " + path);
    }

    SampleBuffer buffer;
    buffer.sampleRate = sampleRate;
    buffer.channels = channels;

    if (std::filesystem::file_size(path, ec) == 0 && !ec) {
        return buffer;
    }

    SF_INFO sfinfo = MakeRawPcmInfo(sampleRate, channels);
    SndfilePtr infile(sf_open(path.c_str(), SFM_READ, &sfinfo));
    if (!infile) {
        throw PcmFileException("Could not open " + path + ": " + sf_strerror(nullptr));
    }

    buffer.samples.resize(static_cast<size_t>(sfinfo.frames) * channels);
    sf_count_t framesRead = sf_readf_short(infile.get(), buffer.samples.data(), sfinfo.frames);
    if (framesRead != sfinfo.frames) {
        throw PcmFileException("Short read from " + path + ": got " + std::to_string(framesRead) +
                               " of " + std::to_string(sfinfo.frames) + " frames");
    }

    DEBUG_LOG("Read " << buffer.samples.size() << " samples from " << path << DEBUG_LOG_ENDL);
    return buffer;
}

SampleBuffer ReadPcmFile(const std::string& path, const AudioQuality& quality) {
    return ReadPcmFile(path, quality.sampleRate, quality.channels);
}

PcmFileWriter::PcmFileWriter(const std::string& path, unsigned int sampleRate,
                             unsigned int channels)
    : _path(path)
    , _channels(channels)
    , _samplesWritten(0) {
    SF_INFO sfinfo = MakeRawPcmInfo(sampleRate, channels);
    _file.reset(sf_open(path.c_str(), SFM_WRITE, &sfinfo));
    if (!_file) {
        throw PcmFileException("Could not create " + path + ": " + sf_strerror(nullptr));
    }
}

PcmFileWriter::~PcmFileWriter() = default;

bool PcmFileWriter::Write(const int16_t* samples, size_t count) {
    if (!_file || samples == nullptr) {
        return false;
    }
    if (count == 0) {
        return true;
    }
    if (count % _channels != 0) {
        ERROR_LOG("Refusing to write a partial frame to " << _path);
        return false;
    }

    sf_count_t written = sf_write_short(_file.get(), samples, static_cast<sf_count_t>(count));
    if (written != static_cast<sf_count_t>(count)) {
        ERROR_LOG("Error: wrote " << written << " samples, expected " << count << " to " << _path);
        return false;
    }

    _samplesWritten += written;
    return true;
}

void PcmFileWriter::Close() {
    if (!_file) {
        return;
    }
    int status = sf_close(_file.release());
    if (status != 0) {
        throw PcmFileException("Error closing " + _path + ": " + sf_error_number(status));
    }
}

} // namespace call_capture
