#include "wav_codec.hpp"
#include <sndfile.h>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace wav_codec {

namespace {
    // Growable memory file for sf_open_virtual
    struct MemoryFile {
        std::vector<char> data;
        sf_count_t pos = 0;
    };

    sf_count_t memGetLength(void* user_data) {
        return static_cast<sf_count_t>(static_cast<MemoryFile*>(user_data)->data.size());
    }

    sf_count_t memSeek(sf_count_t offset, int whence, void* user_data) {
        auto* file = static_cast<MemoryFile*>(user_data);
        sf_count_t target = 0;
        switch (whence) {
            case SEEK_SET: target = offset; break;
            case SEEK_CUR: target = file->pos + offset; break;
            case SEEK_END: target = static_cast<sf_count_t>(file->data.size()) + offset; break;
            default: return -1;
        }
        if (target < 0) {
            return -1;
        }
        file->pos = target;
        return file->pos;
    }

    sf_count_t memRead(void* ptr, sf_count_t count, void* user_data) {
        auto* file = static_cast<MemoryFile*>(user_data);
        sf_count_t available = static_cast<sf_count_t>(file->data.size()) - file->pos;
        if (available <= 0) {
            return 0;
        }
        sf_count_t n = count < available ? count : available;
        std::memcpy(ptr, file->data.data() + file->pos, static_cast<size_t>(n));
        file->pos += n;
        return n;
    }

    sf_count_t memWrite(const void* ptr, sf_count_t count, void* user_data) {
        auto* file = static_cast<MemoryFile*>(user_data);
        size_t end = static_cast<size_t>(file->pos + count);
        if (file->data.size() < end) {
            file->data.resize(end);
        }
        std::memcpy(file->data.data() + file->pos, ptr, static_cast<size_t>(count));
        file->pos += count;
        return count;
    }

    sf_count_t memTell(void* user_data) {
        return static_cast<MemoryFile*>(user_data)->pos;
    }
}

std::vector<char> encodeWav(const std::vector<int16_t>& samples, int sample_rate) {
    MemoryFile file;
    file.data.reserve(44 + samples.size() * sizeof(int16_t));

    SF_VIRTUAL_IO vio;
    vio.get_filelen = memGetLength;
    vio.seek = memSeek;
    vio.read = memRead;
    vio.write = memWrite;
    vio.tell = memTell;

    SF_INFO info;
    std::memset(&info, 0, sizeof(info));
    info.samplerate = sample_rate;
    info.channels = 1;
    info.format = SF_FORMAT_WAV | SF_FORMAT_PCM_16;

    SNDFILE* sf = sf_open_virtual(&vio, SFM_WRITE, &info, &file);
    if (!sf) {
        throw std::runtime_error(std::string("Failed to open WAV encoder: ") + sf_strerror(nullptr));
    }

    sf_count_t written = sf_write_short(sf, samples.data(), static_cast<sf_count_t>(samples.size()));
    if (written != static_cast<sf_count_t>(samples.size())) {
        std::string error = sf_strerror(sf);
        sf_close(sf);
        throw std::runtime_error("Short WAV write: " + error);
    }

    // Closing finalizes the RIFF header sizes
    if (sf_close(sf) != 0) {
        throw std::runtime_error("Failed to finalize WAV stream");
    }

    return file.data;
}

bool writeFile(const std::string& path, const std::vector<char>& bytes) {
    std::ofstream out(path, std::ios::binary);
    if (!out) {
        return false;
    }
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    return static_cast<bool>(out);
}

SoundFile readMono(const std::string& path) {
    SF_INFO info;
    std::memset(&info, 0, sizeof(info));

    SNDFILE* sf = sf_open(path.c_str(), SFM_READ, &info);
    if (!sf) {
        throw std::runtime_error("Cannot open " + path + ": " + sf_strerror(nullptr));
    }

    std::vector<int16_t> interleaved(static_cast<size_t>(info.frames * info.channels));
    sf_count_t frames_read = sf_readf_short(sf, interleaved.data(), info.frames);
    sf_close(sf);

    if (frames_read != info.frames) {
        std::cerr << "[wav_codec] Warning: only read " << frames_read << " of "
                  << info.frames << " frames from " << path << std::endl;
    }

    SoundFile result;
    result.sample_rate = info.samplerate;
    result.source_channels = info.channels;
    result.samples.resize(static_cast<size_t>(frames_read));

    for (sf_count_t f = 0; f < frames_read; ++f) {
        int32_t sum = 0;
        for (int c = 0; c < info.channels; ++c) {
            sum += interleaved[static_cast<size_t>(f * info.channels + c)];
        }
        result.samples[static_cast<size_t>(f)] = static_cast<int16_t>(sum / info.channels);
    }

    return result;
}

} // namespace wav_codec
