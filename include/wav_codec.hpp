#pragma once

#include <cstdint>
#include <string>
#include <vector>

// 16-bit mono WAV encoding and sound file loading on top of libsndfile.
namespace wav_codec {

// Encodes samples as a complete in-memory WAV file (PCM 16, mono).
// Throws std::runtime_error if libsndfile rejects the stream.
std::vector<char> encodeWav(const std::vector<int16_t>& samples, int sample_rate);

// Writes raw bytes to `path`. Returns false if the file could not be written.
bool writeFile(const std::string& path, const std::vector<char>& bytes);

struct SoundFile {
    std::vector<int16_t> samples;  // mono
    int sample_rate = 0;
    int source_channels = 0;
};

// Reads any libsndfile-supported file and averages it down to mono 16-bit.
// Throws std::runtime_error when the file cannot be opened.
SoundFile readMono(const std::string& path);

} // namespace wav_codec
