#include "audio_frame.hpp"
#include <cstdlib>

double meanAbsoluteLevel(const int16_t* samples, size_t count) {
    if (count == 0) {
        return 0.0;
    }

    int64_t sum = 0;
    for (size_t i = 0; i < count; ++i) {
        sum += std::abs(static_cast<int32_t>(samples[i]));
    }
    return static_cast<double>(sum) / static_cast<double>(count);
}

AudioFrame makeFrame(const int16_t* interleaved, size_t frame_count, int channels,
                     WallClock::time_point captured_at) {
    std::vector<int16_t> mono;

    if (channels <= 1) {
        mono.assign(interleaved, interleaved + frame_count);
    } else {
        // Average channels down to mono
        mono.resize(frame_count);
        for (size_t f = 0; f < frame_count; ++f) {
            int32_t sum = 0;
            for (int c = 0; c < channels; ++c) {
                sum += interleaved[f * channels + c];
            }
            mono[f] = static_cast<int16_t>(sum / channels);
        }
    }

    double level = meanAbsoluteLevel(mono.data(), mono.size());
    return AudioFrame(std::move(mono), level, captured_at);
}
