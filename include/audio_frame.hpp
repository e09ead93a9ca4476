#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

using WallClock = std::chrono::system_clock;

// One block of mono 16-bit PCM as delivered by the capture callback.
struct AudioFrame {
    std::vector<int16_t> samples;
    double mean_abs;                  // mean absolute sample magnitude
    WallClock::time_point captured_at;

    AudioFrame() : mean_abs(0.0) {}
    AudioFrame(std::vector<int16_t> s, double level, WallClock::time_point t)
        : samples(std::move(s)), mean_abs(level), captured_at(t) {}
};

// Mean of |sample| over the block. Returns 0 for an empty block.
double meanAbsoluteLevel(const int16_t* samples, size_t count);

// Builds a mono frame from interleaved input, averaging channels.
AudioFrame makeFrame(const int16_t* interleaved, size_t frame_count, int channels,
                     WallClock::time_point captured_at);
