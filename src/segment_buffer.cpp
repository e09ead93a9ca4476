#include "segment_buffer.hpp"
#include <cstddef>
#include <utility>

size_t Burst::sampleCount() const {
    size_t total = 0;
    for (const auto& frame : frames) {
        total += frame.samples.size();
    }
    return total;
}

std::vector<int16_t> Burst::joinedSamples() const {
    std::vector<int16_t> joined;
    joined.reserve(sampleCount());
    for (const auto& frame : frames) {
        joined.insert(joined.end(), frame.samples.begin(), frame.samples.end());
    }
    return joined;
}

FrameGate makeAmplitudeGate(double threshold) {
    return [threshold](const AudioFrame& frame) {
        return frame.mean_abs > threshold;
    };
}

SegmentBuffer::SegmentBuffer(FrameGate gate) : gate_(std::move(gate)) {
    if (!gate_) {
        gate_ = [](const AudioFrame&) { return true; };
    }
}

bool SegmentBuffer::offer(AudioFrame frame) {
    if (!gate_(frame)) {
        gated_frames_++;
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        frames_.push_back(std::move(frame));
    }
    kept_frames_++;
    return true;
}

Burst SegmentBuffer::drain(size_t cap) {
    Burst burst;

    // Swap under the lock, truncate outside it
    {
        std::lock_guard<std::mutex> lock(mutex_);
        burst.frames.swap(frames_);
    }

    if (cap > 0 && burst.frames.size() > cap) {
        burst.discarded_frames = burst.frames.size() - cap;
        burst.frames.erase(burst.frames.begin() + static_cast<std::ptrdiff_t>(cap), burst.frames.end());
        burst.truncated = true;
    }

    return burst;
}

bool SegmentBuffer::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return frames_.empty();
}

size_t SegmentBuffer::pendingFrames() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return frames_.size();
}
