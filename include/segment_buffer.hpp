#ifndef SEGMENT_BUFFER_HPP
#define SEGMENT_BUFFER_HPP

#include "audio_frame.hpp"
#include <atomic>
#include <functional>
#include <mutex>
#include <vector>

// Frames collected between two drains.
struct Burst {
    std::vector<AudioFrame> frames;
    bool truncated;
    size_t discarded_frames;

    Burst() : truncated(false), discarded_frames(0) {}

    bool empty() const { return frames.empty(); }
    size_t sampleCount() const;
    std::vector<int16_t> joinedSamples() const;
};

// Decides whether a frame carries speech worth transcribing.
using FrameGate = std::function<bool(const AudioFrame&)>;

// Keeps frames whose mean absolute level exceeds `threshold`.
// This is an energy heuristic, not voice-activity detection: loud noise passes
// and quiet speech is dropped.
FrameGate makeAmplitudeGate(double threshold);

/**
 * Amplitude-gated frame accumulator shared between the capture callback
 * (single writer) and the segmentation loop (single reader).
 *
 * The mutex is held only for one push_back or one swap, so the capture
 * callback never waits on transcription.
 */
class SegmentBuffer {
public:
    explicit SegmentBuffer(FrameGate gate);

    // Capture thread. Returns true if the frame passed the gate and was kept.
    bool offer(AudioFrame frame);

    // Takes every accumulated frame and clears the buffer. When more than
    // `cap` frames are pending only the first `cap` are returned and the rest
    // are dropped. A cap of 0 disables truncation.
    Burst drain(size_t cap);

    bool empty() const;
    size_t pendingFrames() const;

    size_t keptFrames() const { return kept_frames_.load(); }
    size_t gatedFrames() const { return gated_frames_.load(); }

private:
    FrameGate gate_;
    std::vector<AudioFrame> frames_;
    mutable std::mutex mutex_;

    std::atomic<size_t> kept_frames_{0};
    std::atomic<size_t> gated_frames_{0};
};

#endif // SEGMENT_BUFFER_HPP
