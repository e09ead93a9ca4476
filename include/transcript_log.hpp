#ifndef TRANSCRIPT_LOG_HPP
#define TRANSCRIPT_LOG_HPP

#include "audio_frame.hpp"
#include <mutex>
#include <string>
#include <vector>

struct Segment {
    size_t position;
    std::string text;
    bool truncated;
    WallClock::time_point capture_start;
    WallClock::time_point capture_end;

    Segment() : position(0), truncated(false) {}

    // Seconds from drain to transcription result.
    double processingDelay() const {
        return std::chrono::duration<double>(capture_end - capture_start).count();
    }
};

/**
 * Append-only, position-indexed list of completed segments.
 *
 * Exactly one writer (the segmentation loop) appends; any number of readers
 * copy segments out by position. Positions start at 0 and are never reused.
 */
class TranscriptLog {
public:
    TranscriptLog() = default;
    TranscriptLog(const TranscriptLog&) = delete;
    TranscriptLog& operator=(const TranscriptLog&) = delete;

    // Returns the position assigned to the new segment.
    size_t append(std::string text, bool truncated,
                  WallClock::time_point capture_start,
                  WallClock::time_point capture_end);

    // Copies of all segments with position >= `position`, in order.
    std::vector<Segment> readFrom(size_t position) const;

    // Throws std::out_of_range for a position that was never appended.
    Segment at(size_t position) const;

    size_t size() const;

private:
    std::vector<Segment> segments_;
    mutable std::mutex mutex_;
};

// A consumer's private "next position to read".
class TranscriptCursor {
public:
    explicit TranscriptCursor(const TranscriptLog& log) : log_(log), next_(0) {}

    // Segments not yet read, without moving the cursor.
    std::vector<Segment> pending() const;

    // Moves the cursor to `next_position`. Moving backwards throws
    // std::logic_error.
    void advanceTo(size_t next_position);

    // pending() followed by advancing past the last returned segment.
    std::vector<Segment> poll();

    size_t next() const { return next_; }
    size_t backlog() const;

private:
    const TranscriptLog& log_;
    size_t next_;
};

#endif // TRANSCRIPT_LOG_HPP
