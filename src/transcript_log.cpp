#include "transcript_log.hpp"
#include <cstddef>
#include <stdexcept>
#include <utility>

size_t TranscriptLog::append(std::string text, bool truncated,
                             WallClock::time_point capture_start,
                             WallClock::time_point capture_end) {
    std::lock_guard<std::mutex> lock(mutex_);

    Segment segment;
    segment.position = segments_.size();
    segment.text = std::move(text);
    segment.truncated = truncated;
    segment.capture_start = capture_start;
    segment.capture_end = capture_end;

    segments_.push_back(std::move(segment));
    return segments_.back().position;
}

std::vector<Segment> TranscriptLog::readFrom(size_t position) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (position >= segments_.size()) {
        return {};
    }
    return std::vector<Segment>(segments_.begin() + static_cast<std::ptrdiff_t>(position),
                                segments_.end());
}

Segment TranscriptLog::at(size_t position) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (position >= segments_.size()) {
        throw std::out_of_range("Transcript position " + std::to_string(position) +
                                " not appended yet");
    }
    return segments_[position];
}

size_t TranscriptLog::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return segments_.size();
}

std::vector<Segment> TranscriptCursor::pending() const {
    return log_.readFrom(next_);
}

void TranscriptCursor::advanceTo(size_t next_position) {
    if (next_position < next_) {
        throw std::logic_error("Transcript cursor cannot move backwards (from " +
                               std::to_string(next_) + " to " +
                               std::to_string(next_position) + ")");
    }
    next_ = next_position;
}

std::vector<Segment> TranscriptCursor::poll() {
    std::vector<Segment> segments = pending();
    if (!segments.empty()) {
        advanceTo(segments.back().position + 1);
    }
    return segments;
}

size_t TranscriptCursor::backlog() const {
    size_t total = log_.size();
    return total > next_ ? total - next_ : 0;
}
