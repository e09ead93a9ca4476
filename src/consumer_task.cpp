#include "consumer_task.hpp"
#include <iostream>
#include <utility>

ConsumerTask::ConsumerTask(const TranscriptLog& log,
                           std::unique_ptr<SegmentSink> sink,
                           ShutdownToken& shutdown,
                           std::chrono::milliseconds poll_interval)
    : log_(log), sink_(std::move(sink)), shutdown_(shutdown),
      poll_interval_(poll_interval), cursor_(log) {
}

ConsumerTask::~ConsumerTask() {
    stop();
}

void ConsumerTask::start() {
    if (running_) {
        return;
    }

    running_ = true;
    worker_ = std::thread(&ConsumerTask::workerThread, this);
}

void ConsumerTask::stop() {
    if (!running_) {
        return;
    }

    shutdown_.requestStop();
    if (worker_.joinable()) {
        worker_.join();
    }
    running_ = false;
}

size_t ConsumerTask::backlog() const {
    size_t total = log_.size();
    size_t next = cursor_position_.load();
    return total > next ? total - next : 0;
}

size_t ConsumerTask::pollOnce() {
    size_t handled = 0;

    for (const Segment& segment : cursor_.pending()) {
        if (shutdown_.stopRequested()) {
            break;
        }

        try {
            sink_->consume(segment);
            delivered_++;
        } catch (const std::exception& e) {
            failures_++;
            std::cerr << "\n[" << sink_->name() << "] Segment " << segment.position
                      << " failed: " << e.what() << std::endl;
        }

        // Advance past failures too, a permanently failing segment is not retried
        cursor_.advanceTo(segment.position + 1);
        cursor_position_ = cursor_.next();
        handled++;
    }

    return handled;
}

void ConsumerTask::workerThread() {
    while (!shutdown_.stopRequested()) {
        pollOnce();

        if (shutdown_.waitFor(poll_interval_)) {
            break;
        }
    }
}
