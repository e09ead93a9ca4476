#ifndef CONSUMER_TASK_HPP
#define CONSUMER_TASK_HPP

#include "shutdown_token.hpp"
#include "transcript_log.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

// Takes a segment and produces a side effect (print, page update,
// translation). Throwing marks that one segment as failed.
class SegmentSink {
public:
    virtual ~SegmentSink() = default;

    virtual void consume(const Segment& segment) = 0;
    virtual std::string name() const = 0;
};

/**
 * One independently paced reader of the transcript log.
 *
 * Owns its cursor, its sink and its thread. A slow sink only grows this
 * task's backlog; it never blocks the loop or another consumer. A segment
 * whose sink call throws is logged and skipped, so the cursor always moves
 * forward.
 */
class ConsumerTask {
public:
    ConsumerTask(const TranscriptLog& log,
                 std::unique_ptr<SegmentSink> sink,
                 ShutdownToken& shutdown,
                 std::chrono::milliseconds poll_interval = std::chrono::milliseconds(100));
    ~ConsumerTask();

    ConsumerTask(const ConsumerTask&) = delete;
    ConsumerTask& operator=(const ConsumerTask&) = delete;

    void start();
    // Requests shutdown on the shared token and joins the worker.
    void stop();

    // Delivers every pending segment once. Returns the number handed to the sink.
    size_t pollOnce();

    std::string name() const { return sink_->name(); }
    size_t cursorPosition() const { return cursor_position_.load(); }
    size_t delivered() const { return delivered_.load(); }
    size_t failures() const { return failures_.load(); }
    size_t backlog() const;

private:
    void workerThread();

    const TranscriptLog& log_;
    std::unique_ptr<SegmentSink> sink_;
    ShutdownToken& shutdown_;
    std::chrono::milliseconds poll_interval_;

    TranscriptCursor cursor_;
    std::atomic<size_t> cursor_position_{0};
    std::atomic<size_t> delivered_{0};
    std::atomic<size_t> failures_{0};

    std::atomic<bool> running_{false};
    std::thread worker_;
};

#endif // CONSUMER_TASK_HPP
