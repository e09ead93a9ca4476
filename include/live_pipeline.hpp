#ifndef LIVE_PIPELINE_HPP
#define LIVE_PIPELINE_HPP

#include "audio_source.hpp"
#include "consumer_task.hpp"
#include "segment_buffer.hpp"
#include "segmentation_loop.hpp"
#include "shutdown_token.hpp"
#include "transcript_log.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

/**
 * Wires capture, segmentation and the consumers together and owns the
 * shutdown state.
 *
 * Start order: consumers, segmentation loop, audio source. Shutdown order:
 * stop request, audio source (device released), loop, consumers.
 */
class LivePipeline {
public:
    struct Config {
        double silence_threshold = 300.0;
        SegmentationLoop::Config loop;
        std::chrono::milliseconds consumer_poll_interval{100};
    };

    LivePipeline(std::unique_ptr<AudioSource> source,
                 Transcriber& transcriber,
                 const Config& config);
    ~LivePipeline();

    LivePipeline(const LivePipeline&) = delete;
    LivePipeline& operator=(const LivePipeline&) = delete;

    // Consumers must be added before start().
    ConsumerTask& addConsumer(std::unique_ptr<SegmentSink> sink);

    // Throws DeviceError if the source cannot be started; everything already
    // started is torn down again first.
    void start(const std::string& device_selector);

    // Idempotent. Safe to call while segments are still in flight.
    void shutdown();

    bool running() const { return running_.load() && !faulted_.load(); }
    bool faulted() const { return faulted_.load(); }
    std::string faultMessage() const;

    // Lets the source poll for device loss.
    void checkHealth();

    // No audio waiting, no burst in flight and every consumer caught up.
    bool drained() const;

    const TranscriptLog& log() const { return log_; }
    ShutdownToken& token() { return token_; }
    AudioSource& source() { return *source_; }
    const SegmentBuffer& buffer() const { return buffer_; }
    SegmentationStats stats() const { return loop_.stats(); }
    const std::vector<std::unique_ptr<ConsumerTask>>& consumers() const { return consumers_; }

private:
    void onFault(const StreamFault& fault);

    Config config_;
    std::unique_ptr<AudioSource> source_;
    ShutdownToken token_;
    SegmentBuffer buffer_;
    TranscriptLog log_;
    SegmentationLoop loop_;
    std::vector<std::unique_ptr<ConsumerTask>> consumers_;

    std::atomic<bool> running_{false};
    std::atomic<bool> faulted_{false};
    bool shut_down_{false};
    std::string fault_message_;
    mutable std::mutex fault_mutex_;
    std::mutex shutdown_mutex_;
};

#endif // LIVE_PIPELINE_HPP
