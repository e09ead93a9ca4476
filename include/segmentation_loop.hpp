#ifndef SEGMENTATION_LOOP_HPP
#define SEGMENTATION_LOOP_HPP

#include "segment_buffer.hpp"
#include "shutdown_token.hpp"
#include "transcriber.hpp"
#include "transcript_log.hpp"
#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>

struct SegmentationStats {
    size_t bursts = 0;      // drained and sent to the transcriber
    size_t segments = 0;    // appended to the log
    size_t failures = 0;    // transcriber errors
    size_t suppressed = 0;  // transcribed to empty text
    size_t truncated = 0;   // bursts that hit the frame cap
};

/**
 * Drains the segment buffer on a fixed tick, transcribes each burst and
 * appends non-empty results to the transcript log.
 *
 * The loop is the only writer of the log. A failed burst is logged and
 * dropped; stale audio is never re-sent.
 */
class SegmentationLoop {
public:
    enum class State {
        IDLE,
        DRAINING
    };

    struct Config {
        size_t truncate_frames = 60;
        std::chrono::milliseconds poll_interval{100};
        float no_speech_cutoff = 0.5f;
        int sample_rate = 16000;
        TranscribeRequest request;
        bool keep_audio = false;
        std::string keep_dir = ".";
        bool show_status = false;
    };

    SegmentationLoop(SegmentBuffer& buffer,
                     Transcriber& transcriber,
                     TranscriptLog& log,
                     ShutdownToken& shutdown,
                     const Config& config);
    ~SegmentationLoop();

    // Start/stop the loop thread. stop() requests shutdown and joins; a
    // transcription in flight is allowed to finish but is not appended.
    void start();
    void stop();

    // One drain cycle. Returns true if a segment was appended.
    bool tick();

    State state() const { return state_.load(); }
    SegmentationStats stats() const;

    // "Buffers: audio=<pending frames>, transcript=<log size>"
    std::string statusLine() const;

private:
    void loopThread();
    void keepAudio(const std::vector<char>& wav_bytes);
    void printStatus() const;

    SegmentBuffer& buffer_;
    Transcriber& transcriber_;
    TranscriptLog& log_;
    ShutdownToken& shutdown_;
    Config config_;

    std::atomic<State> state_{State::IDLE};
    std::atomic<bool> running_{false};
    std::thread thread_;

    SegmentationStats stats_;
    mutable std::mutex stats_mutex_;
};

// Keeps pieces whose no-speech probability is below `cutoff`, trims each and
// joins the survivors with single spaces.
std::string joinSpeechPieces(const std::vector<TranscribedPiece>& pieces, float cutoff);

#endif // SEGMENTATION_LOOP_HPP
