#include "segmentation_loop.hpp"
#include "console_output.hpp"
#include "wav_codec.hpp"
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace {
    std::string trimmed(const std::string& str) {
        size_t first = str.find_first_not_of(" \t\n\r");
        if (first == std::string::npos) return "";
        size_t last = str.find_last_not_of(" \t\n\r");
        return str.substr(first, (last - first + 1));
    }

    // Local time as 2024-05-01T13:45:12.123456
    std::string isoTimestamp(WallClock::time_point now) {
        std::time_t t = WallClock::to_time_t(now);
        std::tm local{};
        localtime_r(&t, &local);
        auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
            now.time_since_epoch()).count() % 1000000;

        std::ostringstream out;
        out << std::put_time(&local, "%Y-%m-%dT%H:%M:%S")
            << '.' << std::setw(6) << std::setfill('0') << micros;
        return out.str();
    }
}

std::string joinSpeechPieces(const std::vector<TranscribedPiece>& pieces, float cutoff) {
    std::string joined;
    for (const auto& piece : pieces) {
        if (piece.no_speech_prob >= cutoff) {
            continue;
        }
        std::string text = trimmed(piece.text);
        if (text.empty()) {
            continue;
        }
        if (!joined.empty()) {
            joined += ' ';
        }
        joined += text;
    }
    return joined;
}

SegmentationLoop::SegmentationLoop(SegmentBuffer& buffer,
                                   Transcriber& transcriber,
                                   TranscriptLog& log,
                                   ShutdownToken& shutdown,
                                   const Config& config)
    : buffer_(buffer), transcriber_(transcriber), log_(log),
      shutdown_(shutdown), config_(config) {
}

SegmentationLoop::~SegmentationLoop() {
    stop();
}

void SegmentationLoop::start() {
    if (running_) {
        return;
    }

    running_ = true;
    thread_ = std::thread(&SegmentationLoop::loopThread, this);
}

void SegmentationLoop::stop() {
    if (!running_) {
        return;
    }

    shutdown_.requestStop();
    if (thread_.joinable()) {
        thread_.join();
    }
    running_ = false;
}

SegmentationStats SegmentationLoop::stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

void SegmentationLoop::loopThread() {
    while (!shutdown_.stopRequested()) {
        tick();

        if (config_.show_status) {
            printStatus();
        }

        if (shutdown_.waitFor(config_.poll_interval)) {
            break;
        }
    }
}

bool SegmentationLoop::tick() {
    if (buffer_.empty()) {
        return false;
    }

    state_ = State::DRAINING;

    auto capture_start = WallClock::now();
    Burst burst = buffer_.drain(config_.truncate_frames);
    if (burst.empty()) {
        state_ = State::IDLE;
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.bursts++;
        if (burst.truncated) {
            stats_.truncated++;
        }
    }

    if (burst.truncated) {
        std::cerr << "\n[SegmentationLoop] Burst truncated to " << burst.frames.size()
                  << " frames, dropped " << burst.discarded_frames << std::endl;
    }

    std::string text;
    try {
        std::vector<char> wav = wav_codec::encodeWav(burst.joinedSamples(), config_.sample_rate);

        if (config_.keep_audio) {
            keepAudio(wav);
        }

        std::vector<TranscribedPiece> pieces = transcriber_.transcribe(wav, config_.request);
        text = joinSpeechPieces(pieces, config_.no_speech_cutoff);
    } catch (const std::exception& e) {
        std::cerr << "\n[SegmentationLoop] Transcription failed for burst of "
                  << burst.frames.size() << " frames: " << e.what() << std::endl;
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.failures++;
        }
        state_ = State::IDLE;
        return false;
    }

    auto capture_end = WallClock::now();

    if (text.empty()) {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.suppressed++;
        state_ = State::IDLE;
        return false;
    }

    // Result of a call that outlived shutdown
    if (shutdown_.stopRequested()) {
        std::cerr << "\n[SegmentationLoop] Shutdown requested, discarding late result" << std::endl;
        state_ = State::IDLE;
        return false;
    }

    log_.append(text, burst.truncated, capture_start, capture_end);
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.segments++;
    }

    state_ = State::IDLE;
    return true;
}

void SegmentationLoop::keepAudio(const std::vector<char>& wav_bytes) {
    std::filesystem::path path = std::filesystem::path(config_.keep_dir) /
                                 (isoTimestamp(WallClock::now()) + ".wav");
    if (!wav_codec::writeFile(path.string(), wav_bytes)) {
        std::cerr << "\n[SegmentationLoop] Failed to keep audio file " << path.string() << std::endl;
    }
}

std::string SegmentationLoop::statusLine() const {
    return "Buffers: audio=" + std::to_string(buffer_.pendingFrames()) +
           ", transcript=" + std::to_string(log_.size());
}

void SegmentationLoop::printStatus() const {
    writeStatusLine(std::cout, statusLine());
}
