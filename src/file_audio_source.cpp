#include "file_audio_source.hpp"
#include "wav_codec.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <utility>

FileAudioSource::FileAudioSource(const std::string& path, const AudioSourceConfig& config, bool realtime)
    : path_(path), config_(config), realtime_(realtime) {
}

FileAudioSource::~FileAudioSource() {
    stop();
}

void FileAudioSource::start(const std::string& device_selector,
                            FrameCallback on_frame,
                            FaultCallback on_fault) {
    (void)device_selector;
    std::lock_guard<std::mutex> lock(control_mutex_);

    if (active_ || thread_.joinable()) {
        std::cerr << "[FileAudioSource] Already started" << std::endl;
        return;
    }

    wav_codec::SoundFile sound;
    try {
        sound = wav_codec::readMono(path_);
    } catch (const std::exception& e) {
        throw DeviceError(std::string("Cannot open audio file: ") + e.what());
    }

    if (sound.sample_rate != config_.sample_rate) {
        throw DeviceError("Audio file " + path_ + " has sample rate " + std::to_string(sound.sample_rate) +
                          " Hz, expected " + std::to_string(config_.sample_rate) + " Hz");
    }

    std::cout << "Replaying audio file: " << path_ << " (" << sound.samples.size() << " samples, "
              << sound.source_channels << " channel(s))" << std::endl;

    on_frame_ = std::move(on_frame);
    on_fault_ = std::move(on_fault);
    stop_requested_ = false;
    finished_ = false;
    frames_delivered_ = 0;
    active_ = true;

    thread_ = std::thread(&FileAudioSource::replayThread, this, std::move(sound.samples));
}

void FileAudioSource::stop() {
    std::lock_guard<std::mutex> lock(control_mutex_);

    {
        std::lock_guard<std::mutex> wait_lock(wait_mutex_);
        stop_requested_ = true;
    }
    wait_cv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }
    active_ = false;
}

bool FileAudioSource::isActive() const {
    return active_.load();
}

void FileAudioSource::replayThread(std::vector<int16_t> samples) {
    const size_t frame_size = static_cast<size_t>(config_.frames_per_buffer);
    const auto frame_duration = std::chrono::microseconds(
        static_cast<long long>(frame_size) * 1000000LL / config_.sample_rate);

    auto next_deadline = std::chrono::steady_clock::now();

    for (size_t offset = 0; offset < samples.size() && !stop_requested_; offset += frame_size) {
        if (realtime_) {
            // A frame is only "captured" once its duration has elapsed
            next_deadline += frame_duration;
            std::unique_lock<std::mutex> lock(wait_mutex_);
            if (wait_cv_.wait_until(lock, next_deadline, [this] { return stop_requested_.load(); })) {
                break;
            }
        }

        size_t count = std::min(frame_size, samples.size() - offset);
        if (on_frame_) {
            on_frame_(makeFrame(samples.data() + offset, count, 1, WallClock::now()));
        }
        frames_delivered_++;
    }

    if (!stop_requested_) {
        finished_ = true;
        std::cout << "\n[FileAudioSource] End of file reached" << std::endl;
    }
    active_ = false;
}
