#ifndef FILE_AUDIO_SOURCE_HPP
#define FILE_AUDIO_SOURCE_HPP

#include "audio_source.hpp"
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>

/**
 * Replays a sound file as if it came from a microphone: the file is read with
 * libsndfile, cut into frames of the configured size and delivered on a
 * replay thread. With `realtime` each frame is held back for its own
 * duration; without it frames are delivered back to back.
 *
 * The device selector passed to start() is ignored.
 */
class FileAudioSource : public AudioSource {
public:
    FileAudioSource(const std::string& path, const AudioSourceConfig& config, bool realtime = true);
    ~FileAudioSource() override;

    void start(const std::string& device_selector,
               FrameCallback on_frame,
               FaultCallback on_fault) override;
    void stop() override;
    bool isActive() const override;
    std::string backendName() const override { return "file " + path_; }

    // True once every frame of the file has been delivered.
    bool finished() const { return finished_.load(); }
    size_t framesDelivered() const { return frames_delivered_.load(); }

private:
    void replayThread(std::vector<int16_t> samples);

    std::string path_;
    AudioSourceConfig config_;
    bool realtime_;

    FrameCallback on_frame_;
    FaultCallback on_fault_;

    std::mutex control_mutex_;
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
    std::thread thread_;

    std::atomic<bool> active_{false};
    std::atomic<bool> stop_requested_{false};
    std::atomic<bool> finished_{false};
    std::atomic<size_t> frames_delivered_{0};
};

#endif // FILE_AUDIO_SOURCE_HPP
