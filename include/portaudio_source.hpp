#ifndef PORTAUDIO_SOURCE_HPP
#define PORTAUDIO_SOURCE_HPP

#include "audio_source.hpp"
#include <portaudio.h>
#include <atomic>
#include <mutex>

// Live capture through a PortAudio callback stream (16-bit input).
class PortAudioSource : public AudioSource {
public:
    explicit PortAudioSource(const AudioSourceConfig& config);
    ~PortAudioSource() override;

    void start(const std::string& device_selector,
               FrameCallback on_frame,
               FaultCallback on_fault) override;
    void stop() override;
    bool isActive() const override;
    std::string backendName() const override { return "PortAudio"; }
    void checkHealth() override;

    // Input-capable devices. Initializes and terminates PortAudio itself.
    static std::vector<InputDeviceInfo> listInputDevices();

private:
    // Requires PortAudio to be initialized
    static std::vector<InputDeviceInfo> enumerateDevices();

    void releaseLocked();
    void reportFault(const std::string& message);
    void processAudioFrame(const int16_t* input, unsigned long frame_count);

    static int audioCallback(const void* input_buffer, void* output_buffer,
                             unsigned long frames_per_buffer,
                             const PaStreamCallbackTimeInfo* time_info,
                             PaStreamCallbackFlags status_flags,
                             void* user_data);
    static void streamFinishedCallback(void* user_data);

    AudioSourceConfig config_;
    PaStream* stream_{nullptr};
    bool pa_initialized_{false};
    mutable std::mutex control_mutex_;

    FrameCallback on_frame_;
    FaultCallback on_fault_;

    std::atomic<bool> stop_requested_{false};
    std::atomic<bool> fault_reported_{false};
    std::atomic<size_t> overflow_count_{0};
};

#endif // PORTAUDIO_SOURCE_HPP
