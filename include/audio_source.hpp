#ifndef AUDIO_SOURCE_HPP
#define AUDIO_SOURCE_HPP

#include "audio_frame.hpp"
#include "pipeline_errors.hpp"
#include <functional>
#include <string>
#include <vector>

struct AudioSourceConfig {
    int sample_rate = 16000;
    int channels = 1;
    unsigned long frames_per_buffer = 1024 * 128;  // large frames keep per-call overhead small
};

struct InputDeviceInfo {
    int index;
    std::string name;
    double default_sample_rate;
    int max_input_channels;
};

/**
 * Real-time capture device. Frames are delivered on the source's own capture
 * thread; the frame callback must return within one frame's worth of audio.
 */
class AudioSource {
public:
    using FrameCallback = std::function<void(AudioFrame&&)>;
    using FaultCallback = std::function<void(const StreamFault&)>;

    virtual ~AudioSource() = default;

    // Opens and starts the device picked by `device_selector` (see
    // resolveInputDevice). Throws DeviceError if it cannot be opened.
    virtual void start(const std::string& device_selector,
                       FrameCallback on_frame,
                       FaultCallback on_fault) = 0;

    // Stops delivery and releases the device. Idempotent, callable from any
    // thread other than the capture thread.
    virtual void stop() = 0;

    virtual bool isActive() const = 0;
    virtual std::string backendName() const = 0;

    // Polled from the controlling thread. Sources that cannot signal device
    // loss from their callback detect it here and report it via on_fault.
    virtual void checkHealth() {}
};

// Empty selector -> -1 (system default). A selector that is entirely an
// integer -> that index. Otherwise the first input device whose name contains
// the selector, ignoring case. Throws DeviceError when nothing matches.
int resolveInputDevice(const std::string& device_selector,
                       const std::vector<InputDeviceInfo>& devices);

#endif // AUDIO_SOURCE_HPP
