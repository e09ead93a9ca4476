#include "portaudio_source.hpp"
#include <iostream>
#include <utility>

PortAudioSource::PortAudioSource(const AudioSourceConfig& config) : config_(config) {
}

PortAudioSource::~PortAudioSource() {
    stop();
}

std::vector<InputDeviceInfo> PortAudioSource::enumerateDevices() {
    std::vector<InputDeviceInfo> devices;
    int numDevices = Pa_GetDeviceCount();
    for (int i = 0; i < numDevices; i++) {
        const PaDeviceInfo* deviceInfo = Pa_GetDeviceInfo(i);
        if (deviceInfo && deviceInfo->maxInputChannels > 0) {
            devices.push_back(InputDeviceInfo{i, deviceInfo->name,
                                              deviceInfo->defaultSampleRate,
                                              deviceInfo->maxInputChannels});
        }
    }
    return devices;
}

std::vector<InputDeviceInfo> PortAudioSource::listInputDevices() {
    PaError err = Pa_Initialize();
    if (err != paNoError) {
        throw DeviceError(std::string("Failed to initialize PortAudio: ") + Pa_GetErrorText(err));
    }

    std::vector<InputDeviceInfo> devices = enumerateDevices();
    Pa_Terminate();
    return devices;
}

void PortAudioSource::start(const std::string& device_selector,
                            FrameCallback on_frame,
                            FaultCallback on_fault) {
    std::lock_guard<std::mutex> lock(control_mutex_);

    if (stream_) {
        std::cerr << "[PortAudioSource] Stream already active" << std::endl;
        return;
    }

    on_frame_ = std::move(on_frame);
    on_fault_ = std::move(on_fault);
    stop_requested_ = false;
    fault_reported_ = false;
    overflow_count_ = 0;

    PaError err = Pa_Initialize();
    if (err != paNoError) {
        throw DeviceError(std::string("Failed to initialize PortAudio: ") + Pa_GetErrorText(err));
    }
    pa_initialized_ = true;

    int device_index = -1;
    try {
        device_index = resolveInputDevice(device_selector, enumerateDevices());
    } catch (const DeviceError&) {
        releaseLocked();
        throw;
    }

    if (device_index == -1) {
        device_index = Pa_GetDefaultInputDevice();
        if (device_index == paNoDevice) {
            releaseLocked();
            throw DeviceError("No default input device available");
        }
    }

    const PaDeviceInfo* deviceInfo =
        (device_index >= 0 && device_index < Pa_GetDeviceCount()) ? Pa_GetDeviceInfo(device_index) : nullptr;
    if (!deviceInfo || deviceInfo->maxInputChannels < config_.channels) {
        releaseLocked();
        throw DeviceError("Device " + std::to_string(device_index) + " is not an input device with " +
                          std::to_string(config_.channels) + " channel(s)");
    }

    // Set up stream parameters
    PaStreamParameters inputParameters;
    inputParameters.device = device_index;
    inputParameters.channelCount = config_.channels;
    inputParameters.sampleFormat = paInt16;
    inputParameters.suggestedLatency = deviceInfo->defaultHighInputLatency;
    inputParameters.hostApiSpecificStreamInfo = nullptr;

    err = Pa_OpenStream(&stream_,
                        &inputParameters,
                        nullptr, // no output
                        config_.sample_rate,
                        config_.frames_per_buffer,
                        paClipOff,
                        &PortAudioSource::audioCallback,
                        this);
    if (err != paNoError) {
        stream_ = nullptr;
        releaseLocked();
        throw DeviceError(std::string("Error opening audio device: ") + Pa_GetErrorText(err));
    }

    Pa_SetStreamFinishedCallback(stream_, &PortAudioSource::streamFinishedCallback);

    err = Pa_StartStream(stream_);
    if (err != paNoError) {
        releaseLocked();
        throw DeviceError(std::string("Failed to start stream: ") + Pa_GetErrorText(err));
    }

    std::cout << "Using audio device: " << deviceInfo->name << " (index " << device_index << ")" << std::endl;
    std::cout << "Sample rate: " << config_.sample_rate << " Hz, channels: " << config_.channels
              << ", frame: " << config_.frames_per_buffer << " samples" << std::endl;
}

void PortAudioSource::stop() {
    std::lock_guard<std::mutex> lock(control_mutex_);
    if (!stream_ && !pa_initialized_) {
        return;
    }

    stop_requested_ = true;
    releaseLocked();

    if (overflow_count_ > 0) {
        std::cerr << "[PortAudioSource] " << overflow_count_.load()
                  << " input overflow(s) during capture" << std::endl;
    }
}

void PortAudioSource::releaseLocked() {
    stop_requested_ = true;

    if (stream_) {
        PaError err = Pa_IsStreamStopped(stream_) == 1 ? paNoError : Pa_StopStream(stream_);
        if (err != paNoError) {
            std::cerr << "[PortAudioSource] Failed to stop stream: " << Pa_GetErrorText(err) << std::endl;
        }
        err = Pa_CloseStream(stream_);
        if (err != paNoError) {
            std::cerr << "[PortAudioSource] Failed to close stream: " << Pa_GetErrorText(err) << std::endl;
        }
        stream_ = nullptr;
    }

    if (pa_initialized_) {
        Pa_Terminate();
        pa_initialized_ = false;
    }
}

bool PortAudioSource::isActive() const {
    std::lock_guard<std::mutex> lock(control_mutex_);
    return stream_ && Pa_IsStreamActive(stream_) == 1;
}

void PortAudioSource::checkHealth() {
    bool lost = false;
    {
        std::lock_guard<std::mutex> lock(control_mutex_);
        lost = stream_ && !stop_requested_ && Pa_IsStreamActive(stream_) != 1;
    }

    if (lost) {
        reportFault("Audio stream is no longer active (device lost?)");
    }
}

void PortAudioSource::reportFault(const std::string& message) {
    if (fault_reported_.exchange(true)) {
        return;
    }
    if (on_fault_) {
        on_fault_(StreamFault(message));
    }
}

void PortAudioSource::processAudioFrame(const int16_t* input, unsigned long frame_count) {
    if (on_frame_) {
        on_frame_(makeFrame(input, frame_count, config_.channels, WallClock::now()));
    }
}

int PortAudioSource::audioCallback(const void* input_buffer, void* output_buffer,
                                   unsigned long frames_per_buffer,
                                   const PaStreamCallbackTimeInfo* time_info,
                                   PaStreamCallbackFlags status_flags,
                                   void* user_data) {
    (void)output_buffer;
    (void)time_info;

    PortAudioSource* source = static_cast<PortAudioSource*>(user_data);
    const int16_t* input = static_cast<const int16_t*>(input_buffer);

    if (source->stop_requested_) {
        return paComplete;
    }

    if (status_flags & paInputOverflow) {
        source->overflow_count_++;
    }

    if (input) {
        source->processAudioFrame(input, frames_per_buffer);
    }

    return paContinue;
}

void PortAudioSource::streamFinishedCallback(void* user_data) {
    PortAudioSource* source = static_cast<PortAudioSource*>(user_data);
    if (!source->stop_requested_) {
        source->reportFault("Audio stream finished unexpectedly");
    }
}
