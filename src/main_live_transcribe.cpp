#include <iostream>
#include <string>
#include <memory>
#include <chrono>
#include <thread>
#include <iomanip>
#include <vector>
#include <atomic>
#include <signal.h>

#include "api_comm.hpp"
#include "file_audio_source.hpp"
#include "live_pipeline.hpp"
#include "pipeline_config.hpp"
#include "pipeline_setup.hpp"
#include "portaudio_source.hpp"
#include "whisper_api_transcriber.hpp"

// Global flag for graceful shutdown
std::atomic<bool> g_running(true);

void signalHandler(int signum) {
    g_running = false;

    // Restore default signal handler to allow force quit
    signal(signum, SIG_DFL);
}

namespace {
    void listDevices() {
        std::vector<InputDeviceInfo> devices = PortAudioSource::listInputDevices();

        std::cout << "\nAvailable audio input devices:" << std::endl;
        std::cout << "------------------------------" << std::endl;
        for (const auto& device : devices) {
            std::cout << "Index " << device.index << ": " << device.name << std::endl;
            std::cout << "    Max input channels: " << device.max_input_channels << std::endl;
            std::cout << "    Default sample rate: " << std::fixed << std::setprecision(0)
                      << device.default_sample_rate << " Hz" << std::endl;
        }
        if (devices.empty()) {
            std::cout << "No input devices found" << std::endl;
        }
    }

    std::unique_ptr<Translator> makeLlmTranslator(api_comm::ApiClient& client, const PipelineConfig& config) {
        if (config.llm_backend == "api") {
            if (!client.isConfigured()) {
                throw ConfigError("No API key configured for the 'api' backend. Use --api_key, "
                                  "an .env file or the API_KEY environment variable");
            }
            std::cout << "Translating with " << client.getApiProvider() << " at "
                      << client.getApiUrl() << std::endl;
            return std::make_unique<ApiTranslator>(client, config.model_translate, config.translation_prompt);
        }

        auto translator = std::make_unique<OllamaTranslator>(config.model_translate, config.translation_prompt);
        if (!translator->initialize()) {
            throw ConfigError("Ollama model " + config.model_translate + " is not available");
        }
        return translator;
    }

    std::unique_ptr<AudioSource> makeSource(const PipelineConfig& config) {
        AudioSourceConfig source_config;
        source_config.sample_rate = config.sample_rate;
        source_config.channels = config.channels;
        source_config.frames_per_buffer = config.frames_per_buffer;

        if (!config.input_file.empty()) {
            return std::make_unique<FileAudioSource>(config.input_file, source_config);
        }
        return std::make_unique<PortAudioSource>(source_config);
    }

    void printStatistics(const LivePipeline& pipeline) {
        SegmentationStats stats = pipeline.stats();

        std::cout << "\n\nSession Statistics:" << std::endl;
        std::cout << "  Frames kept / gated: " << pipeline.buffer().keptFrames() << " / "
                  << pipeline.buffer().gatedFrames() << std::endl;
        std::cout << "  Bursts transcribed: " << stats.bursts << std::endl;
        std::cout << "  Segments: " << stats.segments << std::endl;
        std::cout << "  Silent bursts: " << stats.suppressed << std::endl;
        std::cout << "  Truncated bursts: " << stats.truncated << std::endl;
        std::cout << "  Transcription failures: " << stats.failures << std::endl;
        for (const auto& consumer : pipeline.consumers()) {
            std::cout << "  " << consumer->name() << ": " << consumer->delivered() << " delivered, "
                      << consumer->failures() << " failed, " << consumer->backlog() << " pending" << std::endl;
        }
    }
}

int main(int argc, char** argv) {
    std::cout << "Live Transcribe" << std::endl;
    std::cout << "===============" << std::endl;

    PipelineConfig config;
    try {
        config = parseCommandLine(std::vector<std::string>(argv + 1, argv + argc));
    } catch (const ConfigError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        printUsage(argv[0]);
        return 1;
    }

    if (config.show_help) {
        printUsage(argv[0]);
        return 0;
    }

    if (config.list_devices) {
        try {
            listDevices();
        } catch (const DeviceError& e) {
            std::cerr << "Error: " << e.what() << std::endl;
            return 1;
        }
        return 0;
    }

    printConfiguration(config);

    // Set up signal handlers
    signal(SIGINT, signalHandler);   // Ctrl+C
    signal(SIGTERM, signalHandler);  // Termination

    int exit_code = 0;

    try {
        api_comm::ApiClient client;
        configureApiClient(client, config);

        WhisperApiTranscriber::Config whisper_config;
        whisper_config.base_url = config.whisper_url;
        whisper_config.model = config.model;
        WhisperApiTranscriber transcriber(client, whisper_config);

        LivePipeline::Config pipeline_config = buildPipelineConfig(config);

        std::unique_ptr<AudioSource> source = makeSource(config);
        FileAudioSource* file_source = dynamic_cast<FileAudioSource*>(source.get());

        LivePipeline pipeline(std::move(source), transcriber, pipeline_config);

        // Abort HTTP transfers in flight once shutdown starts
        ShutdownToken& token = pipeline.token();
        client.setCancelCheck([&token]() { return token.stopRequested(); });

        addModeConsumers(
            pipeline, config, std::cout,
            [&client, &config]() { return makeLlmTranslator(client, config); },
            [&client, &config]() -> std::unique_ptr<Renderer> {
                return std::make_unique<HttpRenderer>(client, config.render_url);
            });

        std::cout << "Transcribing with " << transcriber.name() << " at "
                  << transcriber.endpointFor(pipeline_config.loop.request.task) << std::endl;

        pipeline.start(config.device);

        std::cout << "\n=== Listening ===" << std::endl;
        std::cout << "Press Ctrl+C to stop" << std::endl;
        std::cout << "=================\n" << std::endl;

        while (g_running && pipeline.running()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            pipeline.checkHealth();

            if (file_source && file_source->finished() && pipeline.drained()) {
                break;
            }
        }

        if (pipeline.faulted()) {
            std::cerr << "\nError: " << pipeline.faultMessage() << std::endl;
            exit_code = 1;
        } else if (!g_running) {
            std::cout << "\nInterrupt signal received. Stopping..." << std::endl;
        }

        pipeline.shutdown();
        printStatistics(pipeline);

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return exit_code;
}
