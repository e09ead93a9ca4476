#ifndef PIPELINE_CONFIG_HPP
#define PIPELINE_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

// Everything the live_transcribe command line can set.
struct PipelineConfig {
    // Audio capture
    int sample_rate;
    int channels;
    unsigned long frames_per_buffer;
    std::string device;      // index or part of a device name, empty = default
    std::string input_file;  // replay this file instead of capturing
    bool list_devices;

    // Segmentation
    double silence_threshold;
    size_t truncate_frames;
    std::chrono::milliseconds poll_interval;
    std::chrono::milliseconds consumer_poll_interval;
    float no_speech_cutoff;
    bool keep;
    std::string keep_dir;
    bool show_status;

    // Transcription
    std::string mode;  // transcribe | translate-whisper | translate-llm
    std::string lang;
    std::string model;
    std::string whisper_url;
    std::string prompt_file;
    std::string transcribe_prompt;  // contents of prompt_file

    // Translation
    std::string model_translate;
    std::string translation_prompt_file;
    std::string translation_prompt;  // contents of translation_prompt_file
    std::string llm_backend;         // ollama | api

    // API
    std::string api_key;
    std::string api_url;
    std::string env_file;
    long http_timeout;  // seconds per HTTP request

    // Output
    std::string render_url;
    bool show_delay;

    bool show_help;

    PipelineConfig() :
        sample_rate(16000),
        channels(1),
        frames_per_buffer(1024 * 128),
        list_devices(false),
        silence_threshold(300.0),
        truncate_frames(60),
        poll_interval(100),
        consumer_poll_interval(100),
        no_speech_cutoff(0.5f),
        keep(false),
        keep_dir("."),
        show_status(false),
        mode("transcribe"),
        model("small"),
        whisper_url("http://127.0.0.1:8000/v1"),
        prompt_file("transcribe_prompt.txt"),
        llm_backend("ollama"),
        env_file(".env"),
        http_timeout(60),
        show_delay(false),
        show_help(false) {}
};

// Parses `--name value` flags (argv without the program name). Validates the
// result and loads the prompt files. Throws ConfigError on any problem.
// `--help` sets show_help and stops parsing.
PipelineConfig parseCommandLine(const std::vector<std::string>& args);

// Reads a whole text file with surrounding whitespace removed. Throws
// ConfigError if it cannot be opened.
std::string loadPromptFile(const std::string& path);

void printUsage(const char* program_name);
void printConfiguration(const PipelineConfig& config);

#endif // PIPELINE_CONFIG_HPP
