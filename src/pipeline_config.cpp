#include "pipeline_config.hpp"
#include "pipeline_errors.hpp"
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace {
    std::string trimmed(const std::string& str) {
        size_t first = str.find_first_not_of(" \t\n\r");
        if (first == std::string::npos) return "";
        size_t last = str.find_last_not_of(" \t\n\r");
        return str.substr(first, (last - first + 1));
    }

    long parseInteger(const std::string& flag, const std::string& value) {
        size_t used = 0;
        long result = 0;
        try {
            result = std::stol(value, &used);
        } catch (const std::logic_error&) {
            used = 0;
        }
        if (used == 0 || used != value.size()) {
            throw ConfigError("Invalid value for " + flag + ": '" + value + "' is not an integer");
        }
        return result;
    }

    double parseNumber(const std::string& flag, const std::string& value) {
        size_t used = 0;
        double result = 0;
        try {
            result = std::stod(value, &used);
        } catch (const std::logic_error&) {
            used = 0;
        }
        if (used == 0 || used != value.size()) {
            throw ConfigError("Invalid value for " + flag + ": '" + value + "' is not a number");
        }
        return result;
    }

    void validate(const PipelineConfig& config) {
        if (config.mode != "transcribe" && config.mode != "translate-whisper" &&
            config.mode != "translate-llm") {
            throw ConfigError("Invalid mode: " + config.mode +
                              ". Must be 'transcribe', 'translate-whisper' or 'translate-llm'");
        }
        if (config.mode == "translate-llm" &&
            (config.model_translate.empty() || config.translation_prompt_file.empty())) {
            throw ConfigError("--model_translate and --translation_prompt are required for 'translate-llm' mode");
        }
        if (config.llm_backend != "ollama" && config.llm_backend != "api") {
            throw ConfigError("Invalid LLM backend: " + config.llm_backend + ". Must be 'ollama' or 'api'");
        }
        if (config.sample_rate <= 0) {
            throw ConfigError("Sample rate must be positive");
        }
        if (config.channels <= 0) {
            throw ConfigError("Channel count must be positive");
        }
        if (config.frames_per_buffer == 0) {
            throw ConfigError("Frame size must be positive");
        }
        if (config.truncate_frames == 0) {
            throw ConfigError("Truncation cap must be at least 1 frame");
        }
        if (config.poll_interval.count() <= 0 || config.consumer_poll_interval.count() <= 0) {
            throw ConfigError("Poll intervals must be positive");
        }
        if (config.http_timeout <= 0) {
            throw ConfigError("HTTP timeout must be positive");
        }
        if (config.silence_threshold < 0) {
            throw ConfigError("Silence threshold must not be negative");
        }
    }
}

std::string loadPromptFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Cannot open prompt file: " + path);
    }

    std::stringstream content;
    content << file.rdbuf();
    return trimmed(content.str());
}

PipelineConfig parseCommandLine(const std::vector<std::string>& args) {
    PipelineConfig config;
    bool prompt_file_given = false;

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];

        if (arg == "--help" || arg == "-h") {
            config.show_help = true;
            return config;
        }
        else if (arg == "--list_devices") {
            config.list_devices = true;
            continue;
        }
        else if (arg == "--keep") {
            config.keep = true;
            continue;
        }
        else if (arg == "--show_delay") {
            config.show_delay = true;
            continue;
        }
        else if (arg == "--show_status") {
            config.show_status = true;
            continue;
        }

        if (arg.rfind("--", 0) != 0) {
            throw ConfigError("Unexpected argument: " + arg);
        }
        if (i + 1 >= args.size()) {
            throw ConfigError("Missing value for " + arg);
        }
        const std::string& value = args[++i];

        if (arg == "--sample_rate") {
            config.sample_rate = static_cast<int>(parseInteger(arg, value));
        }
        else if (arg == "--channels") {
            config.channels = static_cast<int>(parseInteger(arg, value));
        }
        else if (arg == "--frames_per_buffer") {
            long frames = parseInteger(arg, value);
            config.frames_per_buffer = frames > 0 ? static_cast<unsigned long>(frames) : 0;
        }
        else if (arg == "--device") {
            config.device = value;
        }
        else if (arg == "--input_file") {
            config.input_file = value;
        }
        else if (arg == "--silence_threshold") {
            config.silence_threshold = parseNumber(arg, value);
        }
        else if (arg == "--truncate_frames") {
            long frames = parseInteger(arg, value);
            config.truncate_frames = frames > 0 ? static_cast<size_t>(frames) : 0;
        }
        else if (arg == "--poll_ms") {
            config.poll_interval = std::chrono::milliseconds(parseInteger(arg, value));
        }
        else if (arg == "--consumer_poll_ms") {
            config.consumer_poll_interval = std::chrono::milliseconds(parseInteger(arg, value));
        }
        else if (arg == "--no_speech_cutoff") {
            config.no_speech_cutoff = static_cast<float>(parseNumber(arg, value));
        }
        else if (arg == "--keep_dir") {
            config.keep_dir = value;
        }
        else if (arg == "--mode") {
            config.mode = value;
        }
        else if (arg == "--lang") {
            config.lang = value;
        }
        else if (arg == "--model") {
            config.model = value;
        }
        else if (arg == "--whisper_url") {
            config.whisper_url = value;
        }
        else if (arg == "--prompt_file") {
            config.prompt_file = value;
            prompt_file_given = true;
        }
        else if (arg == "--model_translate") {
            config.model_translate = value;
        }
        else if (arg == "--translation_prompt") {
            config.translation_prompt_file = value;
        }
        else if (arg == "--llm_backend") {
            config.llm_backend = value;
        }
        else if (arg == "--api_key") {
            config.api_key = value;
        }
        else if (arg == "--api_url") {
            config.api_url = value;
        }
        else if (arg == "--env_file") {
            config.env_file = value;
        }
        else if (arg == "--timeout") {
            config.http_timeout = parseInteger(arg, value);
        }
        else if (arg == "--render_url") {
            config.render_url = value;
        }
        else {
            throw ConfigError("Unknown argument: " + arg);
        }
    }

    validate(config);

    // The default prompt file is optional, an explicit one is not
    if (prompt_file_given || std::filesystem::exists(config.prompt_file)) {
        config.transcribe_prompt = loadPromptFile(config.prompt_file);
    }
    if (config.mode == "translate-llm") {
        config.translation_prompt = loadPromptFile(config.translation_prompt_file);
    }

    return config;
}

void printUsage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options]" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --mode <mode>                 transcribe, translate-whisper or translate-llm (default: transcribe)" << std::endl;
    std::cout << "  --lang <code>                 Spoken language, empty = auto-detect" << std::endl;
    std::cout << "  --model <name>                Whisper model (default: small)" << std::endl;
    std::cout << "  --whisper_url <url>           Whisper API base URL (default: http://127.0.0.1:8000/v1)" << std::endl;
    std::cout << "  --prompt_file <path>          Transcription prompt file (default: transcribe_prompt.txt if present)" << std::endl;
    std::cout << "  --model_translate <name>      LLM model for translate-llm mode" << std::endl;
    std::cout << "  --translation_prompt <path>   Translation prompt file for translate-llm mode" << std::endl;
    std::cout << "  --llm_backend <backend>       ollama or api (default: ollama)" << std::endl;
    std::cout << "  --api_key <key>               API key for the service" << std::endl;
    std::cout << "  --api_url <url>               Chat completions endpoint URL" << std::endl;
    std::cout << "  --env_file <path>             Path to .env file (default: .env)" << std::endl;
    std::cout << "  --timeout <seconds>           Timeout for each HTTP request (default: 60)" << std::endl;
    std::cout << "  --render_url <url>            Post every segment to this page-update endpoint" << std::endl;
    std::cout << "  --device <index|name>         Audio input device index or partial name" << std::endl;
    std::cout << "  --input_file <path>           Replay a sound file instead of capturing" << std::endl;
    std::cout << "  --list_devices                List available audio input devices and exit" << std::endl;
    std::cout << "  --sample_rate <value>         Audio sample rate (default: 16000)" << std::endl;
    std::cout << "  --channels <value>            Number of audio channels (default: 1)" << std::endl;
    std::cout << "  --frames_per_buffer <value>   Samples per captured frame (default: 131072)" << std::endl;
    std::cout << "  --silence_threshold <value>   Mean absolute level below which frames are dropped (default: 300)" << std::endl;
    std::cout << "  --truncate_frames <value>     Maximum frames per burst (default: 60)" << std::endl;
    std::cout << "  --poll_ms <value>             Buffer drain interval in ms (default: 100)" << std::endl;
    std::cout << "  --consumer_poll_ms <value>    Consumer poll interval in ms (default: 100)" << std::endl;
    std::cout << "  --no_speech_cutoff <value>    Drop pieces with higher no-speech probability (default: 0.5)" << std::endl;
    std::cout << "  --keep                        Keep the audio of every burst as a WAV file" << std::endl;
    std::cout << "  --keep_dir <path>             Directory for kept audio (default: .)" << std::endl;
    std::cout << "  --show_delay                  Show processing delays" << std::endl;
    std::cout << "  --show_status                 Show buffer status line" << std::endl;
    std::cout << "  --help                        Show this help message" << std::endl;
}

void printConfiguration(const PipelineConfig& config) {
    std::cout << "\nConfiguration:" << std::endl;
    std::cout << "  Mode: " << config.mode << std::endl;
    std::cout << "  Language: " << (config.lang.empty() ? "auto" : config.lang) << std::endl;
    std::cout << "  Whisper model: " << config.model << " (" << config.whisper_url << ")" << std::endl;
    if (config.mode == "translate-llm") {
        std::cout << "  Translation model: " << config.model_translate
                  << " (" << config.llm_backend << ")" << std::endl;
    }
    std::cout << "  Sample rate: " << config.sample_rate << " Hz" << std::endl;
    std::cout << "  Channels: " << config.channels << std::endl;
    std::cout << "  Frame size: " << config.frames_per_buffer << " samples" << std::endl;
    std::cout << "  Silence threshold: " << std::fixed << std::setprecision(1)
              << config.silence_threshold << std::endl;
    std::cout << "  Truncation cap: " << config.truncate_frames << " frames" << std::endl;
    std::cout << "  No-speech cutoff: " << std::setprecision(2) << config.no_speech_cutoff << std::endl;
    std::cout << "  HTTP timeout: " << config.http_timeout << " s" << std::endl;
    if (!config.render_url.empty()) {
        std::cout << "  Render URL: " << config.render_url << std::endl;
    }
    if (config.keep) {
        std::cout << "  Keeping audio in: " << config.keep_dir << std::endl;
    }
    std::cout << std::endl;
}
