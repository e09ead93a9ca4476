#include "pipeline_setup.hpp"
#include "segment_sinks.hpp"
#include <iostream>

std::string transcribeTaskFor(const std::string& mode) {
    return mode == "translate-whisper" ? "translate" : "transcribe";
}

LivePipeline::Config buildPipelineConfig(const PipelineConfig& config) {
    LivePipeline::Config pipeline_config;
    pipeline_config.silence_threshold = config.silence_threshold;
    pipeline_config.consumer_poll_interval = config.consumer_poll_interval;

    SegmentationLoop::Config& loop = pipeline_config.loop;
    loop.truncate_frames = config.truncate_frames;
    loop.poll_interval = config.poll_interval;
    loop.no_speech_cutoff = config.no_speech_cutoff;
    loop.sample_rate = config.sample_rate;
    loop.keep_audio = config.keep;
    loop.keep_dir = config.keep_dir;
    loop.show_status = config.show_status;
    loop.request.language = config.lang;
    loop.request.prompt = config.transcribe_prompt;
    loop.request.task = transcribeTaskFor(config.mode);

    return pipeline_config;
}

void configureApiClient(api_comm::ApiClient& client, const PipelineConfig& config) {
    // Load from .env file first, command line values win
    if (client.loadConfigFromEnv(config.env_file)) {
        std::cout << "Loaded API configuration from " << config.env_file << std::endl;
    }
    if (!config.api_key.empty()) {
        client.setApiKey(config.api_key);
    }
    if (!config.api_url.empty()) {
        client.setApiUrl(config.api_url);
    }
    client.setTimeout(config.http_timeout);
}

void addModeConsumers(LivePipeline& pipeline,
                      const PipelineConfig& config,
                      std::ostream& out,
                      const TranslatorFactory& make_llm_translator,
                      const RendererFactory& make_renderer) {
    if (config.mode == "transcribe") {
        pipeline.addConsumer(std::make_unique<ConsoleSink>(out, config.show_delay));
    } else if (config.mode == "translate-whisper") {
        pipeline.addConsumer(std::make_unique<TranslatorSink>(
            std::make_unique<PassthroughTranslator>(), out, config.show_delay));
    } else {
        pipeline.addConsumer(std::make_unique<TranslatorSink>(
            make_llm_translator(), out, config.show_delay));
    }

    if (!config.render_url.empty()) {
        pipeline.addConsumer(std::make_unique<RendererSink>(make_renderer(), config.show_delay));
    }
}
