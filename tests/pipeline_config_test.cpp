#include "pipeline_config.hpp"
#include "pipeline_errors.hpp"
#include "pipeline_setup.hpp"
#include "test_fakes.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>

using test_utils::FakeAudioSource;
using test_utils::FakeRenderer;
using test_utils::FakeTranscriber;
using test_utils::FakeTranslator;
using test_utils::frameWithLevel;
using test_utils::waitUntil;

namespace {
    std::string writeTempFile(const std::string& name, const std::string& content) {
        std::filesystem::path path = std::filesystem::temp_directory_path() / name;
        std::ofstream out(path);
        out << content;
        return path.string();
    }
}

TEST(PipelineConfigTest, DefaultsMatchDocumentedValues) {
    PipelineConfig config = parseCommandLine({});

    EXPECT_EQ(config.sample_rate, 16000);
    EXPECT_EQ(config.channels, 1);
    EXPECT_EQ(config.frames_per_buffer, 131072u);
    EXPECT_DOUBLE_EQ(config.silence_threshold, 300.0);
    EXPECT_EQ(config.truncate_frames, 60u);
    EXPECT_EQ(config.poll_interval.count(), 100);
    EXPECT_EQ(config.consumer_poll_interval.count(), 100);
    EXPECT_FLOAT_EQ(config.no_speech_cutoff, 0.5f);
    EXPECT_FALSE(config.keep);
    EXPECT_FALSE(config.show_delay);
    EXPECT_EQ(config.mode, "transcribe");
    EXPECT_EQ(config.model, "small");
    EXPECT_EQ(config.llm_backend, "ollama");
    EXPECT_TRUE(config.lang.empty());
    EXPECT_TRUE(config.device.empty());
    EXPECT_EQ(config.http_timeout, 60);
}

TEST(PipelineConfigTest, FlagsAndValuesAreParsed) {
    PipelineConfig config = parseCommandLine({
        "--mode", "translate-whisper", "--lang", "ja", "--model", "medium",
        "--device", "Yeti", "--keep", "--keep_dir", "/tmp", "--show_delay",
        "--silence_threshold", "450.5", "--truncate_frames", "30",
        "--poll_ms", "50", "--no_speech_cutoff", "0.3",
        "--render_url", "http://localhost:3000/update", "--timeout", "20"});

    EXPECT_EQ(config.mode, "translate-whisper");
    EXPECT_EQ(config.lang, "ja");
    EXPECT_EQ(config.model, "medium");
    EXPECT_EQ(config.device, "Yeti");
    EXPECT_TRUE(config.keep);
    EXPECT_EQ(config.keep_dir, "/tmp");
    EXPECT_TRUE(config.show_delay);
    EXPECT_DOUBLE_EQ(config.silence_threshold, 450.5);
    EXPECT_EQ(config.truncate_frames, 30u);
    EXPECT_EQ(config.poll_interval.count(), 50);
    EXPECT_FLOAT_EQ(config.no_speech_cutoff, 0.3f);
    EXPECT_EQ(config.render_url, "http://localhost:3000/update");
    EXPECT_EQ(config.http_timeout, 20);
}

TEST(PipelineConfigTest, HelpStopsParsing) {
    PipelineConfig config = parseCommandLine({"--help", "--bogus"});
    EXPECT_TRUE(config.show_help);
}

TEST(PipelineConfigTest, ListDevicesFlag) {
    EXPECT_TRUE(parseCommandLine({"--list_devices"}).list_devices);
}

TEST(PipelineConfigTest, TranslateLlmNeedsModelAndPrompt) {
    EXPECT_THROW(parseCommandLine({"--mode", "translate-llm"}), ConfigError);
    EXPECT_THROW(parseCommandLine({"--mode", "translate-llm", "--model_translate", "qwen2.5"}), ConfigError);

    std::string prompt = writeTempFile("live_transcribe_translation_prompt.txt",
                                       "\nTranslate to English.\n\n");
    PipelineConfig config = parseCommandLine({
        "--mode", "translate-llm", "--model_translate", "qwen2.5",
        "--translation_prompt", prompt, "--llm_backend", "api"});

    EXPECT_EQ(config.translation_prompt, "Translate to English.");
    EXPECT_EQ(config.llm_backend, "api");
    std::filesystem::remove(prompt);
}

TEST(PipelineConfigTest, MissingTranslationPromptFileIsConfigError) {
    EXPECT_THROW(parseCommandLine({"--mode", "translate-llm", "--model_translate", "m",
                                   "--translation_prompt", "/nonexistent/prompt.txt"}),
                 ConfigError);
}

TEST(PipelineConfigTest, ExplicitPromptFileIsLoaded) {
    std::string prompt = writeTempFile("live_transcribe_transcribe_prompt.txt", "Names: Ana, Bojan");
    PipelineConfig config = parseCommandLine({"--prompt_file", prompt});
    EXPECT_EQ(config.transcribe_prompt, "Names: Ana, Bojan");
    std::filesystem::remove(prompt);

    EXPECT_THROW(parseCommandLine({"--prompt_file", "/nonexistent/prompt.txt"}), ConfigError);
}

TEST(PipelineConfigTest, InvalidValuesAreRejected) {
    EXPECT_THROW(parseCommandLine({"--mode", "dictate"}), ConfigError);
    EXPECT_THROW(parseCommandLine({"--llm_backend", "openai"}), ConfigError);
    EXPECT_THROW(parseCommandLine({"--truncate_frames", "0"}), ConfigError);
    EXPECT_THROW(parseCommandLine({"--sample_rate", "fast"}), ConfigError);
    EXPECT_THROW(parseCommandLine({"--sample_rate", "16k"}), ConfigError);
    EXPECT_THROW(parseCommandLine({"--silence_threshold", "-1"}), ConfigError);
    EXPECT_THROW(parseCommandLine({"--poll_ms", "0"}), ConfigError);
    EXPECT_THROW(parseCommandLine({"--timeout", "0"}), ConfigError);
}

TEST(PipelineConfigTest, UnknownOrIncompleteArgumentsAreRejected) {
    EXPECT_THROW(parseCommandLine({"--whisper_device", "cuda"}), ConfigError);
    EXPECT_THROW(parseCommandLine({"--lang"}), ConfigError);
    EXPECT_THROW(parseCommandLine({"stray"}), ConfigError);
}

TEST(PipelineSetupTest, LoopSettingsFollowCommandLine) {
    PipelineConfig config = parseCommandLine({"--mode", "translate-whisper", "--lang", "de",
                                              "--silence_threshold", "450", "--truncate_frames", "12",
                                              "--keep", "--keep_dir", "/tmp/bursts"});

    LivePipeline::Config pipeline_config = buildPipelineConfig(config);

    EXPECT_DOUBLE_EQ(pipeline_config.silence_threshold, 450.0);
    EXPECT_EQ(pipeline_config.loop.truncate_frames, 12u);
    EXPECT_EQ(pipeline_config.loop.sample_rate, config.sample_rate);
    EXPECT_TRUE(pipeline_config.loop.keep_audio);
    EXPECT_EQ(pipeline_config.loop.keep_dir, "/tmp/bursts");
    EXPECT_EQ(pipeline_config.loop.request.language, "de");
    EXPECT_EQ(pipeline_config.loop.request.task, "translate");
}

TEST(PipelineSetupTest, OnlyWhisperTranslationAsksForTranslateTask) {
    EXPECT_EQ(transcribeTaskFor("translate-whisper"), "translate");
    EXPECT_EQ(transcribeTaskFor("translate-llm"), "transcribe");
    EXPECT_EQ(transcribeTaskFor("transcribe"), "transcribe");
    EXPECT_EQ(buildPipelineConfig(parseCommandLine({})).loop.request.task, "transcribe");
}

TEST(PipelineSetupTest, ApiClientTakesEnvFileThenCommandLine) {
    std::string env = writeTempFile("live_transcribe_setup.env",
                                    "API_KEY=from-env\nAPI_URL=http://env.example/v1/chat\n");
    PipelineConfig config = parseCommandLine({"--env_file", env,
                                              "--api_url", "http://cli.example/v1/chat",
                                              "--timeout", "7"});

    api_comm::ApiClient client;
    configureApiClient(client, config);

    EXPECT_TRUE(client.isConfigured());
    EXPECT_EQ(client.getApiUrl(), "http://cli.example/v1/chat");
    EXPECT_EQ(client.getTimeout(), 7);
    std::filesystem::remove(env);
}

class ModeConsumersTest : public ::testing::Test {
protected:
    void build(const std::vector<std::string>& args) {
        config = parseCommandLine(args);
        LivePipeline::Config pipeline_config = buildPipelineConfig(config);
        pipeline_config.consumer_poll_interval = std::chrono::milliseconds(5);
        pipeline_config.loop.poll_interval = std::chrono::milliseconds(10);

        auto fake_source = std::make_unique<FakeAudioSource>();
        source = fake_source.get();
        pipeline = std::make_unique<LivePipeline>(std::move(fake_source), transcriber, pipeline_config);

        addModeConsumers(
            *pipeline, config, out,
            [this]() -> std::unique_ptr<Translator> {
                translator_calls++;
                return std::make_unique<FakeTranslator>();
            },
            [this]() -> std::unique_ptr<Renderer> {
                renderer_calls++;
                return std::make_unique<FakeRenderer>();
            });
    }

    std::vector<std::string> consumerNames() const {
        std::vector<std::string> names;
        for (const auto& consumer : pipeline->consumers()) {
            names.push_back(consumer->name());
        }
        return names;
    }

    // Runs one loud frame through and waits for every consumer to take it.
    void deliverOneSegment() {
        pipeline->start("");
        source->emit(frameWithLevel(1000));
        EXPECT_TRUE(waitUntil([this]() {
            for (const auto& consumer : pipeline->consumers()) {
                if (consumer->delivered() + consumer->failures() < 1) {
                    return false;
                }
            }
            return true;
        }));
        pipeline->shutdown();
    }

    PipelineConfig config;
    FakeTranscriber transcriber;
    std::ostringstream out;
    FakeAudioSource* source = nullptr;
    std::unique_ptr<LivePipeline> pipeline;
    int translator_calls = 0;
    int renderer_calls = 0;
};

TEST_F(ModeConsumersTest, TranscribeModePrintsToConsole) {
    build({"--mode", "transcribe"});

    EXPECT_EQ(consumerNames(), std::vector<std::string>({"Console"}));
    EXPECT_EQ(translator_calls, 0);
    EXPECT_EQ(renderer_calls, 0);

    deliverOneSegment();
    EXPECT_EQ(out.str(), "\nTranscribed: hello\n");
}

TEST_F(ModeConsumersTest, WhisperTranslationPassesTextThrough) {
    build({"--mode", "translate-whisper"});

    EXPECT_EQ(consumerNames(), std::vector<std::string>({"Translator"}));
    EXPECT_EQ(translator_calls, 0);

    deliverOneSegment();
    EXPECT_EQ(out.str(), "\nTranslated: hello\n");
    ASSERT_FALSE(transcriber.requests().empty());
    EXPECT_EQ(transcriber.requests()[0].task, "translate");
}

TEST_F(ModeConsumersTest, LlmTranslationUsesSuppliedTranslator) {
    std::string prompt = writeTempFile("live_transcribe_mode_prompt.txt", "Translate to French.");
    build({"--mode", "translate-llm", "--model_translate", "qwen2.5", "--translation_prompt", prompt});
    std::filesystem::remove(prompt);

    EXPECT_EQ(consumerNames(), std::vector<std::string>({"Translator"}));
    EXPECT_EQ(translator_calls, 1);

    deliverOneSegment();
    EXPECT_EQ(out.str(), "\nTranslated: [fr] hello\n");
    ASSERT_FALSE(transcriber.requests().empty());
    EXPECT_EQ(transcriber.requests()[0].task, "transcribe");
}

TEST_F(ModeConsumersTest, RenderUrlAddsRendererConsumer) {
    build({"--mode", "transcribe", "--render_url", "http://localhost:8080/update"});

    EXPECT_EQ(consumerNames(), std::vector<std::string>({"Console", "Renderer"}));
    EXPECT_EQ(renderer_calls, 1);
}
