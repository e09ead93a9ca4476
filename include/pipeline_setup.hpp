#ifndef PIPELINE_SETUP_HPP
#define PIPELINE_SETUP_HPP

#include "api_comm.hpp"
#include "live_pipeline.hpp"
#include "pipeline_config.hpp"
#include "renderer.hpp"
#include "translator.hpp"
#include <functional>
#include <memory>
#include <ostream>

using TranslatorFactory = std::function<std::unique_ptr<Translator>()>;
using RendererFactory = std::function<std::unique_ptr<Renderer>()>;

// Speech model task for a mode: "translate" for translate-whisper,
// "transcribe" otherwise.
std::string transcribeTaskFor(const std::string& mode);

LivePipeline::Config buildPipelineConfig(const PipelineConfig& config);

// .env file first, then --api_key, --api_url and --timeout.
void configureApiClient(api_comm::ApiClient& client, const PipelineConfig& config);

/**
 * Adds the consumers a mode needs:
 *   transcribe         console sink
 *   translate-whisper  translator sink with a passthrough translator
 *   translate-llm      translator sink with `make_llm_translator()`
 * plus a renderer sink from `make_renderer()` when render_url is set.
 * Factories are only called for the consumers actually added.
 */
void addModeConsumers(LivePipeline& pipeline,
                      const PipelineConfig& config,
                      std::ostream& out,
                      const TranslatorFactory& make_llm_translator,
                      const RendererFactory& make_renderer);

#endif // PIPELINE_SETUP_HPP
