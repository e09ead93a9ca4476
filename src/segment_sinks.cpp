#include "segment_sinks.hpp"
#include "console_output.hpp"
#include <chrono>
#include <iomanip>
#include <sstream>
#include <utility>

namespace {
    std::string delayTag(const std::string& label, double seconds) {
        std::ostringstream out;
        out << " [" << label << ": " << std::fixed << std::setprecision(2) << seconds << "s]";
        return out.str();
    }
}

std::string displayText(const Segment& segment, bool show_delay) {
    std::string text = segment.text;
    if (segment.truncated) {
        text += " (truncated)";
    }
    if (show_delay) {
        text += delayTag("Delay", segment.processingDelay());
    }
    return text;
}

ConsoleSink::ConsoleSink(std::ostream& out, bool show_delay)
    : out_(out), show_delay_(show_delay) {
}

void ConsoleSink::consume(const Segment& segment) {
    writeConsoleLine(out_, "Transcribed: " + displayText(segment, show_delay_));
}

TranslatorSink::TranslatorSink(std::unique_ptr<Translator> translator, std::ostream& out, bool show_delay)
    : translator_(std::move(translator)), out_(out), show_delay_(show_delay),
      last_translation_delay_(0.0) {
}

void TranslatorSink::consume(const Segment& segment) {
    auto start_time = std::chrono::steady_clock::now();
    std::string output = translator_->translate(segment.text);
    auto end_time = std::chrono::steady_clock::now();
    last_translation_delay_ = std::chrono::duration<double>(end_time - start_time).count();

    // The translator sees plain text, the marker only goes on the printed line
    std::string line = "Translated: " + output;
    if (segment.truncated) {
        line += " (truncated)";
    }
    if (show_delay_) {
        line += delayTag("Delay", segment.processingDelay());
        line += delayTag("Translation delay", last_translation_delay_);
    }
    writeConsoleLine(out_, line);
}

RendererSink::RendererSink(std::unique_ptr<Renderer> renderer, bool show_delay)
    : renderer_(std::move(renderer)), show_delay_(show_delay) {
}

void RendererSink::consume(const Segment& segment) {
    renderer_->update(displayText(segment, show_delay_));
}
