#ifndef SEGMENT_SINKS_HPP
#define SEGMENT_SINKS_HPP

#include "consumer_task.hpp"
#include "renderer.hpp"
#include "translator.hpp"
#include <memory>
#include <ostream>
#include <string>

// Segment text as shown to users: " (truncated)" for capped bursts and,
// with show_delay, " [Delay: 1.23s]".
std::string displayText(const Segment& segment, bool show_delay);

// Prints "Transcribed: <text>".
class ConsoleSink : public SegmentSink {
public:
    ConsoleSink(std::ostream& out, bool show_delay);

    void consume(const Segment& segment) override;
    std::string name() const override { return "Console"; }

private:
    std::ostream& out_;
    bool show_delay_;
};

// Translates each segment and prints "Translated: <output>", with
// " (truncated)" for capped bursts. With show_delay both the capture delay
// and this sink's own translation time are shown.
class TranslatorSink : public SegmentSink {
public:
    TranslatorSink(std::unique_ptr<Translator> translator, std::ostream& out, bool show_delay);

    void consume(const Segment& segment) override;
    std::string name() const override { return "Translator"; }

    double lastTranslationDelay() const { return last_translation_delay_; }

private:
    std::unique_ptr<Translator> translator_;
    std::ostream& out_;
    bool show_delay_;
    double last_translation_delay_;
};

// Pushes each segment to a remote page.
class RendererSink : public SegmentSink {
public:
    RendererSink(std::unique_ptr<Renderer> renderer, bool show_delay);

    void consume(const Segment& segment) override;
    std::string name() const override { return "Renderer"; }

private:
    std::unique_ptr<Renderer> renderer_;
    bool show_delay_;
};

#endif // SEGMENT_SINKS_HPP
