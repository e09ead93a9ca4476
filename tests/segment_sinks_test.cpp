#include "segment_sinks.hpp"
#include "test_fakes.hpp"

#include <gtest/gtest.h>

#include <sstream>

using test_utils::FakeRenderer;
using test_utils::FakeTranslator;

namespace {
    Segment makeSegment(const std::string& text, bool truncated, double delay_seconds) {
        Segment segment;
        segment.position = 4;
        segment.text = text;
        segment.truncated = truncated;
        segment.capture_start = WallClock::now();
        segment.capture_end = segment.capture_start +
            std::chrono::duration_cast<WallClock::duration>(std::chrono::duration<double>(delay_seconds));
        return segment;
    }
}

TEST(DisplayTextTest, PlainText) {
    EXPECT_EQ(displayText(makeSegment("Guten Morgen", false, 1.0), false), "Guten Morgen");
}

TEST(DisplayTextTest, TruncationMarkerAndDelay) {
    EXPECT_EQ(displayText(makeSegment("long talk", true, 2.5), true),
              "long talk (truncated) [Delay: 2.50s]");
}

TEST(ConsoleSinkTest, PrintsTranscribedLine) {
    std::ostringstream out;
    ConsoleSink sink(out, true);
    sink.consume(makeSegment("hello", false, 0.25));

    EXPECT_EQ(out.str(), "\nTranscribed: hello [Delay: 0.25s]\n");
}

TEST(TranslatorSinkTest, PrintsTranslationWithBothDelays) {
    std::ostringstream out;
    auto* translator = new FakeTranslator();
    TranslatorSink sink(std::unique_ptr<Translator>(translator), out, true);
    sink.consume(makeSegment("bonjour", false, 1.0));

    ASSERT_EQ(translator->inputs.size(), 1u);
    EXPECT_EQ(translator->inputs[0], "bonjour");

    std::string line = out.str();
    EXPECT_EQ(line.rfind("\nTranslated: [fr] bonjour [Delay: 1.00s] [Translation delay: ", 0), 0u);
    EXPECT_GE(sink.lastTranslationDelay(), 0.0);
}

TEST(TranslatorSinkTest, TruncatedSegmentIsMarkedButTranslatedPlain) {
    std::ostringstream out;
    auto translator = std::make_unique<FakeTranslator>();
    FakeTranslator* fake = translator.get();
    TranslatorSink sink(std::move(translator), out, true);
    sink.consume(makeSegment("long talk", true, 2.0));

    ASSERT_EQ(fake->inputs.size(), 1u);
    EXPECT_EQ(fake->inputs[0], "long talk");
    EXPECT_EQ(out.str().rfind("\nTranslated: [fr] long talk (truncated) [Delay: 2.00s] [Translation delay: ", 0), 0u);
}

TEST(TranslatorSinkTest, PassthroughShowsTruncationMarker) {
    std::ostringstream out;
    TranslatorSink sink(std::make_unique<PassthroughTranslator>(), out, false);
    sink.consume(makeSegment("long talk", true, 0.0));
    EXPECT_EQ(out.str(), "\nTranslated: long talk (truncated)\n");
}

TEST(TranslatorSinkTest, FailurePropagatesAndPrintsNothing) {
    std::ostringstream out;
    auto* translator = new FakeTranslator();
    translator->fail = true;
    TranslatorSink sink(std::unique_ptr<Translator>(translator), out, false);

    EXPECT_THROW(sink.consume(makeSegment("x", false, 0.0)), TranslationFailure);
    EXPECT_TRUE(out.str().empty());
}

TEST(TranslatorSinkTest, PassthroughPrintsTranscript) {
    std::ostringstream out;
    TranslatorSink sink(std::unique_ptr<Translator>(new PassthroughTranslator()), out, false);
    sink.consume(makeSegment("already english", false, 0.0));
    EXPECT_EQ(out.str(), "\nTranslated: already english\n");
}

TEST(RendererSinkTest, SendsDisplayText) {
    auto* renderer = new FakeRenderer();
    RendererSink sink(std::unique_ptr<Renderer>(renderer), false);
    sink.consume(makeSegment("paragraph", true, 0.0));

    ASSERT_EQ(renderer->updates.size(), 1u);
    EXPECT_EQ(renderer->updates[0], "paragraph (truncated)");
}

TEST(RendererSinkTest, RenderFailurePropagates) {
    auto* renderer = new FakeRenderer();
    renderer->fail = true;
    RendererSink sink(std::unique_ptr<Renderer>(renderer), false);
    EXPECT_THROW(sink.consume(makeSegment("p", false, 0.0)), RenderFailure);
}
