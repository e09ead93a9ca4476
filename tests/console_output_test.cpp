#include "console_output.hpp"
#include "segmentation_loop.hpp"
#include "test_fakes.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <thread>

TEST(ConsoleOutputTest, LineAndStatusFormats) {
    std::ostringstream out;
    writeConsoleLine(out, "Transcribed: hi");
    writeStatusLine(out, "Buffers: audio=0, transcript=1");
    EXPECT_EQ(out.str(), "\nTranscribed: hi\nBuffers: audio=0, transcript=1\r");
}

TEST(ConsoleOutputTest, StatusAndSegmentLinesNeverInterleave) {
    std::ostringstream out;
    const int count = 300;

    std::thread consumer([&out]() {
        for (int i = 0; i < count; ++i) {
            writeConsoleLine(out, "Transcribed: segment number " + std::to_string(i));
        }
    });
    std::thread loop([&out]() {
        for (int i = 0; i < count; ++i) {
            writeStatusLine(out, "Buffers: audio=" + std::to_string(i) + ", transcript=" + std::to_string(i));
        }
    });
    consumer.join();
    loop.join();

    std::string text = out.str();
    for (int i = 0; i < count; ++i) {
        std::string n = std::to_string(i);
        EXPECT_NE(text.find("\nTranscribed: segment number " + n + "\n"), std::string::npos) << n;
        EXPECT_NE(text.find("Buffers: audio=" + n + ", transcript=" + n + "\r"), std::string::npos) << n;
    }
}

TEST(SegmentationLoopStatusTest, ReportsPendingFramesAndLogSize) {
    SegmentBuffer buffer(nullptr);
    test_utils::FakeTranscriber transcriber;
    TranscriptLog log;
    ShutdownToken token;
    SegmentationLoop loop(buffer, transcriber, log, token, SegmentationLoop::Config());

    buffer.offer(test_utils::frameWithLevel(1000));
    buffer.offer(test_utils::frameWithLevel(1000));
    auto now = WallClock::now();
    log.append("one", false, now, now);

    EXPECT_EQ(loop.statusLine(), "Buffers: audio=2, transcript=1");
}
