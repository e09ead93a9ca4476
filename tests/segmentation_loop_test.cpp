#include "segmentation_loop.hpp"
#include "test_fakes.hpp"

#include <gtest/gtest.h>

#include <filesystem>

using test_utils::FakeTranscriber;
using test_utils::frameWithLevel;
using test_utils::waitUntil;

class SegmentationLoopTest : public ::testing::Test {
protected:
    SegmentationLoopTest() : buffer(makeAmplitudeGate(300.0)) {
        config.truncate_frames = 10;
        config.poll_interval = std::chrono::milliseconds(10);
        config.request.language = "de";
        config.request.prompt = "Glossary: Kubernetes";
    }

    void fill(int loud_frames) {
        for (int i = 0; i < loud_frames; ++i) {
            buffer.offer(frameWithLevel(1000));
        }
    }

    SegmentBuffer buffer;
    FakeTranscriber transcriber;
    TranscriptLog log;
    ShutdownToken token;
    SegmentationLoop::Config config;
};

TEST_F(SegmentationLoopTest, EmptyBufferDoesNothing) {
    SegmentationLoop loop(buffer, transcriber, log, token, config);
    EXPECT_FALSE(loop.tick());
    EXPECT_EQ(transcriber.calls.load(), 0);
    EXPECT_EQ(loop.state(), SegmentationLoop::State::IDLE);
}

TEST_F(SegmentationLoopTest, HighNoSpeechPiecesAreDropped) {
    transcriber.pushResult({TranscribedPiece(" Hello there. ", 0.2f),
                            TranscribedPiece(" [music]", 0.7f)});
    fill(3);

    SegmentationLoop loop(buffer, transcriber, log, token, config);
    EXPECT_TRUE(loop.tick());

    ASSERT_EQ(log.size(), 1u);
    Segment segment = log.at(0);
    EXPECT_EQ(segment.text, "Hello there.");
    EXPECT_FALSE(segment.truncated);
    EXPECT_GE(segment.processingDelay(), 0.0);
    EXPECT_TRUE(buffer.empty());
    EXPECT_EQ(loop.state(), SegmentationLoop::State::IDLE);
}

TEST_F(SegmentationLoopTest, RequestCarriesLanguageTaskAndPrompt) {
    fill(2);
    SegmentationLoop loop(buffer, transcriber, log, token, config);
    loop.tick();

    std::vector<TranscribeRequest> requests = transcriber.requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].language, "de");
    EXPECT_EQ(requests[0].task, "transcribe");
    EXPECT_EQ(requests[0].prompt, "Glossary: Kubernetes");

    // 44-byte header plus 2 frames of 160 16-bit samples
    std::vector<size_t> sizes = transcriber.wavSizes();
    ASSERT_EQ(sizes.size(), 1u);
    EXPECT_EQ(sizes[0], 44u + 2u * 160u * 2u);
}

TEST_F(SegmentationLoopTest, EmptyTranscriptionAppendsNothing) {
    transcriber.pushResult({});
    transcriber.pushResult({TranscribedPiece("   ", 0.1f)});
    transcriber.pushResult({TranscribedPiece("only noise", 0.9f)});
    transcriber.pushResult({TranscribedPiece("next", 0.1f)});

    SegmentationLoop loop(buffer, transcriber, log, token, config);
    for (int i = 0; i < 3; ++i) {
        fill(1);
        EXPECT_FALSE(loop.tick());
        EXPECT_TRUE(buffer.empty());
    }
    EXPECT_EQ(log.size(), 0u);
    EXPECT_EQ(loop.stats().suppressed, 3u);

    fill(1);
    EXPECT_TRUE(loop.tick());
    ASSERT_EQ(log.size(), 1u);
    EXPECT_EQ(log.at(0).position, 0u);
    EXPECT_EQ(log.at(0).text, "next");
}

TEST_F(SegmentationLoopTest, FailureDropsBurstAndLaterTicksContinue) {
    transcriber.pushFailure();
    transcriber.pushResult({TranscribedPiece("recovered", 0.0f)});

    SegmentationLoop loop(buffer, transcriber, log, token, config);
    fill(4);
    EXPECT_FALSE(loop.tick());
    EXPECT_TRUE(buffer.empty());
    EXPECT_EQ(loop.stats().failures, 1u);
    EXPECT_EQ(loop.state(), SegmentationLoop::State::IDLE);

    fill(1);
    EXPECT_TRUE(loop.tick());
    ASSERT_EQ(log.size(), 1u);
    EXPECT_EQ(log.at(0).text, "recovered");
    EXPECT_EQ(transcriber.calls.load(), 2);
}

TEST_F(SegmentationLoopTest, TruncatedBurstIsFlagged) {
    fill(15);
    SegmentationLoop loop(buffer, transcriber, log, token, config);
    EXPECT_TRUE(loop.tick());

    ASSERT_EQ(log.size(), 1u);
    EXPECT_TRUE(log.at(0).truncated);
    EXPECT_EQ(loop.stats().truncated, 1u);
    EXPECT_TRUE(buffer.empty());

    // Only the first 10 frames were sent
    EXPECT_EQ(transcriber.wavSizes()[0], 44u + 10u * 160u * 2u);
}

TEST_F(SegmentationLoopTest, ResultArrivingAfterShutdownIsDiscarded) {
    transcriber.setOnCall([this]() { token.requestStop(); });
    fill(2);

    SegmentationLoop loop(buffer, transcriber, log, token, config);
    EXPECT_FALSE(loop.tick());
    EXPECT_EQ(transcriber.calls.load(), 1);
    EXPECT_EQ(log.size(), 0u);
}

TEST_F(SegmentationLoopTest, KeptAudioIsWrittenAsWav) {
    std::filesystem::path dir = std::filesystem::temp_directory_path() / "live_transcribe_keep_test";
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);

    config.keep_audio = true;
    config.keep_dir = dir.string();
    fill(1);

    SegmentationLoop loop(buffer, transcriber, log, token, config);
    loop.tick();

    size_t wav_files = 0;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        EXPECT_EQ(entry.path().extension(), ".wav");
        EXPECT_EQ(entry.file_size(), 44u + 160u * 2u);
        wav_files++;
    }
    EXPECT_EQ(wav_files, 1u);
    std::filesystem::remove_all(dir);
}

TEST_F(SegmentationLoopTest, ThreadDrainsUntilStopped) {
    SegmentationLoop loop(buffer, transcriber, log, token, config);
    loop.start();

    fill(2);
    EXPECT_TRUE(waitUntil([this]() { return log.size() == 1; }));
    fill(2);
    EXPECT_TRUE(waitUntil([this]() { return log.size() == 2; }));

    loop.stop();
    EXPECT_TRUE(token.stopRequested());

    fill(2);
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(log.size(), 2u);
    EXPECT_EQ(log.at(1).position, 1u);
}

TEST(JoinSpeechPiecesTest, TrimsAndJoinsWithSingleSpaces) {
    std::vector<TranscribedPiece> pieces{
        TranscribedPiece("  first ", 0.1f),
        TranscribedPiece("\tsecond\n", 0.49f),
        TranscribedPiece("dropped", 0.5f),
        TranscribedPiece("", 0.0f),
        TranscribedPiece("third", 0.0f)};

    EXPECT_EQ(joinSpeechPieces(pieces, 0.5f), "first second third");
    EXPECT_EQ(joinSpeechPieces(pieces, 0.0f), "");
    EXPECT_EQ(joinSpeechPieces({}, 0.5f), "");
}
