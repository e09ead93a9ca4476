#ifndef WHISPER_API_TRANSCRIBER_HPP
#define WHISPER_API_TRANSCRIBER_HPP

#include "transcriber.hpp"
#include "api_comm.hpp"

/**
 * Whisper served behind an OpenAI-compatible audio API (OpenAI,
 * faster-whisper-server, speaches, whisper.cpp with the OpenAI shim).
 *
 * task "transcribe" posts to <base_url>/audio/transcriptions and task
 * "translate" to <base_url>/audio/translations, always asking for
 * verbose_json so every segment carries its no_speech_prob.
 */
class WhisperApiTranscriber : public Transcriber {
public:
    struct Config {
        std::string base_url = "http://127.0.0.1:8000/v1";
        std::string model = "small";
        float temperature = 0.0f;
    };

    WhisperApiTranscriber(api_comm::ApiClient& client, const Config& config);

    std::vector<TranscribedPiece> transcribe(const std::vector<char>& wav_bytes,
                                             const TranscribeRequest& request) override;

    std::string name() const override { return "whisper-api (" + config_.model + ")"; }

    std::string endpointFor(const std::string& task) const;

private:
    api_comm::ApiClient& client_;
    Config config_;
};

// Parses a verbose_json body. Segments without no_speech_prob count as
// speech; a body with text but no segments yields a single piece.
// Throws TranscriptionFailure on malformed JSON.
std::vector<TranscribedPiece> parseVerboseTranscription(const std::string& body);

#endif // WHISPER_API_TRANSCRIBER_HPP
