#include "whisper_api_transcriber.hpp"
#include "pipeline_errors.hpp"
#include <sstream>

using api_comm::json;

WhisperApiTranscriber::WhisperApiTranscriber(api_comm::ApiClient& client, const Config& config)
    : client_(client), config_(config) {
    while (!config_.base_url.empty() && config_.base_url.back() == '/') {
        config_.base_url.pop_back();
    }
}

std::string WhisperApiTranscriber::endpointFor(const std::string& task) const {
    if (task == "translate") {
        return config_.base_url + "/audio/translations";
    }
    return config_.base_url + "/audio/transcriptions";
}

std::vector<TranscribedPiece> WhisperApiTranscriber::transcribe(const std::vector<char>& wav_bytes,
                                                                const TranscribeRequest& request) {
    if (request.task != "transcribe" && request.task != "translate") {
        throw TranscriptionFailure("Unknown task: " + request.task);
    }

    std::ostringstream temperature;
    temperature << config_.temperature;

    std::vector<api_comm::FormPart> parts;
    parts.push_back(api_comm::FormPart::file("file", "segment.wav", "audio/wav",
                                             std::string(wav_bytes.begin(), wav_bytes.end())));
    parts.push_back(api_comm::FormPart::field("model", config_.model));
    parts.push_back(api_comm::FormPart::field("response_format", "verbose_json"));
    parts.push_back(api_comm::FormPart::field("temperature", temperature.str()));

    // The translations endpoint always targets English and takes no language
    if (!request.language.empty() && request.task == "transcribe") {
        parts.push_back(api_comm::FormPart::field("language", request.language));
    }
    if (!request.prompt.empty()) {
        parts.push_back(api_comm::FormPart::field("prompt", request.prompt));
    }

    std::string body;
    try {
        body = client_.postForm(endpointFor(request.task), parts);
    } catch (const api_comm::ApiError& e) {
        throw TranscriptionFailure(e.what());
    }

    return parseVerboseTranscription(body);
}

std::vector<TranscribedPiece> parseVerboseTranscription(const std::string& body) {
    json j;
    try {
        j = json::parse(body);
    } catch (const json::parse_error& e) {
        throw TranscriptionFailure(std::string("JSON parse error: ") + e.what());
    }

    if (!j.is_object()) {
        throw TranscriptionFailure("Transcription response is not an object");
    }

    std::vector<TranscribedPiece> pieces;

    if (j.contains("segments") && j["segments"].is_array()) {
        for (const auto& seg : j["segments"]) {
            if (!seg.is_object()) {
                continue;
            }
            TranscribedPiece piece;
            piece.text = seg.value("text", "");
            if (seg.contains("no_speech_prob") && seg["no_speech_prob"].is_number()) {
                piece.no_speech_prob = seg["no_speech_prob"].get<float>();
            }
            pieces.push_back(piece);
        }
        return pieces;
    }

    if (j.contains("text") && j["text"].is_string()) {
        pieces.emplace_back(j["text"].get<std::string>(), 0.0f);
        return pieces;
    }

    throw TranscriptionFailure("Transcription response has neither segments nor text");
}
