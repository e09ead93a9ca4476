#ifndef TRANSCRIBER_HPP
#define TRANSCRIBER_HPP

#include <string>
#include <vector>

// One sub-segment returned by a speech model.
struct TranscribedPiece {
    std::string text;
    float no_speech_prob;

    TranscribedPiece() : no_speech_prob(0.0f) {}
    TranscribedPiece(const std::string& t, float p) : text(t), no_speech_prob(p) {}
};

struct TranscribeRequest {
    std::string language;            // empty = auto-detect
    std::string task = "transcribe"; // "transcribe" or "translate"
    std::string prompt;              // empty = no initial prompt
};

// Speech-to-text capability. Implementations throw TranscriptionFailure for
// any error; the whole call fails as one unit.
class Transcriber {
public:
    virtual ~Transcriber() = default;

    virtual std::vector<TranscribedPiece> transcribe(const std::vector<char>& wav_bytes,
                                                     const TranscribeRequest& request) = 0;

    virtual std::string name() const = 0;
};

#endif // TRANSCRIBER_HPP
