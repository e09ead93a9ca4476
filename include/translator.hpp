#ifndef TRANSLATOR_HPP
#define TRANSLATOR_HPP

#include "api_comm.hpp"
#include <string>

// Text-to-text translation capability. Implementations throw
// TranslationFailure on error.
class Translator {
public:
    virtual ~Translator() = default;

    virtual std::string translate(const std::string& text) = 0;
    virtual std::string name() const = 0;
};

// For speech models that already translated while transcribing.
class PassthroughTranslator : public Translator {
public:
    std::string translate(const std::string& text) override { return text; }
    std::string name() const override { return "passthrough"; }
};

// Builds "<prompt>\n---\n<text>", the request sent to every LLM backend.
std::string buildTranslationPrompt(const std::string& prompt, const std::string& text);

// Local model through the Ollama server.
class OllamaTranslator : public Translator {
public:
    OllamaTranslator(const std::string& model, const std::string& prompt);

    // Checks that the server is up and the model is present, pulling it if
    // needed, as the ASR-LLM demos did. Returns false if unusable.
    bool initialize();

    std::string translate(const std::string& text) override;
    std::string name() const override { return "ollama (" + model_ + ")"; }

private:
    std::string model_;
    std::string prompt_;
};

// OpenAI-compatible chat completions endpoint.
class ApiTranslator : public Translator {
public:
    ApiTranslator(api_comm::ApiClient& client, const std::string& model, const std::string& prompt);

    std::string translate(const std::string& text) override;
    std::string name() const override;

private:
    api_comm::ApiClient& client_;
    std::string model_;
    std::string prompt_;
};

#endif // TRANSLATOR_HPP
