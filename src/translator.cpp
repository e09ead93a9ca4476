#include "translator.hpp"
#include "pipeline_errors.hpp"
#include <iostream>
#include <vector>

std::string buildTranslationPrompt(const std::string& prompt, const std::string& text) {
    return prompt + "\n---\n" + text;
}

OllamaTranslator::OllamaTranslator(const std::string& model, const std::string& prompt)
    : model_(model), prompt_(prompt) {
}

bool OllamaTranslator::initialize() {
    ollama::allow_exceptions(true);

    // Check if Ollama server is running
    if (!ollama::is_running()) {
        std::cerr << "Error: Ollama server is not running. Please start ollama service first." << std::endl;
        std::cerr << "Run: sudo systemctl start ollama" << std::endl;
        return false;
    }
    std::cout << "Ollama server is running (version: " << ollama::get_version() << ")" << std::endl;

    // Check if the specified model is available
    std::vector<std::string> models = ollama::list_models();
    bool model_found = false;
    for (const auto& model : models) {
        if (model == model_) {
            model_found = true;
            break;
        }
    }

    if (!model_found) {
        std::cout << "Model '" << model_ << "' not found locally. Attempting to pull..." << std::endl;
        if (!ollama::pull_model(model_)) {
            std::cerr << "Failed to pull model: " << model_ << std::endl;
            std::cerr << "ollama pull " << model_ << std::endl;
            return false;
        }
        std::cout << "Model pulled successfully!" << std::endl;
    } else {
        std::cout << "Using existing model: " << model_ << std::endl;
    }

    return true;
}

std::string OllamaTranslator::translate(const std::string& text) {
    try {
        ollama::response response = ollama::generate(model_, buildTranslationPrompt(prompt_, text));
        std::string output = response.as_simple_string();
        if (output.empty()) {
            throw TranslationFailure("Empty response from " + model_);
        }
        return output;
    } catch (const ollama::exception& e) {
        throw TranslationFailure(std::string("Ollama error: ") + e.what());
    }
}

ApiTranslator::ApiTranslator(api_comm::ApiClient& client, const std::string& model, const std::string& prompt)
    : client_(client), model_(model), prompt_(prompt) {
}

std::string ApiTranslator::name() const {
    return client_.getApiProvider() + " (" + model_ + ")";
}

std::string ApiTranslator::translate(const std::string& text) {
    std::vector<api_comm::Message> messages;
    messages.emplace_back("user", buildTranslationPrompt(prompt_, text));

    try {
        std::string content = client_.chat(model_, messages);
        if (content.empty()) {
            throw TranslationFailure("Empty completion from " + model_);
        }
        return content;
    } catch (const api_comm::ApiError& e) {
        throw TranslationFailure(std::string("API error: ") + e.what());
    }
}
