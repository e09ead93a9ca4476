#ifndef API_COMM_HPP
#define API_COMM_HPP

#include <string>
#include <vector>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <utility>
#include "ollama.hpp"  // Use the json library from ollama.hpp

namespace api_comm {

using json = nlohmann::json;

struct Message {
    std::string role;
    std::string content;

    Message(const std::string& r, const std::string& c) : role(r), content(c) {}
};

struct Options {
    float temperature = 0.2f;
    int max_tokens = 500;
    float top_p = 1.0f;
};

// One field of a multipart/form-data body. A part with a filename is sent as
// a file upload carrying `data`; otherwise `data` is the field value.
struct FormPart {
    std::string name;
    std::string data;
    std::string filename;
    std::string content_type;

    static FormPart field(const std::string& name, const std::string& value) {
        return FormPart{name, value, "", ""};
    }
    static FormPart file(const std::string& name, const std::string& filename,
                         const std::string& content_type, std::string bytes) {
        return FormPart{name, std::move(bytes), filename, content_type};
    }
};

// Transport failure, non-2xx status or unparsable body.
class ApiError : public std::runtime_error {
public:
    explicit ApiError(const std::string& what) : std::runtime_error(what) {}
};

// Thin libcurl client for OpenAI-compatible endpoints. Every request call is
// blocking and may be issued from several threads at once.
class ApiClient {
public:
    // Returns true when in-flight transfers should be aborted.
    using CancelCheck = std::function<bool()>;

    ApiClient();
    ~ApiClient();

    // Set API configuration
    void setApiKey(const std::string& key);
    void setApiUrl(const std::string& url);
    void setTimeout(long seconds);
    void setCancelCheck(CancelCheck check);

    // Load configuration from .env file
    bool loadConfigFromEnv(const std::string& env_file = ".env");

    // Chat completion against the configured API URL, returns the reply text
    std::string chat(const std::string& model,
                  const std::vector<Message>& messages,
                  const Options& options = Options());

    // POST a JSON body, returns the response body
    std::string postJson(const std::string& url, const json& body);

    // POST multipart/form-data, returns the response body
    std::string postForm(const std::string& url, const std::vector<FormPart>& parts);

    // Check if API is configured
    bool isConfigured() const;
    std::string getApiUrl() const;
    long getTimeout() const;

    // Get current API provider name (for display)
    std::string getApiProvider() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl;
};

// Pulls the first choice's message content out of a chat completion body.
// Throws ApiError if the body is not a completion.
std::string parseChatResponse(const std::string& body);

} // namespace api_comm

#endif // API_COMM_HPP
