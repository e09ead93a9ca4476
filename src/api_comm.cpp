#include "api_comm.hpp"
#include <curl/curl.h>
#include <iostream>
#include <fstream>
#include <cstring>
#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace api_comm {

// Helper function to trim whitespace
static std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) return "";
    size_t last = str.find_last_not_of(" \t\n\r");
    return str.substr(first, (last - first + 1));
}

// Helper function for cURL write callback
static size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* str = static_cast<std::string*>(userp);
    str->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

// Non-zero return makes cURL abort with CURLE_ABORTED_BY_CALLBACK
static int ProgressCallback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* check = static_cast<ApiClient::CancelCheck*>(clientp);
    return (*check && (*check)()) ? 1 : 0;
}

class ApiClient::Impl {
public:
    std::string api_key;
    std::string api_url;
    long timeout_seconds = 60;
    CancelCheck cancel_check;
    mutable std::mutex mutex;

    Impl() {
        // Try to load API key from environment variable
        const char* env_key = std::getenv("API_KEY");
        if (!env_key) env_key = std::getenv("OPENAI_API_KEY");
        if (env_key) {
            api_key = env_key;
        }

        // Try to load API URL from environment variable
        const char* env_url = std::getenv("API_URL");
        if (env_url) {
            api_url = env_url;
        } else {
            // Default to OpenAI API
            api_url = "https://api.openai.com/v1/chat/completions";
        }
    }

    std::string getProviderName() const {
        if (api_url.find("deepseek.com") != std::string::npos) {
            return "DeepSeek";
        } else if (api_url.find("openai.com") != std::string::npos) {
            return "OpenAI";
        } else if (api_url.find("groq.com") != std::string::npos) {
            return "Groq";
        } else if (api_url.find("localhost") != std::string::npos ||
                   api_url.find("127.0.0.1") != std::string::npos) {
            return "Local API";
        }
        return "Custom API";
    }

    // Settings copied out under the lock so requests run concurrently
    struct Snapshot {
        std::string api_key;
        long timeout_seconds;
        CancelCheck cancel_check;
    };

    Snapshot snapshot() const {
        std::lock_guard<std::mutex> lock(mutex);
        return Snapshot{api_key, timeout_seconds, cancel_check};
    }

    // Runs one POST. `attach_body` sets the body options on the handle and
    // may return a mime handle that must outlive the transfer.
    std::string post(const std::string& url,
                     curl_slist* headers,
                     const std::function<curl_mime*(CURL*)>& attach_body) {
        Snapshot settings = snapshot();

        // Initialize cURL
        CURL* curl = curl_easy_init();
        if (!curl) {
            curl_slist_free_all(headers);
            throw ApiError("Failed to initialize cURL");
        }

        if (!settings.api_key.empty()) {
            std::string auth_header = "Authorization: Bearer " + settings.api_key;
            headers = curl_slist_append(headers, auth_header.c_str());
        }

        std::string response_body;
        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, settings.timeout_seconds);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);

        if (settings.cancel_check) {
            curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, ProgressCallback);
            curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &settings.cancel_check);
            curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        }

        // Check for proxy settings
        const char* https_proxy = std::getenv("https_proxy");
        if (!https_proxy) https_proxy = std::getenv("HTTPS_PROXY");
        if (https_proxy) {
            curl_easy_setopt(curl, CURLOPT_PROXY, https_proxy);
        }

        curl_mime* mime = attach_body(curl);

        CURLcode res = curl_easy_perform(curl);
        long response_code = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response_code);

        // Cleanup
        if (mime) {
            curl_mime_free(mime);
        }
        curl_slist_free_all(headers);
        curl_easy_cleanup(curl);

        if (res == CURLE_ABORTED_BY_CALLBACK) {
            throw ApiError("Request to " + url + " cancelled");
        }
        if (res != CURLE_OK) {
            throw ApiError(std::string("cURL error: ") + curl_easy_strerror(res));
        }
        if (response_code < 200 || response_code >= 300) {
            throw ApiError("HTTP " + std::to_string(response_code) + " from " + url + ": " +
                           response_body.substr(0, 200));
        }

        return response_body;
    }
};

ApiClient::ApiClient() : impl(std::make_unique<Impl>()) {
    // Initialize cURL globally (once per application)
    static const bool curl_initialized = (curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK);
    if (!curl_initialized) {
        std::cerr << "[API] curl_global_init failed" << std::endl;
    }
}

ApiClient::~ApiClient() = default;

void ApiClient::setApiKey(const std::string& key) {
    std::lock_guard<std::mutex> lock(impl->mutex);
    impl->api_key = key;
}

void ApiClient::setApiUrl(const std::string& url) {
    std::lock_guard<std::mutex> lock(impl->mutex);
    impl->api_url = url;
}

void ApiClient::setTimeout(long seconds) {
    std::lock_guard<std::mutex> lock(impl->mutex);
    impl->timeout_seconds = seconds;
}

void ApiClient::setCancelCheck(CancelCheck check) {
    std::lock_guard<std::mutex> lock(impl->mutex);
    impl->cancel_check = std::move(check);
}

bool ApiClient::loadConfigFromEnv(const std::string& env_file) {
    std::ifstream file(env_file);
    if (!file.is_open()) {
        // Try from current directory
        file.open("./" + env_file);
        if (!file.is_open()) {
            return false;
        }
    }

    bool found_key = false;
    bool found_url = false;

    std::string line;
    while (std::getline(file, line)) {
        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') continue;

        size_t eq_pos = line.find('=');
        if (eq_pos != std::string::npos) {
            std::string key = trim(line.substr(0, eq_pos));
            std::string value = trim(line.substr(eq_pos + 1));

            // Remove quotes if present
            if (value.size() >= 2 &&
                ((value.front() == '"' && value.back() == '"') ||
                 (value.front() == '\'' && value.back() == '\''))) {
                value = value.substr(1, value.size() - 2);
            }

            if (key == "API_KEY" || key == "DEEPSEEK_API_KEY" || key == "OPENAI_API_KEY") {
                setApiKey(value);
                found_key = true;
            } else if (key == "API_URL") {
                setApiUrl(value);
                found_url = true;
            }
        }
    }

    return found_key || found_url;
}

bool ApiClient::isConfigured() const {
    std::lock_guard<std::mutex> lock(impl->mutex);
    return !impl->api_key.empty() && !impl->api_url.empty();
}

std::string ApiClient::getApiUrl() const {
    std::lock_guard<std::mutex> lock(impl->mutex);
    return impl->api_url;
}

long ApiClient::getTimeout() const {
    std::lock_guard<std::mutex> lock(impl->mutex);
    return impl->timeout_seconds;
}

std::string ApiClient::getApiProvider() const {
    std::lock_guard<std::mutex> lock(impl->mutex);
    return impl->getProviderName();
}

std::string parseChatResponse(const std::string& body) {
    json response_json;
    try {
        response_json = json::parse(body);
    } catch (const json::parse_error& e) {
        throw ApiError(std::string("JSON parse error: ") + e.what());
    }

    if (!response_json.contains("choices") ||
        !response_json["choices"].is_array() ||
        response_json["choices"].empty()) {
        throw ApiError("Completion response has no choices");
    }

    const auto& choice = response_json["choices"][0];
    if (!choice.contains("message") || !choice["message"].contains("content") ||
        !choice["message"]["content"].is_string()) {
        throw ApiError("Completion choice has no message content");
    }

    return choice["message"]["content"].get<std::string>();
}

std::string ApiClient::chat(const std::string& model,
                         const std::vector<Message>& messages,
                         const Options& options) {
    std::string url = getApiUrl();
    if (url.empty()) {
        throw ApiError("API URL not set");
    }

    // Prepare request JSON
    json request;
    request["model"] = model;
    request["stream"] = false;
    request["temperature"] = options.temperature;
    request["max_tokens"] = options.max_tokens;
    request["top_p"] = options.top_p;

    // Convert messages
    json messages_json = json::array();
    for (const auto& msg : messages) {
        messages_json.push_back({{"role", msg.role}, {"content", msg.content}});
    }
    request["messages"] = messages_json;

    return parseChatResponse(postJson(url, request));
}

std::string ApiClient::postJson(const std::string& url, const json& body) {
    std::string request_body = body.dump();

    curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");

    return impl->post(url, headers, [&request_body](CURL* curl) -> curl_mime* {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request_body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request_body.length()));
        return nullptr;
    });
}

std::string ApiClient::postForm(const std::string& url, const std::vector<FormPart>& parts) {
    return impl->post(url, nullptr, [&parts](CURL* curl) -> curl_mime* {
        curl_mime* mime = curl_mime_init(curl);
        for (const auto& p : parts) {
            curl_mimepart* part = curl_mime_addpart(mime);
            curl_mime_name(part, p.name.c_str());
            curl_mime_data(part, p.data.data(), p.data.size());
            if (!p.filename.empty()) {
                curl_mime_filename(part, p.filename.c_str());
            }
            if (!p.content_type.empty()) {
                curl_mime_type(part, p.content_type.c_str());
            }
        }
        curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
        return mime;
    });
}

} // namespace api_comm
