#include "renderer.hpp"
#include "pipeline_errors.hpp"

HttpRenderer::HttpRenderer(api_comm::ApiClient& client, const std::string& url)
    : client_(client), url_(url) {
}

void HttpRenderer::update(const std::string& text) {
    api_comm::json body;
    body["text"] = text;

    try {
        client_.postJson(url_, body);
    } catch (const api_comm::ApiError& e) {
        throw RenderFailure(e.what());
    }
}
