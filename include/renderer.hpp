#ifndef RENDERER_HPP
#define RENDERER_HPP

#include "api_comm.hpp"
#include <string>

// Appends text to an externally rendered surface. Throws RenderFailure.
class Renderer {
public:
    virtual ~Renderer() = default;

    virtual void update(const std::string& text) = 0;
    virtual std::string name() const = 0;
};

// Posts {"text": ...} to a page-update endpoint; the page appends it as a
// new paragraph.
class HttpRenderer : public Renderer {
public:
    HttpRenderer(api_comm::ApiClient& client, const std::string& url);

    void update(const std::string& text) override;
    std::string name() const override { return "renderer " + url_; }

private:
    api_comm::ApiClient& client_;
    std::string url_;
};

#endif // RENDERER_HPP
