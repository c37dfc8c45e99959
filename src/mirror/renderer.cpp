#include <sitemirror/mirror/renderer.hpp>
#include <sitemirror/core/errors.hpp>
#include <sitemirror/core/logger.hpp>

namespace sitemirror {

namespace {

// Closes the context on every exit from the render scope
class ContextCloser {
public:
    explicit ContextCloser(BrowserContext* ctx) : ctx_(ctx) {}
    ~ContextCloser() {
        if (ctx_) ctx_->close();
    }

private:
    ContextCloser(const ContextCloser&);
    ContextCloser& operator=(const ContextCloser&);

    BrowserContext* ctx_;
};

} // namespace

PageRenderer::PageRenderer(const MirrorConfig& config,
                           HttpTransport& http,
                           BrowserLauncher& browser,
                           const RenderPolicy& policy)
    : config_(config)
    , http_(http)
    , browser_(browser)
    , policy_(policy) {
}

RenderedDocument PageRenderer::render(const std::string& url) {
    std::string html;
    if (try_static(url, html)) {
        LOG_INFO("Using static HTML for %s (%zu bytes)", url.c_str(), html.size());
        return RenderedDocument(html, RenderMode::STATIC);
    }

    LOG_INFO("Switching to headless rendering for %s", url.c_str());
    return RenderedDocument(render_dynamic(url), RenderMode::DYNAMIC);
}

bool PageRenderer::try_static(const std::string& url, std::string& html) {
    HeaderMap headers;
    headers["Accept"] = "text/html,application/xhtml+xml,application/xml;q=0.9,*/*;q=0.8";
    headers["Accept-Language"] = "en-US,en;q=0.5";

    HttpResponse resp = http_.get(url, config_.static_timeout_ms, headers);
    if (resp.transport_failed()) {
        LOG_WARN("Static fetch of %s failed: %s", url.c_str(), resp.error.c_str());
        return false;
    }
    if (!resp.ok()) {
        // Error pages are still judged on their content
        LOG_WARN("Static fetch of %s returned HTTP %ld", url.c_str(), resp.status_code);
    }

    if (policy_.should_fallback_to_dynamic_render(resp.body)) {
        LOG_DEBUG("Static body of %s (%zu bytes) looks client-rendered", url.c_str(), resp.body.size());
        return false;
    }

    html.swap(resp.body);
    return true;
}

std::string PageRenderer::render_dynamic(const std::string& url) {
    std::unique_ptr<BrowserContext> ctx;
    try {
        ctx = browser_.launch();
    } catch (const RenderError& e) {
        throw RenderError("Static fetch was insufficient and headless launch failed: " +
                          std::string(e.what()));
    }
    if (!ctx) {
        throw RenderError("Headless launcher returned no browser context");
    }

    ContextCloser closer(ctx.get());
    try {
        return ctx->navigate(url);
    } catch (const RenderError& e) {
        throw RenderError("Static fetch was insufficient and headless render failed: " +
                          std::string(e.what()));
    }
}

} // namespace sitemirror
