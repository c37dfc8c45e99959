#ifndef SITEMIRROR_MIRROR_RENDERER_HPP
#define SITEMIRROR_MIRROR_RENDERER_HPP

#include <sitemirror/core/types.hpp>
#include <sitemirror/core/http_client.hpp>
#include <sitemirror/mirror/headless_browser.hpp>
#include <sitemirror/mirror/render_policy.hpp>
#include <sitemirror/mirror/mirror_config.hpp>
#include <string>

namespace sitemirror {

// Obtains page HTML the cheapest way that looks complete: a static GET first,
// a headless render when the static body fails the render policy or the
// request itself fails.
class PageRenderer {
public:
    PageRenderer(const MirrorConfig& config,
                 HttpTransport& http,
                 BrowserLauncher& browser,
                 const RenderPolicy& policy);
    
    // Throws RenderError when the headless fallback also fails
    RenderedDocument render(const std::string& url);

private:
    MirrorConfig config_;
    HttpTransport& http_;
    BrowserLauncher& browser_;
    const RenderPolicy& policy_;

    // False when the static body should not be used
    bool try_static(const std::string& url, std::string& html);
    std::string render_dynamic(const std::string& url);
};

} // namespace sitemirror

#endif // SITEMIRROR_MIRROR_RENDERER_HPP
