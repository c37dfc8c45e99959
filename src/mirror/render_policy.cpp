#include <sitemirror/mirror/render_policy.hpp>

namespace sitemirror {

HeuristicRenderPolicy::HeuristicRenderPolicy(size_t min_size, const std::string& marker)
    : min_size_(min_size)
    , marker_(marker) {
}

bool HeuristicRenderPolicy::should_fallback_to_dynamic_render(const std::string& html) const {
    if (html.size() < min_size_) return true;
    // Case-sensitive, like the marker itself
    return !marker_.empty() && html.find(marker_) == std::string::npos;
}

} // namespace sitemirror
