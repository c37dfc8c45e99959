#ifndef SITEMIRROR_MIRROR_RENDER_POLICY_HPP
#define SITEMIRROR_MIRROR_RENDER_POLICY_HPP

#include <string>
#include <cstddef>

namespace sitemirror {

// Decides whether a statically fetched document is good enough to mirror
class RenderPolicy {
public:
    virtual ~RenderPolicy() {}
    
    virtual bool should_fallback_to_dynamic_render(const std::string& html) const = 0;
};

// Falls back when the body is shorter than min_size or has no script marker.
// Small static pages trigger needless renders, and dynamic pages whose shell
// is already large slip through; the resulting mode tells the caller which
// path was taken.
class HeuristicRenderPolicy : public RenderPolicy {
public:
    HeuristicRenderPolicy(size_t min_size = 2000, const std::string& marker = "<script");
    
    bool should_fallback_to_dynamic_render(const std::string& html) const;

    size_t min_size() const { return min_size_; }
    const std::string& marker() const { return marker_; }

private:
    size_t min_size_;
    std::string marker_;
};

} // namespace sitemirror

#endif // SITEMIRROR_MIRROR_RENDER_POLICY_HPP
