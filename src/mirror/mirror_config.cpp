#include <sitemirror/mirror/mirror_config.hpp>
#include <sitemirror/core/logger.hpp>

namespace sitemirror {

namespace {

size_t positive_size(const Config& cfg, const std::string& key, size_t def) {
    int64_t value = cfg.get_int(key, static_cast<int64_t>(def));
    if (value <= 0) {
        LOG_WARN("Config: %s must be positive, using %zu", key.c_str(), def);
        return def;
    }
    return static_cast<size_t>(value);
}

} // namespace

MirrorConfig MirrorConfig::from_config(const Config& cfg) {
    MirrorConfig mc;
    
    mc.static_timeout_ms = static_cast<long>(positive_size(cfg, "static.timeout_ms", mc.static_timeout_ms));
    mc.min_document_size = static_cast<size_t>(cfg.get_int("static.min_document_size",
                                                           static_cast<int64_t>(mc.min_document_size)));
    mc.script_marker = cfg.get_string("static.script_marker", mc.script_marker);

    mc.browser_path = cfg.get_string("render.browser_path", mc.browser_path);
    mc.render_timeout_ms = static_cast<long>(positive_size(cfg, "render.timeout_ms", mc.render_timeout_ms));
    mc.idle_budget_ms = static_cast<long>(positive_size(cfg, "render.idle_budget_ms", mc.idle_budget_ms));

    mc.fetch_timeout_ms = static_cast<long>(positive_size(cfg, "fetch.timeout_ms", mc.fetch_timeout_ms));
    mc.fetch_workers = positive_size(cfg, "fetch.workers", mc.fetch_workers);
    mc.max_asset_bytes = positive_size(cfg, "fetch.max_asset_bytes", mc.max_asset_bytes);
    mc.user_agent = cfg.get_string("http.user_agent", mc.user_agent);

    mc.output_dir = cfg.get_string("output_dir", mc.output_dir);
    mc.public_dir = cfg.get_string("public_dir", mc.public_dir);
    
    LOG_DEBUG("Mirror config: static_timeout=%ldms min_size=%zu render_timeout=%ldms workers=%zu",
              mc.static_timeout_ms, mc.min_document_size, mc.render_timeout_ms, mc.fetch_workers);
    return mc;
}

} // namespace sitemirror
