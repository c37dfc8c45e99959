#ifndef SITEMIRROR_MIRROR_MIRROR_CONFIG_HPP
#define SITEMIRROR_MIRROR_MIRROR_CONFIG_HPP

#include <sitemirror/core/config.hpp>
#include <string>
#include <cstddef>

namespace sitemirror {

// Settings for one Cloner and everything it constructs. Passed in explicitly;
// there is no process-wide mirror state.
struct MirrorConfig {
    // Static fetch and the dynamic-content heuristic
    long static_timeout_ms;
    size_t min_document_size;
    std::string script_marker;

    // Headless fallback
    std::string browser_path;       // empty: search PATH
    long render_timeout_ms;         // hard limit, process is killed after this
    long idle_budget_ms;            // virtual time allowed for the network to settle

    // Asset downloads
    long fetch_timeout_ms;
    size_t fetch_workers;
    size_t max_asset_bytes;
    std::string user_agent;

    // Output layout
    std::string output_dir;
    std::string public_dir;
    
    MirrorConfig()
        : static_timeout_ms(10000)
        , min_document_size(2000)
        , script_marker("<script")
        , render_timeout_ms(60000)
        , idle_budget_ms(5000)
        , fetch_timeout_ms(30000)
        , fetch_workers(8)
        , max_asset_bytes(50 * 1024 * 1024)
        , user_agent("sitemirror/1.0")
        , output_dir(".")
        , public_dir("public/downloads") {}
    
    static MirrorConfig from_config(const Config& cfg);
};

} // namespace sitemirror

#endif // SITEMIRROR_MIRROR_MIRROR_CONFIG_HPP
