/*
 * sitemirror - Clone orchestration
 *
 *   validate -> lock target -> render -> extract/rewrite
 *            -> fetch assets (bounded pool) -> index.html -> zip -> public copy
 *
 * Rewriting finishes before the first asset request, so the document on disk
 * always points at final local paths.
 */
#ifndef SITEMIRROR_MIRROR_CLONER_HPP
#define SITEMIRROR_MIRROR_CLONER_HPP

#include <sitemirror/core/types.hpp>
#include <sitemirror/core/http_client.hpp>
#include <sitemirror/core/thread_pool.hpp>
#include <sitemirror/mirror/mirror_config.hpp>
#include <sitemirror/mirror/headless_browser.hpp>
#include <sitemirror/mirror/render_policy.hpp>
#include <sitemirror/mirror/renderer.hpp>
#include <sitemirror/mirror/extractor.hpp>
#include <sitemirror/mirror/asset_fetcher.hpp>
#include <sitemirror/mirror/archive.hpp>
#include <string>
#include <set>
#include <memory>
#include <mutex>
#include <condition_variable>

namespace sitemirror {

// At most one clone run per folder name. Runs for other targets are not
// blocked.
class TargetLocks {
public:
    TargetLocks() {}

    void acquire(const std::string& key);
    void release(const std::string& key);
    bool busy(const std::string& key) const;

    class Guard {
    public:
        Guard(TargetLocks& locks, const std::string& key)
            : locks_(locks), key_(key) { locks_.acquire(key_); }
        ~Guard() { locks_.release(key_); }
    private:
        Guard(const Guard&);
        Guard& operator=(const Guard&);

        TargetLocks& locks_;
        std::string key_;
    };

private:
    TargetLocks(const TargetLocks&);
    TargetLocks& operator=(const TargetLocks&);

    mutable std::mutex mutex_;
    std::condition_variable released_;
    std::set<std::string> active_;
};

class Cloner {
public:
    // Production wiring: libcurl transport, Chromium launcher, heuristic policy
    explicit Cloner(const MirrorConfig& config);
    
    // Collaborators are borrowed and must outlive the cloner
    Cloner(const MirrorConfig& config,
           HttpTransport& http,
           BrowserLauncher& browser,
           const RenderPolicy& policy);
    
    ~Cloner();
    
    // Throws ValidationError, RenderError or PersistenceError. Individual
    // asset failures are returned in CloneResult::failed_assets.
    // Safe to call from several threads.
    CloneResult clone_website(const std::string& url);

    const MirrorConfig& config() const { return config_; }

private:
    Cloner(const Cloner&);
    Cloner& operator=(const Cloner&);

    MirrorConfig config_;
    
    std::unique_ptr<HttpClient> owned_http_;
    std::unique_ptr<ChromiumLauncher> owned_browser_;
    std::unique_ptr<HeuristicRenderPolicy> owned_policy_;
    
    HttpTransport& http_;
    BrowserLauncher& browser_;
    const RenderPolicy& policy_;
    
    PageRenderer renderer_;
    ReferenceExtractor extractor_;
    AssetFetcher fetcher_;
    ArchiveBuilder archive_;
    ThreadPool pool_;
    TargetLocks locks_;

    void fetch_assets(const std::vector<AssetReference>& refs,
                      const ClonedSite& site,
                      std::vector<AssetFailure>& failures);
};

} // namespace sitemirror

#endif // SITEMIRROR_MIRROR_CLONER_HPP
