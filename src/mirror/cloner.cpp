#include <sitemirror/mirror/cloner.hpp>
#include <sitemirror/mirror/url.hpp>
#include <sitemirror/core/errors.hpp>
#include <sitemirror/core/logger.hpp>
#include <sitemirror/core/utils.hpp>

#include <map>

namespace sitemirror {

// ============ TargetLocks ============

void TargetLocks::acquire(const std::string& key) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (active_.count(key)) {
        LOG_INFO("Waiting for running clone of %s", key.c_str());
    }
    released_.wait(lock, [this, &key] { return active_.count(key) == 0; });
    active_.insert(key);
}

void TargetLocks::release(const std::string& key) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        active_.erase(key);
    }
    released_.notify_all();
}

bool TargetLocks::busy(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.count(key) != 0;
}

// ============ Cloner ============

namespace {

HttpClient* make_http_client(const MirrorConfig& config) {
    HttpClient* client = new HttpClient();
    client->set_user_agent(config.user_agent);
    client->set_max_body_bytes(config.max_asset_bytes);
    return client;
}

} // namespace

Cloner::Cloner(const MirrorConfig& config)
    : config_(config)
    , owned_http_(make_http_client(config))
    , owned_browser_(new ChromiumLauncher(config))
    , owned_policy_(new HeuristicRenderPolicy(config.min_document_size, config.script_marker))
    , http_(*owned_http_)
    , browser_(*owned_browser_)
    , policy_(*owned_policy_)
    , renderer_(config_, http_, browser_, policy_)
    , fetcher_(config_, http_)
    , archive_(config_)
    , pool_(config.fetch_workers > 0 ? config.fetch_workers : 1) {
}

Cloner::Cloner(const MirrorConfig& config,
               HttpTransport& http,
               BrowserLauncher& browser,
               const RenderPolicy& policy)
    : config_(config)
    , http_(http)
    , browser_(browser)
    , policy_(policy)
    , renderer_(config_, http_, browser_, policy_)
    , fetcher_(config_, http_)
    , archive_(config_)
    , pool_(config.fetch_workers > 0 ? config.fetch_workers : 1) {
}

Cloner::~Cloner() {
    pool_.shutdown();
}

void Cloner::fetch_assets(const std::vector<AssetReference>& refs,
                          const ClonedSite& site,
                          std::vector<AssetFailure>& failures) {
    // References sharing a local path form one task and run in document
    // order, so the later download overwrites the file instead of racing it
    std::vector<std::vector<size_t> > groups;
    std::map<std::string, size_t> group_of;
    for (size_t i = 0; i < refs.size(); ++i) {
        std::map<std::string, size_t>::const_iterator it = group_of.find(refs[i].local_path);
        if (it == group_of.end()) {
            group_of[refs[i].local_path] = groups.size();
            groups.push_back(std::vector<size_t>(1, i));
        } else {
            groups[it->second].push_back(i);
        }
    }

    // One slot per reference; workers never touch the same element
    std::vector<AssetFailure> slots(refs.size());
    std::vector<char> failed(refs.size(), 0);
    std::vector<std::string> write_errors(refs.size());

    {
        TaskGroup group(pool_);
        for (size_t g = 0; g < groups.size(); ++g) {
            const std::vector<size_t>& members = groups[g];
            group.run([this, &refs, &site, &slots, &failed, &write_errors, &members]() {
                for (size_t k = 0; k < members.size(); ++k) {
                    size_t i = members[k];
                    try {
                        if (!fetcher_.fetch_to(refs[i], site.folder_path, slots[i])) {
                            failed[i] = 1;
                        }
                    } catch (const PersistenceError& e) {
                        write_errors[i] = e.what();
                        return;
                    } catch (const std::exception& e) {
                        slots[i] = AssetFailure(refs[i].remote_url, refs[i].local_path, e.what());
                        failed[i] = 1;
                    }
                }
            });
        }
        group.wait();
    }

    for (size_t i = 0; i < refs.size(); ++i) {
        if (!write_errors[i].empty()) {
            throw PersistenceError(write_errors[i]);
        }
    }
    for (size_t i = 0; i < refs.size(); ++i) {
        if (failed[i]) failures.push_back(slots[i]);
    }
}

CloneResult Cloner::clone_website(const std::string& url) {
    // Nothing is fetched or written for an invalid target
    Url target = Url::parse(url);
    // Surrounding whitespace passes validation but breaks naming and resolution
    std::string page_url = trim(url);
    std::string folder = folder_name_for(page_url);
    
    TargetLocks::Guard guard(locks_, folder);
    int64_t started = monotonic_ms();
    LOG_INFO("Cloning %s into %s", target.href.c_str(), folder.c_str());

    RenderedDocument doc = renderer_.render(page_url);
    LOG_INFO("Rendered %s (%s, %zu bytes)", page_url.c_str(), render_mode_str(doc.mode), doc.html.size());

    ExtractionResult extracted = extractor_.extract(doc.html, page_url);

    ClonedSite site = archive_.layout_for(folder);
    archive_.prepare(site);

    CloneResult result;
    result.mode = doc.mode;
    result.asset_count = extracted.references.size();
    fetch_assets(extracted.references, site, result.failed_assets);
    if (!result.failed_assets.empty()) {
        LOG_WARN("%zu of %zu assets could not be downloaded",
                 result.failed_assets.size(), extracted.references.size());
    }

    ArchiveInfo info = archive_.materialize(site, extracted.html, extracted.references);
    result.archive_path = info.archive_path;
    result.public_archive_path = info.public_archive_path;
    result.archive_file_name = info.file_name;
    result.archive_sha256 = info.sha256;

    LOG_INFO("%s in %lld ms", result.summary().c_str(),
             static_cast<long long>(monotonic_ms() - started));
    return result;
}

} // namespace sitemirror
