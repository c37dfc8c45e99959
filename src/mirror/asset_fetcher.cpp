#include <sitemirror/mirror/asset_fetcher.hpp>
#include <sitemirror/core/errors.hpp>
#include <sitemirror/core/logger.hpp>
#include <sitemirror/core/utils.hpp>
#include <cerrno>
#include <cstring>

namespace sitemirror {

AssetFetcher::AssetFetcher(const MirrorConfig& config, HttpTransport& http)
    : config_(config)
    , http_(http) {
}

std::string AssetFetcher::download(const std::string& remote_url) {
    HttpResponse resp = http_.get(remote_url, config_.fetch_timeout_ms);
    if (resp.transport_failed()) {
        throw AssetFetchError(resp.error.empty() ? "no response" : resp.error);
    }
    if (!resp.ok()) {
        throw AssetFetchError(resp.error.empty() ? "unexpected HTTP status" : resp.error);
    }
    return resp.body;
}

bool AssetFetcher::fetch(const std::string& remote_url, std::string& bytes, std::string* error) {
    try {
        bytes = download(remote_url);
        return true;
    } catch (const AssetFetchError& e) {
        LOG_WARN("Failed: %s (%s)", remote_url.c_str(), e.what());
        bytes.clear();
        if (error) *error = e.what();
        return false;
    }
}

bool AssetFetcher::fetch_to(const AssetReference& ref, const std::string& folder_root,
                            AssetFailure& failure) {
    std::string bytes;
    std::string error;
    if (!fetch(ref.remote_url, bytes, &error)) {
        failure = AssetFailure(ref.remote_url, ref.local_path, error);
        return false;
    }

    std::string dest = join_path(folder_root, ref.local_path);
    std::string parent = dirname(dest);
    if (!mkdir_p(parent)) {
        throw PersistenceError("Cannot create directory " + parent + ": " + strerror(errno));
    }
    if (!write_file(dest, bytes)) {
        throw PersistenceError("Cannot write asset " + dest + ": " + strerror(errno));
    }

    LOG_DEBUG("Downloaded: %s -> %s (%zu bytes)", ref.remote_url.c_str(), dest.c_str(), bytes.size());
    return true;
}

} // namespace sitemirror
