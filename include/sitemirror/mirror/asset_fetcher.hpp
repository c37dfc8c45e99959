#ifndef SITEMIRROR_MIRROR_ASSET_FETCHER_HPP
#define SITEMIRROR_MIRROR_ASSET_FETCHER_HPP

#include <sitemirror/core/types.hpp>
#include <sitemirror/core/http_client.hpp>
#include <sitemirror/mirror/mirror_config.hpp>
#include <string>

namespace sitemirror {

// Downloads single assets. A broken asset is logged and reported back, it
// never aborts the clone; only local write failures are fatal.
class AssetFetcher {
public:
    AssetFetcher(const MirrorConfig& config, HttpTransport& http);
    
    // Bytes of remote_url, or false (with reason in error) on network
    // failure or non-2xx status. Never throws for remote problems.
    bool fetch(const std::string& remote_url, std::string& bytes, std::string* error = NULL);
    
    // fetch() and store the bytes at <folder_root>/<ref.local_path>, creating
    // parent directories first. Returns false and fills failure when the
    // download failed. Throws PersistenceError when the file cannot be written.
    bool fetch_to(const AssetReference& ref, const std::string& folder_root, AssetFailure& failure);

private:
    MirrorConfig config_;
    HttpTransport& http_;

    // Throws AssetFetchError
    std::string download(const std::string& remote_url);
};

} // namespace sitemirror

#endif // SITEMIRROR_MIRROR_ASSET_FETCHER_HPP
