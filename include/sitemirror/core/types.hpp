#ifndef SITEMIRROR_CORE_TYPES_HPP
#define SITEMIRROR_CORE_TYPES_HPP

#include "json.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace sitemirror {

// How the page HTML was obtained
enum class RenderMode {
    STATIC,   // plain GET, no scripts executed
    DYNAMIC   // headless browser DOM snapshot
};

const char* render_mode_str(RenderMode m);

enum class AssetCategory {
    CSS,
    JS,
    IMAGE,
    FONT,
    MISC
};

const char* asset_category_str(AssetCategory c);

// Folder under assets/ that holds a category ("css", "js", "images", ...)
const char* asset_category_folder(AssetCategory c);

// Page HTML as captured; not modified after extraction starts
struct RenderedDocument {
    std::string html;
    RenderMode mode;
    
    RenderedDocument() : mode(RenderMode::STATIC) {}
    RenderedDocument(const std::string& h, RenderMode m) : html(h), mode(m) {}
};

// One external resource referenced by the page.
// local_path depends only on category and basename, so two different URLs
// with the same file name and category share a local_path and the later
// download overwrites the earlier one.
struct AssetReference {
    std::string remote_url;     // absolute
    AssetCategory category;
    std::string local_path;     // "assets/<folder>/<basename>"
    
    AssetReference() : category(AssetCategory::MISC) {}
    AssetReference(const std::string& url, AssetCategory c, const std::string& path)
        : remote_url(url), category(c), local_path(path) {}
};

// An asset that could not be stored; the document still points at local_path
struct AssetFailure {
    std::string remote_url;
    std::string local_path;
    std::string reason;
    
    AssetFailure() {}
    AssetFailure(const std::string& url, const std::string& path, const std::string& why)
        : remote_url(url), local_path(path), reason(why) {}
};

// On-disk layout of one clone run
struct ClonedSite {
    std::string folder_name;          // sanitized target URL
    std::string folder_path;          // <output_dir>/<folder_name>
    std::string document_path;        // <folder_path>/index.html
    std::string asset_root;           // <folder_path>/assets
    std::string archive_path;         // <output_dir>/<folder_name>.zip
    std::string public_archive_path;  // <public_dir>/<folder_name>.zip
};

struct CloneResult {
    RenderMode mode;
    std::string archive_path;
    std::string public_archive_path;
    std::string archive_file_name;
    std::string archive_sha256;
    size_t asset_count;
    std::vector<AssetFailure> failed_assets;
    
    CloneResult() : mode(RenderMode::STATIC), asset_count(0) {}
    
    bool complete() const { return failed_assets.empty(); }
    
    // "Website (static) cloned to /abs/path/example_com.zip"
    std::string summary() const;
    
    Json to_json() const;
};

} // namespace sitemirror

#endif // SITEMIRROR_CORE_TYPES_HPP
