#include <sitemirror/core/types.hpp>

namespace sitemirror {

const char* render_mode_str(RenderMode m) {
    switch (m) {
        case RenderMode::STATIC:  return "static";
        case RenderMode::DYNAMIC: return "dynamic";
    }
    return "unknown";
}

const char* asset_category_str(AssetCategory c) {
    switch (c) {
        case AssetCategory::CSS:   return "css";
        case AssetCategory::JS:    return "js";
        case AssetCategory::IMAGE: return "image";
        case AssetCategory::FONT:  return "font";
        case AssetCategory::MISC:  return "misc";
    }
    return "unknown";
}

const char* asset_category_folder(AssetCategory c) {
    switch (c) {
        case AssetCategory::CSS:   return "css";
        case AssetCategory::JS:    return "js";
        case AssetCategory::IMAGE: return "images";
        case AssetCategory::FONT:  return "fonts";
        case AssetCategory::MISC:  return "misc";
    }
    return "misc";
}

std::string CloneResult::summary() const {
    return std::string("Website (") + render_mode_str(mode) + ") cloned to " + archive_path;
}

Json CloneResult::to_json() const {
    Json j = Json::object();
    j["result"] = summary();
    j["zipPath"] = archive_path;
    j["publicZipPath"] = public_archive_path;
    j["zipName"] = archive_file_name;
    j["mode"] = render_mode_str(mode);
    j["sha256"] = archive_sha256;
    j["assetCount"] = asset_count;
    
    Json failed = Json::array();
    for (size_t i = 0; i < failed_assets.size(); ++i) {
        Json f = Json::object();
        f["url"] = failed_assets[i].remote_url;
        f["localPath"] = failed_assets[i].local_path;
        f["reason"] = failed_assets[i].reason;
        failed.push_back(f);
    }
    j["failedAssets"] = failed;
    return j;
}

} // namespace sitemirror
