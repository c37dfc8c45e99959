#include <sitemirror/mirror/archive.hpp>
#include <sitemirror/core/errors.hpp>
#include <sitemirror/core/logger.hpp>
#include <sitemirror/core/utils.hpp>

#include <zip.h>
#include <cerrno>
#include <cstring>

namespace sitemirror {

namespace {

const char* DOCUMENT_NAME = "index.html";

std::string zip_open_error(int code) {
    zip_error_t error;
    zip_error_init_with_code(&error, code);
    std::string msg = zip_error_strerror(&error);
    zip_error_fini(&error);
    return msg;
}

std::string file_sha256(const std::string& path) {
    std::string data;
    if (!read_file(path, data)) {
        throw PersistenceError("Cannot read " + path + ": " + strerror(errno));
    }
    return sha256_hex(data);
}

} // namespace

ArchiveBuilder::ArchiveBuilder(const MirrorConfig& config) : config_(config) {}

ClonedSite ArchiveBuilder::layout_for(const std::string& folder_name) const {
    std::string out_dir = absolute_path(config_.output_dir);
    std::string pub_dir = absolute_path(config_.public_dir);
    
    ClonedSite site;
    site.folder_name = folder_name;
    site.folder_path = join_path(out_dir, folder_name);
    site.document_path = join_path(site.folder_path, DOCUMENT_NAME);
    site.asset_root = join_path(site.folder_path, "assets");
    site.archive_path = join_path(out_dir, folder_name + ".zip");
    site.public_archive_path = join_path(pub_dir, folder_name + ".zip");
    return site;
}

void ArchiveBuilder::prepare(const ClonedSite& site) const {
    if (path_exists(site.folder_path)) {
        LOG_DEBUG("Clearing previous mirror at %s", site.folder_path.c_str());
        if (!remove_tree(site.folder_path)) {
            throw PersistenceError("Cannot clear " + site.folder_path + ": " + strerror(errno));
        }
    }
    if (!mkdir_p(site.folder_path)) {
        throw PersistenceError("Cannot create " + site.folder_path + ": " + strerror(errno));
    }
}

size_t ArchiveBuilder::write_zip(const std::string& folder_root, const std::string& zip_path) {
    int err = 0;
    zip_t* za = zip_open(zip_path.c_str(), ZIP_CREATE | ZIP_TRUNCATE, &err);
    if (!za) {
        throw PersistenceError("Cannot create archive " + zip_path + ": " + zip_open_error(err));
    }

    std::vector<std::string> files = list_files_recursive(folder_root);
    for (size_t i = 0; i < files.size(); ++i) {
        std::string source_path = join_path(folder_root, files[i]);
        zip_source_t* src = zip_source_file(za, source_path.c_str(), 0, 0);
        if (!src) {
            std::string msg = zip_strerror(za);
            zip_discard(za);
            throw PersistenceError("Cannot read " + source_path + " for archiving: " + msg);
        }

        zip_int64_t idx = zip_file_add(za, files[i].c_str(), src, ZIP_FL_OVERWRITE | ZIP_FL_ENC_UTF_8);
        if (idx < 0) {
            std::string msg = zip_strerror(za);
            zip_source_free(src);
            zip_discard(za);
            throw PersistenceError("Cannot add " + files[i] + " to archive: " + msg);
        }
        zip_set_file_compression(za, static_cast<zip_uint64_t>(idx), ZIP_CM_DEFLATE, 0);
    }

    // Sources are read and compressed here
    if (zip_close(za) != 0) {
        std::string msg = zip_strerror(za);
        zip_discard(za);
        throw PersistenceError("Cannot write archive " + zip_path + ": " + msg);
    }

    // libzip writes nothing for an archive without entries
    if (files.empty() && !path_exists(zip_path)) {
        static const char EMPTY_ZIP[22] = { 'P', 'K', 5, 6 };
        if (!write_file(zip_path, std::string(EMPTY_ZIP, sizeof(EMPTY_ZIP)))) {
            throw PersistenceError("Cannot write archive " + zip_path + ": " + strerror(errno));
        }
    }
    return files.size();
}

void ArchiveBuilder::publish(const std::string& archive_path, const std::string& public_path,
                             const std::string& expected_sha256) const {
    std::string dir = dirname(public_path);
    if (!mkdir_p(dir)) {
        throw PersistenceError("Cannot create public directory " + dir + ": " + strerror(errno));
    }
    if (!copy_file(archive_path, public_path)) {
        throw PersistenceError("Cannot copy archive to " + public_path + ": " + strerror(errno));
    }
    if (file_sha256(public_path) != expected_sha256) {
        throw PersistenceError("Public copy " + public_path + " does not match " + archive_path);
    }
}

ArchiveInfo ArchiveBuilder::materialize(const ClonedSite& site,
                                        const std::string& document_html,
                                        const std::vector<AssetReference>& assets) const {
    if (!mkdir_p(site.folder_path)) {
        throw PersistenceError("Cannot create " + site.folder_path + ": " + strerror(errno));
    }
    if (!write_file(site.document_path, document_html)) {
        throw PersistenceError("Cannot write " + site.document_path + ": " + strerror(errno));
    }

    size_t missing = 0;
    for (size_t i = 0; i < assets.size(); ++i) {
        if (!path_exists(join_path(site.folder_path, assets[i].local_path))) {
            ++missing;
        }
    }
    if (missing > 0) {
        LOG_WARN("%zu of %zu referenced assets are missing from %s",
                 missing, assets.size(), site.folder_name.c_str());
    }

    ArchiveInfo info;
    info.archive_path = site.archive_path;
    info.public_archive_path = site.public_archive_path;
    info.file_name = basename(site.archive_path);
    info.entry_count = write_zip(site.folder_path, site.archive_path);
    info.sha256 = file_sha256(site.archive_path);

    publish(site.archive_path, site.public_archive_path, info.sha256);

    LOG_INFO("Archive %s written (%zu entries, sha256 %s)",
             info.archive_path.c_str(), info.entry_count, info.sha256.substr(0, 12).c_str());
    return info;
}

} // namespace sitemirror
