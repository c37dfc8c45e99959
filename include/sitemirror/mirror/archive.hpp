#ifndef SITEMIRROR_MIRROR_ARCHIVE_HPP
#define SITEMIRROR_MIRROR_ARCHIVE_HPP

#include <sitemirror/core/types.hpp>
#include <sitemirror/mirror/mirror_config.hpp>
#include <string>
#include <vector>

namespace sitemirror {

struct ArchiveInfo {
    std::string archive_path;
    std::string public_archive_path;
    std::string file_name;
    std::string sha256;
    size_t entry_count;
    
    ArchiveInfo() : entry_count(0) {}
};

// Lays out the mirror folder and turns it into <folder_name>.zip:
//
//   <output_dir>/<folder_name>/index.html
//   <output_dir>/<folder_name>/assets/{css,js,images,fonts,misc}/...
//   <output_dir>/<folder_name>.zip
//   <public_dir>/<folder_name>.zip        (byte-identical copy)
class ArchiveBuilder {
public:
    explicit ArchiveBuilder(const MirrorConfig& config);
    
    // Paths for a folder name; nothing is created
    ClonedSite layout_for(const std::string& folder_name) const;
    
    // Create an empty folder for this run, discarding leftovers of an
    // earlier run of the same target. Throws PersistenceError.
    void prepare(const ClonedSite& site) const;
    
    // Write index.html, zip the folder and publish the copy. Assets are
    // expected at their local paths already; missing ones are only logged.
    // Throws PersistenceError.
    ArchiveInfo materialize(const ClonedSite& site,
                            const std::string& document_html,
                            const std::vector<AssetReference>& assets) const;
    
    // Zip every regular file below folder_root, entries named relative to it.
    // Returns the number of entries. Throws PersistenceError.
    static size_t write_zip(const std::string& folder_root, const std::string& zip_path);

private:
    MirrorConfig config_;

    void publish(const std::string& archive_path, const std::string& public_path,
                 const std::string& expected_sha256) const;
};

} // namespace sitemirror

#endif // SITEMIRROR_MIRROR_ARCHIVE_HPP
