#ifndef SITEMIRROR_MIRROR_EXTRACTOR_HPP
#define SITEMIRROR_MIRROR_EXTRACTOR_HPP

#include <sitemirror/core/types.hpp>
#include <string>
#include <vector>

namespace sitemirror {

struct ExtractionResult {
    std::string html;                          // rewritten document
    std::vector<AssetReference> references;    // one per distinct remote URL, document order
};

// Finds <link href>, <script src> and <img src> references, assigns each a
// local path under assets/ and rewrites the attribute to it. Pure: parses,
// mutates and serializes in memory, never touches network or disk.
class ReferenceExtractor {
public:
    ReferenceExtractor();

    ExtractionResult extract(const std::string& html, const std::string& base_url) const;
    
    // Category from the extension of the URL path (query ignored, any case)
    static AssetCategory classify(const std::string& remote_url);
    
    // "assets/<category folder>/<basename>"
    static std::string local_path_for(AssetCategory category, const std::string& basename);

    // Attribute carrying the reference for an element, or NULL if not scanned
    static const char* reference_attribute(const std::string& element_name);
};

} // namespace sitemirror

#endif // SITEMIRROR_MIRROR_EXTRACTOR_HPP
