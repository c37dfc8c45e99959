#include <sitemirror/mirror/extractor.hpp>
#include <sitemirror/mirror/url.hpp>
#include <sitemirror/core/logger.hpp>
#include <sitemirror/core/utils.hpp>

#include <libxml/HTMLparser.h>
#include <libxml/HTMLtree.h>
#include <libxml/tree.h>
#include <libxml/parser.h>

#include <map>
#include <memory>

namespace sitemirror {

namespace {

struct ExtensionRule {
    const char* ext;
    AssetCategory category;
};

static const ExtensionRule EXTENSION_TABLE[] = {
    { "css",   AssetCategory::CSS },
    { "js",    AssetCategory::JS },
    { "mjs",   AssetCategory::JS },
    { "png",   AssetCategory::IMAGE },
    { "jpg",   AssetCategory::IMAGE },
    { "jpeg",  AssetCategory::IMAGE },
    { "gif",   AssetCategory::IMAGE },
    { "svg",   AssetCategory::IMAGE },
    { "webp",  AssetCategory::IMAGE },
    { "ico",   AssetCategory::IMAGE },
    { "woff",  AssetCategory::FONT },
    { "woff2", AssetCategory::FONT },
    { "ttf",   AssetCategory::FONT },
    { "eot",   AssetCategory::FONT },
    { "otf",   AssetCategory::FONT },
    { NULL,    AssetCategory::MISC }
};

struct XmlDocDeleter {
    void operator()(xmlDoc* doc) const { xmlFreeDoc(doc); }
};
typedef std::unique_ptr<xmlDoc, XmlDocDeleter> XmlDocPtr;

std::string get_attribute(xmlNode* node, const char* name, bool& present) {
    xmlChar* value = xmlGetProp(node, reinterpret_cast<const xmlChar*>(name));
    present = value != NULL;
    if (!value) return "";
    std::string result(reinterpret_cast<const char*>(value));
    xmlFree(value);
    return result;
}

// Without a declared charset libxml2 assumes Latin-1; the web default is UTF-8
const char* parse_encoding(const std::string& html) {
    std::string head = to_lower(html.substr(0, 4096));
    if (head.find("charset") != std::string::npos) return NULL;
    return "UTF-8";
}

class Rewriter {
public:
    Rewriter(const std::string& base_url, std::vector<AssetReference>& refs)
        : base_url_(base_url), refs_(refs) {}

    void walk(xmlNode* node) {
        for (xmlNode* cur = node; cur != NULL; cur = cur->next) {
            if (cur->type == XML_ELEMENT_NODE) {
                visit(cur);
            }
            if (cur->children) {
                walk(cur->children);
            }
        }
    }

private:
    std::string base_url_;
    std::vector<AssetReference>& refs_;
    std::map<std::string, size_t> seen_;

    void visit(xmlNode* element) {
        std::string name = to_lower(reinterpret_cast<const char*>(element->name));
        const char* attr = ReferenceExtractor::reference_attribute(name);
        if (!attr) return;

        bool present = false;
        std::string raw = trim(get_attribute(element, attr, present));
        if (!present || raw.empty()) return;
        if (starts_with(to_lower(raw), "data:")) return;

        std::string remote;
        if (!resolve_url(raw, base_url_, remote)) {
            LOG_DEBUG("Skipping unresolvable %s=\"%s\" on <%s>", attr, raw.c_str(), name.c_str());
            return;
        }

        std::string file = url_basename(remote);
        if (file.empty() || file == "." || file == "..") {
            LOG_DEBUG("Skipping %s: no usable file name", remote.c_str());
            return;
        }

        std::string local;
        std::map<std::string, size_t>::const_iterator it = seen_.find(remote);
        if (it != seen_.end()) {
            local = refs_[it->second].local_path;
        } else {
            AssetCategory category = ReferenceExtractor::classify(remote);
            local = ReferenceExtractor::local_path_for(category, file);
            seen_[remote] = refs_.size();
            refs_.push_back(AssetReference(remote, category, local));
            LOG_DEBUG("Asset (%s) %s -> %s", asset_category_str(category), remote.c_str(), local.c_str());
        }

        xmlSetProp(element, reinterpret_cast<const xmlChar*>(attr),
                   reinterpret_cast<const xmlChar*>(local.c_str()));
    }
};

} // namespace

ReferenceExtractor::ReferenceExtractor() {
    xmlInitParser();
}

const char* ReferenceExtractor::reference_attribute(const std::string& element_name) {
    if (element_name == "link") return "href";
    if (element_name == "script" || element_name == "img") return "src";
    return NULL;
}

AssetCategory ReferenceExtractor::classify(const std::string& remote_url) {
    std::string file = url_basename(remote_url);
    size_t dot = file.rfind('.');
    if (dot == std::string::npos || dot + 1 >= file.size()) {
        return AssetCategory::MISC;
    }
    std::string ext = to_lower(file.substr(dot + 1));
    for (size_t i = 0; EXTENSION_TABLE[i].ext != NULL; ++i) {
        if (ext == EXTENSION_TABLE[i].ext) return EXTENSION_TABLE[i].category;
    }
    return AssetCategory::MISC;
}

std::string ReferenceExtractor::local_path_for(AssetCategory category, const std::string& basename) {
    return std::string("assets/") + asset_category_folder(category) + "/" + basename;
}

ExtractionResult ReferenceExtractor::extract(const std::string& html, const std::string& base_url) const {
    ExtractionResult result;
    result.html = html;
    if (html.empty()) {
        return result;
    }

    // NODEFDTD: a page without a doctype must not gain one on output
    int options = HTML_PARSE_RECOVER | HTML_PARSE_NOERROR | HTML_PARSE_NOWARNING |
                  HTML_PARSE_NONET | HTML_PARSE_NODEFDTD;
    XmlDocPtr doc(htmlReadMemory(html.data(), static_cast<int>(html.size()),
                                 base_url.c_str(), parse_encoding(html), options));
    if (!doc) {
        LOG_WARN("HTML parser produced no document for %s; keeping markup unchanged", base_url.c_str());
        return result;
    }

    Rewriter rewriter(base_url, result.references);
    rewriter.walk(xmlDocGetRootElement(doc.get()));

    xmlChar* out = NULL;
    int size = 0;
    htmlDocDumpMemoryFormat(doc.get(), &out, &size, 0);
    if (out) {
        result.html.assign(reinterpret_cast<const char*>(out), static_cast<size_t>(size));
        xmlFree(out);
    }

    LOG_INFO("Extracted %zu asset references from %s", result.references.size(), base_url.c_str());
    return result;
}

} // namespace sitemirror
