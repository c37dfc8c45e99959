#include <sitemirror/mirror/url.hpp>
#include <sitemirror/core/errors.hpp>
#include <sitemirror/core/utils.hpp>
#include <curl/curl.h>
#include <cctype>

namespace sitemirror {

namespace {

class CurlUrl {
public:
    CurlUrl() : h_(curl_url()) {}
    ~CurlUrl() { if (h_) curl_url_cleanup(h_); }

    CURLU* get() const { return h_; }

    bool set(CURLUPart part, const char* value, unsigned int flags = 0) {
        return h_ && curl_url_set(h_, part, value, flags) == CURLUE_OK;
    }

    bool part(CURLUPart which, std::string& out) const {
        char* value = NULL;
        if (!h_ || curl_url_get(h_, which, &value, 0) != CURLUE_OK || !value) {
            return false;
        }
        out = value;
        curl_free(value);
        return true;
    }

private:
    CurlUrl(const CurlUrl&);
    CurlUrl& operator=(const CurlUrl&);

    CURLU* h_;
};

bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

bool is_http_scheme(const std::string& scheme) {
    std::string lower = to_lower(scheme);
    return lower == "http" || lower == "https";
}

// Leading "scheme:" per RFC 3986, or empty
std::string explicit_scheme(const std::string& ref) {
    if (ref.empty() || !std::isalpha(static_cast<unsigned char>(ref[0]))) return "";
    for (size_t i = 1; i < ref.size(); ++i) {
        char c = ref[i];
        if (c == ':') return ref.substr(0, i);
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '-' && c != '.') {
            return "";
        }
    }
    return "";
}

} // namespace

Url Url::parse(const std::string& text) {
    std::string trimmed = trim(text);
    std::string lower = to_lower(trimmed);
    if (!starts_with(lower, "http://") && !starts_with(lower, "https://")) {
        throw ValidationError("Invalid URL. Include http(s)://");
    }

    CurlUrl u;
    if (!u.set(CURLUPART_URL, trimmed.c_str())) {
        throw ValidationError("Invalid URL: " + trimmed);
    }

    Url url;
    if (!u.part(CURLUPART_SCHEME, url.scheme) || !is_http_scheme(url.scheme)) {
        throw ValidationError("Invalid URL. Include http(s)://");
    }
    if (!u.part(CURLUPART_HOST, url.host) || url.host.empty()) {
        throw ValidationError("Invalid URL: missing host in " + trimmed);
    }
    if (!u.part(CURLUPART_PATH, url.path) || url.path.empty()) {
        url.path = "/";
    }
    u.part(CURLUPART_QUERY, url.query);

    u.set(CURLUPART_FRAGMENT, NULL);
    if (!u.part(CURLUPART_URL, url.href)) {
        throw ValidationError("Invalid URL: " + trimmed);
    }
    return url;
}

bool resolve_url(const std::string& reference, const std::string& base, std::string& out) {
    std::string ref = trim(reference);
    if (ref.empty()) return false;

    std::string ref_scheme = explicit_scheme(ref);
    if (!ref_scheme.empty() && !is_http_scheme(ref_scheme)) {
        return false;
    }

    CurlUrl u;
    if (!u.set(CURLUPART_URL, base.c_str())) {
        return false;
    }
    // An absolute reference replaces the base, a relative one is resolved
    if (!u.set(CURLUPART_URL, ref.c_str())) {
        return false;
    }

    std::string scheme, host;
    if (!u.part(CURLUPART_SCHEME, scheme) || !is_http_scheme(scheme)) {
        return false;
    }
    if (!u.part(CURLUPART_HOST, host) || host.empty()) {
        return false;
    }

    u.set(CURLUPART_FRAGMENT, NULL);
    return u.part(CURLUPART_URL, out);
}

std::string url_basename(const std::string& absolute_url) {
    CurlUrl u;
    std::string path;
    if (!u.set(CURLUPART_URL, absolute_url.c_str()) || !u.part(CURLUPART_PATH, path)) {
        return "";
    }
    return basename(path);
}

std::string folder_name_for(const std::string& url) {
    std::string rest = url;

    size_t sep = url.find("://");
    bool has_scheme = sep != std::string::npos && sep > 0;
    for (size_t i = 0; has_scheme && i < sep; ++i) {
        if (!is_word_char(url[i])) has_scheme = false;
    }
    if (has_scheme) {
        rest = url.substr(sep + 3);
    } else if (starts_with(url, "//")) {
        rest = url.substr(2);
    }

    for (size_t i = 0; i < rest.size(); ++i) {
        if (!is_word_char(rest[i])) rest[i] = '_';
    }
    return rest;
}

} // namespace sitemirror
