#ifndef SITEMIRROR_MIRROR_URL_HPP
#define SITEMIRROR_MIRROR_URL_HPP

#include <string>

namespace sitemirror {

// Absolute http(s) URL, parsed and normalized by libcurl's URL API
struct Url {
    std::string href;      // normalized, fragment removed
    std::string scheme;    // "http" or "https"
    std::string host;
    std::string path;      // always starts with '/'
    std::string query;     // without '?'
    
    // Throws ValidationError unless text is an absolute http:// or https:// URL
    static Url parse(const std::string& text);
};

// Resolve reference against base. Fails for anything that does not end up as
// an absolute http(s) URL (mailto:, javascript:, malformed input).
bool resolve_url(const std::string& reference, const std::string& base, std::string& out);

// Last path segment of an absolute URL, query and fragment excluded.
// Empty when the path ends in '/'.
std::string url_basename(const std::string& absolute_url);

// Strip a leading "scheme://" (or "//"), then map every character outside
// [A-Za-z0-9_] to '_':  "https://a.b/c" -> "a_b_c"
std::string folder_name_for(const std::string& url);

} // namespace sitemirror

#endif // SITEMIRROR_MIRROR_URL_HPP
