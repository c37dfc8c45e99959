#ifndef SITEMIRROR_CORE_HTTP_CLIENT_HPP
#define SITEMIRROR_CORE_HTTP_CLIENT_HPP

#include <string>
#include <vector>
#include <map>
#include <curl/curl.h>

namespace sitemirror {

typedef std::map<std::string, std::string> HeaderMap;

// HTTP response structure
struct HttpResponse {
    long status_code;
    std::string body;
    HeaderMap headers;
    std::string effective_url;  // after redirects
    std::string error;          // transport error, empty when a response arrived
    
    HttpResponse() : status_code(0) {}
    
    bool ok() const { return status_code >= 200 && status_code < 300; }

    // True when no HTTP response was received at all
    bool transport_failed() const { return status_code == 0; }
};

// Seam between the mirror pipeline and the network. Implementations must be
// safe to call from several worker threads at once.
class HttpTransport {
public:
    virtual ~HttpTransport() {}

    virtual HttpResponse get(const std::string& url, long timeout_ms,
                             const HeaderMap& headers = HeaderMap()) = 0;
};

// HTTP client using libcurl. Each request runs on its own easy handle, so a
// single client can serve the whole fetch pool. curl_global_init must have
// been called before the first request.
class HttpClient : public HttpTransport {
public:
    HttpClient();
    
    void set_user_agent(const std::string& ua) { user_agent_ = ua; }
    void set_max_body_bytes(size_t n) { max_body_bytes_ = n; }
    
    HttpResponse get(const std::string& url, long timeout_ms,
                     const HeaderMap& headers = HeaderMap());

private:
    std::string user_agent_;
    size_t max_body_bytes_;
    long max_redirects_;

    struct BodySink {
        std::string* body;
        size_t limit;
        bool truncated;
    };
    
    static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata);
    static size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata);
};

} // namespace sitemirror

#endif // SITEMIRROR_CORE_HTTP_CLIENT_HPP
