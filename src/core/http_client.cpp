#include <sitemirror/core/http_client.hpp>
#include <sitemirror/core/logger.hpp>
#include <cstring>
#include <sstream>

namespace sitemirror {

namespace {

// Owns one easy handle and its header list for the duration of a request
class CurlHandle {
public:
    CurlHandle() : curl_(curl_easy_init()), headers_(NULL) {}
    ~CurlHandle() {
        if (headers_) curl_slist_free_all(headers_);
        if (curl_) curl_easy_cleanup(curl_);
    }

    CURL* get() const { return curl_; }

    void add_header(const std::string& line) {
        headers_ = curl_slist_append(headers_, line.c_str());
    }
    struct curl_slist* headers() const { return headers_; }

private:
    CurlHandle(const CurlHandle&);
    CurlHandle& operator=(const CurlHandle&);

    CURL* curl_;
    struct curl_slist* headers_;
};

} // namespace

HttpClient::HttpClient()
    : user_agent_("sitemirror/1.0")
    , max_body_bytes_(0)
    , max_redirects_(5) {
}

size_t HttpClient::write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    size_t total = size * nmemb;
    BodySink* sink = static_cast<BodySink*>(userdata);
    if (sink->limit > 0 && sink->body->size() + total > sink->limit) {
        sink->truncated = true;
        return 0;  // aborts the transfer with CURLE_WRITE_ERROR
    }
    sink->body->append(ptr, total);
    return total;
}

size_t HttpClient::header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    size_t total = size * nitems;
    HeaderMap* headers = static_cast<HeaderMap*>(userdata);
    
    std::string line(buffer, total);
    
    // Remove trailing \r\n
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }

    // A new status line starts a fresh header block (redirect hops)
    if (line.compare(0, 5, "HTTP/") == 0) {
        headers->clear();
        return total;
    }
    
    // Find the colon separator
    size_t colon = line.find(':');
    if (colon != std::string::npos) {
        std::string key = line.substr(0, colon);
        std::string value = line.substr(colon + 1);
        
        // Trim leading whitespace from value
        size_t start = value.find_first_not_of(" \t");
        value = start != std::string::npos ? value.substr(start) : "";
        
        (*headers)[key] = value;
    }
    
    return total;
}

HttpResponse HttpClient::get(const std::string& url, long timeout_ms,
                             const HeaderMap& headers) {
    HttpResponse resp;
    
    CurlHandle handle;
    CURL* curl = handle.get();
    if (!curl) {
        resp.error = "CURL not initialized";
        return resp;
    }
    
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    
    // Set timeout
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, timeout_ms / 2);
    // Worker threads must not receive SIGALRM from the resolver
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    
    curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent_.c_str());
    // Let curl negotiate and decode gzip/deflate/br
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");
    
    for (HeaderMap::const_iterator it = headers.begin(); it != headers.end(); ++it) {
        handle.add_header(it->first + ": " + it->second);
    }
    if (handle.headers()) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, handle.headers());
    }
    
    // Set response callbacks
    std::string response_body;
    BodySink sink;
    sink.body = &response_body;
    sink.limit = max_body_bytes_;
    sink.truncated = false;
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &sink);
    
    HeaderMap response_headers;
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response_headers);
    
    // Follow redirects
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, max_redirects_);
    
    // SSL verification (enabled by default)
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
    
    CURLcode res = curl_easy_perform(curl);
    
    if (res != CURLE_OK) {
        if (sink.truncated) {
            std::ostringstream oss;
            oss << "response exceeds " << max_body_bytes_ << " bytes";
            resp.error = oss.str();
        } else {
            resp.error = curl_easy_strerror(res);
        }
        LOG_DEBUG("GET %s failed: %s", url.c_str(), resp.error.c_str());
        return resp;
    }
    
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &resp.status_code);

    char* effective = NULL;
    if (curl_easy_getinfo(curl, CURLINFO_EFFECTIVE_URL, &effective) == CURLE_OK && effective) {
        resp.effective_url = effective;
    }
    
    resp.body.swap(response_body);
    resp.headers.swap(response_headers);
    
    if (!resp.ok()) {
        std::ostringstream oss;
        oss << "HTTP " << resp.status_code;
        resp.error = oss.str();
    }
    
    LOG_DEBUG("GET %s -> %ld (%zu bytes)", url.c_str(), resp.status_code, resp.body.size());
    return resp;
}

} // namespace sitemirror
