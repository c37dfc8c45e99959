#ifndef SITEMIRROR_MIRROR_CLONE_ENDPOINT_HPP
#define SITEMIRROR_MIRROR_CLONE_ENDPOINT_HPP

#include <sitemirror/core/json.hpp>
#include <sitemirror/mirror/cloner.hpp>

namespace sitemirror {

struct EndpointResponse {
    int status;
    Json body;
    
    EndpointResponse() : status(200), body(Json::object()) {}
    EndpointResponse(int s, const Json& b) : status(s), body(b) {}
};

// Request/response contract of the download API, independent of any server:
//   POST /api/clone {"url": "..."}  -> 200 | 400 | 500
//   GET  /api/health                -> 200 {"ok": true}
class CloneEndpoint {
public:
    explicit CloneEndpoint(Cloner& cloner, const std::string& download_prefix = "/downloads");
    
    EndpointResponse handle(const Json& request_body);
    EndpointResponse health() const;

private:
    Cloner& cloner_;
    std::string download_prefix_;
};

} // namespace sitemirror

#endif // SITEMIRROR_MIRROR_CLONE_ENDPOINT_HPP
