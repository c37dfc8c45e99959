#include <sitemirror/mirror/clone_endpoint.hpp>
#include <sitemirror/core/errors.hpp>
#include <sitemirror/core/logger.hpp>
#include <sitemirror/core/utils.hpp>

namespace sitemirror {

namespace {

const char* INVALID_URL_MESSAGE = "Invalid URL. Include http(s)://";

Json message(const std::string& text) {
    Json j = Json::object();
    j["message"] = text;
    return j;
}

} // namespace

CloneEndpoint::CloneEndpoint(Cloner& cloner, const std::string& download_prefix)
    : cloner_(cloner)
    , download_prefix_(download_prefix) {
}

EndpointResponse CloneEndpoint::handle(const Json& request_body) {
    if (!request_body.is_object() || !request_body.contains("url") ||
        !request_body["url"].is_string()) {
        return EndpointResponse(400, message(INVALID_URL_MESSAGE));
    }
    std::string url = request_body["url"].get<std::string>();
    std::string lower = to_lower(trim(url));
    if (!starts_with(lower, "http://") && !starts_with(lower, "https://")) {
        return EndpointResponse(400, message(INVALID_URL_MESSAGE));
    }

    try {
        CloneResult result = cloner_.clone_website(url);

        Json body = message("Cloned successfully");
        body["zipFileName"] = result.archive_file_name;
        body["downloadPath"] = join_path(download_prefix_, result.archive_file_name);
        body["mode"] = render_mode_str(result.mode);
        return EndpointResponse(200, body);
    } catch (const ValidationError& e) {
        return EndpointResponse(400, message(e.what()));
    } catch (const CloneError& e) {
        LOG_ERROR("Clone error (%s): %s", clone_error_kind_str(e.kind()), e.what());
        return EndpointResponse(500, message(e.what()));
    } catch (const std::exception& e) {
        LOG_ERROR("Clone error: %s", e.what());
        return EndpointResponse(500, message(e.what()));
    }
}

EndpointResponse CloneEndpoint::health() const {
    Json body = Json::object();
    body["ok"] = true;
    return EndpointResponse(200, body);
}

} // namespace sitemirror
