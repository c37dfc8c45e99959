#include "test_support.hpp"

#include <sitemirror/core/errors.hpp>
#include <sitemirror/core/utils.hpp>
#include <zip.h>

namespace sitemirror {
namespace testing {

// ============ FakeTransport ============

void FakeTransport::respond(const std::string& url, long status, const std::string& body) {
    std::lock_guard<std::mutex> lock(mutex_);
    HttpResponse resp;
    resp.status_code = status;
    resp.body = body;
    resp.effective_url = url;
    if (status < 200 || status >= 300) {
        resp.error = "HTTP " + std::to_string(status);
    }
    responses_[url] = resp;
}

void FakeTransport::fail(const std::string& url, const std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    HttpResponse resp;
    resp.error = error;
    responses_[url] = resp;
}

HttpResponse FakeTransport::get(const std::string& url, long timeout_ms, const HeaderMap& headers) {
    (void)timeout_ms;
    (void)headers;
    std::lock_guard<std::mutex> lock(mutex_);
    ++calls_[url];
    std::map<std::string, HttpResponse>::const_iterator it = responses_.find(url);
    if (it != responses_.end()) {
        return it->second;
    }
    HttpResponse missing;
    missing.status_code = 404;
    missing.error = "HTTP 404";
    missing.effective_url = url;
    return missing;
}

size_t FakeTransport::calls(const std::string& url) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, size_t>::const_iterator it = calls_.find(url);
    return it == calls_.end() ? 0 : it->second;
}

size_t FakeTransport::total_calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t total = 0;
    for (std::map<std::string, size_t>::const_iterator it = calls_.begin(); it != calls_.end(); ++it) {
        total += it->second;
    }
    return total;
}

// ============ FakeLauncher ============

namespace {

class FakeContext : public BrowserContext {
public:
    FakeContext(const std::string& dom, BrowserStats& stats) : dom_(dom), stats_(stats) {}

    std::string navigate(const std::string& url) {
        ++stats_.navigations;
        stats_.urls.push_back(url);
        if (dom_.empty()) {
            throw RenderError("navigation timed out");
        }
        return dom_;
    }

    void close() { ++stats_.closes; }

private:
    std::string dom_;
    BrowserStats& stats_;
};

} // namespace

std::unique_ptr<BrowserContext> FakeLauncher::launch() {
    ++stats_.launches;
    if (fail_launch_) {
        throw RenderError("no browser");
    }
    return std::unique_ptr<BrowserContext>(new FakeContext(dom_, stats_));
}

// ============ ScratchDir ============

ScratchDir::ScratchDir() : path_(make_temp_dir("sitemirror-test-")) {}

ScratchDir::~ScratchDir() {
    if (!path_.empty()) {
        remove_tree(path_);
    }
}

std::string ScratchDir::file(const std::string& rel) const {
    return join_path(path_, rel);
}

MirrorConfig scratch_config(const ScratchDir& dir) {
    MirrorConfig config;
    config.output_dir = dir.file("out");
    config.public_dir = dir.file("public/downloads");
    config.fetch_workers = 4;
    return config;
}

// ============ Zip reader ============

std::map<std::string, std::string> read_zip(const std::string& path) {
    std::map<std::string, std::string> entries;

    int err = 0;
    zip_t* za = zip_open(path.c_str(), ZIP_RDONLY, &err);
    if (!za) return entries;

    zip_int64_t count = zip_get_num_entries(za, 0);
    for (zip_int64_t i = 0; i < count; ++i) {
        zip_stat_t st;
        zip_stat_init(&st);
        if (zip_stat_index(za, static_cast<zip_uint64_t>(i), 0, &st) != 0) continue;

        zip_file_t* zf = zip_fopen_index(za, static_cast<zip_uint64_t>(i), 0);
        if (!zf) continue;

        std::string data(static_cast<size_t>(st.size), '\0');
        zip_int64_t n = st.size > 0 ? zip_fread(zf, &data[0], st.size) : 0;
        zip_fclose(zf);
        if (n < 0) continue;
        data.resize(static_cast<size_t>(n));
        entries[st.name] = data;
    }

    zip_close(za);
    return entries;
}

std::string large_static_page(const std::string& body_markup) {
    std::string page = "<!DOCTYPE html>\n<html><head><title>Fixture</title>"
                       "<script>var ready = true;</script></head><body>";
    page += body_markup;
    page += "<p>" + std::string(2500, 'x') + "</p></body></html>";
    return page;
}

} // namespace testing
} // namespace sitemirror
