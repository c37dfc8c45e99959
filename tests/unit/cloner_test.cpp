#include "test_support.hpp"

#include <sitemirror/mirror/cloner.hpp>
#include <sitemirror/core/errors.hpp>
#include <sitemirror/core/utils.hpp>

#include <gtest/gtest.h>
#include <atomic>
#include <map>
#include <chrono>
#include <thread>

using namespace sitemirror;
using sitemirror::testing::FakeLauncher;
using sitemirror::testing::FakeTransport;
using sitemirror::testing::ScratchDir;
using sitemirror::testing::large_static_page;
using sitemirror::testing::read_zip;
using sitemirror::testing::scratch_config;

namespace {

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

TEST(ClonerTest, TinyPageIsRenderedDynamicallyAndArchived) {
    ScratchDir dir;
    FakeTransport http;
    http.respond("http://example.com", 200, "hello");
    FakeLauncher browser("<html><body><p>from the browser</p></body></html>");
    HeuristicRenderPolicy policy;
    Cloner cloner(scratch_config(dir), http, browser, policy);

    CloneResult result = cloner.clone_website("http://example.com");

    EXPECT_EQ(RenderMode::DYNAMIC, result.mode);
    EXPECT_EQ("example_com.zip", result.archive_file_name);
    EXPECT_EQ(dir.file("out/example_com.zip"), result.archive_path);
    EXPECT_EQ(dir.file("public/downloads/example_com.zip"), result.public_archive_path);
    EXPECT_EQ(1, browser.stats().closes);
    EXPECT_EQ("Website (dynamic) cloned to " + result.archive_path, result.summary());

    std::map<std::string, std::string> entries = read_zip(result.archive_path);
    ASSERT_EQ(1u, entries.count("index.html"));
    EXPECT_TRUE(contains(entries["index.html"], "from the browser"));
}

TEST(ClonerTest, BrokenAssetDoesNotAbortClone) {
    ScratchDir dir;
    FakeTransport http;
    http.respond("https://ex.com/", 200, large_static_page(
        "<link rel=\"stylesheet\" href=\"/css/site.css\">"
        "<img src=\"/img/missing.png\">"
        "<script src=\"https://cdn.ex.com/lib.js\"></script>"));
    http.respond("https://ex.com/css/site.css", 200, "body{color:red}");
    http.respond("https://cdn.ex.com/lib.js", 200, "console.log(1)");
    FakeLauncher browser;
    HeuristicRenderPolicy policy;
    Cloner cloner(scratch_config(dir), http, browser, policy);

    CloneResult result = cloner.clone_website("https://ex.com/");

    EXPECT_EQ(RenderMode::STATIC, result.mode);
    EXPECT_EQ(3u, result.asset_count);
    EXPECT_FALSE(result.complete());
    ASSERT_EQ(1u, result.failed_assets.size());
    EXPECT_EQ("https://ex.com/img/missing.png", result.failed_assets[0].remote_url);
    EXPECT_EQ("assets/images/missing.png", result.failed_assets[0].local_path);
    EXPECT_EQ(0, browser.stats().launches);

    std::map<std::string, std::string> entries = read_zip(result.archive_path);
    EXPECT_EQ(3u, entries.size());
    EXPECT_EQ("body{color:red}", entries["assets/css/site.css"]);
    EXPECT_EQ("console.log(1)", entries["assets/js/lib.js"]);
    EXPECT_EQ(0u, entries.count("assets/images/missing.png"));
    EXPECT_TRUE(contains(entries["index.html"], "assets/images/missing.png"));
    EXPECT_TRUE(contains(entries["index.html"], "assets/css/site.css"));
}

TEST(ClonerTest, ResultJsonCarriesArchiveAndFailureDetail) {
    ScratchDir dir;
    FakeTransport http;
    http.respond("https://ex.com/", 200, large_static_page("<img src=\"/gone.gif\">"));
    FakeLauncher browser;
    HeuristicRenderPolicy policy;
    Cloner cloner(scratch_config(dir), http, browser, policy);

    Json j = cloner.clone_website("https://ex.com/").to_json();
    EXPECT_EQ("static", j["mode"].get<std::string>());
    EXPECT_EQ("ex_com_.zip", j["zipName"].get<std::string>());
    EXPECT_EQ(1, j["assetCount"].get<int>());
    ASSERT_EQ(1u, j["failedAssets"].size());
    EXPECT_EQ("https://ex.com/gone.gif", j["failedAssets"][0]["url"].get<std::string>());
    EXPECT_EQ(64u, j["sha256"].get<std::string>().size());
    EXPECT_TRUE(contains(j["result"].get<std::string>(), "Website (static) cloned to "));
}

TEST(ClonerTest, RepeatedCloneOverwritesSameArchiveName) {
    ScratchDir dir;
    FakeTransport http;
    http.respond("https://a.b/c", 200, large_static_page("<p>first</p>"));
    FakeLauncher browser;
    HeuristicRenderPolicy policy;
    Cloner cloner(scratch_config(dir), http, browser, policy);

    CloneResult first = cloner.clone_website("https://a.b/c");
    http.respond("https://a.b/c", 200, large_static_page("<p>second</p>"));
    CloneResult second = cloner.clone_website("https://a.b/c");

    EXPECT_EQ("a_b_c.zip", first.archive_file_name);
    EXPECT_EQ("a_b_c.zip", second.archive_file_name);
    EXPECT_EQ(first.archive_path, second.archive_path);

    std::map<std::string, std::string> entries = read_zip(second.public_archive_path);
    EXPECT_TRUE(contains(entries["index.html"], "second"));
    EXPECT_FALSE(contains(entries["index.html"], "first"));
}

TEST(ClonerTest, SurroundingWhitespaceIsIgnored) {
    ScratchDir dir;
    FakeTransport http;
    http.respond("https://ex.com/", 200, large_static_page(
        "<link rel=\"stylesheet\" href=\"assets/css/site.css\">"));
    http.respond("https://ex.com/assets/css/site.css", 200, "p{margin:0}");
    FakeLauncher browser;
    HeuristicRenderPolicy policy;
    Cloner cloner(scratch_config(dir), http, browser, policy);

    CloneResult result = cloner.clone_website("  https://ex.com/\n");

    EXPECT_EQ("ex_com_.zip", result.archive_file_name);
    EXPECT_EQ(1u, result.asset_count);
    EXPECT_TRUE(result.complete());
    std::map<std::string, std::string> entries = read_zip(result.archive_path);
    EXPECT_EQ("p{margin:0}", entries["assets/css/site.css"]);
}

TEST(ClonerTest, CollidingLocalPathHoldsLaterDownload) {
    ScratchDir dir;
    FakeTransport http;
    http.respond("https://ex.com/", 200, large_static_page(
        "<link rel=\"stylesheet\" href=\"/v1/style.css\">"
        "<link rel=\"stylesheet\" href=\"/v2/style.css\">"));
    http.respond("https://ex.com/v1/style.css", 200, std::string(4096, 'a'));
    http.respond("https://ex.com/v2/style.css", 200, "short");
    FakeLauncher browser;
    HeuristicRenderPolicy policy;
    Cloner cloner(scratch_config(dir), http, browser, policy);

    for (int run = 0; run < 5; ++run) {
        CloneResult result = cloner.clone_website("https://ex.com/");
        EXPECT_EQ(2u, result.asset_count);
        EXPECT_TRUE(result.complete());

        std::map<std::string, std::string> entries = read_zip(result.archive_path);
        EXPECT_EQ("short", entries["assets/css/style.css"]);
    }
}

TEST(ClonerTest, InvalidUrlTouchesNothing) {
    ScratchDir dir;
    FakeTransport http;
    FakeLauncher browser;
    HeuristicRenderPolicy policy;
    Cloner cloner(scratch_config(dir), http, browser, policy);

    EXPECT_THROW(cloner.clone_website("example.com"), ValidationError);
    EXPECT_THROW(cloner.clone_website("ftp://example.com/"), ValidationError);
    EXPECT_EQ(0u, http.total_calls());
    EXPECT_EQ(0, browser.stats().launches);
    EXPECT_FALSE(path_exists(dir.file("out")));
}

TEST(ClonerTest, RenderFailureProducesNoArchive) {
    ScratchDir dir;
    FakeTransport http;
    http.fail("https://down.example/", "Could not resolve host");
    FakeLauncher browser("");
    HeuristicRenderPolicy policy;
    Cloner cloner(scratch_config(dir), http, browser, policy);

    EXPECT_THROW(cloner.clone_website("https://down.example/"), RenderError);
    EXPECT_EQ(1, browser.stats().closes);
    EXPECT_FALSE(path_exists(dir.file("out/down_example_.zip")));
}

TEST(ClonerTest, ConcurrentClonesOfSameTargetBothSucceed) {
    ScratchDir dir;
    FakeTransport http;
    http.respond("https://ex.com/", 200, large_static_page("<img src=\"/a.png\"><img src=\"/b.png\">"));
    http.respond("https://ex.com/a.png", 200, "AAAA");
    http.respond("https://ex.com/b.png", 200, "BBBB");
    FakeLauncher browser;
    HeuristicRenderPolicy policy;
    Cloner cloner(scratch_config(dir), http, browser, policy);

    std::atomic<int> ok(0);
    std::vector<std::thread> threads;
    for (int i = 0; i < 3; ++i) {
        threads.push_back(std::thread([&cloner, &ok] {
            CloneResult r = cloner.clone_website("https://ex.com/");
            if (r.complete()) ++ok;
        }));
    }
    for (size_t i = 0; i < threads.size(); ++i) {
        threads[i].join();
    }

    EXPECT_EQ(3, ok.load());
    std::map<std::string, std::string> entries = read_zip(dir.file("out/ex_com_.zip"));
    EXPECT_EQ(3u, entries.size());
    EXPECT_EQ("AAAA", entries["assets/images/a.png"]);
    EXPECT_EQ("BBBB", entries["assets/images/b.png"]);
}

TEST(TargetLocksTest, SerializesSameKeyOnly) {
    TargetLocks locks;
    locks.acquire("a");
    EXPECT_TRUE(locks.busy("a"));
    EXPECT_FALSE(locks.busy("b"));

    // A different key is never blocked
    {
        TargetLocks::Guard other(locks, "b");
        EXPECT_TRUE(locks.busy("b"));
    }
    EXPECT_FALSE(locks.busy("b"));

    std::atomic<bool> entered(false);
    std::thread waiter([&locks, &entered] {
        TargetLocks::Guard guard(locks, "a");
        entered = true;
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(entered.load());

    locks.release("a");
    waiter.join();
    EXPECT_TRUE(entered.load());
    EXPECT_FALSE(locks.busy("a"));
}
