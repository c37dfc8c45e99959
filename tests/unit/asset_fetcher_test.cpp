#include "test_support.hpp"

#include <sitemirror/mirror/asset_fetcher.hpp>
#include <sitemirror/core/errors.hpp>
#include <sitemirror/core/utils.hpp>

#include <gtest/gtest.h>

using namespace sitemirror;
using sitemirror::testing::FakeTransport;
using sitemirror::testing::ScratchDir;

TEST(AssetFetcherTest, ReturnsBytesOnSuccess) {
    FakeTransport http;
    http.respond("https://ex.com/a.css", 200, "body{}");
    AssetFetcher fetcher(MirrorConfig(), http);

    std::string bytes;
    EXPECT_TRUE(fetcher.fetch("https://ex.com/a.css", bytes));
    EXPECT_EQ("body{}", bytes);
}

TEST(AssetFetcherTest, NotFoundIsReportedNotThrown) {
    FakeTransport http;
    AssetFetcher fetcher(MirrorConfig(), http);

    std::string bytes = "stale";
    std::string error;
    EXPECT_FALSE(fetcher.fetch("https://ex.com/missing.png", bytes, &error));
    EXPECT_TRUE(bytes.empty());
    EXPECT_EQ("HTTP 404", error);
}

TEST(AssetFetcherTest, TransportFailureIsReportedNotThrown) {
    FakeTransport http;
    http.fail("https://ex.com/a.js", "Connection refused");
    AssetFetcher fetcher(MirrorConfig(), http);

    std::string bytes;
    std::string error;
    EXPECT_FALSE(fetcher.fetch("https://ex.com/a.js", bytes, &error));
    EXPECT_EQ("Connection refused", error);
}

TEST(AssetFetcherTest, FetchToCreatesParentDirectories) {
    ScratchDir dir;
    FakeTransport http;
    http.respond("https://ex.com/f.woff2", 200, std::string("\x77\x4f\x46\x32\x00", 5));
    AssetFetcher fetcher(MirrorConfig(), http);

    AssetReference ref("https://ex.com/f.woff2", AssetCategory::FONT, "assets/fonts/f.woff2");
    AssetFailure failure;
    ASSERT_TRUE(fetcher.fetch_to(ref, dir.path(), failure));

    std::string stored;
    ASSERT_TRUE(read_file(dir.file("assets/fonts/f.woff2"), stored));
    EXPECT_EQ(5u, stored.size());
}

TEST(AssetFetcherTest, FetchToRecordsFailureWithoutWriting) {
    ScratchDir dir;
    FakeTransport http;
    AssetFetcher fetcher(MirrorConfig(), http);

    AssetReference ref("https://ex.com/gone.css", AssetCategory::CSS, "assets/css/gone.css");
    AssetFailure failure;
    EXPECT_FALSE(fetcher.fetch_to(ref, dir.path(), failure));
    EXPECT_EQ("https://ex.com/gone.css", failure.remote_url);
    EXPECT_EQ("assets/css/gone.css", failure.local_path);
    EXPECT_FALSE(failure.reason.empty());
    EXPECT_FALSE(path_exists(dir.file("assets/css/gone.css")));
}

TEST(AssetFetcherTest, UnwritableDestinationIsPersistenceError) {
    ScratchDir dir;
    ASSERT_TRUE(write_file(dir.file("assets"), "not a directory"));
    FakeTransport http;
    http.respond("https://ex.com/a.css", 200, "x");
    AssetFetcher fetcher(MirrorConfig(), http);

    AssetReference ref("https://ex.com/a.css", AssetCategory::CSS, "assets/css/a.css");
    AssetFailure failure;
    EXPECT_THROW(fetcher.fetch_to(ref, dir.path(), failure), PersistenceError);
}
