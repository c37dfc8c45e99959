#include <sitemirror/core/config.hpp>
#include <sitemirror/mirror/mirror_config.hpp>

#include <gtest/gtest.h>
#include <cstdlib>

using namespace sitemirror;

TEST(ConfigTest, RejectsNonObjectAndMalformedJson) {
    Config cfg;
    EXPECT_FALSE(cfg.load_string("[1, 2]"));
    EXPECT_FALSE(cfg.load_string("{ not json"));
    EXPECT_TRUE(cfg.load_string("{}"));
}

TEST(ConfigTest, DotKeysWalkSections) {
    Config cfg;
    ASSERT_TRUE(cfg.load_string(R"({"fetch": {"workers": 3}, "http": {"user_agent": "ua"}, "flag": true})"));
    EXPECT_EQ(3, cfg.get_int("fetch.workers", 8));
    EXPECT_EQ("ua", cfg.get_string("http.user_agent"));
    EXPECT_TRUE(cfg.get_bool("flag"));
    EXPECT_EQ(42, cfg.get_int("fetch.missing", 42));
    EXPECT_EQ("dflt", cfg.get_string("fetch.workers", "dflt"));
}

TEST(ConfigTest, EnvironmentOverridesFile) {
    EXPECT_EQ("SITEMIRROR_RENDER_TIMEOUT_MS", Config::to_env_key("render.timeout_ms"));

    Config cfg;
    ASSERT_TRUE(cfg.load_string(R"({"render": {"timeout_ms": 1000}})"));
    setenv("SITEMIRROR_RENDER_TIMEOUT_MS", "2500", 1);
    EXPECT_EQ(2500, cfg.get_int("render.timeout_ms", 0));
    setenv("SITEMIRROR_RENDER_TIMEOUT_MS", "soon", 1);
    EXPECT_EQ(1000, cfg.get_int("render.timeout_ms", 0));
    unsetenv("SITEMIRROR_RENDER_TIMEOUT_MS");
}

TEST(MirrorConfigTest, DefaultsMatchDocumentedValues) {
    MirrorConfig mc = MirrorConfig::from_config(Config());
    EXPECT_EQ(10000, mc.static_timeout_ms);
    EXPECT_EQ(2000u, mc.min_document_size);
    EXPECT_EQ("<script", mc.script_marker);
    EXPECT_EQ(60000, mc.render_timeout_ms);
    EXPECT_EQ(8u, mc.fetch_workers);
    EXPECT_EQ(".", mc.output_dir);
    EXPECT_EQ("public/downloads", mc.public_dir);
}

TEST(MirrorConfigTest, ReadsSectionsAndRejectsNonPositive) {
    Config cfg;
    ASSERT_TRUE(cfg.load_string(R"({
        "static": {"min_document_size": 10, "script_marker": "<main"},
        "render": {"browser_path": "/opt/chrome", "timeout_ms": -5},
        "fetch": {"workers": 2},
        "output_dir": "/srv/mirror"
    })"));
    MirrorConfig mc = MirrorConfig::from_config(cfg);
    EXPECT_EQ(10u, mc.min_document_size);
    EXPECT_EQ("<main", mc.script_marker);
    EXPECT_EQ("/opt/chrome", mc.browser_path);
    EXPECT_EQ(60000, mc.render_timeout_ms);
    EXPECT_EQ(2u, mc.fetch_workers);
    EXPECT_EQ("/srv/mirror", mc.output_dir);
}
