#include "test_support.hpp"

#include <sitemirror/core/utils.hpp>
#include <sitemirror/core/logger.hpp>

#include <gtest/gtest.h>
#include <unistd.h>

using namespace sitemirror;
using sitemirror::testing::ScratchDir;

TEST(UtilsTest, JoinPathHandlesSlashes) {
    EXPECT_EQ("a/b", join_path("a", "b"));
    EXPECT_EQ("a/b", join_path("a/", "b"));
    EXPECT_EQ("a/b", join_path("a/", "/b"));
    EXPECT_EQ("b", join_path("", "b"));
}

TEST(UtilsTest, BasenameAndDirname) {
    EXPECT_EQ("c.css", sitemirror::basename(std::string("/a/b/c.css")));
    EXPECT_EQ("", sitemirror::basename(std::string("/a/b/")));
    EXPECT_EQ("/a/b", sitemirror::dirname(std::string("/a/b/c.css")));
    EXPECT_EQ(".", sitemirror::dirname(std::string("file")));
}

TEST(UtilsTest, AbsolutePathKeepsAbsoluteInput) {
    EXPECT_EQ("/tmp/x", absolute_path("/tmp/x"));
    std::string rel = absolute_path("out/site");
    ASSERT_FALSE(rel.empty());
    EXPECT_EQ('/', rel[0]);
    char cwd[4096];
    ASSERT_TRUE(getcwd(cwd, sizeof(cwd)) != NULL);
    EXPECT_EQ(std::string(cwd) + "/out/site", rel);
}

TEST(UtilsTest, MkdirPIsIdempotent) {
    ScratchDir dir;
    std::string nested = dir.file("a/b/c");
    EXPECT_TRUE(mkdir_p(nested));
    EXPECT_TRUE(mkdir_p(nested));
    EXPECT_TRUE(is_directory(nested));
}

TEST(UtilsTest, MkdirPFailsOverRegularFile) {
    ScratchDir dir;
    ASSERT_TRUE(write_file(dir.file("blocker"), "x"));
    EXPECT_FALSE(mkdir_p(dir.file("blocker/child")));
}

TEST(UtilsTest, ListFilesRecursiveIsSortedAndRelative) {
    ScratchDir dir;
    ASSERT_TRUE(mkdir_p(dir.file("assets/css")));
    ASSERT_TRUE(write_file(dir.file("index.html"), "<html></html>"));
    ASSERT_TRUE(write_file(dir.file("assets/css/site.css"), "body{}"));
    ASSERT_TRUE(mkdir_p(dir.file("assets/empty")));

    std::vector<std::string> files = list_files_recursive(dir.path());
    ASSERT_EQ(2u, files.size());
    EXPECT_EQ("assets/css/site.css", files[0]);
    EXPECT_EQ("index.html", files[1]);
}

TEST(UtilsTest, CopyFileIsByteIdenticalIncludingEmpty) {
    ScratchDir dir;
    std::string binary("\x00\x01\xff\n\r", 5);
    ASSERT_TRUE(write_file(dir.file("src.bin"), binary));
    ASSERT_TRUE(write_file(dir.file("empty"), ""));

    EXPECT_TRUE(copy_file(dir.file("src.bin"), dir.file("dst.bin")));
    EXPECT_TRUE(copy_file(dir.file("empty"), dir.file("empty.copy")));

    std::string out;
    ASSERT_TRUE(read_file(dir.file("dst.bin"), out));
    EXPECT_EQ(binary, out);
    ASSERT_TRUE(read_file(dir.file("empty.copy"), out));
    EXPECT_TRUE(out.empty());
}

TEST(UtilsTest, RemoveTreeDeletesEverything) {
    ScratchDir dir;
    ASSERT_TRUE(mkdir_p(dir.file("t/a/b")));
    ASSERT_TRUE(write_file(dir.file("t/a/b/f"), "1"));
    EXPECT_TRUE(remove_tree(dir.file("t")));
    EXPECT_FALSE(path_exists(dir.file("t")));
    EXPECT_TRUE(remove_tree(dir.file("t")));
}

TEST(UtilsTest, Sha256OfKnownInput) {
    EXPECT_EQ("ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad", sha256_hex("abc"));
}

TEST(UtilsTest, FindExecutableSearchesPath) {
    EXPECT_FALSE(find_executable("sh").empty());
    EXPECT_TRUE(find_executable("definitely-not-a-real-binary-name").empty());
}

TEST(LoggerTest, ParseLogLevel) {
    EXPECT_EQ(LogLevel::DEBUG, parse_log_level("debug"));
    EXPECT_EQ(LogLevel::WARN, parse_log_level("WARN"));
    EXPECT_EQ(LogLevel::WARN, parse_log_level("warning"));
    EXPECT_EQ(LogLevel::ERROR, parse_log_level("error"));
    EXPECT_EQ(LogLevel::INFO, parse_log_level("verbose"));
}
