#include <gtest/gtest.h>
#include "fingerprint/source_tree.h"
#include "common/hashing.h"
#include <sys/stat.h>
#include <fcntl.h>
#include <filesystem>
#include <fstream>

using namespace testsieve;
namespace fs = std::filesystem;

namespace {

class SourceTreeTest : public ::testing::Test {
protected:
    fs::path root_;

    void SetUp() override {
        root_ = fs::temp_directory_path() /
                ("testsieve_tree_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) + "_" +
                 ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(root_);
        fs::create_directories(root_ / "pkg");
    }

    void TearDown() override { fs::remove_all(root_); }

    void write(const std::string& name, const std::string& content) {
        std::ofstream out(root_ / name, std::ios::binary);
        out << content;
    }

    void set_mtime(const std::string& name, time_t seconds, long nanos) {
        struct timespec times[2] = {{seconds, nanos}, {seconds, nanos}};
        ASSERT_EQ(::utimensat(AT_FDCWD, (root_ / name).c_str(), times, 0), 0);
    }
};

}  // namespace

TEST_F(SourceTreeTest, test_reads_content_and_hash) {
    write("pkg/mod.py", "def f():\n    return 1\n");
    SourceTree tree(root_);
    EXPECT_TRUE(tree.exists("pkg/mod.py"));
    EXPECT_EQ(tree.content("pkg/mod.py"), "def f():\n    return 1\n");
    EXPECT_EQ(tree.fsha("pkg/mod.py"), git_blob_sha("def f():\n    return 1\n"));
}

TEST_F(SourceTreeTest, test_missing_file) {
    SourceTree tree(root_);
    EXPECT_FALSE(tree.exists("nope.py"));
    EXPECT_FALSE(tree.fsha("nope.py").has_value());
    EXPECT_FALSE(tree.mtime("nope.py").has_value());
    EXPECT_FALSE(tree.disk_mtime("nope.py").has_value());
    EXPECT_EQ(tree.module("nope.py"), nullptr);
}

TEST_F(SourceTreeTest, test_directory_is_not_a_file) {
    SourceTree tree(root_);
    EXPECT_FALSE(tree.exists("pkg"));
}

TEST_F(SourceTreeTest, test_module_is_parsed_once) {
    write("pkg/mod.py", "def f():\n    return 1\n");
    SourceTree tree(root_);
    auto first = tree.module("pkg/mod.py");
    auto second = tree.module("pkg/mod.py");
    ASSERT_NE(first, nullptr);
    EXPECT_EQ(first.get(), second.get());
    EXPECT_EQ(first->blocks().size(), 2u);
}

TEST_F(SourceTreeTest, test_contents_are_cached_until_invalidated) {
    write("pkg/mod.py", "x = 1\n");
    SourceTree tree(root_);
    auto before = tree.fsha("pkg/mod.py");
    write("pkg/mod.py", "x = 2\n");
    EXPECT_EQ(tree.fsha("pkg/mod.py"), before);

    tree.invalidate("pkg/mod.py");
    EXPECT_EQ(tree.fsha("pkg/mod.py"), git_blob_sha("x = 2\n"));

    tree.invalidate();
    EXPECT_EQ(tree.cached_count(), 0u);
}

TEST_F(SourceTreeTest, test_mtime_in_unix_nanoseconds) {
    write("data.json", "{}");
    set_mtime("data.json", 1700000000, 123456789);
    int64_t expected = 1700000000123456789LL;

    SourceTree tree(root_);
    EXPECT_EQ(tree.disk_mtime("data.json"), expected);
    EXPECT_EQ(tree.cached_count(), 0u);
    EXPECT_EQ(tree.mtime("data.json"), expected);
    EXPECT_EQ(tree.cached_count(), 1u);
}

TEST_F(SourceTreeTest, test_mtime_distinguishes_writes_within_one_second) {
    write("data.json", "{}");
    set_mtime("data.json", 1700000000, 100000000);
    auto early = stat_mtime_ns(root_ / "data.json");
    set_mtime("data.json", 1700000000, 900000000);
    auto late = stat_mtime_ns(root_ / "data.json");

    ASSERT_TRUE(early.has_value());
    ASSERT_TRUE(late.has_value());
    EXPECT_EQ(*late - *early, 800000000);
    EXPECT_FALSE(stat_mtime_ns(root_ / "missing.json").has_value());
}
