#include <gtest/gtest.h>
#include "fingerprint/block.h"
#include "common/hashing.h"

using namespace testsieve;

namespace {

const char* SIMPLE = R"(import os

def f():
    return 1

def g():
    x = 2
    return x
)";

}  // namespace

// ========== Decomposition ==========

TEST(BlockTest, test_module_and_function_blocks) {
    auto blocks = parse_blocks(SIMPLE);
    ASSERT_EQ(blocks.size(), 3u);

    EXPECT_EQ(blocks[0].name, MODULE_BLOCK_NAME);
    EXPECT_EQ(blocks[0].start, 1);
    EXPECT_EQ(blocks[0].end, 8);

    EXPECT_EQ(blocks[1].name, "f");
    EXPECT_EQ(blocks[1].start, 4);
    EXPECT_EQ(blocks[1].end, 4);

    EXPECT_EQ(blocks[2].name, "g");
    EXPECT_EQ(blocks[2].start, 7);
    EXPECT_EQ(blocks[2].end, 8);
}

TEST(BlockTest, test_module_block_elides_function_bodies) {
    auto blocks = parse_blocks(SIMPLE);
    ASSERT_EQ(blocks.size(), 3u);
    EXPECT_NE(blocks[0].code.find("def f():\n    ...\n"), std::string::npos);
    EXPECT_EQ(blocks[0].code.find("return 1"), std::string::npos);
    EXPECT_EQ(blocks[0].checksum, crc32_signed(blocks[0].code));
}

TEST(BlockTest, test_methods_inside_class_are_blocks) {
    auto blocks = parse_blocks("class A:\n    def m(self):\n        return 1\n");
    ASSERT_EQ(blocks.size(), 2u);
    EXPECT_EQ(blocks[1].name, "m");
    EXPECT_EQ(blocks[1].start, 3);
    EXPECT_EQ(blocks[1].end, 3);
}

TEST(BlockTest, test_nested_functions) {
    auto blocks = parse_blocks("def outer():\n    def inner():\n        return 1\n    return inner\n");
    ASSERT_EQ(blocks.size(), 3u);
    EXPECT_EQ(blocks[1].name, "outer");
    EXPECT_EQ(blocks[1].start, 2);
    EXPECT_EQ(blocks[1].end, 4);
    EXPECT_EQ(blocks[2].name, "inner");
    EXPECT_EQ(blocks[2].start, 3);
    EXPECT_EQ(blocks[2].end, 3);
    EXPECT_EQ(blocks[1].code.find("return 1"), std::string::npos);
}

TEST(BlockTest, test_async_def_is_a_block) {
    auto blocks = parse_blocks("async def fetch():\n    await go()\n");
    ASSERT_EQ(blocks.size(), 2u);
    EXPECT_EQ(blocks[1].name, "fetch");
}

TEST(BlockTest, test_one_line_def_is_not_a_block) {
    auto blocks = parse_blocks("def f(): return 1\n");
    ASSERT_EQ(blocks.size(), 1u);
    EXPECT_EQ(blocks[0].name, MODULE_BLOCK_NAME);
}

TEST(BlockTest, test_multiline_signature) {
    auto blocks = parse_blocks("def f(a,\n      b):\n    return a + b\n");
    ASSERT_EQ(blocks.size(), 2u);
    EXPECT_EQ(blocks[1].start, 3);
    EXPECT_EQ(blocks[1].end, 3);
}

TEST(BlockTest, test_empty_source_has_module_block) {
    auto blocks = parse_blocks("");
    ASSERT_EQ(blocks.size(), 1u);
    EXPECT_EQ(blocks[0].start, 1);
    EXPECT_EQ(blocks[0].end, 1);
}

// ========== Checksum stability ==========

TEST(BlockTest, test_body_change_only_affects_its_block) {
    std::string changed = SIMPLE;
    changed.replace(changed.find("return 1"), 8, "return 3");
    auto before = parse_blocks(SIMPLE);
    auto after = parse_blocks(changed);
    ASSERT_EQ(before.size(), after.size());
    EXPECT_EQ(before[0].checksum, after[0].checksum);
    EXPECT_NE(before[1].checksum, after[1].checksum);
    EXPECT_EQ(before[2].checksum, after[2].checksum);
}

TEST(BlockTest, test_comment_lines_do_not_change_checksum) {
    auto before = parse_blocks("def g():\n    x = 2\n    return x\n");
    auto after = parse_blocks("def g():\n    x = 2\n    # explain\n    return x\n");
    ASSERT_EQ(before.size(), 2u);
    ASSERT_EQ(after.size(), 2u);
    EXPECT_EQ(before[1].checksum, after[1].checksum);
}

TEST(BlockTest, test_string_containing_colon_does_not_open_suite) {
    auto blocks = parse_blocks("x = 'def f():'\ny = 1\n");
    ASSERT_EQ(blocks.size(), 1u);
}

// ========== Syntax errors ==========

TEST(BlockTest, test_unbalanced_bracket_yields_no_blocks) {
    EXPECT_TRUE(parse_blocks("def f(:\n    pass\n").empty());
}

TEST(BlockTest, test_unexpected_indent_yields_no_blocks) {
    EXPECT_TRUE(parse_blocks("x = 1\n    y = 2\n").empty());
}

TEST(BlockTest, test_missing_suite_yields_no_blocks) {
    EXPECT_TRUE(parse_blocks("def f():\n").empty());
}

TEST(BlockTest, test_unterminated_string_yields_no_blocks) {
    EXPECT_TRUE(parse_blocks("x = 'abc\n").empty());
}

// ========== Helpers ==========

TEST(BlockTest, test_whole_file_block) {
    auto blocks = whole_file_block("a,b\n1,2\n");
    ASSERT_EQ(blocks.size(), 1u);
    EXPECT_EQ(blocks[0].start, 1);
    EXPECT_EQ(blocks[0].end, 2);
    EXPECT_EQ(blocks[0].checksum, crc32_signed("a,b\n1,2\n"));
}

TEST(BlockTest, test_strip_comment_lines) {
    EXPECT_EQ(strip_comment_lines("a\n  # c\nb  # kept\n"), "a\nb  # kept\n");
    EXPECT_EQ(strip_comment_lines(""), "");
}
