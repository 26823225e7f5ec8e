#pragma once
#ifndef TESTSIEVE_BLOCK_H
#define TESTSIEVE_BLOCK_H

#include <string>
#include <vector>
#include <cstdint>

namespace testsieve {

// A non-overlapping, checksummed region of a module. Line numbers are
// 1-based and inclusive.
struct Block {
    std::string name;
    int start = 0;
    int end = 0;
    std::string code;
    int32_t checksum = 0;
};

inline constexpr const char* MODULE_BLOCK_NAME = "<module>";

// Block decomposition of indentation-scoped source. A syntax error yields
// an empty vector.
std::vector<Block> parse_blocks(const std::string& source);

// Whole file as one block, for files that are not parsed.
std::vector<Block> whole_file_block(const std::string& source);

// Drops lines whose first non-whitespace character starts a comment.
std::string strip_comment_lines(const std::string& text);

}  // namespace testsieve

#endif  // TESTSIEVE_BLOCK_H
