#pragma once
#ifndef TESTSIEVE_MODULE_H
#define TESTSIEVE_MODULE_H

#include <string>
#include <string_view>
#include <vector>
#include <set>
#include <cstdint>
#include "fingerprint/block.h"

namespace testsieve {

inline constexpr const char* SOURCE_EXTENSION = ".py";

bool is_source_file(std::string_view filename);

// A source file decomposed into blocks. Files without the source extension
// are a single block covering the whole file.
class Module {
public:
    explicit Module(std::string source, std::string filename = "<string>");

    const std::string& filename() const { return filename_; }
    const std::string& source() const { return source_; }
    const std::vector<Block>& blocks() const { return blocks_; }

    // Empty when the source failed to parse.
    const std::vector<int32_t>& checksums() const { return checksums_; }

    bool parsed() const { return !blocks_.empty(); }

    // Index of the innermost block owning the line, or -1. Line 0 selects
    // the module block.
    int block_for_line(int line) const;

private:
    std::string filename_;
    std::string source_;
    std::vector<Block> blocks_;
    std::vector<int32_t> checksums_;
};

std::vector<int32_t> methods_to_checksums(const std::vector<Block>& blocks);

// Little-endian packed signed 32-bit values.
std::string checksums_to_blob(const std::vector<int32_t>& checksums);

// Empty when the blob length is not a multiple of four.
std::vector<int32_t> blob_to_checksums(std::string_view blob);

// Checksums of the blocks touched by the covered lines, in block order.
// A module that failed to parse yields the checksum of its whole source.
std::vector<int32_t> create_fingerprint(const Module& module, const std::set<int>& covered_lines);

// True when every stored checksum is still present in the module.
bool match_fingerprint(const Module& module, const std::vector<int32_t>& fingerprint);

// Same test over raw checksum lists, for callers holding only persisted data.
bool checksums_match(const std::vector<int32_t>& current, const std::vector<int32_t>& fingerprint);

// Recorded against a newly discovered test's home file. It matches no
// real block, so the test is selected again until it has run once.
int32_t placeholder_checksum();

}  // namespace testsieve

#endif  // TESTSIEVE_MODULE_H
