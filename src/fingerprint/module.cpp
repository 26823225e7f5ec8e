#include "fingerprint/module.h"
#include "common/hashing.h"
#include <unordered_set>

namespace testsieve {

bool is_source_file(std::string_view filename) {
    std::string_view ext(SOURCE_EXTENSION);
    return filename.size() >= ext.size() &&
           filename.compare(filename.size() - ext.size(), ext.size(), ext) == 0;
}

Module::Module(std::string source, std::string filename)
    : filename_(std::move(filename)),
      source_(std::move(source)) {
    if (filename_ == "<string>" || is_source_file(filename_)) {
        blocks_ = parse_blocks(source_);
    } else {
        blocks_ = whole_file_block(source_);
    }
    checksums_ = methods_to_checksums(blocks_);
}

int Module::block_for_line(int line) const {
    if (blocks_.empty()) return -1;
    if (line <= 0) return 0;

    // Blocks after the module block are in source order and nested blocks
    // follow their parent, so the last containing block is the innermost.
    int found = -1;
    for (size_t i = 1; i < blocks_.size(); ++i) {
        if (blocks_[i].start > line) break;
        if (line <= blocks_[i].end) found = static_cast<int>(i);
    }
    if (found >= 0) return found;
    return line <= blocks_[0].end ? 0 : -1;
}

std::vector<int32_t> methods_to_checksums(const std::vector<Block>& blocks) {
    std::vector<int32_t> checksums;
    checksums.reserve(blocks.size());
    for (const auto& block : blocks) {
        checksums.push_back(block.checksum);
    }
    return checksums;
}

std::string checksums_to_blob(const std::vector<int32_t>& checksums) {
    std::string blob;
    blob.reserve(checksums.size() * 4);
    for (int32_t value : checksums) {
        uint32_t bits = static_cast<uint32_t>(value);
        for (int shift = 0; shift < 32; shift += 8) {
            blob.push_back(static_cast<char>((bits >> shift) & 0xFF));
        }
    }
    return blob;
}

std::vector<int32_t> blob_to_checksums(std::string_view blob) {
    if (blob.size() % 4 != 0) return {};
    std::vector<int32_t> checksums;
    checksums.reserve(blob.size() / 4);
    for (size_t i = 0; i < blob.size(); i += 4) {
        uint32_t bits = 0;
        for (int b = 0; b < 4; ++b) {
            bits |= static_cast<uint32_t>(static_cast<uint8_t>(blob[i + b])) << (8 * b);
        }
        checksums.push_back(static_cast<int32_t>(bits));
    }
    return checksums;
}

std::vector<int32_t> create_fingerprint(const Module& module, const std::set<int>& covered_lines) {
    // Unparsed sources are pinned to their exact text.
    if (!module.parsed()) return {crc32_signed(module.source())};

    const auto& blocks = module.blocks();
    std::vector<bool> touched(blocks.size(), false);
    for (int line : covered_lines) {
        int idx = module.block_for_line(line);
        if (idx >= 0) touched[idx] = true;
    }

    std::vector<int32_t> fingerprint;
    for (size_t i = 0; i < blocks.size(); ++i) {
        if (touched[i]) fingerprint.push_back(blocks[i].checksum);
    }
    return fingerprint;
}

bool checksums_match(const std::vector<int32_t>& current, const std::vector<int32_t>& fingerprint) {
    std::unordered_set<int32_t> available(current.begin(), current.end());
    for (int32_t checksum : fingerprint) {
        if (!available.count(checksum)) return false;
    }
    return true;
}

bool match_fingerprint(const Module& module, const std::vector<int32_t>& fingerprint) {
    return checksums_match(module.checksums(), fingerprint);
}

int32_t placeholder_checksum() {
    static const int32_t value = crc32_signed("0match");
    return value;
}

}  // namespace testsieve
