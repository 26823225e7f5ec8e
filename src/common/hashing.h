#pragma once
#ifndef TESTSIEVE_HASHING_H
#define TESTSIEVE_HASHING_H

#include <cstdint>
#include <string>
#include <string_view>

namespace testsieve {

// CRC-32 of the text, reinterpreted as a signed 32-bit value.
int32_t crc32_signed(std::string_view text);

// Git blob hash: SHA-1 over "blob <size>\0<content>", lowercase hex.
std::string git_blob_sha(std::string_view content);

// Plain SHA-1 hex of the content.
std::string sha1_hex(std::string_view content);

// Folds the first 32 bits of a hex SHA into a non-negative checksum.
int32_t file_sha_to_checksum(const std::string& sha);

}  // namespace testsieve

#endif  // TESTSIEVE_HASHING_H
