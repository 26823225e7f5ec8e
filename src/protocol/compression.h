#pragma once
#ifndef TESTSIEVE_COMPRESSION_H
#define TESTSIEVE_COMPRESSION_H

#include <cstddef>
#include <string>
#include <string_view>

namespace testsieve {

// Payloads larger than this are sent deflated.
inline constexpr size_t COMPRESSION_THRESHOLD = 1024;

// <raw_len:4><zlib stream>
std::string deflate_payload(std::string_view raw);

// Throws ProtocolError on corrupt input.
std::string inflate_payload(std::string_view compressed);

}  // namespace testsieve

#endif  // TESTSIEVE_COMPRESSION_H
