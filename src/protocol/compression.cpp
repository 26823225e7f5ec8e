#include "protocol/compression.h"
#include "common/errors.h"
#include <zlib.h>
#include <cstdint>

namespace testsieve {

namespace {

// Upper bound on a declared inflated size.
constexpr uint32_t MAX_INFLATED_SIZE = 256u * 1024 * 1024;

}  // namespace

std::string deflate_payload(std::string_view raw) {
    uLongf bound = compressBound(static_cast<uLong>(raw.size()));
    std::string out(4 + bound, '\0');

    uint32_t raw_len = static_cast<uint32_t>(raw.size());
    for (int i = 0; i < 4; ++i) {
        out[i] = static_cast<char>((raw_len >> (8 * i)) & 0xFF);
    }

    int rc = compress2(reinterpret_cast<Bytef*>(&out[4]), &bound,
                       reinterpret_cast<const Bytef*>(raw.data()), static_cast<uLong>(raw.size()),
                       Z_DEFAULT_COMPRESSION);
    if (rc != Z_OK) {
        throw ProtocolError("zlib compress failed with code " + std::to_string(rc));
    }
    out.resize(4 + bound);
    return out;
}

std::string inflate_payload(std::string_view compressed) {
    if (compressed.size() < 4) throw ProtocolError("Compressed payload too short");

    uint32_t raw_len = 0;
    for (int i = 0; i < 4; ++i) {
        raw_len |= static_cast<uint32_t>(static_cast<uint8_t>(compressed[i])) << (8 * i);
    }
    if (raw_len > MAX_INFLATED_SIZE) throw ProtocolError("Compressed payload declares oversized body");

    if (raw_len == 0) return "";

    std::string out(raw_len, '\0');
    uLongf out_len = raw_len;
    int rc = uncompress(reinterpret_cast<Bytef*>(out.data()), &out_len,
                        reinterpret_cast<const Bytef*>(compressed.data() + 4),
                        static_cast<uLong>(compressed.size() - 4));
    if (rc != Z_OK || out_len != raw_len) {
        throw ProtocolError("zlib uncompress failed with code " + std::to_string(rc));
    }
    return out;
}

}  // namespace testsieve
