#include "common/hashing.h"
#include <openssl/evp.h>
#include <zlib.h>
#include <memory>
#include <stdexcept>

namespace testsieve {

namespace {

std::string to_hex(const unsigned char* data, unsigned int len) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (unsigned int i = 0; i < len; ++i) {
        out += digits[data[i] >> 4];
        out += digits[data[i] & 0x0f];
    }
    return out;
}

std::string sha1_parts(std::string_view header, std::string_view content) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha1(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), header.data(), header.size()) != 1 ||
        EVP_DigestUpdate(ctx.get(), content.data(), content.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
        throw std::runtime_error("SHA-1 digest failed");
    }
    return to_hex(digest, digest_len);
}

}  // namespace

int32_t crc32_signed(std::string_view text) {
    uLong crc = crc32(0L, Z_NULL, 0);
    // zlib takes a uInt length; feed large inputs in chunks
    const auto* data = reinterpret_cast<const Bytef*>(text.data());
    size_t remaining = text.size();
    while (remaining > 0) {
        uInt chunk = remaining > 0x40000000u ? 0x40000000u : static_cast<uInt>(remaining);
        crc = crc32(crc, data, chunk);
        data += chunk;
        remaining -= chunk;
    }
    return static_cast<int32_t>(static_cast<uint32_t>(crc));
}

std::string git_blob_sha(std::string_view content) {
    std::string header = "blob " + std::to_string(content.size());
    header.push_back('\0');
    return sha1_parts(header, content);
}

std::string sha1_hex(std::string_view content) {
    return sha1_parts(std::string_view(), content);
}

int32_t file_sha_to_checksum(const std::string& sha) {
    if (sha.size() < 8) return 0;
    uint32_t value = 0;
    try {
        value = static_cast<uint32_t>(std::stoul(sha.substr(0, 8), nullptr, 16));
    } catch (const std::exception&) {
        return 0;
    }
    return static_cast<int32_t>(value & 0x7FFFFFFFu);
}

}  // namespace testsieve
