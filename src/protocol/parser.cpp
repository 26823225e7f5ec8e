#include "protocol/parser.h"
#include "common/errors.h"
#include "protocol/codec.h"
#include "protocol/compression.h"
#include <cstring>

namespace testsieve {

namespace {

constexpr size_t MAGIC_LEN = 4;

// Reads a length-prefixed string: <4-byte-length><data>. Returns false when
// the buffer ends first.
bool read_bulk_string(const uint8_t* data, size_t available, size_t& offset, std::string& out) {
    if (offset + 4 > available) return false;
    uint32_t len = 0;
    for (int i = 0; i < 4; ++i) {
        len |= static_cast<uint32_t>(data[offset + i]) << (8 * i);
    }
    if (len > MAX_PAYLOAD_SIZE) {
        throw ProtocolError("Field length " + std::to_string(len) + " exceeds limit");
    }
    offset += 4;
    if (offset + len > available) return false;
    out.assign(reinterpret_cast<const char*>(data + offset), len);
    offset += len;
    return true;
}

bool read_u64(const uint8_t* data, size_t available, size_t& offset, uint64_t& out) {
    if (offset + 8 > available) return false;
    out = 0;
    for (int i = 0; i < 8; ++i) {
        out |= static_cast<uint64_t>(data[offset + i]) << (8 * i);
    }
    offset += 8;
    return true;
}

std::string encode_payload(const std::string& payload, uint8_t& flags) {
    if (payload.size() > COMPRESSION_THRESHOLD) {
        flags |= FLAG_COMPRESSED;
        return deflate_payload(payload);
    }
    return payload;
}

std::string decode_payload(std::string payload, uint8_t flags) {
    if (flags & FLAG_COMPRESSED) return inflate_payload(payload);
    return payload;
}

}  // namespace

std::optional<Request> Parser::parse_request(const uint8_t* data, size_t length, size_t& consumed) {
    if (!data || length < MAGIC_LEN) return std::nullopt;
    if (std::memcmp(data, FRAME_MAGIC, MAGIC_LEN) != 0) {
        throw ProtocolError("Bad frame magic");
    }

    size_t offset = MAGIC_LEN;
    if (offset + 1 > length) return std::nullopt;
    uint8_t flags = data[offset++];

    Request request;
    uint64_t exec_id = 0;
    std::string payload;
    if (!read_bulk_string(data, length, offset, request.op)) return std::nullopt;
    if (!read_u64(data, length, offset, exec_id)) return std::nullopt;
    if (!read_bulk_string(data, length, offset, request.repo)) return std::nullopt;
    if (!read_bulk_string(data, length, offset, request.job)) return std::nullopt;
    if (!read_bulk_string(data, length, offset, request.token)) return std::nullopt;
    if (!read_bulk_string(data, length, offset, payload)) return std::nullopt;

    request.exec_id = static_cast<int64_t>(exec_id);
    request.payload = decode_payload(std::move(payload), flags);
    consumed = offset;
    return request;
}

std::optional<Response> Parser::parse_response(const uint8_t* data, size_t length, size_t& consumed) {
    if (!data || length < 2) return std::nullopt;
    uint8_t status = data[0];
    if (status > static_cast<uint8_t>(Status::ServerError)) {
        throw ProtocolError("Unknown response status " + std::to_string(status));
    }
    uint8_t flags = data[1];

    size_t offset = 2;
    std::string payload;
    if (!read_bulk_string(data, length, offset, payload)) return std::nullopt;

    Response response;
    response.status = static_cast<Status>(status);
    response.payload = decode_payload(std::move(payload), flags);
    consumed = offset;
    return response;
}

std::string Parser::serialize_request(const Request& request) {
    uint8_t flags = 0;
    std::string payload = encode_payload(request.payload, flags);

    ByteWriter w;
    w.raw(std::string_view(FRAME_MAGIC, MAGIC_LEN));
    w.u8(flags);
    w.bytes(request.op);
    w.u64(static_cast<uint64_t>(request.exec_id));
    w.bytes(request.repo);
    w.bytes(request.job);
    w.bytes(request.token);
    w.bytes(payload);
    return w.take();
}

std::string Parser::serialize_response(const Response& response) {
    uint8_t flags = 0;
    std::string payload = encode_payload(response.payload, flags);

    ByteWriter w;
    w.u8(static_cast<uint8_t>(response.status));
    w.u8(flags);
    w.bytes(payload);
    return w.take();
}

std::string Parser::serialize_ok(std::string payload) {
    return serialize_response({Status::Ok, std::move(payload)});
}

std::string Parser::serialize_error(Status status, const std::string& message) {
    return serialize_response({status, message});
}

}  // namespace testsieve
