#pragma once
#ifndef TESTSIEVE_PARSER_H
#define TESTSIEVE_PARSER_H

#include <string>
#include <string_view>
#include <vector>
#include <cstdint>
#include <optional>

namespace testsieve {

// Binary RPC framing for the network store.
// Request:  <magic "TSV1"><flags:1><op_len:4><op><exec_id:8><repo_len:4><repo>
//           <job_len:4><job><token_len:4><token><payload_len:4><payload>
// Response: <status:1><flags:1><payload_len:4><payload>
// Flag bit 0 marks a deflated payload.

inline constexpr char FRAME_MAGIC[] = "TSV1";
inline constexpr uint8_t FLAG_COMPRESSED = 0x01;
// Largest payload accepted on the wire.
inline constexpr uint32_t MAX_PAYLOAD_SIZE = 64u * 1024 * 1024;

enum class Status : uint8_t {
    Ok = 0,
    ClientError = 1,
    ServerError = 2,
};

struct Request {
    std::string op;
    int64_t exec_id = 0;
    std::string repo;
    std::string job;
    std::string token;
    std::string payload;
};

struct Response {
    Status status = Status::Ok;
    std::string payload;
};

class Parser {
public:
    // Parses one complete request from the front of the buffer. Returns
    // nullopt until enough bytes have arrived; consumed is set on success.
    // Throws ProtocolError on a malformed frame.
    static std::optional<Request> parse_request(const uint8_t* data, size_t length, size_t& consumed);

    static std::optional<Response> parse_response(const uint8_t* data, size_t length, size_t& consumed);

    static std::string serialize_request(const Request& request);
    static std::string serialize_response(const Response& response);

    static std::string serialize_ok(std::string payload);
    static std::string serialize_error(Status status, const std::string& message);
};

}  // namespace testsieve

#endif  // TESTSIEVE_PARSER_H
