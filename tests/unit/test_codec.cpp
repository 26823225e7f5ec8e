#include <gtest/gtest.h>
#include "protocol/codec.h"
#include "protocol/compression.h"

using namespace testsieve;

// ========== Byte layout ==========

TEST(CodecTest, test_integers_are_little_endian) {
    ByteWriter w;
    w.u32(0x01020304);
    EXPECT_EQ(w.str(), std::string("\x04\x03\x02\x01", 4));
}

TEST(CodecTest, test_string_is_length_prefixed) {
    auto payload = wire::encode(std::string("abc"));
    EXPECT_EQ(payload, std::string("\x03\x00\x00\x00" "abc", 7));
}

TEST(CodecTest, test_optional_carries_presence_byte) {
    EXPECT_EQ(wire::encode(std::optional<int32_t>()), std::string("\x00", 1));
    EXPECT_EQ(wire::encode(std::optional<int32_t>(7)).size(), 5u);
}

// ========== Store payloads ==========

TEST(CodecTest, test_test_records_survive_the_wire) {
    TestRecords records;
    TestRecord& record = records["tests/test_a.py::test_one"];
    record.duration = 0.25;
    record.failed = true;
    record.forced = false;
    record.fingerprints.push_back({"src/a.py", "abc123", 1700000000, {1, -2, 3}});
    record.file_deps.insert({"data/input.json", "deadbeef"});
    record.external_deps.insert("numpy");

    auto [decoded] = wire::decode<TestRecords>(wire::encode(records));
    ASSERT_EQ(decoded.size(), 1u);
    const TestRecord& out = decoded.at("tests/test_a.py::test_one");
    EXPECT_DOUBLE_EQ(out.duration, 0.25);
    EXPECT_TRUE(out.failed);
    ASSERT_TRUE(out.forced.has_value());
    EXPECT_FALSE(*out.forced);
    ASSERT_EQ(out.fingerprints.size(), 1u);
    EXPECT_EQ(out.fingerprints[0].filename, "src/a.py");
    EXPECT_EQ(out.fingerprints[0].mtime, 1700000000);
    EXPECT_EQ(out.fingerprints[0].checksums, (std::vector<int32_t>{1, -2, 3}));
    EXPECT_EQ(out.file_deps.begin()->sha, "deadbeef");
    EXPECT_EQ(out.external_deps, (std::set<std::string>{"numpy"}));
}

TEST(CodecTest, test_file_checksums_keep_missing_files) {
    FileChecksums checksums;
    checksums["gone.py"] = std::nullopt;
    checksums["kept.py"] = std::vector<int32_t>{5};

    auto [decoded] = wire::decode<FileChecksums>(wire::encode(checksums));
    EXPECT_FALSE(decoded.at("gone.py").has_value());
    EXPECT_EQ(decoded.at("kept.py"), (std::vector<int32_t>{5}));
}

TEST(CodecTest, test_multiple_arguments_decode_in_order) {
    auto payload = wire::encode(std::string("env"), int64_t{42}, true);
    auto [name, id, flag] = wire::decode<std::string, int64_t, bool>(payload);
    EXPECT_EQ(name, "env");
    EXPECT_EQ(id, 42);
    EXPECT_TRUE(flag);
}

// ========== Malformed payloads ==========

TEST(CodecTest, test_truncated_payload_throws) {
    auto payload = wire::encode(std::string("abcdef"));
    payload.resize(payload.size() - 2);
    EXPECT_THROW(wire::decode<std::string>(payload), ProtocolError);
}

TEST(CodecTest, test_trailing_bytes_throw) {
    auto payload = wire::encode(int64_t{1}) + "x";
    EXPECT_THROW(wire::decode<int64_t>(payload), ProtocolError);
}

TEST(CodecTest, test_huge_declared_length_throws) {
    std::string payload("\xff\xff\xff\x7f", 4);
    EXPECT_THROW(wire::decode<std::vector<std::string>>(payload), ProtocolError);
}

// ========== Compression ==========

TEST(CodecTest, test_deflate_inflate) {
    std::string raw(10000, 'a');
    auto compressed = deflate_payload(raw);
    EXPECT_LT(compressed.size(), raw.size());
    EXPECT_EQ(inflate_payload(compressed), raw);
}

TEST(CodecTest, test_inflate_rejects_garbage) {
    EXPECT_THROW(inflate_payload("ab"), ProtocolError);
    EXPECT_THROW(inflate_payload(std::string("\x10\x00\x00\x00garbage", 11)), ProtocolError);
}
