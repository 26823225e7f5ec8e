#pragma once
#ifndef TESTSIEVE_CODEC_H
#define TESTSIEVE_CODEC_H

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>
#include "common/errors.h"
#include "store/types.h"

namespace testsieve {

// Little-endian binary encoding of store payloads. Strings and containers
// carry a 4-byte length prefix.
class ByteWriter {
public:
    void u8(uint8_t value) { out_.push_back(static_cast<char>(value)); }
    void u32(uint32_t value) { put_le(value, 4); }
    void u64(uint64_t value) { put_le(value, 8); }
    void bytes(std::string_view value) {
        u32(static_cast<uint32_t>(value.size()));
        out_.append(value.data(), value.size());
    }
    void raw(std::string_view value) { out_.append(value.data(), value.size()); }

    const std::string& str() const { return out_; }
    std::string take() { return std::move(out_); }

private:
    std::string out_;

    void put_le(uint64_t value, int width) {
        for (int i = 0; i < width; ++i) {
            out_.push_back(static_cast<char>((value >> (8 * i)) & 0xFF));
        }
    }
};

class ByteReader {
public:
    explicit ByteReader(std::string_view data) : data_(data) {}

    uint8_t u8() {
        require(1);
        return static_cast<uint8_t>(data_[offset_++]);
    }
    uint32_t u32() { return static_cast<uint32_t>(get_le(4)); }
    uint64_t u64() { return get_le(8); }
    std::string bytes() {
        uint32_t len = u32();
        require(len);
        std::string value(data_.substr(offset_, len));
        offset_ += len;
        return value;
    }
    std::string_view raw(size_t len) {
        require(len);
        std::string_view value = data_.substr(offset_, len);
        offset_ += len;
        return value;
    }

    size_t offset() const { return offset_; }
    size_t remaining() const { return data_.size() - offset_; }

private:
    std::string_view data_;
    size_t offset_ = 0;

    void require(size_t len) const {
        if (len > data_.size() - offset_) {
            throw ProtocolError("Truncated payload at offset " + std::to_string(offset_));
        }
    }

    uint64_t get_le(int width) {
        require(static_cast<size_t>(width));
        uint64_t value = 0;
        for (int i = 0; i < width; ++i) {
            value |= static_cast<uint64_t>(static_cast<uint8_t>(data_[offset_ + i])) << (8 * i);
        }
        offset_ += width;
        return value;
    }
};

namespace wire {

void write(ByteWriter& w, bool value);
void write(ByteWriter& w, int32_t value);
void write(ByteWriter& w, int64_t value);
void write(ByteWriter& w, double value);
void write(ByteWriter& w, const std::string& value);
void write(ByteWriter& w, const FileDependency& value);
void write(ByteWriter& w, const FileFingerprint& value);
void write(ByteWriter& w, const TestRecord& value);
void write(ByteWriter& w, const TestExecutionInfo& value);
void write(ByteWriter& w, const InitiateResult& value);
void write(ByteWriter& w, const DetermineResult& value);
void write(ByteWriter& w, const FingerprintRow& value);
void write(ByteWriter& w, const MtimeUpdate& value);
void write(ByteWriter& w, const ChangedFileData& value);
void write(ByteWriter& w, const SavingStats& value);
void write(ByteWriter& w, const RunSummary& value);
void write(ByteWriter& w, const FileTest& value);
void write(ByteWriter& w, const TestDetail& value);
void write(ByteWriter& w, const CodependencyEdge& value);
void write(ByteWriter& w, const FileCoverage& value);
void write(ByteWriter& w, const CoverageQuery& value);
void write(ByteWriter& w, const CoverageAnalysis& value);
void write(ByteWriter& w, const FileTestList& value);
void write(ByteWriter& w, const ImpactEstimate& value);

void read(ByteReader& r, bool& value);
void read(ByteReader& r, int32_t& value);
void read(ByteReader& r, int64_t& value);
void read(ByteReader& r, double& value);
void read(ByteReader& r, std::string& value);
void read(ByteReader& r, FileDependency& value);
void read(ByteReader& r, FileFingerprint& value);
void read(ByteReader& r, TestRecord& value);
void read(ByteReader& r, TestExecutionInfo& value);
void read(ByteReader& r, InitiateResult& value);
void read(ByteReader& r, DetermineResult& value);
void read(ByteReader& r, FingerprintRow& value);
void read(ByteReader& r, MtimeUpdate& value);
void read(ByteReader& r, ChangedFileData& value);
void read(ByteReader& r, SavingStats& value);
void read(ByteReader& r, RunSummary& value);
void read(ByteReader& r, FileTest& value);
void read(ByteReader& r, TestDetail& value);
void read(ByteReader& r, CodependencyEdge& value);
void read(ByteReader& r, FileCoverage& value);
void read(ByteReader& r, CoverageQuery& value);
void read(ByteReader& r, CoverageAnalysis& value);
void read(ByteReader& r, FileTestList& value);
void read(ByteReader& r, ImpactEstimate& value);

template <typename T> void write(ByteWriter& w, const std::optional<T>& value);
template <typename T> void write(ByteWriter& w, const std::vector<T>& values);
template <typename T> void write(ByteWriter& w, const std::set<T>& values);
template <typename K, typename V> void write(ByteWriter& w, const std::map<K, V>& values);
template <typename T> void read(ByteReader& r, std::optional<T>& value);
template <typename T> void read(ByteReader& r, std::vector<T>& values);
template <typename T> void read(ByteReader& r, std::set<T>& values);
template <typename K, typename V> void read(ByteReader& r, std::map<K, V>& values);

template <typename T>
void write(ByteWriter& w, const std::optional<T>& value) {
    w.u8(value ? 1 : 0);
    if (value) write(w, *value);
}

template <typename T>
void write(ByteWriter& w, const std::vector<T>& values) {
    w.u32(static_cast<uint32_t>(values.size()));
    for (const auto& value : values) write(w, value);
}

template <typename T>
void write(ByteWriter& w, const std::set<T>& values) {
    w.u32(static_cast<uint32_t>(values.size()));
    for (const auto& value : values) write(w, value);
}

template <typename K, typename V>
void write(ByteWriter& w, const std::map<K, V>& values) {
    w.u32(static_cast<uint32_t>(values.size()));
    for (const auto& [key, value] : values) {
        write(w, key);
        write(w, value);
    }
}

template <typename T>
void read(ByteReader& r, std::optional<T>& value) {
    if (r.u8()) {
        T inner{};
        read(r, inner);
        value = std::move(inner);
    } else {
        value.reset();
    }
}

template <typename T>
void read(ByteReader& r, std::vector<T>& values) {
    uint32_t count = r.u32();
    values.clear();
    for (uint32_t i = 0; i < count; ++i) {
        T value{};
        read(r, value);
        values.push_back(std::move(value));
    }
}

template <typename T>
void read(ByteReader& r, std::set<T>& values) {
    uint32_t count = r.u32();
    values.clear();
    for (uint32_t i = 0; i < count; ++i) {
        T value{};
        read(r, value);
        values.insert(std::move(value));
    }
}

template <typename K, typename V>
void read(ByteReader& r, std::map<K, V>& values) {
    uint32_t count = r.u32();
    values.clear();
    for (uint32_t i = 0; i < count; ++i) {
        K key{};
        V value{};
        read(r, key);
        read(r, value);
        values.emplace(std::move(key), std::move(value));
    }
}

template <typename... Args>
std::string encode(const Args&... args) {
    ByteWriter w;
    (write(w, args), ...);
    return w.take();
}

// Decodes a payload written by encode() with the same argument types.
// Trailing bytes are a protocol error.
template <typename... Args>
std::tuple<Args...> decode(std::string_view payload) {
    ByteReader r(payload);
    std::tuple<Args...> values;
    std::apply([&r](auto&... value) { (read(r, value), ...); }, values);
    if (r.remaining() != 0) {
        throw ProtocolError("Unexpected " + std::to_string(r.remaining()) + " trailing bytes");
    }
    return values;
}

}  // namespace wire

}  // namespace testsieve

#endif  // TESTSIEVE_CODEC_H
