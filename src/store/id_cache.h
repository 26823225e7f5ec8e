#pragma once
#ifndef TESTSIEVE_ID_CACHE_H
#define TESTSIEVE_ID_CACHE_H

#include <string>
#include <string_view>
#include <list>
#include <unordered_map>
#include <mutex>
#include <optional>
#include <cstdint>
#include <cstddef>

namespace testsieve {

// Bounded LRU of store row ids, keyed by the row's natural key.
class IdCache {
public:
    explicit IdCache(size_t max_entries = 1000);

    // Key for a file_fp row.
    static std::string fingerprint_key(const std::string& filename, const std::string& fsha,
                                       std::string_view checksum_blob);

    std::optional<int64_t> get(const std::string& key);
    void put(const std::string& key, int64_t id);
    void remove(const std::string& key);
    void clear();

    size_t entry_count() const;
    size_t capacity() const { return max_entries_; }
    uint64_t hits() const;
    uint64_t misses() const;

private:
    struct Node {
        std::string key;
        int64_t id = 0;
    };

    size_t max_entries_;
    uint64_t hits_ = 0;
    uint64_t misses_ = 0;

    // front = most recently used, back = least recently used
    std::list<Node> lru_list_;
    std::unordered_map<std::string, std::list<Node>::iterator> lookup_;

    mutable std::mutex mutex_;

    void evict_one();
};

}  // namespace testsieve

#endif  // TESTSIEVE_ID_CACHE_H
