#include "store/id_cache.h"

namespace testsieve {

IdCache::IdCache(size_t max_entries)
    : max_entries_(max_entries == 0 ? 1 : max_entries) {}

std::string IdCache::fingerprint_key(const std::string& filename, const std::string& fsha,
                                     std::string_view checksum_blob) {
    std::string key;
    key.reserve(filename.size() + fsha.size() + checksum_blob.size() + 2);
    key += filename;
    key += '\0';
    key += fsha;
    key += '\0';
    key += checksum_blob;
    return key;
}

std::optional<int64_t> IdCache::get(const std::string& key) {
    std::lock_guard lock(mutex_);
    auto it = lookup_.find(key);
    if (it == lookup_.end()) {
        ++misses_;
        return std::nullopt;
    }
    ++hits_;
    lru_list_.splice(lru_list_.begin(), lru_list_, it->second);
    return it->second->id;
}

void IdCache::put(const std::string& key, int64_t id) {
    std::lock_guard lock(mutex_);
    auto it = lookup_.find(key);
    if (it != lookup_.end()) {
        it->second->id = id;
        lru_list_.splice(lru_list_.begin(), lru_list_, it->second);
        return;
    }

    while (lru_list_.size() >= max_entries_) {
        evict_one();
    }
    lru_list_.push_front({key, id});
    lookup_[key] = lru_list_.begin();
}

void IdCache::remove(const std::string& key) {
    std::lock_guard lock(mutex_);
    auto it = lookup_.find(key);
    if (it != lookup_.end()) {
        lru_list_.erase(it->second);
        lookup_.erase(it);
    }
}

void IdCache::clear() {
    std::lock_guard lock(mutex_);
    lru_list_.clear();
    lookup_.clear();
}

void IdCache::evict_one() {
    // Caller holds the lock
    if (lru_list_.empty()) return;
    lookup_.erase(lru_list_.back().key);
    lru_list_.pop_back();
}

size_t IdCache::entry_count() const {
    std::lock_guard lock(mutex_);
    return lru_list_.size();
}

uint64_t IdCache::hits() const {
    std::lock_guard lock(mutex_);
    return hits_;
}

uint64_t IdCache::misses() const {
    std::lock_guard lock(mutex_);
    return misses_;
}

}  // namespace testsieve
