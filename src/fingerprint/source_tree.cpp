#include "fingerprint/source_tree.h"
#include "common/hashing.h"
#include <spdlog/spdlog.h>
#include <sys/stat.h>
#include <fstream>
#include <sstream>

namespace testsieve {

std::optional<int64_t> stat_mtime_ns(const std::filesystem::path& path) {
    struct stat info;
    if (::stat(path.c_str(), &info) != 0) return std::nullopt;
    return static_cast<int64_t>(info.st_mtim.tv_sec) * 1000000000LL + info.st_mtim.tv_nsec;
}

SourceTree::SourceTree(std::filesystem::path root)
    : root_(std::move(root)) {}

SourceTree::Entry& SourceTree::load(const std::string& filename) {
    auto it = cache_.find(filename);
    if (it != cache_.end()) return it->second;

    Entry entry;
    std::filesystem::path path = root_ / filename;
    std::error_code ec;
    if (std::filesystem::is_regular_file(path, ec)) {
        std::ifstream in(path, std::ios::binary);
        if (in) {
            std::ostringstream ss;
            ss << in.rdbuf();
            entry.exists = true;
            entry.content = ss.str();
            entry.fsha = git_blob_sha(entry.content);
            entry.mtime = stat_mtime_ns(path).value_or(0);
        } else {
            spdlog::warn("Cannot read {}", path.string());
        }
    }
    return cache_.emplace(filename, std::move(entry)).first->second;
}

bool SourceTree::exists(const std::string& filename) {
    std::lock_guard lock(mutex_);
    return load(filename).exists;
}

std::optional<std::string> SourceTree::content(const std::string& filename) {
    std::lock_guard lock(mutex_);
    Entry& entry = load(filename);
    if (!entry.exists) return std::nullopt;
    return entry.content;
}

std::optional<std::string> SourceTree::fsha(const std::string& filename) {
    std::lock_guard lock(mutex_);
    Entry& entry = load(filename);
    if (!entry.exists) return std::nullopt;
    return entry.fsha;
}

std::optional<int64_t> SourceTree::mtime(const std::string& filename) {
    std::lock_guard lock(mutex_);
    Entry& entry = load(filename);
    if (!entry.exists) return std::nullopt;
    return entry.mtime;
}

std::optional<int64_t> SourceTree::disk_mtime(const std::string& filename) const {
    {
        std::lock_guard lock(mutex_);
        auto it = cache_.find(filename);
        if (it != cache_.end()) {
            if (!it->second.exists) return std::nullopt;
            return it->second.mtime;
        }
    }
    return stat_mtime_ns(root_ / filename);
}

std::shared_ptr<const Module> SourceTree::module(const std::string& filename) {
    std::lock_guard lock(mutex_);
    Entry& entry = load(filename);
    if (!entry.exists) return nullptr;
    if (!entry.module) {
        entry.module = std::make_shared<const Module>(entry.content, filename);
    }
    return entry.module;
}

void SourceTree::invalidate() {
    std::lock_guard lock(mutex_);
    cache_.clear();
}

void SourceTree::invalidate(const std::string& filename) {
    std::lock_guard lock(mutex_);
    cache_.erase(filename);
}

size_t SourceTree::cached_count() const {
    std::lock_guard lock(mutex_);
    return cache_.size();
}

}  // namespace testsieve
