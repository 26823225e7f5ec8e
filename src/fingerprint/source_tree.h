#pragma once
#ifndef TESTSIEVE_SOURCE_TREE_H
#define TESTSIEVE_SOURCE_TREE_H

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include "fingerprint/module.h"

namespace testsieve {

// Unix modification time in nanoseconds, nullopt when the path cannot be stat'ed.
std::optional<int64_t> stat_mtime_ns(const std::filesystem::path& path);

// Project files addressed by root-relative names, read once per run.
class SourceTree {
public:
    explicit SourceTree(std::filesystem::path root);

    const std::filesystem::path& root() const { return root_; }

    bool exists(const std::string& filename);
    std::optional<std::string> content(const std::string& filename);
    std::optional<std::string> fsha(const std::string& filename);
    // Modification times are Unix nanoseconds.
    std::optional<int64_t> mtime(const std::string& filename);
    // Modification time from a stat call, without reading the file.
    std::optional<int64_t> disk_mtime(const std::string& filename) const;

    // nullptr when the file does not exist
    std::shared_ptr<const Module> module(const std::string& filename);

    // Forget cached contents, e.g. after files were edited.
    void invalidate();
    void invalidate(const std::string& filename);

    size_t cached_count() const;

private:
    struct Entry {
        bool exists = false;
        std::string content;
        std::string fsha;
        int64_t mtime = 0;
        std::shared_ptr<const Module> module;
    };

    std::filesystem::path root_;
    std::unordered_map<std::string, Entry> cache_;
    mutable std::mutex mutex_;

    Entry& load(const std::string& filename);
};

}  // namespace testsieve

#endif  // TESTSIEVE_SOURCE_TREE_H
