#pragma once
#ifndef TESTSIEVE_STORE_REGISTRY_H
#define TESTSIEVE_STORE_REGISTRY_H

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include "store/sqlite_store.h"

namespace testsieve {

// One embedded store per (repo, job), opened on first use under data_dir.
class StoreRegistry {
public:
    explicit StoreRegistry(std::string data_dir);
    ~StoreRegistry();

    std::shared_ptr<SqliteStore> get(const std::string& repo, const std::string& job);

    // <data_dir>/<repo>/<job>.db with unsafe characters replaced.
    std::string path_for(const std::string& repo, const std::string& job) const;

    size_t open_count() const;
    void close_all();

private:
    std::string data_dir_;
    std::map<std::pair<std::string, std::string>, std::shared_ptr<SqliteStore>> stores_;
    mutable std::mutex mutex_;
};

}  // namespace testsieve

#endif  // TESTSIEVE_STORE_REGISTRY_H
