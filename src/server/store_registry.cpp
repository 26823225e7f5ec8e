#include "server/store_registry.h"
#include <spdlog/spdlog.h>
#include <cctype>
#include <filesystem>

namespace testsieve {

namespace {

std::string sanitize_component(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.') {
            out.push_back(c);
        } else {
            out.push_back('_');
        }
    }
    if (out.empty() || out == "." || out == "..") out = "_" + out;
    return out;
}

}  // namespace

StoreRegistry::StoreRegistry(std::string data_dir)
    : data_dir_(std::move(data_dir)) {}

StoreRegistry::~StoreRegistry() {
    close_all();
}

std::string StoreRegistry::path_for(const std::string& repo, const std::string& job) const {
    return (std::filesystem::path(data_dir_) / sanitize_component(repo) /
            (sanitize_component(job) + ".db")).string();
}

std::shared_ptr<SqliteStore> StoreRegistry::get(const std::string& repo, const std::string& job) {
    std::lock_guard lock(mutex_);
    auto key = std::make_pair(repo, job);
    auto it = stores_.find(key);
    if (it != stores_.end()) return it->second;

    auto store = std::make_shared<SqliteStore>(path_for(repo, job));
    stores_.emplace(key, store);
    spdlog::info("Opened store for {}/{} at {}", repo, job, store->path());
    return store;
}

size_t StoreRegistry::open_count() const {
    std::lock_guard lock(mutex_);
    return stores_.size();
}

void StoreRegistry::close_all() {
    std::lock_guard lock(mutex_);
    for (auto& [key, store] : stores_) {
        store->close();
    }
    stores_.clear();
}

}  // namespace testsieve
