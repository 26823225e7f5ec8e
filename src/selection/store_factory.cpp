#include "selection/store_factory.h"
#include "client/remote_store.h"
#include "common/errors.h"
#include "store/sqlite_store.h"
#include <spdlog/spdlog.h>

namespace testsieve {

std::filesystem::path data_file_path(const Config& config, const std::filesystem::path& root) {
    std::filesystem::path path(config.data_file);
    if (path.is_relative()) path = root / path;
    return path;
}

std::unique_ptr<FingerprintStore> open_embedded_store(const Config& config, const std::filesystem::path& root) {
    auto path = data_file_path(config, root);
    try {
        auto store = std::make_unique<SqliteStore>(path.string());
        spdlog::info("Using embedded store {}", path.string());
        return store;
    } catch (const StoreConfigError&) {
        throw;
    } catch (const StoreError& e) {
        throw StoreConfigError("Cannot open " + path.string() + ": " + e.what());
    }
}

std::unique_ptr<FingerprintStore> open_store(const Config& config, const std::filesystem::path& root) {
    if (config.network_store_configured()) {
        auto store = std::make_unique<RemoteStore>(RemoteStore::options_from(config));
        spdlog::info("Using {}", store->describe());
        return store;
    }
    if (config.net_enabled) {
        spdlog::warn("Network store is not fully configured, using the embedded store");
    }
    return open_embedded_store(config, root);
}

StoreFactory embedded_store_factory(const Config& config, const std::filesystem::path& root) {
    return [config, root]() { return open_embedded_store(config, root); };
}

}  // namespace testsieve
