#pragma once
#ifndef TESTSIEVE_STORE_FACTORY_H
#define TESTSIEVE_STORE_FACTORY_H

#include <filesystem>
#include <functional>
#include <memory>
#include "config/config.h"
#include "store/fingerprint_store.h"

namespace testsieve {

using StoreFactory = std::function<std::unique_ptr<FingerprintStore>()>;

// Data file location: config.data_file, relative to the project root
// unless absolute.
std::filesystem::path data_file_path(const Config& config, const std::filesystem::path& root);

// Throws StoreConfigError when the file cannot be opened.
std::unique_ptr<FingerprintStore> open_embedded_store(const Config& config, const std::filesystem::path& root);

// Network store when fully configured, embedded store otherwise.
std::unique_ptr<FingerprintStore> open_store(const Config& config, const std::filesystem::path& root);

StoreFactory embedded_store_factory(const Config& config, const std::filesystem::path& root);

}  // namespace testsieve

#endif  // TESTSIEVE_STORE_FACTORY_H
