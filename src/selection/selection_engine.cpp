#include "selection/selection_engine.h"
#include "fingerprint/module.h"
#include "recorder/execution_recorder.h"
#include "store/packages.h"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace testsieve {

const char* phase_name(Phase phase) {
    switch (phase) {
        case Phase::Idle: return "idle";
        case Phase::Init: return "init";
        case Phase::Diff: return "diff";
        case Phase::Determine: return "determine";
        case Phase::Partition: return "partition";
        case Phase::Reconcile: return "reconcile";
        case Phase::Closed: return "closed";
    }
    return "unknown";
}

SelectionOptions SelectionOptions::from_config(const Config& config) {
    SelectionOptions options;
    options.environment = config.environment;
    options.consistency_check = config.consistency_check;
    if (!config.run_id.empty()) options.metadata["run_id"] = config.run_id;
    return options;
}

SelectionEngine::SelectionEngine(std::unique_ptr<FingerprintStore> store, SourceTree& source_tree,
                                 SelectionOptions options, StoreFactory fallback)
    : store_(std::move(store)),
      source_tree_(source_tree),
      options_(std::move(options)),
      fallback_(std::move(fallback)) {}

std::string SelectionEngine::manifest() const {
    return drop_patch_version(options_.packages);
}

void SelectionEngine::initiate() {
    InitiateResult result;
    try {
        result = store_->initiate_execution(options_.environment, manifest(), options_.runtime_version,
                                            options_.metadata);
    } catch (const StoreNetworkError& e) {
        if (!fall_back(e)) throw;
        return;
    } catch (const StoreRejectedError& e) {
        if (!fall_back(e)) throw;
        return;
    }
    apply_initiate(result);
}

void SelectionEngine::apply_initiate(const InitiateResult& result) {
    exec_id_ = result.exec_id;
    packages_changed_ = result.packages_changed;
    changed_packages_ = result.changed_packages;
    files_of_interest_ = result.filenames;
    initiated_ = true;
    phase_ = Phase::Init;

    spdlog::info("Execution {} ({}) on {}", exec_id_, options_.environment, store_->describe());
    if (packages_changed_) {
        spdlog::info("{} packages changed since the last run", changed_packages_.size());
    }
}

bool SelectionEngine::fall_back(const StoreError& error) {
    if (!fallback_ || fell_back_) return false;

    spdlog::error("{}: {} (falling back to the embedded store)", store_->describe(), error.what());
    store_->close();
    store_ = fallback_();
    fell_back_ = true;
    apply_initiate(store_->initiate_execution(options_.environment, manifest(), options_.runtime_version,
                                              options_.metadata));
    return true;
}

std::map<std::string, std::string> SelectionEngine::local_fshas(std::vector<MtimeUpdate>& mtime_updates) {
    std::map<std::string, std::vector<FingerprintRow>> recorded;
    for (auto& row : store_->filenames_fingerprints(exec_id_)) {
        recorded[row.filename].push_back(std::move(row));
    }

    std::map<std::string, std::string> fshas;
    for (const auto& filename : files_of_interest_) {
        auto disk_mtime = source_tree_.disk_mtime(filename);
        if (!disk_mtime) continue;
        const auto& rows = recorded[filename];

        // An unchanged mtime vouches for the recorded content hash.
        auto same_mtime = std::find_if(rows.begin(), rows.end(), [&](const FingerprintRow& row) {
            return !row.fsha.empty() && row.mtime == *disk_mtime;
        });
        if (same_mtime != rows.end()) {
            fshas[filename] = same_mtime->fsha;
            continue;
        }

        auto fsha = source_tree_.fsha(filename);
        if (!fsha) continue;
        fshas[filename] = *fsha;
        for (const auto& row : rows) {
            if (row.fsha == *fsha) mtime_updates.push_back({row.id, *disk_mtime, *fsha});
        }
    }
    return fshas;
}

std::map<std::string, std::string> SelectionEngine::file_dependency_shas() {
    std::map<std::string, std::string> shas;
    for (const auto& filename : store_->file_dependency_filenames(exec_id_)) {
        if (auto sha = source_tree_.fsha(filename)) shas[filename] = *sha;
    }
    return shas;
}

void SelectionEngine::determine_stable() {
    if (!initiated_) initiate();

    while (true) {
        try {
            std::vector<MtimeUpdate> mtime_updates;
            auto fshas = local_fshas(mtime_updates);

            changed_files_ = store_->fetch_unknown_files(exec_id_, fshas);
            phase_ = Phase::Diff;
            spdlog::info("{} files changed", changed_files_.size());
            for (size_t i = 0; i < changed_files_.size() && i < 10; ++i) {
                spdlog::debug("  changed file: {}", changed_files_[i]);
            }
            if (changed_files_.size() > 10) {
                spdlog::debug("  ... and {} more", changed_files_.size() - 10);
            }

            FileChecksums checksums;
            for (const auto& filename : changed_files_) {
                auto module = source_tree_.module(filename);
                if (module) {
                    checksums[filename] = module->checksums();
                } else {
                    checksums[filename] = std::nullopt;
                }
            }

            auto result = store_->determine_tests(exec_id_, checksums, file_dependency_shas(), changed_packages_);
            phase_ = Phase::Determine;
            if (options_.consistency_check) check_consistency(result.affected);

            auto filenames = store_->filenames(exec_id_);
            all_files_ = std::set<std::string>(filenames.begin(), filenames.end());
            partition(result);

            if (!mtime_updates.empty()) store_->update_mtimes(mtime_updates);
            break;
        } catch (const StoreNetworkError& e) {
            if (fall_back(e)) continue;
            spdlog::error("Selection failed, running every test: {}", e.what());
            select_everything();
            break;
        } catch (const StoreRejectedError& e) {
            if (fall_back(e)) continue;
            spdlog::error("Selection failed, running every test: {}", e.what());
            select_everything();
            break;
        } catch (const StoreError& e) {
            spdlog::error("Selection failed, running every test: {}", e.what());
            select_everything();
            break;
        }
    }
    phase_ = Phase::Partition;
}

void SelectionEngine::partition(const DetermineResult& result) {
    unstable_tests_ = result.affected;
    failing_tests_ = result.failing;
    unstable_files_.clear();
    for (const auto& test_name : unstable_tests_) {
        unstable_files_.insert(home_file(test_name));
    }

    stable_tests_.clear();
    for (const auto& [test_name, info] : store_->all_test_executions(exec_id_)) {
        if (!unstable_tests_.count(test_name)) stable_tests_.insert(test_name);
    }

    stable_files_.clear();
    for (const auto& filename : all_files_) {
        if (!unstable_files_.count(filename)) stable_files_.insert(filename);
    }
    select_all_ = false;

    spdlog::info("{} tests to run, {} stable, {} failing", unstable_tests_.size(), stable_tests_.size(),
                 failing_tests_.size());
}

void SelectionEngine::select_everything() {
    select_all_ = true;
    stable_tests_.clear();
    stable_files_.clear();
    unstable_tests_.clear();
    unstable_files_.clear();
    failing_tests_.clear();
}

std::set<std::string> SelectionEngine::deselected_tests() const {
    std::set<std::string> result;
    for (const auto& test_name : stable_tests_) {
        if (!failing_tests_.count(test_name)) result.insert(test_name);
    }
    return result;
}

std::set<std::string> SelectionEngine::deselected_files() const {
    std::set<std::string> failing_files;
    for (const auto& test_name : failing_tests_) failing_files.insert(home_file(test_name));

    std::set<std::string> result;
    for (const auto& filename : stable_files_) {
        if (!failing_files.count(filename)) result.insert(filename);
    }
    return result;
}

bool SelectionEngine::check_consistency(const std::set<std::string>& affected) {
    std::vector<int64_t> fsha_misses;
    for (const auto& row : store_->filenames_fingerprints(exec_id_)) {
        auto fsha = source_tree_.fsha(row.filename);
        if (!fsha || *fsha != row.fsha) fsha_misses.push_back(row.id);
    }

    std::set<std::string> legacy;
    for (const auto& data : store_->fetch_changed_file_data(exec_id_, fsha_misses)) {
        auto module = source_tree_.module(data.filename);
        if (!module || !match_fingerprint(*module, data.checksums)) legacy.insert(data.test_name);
    }

    if (legacy == affected) return true;

    spdlog::warn("Consistency check: fingerprint scan selects {} tests, store selects {}", legacy.size(),
                 affected.size());
    for (const auto& test_name : legacy) {
        if (!affected.count(test_name)) spdlog::debug("  only in fingerprint scan: {}", test_name);
    }
    for (const auto& test_name : affected) {
        if (!legacy.count(test_name)) spdlog::debug("  only in store: {}", test_name);
    }
    return false;
}

void SelectionEngine::reconcile(const std::set<std::string>& discovered) {
    if (options_.role != Role::Coordinator) {
        spdlog::debug("Worker leaves reconciliation to the coordinator");
        return;
    }

    // Deselected tests are not collected but still exist.
    std::set<std::string> collected = discovered;
    collected.insert(stable_tests_.begin(), stable_tests_.end());

    try {
        auto known = with_store([&](FingerprintStore& store) { return store.all_test_executions(exec_id_); });

        TestRecords placeholders;
        for (const auto& test_name : collected) {
            if (known.count(test_name)) continue;
            std::string home = home_file(test_name);
            if (!is_source_file(home)) continue;
            TestRecord record;
            FileFingerprint fingerprint;
            fingerprint.filename = home;
            fingerprint.checksums = {placeholder_checksum()};
            record.fingerprints.push_back(std::move(fingerprint));
            placeholders.emplace(test_name, std::move(record));
        }
        if (!placeholders.empty()) {
            with_store([&](FingerprintStore& store) { store.insert_test_file_fps(exec_id_, placeholders); });
        }

        std::vector<std::string> stale;
        for (const auto& [test_name, info] : known) {
            if (!collected.count(test_name)) stale.push_back(test_name);
        }
        if (!stale.empty()) {
            with_store([&](FingerprintStore& store) { store.delete_test_executions(exec_id_, stale); });
        }

        spdlog::info("Reconciled tests: {} added, {} removed", placeholders.size(), stale.size());
    } catch (const StoreError& e) {
        spdlog::error("Reconciliation failed: {}", e.what());
    }
    phase_ = Phase::Reconcile;
}

void SelectionEngine::reconcile(const std::vector<std::set<std::string>>& discovered_per_worker) {
    std::set<std::string> discovered;
    for (const auto& worker : discovered_per_worker) {
        discovered.insert(worker.begin(), worker.end());
    }
    reconcile(discovered);
}

void SelectionEngine::save_records(const TestRecords& records) {
    if (records.empty()) return;
    try {
        with_store([&](FingerprintStore& store) { store.insert_test_file_fps(exec_id_, records); });
    } catch (const StoreError& e) {
        spdlog::error("Could not save {} test records: {}", records.size(), e.what());
    }
}

std::map<std::string, TestExecutionInfo> SelectionEngine::all_tests() {
    return with_store([&](FingerprintStore& store) { return store.all_test_executions(exec_id_); });
}

std::map<std::string, double> SelectionEngine::avg_durations() {
    struct Totals {
        int count = 0;
        double sum = 0.0;
    };
    std::map<std::string, Totals> totals;

    for (const auto& [test_name, info] : all_tests()) {
        std::vector<std::string> parts;
        size_t begin = 0;
        while (true) {
            size_t end = test_name.find("::", begin);
            parts.push_back(test_name.substr(begin, end == std::string::npos ? std::string::npos : end - begin));
            if (end == std::string::npos) break;
            begin = end + 2;
        }

        totals[test_name] = {1, info.duration};
        if (parts.size() > 2) {
            totals[parts[1]].count += 1;
            totals[parts[1]].sum += info.duration;
        }
        totals[parts[0]].count += 1;
        totals[parts[0]].sum += info.duration;
    }

    std::map<std::string, double> durations;
    for (const auto& [key, total] : totals) {
        durations[key] = total.sum / total.count;
    }
    return durations;
}

SavingStats SelectionEngine::close(double duration) {
    SavingStats stats;
    try {
        if (options_.role == Role::Coordinator) {
            with_store([&](FingerprintStore& store) { store.finish_execution(exec_id_, duration, options_.select); });
        }
        stats = with_store([&](FingerprintStore& store) { return store.fetch_saving_stats(exec_id_, options_.select); });
    } catch (const StoreError& e) {
        spdlog::error("Could not finalize execution {}: {}", exec_id_, e.what());
    }
    store_->close();
    phase_ = Phase::Closed;
    return stats;
}

}  // namespace testsieve
