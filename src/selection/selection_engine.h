#pragma once
#ifndef TESTSIEVE_SELECTION_ENGINE_H
#define TESTSIEVE_SELECTION_ENGINE_H

#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>
#include "common/errors.h"
#include "config/config.h"
#include "fingerprint/source_tree.h"
#include "selection/store_factory.h"
#include "store/fingerprint_store.h"

namespace testsieve {

enum class Role {
    Coordinator,  // single process or distributed controller
    Worker,
};

enum class Phase {
    Idle,
    Init,
    Diff,
    Determine,
    Partition,
    Reconcile,
    Closed,
};

const char* phase_name(Phase phase);

struct SelectionOptions {
    std::string environment = "default";
    // "name version, name version"; patch versions are dropped.
    std::string packages;
    std::string runtime_version;
    std::map<std::string, std::string> metadata;
    Role role = Role::Coordinator;
    // False when every test runs regardless of the selection.
    bool select = true;
    bool consistency_check = false;

    static SelectionOptions from_config(const Config& config);
};

// Drives one run: INIT -> DIFF -> DETERMINE -> PARTITION, then after the
// tests ran RECONCILE -> CLOSE. Store failures never abort the run; a
// network store that stays unreachable or refuses requests is replaced by
// the embedded fallback, and other store errors select every test.
class SelectionEngine {
public:
    SelectionEngine(std::unique_ptr<FingerprintStore> store, SourceTree& source_tree,
                    SelectionOptions options, StoreFactory fallback = {});

    // INIT. Throws StoreError when neither store can start an execution.
    void initiate();

    // DIFF, DETERMINE and PARTITION. Initiates first if needed.
    void determine_stable();

    // Coordinator only: inserts placeholders for discovered tests the store
    // does not know and deletes known tests that were not discovered.
    // Workers return without touching the store.
    void reconcile(const std::set<std::string>& discovered);
    void reconcile(const std::vector<std::set<std::string>>& discovered_per_worker);

    // Writes one recorder batch.
    void save_records(const TestRecords& records);

    // CLOSE: finalizes the execution (coordinator) and closes the store.
    SavingStats close(double duration);

    // Re-derives the affected set from fsha misses and stored fingerprints
    // and logs a warning when it differs. Returns true when both agree.
    bool check_consistency(const std::set<std::string>& affected);

    std::map<std::string, TestExecutionInfo> all_tests();

    // Average durations per test, per class and per module, for ordering.
    std::map<std::string, double> avg_durations();

    // Stable tests that are not failing: safe to skip.
    std::set<std::string> deselected_tests() const;
    // Stable files without a failing test.
    std::set<std::string> deselected_files() const;

    int64_t exec_id() const { return exec_id_; }
    Phase phase() const { return phase_; }
    Role role() const { return options_.role; }
    bool select_all() const { return select_all_; }
    bool using_fallback() const { return fell_back_; }
    bool packages_changed() const { return packages_changed_; }
    const std::vector<std::string>& changed_packages() const { return changed_packages_; }

    const std::vector<std::string>& changed_files() const { return changed_files_; }
    const std::set<std::string>& all_files() const { return all_files_; }
    const std::set<std::string>& stable_tests() const { return stable_tests_; }
    const std::set<std::string>& unstable_tests() const { return unstable_tests_; }
    const std::set<std::string>& stable_files() const { return stable_files_; }
    const std::set<std::string>& unstable_files() const { return unstable_files_; }
    const std::set<std::string>& failing_tests() const { return failing_tests_; }

    FingerprintStore& store() { return *store_; }

private:
    std::unique_ptr<FingerprintStore> store_;
    SourceTree& source_tree_;
    SelectionOptions options_;
    StoreFactory fallback_;
    bool fell_back_ = false;

    Phase phase_ = Phase::Idle;
    int64_t exec_id_ = 0;
    bool initiated_ = false;
    bool select_all_ = false;
    bool packages_changed_ = false;
    std::vector<std::string> changed_packages_;
    std::vector<std::string> files_of_interest_;

    std::vector<std::string> changed_files_;
    std::set<std::string> all_files_;
    std::set<std::string> stable_tests_;
    std::set<std::string> unstable_tests_;
    std::set<std::string> stable_files_;
    std::set<std::string> unstable_files_;
    std::set<std::string> failing_tests_;

    std::string manifest() const;
    void apply_initiate(const InitiateResult& result);
    bool fall_back(const StoreError& error);

    std::map<std::string, std::string> local_fshas(std::vector<MtimeUpdate>& mtime_updates);
    std::map<std::string, std::string> file_dependency_shas();
    void partition(const DetermineResult& result);
    void select_everything();

    // Runs fn against the store, switching to the fallback store once when
    // the network store is unreachable or refuses the request.
    template <typename Fn>
    auto with_store(Fn&& fn) {
        try {
            return fn(*store_);
        } catch (const StoreNetworkError& e) {
            if (!fall_back(e)) throw;
            return fn(*store_);
        } catch (const StoreRejectedError& e) {
            if (!fall_back(e)) throw;
            return fn(*store_);
        }
    }
};

}  // namespace testsieve

#endif  // TESTSIEVE_SELECTION_ENGINE_H
