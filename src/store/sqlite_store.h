#pragma once
#ifndef TESTSIEVE_SQLITE_STORE_H
#define TESTSIEVE_SQLITE_STORE_H

#include <memory>
#include <mutex>
#include <string>
#include "store/database.h"
#include "store/fingerprint_store.h"
#include "store/id_cache.h"

namespace testsieve {

// Embedded store: one SQLite file holds every environment of a (repo, job).
class SqliteStore : public FingerprintStore {
public:
    explicit SqliteStore(const std::string& path, size_t id_cache_capacity = 1000);
    ~SqliteStore() override;

    InitiateResult initiate_execution(const std::string& environment,
                                      const std::string& packages,
                                      const std::string& runtime_version,
                                      const std::map<std::string, std::string>& metadata) override;

    std::vector<std::string> fetch_unknown_files(
        int64_t exec_id, const std::map<std::string, std::string>& files_fshas) override;

    DetermineResult determine_tests(int64_t exec_id,
                                    const FileChecksums& files_checksums,
                                    const std::map<std::string, std::string>& file_dep_shas,
                                    const std::vector<std::string>& changed_packages) override;

    void insert_test_file_fps(int64_t exec_id, const TestRecords& records) override;
    void delete_test_executions(int64_t exec_id, const std::vector<std::string>& test_names) override;

    std::map<std::string, TestExecutionInfo> all_test_executions(int64_t exec_id) override;
    std::vector<std::string> filenames(int64_t exec_id) override;
    std::vector<FingerprintRow> filenames_fingerprints(int64_t exec_id) override;
    std::vector<std::string> file_dependency_filenames(int64_t exec_id) override;
    std::vector<ChangedFileData> fetch_changed_file_data(
        int64_t exec_id, const std::vector<int64_t>& fingerprint_ids) override;
    void update_mtimes(const std::vector<MtimeUpdate>& updates) override;

    void write_attribute(const std::string& attribute, const std::string& data,
                         std::optional<int64_t> exec_id) override;
    std::optional<std::string> fetch_attribute(const std::string& attribute,
                                               std::optional<int64_t> exec_id) override;

    SavingStats fetch_saving_stats(int64_t exec_id, bool select) override;
    void finish_execution(int64_t exec_id, double duration, bool select) override;

    void close() override;
    std::string describe() const override;

    const std::string& path() const { return path_; }
    const IdCache& id_cache() const { return id_cache_; }

    // Runs fn with exclusive access to the connection, for read-only
    // queries outside the store contract.
    template <typename Fn>
    auto with_database(Fn&& fn) {
        std::lock_guard lock(mutex_);
        return fn(*db_);
    }

private:
    std::string path_;
    std::unique_ptr<Database> db_;
    IdCache id_cache_;
    std::mutex mutex_;

    void init_schema();
    int64_t fetch_or_create_file_fp(const FileFingerprint& fp);
    int64_t fetch_or_create_file_dependency(const FileDependency& dep);
    SavingStats saving_stats_locked(int64_t exec_id, bool select);
    void write_attribute_locked(const std::string& attribute, const std::string& data,
                                std::optional<int64_t> exec_id);
    std::optional<std::string> fetch_attribute_locked(const std::string& attribute,
                                                      std::optional<int64_t> exec_id);
};

}  // namespace testsieve

#endif  // TESTSIEVE_SQLITE_STORE_H
