#pragma once
#ifndef TESTSIEVE_FINGERPRINT_STORE_H
#define TESTSIEVE_FINGERPRINT_STORE_H

#include <map>
#include <optional>
#include <string>
#include <vector>
#include "store/types.h"

namespace testsieve {

// Persistent record of executions, file fingerprints and test dependencies.
// Implemented by the embedded SqliteStore and the network RemoteStore; both
// give the same answers for the same sequence of calls.
class FingerprintStore {
public:
    virtual ~FingerprintStore() = default;

    // Starts or resumes the execution of an environment. A runtime version
    // change reports RUNTIME_CHANGED_PACKAGE as the only changed package.
    virtual InitiateResult initiate_execution(const std::string& environment,
                                              const std::string& packages,
                                              const std::string& runtime_version,
                                              const std::map<std::string, std::string>& metadata) = 0;

    // Files referenced by the execution's tests whose stored fsha is missing
    // or differs from the supplied one.
    virtual std::vector<std::string> fetch_unknown_files(
        int64_t exec_id, const std::map<std::string, std::string>& files_fshas) = 0;

    // Resets the forced flag of every test, then evaluates the stored
    // fingerprints against the supplied checksums, non-source file hashes
    // and changed packages.
    virtual DetermineResult determine_tests(int64_t exec_id,
                                            const FileChecksums& files_checksums,
                                            const std::map<std::string, std::string>& file_dep_shas,
                                            const std::vector<std::string>& changed_packages) = 0;

    // Replaces each listed test's rows; other tests are untouched.
    virtual void insert_test_file_fps(int64_t exec_id, const TestRecords& records) = 0;

    virtual void delete_test_executions(int64_t exec_id, const std::vector<std::string>& test_names) = 0;

    virtual std::map<std::string, TestExecutionInfo> all_test_executions(int64_t exec_id) = 0;

    virtual std::vector<std::string> filenames(int64_t exec_id) = 0;

    virtual std::vector<FingerprintRow> filenames_fingerprints(int64_t exec_id) = 0;

    virtual std::vector<std::string> file_dependency_filenames(int64_t exec_id) = 0;

    virtual std::vector<ChangedFileData> fetch_changed_file_data(
        int64_t exec_id, const std::vector<int64_t>& fingerprint_ids) = 0;

    virtual void update_mtimes(const std::vector<MtimeUpdate>& updates) = 0;

    // Opaque metadata, scoped to an execution when exec_id is set.
    virtual void write_attribute(const std::string& attribute, const std::string& data,
                                 std::optional<int64_t> exec_id) = 0;
    virtual std::optional<std::string> fetch_attribute(const std::string& attribute,
                                                       std::optional<int64_t> exec_id) = 0;

    virtual SavingStats fetch_saving_stats(int64_t exec_id, bool select) = 0;

    virtual void finish_execution(int64_t exec_id, double duration, bool select) = 0;

    // Flushes anything the store still holds. Safe to call twice.
    virtual void close() = 0;

    // Short human-readable location, for logs.
    virtual std::string describe() const = 0;
};

}  // namespace testsieve

#endif  // TESTSIEVE_FINGERPRINT_STORE_H
