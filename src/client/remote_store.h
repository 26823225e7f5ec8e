#pragma once
#ifndef TESTSIEVE_REMOTE_STORE_H
#define TESTSIEVE_REMOTE_STORE_H

#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <boost/asio.hpp>
#include "config/config.h"
#include "protocol/parser.h"
#include "store/fingerprint_store.h"

namespace testsieve {

// Network store client. Every call carries a timeout; transport failures and
// server errors are retried with exponential backoff, then surface as
// StoreNetworkError. Client errors throw StoreRejectedError without retry.
class RemoteStore : public FingerprintStore {
public:
    struct Options {
        std::string host;
        uint16_t port = 7878;
        std::string repo;
        std::string job;
        std::string token;
        // Bulk writes get twice this.
        std::chrono::milliseconds timeout{60000};
        int retries = 3;
        std::chrono::milliseconds backoff_base{500};
        std::chrono::milliseconds backoff_cap{8000};
    };

    explicit RemoteStore(Options options);
    ~RemoteStore() override;

    static Options options_from(const Config& config);

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

    // Report queries served by the same endpoint.
    RunSummary report_summary(int64_t exec_id, const std::optional<std::string>& run_id);
    std::vector<FileTest> report_file_tests(int64_t exec_id, const std::string& filename);
    std::optional<TestDetail> report_test_detail(int64_t exec_id, const std::string& test_name);
    std::vector<CodependencyEdge> report_codependency(int64_t exec_id);
    CoverageAnalysis report_coverage(int64_t exec_id, const CoverageQuery& query);
    FileTestList report_tests_for_file(int64_t exec_id, const std::string& filename, int64_t limit);
    ImpactEstimate report_impact(int64_t exec_id, const FileChecksums& files_checksums);

    size_t attempt_count() const { return attempts_.load(); }

private:
    Options options_;
    boost::asio::io_context io_context_;
    std::optional<boost::asio::ip::tcp::socket> socket_;
    std::atomic<size_t> attempts_{0};
    std::mutex mutex_;

    std::string call(const char* op, int64_t exec_id, const std::string& payload, bool bulk = false);
    Response attempt(const std::string& frame, std::chrono::milliseconds timeout);
    void connect(std::chrono::steady_clock::time_point deadline);
    void run_until(std::chrono::steady_clock::time_point deadline);
    void reset_socket();
};

}  // namespace testsieve

#endif  // TESTSIEVE_REMOTE_STORE_H
