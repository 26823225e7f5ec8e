#pragma once
#ifndef TESTSIEVE_REPORTER_H
#define TESTSIEVE_REPORTER_H

#include <optional>
#include <string>
#include <vector>
#include "store/sqlite_store.h"
#include "store/types.h"

namespace testsieve {

// Read-only views over an embedded store for dashboards and CLIs.
class Reporter {
public:
    explicit Reporter(SqliteStore& store);

    // Latest finished run of the execution, or the run tagged with run_id.
    // Falls back to live counts when no run has finished yet.
    RunSummary summary(int64_t exec_id, const std::optional<std::string>& run_id = std::nullopt);

    std::vector<FileTest> file_tests(int64_t exec_id, const std::string& filename);

    std::optional<TestDetail> test_detail(int64_t exec_id, const std::string& test_name);

    // File pairs that share at least one test, most shared first.
    std::vector<CodependencyEdge> codependency_graph(int64_t exec_id);

    // Files ranked by how many tests depend on them.
    CoverageAnalysis coverage_analysis(int64_t exec_id, const CoverageQuery& query = {});

    // Names of the tests depending on a file. A '%' in filename makes it a
    // LIKE pattern. total_count ignores the limit.
    FileTestList tests_for_file(int64_t exec_id, const std::string& filename, int64_t limit = 500);

    // Tests whose recorded fingerprints no longer match the given current
    // checksums, without touching the store. failing lists every test that
    // failed on its last run.
    ImpactEstimate estimate_impact(int64_t exec_id, const FileChecksums& files_checksums);

private:
    SqliteStore& store_;
};

}  // namespace testsieve

#endif  // TESTSIEVE_REPORTER_H
