#pragma once
#ifndef TESTSIEVE_STORE_TYPES_H
#define TESTSIEVE_STORE_TYPES_H

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace testsieve {

// Reserved changed-package name: every test of the execution is affected.
inline constexpr const char* RUNTIME_CHANGED_PACKAGE = "__runtime_version_changed__";

// A non-source file a test read, identified by its content hash.
struct FileDependency {
    std::string filename;
    std::string sha;

    bool operator<(const FileDependency& other) const {
        return filename < other.filename || (filename == other.filename && sha < other.sha);
    }
    bool operator==(const FileDependency& other) const {
        return filename == other.filename && sha == other.sha;
    }
};

// Fingerprint of one file version as recorded for one test.
struct FileFingerprint {
    std::string filename;
    std::string fsha;
    int64_t mtime = 0;
    std::vector<int32_t> checksums;
};

// Outcome and dependencies of one test, as written by the recorder.
struct TestRecord {
    double duration = 0.0;
    bool failed = false;
    std::optional<bool> forced;
    std::vector<FileFingerprint> fingerprints;
    std::set<FileDependency> file_deps;
    std::set<std::string> external_deps;
};

using TestRecords = std::map<std::string, TestRecord>;

struct TestExecutionInfo {
    double duration = 0.0;
    bool failed = false;
    std::optional<bool> forced;
};

struct InitiateResult {
    int64_t exec_id = 0;
    std::vector<std::string> filenames;
    bool packages_changed = false;
    std::vector<std::string> changed_packages;
};

// Current block checksums per changed file; nullopt for a file that no
// longer exists.
using FileChecksums = std::map<std::string, std::optional<std::vector<int32_t>>>;

struct DetermineResult {
    std::set<std::string> affected;
    std::set<std::string> failing;
};

struct FingerprintRow {
    int64_t id = 0;
    std::string filename;
    std::string fsha;
    int64_t mtime = 0;
    std::vector<int32_t> checksums;
};

struct MtimeUpdate {
    int64_t fingerprint_id = 0;
    int64_t mtime = 0;
    std::string fsha;
};

// One (test, file fingerprint) association, used by the legacy cross-check.
struct ChangedFileData {
    std::string filename;
    std::string test_name;
    std::vector<int32_t> checksums;
    int64_t fingerprint_id = 0;
    bool failed = false;
    double duration = 0.0;
};

struct SavingStats {
    double run_saved_time = 0.0;
    double run_all_time = 0.0;
    int64_t run_saved_tests = 0;
    int64_t run_all_tests = 0;
    double total_saved_time = 0.0;
    double total_all_time = 0.0;
    int64_t total_saved_tests = 0;
    int64_t total_all_tests = 0;
};

// Reporting

struct RunSummary {
    std::string environment;
    std::string run_id;
    std::string created;
    int64_t tests = 0;
    int64_t files = 0;
    int64_t saved_tests = 0;
    double saved_time = 0.0;
    double all_time = 0.0;
};

struct FileTest {
    std::string test_name;
    double duration = 0.0;
    bool failed = false;
    std::vector<int32_t> checksums;
};

struct TestDetail {
    std::string test_name;
    double duration = 0.0;
    bool failed = false;
    std::optional<bool> forced;
    std::vector<FileFingerprint> fingerprints;
    std::vector<FileDependency> file_deps;
    std::vector<std::string> packages;
};

struct CodependencyEdge {
    std::string file_a;
    std::string file_b;
    int64_t shared_tests = 0;
};

struct FileCoverage {
    std::string filename;
    int64_t test_count = 0;
    // Distinct recorded fingerprints of the file.
    int64_t fingerprint_count = 0;
};

struct CoverageQuery {
    // Least covered first unless set.
    bool descending = false;
    int64_t limit = 50;
    int64_t min_tests = 0;
    std::optional<int64_t> max_tests;
    // Substring of the filename; empty matches every file.
    std::string pattern;
};

struct CoverageAnalysis {
    int64_t total_files = 0;
    int64_t total_tests = 0;
    std::vector<FileCoverage> files;
};

struct FileTestList {
    std::vector<std::string> tests;
    int64_t total_count = 0;
};

struct ImpactEstimate {
    std::set<std::string> affected;
    std::set<std::string> failing;
};

}  // namespace testsieve

#endif  // TESTSIEVE_STORE_TYPES_H
