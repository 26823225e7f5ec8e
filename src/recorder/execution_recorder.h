#pragma once
#ifndef TESTSIEVE_EXECUTION_RECORDER_H
#define TESTSIEVE_EXECUTION_RECORDER_H

#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "fingerprint/source_tree.h"
#include "recorder/coverage.h"
#include "recorder/dependency_tracker.h"
#include "store/types.h"

namespace testsieve {

inline constexpr size_t DEFAULT_BATCH_SIZE = 250;

struct TestOutcome {
    double duration = 0.0;
    bool failed = false;
};

// Everything one test depended on within a flushed batch. Files pulled in
// only through imports carry line 0 (module block).
struct TestDependencies {
    FilesLines files_lines;
    std::set<FileDependency> file_deps;
    std::set<std::string> external_deps;
};

using BatchDependencies = std::map<std::string, TestDependencies>;

// "tests/test_a.py::TestX::test_y" -> "tests/test_a.py"
std::string home_file(const std::string& test_name);

// Records coverage and dependencies of consecutive tests and writes them
// as fingerprints every batch_size tests.
//
// Usage per test:
//   recorder.start_test(name, next_name);
//   ... test runs, harness feeds coverage and the tracker ...
//   recorder.discard_current();         // only if the run was interrupted
//   recorder.finish_test({duration, failed});
class ExecutionRecorder {
public:
    using BatchWriter = std::function<void(const TestRecords&)>;

    ExecutionRecorder(CoverageProvider& coverage, DependencyTracker& tracker, SourceTree& source_tree,
                      BatchWriter writer, size_t batch_size = DEFAULT_BATCH_SIZE);
    // Nested recorder sharing the coverage stack of an enclosing one.
    ExecutionRecorder(CoverageProvider& coverage, DependencyTracker& tracker, SourceTree& source_tree,
                      BatchWriter writer, size_t batch_size, CoverageStack& shared_stack);
    ~ExecutionRecorder();

    ExecutionRecorder(const ExecutionRecorder&) = delete;
    ExecutionRecorder& operator=(const ExecutionRecorder&) = delete;

    void start_test(const std::string& test_name, const std::optional<std::string>& next_test_name);

    // The running test will be left out of the next flush and recorded on
    // a later run instead.
    void discard_current();

    // Ends the running test. The batch is flushed when it is full, when
    // there is no next test, or when the test was discarded. Returns the
    // records written, empty when nothing was flushed.
    TestRecords finish_test(const TestOutcome& outcome);

    // Writes whatever is batched now.
    TestRecords flush();

    // Tests selection would have skipped: recording one of them (unless it
    // is failing) marks it forced.
    void set_selection(std::set<std::string> stable_tests, std::set<std::string> failing_tests);

    CoverageStack& coverage_stack() { return stack_; }
    size_t batch_size() const { return batch_size_; }
    size_t batched_count() const { return batched_.size(); }
    const std::optional<std::string>& current_test() const { return current_; }

    void close();

private:
    CoverageProvider& coverage_;
    DependencyTracker& tracker_;
    SourceTree& source_tree_;
    BatchWriter writer_;
    size_t batch_size_;

    CoverageStack own_stack_;
    CoverageStack& stack_;
    std::vector<CoverageProvider*> check_stack_;

    std::optional<std::string> current_;
    std::optional<std::string> next_;
    std::optional<std::string> interrupted_;
    std::set<std::string> batched_;
    std::map<std::string, TrackedDependencies> tracked_;
    std::map<std::string, TestOutcome> outcomes_;

    std::set<std::string> stable_tests_;
    std::set<std::string> failing_tests_;

    BatchDependencies collect_batch();
    void merge_tracked(BatchDependencies& batch);
    TestRecords build_records(const BatchDependencies& batch);
};

}  // namespace testsieve

#endif  // TESTSIEVE_EXECUTION_RECORDER_H
