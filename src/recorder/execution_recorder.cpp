#include "recorder/execution_recorder.h"
#include "common/errors.h"
#include "fingerprint/module.h"
#include <spdlog/spdlog.h>

namespace testsieve {

std::string home_file(const std::string& test_name) {
    return test_name.substr(0, test_name.find("::"));
}

ExecutionRecorder::ExecutionRecorder(CoverageProvider& coverage, DependencyTracker& tracker,
                                     SourceTree& source_tree, BatchWriter writer, size_t batch_size)
    : coverage_(coverage),
      tracker_(tracker),
      source_tree_(source_tree),
      writer_(std::move(writer)),
      batch_size_(batch_size == 0 ? 1 : batch_size),
      stack_(own_stack_) {}

ExecutionRecorder::ExecutionRecorder(CoverageProvider& coverage, DependencyTracker& tracker,
                                     SourceTree& source_tree, BatchWriter writer, size_t batch_size,
                                     CoverageStack& shared_stack)
    : coverage_(coverage),
      tracker_(tracker),
      source_tree_(source_tree),
      writer_(std::move(writer)),
      batch_size_(batch_size == 0 ? 1 : batch_size),
      stack_(shared_stack) {}

ExecutionRecorder::~ExecutionRecorder() {
    close();
}

void ExecutionRecorder::set_selection(std::set<std::string> stable_tests, std::set<std::string> failing_tests) {
    stable_tests_ = std::move(stable_tests);
    failing_tests_ = std::move(failing_tests);
}

void ExecutionRecorder::start_test(const std::string& test_name,
                                   const std::optional<std::string>& next_test_name) {
    next_ = next_test_name;
    batched_.insert(test_name);

    if (!stack_.contains(coverage_)) {
        stack_.push(coverage_);
    } else if (!coverage_.started()) {
        coverage_.start();
    }

    current_ = test_name;
    coverage_.switch_context(test_name);
    check_stack_ = stack_.snapshot();

    std::string test_file = test_name.find("::") != std::string::npos ? home_file(test_name) : "";
    tracker_.start(test_name, test_file);
}

void ExecutionRecorder::discard_current() {
    interrupted_ = current_;
}

TestRecords ExecutionRecorder::finish_test(const TestOutcome& outcome) {
    if (!current_) {
        throw RecorderError("finish_test called without a running test");
    }
    if (stack_.snapshot() != check_stack_) {
        throw RecorderError("Test " + *current_ + " changed the coverage stack");
    }

    tracked_[*current_] = tracker_.stop();
    outcomes_[*current_] = outcome;

    bool flush_now = batched_.size() >= batch_size_ || !next_ || interrupted_;
    current_.reset();
    if (!flush_now) return {};
    return flush();
}

TestRecords ExecutionRecorder::flush() {
    if (batched_.empty() && tracked_.empty()) return {};

    coverage_.stop();
    BatchDependencies batch = collect_batch();
    merge_tracked(batch);

    if (stack_.top() == &coverage_ && stack_.parent()) {
        FilesLines measured;
        for (const auto& [test_name, deps] : batch) {
            for (const auto& [filename, lines] : deps.files_lines) {
                measured[filename].insert(lines.begin(), lines.end());
            }
        }
        stack_.parent()->add_lines(measured);
    }

    coverage_.erase();
    coverage_.start();

    TestRecords records = build_records(batch);
    batched_.clear();
    tracked_.clear();
    outcomes_.clear();
    if (interrupted_) {
        spdlog::info("Discarded interrupted test {}", *interrupted_);
        interrupted_.reset();
    }

    if (!records.empty()) {
        spdlog::debug("Flushing {} test records", records.size());
        writer_(records);
    }
    return records;
}

BatchDependencies ExecutionRecorder::collect_batch() {
    BatchDependencies batch;
    for (auto& [context, files] : coverage_.data()) {
        if (context.empty() || context == interrupted_) continue;
        batch[context].files_lines = std::move(files);
    }

    for (const auto& test_name : batched_) {
        if (test_name == interrupted_) continue;
        auto& files_lines = batch[test_name].files_lines;
        std::string home = home_file(test_name);
        if (!files_lines.count(home)) files_lines[home] = {1};
    }
    return batch;
}

void ExecutionRecorder::merge_tracked(BatchDependencies& batch) {
    for (const auto& [test_name, tracked] : tracked_) {
        if (test_name == interrupted_) continue;
        TestDependencies& deps = batch[test_name];
        std::set<std::string> external = tracked.external_imports;

        for (const auto& local : tracked.local_imports) {
            deps.files_lines.emplace(local, std::set<int>{0});
        }

        // Loading a module runs its top-level code and the top-level code
        // of everything it imports.
        if (!tracked.test_file.empty()) {
            auto test_file_external = tracker_.module_external_imports(tracked.test_file);
            external.insert(test_file_external.begin(), test_file_external.end());

            for (const auto& imported : tracker_.module_imports(tracked.test_file)) {
                deps.files_lines.emplace(imported, std::set<int>{0});
                for (const auto& transitive : tracker_.module_imports(imported)) {
                    deps.files_lines.emplace(transitive, std::set<int>{0});
                }
                auto module_external = tracker_.module_external_imports(imported);
                external.insert(module_external.begin(), module_external.end());
            }
        }

        deps.file_deps.insert(tracked.files.begin(), tracked.files.end());
        deps.external_deps.insert(external.begin(), external.end());
    }
}

TestRecords ExecutionRecorder::build_records(const BatchDependencies& batch) {
    TestRecords records;
    for (const auto& [test_name, deps] : batch) {
        TestRecord record;
        auto outcome = outcomes_.find(test_name);
        if (outcome != outcomes_.end()) {
            record.duration = outcome->second.duration;
            record.failed = outcome->second.failed;
        }
        record.forced = stable_tests_.count(test_name) > 0 && failing_tests_.count(test_name) == 0;

        for (const auto& [filename, lines] : deps.files_lines) {
            auto module = source_tree_.module(filename);
            if (!module) continue;
            FileFingerprint fingerprint;
            fingerprint.filename = filename;
            fingerprint.fsha = source_tree_.fsha(filename).value_or("");
            fingerprint.mtime = source_tree_.mtime(filename).value_or(0);
            fingerprint.checksums = create_fingerprint(*module, lines);
            record.fingerprints.push_back(std::move(fingerprint));
        }
        record.file_deps = deps.file_deps;
        record.external_deps = deps.external_deps;
        records.emplace(test_name, std::move(record));
    }
    return records;
}

void ExecutionRecorder::close() {
    tracker_.close();
    stack_.release(coverage_);
    current_.reset();
}

}  // namespace testsieve
