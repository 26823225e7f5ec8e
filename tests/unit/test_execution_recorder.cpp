#include <gtest/gtest.h>
#include "common/errors.h"
#include "common/hashing.h"
#include "recorder/execution_recorder.h"
#include <filesystem>
#include <fstream>

using namespace testsieve;
namespace fs = std::filesystem;

namespace {

const char* CALC_SOURCE =
    "def add(a, b):\n"
    "    return a + b\n"
    "\n"
    "\n"
    "def sub(a, b):\n"
    "    return a - b\n";

const char* TEST_SOURCE =
    "import calc\n"
    "import pytest\n"
    "\n"
    "\n"
    "def test_add():\n"
    "    assert calc.add(1, 2) == 3\n"
    "\n"
    "\n"
    "def test_sub():\n"
    "    assert calc.sub(2, 1) == 1\n";

class ExecutionRecorderTest : public ::testing::Test {
protected:
    fs::path root_;
    std::unique_ptr<SourceTree> tree_;
    std::unique_ptr<DependencyTracker> tracker_;
    InMemoryCoverage coverage_;
    std::vector<TestRecords> written_;

    void SetUp() override {
        root_ = fs::temp_directory_path() /
                (std::string("testsieve_recorder_") + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(root_);
        write("calc.py", CALC_SOURCE);
        write("tests/test_calc.py", TEST_SOURCE);
        write("data/table.csv", "a,b\n1,2\n");
        tree_ = std::make_unique<SourceTree>(root_);
        tracker_ = std::make_unique<DependencyTracker>(root_);
    }

    void TearDown() override { fs::remove_all(root_); }

    void write(const std::string& name, const std::string& content) {
        fs::create_directories((root_ / name).parent_path());
        std::ofstream out(root_ / name, std::ios::binary);
        out << content;
    }

    std::unique_ptr<ExecutionRecorder> recorder(size_t batch_size) {
        return std::make_unique<ExecutionRecorder>(
            coverage_, *tracker_, *tree_, [this](const TestRecords& records) { written_.push_back(records); },
            batch_size);
    }

    const FileFingerprint* find(const TestRecord& record, const std::string& filename) {
        for (const auto& fingerprint : record.fingerprints) {
            if (fingerprint.filename == filename) return &fingerprint;
        }
        return nullptr;
    }
};

const std::string TEST_ADD = "tests/test_calc.py::test_add";
const std::string TEST_SUB = "tests/test_calc.py::test_sub";
const std::string TEST_MUL = "tests/test_calc.py::test_mul";

}  // namespace

TEST(HomeFileTest, test_home_file) {
    EXPECT_EQ(home_file("tests/test_a.py::TestX::test_y"), "tests/test_a.py");
    EXPECT_EQ(home_file("tests/test_a.py"), "tests/test_a.py");
}

// ========== Batching ==========

TEST_F(ExecutionRecorderTest, test_batch_is_flushed_when_full) {
    auto rec = recorder(2);

    rec->start_test(TEST_ADD, TEST_SUB);
    EXPECT_TRUE(rec->finish_test({0.1, false}).empty());
    EXPECT_EQ(rec->batched_count(), 1u);

    rec->start_test(TEST_SUB, TEST_MUL);
    auto flushed = rec->finish_test({0.2, false});
    EXPECT_EQ(flushed.size(), 2u);
    EXPECT_EQ(rec->batched_count(), 0u);

    rec->start_test(TEST_MUL, std::nullopt);
    flushed = rec->finish_test({0.3, true});
    ASSERT_EQ(flushed.size(), 1u);
    EXPECT_TRUE(flushed.at(TEST_MUL).failed);
    EXPECT_DOUBLE_EQ(flushed.at(TEST_MUL).duration, 0.3);

    ASSERT_EQ(written_.size(), 2u);
    EXPECT_EQ(written_[0].count(TEST_ADD), 1u);
    EXPECT_EQ(written_[0].count(TEST_SUB), 1u);
}

TEST_F(ExecutionRecorderTest, test_last_test_flushes_partial_batch) {
    auto rec = recorder(DEFAULT_BATCH_SIZE);
    rec->start_test(TEST_ADD, std::nullopt);
    auto flushed = rec->finish_test({0.1, false});
    EXPECT_EQ(flushed.size(), 1u);
    EXPECT_EQ(written_.size(), 1u);
}

TEST_F(ExecutionRecorderTest, test_zero_batch_size_is_one) {
    auto rec = recorder(0);
    EXPECT_EQ(rec->batch_size(), 1u);
}

// ========== Fingerprints ==========

TEST_F(ExecutionRecorderTest, test_covered_lines_become_fingerprints) {
    auto rec = recorder(DEFAULT_BATCH_SIZE);
    rec->start_test(TEST_ADD, std::nullopt);
    coverage_.record("tests/test_calc.py", std::set<int>{5, 6});
    coverage_.record("calc.py", std::set<int>{1, 2});
    auto flushed = rec->finish_test({0.1, false});

    const TestRecord& record = flushed.at(TEST_ADD);
    const FileFingerprint* calc = find(record, "calc.py");
    ASSERT_NE(calc, nullptr);
    EXPECT_EQ(calc->checksums, create_fingerprint(*tree_->module("calc.py"), {1, 2}));
    EXPECT_EQ(calc->fsha, git_blob_sha(CALC_SOURCE));
    EXPECT_GT(calc->mtime, 0);

    const FileFingerprint* home = find(record, "tests/test_calc.py");
    ASSERT_NE(home, nullptr);
    EXPECT_EQ(home->checksums, create_fingerprint(*tree_->module("tests/test_calc.py"), {5, 6}));
}

TEST_F(ExecutionRecorderTest, test_home_file_without_coverage_gets_module_line) {
    auto rec = recorder(DEFAULT_BATCH_SIZE);
    rec->start_test(TEST_ADD, std::nullopt);
    auto flushed = rec->finish_test({0.1, false});

    const FileFingerprint* home = find(flushed.at(TEST_ADD), "tests/test_calc.py");
    ASSERT_NE(home, nullptr);
    EXPECT_EQ(home->checksums, create_fingerprint(*tree_->module("tests/test_calc.py"), {1}));
}

TEST_F(ExecutionRecorderTest, test_imports_and_file_reads_are_dependencies) {
    auto rec = recorder(DEFAULT_BATCH_SIZE);
    rec->start_test(TEST_ADD, std::nullopt);
    tracker_->on_file_read((root_ / "data/table.csv").string());
    auto flushed = rec->finish_test({0.1, false});

    const TestRecord& record = flushed.at(TEST_ADD);
    // calc.py is imported by the test file, so its module block is a dependency.
    const FileFingerprint* calc = find(record, "calc.py");
    ASSERT_NE(calc, nullptr);
    EXPECT_EQ(calc->checksums, create_fingerprint(*tree_->module("calc.py"), {0}));

    ASSERT_EQ(record.file_deps.size(), 1u);
    EXPECT_EQ(record.file_deps.begin()->filename, "data/table.csv");
    EXPECT_EQ(record.file_deps.begin()->sha, git_blob_sha("a,b\n1,2\n"));
    EXPECT_EQ(record.external_deps, (std::set<std::string>{"pytest"}));
}

TEST_F(ExecutionRecorderTest, test_forced_flag_follows_selection) {
    auto rec = recorder(DEFAULT_BATCH_SIZE);
    rec->set_selection({TEST_ADD, TEST_SUB}, {TEST_SUB});

    rec->start_test(TEST_ADD, TEST_SUB);
    rec->finish_test({0.1, false});
    rec->start_test(TEST_SUB, TEST_MUL);
    rec->finish_test({0.1, false});
    rec->start_test(TEST_MUL, std::nullopt);
    auto flushed = rec->finish_test({0.1, false});

    ASSERT_EQ(flushed.size(), 3u);
    EXPECT_EQ(flushed.at(TEST_ADD).forced, true);
    EXPECT_EQ(flushed.at(TEST_SUB).forced, false);
    EXPECT_EQ(flushed.at(TEST_MUL).forced, false);
}

// ========== Interruption and misuse ==========

TEST_F(ExecutionRecorderTest, test_discarded_test_is_not_written) {
    auto rec = recorder(DEFAULT_BATCH_SIZE);
    rec->start_test(TEST_ADD, TEST_SUB);
    coverage_.record("calc.py", 2);
    rec->discard_current();
    auto flushed = rec->finish_test({0.1, false});
    EXPECT_TRUE(flushed.empty());
    EXPECT_TRUE(written_.empty());

    rec->start_test(TEST_SUB, std::nullopt);
    flushed = rec->finish_test({0.1, false});
    ASSERT_EQ(flushed.size(), 1u);
    EXPECT_EQ(flushed.count(TEST_SUB), 1u);
}

TEST_F(ExecutionRecorderTest, test_finish_without_running_test_throws) {
    auto rec = recorder(DEFAULT_BATCH_SIZE);
    EXPECT_THROW(rec->finish_test({0.1, false}), RecorderError);
}

TEST_F(ExecutionRecorderTest, test_test_changing_coverage_stack_throws) {
    auto rec = recorder(DEFAULT_BATCH_SIZE);
    InMemoryCoverage stray;
    rec->start_test(TEST_ADD, std::nullopt);
    rec->coverage_stack().push(stray);
    EXPECT_THROW(rec->finish_test({0.1, false}), RecorderError);
    rec->coverage_stack().release(stray);
}

// ========== Nesting ==========

TEST_F(ExecutionRecorderTest, test_nested_recorder_forwards_lines_to_parent) {
    auto outer = recorder(DEFAULT_BATCH_SIZE);
    outer->start_test("tests/test_outer.py::test_runs_inner_suite", std::nullopt);

    InMemoryCoverage inner_coverage;
    DependencyTracker inner_tracker(root_);
    std::vector<TestRecords> inner_written;
    {
        ExecutionRecorder inner(inner_coverage, inner_tracker, *tree_,
                                [&inner_written](const TestRecords& records) { inner_written.push_back(records); },
                                DEFAULT_BATCH_SIZE, outer->coverage_stack());
        inner.start_test(TEST_ADD, std::nullopt);
        EXPECT_FALSE(coverage_.started());
        inner_coverage.record("calc.py", 2);
        inner.finish_test({0.1, false});
    }

    EXPECT_TRUE(coverage_.started());
    ASSERT_EQ(inner_written.size(), 1u);
    auto outer_lines = coverage_.data()["tests/test_outer.py::test_runs_inner_suite"];
    EXPECT_EQ(outer_lines["calc.py"].count(2), 1u);
}
