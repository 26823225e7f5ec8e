#include <gtest/gtest.h>
#include "common/errors.h"
#include "fingerprint/module.h"
#include "store/sqlite_store.h"
#include <filesystem>
#include <fstream>

using namespace testsieve;
namespace fs = std::filesystem;

namespace {

class SqliteStoreTest : public ::testing::Test {
protected:
    fs::path dir_;
    std::unique_ptr<SqliteStore> store_;

    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               (std::string("testsieve_store_") + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(dir_);
        store_ = std::make_unique<SqliteStore>((dir_ / "data.db").string());
    }

    void TearDown() override {
        store_.reset();
        fs::remove_all(dir_);
    }

    int64_t initiate(const std::string& packages = "numpy 1.26, requests 2.31",
                     const std::string& runtime = "3.11.4") {
        return store_->initiate_execution("default", packages, runtime, {}).exec_id;
    }

    int64_t count(const std::string& sql) {
        return store_->with_database([&](Database& db) {
            auto stmt = db.prepare(sql);
            stmt.step();
            return stmt.column_int64(0);
        });
    }
};

FileFingerprint fingerprint(const std::string& filename, const std::string& fsha,
                            std::vector<int32_t> checksums, int64_t mtime = 100) {
    FileFingerprint fp;
    fp.filename = filename;
    fp.fsha = fsha;
    fp.mtime = mtime;
    fp.checksums = std::move(checksums);
    return fp;
}

TestRecord record(std::vector<FileFingerprint> fingerprints, double duration = 1.0, bool failed = false) {
    TestRecord rec;
    rec.duration = duration;
    rec.failed = failed;
    rec.forced = false;
    rec.fingerprints = std::move(fingerprints);
    return rec;
}

}  // namespace

// ========== Initiate ==========

TEST_F(SqliteStoreTest, test_initiate_creates_environment_once) {
    auto first = store_->initiate_execution("default", "numpy 1.26", "3.11", {});
    auto second = store_->initiate_execution("default", "numpy 1.26", "3.11", {});
    EXPECT_GT(first.exec_id, 0);
    EXPECT_EQ(first.exec_id, second.exec_id);
    EXPECT_FALSE(second.packages_changed);
    EXPECT_TRUE(second.changed_packages.empty());
    EXPECT_TRUE(second.filenames.empty());
    EXPECT_EQ(count("SELECT count(*) FROM environment"), 1);
}

TEST_F(SqliteStoreTest, test_environments_are_separate) {
    auto a = store_->initiate_execution("py311", "", "3.11", {});
    auto b = store_->initiate_execution("py312", "", "3.12", {});
    EXPECT_NE(a.exec_id, b.exec_id);
}

TEST_F(SqliteStoreTest, test_initiate_reports_changed_packages) {
    initiate("numpy 1.26, requests 2.31");
    auto result = store_->initiate_execution("default", "numpy 1.27, requests 2.31", "3.11.4", {});
    EXPECT_TRUE(result.packages_changed);
    EXPECT_EQ(result.changed_packages, (std::vector<std::string>{"numpy"}));

    auto again = store_->initiate_execution("default", "numpy 1.27, requests 2.31", "3.11.4", {});
    EXPECT_FALSE(again.packages_changed);
}

TEST_F(SqliteStoreTest, test_initiate_reports_runtime_change) {
    initiate("numpy 1.26", "3.11.4");
    auto result = store_->initiate_execution("default", "numpy 1.27", "3.12.0", {});
    EXPECT_TRUE(result.packages_changed);
    EXPECT_EQ(result.changed_packages, (std::vector<std::string>{RUNTIME_CHANGED_PACKAGE}));
}

TEST_F(SqliteStoreTest, test_initiate_writes_metadata_for_execution) {
    auto result = store_->initiate_execution("default", "", "3.11", {{"run_id", "4242"}});
    EXPECT_EQ(store_->fetch_attribute("run_id", result.exec_id), "4242");
    EXPECT_FALSE(store_->fetch_attribute("run_id", std::nullopt).has_value());
}

TEST_F(SqliteStoreTest, test_initiate_lists_recorded_files) {
    int64_t exec_id = initiate();
    TestRecords records;
    records["tests/test_a.py::test_one"] = record({fingerprint("tests/test_a.py", "aaa", {1}),
                                                   fingerprint("src/a.py", "bbb", {2})});
    store_->insert_test_file_fps(exec_id, records);

    auto result = store_->initiate_execution("default", "numpy 1.26, requests 2.31", "3.11.4", {});
    EXPECT_EQ(result.filenames, (std::vector<std::string>{"src/a.py", "tests/test_a.py"}));
}

// ========== Attributes ==========

TEST_F(SqliteStoreTest, test_attributes_are_scoped) {
    int64_t exec_id = initiate();
    store_->write_attribute("last_commit", "abc", std::nullopt);
    store_->write_attribute("last_commit", "def", exec_id);
    EXPECT_EQ(store_->fetch_attribute("last_commit", std::nullopt), "abc");
    EXPECT_EQ(store_->fetch_attribute("last_commit", exec_id), "def");

    store_->write_attribute("last_commit", "xyz", std::nullopt);
    EXPECT_EQ(store_->fetch_attribute("last_commit", std::nullopt), "xyz");
    EXPECT_FALSE(store_->fetch_attribute("missing", std::nullopt).has_value());
}

// ========== Insert ==========

TEST_F(SqliteStoreTest, test_insert_and_list_tests) {
    int64_t exec_id = initiate();
    TestRecords records;
    records["tests/test_a.py::test_one"] = record({fingerprint("tests/test_a.py", "aaa", {1})}, 0.5);
    records["tests/test_a.py::test_two"] = record({fingerprint("tests/test_a.py", "aaa", {1})}, 1.5, true);
    store_->insert_test_file_fps(exec_id, records);

    auto tests = store_->all_test_executions(exec_id);
    ASSERT_EQ(tests.size(), 2u);
    EXPECT_DOUBLE_EQ(tests["tests/test_a.py::test_one"].duration, 0.5);
    EXPECT_FALSE(tests["tests/test_a.py::test_one"].failed);
    EXPECT_TRUE(tests["tests/test_a.py::test_two"].failed);
    EXPECT_EQ(tests["tests/test_a.py::test_two"].forced, false);
}

TEST_F(SqliteStoreTest, test_identical_fingerprints_share_one_row) {
    int64_t exec_id = initiate();
    TestRecords records;
    records["tests/test_a.py::test_one"] = record({fingerprint("src/add.py", "fff", {10, 11})});
    records["tests/test_a.py::test_two"] = record({fingerprint("src/add.py", "fff", {10, 11})});
    store_->insert_test_file_fps(exec_id, records);

    EXPECT_EQ(store_->filenames_fingerprints(exec_id).size(), 1u);
    EXPECT_EQ(count("SELECT count(*) FROM file_fp"), 1);
    EXPECT_EQ(count("SELECT count(*) FROM test_execution_file_fp"), 2);
}

TEST_F(SqliteStoreTest, test_reinsert_replaces_test_rows) {
    int64_t exec_id = initiate();
    TestRecords first;
    first["tests/test_a.py::test_one"] = record({fingerprint("src/a.py", "v1", {1})}, 1.0, true);
    first["tests/test_a.py::test_two"] = record({fingerprint("src/a.py", "v1", {1})});
    store_->insert_test_file_fps(exec_id, first);

    TestRecords second;
    second["tests/test_a.py::test_one"] = record({fingerprint("src/b.py", "v1", {2})}, 2.0, false);
    store_->insert_test_file_fps(exec_id, second);

    auto tests = store_->all_test_executions(exec_id);
    ASSERT_EQ(tests.size(), 2u);
    EXPECT_FALSE(tests["tests/test_a.py::test_one"].failed);
    EXPECT_DOUBLE_EQ(tests["tests/test_a.py::test_one"].duration, 2.0);
    EXPECT_EQ(store_->filenames(exec_id), (std::vector<std::string>{"src/a.py", "src/b.py"}));
    EXPECT_EQ(count("SELECT count(*) FROM test_execution"), 2);
}

TEST_F(SqliteStoreTest, test_empty_fsha_is_stored_as_null) {
    int64_t exec_id = initiate();
    TestRecords records;
    records["tests/test_new.py::test_x"] = record({fingerprint("tests/test_new.py", "", {placeholder_checksum()}, 0)});
    store_->insert_test_file_fps(exec_id, records);
    EXPECT_EQ(count("SELECT count(*) FROM file_fp WHERE fsha IS NULL"), 1);

    // A second placeholder for the same file reuses the row.
    TestRecords more;
    more["tests/test_new.py::test_y"] = record({fingerprint("tests/test_new.py", "", {placeholder_checksum()}, 0)});
    store_->insert_test_file_fps(exec_id, more);
    EXPECT_EQ(count("SELECT count(*) FROM file_fp"), 1);
}

TEST_F(SqliteStoreTest, test_delete_test_executions) {
    int64_t exec_id = initiate();
    TestRecords records;
    records["tests/test_a.py::test_one"] = record({fingerprint("src/a.py", "v1", {1})});
    records["tests/test_a.py::test_two"] = record({fingerprint("src/a.py", "v1", {1})});
    store_->insert_test_file_fps(exec_id, records);

    store_->delete_test_executions(exec_id, {"tests/test_a.py::test_one", "tests/test_a.py::unknown"});
    auto tests = store_->all_test_executions(exec_id);
    ASSERT_EQ(tests.size(), 1u);
    EXPECT_TRUE(tests.count("tests/test_a.py::test_two"));
    EXPECT_EQ(count("SELECT count(*) FROM test_execution_file_fp"), 1);
}

TEST_F(SqliteStoreTest, test_tests_are_scoped_to_environment) {
    int64_t a = store_->initiate_execution("py311", "", "3.11", {}).exec_id;
    int64_t b = store_->initiate_execution("py312", "", "3.12", {}).exec_id;
    TestRecords records;
    records["tests/test_a.py::test_one"] = record({fingerprint("src/a.py", "v1", {1})});
    store_->insert_test_file_fps(a, records);

    EXPECT_EQ(store_->all_test_executions(a).size(), 1u);
    EXPECT_TRUE(store_->all_test_executions(b).empty());
    EXPECT_TRUE(store_->filenames(b).empty());
}

// ========== Unknown files ==========

TEST_F(SqliteStoreTest, test_fetch_unknown_files) {
    int64_t exec_id = initiate();
    TestRecords records;
    records["tests/test_a.py::test_one"] = record({fingerprint("src/same.py", "s1", {1}),
                                                   fingerprint("src/changed.py", "c1", {2}),
                                                   fingerprint("src/deleted.py", "d1", {3})});
    records["tests/test_new.py::test_x"] = record({fingerprint("tests/test_new.py", "", {placeholder_checksum()})});
    store_->insert_test_file_fps(exec_id, records);

    auto unknown = store_->fetch_unknown_files(exec_id, {{"src/same.py", "s1"},
                                                         {"src/changed.py", "c2"},
                                                         {"tests/test_new.py", "n1"}});
    EXPECT_EQ(unknown, (std::vector<std::string>{"src/changed.py", "src/deleted.py", "tests/test_new.py"}));
}

TEST_F(SqliteStoreTest, test_file_with_several_versions_is_unknown_if_any_differs) {
    int64_t exec_id = initiate();
    TestRecords records;
    records["tests/test_a.py::test_one"] = record({fingerprint("src/a.py", "old", {1})});
    records["tests/test_a.py::test_two"] = record({fingerprint("src/a.py", "new", {1})});
    store_->insert_test_file_fps(exec_id, records);

    EXPECT_EQ(store_->fetch_unknown_files(exec_id, {{"src/a.py", "new"}}),
              (std::vector<std::string>{"src/a.py"}));
}

// ========== Determine ==========

TEST_F(SqliteStoreTest, test_determine_by_checksums) {
    int64_t exec_id = initiate();
    TestRecords records;
    records["tests/test_add.py::test_add"] = record({fingerprint("src/calc.py", "v1", {10, 11})});
    records["tests/test_sub.py::test_sub"] = record({fingerprint("src/calc.py", "v1", {10, 12})});
    records["tests/test_other.py::test_other"] = record({fingerprint("src/other.py", "o1", {20})});
    store_->insert_test_file_fps(exec_id, records);

    // Block 11 changed; blocks 10 and 12 are intact.
    FileChecksums checksums;
    checksums["src/calc.py"] = std::vector<int32_t>{10, 12, 13};
    auto result = store_->determine_tests(exec_id, checksums, {}, {});
    EXPECT_EQ(result.affected, (std::set<std::string>{"tests/test_add.py::test_add"}));
    EXPECT_TRUE(result.failing.empty());
}

TEST_F(SqliteStoreTest, test_determine_deleted_file_affects_all_its_tests) {
    int64_t exec_id = initiate();
    TestRecords records;
    records["tests/test_a.py::test_one"] = record({fingerprint("src/gone.py", "g1", {1})});
    records["tests/test_a.py::test_two"] = record({fingerprint("src/gone.py", "g1", {2})});
    records["tests/test_b.py::test_three"] = record({fingerprint("src/kept.py", "k1", {3})});
    store_->insert_test_file_fps(exec_id, records);

    FileChecksums checksums;
    checksums["src/gone.py"] = std::nullopt;
    auto result = store_->determine_tests(exec_id, checksums, {}, {});
    EXPECT_EQ(result.affected,
              (std::set<std::string>{"tests/test_a.py::test_one", "tests/test_a.py::test_two"}));
}

TEST_F(SqliteStoreTest, test_determine_placeholder_is_always_affected) {
    int64_t exec_id = initiate();
    TestRecords records;
    records["tests/test_new.py::test_x"] = record({fingerprint("tests/test_new.py", "", {placeholder_checksum()})});
    store_->insert_test_file_fps(exec_id, records);

    Module module("def test_x():\n    assert True\n", "tests/test_new.py");
    FileChecksums checksums;
    checksums["tests/test_new.py"] = module.checksums();
    auto result = store_->determine_tests(exec_id, checksums, {}, {});
    EXPECT_TRUE(result.affected.count("tests/test_new.py::test_x"));
}

TEST_F(SqliteStoreTest, test_determine_file_dependencies) {
    int64_t exec_id = initiate();
    TestRecords records;
    TestRecord reads_config = record({fingerprint("tests/test_a.py", "t1", {1})});
    reads_config.file_deps.insert({"config/settings.json", "sha-1"});
    TestRecord reads_data = record({fingerprint("tests/test_a.py", "t1", {1})});
    reads_data.file_deps.insert({"data/input.csv", "sha-2"});
    TestRecord reads_nothing = record({fingerprint("tests/test_a.py", "t1", {1})});
    records["tests/test_a.py::test_config"] = reads_config;
    records["tests/test_a.py::test_data"] = reads_data;
    records["tests/test_a.py::test_plain"] = reads_nothing;
    store_->insert_test_file_fps(exec_id, records);

    EXPECT_EQ(store_->file_dependency_filenames(exec_id),
              (std::vector<std::string>{"config/settings.json", "data/input.csv"}));

    // settings.json changed, input.csv is gone.
    auto result = store_->determine_tests(exec_id, {}, {{"config/settings.json", "sha-9"}}, {});
    EXPECT_EQ(result.affected,
              (std::set<std::string>{"tests/test_a.py::test_config", "tests/test_a.py::test_data"}));

    result = store_->determine_tests(exec_id, {}, {{"config/settings.json", "sha-1"}, {"data/input.csv", "sha-2"}}, {});
    EXPECT_TRUE(result.affected.empty());
}

TEST_F(SqliteStoreTest, test_determine_changed_packages) {
    int64_t exec_id = initiate();
    TestRecords records;
    TestRecord uses_numpy = record({fingerprint("tests/test_np.py", "n1", {1})});
    uses_numpy.external_deps = {"numpy"};
    TestRecord uses_requests = record({fingerprint("tests/test_http.py", "h1", {2})});
    uses_requests.external_deps = {"requests"};
    TestRecord pure = record({fingerprint("tests/test_pure.py", "p1", {3})});
    records["tests/test_np.py::test_array"] = uses_numpy;
    records["tests/test_http.py::test_get"] = uses_requests;
    records["tests/test_pure.py::test_math"] = pure;
    store_->insert_test_file_fps(exec_id, records);

    auto result = store_->determine_tests(exec_id, {}, {}, {"numpy"});
    EXPECT_EQ(result.affected, (std::set<std::string>{"tests/test_np.py::test_array"}));

    result = store_->determine_tests(exec_id, {}, {}, {RUNTIME_CHANGED_PACKAGE});
    EXPECT_EQ(result.affected.size(), 3u);
}

TEST_F(SqliteStoreTest, test_determine_reports_failing_tests) {
    int64_t exec_id = initiate();
    TestRecords records;
    records["tests/test_a.py::test_ok"] = record({fingerprint("tests/test_a.py", "t1", {1})});
    records["tests/test_a.py::test_bad"] = record({fingerprint("tests/test_a.py", "t1", {1})}, 1.0, true);
    store_->insert_test_file_fps(exec_id, records);

    auto result = store_->determine_tests(exec_id, {}, {}, {});
    EXPECT_TRUE(result.affected.empty());
    EXPECT_EQ(result.failing, (std::set<std::string>{"tests/test_a.py::test_bad"}));
}

TEST_F(SqliteStoreTest, test_determine_resets_forced) {
    int64_t exec_id = initiate();
    TestRecords records;
    TestRecord forced = record({fingerprint("tests/test_a.py", "t1", {1})});
    forced.forced = true;
    records["tests/test_a.py::test_one"] = forced;
    store_->insert_test_file_fps(exec_id, records);

    store_->determine_tests(exec_id, {}, {}, {});
    EXPECT_FALSE(store_->all_test_executions(exec_id)["tests/test_a.py::test_one"].forced.has_value());
}

TEST_F(SqliteStoreTest, test_determine_malformed_blob_is_affected) {
    int64_t exec_id = initiate();
    TestRecords records;
    records["tests/test_a.py::test_one"] = record({fingerprint("src/a.py", "v1", {1})});
    store_->insert_test_file_fps(exec_id, records);
    store_->with_database([](Database& db) { db.exec("UPDATE file_fp SET method_checksums = x'010203'"); });

    FileChecksums checksums;
    checksums["src/a.py"] = std::vector<int32_t>{1};
    auto result = store_->determine_tests(exec_id, checksums, {}, {});
    EXPECT_TRUE(result.affected.count("tests/test_a.py::test_one"));
}

TEST_F(SqliteStoreTest, test_determine_dangling_fingerprint_link_is_affected) {
    int64_t exec_id = initiate();
    TestRecords records;
    records["tests/test_a.py::test_one"] = record({fingerprint("src/a.py", "v1", {1})});
    records["tests/test_b.py::test_two"] = record({fingerprint("src/b.py", "v1", {2})});
    store_->insert_test_file_fps(exec_id, records);
    store_->with_database([](Database& db) { db.exec("DELETE FROM file_fp WHERE filename = 'src/a.py'"); });

    auto result = store_->determine_tests(exec_id, {}, {}, {});
    EXPECT_EQ(result.affected, (std::set<std::string>{"tests/test_a.py::test_one"}));
}

// ========== Fingerprint rows ==========

TEST_F(SqliteStoreTest, test_update_mtimes) {
    int64_t exec_id = initiate();
    TestRecords records;
    records["tests/test_a.py::test_one"] = record({fingerprint("src/a.py", "v1", {1}, 100)});
    store_->insert_test_file_fps(exec_id, records);

    auto rows = store_->filenames_fingerprints(exec_id);
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].mtime, 100);
    EXPECT_EQ(rows[0].checksums, (std::vector<int32_t>{1}));

    store_->update_mtimes({{rows[0].id, 200, "v1"}});
    rows = store_->filenames_fingerprints(exec_id);
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].mtime, 200);
    EXPECT_EQ(rows[0].fsha, "v1");
}

TEST_F(SqliteStoreTest, test_fetch_changed_file_data) {
    int64_t exec_id = initiate();
    TestRecords records;
    records["tests/test_a.py::test_one"] = record({fingerprint("src/a.py", "v1", {1, 2})}, 0.75, true);
    records["tests/test_b.py::test_two"] = record({fingerprint("src/b.py", "v1", {3})});
    store_->insert_test_file_fps(exec_id, records);

    int64_t a_id = 0;
    for (const auto& row : store_->filenames_fingerprints(exec_id)) {
        if (row.filename == "src/a.py") a_id = row.id;
    }
    auto data = store_->fetch_changed_file_data(exec_id, {a_id});
    ASSERT_EQ(data.size(), 1u);
    EXPECT_EQ(data[0].test_name, "tests/test_a.py::test_one");
    EXPECT_EQ(data[0].checksums, (std::vector<int32_t>{1, 2}));
    EXPECT_TRUE(data[0].failed);
    EXPECT_DOUBLE_EQ(data[0].duration, 0.75);
}

// ========== Saving stats ==========

TEST_F(SqliteStoreTest, test_saving_stats_count_tests_not_rerun) {
    int64_t exec_id = initiate();
    TestRecords records;
    records["tests/test_a.py::test_a"] = record({fingerprint("tests/test_a.py", "t1", {1})}, 1.0);
    records["tests/test_a.py::test_b"] = record({fingerprint("tests/test_a.py", "t1", {1})}, 2.0);
    records["tests/test_a.py::test_c"] = record({fingerprint("tests/test_a.py", "t1", {1})}, 3.0);
    store_->insert_test_file_fps(exec_id, records);

    // Next run: every test starts unforced, only test_b runs again.
    store_->determine_tests(exec_id, {}, {}, {});
    TestRecords rerun;
    rerun["tests/test_a.py::test_b"] = record({fingerprint("tests/test_a.py", "t1", {1})}, 2.0);
    store_->insert_test_file_fps(exec_id, rerun);

    auto stats = store_->fetch_saving_stats(exec_id, true);
    EXPECT_EQ(stats.run_all_tests, 3);
    EXPECT_DOUBLE_EQ(stats.run_all_time, 6.0);
    EXPECT_EQ(stats.run_saved_tests, 2);
    EXPECT_DOUBLE_EQ(stats.run_saved_time, 4.0);
    EXPECT_EQ(stats.total_all_tests, 0);

    auto no_select = store_->fetch_saving_stats(exec_id, false);
    EXPECT_EQ(no_select.run_saved_tests, 0);
    EXPECT_DOUBLE_EQ(no_select.run_saved_time, 0.0);
}

TEST_F(SqliteStoreTest, test_finish_accumulates_totals) {
    int64_t exec_id = initiate();
    TestRecords records;
    records["tests/test_a.py::test_a"] = record({fingerprint("tests/test_a.py", "t1", {1})}, 1.0);
    records["tests/test_a.py::test_b"] = record({fingerprint("tests/test_a.py", "t1", {1})}, 2.0);
    store_->insert_test_file_fps(exec_id, records);
    store_->determine_tests(exec_id, {}, {}, {});

    store_->finish_execution(exec_id, 5.0, true);
    store_->finish_execution(exec_id, 5.0, true);

    auto stats = store_->fetch_saving_stats(exec_id, true);
    EXPECT_EQ(stats.total_all_tests, 4);
    EXPECT_EQ(stats.total_saved_tests, 4);
    EXPECT_DOUBLE_EQ(stats.total_all_time, 6.0);
    EXPECT_DOUBLE_EQ(stats.total_saved_time, 6.0);
    EXPECT_EQ(count("SELECT sessions FROM environment"), 2);
    EXPECT_EQ(count("SELECT count(*) FROM run_infos"), 2);
}

TEST_F(SqliteStoreTest, test_finish_records_run_id) {
    auto exec_id = store_->initiate_execution("default", "", "3.11", {{"run_id", "run-77"}}).exec_id;
    store_->finish_execution(exec_id, 1.0, true);
    EXPECT_EQ(count("SELECT count(*) FROM run_uid WHERE repo_run_id = 'run-77'"), 1);
}

TEST_F(SqliteStoreTest, test_finish_removes_orphaned_rows) {
    int64_t exec_id = initiate();
    TestRecords first;
    TestRecord old_version = record({fingerprint("src/a.py", "v1", {1})});
    old_version.file_deps.insert({"data/in.csv", "d1"});
    first["tests/test_a.py::test_one"] = old_version;
    store_->insert_test_file_fps(exec_id, first);

    TestRecords second;
    TestRecord new_version = record({fingerprint("src/a.py", "v2", {2})});
    new_version.file_deps.insert({"data/in.csv", "d2"});
    second["tests/test_a.py::test_one"] = new_version;
    store_->insert_test_file_fps(exec_id, second);
    EXPECT_EQ(count("SELECT count(*) FROM file_fp"), 2);

    store_->finish_execution(exec_id, 1.0, true);
    EXPECT_EQ(count("SELECT count(*) FROM file_fp"), 1);
    EXPECT_EQ(count("SELECT count(*) FROM file_dependency"), 1);
    EXPECT_EQ(count("SELECT count(*) FROM file_fp WHERE fsha = 'v2'"), 1);
    EXPECT_EQ(store_->id_cache().entry_count(), 0u);
}

// ========== Lifecycle ==========

TEST_F(SqliteStoreTest, test_data_survives_reopen) {
    int64_t exec_id = initiate();
    TestRecords records;
    records["tests/test_a.py::test_one"] = record({fingerprint("src/a.py", "v1", {1})});
    store_->insert_test_file_fps(exec_id, records);
    std::string path = store_->path();
    store_->close();
    store_->close();

    store_ = std::make_unique<SqliteStore>(path);
    auto result = store_->initiate_execution("default", "numpy 1.26, requests 2.31", "3.11.4", {});
    EXPECT_EQ(result.exec_id, exec_id);
    EXPECT_EQ(store_->all_test_executions(exec_id).size(), 1u);
}

TEST_F(SqliteStoreTest, test_unwritable_location_is_config_error) {
    std::ofstream(dir_ / "blocker") << "not a directory";
    EXPECT_THROW(SqliteStore((dir_ / "blocker" / "nested" / "data.db").string()), StoreConfigError);
}

TEST_F(SqliteStoreTest, test_describe_names_path) {
    EXPECT_NE(store_->describe().find("data.db"), std::string::npos);
}
