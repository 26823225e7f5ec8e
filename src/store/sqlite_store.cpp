#include "store/sqlite_store.h"
#include "common/errors.h"
#include "fingerprint/module.h"
#include "store/packages.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <filesystem>

namespace testsieve {

namespace {

const char* SCHEMA = R"(
CREATE TABLE IF NOT EXISTS metadata (dataid TEXT PRIMARY KEY, data TEXT);

CREATE TABLE IF NOT EXISTS environment (
    id INTEGER PRIMARY KEY ASC,
    environment_name TEXT NOT NULL UNIQUE,
    system_packages TEXT,
    runtime_version TEXT,
    sessions INTEGER NOT NULL DEFAULT 0,
    last_duration REAL,
    create_date TEXT DEFAULT (datetime('now'))
);

CREATE TABLE IF NOT EXISTS test_execution (
    id INTEGER PRIMARY KEY ASC,
    environment_id INTEGER,
    test_name TEXT,
    duration FLOAT,
    failed BIT,
    forced BIT,
    FOREIGN KEY(environment_id) REFERENCES environment(id) ON DELETE CASCADE
);
CREATE INDEX IF NOT EXISTS test_execution_fk_name ON test_execution (environment_id, test_name);

CREATE TABLE IF NOT EXISTS file_fp (
    id INTEGER PRIMARY KEY,
    filename TEXT,
    method_checksums BLOB,
    mtime INTEGER,
    fsha TEXT,
    UNIQUE (filename, fsha, method_checksums)
);
CREATE INDEX IF NOT EXISTS file_fp_filename ON file_fp (filename);

CREATE TABLE IF NOT EXISTS test_execution_file_fp (
    test_execution_id INTEGER,
    fingerprint_id INTEGER,
    FOREIGN KEY(test_execution_id) REFERENCES test_execution(id) ON DELETE CASCADE
);
CREATE INDEX IF NOT EXISTS test_execution_file_fp_both ON test_execution_file_fp (test_execution_id, fingerprint_id);
CREATE INDEX IF NOT EXISTS test_execution_file_fp_fp_id ON test_execution_file_fp (fingerprint_id);

CREATE TABLE IF NOT EXISTS file_dependency (
    id INTEGER PRIMARY KEY,
    filename TEXT NOT NULL,
    sha TEXT NOT NULL,
    UNIQUE (filename, sha)
);

CREATE TABLE IF NOT EXISTS test_execution_file_dependency (
    test_execution_id INTEGER,
    file_dependency_id INTEGER,
    FOREIGN KEY(test_execution_id) REFERENCES test_execution(id) ON DELETE CASCADE,
    FOREIGN KEY(file_dependency_id) REFERENCES file_dependency(id)
);
CREATE INDEX IF NOT EXISTS tefd_both ON test_execution_file_dependency (test_execution_id, file_dependency_id);

CREATE TABLE IF NOT EXISTS test_external_dependency (
    id INTEGER PRIMARY KEY,
    test_execution_id INTEGER,
    package_name TEXT NOT NULL,
    FOREIGN KEY(test_execution_id) REFERENCES test_execution(id) ON DELETE CASCADE
);
CREATE INDEX IF NOT EXISTS ted_te_id ON test_external_dependency (test_execution_id);
CREATE INDEX IF NOT EXISTS ted_pkg_name ON test_external_dependency (package_name);

CREATE TABLE IF NOT EXISTS run_uid (
    id INTEGER PRIMARY KEY,
    environment_id INTEGER,
    repo_run_id TEXT NULL,
    create_date TEXT DEFAULT (datetime('now'))
);

CREATE TABLE IF NOT EXISTS run_infos (
    run_time_saved REAL,
    run_time_all REAL,
    tests_saved INTEGER,
    tests_all INTEGER,
    run_uid INTEGER,
    FOREIGN KEY(run_uid) REFERENCES run_uid(id)
);
)";

std::string attribute_key(const std::string& attribute, std::optional<int64_t> exec_id) {
    return (exec_id ? std::to_string(*exec_id) : std::string("global")) + ":" + attribute;
}

void bind_optional_text(Statement& stmt, int index, const std::string& value) {
    if (value.empty()) {
        stmt.bind_null(index);
    } else {
        stmt.bind(index, value);
    }
}

double parse_double_or_zero(const std::optional<std::string>& value) {
    if (!value) return 0.0;
    try {
        return std::stod(*value);
    } catch (const std::exception&) {
        return 0.0;
    }
}

}  // namespace

SqliteStore::SqliteStore(const std::string& path, size_t id_cache_capacity)
    : path_(path),
      id_cache_(id_cache_capacity) {
    std::filesystem::path parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            throw StoreConfigError("Cannot create directory " + parent.string() + ": " + ec.message());
        }
    }

    db_ = std::make_unique<Database>(path);
    try {
        db_->exec("PRAGMA journal_mode=WAL;"
                  "PRAGMA synchronous=NORMAL;"
                  "PRAGMA foreign_keys=ON;");
        init_schema();
    } catch (const StoreError& e) {
        throw StoreConfigError("Cannot initialize " + path + ": " + e.what());
    }
    spdlog::debug("Opened fingerprint store {}", path);
}

SqliteStore::~SqliteStore() {
    close();
}

void SqliteStore::init_schema() {
    db_->exec(SCHEMA);
}

std::string SqliteStore::describe() const {
    return "embedded store " + path_;
}

void SqliteStore::close() {
    std::lock_guard lock(mutex_);
    if (db_ && db_->is_open()) {
        db_->close();
        spdlog::debug("Closed fingerprint store {}", path_);
    }
}

InitiateResult SqliteStore::initiate_execution(const std::string& environment,
                                               const std::string& packages,
                                               const std::string& runtime_version,
                                               const std::map<std::string, std::string>& metadata) {
    std::lock_guard lock(mutex_);
    InitiateResult result;
    Transaction tx(*db_);

    auto find = db_->prepare(
        "SELECT id, system_packages, runtime_version FROM environment WHERE environment_name = ?");
    find.bind(1, environment);
    if (find.step()) {
        result.exec_id = find.column_int64(0);
        std::string old_packages = find.column_text(1);
        std::string old_runtime = find.column_text(2);

        if (old_runtime != runtime_version) {
            result.changed_packages.push_back(RUNTIME_CHANGED_PACKAGE);
        } else if (old_packages != packages) {
            auto changed = compute_changed_packages(old_packages, packages);
            result.changed_packages.assign(changed.begin(), changed.end());
        }

        if (old_packages != packages || old_runtime != runtime_version) {
            auto update = db_->prepare(
                "UPDATE environment SET system_packages = ?, runtime_version = ? WHERE id = ?");
            update.bind(1, packages).bind(2, runtime_version).bind(3, result.exec_id);
            update.run();
            spdlog::info("Environment {} packages updated, {} changed", environment,
                         result.changed_packages.size());
        }
    } else {
        auto insert = db_->prepare(
            "INSERT INTO environment (environment_name, system_packages, runtime_version) VALUES (?, ?, ?)");
        insert.bind(1, environment).bind(2, packages).bind(3, runtime_version);
        insert.run();
        result.exec_id = db_->last_insert_rowid();
        spdlog::info("Created environment {} with id {}", environment, result.exec_id);
    }

    for (const auto& [key, value] : metadata) {
        write_attribute_locked(key, value, result.exec_id);
    }

    auto names = db_->prepare(R"(
        SELECT DISTINCT f.filename
        FROM test_execution te
        JOIN test_execution_file_fp te_ffp ON te.id = te_ffp.test_execution_id
        JOIN file_fp f ON te_ffp.fingerprint_id = f.id
        WHERE te.environment_id = ?
        ORDER BY f.filename)");
    names.bind(1, result.exec_id);
    while (names.step()) {
        result.filenames.push_back(names.column_text(0));
    }

    tx.commit();
    result.packages_changed = !result.changed_packages.empty();
    return result;
}

std::vector<std::string> SqliteStore::fetch_unknown_files(
    int64_t exec_id, const std::map<std::string, std::string>& files_fshas) {
    std::lock_guard lock(mutex_);
    auto stmt = db_->prepare(R"(
        SELECT DISTINCT f.filename, f.fsha
        FROM test_execution te
        JOIN test_execution_file_fp te_ffp ON te.id = te_ffp.test_execution_id
        JOIN file_fp f ON te_ffp.fingerprint_id = f.id
        WHERE te.environment_id = ?)");
    stmt.bind(1, exec_id);

    std::set<std::string> unknown;
    while (stmt.step()) {
        std::string filename = stmt.column_text(0);
        auto it = files_fshas.find(filename);
        if (stmt.is_null(1) || it == files_fshas.end() || it->second != stmt.column_text(1)) {
            unknown.insert(std::move(filename));
        }
    }
    return {unknown.begin(), unknown.end()};
}

DetermineResult SqliteStore::determine_tests(int64_t exec_id,
                                             const FileChecksums& files_checksums,
                                             const std::map<std::string, std::string>& file_dep_shas,
                                             const std::vector<std::string>& changed_packages) {
    std::lock_guard lock(mutex_);
    DetermineResult result;
    Transaction tx(*db_);

    auto reset = db_->prepare("UPDATE test_execution SET forced = NULL WHERE environment_id = ?");
    reset.bind(1, exec_id);
    reset.run();

    auto fingerprints = db_->prepare(R"(
        SELECT te.test_name, f.method_checksums
        FROM test_execution te
        JOIN test_execution_file_fp te_ffp ON te.id = te_ffp.test_execution_id
        JOIN file_fp f ON te_ffp.fingerprint_id = f.id
        WHERE te.environment_id = ? AND f.filename = ?)");
    for (const auto& [filename, current] : files_checksums) {
        fingerprints.reset();
        fingerprints.bind(1, exec_id).bind(2, filename);
        while (fingerprints.step()) {
            std::string test_name = fingerprints.column_text(0);
            if (!current) {
                result.affected.insert(std::move(test_name));
                continue;
            }
            std::string blob = fingerprints.column_blob(1);
            if (blob.size() % 4 != 0 || !checksums_match(*current, blob_to_checksums(blob))) {
                result.affected.insert(std::move(test_name));
            }
        }
    }

    // Links whose fingerprint row is gone cannot be verified.
    auto dangling = db_->prepare(R"(
        SELECT DISTINCT te.test_name
        FROM test_execution te
        JOIN test_execution_file_fp te_ffp ON te.id = te_ffp.test_execution_id
        LEFT JOIN file_fp f ON te_ffp.fingerprint_id = f.id
        WHERE te.environment_id = ? AND f.id IS NULL)");
    dangling.bind(1, exec_id);
    while (dangling.step()) {
        result.affected.insert(dangling.column_text(0));
    }

    auto file_deps = db_->prepare(R"(
        SELECT te.test_name, fd.filename, fd.sha
        FROM test_execution te
        JOIN test_execution_file_dependency tefd ON te.id = tefd.test_execution_id
        JOIN file_dependency fd ON tefd.file_dependency_id = fd.id
        WHERE te.environment_id = ?)");
    file_deps.bind(1, exec_id);
    while (file_deps.step()) {
        auto it = file_dep_shas.find(file_deps.column_text(1));
        if (it == file_dep_shas.end() || it->second != file_deps.column_text(2)) {
            result.affected.insert(file_deps.column_text(0));
        }
    }

    bool runtime_changed = std::find(changed_packages.begin(), changed_packages.end(),
                                     RUNTIME_CHANGED_PACKAGE) != changed_packages.end();
    if (runtime_changed) {
        auto all = db_->prepare("SELECT DISTINCT test_name FROM test_execution WHERE environment_id = ?");
        all.bind(1, exec_id);
        while (all.step()) {
            result.affected.insert(all.column_text(0));
        }
    } else if (!changed_packages.empty()) {
        auto by_package = db_->prepare(R"(
            SELECT DISTINCT te.test_name
            FROM test_execution te
            JOIN test_external_dependency ted ON te.id = ted.test_execution_id
            WHERE te.environment_id = ? AND ted.package_name = ?)");
        for (const auto& package : changed_packages) {
            by_package.reset();
            by_package.bind(1, exec_id).bind(2, package);
            while (by_package.step()) {
                result.affected.insert(by_package.column_text(0));
            }
        }
    }

    auto failing = db_->prepare(
        "SELECT test_name FROM test_execution WHERE environment_id = ? AND failed = 1");
    failing.bind(1, exec_id);
    while (failing.step()) {
        result.failing.insert(failing.column_text(0));
    }

    tx.commit();
    return result;
}

int64_t SqliteStore::fetch_or_create_file_fp(const FileFingerprint& fp) {
    std::string blob = checksums_to_blob(fp.checksums);
    std::string key = IdCache::fingerprint_key(fp.filename, fp.fsha, blob);
    if (auto cached = id_cache_.get(key)) return *cached;

    auto find = db_->prepare(
        "SELECT id FROM file_fp WHERE filename = ? AND fsha IS ? AND method_checksums = ?");
    find.bind(1, fp.filename);
    bind_optional_text(find, 2, fp.fsha);
    find.bind_blob(3, blob);

    int64_t id = 0;
    if (find.step()) {
        id = find.column_int64(0);
    } else {
        auto insert = db_->prepare(
            "INSERT INTO file_fp (filename, method_checksums, mtime, fsha) VALUES (?, ?, ?, ?)");
        insert.bind(1, fp.filename).bind_blob(2, blob).bind(3, fp.mtime);
        bind_optional_text(insert, 4, fp.fsha);
        insert.run();
        id = db_->last_insert_rowid();
    }
    id_cache_.put(key, id);
    return id;
}

int64_t SqliteStore::fetch_or_create_file_dependency(const FileDependency& dep) {
    auto find = db_->prepare("SELECT id FROM file_dependency WHERE filename = ? AND sha = ?");
    find.bind(1, dep.filename).bind(2, dep.sha);
    if (find.step()) return find.column_int64(0);

    auto insert = db_->prepare("INSERT INTO file_dependency (filename, sha) VALUES (?, ?)");
    insert.bind(1, dep.filename).bind(2, dep.sha);
    insert.run();
    return db_->last_insert_rowid();
}

void SqliteStore::insert_test_file_fps(int64_t exec_id, const TestRecords& records) {
    if (records.empty()) return;
    std::lock_guard lock(mutex_);
    Transaction tx(*db_);

    auto remove = db_->prepare("DELETE FROM test_execution WHERE environment_id = ? AND test_name = ?");
    auto insert = db_->prepare(
        "INSERT INTO test_execution (environment_id, test_name, duration, failed, forced) VALUES (?, ?, ?, ?, ?)");
    auto link_fp = db_->prepare(
        "INSERT INTO test_execution_file_fp (test_execution_id, fingerprint_id) VALUES (?, ?)");
    auto link_dep = db_->prepare(
        "INSERT INTO test_execution_file_dependency (test_execution_id, file_dependency_id) VALUES (?, ?)");
    auto link_pkg = db_->prepare(
        "INSERT INTO test_external_dependency (test_execution_id, package_name) VALUES (?, ?)");

    for (const auto& [test_name, record] : records) {
        remove.reset();
        remove.bind(1, exec_id).bind(2, test_name);
        remove.run();

        insert.reset();
        insert.bind(1, exec_id)
              .bind(2, test_name)
              .bind(3, record.duration)
              .bind(4, static_cast<int64_t>(record.failed ? 1 : 0))
              .bind(5, record.forced);
        insert.run();
        int64_t te_id = db_->last_insert_rowid();

        for (const auto& fp : record.fingerprints) {
            link_fp.reset();
            link_fp.bind(1, te_id).bind(2, fetch_or_create_file_fp(fp));
            link_fp.run();
        }
        for (const auto& dep : record.file_deps) {
            link_dep.reset();
            link_dep.bind(1, te_id).bind(2, fetch_or_create_file_dependency(dep));
            link_dep.run();
        }
        for (const auto& package : record.external_deps) {
            link_pkg.reset();
            link_pkg.bind(1, te_id).bind(2, package);
            link_pkg.run();
        }
    }

    tx.commit();
    spdlog::debug("Stored {} test executions in {}", records.size(), path_);
}

void SqliteStore::delete_test_executions(int64_t exec_id, const std::vector<std::string>& test_names) {
    if (test_names.empty()) return;
    std::lock_guard lock(mutex_);
    Transaction tx(*db_);
    auto remove = db_->prepare("DELETE FROM test_execution WHERE environment_id = ? AND test_name = ?");
    for (const auto& name : test_names) {
        remove.reset();
        remove.bind(1, exec_id).bind(2, name);
        remove.run();
    }
    tx.commit();
}

std::map<std::string, TestExecutionInfo> SqliteStore::all_test_executions(int64_t exec_id) {
    std::lock_guard lock(mutex_);
    auto stmt = db_->prepare(
        "SELECT test_name, duration, failed, forced FROM test_execution WHERE environment_id = ?");
    stmt.bind(1, exec_id);
    std::map<std::string, TestExecutionInfo> tests;
    while (stmt.step()) {
        TestExecutionInfo info;
        info.duration = stmt.column_double(1);
        info.failed = stmt.column_int64(2) != 0;
        info.forced = stmt.column_optional_bool(3);
        tests[stmt.column_text(0)] = info;
    }
    return tests;
}

std::vector<std::string> SqliteStore::filenames(int64_t exec_id) {
    std::lock_guard lock(mutex_);
    auto stmt = db_->prepare(R"(
        SELECT DISTINCT f.filename
        FROM test_execution te
        JOIN test_execution_file_fp te_ffp ON te.id = te_ffp.test_execution_id
        JOIN file_fp f ON te_ffp.fingerprint_id = f.id
        WHERE te.environment_id = ?
        ORDER BY f.filename)");
    stmt.bind(1, exec_id);
    std::vector<std::string> names;
    while (stmt.step()) {
        names.push_back(stmt.column_text(0));
    }
    return names;
}

std::vector<FingerprintRow> SqliteStore::filenames_fingerprints(int64_t exec_id) {
    std::lock_guard lock(mutex_);
    auto stmt = db_->prepare(R"(
        SELECT DISTINCT f.id, f.filename, f.fsha, f.mtime, f.method_checksums
        FROM test_execution te
        JOIN test_execution_file_fp te_ffp ON te.id = te_ffp.test_execution_id
        JOIN file_fp f ON te_ffp.fingerprint_id = f.id
        WHERE te.environment_id = ?
        ORDER BY f.id)");
    stmt.bind(1, exec_id);
    std::vector<FingerprintRow> rows;
    while (stmt.step()) {
        FingerprintRow row;
        row.id = stmt.column_int64(0);
        row.filename = stmt.column_text(1);
        row.fsha = stmt.column_text(2);
        row.mtime = stmt.column_int64(3);
        row.checksums = blob_to_checksums(stmt.column_blob(4));
        rows.push_back(std::move(row));
    }
    return rows;
}

std::vector<std::string> SqliteStore::file_dependency_filenames(int64_t exec_id) {
    std::lock_guard lock(mutex_);
    auto stmt = db_->prepare(R"(
        SELECT DISTINCT fd.filename
        FROM test_execution te
        JOIN test_execution_file_dependency tefd ON te.id = tefd.test_execution_id
        JOIN file_dependency fd ON tefd.file_dependency_id = fd.id
        WHERE te.environment_id = ?
        ORDER BY fd.filename)");
    stmt.bind(1, exec_id);
    std::vector<std::string> names;
    while (stmt.step()) {
        names.push_back(stmt.column_text(0));
    }
    return names;
}

std::vector<ChangedFileData> SqliteStore::fetch_changed_file_data(
    int64_t exec_id, const std::vector<int64_t>& fingerprint_ids) {
    std::lock_guard lock(mutex_);
    auto stmt = db_->prepare(R"(
        SELECT f.filename, te.test_name, f.method_checksums, f.id, te.failed, te.duration
        FROM test_execution te
        JOIN test_execution_file_fp te_ffp ON te.id = te_ffp.test_execution_id
        JOIN file_fp f ON te_ffp.fingerprint_id = f.id
        WHERE te.environment_id = ? AND f.id = ?)");
    std::vector<ChangedFileData> rows;
    for (int64_t id : fingerprint_ids) {
        stmt.reset();
        stmt.bind(1, exec_id).bind(2, id);
        while (stmt.step()) {
            ChangedFileData row;
            row.filename = stmt.column_text(0);
            row.test_name = stmt.column_text(1);
            row.checksums = blob_to_checksums(stmt.column_blob(2));
            row.fingerprint_id = stmt.column_int64(3);
            row.failed = stmt.column_int64(4) != 0;
            row.duration = stmt.column_double(5);
            rows.push_back(std::move(row));
        }
    }
    return rows;
}

void SqliteStore::update_mtimes(const std::vector<MtimeUpdate>& updates) {
    if (updates.empty()) return;
    std::lock_guard lock(mutex_);
    Transaction tx(*db_);
    auto stmt = db_->prepare("UPDATE OR IGNORE file_fp SET mtime = ?, fsha = ? WHERE id = ?");
    for (const auto& update : updates) {
        stmt.reset();
        stmt.bind(1, update.mtime);
        bind_optional_text(stmt, 2, update.fsha);
        stmt.bind(3, update.fingerprint_id);
        stmt.run();
    }
    tx.commit();
    id_cache_.clear();
}

void SqliteStore::write_attribute_locked(const std::string& attribute, const std::string& data,
                                         std::optional<int64_t> exec_id) {
    auto stmt = db_->prepare("INSERT OR REPLACE INTO metadata (dataid, data) VALUES (?, ?)");
    stmt.bind(1, attribute_key(attribute, exec_id)).bind(2, data);
    stmt.run();
}

std::optional<std::string> SqliteStore::fetch_attribute_locked(const std::string& attribute,
                                                               std::optional<int64_t> exec_id) {
    auto stmt = db_->prepare("SELECT data FROM metadata WHERE dataid = ?");
    stmt.bind(1, attribute_key(attribute, exec_id));
    if (!stmt.step()) return std::nullopt;
    return stmt.column_text(0);
}

void SqliteStore::write_attribute(const std::string& attribute, const std::string& data,
                                  std::optional<int64_t> exec_id) {
    std::lock_guard lock(mutex_);
    write_attribute_locked(attribute, data, exec_id);
}

std::optional<std::string> SqliteStore::fetch_attribute(const std::string& attribute,
                                                        std::optional<int64_t> exec_id) {
    std::lock_guard lock(mutex_);
    return fetch_attribute_locked(attribute, exec_id);
}

SavingStats SqliteStore::saving_stats_locked(int64_t exec_id, bool select) {
    SavingStats stats;

    auto all = db_->prepare(
        "SELECT count(*), COALESCE(sum(duration), 0) FROM test_execution WHERE environment_id = ?");
    all.bind(1, exec_id);
    if (all.step()) {
        stats.run_all_tests = all.column_int64(0);
        stats.run_all_time = all.column_double(1);
    }

    if (select) {
        auto saved = db_->prepare(R"(
            SELECT count(*), COALESCE(sum(duration), 0) FROM test_execution
            WHERE environment_id = ? AND forced IS NULL)");
        saved.bind(1, exec_id);
        if (saved.step()) {
            stats.run_saved_tests = saved.column_int64(0);
            stats.run_saved_time = saved.column_double(1);
        }
    }

    stats.total_saved_time = parse_double_or_zero(fetch_attribute_locked("time_saved", std::nullopt));
    stats.total_all_time = parse_double_or_zero(fetch_attribute_locked("time_all", std::nullopt));
    stats.total_saved_tests = static_cast<int64_t>(
        parse_double_or_zero(fetch_attribute_locked("tests_saved", std::nullopt)));
    stats.total_all_tests = static_cast<int64_t>(
        parse_double_or_zero(fetch_attribute_locked("tests_all", std::nullopt)));
    return stats;
}

SavingStats SqliteStore::fetch_saving_stats(int64_t exec_id, bool select) {
    std::lock_guard lock(mutex_);
    return saving_stats_locked(exec_id, select);
}

void SqliteStore::finish_execution(int64_t exec_id, double duration, bool select) {
    std::lock_guard lock(mutex_);
    Transaction tx(*db_);

    SavingStats stats = saving_stats_locked(exec_id, select);
    write_attribute_locked("time_saved", std::to_string(stats.total_saved_time + stats.run_saved_time), std::nullopt);
    write_attribute_locked("time_all", std::to_string(stats.total_all_time + stats.run_all_time), std::nullopt);
    write_attribute_locked("tests_saved", std::to_string(stats.total_saved_tests + stats.run_saved_tests), std::nullopt);
    write_attribute_locked("tests_all", std::to_string(stats.total_all_tests + stats.run_all_tests), std::nullopt);

    auto run = db_->prepare("INSERT INTO run_uid (environment_id, repo_run_id) VALUES (?, ?)");
    run.bind(1, exec_id);
    auto run_id = fetch_attribute_locked("run_id", exec_id);
    if (run_id && !run_id->empty()) {
        run.bind(2, *run_id);
    } else {
        run.bind_null(2);
    }
    run.run();
    int64_t run_uid = db_->last_insert_rowid();

    auto info = db_->prepare(R"(
        INSERT INTO run_infos (run_time_saved, run_time_all, tests_saved, tests_all, run_uid)
        VALUES (?, ?, ?, ?, ?))");
    info.bind(1, stats.run_saved_time)
        .bind(2, stats.run_all_time)
        .bind(3, stats.run_saved_tests)
        .bind(4, stats.run_all_tests)
        .bind(5, run_uid);
    info.run();

    auto env = db_->prepare(
        "UPDATE environment SET sessions = sessions + 1, last_duration = ? WHERE id = ?");
    env.bind(1, duration).bind(2, exec_id);
    env.run();

    // Superseded file versions and dependencies nobody links to any more.
    db_->exec(R"(
        DELETE FROM file_fp WHERE id NOT IN (SELECT DISTINCT fingerprint_id FROM test_execution_file_fp);
        DELETE FROM file_dependency WHERE id NOT IN
            (SELECT DISTINCT file_dependency_id FROM test_execution_file_dependency);)");

    tx.commit();
    id_cache_.clear();
    spdlog::info("Finished execution {}: {} of {} tests skipped", exec_id,
                 stats.run_saved_tests, stats.run_all_tests);
}

}  // namespace testsieve
