#include "report/reporter.h"
#include "fingerprint/module.h"

namespace testsieve {

Reporter::Reporter(SqliteStore& store)
    : store_(store) {}

RunSummary Reporter::summary(int64_t exec_id, const std::optional<std::string>& run_id) {
    return store_.with_database([&](Database& db) {
        RunSummary summary;

        auto env = db.prepare("SELECT environment_name, create_date FROM environment WHERE id = ?");
        env.bind(1, exec_id);
        if (env.step()) {
            summary.environment = env.column_text(0);
            summary.created = env.column_text(1);
        }

        auto files = db.prepare(R"(
            SELECT COUNT(DISTINCT f.filename)
            FROM test_execution te
            JOIN test_execution_file_fp te_ffp ON te.id = te_ffp.test_execution_id
            JOIN file_fp f ON te_ffp.fingerprint_id = f.id
            WHERE te.environment_id = ?)");
        files.bind(1, exec_id);
        if (files.step()) summary.files = files.column_int64(0);

        std::string sql = R"(
            SELECT ri.tests_all, ri.tests_saved, ri.run_time_all, ri.run_time_saved,
                   ru.repo_run_id, ru.create_date
            FROM run_infos ri
            JOIN run_uid ru ON ri.run_uid = ru.id
            WHERE ru.environment_id = ?)";
        if (run_id) sql += " AND ru.repo_run_id = ?";
        sql += " ORDER BY ru.id DESC LIMIT 1";

        auto run = db.prepare(sql);
        run.bind(1, exec_id);
        if (run_id) run.bind(2, *run_id);
        if (run.step()) {
            summary.tests = run.column_int64(0);
            summary.saved_tests = run.column_int64(1);
            summary.all_time = run.column_double(2);
            summary.saved_time = run.column_double(3);
            summary.run_id = run.column_text(4);
            summary.created = run.column_text(5);
            return summary;
        }

        auto live = db.prepare(
            "SELECT count(*), COALESCE(sum(duration), 0) FROM test_execution WHERE environment_id = ?");
        live.bind(1, exec_id);
        if (live.step()) {
            summary.tests = live.column_int64(0);
            summary.all_time = live.column_double(1);
        }
        return summary;
    });
}

std::vector<FileTest> Reporter::file_tests(int64_t exec_id, const std::string& filename) {
    return store_.with_database([&](Database& db) {
        auto stmt = db.prepare(R"(
            SELECT te.test_name, te.duration, te.failed, f.method_checksums
            FROM test_execution te
            JOIN test_execution_file_fp te_ffp ON te.id = te_ffp.test_execution_id
            JOIN file_fp f ON te_ffp.fingerprint_id = f.id
            WHERE te.environment_id = ? AND f.filename = ?
            ORDER BY te.test_name)");
        stmt.bind(1, exec_id).bind(2, filename);

        std::vector<FileTest> tests;
        while (stmt.step()) {
            FileTest test;
            test.test_name = stmt.column_text(0);
            test.duration = stmt.column_double(1);
            test.failed = stmt.column_int64(2) != 0;
            test.checksums = blob_to_checksums(stmt.column_blob(3));
            tests.push_back(std::move(test));
        }
        return tests;
    });
}

std::optional<TestDetail> Reporter::test_detail(int64_t exec_id, const std::string& test_name) {
    return store_.with_database([&](Database& db) -> std::optional<TestDetail> {
        auto test = db.prepare(R"(
            SELECT id, duration, failed, forced FROM test_execution
            WHERE environment_id = ? AND test_name = ?)");
        test.bind(1, exec_id).bind(2, test_name);
        if (!test.step()) return std::nullopt;

        TestDetail detail;
        int64_t te_id = test.column_int64(0);
        detail.test_name = test_name;
        detail.duration = test.column_double(1);
        detail.failed = test.column_int64(2) != 0;
        detail.forced = test.column_optional_bool(3);

        auto fps = db.prepare(R"(
            SELECT f.filename, f.fsha, f.mtime, f.method_checksums
            FROM test_execution_file_fp te_ffp
            JOIN file_fp f ON te_ffp.fingerprint_id = f.id
            WHERE te_ffp.test_execution_id = ?
            ORDER BY f.filename)");
        fps.bind(1, te_id);
        while (fps.step()) {
            FileFingerprint fp;
            fp.filename = fps.column_text(0);
            fp.fsha = fps.column_text(1);
            fp.mtime = fps.column_int64(2);
            fp.checksums = blob_to_checksums(fps.column_blob(3));
            detail.fingerprints.push_back(std::move(fp));
        }

        auto deps = db.prepare(R"(
            SELECT fd.filename, fd.sha
            FROM test_execution_file_dependency tefd
            JOIN file_dependency fd ON tefd.file_dependency_id = fd.id
            WHERE tefd.test_execution_id = ?
            ORDER BY fd.filename)");
        deps.bind(1, te_id);
        while (deps.step()) {
            detail.file_deps.push_back({deps.column_text(0), deps.column_text(1)});
        }

        auto packages = db.prepare(
            "SELECT package_name FROM test_external_dependency WHERE test_execution_id = ? ORDER BY package_name");
        packages.bind(1, te_id);
        while (packages.step()) {
            detail.packages.push_back(packages.column_text(0));
        }
        return detail;
    });
}

std::vector<CodependencyEdge> Reporter::codependency_graph(int64_t exec_id) {
    return store_.with_database([&](Database& db) {
        auto stmt = db.prepare(R"(
            SELECT f1.filename, f2.filename, COUNT(DISTINCT te.id)
            FROM test_execution te
            JOIN test_execution_file_fp a ON a.test_execution_id = te.id
            JOIN file_fp f1 ON f1.id = a.fingerprint_id
            JOIN test_execution_file_fp b ON b.test_execution_id = te.id
            JOIN file_fp f2 ON f2.id = b.fingerprint_id
            WHERE te.environment_id = ? AND f1.filename < f2.filename
            GROUP BY f1.filename, f2.filename
            ORDER BY 3 DESC, 1, 2)");
        stmt.bind(1, exec_id);

        std::vector<CodependencyEdge> edges;
        while (stmt.step()) {
            edges.push_back({stmt.column_text(0), stmt.column_text(1), stmt.column_int64(2)});
        }
        return edges;
    });
}

CoverageAnalysis Reporter::coverage_analysis(int64_t exec_id, const CoverageQuery& query) {
    return store_.with_database([&](Database& db) {
        CoverageAnalysis analysis;

        auto totals = db.prepare(R"(
            SELECT
                (SELECT COUNT(DISTINCT f.filename)
                 FROM test_execution te
                 JOIN test_execution_file_fp te_ffp ON te.id = te_ffp.test_execution_id
                 JOIN file_fp f ON te_ffp.fingerprint_id = f.id
                 WHERE te.environment_id = ?1),
                (SELECT COUNT(*) FROM test_execution WHERE environment_id = ?1))");
        totals.bind(1, exec_id);
        if (totals.step()) {
            analysis.total_files = totals.column_int64(0);
            analysis.total_tests = totals.column_int64(1);
        }

        std::string sql = R"(
            SELECT f.filename, COUNT(DISTINCT te.id), COUNT(DISTINCT f.id)
            FROM test_execution te
            JOIN test_execution_file_fp te_ffp ON te.id = te_ffp.test_execution_id
            JOIN file_fp f ON te_ffp.fingerprint_id = f.id
            WHERE te.environment_id = ? AND instr(f.filename, ?) > 0
            GROUP BY f.filename
            HAVING COUNT(DISTINCT te.id) >= ?)";
        if (query.max_tests) sql += " AND COUNT(DISTINCT te.id) <= ?";
        sql += query.descending ? " ORDER BY 2 DESC, 1" : " ORDER BY 2 ASC, 1";
        sql += " LIMIT ?";

        auto stmt = db.prepare(sql);
        stmt.bind(1, exec_id).bind(2, query.pattern).bind(3, query.min_tests);
        int limit_index = 4;
        if (query.max_tests) stmt.bind(limit_index++, *query.max_tests);
        stmt.bind(limit_index, query.limit);

        while (stmt.step()) {
            analysis.files.push_back({stmt.column_text(0), stmt.column_int64(1), stmt.column_int64(2)});
        }
        return analysis;
    });
}

FileTestList Reporter::tests_for_file(int64_t exec_id, const std::string& filename, int64_t limit) {
    return store_.with_database([&](Database& db) {
        const char* match = filename.find('%') != std::string::npos ? "LIKE" : "=";
        std::string from = std::string(R"(
            FROM test_execution te
            JOIN test_execution_file_fp te_ffp ON te.id = te_ffp.test_execution_id
            JOIN file_fp f ON te_ffp.fingerprint_id = f.id
            WHERE te.environment_id = ? AND f.filename )") + match + " ?";

        FileTestList list;
        auto count = db.prepare("SELECT COUNT(DISTINCT te.test_name)" + from);
        count.bind(1, exec_id).bind(2, filename);
        if (count.step()) list.total_count = count.column_int64(0);

        auto names = db.prepare("SELECT DISTINCT te.test_name" + from + " ORDER BY te.test_name LIMIT ?");
        names.bind(1, exec_id).bind(2, filename).bind(3, limit);
        while (names.step()) {
            list.tests.push_back(names.column_text(0));
        }
        return list;
    });
}

ImpactEstimate Reporter::estimate_impact(int64_t exec_id, const FileChecksums& files_checksums) {
    return store_.with_database([&](Database& db) {
        ImpactEstimate estimate;

        auto fingerprints = db.prepare(R"(
            SELECT te.test_name, f.method_checksums
            FROM test_execution te
            JOIN test_execution_file_fp te_ffp ON te.id = te_ffp.test_execution_id
            JOIN file_fp f ON te_ffp.fingerprint_id = f.id
            WHERE te.environment_id = ? AND f.filename = ?)");
        for (const auto& [filename, current] : files_checksums) {
            fingerprints.reset();
            fingerprints.bind(1, exec_id).bind(2, filename);
            while (fingerprints.step()) {
                std::string blob = fingerprints.column_blob(1);
                if (!current || blob.size() % 4 != 0 || !checksums_match(*current, blob_to_checksums(blob))) {
                    estimate.affected.insert(fingerprints.column_text(0));
                }
            }
        }

        auto failing = db.prepare("SELECT test_name FROM test_execution WHERE environment_id = ? AND failed = 1");
        failing.bind(1, exec_id);
        while (failing.step()) {
            estimate.failing.insert(failing.column_text(0));
        }
        return estimate;
    });
}

}  // namespace testsieve
