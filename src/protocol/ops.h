#pragma once
#ifndef TESTSIEVE_OPS_H
#define TESTSIEVE_OPS_H

namespace testsieve {
namespace ops {

inline constexpr const char* SESSION_INITIATE = "session.initiate";
inline constexpr const char* SESSION_FINISH = "session.finish";
inline constexpr const char* FILES_FETCH_UNKNOWN = "files.fetch_unknown";
inline constexpr const char* TESTS_DETERMINE = "tests.determine";
inline constexpr const char* TEST_EXECUTION_BATCH_INSERT = "test_execution.batch_insert";
inline constexpr const char* TESTS_DELETE = "tests.delete";
inline constexpr const char* TESTS_ALL = "tests.all";
inline constexpr const char* FILES_LIST = "files.list";
inline constexpr const char* FILES_FINGERPRINTS = "files.fingerprints";
inline constexpr const char* FILES_CHANGED_DATA = "files.changed_data";
inline constexpr const char* FILES_UPDATE_MTIMES = "files.update_mtimes";
inline constexpr const char* FILE_DEPENDENCIES_LIST = "file_dependencies.list";
inline constexpr const char* METADATA_WRITE = "metadata.write";
inline constexpr const char* METADATA_READ = "metadata.read";
inline constexpr const char* STATS_SAVINGS = "stats.savings";
inline constexpr const char* REPORT_SUMMARY = "report.summary";
inline constexpr const char* REPORT_FILE_TESTS = "report.file_tests";
inline constexpr const char* REPORT_TEST_DETAIL = "report.test_detail";
inline constexpr const char* REPORT_CODEPENDENCY = "report.codependency";
inline constexpr const char* REPORT_COVERAGE = "report.coverage";
inline constexpr const char* REPORT_TESTS_FOR_FILE = "report.tests_for_file";
inline constexpr const char* REPORT_IMPACT = "report.impact";

}  // namespace ops
}  // namespace testsieve

#endif  // TESTSIEVE_OPS_H
