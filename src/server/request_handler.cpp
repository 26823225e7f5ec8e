#include "server/request_handler.h"
#include "common/errors.h"
#include "protocol/codec.h"
#include "protocol/ops.h"
#include "report/reporter.h"
#include <spdlog/spdlog.h>

namespace testsieve {

RequestHandler::RequestHandler(StoreRegistry& registry, std::string auth_token)
    : registry_(registry),
      auth_token_(std::move(auth_token)) {
    register_operations();
}

void RequestHandler::register_operations() {
    using namespace wire;

    operations_[ops::SESSION_INITIATE] = [](SqliteStore& store, const Request& req) {
        auto [environment, packages, runtime, metadata] =
            decode<std::string, std::string, std::string, std::map<std::string, std::string>>(req.payload);
        return encode(store.initiate_execution(environment, packages, runtime, metadata));
    };
    operations_[ops::SESSION_FINISH] = [](SqliteStore& store, const Request& req) {
        auto [duration, select] = decode<double, bool>(req.payload);
        store.finish_execution(req.exec_id, duration, select);
        return std::string();
    };
    operations_[ops::FILES_FETCH_UNKNOWN] = [](SqliteStore& store, const Request& req) {
        auto [fshas] = decode<std::map<std::string, std::string>>(req.payload);
        return encode(store.fetch_unknown_files(req.exec_id, fshas));
    };
    operations_[ops::TESTS_DETERMINE] = [](SqliteStore& store, const Request& req) {
        auto [checksums, dep_shas, packages] =
            decode<FileChecksums, std::map<std::string, std::string>, std::vector<std::string>>(req.payload);
        return encode(store.determine_tests(req.exec_id, checksums, dep_shas, packages));
    };
    operations_[ops::TEST_EXECUTION_BATCH_INSERT] = [](SqliteStore& store, const Request& req) {
        auto [records] = decode<TestRecords>(req.payload);
        store.insert_test_file_fps(req.exec_id, records);
        return std::string();
    };
    operations_[ops::TESTS_DELETE] = [](SqliteStore& store, const Request& req) {
        auto [names] = decode<std::vector<std::string>>(req.payload);
        store.delete_test_executions(req.exec_id, names);
        return std::string();
    };
    operations_[ops::TESTS_ALL] = [](SqliteStore& store, const Request& req) {
        return encode(store.all_test_executions(req.exec_id));
    };
    operations_[ops::FILES_LIST] = [](SqliteStore& store, const Request& req) {
        return encode(store.filenames(req.exec_id));
    };
    operations_[ops::FILES_FINGERPRINTS] = [](SqliteStore& store, const Request& req) {
        return encode(store.filenames_fingerprints(req.exec_id));
    };
    operations_[ops::FILES_CHANGED_DATA] = [](SqliteStore& store, const Request& req) {
        auto [ids] = decode<std::vector<int64_t>>(req.payload);
        return encode(store.fetch_changed_file_data(req.exec_id, ids));
    };
    operations_[ops::FILES_UPDATE_MTIMES] = [](SqliteStore& store, const Request& req) {
        auto [updates] = decode<std::vector<MtimeUpdate>>(req.payload);
        store.update_mtimes(updates);
        return std::string();
    };
    operations_[ops::FILE_DEPENDENCIES_LIST] = [](SqliteStore& store, const Request& req) {
        return encode(store.file_dependency_filenames(req.exec_id));
    };
    operations_[ops::METADATA_WRITE] = [](SqliteStore& store, const Request& req) {
        auto [attribute, data, scoped] = decode<std::string, std::string, bool>(req.payload);
        store.write_attribute(attribute, data, scoped ? std::optional<int64_t>(req.exec_id) : std::nullopt);
        return std::string();
    };
    operations_[ops::METADATA_READ] = [](SqliteStore& store, const Request& req) {
        auto [attribute, scoped] = decode<std::string, bool>(req.payload);
        return encode(store.fetch_attribute(attribute,
                                            scoped ? std::optional<int64_t>(req.exec_id) : std::nullopt));
    };
    operations_[ops::STATS_SAVINGS] = [](SqliteStore& store, const Request& req) {
        auto [select] = decode<bool>(req.payload);
        return encode(store.fetch_saving_stats(req.exec_id, select));
    };
    operations_[ops::REPORT_SUMMARY] = [](SqliteStore& store, const Request& req) {
        auto [run_id] = decode<std::optional<std::string>>(req.payload);
        return encode(Reporter(store).summary(req.exec_id, run_id));
    };
    operations_[ops::REPORT_FILE_TESTS] = [](SqliteStore& store, const Request& req) {
        auto [filename] = decode<std::string>(req.payload);
        return encode(Reporter(store).file_tests(req.exec_id, filename));
    };
    operations_[ops::REPORT_TEST_DETAIL] = [](SqliteStore& store, const Request& req) {
        auto [test_name] = decode<std::string>(req.payload);
        return encode(Reporter(store).test_detail(req.exec_id, test_name));
    };
    operations_[ops::REPORT_CODEPENDENCY] = [](SqliteStore& store, const Request& req) {
        return encode(Reporter(store).codependency_graph(req.exec_id));
    };
    operations_[ops::REPORT_COVERAGE] = [](SqliteStore& store, const Request& req) {
        auto [query] = decode<CoverageQuery>(req.payload);
        return encode(Reporter(store).coverage_analysis(req.exec_id, query));
    };
    operations_[ops::REPORT_TESTS_FOR_FILE] = [](SqliteStore& store, const Request& req) {
        auto [filename, limit] = decode<std::string, int64_t>(req.payload);
        return encode(Reporter(store).tests_for_file(req.exec_id, filename, limit));
    };
    operations_[ops::REPORT_IMPACT] = [](SqliteStore& store, const Request& req) {
        auto [files_checksums] = decode<FileChecksums>(req.payload);
        return encode(Reporter(store).estimate_impact(req.exec_id, files_checksums));
    };
}

Response RequestHandler::handle(const Request& request) {
    ++handled_;

    if (!auth_token_.empty() && request.token != auth_token_) {
        spdlog::warn("Rejected {} for {}/{}: bad auth token", request.op, request.repo, request.job);
        return {Status::ClientError, "unauthorized"};
    }
    if (request.repo.empty() || request.job.empty()) {
        return {Status::ClientError, "repo and job are required"};
    }

    auto it = operations_.find(request.op);
    if (it == operations_.end()) {
        return {Status::ClientError, "unknown operation " + request.op};
    }

    try {
        auto store = registry_.get(request.repo, request.job);
        std::string payload = it->second(*store, request);
        spdlog::debug("{} {}/{} exec {} ok, {} bytes", request.op, request.repo, request.job,
                      request.exec_id, payload.size());
        return {Status::Ok, std::move(payload)};
    } catch (const ProtocolError& e) {
        spdlog::warn("{} for {}/{}: malformed payload: {}", request.op, request.repo, request.job, e.what());
        return {Status::ClientError, e.what()};
    } catch (const std::exception& e) {
        spdlog::error("{} for {}/{} failed: {}", request.op, request.repo, request.job, e.what());
        return {Status::ServerError, e.what()};
    }
}

}  // namespace testsieve
