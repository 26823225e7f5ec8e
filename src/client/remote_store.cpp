#include "client/remote_store.h"
#include "common/errors.h"
#include "protocol/codec.h"
#include "protocol/ops.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <thread>

namespace testsieve {

using boost::asio::ip::tcp;

namespace {

class AttemptError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// An undecodable OK reply counts as a transport failure.
template <typename T>
T decode_reply(const char* op, const std::string& payload) {
    try {
        return std::get<0>(wire::decode<T>(payload));
    } catch (const ProtocolError& e) {
        throw StoreNetworkError(std::string(op) + " returned a malformed reply: " + e.what());
    }
}

}  // namespace

RemoteStore::RemoteStore(Options options)
    : options_(std::move(options)) {}

RemoteStore::~RemoteStore() {
    close();
}

RemoteStore::Options RemoteStore::options_from(const Config& config) {
    Options options;
    options.host = config.server_host;
    options.port = config.server_port;
    options.repo = config.repo_id;
    options.job = config.job_id;
    options.token = config.auth_token;
    options.timeout = config.net_timeout;
    options.retries = config.net_retries;
    return options;
}

std::string RemoteStore::describe() const {
    return "network store " + options_.host + ":" + std::to_string(options_.port) + " (" +
           options_.repo + "/" + options_.job + ")";
}

void RemoteStore::close() {
    std::lock_guard lock(mutex_);
    reset_socket();
}

void RemoteStore::reset_socket() {
    if (socket_) {
        boost::system::error_code ec;
        socket_->close(ec);
        socket_.reset();
    }
}

void RemoteStore::run_until(std::chrono::steady_clock::time_point deadline) {
    io_context_.restart();
    io_context_.run_until(deadline);
    if (!io_context_.stopped()) {
        // Timed out: cancel the outstanding operation and let its handler run.
        if (socket_) {
            boost::system::error_code ec;
            socket_->close(ec);
        }
        io_context_.run();
    }
}

void RemoteStore::connect(std::chrono::steady_clock::time_point deadline) {
    if (socket_ && socket_->is_open()) return;

    tcp::resolver resolver(io_context_);
    boost::system::error_code ec = boost::asio::error::would_block;
    tcp::resolver::results_type endpoints;
    resolver.async_resolve(options_.host, std::to_string(options_.port),
                           [&](const boost::system::error_code& result_ec, tcp::resolver::results_type results) {
                               ec = result_ec;
                               endpoints = std::move(results);
                           });
    io_context_.restart();
    io_context_.run_until(deadline);
    if (!io_context_.stopped()) {
        resolver.cancel();
        io_context_.run();
    }
    if (ec) throw AttemptError("resolve " + options_.host + " failed: " + ec.message());

    socket_.emplace(io_context_);
    ec = boost::asio::error::would_block;
    boost::asio::async_connect(*socket_, endpoints,
                               [&](const boost::system::error_code& result_ec, const tcp::endpoint&) {
                                   ec = result_ec;
                               });
    run_until(deadline);
    if (ec) {
        reset_socket();
        throw AttemptError("connect failed: " + ec.message());
    }
    socket_->set_option(tcp::no_delay(true));
}

Response RemoteStore::attempt(const std::string& frame, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    connect(deadline);

    boost::system::error_code ec = boost::asio::error::would_block;
    boost::asio::async_write(*socket_, boost::asio::buffer(frame),
                             [&](const boost::system::error_code& result_ec, size_t) { ec = result_ec; });
    run_until(deadline);
    if (ec) throw AttemptError("write failed: " + ec.message());

    std::vector<uint8_t> received;
    std::vector<uint8_t> chunk(64 * 1024);
    while (true) {
        size_t consumed = 0;
        std::optional<Response> response;
        try {
            response = Parser::parse_response(received.data(), received.size(), consumed);
        } catch (const ProtocolError& e) {
            throw AttemptError(std::string("malformed response: ") + e.what());
        }
        if (response) {
            if (consumed != received.size()) {
                throw AttemptError("unexpected bytes after response");
            }
            return std::move(*response);
        }

        size_t bytes_read = 0;
        ec = boost::asio::error::would_block;
        socket_->async_read_some(boost::asio::buffer(chunk),
                                 [&](const boost::system::error_code& result_ec, size_t n) {
                                     ec = result_ec;
                                     bytes_read = n;
                                 });
        run_until(deadline);
        if (ec == boost::asio::error::operation_aborted) {
            throw AttemptError("timed out after " + std::to_string(timeout.count()) + " ms");
        }
        if (ec) throw AttemptError("read failed: " + ec.message());
        received.insert(received.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(bytes_read));
    }
}

std::string RemoteStore::call(const char* op, int64_t exec_id, const std::string& payload, bool bulk) {
    std::lock_guard lock(mutex_);

    Request request;
    request.op = op;
    request.exec_id = exec_id;
    request.repo = options_.repo;
    request.job = options_.job;
    request.token = options_.token;
    request.payload = payload;
    std::string frame = Parser::serialize_request(request);
    auto timeout = bulk ? options_.timeout * 2 : options_.timeout;

    std::string last_error;
    int max_attempts = std::max(0, options_.retries) + 1;
    for (int attempt_no = 0; attempt_no < max_attempts; ++attempt_no) {
        if (attempt_no > 0) {
            auto backoff = std::min(options_.backoff_cap, options_.backoff_base * (1 << (attempt_no - 1)));
            spdlog::warn("Retrying {} in {} ms after: {}", op, backoff.count(), last_error);
            std::this_thread::sleep_for(backoff);
        }
        ++attempts_;

        try {
            Response response = attempt(frame, timeout);
            switch (response.status) {
                case Status::Ok:
                    return std::move(response.payload);
                case Status::ClientError:
                    throw StoreRejectedError(std::string(op) + " rejected by server: " + response.payload);
                case Status::ServerError:
                    last_error = "server error: " + response.payload;
                    break;
            }
        } catch (const AttemptError& e) {
            last_error = e.what();
            reset_socket();
        }
    }

    throw StoreNetworkError(std::string(op) + " failed after " + std::to_string(max_attempts) +
                            " attempts: " + last_error);
}

InitiateResult RemoteStore::initiate_execution(const std::string& environment,
                                               const std::string& packages,
                                               const std::string& runtime_version,
                                               const std::map<std::string, std::string>& metadata) {
    auto payload = call(ops::SESSION_INITIATE, 0, wire::encode(environment, packages, runtime_version, metadata));
    return decode_reply<InitiateResult>(ops::SESSION_INITIATE, payload);
}

std::vector<std::string> RemoteStore::fetch_unknown_files(
    int64_t exec_id, const std::map<std::string, std::string>& files_fshas) {
    auto payload = call(ops::FILES_FETCH_UNKNOWN, exec_id, wire::encode(files_fshas));
    return decode_reply<std::vector<std::string>>(ops::FILES_FETCH_UNKNOWN, payload);
}

DetermineResult RemoteStore::determine_tests(int64_t exec_id,
                                             const FileChecksums& files_checksums,
                                             const std::map<std::string, std::string>& file_dep_shas,
                                             const std::vector<std::string>& changed_packages) {
    auto payload = call(ops::TESTS_DETERMINE, exec_id,
                        wire::encode(files_checksums, file_dep_shas, changed_packages));
    return decode_reply<DetermineResult>(ops::TESTS_DETERMINE, payload);
}

void RemoteStore::insert_test_file_fps(int64_t exec_id, const TestRecords& records) {
    if (records.empty()) return;
    call(ops::TEST_EXECUTION_BATCH_INSERT, exec_id, wire::encode(records), true);
}

void RemoteStore::delete_test_executions(int64_t exec_id, const std::vector<std::string>& test_names) {
    if (test_names.empty()) return;
    call(ops::TESTS_DELETE, exec_id, wire::encode(test_names));
}

std::map<std::string, TestExecutionInfo> RemoteStore::all_test_executions(int64_t exec_id) {
    auto payload = call(ops::TESTS_ALL, exec_id, "");
    return decode_reply<std::map<std::string, TestExecutionInfo>>(ops::TESTS_ALL, payload);
}

std::vector<std::string> RemoteStore::filenames(int64_t exec_id) {
    auto payload = call(ops::FILES_LIST, exec_id, "");
    return decode_reply<std::vector<std::string>>(ops::FILES_LIST, payload);
}

std::vector<FingerprintRow> RemoteStore::filenames_fingerprints(int64_t exec_id) {
    auto payload = call(ops::FILES_FINGERPRINTS, exec_id, "");
    return decode_reply<std::vector<FingerprintRow>>(ops::FILES_FINGERPRINTS, payload);
}

std::vector<std::string> RemoteStore::file_dependency_filenames(int64_t exec_id) {
    auto payload = call(ops::FILE_DEPENDENCIES_LIST, exec_id, "");
    return decode_reply<std::vector<std::string>>(ops::FILE_DEPENDENCIES_LIST, payload);
}

std::vector<ChangedFileData> RemoteStore::fetch_changed_file_data(
    int64_t exec_id, const std::vector<int64_t>& fingerprint_ids) {
    auto payload = call(ops::FILES_CHANGED_DATA, exec_id, wire::encode(fingerprint_ids));
    return decode_reply<std::vector<ChangedFileData>>(ops::FILES_CHANGED_DATA, payload);
}

void RemoteStore::update_mtimes(const std::vector<MtimeUpdate>& updates) {
    if (updates.empty()) return;
    call(ops::FILES_UPDATE_MTIMES, 0, wire::encode(updates));
}

void RemoteStore::write_attribute(const std::string& attribute, const std::string& data,
                                  std::optional<int64_t> exec_id) {
    call(ops::METADATA_WRITE, exec_id.value_or(0), wire::encode(attribute, data, exec_id.has_value()));
}

std::optional<std::string> RemoteStore::fetch_attribute(const std::string& attribute,
                                                        std::optional<int64_t> exec_id) {
    auto payload = call(ops::METADATA_READ, exec_id.value_or(0), wire::encode(attribute, exec_id.has_value()));
    return decode_reply<std::optional<std::string>>(ops::METADATA_READ, payload);
}

SavingStats RemoteStore::fetch_saving_stats(int64_t exec_id, bool select) {
    auto payload = call(ops::STATS_SAVINGS, exec_id, wire::encode(select));
    return decode_reply<SavingStats>(ops::STATS_SAVINGS, payload);
}

void RemoteStore::finish_execution(int64_t exec_id, double duration, bool select) {
    call(ops::SESSION_FINISH, exec_id, wire::encode(duration, select));
}

RunSummary RemoteStore::report_summary(int64_t exec_id, const std::optional<std::string>& run_id) {
    auto payload = call(ops::REPORT_SUMMARY, exec_id, wire::encode(run_id));
    return decode_reply<RunSummary>(ops::REPORT_SUMMARY, payload);
}

std::vector<FileTest> RemoteStore::report_file_tests(int64_t exec_id, const std::string& filename) {
    auto payload = call(ops::REPORT_FILE_TESTS, exec_id, wire::encode(filename));
    return decode_reply<std::vector<FileTest>>(ops::REPORT_FILE_TESTS, payload);
}

std::optional<TestDetail> RemoteStore::report_test_detail(int64_t exec_id, const std::string& test_name) {
    auto payload = call(ops::REPORT_TEST_DETAIL, exec_id, wire::encode(test_name));
    return decode_reply<std::optional<TestDetail>>(ops::REPORT_TEST_DETAIL, payload);
}

std::vector<CodependencyEdge> RemoteStore::report_codependency(int64_t exec_id) {
    auto payload = call(ops::REPORT_CODEPENDENCY, exec_id, "");
    return decode_reply<std::vector<CodependencyEdge>>(ops::REPORT_CODEPENDENCY, payload);
}

CoverageAnalysis RemoteStore::report_coverage(int64_t exec_id, const CoverageQuery& query) {
    auto payload = call(ops::REPORT_COVERAGE, exec_id, wire::encode(query));
    return decode_reply<CoverageAnalysis>(ops::REPORT_COVERAGE, payload);
}

FileTestList RemoteStore::report_tests_for_file(int64_t exec_id, const std::string& filename, int64_t limit) {
    auto payload = call(ops::REPORT_TESTS_FOR_FILE, exec_id, wire::encode(filename, limit));
    return decode_reply<FileTestList>(ops::REPORT_TESTS_FOR_FILE, payload);
}

ImpactEstimate RemoteStore::report_impact(int64_t exec_id, const FileChecksums& files_checksums) {
    auto payload = call(ops::REPORT_IMPACT, exec_id, wire::encode(files_checksums));
    return decode_reply<ImpactEstimate>(ops::REPORT_IMPACT, payload);
}

}  // namespace testsieve
