#pragma once
#ifndef TESTSIEVE_REQUEST_HANDLER_H
#define TESTSIEVE_REQUEST_HANDLER_H

#include <atomic>
#include <functional>
#include <string>
#include <unordered_map>
#include "protocol/parser.h"
#include "server/store_registry.h"

namespace testsieve {

// Executes store operations addressed by (repo, job, op) and encodes the
// reply. Client mistakes get Status::ClientError, store failures
// Status::ServerError.
class RequestHandler {
public:
    RequestHandler(StoreRegistry& registry, std::string auth_token);

    Response handle(const Request& request);

    size_t handled_count() const { return handled_.load(); }

private:
    using Operation = std::function<std::string(SqliteStore&, const Request&)>;

    StoreRegistry& registry_;
    std::string auth_token_;
    std::unordered_map<std::string, Operation> operations_;
    std::atomic<size_t> handled_{0};

    void register_operations();
};

}  // namespace testsieve

#endif  // TESTSIEVE_REQUEST_HANDLER_H
