#pragma once
#ifndef TESTSIEVE_SERVER_H
#define TESTSIEVE_SERVER_H

#include <memory>
#include <mutex>
#include <optional>
#include <vector>
#include <thread>
#include <atomic>
#include <boost/asio.hpp>
#include "config/config.h"
#include "server/request_handler.h"
#include "server/store_registry.h"

namespace testsieve {

class Connection;

// Network store server: accepts connections and serves store operations
// from a pool of worker threads.
class Server {
public:
    explicit Server(const Config& config);
    ~Server();

    void start();
    void stop();
    bool is_running() const { return running_.load(); }

    // Bound port; differs from the configured one when that was 0.
    uint16_t port() const;

    size_t connection_count() const;
    StoreRegistry& registry() { return registry_; }

private:
    Config config_;
    boost::asio::io_context io_context_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_guard_;
    boost::asio::ip::tcp::acceptor acceptor_;
    StoreRegistry registry_;
    RequestHandler handler_;
    std::vector<std::weak_ptr<Connection>> connections_;
    mutable std::mutex connections_mutex_;
    std::vector<std::thread> worker_threads_;
    std::atomic<bool> running_{false};
    std::atomic<bool> accepting_{false};

    void accept_connection();
    void run_workers(unsigned thread_count);
    void cleanup_connections();
};

}  // namespace testsieve

#endif  // TESTSIEVE_SERVER_H
