#include "server/server.h"
#include "server/connection.h"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace testsieve {

Server::Server(const Config& config)
    : config_(config),
      acceptor_(io_context_,
                boost::asio::ip::tcp::endpoint(
                    boost::asio::ip::make_address(config.bind_address),
                    config.port)),
      registry_(config.server_data_dir),
      handler_(registry_, config.auth_token) {
    spdlog::info("Server initialized on {}:{}", config.bind_address, port());
}

Server::~Server() {
    stop();
}

uint16_t Server::port() const {
    boost::system::error_code ec;
    auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? config_.port : endpoint.port();
}

void Server::start() {
    if (running_.exchange(true)) return;
    accepting_.store(true);
    work_guard_.emplace(io_context_.get_executor());
    accept_connection();
    run_workers(std::max(2u, std::thread::hardware_concurrency()));
}

void Server::stop() {
    if (!running_.exchange(false)) return;
    accepting_.store(false);

    boost::system::error_code ec;
    acceptor_.close(ec);
    work_guard_.reset();
    io_context_.stop();

    for (auto& t : worker_threads_) {
        if (t.joinable()) {
            t.join();
        }
    }
    worker_threads_.clear();

    {
        std::lock_guard lock(connections_mutex_);
        for (auto& weak : connections_) {
            if (auto conn = weak.lock()) conn->stop();
        }
        connections_.clear();
    }
    registry_.close_all();
    spdlog::info("Server stopped");
}

size_t Server::connection_count() const {
    std::lock_guard lock(connections_mutex_);
    return static_cast<size_t>(std::count_if(connections_.begin(), connections_.end(), [](const auto& weak) {
        auto conn = weak.lock();
        return conn && conn->is_active();
    }));
}

void Server::accept_connection() {
    if (!accepting_.load()) return;

    acceptor_.async_accept(
        boost::asio::make_strand(io_context_),
        [this](boost::system::error_code ec, boost::asio::ip::tcp::socket socket) {
            if (!ec) {
                auto conn = std::make_shared<Connection>(std::move(socket), handler_);
                size_t total = 0;
                {
                    std::lock_guard lock(connections_mutex_);
                    cleanup_connections();
                    connections_.push_back(conn);
                    total = connections_.size();
                }
                conn->start();
                spdlog::debug("New connection accepted, total: {}", total);
            } else if (ec != boost::asio::error::operation_aborted) {
                spdlog::warn("Accept failed: {}", ec.message());
            }
            accept_connection();
        });
}

void Server::run_workers(unsigned thread_count) {
    for (unsigned i = 0; i < thread_count; ++i) {
        worker_threads_.emplace_back([this]() {
            io_context_.run();
        });
    }
}

void Server::cleanup_connections() {
    // Caller holds connections_mutex_
    connections_.erase(
        std::remove_if(connections_.begin(), connections_.end(),
                       [](const auto& weak) {
                           auto conn = weak.lock();
                           return !conn || !conn->is_active();
                       }),
        connections_.end());
}

}  // namespace testsieve
