#pragma once
#ifndef TESTSIEVE_CONNECTION_H
#define TESTSIEVE_CONNECTION_H

#include <memory>
#include <string>
#include <vector>
#include <queue>
#include <atomic>
#include <boost/asio.hpp>

namespace testsieve {

class RequestHandler;

// One client socket. Frames are handled in arrival order and answered in
// the same order. The socket's executor must be a strand.
class Connection : public std::enable_shared_from_this<Connection> {
public:
    Connection(boost::asio::ip::tcp::socket socket, RequestHandler& handler);
    ~Connection();

    void start();
    void stop();
    bool is_active() const { return active_.load(); }

private:
    boost::asio::ip::tcp::socket socket_;
    RequestHandler& handler_;
    std::atomic<bool> active_{false};
    bool close_after_write_ = false;
    std::vector<uint8_t> read_buffer_;
    std::vector<uint8_t> pending_;
    std::queue<std::string> write_queue_;

    void do_read();
    void do_write();
    void send(std::string data);
    void handle_data(const uint8_t* data, size_t length);
};

}  // namespace testsieve

#endif  // TESTSIEVE_CONNECTION_H
