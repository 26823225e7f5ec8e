#include "server/connection.h"
#include "common/errors.h"
#include "protocol/parser.h"
#include "server/request_handler.h"
#include <spdlog/spdlog.h>

namespace testsieve {

Connection::Connection(boost::asio::ip::tcp::socket socket, RequestHandler& handler)
    : socket_(std::move(socket)),
      handler_(handler),
      read_buffer_(64 * 1024) {
}

Connection::~Connection() {
    stop();
}

void Connection::start() {
    active_.store(true);
    do_read();
}

void Connection::stop() {
    if (active_.exchange(false)) {
        boost::system::error_code ec;
        socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }
}

void Connection::send(std::string data) {
    if (!active_.load()) return;
    write_queue_.push(std::move(data));
    if (write_queue_.size() == 1) {
        do_write();
    }
}

void Connection::do_read() {
    auto self = shared_from_this();
    socket_.async_read_some(
        boost::asio::buffer(read_buffer_),
        [this, self](boost::system::error_code ec, size_t bytes_read) {
            if (!ec) {
                handle_data(read_buffer_.data(), bytes_read);
                if (!close_after_write_) do_read();
            } else {
                if (ec != boost::asio::error::eof) {
                    spdlog::debug("Connection read error: {}", ec.message());
                }
                stop();
            }
        });
}

void Connection::do_write() {
    if (write_queue_.empty()) return;

    auto self = shared_from_this();
    auto& front = write_queue_.front();
    boost::asio::async_write(
        socket_,
        boost::asio::buffer(front),
        [this, self](boost::system::error_code ec, size_t /*bytes_written*/) {
            if (!ec) {
                write_queue_.pop();
                if (!write_queue_.empty()) {
                    do_write();
                } else if (close_after_write_) {
                    stop();
                }
            } else {
                stop();
            }
        });
}

void Connection::handle_data(const uint8_t* data, size_t length) {
    pending_.insert(pending_.end(), data, data + length);

    while (!pending_.empty()) {
        size_t consumed = 0;
        std::optional<Request> request;
        try {
            request = Parser::parse_request(pending_.data(), pending_.size(), consumed);
        } catch (const ProtocolError& e) {
            spdlog::warn("Dropping connection after malformed frame: {}", e.what());
            pending_.clear();
            close_after_write_ = true;
            send(Parser::serialize_error(Status::ClientError, e.what()));
            return;
        }
        if (!request) return;

        pending_.erase(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(consumed));
        spdlog::debug("Received {} ({} payload bytes)", request->op, request->payload.size());
        send(Parser::serialize_response(handler_.handle(*request)));
    }
}

}  // namespace testsieve
