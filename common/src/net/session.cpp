#include "net/session.hpp"
#include "logger.hpp"

namespace minimail {

Session::Session(tcp::socket socket, size_t max_line_length)
    : socket_(std::move(socket))
    , read_buffer_(max_line_length)
    , timeout_timer_(socket_.get_executor()) {
    boost::system::error_code ec;
    auto endpoint = socket_.remote_endpoint(ec);
    if (!ec) {
        remote_address_ = endpoint.address().to_string();
        remote_port_ = endpoint.port();
    }
}

void Session::start() {
    auto self = shared_from_this();
    asio::dispatch(socket_.get_executor(), [this, self]() {
        on_connect();
        reset_timeout();
        do_read();
    });
}

void Session::stop() {
    if (stopped_) return;
    stopped_ = true;

    timeout_timer_.cancel();
    on_disconnect();
    close_socket();

    if (close_handler_) {
        auto handler = std::move(close_handler_);
        close_handler_ = nullptr;
        handler();
    }
}

void Session::close_socket() {
    boost::system::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_both, ec);
    socket_.close(ec);
}

void Session::set_timeout(std::chrono::seconds timeout) {
    timeout_ = timeout;
}

void Session::reset_timeout() {
    timeout_timer_.expires_after(timeout_);
    auto self = shared_from_this();
    timeout_timer_.async_wait([this, self](const boost::system::error_code& ec) {
        // A re-armed or cancelled timer reports operation_aborted
        if (!ec && !stopped_) {
            on_timeout();
        }
    });
}

void Session::send(const std::string& data) {
    auto self = shared_from_this();
    asio::post(socket_.get_executor(), [this, self, data]() {
        if (stopped_) return;
        bool was_empty = write_queue_.empty();
        write_queue_.push_back(data);
        if (was_empty) {
            do_write();
        }
    });
}

void Session::send_line(const std::string& line) {
    send(line + "\r\n");
}

void Session::close_after_flush() {
    closing_ = true;
    auto self = shared_from_this();
    asio::post(socket_.get_executor(), [this, self]() {
        if (write_queue_.empty()) {
            stop();
        }
    });
}

void Session::do_read() {
    if (stopped_ || closing_) return;

    auto self = shared_from_this();
    asio::async_read_until(
        socket_,
        read_buffer_,
        '\n',
        [this, self](const boost::system::error_code& ec, std::size_t bytes_transferred) {
            handle_read(ec, bytes_transferred);
        });
}

void Session::handle_read(const boost::system::error_code& ec, std::size_t /* bytes_transferred */) {
    if (stopped_) return;

    if (ec == asio::error::not_found) {
        on_line_too_long();
        return;
    }

    if (!ec) {
        reset_timeout();

        std::istream is(&read_buffer_);
        std::string line;
        std::getline(is, line);

        // Accept bare LF as well as CRLF
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        on_line(line);

        do_read();
    } else {
        on_error(ec);
        stop();
    }
}

void Session::do_write() {
    if (stopped_ || write_queue_.empty()) return;

    auto self = shared_from_this();
    asio::async_write(
        socket_,
        asio::buffer(write_queue_.front()),
        [this, self](const boost::system::error_code& ec, std::size_t bytes_transferred) {
            handle_write(ec, bytes_transferred);
        });
}

void Session::handle_write(const boost::system::error_code& ec, std::size_t /* bytes_transferred */) {
    if (stopped_) return;

    if (!ec) {
        write_queue_.pop_front();
        if (!write_queue_.empty()) {
            do_write();
        } else if (closing_) {
            stop();
        }
    } else {
        on_error(ec);
        stop();
    }
}

void Session::on_connect() {
    LOG_DEBUG_FMT("New connection from {}:{}", remote_address_, remote_port_);
}

void Session::on_disconnect() {
    LOG_DEBUG_FMT("Connection closed from {}:{}", remote_address_, remote_port_);
}

void Session::on_error(const boost::system::error_code& ec) {
    if (ec == asio::error::eof || ec == asio::error::connection_reset ||
        ec == asio::error::operation_aborted) {
        return;  // Normal disconnection
    }
    LOG_ERROR_FMT("Session error from {}: {}", remote_address_, ec.message());
}

void Session::on_line_too_long() {
    LOG_WARNING_FMT("Line from {}:{} exceeds {} bytes, closing",
                    remote_address_, remote_port_, read_buffer_.max_size());
    stop();
}

void Session::on_timeout() {
    LOG_DEBUG_FMT("Session timeout for {}:{}", remote_address_, remote_port_);
    stop();
}

}  // namespace minimail
