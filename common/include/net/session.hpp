#pragma once

#include <memory>
#include <string>
#include <deque>
#include <functional>
#include <chrono>
#include <utility>
#include <boost/asio.hpp>

namespace minimail {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

// Line-oriented connection. All handlers of one session run on the strand the
// socket was accepted on, so derived classes see on_line() calls one at a time.
class Session : public std::enable_shared_from_this<Session> {
public:
    static constexpr size_t kDefaultMaxLineLength = 64 * 1024;

    explicit Session(tcp::socket socket, size_t max_line_length = kDefaultMaxLineLength);
    virtual ~Session() = default;

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    virtual void start();
    virtual void stop();

    void send(const std::string& data);
    void send_line(const std::string& line);

    // Stops the session once everything queued so far has been written. Must be
    // called from one of the session's own handlers; no further lines are read.
    void close_after_flush();

    const std::string& remote_address() const { return remote_address_; }
    uint16_t remote_port() const { return remote_port_; }

    // Idle limit, re-armed by every line received
    void set_timeout(std::chrono::seconds timeout);
    void reset_timeout();

    using CloseHandler = std::function<void()>;
    void set_close_handler(CloseHandler handler) { close_handler_ = std::move(handler); }

protected:
    virtual void on_connect();
    virtual void on_line(const std::string& line) = 0;
    virtual void on_disconnect();
    virtual void on_error(const boost::system::error_code& ec);
    virtual void on_line_too_long();
    virtual void on_timeout();

    void do_read();
    void do_write();

    void close_socket();

    tcp::socket socket_;

    asio::streambuf read_buffer_;
    std::deque<std::string> write_queue_;

    asio::steady_timer timeout_timer_;
    std::chrono::seconds timeout_{300};

    bool stopped_ = false;
    bool closing_ = false;

private:
    void handle_read(const boost::system::error_code& ec, std::size_t bytes_transferred);
    void handle_write(const boost::system::error_code& ec, std::size_t bytes_transferred);

    std::string remote_address_ = "unknown";
    uint16_t remote_port_ = 0;
    CloseHandler close_handler_;
};

}  // namespace minimail
