#pragma once

#include <string>
#include <vector>
#include <utility>
#include <stdexcept>
#include <cstdint>
#include <utility>
#include <boost/asio.hpp>

namespace minimail::client {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

// Thrown on connection failures, socket closure and replies the caller did not expect.
class ClientError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Blocking CRLF line transport shared by both clients.
class LineConnection {
public:
    LineConnection();
    ~LineConnection();

    LineConnection(const LineConnection&) = delete;
    LineConnection& operator=(const LineConnection&) = delete;

    void connect(const std::string& host, uint16_t port);
    void close();
    bool is_open() const { return socket_.is_open(); }

    void send_line(const std::string& line);
    void send_raw(const std::string& data);
    std::string read_line();

private:
    asio::io_context io_context_;
    tcp::socket socket_;
    asio::streambuf buffer_;
};

struct SMTPReply {
    int code = 0;
    std::vector<std::string> lines;   // text after the code, one entry per reply line

    bool positive() const { return code >= 200 && code < 400; }
    std::string text() const;
};

class SMTPClient {
public:
    SMTPClient() = default;

    // Connects and consumes the 220 greeting.
    void connect(const std::string& host, uint16_t port);

    SMTPReply command(const std::string& line);
    SMTPReply read_reply();

    void helo(const std::string& hostname);
    void mail_from(const std::string& sender);
    SMTPReply rcpt_to(const std::string& recipient);

    // Sends content as dot-stuffed CRLF lines followed by the terminator;
    // bare LF line endings are converted.
    SMTPReply data(const std::string& content);

    void rset();
    void quit();

    // HELO is expected to have been sent. Unknown recipients are skipped; throws
    // when none is accepted or the message is refused.
    size_t send_mail(const std::string& sender,
                     const std::vector<std::string>& recipients,
                     const std::string& content);

    const SMTPReply& greeting() const { return greeting_; }
    LineConnection& connection() { return connection_; }

private:
    SMTPReply expect(const std::string& line, int code);

    LineConnection connection_;
    SMTPReply greeting_;
};

struct POP3Reply {
    bool ok = false;
    std::string message;   // text after +OK/-ERR
};

class POP3Client {
public:
    POP3Client() = default;

    // Connects and consumes the +OK greeting.
    void connect(const std::string& host, uint16_t port);

    POP3Reply command(const std::string& line);

    // Sends a command with a multi-line answer; returns the unstuffed lines
    // without the terminator. Throws when the status line is -ERR.
    std::vector<std::string> multiline(const std::string& line);

    POP3Reply user(const std::string& username);
    POP3Reply pass(const std::string& password);
    void login(const std::string& username, const std::string& password);

    std::pair<size_t, size_t> stat();
    std::vector<std::pair<size_t, size_t>> list();
    std::vector<std::pair<size_t, std::string>> uidl();

    // Message content with each line terminated by "\n".
    std::string retr(size_t index);

    POP3Reply dele(size_t index);
    POP3Reply rset();
    POP3Reply noop();
    POP3Reply quit();

    LineConnection& connection() { return connection_; }

private:
    POP3Reply read_reply();

    LineConnection connection_;
};

}  // namespace minimail::client
