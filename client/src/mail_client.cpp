#include "mail_client.hpp"
#include "protocol/command_line.hpp"
#include "logger.hpp"
#include <cctype>
#include <istream>

namespace minimail::client {

namespace {

bool is_reply_code(const std::string& line) {
    return line.size() >= 3 &&
           std::isdigit(static_cast<unsigned char>(line[0])) &&
           std::isdigit(static_cast<unsigned char>(line[1])) &&
           std::isdigit(static_cast<unsigned char>(line[2]));
}

size_t to_size(const std::string& value, const std::string& context) {
    auto parsed = protocol::split_words(value);
    if (parsed.empty() || !std::isdigit(static_cast<unsigned char>(parsed[0][0]))) {
        throw ClientError("Malformed " + context + ": " + value);
    }
    return std::stoull(parsed[0]);
}

}  // namespace

// LineConnection

LineConnection::LineConnection()
    : socket_(io_context_) {
}

LineConnection::~LineConnection() {
    close();
}

void LineConnection::connect(const std::string& host, uint16_t port) {
    boost::system::error_code ec;
    tcp::resolver resolver(io_context_);
    auto endpoints = resolver.resolve(host, std::to_string(port), ec);
    if (ec) {
        throw ClientError("Cannot resolve " + host + ": " + ec.message());
    }

    asio::connect(socket_, endpoints, ec);
    if (ec) {
        throw ClientError("Cannot connect to " + host + ":" + std::to_string(port) + ": " +
                          ec.message());
    }
    LOG_DEBUG_FMT("Connected to {}:{}", host, port);
}

void LineConnection::close() {
    if (!socket_.is_open()) return;

    boost::system::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_both, ec);
    socket_.close(ec);
}

void LineConnection::send_line(const std::string& line) {
    send_raw(line + "\r\n");
}

void LineConnection::send_raw(const std::string& data) {
    boost::system::error_code ec;
    asio::write(socket_, asio::buffer(data), ec);
    if (ec) {
        throw ClientError("Write failed: " + ec.message());
    }
}

std::string LineConnection::read_line() {
    boost::system::error_code ec;
    asio::read_until(socket_, buffer_, '\n', ec);
    if (ec) {
        if (ec == asio::error::eof) {
            throw ClientError("Unexpected socket closure");
        }
        throw ClientError("Read failed: " + ec.message());
    }

    std::istream is(&buffer_);
    std::string line;
    std::getline(is, line);

    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return line;
}

// SMTPClient

std::string SMTPReply::text() const {
    std::string result;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) result += "\n";
        result += std::to_string(code) + " " + lines[i];
    }
    return result;
}

void SMTPClient::connect(const std::string& host, uint16_t port) {
    connection_.connect(host, port);
    greeting_ = read_reply();
    if (greeting_.code != 220) {
        throw ClientError("Unexpected greeting: " + greeting_.text());
    }
}

SMTPReply SMTPClient::read_reply() {
    SMTPReply reply;

    while (true) {
        std::string line = connection_.read_line();
        if (!is_reply_code(line)) {
            throw ClientError("Malformed reply: " + line);
        }

        reply.code = std::stoi(line.substr(0, 3));
        reply.lines.push_back(line.size() > 4 ? line.substr(4) : "");

        // Check if this is the last line (no continuation)
        if (line.size() == 3 || line[3] == ' ') {
            break;
        }
    }

    return reply;
}

SMTPReply SMTPClient::command(const std::string& line) {
    connection_.send_line(line);
    return read_reply();
}

SMTPReply SMTPClient::expect(const std::string& line, int code) {
    SMTPReply reply = command(line);
    if (reply.code != code) {
        throw ClientError("Unexpected response to " + line + ": " + reply.text());
    }
    return reply;
}

void SMTPClient::helo(const std::string& hostname) {
    expect("HELO " + hostname, 250);
}

void SMTPClient::mail_from(const std::string& sender) {
    expect("MAIL FROM:<" + sender + ">", 250);
}

SMTPReply SMTPClient::rcpt_to(const std::string& recipient) {
    return command("RCPT TO:<" + recipient + ">");
}

SMTPReply SMTPClient::data(const std::string& content) {
    expect("DATA", 354);

    std::string payload = protocol::dot_stuff(content);
    payload += protocol::kTerminator;
    payload += protocol::kCRLF;
    connection_.send_raw(payload);

    return read_reply();
}

void SMTPClient::rset() {
    expect("RSET", 250);
}

void SMTPClient::quit() {
    expect("QUIT", 221);
    connection_.close();
}

size_t SMTPClient::send_mail(const std::string& sender,
                             const std::vector<std::string>& recipients,
                             const std::string& content) {
    mail_from(sender);

    size_t accepted = 0;
    for (const auto& recipient : recipients) {
        SMTPReply reply = rcpt_to(recipient);
        if (reply.code == 250) {
            ++accepted;
        } else {
            LOG_WARNING_FMT("Recipient {} refused: {}", recipient, reply.text());
        }
    }

    if (accepted == 0) {
        rset();
        throw ClientError("No recipient accepted");
    }

    SMTPReply reply = data(content);
    if (reply.code != 250) {
        throw ClientError("Message refused: " + reply.text());
    }
    return accepted;
}

// POP3Client

void POP3Client::connect(const std::string& host, uint16_t port) {
    connection_.connect(host, port);
    POP3Reply greeting = read_reply();
    if (!greeting.ok) {
        throw ClientError("Unexpected negative greeting from server: " + greeting.message);
    }
}

POP3Reply POP3Client::read_reply() {
    std::string line = connection_.read_line();

    POP3Reply reply;
    if (line.rfind("+OK", 0) == 0) {
        reply.ok = true;
        reply.message = protocol::trim(line.substr(3));
    } else if (line.rfind("-ERR", 0) == 0) {
        reply.message = protocol::trim(line.substr(4));
    } else {
        throw ClientError("Malformed reply: " + line);
    }
    return reply;
}

POP3Reply POP3Client::command(const std::string& line) {
    connection_.send_line(line);
    return read_reply();
}

std::vector<std::string> POP3Client::multiline(const std::string& line) {
    POP3Reply status = command(line);
    if (!status.ok) {
        throw ClientError(line + " failed: " + status.message);
    }

    std::vector<std::string> lines;
    while (true) {
        std::string body_line = connection_.read_line();
        if (protocol::is_terminator(body_line)) {
            break;
        }
        lines.push_back(protocol::unstuff_line(body_line));
    }
    return lines;
}

POP3Reply POP3Client::user(const std::string& username) {
    return command("USER " + username);
}

POP3Reply POP3Client::pass(const std::string& password) {
    return command("PASS " + password);
}

void POP3Client::login(const std::string& username, const std::string& password) {
    POP3Reply reply = user(username);
    if (!reply.ok) {
        throw ClientError("USER rejected: " + reply.message);
    }

    reply = pass(password);
    if (!reply.ok) {
        throw ClientError("PASS rejected: " + reply.message);
    }
}

std::pair<size_t, size_t> POP3Client::stat() {
    POP3Reply reply = command("STAT");
    if (!reply.ok) {
        throw ClientError("STAT failed: " + reply.message);
    }

    auto fields = protocol::split_words(reply.message);
    if (fields.size() < 2) {
        throw ClientError("Malformed STAT reply: " + reply.message);
    }
    return {to_size(fields[0], "STAT reply"), to_size(fields[1], "STAT reply")};
}

std::vector<std::pair<size_t, size_t>> POP3Client::list() {
    std::vector<std::pair<size_t, size_t>> entries;
    for (const auto& line : multiline("LIST")) {
        auto fields = protocol::split_words(line);
        if (fields.size() != 2) {
            throw ClientError("Malformed LIST entry: " + line);
        }
        entries.emplace_back(to_size(fields[0], "LIST entry"), to_size(fields[1], "LIST entry"));
    }
    return entries;
}

std::vector<std::pair<size_t, std::string>> POP3Client::uidl() {
    std::vector<std::pair<size_t, std::string>> entries;
    for (const auto& line : multiline("UIDL")) {
        auto fields = protocol::split_words(line);
        if (fields.size() != 2) {
            throw ClientError("Malformed UIDL entry: " + line);
        }
        entries.emplace_back(to_size(fields[0], "UIDL entry"), fields[1]);
    }
    return entries;
}

std::string POP3Client::retr(size_t index) {
    std::string content;
    for (const auto& line : multiline("RETR " + std::to_string(index))) {
        content += line;
        content += '\n';
    }
    return content;
}

POP3Reply POP3Client::dele(size_t index) {
    return command("DELE " + std::to_string(index));
}

POP3Reply POP3Client::rset() {
    return command("RSET");
}

POP3Reply POP3Client::noop() {
    return command("NOOP");
}

POP3Reply POP3Client::quit() {
    POP3Reply reply = command("QUIT");
    connection_.close();
    return reply;
}

}  // namespace minimail::client
