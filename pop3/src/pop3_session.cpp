#include "pop3_session.hpp"
#include "logger.hpp"

namespace minimail::pop3 {

POP3Session::POP3Session(tcp::socket socket,
                         std::shared_ptr<const UserDirectory> users,
                         std::shared_ptr<MailboxStore> store,
                         const POP3Config& config)
    : Session(std::move(socket), config.max_line_length)
    , machine_(std::move(users), std::move(store), config.hostname) {
    machine_.set_peer(remote_address() + ":" + std::to_string(remote_port()));
}

void POP3Session::on_connect() {
    Session::on_connect();
    LOG_INFO_FMT("POP3 connection from {}:{}", remote_address(), remote_port());

    deliver(machine_.greeting());
}

void POP3Session::on_line(const std::string& line) {
    deliver(machine_.on_line(line));
}

void POP3Session::on_disconnect() {
    // Releases the maildrop without applying deletions unless QUIT already committed
    machine_.abort();
    Session::on_disconnect();
}

void POP3Session::on_line_too_long() {
    LOG_WARNING_FMT("POP3 {}:{}: line too long, closing", remote_address(), remote_port());
    machine_.abort();
    deliver({response::err("Line too long"), true});
}

void POP3Session::deliver(const Reply& reply) {
    if (!reply.empty()) {
        send_line(reply.text);
    }
    if (reply.close) {
        close_after_flush();
    }
}

}  // namespace minimail::pop3
