#include "smtp_session.hpp"
#include "logger.hpp"

namespace minimail::smtp {

SMTPSession::SMTPSession(tcp::socket socket,
                         std::shared_ptr<const UserDirectory> users,
                         std::shared_ptr<MailboxStore> store,
                         const SMTPConfig& config)
    : Session(std::move(socket), config.max_line_length)
    , machine_(std::move(users), std::move(store), config.hostname) {
    machine_.set_max_message_size(config.max_message_size);
    machine_.set_max_recipients(config.max_recipients);
    machine_.set_peer(remote_address() + ":" + std::to_string(remote_port()));
}

void SMTPSession::on_connect() {
    Session::on_connect();
    LOG_INFO_FMT("SMTP connection from {}:{}", remote_address(), remote_port());

    deliver(machine_.greeting());
}

void SMTPSession::on_line(const std::string& line) {
    deliver(machine_.on_line(line));
}

void SMTPSession::on_disconnect() {
    machine_.abort();
    Session::on_disconnect();
}

void SMTPSession::on_line_too_long() {
    LOG_WARNING_FMT("SMTP {}:{}: line too long, closing", remote_address(), remote_port());
    deliver({reply::make(reply::SYNTAX_ERROR, "Line too long"), true});
}

void SMTPSession::deliver(const Reply& reply) {
    if (!reply.empty()) {
        send_line(reply.text);
    }
    if (reply.close) {
        close_after_flush();
    }
}

}  // namespace minimail::smtp
