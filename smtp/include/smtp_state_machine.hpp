#pragma once

#include "smtp_commands.hpp"
#include "protocol/reply.hpp"
#include <memory>
#include <string>
#include <vector>

namespace minimail {
class UserDirectory;
class MailboxStore;
}

namespace minimail::smtp {

using protocol::Reply;

enum class SessionState {
    GREETING,        // Waiting for HELO/EHLO
    SENDER_SET,      // Greeted, waiting for MAIL FROM
    RECIPIENTS_SET,  // Sender known, collecting RCPT TO
    RECEIVING_DATA,  // Between DATA and the lone "."
    DONE             // After QUIT or connection loss
};

std::string_view to_string(SessionState state);

struct Envelope {
    std::string mail_from;
    std::vector<std::string> rcpt_to;   // accepted recipients, no duplicates
    std::string data;
    bool oversize = false;

    void clear() {
        mail_from.clear();
        rcpt_to.clear();
        data.clear();
        oversize = false;
    }
};

// Transport independent submission session: one line in, at most one reply out.
class SMTPStateMachine {
public:
    SMTPStateMachine(std::shared_ptr<const UserDirectory> users,
                     std::shared_ptr<MailboxStore> store,
                     std::string hostname);

    Reply greeting() const;
    Reply on_line(const std::string& line);

    // Connection lost: any partial message is discarded, nothing is appended.
    void abort();

    SessionState state() const { return state_; }
    const Envelope& envelope() const { return envelope_; }
    const std::string& client_hostname() const { return client_hostname_; }

    void set_max_message_size(size_t size) { max_message_size_ = size; }
    void set_max_recipients(size_t max) { max_recipients_ = max; }
    void set_peer(const std::string& peer) { peer_ = peer; }

private:
    Reply handle_command(const Command& cmd);
    Reply handle_data_line(const std::string& line);
    Reply finish_message();

    Reply handle_helo(const Command& cmd, bool extended);
    Reply handle_mail(const Command& cmd);
    Reply handle_rcpt(const Command& cmd);
    Reply handle_data(const Command& cmd);
    Reply handle_rset(const Command& cmd);
    Reply handle_noop(const Command& cmd);
    Reply handle_quit(const Command& cmd);
    Reply handle_vrfy(const Command& cmd);
    Reply handle_help(const Command& cmd);

    std::shared_ptr<const UserDirectory> users_;
    std::shared_ptr<MailboxStore> store_;
    std::string hostname_;
    std::string peer_ = "unknown";

    SessionState state_ = SessionState::GREETING;
    Envelope envelope_;
    std::string client_hostname_;

    size_t max_message_size_ = 10 * 1024 * 1024;
    size_t max_recipients_ = 100;
};

}  // namespace minimail::smtp
