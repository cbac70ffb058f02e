#pragma once

#include "pop3_commands.hpp"
#include "protocol/reply.hpp"
#include <memory>
#include <string>
#include <string_view>
#include <optional>

namespace minimail {
class UserDirectory;
class MailboxStore;
class MailboxHandle;
}

namespace minimail::pop3 {

using protocol::Reply;

enum class SessionState {
    AUTHORIZATION,  // Before authentication
    TRANSACTION,    // Mailbox locked, deletions staged
    UPDATE,         // Applying deletions after QUIT
    CLOSED          // Terminal
};

std::string_view to_string(SessionState state);

// Transport independent retrieval session. The mailbox lock is held from a
// successful PASS until QUIT commits or abort() drops the staged deletions.
class POP3StateMachine {
public:
    POP3StateMachine(std::shared_ptr<const UserDirectory> users,
                     std::shared_ptr<MailboxStore> store,
                     std::string hostname);
    ~POP3StateMachine();

    POP3StateMachine(const POP3StateMachine&) = delete;
    POP3StateMachine& operator=(const POP3StateMachine&) = delete;

    Reply greeting() const;
    Reply on_line(const std::string& line);

    // Connection lost or timed out: implicit RSET, lock released, nothing committed.
    void abort();

    SessionState state() const { return state_; }
    const std::string& username() const { return username_; }
    const MailboxHandle* mailbox() const { return mailbox_.get(); }

    void set_peer(const std::string& peer) { peer_ = peer; }

private:
    Reply handle_command(const Command& cmd);

    Reply handle_user(const Command& cmd);
    Reply handle_pass(const Command& cmd);
    Reply handle_stat(const Command& cmd);
    Reply handle_list(const Command& cmd);
    Reply handle_retr(const Command& cmd);
    Reply handle_top(const Command& cmd);
    Reply handle_dele(const Command& cmd);
    Reply handle_noop(const Command& cmd);
    Reply handle_rset(const Command& cmd);
    Reply handle_quit(const Command& cmd);
    Reply handle_uidl(const Command& cmd);
    Reply handle_capa(const Command& cmd);

    // Resolves a message-number argument against the current snapshot, or
    // produces the -ERR reply explaining why it cannot be used.
    std::optional<size_t> resolve_index(const std::string& argument, std::string& error) const;

    std::shared_ptr<const UserDirectory> users_;
    std::shared_ptr<MailboxStore> store_;
    std::string hostname_;
    std::string peer_ = "unknown";

    SessionState state_ = SessionState::AUTHORIZATION;
    std::string pending_username_;
    std::string username_;
    std::unique_ptr<MailboxHandle> mailbox_;
};

}  // namespace minimail::pop3
