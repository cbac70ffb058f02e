#include "pop3_state_machine.hpp"
#include "auth/user_directory.hpp"
#include "storage/mailbox_store.hpp"
#include "protocol/command_line.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace minimail::pop3 {

namespace {

const char* const kNotInTransaction = "Not in transaction state, use USER/PASS first to authenticate";

// Header block, the blank separator line and the first body_lines lines of the body.
std::string top_of(const std::string& body, size_t body_lines) {
    std::string out;
    size_t pos = 0;
    bool in_headers = true;
    size_t emitted_body = 0;

    while (pos < body.size()) {
        size_t eol = body.find('\n', pos);
        size_t next = (eol == std::string::npos) ? body.size() : eol + 1;

        if (!in_headers) {
            if (emitted_body == body_lines) break;
            ++emitted_body;
        }

        std::string_view line(body.data() + pos, next - pos);
        out.append(line);

        if (in_headers && (line == "\r\n" || line == "\n")) {
            in_headers = false;
        }
        pos = next;
    }
    return out;
}

bool all_digits(const std::string& value) {
    return !value.empty() && value.size() <= 18 &&
           std::all_of(value.begin(), value.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

}  // namespace

std::string_view to_string(SessionState state) {
    switch (state) {
        case SessionState::AUTHORIZATION: return "AUTHORIZATION";
        case SessionState::TRANSACTION:   return "TRANSACTION";
        case SessionState::UPDATE:        return "UPDATE";
        case SessionState::CLOSED:        return "CLOSED";
    }
    return "UNKNOWN";
}

POP3StateMachine::POP3StateMachine(std::shared_ptr<const UserDirectory> users,
                                   std::shared_ptr<MailboxStore> store,
                                   std::string hostname)
    : users_(std::move(users))
    , store_(std::move(store))
    , hostname_(std::move(hostname)) {
}

POP3StateMachine::~POP3StateMachine() = default;

Reply POP3StateMachine::greeting() const {
    return {response::ok("POP3 server ready"), false};
}

Reply POP3StateMachine::on_line(const std::string& line) {
    if (state_ == SessionState::CLOSED || state_ == SessionState::UPDATE) {
        return {};
    }

    Command cmd = Command::parse(line);
    if (cmd.name.empty()) {
        return {response::err("Empty command"), false};
    }

    if (cmd.type == CommandType::PASS) {
        LOG_DEBUG_FMT("POP3 {} [{}]: PASS ****", peer_, to_string(state_));
    } else {
        LOG_DEBUG_FMT("POP3 {} [{}]: {}", peer_, to_string(state_), line);
    }

    return handle_command(cmd);
}

void POP3StateMachine::abort() {
    if (mailbox_) {
        LOG_INFO_FMT("POP3 {}: session for {} ended without QUIT, {} deletion mark(s) dropped",
                     peer_, username_, mailbox_->marks().size());
        mailbox_.reset();
    }
    state_ = SessionState::CLOSED;
}

Reply POP3StateMachine::handle_command(const Command& cmd) {
    switch (cmd.type) {
        case CommandType::USER: return handle_user(cmd);
        case CommandType::PASS: return handle_pass(cmd);
        case CommandType::STAT: return handle_stat(cmd);
        case CommandType::LIST: return handle_list(cmd);
        case CommandType::RETR: return handle_retr(cmd);
        case CommandType::TOP:  return handle_top(cmd);
        case CommandType::DELE: return handle_dele(cmd);
        case CommandType::NOOP: return handle_noop(cmd);
        case CommandType::RSET: return handle_rset(cmd);
        case CommandType::QUIT: return handle_quit(cmd);
        case CommandType::UIDL: return handle_uidl(cmd);
        case CommandType::CAPA: return handle_capa(cmd);
        case CommandType::APOP: return {response::err("Unimplemented command"), false};
        case CommandType::UNKNOWN: break;
    }
    return {response::err("Unknown command \"" + cmd.name + "\""), false};
}

Reply POP3StateMachine::handle_user(const Command& cmd) {
    if (state_ != SessionState::AUTHORIZATION) {
        return {response::err("Already authenticated"), false};
    }

    if (cmd.args.size() != 1) {
        return {response::err("Invalid argument"), false};
    }

    if (!users_ || !users_->exists(cmd.args[0])) {
        pending_username_.clear();
        return {response::err("No mailbox for given user"), false};
    }

    pending_username_ = cmd.args[0];
    return {response::ok(pending_username_ + " is a valid mailbox"), false};
}

Reply POP3StateMachine::handle_pass(const Command& cmd) {
    if (state_ != SessionState::AUTHORIZATION) {
        return {response::err("Already authenticated"), false};
    }

    if (pending_username_.empty()) {
        return {response::err("Invalid command sequence, must send USER command first"), false};
    }

    if (cmd.argument.empty()) {
        return {response::err("Invalid argument"), false};
    }

    std::string user = pending_username_;
    pending_username_.clear();

    if (!users_->verify(user, cmd.argument)) {
        LOG_INFO_FMT("POP3 {}: authentication failed for {}", peer_, user);
        return {response::err("AUTH", "Invalid password"), false};
    }

    auto result = store_->acquire(user);
    switch (result.status) {
        case StoreStatus::Ok:
            break;
        case StoreStatus::AlreadyLocked:
            LOG_INFO_FMT("POP3 {}: maildrop of {} is locked by another session", peer_, user);
            return {response::err("IN-USE", "Unable to lock maildrop"), false};
        case StoreStatus::NoSuchUser:
            return {response::err("AUTH", "No mailbox for given user"), false};
        case StoreStatus::NoSuchIndex:
        case StoreStatus::AlreadyDeleted:
        case StoreStatus::IOError:
            return {response::err("SYS/TEMP", "Unable to open maildrop"), false};
    }

    mailbox_ = std::move(result.handle);
    username_ = user;
    state_ = SessionState::TRANSACTION;

    LOG_INFO_FMT("POP3 {}: {} logged in, {} messages", peer_, username_, mailbox_->count());
    return {response::ok("Maildrop locked and ready, " + std::to_string(mailbox_->count()) +
                         " messages (" + std::to_string(mailbox_->total_size()) + " octets)"),
            false};
}

Reply POP3StateMachine::handle_stat(const Command& /* cmd */) {
    if (state_ != SessionState::TRANSACTION) {
        return {response::err(kNotInTransaction), false};
    }

    return {response::ok(std::to_string(mailbox_->count()) + " " +
                         std::to_string(mailbox_->total_size())), false};
}

std::optional<size_t> POP3StateMachine::resolve_index(const std::string& argument,
                                                      std::string& error) const {
    auto index = protocol::parse_index(argument);
    if (!index) {
        error = response::err("Invalid argument, requires a valid message number");
        return std::nullopt;
    }

    if (!mailbox_->valid_index(*index)) {
        error = response::err("No such message, only " +
                              std::to_string(mailbox_->snapshot_size()) + " messages in maildrop");
        return std::nullopt;
    }

    if (mailbox_->is_marked(*index)) {
        error = response::err("Message " + std::to_string(*index) + " already deleted");
        return std::nullopt;
    }

    return index;
}

Reply POP3StateMachine::handle_list(const Command& cmd) {
    if (state_ != SessionState::TRANSACTION) {
        return {response::err(kNotInTransaction), false};
    }

    if (!cmd.args.empty()) {
        if (cmd.args.size() != 1) {
            return {response::err("Invalid argument, requires a valid message number"), false};
        }

        std::string error;
        auto index = resolve_index(cmd.args[0], error);
        if (!index) {
            return {error, false};
        }
        return {response::ok(std::to_string(*index) + " " +
                             std::to_string(mailbox_->fetch(*index)->size())), false};
    }

    // Multi-line response
    std::ostringstream oss;
    oss << response::ok(std::to_string(mailbox_->count()) + " messages ("
                        + std::to_string(mailbox_->total_size()) + " octets)") << "\r\n";

    for (const auto& summary : mailbox_->list()) {
        oss << summary.index << " " << summary.size << "\r\n";
    }
    oss << ".";

    return {oss.str(), false};
}

Reply POP3StateMachine::handle_retr(const Command& cmd) {
    if (state_ != SessionState::TRANSACTION) {
        return {response::err(kNotInTransaction), false};
    }

    if (cmd.args.size() != 1) {
        return {response::err("Invalid argument, requires a valid message number"), false};
    }

    std::string error;
    auto index = resolve_index(cmd.args[0], error);
    if (!index) {
        return {error, false};
    }

    auto message = mailbox_->fetch(*index);

    std::string text = response::ok(std::to_string(message->size()) + " octets");
    text += protocol::kCRLF;
    text += protocol::dot_stuff(message->body);
    text += protocol::kTerminator;

    return {text, false};
}

Reply POP3StateMachine::handle_top(const Command& cmd) {
    if (state_ != SessionState::TRANSACTION) {
        return {response::err(kNotInTransaction), false};
    }

    if (cmd.args.size() != 2 || !all_digits(cmd.args[1])) {
        return {response::err("Usage: TOP msg n"), false};
    }

    std::string error;
    auto index = resolve_index(cmd.args[0], error);
    if (!index) {
        return {error, false};
    }

    size_t lines = std::stoull(cmd.args[1]);
    auto message = mailbox_->fetch(*index);

    std::string text = response::ok("top of message follows");
    text += protocol::kCRLF;
    text += protocol::dot_stuff(top_of(message->body, lines));
    text += protocol::kTerminator;

    return {text, false};
}

Reply POP3StateMachine::handle_dele(const Command& cmd) {
    if (state_ != SessionState::TRANSACTION) {
        return {response::err(kNotInTransaction), false};
    }

    auto index = cmd.args.size() == 1 ? protocol::parse_index(cmd.args[0]) : std::nullopt;
    if (!index) {
        return {response::err("Invalid argument, requires a valid message number"), false};
    }

    switch (mailbox_->mark_delete(*index)) {
        case StoreStatus::Ok:
            return {response::ok("Message " + std::to_string(*index) + " deleted"), false};
        case StoreStatus::AlreadyDeleted:
            return {response::err("Message " + std::to_string(*index) + " already deleted"), false};
        case StoreStatus::NoSuchIndex:
        case StoreStatus::NoSuchUser:
        case StoreStatus::AlreadyLocked:
        case StoreStatus::IOError:
            break;
    }
    return {response::err("Invalid message number, no such message"), false};
}

Reply POP3StateMachine::handle_noop(const Command& /* cmd */) {
    if (state_ != SessionState::TRANSACTION) {
        return {response::err(kNotInTransaction), false};
    }
    return {response::ok(), false};
}

Reply POP3StateMachine::handle_rset(const Command& /* cmd */) {
    if (state_ != SessionState::TRANSACTION) {
        return {response::err(kNotInTransaction), false};
    }

    mailbox_->clear_marks();
    return {response::ok("maildrop has " + std::to_string(mailbox_->count()) + " messages (" +
                         std::to_string(mailbox_->total_size()) + " octets)"), false};
}

Reply POP3StateMachine::handle_quit(const Command& /* cmd */) {
    if (state_ != SessionState::TRANSACTION) {
        state_ = SessionState::CLOSED;
        return {response::ok("POP3 server signing off"), true};
    }

    state_ = SessionState::UPDATE;
    size_t deleted = mailbox_->marks().size();
    StoreStatus status = mailbox_->commit();
    size_t remaining = mailbox_->count();

    // A failed commit keeps storage as it was; dropping the handle frees the lock
    mailbox_.reset();
    state_ = SessionState::CLOSED;

    if (status != StoreStatus::Ok) {
        LOG_ERROR_FMT("POP3 {}: commit for {} failed: {}", peer_, username_, to_string(status));
        return {response::err("SYS/TEMP", "Unable to remove deleted messages"), true};
    }

    LOG_INFO_FMT("POP3 {}: {} signed off, {} deleted", peer_, username_, deleted);
    return {response::ok("POP3 server signing off (" + std::to_string(remaining) +
                         " messages left)"), true};
}

Reply POP3StateMachine::handle_uidl(const Command& cmd) {
    if (state_ != SessionState::TRANSACTION) {
        return {response::err(kNotInTransaction), false};
    }

    if (!cmd.args.empty()) {
        if (cmd.args.size() != 1) {
            return {response::err("Invalid argument, requires a valid message number"), false};
        }

        std::string error;
        auto index = resolve_index(cmd.args[0], error);
        if (!index) {
            return {error, false};
        }
        return {response::ok(std::to_string(*index) + " " + *mailbox_->uid(*index)), false};
    }

    // Multi-line response
    std::ostringstream oss;
    oss << response::ok() << "\r\n";

    for (const auto& summary : mailbox_->list()) {
        oss << summary.index << " " << *mailbox_->uid(summary.index) << "\r\n";
    }
    oss << ".";

    return {oss.str(), false};
}

Reply POP3StateMachine::handle_capa(const Command& /* cmd */) {
    std::ostringstream oss;
    oss << response::ok("Capability list follows") << "\r\n";
    oss << "USER\r\n";
    oss << "TOP\r\n";
    oss << "UIDL\r\n";
    oss << "RESP-CODES\r\n";
    oss << "AUTH-RESP-CODE\r\n";
    oss << "PIPELINING\r\n";

    if (state_ == SessionState::TRANSACTION) {
        oss << "EXPIRE NEVER\r\n";
    }

    oss << "IMPLEMENTATION " << hostname_ << "\r\n";
    oss << ".";

    return {oss.str(), false};
}

}  // namespace minimail::pop3
