#include "smtp_state_machine.hpp"
#include "auth/user_directory.hpp"
#include "storage/mailbox_store.hpp"
#include "protocol/command_line.hpp"
#include "logger.hpp"
#include <algorithm>
#include <chrono>

namespace minimail::smtp {

namespace {

const char* const kSupportedCommands = "HELO EHLO MAIL RCPT DATA RSET NOOP QUIT VRFY HELP";

std::optional<std::string> command_syntax(const std::string& topic) {
    switch (Command::string_to_type(protocol::to_upper(topic))) {
        case CommandType::HELO: return "HELO <hostname>";
        case CommandType::EHLO: return "EHLO <hostname>";
        case CommandType::MAIL: return "MAIL FROM:<address>";
        case CommandType::RCPT: return "RCPT TO:<address>";
        case CommandType::DATA: return "DATA";
        case CommandType::RSET: return "RSET";
        case CommandType::NOOP: return "NOOP";
        case CommandType::QUIT: return "QUIT";
        case CommandType::VRFY: return "VRFY <address>";
        case CommandType::HELP: return "HELP [command]";
        case CommandType::UNKNOWN: break;
    }
    return std::nullopt;
}

}  // namespace

std::string_view to_string(SessionState state) {
    switch (state) {
        case SessionState::GREETING:       return "GREETING";
        case SessionState::SENDER_SET:     return "SENDER_SET";
        case SessionState::RECIPIENTS_SET: return "RECIPIENTS_SET";
        case SessionState::RECEIVING_DATA: return "RECEIVING_DATA";
        case SessionState::DONE:           return "DONE";
    }
    return "UNKNOWN";
}

SMTPStateMachine::SMTPStateMachine(std::shared_ptr<const UserDirectory> users,
                                   std::shared_ptr<MailboxStore> store,
                                   std::string hostname)
    : users_(std::move(users))
    , store_(std::move(store))
    , hostname_(std::move(hostname)) {
}

Reply SMTPStateMachine::greeting() const {
    return {reply::make(reply::SERVICE_READY, hostname_ + " Service Ready"), false};
}

Reply SMTPStateMachine::on_line(const std::string& line) {
    switch (state_) {
        case SessionState::DONE:
            return {};
        case SessionState::RECEIVING_DATA:
            return handle_data_line(line);
        case SessionState::GREETING:
        case SessionState::SENDER_SET:
        case SessionState::RECIPIENTS_SET:
            break;
    }

    Command cmd = Command::parse(line);
    if (cmd.name.empty()) {
        return {reply::make(reply::SYNTAX_ERROR, "Error: bad syntax"), false};
    }

    LOG_DEBUG_FMT("SMTP {} [{}]: {}", peer_, to_string(state_), line);
    return handle_command(cmd);
}

void SMTPStateMachine::abort() {
    if (state_ == SessionState::RECEIVING_DATA) {
        LOG_INFO_FMT("SMTP {}: connection lost during DATA, {} bytes discarded",
                     peer_, envelope_.data.size());
    }
    envelope_.clear();
    state_ = SessionState::DONE;
}

Reply SMTPStateMachine::handle_command(const Command& cmd) {
    switch (cmd.type) {
        case CommandType::HELO: return handle_helo(cmd, false);
        case CommandType::EHLO: return handle_helo(cmd, true);
        case CommandType::MAIL: return handle_mail(cmd);
        case CommandType::RCPT: return handle_rcpt(cmd);
        case CommandType::DATA: return handle_data(cmd);
        case CommandType::RSET: return handle_rset(cmd);
        case CommandType::NOOP: return handle_noop(cmd);
        case CommandType::QUIT: return handle_quit(cmd);
        case CommandType::VRFY: return handle_vrfy(cmd);
        case CommandType::HELP: return handle_help(cmd);
        case CommandType::UNKNOWN: break;
    }
    return {reply::make(reply::SYNTAX_ERROR, "Error: command \"" + cmd.name + "\" not recognized"),
            false};
}

Reply SMTPStateMachine::handle_helo(const Command& cmd, bool extended) {
    if (cmd.argument.empty()) {
        return {reply::make(reply::SYNTAX_ERROR_PARAMS,
                            "Syntax: " + Command::type_to_string(cmd.type) + " hostname"), false};
    }

    if (state_ != SessionState::GREETING) {
        return {reply::make(reply::BAD_SEQUENCE, "Duplicate HELO"), false};
    }

    client_hostname_ = cmd.argument;
    envelope_.clear();
    state_ = SessionState::SENDER_SET;

    if (!extended) {
        return {reply::make(reply::OK, hostname_ + " Hello " + cmd.argument), false};
    }

    std::vector<std::string> capabilities;
    capabilities.push_back(hostname_ + " Hello " + cmd.argument);
    capabilities.push_back("SIZE " + std::to_string(max_message_size_));
    capabilities.push_back("PIPELINING");
    capabilities.push_back("HELP");

    return {reply::make_multi(reply::OK, capabilities), false};
}

Reply SMTPStateMachine::handle_mail(const Command& cmd) {
    if (state_ == SessionState::GREETING) {
        return {reply::make(reply::BAD_SEQUENCE, "Error: send HELO first"), false};
    }

    if (state_ == SessionState::RECIPIENTS_SET) {
        return {reply::make(reply::BAD_SEQUENCE, "Error: nested MAIL command"), false};
    }

    auto path = MailPath::parse(cmd.argument, "FROM:");
    if (!path) {
        return {reply::make(reply::SYNTAX_ERROR_PARAMS, "Syntax: MAIL FROM:<address>"), false};
    }

    if (!path->parameters.empty()) {
        return {reply::make(reply::PARAMS_NOT_RECOGNIZED,
                            "MAIL FROM parameters not recognized or not implemented"), false};
    }

    envelope_.clear();
    envelope_.mail_from = path->address;
    state_ = SessionState::RECIPIENTS_SET;

    return {reply::make(reply::OK, "<" + path->address + "> Sender OK"), false};
}

Reply SMTPStateMachine::handle_rcpt(const Command& cmd) {
    if (state_ == SessionState::GREETING) {
        return {reply::make(reply::BAD_SEQUENCE, "Error: send HELO first"), false};
    }

    if (state_ != SessionState::RECIPIENTS_SET) {
        return {reply::make(reply::BAD_SEQUENCE, "Error: need MAIL command"), false};
    }

    auto path = MailPath::parse(cmd.argument, "TO:");
    if (!path || path->address.empty()) {
        return {reply::make(reply::SYNTAX_ERROR_PARAMS, "Syntax: RCPT TO:<address>"), false};
    }

    if (!path->parameters.empty()) {
        return {reply::make(reply::PARAMS_NOT_RECOGNIZED,
                            "RCPT TO parameters not recognized or not implemented"), false};
    }

    auto& rcpts = envelope_.rcpt_to;
    if (std::find(rcpts.begin(), rcpts.end(), path->address) != rcpts.end()) {
        return {reply::make(reply::OK, "Recipient Ok"), false};
    }

    if (rcpts.size() >= max_recipients_) {
        return {reply::make(reply::INSUFFICIENT_STORAGE, "Too many recipients"), false};
    }

    if (!users_ || !users_->exists(path->address)) {
        LOG_DEBUG_FMT("SMTP {}: rejected unknown recipient {}", peer_, path->address);
        return {reply::make(reply::MAILBOX_NOT_FOUND, "No such user <" + path->address + ">"),
                false};
    }

    rcpts.push_back(path->address);
    return {reply::make(reply::OK, "Recipient Ok"), false};
}

Reply SMTPStateMachine::handle_data(const Command& cmd) {
    if (state_ == SessionState::GREETING) {
        return {reply::make(reply::BAD_SEQUENCE, "Error: send HELO first"), false};
    }

    if (state_ != SessionState::RECIPIENTS_SET) {
        return {reply::make(reply::BAD_SEQUENCE, "Error: need MAIL command"), false};
    }

    if (envelope_.rcpt_to.empty()) {
        return {reply::make(reply::BAD_SEQUENCE, "Error: need RCPT command"), false};
    }

    if (!cmd.argument.empty()) {
        return {reply::make(reply::SYNTAX_ERROR_PARAMS, "Syntax: DATA"), false};
    }

    envelope_.data.clear();
    envelope_.oversize = false;
    state_ = SessionState::RECEIVING_DATA;

    return {reply::make(reply::START_MAIL_INPUT, "End data with <CR><LF>.<CR><LF>"), false};
}

Reply SMTPStateMachine::handle_rset(const Command& cmd) {
    if (!cmd.argument.empty()) {
        return {reply::make(reply::SYNTAX_ERROR_PARAMS, "Syntax: RSET"), false};
    }

    envelope_.clear();
    if (state_ != SessionState::GREETING) {
        state_ = SessionState::SENDER_SET;
    }

    return {reply::make(reply::OK, "OK"), false};
}

Reply SMTPStateMachine::handle_noop(const Command& /* cmd */) {
    return {reply::make(reply::OK, "OK"), false};
}

Reply SMTPStateMachine::handle_quit(const Command& /* cmd */) {
    envelope_.clear();
    state_ = SessionState::DONE;
    return {reply::make(reply::SERVICE_CLOSING, hostname_ + " Closing connection"), true};
}

Reply SMTPStateMachine::handle_vrfy(const Command& cmd) {
    std::string address = bare_address(cmd.argument);
    if (address.empty()) {
        return {reply::make(reply::SYNTAX_ERROR_PARAMS, "Syntax: VRFY <address>"), false};
    }

    if (users_ && users_->exists(address)) {
        return {reply::make(reply::OK, "<" + address + ">"), false};
    }

    return {reply::make(reply::CANNOT_VRFY, "Cannot VRFY user <" + address + ">"), false};
}

Reply SMTPStateMachine::handle_help(const Command& cmd) {
    if (cmd.argument.empty()) {
        std::vector<std::string> help;
        help.push_back(hostname_ + " supports:");
        help.push_back(kSupportedCommands);
        return {reply::make_multi(reply::HELP, help), false};
    }

    auto syntax = command_syntax(cmd.argument);
    if (!syntax) {
        return {reply::make(reply::SYNTAX_ERROR_PARAMS,
                            std::string("Supported commands: ") + kSupportedCommands), false};
    }

    return {reply::make(reply::HELP, "Syntax: " + *syntax), false};
}

Reply SMTPStateMachine::handle_data_line(const std::string& line) {
    if (protocol::is_terminator(line)) {
        return finish_message();
    }

    if (envelope_.oversize) {
        return {};
    }

    std::string content = protocol::unstuff_line(line);
    if (envelope_.data.size() + content.size() + protocol::kCRLF.size() > max_message_size_) {
        LOG_WARNING_FMT("SMTP {}: message exceeds {} bytes, discarding", peer_, max_message_size_);
        envelope_.oversize = true;
        envelope_.data.clear();
        return {};
    }

    envelope_.data += content;
    envelope_.data += protocol::kCRLF;
    return {};
}

Reply SMTPStateMachine::finish_message() {
    state_ = SessionState::SENDER_SET;

    if (envelope_.oversize) {
        envelope_.clear();
        return {reply::make(reply::EXCEEDED_STORAGE,
                            "Message exceeds fixed maximum message size"), false};
    }

    Message message;
    message.sender = envelope_.mail_from;
    message.recipients = envelope_.rcpt_to;
    message.body = std::move(envelope_.data);
    message.received_at = std::chrono::system_clock::now();

    size_t delivered = 0;
    for (const auto& recipient : envelope_.rcpt_to) {
        StoreStatus status = store_->append(recipient, message);
        if (status == StoreStatus::Ok) {
            ++delivered;
        } else {
            LOG_ERROR_FMT("SMTP {}: delivery to {} failed: {}", peer_, recipient, to_string(status));
        }
    }

    size_t total = envelope_.rcpt_to.size();
    envelope_.clear();

    if (delivered != total) {
        return {reply::make(reply::LOCAL_ERROR,
                            "Requested action aborted: local error in processing"), false};
    }

    LOG_INFO_FMT("SMTP {}: message from <{}> ({} bytes) delivered to {} recipient(s)",
                 peer_, message.sender, message.body.size(), delivered);
    return {reply::make(reply::OK, "OK: message accepted for delivery"), false};
}

}  // namespace minimail::smtp
