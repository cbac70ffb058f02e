#include "pop3_commands.hpp"
#include "protocol/command_line.hpp"
#include <unordered_map>

namespace minimail::pop3 {

Command Command::parse(const std::string& line) {
    Command cmd;

    auto split = protocol::split_command(line);
    if (split.verb.empty()) {
        return cmd;
    }

    cmd.name = split.verb;
    cmd.type = string_to_type(split.verb);
    cmd.argument = split.argument;
    cmd.args = protocol::split_words(split.argument);

    return cmd;
}

CommandType Command::string_to_type(const std::string& name) {
    static const std::unordered_map<std::string, CommandType> mapping = {
        {"USER", CommandType::USER},
        {"PASS", CommandType::PASS},
        {"STAT", CommandType::STAT},
        {"LIST", CommandType::LIST},
        {"RETR", CommandType::RETR},
        {"DELE", CommandType::DELE},
        {"NOOP", CommandType::NOOP},
        {"RSET", CommandType::RSET},
        {"QUIT", CommandType::QUIT},
        {"TOP", CommandType::TOP},
        {"UIDL", CommandType::UIDL},
        {"CAPA", CommandType::CAPA},
        {"APOP", CommandType::APOP}
    };

    auto it = mapping.find(name);
    return it != mapping.end() ? it->second : CommandType::UNKNOWN;
}

std::string Command::type_to_string(CommandType type) {
    switch (type) {
        case CommandType::USER: return "USER";
        case CommandType::PASS: return "PASS";
        case CommandType::STAT: return "STAT";
        case CommandType::LIST: return "LIST";
        case CommandType::RETR: return "RETR";
        case CommandType::DELE: return "DELE";
        case CommandType::NOOP: return "NOOP";
        case CommandType::RSET: return "RSET";
        case CommandType::QUIT: return "QUIT";
        case CommandType::TOP: return "TOP";
        case CommandType::UIDL: return "UIDL";
        case CommandType::CAPA: return "CAPA";
        case CommandType::APOP: return "APOP";
        case CommandType::UNKNOWN: break;
    }
    return "UNKNOWN";
}

}  // namespace minimail::pop3
