#include "smtp_commands.hpp"
#include "protocol/command_line.hpp"
#include <unordered_map>

namespace minimail::smtp {

Command Command::parse(const std::string& line) {
    Command cmd;

    auto split = protocol::split_command(line);
    if (split.verb.empty()) {
        return cmd;
    }

    cmd.name = split.verb;
    cmd.argument = split.argument;
    cmd.type = string_to_type(split.verb);
    return cmd;
}

CommandType Command::string_to_type(const std::string& name) {
    static const std::unordered_map<std::string, CommandType> mapping = {
        {"HELO", CommandType::HELO},
        {"EHLO", CommandType::EHLO},
        {"MAIL", CommandType::MAIL},
        {"RCPT", CommandType::RCPT},
        {"DATA", CommandType::DATA},
        {"RSET", CommandType::RSET},
        {"NOOP", CommandType::NOOP},
        {"QUIT", CommandType::QUIT},
        {"VRFY", CommandType::VRFY},
        {"HELP", CommandType::HELP}
    };

    auto it = mapping.find(name);
    return it != mapping.end() ? it->second : CommandType::UNKNOWN;
}

std::string Command::type_to_string(CommandType type) {
    switch (type) {
        case CommandType::HELO: return "HELO";
        case CommandType::EHLO: return "EHLO";
        case CommandType::MAIL: return "MAIL";
        case CommandType::RCPT: return "RCPT";
        case CommandType::DATA: return "DATA";
        case CommandType::RSET: return "RSET";
        case CommandType::NOOP: return "NOOP";
        case CommandType::QUIT: return "QUIT";
        case CommandType::VRFY: return "VRFY";
        case CommandType::HELP: return "HELP";
        case CommandType::UNKNOWN: break;
    }
    return "UNKNOWN";
}

std::optional<MailPath> MailPath::parse(const std::string& argument, std::string_view keyword) {
    if (argument.size() < keyword.size() ||
        protocol::to_upper(argument.substr(0, keyword.size())) != keyword) {
        return std::nullopt;
    }

    std::string rest = protocol::trim(argument.substr(keyword.size()));
    if (rest.empty()) {
        return std::nullopt;
    }

    MailPath path;
    if (rest[0] == '<') {
        auto close = rest.find('>');
        if (close == std::string::npos) {
            return std::nullopt;
        }
        path.address = protocol::trim(rest.substr(1, close - 1));
        path.parameters = protocol::trim(rest.substr(close + 1));
    } else {
        auto space = rest.find_first_of(" \t");
        path.address = rest.substr(0, space);
        if (space != std::string::npos) {
            path.parameters = protocol::trim(rest.substr(space));
        }
    }

    if (path.address.find_first_of("<> \t") != std::string::npos) {
        return std::nullopt;
    }
    return path;
}

std::string bare_address(const std::string& argument) {
    std::string address = protocol::trim(argument);
    if (address.size() >= 2 && address.front() == '<' && address.back() == '>') {
        address = protocol::trim(address.substr(1, address.size() - 2));
    }
    return address;
}

}  // namespace minimail::smtp
