#pragma once

#include <string>
#include <vector>

namespace minimail::pop3 {

enum class CommandType {
    USER,
    PASS,
    STAT,
    LIST,
    RETR,
    DELE,
    NOOP,
    RSET,
    QUIT,
    TOP,
    UIDL,
    CAPA,
    APOP,
    UNKNOWN
};

struct Command {
    CommandType type = CommandType::UNKNOWN;
    std::string name;
    std::string argument;
    std::vector<std::string> args;

    static Command parse(const std::string& line);
    static CommandType string_to_type(const std::string& name);
    static std::string type_to_string(CommandType type);
};

// Response helpers
namespace response {
    constexpr const char* OK = "+OK";
    constexpr const char* ERR = "-ERR";

    inline std::string ok(const std::string& msg = "") {
        return msg.empty() ? std::string(OK) : std::string(OK) + " " + msg;
    }

    inline std::string err(const std::string& msg = "") {
        return msg.empty() ? std::string(ERR) : std::string(ERR) + " " + msg;
    }

    // RFC 2449 extended response codes
    inline std::string err(const char* code, const std::string& msg) {
        return std::string(ERR) + " [" + code + "] " + msg;
    }
}

}  // namespace minimail::pop3
