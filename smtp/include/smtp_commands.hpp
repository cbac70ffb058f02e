#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <optional>

namespace minimail::smtp {

enum class CommandType {
    HELO,
    EHLO,
    MAIL,      // MAIL FROM:
    RCPT,      // RCPT TO:
    DATA,
    RSET,
    NOOP,
    QUIT,
    VRFY,
    HELP,
    UNKNOWN
};

struct Command {
    CommandType type = CommandType::UNKNOWN;
    std::string name;
    std::string argument;

    static Command parse(const std::string& line);
    static CommandType string_to_type(const std::string& name);
    static std::string type_to_string(CommandType type);
};

// SMTP Reply codes and messages
namespace reply {
    // 2xx - Positive Completion
    constexpr int HELP = 214;
    constexpr int SERVICE_READY = 220;
    constexpr int SERVICE_CLOSING = 221;
    constexpr int OK = 250;
    constexpr int CANNOT_VRFY = 252;

    // 3xx - Positive Intermediate
    constexpr int START_MAIL_INPUT = 354;

    // 4xx - Transient Negative
    constexpr int LOCAL_ERROR = 451;
    constexpr int INSUFFICIENT_STORAGE = 452;

    // 5xx - Permanent Negative
    constexpr int SYNTAX_ERROR = 500;
    constexpr int SYNTAX_ERROR_PARAMS = 501;
    constexpr int BAD_SEQUENCE = 503;
    constexpr int MAILBOX_NOT_FOUND = 550;
    constexpr int EXCEEDED_STORAGE = 552;
    constexpr int PARAMS_NOT_RECOGNIZED = 555;

    inline std::string make(int code, const std::string& message) {
        return std::to_string(code) + " " + message;
    }

    inline std::string make_multi(int code, const std::vector<std::string>& lines) {
        std::string result;
        for (size_t i = 0; i < lines.size(); ++i) {
            if (i == lines.size() - 1) {
                result += std::to_string(code) + " " + lines[i];
            } else {
                result += std::to_string(code) + "-" + lines[i] + "\r\n";
            }
        }
        return result;
    }
}

// Reverse- or forward-path of MAIL FROM:/RCPT TO:. The keyword is matched
// case-insensitively; anything after the path is kept as parameters.
struct MailPath {
    std::string address;
    std::string parameters;

    static std::optional<MailPath> parse(const std::string& argument, std::string_view keyword);
};

// Strips optional angle brackets and surrounding blanks from a VRFY argument.
std::string bare_address(const std::string& argument);

}  // namespace minimail::smtp
