#include "mail_client.hpp"
#include "protocol/command_line.hpp"
#include "logger.hpp"
#include <iostream>
#include <chrono>
#include <optional>
#include <vector>

namespace {

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " <server> <pop3_port> <smtp_port> [options]\n"
              << "Options:\n"
              << "  --user <name>          Mailbox to log in to (required)\n"
              << "  --password <secret>    Password for --user (required)\n"
              << "  --to <address>         Recipient (default: --user); the check reads --user's mailbox\n"
              << "  --from <address>       Sender (default: --user)\n"
              << "  --subject <text>       Subject line\n"
              << "  --body <text>          Message body\n"
              << "  --debug                Verbose protocol logging\n"
              << "  -h, --help             Show this help message\n";
}

std::optional<uint16_t> parse_port(const std::string& value) {
    auto port = minimail::protocol::parse_index(value);
    if (!port || *port > 65535) {
        return std::nullopt;
    }
    return static_cast<uint16_t>(*port);
}

}  // namespace

int main(int argc, char* argv[]) {
    std::vector<std::string> positional;
    std::string user;
    std::string password;
    std::string to;
    std::string from;
    std::string subject = "minimail round trip";
    std::string body = "hello\n";
    bool debug = false;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--user" && i + 1 < argc) {
            user = argv[++i];
        } else if (arg == "--password" && i + 1 < argc) {
            password = argv[++i];
        } else if (arg == "--to" && i + 1 < argc) {
            to = argv[++i];
        } else if (arg == "--from" && i + 1 < argc) {
            from = argv[++i];
        } else if (arg == "--subject" && i + 1 < argc) {
            subject = argv[++i];
        } else if (arg == "--body" && i + 1 < argc) {
            body = argv[++i];
        } else if (arg == "--debug") {
            debug = true;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 2;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() != 3 || user.empty() || password.empty()) {
        print_usage(argv[0]);
        return 2;
    }

    auto pop3_port = parse_port(positional[1]);
    auto smtp_port = parse_port(positional[2]);
    if (!pop3_port || !smtp_port) {
        std::cerr << "Invalid port\n";
        return 2;
    }

    const std::string& server = positional[0];
    if (to.empty()) to = user;
    if (from.empty()) from = user;
    if (!body.empty() && body.back() != '\n') body += '\n';

    minimail::Logger::instance().init(debug ? minimail::LogLevel::Debug : minimail::LogLevel::Warning);

    // Unique subject so the message can be told apart from earlier runs
    auto stamp = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    std::string content = "From: " + from + "\n"
                        + "To: " + to + "\n"
                        + "Subject: " + subject + " [" + std::to_string(stamp) + "]\n"
                        + "\n"
                        + body;

    try {
        minimail::client::SMTPClient smtp;
        smtp.connect(server, *smtp_port);
        smtp.helo("minimail-client");
        smtp.send_mail(from, {to}, content);
        smtp.quit();
        std::cout << "Submitted message to " << to << " via " << server << ":" << *smtp_port << "\n";

        minimail::client::POP3Client pop3;
        pop3.connect(server, *pop3_port);
        pop3.login(user, password);

        auto [count, size] = pop3.stat();
        std::cout << "Mailbox " << user << ": " << count << " messages, " << size << " octets\n";

        bool found = false;
        for (const auto& [index, octets] : pop3.list()) {
            if (pop3.retr(index) == content) {
                std::cout << "Message " << index << " (" << octets << " octets) matches\n";
                found = true;
                break;
            }
        }
        pop3.quit();

        if (!found) {
            std::cerr << "Submitted message not found in mailbox of " << user << "\n";
            return 1;
        }
    } catch (const minimail::client::ClientError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
