#pragma once

#include <string>
#include <filesystem>
#include <optional>
#include <unordered_map>
#include <chrono>
#include <cstdint>
#include "logger.hpp"

namespace minimail {

struct ServerConfig {
    std::string bind_address = "127.0.0.1";
    uint16_t port = 0;
    std::string hostname = "localhost";
    size_t max_connections = 1000;
    size_t thread_pool_size = 4;
    size_t max_line_length = 64 * 1024;
    std::chrono::seconds connection_timeout{300};
};

struct StorageConfig {
    std::filesystem::path root = "/var/lib/minimail";
    std::filesystem::path registry;     // empty: <root>/userinfo.txt
    std::string mailbox_dir = "users";
    std::chrono::milliseconds lock_wait{0};  // 0 = fail fast
    bool sync_writes = true;

    std::filesystem::path registry_path() const {
        return registry.empty() ? root / "userinfo.txt" : registry;
    }
    std::filesystem::path mailbox_root() const { return root / mailbox_dir; }
};

struct LogConfig {
    LogLevel level = LogLevel::Info;
    std::filesystem::path file;
    bool log_to_console = true;
    bool log_to_file = false;
    size_t max_file_size = 10 * 1024 * 1024;
    size_t max_files = 5;
};

struct SMTPConfig : ServerConfig {
    size_t max_message_size = 10 * 1024 * 1024;
    size_t max_recipients = 100;

    SMTPConfig() {
        port = 2525;
    }
};

struct POP3Config : ServerConfig {
    POP3Config() {
        port = 1110;
    }
};

class Config {
public:
    Config() = default;

    bool load(const std::filesystem::path& config_file);
    bool load_from_string(const std::string& content);

    const StorageConfig& storage() const { return storage_; }
    const LogConfig& log() const { return log_; }
    const SMTPConfig& smtp() const { return smtp_; }
    const POP3Config& pop3() const { return pop3_; }

    StorageConfig& storage() { return storage_; }
    LogConfig& log() { return log_; }
    SMTPConfig& smtp() { return smtp_; }
    POP3Config& pop3() { return pop3_; }

    // Keys are "section.key". set() applies known keys to the typed sections,
    // get() only sees keys no section claimed.
    std::optional<std::string> get(const std::string& key) const;
    void set(const std::string& key, const std::string& value);

    std::string last_error() const { return last_error_; }

private:
    void parse_section(const std::string& section, const std::string& key, const std::string& value);
    bool parse_server_key(ServerConfig& server, const std::string& key, const std::string& value);

    StorageConfig storage_;
    LogConfig log_;
    SMTPConfig smtp_;
    POP3Config pop3_;

    std::unordered_map<std::string, std::string> custom_values_;
    std::string last_error_;
};

}  // namespace minimail
