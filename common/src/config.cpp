#include "config.hpp"
#include "logger.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>

namespace minimail {

namespace {

bool to_bool(const std::string& v) {
    return v == "true" || v == "yes" || v == "1" || v == "on";
}

int64_t to_int(const std::string& v) {
    try {
        return std::stoll(v);
    } catch (const std::exception&) {
        LOG_WARNING_FMT("Invalid numeric value '{}' in configuration", v);
        return 0;
    }
}

void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t");
    auto end = s.find_last_not_of(" \t\r\n");
    if (start == std::string::npos) {
        s.clear();
    } else {
        s = s.substr(start, end - start + 1);
    }
}

}  // namespace

bool Config::load(const std::filesystem::path& config_file) {
    std::ifstream file(config_file);
    if (!file.is_open()) {
        last_error_ = "Cannot open " + config_file.string();
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_from_string(buffer.str());
}

bool Config::load_from_string(const std::string& content) {
    std::istringstream stream(content);
    std::string line;
    std::string current_section;

    while (std::getline(stream, line)) {
        trim(line);

        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        if (line[0] == '[' && line.back() == ']') {
            current_section = line.substr(1, line.length() - 2);
            trim(current_section);
            std::transform(current_section.begin(), current_section.end(),
                          current_section.begin(), ::tolower);
            continue;
        }

        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) continue;

        std::string key = line.substr(0, eq_pos);
        std::string value = line.substr(eq_pos + 1);
        trim(key);
        trim(value);

        if (value.length() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.length() - 2);
        }

        std::transform(key.begin(), key.end(), key.begin(), ::tolower);
        parse_section(current_section, key, value);
    }

    return true;
}

bool Config::parse_server_key(ServerConfig& server, const std::string& key,
                              const std::string& value) {
    if (key == "bind_address" || key == "address") {
        server.bind_address = value;
    } else if (key == "port") {
        server.port = static_cast<uint16_t>(to_int(value));
    } else if (key == "hostname") {
        server.hostname = value;
    } else if (key == "max_connections") {
        server.max_connections = static_cast<size_t>(to_int(value));
    } else if (key == "thread_pool_size" || key == "threads") {
        server.thread_pool_size = std::max<size_t>(1, static_cast<size_t>(to_int(value)));
    } else if (key == "max_line_length") {
        server.max_line_length = static_cast<size_t>(to_int(value));
    } else if (key == "connection_timeout") {
        server.connection_timeout = std::chrono::seconds(to_int(value));
    } else {
        return false;
    }
    return true;
}

void Config::parse_section(const std::string& section, const std::string& key,
                           const std::string& value) {
    if (section == "storage") {
        if (key == "root") {
            storage_.root = value;
        } else if (key == "registry" || key == "users_file") {
            storage_.registry = value;
        } else if (key == "mailbox_dir") {
            storage_.mailbox_dir = value;
        } else if (key == "lock_wait_ms") {
            storage_.lock_wait = std::chrono::milliseconds(to_int(value));
        } else if (key == "sync_writes") {
            storage_.sync_writes = to_bool(value);
        } else {
            custom_values_[section + "." + key] = value;
        }
    } else if (section == "log" || section == "logging") {
        if (key == "level") {
            if (auto level = parse_log_level(value)) {
                log_.level = *level;
            } else {
                LOG_WARNING_FMT("Unknown log level '{}'", value);
            }
        } else if (key == "file") {
            log_.file = value;
            log_.log_to_file = !value.empty();
        } else if (key == "console") {
            log_.log_to_console = to_bool(value);
        } else if (key == "max_file_size") {
            log_.max_file_size = static_cast<size_t>(to_int(value));
        } else if (key == "max_files") {
            log_.max_files = static_cast<size_t>(to_int(value));
        }
    } else if (section == "smtp") {
        if (parse_server_key(smtp_, key, value)) return;

        if (key == "max_message_size") {
            smtp_.max_message_size = static_cast<size_t>(to_int(value));
        } else if (key == "max_recipients") {
            smtp_.max_recipients = static_cast<size_t>(to_int(value));
        } else {
            custom_values_[section + "." + key] = value;
        }
    } else if (section == "pop3") {
        if (!parse_server_key(pop3_, key, value)) {
            custom_values_[section + "." + key] = value;
        }
    } else {
        std::string full_key = section.empty() ? key : section + "." + key;
        custom_values_[full_key] = value;
    }
}

std::optional<std::string> Config::get(const std::string& key) const {
    auto it = custom_values_.find(key);
    if (it != custom_values_.end()) {
        return it->second;
    }
    return std::nullopt;
}

void Config::set(const std::string& key, const std::string& value) {
    auto dot = key.find('.');
    if (dot == std::string::npos) {
        custom_values_[key] = value;
        return;
    }
    parse_section(key.substr(0, dot), key.substr(dot + 1), value);
}

}  // namespace minimail
