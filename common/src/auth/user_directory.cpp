#include "auth/user_directory.hpp"
#include "protocol/command_line.hpp"
#include "logger.hpp"
#include <fstream>
#include <sstream>
#include <openssl/crypto.h>

namespace minimail {

UserDirectory::UserDirectory(const std::filesystem::path& registry_path)
    : registry_path_(registry_path) {
}

bool UserDirectory::load() {
    std::ifstream file(registry_path_);
    if (!file.is_open()) {
        last_error_ = "Cannot open user registry " + registry_path_.string();
        LOG_ERROR(last_error_);
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        last_error_ = "Error reading user registry " + registry_path_.string();
        LOG_ERROR(last_error_);
        return false;
    }

    return load_from_string(buffer.str());
}

bool UserDirectory::load_from_string(const std::string& content) {
    users_.clear();
    order_.clear();

    std::istringstream stream(content);
    std::string line;
    size_t line_number = 0;
    size_t skipped = 0;

    while (std::getline(stream, line)) {
        ++line_number;

        std::string trimmed = protocol::trim(line);
        if (trimmed.empty() || trimmed[0] == '#') continue;

        auto fields = protocol::split_words(trimmed);
        if (fields.size() != 2) {
            LOG_WARNING_FMT("User registry line {}: expected '<username> <password>', skipped",
                            line_number);
            ++skipped;
            continue;
        }

        const std::string& username = fields[0];
        if (!is_valid_username(username)) {
            LOG_WARNING_FMT("User registry line {}: invalid username '{}', skipped",
                            line_number, username);
            ++skipped;
            continue;
        }

        if (users_.count(username) > 0) {
            LOG_WARNING_FMT("User registry line {}: duplicate username '{}' ignored",
                            line_number, username);
            ++skipped;
            continue;
        }

        users_.emplace(username, User{username, fields[1]});
        order_.push_back(username);
    }

    LOG_INFO_FMT("Loaded {} users ({} registry lines skipped)", users_.size(), skipped);
    return true;
}

std::optional<std::string> UserDirectory::lookup(const std::string& username) const {
    auto it = users_.find(username);
    if (it == users_.end()) {
        return std::nullopt;
    }
    return it->second.password;
}

bool UserDirectory::verify(const std::string& username, const std::string& password) const {
    auto it = users_.find(username);
    if (it == users_.end()) {
        return false;
    }

    const std::string& stored = it->second.password;
    if (stored.size() != password.size()) {
        return false;
    }
    return CRYPTO_memcmp(stored.data(), password.data(), stored.size()) == 0;
}

bool UserDirectory::exists(const std::string& username) const {
    return users_.count(username) > 0;
}

std::vector<std::string> UserDirectory::usernames() const {
    return order_;
}

bool UserDirectory::is_valid_username(const std::string& username) {
    if (username.empty() || username == "." || username == "..") {
        return false;
    }
    return username.find_first_of(std::string("/\\\0", 3)) == std::string::npos;
}

}  // namespace minimail
