#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include <vector>
#include <unordered_map>

namespace minimail {

struct User {
    std::string username;
    std::string password;
};

// Flat registry of "<username> <password>" lines, loaded once and read-only
// afterwards. The first entry for a username wins.
class UserDirectory {
public:
    UserDirectory() = default;
    explicit UserDirectory(const std::filesystem::path& registry_path);

    bool load();
    bool load_from_string(const std::string& content);

    std::optional<std::string> lookup(const std::string& username) const;
    bool verify(const std::string& username, const std::string& password) const;
    bool exists(const std::string& username) const;

    size_t size() const { return users_.size(); }
    std::vector<std::string> usernames() const;

    const std::filesystem::path& registry_path() const { return registry_path_; }
    std::string last_error() const { return last_error_; }

    static bool is_valid_username(const std::string& username);

private:
    std::filesystem::path registry_path_;
    std::unordered_map<std::string, User> users_;
    std::vector<std::string> order_;
    std::string last_error_;
};

}  // namespace minimail
