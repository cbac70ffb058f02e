#include "protocol/command_line.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <iomanip>
#include <memory>
#include <stdexcept>
#include <openssl/evp.h>

namespace minimail::protocol {

CommandLine split_command(const std::string& line) {
    CommandLine cmd;

    auto start = line.find_first_not_of(" \t");
    if (start == std::string::npos) {
        return cmd;
    }

    auto sep = line.find_first_of(" \t", start);
    if (sep == std::string::npos) {
        cmd.verb = to_upper(line.substr(start));
        return cmd;
    }

    cmd.verb = to_upper(line.substr(start, sep - start));
    cmd.argument = trim(line.substr(sep + 1));
    return cmd;
}

std::string to_upper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

std::string trim(const std::string& value) {
    auto start = value.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(start, end - start + 1);
}

std::vector<std::string> split_words(const std::string& value) {
    std::vector<std::string> words;
    std::istringstream iss(value);
    std::string word;
    while (iss >> word) {
        words.push_back(word);
    }
    return words;
}

std::optional<size_t> parse_index(const std::string& value) {
    if (value.empty() || value.size() > 18) {
        return std::nullopt;
    }
    if (!std::all_of(value.begin(), value.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }

    size_t index = std::stoull(value);
    if (index == 0) {
        return std::nullopt;
    }
    return index;
}

bool is_terminator(const std::string& line) {
    return line == kTerminator;
}

std::string unstuff_line(const std::string& line) {
    if (!line.empty() && line[0] == '.') {
        return line.substr(1);
    }
    return line;
}

std::string dot_stuff(const std::string& content) {
    std::string out;
    out.reserve(content.size() + content.size() / 32 + 2);

    size_t pos = 0;
    while (pos < content.size()) {
        size_t nl = content.find('\n', pos);
        size_t end = (nl == std::string::npos) ? content.size() : nl;

        size_t line_end = end;
        if (line_end > pos && content[line_end - 1] == '\r') {
            --line_end;
        }

        if (line_end > pos && content[pos] == '.') {
            out += '.';
        }
        out.append(content, pos, line_end - pos);
        out += kCRLF;

        if (nl == std::string::npos) break;
        pos = nl + 1;
    }

    return out;
}

std::string sha256_hex(std::string_view data) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }

    std::ostringstream oss;
    for (unsigned int i = 0; i < digest_len; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    }
    return oss.str();
}

}  // namespace minimail::protocol
