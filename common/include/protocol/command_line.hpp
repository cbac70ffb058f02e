#pragma once

#include <string>
#include <string_view>
#include <optional>
#include <vector>
#include <cstddef>

namespace minimail::protocol {

// A command line split into an upper-cased verb and the remaining argument text.
struct CommandLine {
    std::string verb;
    std::string argument;
};

CommandLine split_command(const std::string& line);

std::string to_upper(std::string value);
std::string trim(const std::string& value);

// Splits on runs of spaces and tabs.
std::vector<std::string> split_words(const std::string& value);

// Strict decimal parse of a 1-based message number; rejects signs, blanks and zero.
std::optional<size_t> parse_index(const std::string& value);

// Dot transparency (RFC 5321 4.5.2 / RFC 1939 3)
inline constexpr std::string_view kCRLF = "\r\n";
inline constexpr std::string_view kTerminator = ".";

bool is_terminator(const std::string& line);
std::string unstuff_line(const std::string& line);

// Encodes content as CRLF terminated lines with leading dots doubled. A final
// line without a line break is terminated; the closing "." is not appended.
std::string dot_stuff(const std::string& content);

// Lowercase hex SHA-256 of the given bytes.
std::string sha256_hex(std::string_view data);

}  // namespace minimail::protocol
