#pragma once

#include <string>
#include <string_view>
#include <memory>
#include <mutex>
#include <fstream>
#include <chrono>
#include <source_location>
#include <filesystem>
#include <optional>
#include <fmt/format.h>

namespace minimail {

enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warning = 3,
    Error = 4,
    Fatal = 5
};

// Accepts "trace", "debug", "info", "warning"/"warn", "error", "fatal" (any case).
std::optional<LogLevel> parse_log_level(std::string_view name);

class Logger {
public:
    static Logger& instance();

    void init(LogLevel level = LogLevel::Info,
              bool console = true,
              const std::filesystem::path& file = "",
              size_t max_file_size = 10 * 1024 * 1024,
              size_t max_files = 5);

    template<typename... Args>
    void log(LogLevel level, const std::source_location& loc,
             fmt::format_string<Args...> format_str, Args&&... args) {
        if (level < level_) return;

        std::string message = fmt::format(format_str, std::forward<Args>(args)...);
        write(level, loc, message);
    }

private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void write(LogLevel level, const std::source_location& loc, const std::string& message);
    void rotate_if_needed();

    LogLevel level_ = LogLevel::Info;
    bool console_ = true;
    std::filesystem::path log_file_;
    std::ofstream file_stream_;
    size_t max_file_size_ = 10 * 1024 * 1024;
    size_t max_files_ = 5;
    size_t current_size_ = 0;
    std::mutex mutex_;
};

#define LOG_INFO(msg) LOG_INFO_FMT("{}", msg)
#define LOG_ERROR(msg) LOG_ERROR_FMT("{}", msg)

#define LOG_TRACE_FMT(format_str, ...) \
    minimail::Logger::instance().log(minimail::LogLevel::Trace, std::source_location::current(), format_str, __VA_ARGS__)
#define LOG_DEBUG_FMT(format_str, ...) \
    minimail::Logger::instance().log(minimail::LogLevel::Debug, std::source_location::current(), format_str, __VA_ARGS__)
#define LOG_INFO_FMT(format_str, ...) \
    minimail::Logger::instance().log(minimail::LogLevel::Info, std::source_location::current(), format_str, __VA_ARGS__)
#define LOG_WARNING_FMT(format_str, ...) \
    minimail::Logger::instance().log(minimail::LogLevel::Warning, std::source_location::current(), format_str, __VA_ARGS__)
#define LOG_ERROR_FMT(format_str, ...) \
    minimail::Logger::instance().log(minimail::LogLevel::Error, std::source_location::current(), format_str, __VA_ARGS__)
#define LOG_FATAL_FMT(format_str, ...) \
    minimail::Logger::instance().log(minimail::LogLevel::Fatal, std::source_location::current(), format_str, __VA_ARGS__)

}  // namespace minimail
