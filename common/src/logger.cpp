#include "logger.hpp"
#include <fmt/chrono.h>
#include <iostream>
#include <thread>
#include <ctime>
#include <cctype>

namespace minimail {

namespace {

struct LevelStyle {
    const char* tag;
    const char* color;
};

LevelStyle style_for(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:   return {"TRACE", "\033[90m"};
        case LogLevel::Debug:   return {"DEBUG", "\033[36m"};
        case LogLevel::Info:    return {"INFO ", "\033[32m"};
        case LogLevel::Warning: return {"WARN ", "\033[33m"};
        case LogLevel::Error:   return {"ERROR", "\033[31m"};
        case LogLevel::Fatal:   return {"FATAL", "\033[35m"};
    }
    return {"?????", ""};
}

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto seconds = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&seconds, &local);
    return fmt::format("{:%Y-%m-%d %H:%M:%S}.{:03}", local, ms.count());
}

std::filesystem::path numbered(const std::filesystem::path& file, size_t n) {
    auto path = file;
    path += "." + std::to_string(n);
    return path;
}

}  // namespace

std::optional<LogLevel> parse_log_level(std::string_view name) {
    std::string level(name);
    for (auto& c : level) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    if (level == "trace") return LogLevel::Trace;
    if (level == "debug") return LogLevel::Debug;
    if (level == "info") return LogLevel::Info;
    if (level == "warning" || level == "warn") return LogLevel::Warning;
    if (level == "error") return LogLevel::Error;
    if (level == "fatal") return LogLevel::Fatal;
    return std::nullopt;
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::init(LogLevel level, bool console, const std::filesystem::path& file,
                  size_t max_file_size, size_t max_files) {
    std::lock_guard<std::mutex> lock(mutex_);

    level_ = level;
    console_ = console;
    max_file_size_ = max_file_size;
    max_files_ = max_files;
    log_file_ = file;
    current_size_ = 0;

    if (file_stream_.is_open()) {
        file_stream_.close();
    }
    if (file.empty()) {
        return;
    }

    std::error_code ec;
    if (auto parent = file.parent_path(); !parent.empty()) {
        std::filesystem::create_directories(parent, ec);
    }
    file_stream_.open(file, std::ios::app);
    if (!file_stream_.is_open()) {
        std::cerr << "Unable to open log file " << file.string() << "\n";
        return;
    }
    current_size_ = std::filesystem::file_size(file, ec);
    if (ec) current_size_ = 0;
}

void Logger::write(LogLevel level, const std::source_location& loc, const std::string& message) {
    auto style = style_for(level);
    auto filename = std::filesystem::path(loc.file_name()).filename().string();

    // Session handlers run on a shared worker pool, the thread tag tells them apart
    auto tid = std::hash<std::thread::id>{}(std::this_thread::get_id()) % 100000;

    std::string line = fmt::format("[{}] [{}] [{:05}] [{}:{}] {}",
                                   timestamp(), style.tag, tid, filename, loc.line(), message);

    std::lock_guard<std::mutex> lock(mutex_);

    if (console_) {
        std::cerr << style.color << line << "\033[0m\n";
    }

    if (file_stream_.is_open()) {
        rotate_if_needed();
        file_stream_ << line << "\n";
        file_stream_.flush();
        current_size_ += line.size() + 1;
    }
}

// Shifts "<file>.N" up by one, dropping the oldest, so at most max_files_
// files exist including the live one.
void Logger::rotate_if_needed() {
    if (current_size_ < max_file_size_) return;

    file_stream_.close();

    std::error_code ec;
    if (max_files_ > 1) {
        std::filesystem::remove(numbered(log_file_, max_files_ - 1), ec);
        for (size_t i = max_files_ - 1; i > 1; --i) {
            std::filesystem::rename(numbered(log_file_, i - 1), numbered(log_file_, i), ec);
        }
        std::filesystem::rename(log_file_, numbered(log_file_, 1), ec);
    } else {
        std::filesystem::remove(log_file_, ec);
    }

    file_stream_.open(log_file_, std::ios::app);
    current_size_ = 0;
}

}  // namespace minimail
