// Copyright (c) 2024-2026 The DTL Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/logging.h"

#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>

namespace core {

// ---------------------------------------------------------------------------
// Name helpers
// ---------------------------------------------------------------------------
std::string_view log_level_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERR:   return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        case LogLevel::OFF:   return "OFF";
    }
    return "UNKNOWN";
}

std::string_view log_category_string(LogCategory cat) noexcept {
    uint32_t bits = static_cast<uint32_t>(cat);
    if (bits == 0) return "NONE";
    if (bits == static_cast<uint32_t>(LogCategory::ALL)) return "ALL";

    uint32_t lowest = bits & (~bits + 1u);
    switch (static_cast<LogCategory>(lowest)) {
        case LogCategory::STORAGE: return "STORAGE";
        case LogCategory::RPC:     return "RPC";
        case LogCategory::SYNC:    return "SYNC";
        case LogCategory::DECODE:  return "DECODE";
        case LogCategory::CONFIG:  return "CONFIG";
        default:                   break;
    }
    return "UNKNOWN";
}

LogLevel parse_log_level(std::string_view name) noexcept {
    std::string lower;
    lower.reserve(name.size());
    for (char c : name) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    if (lower == "trace")                     return LogLevel::TRACE;
    if (lower == "debug")                     return LogLevel::DEBUG;
    if (lower == "info")                      return LogLevel::INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error" || lower == "err")   return LogLevel::ERR;
    if (lower == "fatal")                     return LogLevel::FATAL;
    if (lower == "off" || lower == "none")    return LogLevel::OFF;
    return LogLevel::INFO;
}

// ---------------------------------------------------------------------------
// Logger -- lifecycle
// ---------------------------------------------------------------------------
Logger& Logger::instance() {
    static Logger the_logger;
    return the_logger;
}

Logger::Logger() {
    buffer_.reserve(BUFFER_FLUSH_THRESHOLD * 2);
}

Logger::~Logger() {
    flush();
}

// ---------------------------------------------------------------------------
// Logger -- configuration
// ---------------------------------------------------------------------------
void Logger::set_level(LogLevel lvl) {
    level_.store(static_cast<int>(lvl), std::memory_order_release);
}

void Logger::set_categories(LogCategory mask) {
    enabled_categories_.store(static_cast<uint32_t>(mask),
                              std::memory_order_release);
}

LogLevel Logger::level() const noexcept {
    return static_cast<LogLevel>(level_.load(std::memory_order_acquire));
}

LogCategory Logger::enabled_categories() const noexcept {
    return static_cast<LogCategory>(
        enabled_categories_.load(std::memory_order_acquire));
}

bool Logger::will_log(LogLevel lvl, LogCategory cat) const noexcept {
    if (static_cast<int>(lvl) < level_.load(std::memory_order_acquire)) {
        return false;
    }
    // NONE (0) always passes the category filter.
    uint32_t cat_bits = static_cast<uint32_t>(cat);
    if (cat_bits != 0 &&
        (enabled_categories_.load(std::memory_order_acquire) & cat_bits) == 0) {
        return false;
    }
    return print_to_console_.load(std::memory_order_acquire) ||
           print_to_file_.load(std::memory_order_acquire);
}

void Logger::set_print_to_console(bool enable) {
    print_to_console_.store(enable, std::memory_order_release);
}

bool Logger::set_log_file(const std::filesystem::path& path) {
    std::lock_guard<std::mutex> lock(write_mutex_);

    if (file_stream_.is_open()) {
        flush_file_locked();
        file_stream_.close();
    }
    buffer_.clear();
    print_to_file_.store(false, std::memory_order_release);

    if (path.empty()) {
        return true;
    }

    file_stream_.open(path, std::ios::out | std::ios::app);
    if (!file_stream_.is_open()) {
        std::cerr << "Logger: failed to open log file: " << path << "\n";
        return false;
    }
    print_to_file_.store(true, std::memory_order_release);
    return true;
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(write_mutex_);
    flush_file_locked();
    std::cerr.flush();
}

void Logger::flush_file_locked() {
    if (!file_stream_.is_open()) {
        buffer_.clear();
        return;
    }
    if (!buffer_.empty()) {
        file_stream_.write(buffer_.data(),
                           static_cast<std::streamsize>(buffer_.size()));
        buffer_.clear();
    }
    file_stream_.flush();
}

// ---------------------------------------------------------------------------
// Logger -- writing
// ---------------------------------------------------------------------------
void Logger::write(LogLevel lvl, LogCategory cat, std::string_view message) {
    std::string line;
    line.reserve(64 + message.size());
    line += '[';
    line += format_timestamp();
    line += "] [";
    line += log_level_string(lvl);
    line += "] [";
    line += log_category_string(cat);
    line += "] ";
    line += message;
    line += '\n';

    std::lock_guard<std::mutex> lock(write_mutex_);

    if (print_to_console_.load(std::memory_order_relaxed)) {
        std::cerr.write(line.data(), static_cast<std::streamsize>(line.size()));
    }

    if (print_to_file_.load(std::memory_order_relaxed) &&
        file_stream_.is_open()) {
        buffer_ += line;
        if (buffer_.size() >= BUFFER_FLUSH_THRESHOLD ||
            static_cast<int>(lvl) >= static_cast<int>(LogLevel::WARN)) {
            flush_file_locked();
        }
    }
}

// "YYYY-MM-DD HH:MM:SS.mmm" in UTC
std::string Logger::format_timestamp() {
    using Clock = std::chrono::system_clock;

    auto now = Clock::now();
    auto epoch_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch()).count();
    int millis = static_cast<int>(epoch_ms % 1000);

    std::time_t time_val = Clock::to_time_t(now);
    std::tm tm_buf{};
    gmtime_r(&time_val, &tm_buf);

    char buf[32];
    int n = std::snprintf(
        buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d.%03d",
        tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
        tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, millis);
    return std::string(buf, static_cast<std::size_t>(n));
}

} // namespace core
