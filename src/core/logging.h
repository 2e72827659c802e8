#pragma once
// Copyright (c) 2024-2026 The DTL Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DTL_CORE_LOGGING_H
#define DTL_CORE_LOGGING_H

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <string_view>

namespace core {

// ---------------------------------------------------------------------------
// LogLevel: severity levels for log messages
// ---------------------------------------------------------------------------
enum class LogLevel : int {
    TRACE   = 0,
    DEBUG   = 1,
    INFO    = 2,
    WARN    = 3,
    ERR     = 4,  // "ERROR" conflicts with Windows <windows.h> macro
    FATAL   = 5,
    OFF     = 6,
};

// ---------------------------------------------------------------------------
// LogCategory: bitmask categories for filtering log output
// ---------------------------------------------------------------------------
enum class LogCategory : uint32_t {
    NONE    = 0,
    STORAGE = 1u << 0,
    RPC     = 1u << 1,
    SYNC    = 1u << 2,
    DECODE  = 1u << 3,
    CONFIG  = 1u << 4,
    ALL     = 0xFFFFFFFF,
};

inline constexpr LogCategory operator|(LogCategory a, LogCategory b) noexcept {
    return static_cast<LogCategory>(
        static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

inline constexpr LogCategory operator&(LogCategory a, LogCategory b) noexcept {
    return static_cast<LogCategory>(
        static_cast<uint32_t>(a) & static_cast<uint32_t>(b));
}

/// Returns the short string name for a log level (e.g. "INFO", "WARN").
[[nodiscard]] std::string_view log_level_string(LogLevel level) noexcept;

/// Returns the name of the lowest set bit of @p cat, "NONE" for zero and
/// "ALL" for the full mask.
[[nodiscard]] std::string_view log_category_string(
    LogCategory cat) noexcept;

/// Parses "trace", "debug", "info", "warn", "error", "fatal" or "off"
/// (case-insensitive). Unknown names yield INFO.
[[nodiscard]] LogLevel parse_log_level(std::string_view name) noexcept;

// ---------------------------------------------------------------------------
// Logger: thread-safe singleton logger
// ---------------------------------------------------------------------------
class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level);
    void set_categories(LogCategory mask);
    [[nodiscard]] LogLevel level() const noexcept;
    [[nodiscard]] LogCategory enabled_categories() const noexcept;

    /// Lockless check performed by the LOG_* macros before any message
    /// formatting happens.
    [[nodiscard]] bool will_log(LogLevel level,
                                LogCategory cat) const noexcept;

    void set_print_to_console(bool enable);

    /// Opens @p path in append mode and enables the file sink. An empty
    /// path closes the current file. Returns false if the file could not
    /// be opened.
    bool set_log_file(const std::filesystem::path& path);

    void flush();

    /// Writes one formatted line:
    ///   [2026-02-03 12:00:00.123] [INFO] [SYNC] message
    void write(LogLevel level, LogCategory cat, std::string_view message);

    Logger(const Logger&)            = delete;
    Logger& operator=(const Logger&) = delete;

private:
    Logger();
    ~Logger();

    static std::string format_timestamp();
    void flush_file_locked();

    std::atomic<int>      level_{static_cast<int>(LogLevel::INFO)};
    std::atomic<uint32_t> enabled_categories_{
        static_cast<uint32_t>(LogCategory::ALL)};
    std::atomic<bool>     print_to_console_{true};
    std::atomic<bool>     print_to_file_{false};

    mutable std::mutex    write_mutex_;
    std::ofstream         file_stream_;
    std::string           buffer_;

    static constexpr std::size_t BUFFER_FLUSH_THRESHOLD = 8192;
};

} // namespace core

// ---------------------------------------------------------------------------
// Convenience macros
// ---------------------------------------------------------------------------
// The will_log() check runs before the message expression is evaluated, so
// disabled levels cost one atomic load.
//
//   LOG_INFO(core::LogCategory::SYNC, "synced to block " + std::to_string(n));
// ---------------------------------------------------------------------------

#define DTL_LOG_AT(lvl, cat, msg)                                         \
    do {                                                                  \
        if (core::Logger::instance().will_log((lvl), (cat))) {            \
            core::Logger::instance().write((lvl), (cat),                  \
                                           std::string(msg));             \
        }                                                                 \
    } while (0)

#define LOG_TRACE(cat, msg) DTL_LOG_AT(core::LogLevel::TRACE, cat, msg)
#define LOG_DEBUG(cat, msg) DTL_LOG_AT(core::LogLevel::DEBUG, cat, msg)
#define LOG_INFO(cat, msg)  DTL_LOG_AT(core::LogLevel::INFO, cat, msg)
#define LOG_WARN(cat, msg)  DTL_LOG_AT(core::LogLevel::WARN, cat, msg)
#define LOG_ERROR(cat, msg) DTL_LOG_AT(core::LogLevel::ERR, cat, msg)
#define LOG_FATAL(cat, msg) DTL_LOG_AT(core::LogLevel::FATAL, cat, msg)

#endif // DTL_CORE_LOGGING_H
