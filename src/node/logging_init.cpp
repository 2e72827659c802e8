// Copyright (c) 2024-2026 The DTL Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "node/logging_init.h"
#include "node/options.h"

#include "core/fs.h"
#include "core/logging.h"

#include <filesystem>
#include <sstream>
#include <string>
#include <system_error>

namespace node {

// ---------------------------------------------------------------------------
// init_logging
// ---------------------------------------------------------------------------

core::Result<void> init_logging(const ServiceOptions& options) {
    auto& logger = core::Logger::instance();

    logger.set_level(options.log_level);
    logger.set_print_to_console(options.print_to_console);

    std::filesystem::path log_path = options.log_file_path();
    if (log_path.empty()) {
        return core::make_ok();
    }

    if (log_path.has_parent_path() &&
        !core::fs::ensure_directory(log_path.parent_path())) {
        return core::Error(core::ErrorCode::STORAGE_ERROR,
                           "cannot create log directory " +
                           log_path.parent_path().string());
    }

    rotate_log_file(log_path, MAX_LOG_FILE_SIZE);

    if (!logger.set_log_file(log_path)) {
        return core::Error(core::ErrorCode::STORAGE_ERROR,
                           "cannot open log file " + log_path.string());
    }
    return core::make_ok();
}

// ---------------------------------------------------------------------------
// rotate_log_file
// ---------------------------------------------------------------------------

bool rotate_log_file(const std::filesystem::path& log_path,
                     uint64_t max_size) {
    auto size_opt = core::fs::file_size(log_path);
    if (!size_opt.has_value() || *size_opt < max_size) {
        return false;
    }

    // dtl.log -> dtl.log.1
    std::filesystem::path rotated_path =
        log_path.parent_path() / (log_path.filename().string() + ".1");

    std::error_code ec;
    if (std::filesystem::exists(rotated_path, ec)) {
        std::filesystem::remove(rotated_path, ec);
        if (ec) {
            LOG_WARN(core::LogCategory::NONE,
                     "Failed to remove old rotated log: " +
                     rotated_path.string());
        }
    }

    if (!core::fs::rename_safe(log_path, rotated_path)) {
        LOG_WARN(core::LogCategory::NONE,
                 "Failed to rotate log file: " + log_path.string());
        return false;
    }

    LOG_INFO(core::LogCategory::NONE,
             "Rotated log file: " + log_path.string() +
             " -> " + rotated_path.string() +
             " (was " + std::to_string(*size_opt / (1024 * 1024)) + " MB)");
    return true;
}

// ---------------------------------------------------------------------------
// get_startup_banner
// ---------------------------------------------------------------------------

std::string get_startup_banner(const ServiceOptions& options,
                               const ServiceSettings& settings) {
    std::ostringstream ss;

    ss << "\n"
       << "============================================================\n"
       << "  " << get_client_name() << "\n"
       << "  Build: " << __DATE__ << " " << __TIME__ << "\n"
       << "  Compiler: "
#if defined(__clang__)
       << "Clang " << __clang_major__ << "." << __clang_minor__
#elif defined(__GNUC__)
       << "GCC " << __GNUC__ << "." << __GNUC_MINOR__
#else
       << "Unknown"
#endif
       << " | C++ " << __cplusplus << "\n"
       << "  Data directory: " << options.datadir.string() << "\n"
       << "  L2 endpoint: " << settings.endpoint.to_string()
       << " (chain " << settings.engine.chain_id << ", timeout "
       << settings.rpc_timeout_ms << " ms)\n"
       << "  Fetch mode: " << ingest::fetch_mode_name(settings.fetch_mode)
       << "\n"
       << "  Window: " << settings.engine.batch_size << " blocks, polling "
       << settings.engine.polling_interval.count() << " ms\n"
       << "  Error policy: "
       << ingest::error_policy_name(settings.engine.policy) << "\n"
       << "  Log level: " << core::log_level_string(options.log_level) << "\n"
       << "============================================================\n";

    return ss.str();
}

} // namespace node
