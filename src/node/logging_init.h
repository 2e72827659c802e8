#pragma once
// Copyright (c) 2024-2026 The DTL Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// Logging system initialization for the dtld service.
//
// Configures the global Logger singleton from ServiceOptions:
//   - Sets the log level threshold.
//   - Enables or disables the stderr sink.
//   - Rotates and opens <datadir>/dtl.log unless file logging is off.
// ---------------------------------------------------------------------------

#ifndef DTL_NODE_LOGGING_INIT_H
#define DTL_NODE_LOGGING_INIT_H

#include "core/error.h"

#include <cstdint>
#include <filesystem>
#include <string>

namespace node {

struct ServiceOptions;
struct ServiceSettings;

/// Initialize the logging subsystem.
///
/// @returns STORAGE_ERROR if the log file cannot be opened.
[[nodiscard]] core::Result<void> init_logging(const ServiceOptions& options);

// ---------------------------------------------------------------------------
// Log file rotation
// ---------------------------------------------------------------------------

/// Maximum log file size before rotation, in bytes.
inline constexpr uint64_t MAX_LOG_FILE_SIZE = 50 * 1024 * 1024;  // 50 MB

/// Rotate the log file at the given path if it is at least max_size bytes.
///
/// An existing dtl.log.1 is deleted and dtl.log is renamed to dtl.log.1;
/// the logger creates a fresh dtl.log when it opens the path.
///
/// @returns true if rotation was performed, false if not needed or on error.
bool rotate_log_file(const std::filesystem::path& log_path,
                     uint64_t max_size = MAX_LOG_FILE_SIZE);

// ---------------------------------------------------------------------------
// Startup banner
// ---------------------------------------------------------------------------

/// Multi-line banner with the client version, build info and the
/// effective settings.
[[nodiscard]] std::string get_startup_banner(const ServiceOptions& options,
                                             const ServiceSettings& settings);

} // namespace node

#endif // DTL_NODE_LOGGING_INIT_H
