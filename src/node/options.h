#pragma once
// Copyright (c) 2024-2026 The DTL Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// ServiceOptions -- all configuration options for the dtld service.
//
// Parsed from command-line arguments and/or <datadir>/dtl.conf. The raw
// options are checked once by validate_options(), which produces the
// ServiceSettings the engine is built from. Nothing downstream of
// validate_options() re-checks them.
// ---------------------------------------------------------------------------

#ifndef DTL_NODE_OPTIONS_H
#define DTL_NODE_OPTIONS_H

#include "core/error.h"
#include "core/logging.h"
#include "ingest/block_fetcher.h"
#include "ingest/ingestion.h"
#include "rpc/http_client.h"

#include <cstdint>
#include <filesystem>
#include <string>

namespace node {

// ---------------------------------------------------------------------------
// Version constants
// ---------------------------------------------------------------------------

inline constexpr int VERSION_MAJOR = 0;
inline constexpr int VERSION_MINOR = 1;
inline constexpr int VERSION_PATCH = 0;
inline constexpr const char* VERSION_SUFFIX = "";

/// Returns the full version string, e.g. "0.1.0".
std::string get_version_string();

/// Returns the full client name, e.g. "DTL v0.1.0".
std::string get_client_name();

/// Name of the default config file inside the data directory.
inline constexpr const char* DEFAULT_CONF_FILENAME = "dtl.conf";

/// Name of the unconfirmed-record log inside the data directory.
inline constexpr const char* STORE_FILENAME = "unconfirmed.log";

// ---------------------------------------------------------------------------
// ServiceOptions
// ---------------------------------------------------------------------------

struct ServiceOptions {
    // -- Data directory ------------------------------------------------------
    std::filesystem::path datadir;    // absolute, resolved at parse time
    std::filesystem::path conf_file;  // the file actually consulted

    // -- Remote endpoint -----------------------------------------------------
    std::string l2_rpc;               // http://host:port[/path]
    int64_t     l2_chain_id = -1;     // -1 = not given
    int64_t     rpc_timeout_ms = 30000;

    // -- Ingestion -----------------------------------------------------------
    int64_t polling_interval_ms = 5000;
    int64_t batch_size = 1000;
    bool    catch_all_errors = false;
    bool    legacy_compat = false;

    // -- Logging -------------------------------------------------------------
    core::LogLevel log_level = core::LogLevel::INFO;
    std::string    log_file = "dtl.log";  // empty disables the file sink
    bool           print_to_console = true;

    // -- Early-exit requests -------------------------------------------------
    bool show_help = false;
    bool show_version = false;

    /// Full path of the log file, or an empty path when file logging is off.
    [[nodiscard]] std::filesystem::path log_file_path() const;

    [[nodiscard]] std::filesystem::path store_path() const;
};

/// Settings derived from validated options.
struct ServiceSettings {
    rpc::Endpoint        endpoint;
    int                  rpc_timeout_ms = 30000;
    ingest::FetchMode    fetch_mode = ingest::FetchMode::BULK;
    ingest::EngineParams engine;
};

// ---------------------------------------------------------------------------
// Argument / config file parsing
// ---------------------------------------------------------------------------

/// Parse command-line arguments, then the config file, into ServiceOptions.
///
/// Command-line values take precedence over the file. The file defaults to
/// <datadir>/dtl.conf and may be absent; a file named with -conf must
/// exist. Unknown keys and malformed integers are CONFIG_ERROR.
[[nodiscard]] core::Result<ServiceOptions> parse_options(
    int argc, const char* const argv[]);

/// Checks the options and derives the engine settings. CONFIG_ERROR for a
/// missing or unparsable endpoint, a missing chain id, or a non-positive
/// batch size, polling interval or RPC timeout.
[[nodiscard]] core::Result<ServiceSettings> validate_options(
    const ServiceOptions& options);

/// Print a usage/help message to stdout.
void print_usage();

/// Print version information to stdout.
void print_version();

} // namespace node

#endif // DTL_NODE_OPTIONS_H
