// Copyright (c) 2024-2026 The DTL Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "node/options.h"

#include "core/config.h"
#include "core/fs.h"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <limits>
#include <sstream>
#include <string>
#include <string_view>

namespace node {

// ---------------------------------------------------------------------------
// Version helpers
// ---------------------------------------------------------------------------

std::string get_version_string() {
    std::ostringstream ss;
    ss << VERSION_MAJOR << '.' << VERSION_MINOR << '.' << VERSION_PATCH;
    if (VERSION_SUFFIX[0] != '\0') {
        ss << '-' << VERSION_SUFFIX;
    }
    return ss.str();
}

std::string get_client_name() {
    return "DTL v" + get_version_string();
}

// ---------------------------------------------------------------------------
// ServiceOptions -- derived helpers
// ---------------------------------------------------------------------------

std::filesystem::path ServiceOptions::log_file_path() const {
    if (log_file.empty()) return {};
    std::filesystem::path p{log_file};
    if (p.is_absolute()) return p;
    return datadir / p;
}

std::filesystem::path ServiceOptions::store_path() const {
    return datadir / STORE_FILENAME;
}

// ---------------------------------------------------------------------------
// Internal helpers
// ---------------------------------------------------------------------------

namespace {

/// Every key dtld understands, including the early-exit flags.
constexpr std::string_view KNOWN_KEYS[] = {
    core::CONF_DATADIR,         core::CONF_CONF,
    core::CONF_L2RPC,           core::CONF_L2CHAINID,
    core::CONF_POLLINGINTERVAL, core::CONF_TXPERPOLL,
    core::CONF_CATCHALL,        core::CONF_LEGACYCOMPAT,
    core::CONF_RPCTIMEOUT,      core::CONF_LOGLEVEL,
    core::CONF_LOGFILE,         core::CONF_PRINTTOCONSOLE,
    "help", "h", "?", "version",
};

bool is_known_key(std::string_view key) {
    return std::find(std::begin(KNOWN_KEYS), std::end(KNOWN_KEYS), key) !=
           std::end(KNOWN_KEYS);
}

core::Error config_error(std::string message) {
    return core::Error(core::ErrorCode::CONFIG_ERROR, std::move(message));
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// parse_options
// ---------------------------------------------------------------------------

core::Result<ServiceOptions> parse_options(int argc,
                                           const char* const argv[]) {
    ServiceOptions opts;

    core::Config raw;
    DTL_TRY_VOID(raw.parse_args(argc, argv));

    // Early-exit flags short-circuit everything else.
    if (raw.has("help") || raw.has("h") || raw.has("?")) {
        opts.show_help = true;
        return opts;
    }
    if (raw.has("version")) {
        opts.show_version = true;
        return opts;
    }

    // Resolve the data directory first so we can locate the config file.
    if (auto dd = raw.get(core::CONF_DATADIR); dd.has_value() && !dd->empty()) {
        opts.datadir = std::filesystem::path{*dd};
    } else {
        opts.datadir = core::fs::get_default_data_dir();
    }
    opts.datadir = core::fs::absolute(opts.datadir);

    // -conf=<path> overrides the default <datadir>/dtl.conf and must exist.
    auto conf_arg = raw.get(core::CONF_CONF);
    bool explicit_conf = conf_arg.has_value() && !conf_arg->empty();
    opts.conf_file = explicit_conf ? std::filesystem::path{*conf_arg}
                                   : opts.datadir / DEFAULT_CONF_FILENAME;

    if (core::fs::file_exists(opts.conf_file)) {
        auto loaded = raw.parse_file(opts.conf_file);
        if (!loaded.ok()) {
            return config_error(loaded.error().message());
        }
    } else if (explicit_conf) {
        return config_error("config file not found: " +
                            opts.conf_file.string());
    }

    for (const auto& key : raw.keys()) {
        if (!is_known_key(key)) {
            return config_error("unknown option -" + key);
        }
    }

    opts.l2_rpc = raw.get_or(core::CONF_L2RPC, "");

    DTL_TRY_ASSIGN(chain_id, raw.get_int(core::CONF_L2CHAINID, -1));
    opts.l2_chain_id = chain_id;

    DTL_TRY_ASSIGN(timeout, raw.get_int(core::CONF_RPCTIMEOUT,
                                        opts.rpc_timeout_ms));
    opts.rpc_timeout_ms = timeout;

    DTL_TRY_ASSIGN(interval, raw.get_int(core::CONF_POLLINGINTERVAL,
                                         opts.polling_interval_ms));
    opts.polling_interval_ms = interval;

    DTL_TRY_ASSIGN(batch, raw.get_int(core::CONF_TXPERPOLL, opts.batch_size));
    opts.batch_size = batch;

    opts.catch_all_errors = raw.get_bool(core::CONF_CATCHALL, false);
    opts.legacy_compat = raw.get_bool(core::CONF_LEGACYCOMPAT, false);

    if (auto lvl = raw.get(core::CONF_LOGLEVEL); lvl.has_value()) {
        opts.log_level = core::parse_log_level(*lvl);
    }
    opts.log_file = raw.get_or(core::CONF_LOGFILE, opts.log_file);
    opts.print_to_console =
        raw.get_bool(core::CONF_PRINTTOCONSOLE, opts.print_to_console);

    return opts;
}

// ---------------------------------------------------------------------------
// validate_options
// ---------------------------------------------------------------------------

core::Result<ServiceSettings> validate_options(const ServiceOptions& options) {
    if (options.l2_rpc.empty()) {
        return config_error("-l2rpc is required");
    }
    auto endpoint = rpc::parse_endpoint(options.l2_rpc);
    if (!endpoint.ok()) {
        return config_error("invalid -l2rpc: " + endpoint.error().message());
    }

    if (options.l2_chain_id < 0) {
        return config_error("-l2chainid is required");
    }
    if (options.l2_chain_id == 0) {
        return config_error("-l2chainid must be positive");
    }
    if (options.batch_size <= 0) {
        return config_error("-transactionsperpollinginterval must be "
                            "positive, got " +
                            std::to_string(options.batch_size));
    }
    if (options.polling_interval_ms <= 0) {
        return config_error("-pollinginterval must be positive, got " +
                            std::to_string(options.polling_interval_ms));
    }
    if (options.rpc_timeout_ms <= 0 ||
        options.rpc_timeout_ms > std::numeric_limits<int>::max()) {
        return config_error("-rpctimeout out of range: " +
                            std::to_string(options.rpc_timeout_ms));
    }

    ServiceSettings settings;
    settings.endpoint = std::move(endpoint).value();
    settings.rpc_timeout_ms = static_cast<int>(options.rpc_timeout_ms);
    settings.fetch_mode = options.legacy_compat
                              ? ingest::FetchMode::COMPATIBILITY
                              : ingest::FetchMode::BULK;
    settings.engine.chain_id = static_cast<uint64_t>(options.l2_chain_id);
    settings.engine.batch_size = static_cast<uint64_t>(options.batch_size);
    settings.engine.polling_interval =
        std::chrono::milliseconds{options.polling_interval_ms};
    settings.engine.policy = options.catch_all_errors
                                 ? ingest::ErrorPolicy::CATCH_AND_BACKOFF
                                 : ingest::ErrorPolicy::FAIL_FAST;
    return settings;
}

// ---------------------------------------------------------------------------
// print_usage
// ---------------------------------------------------------------------------

void print_usage() {
    std::cout
        << get_client_name() << "\n"
        << "\n"
        << "Usage:\n"
        << "  dtld [options]\n"
        << "\n"
        << "Options:\n"
        << "  -h, -help, -?                       Show this help message and exit\n"
        << "  -version                            Show version information and exit\n"
        << "\n"
        << "Data directory:\n"
        << "  -datadir=<dir>                      Data directory path (default: ~/.dtl)\n"
        << "  -conf=<file>                        Config file (default: <datadir>/dtl.conf)\n"
        << "\n"
        << "L2 endpoint:\n"
        << "  -l2rpc=<url>                        Sequencer JSON-RPC endpoint, http://host:port[/path]\n"
        << "  -l2chainid=<n>                      L2 chain id\n"
        << "  -rpctimeout=<ms>                    HTTP request timeout (default: 30000)\n"
        << "\n"
        << "Ingestion:\n"
        << "  -pollinginterval=<ms>               Idle poll and error backoff (default: 5000)\n"
        << "  -transactionsperpollinginterval=<n> Blocks per window (default: 1000)\n"
        << "  -legacysequencercompatibility=<0|1> Fetch blocks one by one (default: 0)\n"
        << "  -dangerouslycatchallerrors=<0|1>    Log and retry on every error (default: 0)\n"
        << "\n"
        << "Logging:\n"
        << "  -loglevel=<level>                   trace, debug, info, warn, error, fatal, off\n"
        << "  -logfile=<file>                     Log filename, empty to disable (default: dtl.log)\n"
        << "  -printtoconsole=<0|1>               Log to stderr (default: 1)\n"
        << "\n";
}

// ---------------------------------------------------------------------------
// print_version
// ---------------------------------------------------------------------------

void print_version() {
    std::cout
        << get_client_name() << "\n"
        << "Copyright (c) 2024-2026 The DTL Developers\n"
        << "Distributed under the MIT software license.\n"
        << "\n"
        << "Compiler: "
#if defined(__clang__)
        << "Clang " << __clang_major__ << "." << __clang_minor__
#elif defined(__GNUC__)
        << "GCC " << __GNUC__ << "." << __GNUC_MINOR__
#else
        << "Unknown"
#endif
        << "\n"
        << "C++ standard: " << __cplusplus << "\n"
        << "Build date: " << __DATE__ << " " << __TIME__ << "\n";
}

} // namespace node
