#pragma once
// Copyright (c) 2024-2026 The DTL Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace core {

// ---------------------------------------------------------------------------
// Configuration key constants
// ---------------------------------------------------------------------------
inline constexpr const char* CONF_DATADIR          = "datadir";
inline constexpr const char* CONF_CONF             = "conf";
inline constexpr const char* CONF_L2RPC            = "l2rpc";
inline constexpr const char* CONF_L2CHAINID        = "l2chainid";
inline constexpr const char* CONF_POLLINGINTERVAL  = "pollinginterval";
inline constexpr const char* CONF_TXPERPOLL        = "transactionsperpollinginterval";
inline constexpr const char* CONF_CATCHALL         = "dangerouslycatchallerrors";
inline constexpr const char* CONF_LEGACYCOMPAT     = "legacysequencercompatibility";
inline constexpr const char* CONF_RPCTIMEOUT       = "rpctimeout";
inline constexpr const char* CONF_LOGLEVEL         = "loglevel";
inline constexpr const char* CONF_LOGFILE          = "logfile";
inline constexpr const char* CONF_PRINTTOCONSOLE   = "printtoconsole";

// ---------------------------------------------------------------------------
// Config  --  layered key/value configuration
//
// Priority order: command-line args  >  config file  >  programmatic set()
// ---------------------------------------------------------------------------
class Config {
public:
    Config() = default;

    /// Parse command-line arguments.
    ///   -key=value   --key=value   (key/value pair)
    ///   -key         --key         (boolean flag, value = "1")
    /// Positional arguments are reported as CONFIG_ERROR.
    core::Result<void> parse_args(int argc, const char* const argv[]);

    /// Parse an INI-style file of key=value lines. '#' starts a comment
    /// line. A missing file is STORAGE_NOT_FOUND.
    core::Result<void> parse_file(const std::filesystem::path& path);

    void set(std::string_view key, std::string value);

    [[nodiscard]] std::optional<std::string> get(std::string_view key) const;
    [[nodiscard]] std::string get_or(std::string_view key,
                                     std::string_view default_val) const;

    /// Strict integer lookup: absent keys yield @p default_val, values that
    /// do not parse completely are CONFIG_ERROR.
    [[nodiscard]] core::Result<int64_t> get_int(std::string_view key,
                                                int64_t default_val) const;

    /// Truthy: "1", "true", "yes", "on"; falsy: "0", "false", "no", "off"
    /// (case-insensitive). Anything else yields @p default_val.
    [[nodiscard]] bool get_bool(std::string_view key,
                                bool default_val = false) const;

    [[nodiscard]] bool has(std::string_view key) const;

    /// Every key seen in any source, for unknown-option diagnostics.
    [[nodiscard]] std::vector<std::string> keys() const;

private:
    using ValueMap = std::unordered_map<std::string, std::string>;

    ValueMap cli_values_;
    ValueMap file_values_;

    [[nodiscard]] const std::string* lookup(std::string_view key) const;
};

} // namespace core
