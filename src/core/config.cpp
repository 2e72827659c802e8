// Copyright (c) 2024-2026 The DTL Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/config.h"
#include "core/logging.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <string>

namespace core {

namespace {

std::string_view trim(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front())))
        sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back())))
        sv.remove_suffix(1);
    return sv;
}

std::string_view strip_dashes(std::string_view sv) {
    if (sv.starts_with("--")) return sv.substr(2);
    if (sv.starts_with("-"))  return sv.substr(1);
    return sv;
}

std::string lowercase(std::string_view sv) {
    std::string out(sv);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Config -- source loading
// ---------------------------------------------------------------------------

core::Result<void> Config::parse_args(int argc, const char* const argv[]) {
    // argv[0] is the program name.
    for (int i = 1; i < argc; ++i) {
        std::string_view arg{argv[i]};
        if (arg.empty()) continue;

        if (!arg.starts_with("-")) {
            return core::Error(core::ErrorCode::CONFIG_ERROR,
                               "unexpected positional argument '" +
                               std::string{arg} + "'");
        }

        std::string_view stripped = strip_dashes(arg);
        auto eq_pos = stripped.find('=');
        if (eq_pos != std::string_view::npos) {
            cli_values_[lowercase(trim(stripped.substr(0, eq_pos)))] =
                std::string{trim(stripped.substr(eq_pos + 1))};
        } else {
            cli_values_[lowercase(trim(stripped))] = "1";
        }
    }
    return core::make_ok();
}

core::Result<void> Config::parse_file(const std::filesystem::path& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        return core::Error(core::ErrorCode::STORAGE_NOT_FOUND,
                           "unable to open config file '" +
                           path.string() + "'");
    }

    LOG_INFO(core::LogCategory::CONFIG,
             "Loading configuration from '" + path.string() + "'");

    std::string line;
    int line_num = 0;
    while (std::getline(ifs, line)) {
        ++line_num;
        std::string_view sv = trim(std::string_view{line});
        if (sv.empty() || sv.front() == '#') continue;

        auto eq_pos = sv.find('=');
        if (eq_pos == std::string_view::npos) {
            file_values_[lowercase(sv)] = "1";
            continue;
        }

        std::string_view key = trim(sv.substr(0, eq_pos));
        if (key.empty()) {
            return core::Error(core::ErrorCode::CONFIG_ERROR,
                               "empty key on line " +
                               std::to_string(line_num) + " of '" +
                               path.string() + "'");
        }
        file_values_[lowercase(key)] = std::string{trim(sv.substr(eq_pos + 1))};
    }
    return core::make_ok();
}

// ---------------------------------------------------------------------------
// Config -- lookups
// ---------------------------------------------------------------------------

void Config::set(std::string_view key, std::string value) {
    file_values_[lowercase(key)] = std::move(value);
}

const std::string* Config::lookup(std::string_view key) const {
    std::string k = lowercase(key);
    if (auto it = cli_values_.find(k); it != cli_values_.end()) {
        return &it->second;
    }
    if (auto it = file_values_.find(k); it != file_values_.end()) {
        return &it->second;
    }
    return nullptr;
}

std::optional<std::string> Config::get(std::string_view key) const {
    const auto* val = lookup(key);
    if (!val) return std::nullopt;
    return *val;
}

std::string Config::get_or(std::string_view key,
                           std::string_view default_val) const {
    const auto* val = lookup(key);
    return val ? *val : std::string{default_val};
}

core::Result<int64_t> Config::get_int(std::string_view key,
                                      int64_t default_val) const {
    const auto* val = lookup(key);
    if (!val) return default_val;

    int64_t result = 0;
    const char* end = val->data() + val->size();
    auto [ptr, ec] = std::from_chars(val->data(), end, result);
    if (ec != std::errc{} || ptr != end) {
        return core::Error(core::ErrorCode::CONFIG_ERROR,
                           "cannot parse '" + *val +
                           "' as integer for -" + std::string{key});
    }
    return result;
}

bool Config::get_bool(std::string_view key, bool default_val) const {
    const auto* val = lookup(key);
    if (!val || val->empty()) return default_val;

    std::string v = lowercase(*val);
    if (v == "1" || v == "true" || v == "yes" || v == "on")  return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    return default_val;
}

bool Config::has(std::string_view key) const {
    return lookup(key) != nullptr;
}

std::vector<std::string> Config::keys() const {
    std::vector<std::string> out;
    out.reserve(cli_values_.size() + file_values_.size());
    for (const auto& [k, v] : cli_values_) out.push_back(k);
    for (const auto& [k, v] : file_values_) {
        if (!cli_values_.count(k)) out.push_back(k);
    }
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace core
