// Copyright (c) 2024-2026 The DTL Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/hex.h"

#include <array>

namespace core {

// ---------------------------------------------------------------------------
// Lookup tables
// ---------------------------------------------------------------------------

static constexpr char HEX_DIGITS[] = "0123456789abcdef";

// Maps ASCII value -> nibble value, 0xFF means invalid.
static constexpr std::array<uint8_t, 256> make_decode_table() {
    std::array<uint8_t, 256> table{};
    for (auto& v : table) v = 0xFF;
    for (int i = 0; i <= 9; ++i) {
        table[static_cast<size_t>('0') + i] = static_cast<uint8_t>(i);
    }
    for (int i = 0; i < 6; ++i) {
        table[static_cast<size_t>('a') + i] = static_cast<uint8_t>(10 + i);
        table[static_cast<size_t>('A') + i] = static_cast<uint8_t>(10 + i);
    }
    return table;
}

static constexpr auto DECODE_TABLE = make_decode_table();

static std::string_view strip_prefix(std::string_view s) {
    if (s.size() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) {
        s.remove_prefix(2);
    }
    return s;
}

// ---------------------------------------------------------------------------
// Byte data
// ---------------------------------------------------------------------------

std::string to_hex(std::span<const uint8_t> data) {
    std::string result;
    result.resize(data.size() * 2);
    char* out = result.data();
    for (uint8_t byte : data) {
        *out++ = HEX_DIGITS[byte >> 4];
        *out++ = HEX_DIGITS[byte & 0xF];
    }
    return result;
}

std::optional<std::vector<uint8_t>> from_hex(std::string_view hex) {
    hex = strip_prefix(hex);
    if (hex.size() % 2 != 0) {
        return std::nullopt;
    }

    std::vector<uint8_t> result;
    result.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        const uint8_t hi = DECODE_TABLE[static_cast<uint8_t>(hex[i])];
        const uint8_t lo = DECODE_TABLE[static_cast<uint8_t>(hex[i + 1])];
        if (hi == 0xFF || lo == 0xFF) {
            return std::nullopt;
        }
        result.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return result;
}

bool is_hex_data(std::string_view str) {
    if (!str.starts_with("0x")) {
        return false;
    }
    str.remove_prefix(2);
    if (str.size() % 2 != 0) {
        return false;
    }
    for (char ch : str) {
        if (DECODE_TABLE[static_cast<uint8_t>(ch)] == 0xFF) {
            return false;
        }
    }
    return true;
}

// ---------------------------------------------------------------------------
// Quantities
// ---------------------------------------------------------------------------

std::string to_quantity(uint64_t value) {
    if (value == 0) {
        return "0x0";
    }
    char buf[16];
    int n = 0;
    while (value != 0) {
        buf[n++] = HEX_DIGITS[value & 0xF];
        value >>= 4;
    }
    std::string out = "0x";
    out.reserve(2 + static_cast<size_t>(n));
    while (n > 0) {
        out += buf[--n];
    }
    return out;
}

core::Result<uint64_t> parse_quantity(std::string_view str) {
    if (!(str.starts_with("0x") || str.starts_with("0X"))) {
        return core::Error(core::ErrorCode::PARSE_BAD_FORMAT,
                           "quantity missing 0x prefix: '" +
                           std::string(str) + "'");
    }
    std::string_view digits = str.substr(2);
    if (digits.empty()) {
        return core::Error(core::ErrorCode::PARSE_BAD_FORMAT,
                           "empty quantity");
    }

    while (digits.size() > 1 && digits.front() == '0') {
        digits.remove_prefix(1);
    }
    if (digits.size() > 16) {
        return core::Error(core::ErrorCode::PARSE_BAD_FORMAT,
                           "quantity exceeds 64 bits: '" +
                           std::string(str) + "'");
    }

    uint64_t value = 0;
    for (char ch : digits) {
        uint8_t nibble = DECODE_TABLE[static_cast<uint8_t>(ch)];
        if (nibble == 0xFF) {
            return core::Error(core::ErrorCode::PARSE_BAD_FORMAT,
                               "invalid hex digit in quantity: '" +
                               std::string(str) + "'");
        }
        value = (value << 4) | nibble;
    }
    return value;
}

}  // namespace core
