#pragma once
// Copyright (c) 2024-2026 The DTL Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace core {

// Encode a byte span to a lowercase hexadecimal string (no prefix).
std::string to_hex(std::span<const uint8_t> data);

// Decode a hexadecimal string to bytes. An optional "0x" prefix is
// accepted. Returns nullopt on odd length or non-hex characters.
std::optional<std::vector<uint8_t>> from_hex(std::string_view hex);

// True for "0x"-prefixed even-length hex data, including the empty "0x".
bool is_hex_data(std::string_view str);

// ---------------------------------------------------------------------------
// JSON-RPC quantities
// ---------------------------------------------------------------------------
// A quantity is "0x" followed by lowercase hex digits with no leading
// zeros; zero is "0x0".

std::string to_quantity(uint64_t value);

// Parses a quantity. Leading zeros are tolerated on input; a missing
// prefix, an empty digit string, non-hex digits or a value wider than
// 64 bits is PARSE_BAD_FORMAT.
core::Result<uint64_t> parse_quantity(std::string_view str);

}  // namespace core
