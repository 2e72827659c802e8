#pragma once
// Copyright (c) 2024-2026 The DTL Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/stream.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

namespace core {

/// Upper bound for a single length-prefixed field in a storage record.
inline constexpr uint32_t MAX_FIELD_LENGTH = 64u << 20;

// ===================================================================
// Primitive serializers -- little-endian wire format
// ===================================================================

template <typename Stream>
inline void ser_write_u32(Stream& s, uint32_t v) {
    uint8_t buf[4];
    buf[0] = static_cast<uint8_t>(v & 0xFF);
    buf[1] = static_cast<uint8_t>((v >> 8) & 0xFF);
    buf[2] = static_cast<uint8_t>((v >> 16) & 0xFF);
    buf[3] = static_cast<uint8_t>((v >> 24) & 0xFF);
    s.write(std::span<const uint8_t>(buf, 4));
}

template <typename Stream>
inline void ser_write_bytes(Stream& s, std::span<const uint8_t> data) {
    s.write(data);
}

template <typename Stream>
inline uint32_t ser_read_u32(Stream& s) {
    uint8_t buf[4];
    s.read(std::span<uint8_t>(buf, 4));
    return static_cast<uint32_t>(buf[0])
         | (static_cast<uint32_t>(buf[1]) << 8)
         | (static_cast<uint32_t>(buf[2]) << 16)
         | (static_cast<uint32_t>(buf[3]) << 24);
}

// ===================================================================
// Length-prefixed strings: u32 length followed by raw bytes
// ===================================================================

template <typename Stream>
void ser_write_string(Stream& s, std::string_view str) {
    if (str.size() > MAX_FIELD_LENGTH) {
        throw std::length_error("ser_write_string(): field too long");
    }
    ser_write_u32(s, static_cast<uint32_t>(str.size()));
    s.write(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(str.data()), str.size()));
}

template <typename Stream>
std::string ser_read_string(Stream& s) {
    uint32_t len = ser_read_u32(s);
    if (len > MAX_FIELD_LENGTH) {
        throw std::out_of_range("ser_read_string(): field too long");
    }
    std::string result(static_cast<size_t>(len), '\0');
    if (len > 0) {
        s.read(std::span<uint8_t>(
            reinterpret_cast<uint8_t*>(result.data()), result.size()));
    }
    return result;
}

}  // namespace core
