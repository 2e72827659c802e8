// Copyright (c) 2024-2026 The DTL Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "store/keys.h"

#include <charconv>

namespace store {

std::string index_key(const RecordKind& kind, uint64_t index) {
    char digits[INDEX_KEY_WIDTH];
    auto [ptr, ec] = std::to_chars(digits, digits + sizeof(digits), index);
    size_t len = static_cast<size_t>(ptr - digits);

    std::string key;
    key.reserve(kind.index_prefix.size() + 1 + INDEX_KEY_WIDTH);
    key.append(kind.index_prefix);
    key.push_back(':');
    key.append(INDEX_KEY_WIDTH - len, '0');
    key.append(digits, len);
    return key;
}

std::string latest_key(const RecordKind& kind) {
    return std::string(kind.latest_key);
}

std::string scan_cursor_key(std::string_view name) {
    std::string key = "event:latest:";
    key.append(name);
    return key;
}

bool parse_decimal_u64(std::string_view text, uint64_t& out) {
    if (text.empty()) return false;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(),
                                     out);
    return ec == std::errc{} && ptr == text.data() + text.size();
}

} // namespace store
