#pragma once
// Copyright (c) 2024-2026 The DTL Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>

namespace store {

/// Decimal width of the zero-padded index suffix of every indexed key.
inline constexpr size_t INDEX_KEY_WIDTH = 32;

static_assert(std::numeric_limits<uint64_t>::digits10 + 1 <= INDEX_KEY_WIDTH,
              "every uint64_t index must fit the padded key width");

// ---------------------------------------------------------------------------
// RecordKind -- key namespace of one family of indexed records
// ---------------------------------------------------------------------------
// Record i of a kind lives at "<index_prefix>:<i padded to 32 digits>"; the
// highest stored index lives at latest_key. Both strings are part of the
// on-disk format shared with existing deployments.
// ---------------------------------------------------------------------------
struct RecordKind {
    std::string_view name;
    std::string_view index_prefix;
    std::string_view latest_key;
};

inline constexpr RecordKind ENQUEUE{
    "enqueue", "enqueue:index", "enqueue:latest"};
inline constexpr RecordKind TRANSACTION{
    "transaction", "transaction:index", "transaction:latest"};
inline constexpr RecordKind TRANSACTION_BATCH{
    "transaction batch", "batch:transaction:index",
    "batch:transaction:latest"};
inline constexpr RecordKind STATE_ROOT{
    "state root", "stateroot:index", "stateroot:latest"};
inline constexpr RecordKind STATE_ROOT_BATCH{
    "state root batch", "batch:stateroot:index", "batch:stateroot:latest"};
inline constexpr RecordKind UNCONFIRMED_TRANSACTION{
    "unconfirmed transaction", "unconfirmed:transaction:index",
    "unconfirmed:transaction:latest"};
inline constexpr RecordKind UNCONFIRMED_STATE_ROOT{
    "unconfirmed state root", "unconfirmed:stateroot:index",
    "unconfirmed:stateroot:latest"};

/// Pointer-only kind: the last L2 block committed by the ingestion loop.
inline constexpr RecordKind SYNCED_UNCONFIRMED{
    "synced unconfirmed", "synced:unconfirmed:index",
    "synced:unconfirmed:latest"};

/// "<index_prefix>:" followed by @p index zero-padded to INDEX_KEY_WIDTH.
[[nodiscard]] std::string index_key(const RecordKind& kind, uint64_t index);

[[nodiscard]] std::string latest_key(const RecordKind& kind);

/// "event:latest:<name>"
[[nodiscard]] std::string scan_cursor_key(std::string_view name);

/// Strict decimal parse of a stored pointer value.
[[nodiscard]] bool parse_decimal_u64(std::string_view text, uint64_t& out);

} // namespace store
