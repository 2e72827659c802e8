#pragma once
// Copyright (c) 2024-2026 The DTL Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "rpc/json.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace store {

// ---------------------------------------------------------------------------
// Persisted record types
// ---------------------------------------------------------------------------
// Each record is stored as compact JSON text. Field names are the camelCase
// names shown next to each member; absent optionals serialize as null.
// from_json() reports STORAGE_CORRUPT for anything that does not match.
// ---------------------------------------------------------------------------

enum class QueueOrigin { SEQUENCER, L1 };
enum class TxType { EIP155, ETH_SIGN };

[[nodiscard]] std::string_view queue_origin_name(QueueOrigin origin) noexcept;
[[nodiscard]] std::string_view tx_type_name(TxType type) noexcept;

struct EnqueueEntry {
    uint64_t    index = 0;
    std::string target;
    std::string data;
    uint64_t    gas_limit = 0;      // gasLimit
    std::string origin;
    uint64_t    block_number = 0;   // blockNumber
    uint64_t    timestamp = 0;

    [[nodiscard]] rpc::JsonValue to_json() const;
    static core::Result<EnqueueEntry> from_json(const rpc::JsonValue& v);
    bool operator==(const EnqueueEntry&) const = default;
};

struct TransactionSignature {
    std::string r;
    std::string s;
    std::string v;

    bool operator==(const TransactionSignature&) const = default;
};

/// Decoded view of a sequencer-submitted transaction.
struct DecodedTransaction {
    TransactionSignature       sig;
    uint64_t                   gas_limit = 0;   // gasLimit
    uint64_t                   gas_price = 0;   // gasPrice
    uint64_t                   nonce = 0;
    std::optional<std::string> target;          // null for contract creation
    std::string                data;

    bool operator==(const DecodedTransaction&) const = default;
};

struct TransactionEntry {
    uint64_t                          index = 0;
    std::optional<uint64_t>           batch_index;   // batchIndex
    std::string                       data;
    uint64_t                          block_number = 0;
    uint64_t                          timestamp = 0;
    uint64_t                          gas_limit = 0;
    std::string                       target;
    std::optional<std::string>        origin;
    QueueOrigin                       queue_origin = QueueOrigin::SEQUENCER;
    std::optional<uint64_t>           queue_index;   // queueIndex
    std::optional<TxType>             type;
    std::optional<DecodedTransaction> decoded;

    [[nodiscard]] rpc::JsonValue to_json() const;
    static core::Result<TransactionEntry> from_json(const rpc::JsonValue& v);
    bool operator==(const TransactionEntry&) const = default;
};

/// Shared layout of transaction batches and state-root batches.
struct BatchEntry {
    uint64_t    index = 0;
    uint64_t    block_number = 0;
    uint64_t    timestamp = 0;
    std::string submitter;
    uint64_t    size = 0;
    std::string root;
    uint64_t    prev_total_elements = 0;  // prevTotalElements
    std::string extra_data;               // extraData

    [[nodiscard]] rpc::JsonValue to_json() const;
    static core::Result<BatchEntry> from_json(const rpc::JsonValue& v);
    bool operator==(const BatchEntry&) const = default;
};

using TransactionBatchEntry = BatchEntry;
using StateRootBatchEntry = BatchEntry;

struct StateRootEntry {
    uint64_t                index = 0;
    std::optional<uint64_t> batch_index;
    std::string             value;

    [[nodiscard]] rpc::JsonValue to_json() const;
    static core::Result<StateRootEntry> from_json(const rpc::JsonValue& v);
    bool operator==(const StateRootEntry&) const = default;
};

/// Serialize any record type to its stored JSON text.
template <typename Entry>
std::string encode_record(const Entry& entry) {
    return rpc::json_serialize(entry.to_json());
}

/// Parse stored JSON text back into a record.
template <typename Entry>
core::Result<Entry> decode_record(std::string_view text) {
    auto parsed = rpc::try_parse_json(text);
    if (!parsed.ok()) {
        return core::Error(core::ErrorCode::STORAGE_CORRUPT,
                           "stored record is not JSON: " +
                           parsed.error().message());
    }
    return Entry::from_json(parsed.value());
}

} // namespace store
