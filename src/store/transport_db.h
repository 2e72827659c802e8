#pragma once
// Copyright (c) 2024-2026 The DTL Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "store/keys.h"
#include "store/kv.h"
#include "store/records.h"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace store {

/// A record's serialized value paired with the index it is stored under.
struct IndexedValue {
    uint64_t    index = 0;
    std::string value;
};

/// Records for one kind inside a multi-kind commit.
struct IndexedGroup {
    const RecordKind*         kind = nullptr;
    std::vector<IndexedValue> values;
};

// ---------------------------------------------------------------------------
// TransportDB -- ordered, index-addressed record store
// ---------------------------------------------------------------------------
// Layered over a KvStore. Every put writes its records and the kind's latest
// pointer in one atomic backend batch, and the pointer only ever moves
// forward: rewriting an older range leaves it where it was. Errors:
//   INVALID_ARGUMENT   empty or non-increasing input
//   STORAGE_NOT_FOUND  missing record or pointer
//   STORAGE_CORRUPT    stored bytes that do not decode
// ---------------------------------------------------------------------------
class TransportDB {
public:
    explicit TransportDB(KvStore& kv) : kv_(kv) {}

    // -- Generic ordered store ----------------------------------------------

    core::Result<void> put_indexed(const RecordKind& kind,
                                   std::vector<IndexedValue> values);

    /// Commits several kinds in a single atomic batch.
    core::Result<void> put_indexed_groups(std::vector<IndexedGroup> groups);

    core::Result<std::string> get_by_index(const RecordKind& kind,
                                           uint64_t index) const;

    /// Values with start <= index < end, ascending.
    core::Result<std::vector<std::string>> get_range(const RecordKind& kind,
                                                     uint64_t start,
                                                     uint64_t end) const;

    core::Result<uint64_t> get_latest(const RecordKind& kind) const;

    /// Moves the latest pointer to @p index unless it is already at or past
    /// it. Used for pointer-only kinds such as the sync cursor.
    core::Result<void> advance_latest(const RecordKind& kind, uint64_t index);

    core::Result<uint64_t> get_scan_cursor(std::string_view name) const;
    core::Result<void> put_scan_cursor(std::string_view name, uint64_t block);

    // -- Typed records ------------------------------------------------------

    core::Result<void> put_enqueue_entries(const std::vector<EnqueueEntry>& entries);
    core::Result<void> put_transaction_entries(const std::vector<TransactionEntry>& entries);
    core::Result<void> put_transaction_batch_entries(const std::vector<TransactionBatchEntry>& entries);
    core::Result<void> put_state_root_entries(const std::vector<StateRootEntry>& entries);
    core::Result<void> put_state_root_batch_entries(const std::vector<StateRootBatchEntry>& entries);
    core::Result<void> put_unconfirmed_transaction_entries(const std::vector<TransactionEntry>& entries);
    core::Result<void> put_unconfirmed_state_root_entries(const std::vector<StateRootEntry>& entries);

    /// Writes one block's unconfirmed transaction and state root together.
    core::Result<void> put_unconfirmed_block(const TransactionEntry& tx,
                                             const StateRootEntry& root);

    core::Result<EnqueueEntry> get_enqueue_by_index(uint64_t index) const;
    core::Result<TransactionEntry> get_transaction_by_index(uint64_t index) const;
    core::Result<TransactionBatchEntry> get_transaction_batch_by_index(uint64_t index) const;
    core::Result<StateRootEntry> get_state_root_by_index(uint64_t index) const;
    core::Result<StateRootBatchEntry> get_state_root_batch_by_index(uint64_t index) const;
    core::Result<TransactionEntry> get_unconfirmed_transaction_by_index(uint64_t index) const;
    core::Result<StateRootEntry> get_unconfirmed_state_root_by_index(uint64_t index) const;

    core::Result<std::vector<TransactionEntry>> get_transactions_by_index_range(
        uint64_t start, uint64_t end) const;
    core::Result<std::vector<StateRootEntry>> get_state_roots_by_index_range(
        uint64_t start, uint64_t end) const;
    core::Result<std::vector<TransactionEntry>> get_unconfirmed_transactions_by_index_range(
        uint64_t start, uint64_t end) const;

    core::Result<EnqueueEntry> get_latest_enqueue() const;
    core::Result<TransactionEntry> get_latest_transaction() const;
    core::Result<TransactionBatchEntry> get_latest_transaction_batch() const;
    core::Result<StateRootEntry> get_latest_state_root() const;
    core::Result<StateRootBatchEntry> get_latest_state_root_batch() const;

    // -- Ingestion cursor ---------------------------------------------------

    core::Result<uint64_t> get_highest_synced_unconfirmed_block() const;
    core::Result<void> set_highest_synced_unconfirmed_block(uint64_t block);

private:
    template <typename Entry>
    core::Result<void> put_entries(const RecordKind& kind,
                                   const std::vector<Entry>& entries);

    template <typename Entry>
    core::Result<Entry> get_entry(const RecordKind& kind, uint64_t index) const;

    template <typename Entry>
    core::Result<std::vector<Entry>> get_entries(const RecordKind& kind,
                                                 uint64_t start,
                                                 uint64_t end) const;

    template <typename Entry>
    core::Result<Entry> get_latest_entry(const RecordKind& kind) const;

    core::Result<uint64_t> read_pointer(const std::string& key) const;

    KvStore& kv_;
};

} // namespace store
