// Copyright (c) 2024-2026 The DTL Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "store/transport_db.h"

#include "core/logging.h"

#include <utility>

namespace store {

// ---------------------------------------------------------------------------
// Generic ordered store
// ---------------------------------------------------------------------------

core::Result<uint64_t> TransportDB::read_pointer(const std::string& key) const {
    DTL_TRY_ASSIGN(text, kv_.get(key));
    uint64_t value = 0;
    if (!parse_decimal_u64(text, value)) {
        return core::Error(core::ErrorCode::STORAGE_CORRUPT,
                           "pointer '" + key + "' holds '" + text +
                           "', expected a decimal index");
    }
    return value;
}

core::Result<void> TransportDB::put_indexed(const RecordKind& kind,
                                            std::vector<IndexedValue> values) {
    std::vector<IndexedGroup> groups;
    groups.push_back(IndexedGroup{&kind, std::move(values)});
    return put_indexed_groups(std::move(groups));
}

core::Result<void> TransportDB::put_indexed_groups(
    std::vector<IndexedGroup> groups) {
    if (groups.empty()) {
        return core::Error(core::ErrorCode::INVALID_ARGUMENT,
                           "put_indexed_groups: no groups");
    }

    KvBatch batch;
    for (auto& group : groups) {
        if (group.kind == nullptr) {
            return core::Error(core::ErrorCode::INVALID_ARGUMENT,
                               "put_indexed: group without a kind");
        }
        const RecordKind& kind = *group.kind;
        if (group.values.empty()) {
            return core::Error(core::ErrorCode::INVALID_ARGUMENT,
                               "put_indexed: empty " + std::string(kind.name) +
                               " batch");
        }
        for (size_t i = 1; i < group.values.size(); ++i) {
            if (group.values[i].index <= group.values[i - 1].index) {
                return core::Error(core::ErrorCode::INVALID_ARGUMENT,
                    "put_indexed: " + std::string(kind.name) +
                    " indices not strictly increasing at " +
                    std::to_string(group.values[i].index));
            }
        }

        uint64_t batch_max = group.values.back().index;
        auto current = read_pointer(latest_key(kind));
        if (!current.ok() && !current.error().is(core::ErrorCode::STORAGE_NOT_FOUND)) {
            return current.error();
        }

        for (auto& v : group.values) {
            batch.push_back(KvWrite{index_key(kind, v.index), std::move(v.value)});
        }
        if (!current.ok() || current.value() < batch_max) {
            batch.push_back(KvWrite{latest_key(kind), std::to_string(batch_max)});
        }
    }

    DTL_TRY_VOID(kv_.write_batch(batch));
    return core::make_ok();
}

core::Result<std::string> TransportDB::get_by_index(const RecordKind& kind,
                                                    uint64_t index) const {
    return kv_.get(index_key(kind, index));
}

core::Result<std::vector<std::string>> TransportDB::get_range(
    const RecordKind& kind, uint64_t start, uint64_t end) const {
    if (start >= end) {
        return std::vector<std::string>{};
    }
    return kv_.scan(index_key(kind, start), index_key(kind, end));
}

core::Result<uint64_t> TransportDB::get_latest(const RecordKind& kind) const {
    return read_pointer(latest_key(kind));
}

core::Result<void> TransportDB::advance_latest(const RecordKind& kind,
                                               uint64_t index) {
    auto current = read_pointer(latest_key(kind));
    if (current.ok()) {
        if (current.value() >= index) {
            return core::make_ok();
        }
    } else if (!current.error().is(core::ErrorCode::STORAGE_NOT_FOUND)) {
        return current.error();
    }
    return kv_.put(latest_key(kind), std::to_string(index));
}

core::Result<uint64_t> TransportDB::get_scan_cursor(std::string_view name) const {
    return read_pointer(scan_cursor_key(name));
}

core::Result<void> TransportDB::put_scan_cursor(std::string_view name,
                                                uint64_t block) {
    return kv_.put(scan_cursor_key(name), std::to_string(block));
}

// ---------------------------------------------------------------------------
// Typed helpers
// ---------------------------------------------------------------------------

namespace {

template <typename Entry>
std::vector<IndexedValue> to_indexed(const std::vector<Entry>& entries) {
    std::vector<IndexedValue> values;
    values.reserve(entries.size());
    for (const auto& e : entries) {
        values.push_back(IndexedValue{e.index, encode_record(e)});
    }
    return values;
}

} // namespace

template <typename Entry>
core::Result<void> TransportDB::put_entries(const RecordKind& kind,
                                            const std::vector<Entry>& entries) {
    return put_indexed(kind, to_indexed(entries));
}

template <typename Entry>
core::Result<Entry> TransportDB::get_entry(const RecordKind& kind,
                                           uint64_t index) const {
    DTL_TRY_ASSIGN(text, get_by_index(kind, index));
    return decode_record<Entry>(text);
}

template <typename Entry>
core::Result<std::vector<Entry>> TransportDB::get_entries(
    const RecordKind& kind, uint64_t start, uint64_t end) const {
    DTL_TRY_ASSIGN(texts, get_range(kind, start, end));
    std::vector<Entry> out;
    out.reserve(texts.size());
    for (const auto& text : texts) {
        DTL_TRY_ASSIGN(entry, decode_record<Entry>(text));
        out.push_back(std::move(entry));
    }
    return out;
}

template <typename Entry>
core::Result<Entry> TransportDB::get_latest_entry(const RecordKind& kind) const {
    DTL_TRY_ASSIGN(index, get_latest(kind));
    return get_entry<Entry>(kind, index);
}

core::Result<void> TransportDB::put_enqueue_entries(
    const std::vector<EnqueueEntry>& entries) {
    return put_entries(ENQUEUE, entries);
}

core::Result<void> TransportDB::put_transaction_entries(
    const std::vector<TransactionEntry>& entries) {
    return put_entries(TRANSACTION, entries);
}

core::Result<void> TransportDB::put_transaction_batch_entries(
    const std::vector<TransactionBatchEntry>& entries) {
    return put_entries(TRANSACTION_BATCH, entries);
}

core::Result<void> TransportDB::put_state_root_entries(
    const std::vector<StateRootEntry>& entries) {
    return put_entries(STATE_ROOT, entries);
}

core::Result<void> TransportDB::put_state_root_batch_entries(
    const std::vector<StateRootBatchEntry>& entries) {
    return put_entries(STATE_ROOT_BATCH, entries);
}

core::Result<void> TransportDB::put_unconfirmed_transaction_entries(
    const std::vector<TransactionEntry>& entries) {
    return put_entries(UNCONFIRMED_TRANSACTION, entries);
}

core::Result<void> TransportDB::put_unconfirmed_state_root_entries(
    const std::vector<StateRootEntry>& entries) {
    return put_entries(UNCONFIRMED_STATE_ROOT, entries);
}

core::Result<void> TransportDB::put_unconfirmed_block(
    const TransactionEntry& tx, const StateRootEntry& root) {
    std::vector<IndexedGroup> groups;
    groups.push_back(IndexedGroup{&UNCONFIRMED_TRANSACTION,
                                  {IndexedValue{tx.index, encode_record(tx)}}});
    groups.push_back(IndexedGroup{&UNCONFIRMED_STATE_ROOT,
                                  {IndexedValue{root.index, encode_record(root)}}});
    return put_indexed_groups(std::move(groups));
}

core::Result<EnqueueEntry> TransportDB::get_enqueue_by_index(uint64_t index) const {
    return get_entry<EnqueueEntry>(ENQUEUE, index);
}

core::Result<TransactionEntry> TransportDB::get_transaction_by_index(
    uint64_t index) const {
    return get_entry<TransactionEntry>(TRANSACTION, index);
}

core::Result<TransactionBatchEntry> TransportDB::get_transaction_batch_by_index(
    uint64_t index) const {
    return get_entry<TransactionBatchEntry>(TRANSACTION_BATCH, index);
}

core::Result<StateRootEntry> TransportDB::get_state_root_by_index(
    uint64_t index) const {
    return get_entry<StateRootEntry>(STATE_ROOT, index);
}

core::Result<StateRootBatchEntry> TransportDB::get_state_root_batch_by_index(
    uint64_t index) const {
    return get_entry<StateRootBatchEntry>(STATE_ROOT_BATCH, index);
}

core::Result<TransactionEntry> TransportDB::get_unconfirmed_transaction_by_index(
    uint64_t index) const {
    return get_entry<TransactionEntry>(UNCONFIRMED_TRANSACTION, index);
}

core::Result<StateRootEntry> TransportDB::get_unconfirmed_state_root_by_index(
    uint64_t index) const {
    return get_entry<StateRootEntry>(UNCONFIRMED_STATE_ROOT, index);
}

core::Result<std::vector<TransactionEntry>>
TransportDB::get_transactions_by_index_range(uint64_t start, uint64_t end) const {
    return get_entries<TransactionEntry>(TRANSACTION, start, end);
}

core::Result<std::vector<StateRootEntry>>
TransportDB::get_state_roots_by_index_range(uint64_t start, uint64_t end) const {
    return get_entries<StateRootEntry>(STATE_ROOT, start, end);
}

core::Result<std::vector<TransactionEntry>>
TransportDB::get_unconfirmed_transactions_by_index_range(uint64_t start,
                                                         uint64_t end) const {
    return get_entries<TransactionEntry>(UNCONFIRMED_TRANSACTION, start, end);
}

core::Result<EnqueueEntry> TransportDB::get_latest_enqueue() const {
    return get_latest_entry<EnqueueEntry>(ENQUEUE);
}

core::Result<TransactionEntry> TransportDB::get_latest_transaction() const {
    return get_latest_entry<TransactionEntry>(TRANSACTION);
}

core::Result<TransactionBatchEntry> TransportDB::get_latest_transaction_batch() const {
    return get_latest_entry<TransactionBatchEntry>(TRANSACTION_BATCH);
}

core::Result<StateRootEntry> TransportDB::get_latest_state_root() const {
    return get_latest_entry<StateRootEntry>(STATE_ROOT);
}

core::Result<StateRootBatchEntry> TransportDB::get_latest_state_root_batch() const {
    return get_latest_entry<StateRootBatchEntry>(STATE_ROOT_BATCH);
}

// ---------------------------------------------------------------------------
// Ingestion cursor
// ---------------------------------------------------------------------------

core::Result<uint64_t> TransportDB::get_highest_synced_unconfirmed_block() const {
    return get_latest(SYNCED_UNCONFIRMED);
}

core::Result<void> TransportDB::set_highest_synced_unconfirmed_block(
    uint64_t block) {
    auto res = advance_latest(SYNCED_UNCONFIRMED, block);
    if (res.ok()) {
        LOG_DEBUG(core::LogCategory::STORAGE,
                  "highest synced unconfirmed block -> " +
                  std::to_string(block));
    }
    return res;
}

} // namespace store
