#pragma once
// Copyright (c) 2024-2026 The DTL Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "store/flatfile.h"
#include "store/kv.h"
#include "store/memory_kv.h"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <vector>

namespace store {

// ---------------------------------------------------------------------------
// LogKvStore -- durable KvStore backed by an append-only batch log
// ---------------------------------------------------------------------------
// Every write_batch() appends one record and fdatasync()s it before the
// batch becomes visible to get() and scan():
//
//   magic u32 | payload_len u32 | payload | sha3_256(payload) (32 bytes)
//   payload = op_count u32, then op_count x (key_len u32 | key |
//                                            value_len u32 | value)
//
// Integers are little-endian. open() replays the log into an in-memory
// ordered index. A torn record at the end of the file is cut off, so a
// batch is either fully applied or absent; damage anywhere before the last
// record is reported as STORAGE_CORRUPT. A failed write is rolled back;
// if the rollback fails too, later writes are refused until reopen. The
// log is never compacted.
// ---------------------------------------------------------------------------
class LogKvStore : public KvStore {
public:
    static constexpr uint32_t RECORD_MAGIC = 0x4c54444b;  // "KDTL"
    static constexpr size_t   HEADER_SIZE = 8;
    static constexpr size_t   CHECKSUM_SIZE = 32;

    static core::Result<std::unique_ptr<LogKvStore>> open(
        const std::filesystem::path& path);

    ~LogKvStore() override;

    core::Result<std::string> get(std::string_view key) const override;
    core::Result<void> write_batch(const KvBatch& batch) override;
    core::Result<std::vector<std::string>> scan(
        std::string_view gte, std::string_view lt) const override;

    /// Number of batch records replayed or written since open().
    [[nodiscard]] uint64_t record_count() const;

    /// Bytes discarded from the end of the log during open().
    [[nodiscard]] int64_t truncated_bytes() const { return truncated_bytes_; }

    [[nodiscard]] const std::filesystem::path& path() const {
        return file_.path();
    }

private:
    explicit LogKvStore(const std::filesystem::path& path);

    core::Result<void> replay();

    FlatFile           file_;
    MemoryKvStore      index_;
    mutable std::mutex write_mutex_;
    uint64_t           record_count_ = 0;
    int64_t            truncated_bytes_ = 0;
};

/// Serializes @p batch into one framed, checksummed log record.
[[nodiscard]] core::Result<std::vector<uint8_t>> encode_log_record(
    const KvBatch& batch);

} // namespace store
