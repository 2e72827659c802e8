// Copyright (c) 2024-2026 The DTL Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "store/log_kv.h"

#include "core/logging.h"
#include "core/serialize.h"
#include "core/stream.h"
#include "crypto/sha3.h"

#include <algorithm>
#include <cstring>
#include <utility>
#include <stdexcept>

namespace store {

namespace {

core::Result<crypto::Hash256> checksum(std::span<const uint8_t> payload) {
    try {
        return crypto::sha3_256(payload);
    } catch (const std::runtime_error& e) {
        return core::Error(core::ErrorCode::CRYPTO_ERROR, e.what());
    }
}

bool all_zero(std::span<const uint8_t> bytes) {
    return std::all_of(bytes.begin(), bytes.end(),
                       [](uint8_t b) { return b == 0; });
}

/// Parses a checksummed payload into its writes.
core::Result<KvBatch> decode_payload(std::span<const uint8_t> payload) {
    try {
        core::SpanReader reader(payload);
        uint32_t op_count = core::ser_read_u32(reader);
        KvBatch batch;
        batch.reserve(std::min<size_t>(op_count, payload.size() / 8));
        for (uint32_t i = 0; i < op_count; ++i) {
            std::string key = core::ser_read_string(reader);
            std::string value = core::ser_read_string(reader);
            batch.push_back(KvWrite{std::move(key), std::move(value)});
        }
        if (!reader.eof()) {
            return core::Error(core::ErrorCode::STORAGE_CORRUPT,
                               "trailing bytes in log record payload");
        }
        return batch;
    } catch (const std::out_of_range& e) {
        return core::Error(core::ErrorCode::STORAGE_CORRUPT,
                           std::string("malformed log record: ") + e.what());
    }
}

} // namespace

core::Result<std::vector<uint8_t>> encode_log_record(const KvBatch& batch) {
    core::DataStream payload;
    try {
        core::ser_write_u32(payload, static_cast<uint32_t>(batch.size()));
        for (const auto& w : batch) {
            core::ser_write_string(payload, w.key);
            core::ser_write_string(payload, w.value);
        }
    } catch (const std::length_error& e) {
        return core::Error(core::ErrorCode::INVALID_ARGUMENT, e.what());
    }

    if (payload.size() > core::MAX_FIELD_LENGTH) {
        return core::Error(core::ErrorCode::INVALID_ARGUMENT,
                           "batch too large for a single log record");
    }

    DTL_TRY_ASSIGN(digest, checksum(payload.view()));

    core::DataStream record;
    record.reserve(LogKvStore::HEADER_SIZE + payload.size() +
                   LogKvStore::CHECKSUM_SIZE);
    core::ser_write_u32(record, LogKvStore::RECORD_MAGIC);
    core::ser_write_u32(record, static_cast<uint32_t>(payload.size()));
    core::ser_write_bytes(record, payload.view());
    core::ser_write_bytes(record, digest);
    return record.release();
}

// ---------------------------------------------------------------------------
// LogKvStore
// ---------------------------------------------------------------------------

LogKvStore::LogKvStore(const std::filesystem::path& path)
    : file_(path) {}

LogKvStore::~LogKvStore() = default;

core::Result<std::unique_ptr<LogKvStore>> LogKvStore::open(
    const std::filesystem::path& path) {
    std::unique_ptr<LogKvStore> store(new LogKvStore(path));
    DTL_TRY_VOID(store->file_.open());
    DTL_TRY_VOID(store->replay());

    LOG_INFO(core::LogCategory::STORAGE,
             "opened " + path.string() + ": " +
             std::to_string(store->record_count_) + " batches, " +
             std::to_string(store->index_.size()) + " keys");
    return std::move(store);
}

core::Result<void> LogKvStore::replay() {
    DTL_TRY_ASSIGN(file_size, file_.size());
    DTL_TRY_ASSIGN(data, file_.read_at(0, static_cast<size_t>(file_size)));
    std::span<const uint8_t> bytes(data);

    size_t pos = 0;
    std::string tail_reason;
    while (pos < bytes.size()) {
        auto rest = bytes.subspan(pos);
        if (rest.size() < HEADER_SIZE) {
            tail_reason = "partial record header";
            break;
        }

        core::SpanReader header(rest.first(HEADER_SIZE));
        uint32_t magic = core::ser_read_u32(header);
        uint32_t payload_len = core::ser_read_u32(header);

        if (magic != RECORD_MAGIC) {
            if (all_zero(rest)) {
                tail_reason = "zero-filled tail";
                break;
            }
            return core::Error(core::ErrorCode::STORAGE_CORRUPT,
                "bad record magic at offset " + std::to_string(pos) +
                " in " + file_.path().string());
        }

        size_t record_len = HEADER_SIZE + static_cast<size_t>(payload_len) +
                            CHECKSUM_SIZE;
        if (payload_len > core::MAX_FIELD_LENGTH) {
            return core::Error(core::ErrorCode::STORAGE_CORRUPT,
                "oversized record at offset " + std::to_string(pos));
        }
        if (rest.size() < record_len) {
            tail_reason = "record extends past end of file";
            break;
        }

        auto payload = rest.subspan(HEADER_SIZE, payload_len);
        auto stored = rest.subspan(HEADER_SIZE + payload_len, CHECKSUM_SIZE);
        DTL_TRY_ASSIGN(digest, checksum(payload));
        if (!std::equal(digest.begin(), digest.end(), stored.begin())) {
            if (rest.size() == record_len) {
                tail_reason = "checksum mismatch in last record";
                break;
            }
            return core::Error(core::ErrorCode::STORAGE_CORRUPT,
                "checksum mismatch at offset " + std::to_string(pos) +
                " in " + file_.path().string());
        }

        DTL_TRY_ASSIGN(batch, decode_payload(payload));
        DTL_TRY_VOID(index_.write_batch(batch));
        ++record_count_;
        pos += record_len;
    }

    if (pos < bytes.size()) {
        truncated_bytes_ = static_cast<int64_t>(bytes.size() - pos);
        LOG_WARN(core::LogCategory::STORAGE,
                 "discarding " + std::to_string(truncated_bytes_) +
                 " bytes at end of " + file_.path().string() + " (" +
                 tail_reason + ")");
        DTL_TRY_VOID(file_.truncate(static_cast<int64_t>(pos)));
    }
    return core::make_ok();
}

core::Result<std::string> LogKvStore::get(std::string_view key) const {
    return index_.get(key);
}

core::Result<void> LogKvStore::write_batch(const KvBatch& batch) {
    if (batch.empty()) {
        return core::make_ok();
    }
    DTL_TRY_ASSIGN(record, encode_log_record(batch));

    std::lock_guard<std::mutex> lock(write_mutex_);
    // append() leaves no fragment behind on failure.
    DTL_TRY_ASSIGN(offset, file_.append(record));
    auto synced = file_.sync();
    if (!synced.ok()) {
        auto undo = file_.truncate(offset);
        if (!undo.ok()) {
            LOG_ERROR(core::LogCategory::STORAGE,
                      "cannot drop unsynced record from " +
                      file_.path().string() + ", refusing further writes: " +
                      undo.error().message());
        }
        return synced;
    }

    DTL_TRY_VOID(index_.write_batch(batch));
    ++record_count_;
    LOG_TRACE(core::LogCategory::STORAGE,
              "appended batch of " + std::to_string(batch.size()) +
              " writes at offset " + std::to_string(offset));
    return core::make_ok();
}

core::Result<std::vector<std::string>> LogKvStore::scan(
    std::string_view gte, std::string_view lt) const {
    return index_.scan(gte, lt);
}

uint64_t LogKvStore::record_count() const {
    std::lock_guard<std::mutex> lock(write_mutex_);
    return record_count_;
}

} // namespace store
