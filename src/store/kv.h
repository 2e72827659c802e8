#pragma once
// Copyright (c) 2024-2026 The DTL Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"

#include <string>
#include <string_view>
#include <vector>

namespace store {

/// One key/value put inside an atomic batch.
struct KvWrite {
    std::string key;
    std::string value;
};

using KvBatch = std::vector<KvWrite>;

// ---------------------------------------------------------------------------
// KvStore -- ordered byte-oriented key/value backend
// ---------------------------------------------------------------------------
// Keys compare byte-lexicographically. A batch is applied atomically: after
// a crash either every write in it is visible or none is.
// ---------------------------------------------------------------------------
class KvStore {
public:
    virtual ~KvStore() = default;

    /// Returns STORAGE_NOT_FOUND when @p key is absent.
    virtual core::Result<std::string> get(std::string_view key) const = 0;

    virtual core::Result<void> write_batch(const KvBatch& batch) = 0;

    /// Values whose keys lie in [gte, lt), in ascending key order.
    virtual core::Result<std::vector<std::string>> scan(
        std::string_view gte, std::string_view lt) const = 0;

    core::Result<void> put(std::string key, std::string value) {
        KvBatch batch;
        batch.push_back(KvWrite{std::move(key), std::move(value)});
        return write_batch(batch);
    }
};

} // namespace store
