#pragma once
// Copyright (c) 2024-2026 The DTL Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "store/kv.h"

#include <functional>
#include <map>
#include <mutex>

namespace store {

/// Volatile KvStore over a std::map. Used by tests and as the replay
/// target of LogKvStore.
class MemoryKvStore : public KvStore {
public:
    core::Result<std::string> get(std::string_view key) const override;
    core::Result<void> write_batch(const KvBatch& batch) override;
    core::Result<std::vector<std::string>> scan(
        std::string_view gte, std::string_view lt) const override;

    [[nodiscard]] size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::string, std::less<>> entries_;
};

} // namespace store
