// Copyright (c) 2024-2026 The DTL Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "store/memory_kv.h"

namespace store {

core::Result<std::string> MemoryKvStore::get(std::string_view key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return core::Error(core::ErrorCode::STORAGE_NOT_FOUND,
                           "key not found: " + std::string(key));
    }
    return it->second;
}

core::Result<void> MemoryKvStore::write_batch(const KvBatch& batch) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& w : batch) {
        entries_.insert_or_assign(w.key, w.value);
    }
    return core::make_ok();
}

core::Result<std::vector<std::string>> MemoryKvStore::scan(
    std::string_view gte, std::string_view lt) const {
    std::vector<std::string> out;
    if (!(gte < lt)) {
        return out;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto end = entries_.lower_bound(lt);
    for (auto it = entries_.lower_bound(gte); it != end; ++it) {
        out.push_back(it->second);
    }
    return out;
}

size_t MemoryKvStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace store
