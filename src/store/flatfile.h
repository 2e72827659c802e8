#pragma once
// Copyright (c) 2024-2026 The DTL Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <span>
#include <string>
#include <vector>

namespace store {

// ---------------------------------------------------------------------------
// FlatFile -- append-only file over a POSIX descriptor
// ---------------------------------------------------------------------------
// The file never holds a partial append: a short or failed write is cut
// back to the previous end before append() returns. If that cut itself
// fails the file is poisoned and every later append() and truncate() is
// refused with STORAGE_ERROR, so nothing can be written behind a fragment.
//
// sync() is fdatasync(2): once it returns, appended bytes survive a power
// loss, not just a process crash.
// ---------------------------------------------------------------------------
class FlatFile {
public:
    explicit FlatFile(std::filesystem::path path);
    ~FlatFile();

    FlatFile(const FlatFile&) = delete;
    FlatFile& operator=(const FlatFile&) = delete;

    /// Opens read/write, creating the file and its parent directory.
    core::Result<void> open();

    void close();

    [[nodiscard]] bool is_open() const;

    /// Writes @p data at the end and returns the offset it starts at.
    core::Result<int64_t> append(std::span<const uint8_t> data);

    core::Result<std::vector<uint8_t>> read_at(int64_t offset,
                                               size_t length) const;

    core::Result<int64_t> size() const;

    core::Result<void> sync();

    /// Shrinks the file to @p new_size bytes. Growing is an error.
    core::Result<void> truncate(int64_t new_size);

    /// True once a rollback could not restore the file's end.
    [[nodiscard]] bool poisoned() const;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    core::Error io_error(const std::string& what, int err) const;

    std::filesystem::path path_;
    int                   fd_ = -1;
    int64_t               size_ = 0;
    bool                  poisoned_ = false;
    mutable std::mutex    mutex_;
};

} // namespace store
