#pragma once
// Copyright (c) 2024-2026 The DTL Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <cstdint>
#include <filesystem>
#include <optional>

namespace core::fs {

using path = std::filesystem::path;

/// $HOME/.dtl, or /tmp/.dtl when HOME is unset.
path get_default_data_dir();

/// Creates the directory (and parents) if it does not exist.
/// Returns true on success or if the directory already exists.
bool ensure_directory(const path& dir);

path absolute(const path& p);

bool file_exists(const path& p);

std::optional<uint64_t> file_size(const path& p);

/// rename(2): atomic on the same filesystem, replaces `dst` if present.
bool rename_safe(const path& src, const path& dst);

// ---------------------------------------------------------------------------
// FileLock - advisory flock(2) lock with RAII release.
// ---------------------------------------------------------------------------
class FileLock {
public:
    /// Does NOT acquire the lock; call try_lock().
    explicit FileLock(const path& p);
    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;
    FileLock(FileLock&& other) noexcept;
    FileLock& operator=(FileLock&& other) noexcept;

    /// Non-blocking exclusive lock. Returns false if another process (or
    /// another FileLock on the same file) already holds it.
    bool try_lock();

    void unlock();

    [[nodiscard]] bool locked() const noexcept { return locked_; }
    [[nodiscard]] const path& lock_path() const noexcept { return lock_path_; }

private:
    void close_fd();

    path lock_path_;
    bool locked_{false};
    int  fd_{-1};
};

} // namespace core::fs
