// Copyright (c) 2024-2026 The DTL Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/fs.h"

#include <cstdlib>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace core::fs {

// ---------------------------------------------------------------------------
// Paths
// ---------------------------------------------------------------------------

path get_default_data_dir()
{
    const char* home = std::getenv("HOME");
    if (home && home[0] != '\0') {
        return path(home) / ".dtl";
    }
    return path("/tmp/.dtl");
}

bool ensure_directory(const path& dir)
{
    std::error_code ec;
    if (std::filesystem::is_directory(dir, ec)) {
        return true;
    }
    std::filesystem::create_directories(dir, ec);
    return !ec && std::filesystem::is_directory(dir, ec);
}

path absolute(const path& p)
{
    std::error_code ec;
    auto result = std::filesystem::absolute(p, ec);
    return ec ? p : result;
}

bool file_exists(const path& p)
{
    std::error_code ec;
    return std::filesystem::is_regular_file(p, ec);
}

std::optional<uint64_t> file_size(const path& p)
{
    std::error_code ec;
    auto sz = std::filesystem::file_size(p, ec);
    if (ec) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(sz);
}

bool rename_safe(const path& src, const path& dst)
{
    std::error_code ec;
    std::filesystem::rename(src, dst, ec);
    return !ec;
}

// ---------------------------------------------------------------------------
// FileLock
// ---------------------------------------------------------------------------

FileLock::FileLock(const path& p)
    : lock_path_(p)
{
}

FileLock::~FileLock()
{
    unlock();
    close_fd();
}

FileLock::FileLock(FileLock&& other) noexcept
    : lock_path_(std::move(other.lock_path_))
    , locked_(other.locked_)
    , fd_(other.fd_)
{
    other.locked_ = false;
    other.fd_ = -1;
}

FileLock& FileLock::operator=(FileLock&& other) noexcept
{
    if (this != &other) {
        unlock();
        close_fd();
        lock_path_ = std::move(other.lock_path_);
        locked_ = other.locked_;
        fd_ = other.fd_;
        other.locked_ = false;
        other.fd_ = -1;
    }
    return *this;
}

bool FileLock::try_lock()
{
    if (locked_) {
        return true;
    }

    if (fd_ < 0) {
        fd_ = ::open(lock_path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
        if (fd_ < 0) {
            return false;
        }
    }

    if (::flock(fd_, LOCK_EX | LOCK_NB) != 0) {
        return false;
    }
    locked_ = true;
    return true;
}

void FileLock::unlock()
{
    if (!locked_) {
        return;
    }
    if (fd_ >= 0) {
        ::flock(fd_, LOCK_UN);
    }
    locked_ = false;
}

void FileLock::close_fd()
{
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

} // namespace core::fs
