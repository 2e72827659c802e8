// Copyright (c) 2024-2026 The DTL Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "store/flatfile.h"

#include "core/logging.h"

#include <cerrno>
#include <cstring>
#include <string>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace store {

FlatFile::FlatFile(std::filesystem::path path)
    : path_(std::move(path)) {}

FlatFile::~FlatFile() {
    close();
}

core::Error FlatFile::io_error(const std::string& what, int err) const {
    return core::Error(core::ErrorCode::STORAGE_ERROR,
                       what + " " + path_.string() + ": " +
                       std::strerror(err));
}

core::Result<void> FlatFile::open() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fd_ >= 0) {
        return core::make_ok();
    }

    if (auto parent = path_.parent_path(); !parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return core::Error(core::ErrorCode::STORAGE_ERROR,
                               "cannot create directory " + parent.string() +
                               ": " + ec.message());
        }
    }

    int fd = ::open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        return io_error("cannot open", errno);
    }

    struct stat st{};
    if (::fstat(fd, &st) != 0) {
        int err = errno;
        ::close(fd);
        return io_error("cannot stat", err);
    }

    fd_ = fd;
    size_ = static_cast<int64_t>(st.st_size);
    poisoned_ = false;
    return core::make_ok();
}

void FlatFile::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    size_ = 0;
}

bool FlatFile::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fd_ >= 0;
}

bool FlatFile::poisoned() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return poisoned_;
}

core::Result<int64_t> FlatFile::append(std::span<const uint8_t> data) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fd_ < 0) {
        return core::Error(core::ErrorCode::STORAGE_ERROR,
                           "append to closed file " + path_.string());
    }
    if (poisoned_) {
        return core::Error(core::ErrorCode::STORAGE_ERROR,
                           path_.string() + " has an unrecoverable partial "
                           "write; reopen to repair it");
    }

    const int64_t offset = size_;
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::pwrite(fd_, data.data() + written, data.size() - written,
                             static_cast<off_t>(offset) +
                                 static_cast<off_t>(written));
        if (n > 0) {
            written += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }

        int err = n < 0 ? errno : EIO;
        core::Error failure = io_error("write failed on", err);
        if (written > 0) {
            LOG_WARN(core::LogCategory::STORAGE,
                     "rolling back " + std::to_string(written) +
                     " bytes of a partial write to " + path_.string());
        }
        if (::ftruncate(fd_, static_cast<off_t>(offset)) != 0) {
            poisoned_ = true;
            LOG_ERROR(core::LogCategory::STORAGE,
                      "cannot roll back partial write: " +
                      io_error("ftruncate", errno).message());
        }
        return failure;
    }

    size_ = offset + static_cast<int64_t>(data.size());
    return offset;
}

core::Result<std::vector<uint8_t>> FlatFile::read_at(int64_t offset,
                                                     size_t length) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fd_ < 0) {
        return core::Error(core::ErrorCode::STORAGE_ERROR,
                           "read from closed file " + path_.string());
    }
    if (offset < 0 || static_cast<uint64_t>(offset) + length >
                          static_cast<uint64_t>(size_)) {
        return core::Error(core::ErrorCode::STORAGE_ERROR,
                           "read of " + std::to_string(length) +
                           " bytes at " + std::to_string(offset) +
                           " is past the end of " + path_.string() +
                           " (" + std::to_string(size_) + " bytes)");
    }

    std::vector<uint8_t> buffer(length);
    size_t done = 0;
    while (done < length) {
        ssize_t n = ::pread(fd_, buffer.data() + done, length - done,
                            static_cast<off_t>(offset) +
                                static_cast<off_t>(done));
        if (n > 0) {
            done += static_cast<size_t>(n);
        } else if (n < 0 && errno == EINTR) {
            continue;
        } else {
            return io_error("read failed on", n < 0 ? errno : EIO);
        }
    }
    return buffer;
}

core::Result<int64_t> FlatFile::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fd_ < 0) {
        return core::Error(core::ErrorCode::STORAGE_ERROR,
                           "size of closed file " + path_.string());
    }
    return size_;
}

core::Result<void> FlatFile::sync() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fd_ < 0) {
        return core::Error(core::ErrorCode::STORAGE_ERROR,
                           "sync of closed file " + path_.string());
    }
    while (::fdatasync(fd_) != 0) {
        if (errno != EINTR) {
            return io_error("fdatasync failed on", errno);
        }
    }
    return core::make_ok();
}

core::Result<void> FlatFile::truncate(int64_t new_size) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fd_ < 0) {
        return core::Error(core::ErrorCode::STORAGE_ERROR,
                           "truncate of closed file " + path_.string());
    }
    if (poisoned_) {
        return core::Error(core::ErrorCode::STORAGE_ERROR,
                           path_.string() + " has an unrecoverable partial "
                           "write; reopen to repair it");
    }
    if (new_size < 0 || new_size > size_) {
        return core::Error(core::ErrorCode::STORAGE_ERROR,
                           "cannot truncate " + path_.string() + " from " +
                           std::to_string(size_) + " to " +
                           std::to_string(new_size) + " bytes");
    }
    if (::ftruncate(fd_, static_cast<off_t>(new_size)) != 0) {
        poisoned_ = true;
        return io_error("ftruncate failed on", errno);
    }
    size_ = new_size;
    return core::make_ok();
}

} // namespace store
