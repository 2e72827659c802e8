// Copyright (c) 2024-2026 The DTL Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "net/socket.h"
#include "core/logging.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <string>

#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <signal.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace {

/// Ignore SIGPIPE process-wide so a write to a closed peer returns EPIPE
/// instead of killing the daemon.
struct SigpipeGuard {
    SigpipeGuard() { ::signal(SIGPIPE, SIG_IGN); }
};

void ignore_sigpipe() {
    static SigpipeGuard instance;
    (void)instance;
}

std::string errno_string(int err) {
    return std::string(std::strerror(err)) + " (errno " +
           std::to_string(err) + ")";
}

bool set_nonblocking(int fd, bool enable) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return false;
    }
    flags = enable ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    return ::fcntl(fd, F_SETFL, flags) != -1;
}

/// select() on one descriptor. Returns >0 ready, 0 timeout, <0 error.
int wait_fd(int fd, bool for_write, int timeout_ms) {
    fd_set set;
    FD_ZERO(&set);
    FD_SET(fd, &set);

    struct timeval tv;
    tv.tv_sec  = std::max(timeout_ms, 0) / 1000;
    tv.tv_usec = (std::max(timeout_ms, 0) % 1000) * 1000;

    int rc;
    do {
        rc = ::select(fd + 1, for_write ? nullptr : &set,
                      for_write ? &set : nullptr, nullptr, &tv);
    } while (rc < 0 && errno == EINTR);
    return rc;
}

/// Bytes handed to a single send() call.
constexpr size_t MAX_SEND_CHUNK = 1024 * 1024;

} // namespace

namespace net {

Socket::Socket() {
    ignore_sigpipe();
}

Socket::~Socket() {
    close();
}

Socket::Socket(Socket&& other) noexcept : fd_(other.fd_) {
    other.fd_ = -1;
}

Socket& Socket::operator=(Socket&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

core::Result<void> Socket::connect(const std::string& host, uint16_t port,
                                   int timeout_ms) {
    if (host.empty() || port == 0) {
        return core::Error(core::ErrorCode::NETWORK_ERROR,
                           "connect: host and port are required");
    }

    struct addrinfo hints{};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    std::string port_str = std::to_string(port);
    struct addrinfo* result = nullptr;
    int rc = ::getaddrinfo(host.c_str(), port_str.c_str(), &hints, &result);
    if (rc != 0 || result == nullptr) {
        return core::Error(core::ErrorCode::NETWORK_ERROR,
                           "getaddrinfo failed for " + host + ":" +
                           port_str + " - " + gai_strerror(rc));
    }

    core::Error last_err(core::ErrorCode::NETWORK_ERROR,
                         "no usable address for " + host);

    for (struct addrinfo* rp = result; rp != nullptr; rp = rp->ai_next) {
        close();

        fd_ = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (fd_ < 0) {
            last_err = core::Error(core::ErrorCode::NETWORK_ERROR,
                                   "socket() failed: " + errno_string(errno));
            continue;
        }

        if (!set_nonblocking(fd_, true)) {
            last_err = core::Error(core::ErrorCode::NETWORK_ERROR,
                                   "fcntl(O_NONBLOCK) failed: " +
                                   errno_string(errno));
            continue;
        }

        rc = ::connect(fd_, rp->ai_addr, rp->ai_addrlen);
        if (rc != 0) {
            int err = errno;
            if (err != EINPROGRESS) {
                auto code = err == ECONNREFUSED
                                ? core::ErrorCode::NETWORK_REFUSED
                                : core::ErrorCode::NETWORK_ERROR;
                last_err = core::Error(code, "connect to " + host + ":" +
                                       port_str + " failed: " +
                                       errno_string(err));
                continue;
            }

            int ready = wait_fd(fd_, true, timeout_ms);
            if (ready <= 0) {
                last_err = core::Error(core::ErrorCode::NETWORK_TIMEOUT,
                                       "connect to " + host + ":" + port_str +
                                       " timed out after " +
                                       std::to_string(timeout_ms) + " ms");
                continue;
            }

            int sock_err = 0;
            socklen_t opt_len = sizeof(sock_err);
            ::getsockopt(fd_, SOL_SOCKET, SO_ERROR, &sock_err, &opt_len);
            if (sock_err != 0) {
                auto code = sock_err == ECONNREFUSED
                                ? core::ErrorCode::NETWORK_REFUSED
                                : core::ErrorCode::NETWORK_ERROR;
                last_err = core::Error(code, "connect to " + host + ":" +
                                       port_str + " failed: " +
                                       errno_string(sock_err));
                continue;
            }
        }

        set_nonblocking(fd_, false);
        ::freeaddrinfo(result);
        LOG_TRACE(core::LogCategory::RPC,
                  "connected to " + host + ":" + port_str);
        return core::make_ok();
    }

    ::freeaddrinfo(result);
    close();
    return last_err;
}

core::Result<void> Socket::send_all(std::span<const uint8_t> data) {
    if (!is_open()) {
        return core::Error(core::ErrorCode::NETWORK_CLOSED,
                           "send on closed socket");
    }

    size_t sent = 0;
    while (sent < data.size()) {
        size_t chunk = std::min(data.size() - sent, MAX_SEND_CHUNK);
        ssize_t rc = ::send(fd_, data.data() + sent, chunk, MSG_NOSIGNAL);
        if (rc < 0) {
            int err = errno;
            if (err == EINTR) {
                continue;
            }
            if (err == EPIPE || err == ECONNRESET) {
                return core::Error(core::ErrorCode::NETWORK_CLOSED,
                                   "connection reset by peer on send");
            }
            return core::Error(core::ErrorCode::NETWORK_ERROR,
                               "send() failed: " + errno_string(err));
        }
        sent += static_cast<size_t>(rc);
    }
    return core::make_ok();
}

core::Result<size_t> Socket::recv(std::span<uint8_t> buf, int timeout_ms) {
    if (!is_open()) {
        return core::Error(core::ErrorCode::NETWORK_CLOSED,
                           "recv on closed socket");
    }
    if (buf.empty()) {
        return size_t{0};
    }

    int ready = wait_fd(fd_, false, timeout_ms);
    if (ready == 0) {
        return core::Error(core::ErrorCode::NETWORK_TIMEOUT,
                           "no data within " + std::to_string(timeout_ms) +
                           " ms");
    }
    if (ready < 0) {
        return core::Error(core::ErrorCode::NETWORK_ERROR,
                           "select() failed: " + errno_string(errno));
    }

    ssize_t rc;
    do {
        rc = ::recv(fd_, buf.data(), buf.size(), 0);
    } while (rc < 0 && errno == EINTR);

    if (rc < 0) {
        int err = errno;
        if (err == ECONNRESET) {
            return core::Error(core::ErrorCode::NETWORK_CLOSED,
                               "connection reset by peer on recv");
        }
        return core::Error(core::ErrorCode::NETWORK_ERROR,
                           "recv() failed: " + errno_string(err));
    }
    return static_cast<size_t>(rc);
}

void Socket::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

} // namespace net
