#pragma once
// Copyright (c) 2024-2026 The DTL Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// Socket -- blocking POSIX TCP client socket with millisecond timeouts.
//
// RAII ownership of one descriptor, move-only. Every I/O method returns
// core::Result with a NETWORK_* code on failure.
// ---------------------------------------------------------------------------

#include "core/error.h"

#include <cstdint>
#include <span>
#include <string>

namespace net {

class Socket {
public:
    Socket();
    ~Socket();

    Socket(Socket&& other) noexcept;
    Socket& operator=(Socket&& other) noexcept;
    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    /// Resolve @p host and connect, trying each address in turn. Uses a
    /// non-blocking connect + select so the attempt is bounded by
    /// @p timeout_ms. Refusals map to NETWORK_REFUSED, expiry to
    /// NETWORK_TIMEOUT.
    core::Result<void> connect(const std::string& host, uint16_t port,
                               int timeout_ms);

    /// Send every byte of @p data or fail.
    core::Result<void> send_all(std::span<const uint8_t> data);

    /// Wait up to @p timeout_ms for data and read what is available.
    /// Returns 0 on orderly shutdown by the peer; NETWORK_TIMEOUT if
    /// nothing arrived in time.
    core::Result<size_t> recv(std::span<uint8_t> buf, int timeout_ms);

    /// Safe to call multiple times.
    void close();

    [[nodiscard]] bool is_open() const { return fd_ >= 0; }

private:
    int fd_ = -1;
};

} // namespace net
