#pragma once
// Copyright (c) 2024-2026 The DTL Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace core {

// ---------------------------------------------------------------------------
// Process-wide shutdown signalling
// ---------------------------------------------------------------------------

/// Set by SIGINT / SIGTERM / SIGHUP and by request_shutdown().
inline std::atomic<bool> g_shutdown_requested{false};

inline std::condition_variable g_shutdown_cv;
inline std::mutex g_shutdown_mutex;

/// Install handlers for SIGINT, SIGTERM and SIGHUP. A second signal while
/// a shutdown is already pending exits the process immediately. Safe to
/// call more than once.
void init_signal_handlers();

[[nodiscard]] bool shutdown_requested() noexcept;

/// Raise the shutdown flag and wake wait_for_shutdown() callers.
void request_shutdown();

/// Block until shutdown is requested or @p timeout expires.
/// @return true if shutdown was requested.
bool wait_for_shutdown(std::chrono::milliseconds timeout);

/// Clear the shutdown flag. Tests only.
void reset_shutdown();

// ---------------------------------------------------------------------------
// SignalSet  --  latching event used as a cancellation token
// ---------------------------------------------------------------------------
// Once notified it stays notified until reset(), so a waiter that arrives
// after notify_all() returns immediately.
class SignalSet {
public:
    SignalSet() = default;

    SignalSet(const SignalSet&) = delete;
    SignalSet& operator=(const SignalSet&) = delete;

    void notify_all();

    /// Block until notified or @p timeout expires.
    /// @return true if notified, false on timeout.
    bool wait_for(std::chrono::milliseconds timeout);

    [[nodiscard]] bool is_notified() const;

    void reset();

private:
    mutable std::mutex      mutex_;
    std::condition_variable cv_;
    bool                    notified_{false};
};

} // namespace core
