// Copyright (c) 2024-2026 The DTL Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/signal.h"
#include "core/logging.h"

#include <csignal>
#include <cstdlib>
#include <cstring>
#include <unistd.h>

namespace core {

// ---------------------------------------------------------------------------
// Shutdown helpers
// ---------------------------------------------------------------------------

bool shutdown_requested() noexcept {
    return g_shutdown_requested.load(std::memory_order_acquire);
}

void request_shutdown() {
    bool expected = false;
    if (g_shutdown_requested.compare_exchange_strong(
            expected, true, std::memory_order_release,
            std::memory_order_relaxed)) {
        LOG_INFO(core::LogCategory::NONE, "Shutdown requested");
    }
    std::lock_guard<std::mutex> lock(g_shutdown_mutex);
    g_shutdown_cv.notify_all();
}

bool wait_for_shutdown(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(g_shutdown_mutex);
    return g_shutdown_cv.wait_for(lock, timeout, [] {
        return g_shutdown_requested.load(std::memory_order_acquire);
    });
}

void reset_shutdown() {
    g_shutdown_requested.store(false, std::memory_order_release);
}

// ---------------------------------------------------------------------------
// POSIX signal handlers
// ---------------------------------------------------------------------------

namespace {

void posix_signal_handler(int /*signum*/) {
    // Only async-signal-safe calls here: no logging, no locks.
    if (g_shutdown_requested.load(std::memory_order_relaxed)) {
        const char msg[] = "\nForced shutdown (second signal received)\n";
        (void)!write(STDERR_FILENO, msg, sizeof(msg) - 1);
        _exit(1);
    }
    // wait_for_shutdown() polls with a bounded timeout, so the flag alone
    // is enough to wake the main thread.
    g_shutdown_requested.store(true, std::memory_order_release);
}

} // namespace

void init_signal_handlers() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        struct sigaction sa;
        std::memset(&sa, 0, sizeof(sa));
        sa.sa_handler = posix_signal_handler;
        sigemptyset(&sa.sa_mask);
        sa.sa_flags = 0;

        for (int sig : {SIGINT, SIGTERM, SIGHUP}) {
            if (sigaction(sig, &sa, nullptr) != 0) {
                LOG_ERROR(core::LogCategory::NONE,
                          "Failed to install handler for signal " +
                          std::to_string(sig));
            }
        }
    });
}

// ---------------------------------------------------------------------------
// SignalSet
// ---------------------------------------------------------------------------

void SignalSet::notify_all() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        notified_ = true;
    }
    cv_.notify_all();
}

bool SignalSet::wait_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return notified_; });
}

bool SignalSet::is_notified() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return notified_;
}

void SignalSet::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    notified_ = false;
}

} // namespace core
