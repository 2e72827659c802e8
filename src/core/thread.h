#pragma once

// Copyright (c) 2024-2026 The DTL Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace core {

/// Set the name of the calling thread (pthread_setname_np, truncated to
/// 15 characters).
void set_thread_name(std::string_view name);

// ---------------------------------------------------------------------------
// ThreadGroup
// ---------------------------------------------------------------------------

/// A set of named worker threads joined together. An exception escaping a
/// worker is logged and the thread ends; it never reaches the joiner.
class ThreadGroup {
public:
    ThreadGroup() = default;
    ~ThreadGroup();

    ThreadGroup(const ThreadGroup&) = delete;
    ThreadGroup& operator=(const ThreadGroup&) = delete;

    void create_thread(std::string name, std::function<void()> func);

    /// Block until every managed thread has completed.
    void join_all();

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::vector<std::thread> threads_;
};

// ---------------------------------------------------------------------------
// TraceThread
// ---------------------------------------------------------------------------

/// Named thread with start/exit logging. The destructor joins.
class TraceThread {
public:
    TraceThread(std::string name, std::function<void()> func);
    ~TraceThread();

    TraceThread(TraceThread&& other) noexcept;
    TraceThread& operator=(TraceThread&& other) noexcept;

    TraceThread(const TraceThread&) = delete;
    TraceThread& operator=(const TraceThread&) = delete;

    void join();
    bool joinable() const noexcept;

private:
    std::string name_;
    std::thread thread_;
};

}  // namespace core
