// Copyright (c) 2024-2026 The DTL Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/thread.h"
#include "core/logging.h"

#include <exception>
#include <utility>

#include <pthread.h>

namespace core {

namespace {

/// Runs @p func, logging anything it throws instead of terminating.
void run_guarded(const std::string& name, const std::function<void()>& func)
{
    try {
        func();
    } catch (const std::exception& e) {
        LOG_ERROR(core::LogCategory::NONE,
                  "exception in thread '" + name + "': " + e.what());
    } catch (...) {
        LOG_ERROR(core::LogCategory::NONE,
                  "unknown exception in thread '" + name + "'");
    }
}

}  // namespace

void set_thread_name(std::string_view name)
{
    constexpr size_t MAX_PTHREAD_NAME = 15;
    std::string truncated{name.substr(0, MAX_PTHREAD_NAME)};
    pthread_setname_np(pthread_self(), truncated.c_str());
}

// ---------------------------------------------------------------------------
// ThreadGroup
// ---------------------------------------------------------------------------

ThreadGroup::~ThreadGroup()
{
    join_all();
}

void ThreadGroup::create_thread(std::string name, std::function<void()> func)
{
    std::lock_guard<std::mutex> guard(mutex_);
    threads_.emplace_back(
        [n = std::move(name), f = std::move(func)]() {
            set_thread_name(n);
            run_guarded(n, f);
        });
}

void ThreadGroup::join_all()
{
    std::vector<std::thread> local;
    {
        std::lock_guard<std::mutex> guard(mutex_);
        local.swap(threads_);
    }
    for (auto& t : local) {
        if (t.joinable()) {
            t.join();
        }
    }
}

size_t ThreadGroup::size() const
{
    std::lock_guard<std::mutex> guard(mutex_);
    return threads_.size();
}

// ---------------------------------------------------------------------------
// TraceThread
// ---------------------------------------------------------------------------

TraceThread::TraceThread(std::string name, std::function<void()> func)
    : name_(std::move(name))
{
    thread_ = std::thread(
        [n = name_, f = std::move(func)]() {
            set_thread_name(n);
            LOG_DEBUG(core::LogCategory::NONE, "thread '" + n + "' started");
            run_guarded(n, f);
            LOG_DEBUG(core::LogCategory::NONE, "thread '" + n + "' exiting");
        });
}

TraceThread::~TraceThread()
{
    join();
}

TraceThread::TraceThread(TraceThread&& other) noexcept
    : name_(std::move(other.name_))
    , thread_(std::move(other.thread_))
{
}

TraceThread& TraceThread::operator=(TraceThread&& other) noexcept
{
    if (this != &other) {
        join();
        name_ = std::move(other.name_);
        thread_ = std::move(other.thread_);
    }
    return *this;
}

void TraceThread::join()
{
    if (thread_.joinable()) {
        thread_.join();
    }
}

bool TraceThread::joinable() const noexcept
{
    return thread_.joinable();
}

}  // namespace core
