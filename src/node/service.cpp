// Copyright (c) 2024-2026 The DTL Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "node/service.h"

#include "core/logging.h"
#include "core/signal.h"

#include <chrono>
#include <utility>

namespace node {

Service::Service(ServiceOptions options, ServiceSettings settings)
    : options_(std::move(options)), settings_(std::move(settings)) {}

Service::~Service() {
    shutdown();
}

// ---------------------------------------------------------------------------
// init
// ---------------------------------------------------------------------------

core::Result<void> Service::init() {
    if (!core::fs::ensure_directory(options_.datadir)) {
        return core::Error(core::ErrorCode::STORAGE_ERROR,
                           "cannot create data directory " +
                           options_.datadir.string());
    }

    // One writer per data directory.
    lock_ = std::make_unique<core::fs::FileLock>(options_.datadir /
                                                 LOCK_FILENAME);
    if (!lock_->try_lock()) {
        lock_.reset();
        return core::Error(core::ErrorCode::STORAGE_LOCKED,
                           "data directory " + options_.datadir.string() +
                           " is in use by another dtld process");
    }

    auto kv = store::LogKvStore::open(options_.store_path());
    if (!kv.ok()) {
        lock_.reset();
        return std::move(kv).error();
    }
    kv_ = std::move(kv).value();
    LOG_INFO(core::LogCategory::STORAGE,
             "Opened " + kv_->path().string() + " (" +
             std::to_string(kv_->record_count()) + " records)");

    db_ = std::make_unique<store::TransportDB>(*kv_);
    client_ = std::make_unique<rpc::HttpRpcClient>(
        rpc::HttpClient(settings_.endpoint, settings_.rpc_timeout_ms));
    fetcher_ = std::make_unique<ingest::RpcBlockFetcher>(
        *client_, settings_.fetch_mode);
    engine_ = std::make_unique<ingest::IngestionEngine>(
        settings_.engine, *fetcher_, decoder_, *db_, sleeper_);

    running_.store(true, std::memory_order_release);
    return core::make_ok();
}

// ---------------------------------------------------------------------------
// run
// ---------------------------------------------------------------------------

void Service::ingest_thread_main() {
    auto result = engine_->run();
    {
        std::lock_guard<std::mutex> lock(result_mutex_);
        loop_result_ = std::move(result);
    }
    // Wake the main thread whether the loop stopped or failed.
    core::request_shutdown();
}

core::Result<void> Service::run() {
    if (!running_.load(std::memory_order_acquire)) {
        return core::Error(core::ErrorCode::INTERNAL_ERROR,
                           "Service::run() called before init()");
    }

    ingest_thread_ = std::make_unique<core::TraceThread>(
        "dtl-ingest", [this] { ingest_thread_main(); });

    LOG_INFO(core::LogCategory::NONE,
             "dtld is running. Press Ctrl+C to stop.");

    while (!core::wait_for_shutdown(std::chrono::seconds(1))) {
    }

    LOG_INFO(core::LogCategory::NONE, "Shutdown requested.");
    engine_->stop();
    ingest_thread_->join();

    std::lock_guard<std::mutex> lock(result_mutex_);
    return loop_result_;
}

// ---------------------------------------------------------------------------
// shutdown
// ---------------------------------------------------------------------------

void Service::shutdown() {
    bool was_running = running_.exchange(false, std::memory_order_acq_rel);
    if (!was_running) {
        return;
    }

    LOG_INFO(core::LogCategory::NONE, "dtld shutting down...");

    if (engine_) {
        engine_->stop();
    }
    if (ingest_thread_ && ingest_thread_->joinable()) {
        ingest_thread_->join();
    }
    ingest_thread_.reset();

    // Reverse construction order.
    engine_.reset();
    fetcher_.reset();
    client_.reset();
    db_.reset();
    kv_.reset();

    if (lock_) {
        lock_->unlock();
        lock_.reset();
    }

    LOG_INFO(core::LogCategory::NONE, "Shutdown complete.");
    core::Logger::instance().flush();
}

} // namespace node
