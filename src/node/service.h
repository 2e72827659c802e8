#pragma once
// Copyright (c) 2024-2026 The DTL Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// Service -- top-level orchestrator for dtld.
//
// Owns every subsystem and coordinates their lifecycle:
//
//   1. Construction:  Stores the validated options.  Nothing is opened.
//   2. init():        Locks the data directory, opens the record log and
//                     builds the RPC client, fetcher, decoder and engine.
//   3. run():         Starts the ingestion loop on the "dtl-ingest" thread
//                     and blocks until a shutdown signal or until the loop
//                     ends on its own (fail-fast error).
//   4. shutdown():    Stops the loop, joins the thread and releases the
//                     store and the directory lock.
//
// init(), run() and shutdown() must be called from the same thread.
// ---------------------------------------------------------------------------

#ifndef DTL_NODE_SERVICE_H
#define DTL_NODE_SERVICE_H

#include "core/error.h"
#include "core/fs.h"
#include "core/thread.h"
#include "ingest/block_fetcher.h"
#include "ingest/decoder.h"
#include "ingest/ingestion.h"
#include "node/options.h"
#include "rpc/client.h"
#include "store/log_kv.h"
#include "store/transport_db.h"

#include <atomic>
#include <memory>
#include <mutex>

namespace node {

/// Name of the advisory lock file inside the data directory.
inline constexpr const char* LOCK_FILENAME = ".lock";

class Service {
public:
    Service(ServiceOptions options, ServiceSettings settings);

    /// Calls shutdown() if the service is still running.
    ~Service();

    Service(const Service&) = delete;
    Service& operator=(const Service&) = delete;

    /// STORAGE_LOCKED if another process holds the data directory; any
    /// error from opening the record log is returned as-is.
    [[nodiscard]] core::Result<void> init();

    /// Returns the error that stopped the ingestion loop, or success when
    /// the loop was stopped by a shutdown request.
    [[nodiscard]] core::Result<void> run();

    /// Safe to call more than once.
    void shutdown();

    [[nodiscard]] bool is_running() const noexcept {
        return running_.load(std::memory_order_acquire);
    }

    [[nodiscard]] const ServiceOptions& options() const noexcept {
        return options_;
    }

    [[nodiscard]] const ServiceSettings& settings() const noexcept {
        return settings_;
    }

private:
    void ingest_thread_main();

    ServiceOptions  options_;
    ServiceSettings settings_;

    std::unique_ptr<core::fs::FileLock>      lock_;
    std::unique_ptr<store::LogKvStore>       kv_;
    std::unique_ptr<store::TransportDB>      db_;
    std::unique_ptr<rpc::HttpRpcClient>      client_;
    std::unique_ptr<ingest::RpcBlockFetcher> fetcher_;
    ingest::SequencerBlockHandler            decoder_;
    ingest::SignalSleeper                    sleeper_;
    std::unique_ptr<ingest::IngestionEngine> engine_;
    std::unique_ptr<core::TraceThread>       ingest_thread_;

    std::mutex         result_mutex_;
    core::Result<void> loop_result_;

    std::atomic<bool> running_{false};
};

} // namespace node

#endif // DTL_NODE_SERVICE_H
