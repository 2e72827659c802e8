// Copyright (c) 2024-2026 The DTL Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "ingest/ingestion.h"

#include "core/logging.h"

#include <algorithm>
#include <cstdint>
#include <string>

namespace ingest {

ErrorAction resolve_error(ErrorPolicy policy, bool stop_requested) noexcept {
    if (stop_requested || policy == ErrorPolicy::CATCH_AND_BACKOFF) {
        return ErrorAction::BACKOFF;
    }
    return ErrorAction::PROPAGATE;
}

std::string_view error_policy_name(ErrorPolicy policy) noexcept {
    return policy == ErrorPolicy::CATCH_AND_BACKOFF ? "catch-and-backoff"
                                                    : "fail-fast";
}

SyncWindow compute_window(uint64_t highest, uint64_t height,
                          uint64_t batch_size) {
    SyncWindow w;
    w.highest = highest;
    w.head = height > 0 ? height - 1 : 0;
    uint64_t reach = highest > UINT64_MAX - batch_size ? UINT64_MAX
                                                       : highest + batch_size;
    w.target = std::min(reach, w.head);
    return w;
}

std::string_view iteration_outcome_name(IterationOutcome outcome) noexcept {
    switch (outcome) {
        case IterationOutcome::AT_HEAD:          return "at-head";
        case IterationOutcome::INVALID_WINDOW:   return "invalid-window";
        case IterationOutcome::SYNCED_CAUGHT_UP: return "synced-caught-up";
        case IterationOutcome::SYNCED_BEHIND:    return "synced-behind";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// SignalSleeper
// ---------------------------------------------------------------------------

void SignalSleeper::sleep(std::chrono::milliseconds duration) {
    signal_.wait_for(duration);
}

void SignalSleeper::interrupt() {
    signal_.notify_all();
}

// ---------------------------------------------------------------------------
// IngestionEngine
// ---------------------------------------------------------------------------

IngestionEngine::IngestionEngine(EngineParams params, BlockFetcher& fetcher,
                                 BlockDecoder& decoder, store::TransportDB& db,
                                 Sleeper& sleeper)
    : params_(params), fetcher_(fetcher), decoder_(decoder), db_(db),
      sleeper_(sleeper) {}

core::Result<uint64_t> IngestionEngine::read_cursor() const {
    auto cursor = db_.get_highest_synced_unconfirmed_block();
    if (!cursor.ok() && cursor.error().is(core::ErrorCode::STORAGE_NOT_FOUND)) {
        return DEFAULT_HIGHEST_SYNCED;
    }
    return cursor;
}

core::Result<void> IngestionEngine::commit_window(const SyncWindow& window) {
    DTL_TRY_ASSIGN(blocks, fetcher_.fetch_range(window.highest + 1,
                                                window.target));
    for (const auto& block : blocks) {
        DTL_TRY_ASSIGN(entry, decoder_.parse_block(block, params_.chain_id));
        DTL_TRY_VOID(decoder_.store_block(entry, db_));
        blocks_committed_.fetch_add(1, std::memory_order_relaxed);
    }
    DTL_TRY_VOID(db_.set_highest_synced_unconfirmed_block(window.target));
    return core::make_ok();
}

core::Result<IterationOutcome> IngestionEngine::run_once() {
    DTL_TRY_ASSIGN(highest, read_cursor());
    DTL_TRY_ASSIGN(height, fetcher_.current_height());
    SyncWindow window = compute_window(highest, height, params_.batch_size);

    if (window.at_head()) {
        LOG_TRACE(core::LogCategory::SYNC,
                  "at head " + std::to_string(window.head) + ", waiting");
        sleeper_.sleep(params_.polling_interval);
        return IterationOutcome::AT_HEAD;
    }

    if (window.invalid()) {
        LOG_INFO(core::LogCategory::SYNC,
                 "cannot sync: highest synced block " +
                 std::to_string(window.highest) +
                 " is ahead of target block " + std::to_string(window.target));
        sleeper_.sleep(params_.polling_interval);
        return IterationOutcome::INVALID_WINDOW;
    }

    LOG_INFO(core::LogCategory::SYNC,
             "synchronizing unconfirmed transactions from block " +
             std::to_string(window.highest) + " to block " +
             std::to_string(window.target));
    DTL_TRY_VOID(commit_window(window));

    if (window.head - window.highest < params_.batch_size) {
        sleeper_.sleep(params_.polling_interval);
        return IterationOutcome::SYNCED_CAUGHT_UP;
    }
    return IterationOutcome::SYNCED_BEHIND;
}

core::Result<void> IngestionEngine::run() {
    LOG_INFO(core::LogCategory::SYNC,
             "ingestion started (batch " + std::to_string(params_.batch_size) +
             ", interval " + std::to_string(params_.polling_interval.count()) +
             " ms, " + std::string(error_policy_name(params_.policy)) + ")");

    while (!stop_requested()) {
        auto outcome = run_once();
        if (outcome.ok()) {
            continue;
        }

        const core::Error& err = outcome.error();
        if (resolve_error(params_.policy, stop_requested()) ==
            ErrorAction::PROPAGATE) {
            LOG_ERROR(core::LogCategory::SYNC,
                      "ingestion stopped: " + err.format());
            return err;
        }
        LOG_ERROR(core::LogCategory::SYNC,
                  "caught an unhandled error: " + err.format());
        sleeper_.sleep(params_.polling_interval);
    }

    LOG_INFO(core::LogCategory::SYNC,
             "ingestion stopped after " + std::to_string(blocks_committed()) +
             " blocks");
    return core::make_ok();
}

void IngestionEngine::stop() {
    stop_requested_.store(true, std::memory_order_release);
    sleeper_.interrupt();
}

} // namespace ingest
