#pragma once
// Copyright (c) 2024-2026 The DTL Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "core/signal.h"
#include "ingest/block_fetcher.h"
#include "ingest/decoder.h"
#include "store/transport_db.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string_view>

namespace ingest {

// ---------------------------------------------------------------------------
// Error policy
// ---------------------------------------------------------------------------

enum class ErrorPolicy {
    FAIL_FAST,          // the first failure terminates run()
    CATCH_AND_BACKOFF,  // log, sleep one polling interval, retry
};

enum class ErrorAction { PROPAGATE, BACKOFF };

/// A failure is absorbed when the policy says so or when the engine is
/// already stopping; otherwise it propagates out of run().
[[nodiscard]] ErrorAction resolve_error(ErrorPolicy policy,
                                        bool stop_requested) noexcept;

[[nodiscard]] std::string_view error_policy_name(ErrorPolicy policy) noexcept;

// ---------------------------------------------------------------------------
// Sync window
// ---------------------------------------------------------------------------

/// Cursor value assumed when nothing has been synced yet. Block 0 is
/// reserved, so the first window starts at block 2.
inline constexpr uint64_t DEFAULT_HIGHEST_SYNCED = 1;

struct SyncWindow {
    uint64_t highest = 0;  // last committed block
    uint64_t head = 0;     // chain height - 1, floored at 0
    uint64_t target = 0;   // min(highest + batch, head)

    [[nodiscard]] bool at_head() const { return highest == target; }
    [[nodiscard]] bool invalid() const { return highest > target; }
};

[[nodiscard]] SyncWindow compute_window(uint64_t highest, uint64_t height,
                                        uint64_t batch_size);

/// Validated engine settings, fixed for the engine's lifetime.
struct EngineParams {
    uint64_t                  chain_id = 0;
    uint64_t                  batch_size = 1000;
    std::chrono::milliseconds polling_interval{5000};
    ErrorPolicy               policy = ErrorPolicy::FAIL_FAST;
};

// ---------------------------------------------------------------------------
// Sleeper -- the loop's only blocking wait
// ---------------------------------------------------------------------------
class Sleeper {
public:
    virtual ~Sleeper() = default;

    virtual void sleep(std::chrono::milliseconds duration) = 0;

    /// Wakes a pending sleep() and makes later ones return immediately.
    virtual void interrupt() = 0;
};

/// Sleeper backed by a latching core::SignalSet.
class SignalSleeper final : public Sleeper {
public:
    void sleep(std::chrono::milliseconds duration) override;
    void interrupt() override;

private:
    core::SignalSet signal_;
};

enum class IterationOutcome {
    AT_HEAD,           // nothing new, slept
    INVALID_WINDOW,    // cursor ahead of the chain, skipped and slept
    SYNCED_CAUGHT_UP,  // committed a window near the head, slept
    SYNCED_BEHIND,     // committed a full window, no pause
};

[[nodiscard]] std::string_view iteration_outcome_name(
    IterationOutcome outcome) noexcept;

// ---------------------------------------------------------------------------
// IngestionEngine -- the unconfirmed-block polling loop
// ---------------------------------------------------------------------------
// One iteration: read the cursor, size the window against the chain head,
// fetch (highest, target], decode and commit each block in ascending order,
// advance the cursor to target, then pace. The cursor moves once per
// window, so a crash mid-window replays the window on restart; commits are
// idempotent overwrites.
//
// stop() may be called from any thread. It is observed at the top of each
// iteration and in the error handler, and it cuts any pending sleep short.
// ---------------------------------------------------------------------------
class IngestionEngine {
public:
    IngestionEngine(EngineParams params, BlockFetcher& fetcher,
                    BlockDecoder& decoder, store::TransportDB& db,
                    Sleeper& sleeper);

    IngestionEngine(const IngestionEngine&) = delete;
    IngestionEngine& operator=(const IngestionEngine&) = delete;

    /// Runs one iteration. Errors are returned as-is, without the policy.
    core::Result<IterationOutcome> run_once();

    /// Loops until stop(). Returns the error that ended the loop under
    /// FAIL_FAST, or success after a stop.
    core::Result<void> run();

    void stop();

    [[nodiscard]] bool stop_requested() const noexcept {
        return stop_requested_.load(std::memory_order_acquire);
    }

    [[nodiscard]] const EngineParams& params() const { return params_; }

    [[nodiscard]] uint64_t blocks_committed() const noexcept {
        return blocks_committed_.load(std::memory_order_relaxed);
    }

private:
    core::Result<uint64_t> read_cursor() const;
    core::Result<void> commit_window(const SyncWindow& window);

    EngineParams        params_;
    BlockFetcher&       fetcher_;
    BlockDecoder&       decoder_;
    store::TransportDB& db_;
    Sleeper&            sleeper_;

    std::atomic<bool>     stop_requested_{false};
    std::atomic<uint64_t> blocks_committed_{0};
};

} // namespace ingest
