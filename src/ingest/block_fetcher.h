#pragma once
// Copyright (c) 2024-2026 The DTL Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "rpc/client.h"
#include "rpc/json.h"

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace ingest {

/// A block as returned by the endpoint, with its number already extracted.
struct RawBlock {
    uint64_t       number = 0;
    rpc::JsonValue json;
};

// ---------------------------------------------------------------------------
// BlockFetcher -- read side of the ingestion loop
// ---------------------------------------------------------------------------
class BlockFetcher {
public:
    virtual ~BlockFetcher() = default;

    /// Current chain height reported by the endpoint.
    virtual core::Result<uint64_t> current_height() = 0;

    /// Blocks start..end inclusive, ascending by number. start > end
    /// yields an empty list.
    virtual core::Result<std::vector<RawBlock>> fetch_range(uint64_t start,
                                                            uint64_t end) = 0;
};

enum class FetchMode {
    BULK,           // one eth_getBlockRange call
    COMPATIBILITY,  // parallel eth_getBlockByNumber calls
};

[[nodiscard]] std::string_view fetch_mode_name(FetchMode mode) noexcept;

/// Reads the "number" quantity of a block object.
core::Result<uint64_t> block_number(const rpc::JsonValue& block);

/// Stable sort by block number. The one place fetched blocks are ordered.
void sort_by_block_number(std::vector<RawBlock>& blocks);

// ---------------------------------------------------------------------------
// RpcBlockFetcher -- BlockFetcher over a JSON-RPC endpoint
// ---------------------------------------------------------------------------
// In COMPATIBILITY mode the per-block requests are spread over at most
// max_parallel worker threads; all of them finish before the results are
// sorted and returned, so no partial range ever escapes.
// ---------------------------------------------------------------------------
class RpcBlockFetcher final : public BlockFetcher {
public:
    static constexpr size_t DEFAULT_MAX_PARALLEL = 16;

    RpcBlockFetcher(rpc::RpcClient& client, FetchMode mode,
                    size_t max_parallel = DEFAULT_MAX_PARALLEL);

    core::Result<uint64_t> current_height() override;
    core::Result<std::vector<RawBlock>> fetch_range(uint64_t start,
                                                    uint64_t end) override;

    [[nodiscard]] FetchMode mode() const { return mode_; }

private:
    core::Result<std::vector<RawBlock>> fetch_bulk(uint64_t start,
                                                   uint64_t end);
    core::Result<std::vector<RawBlock>> fetch_each(uint64_t start,
                                                   uint64_t end);

    rpc::RpcClient& client_;
    FetchMode       mode_;
    size_t          max_parallel_;
};

} // namespace ingest
