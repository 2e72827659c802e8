// Copyright (c) 2024-2026 The DTL Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "ingest/block_fetcher.h"

#include "core/hex.h"
#include "core/logging.h"
#include "core/thread.h"

#include <algorithm>
#include <atomic>
#include <mutex>
#include <optional>
#include <utility>

namespace ingest {

namespace {

core::Error invalid(const std::string& what) {
    return core::Error(core::ErrorCode::RPC_INVALID_RESPONSE, what);
}

core::Result<uint64_t> read_quantity(const rpc::JsonValue& v,
                                     const std::string& what) {
    if (!v.is_string()) {
        return invalid(what + " is not a hex quantity");
    }
    auto q = core::parse_quantity(v.get_string());
    if (!q.ok()) {
        return invalid(what + ": " + q.error().message());
    }
    return q.value();
}

core::Result<RawBlock> to_raw_block(rpc::JsonValue json) {
    if (!json.is_object()) {
        return invalid("block is not an object");
    }
    DTL_TRY_ASSIGN(number, block_number(json));
    return RawBlock{number, std::move(json)};
}

} // namespace

std::string_view fetch_mode_name(FetchMode mode) noexcept {
    return mode == FetchMode::COMPATIBILITY ? "compatibility" : "bulk";
}

core::Result<uint64_t> block_number(const rpc::JsonValue& block) {
    return read_quantity(block["number"], "block number");
}

void sort_by_block_number(std::vector<RawBlock>& blocks) {
    std::stable_sort(blocks.begin(), blocks.end(),
                     [](const RawBlock& a, const RawBlock& b) {
                         return a.number < b.number;
                     });
}

// ---------------------------------------------------------------------------
// RpcBlockFetcher
// ---------------------------------------------------------------------------

RpcBlockFetcher::RpcBlockFetcher(rpc::RpcClient& client, FetchMode mode,
                                 size_t max_parallel)
    : client_(client), mode_(mode),
      max_parallel_(std::max<size_t>(max_parallel, 1)) {}

core::Result<uint64_t> RpcBlockFetcher::current_height() {
    DTL_TRY_ASSIGN(result,
                   client_.call("eth_blockNumber",
                                rpc::JsonValue(rpc::JsonValue::Array{})));
    return read_quantity(result, "eth_blockNumber result");
}

core::Result<std::vector<RawBlock>> RpcBlockFetcher::fetch_range(uint64_t start,
                                                                 uint64_t end) {
    if (start > end) {
        return std::vector<RawBlock>{};
    }
    LOG_DEBUG(core::LogCategory::RPC,
              "fetching blocks " + std::to_string(start) + ".." +
              std::to_string(end) + " (" +
              std::string(fetch_mode_name(mode_)) + ")");
    return mode_ == FetchMode::BULK ? fetch_bulk(start, end)
                                    : fetch_each(start, end);
}

core::Result<std::vector<RawBlock>> RpcBlockFetcher::fetch_bulk(uint64_t start,
                                                                uint64_t end) {
    rpc::JsonValue params(rpc::JsonValue::Array{
        core::to_quantity(start), core::to_quantity(end), true});
    DTL_TRY_ASSIGN(result, client_.call("eth_getBlockRange", params));
    if (!result.is_array()) {
        return invalid("eth_getBlockRange result is not an array");
    }

    std::vector<RawBlock> blocks;
    blocks.reserve(result.size());
    for (auto& item : result.get_array()) {
        DTL_TRY_ASSIGN(block, to_raw_block(std::move(item)));
        blocks.push_back(std::move(block));
    }
    return blocks;
}

core::Result<std::vector<RawBlock>> RpcBlockFetcher::fetch_each(uint64_t start,
                                                                uint64_t end) {
    const uint64_t count = end - start + 1;
    std::vector<std::optional<RawBlock>> slots(count);
    std::atomic<uint64_t> next{0};
    std::atomic<bool> failed{false};
    std::mutex error_mutex;
    std::optional<core::Error> first_error;

    auto worker = [&]() {
        while (!failed.load(std::memory_order_relaxed)) {
            uint64_t i = next.fetch_add(1, std::memory_order_relaxed);
            if (i >= count) {
                return;
            }
            uint64_t number = start + i;
            rpc::JsonValue params(rpc::JsonValue::Array{
                core::to_quantity(number), true});
            auto result = client_.call("eth_getBlockByNumber", params);

            core::Result<RawBlock> block = core::Error(
                core::ErrorCode::RPC_INVALID_RESPONSE,
                "block " + std::to_string(number) + " not found");
            if (!result.ok()) {
                block = std::move(result).error();
            } else if (!result.value().is_null()) {
                block = to_raw_block(std::move(result).value());
            }

            if (!block.ok()) {
                std::lock_guard<std::mutex> lock(error_mutex);
                if (!first_error) {
                    first_error = std::move(block).error();
                }
                failed.store(true, std::memory_order_relaxed);
                return;
            }
            slots[i] = std::move(block).value();
        }
    };

    {
        core::ThreadGroup group;
        size_t workers = static_cast<size_t>(
            std::min<uint64_t>(count, max_parallel_));
        for (size_t w = 0; w < workers; ++w) {
            group.create_thread("dtl-fetch." + std::to_string(w), worker);
        }
        group.join_all();
    }

    if (first_error) {
        return *first_error;
    }

    std::vector<RawBlock> blocks;
    blocks.reserve(count);
    for (auto& slot : slots) {
        if (!slot) {
            return core::Error(core::ErrorCode::INTERNAL_ERROR,
                               "block fetch worker exited without a result");
        }
        blocks.push_back(std::move(*slot));
    }
    sort_by_block_number(blocks);
    return blocks;
}

} // namespace ingest
