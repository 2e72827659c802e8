// Copyright (c) 2024-2026 The DTL Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// Unit tests for the ingestion pipeline: block fetching over a scripted
// JSON-RPC client, block decoding, and the polling engine.

#include "test_framework.h"

#include "core/error.h"
#include "core/hex.h"
#include "core/thread.h"
#include "ingest/block_fetcher.h"
#include "ingest/decoder.h"
#include "ingest/ingestion.h"
#include "rpc/client.h"
#include "rpc/json.h"
#include "store/memory_kv.h"
#include "store/records.h"
#include "store/transport_db.h"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace {

using namespace std::chrono_literals;

using Range = std::pair<uint64_t, uint64_t>;

constexpr uint64_t CHAIN_ID = 420;
constexpr const char* SOME_ADDRESS = "0x4200000000000000000000000000000000000005";
constexpr const char* L1_SENDER = "0x6fd7d2e1bbad2fe9b4d2c2c6e3d8f4b9d1e0a7c3";

std::string root_for(uint64_t n) {
    std::string digits = core::to_quantity(n).substr(2);
    return "0x" + std::string(64 - digits.size(), 'a') + digits;
}

rpc::JsonValue sequencer_tx(uint64_t n) {
    rpc::JsonValue tx(rpc::JsonValue::Object{});
    tx["blockNumber"] = core::to_quantity(n);
    tx["queueOrigin"] = "sequencer";
    tx["l1BlockNumber"] = "0x10";
    tx["l1Timestamp"] = "0x5f5e100";
    tx["gas"] = "0x5208";
    tx["gasPrice"] = "0x3b9aca00";
    tx["nonce"] = core::to_quantity(n);
    tx["to"] = SOME_ADDRESS;
    tx["input"] = "0xabcd";
    tx["rawTransaction"] = "0xf86b80";
    tx["v"] = core::to_quantity(CHAIN_ID * 2 + 35);
    tx["r"] = "0x1";
    tx["s"] = "0xAB";
    return tx;
}

rpc::JsonValue block_with(uint64_t n, rpc::JsonValue tx) {
    rpc::JsonValue block(rpc::JsonValue::Object{});
    block["number"] = core::to_quantity(n);
    block["stateRoot"] = root_for(n);
    block["transactions"] = rpc::JsonValue(rpc::JsonValue::Array{std::move(tx)});
    return block;
}

rpc::JsonValue sequencer_block(uint64_t n) {
    return block_with(n, sequencer_tx(n));
}

ingest::RawBlock raw_block(uint64_t n, rpc::JsonValue json) {
    return ingest::RawBlock{n, std::move(json)};
}

uint64_t quantity_param(const rpc::JsonValue& params, size_t i) {
    return core::parse_quantity(params.get_array().at(i).get_string())
        .value_or(0);
}

// ---------------------------------------------------------------------------
// ScriptedRpcClient -- answers the three sequencer methods from memory
// ---------------------------------------------------------------------------
class ScriptedRpcClient final : public rpc::RpcClient {
public:
    uint64_t           height = 0;
    std::set<uint64_t> missing;       // eth_getBlockByNumber returns null
    std::set<uint64_t> failing;       // eth_getBlockByNumber returns an error
    uint64_t           slow_block = 0;
    std::chrono::milliseconds delay{0};
    std::map<std::string, rpc::JsonValue> overrides;

    core::Result<rpc::JsonValue> call(const std::string& method,
                                      const rpc::JsonValue& params) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            calls_.push_back(method + rpc::json_serialize(params));
            ++in_flight_;
            max_in_flight_ = std::max(max_in_flight_, in_flight_);
        }
        auto result = answer(method, params);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            --in_flight_;
        }
        return result;
    }

    std::vector<std::string> calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    int max_in_flight() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return max_in_flight_;
    }

private:
    core::Result<rpc::JsonValue> answer(const std::string& method,
                                        const rpc::JsonValue& params) {
        if (auto it = overrides.find(method); it != overrides.end()) {
            return it->second;
        }
        if (method == "eth_blockNumber") {
            return rpc::JsonValue(core::to_quantity(height));
        }
        if (method == "eth_getBlockByNumber") {
            uint64_t n = quantity_param(params, 0);
            if (n == slow_block) {
                std::this_thread::sleep_for(50ms);
            }
            if (delay.count() > 0) {
                std::this_thread::sleep_for(delay);
            }
            if (failing.count(n)) {
                return core::Error(core::ErrorCode::RPC_REMOTE_ERROR,
                                   "header not found");
            }
            if (missing.count(n)) {
                return rpc::JsonValue();
            }
            return sequencer_block(n);
        }
        if (method == "eth_getBlockRange") {
            rpc::JsonValue out(rpc::JsonValue::Array{});
            for (uint64_t n = quantity_param(params, 0);
                 n <= quantity_param(params, 1); ++n) {
                out.push_back(sequencer_block(n));
            }
            return out;
        }
        return core::Error(core::ErrorCode::RPC_REMOTE_ERROR,
                           "the method " + method + " does not exist");
    }

    mutable std::mutex       mutex_;
    std::vector<std::string> calls_;
    int                      in_flight_ = 0;
    int                      max_in_flight_ = 0;
};

// ---------------------------------------------------------------------------
// ScriptedFetcher -- BlockFetcher with a settable head
// ---------------------------------------------------------------------------
class ScriptedFetcher final : public ingest::BlockFetcher {
public:
    uint64_t height = 0;
    int      height_failures = 0;
    std::vector<std::pair<uint64_t, uint64_t>> fetches;

    core::Result<uint64_t> current_height() override {
        if (height_failures > 0) {
            --height_failures;
            return core::Error(core::ErrorCode::NETWORK_REFUSED,
                               "connection refused");
        }
        return height;
    }

    core::Result<std::vector<ingest::RawBlock>> fetch_range(
        uint64_t start, uint64_t end) override {
        fetches.emplace_back(start, end);
        std::vector<ingest::RawBlock> out;
        for (uint64_t n = start; n <= end; ++n) {
            out.push_back(raw_block(n, sequencer_block(n)));
        }
        return out;
    }
};

/// Decoder that rejects one block number until told otherwise.
class FailingDecoder final : public ingest::BlockDecoder {
public:
    uint64_t fail_at = 0;

    core::Result<ingest::SequencerEntry> parse_block(
        const ingest::RawBlock& block, uint64_t chain_id) override {
        if (block.number == fail_at) {
            return core::Error(core::ErrorCode::DECODE_ERROR,
                               "scripted failure");
        }
        return inner_.parse_block(block, chain_id);
    }

    core::Result<void> store_block(const ingest::SequencerEntry& entry,
                                   store::TransportDB& db) override {
        return inner_.store_block(entry, db);
    }

private:
    ingest::SequencerBlockHandler inner_;
};

/// In-memory store whose writes can be made to fail.
class FailingKvStore final : public store::KvStore {
public:
    bool fail_writes = false;
    int  rejected = 0;

    core::Result<std::string> get(std::string_view key) const override {
        return inner_.get(key);
    }

    core::Result<void> write_batch(const store::KvBatch& batch) override {
        if (fail_writes) {
            ++rejected;
            return core::Error(core::ErrorCode::STORAGE_ERROR,
                               "disk full");
        }
        return inner_.write_batch(batch);
    }

    core::Result<std::vector<std::string>> scan(
        std::string_view gte, std::string_view lt) const override {
        return inner_.scan(gte, lt);
    }

private:
    store::MemoryKvStore inner_;
};

class RecordingSleeper final : public ingest::Sleeper {
public:
    std::vector<std::chrono::milliseconds> sleeps;
    std::function<void()> on_sleep;
    bool interrupted = false;

    void sleep(std::chrono::milliseconds duration) override {
        sleeps.push_back(duration);
        if (on_sleep) on_sleep();
    }

    void interrupt() override { interrupted = true; }
};

ingest::EngineParams make_params(uint64_t batch,
                                 ingest::ErrorPolicy policy =
                                     ingest::ErrorPolicy::FAIL_FAST) {
    ingest::EngineParams p;
    p.chain_id = CHAIN_ID;
    p.batch_size = batch;
    p.polling_interval = 5000ms;
    p.policy = policy;
    return p;
}

struct EngineFixture {
    store::MemoryKvStore          kv;
    store::TransportDB            db{kv};
    ScriptedFetcher               fetcher;
    ingest::SequencerBlockHandler decoder;
    RecordingSleeper              sleeper;
};

uint64_t cursor_of(const store::TransportDB& db) {
    return db.get_highest_synced_unconfirmed_block().value_or(0);
}

} // namespace

// ============================================================================
// Block fetching
// ============================================================================

TEST_CASE(Fetcher, sort_by_block_number_is_stable) {
    std::vector<ingest::RawBlock> blocks;
    blocks.push_back(raw_block(3, "c"));
    blocks.push_back(raw_block(2, "first"));
    blocks.push_back(raw_block(2, "second"));
    ingest::sort_by_block_number(blocks);
    CHECK_EQ(blocks[0].number, 2u);
    CHECK_EQ(blocks[0].json.get_string(), std::string("first"));
    CHECK_EQ(blocks[1].json.get_string(), std::string("second"));
    CHECK_EQ(blocks[2].number, 3u);
}

TEST_CASE(Fetcher, block_number_reads_quantity) {
    auto n = ingest::block_number(sequencer_block(0x1f));
    CHECK_OK(n);
    CHECK_EQ(n.value(), 31u);
    CHECK_ERR_CODE(ingest::block_number(rpc::parse_json(R"({"number":7})")),
                   core::ErrorCode::RPC_INVALID_RESPONSE);
    CHECK_ERR_CODE(ingest::block_number(rpc::parse_json("{}")),
                   core::ErrorCode::RPC_INVALID_RESPONSE);
    CHECK_EQ(ingest::fetch_mode_name(ingest::FetchMode::BULK), "bulk");
    CHECK_EQ(ingest::fetch_mode_name(ingest::FetchMode::COMPATIBILITY),
             "compatibility");
}

TEST_CASE(Fetcher, current_height) {
    ScriptedRpcClient client;
    client.height = 11;
    ingest::RpcBlockFetcher fetcher(client, ingest::FetchMode::BULK);
    auto h = fetcher.current_height();
    CHECK_OK(h);
    CHECK_EQ(h.value(), 11u);
    CHECK_EQ(client.calls().front(), std::string("eth_blockNumber[]"));

    client.overrides["eth_blockNumber"] = rpc::JsonValue(11);
    CHECK_ERR_CODE(fetcher.current_height(),
                   core::ErrorCode::RPC_INVALID_RESPONSE);
}

TEST_CASE(Fetcher, bulk_mode_uses_one_range_call) {
    ScriptedRpcClient client;
    ingest::RpcBlockFetcher fetcher(client, ingest::FetchMode::BULK);
    auto blocks = fetcher.fetch_range(2, 6);
    CHECK_OK(blocks);
    CHECK_EQ(blocks.value().size(), 5u);
    for (size_t i = 0; i < blocks.value().size(); ++i) {
        CHECK_EQ(blocks.value()[i].number, 2 + i);
    }
    auto calls = client.calls();
    CHECK_EQ(calls.size(), 1u);
    CHECK_EQ(calls[0], std::string(R"(eth_getBlockRange["0x2","0x6",true])"));
}

TEST_CASE(Fetcher, bulk_mode_rejects_malformed_results) {
    ScriptedRpcClient client;
    ingest::RpcBlockFetcher fetcher(client, ingest::FetchMode::BULK);

    client.overrides["eth_getBlockRange"] = rpc::parse_json(R"({"number":"0x2"})");
    CHECK_ERR_CODE(fetcher.fetch_range(2, 2),
                   core::ErrorCode::RPC_INVALID_RESPONSE);

    client.overrides["eth_getBlockRange"] = rpc::parse_json(R"([{"hash":"0x00"}])");
    CHECK_ERR_CODE(fetcher.fetch_range(2, 2),
                   core::ErrorCode::RPC_INVALID_RESPONSE);

    client.overrides["eth_getBlockRange"] = rpc::parse_json(R"(["0x2"])");
    CHECK_ERR_CODE(fetcher.fetch_range(2, 2),
                   core::ErrorCode::RPC_INVALID_RESPONSE);
}

TEST_CASE(Fetcher, empty_range_makes_no_calls) {
    ScriptedRpcClient client;
    for (auto mode : {ingest::FetchMode::BULK, ingest::FetchMode::COMPATIBILITY}) {
        ingest::RpcBlockFetcher fetcher(client, mode);
        auto blocks = fetcher.fetch_range(7, 6);
        CHECK_OK(blocks);
        CHECK(blocks.value().empty());
    }
    CHECK(client.calls().empty());
}

TEST_CASE(Fetcher, compatibility_mode_returns_ascending_blocks) {
    ScriptedRpcClient client;
    client.slow_block = 2;  // block 3 answers first
    ingest::RpcBlockFetcher fetcher(client, ingest::FetchMode::COMPATIBILITY);
    auto blocks = fetcher.fetch_range(2, 3);
    CHECK_OK(blocks);
    CHECK_EQ(blocks.value().size(), 2u);
    CHECK_EQ(blocks.value()[0].number, 2u);
    CHECK_EQ(blocks.value()[1].number, 3u);

    auto calls = client.calls();
    CHECK_EQ(calls.size(), 2u);
    std::sort(calls.begin(), calls.end());
    CHECK_EQ(calls[0], std::string(R"(eth_getBlockByNumber["0x2",true])"));
    CHECK_EQ(calls[1], std::string(R"(eth_getBlockByNumber["0x3",true])"));
}

TEST_CASE(Fetcher, compatibility_mode_bounds_parallelism) {
    ScriptedRpcClient client;
    client.delay = 10ms;
    ingest::RpcBlockFetcher fetcher(client, ingest::FetchMode::COMPATIBILITY, 2);
    auto blocks = fetcher.fetch_range(2, 9);
    CHECK_OK(blocks);
    CHECK_EQ(blocks.value().size(), 8u);
    CHECK_EQ(blocks.value().back().number, 9u);
    CHECK(client.max_in_flight() >= 1);
    CHECK(client.max_in_flight() <= 2);
    CHECK_EQ(client.calls().size(), 8u);
}

TEST_CASE(Fetcher, compatibility_mode_missing_block_fails_whole_range) {
    ScriptedRpcClient client;
    client.missing.insert(4);
    ingest::RpcBlockFetcher fetcher(client, ingest::FetchMode::COMPATIBILITY);
    auto blocks = fetcher.fetch_range(2, 6);
    CHECK_ERR_CODE(blocks, core::ErrorCode::RPC_INVALID_RESPONSE);
    if (!blocks.ok()) {
        CHECK(blocks.error().message().find("block 4") != std::string::npos);
    }
}

TEST_CASE(Fetcher, compatibility_mode_propagates_call_errors) {
    ScriptedRpcClient client;
    client.failing.insert(3);
    ingest::RpcBlockFetcher fetcher(client, ingest::FetchMode::COMPATIBILITY, 1);
    CHECK_ERR_CODE(fetcher.fetch_range(2, 6), core::ErrorCode::RPC_REMOTE_ERROR);
    // A single worker stops at the first failure.
    CHECK_EQ(client.calls().size(), 2u);
}

// ============================================================================
// Decoding
// ============================================================================

TEST_CASE(Decoder, recovery_id) {
    CHECK_EQ(ingest::recovery_id(0, CHAIN_ID).value(), 0u);
    CHECK_EQ(ingest::recovery_id(1, CHAIN_ID).value(), 1u);
    CHECK_EQ(ingest::recovery_id(27, CHAIN_ID).value(), 0u);
    CHECK_EQ(ingest::recovery_id(28, CHAIN_ID).value(), 1u);
    CHECK_EQ(ingest::recovery_id(875, CHAIN_ID).value(), 0u);
    CHECK_EQ(ingest::recovery_id(876, CHAIN_ID).value(), 1u);
    CHECK_EQ(ingest::recovery_id(37, 1).value(), 0u);
    CHECK_EQ(ingest::recovery_id(38, 1).value(), 1u);
    CHECK_ERR_CODE(ingest::recovery_id(877, CHAIN_ID), core::ErrorCode::DECODE_ERROR);
    CHECK_ERR_CODE(ingest::recovery_id(2, CHAIN_ID), core::ErrorCode::DECODE_ERROR);
    CHECK_ERR_CODE(ingest::recovery_id(37, CHAIN_ID), core::ErrorCode::DECODE_ERROR);
}

TEST_CASE(Decoder, pad_hex) {
    CHECK_EQ(ingest::pad_hex("0x1", 32).value(), "0x" + std::string(63, '0') + "1");
    CHECK_EQ(ingest::pad_hex("0xABc", 2).value(), std::string("0x0abc"));
    CHECK_EQ(ingest::pad_hex("0x", 2).value(), std::string("0x0000"));
    CHECK_ERR_CODE(ingest::pad_hex("1234", 32), core::ErrorCode::DECODE_ERROR);
    CHECK_ERR_CODE(ingest::pad_hex("0x123456", 2), core::ErrorCode::DECODE_ERROR);
    CHECK_ERR_CODE(ingest::pad_hex("0xzz", 32), core::ErrorCode::DECODE_ERROR);
}

TEST_CASE(Decoder, sequencer_block) {
    ingest::SequencerBlockHandler handler;
    auto entry = handler.parse_block(raw_block(7, sequencer_block(7)), CHAIN_ID);
    CHECK_OK(entry);
    if (!entry.ok()) return;

    const store::TransactionEntry& tx = entry.value().transaction;
    CHECK_EQ(tx.index, 6u);
    CHECK(!tx.batch_index.has_value());
    CHECK_EQ(tx.data, std::string("0xf86b80"));
    CHECK_EQ(tx.block_number, 16u);
    CHECK_EQ(tx.timestamp, 100000000u);
    CHECK_EQ(tx.gas_limit, 0u);
    CHECK_EQ(tx.target, std::string(ingest::ZERO_ADDRESS));
    CHECK(!tx.origin.has_value());
    CHECK(tx.queue_origin == store::QueueOrigin::SEQUENCER);
    CHECK(!tx.queue_index.has_value());
    CHECK(tx.type == store::TxType::EIP155);
    CHECK(tx.decoded.has_value());
    if (tx.decoded) {
        const store::DecodedTransaction& d = *tx.decoded;
        CHECK_EQ(d.sig.r, "0x" + std::string(63, '0') + "1");
        CHECK_EQ(d.sig.s, "0x" + std::string(62, '0') + "ab");
        CHECK_EQ(d.sig.v, std::string("0x0"));
        CHECK_EQ(d.gas_limit, 21000u);
        CHECK_EQ(d.gas_price, 1000000000u);
        CHECK_EQ(d.nonce, 7u);
        CHECK(d.target == std::optional<std::string>(SOME_ADDRESS));
        CHECK_EQ(d.data, std::string("0xabcd"));
    }

    CHECK_EQ(entry.value().state_root.index, 6u);
    CHECK_EQ(entry.value().state_root.value, root_for(7));
}

TEST_CASE(Decoder, input_used_without_raw_transaction) {
    rpc::JsonValue tx = sequencer_tx(3);
    tx["rawTransaction"] = nullptr;
    tx["to"] = nullptr;
    ingest::SequencerBlockHandler handler;
    auto entry = handler.parse_block(raw_block(3, block_with(3, tx)), CHAIN_ID);
    CHECK_OK(entry);
    if (!entry.ok()) return;
    CHECK_EQ(entry.value().transaction.data, std::string("0xabcd"));
    CHECK(!entry.value().transaction.decoded->target.has_value());
}

TEST_CASE(Decoder, falls_back_to_block_number) {
    rpc::JsonValue tx = sequencer_tx(9);
    tx["blockNumber"] = nullptr;
    ingest::SequencerBlockHandler handler;
    auto entry = handler.parse_block(raw_block(9, block_with(9, tx)), CHAIN_ID);
    CHECK_OK(entry);
    if (entry.ok()) {
        CHECK_EQ(entry.value().transaction.index, 8u);
    }
}

TEST_CASE(Decoder, l1_block) {
    rpc::JsonValue tx = sequencer_tx(5);
    tx["queueOrigin"] = "l1";
    tx["l1TxOrigin"] = L1_SENDER;
    tx["queueIndex"] = "0x2";
    tx["gas"] = "0x7a1200";
    ingest::SequencerBlockHandler handler;
    auto entry = handler.parse_block(raw_block(5, block_with(5, tx)), CHAIN_ID);
    CHECK_OK(entry);
    if (!entry.ok()) return;

    const store::TransactionEntry& t = entry.value().transaction;
    CHECK(t.queue_origin == store::QueueOrigin::L1);
    CHECK_EQ(t.index, 4u);
    CHECK_EQ(t.gas_limit, 8000000u);
    CHECK_EQ(t.target, std::string(SOME_ADDRESS));
    CHECK(t.origin == std::optional<std::string>(L1_SENDER));
    CHECK(t.queue_index == std::optional<uint64_t>(2));
    CHECK(!t.type.has_value());
    CHECK(!t.decoded.has_value());

    tx["queueIndex"] = nullptr;
    CHECK_ERR_CODE(handler.parse_block(raw_block(5, block_with(5, tx)), CHAIN_ID),
                   core::ErrorCode::DECODE_ERROR);
}

TEST_CASE(Decoder, malformed_blocks) {
    ingest::SequencerBlockHandler handler;

    rpc::JsonValue no_txs = sequencer_block(2);
    no_txs["transactions"] = rpc::JsonValue(rpc::JsonValue::Array{});
    CHECK_ERR_CODE(handler.parse_block(raw_block(2, no_txs), CHAIN_ID),
                   core::ErrorCode::DECODE_ERROR);

    rpc::JsonValue hashes_only = sequencer_block(2);
    hashes_only["transactions"] = rpc::JsonValue(rpc::JsonValue::Array{"0x1234"});
    CHECK_ERR_CODE(handler.parse_block(raw_block(2, hashes_only), CHAIN_ID),
                   core::ErrorCode::DECODE_ERROR);

    CHECK_ERR_CODE(handler.parse_block(raw_block(0, sequencer_block(0)), CHAIN_ID),
                   core::ErrorCode::DECODE_ERROR);

    rpc::JsonValue unknown_origin = sequencer_tx(2);
    unknown_origin["queueOrigin"] = "l3";
    CHECK_ERR_CODE(handler.parse_block(raw_block(2, block_with(2, unknown_origin)),
                                       CHAIN_ID),
                   core::ErrorCode::DECODE_ERROR);

    rpc::JsonValue no_l1_block = sequencer_tx(2);
    no_l1_block["l1BlockNumber"] = nullptr;
    CHECK_ERR_CODE(handler.parse_block(raw_block(2, block_with(2, no_l1_block)),
                                       CHAIN_ID),
                   core::ErrorCode::DECODE_ERROR);

    rpc::JsonValue bad_root = sequencer_block(2);
    bad_root["stateRoot"] = "0x123";
    CHECK_ERR_CODE(handler.parse_block(raw_block(2, bad_root), CHAIN_ID),
                   core::ErrorCode::DECODE_ERROR);

    // v signed for a different chain
    CHECK_ERR_CODE(handler.parse_block(raw_block(2, sequencer_block(2)), 10),
                   core::ErrorCode::DECODE_ERROR);
}

TEST_CASE(Decoder, quantities_must_fit_int64) {
    ingest::SequencerBlockHandler handler;

    rpc::JsonValue widest = sequencer_tx(2);
    widest["gasPrice"] = "0x7fffffffffffffff";
    auto entry = handler.parse_block(raw_block(2, block_with(2, widest)), CHAIN_ID);
    CHECK_OK(entry);
    if (entry.ok()) {
        CHECK_EQ(entry.value().transaction.decoded->gas_price,
                 uint64_t{0x7fffffffffffffff});
    }

    for (const char* field : {"gasPrice", "gas", "nonce", "l1Timestamp"}) {
        rpc::JsonValue tx = sequencer_tx(2);
        tx[field] = "0x8000000000000001";
        CHECK_ERR_CODE(handler.parse_block(raw_block(2, block_with(2, tx)),
                                           CHAIN_ID),
                       core::ErrorCode::DECODE_ERROR);
    }
}

TEST_CASE(Decoder, store_block_writes_both_records) {
    store::MemoryKvStore kv;
    store::TransportDB db(kv);
    ingest::SequencerBlockHandler handler;

    auto entry = handler.parse_block(raw_block(4, sequencer_block(4)), CHAIN_ID);
    CHECK_OK(entry);
    if (!entry.ok()) return;
    CHECK_OK(handler.store_block(entry.value(), db));

    auto tx = db.get_unconfirmed_transaction_by_index(3);
    CHECK_OK(tx);
    if (tx.ok()) {
        CHECK(tx.value() == entry.value().transaction);
    }
    auto root = db.get_unconfirmed_state_root_by_index(3);
    CHECK_OK(root);
    if (root.ok()) {
        CHECK_EQ(root.value().value, root_for(4));
    }
    // Confirmed records are untouched.
    CHECK_ERR_CODE(db.get_transaction_by_index(3),
                   core::ErrorCode::STORAGE_NOT_FOUND);
}

// ============================================================================
// Engine
// ============================================================================

TEST_CASE(Engine, compute_window) {
    auto w = ingest::compute_window(1, 11, 5);
    CHECK_EQ(w.head, 10u);
    CHECK_EQ(w.target, 6u);
    CHECK(!w.at_head());
    CHECK(!w.invalid());

    w = ingest::compute_window(6, 11, 5);
    CHECK_EQ(w.target, 10u);

    w = ingest::compute_window(10, 11, 5);
    CHECK(w.at_head());

    w = ingest::compute_window(1, 0, 5);
    CHECK_EQ(w.head, 0u);
    CHECK(w.invalid());

    w = ingest::compute_window(UINT64_MAX - 1, UINT64_MAX, 5);
    CHECK_EQ(w.target, UINT64_MAX - 1);
    CHECK(w.at_head());
}

TEST_CASE(Engine, resolve_error) {
    using ingest::ErrorAction;
    using ingest::ErrorPolicy;
    CHECK(ingest::resolve_error(ErrorPolicy::FAIL_FAST, false) == ErrorAction::PROPAGATE);
    CHECK(ingest::resolve_error(ErrorPolicy::FAIL_FAST, true) == ErrorAction::BACKOFF);
    CHECK(ingest::resolve_error(ErrorPolicy::CATCH_AND_BACKOFF, false) == ErrorAction::BACKOFF);
    CHECK(ingest::resolve_error(ErrorPolicy::CATCH_AND_BACKOFF, true) == ErrorAction::BACKOFF);
    CHECK_EQ(ingest::error_policy_name(ErrorPolicy::FAIL_FAST), "fail-fast");
}

TEST_CASE(Engine, windows_advance_to_head) {
    EngineFixture f;
    f.fetcher.height = 11;
    ingest::IngestionEngine engine(make_params(5), f.fetcher, f.decoder, f.db,
                                   f.sleeper);

    auto first = engine.run_once();
    CHECK_OK(first);
    CHECK(first.value() == ingest::IterationOutcome::SYNCED_BEHIND);
    CHECK_EQ(f.fetcher.fetches.size(), 1u);
    CHECK(f.fetcher.fetches[0] == Range(2, 6));
    CHECK_EQ(cursor_of(f.db), 6u);
    CHECK(f.sleeper.sleeps.empty());
    CHECK_OK(f.db.get_unconfirmed_transaction_by_index(1));
    CHECK_OK(f.db.get_unconfirmed_transaction_by_index(5));
    CHECK_ERR_CODE(f.db.get_unconfirmed_transaction_by_index(6),
                   core::ErrorCode::STORAGE_NOT_FOUND);

    auto second = engine.run_once();
    CHECK_OK(second);
    CHECK(second.value() == ingest::IterationOutcome::SYNCED_CAUGHT_UP);
    CHECK(f.fetcher.fetches[1] == Range(7, 10));
    CHECK_EQ(cursor_of(f.db), 10u);
    CHECK_EQ(f.sleeper.sleeps.size(), 1u);
    CHECK(f.sleeper.sleeps[0] == 5000ms);

    auto third = engine.run_once();
    CHECK_OK(third);
    CHECK(third.value() == ingest::IterationOutcome::AT_HEAD);
    CHECK_EQ(f.fetcher.fetches.size(), 2u);
    CHECK_EQ(f.sleeper.sleeps.size(), 2u);
    CHECK_EQ(engine.blocks_committed(), 9u);
}

TEST_CASE(Engine, at_head_sleeps_without_fetching) {
    EngineFixture f;
    f.fetcher.height = 2;
    ingest::IngestionEngine engine(make_params(5), f.fetcher, f.decoder, f.db,
                                   f.sleeper);
    auto outcome = engine.run_once();
    CHECK_OK(outcome);
    CHECK(outcome.value() == ingest::IterationOutcome::AT_HEAD);
    CHECK(f.fetcher.fetches.empty());
    CHECK_EQ(f.sleeper.sleeps.size(), 1u);
    CHECK_ERR_CODE(f.db.get_highest_synced_unconfirmed_block(),
                   core::ErrorCode::STORAGE_NOT_FOUND);
}

TEST_CASE(Engine, cursor_ahead_of_chain_is_skipped) {
    EngineFixture f;
    f.fetcher.height = 11;
    CHECK_OK(f.db.set_highest_synced_unconfirmed_block(20));
    ingest::IngestionEngine engine(make_params(5), f.fetcher, f.decoder, f.db,
                                   f.sleeper);
    auto outcome = engine.run_once();
    CHECK_OK(outcome);
    CHECK(outcome.value() == ingest::IterationOutcome::INVALID_WINDOW);
    CHECK(f.fetcher.fetches.empty());
    CHECK_EQ(f.sleeper.sleeps.size(), 1u);
    CHECK_EQ(cursor_of(f.db), 20u);
}

TEST_CASE(Engine, failed_window_leaves_cursor_and_replays) {
    store::MemoryKvStore kv;
    store::TransportDB db(kv);
    ScriptedFetcher fetcher;
    FailingDecoder decoder;
    RecordingSleeper sleeper;
    fetcher.height = 11;
    decoder.fail_at = 4;
    ingest::IngestionEngine engine(make_params(5), fetcher, decoder, db, sleeper);

    CHECK_ERR_CODE(engine.run_once(), core::ErrorCode::DECODE_ERROR);
    CHECK_ERR_CODE(db.get_highest_synced_unconfirmed_block(),
                   core::ErrorCode::STORAGE_NOT_FOUND);
    auto before = db.get_unconfirmed_transaction_by_index(1);
    CHECK_OK(before);
    CHECK_ERR_CODE(db.get_unconfirmed_transaction_by_index(3),
                   core::ErrorCode::STORAGE_NOT_FOUND);

    decoder.fail_at = 0;
    CHECK_OK(engine.run_once());
    CHECK_EQ(cursor_of(db), 6u);
    CHECK(fetcher.fetches[1] == Range(2, 6));
    auto after = db.get_unconfirmed_transaction_by_index(1);
    CHECK_OK(after);
    if (before.ok() && after.ok()) {
        CHECK(store::encode_record(before.value()) ==
              store::encode_record(after.value()));
    }
}

TEST_CASE(Engine, fail_fast_returns_first_error) {
    EngineFixture f;
    f.fetcher.height = 11;
    f.fetcher.height_failures = 1;
    ingest::IngestionEngine engine(make_params(5), f.fetcher, f.decoder, f.db,
                                   f.sleeper);
    auto result = engine.run();
    CHECK_ERR_CODE(result, core::ErrorCode::NETWORK_REFUSED);
    CHECK(f.sleeper.sleeps.empty());
    CHECK(f.fetcher.fetches.empty());
}

TEST_CASE(Engine, fail_fast_stops_on_decode_error) {
    store::MemoryKvStore kv;
    store::TransportDB db(kv);
    ScriptedFetcher fetcher;
    FailingDecoder decoder;
    RecordingSleeper sleeper;
    fetcher.height = 11;
    decoder.fail_at = 8;
    ingest::IngestionEngine engine(make_params(5), fetcher, decoder, db, sleeper);

    CHECK_ERR_CODE(engine.run(), core::ErrorCode::DECODE_ERROR);
    CHECK_EQ(fetcher.fetches.size(), 2u);
    CHECK_EQ(cursor_of(db), 6u);
    CHECK_ERR_CODE(db.get_unconfirmed_transaction_by_index(6),
                   core::ErrorCode::STORAGE_NOT_FOUND);
    CHECK(sleeper.sleeps.empty());
}

TEST_CASE(Engine, fail_fast_stops_on_storage_error) {
    FailingKvStore kv;
    store::TransportDB db(kv);
    ScriptedFetcher fetcher;
    ingest::SequencerBlockHandler decoder;
    RecordingSleeper sleeper;
    fetcher.height = 11;
    kv.fail_writes = true;
    ingest::IngestionEngine engine(make_params(5), fetcher, decoder, db, sleeper);

    CHECK_ERR_CODE(engine.run(), core::ErrorCode::STORAGE_ERROR);
    CHECK_EQ(kv.rejected, 1);
    CHECK_EQ(fetcher.fetches.size(), 1u);
    CHECK_ERR_CODE(db.get_highest_synced_unconfirmed_block(),
                   core::ErrorCode::STORAGE_NOT_FOUND);
    CHECK(sleeper.sleeps.empty());
}

TEST_CASE(Engine, catch_all_backs_off_and_recovers) {
    EngineFixture f;
    f.fetcher.height = 11;
    f.fetcher.height_failures = 2;
    ingest::IngestionEngine engine(
        make_params(5, ingest::ErrorPolicy::CATCH_AND_BACKOFF), f.fetcher,
        f.decoder, f.db, f.sleeper);
    f.sleeper.on_sleep = [&]() {
        if (f.sleeper.sleeps.size() == 3) engine.stop();
    };

    CHECK_OK(engine.run());
    // Two backoffs, then the caught-up pause that stops the loop.
    CHECK_EQ(f.sleeper.sleeps.size(), 3u);
    CHECK_EQ(f.fetcher.fetches.size(), 2u);
    CHECK_EQ(cursor_of(f.db), 10u);
    CHECK(f.sleeper.interrupted);
}

TEST_CASE(Engine, stop_before_run) {
    EngineFixture f;
    f.fetcher.height = 11;
    ingest::IngestionEngine engine(make_params(5), f.fetcher, f.decoder, f.db,
                                   f.sleeper);
    engine.stop();
    CHECK(engine.stop_requested());
    CHECK(f.sleeper.interrupted);
    CHECK_OK(engine.run());
    CHECK(f.fetcher.fetches.empty());
}

TEST_CASE(Engine, signal_sleeper_latches_interrupt) {
    ingest::SignalSleeper sleeper;
    sleeper.interrupt();
    auto start = std::chrono::steady_clock::now();
    sleeper.sleep(10s);
    CHECK(std::chrono::steady_clock::now() - start < 5s);
}

TEST_CASE(Engine, stop_wakes_running_loop) {
    EngineFixture f;
    f.fetcher.height = 2;  // always at head
    ingest::SignalSleeper sleeper;
    ingest::IngestionEngine engine(make_params(5), f.fetcher, f.decoder, f.db,
                                   sleeper);

    core::Result<void> result =
        core::Error(core::ErrorCode::INTERNAL_ERROR, "not run");
    auto start = std::chrono::steady_clock::now();
    {
        core::TraceThread loop("test-ingest", [&]() { result = engine.run(); });
        std::this_thread::sleep_for(50ms);
        engine.stop();
        loop.join();
    }
    CHECK_OK(result);
    CHECK(std::chrono::steady_clock::now() - start < 4s);
}
