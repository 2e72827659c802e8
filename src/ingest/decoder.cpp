// Copyright (c) 2024-2026 The DTL Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "ingest/decoder.h"

#include "core/hex.h"
#include "core/logging.h"

#include <cctype>
#include <cstdint>
#include <limits>
#include <optional>
#include <utility>

namespace ingest {

using rpc::JsonValue;

namespace {

core::Error decode_error(const std::string& what) {
    return core::Error(core::ErrorCode::DECODE_ERROR, what);
}

core::Result<uint64_t> quantity_field(const JsonValue& obj,
                                      const std::string& field) {
    const auto& v = obj[field];
    if (!v.is_string()) {
        return decode_error("transaction field '" + field +
                            "' is missing or not a hex quantity");
    }
    auto q = core::parse_quantity(v.get_string());
    if (!q.ok()) {
        return decode_error("transaction field '" + field + "': " +
                            q.error().message());
    }
    // Stored records carry quantities as JSON integers, which cap at int64.
    if (q.value() > static_cast<uint64_t>(
                        std::numeric_limits<int64_t>::max())) {
        return decode_error("transaction field '" + field + "' " +
                            v.get_string() + " exceeds 2^63-1");
    }
    return q.value();
}

core::Result<std::string> hex_field(const JsonValue& obj,
                                    const std::string& field) {
    const auto& v = obj[field];
    if (!v.is_string() || !core::is_hex_data(v.get_string())) {
        return decode_error("field '" + field + "' is missing or not hex data");
    }
    return v.get_string();
}

core::Result<std::optional<std::string>> optional_hex_field(
    const JsonValue& obj, const std::string& field) {
    if (obj[field].is_null()) {
        return std::optional<std::string>{};
    }
    DTL_TRY_ASSIGN(value, hex_field(obj, field));
    return std::optional<std::string>(std::move(value));
}

core::Result<store::DecodedTransaction> decode_sequencer_tx(
    const JsonValue& tx, uint64_t chain_id) {
    store::DecodedTransaction d;

    DTL_TRY_ASSIGN(v, quantity_field(tx, "v"));
    DTL_TRY_ASSIGN(rec, recovery_id(v, chain_id));
    DTL_TRY_ASSIGN(r_raw, hex_field(tx, "r"));
    DTL_TRY_ASSIGN(s_raw, hex_field(tx, "s"));
    DTL_TRY_ASSIGN(r, pad_hex(r_raw, 32));
    DTL_TRY_ASSIGN(s, pad_hex(s_raw, 32));
    d.sig = store::TransactionSignature{std::move(r), std::move(s),
                                        core::to_quantity(rec)};

    DTL_TRY_ASSIGN(gas, quantity_field(tx, "gas"));
    DTL_TRY_ASSIGN(gas_price, quantity_field(tx, "gasPrice"));
    DTL_TRY_ASSIGN(nonce, quantity_field(tx, "nonce"));
    DTL_TRY_ASSIGN(target, optional_hex_field(tx, "to"));
    DTL_TRY_ASSIGN(input, hex_field(tx, "input"));
    d.gas_limit = gas;
    d.gas_price = gas_price;
    d.nonce = nonce;
    d.target = std::move(target);
    d.data = std::move(input);
    return d;
}

} // namespace

core::Result<uint64_t> recovery_id(uint64_t v, uint64_t chain_id) {
    if (v == 0 || v == 1) {
        return v;
    }
    if (v == 27 || v == 28) {
        return v - 27;
    }
    // EIP-155: v = recovery + chain_id * 2 + 35
    if (chain_id <= (UINT64_MAX - 36) / 2) {
        uint64_t base = chain_id * 2 + 35;
        if (v == base || v == base + 1) {
            return v - base;
        }
    }
    return decode_error("signature v " + std::to_string(v) +
                        " is not recoverable for chain id " +
                        std::to_string(chain_id));
}

core::Result<std::string> pad_hex(std::string_view hex, size_t bytes) {
    if (hex.size() < 2 || hex[0] != '0' || (hex[1] != 'x' && hex[1] != 'X')) {
        return decode_error("'" + std::string(hex) + "' has no 0x prefix");
    }
    std::string_view digits = hex.substr(2);
    if (digits.size() > bytes * 2) {
        return decode_error("'" + std::string(hex) + "' is longer than " +
                            std::to_string(bytes) + " bytes");
    }
    std::string out = "0x";
    out.append(bytes * 2 - digits.size(), '0');
    for (char c : digits) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return decode_error("'" + std::string(hex) + "' is not hex");
        }
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

// ---------------------------------------------------------------------------
// SequencerBlockHandler
// ---------------------------------------------------------------------------

core::Result<SequencerEntry> SequencerBlockHandler::parse_block(
    const RawBlock& block, uint64_t chain_id) {
    const JsonValue& json = block.json;
    const JsonValue& txs = json["transactions"];
    if (!txs.is_array() || txs.size() == 0) {
        return decode_error("block " + std::to_string(block.number) +
                            " has no transactions");
    }
    const JsonValue& tx = txs.get_array().front();
    if (!tx.is_object()) {
        return decode_error("block " + std::to_string(block.number) +
                            " transactions are not hydrated objects");
    }

    uint64_t number = block.number;
    if (!tx["blockNumber"].is_null()) {
        DTL_TRY_ASSIGN(tx_block, quantity_field(tx, "blockNumber"));
        number = tx_block;
    }
    if (number == 0) {
        return decode_error("block 0 carries no sequenced transaction");
    }

    SequencerEntry entry;
    store::TransactionEntry& t = entry.transaction;
    t.index = number - 1;

    DTL_TRY_ASSIGN(l1_block, quantity_field(tx, "l1BlockNumber"));
    DTL_TRY_ASSIGN(l1_time, quantity_field(tx, "l1Timestamp"));
    t.block_number = l1_block;
    t.timestamp = l1_time;

    const JsonValue& raw = tx["rawTransaction"];
    if (raw.is_string()) {
        t.data = raw.get_string();
    } else {
        DTL_TRY_ASSIGN(input, hex_field(tx, "input"));
        t.data = std::move(input);
    }

    const JsonValue& origin = tx["queueOrigin"];
    std::string origin_name = origin.is_string() ? origin.get_string() : "";
    if (origin_name == "sequencer") {
        t.queue_origin = store::QueueOrigin::SEQUENCER;
        t.gas_limit = 0;
        t.target = std::string(ZERO_ADDRESS);
        t.type = store::TxType::EIP155;
        DTL_TRY_ASSIGN(decoded, decode_sequencer_tx(tx, chain_id));
        t.decoded = std::move(decoded);
    } else if (origin_name == "l1") {
        t.queue_origin = store::QueueOrigin::L1;
        DTL_TRY_ASSIGN(gas, quantity_field(tx, "gas"));
        DTL_TRY_ASSIGN(target, hex_field(tx, "to"));
        DTL_TRY_ASSIGN(l1_origin, hex_field(tx, "l1TxOrigin"));
        DTL_TRY_ASSIGN(queue_index, quantity_field(tx, "queueIndex"));
        t.gas_limit = gas;
        t.target = std::move(target);
        t.origin = std::move(l1_origin);
        t.queue_index = queue_index;
    } else {
        return decode_error("block " + std::to_string(number) +
                            " has unknown queueOrigin '" + origin_name + "'");
    }

    DTL_TRY_ASSIGN(state_root, hex_field(json, "stateRoot"));
    entry.state_root.index = t.index;
    entry.state_root.value = std::move(state_root);
    return entry;
}

core::Result<void> SequencerBlockHandler::store_block(
    const SequencerEntry& entry, store::TransportDB& db) {
    DTL_TRY_VOID(db.put_unconfirmed_block(entry.transaction, entry.state_root));
    LOG_TRACE(core::LogCategory::DECODE,
              "stored unconfirmed transaction " +
              std::to_string(entry.transaction.index) + " (" +
              std::string(store::queue_origin_name(
                  entry.transaction.queue_origin)) + ")");
    return core::make_ok();
}

} // namespace ingest
