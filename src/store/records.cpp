// Copyright (c) 2024-2026 The DTL Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "store/records.h"

#include <utility>

namespace store {

using rpc::JsonValue;

namespace {

core::Error corrupt(const std::string& field, std::string_view want) {
    return core::Error(core::ErrorCode::STORAGE_CORRUPT,
                       "record field '" + field + "' is not " +
                       std::string(want));
}

core::Result<uint64_t> read_u64(const JsonValue& obj,
                                const std::string& field) {
    const auto& v = obj[field];
    if (!v.is_int() || v.get_int() < 0) {
        return corrupt(field, "a non-negative integer");
    }
    return static_cast<uint64_t>(v.get_int());
}

core::Result<std::optional<uint64_t>> read_opt_u64(const JsonValue& obj,
                                                   const std::string& field) {
    if (obj[field].is_null()) return std::optional<uint64_t>{};
    DTL_TRY_ASSIGN(value, read_u64(obj, field));
    return std::optional<uint64_t>(value);
}

core::Result<std::string> read_string(const JsonValue& obj,
                                      const std::string& field) {
    const auto& v = obj[field];
    if (!v.is_string()) return corrupt(field, "a string");
    return v.get_string();
}

core::Result<std::optional<std::string>> read_opt_string(
    const JsonValue& obj, const std::string& field) {
    if (obj[field].is_null()) return std::optional<std::string>{};
    DTL_TRY_ASSIGN(value, read_string(obj, field));
    return std::optional<std::string>(std::move(value));
}

JsonValue opt(const std::optional<uint64_t>& v) {
    return v ? JsonValue(*v) : JsonValue(nullptr);
}

JsonValue opt(const std::optional<std::string>& v) {
    return v ? JsonValue(*v) : JsonValue(nullptr);
}

core::Result<void> require_object(const JsonValue& v, std::string_view what) {
    if (!v.is_object()) {
        return core::Error(core::ErrorCode::STORAGE_CORRUPT,
                           std::string(what) + " record is not an object");
    }
    return core::make_ok();
}

JsonValue decoded_to_json(const DecodedTransaction& d) {
    JsonValue sig(JsonValue::Object{});
    sig["r"] = d.sig.r;
    sig["s"] = d.sig.s;
    sig["v"] = d.sig.v;

    JsonValue obj(JsonValue::Object{});
    obj["sig"] = std::move(sig);
    obj["gasLimit"] = d.gas_limit;
    obj["gasPrice"] = d.gas_price;
    obj["nonce"] = d.nonce;
    obj["target"] = opt(d.target);
    obj["data"] = d.data;
    return obj;
}

core::Result<DecodedTransaction> decoded_from_json(const JsonValue& v) {
    DTL_TRY_VOID(require_object(v, "decoded transaction"));
    const auto& sig = v["sig"];
    DTL_TRY_VOID(require_object(sig, "signature"));

    DecodedTransaction d;
    DTL_TRY_ASSIGN(r, read_string(sig, "r"));
    DTL_TRY_ASSIGN(s, read_string(sig, "s"));
    DTL_TRY_ASSIGN(sig_v, read_string(sig, "v"));
    d.sig = TransactionSignature{std::move(r), std::move(s), std::move(sig_v)};
    DTL_TRY_ASSIGN(gas_limit, read_u64(v, "gasLimit"));
    DTL_TRY_ASSIGN(gas_price, read_u64(v, "gasPrice"));
    DTL_TRY_ASSIGN(nonce, read_u64(v, "nonce"));
    DTL_TRY_ASSIGN(target, read_opt_string(v, "target"));
    DTL_TRY_ASSIGN(data, read_string(v, "data"));
    d.gas_limit = gas_limit;
    d.gas_price = gas_price;
    d.nonce = nonce;
    d.target = std::move(target);
    d.data = std::move(data);
    return d;
}

} // namespace

std::string_view queue_origin_name(QueueOrigin origin) noexcept {
    return origin == QueueOrigin::L1 ? "l1" : "sequencer";
}

std::string_view tx_type_name(TxType type) noexcept {
    return type == TxType::ETH_SIGN ? "ETH_SIGN" : "EIP155";
}

// ---------------------------------------------------------------------------
// EnqueueEntry
// ---------------------------------------------------------------------------

JsonValue EnqueueEntry::to_json() const {
    JsonValue obj(JsonValue::Object{});
    obj["index"] = index;
    obj["target"] = target;
    obj["data"] = data;
    obj["gasLimit"] = gas_limit;
    obj["origin"] = origin;
    obj["blockNumber"] = block_number;
    obj["timestamp"] = timestamp;
    return obj;
}

core::Result<EnqueueEntry> EnqueueEntry::from_json(const JsonValue& v) {
    DTL_TRY_VOID(require_object(v, "enqueue"));
    EnqueueEntry e;
    DTL_TRY_ASSIGN(idx, read_u64(v, "index"));
    DTL_TRY_ASSIGN(target, read_string(v, "target"));
    DTL_TRY_ASSIGN(data, read_string(v, "data"));
    DTL_TRY_ASSIGN(gas_limit, read_u64(v, "gasLimit"));
    DTL_TRY_ASSIGN(origin, read_string(v, "origin"));
    DTL_TRY_ASSIGN(block_number, read_u64(v, "blockNumber"));
    DTL_TRY_ASSIGN(timestamp, read_u64(v, "timestamp"));
    e.index = idx;
    e.target = std::move(target);
    e.data = std::move(data);
    e.gas_limit = gas_limit;
    e.origin = std::move(origin);
    e.block_number = block_number;
    e.timestamp = timestamp;
    return e;
}

// ---------------------------------------------------------------------------
// TransactionEntry
// ---------------------------------------------------------------------------

JsonValue TransactionEntry::to_json() const {
    JsonValue obj(JsonValue::Object{});
    obj["index"] = index;
    obj["batchIndex"] = opt(batch_index);
    obj["data"] = data;
    obj["blockNumber"] = block_number;
    obj["timestamp"] = timestamp;
    obj["gasLimit"] = gas_limit;
    obj["target"] = target;
    obj["origin"] = opt(origin);
    obj["queueOrigin"] = queue_origin_name(queue_origin);
    obj["queueIndex"] = opt(queue_index);
    obj["type"] = type ? JsonValue(tx_type_name(*type)) : JsonValue(nullptr);
    obj["decoded"] = decoded ? decoded_to_json(*decoded) : JsonValue(nullptr);
    return obj;
}

core::Result<TransactionEntry> TransactionEntry::from_json(const JsonValue& v) {
    DTL_TRY_VOID(require_object(v, "transaction"));
    TransactionEntry e;
    DTL_TRY_ASSIGN(idx, read_u64(v, "index"));
    DTL_TRY_ASSIGN(batch_index, read_opt_u64(v, "batchIndex"));
    DTL_TRY_ASSIGN(data, read_string(v, "data"));
    DTL_TRY_ASSIGN(block_number, read_u64(v, "blockNumber"));
    DTL_TRY_ASSIGN(timestamp, read_u64(v, "timestamp"));
    DTL_TRY_ASSIGN(gas_limit, read_u64(v, "gasLimit"));
    DTL_TRY_ASSIGN(target, read_string(v, "target"));
    DTL_TRY_ASSIGN(origin, read_opt_string(v, "origin"));
    DTL_TRY_ASSIGN(queue_origin, read_string(v, "queueOrigin"));
    DTL_TRY_ASSIGN(queue_index, read_opt_u64(v, "queueIndex"));
    DTL_TRY_ASSIGN(type, read_opt_string(v, "type"));

    e.index = idx;
    e.batch_index = batch_index;
    e.data = std::move(data);
    e.block_number = block_number;
    e.timestamp = timestamp;
    e.gas_limit = gas_limit;
    e.target = std::move(target);
    e.origin = std::move(origin);
    e.queue_index = queue_index;

    if (queue_origin == "sequencer") {
        e.queue_origin = QueueOrigin::SEQUENCER;
    } else if (queue_origin == "l1") {
        e.queue_origin = QueueOrigin::L1;
    } else {
        return corrupt("queueOrigin", "\"sequencer\" or \"l1\"");
    }

    if (type) {
        if (*type == "EIP155") {
            e.type = TxType::EIP155;
        } else if (*type == "ETH_SIGN") {
            e.type = TxType::ETH_SIGN;
        } else {
            return corrupt("type", "\"EIP155\", \"ETH_SIGN\" or null");
        }
    }

    if (!v["decoded"].is_null()) {
        DTL_TRY_ASSIGN(decoded, decoded_from_json(v["decoded"]));
        e.decoded = std::move(decoded);
    }
    return e;
}

// ---------------------------------------------------------------------------
// BatchEntry
// ---------------------------------------------------------------------------

JsonValue BatchEntry::to_json() const {
    JsonValue obj(JsonValue::Object{});
    obj["index"] = index;
    obj["blockNumber"] = block_number;
    obj["timestamp"] = timestamp;
    obj["submitter"] = submitter;
    obj["size"] = size;
    obj["root"] = root;
    obj["prevTotalElements"] = prev_total_elements;
    obj["extraData"] = extra_data;
    return obj;
}

core::Result<BatchEntry> BatchEntry::from_json(const JsonValue& v) {
    DTL_TRY_VOID(require_object(v, "batch"));
    BatchEntry e;
    DTL_TRY_ASSIGN(idx, read_u64(v, "index"));
    DTL_TRY_ASSIGN(block_number, read_u64(v, "blockNumber"));
    DTL_TRY_ASSIGN(timestamp, read_u64(v, "timestamp"));
    DTL_TRY_ASSIGN(submitter, read_string(v, "submitter"));
    DTL_TRY_ASSIGN(size, read_u64(v, "size"));
    DTL_TRY_ASSIGN(root, read_string(v, "root"));
    DTL_TRY_ASSIGN(prev_total, read_u64(v, "prevTotalElements"));
    DTL_TRY_ASSIGN(extra_data, read_string(v, "extraData"));
    e.index = idx;
    e.block_number = block_number;
    e.timestamp = timestamp;
    e.submitter = std::move(submitter);
    e.size = size;
    e.root = std::move(root);
    e.prev_total_elements = prev_total;
    e.extra_data = std::move(extra_data);
    return e;
}

// ---------------------------------------------------------------------------
// StateRootEntry
// ---------------------------------------------------------------------------

JsonValue StateRootEntry::to_json() const {
    JsonValue obj(JsonValue::Object{});
    obj["index"] = index;
    obj["batchIndex"] = opt(batch_index);
    obj["value"] = value;
    return obj;
}

core::Result<StateRootEntry> StateRootEntry::from_json(const JsonValue& v) {
    DTL_TRY_VOID(require_object(v, "state root"));
    StateRootEntry e;
    DTL_TRY_ASSIGN(idx, read_u64(v, "index"));
    DTL_TRY_ASSIGN(batch_index, read_opt_u64(v, "batchIndex"));
    DTL_TRY_ASSIGN(value, read_string(v, "value"));
    e.index = idx;
    e.batch_index = batch_index;
    e.value = std::move(value);
    return e;
}

} // namespace store
