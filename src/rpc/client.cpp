// Copyright (c) 2024-2026 The DTL Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "rpc/client.h"

#include "core/logging.h"

#include <utility>

namespace rpc {

JsonValue build_request(const std::string& method, const JsonValue& params,
                        int64_t id) {
    JsonValue req(JsonValue::Object{});
    req["jsonrpc"] = "2.0";
    req["id"] = id;
    req["method"] = method;
    req["params"] = params.is_null() ? JsonValue(JsonValue::Array{}) : params;
    return req;
}

core::Result<JsonValue> parse_response(std::string_view body,
                                       int http_status) {
    auto parsed = try_parse_json(body);
    bool is_rpc_object = parsed.ok() && parsed.value().is_object();

    if (is_rpc_object) {
        const JsonValue& doc = parsed.value();
        const JsonValue& err = doc["error"];
        if (!err.is_null()) {
            std::string message = err["message"].is_string()
                                      ? err["message"].get_string()
                                      : json_serialize(err);
            std::string code = err["code"].is_int()
                                   ? std::to_string(err["code"].get_int())
                                   : "?";
            return core::Error(core::ErrorCode::RPC_REMOTE_ERROR,
                               "remote error " + code + ": " + message);
        }
    }

    if (http_status != 200) {
        return core::Error(core::ErrorCode::RPC_ERROR,
                           "HTTP status " + std::to_string(http_status));
    }
    if (!parsed.ok()) {
        return core::Error(core::ErrorCode::RPC_INVALID_RESPONSE,
                           "response body: " + parsed.error().message());
    }
    if (!is_rpc_object || !parsed.value().has_key("result")) {
        return core::Error(core::ErrorCode::RPC_INVALID_RESPONSE,
                           "response has no \"result\" member");
    }
    const JsonValue& doc = parsed.value();
    return doc["result"];
}

HttpRpcClient::HttpRpcClient(HttpClient http)
    : http_(std::move(http)) {}

core::Result<JsonValue> HttpRpcClient::call(const std::string& method,
                                            const JsonValue& params) {
    int64_t id = next_id_.fetch_add(1, std::memory_order_relaxed);
    std::string body = json_serialize(build_request(method, params, id));

    LOG_TRACE(core::LogCategory::RPC, "-> " + body);

    auto resp = http_.post(body);
    if (!resp.ok()) {
        LOG_DEBUG(core::LogCategory::RPC,
                  method + " failed: " + resp.error().message());
        return std::move(resp).error();
    }
    return parse_response(resp.value().body, resp.value().status);
}

} // namespace rpc
