#pragma once
// Copyright (c) 2024-2026 The DTL Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "rpc/http_client.h"
#include "rpc/json.h"

#include <atomic>
#include <cstdint>
#include <string>

namespace rpc {

// ---------------------------------------------------------------------------
// RpcClient -- JSON-RPC 2.0 method invocation
// ---------------------------------------------------------------------------
// call() returns the response's "result" member. Failures:
//   NETWORK_*             transport could not complete the exchange
//   RPC_ERROR             non-200 HTTP status without a JSON-RPC error
//   RPC_REMOTE_ERROR      the endpoint answered with an "error" member
//   RPC_INVALID_RESPONSE  body is not a JSON-RPC response
// Implementations must allow concurrent calls.
// ---------------------------------------------------------------------------
class RpcClient {
public:
    virtual ~RpcClient() = default;

    virtual core::Result<JsonValue> call(const std::string& method,
                                         const JsonValue& params) = 0;
};

/// {"jsonrpc":"2.0","id":<id>,"method":<method>,"params":<params>}
[[nodiscard]] JsonValue build_request(const std::string& method,
                                      const JsonValue& params, int64_t id);

/// Extracts "result" from a response body, mapping failures as above.
/// @p http_status is the transport status code (200 for success).
core::Result<JsonValue> parse_response(std::string_view body,
                                       int http_status);

/// RpcClient over HttpClient, one connection per call.
class HttpRpcClient final : public RpcClient {
public:
    explicit HttpRpcClient(HttpClient http);

    core::Result<JsonValue> call(const std::string& method,
                                 const JsonValue& params) override;

    [[nodiscard]] const Endpoint& endpoint() const { return http_.endpoint(); }

private:
    HttpClient           http_;
    std::atomic<int64_t> next_id_{1};
};

} // namespace rpc
