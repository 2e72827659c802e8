#pragma once
// Copyright (c) 2024-2026 The DTL Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace rpc {

/// Parsed "http://host[:port][/path]" URL.
struct Endpoint {
    std::string host;
    uint16_t    port = 80;
    std::string path = "/";

    [[nodiscard]] std::string to_string() const;
};

/// Accepts plain http URLs only. IPv6 literals go in brackets
/// ("http://[::1]:8545"). Errors are INVALID_ARGUMENT.
core::Result<Endpoint> parse_endpoint(std::string_view url);

struct HttpResponse {
    int         status = 0;
    std::string body;
};

/// Upper bound on a response we are willing to buffer.
inline constexpr size_t MAX_HTTP_RESPONSE_SIZE = 512u << 20;

/// Parses a complete HTTP/1.x response as read off a closed connection.
/// Handles Content-Length and chunked transfer encoding; without either
/// the body runs to the end of the data. Errors are RPC_INVALID_RESPONSE.
core::Result<HttpResponse> parse_http_response(std::string_view raw);

// ---------------------------------------------------------------------------
// HttpClient -- one-shot HTTP/1.1 POST client
// ---------------------------------------------------------------------------
// Each post() opens a fresh connection with "Connection: close", so
// concurrent calls from several threads are safe. timeout_ms bounds the
// whole exchange (connect, send and receive).
// ---------------------------------------------------------------------------
class HttpClient {
public:
    HttpClient(Endpoint endpoint, int timeout_ms);

    core::Result<HttpResponse> post(const std::string& body,
                                    std::string_view content_type =
                                        "application/json") const;

    [[nodiscard]] const Endpoint& endpoint() const { return endpoint_; }
    [[nodiscard]] int timeout_ms() const { return timeout_ms_; }

private:
    Endpoint endpoint_;
    int      timeout_ms_;
};

} // namespace rpc
