// Copyright (c) 2024-2026 The DTL Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "rpc/http_client.h"

#include "core/logging.h"
#include "net/socket.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <span>
#include <utility>

namespace rpc {

namespace {

core::Error bad_url(std::string_view url, const std::string& why) {
    return core::Error(core::ErrorCode::INVALID_ARGUMENT,
                       "invalid endpoint '" + std::string(url) + "': " + why);
}

core::Error bad_response(const std::string& why) {
    return core::Error(core::ErrorCode::RPC_INVALID_RESPONSE,
                       "malformed HTTP response: " + why);
}

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

/// Decodes a chunked body. Trailers after the last chunk are ignored.
core::Result<std::string> decode_chunked(std::string_view data) {
    std::string out;
    for (;;) {
        size_t eol = data.find("\r\n");
        if (eol == std::string_view::npos) {
            return bad_response("truncated chunk header");
        }
        std::string_view size_field = data.substr(0, eol);
        size_t ext = size_field.find(';');
        if (ext != std::string_view::npos) size_field = size_field.substr(0, ext);
        size_field = trim(size_field);

        size_t chunk_size = 0;
        auto [ptr, ec] = std::from_chars(size_field.data(),
                                         size_field.data() + size_field.size(),
                                         chunk_size, 16);
        if (size_field.empty() || ec != std::errc{} ||
            ptr != size_field.data() + size_field.size()) {
            return bad_response("bad chunk size");
        }
        data.remove_prefix(eol + 2);
        if (chunk_size == 0) {
            return out;
        }
        if (data.size() < chunk_size + 2) {
            return bad_response("truncated chunk");
        }
        if (out.size() + chunk_size > MAX_HTTP_RESPONSE_SIZE) {
            return bad_response("body too large");
        }
        out.append(data.substr(0, chunk_size));
        data.remove_prefix(chunk_size + 2);
    }
}

} // namespace

// ---------------------------------------------------------------------------
// Endpoint
// ---------------------------------------------------------------------------

std::string Endpoint::to_string() const {
    bool v6 = host.find(':') != std::string::npos;
    return "http://" + (v6 ? "[" + host + "]" : host) + ":" +
           std::to_string(port) + path;
}

core::Result<Endpoint> parse_endpoint(std::string_view url) {
    constexpr std::string_view scheme = "http://";
    if (url.size() < scheme.size() || !iequals(url.substr(0, scheme.size()), scheme)) {
        return bad_url(url, "only http:// URLs are supported");
    }
    std::string_view rest = url.substr(scheme.size());

    Endpoint ep;
    size_t slash = rest.find('/');
    std::string_view authority = rest.substr(0, slash);
    if (slash != std::string_view::npos) {
        ep.path = std::string(rest.substr(slash));
    }
    if (authority.find('@') != std::string_view::npos) {
        return bad_url(url, "credentials in URL are not supported");
    }

    std::string_view host;
    std::string_view port;
    if (!authority.empty() && authority.front() == '[') {
        size_t close = authority.find(']');
        if (close == std::string_view::npos) {
            return bad_url(url, "unterminated IPv6 literal");
        }
        host = authority.substr(1, close - 1);
        std::string_view after = authority.substr(close + 1);
        if (!after.empty()) {
            if (after.front() != ':') return bad_url(url, "junk after host");
            port = after.substr(1);
        }
    } else {
        size_t colon = authority.rfind(':');
        host = authority.substr(0, colon);
        if (colon != std::string_view::npos) {
            port = authority.substr(colon + 1);
        }
    }

    if (host.empty()) {
        return bad_url(url, "missing host");
    }
    ep.host = std::string(host);

    if (!port.empty()) {
        unsigned value = 0;
        auto [ptr, ec] = std::from_chars(port.data(), port.data() + port.size(),
                                         value);
        if (ec != std::errc{} || ptr != port.data() + port.size() ||
            value == 0 || value > 65535) {
            return bad_url(url, "bad port");
        }
        ep.port = static_cast<uint16_t>(value);
    }
    return ep;
}

// ---------------------------------------------------------------------------
// Response parsing
// ---------------------------------------------------------------------------

core::Result<HttpResponse> parse_http_response(std::string_view raw) {
    size_t header_end = raw.find("\r\n\r\n");
    if (header_end == std::string_view::npos) {
        return bad_response("no end of headers");
    }
    std::string_view head = raw.substr(0, header_end);
    std::string_view body = raw.substr(header_end + 4);

    size_t eol = head.find("\r\n");
    std::string_view status_line = head.substr(0, eol);
    if (status_line.substr(0, 7) != "HTTP/1." || status_line.size() < 12 ||
        status_line[8] != ' ') {
        return bad_response("bad status line");
    }

    HttpResponse resp;
    auto code = status_line.substr(9, 3);
    auto [ptr, ec] = std::from_chars(code.data(), code.data() + 3, resp.status);
    if (ec != std::errc{} || ptr != code.data() + 3) {
        return bad_response("bad status code");
    }

    bool chunked = false;
    bool has_length = false;
    size_t content_length = 0;

    std::string_view headers =
        eol == std::string_view::npos ? std::string_view{} : head.substr(eol + 2);
    while (!headers.empty()) {
        size_t next = headers.find("\r\n");
        std::string_view line = headers.substr(0, next);
        headers = next == std::string_view::npos ? std::string_view{}
                                                 : headers.substr(next + 2);
        size_t colon = line.find(':');
        if (colon == std::string_view::npos) {
            continue;
        }
        std::string_view name = trim(line.substr(0, colon));
        std::string_view value = trim(line.substr(colon + 1));
        if (iequals(name, "Transfer-Encoding") && iequals(value, "chunked")) {
            chunked = true;
        } else if (iequals(name, "Content-Length")) {
            auto [p, e] = std::from_chars(value.data(), value.data() + value.size(),
                                          content_length);
            if (e != std::errc{} || p != value.data() + value.size()) {
                return bad_response("bad Content-Length");
            }
            has_length = true;
        }
    }

    if (chunked) {
        DTL_TRY_ASSIGN(decoded, decode_chunked(body));
        resp.body = std::move(decoded);
    } else if (has_length) {
        if (body.size() < content_length) {
            return bad_response("body shorter than Content-Length");
        }
        resp.body = std::string(body.substr(0, content_length));
    } else {
        resp.body = std::string(body);
    }
    return resp;
}

// ---------------------------------------------------------------------------
// HttpClient
// ---------------------------------------------------------------------------

HttpClient::HttpClient(Endpoint endpoint, int timeout_ms)
    : endpoint_(std::move(endpoint)), timeout_ms_(timeout_ms) {}

core::Result<HttpResponse> HttpClient::post(const std::string& body,
                                            std::string_view content_type) const {
    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + std::chrono::milliseconds(timeout_ms_);
    auto remaining_ms = [&]() {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - clock::now());
        return static_cast<int>(std::max<int64_t>(left.count(), 0));
    };

    net::Socket sock;
    DTL_TRY_VOID(sock.connect(endpoint_.host, endpoint_.port, timeout_ms_));

    std::string request =
        "POST " + endpoint_.path + " HTTP/1.1\r\n"
        "Host: " + endpoint_.host + ":" + std::to_string(endpoint_.port) + "\r\n"
        "Content-Type: " + std::string(content_type) + "\r\n"
        "Accept: application/json\r\n"
        "Content-Length: " + std::to_string(body.size()) + "\r\n"
        "Connection: close\r\n"
        "\r\n" + body;

    DTL_TRY_VOID(sock.send_all(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(request.data()), request.size())));

    std::string raw;
    uint8_t buf[16384];
    for (;;) {
        int wait = remaining_ms();
        if (wait == 0) {
            return core::Error(core::ErrorCode::NETWORK_TIMEOUT,
                               "no complete response from " +
                               endpoint_.to_string() + " within " +
                               std::to_string(timeout_ms_) + " ms");
        }
        DTL_TRY_ASSIGN(n, sock.recv(buf, wait));
        if (n == 0) {
            break;
        }
        raw.append(reinterpret_cast<const char*>(buf), n);
        if (raw.size() > MAX_HTTP_RESPONSE_SIZE) {
            return bad_response("response exceeds " +
                                std::to_string(MAX_HTTP_RESPONSE_SIZE) +
                                " bytes");
        }
    }

    LOG_TRACE(core::LogCategory::RPC,
              "POST " + endpoint_.to_string() + ": sent " +
              std::to_string(body.size()) + " bytes, received " +
              std::to_string(raw.size()));
    return parse_http_response(raw);
}

} // namespace rpc
