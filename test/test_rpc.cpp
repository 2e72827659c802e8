// Copyright (c) 2024-2026 The DTL Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// Unit tests for the JSON model, the HTTP/1.1 client and the JSON-RPC
// client framing.

#include "test_framework.h"

#include "core/error.h"
#include "rpc/client.h"
#include "rpc/http_client.h"
#include "rpc/json.h"

#include <cstdint>
#include <string>

// ============================================================================
// JSON
// ============================================================================

TEST_CASE(Json, parse_and_serialize_sorted) {
    auto v = rpc::parse_json(R"( { "b" : 1, "a" : [true, null, "x\"y", -2.5] } )");
    CHECK(v.is_object());
    CHECK_EQ(v["b"].get_int(), 1);
    CHECK_EQ(v["a"].size(), 4u);
    CHECK(v["a"][1].is_null());
    CHECK_EQ(v["a"][2].get_string(), std::string("x\"y"));
    CHECK_EQ(rpc::json_serialize(v),
             std::string(R"({"a":[true,null,"x\"y",-2.5],"b":1})"));
}

TEST_CASE(Json, string_escapes) {
    auto v = rpc::parse_json(R"("tab\tline\nslash\/uA")");
    CHECK_EQ(v.get_string(), std::string("tab\tline\nslash/uA"));
    CHECK_EQ(rpc::json_serialize(rpc::JsonValue(std::string("a\x01" "b"))),
             std::string(R"("a\u0001b")"));
}

TEST_CASE(Json, numbers) {
    CHECK(rpc::parse_json("9223372036854775807").is_int());
    CHECK(rpc::parse_json("18446744073709551615").is_double());
    CHECK(rpc::parse_json("1e3").is_double());

    rpc::JsonValue big(uint64_t{UINT64_MAX});
    CHECK(big.is_double());
    rpc::JsonValue small(uint64_t{42});
    CHECK(small.is_int());
    CHECK_EQ(small.get_int(), 42);
}

TEST_CASE(Json, malformed_input_is_rejected) {
    CHECK_ERR_CODE(rpc::try_parse_json("{"), core::ErrorCode::PARSE_ERROR);
    CHECK_ERR_CODE(rpc::try_parse_json("[1,]"), core::ErrorCode::PARSE_ERROR);
    CHECK_ERR_CODE(rpc::try_parse_json("{} x"), core::ErrorCode::PARSE_ERROR);
    CHECK_ERR_CODE(rpc::try_parse_json("tru"), core::ErrorCode::PARSE_ERROR);
    CHECK_ERR_CODE(rpc::try_parse_json(""), core::ErrorCode::PARSE_ERROR);
}

TEST_CASE(Json, nesting_is_bounded) {
    std::string shallow = std::string(10, '[') + std::string(10, ']');
    CHECK_OK(rpc::try_parse_json(shallow));

    std::string deep = std::string(200, '[') + std::string(200, ']');
    CHECK_ERR(rpc::try_parse_json(deep));
}

TEST_CASE(Json, missing_member_reads_as_null) {
    const rpc::JsonValue v = rpc::parse_json(R"({"a":1})");
    CHECK(v["missing"].is_null());
    CHECK(!v.has_key("missing"));
    CHECK_EQ(v.size(), 1u);
}

// ============================================================================
// Endpoint
// ============================================================================

TEST_CASE(Endpoint, parse_full_url) {
    auto ep = rpc::parse_endpoint("http://l2geth:8545/rpc/v1");
    CHECK_OK(ep);
    CHECK_EQ(ep.value().host, std::string("l2geth"));
    CHECK_EQ(ep.value().port, 8545);
    CHECK_EQ(ep.value().path, std::string("/rpc/v1"));
    CHECK_EQ(ep.value().to_string(), std::string("http://l2geth:8545/rpc/v1"));
}

TEST_CASE(Endpoint, defaults_and_ipv6) {
    auto plain = rpc::parse_endpoint("HTTP://example.org");
    CHECK_OK(plain);
    CHECK_EQ(plain.value().port, 80);
    CHECK_EQ(plain.value().path, std::string("/"));

    auto v6 = rpc::parse_endpoint("http://[::1]:9545");
    CHECK_OK(v6);
    CHECK_EQ(v6.value().host, std::string("::1"));
    CHECK_EQ(v6.value().port, 9545);
    CHECK_EQ(v6.value().to_string(), std::string("http://[::1]:9545/"));
}

TEST_CASE(Endpoint, rejects_bad_urls) {
    CHECK_ERR_CODE(rpc::parse_endpoint("https://secure:443"),
                   core::ErrorCode::INVALID_ARGUMENT);
    CHECK_ERR_CODE(rpc::parse_endpoint("l2geth:8545"),
                   core::ErrorCode::INVALID_ARGUMENT);
    CHECK_ERR_CODE(rpc::parse_endpoint("http://:8545"),
                   core::ErrorCode::INVALID_ARGUMENT);
    CHECK_ERR_CODE(rpc::parse_endpoint("http://host:0"),
                   core::ErrorCode::INVALID_ARGUMENT);
    CHECK_ERR_CODE(rpc::parse_endpoint("http://host:70000"),
                   core::ErrorCode::INVALID_ARGUMENT);
    CHECK_ERR_CODE(rpc::parse_endpoint("http://user:pw@host:1"),
                   core::ErrorCode::INVALID_ARGUMENT);
    CHECK_ERR_CODE(rpc::parse_endpoint("http://[::1:80"),
                   core::ErrorCode::INVALID_ARGUMENT);
}

// ============================================================================
// HTTP response parsing
// ============================================================================

TEST_CASE(Http, content_length_body) {
    auto r = rpc::parse_http_response(
        "HTTP/1.1 200 OK\r\n"
        "Content-Type: application/json\r\n"
        "content-length: 5\r\n"
        "\r\n"
        "hello-extra");
    CHECK_OK(r);
    CHECK_EQ(r.value().status, 200);
    CHECK_EQ(r.value().body, std::string("hello"));
}

TEST_CASE(Http, chunked_body) {
    auto r = rpc::parse_http_response(
        "HTTP/1.1 200 OK\r\n"
        "Transfer-Encoding: chunked\r\n"
        "\r\n"
        "4\r\n{\"a\"\r\n"
        "3;ext=1\r\n:1}\r\n"
        "0\r\n\r\n");
    CHECK_OK(r);
    CHECK_EQ(r.value().body, std::string("{\"a\":1}"));
}

TEST_CASE(Http, body_until_close) {
    auto r = rpc::parse_http_response("HTTP/1.0 503 Busy\r\n\r\ntry later");
    CHECK_OK(r);
    CHECK_EQ(r.value().status, 503);
    CHECK_EQ(r.value().body, std::string("try later"));
}

TEST_CASE(Http, malformed_responses) {
    CHECK_ERR_CODE(rpc::parse_http_response("HTTP/1.1 200 OK\r\n"),
                   core::ErrorCode::RPC_INVALID_RESPONSE);
    CHECK_ERR_CODE(rpc::parse_http_response("SPDY/3 200 OK\r\n\r\n"),
                   core::ErrorCode::RPC_INVALID_RESPONSE);
    CHECK_ERR_CODE(rpc::parse_http_response(
                       "HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\nshort"),
                   core::ErrorCode::RPC_INVALID_RESPONSE);
    CHECK_ERR_CODE(rpc::parse_http_response(
                       "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n"
                       "zz\r\n"),
                   core::ErrorCode::RPC_INVALID_RESPONSE);
}

TEST_CASE(Http, unreachable_endpoint_is_network_error) {
    rpc::Endpoint ep;
    ep.host = "127.0.0.1";
    ep.port = 1;
    rpc::HttpClient client(ep, 2000);
    auto r = client.post("{}");
    CHECK_ERR(r);
    if (!r.ok()) {
        CHECK(core::is_rpc_error(r.error().code()));
    }
}

// ============================================================================
// JSON-RPC framing
// ============================================================================

TEST_CASE(JsonRpc, build_request_shape) {
    rpc::JsonValue params;
    params.push_back("0x2");
    params.push_back(true);
    auto req = rpc::build_request("eth_getBlockByNumber", params, 7);
    CHECK_EQ(rpc::json_serialize(req),
             std::string(R"({"id":7,"jsonrpc":"2.0","method":"eth_getBlockByNumber","params":["0x2",true]})"));

    auto no_params = rpc::build_request("eth_blockNumber", rpc::JsonValue(), 1);
    CHECK(no_params["params"].is_array());
    CHECK_EQ(no_params["params"].size(), 0u);
}

TEST_CASE(JsonRpc, parse_response_result) {
    auto r = rpc::parse_response(R"({"jsonrpc":"2.0","id":1,"result":"0x10"})", 200);
    CHECK_OK(r);
    CHECK_EQ(r.value().get_string(), std::string("0x10"));

    auto null_result = rpc::parse_response(R"({"jsonrpc":"2.0","id":1,"result":null})", 200);
    CHECK_OK(null_result);
    CHECK(null_result.value().is_null());
}

TEST_CASE(JsonRpc, parse_response_failures) {
    CHECK_ERR_CODE(rpc::parse_response(
                       R"({"jsonrpc":"2.0","id":1,"error":{"code":-32601,"message":"method not found"}})",
                       200),
                   core::ErrorCode::RPC_REMOTE_ERROR);
    // A JSON-RPC error wins over the HTTP status.
    CHECK_ERR_CODE(rpc::parse_response(
                       R"({"jsonrpc":"2.0","id":1,"error":{"code":-32000,"message":"busy"}})",
                       500),
                   core::ErrorCode::RPC_REMOTE_ERROR);
    CHECK_ERR_CODE(rpc::parse_response("Bad Gateway", 502),
                   core::ErrorCode::RPC_ERROR);
    CHECK_ERR_CODE(rpc::parse_response("<html>", 200),
                   core::ErrorCode::RPC_INVALID_RESPONSE);
    CHECK_ERR_CODE(rpc::parse_response(R"({"jsonrpc":"2.0","id":1})", 200),
                   core::ErrorCode::RPC_INVALID_RESPONSE);
    CHECK_ERR_CODE(rpc::parse_response("[1,2]", 200),
                   core::ErrorCode::RPC_INVALID_RESPONSE);
}
