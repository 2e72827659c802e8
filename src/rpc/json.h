#pragma once
// Copyright (c) 2024-2026 The DTL Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DTL_RPC_JSON_H
#define DTL_RPC_JSON_H

#include "core/error.h"

#include <cstdint>
#include <limits>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace rpc {

// ---------------------------------------------------------------------------
// JsonValue -- JSON document model shared by the RPC client and the store
// ---------------------------------------------------------------------------
// A variant of: null, bool, int64_t, double, string, array, object.
// Objects are std::map so serialization emits keys in sorted order, which
// makes the serialized form of a record deterministic.
// ---------------------------------------------------------------------------

struct NullValue {
    bool operator==(const NullValue&) const { return true; }
};

class JsonValue {
public:
    using Array  = std::vector<JsonValue>;
    using Object = std::map<std::string, JsonValue>;

private:
    using Storage = std::variant<NullValue, bool, int64_t, double,
                                 std::string, Array, Object>;
    Storage storage_;

public:
    JsonValue()                        : storage_(NullValue{}) {}
    JsonValue(std::nullptr_t)          : storage_(NullValue{}) {}  // NOLINT
    JsonValue(bool v)                  : storage_(v) {}            // NOLINT
    JsonValue(int v)                   : storage_(static_cast<int64_t>(v)) {} // NOLINT
    JsonValue(int64_t v)               : storage_(v) {}            // NOLINT
    // Values above INT64_MAX degrade to double.
    JsonValue(uint64_t v)                                          // NOLINT
        : storage_(v > static_cast<uint64_t>(
                           std::numeric_limits<int64_t>::max())
                       ? Storage(static_cast<double>(v))
                       : Storage(static_cast<int64_t>(v))) {}
    JsonValue(double v)                : storage_(v) {}            // NOLINT
    JsonValue(const char* v)           : storage_(std::string(v)) {} // NOLINT
    JsonValue(std::string v)           : storage_(std::move(v)) {} // NOLINT
    JsonValue(std::string_view v)      : storage_(std::string(v)) {} // NOLINT
    JsonValue(Array v)                 : storage_(std::move(v)) {} // NOLINT
    JsonValue(Object v)                : storage_(std::move(v)) {} // NOLINT

    [[nodiscard]] bool is_null()   const { return std::holds_alternative<NullValue>(storage_); }
    [[nodiscard]] bool is_bool()   const { return std::holds_alternative<bool>(storage_); }
    [[nodiscard]] bool is_int()    const { return std::holds_alternative<int64_t>(storage_); }
    [[nodiscard]] bool is_double() const { return std::holds_alternative<double>(storage_); }
    [[nodiscard]] bool is_string() const { return std::holds_alternative<std::string>(storage_); }
    [[nodiscard]] bool is_array()  const { return std::holds_alternative<Array>(storage_); }
    [[nodiscard]] bool is_object() const { return std::holds_alternative<Object>(storage_); }

    // -- Accessors (throw std::runtime_error on type mismatch) --------------

    [[nodiscard]] bool get_bool() const {
        if (auto* p = std::get_if<bool>(&storage_)) return *p;
        throw std::runtime_error("JsonValue: not a bool");
    }
    [[nodiscard]] int64_t get_int() const {
        if (auto* p = std::get_if<int64_t>(&storage_)) return *p;
        throw std::runtime_error("JsonValue: not an integer");
    }
    [[nodiscard]] double get_double() const {
        if (auto* p = std::get_if<double>(&storage_)) return *p;
        if (auto* p = std::get_if<int64_t>(&storage_)) return static_cast<double>(*p);
        throw std::runtime_error("JsonValue: not a number");
    }
    [[nodiscard]] const std::string& get_string() const {
        if (auto* p = std::get_if<std::string>(&storage_)) return *p;
        throw std::runtime_error("JsonValue: not a string");
    }
    [[nodiscard]] const Array& get_array() const {
        if (auto* p = std::get_if<Array>(&storage_)) return *p;
        throw std::runtime_error("JsonValue: not an array");
    }
    [[nodiscard]] Array& get_array() {
        if (auto* p = std::get_if<Array>(&storage_)) return *p;
        throw std::runtime_error("JsonValue: not an array");
    }
    [[nodiscard]] const Object& get_object() const {
        if (auto* p = std::get_if<Object>(&storage_)) return *p;
        throw std::runtime_error("JsonValue: not an object");
    }

    /// Object member access; a null value becomes an empty object first.
    JsonValue& operator[](const std::string& key) {
        if (is_null()) storage_ = Object{};
        return std::get<Object>(storage_)[key];
    }

    /// Read-only member access; yields null for missing keys and non-objects.
    const JsonValue& operator[](const std::string& key) const {
        static const JsonValue null_val;
        if (!is_object()) return null_val;
        auto& obj = std::get<Object>(storage_);
        auto it = obj.find(key);
        return (it != obj.end()) ? it->second : null_val;
    }

    const JsonValue& operator[](size_t index) const {
        return get_array().at(index);
    }

    void push_back(JsonValue val) {
        if (is_null()) storage_ = Array{};
        std::get<Array>(storage_).push_back(std::move(val));
    }

    [[nodiscard]] bool has_key(const std::string& key) const {
        if (!is_object()) return false;
        return std::get<Object>(storage_).count(key) > 0;
    }

    [[nodiscard]] size_t size() const {
        if (is_array())  return std::get<Array>(storage_).size();
        if (is_object()) return std::get<Object>(storage_).size();
        if (is_string()) return std::get<std::string>(storage_).size();
        return 0;
    }

    bool operator==(const JsonValue& other) const { return storage_ == other.storage_; }
    bool operator!=(const JsonValue& other) const { return storage_ != other.storage_; }
};

/// Nesting deeper than this is rejected by the parser.
inline constexpr int MAX_JSON_DEPTH = 64;

/// Parse a JSON document. Throws std::runtime_error on malformed input.
JsonValue parse_json(std::string_view input);

/// Non-throwing parse; malformed input yields PARSE_ERROR.
core::Result<JsonValue> try_parse_json(std::string_view input);

/// Compact serialization with object keys in sorted order.
std::string json_serialize(const JsonValue& val);

} // namespace rpc

#endif // DTL_RPC_JSON_H
