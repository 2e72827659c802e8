// Copyright (c) 2024-2026 The DTL Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "rpc/json.h"

#include <charconv>
#include <cmath>
#include <cstdio>
#include <stdexcept>

namespace rpc {

namespace {

[[noreturn]] void fail(const std::string& what) {
    throw std::runtime_error("JSON: " + what);
}

bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

// ---------------------------------------------------------------------------
// Parser -- recursive descent over a string_view, RFC 8259 grammar
// ---------------------------------------------------------------------------
class Parser {
public:
    explicit Parser(std::string_view input) : in_(input) {}

    JsonValue parse_document() {
        JsonValue val = parse_value(0);
        skip_ws();
        if (pos_ != in_.size()) {
            fail("trailing content at offset " + std::to_string(pos_));
        }
        return val;
    }

private:
    std::string_view in_;
    size_t pos_ = 0;

    bool at_end() const { return pos_ >= in_.size(); }

    char next() {
        if (at_end()) fail("unexpected end of input");
        return in_[pos_++];
    }

    void skip_ws() {
        while (!at_end()) {
            char c = in_[pos_];
            if (c != ' ' && c != '\t' && c != '\r' && c != '\n') break;
            ++pos_;
        }
    }

    bool consume(char c) {
        skip_ws();
        if (!at_end() && in_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    void require(char c) {
        if (!consume(c)) {
            fail(std::string("expected '") + c + "' at offset " +
                 std::to_string(pos_));
        }
    }

    void literal(std::string_view word) {
        if (in_.substr(pos_, word.size()) != word) fail("invalid literal");
        pos_ += word.size();
    }

    JsonValue parse_value(int depth) {
        if (depth > MAX_JSON_DEPTH) fail("nesting too deep");
        skip_ws();
        if (at_end()) fail("unexpected end of input");

        switch (in_[pos_]) {
            case '"': return JsonValue(parse_string());
            case '{': return parse_object(depth);
            case '[': return parse_array(depth);
            case 't': literal("true");  return JsonValue(true);
            case 'f': literal("false"); return JsonValue(false);
            case 'n': literal("null");  return JsonValue(nullptr);
            default:  return parse_number();
        }
    }

    void skip_digits() {
        while (!at_end() && is_digit(in_[pos_])) ++pos_;
    }

    JsonValue parse_number() {
        size_t start = pos_;
        bool integral = true;

        if (!at_end() && in_[pos_] == '-') ++pos_;
        if (at_end() || !is_digit(in_[pos_])) fail("invalid number");
        if (in_[pos_] == '0') {
            ++pos_;
        } else {
            skip_digits();
        }
        if (!at_end() && in_[pos_] == '.') {
            integral = false;
            ++pos_;
            if (at_end() || !is_digit(in_[pos_])) fail("invalid fraction");
            skip_digits();
        }
        if (!at_end() && (in_[pos_] == 'e' || in_[pos_] == 'E')) {
            integral = false;
            ++pos_;
            if (!at_end() && (in_[pos_] == '+' || in_[pos_] == '-')) ++pos_;
            if (at_end() || !is_digit(in_[pos_])) fail("invalid exponent");
            skip_digits();
        }

        const char* first = in_.data() + start;
        const char* last = in_.data() + pos_;
        if (integral) {
            int64_t i = 0;
            auto [ptr, ec] = std::from_chars(first, last, i);
            if (ec == std::errc{} && ptr == last) return JsonValue(i);
            // Out of int64 range: fall through to double.
        }
        double d = 0.0;
        auto [ptr, ec] = std::from_chars(first, last, d);
        if (ec != std::errc{} || ptr != last) fail("unparsable number");
        return JsonValue(d);
    }

    uint32_t read_hex4() {
        uint32_t v = 0;
        for (int i = 0; i < 4; ++i) {
            char h = next();
            v <<= 4;
            if (is_digit(h)) v |= static_cast<uint32_t>(h - '0');
            else if (h >= 'a' && h <= 'f') v |= static_cast<uint32_t>(h - 'a' + 10);
            else if (h >= 'A' && h <= 'F') v |= static_cast<uint32_t>(h - 'A' + 10);
            else fail("invalid \\u escape");
        }
        return v;
    }

    uint32_t read_code_point() {
        uint32_t cp = read_hex4();
        if (cp >= 0xD800 && cp <= 0xDBFF) {
            if (next() != '\\' || next() != 'u') fail("missing low surrogate");
            uint32_t lo = read_hex4();
            if (lo < 0xDC00 || lo > 0xDFFF) fail("invalid low surrogate");
            cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
        } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
            fail("unpaired low surrogate");
        }
        return cp;
    }

    std::string parse_string() {
        require('"');
        std::string out;
        for (;;) {
            char c = next();
            if (c == '"') return out;
            if (static_cast<unsigned char>(c) < 0x20) {
                fail("control character in string");
            }
            if (c != '\\') {
                out += c;
                continue;
            }
            char esc = next();
            switch (esc) {
                case '"':  out += '"';  break;
                case '\\': out += '\\'; break;
                case '/':  out += '/';  break;
                case 'b':  out += '\b'; break;
                case 'f':  out += '\f'; break;
                case 'n':  out += '\n'; break;
                case 'r':  out += '\r'; break;
                case 't':  out += '\t'; break;
                case 'u':  append_utf8(out, read_code_point()); break;
                default:
                    fail(std::string("invalid escape '\\") + esc + "'");
            }
        }
    }

    JsonValue parse_array(int depth) {
        require('[');
        JsonValue::Array arr;
        if (consume(']')) return JsonValue(std::move(arr));
        do {
            arr.push_back(parse_value(depth + 1));
        } while (consume(','));
        require(']');
        return JsonValue(std::move(arr));
    }

    JsonValue parse_object(int depth) {
        require('{');
        JsonValue::Object obj;
        if (consume('}')) return JsonValue(std::move(obj));
        do {
            skip_ws();
            std::string key = parse_string();
            require(':');
            obj.insert_or_assign(std::move(key), parse_value(depth + 1));
        } while (consume(','));
        require('}');
        return JsonValue(std::move(obj));
    }
};

// ---------------------------------------------------------------------------
// Serializer
// ---------------------------------------------------------------------------

void write_string(std::string& out, const std::string& s) {
    out += '"';
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b";  break;
            case '\f': out += "\\f";  break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x",
                                  static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    out += '"';
}

void write_value(std::string& out, const JsonValue& val) {
    if (val.is_null()) {
        out += "null";
    } else if (val.is_bool()) {
        out += val.get_bool() ? "true" : "false";
    } else if (val.is_int()) {
        out += std::to_string(val.get_int());
    } else if (val.is_double()) {
        double d = val.get_double();
        if (!std::isfinite(d)) {
            out += "null";
        } else {
            char buf[32];
            auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), d);
            out.append(buf, ec == std::errc{} ? ptr : buf);
        }
    } else if (val.is_string()) {
        write_string(out, val.get_string());
    } else if (val.is_array()) {
        out += '[';
        bool first = true;
        for (const auto& item : val.get_array()) {
            if (!first) out += ',';
            first = false;
            write_value(out, item);
        }
        out += ']';
    } else {
        out += '{';
        bool first = true;
        for (const auto& [key, item] : val.get_object()) {
            if (!first) out += ',';
            first = false;
            write_string(out, key);
            out += ':';
            write_value(out, item);
        }
        out += '}';
    }
}

} // namespace

JsonValue parse_json(std::string_view input) {
    Parser parser(input);
    return parser.parse_document();
}

core::Result<JsonValue> try_parse_json(std::string_view input) {
    try {
        return parse_json(input);
    } catch (const std::runtime_error& e) {
        return core::Error(core::ErrorCode::PARSE_ERROR, e.what());
    }
}

std::string json_serialize(const JsonValue& val) {
    std::string out;
    out.reserve(256);
    write_value(out, val);
    return out;
}

} // namespace rpc
