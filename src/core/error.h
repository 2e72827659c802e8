#pragma once
// Copyright (c) 2024-2026 The DTL Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <cstdint>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace core {

// ErrorCode: categorized error codes for the DTL stack
enum class ErrorCode : uint16_t {
    NONE                 = 0,
    // Parsing (100-199)
    PARSE_ERROR          = 100, PARSE_BAD_FORMAT = 101,
    // Caller / startup input (200-299)
    INVALID_ARGUMENT     = 200, CONFIG_ERROR     = 201,
    // Network transport (300-399)
    NETWORK_ERROR        = 300, NETWORK_TIMEOUT  = 301,
    NETWORK_REFUSED      = 302, NETWORK_CLOSED   = 303,
    // Cryptography (400-499)
    CRYPTO_ERROR         = 400,
    // Storage (500-599)
    STORAGE_ERROR        = 500, STORAGE_NOT_FOUND = 501,
    STORAGE_CORRUPT      = 502, STORAGE_LOCKED    = 503,
    // Block decoding (600-699)
    DECODE_ERROR         = 600,
    // Remote JSON-RPC endpoint (700-799)
    RPC_ERROR            = 700, RPC_INVALID_RESPONSE = 701,
    RPC_REMOTE_ERROR     = 702,
    // Internal (900-999)
    INTERNAL_ERROR       = 900,
};

[[nodiscard]] std::string_view error_code_name(ErrorCode code) noexcept;

/// True for every code the remote endpoint path can produce: socket
/// transport failures and JSON-RPC level failures.
[[nodiscard]] bool is_rpc_error(ErrorCode code) noexcept;

// Error: rich error value carrying code, message, and origin location
class Error {
public:
    Error() noexcept : code_(ErrorCode::NONE) {}

    explicit Error(
        ErrorCode code,
        std::string message = {},
        std::source_location loc = std::source_location::current()) noexcept
        : code_(code), message_(std::move(message)), location_(loc) {}

    [[nodiscard]] ErrorCode          code()    const noexcept { return code_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }
    [[nodiscard]] const std::source_location& location() const noexcept {
        return location_;
    }
    [[nodiscard]] bool is_ok() const noexcept { return code_ == ErrorCode::NONE; }
    [[nodiscard]] bool is(ErrorCode c) const noexcept { return code_ == c; }
    [[nodiscard]] explicit operator bool() const noexcept { return !is_ok(); }
    [[nodiscard]] std::string format() const;

    bool operator==(const Error& o) const noexcept { return code_ == o.code_; }
    bool operator!=(const Error& o) const noexcept { return code_ != o.code_; }

private:
    ErrorCode            code_;
    std::string          message_;
    std::source_location location_;
};

// Result<T, E>: a sum type holding either a value T or an error E
template <typename T, typename E = Error>
class Result {
    static_assert(!std::is_same_v<T, E>,
                  "Result value and error types must differ");
public:
    Result(const T& val) : storage_(val) {}             // NOLINT implicit
    Result(T&& val) : storage_(std::move(val)) {}       // NOLINT implicit
    Result(const E& err) : storage_(err) {}             // NOLINT implicit
    Result(E&& err) : storage_(std::move(err)) {}       // NOLINT implicit

    Result(const Result&)            = default;
    Result(Result&&) noexcept        = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) noexcept = default;
    ~Result()                        = default;

    [[nodiscard]] bool ok() const noexcept {
        return std::holds_alternative<T>(storage_);
    }
    [[nodiscard]] explicit operator bool() const noexcept { return ok(); }

    [[nodiscard]] T& value() & {
        if (!ok()) throw std::runtime_error("Result::value() on error");
        return std::get<T>(storage_);
    }
    [[nodiscard]] const T& value() const& {
        if (!ok()) throw std::runtime_error("Result::value() on error");
        return std::get<T>(storage_);
    }
    [[nodiscard]] T&& value() && {
        if (!ok()) throw std::runtime_error("Result::value() on error");
        return std::get<T>(std::move(storage_));
    }
    [[nodiscard]] E& error() & {
        if (ok()) throw std::runtime_error("Result::error() on value");
        return std::get<E>(storage_);
    }
    [[nodiscard]] const E& error() const& {
        if (ok()) throw std::runtime_error("Result::error() on value");
        return std::get<E>(storage_);
    }
    [[nodiscard]] E&& error() && {
        if (ok()) throw std::runtime_error("Result::error() on value");
        return std::get<E>(std::move(storage_));
    }

    [[nodiscard]] T value_or(T default_val) const {
        return ok() ? std::get<T>(storage_) : std::move(default_val);
    }

    // and_then: Result<T,E> -> (T -> Result<U,E>) -> Result<U,E>
    template <typename F>
    [[nodiscard]] auto and_then(F&& func) const&
        -> std::invoke_result_t<F, const T&> {
        using R = std::invoke_result_t<F, const T&>;
        if (ok()) return func(std::get<T>(storage_));
        return R{std::get<E>(storage_)};
    }

private:
    std::variant<T, E> storage_;
};

// Void-specialization: Result<void, E> for side-effect-only operations
template <typename E>
class Result<void, E> {
public:
    Result() noexcept : storage_(Void{}) {}
    Result(const E& err) : storage_(err) {}             // NOLINT implicit
    Result(E&& err) : storage_(std::move(err)) {}       // NOLINT implicit

    Result(const Result&)            = default;
    Result(Result&&) noexcept        = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) noexcept = default;
    ~Result()                        = default;

    [[nodiscard]] bool ok() const noexcept {
        return std::holds_alternative<Void>(storage_);
    }
    [[nodiscard]] explicit operator bool() const noexcept { return ok(); }

    void value() const {
        if (!ok()) throw std::runtime_error("Result::value() on error");
    }
    [[nodiscard]] E& error() & {
        if (ok()) throw std::runtime_error("Result::error() on value");
        return std::get<E>(storage_);
    }
    [[nodiscard]] const E& error() const& {
        if (ok()) throw std::runtime_error("Result::error() on value");
        return std::get<E>(storage_);
    }
    [[nodiscard]] E&& error() && {
        if (ok()) throw std::runtime_error("Result::error() on value");
        return std::get<E>(std::move(storage_));
    }

private:
    struct Void {};
    std::variant<Void, E> storage_;
};

// Factory helpers
[[nodiscard]] inline Error make_error(
    ErrorCode code,
    std::string message = {},
    std::source_location loc = std::source_location::current()) noexcept {
    return Error(code, std::move(message), loc);
}

[[nodiscard]] inline Result<void> make_ok() noexcept {
    return Result<void>{};
}

// DTL_TRY: propagate errors (GCC/Clang statement-expression)
// Usage:  auto val = DTL_TRY(some_result_expr);
#define DTL_TRY(expr)                                                     \
    ({                                                                    \
        auto&& _dtl_res = (expr);                                         \
        if (!_dtl_res.ok()) return std::move(_dtl_res).error();           \
        std::move(_dtl_res).value();                                      \
    })

// DTL_TRY_ASSIGN: portable alternative (no statement-expressions)
// Usage:  DTL_TRY_ASSIGN(val, some_result_expr);
#define DTL_TRY_ASSIGN(var, expr)                                         \
    auto _dtl_tmp_##var = (expr);                                         \
    if (!_dtl_tmp_##var.ok())                                             \
        return std::move(_dtl_tmp_##var).error();                         \
    auto var = std::move(_dtl_tmp_##var).value()

// DTL_TRY_VOID: propagate errors from Result<void> expressions
#define DTL_TRY_VOID(expr)                                                \
    do {                                                                  \
        auto _dtl_tmp = (expr);                                           \
        if (!_dtl_tmp.ok()) return std::move(_dtl_tmp).error();           \
    } while (false)

} // namespace core
