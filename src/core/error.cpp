// Copyright (c) 2024-2026 The DTL Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"

#include <sstream>

namespace core {

// ---------------------------------------------------------------------------
// error_code_name: human-readable label for every ErrorCode variant
// ---------------------------------------------------------------------------
std::string_view error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::NONE:                 return "NONE";

        case ErrorCode::PARSE_ERROR:          return "PARSE_ERROR";
        case ErrorCode::PARSE_BAD_FORMAT:     return "PARSE_BAD_FORMAT";

        case ErrorCode::INVALID_ARGUMENT:     return "INVALID_ARGUMENT";
        case ErrorCode::CONFIG_ERROR:         return "CONFIG_ERROR";

        case ErrorCode::NETWORK_ERROR:        return "NETWORK_ERROR";
        case ErrorCode::NETWORK_TIMEOUT:      return "NETWORK_TIMEOUT";
        case ErrorCode::NETWORK_REFUSED:      return "NETWORK_REFUSED";
        case ErrorCode::NETWORK_CLOSED:       return "NETWORK_CLOSED";

        case ErrorCode::CRYPTO_ERROR:         return "CRYPTO_ERROR";

        case ErrorCode::STORAGE_ERROR:        return "STORAGE_ERROR";
        case ErrorCode::STORAGE_NOT_FOUND:    return "STORAGE_NOT_FOUND";
        case ErrorCode::STORAGE_CORRUPT:      return "STORAGE_CORRUPT";
        case ErrorCode::STORAGE_LOCKED:       return "STORAGE_LOCKED";

        case ErrorCode::DECODE_ERROR:         return "DECODE_ERROR";

        case ErrorCode::RPC_ERROR:            return "RPC_ERROR";
        case ErrorCode::RPC_INVALID_RESPONSE: return "RPC_INVALID_RESPONSE";
        case ErrorCode::RPC_REMOTE_ERROR:     return "RPC_REMOTE_ERROR";

        case ErrorCode::INTERNAL_ERROR:       return "INTERNAL_ERROR";
    }

    return "UNKNOWN";
}

bool is_rpc_error(ErrorCode code) noexcept {
    auto v = static_cast<uint16_t>(code);
    return (v >= 300 && v < 400) || (v >= 700 && v < 800);
}

// ---------------------------------------------------------------------------
// Error::format: build a diagnostic string including source location
// ---------------------------------------------------------------------------
std::string Error::format() const {
    if (code_ == ErrorCode::NONE) {
        return "no error";
    }

    std::ostringstream oss;
    oss << error_code_name(code_)
        << '(' << static_cast<uint16_t>(code_) << ')';

    if (!message_.empty()) {
        oss << ": " << message_;
    }

    const char* file = location_.file_name();
    if (file && file[0] != '\0') {
        oss << " [" << file << ':' << location_.line() << ']';
    }

    return oss.str();
}

} // namespace core
