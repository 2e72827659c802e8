#pragma once
// Copyright (c) 2024-2026 The DTL Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// SHA3-256 wrapper around the OpenSSL 3.0+ EVP API.
//
// Used to checksum storage log records. The primitive is NIST SHA3-256
// (FIPS 202).
// ---------------------------------------------------------------------------

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

struct evp_md_ctx_st;       // EVP_MD_CTX
typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace crypto {

using Hash256 = std::array<uint8_t, 32>;

/// One-shot SHA3-256. Throws std::runtime_error if OpenSSL fails.
[[nodiscard]] Hash256 sha3_256(std::span<const uint8_t> data);

/// Move-only incremental hasher backed by an EVP_MD_CTX. Feed data with
/// write(), obtain the digest with finalize(), reset() to reuse.
class Sha3Hasher {
public:
    Sha3Hasher();
    ~Sha3Hasher();

    Sha3Hasher(const Sha3Hasher&) = delete;
    Sha3Hasher& operator=(const Sha3Hasher&) = delete;

    Sha3Hasher(Sha3Hasher&& other) noexcept;
    Sha3Hasher& operator=(Sha3Hasher&& other) noexcept;

    Sha3Hasher& write(std::span<const uint8_t> data);

    [[nodiscard]] Hash256 finalize();

    void reset();

private:
    EVP_MD_CTX* ctx_ = nullptr;
    bool finalized_ = false;
};

}  // namespace crypto
