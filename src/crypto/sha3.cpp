// Copyright (c) 2024-2026 The DTL Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "crypto/sha3.h"

#include <stdexcept>
#include <string>

#include <openssl/evp.h>

namespace crypto {

namespace {

void check_ossl(int rc, const char* what) {
    if (rc != 1) {
        throw std::runtime_error(std::string("sha3_256: ") + what +
                                 " failed");
    }
}

}  // namespace

Hash256 sha3_256(std::span<const uint8_t> data) {
    Sha3Hasher hasher;
    hasher.write(data);
    return hasher.finalize();
}

// ===================================================================
// Sha3Hasher
// ===================================================================

Sha3Hasher::Sha3Hasher() {
    ctx_ = EVP_MD_CTX_new();
    if (!ctx_) {
        throw std::runtime_error(
            "Sha3Hasher: EVP_MD_CTX_new() allocation failed");
    }
    if (EVP_DigestInit_ex(ctx_, EVP_sha3_256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx_);
        ctx_ = nullptr;
        throw std::runtime_error(
            "Sha3Hasher: EVP_DigestInit_ex() failed");
    }
}

Sha3Hasher::~Sha3Hasher() {
    if (ctx_) {
        EVP_MD_CTX_free(ctx_);
    }
}

Sha3Hasher::Sha3Hasher(Sha3Hasher&& other) noexcept
    : ctx_(other.ctx_), finalized_(other.finalized_) {
    other.ctx_ = nullptr;
    other.finalized_ = true;
}

Sha3Hasher& Sha3Hasher::operator=(
    Sha3Hasher&& other) noexcept {
    if (this != &other) {
        if (ctx_) {
            EVP_MD_CTX_free(ctx_);
        }
        ctx_ = other.ctx_;
        finalized_ = other.finalized_;
        other.ctx_ = nullptr;
        other.finalized_ = true;
    }
    return *this;
}

Sha3Hasher& Sha3Hasher::write(std::span<const uint8_t> data) {
    if (!ctx_ || finalized_) {
        throw std::runtime_error(
            "Sha3Hasher::write(): context already finalised");
    }
    if (!data.empty()) {
        check_ossl(EVP_DigestUpdate(ctx_, data.data(), data.size()),
                   "EVP_DigestUpdate()");
    }
    return *this;
}

Hash256 Sha3Hasher::finalize() {
    if (!ctx_ || finalized_) {
        throw std::runtime_error(
            "Sha3Hasher::finalize(): context already finalised");
    }

    Hash256 out{};
    unsigned int digest_len = 0;
    check_ossl(EVP_DigestFinal_ex(ctx_, out.data(), &digest_len),
               "EVP_DigestFinal_ex()");
    if (digest_len != out.size()) {
        throw std::runtime_error("sha3_256: unexpected digest length");
    }
    finalized_ = true;
    return out;
}

void Sha3Hasher::reset() {
    if (!ctx_) {
        ctx_ = EVP_MD_CTX_new();
        if (!ctx_) {
            throw std::runtime_error(
                "Sha3Hasher::reset(): EVP_MD_CTX_new() allocation failed");
        }
    }
    check_ossl(EVP_DigestInit_ex(ctx_, EVP_sha3_256(), nullptr),
               "EVP_DigestInit_ex()");
    finalized_ = false;
}

}  // namespace crypto
