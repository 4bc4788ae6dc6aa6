// Copyright (c) 2025 The Uxledger Core developers
// Distributed under the MIT software license

#include <crypto/sha3.h>
#include <openssl/evp.h>
#include <stdexcept>
#include <string>

static void EVPDigest(const EVP_MD* md, const char* name, const uint8_t* data, size_t len,
                      uint8_t* hash, unsigned int expected_len) {
    if (data == nullptr && len > 0) {
        throw std::invalid_argument(std::string(name) + ": data is NULL but len > 0");
    }
    if (hash == nullptr) {
        throw std::invalid_argument(std::string(name) + ": hash output buffer is NULL");
    }

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        throw std::runtime_error(std::string(name) + ": EVP_MD_CTX_new failed");
    }

    unsigned int out_len = 0;
    if (EVP_DigestInit_ex(ctx, md, nullptr) != 1 ||
        EVP_DigestUpdate(ctx, data, len) != 1 ||
        EVP_DigestFinal_ex(ctx, hash, &out_len) != 1) {
        EVP_MD_CTX_free(ctx);
        throw std::runtime_error(std::string(name) + ": digest computation failed");
    }

    EVP_MD_CTX_free(ctx);

    if (out_len != expected_len) {
        throw std::runtime_error(std::string(name) + ": unexpected digest length");
    }
}

void SHA3_256(const uint8_t* data, size_t len, uint8_t hash[32]) {
    EVPDigest(EVP_sha3_256(), "SHA3_256", data, len, hash, 32);
}
