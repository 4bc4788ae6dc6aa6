// Copyright (c) 2025 The Uxledger Core developers
// Distributed under the MIT software license

#ifndef UXLEDGER_CRYPTO_SHA3_H
#define UXLEDGER_CRYPTO_SHA3_H

#include <stdint.h>
#include <stdlib.h>

/**
 * SHA-3 (FIPS 202) hashing
 *
 * Every identity in the ledger (output ids, snapshot hashes, transaction and
 * block hashes) is a SHA3-256 digest. The digest is computed by OpenSSL's EVP
 * interface, so OpenSSL 1.1.1 or newer is required.
 *
 * SHA3_256 throws std::runtime_error if the OpenSSL digest context
 * cannot be created or driven, and std::invalid_argument on null buffers.
 */

/**
 * Compute SHA3-256 hash of data (one-shot function)
 *
 * @param data Input data to hash
 * @param len Length of input data in bytes
 * @param hash Output buffer for 32-byte hash
 */
void SHA3_256(const uint8_t* data, size_t len, uint8_t hash[32]);

#endif // UXLEDGER_CRYPTO_SHA3_H
