// Copyright (c) 2025 The Uxledger Core developers
// Distributed under the MIT software license

#ifndef UXLEDGER_PRIMITIVES_TRANSACTION_H
#define UXLEDGER_PRIMITIVES_TRANSACTION_H

#include <uint256.h>
#include <primitives/address.h>
#include <cstdint>
#include <vector>
#include <utility>

/**
 * An output of a transaction: the address that may spend it and the value
 * it carries (coins and coin hours).
 */
class CTxOut {
public:
    CAddress address;
    uint64_t nCoins;
    uint64_t nHours;

    CTxOut() : nCoins(0), nHours(0) {}

    CTxOut(const CAddress& addressIn, uint64_t nCoinsIn, uint64_t nHoursIn)
        : address(addressIn), nCoins(nCoinsIn), nHours(nHoursIn) {}

    bool operator==(const CTxOut& other) const {
        return (address == other.address &&
                nCoins == other.nCoins &&
                nHours == other.nHours);
    }
};

/**
 * A transaction consumes unspent outputs, named by their ids, and creates
 * new outputs. The new unspent records are materialized by CreateUnspents()
 * once the transaction is placed in a block.
 */
class CTransaction {
public:
    // Transaction version
    int32_t nVersion;

    // Ids of the unspent outputs consumed by this transaction
    std::vector<uint256> vin;

    // Transaction outputs
    std::vector<CTxOut> vout;

    // Cached hash
    mutable uint256 hash_cached;
    mutable bool hash_valid;

    CTransaction() : nVersion(1), hash_valid(false) {}

    CTransaction(int32_t nVersionIn, std::vector<uint256> vinIn, std::vector<CTxOut> voutIn)
        : nVersion(nVersionIn), vin(std::move(vinIn)), vout(std::move(voutIn)), hash_valid(false) {}

    CTransaction(const CTransaction& tx)
        : nVersion(tx.nVersion), vin(tx.vin), vout(tx.vout), hash_valid(false) {}

    CTransaction& operator=(const CTransaction& tx) {
        nVersion = tx.nVersion;
        vin = tx.vin;
        vout = tx.vout;
        hash_valid = false;
        return *this;
    }

    /** SHA3-256 of the serialized transaction (cached). */
    uint256 GetHash() const;

    bool IsNull() const {
        return vin.empty() && vout.empty();
    }

    /** Serialize transaction data for hashing. */
    std::vector<uint8_t> Serialize() const;
};

#endif // UXLEDGER_PRIMITIVES_TRANSACTION_H
