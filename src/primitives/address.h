// Copyright (c) 2025 The Uxledger Core developers
// Distributed under the MIT software license

#ifndef UXLEDGER_PRIMITIVES_ADDRESS_H
#define UXLEDGER_PRIMITIVES_ADDRESS_H

#include <cstring>
#include <cstdint>
#include <string>
#include <iosfwd>

/**
 * Spending address of an output: a version byte plus a 20-byte key hash.
 * Derivation of the key hash from a public key is done by the wallet layer;
 * the ledger only compares addresses.
 */
class CAddress {
public:
    static const size_t KEY_SIZE = 20;

    uint8_t nVersion;
    uint8_t key[KEY_SIZE];

    CAddress() : nVersion(0) { memset(key, 0, KEY_SIZE); }

    bool IsNull() const {
        for (size_t i = 0; i < KEY_SIZE; i++)
            if (key[i] != 0) return false;
        return nVersion == 0;
    }

    bool operator<(const CAddress& other) const {
        if (nVersion != other.nVersion) {
            return nVersion < other.nVersion;
        }
        return memcmp(key, other.key, KEY_SIZE) < 0;
    }

    bool operator==(const CAddress& other) const {
        return nVersion == other.nVersion && memcmp(key, other.key, KEY_SIZE) == 0;
    }

    bool operator!=(const CAddress& other) const {
        return !(*this == other);
    }

    /** Hex of version byte followed by the key (42 characters) */
    std::string GetHex() const;

    /**
     * Parse the GetHex() form
     * @return false (and leaves the address null) if str is not 42 hex characters
     */
    bool SetHex(const std::string& str);
};

std::ostream& operator<<(std::ostream& os, const CAddress& addr);

#endif // UXLEDGER_PRIMITIVES_ADDRESS_H
