// Copyright (c) 2025 The Uxledger Core developers
// Distributed under the MIT software license

#ifndef UXLEDGER_UINT256_H
#define UXLEDGER_UINT256_H

#include <cstring>
#include <cstdint>
#include <string>
#include <iosfwd>

/** 256-bit hash */
class uint256 {
public:
    uint8_t data[32];

    uint256() { memset(data, 0, 32); }

    bool IsNull() const {
        for (int i = 0; i < 32; i++)
            if (data[i] != 0) return false;
        return true;
    }

    // Byte-wise (memcmp) order. Only meaningful as a container key.
    bool operator<(const uint256& other) const {
        return memcmp(data, other.data, 32) < 0;
    }

    bool operator==(const uint256& other) const {
        return memcmp(data, other.data, 32) == 0;
    }

    bool operator!=(const uint256& other) const {
        return memcmp(data, other.data, 32) != 0;
    }

    /** Bitwise XOR of two hashes. Commutative and self-inverse. */
    uint256 Xor(const uint256& other) const {
        uint256 result;
        for (int i = 0; i < 32; i++)
            result.data[i] = data[i] ^ other.data[i];
        return result;
    }

    uint8_t* begin() { return data; }
    const uint8_t* begin() const { return data; }
    uint8_t* end() { return data + 32; }
    const uint8_t* end() const { return data + 32; }

    static constexpr size_t size() { return 32; }

    std::string GetHex() const;
    void SetHex(const std::string& str);
};

// Stream output operator for Boost.Test
std::ostream& operator<<(std::ostream& os, const uint256& h);

#endif // UXLEDGER_UINT256_H
