// Copyright (c) 2025 The Uxledger Core developers
// Distributed under the MIT software license

#include <primitives/address.h>
#include <util/strencodings.h>
#include <ostream>
#include <vector>

// Define static const members (required for ODR-use before C++17 inline variables)
const size_t CAddress::KEY_SIZE;

std::string CAddress::GetHex() const {
    std::string hex = HexStr(&nVersion, 1);
    hex += HexStr(key, KEY_SIZE);
    return hex;
}

bool CAddress::SetHex(const std::string& str) {
    nVersion = 0;
    memset(key, 0, KEY_SIZE);

    if (str.size() != 2 * (1 + KEY_SIZE)) {
        return false;
    }

    std::vector<uint8_t> bytes = ParseHex(str);
    if (bytes.size() != 1 + KEY_SIZE) {
        return false;
    }

    nVersion = bytes[0];
    memcpy(key, bytes.data() + 1, KEY_SIZE);
    return true;
}

std::ostream& operator<<(std::ostream& os, const CAddress& addr) {
    return os << addr.GetHex();
}
