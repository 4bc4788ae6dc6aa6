// Copyright (c) 2025 The Uxledger Core developers
// Distributed under the MIT software license

#include <uint256.h>
#include <util/strencodings.h>
#include <sstream>
#include <iomanip>
#include <ostream>

std::string uint256::GetHex() const {
    std::stringstream ss;
    for (int i = 31; i >= 0; i--) {
        ss << std::hex << std::setw(2) << std::setfill('0') << (int)data[i];
    }
    return ss.str();
}

void uint256::SetHex(const std::string& str) {
    memset(data, 0, 32);

    if (str.empty()) {
        return;
    }

    size_t len = str.length();
    if (len > 64) {
        len = 64;
    }

    // GetHex() prints data[31] first, so walk the string from its end
    for (size_t i = 0; i < len / 2; i++) {
        size_t strPos = len - 2 - (i * 2);
        int8_t high = HexDigit(str[strPos]);
        int8_t low = HexDigit(str[strPos + 1]);
        if (high < 0 || low < 0) {
            memset(data, 0, 32);
            return;
        }
        data[i] = static_cast<uint8_t>((high << 4) | low);
    }

    if (len % 2 == 1) {
        int8_t low = HexDigit(str[0]);
        if (low < 0) {
            memset(data, 0, 32);
            return;
        }
        data[len / 2] = static_cast<uint8_t>(low);
    }
}

std::ostream& operator<<(std::ostream& os, const uint256& h) {
    return os << h.GetHex();
}
