// Copyright (c) 2025 The Uxledger Core developers
// Distributed under the MIT software license

#include <primitives/transaction.h>
#include <crypto/sha3.h>
#include <serialize.h>

std::vector<uint8_t> CTransaction::Serialize() const {
    CDataStream s;
    s.reserve(4 + 9 + vin.size() * 32 + 9 + vout.size() * (21 + 16));

    s.WriteInt32(nVersion);

    s.WriteCompactSize(vin.size());
    for (const uint256& in : vin) {
        s.WriteUint256(in);
    }

    s.WriteCompactSize(vout.size());
    for (const CTxOut& txout : vout) {
        s.WriteAddress(txout.address);
        s.WriteUint64(txout.nCoins);
        s.WriteUint64(txout.nHours);
    }

    return s.GetData();
}

uint256 CTransaction::GetHash() const {
    if (!hash_valid) {
        std::vector<uint8_t> data = Serialize();
        SHA3_256(data.data(), data.size(), hash_cached.data);
        hash_valid = true;
    }
    return hash_cached;
}
