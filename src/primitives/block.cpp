// Copyright (c) 2025 The Uxledger Core developers
// Distributed under the MIT software license

#include <primitives/block.h>
#include <crypto/sha3.h>
#include <serialize.h>
#include <stdexcept>

const size_t CBlockHeader::SERIALIZED_SIZE;

std::string CBlockHeader::Serialize() const {
    CDataStream s;
    s.reserve(SERIALIZED_SIZE);
    s.WriteInt32(nVersion);
    s.WriteUint64(nTime);
    s.WriteUint64(nBkSeq);
    s.WriteUint256(hashPrevBlock);
    s.WriteUint256(hashBody);
    s.WriteUint256(hashUx);
    return s.str();
}

bool CBlockHeader::Deserialize(const std::string& data, std::string* error) {
    if (data.size() != SERIALIZED_SIZE) {
        if (error) *error = "block header size mismatch (" + std::to_string(data.size()) + " bytes)";
        return false;
    }

    const uint8_t* ptr = reinterpret_cast<const uint8_t*>(data.data());
    CDataStream s(ptr, ptr + data.size());
    try {
        nVersion = s.ReadInt32();
        nTime = s.ReadUint64();
        nBkSeq = s.ReadUint64();
        hashPrevBlock = s.ReadUint256();
        hashBody = s.ReadUint256();
        hashUx = s.ReadUint256();
    } catch (const std::runtime_error& e) {
        if (error) *error = e.what();
        return false;
    }
    return true;
}

uint256 CBlockHeader::GetHash() const {
    std::string data = Serialize();
    uint256 hash;
    SHA3_256(reinterpret_cast<const uint8_t*>(data.data()), data.size(), hash.data);
    return hash;
}

uint256 CBlock::GetBodyHash() const {
    std::vector<uint8_t> data;
    data.reserve(vtx.size() * 32);
    for (const CTransaction& tx : vtx) {
        uint256 txid = tx.GetHash();
        data.insert(data.end(), txid.begin(), txid.end());
    }

    uint256 hash;
    SHA3_256(data.data(), data.size(), hash.data);
    return hash;
}
