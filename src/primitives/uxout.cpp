// Copyright (c) 2025 The Uxledger Core developers
// Distributed under the MIT software license

#include <primitives/uxout.h>
#include <crypto/sha3.h>
#include <serialize.h>
#include <stdexcept>

static void WriteUxHead(CDataStream& s, const CUxHead& head) {
    s.WriteUint64(head.nTime);
    s.WriteUint64(head.nBkSeq);
}

static void WriteUxBody(CDataStream& s, const CUxBody& body) {
    s.WriteUint256(body.hashSrcTx);
    s.WriteAddress(body.address);
    s.WriteUint64(body.nCoins);
    s.WriteUint64(body.nHours);
}

uint256 CUxOut::GetHash() const {
    CDataStream s;
    WriteUxBody(s, body);

    uint256 hash;
    SHA3_256(s.data_ptr(), s.size(), hash.data);
    return hash;
}

uint256 CUxOut::GetSnapshotHash() const {
    CDataStream s;
    s.reserve(UXOUT_SERIALIZED_SIZE);
    WriteUxHead(s, head);
    WriteUxBody(s, body);

    uint256 hash;
    SHA3_256(s.data_ptr(), s.size(), hash.data);
    return hash;
}

std::string SerializeUxOut(const CUxOut& ux) {
    CDataStream s;
    s.reserve(UXOUT_SERIALIZED_SIZE);
    WriteUxHead(s, ux.head);
    WriteUxBody(s, ux.body);
    return s.str();
}

bool DeserializeUxOut(const std::string& data, CUxOut& ux, std::string& error) {
    if (data.size() != UXOUT_SERIALIZED_SIZE) {
        error = "unspent output record has " + std::to_string(data.size()) +
                " bytes, expected " + std::to_string(UXOUT_SERIALIZED_SIZE);
        return false;
    }

    const uint8_t* ptr = reinterpret_cast<const uint8_t*>(data.data());
    CDataStream s(ptr, ptr + data.size());

    try {
        ux.head.nTime = s.ReadUint64();
        ux.head.nBkSeq = s.ReadUint64();
        ux.body.hashSrcTx = s.ReadUint256();
        ux.body.address = s.ReadAddress();
        ux.body.nCoins = s.ReadUint64();
        ux.body.nHours = s.ReadUint64();
    } catch (const std::runtime_error& e) {
        error = e.what();
        return false;
    }

    return true;
}

UxArray CreateUnspents(const CBlockHeader& header, const CTransaction& tx) {
    UxArray uxs;
    uxs.reserve(tx.vout.size());

    uint256 txid = tx.GetHash();
    for (const CTxOut& out : tx.vout) {
        CUxBody body;
        body.hashSrcTx = txid;
        body.address = out.address;
        body.nCoins = out.nCoins;
        body.nHours = out.nHours;
        uxs.emplace_back(CUxHead(header.nTime, header.nBkSeq), body);
    }

    return uxs;
}
