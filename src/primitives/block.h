// Copyright (c) 2025 The Uxledger Core developers
// Distributed under the MIT software license

#ifndef UXLEDGER_PRIMITIVES_BLOCK_H
#define UXLEDGER_PRIMITIVES_BLOCK_H

#include <uint256.h>
#include <primitives/transaction.h>
#include <cstdint>
#include <string>
#include <vector>

class CBlockHeader {
public:
    int32_t nVersion;
    uint64_t nTime;
    uint64_t nBkSeq;           // Sequence number (height) of the block
    uint256 hashPrevBlock;
    uint256 hashBody;          // Hash over the block's transaction hashes
    uint256 hashUx;            // Unspent hash before this block's outputs were added

    CBlockHeader() { SetNull(); }

    void SetNull() {
        nVersion = 0;
        nTime = 0;
        nBkSeq = 0;
        hashPrevBlock = uint256();
        hashBody = uint256();
        hashUx = uint256();
    }

    uint256 GetHash() const;

    /** Fixed 116-byte little-endian encoding used for hashing and storage. */
    std::string Serialize() const;
    bool Deserialize(const std::string& data, std::string* error = nullptr);

    static const size_t SERIALIZED_SIZE = 4 + 8 + 8 + 32 + 32 + 32;
};

class CBlock : public CBlockHeader {
public:
    std::vector<CTransaction> vtx;

    CBlock() { SetNull(); }
    CBlock(const CBlockHeader& header) {
        SetNull();
        *(static_cast<CBlockHeader*>(this)) = header;
    }

    void SetNull() {
        CBlockHeader::SetNull();
        vtx.clear();
    }

    CBlockHeader GetBlockHeader() const {
        return *this;
    }

    /** SHA3-256 over the concatenated transaction hashes, in block order. */
    uint256 GetBodyHash() const;
};

#endif // UXLEDGER_PRIMITIVES_BLOCK_H
