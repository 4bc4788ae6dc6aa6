// Copyright (c) 2025 The Uxledger Core developers
// Distributed under the MIT software license

#ifndef UXLEDGER_PRIMITIVES_UXOUT_H
#define UXLEDGER_PRIMITIVES_UXOUT_H

#include <uint256.h>
#include <primitives/address.h>
#include <primitives/block.h>
#include <primitives/transaction.h>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

/**
 * Provenance of an unspent output: when and in which block it was created
 */
struct CUxHead {
    uint64_t nTime;      // Time of the creating block
    uint64_t nBkSeq;     // Sequence of the creating block

    CUxHead() : nTime(0), nBkSeq(0) {}
    CUxHead(uint64_t nTimeIn, uint64_t nBkSeqIn) : nTime(nTimeIn), nBkSeq(nBkSeqIn) {}

    bool operator==(const CUxHead& other) const {
        return nTime == other.nTime && nBkSeq == other.nBkSeq;
    }
};

/**
 * Content of an unspent output. The output id is derived from the body only,
 * so the same output has the same id regardless of which block carried it.
 */
struct CUxBody {
    uint256 hashSrcTx;   // Hash of the transaction that created this output
    CAddress address;    // Owner
    uint64_t nCoins;
    uint64_t nHours;

    CUxBody() : nCoins(0), nHours(0) {}

    bool operator==(const CUxBody& other) const {
        return hashSrcTx == other.hashSrcTx && address == other.address &&
               nCoins == other.nCoins && nHours == other.nHours;
    }
};

/**
 * Unspent transaction output record
 *
 * Records are immutable: they are inserted into the unspent pool once and
 * deleted once when spent.
 */
class CUxOut {
public:
    CUxHead head;
    CUxBody body;

    CUxOut() {}
    CUxOut(const CUxHead& headIn, const CUxBody& bodyIn) : head(headIn), body(bodyIn) {}

    /** Output id: SHA3-256 of the serialized body. */
    uint256 GetHash() const;

    /**
     * Digest of head and body, folded into the unspent hash (the XOR checksum
     * of the whole pool). Never used as an identity.
     */
    uint256 GetSnapshotHash() const;

    bool operator==(const CUxOut& other) const {
        return head == other.head && body == other.body;
    }

    bool operator!=(const CUxOut& other) const {
        return !(*this == other);
    }
};

typedef std::vector<CUxOut> UxArray;

/** Unspent outputs grouped by owner address */
typedef std::map<CAddress, UxArray> AddressUxOuts;

/** Size of a serialized record: head (16) + body (32 + 21 + 8 + 8) */
static const size_t UXOUT_SERIALIZED_SIZE = 16 + 32 + 21 + 8 + 8;

/**
 * Encode a record for the output region
 * Format (little-endian): nTime (8) + nBkSeq (8) + hashSrcTx (32) +
 * address version (1) + address key (20) + nCoins (8) + nHours (8)
 */
std::string SerializeUxOut(const CUxOut& ux);

/**
 * Decode a record written by SerializeUxOut
 * @param data Encoded bytes
 * @param ux Decoded record (unspecified on failure)
 * @param error Reason on failure
 * @return false if data is not exactly one encoded record
 */
bool DeserializeUxOut(const std::string& data, CUxOut& ux, std::string& error);

/**
 * Materialize the unspent outputs a transaction creates when it is included in
 * the block described by header: one record per output, in output order.
 */
UxArray CreateUnspents(const CBlockHeader& header, const CTransaction& tx);

#endif // UXLEDGER_PRIMITIVES_UXOUT_H
