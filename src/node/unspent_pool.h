// Copyright (c) 2025 The Uxledger Core developers
// Distributed under the MIT software license

#ifndef UXLEDGER_NODE_UNSPENT_POOL_H
#define UXLEDGER_NODE_UNSPENT_POOL_H

#include <db/dbwrapper.h>
#include <primitives/block.h>
#include <primitives/uxout.h>
#include <uint256.h>
#include <map>
#include <mutex>
#include <string>
#include <vector>

/**
 * Unspent pool error kinds
 */
enum class UnspentErrorType {
    NONE,
    NOT_FOUND,            // Query or block input named an id absent from the current view
    DUPLICATE_INSERT,     // Block tried to add an id that is already present
    DECODE_ERROR,         // A stored record failed to deserialize
    STORE_ERROR,          // Store read/write failed, or store and cache diverged
    INTERNAL_FAULT        // Unexpected exception while adding or deleting
};

const char* UnspentErrorTypeName(UnspentErrorType type);

/**
 * Error reported by CUnspentPool operations
 */
struct CUnspentError {
    UnspentErrorType type;
    std::string message;
    uint256 hash;           // Offending output id, if any

    CUnspentError() : type(UnspentErrorType::NONE) {}

    void Set(UnspentErrorType typeIn, const std::string& messageIn, const uint256& hashIn = uint256()) {
        type = typeIn;
        message = messageIn;
        hash = hashIn;
    }

    bool IsSet() const { return type != UnspentErrorType::NONE; }

    /** "KIND: message" */
    std::string ToString() const;
};

/**
 * Unspent output pool
 *
 * Keeps the set of spendable outputs in two places: the unspent_pool bucket
 * of the store (id -> encoded record, the source of truth) and an in-memory
 * cache that serves every query. A single aggregate checksum, the unspent
 * hash, is the XOR of the snapshot hashes of all live records. It is stored
 * under xorhash in the unspent_meta bucket and mirrored in the cache.
 *
 * Blocks are applied inside a store transaction owned by the caller. The
 * cache is only touched after every store write of the block succeeded, and
 * the returned undo action restores the cache if the caller's transaction
 * does not commit.
 *
 * Thread-safe. The cache lock is never held across store I/O.
 */
class CUnspentPool
{
private:
    CDBWrapper* m_store;
    CDBBucket m_pool;                         // id -> SerializeUxOut()
    CDBBucket m_meta;                         // xorhash -> 32 raw bytes

    mutable std::mutex cs_cache;
    std::map<uint256, CUxOut> m_cache;
    uint256 m_uxHash;

    bool GetCached(const uint256& id, CUxOut& ux) const;

    bool ReadUxHash(CDBTransaction& tx, uint256& uxHash, CUnspentError& error) const;
    bool AddWithTx(CDBTransaction& tx, const uint256& id, const CUxOut& ux,
                   uint256& uxHash, CUnspentError& error);
    bool DeleteWithTx(CDBTransaction& tx, const uint256& id, CUxOut& removed,
                      uint256& uxHash, CUnspentError& error);

public:
    static const char* const POOL_BUCKET;     // "unspent_pool"
    static const char* const META_BUCKET;     // "unspent_meta"
    static const char* const XORHASH_KEY;     // "xorhash"

    CUnspentPool();

    CUnspentPool(const CUnspentPool&) = delete;
    CUnspentPool& operator=(const CUnspentPool&) = delete;

    /**
     * Attach to the store and load the cache from it
     *
     * Scans every stored record into the cache and loads the stored unspent
     * hash (zero if absent).
     *
     * @param store Open store; must outlive the pool
     * @param error STORE_ERROR if the store is unusable, DECODE_ERROR if a
     *              stored record or the stored hash is malformed
     * @return true if successful
     */
    bool Open(CDBWrapper& store, CUnspentError& error);

    /** Detach from the store and drop the cache */
    void Close();

    bool IsOpen() const { return m_store != nullptr; }

    // Queries. All of them read the cache only.

    /** @return false if id is not unspent (not an error) */
    bool Get(const uint256& id, CUxOut& ux) const;

    /**
     * Look up several ids at once
     * @param uxs Records in the order of ids
     * @param error NOT_FOUND naming the first missing id
     */
    bool GetArray(const std::vector<uint256>& ids, UxArray& uxs, CUnspentError& error) const;

    /** Copy of every unspent record, in no particular order */
    UxArray GetAll() const;

    size_t Len() const;

    bool Contains(const uint256& id) const;

    /** @return true if any of ids is already unspent */
    bool Collides(const std::vector<uint256>& ids) const;

    UxArray GetUnspentsOfAddr(const CAddress& address) const;

    /** Only addresses owning at least one record appear in the result */
    AddressUxOuts GetUnspentsOfAddrs(const std::vector<CAddress>& addresses) const;

    uint256 GetUxHash() const;

    /**
     * Apply a block to the pool inside a store transaction
     *
     * For each transaction in block order: every input must be unspent in
     * the cache as already modified by earlier transactions of the block;
     * inputs are deleted from the store, then the transaction's outputs are
     * added. The stored unspent hash is updated on every add and delete.
     * When all store writes succeeded the cache is updated in one step.
     *
     * @param block Block to apply
     * @param tx Open store transaction; the pool neither commits nor discards it
     * @param undo Set on success to an action restoring the cache to its prior state
     * @param error Set on failure; the cache is then untouched and tx must be discarded
     * @return true if successful
     */
    bool ProcessBlock(const CBlock& block, CDBTransaction& tx, UndoAction& undo, CUnspentError& error);

    /** ProcessBlock packaged for CDBWrapper::Update */
    TxHandler BlockHandler(const CBlock& block);

    /**
     * Check that the cache, its checksum and the store agree
     *
     * Blocks store writers for the duration of the check.
     */
    bool VerifyConsistency(CUnspentError& error) const;
};

#endif // UXLEDGER_NODE_UNSPENT_POOL_H
