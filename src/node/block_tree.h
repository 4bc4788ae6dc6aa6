// Copyright (c) 2025 The Uxledger Core developers
// Distributed under the MIT software license

#ifndef UXLEDGER_NODE_BLOCK_TREE_H
#define UXLEDGER_NODE_BLOCK_TREE_H

#include <db/dbwrapper.h>
#include <primitives/block.h>
#include <uint256.h>
#include <mutex>
#include <string>

/**
 * Linear chain of executed block headers
 *
 * Stores every executed header in the blocks bucket (hash -> header) and the
 * hash of the newest one under head in the chain_meta bucket. Runs beside the
 * unspent pool in the same store transaction, so a block the tree refuses
 * also rolls back the pool.
 */
class CBlockTree
{
private:
    CDBWrapper* m_store;
    CDBBucket m_blocks;
    CDBBucket m_chainMeta;

    mutable std::mutex cs_head;
    CBlockHeader m_head;
    bool m_hasHead;

    bool ConnectHeader(const CBlockHeader& header, CDBTransaction& tx, UndoAction& undo, std::string& error);

public:
    static const char* const BLOCKS_BUCKET;       // "blocks"
    static const char* const CHAIN_META_BUCKET;   // "chain_meta"
    static const char* const HEAD_KEY;            // "head"

    CBlockTree();

    CBlockTree(const CBlockTree&) = delete;
    CBlockTree& operator=(const CBlockTree&) = delete;

    /**
     * Attach to the store and load the head header
     * @param store Open store; must outlive the tree
     * @param error Set if the store is closed or the head is malformed
     * @return true if successful
     */
    bool Open(CDBWrapper& store, std::string& error);

    /**
     * Append a block header inside a store transaction
     *
     * The block must extend the head: sequence head+1 and previous hash equal
     * to the head hash, or sequence 0 with a null previous hash on an empty
     * tree.
     */
    TxHandler BlockHandler(const CBlock& block);

    void Close();
    bool IsOpen() const { return m_store != nullptr; }

    /** @return false if no block was executed yet */
    bool GetHead(CBlockHeader& head) const;

    bool HasBlock(const uint256& hash) const;

    /** Number of blocks in the tree */
    uint64_t Height() const;
};

#endif // UXLEDGER_NODE_BLOCK_TREE_H
