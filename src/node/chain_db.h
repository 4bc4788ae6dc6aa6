// Copyright (c) 2025 The Uxledger Core developers
// Distributed under the MIT software license

#ifndef UXLEDGER_NODE_CHAIN_DB_H
#define UXLEDGER_NODE_CHAIN_DB_H

#include <db/dbwrapper.h>
#include <node/block_tree.h>
#include <node/unspent_pool.h>
#include <primitives/block.h>
#include <string>

class CConfigParser;

/**
 * Chain database
 *
 * Owns the store together with the participants that live in it and
 * executes blocks against all of them in one store transaction.
 */
class CChainDB
{
private:
    CDBWrapper m_db;
    CUnspentPool m_unspents;
    CBlockTree m_tree;

public:
    static const char* const DB_SUBDIR;   // "chaindb"

    CChainDB();
    ~CChainDB();

    CChainDB(const CChainDB&) = delete;
    CChainDB& operator=(const CChainDB&) = delete;

    /**
     * Open the store under datadir and load every participant
     * @param datadir Data directory; the store lives in datadir/chaindb
     * @param options Store options
     * @param error Set on failure
     * @return true if successful
     */
    bool Open(const std::string& datadir, const DBOptions& options, std::string& error);

    void Close();
    bool IsOpen() const { return m_db.IsOpen(); }

    /**
     * Apply a block to the unspent pool and the block tree atomically
     *
     * If either participant refuses the block, or the commit fails, the
     * store is unchanged and both in-memory states are rolled back.
     */
    bool ExecuteBlock(const CBlock& block, std::string& error);

    CUnspentPool& Unspents() { return m_unspents; }
    const CUnspentPool& Unspents() const { return m_unspents; }
    CBlockTree& Tree() { return m_tree; }
    const CBlockTree& Tree() const { return m_tree; }
    CDBWrapper& Store() { return m_db; }

    /**
     * Store options from the dbsync and dbcache (MiB) settings
     */
    static DBOptions OptionsFromConfig(const CConfigParser& config);
};

#endif // UXLEDGER_NODE_CHAIN_DB_H
