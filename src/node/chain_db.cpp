// Copyright (c) 2025 The Uxledger Core developers
// Distributed under the MIT software license

#include <node/chain_db.h>
#include <util/config.h>
#include <util/logging.h>

const char* const CChainDB::DB_SUBDIR = "chaindb";

// LevelDB write buffer bounds, in MiB
static const int64_t MIN_DB_CACHE = 4;
static const int64_t MAX_DB_CACHE = 1024;
static const int64_t DEFAULT_DB_CACHE = 32;

CChainDB::CChainDB() {}

CChainDB::~CChainDB() {
    Close();
}

bool CChainDB::Open(const std::string& datadir, const DBOptions& options, std::string& error) {
    std::string path = datadir + "/" + DB_SUBDIR;

    if (!m_db.Open(path, options, error)) {
        return false;
    }

    CUnspentError unspent_error;
    if (!m_unspents.Open(m_db, unspent_error)) {
        error = unspent_error.ToString();
        m_db.Close();
        return false;
    }

    if (!m_tree.Open(m_db, error)) {
        LogPrintChain(ERROR, "Failed to open block tree: %s", error.c_str());
        m_unspents.Close();
        m_db.Close();
        return false;
    }

    LogPrintChain(INFO, "Chain database ready: %llu blocks, %zu unspent outputs",
                  static_cast<unsigned long long>(m_tree.Height()), m_unspents.Len());
    return true;
}

void CChainDB::Close() {
    m_tree.Close();
    m_unspents.Close();
    m_db.Close();
}

bool CChainDB::ExecuteBlock(const CBlock& block, std::string& error) {
    std::vector<TxHandler> handlers;
    handlers.push_back(m_unspents.BlockHandler(block));
    handlers.push_back(m_tree.BlockHandler(block));

    if (!m_db.Update(handlers, error)) {
        LogPrintChain(WARN, "Block %llu not executed: %s",
                      static_cast<unsigned long long>(block.nBkSeq), error.c_str());
        return false;
    }

    LogPrintChain(INFO, "Executed block %llu (%zu transactions), unspent hash %s",
                  static_cast<unsigned long long>(block.nBkSeq), block.vtx.size(),
                  m_unspents.GetUxHash().GetHex().c_str());
    return true;
}

DBOptions CChainDB::OptionsFromConfig(const CConfigParser& config) {
    DBOptions options;
    options.sync = config.GetBool("dbsync", true);

    int64_t cache_mb = config.GetInt64("dbcache", DEFAULT_DB_CACHE);
    if (cache_mb < MIN_DB_CACHE || cache_mb > MAX_DB_CACHE) {
        LogPrintf(CONFIG, WARN, "dbcache=%lld out of range [%lld, %lld], using %lld",
                  static_cast<long long>(cache_mb), static_cast<long long>(MIN_DB_CACHE),
                  static_cast<long long>(MAX_DB_CACHE), static_cast<long long>(DEFAULT_DB_CACHE));
        cache_mb = DEFAULT_DB_CACHE;
    }
    options.write_buffer_size = static_cast<size_t>(cache_mb) * 1024 * 1024;
    return options;
}
