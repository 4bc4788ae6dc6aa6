// Copyright (c) 2025 The Uxledger Core developers
// Distributed under the MIT software license

#include <node/unspent_pool.h>
#include <util/logging.h>
#include <cstring>
#include <memory>
#include <set>
#include <stdexcept>

const char* const CUnspentPool::POOL_BUCKET = "unspent_pool";
const char* const CUnspentPool::META_BUCKET = "unspent_meta";
const char* const CUnspentPool::XORHASH_KEY = "xorhash";

const char* UnspentErrorTypeName(UnspentErrorType type) {
    switch (type) {
        case UnspentErrorType::NONE: return "NONE";
        case UnspentErrorType::NOT_FOUND: return "NOT_FOUND";
        case UnspentErrorType::DUPLICATE_INSERT: return "DUPLICATE_INSERT";
        case UnspentErrorType::DECODE_ERROR: return "DECODE_ERROR";
        case UnspentErrorType::STORE_ERROR: return "STORE_ERROR";
        case UnspentErrorType::INTERNAL_FAULT: return "INTERNAL_FAULT";
    }
    return "UNKNOWN";
}

std::string CUnspentError::ToString() const {
    return std::string(UnspentErrorTypeName(type)) + ": " + message;
}

static std::string HashKey(const uint256& hash) {
    return std::string(reinterpret_cast<const char*>(hash.begin()), uint256::size());
}

static bool HashFromKey(const std::string& key, uint256& hash) {
    if (key.size() != uint256::size()) {
        return false;
    }
    memcpy(hash.begin(), key.data(), uint256::size());
    return true;
}

CUnspentPool::CUnspentPool() : m_store(nullptr) {
}

bool CUnspentPool::Open(CDBWrapper& store, CUnspentError& error) {
    if (!store.IsOpen()) {
        error.Set(UnspentErrorType::STORE_ERROR, "database not open");
        return false;
    }

    CDBBucket pool = store.CreateBucket(POOL_BUCKET);
    CDBBucket meta = store.CreateBucket(META_BUCKET);

    std::map<uint256, CUxOut> cache;
    bool decodeFailed = false;
    std::string db_error;

    bool ok = pool.ForEach([&](const std::string& key, const std::string& value, std::string& err) {
        uint256 id;
        if (!HashFromKey(key, id)) {
            err = "malformed output id of " + std::to_string(key.size()) + " bytes";
            decodeFailed = true;
            return false;
        }

        CUxOut ux;
        if (!DeserializeUxOut(value, ux, err)) {
            err = "output " + id.GetHex() + ": " + err;
            decodeFailed = true;
            return false;
        }

        cache[id] = ux;
        return true;
    }, db_error);

    if (!ok) {
        error.Set(decodeFailed ? UnspentErrorType::DECODE_ERROR : UnspentErrorType::STORE_ERROR,
                  "loading unspent outputs: " + db_error);
        LogPrintUnspent(ERROR, "Failed to load unspent pool: %s", error.message.c_str());
        return false;
    }

    uint256 uxHash;
    std::string value;
    bool found = false;
    if (!meta.Get(XORHASH_KEY, value, found, db_error)) {
        error.Set(UnspentErrorType::STORE_ERROR, "loading unspent hash: " + db_error);
        LogPrintUnspent(ERROR, "Failed to load unspent pool: %s", error.message.c_str());
        return false;
    }
    if (found && !HashFromKey(value, uxHash)) {
        error.Set(UnspentErrorType::DECODE_ERROR,
                  "stored unspent hash has " + std::to_string(value.size()) + " bytes");
        LogPrintUnspent(ERROR, "Failed to load unspent pool: %s", error.message.c_str());
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(cs_cache);
        m_cache.swap(cache);
        m_uxHash = uxHash;
    }

    m_store = &store;
    m_pool = pool;
    m_meta = meta;

    LogPrintUnspent(INFO, "Loaded %zu unspent outputs, unspent hash %s",
                    Len(), uxHash.GetHex().c_str());
    return true;
}

void CUnspentPool::Close() {
    std::lock_guard<std::mutex> lock(cs_cache);
    m_cache.clear();
    m_uxHash = uint256();
    m_store = nullptr;
    m_pool = CDBBucket();
    m_meta = CDBBucket();
}

bool CUnspentPool::GetCached(const uint256& id, CUxOut& ux) const {
    std::lock_guard<std::mutex> lock(cs_cache);
    auto it = m_cache.find(id);
    if (it == m_cache.end()) {
        return false;
    }
    ux = it->second;
    return true;
}

bool CUnspentPool::Get(const uint256& id, CUxOut& ux) const {
    return GetCached(id, ux);
}

bool CUnspentPool::GetArray(const std::vector<uint256>& ids, UxArray& uxs, CUnspentError& error) const {
    std::lock_guard<std::mutex> lock(cs_cache);

    UxArray result;
    result.reserve(ids.size());
    for (const uint256& id : ids) {
        auto it = m_cache.find(id);
        if (it == m_cache.end()) {
            error.Set(UnspentErrorType::NOT_FOUND, "unspent output " + id.GetHex() + " not found", id);
            return false;
        }
        result.push_back(it->second);
    }

    uxs.swap(result);
    return true;
}

UxArray CUnspentPool::GetAll() const {
    std::lock_guard<std::mutex> lock(cs_cache);

    UxArray uxs;
    uxs.reserve(m_cache.size());
    for (const auto& entry : m_cache) {
        uxs.push_back(entry.second);
    }
    return uxs;
}

size_t CUnspentPool::Len() const {
    std::lock_guard<std::mutex> lock(cs_cache);
    return m_cache.size();
}

bool CUnspentPool::Contains(const uint256& id) const {
    std::lock_guard<std::mutex> lock(cs_cache);
    return m_cache.count(id) != 0;
}

bool CUnspentPool::Collides(const std::vector<uint256>& ids) const {
    std::lock_guard<std::mutex> lock(cs_cache);
    for (const uint256& id : ids) {
        if (m_cache.count(id) != 0) {
            return true;
        }
    }
    return false;
}

UxArray CUnspentPool::GetUnspentsOfAddr(const CAddress& address) const {
    std::lock_guard<std::mutex> lock(cs_cache);

    UxArray uxs;
    for (const auto& entry : m_cache) {
        if (entry.second.body.address == address) {
            uxs.push_back(entry.second);
        }
    }
    return uxs;
}

AddressUxOuts CUnspentPool::GetUnspentsOfAddrs(const std::vector<CAddress>& addresses) const {
    std::set<CAddress> wanted(addresses.begin(), addresses.end());

    std::lock_guard<std::mutex> lock(cs_cache);

    AddressUxOuts result;
    for (const auto& entry : m_cache) {
        if (wanted.count(entry.second.body.address) != 0) {
            result[entry.second.body.address].push_back(entry.second);
        }
    }
    return result;
}

uint256 CUnspentPool::GetUxHash() const {
    std::lock_guard<std::mutex> lock(cs_cache);
    return m_uxHash;
}

bool CUnspentPool::ReadUxHash(CDBTransaction& tx, uint256& uxHash, CUnspentError& error) const {
    std::string value;
    std::string db_error;
    bool found = false;

    if (!tx.Get(m_meta, XORHASH_KEY, value, found, db_error)) {
        error.Set(UnspentErrorType::STORE_ERROR, "reading unspent hash: " + db_error);
        return false;
    }

    uxHash = uint256();
    if (found && !HashFromKey(value, uxHash)) {
        error.Set(UnspentErrorType::DECODE_ERROR,
                  "stored unspent hash has " + std::to_string(value.size()) + " bytes");
        return false;
    }
    return true;
}

bool CUnspentPool::AddWithTx(CDBTransaction& tx, const uint256& id, const CUxOut& ux,
                             uint256& uxHash, CUnspentError& error) {
    try {
        std::string db_error;
        if (!tx.Put(m_pool, HashKey(id), SerializeUxOut(ux), db_error)) {
            error.Set(UnspentErrorType::STORE_ERROR, "writing output " + id.GetHex() + ": " + db_error, id);
            return false;
        }

        uint256 current;
        if (!ReadUxHash(tx, current, error)) {
            return false;
        }

        uint256 updated = current.Xor(ux.GetSnapshotHash());
        if (!tx.Put(m_meta, XORHASH_KEY, HashKey(updated), db_error)) {
            error.Set(UnspentErrorType::STORE_ERROR, "writing unspent hash: " + db_error, id);
            return false;
        }

        uxHash = updated;
    } catch (const std::exception& e) {
        error.Set(UnspentErrorType::INTERNAL_FAULT,
                  std::string("adding output ") + id.GetHex() + ": " + e.what(), id);
        return false;
    }

    return true;
}

bool CUnspentPool::DeleteWithTx(CDBTransaction& tx, const uint256& id, CUxOut& removed,
                                uint256& uxHash, CUnspentError& error) {
    try {
        std::string key = HashKey(id);
        std::string value;
        std::string db_error;
        bool found = false;

        if (!tx.Get(m_pool, key, value, found, db_error)) {
            error.Set(UnspentErrorType::STORE_ERROR, "reading output " + id.GetHex() + ": " + db_error, id);
            return false;
        }

        if (!found) {
            error.Set(UnspentErrorType::STORE_ERROR,
                      "output " + id.GetHex() + " is cached but missing from the store", id);
            return false;
        }

        if (!DeserializeUxOut(value, removed, db_error)) {
            error.Set(UnspentErrorType::DECODE_ERROR, "output " + id.GetHex() + ": " + db_error, id);
            return false;
        }

        if (!tx.Delete(m_pool, key, db_error)) {
            error.Set(UnspentErrorType::STORE_ERROR, "deleting output " + id.GetHex() + ": " + db_error, id);
            return false;
        }

        uint256 current;
        if (!ReadUxHash(tx, current, error)) {
            return false;
        }

        uint256 updated = current.Xor(removed.GetSnapshotHash());
        if (!tx.Put(m_meta, XORHASH_KEY, HashKey(updated), db_error)) {
            error.Set(UnspentErrorType::STORE_ERROR, "writing unspent hash: " + db_error, id);
            return false;
        }

        uxHash = updated;
    } catch (const std::exception& e) {
        error.Set(UnspentErrorType::INTERNAL_FAULT,
                  std::string("deleting output ") + id.GetHex() + ": " + e.what(), id);
        return false;
    }

    return true;
}

bool CUnspentPool::ProcessBlock(const CBlock& block, CDBTransaction& tx, UndoAction& undo,
                                CUnspentError& error) {
    if (!IsOpen()) {
        error.Set(UnspentErrorType::STORE_ERROR, "unspent pool not open");
        return false;
    }

    // Outputs created and pre-existing outputs spent by this block
    std::map<uint256, CUxOut> added;
    std::map<uint256, CUxOut> deleted;

    uint256 uxHash;
    if (!ReadUxHash(tx, uxHash, error)) {
        LogPrintUnspent(ERROR, "Block %llu rejected: %s",
                        static_cast<unsigned long long>(block.nBkSeq), error.message.c_str());
        return false;
    }

    const CBlockHeader header = block.GetBlockHeader();

    for (size_t i = 0; i < block.vtx.size(); i++) {
        const CTransaction& txn = block.vtx[i];

        // Every input must be unspent in the view left by earlier transactions
        std::set<uint256> seen;
        for (const uint256& id : txn.vin) {
            bool present = false;
            if (seen.insert(id).second && deleted.count(id) == 0) {
                CUxOut ux;
                present = added.count(id) != 0 || GetCached(id, ux);
            }
            if (!present) {
                error.Set(UnspentErrorType::NOT_FOUND,
                          "transaction " + std::to_string(i) + " spends unknown output " + id.GetHex(), id);
                LogPrintUnspent(WARN, "Block %llu rejected: %s",
                                static_cast<unsigned long long>(block.nBkSeq), error.message.c_str());
                return false;
            }
        }

        for (const uint256& id : txn.vin) {
            CUxOut removed;
            if (!DeleteWithTx(tx, id, removed, uxHash, error)) {
                LogPrintUnspent(ERROR, "Block %llu rejected: %s",
                                static_cast<unsigned long long>(block.nBkSeq), error.message.c_str());
                return false;
            }

            auto it = added.find(id);
            if (it != added.end()) {
                added.erase(it);  // Created and spent within this block
            } else {
                deleted[id] = removed;
            }
        }

        UxArray uxs = CreateUnspents(header, txn);
        for (const CUxOut& ux : uxs) {
            uint256 id = ux.GetHash();
            if (added.count(id) != 0 || Contains(id)) {
                error.Set(UnspentErrorType::DUPLICATE_INSERT,
                          "transaction " + std::to_string(i) + " recreates output " + id.GetHex(), id);
                LogPrintUnspent(WARN, "Block %llu rejected: %s",
                                static_cast<unsigned long long>(block.nBkSeq), error.message.c_str());
                return false;
            }

            if (!AddWithTx(tx, id, ux, uxHash, error)) {
                LogPrintUnspent(ERROR, "Block %llu rejected: %s",
                                static_cast<unsigned long long>(block.nBkSeq), error.message.c_str());
                return false;
            }

            added[id] = ux;
        }
    }

    uint256 prevHash;
    {
        std::lock_guard<std::mutex> lock(cs_cache);
        prevHash = m_uxHash;
        for (const auto& entry : deleted) {
            m_cache.erase(entry.first);
        }
        for (const auto& entry : added) {
            m_cache[entry.first] = entry.second;
        }
        m_uxHash = uxHash;
    }

    LogPrintUnspent(DEBUG, "Applied block %llu: %zu spent, %zu created, unspent hash %s",
                    static_cast<unsigned long long>(block.nBkSeq), deleted.size(), added.size(),
                    uxHash.GetHex().c_str());

    undo = [this, added, deleted, prevHash]() {
        std::lock_guard<std::mutex> lock(cs_cache);
        for (const auto& entry : added) {
            m_cache.erase(entry.first);
        }
        for (const auto& entry : deleted) {
            m_cache[entry.first] = entry.second;
        }
        m_uxHash = prevHash;
    };

    return true;
}

TxHandler CUnspentPool::BlockHandler(const CBlock& block) {
    return [this, block](CDBTransaction& tx, UndoAction& undo, std::string& error) {
        CUnspentError unspent_error;
        if (!ProcessBlock(block, tx, undo, unspent_error)) {
            error = unspent_error.ToString();
            return false;
        }
        return true;
    };
}

bool CUnspentPool::VerifyConsistency(CUnspentError& error) const {
    if (!IsOpen()) {
        error.Set(UnspentErrorType::STORE_ERROR, "unspent pool not open");
        return false;
    }

    // Holding a transaction keeps blocks from being applied during the check
    std::string db_error;
    std::unique_ptr<CDBTransaction> tx = m_store->BeginTransaction(db_error);
    if (!tx) {
        error.Set(UnspentErrorType::STORE_ERROR, db_error);
        return false;
    }

    std::map<uint256, CUxOut> cache;
    uint256 cachedHash;
    {
        std::lock_guard<std::mutex> lock(cs_cache);
        cache = m_cache;
        cachedHash = m_uxHash;
    }

    uint256 computed;
    for (const auto& entry : cache) {
        if (entry.second.GetHash() != entry.first) {
            error.Set(UnspentErrorType::STORE_ERROR,
                      "cached output " + entry.first.GetHex() + " does not hash to its id", entry.first);
            return false;
        }
        computed = computed.Xor(entry.second.GetSnapshotHash());
    }

    if (computed != cachedHash) {
        error.Set(UnspentErrorType::STORE_ERROR,
                  "cached unspent hash " + cachedHash.GetHex() + " != recomputed " + computed.GetHex());
        return false;
    }

    size_t stored = 0;
    bool decodeFailed = false;
    bool ok = m_pool.ForEach([&](const std::string& key, const std::string& value, std::string& err) {
        uint256 id;
        CUxOut ux;
        if (!HashFromKey(key, id) || !DeserializeUxOut(value, ux, err)) {
            err = "undecodable stored output";
            decodeFailed = true;
            return false;
        }

        auto it = cache.find(id);
        if (it == cache.end() || it->second != ux) {
            err = "stored output " + id.GetHex() + " differs from the cache";
            return false;
        }

        stored++;
        return true;
    }, db_error);

    if (!ok) {
        error.Set(decodeFailed ? UnspentErrorType::DECODE_ERROR : UnspentErrorType::STORE_ERROR, db_error);
        LogPrintUnspent(ERROR, "Consistency check failed: %s", db_error.c_str());
        return false;
    }

    if (stored != cache.size()) {
        error.Set(UnspentErrorType::STORE_ERROR,
                  "store holds " + std::to_string(stored) + " outputs, cache holds " +
                  std::to_string(cache.size()));
        LogPrintUnspent(ERROR, "Consistency check failed: %s", error.message.c_str());
        return false;
    }

    uint256 storedHash;
    if (!ReadUxHash(*tx, storedHash, error)) {
        return false;
    }

    if (storedHash != cachedHash) {
        error.Set(UnspentErrorType::STORE_ERROR,
                  "stored unspent hash " + storedHash.GetHex() + " != cached " + cachedHash.GetHex());
        LogPrintUnspent(ERROR, "Consistency check failed: %s", error.message.c_str());
        return false;
    }

    LogPrintUnspent(DEBUG, "Consistency check passed (%zu outputs)", stored);
    return true;
}
