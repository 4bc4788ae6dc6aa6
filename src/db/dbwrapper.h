// Copyright (c) 2025 The Uxledger Core developers
// Distributed under the MIT software license

#ifndef UXLEDGER_DB_DBWRAPPER_H
#define UXLEDGER_DB_DBWRAPPER_H

#include <leveldb/db.h>
#include <leveldb/write_batch.h>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

class CDBWrapper;
class CDBTransaction;

/**
 * Compensating action returned by a transaction participant.
 * Invoked when the enclosing transaction does not commit.
 */
typedef std::function<void()> UndoAction;

/**
 * Participant in a store transaction.
 * Writes through the transaction, sets undo to revert its in-memory state and
 * returns false with error set on failure.
 */
typedef std::function<bool(CDBTransaction& tx, UndoAction& undo, std::string& error)> TxHandler;

/**
 * Store options
 */
struct DBOptions {
    bool create_if_missing{true};
    bool sync{true};                            // fsync every commit
    size_t write_buffer_size{32 * 1024 * 1024}; // 32 MB write buffer
};

/**
 * Named key-space region of the store.
 *
 * A bucket is a key prefix (name + ':') inside the single LevelDB instance.
 * Reads through a bucket see committed state only; use CDBTransaction::Get
 * to see uncommitted writes.
 */
class CDBBucket
{
private:
    CDBWrapper* m_parent;
    std::string m_name;
    std::string m_prefix;

public:
    CDBBucket() : m_parent(nullptr) {}
    CDBBucket(CDBWrapper* parent, const std::string& name);

    const std::string& GetName() const { return m_name; }

    /** True if the bucket was created by db */
    bool BelongsTo(const CDBWrapper& db) const { return m_parent == &db; }

    /** Full LevelDB key for a key of this bucket */
    std::string Key(const std::string& key) const { return m_prefix + key; }

    /**
     * Read a committed value
     * @param key Key within this bucket
     * @param value Receives the value if found
     * @param found Set to whether the key exists
     * @param error Set on store failure
     * @return false only on store failure
     */
    bool Get(const std::string& key, std::string& value, bool& found, std::string& error) const;

    /**
     * Visit every committed entry of this bucket in key order.
     * The store lock is held during the walk, so fn must not call back into
     * the store. Returning false from fn stops the walk and fails it.
     */
    bool ForEach(const std::function<bool(const std::string& key, const std::string& value,
                                          std::string& error)>& fn,
                 std::string& error) const;
};

/**
 * Read-write transaction.
 *
 * Writes are buffered in a leveldb::WriteBatch and mirrored in an overlay so
 * that Get() reads its own writes. Commit() applies the batch atomically.
 * Destroying an uncommitted transaction discards every write. A transaction
 * holds the store's writer lock for its whole lifetime.
 */
class CDBTransaction
{
private:
    friend class CDBWrapper;

    CDBWrapper& m_parent;
    std::unique_lock<std::mutex> m_writeLock;
    leveldb::WriteBatch m_batch;
    std::map<std::string, std::optional<std::string>> m_overlay;  // nullopt = deleted
    bool m_committed;

    CDBTransaction(CDBWrapper& parent, std::unique_lock<std::mutex> writeLock);

public:
    ~CDBTransaction();

    CDBTransaction(const CDBTransaction&) = delete;
    CDBTransaction& operator=(const CDBTransaction&) = delete;

    bool Get(const CDBBucket& bucket, const std::string& key, std::string& value,
             bool& found, std::string& error) const;
    /**
     * Buffer a write. Throws std::invalid_argument if bucket was created by
     * another store.
     */
    bool Put(const CDBBucket& bucket, const std::string& key, const std::string& value,
             std::string& error);
    bool Delete(const CDBBucket& bucket, const std::string& key, std::string& error);

    /**
     * Atomically apply every write to the store
     * @param error Set on failure, in which case nothing was applied
     * @return true if the writes are durable (subject to DBOptions::sync)
     */
    bool Commit(std::string& error);

    bool IsCommitted() const { return m_committed; }

    /** Number of keys written or deleted so far */
    size_t GetWriteCount() const { return m_overlay.size(); }
};

/**
 * LevelDB-backed transactional key-value store
 */
class CDBWrapper
{
private:
    friend class CDBBucket;
    friend class CDBTransaction;

    std::unique_ptr<leveldb::DB> db;
    mutable std::mutex cs_db;       // guards db
    std::mutex cs_write;            // held by the open CDBTransaction
    std::string m_path;
    DBOptions m_options;

    bool ReadKey(const std::string& key, std::string& value, bool& found, std::string& error) const;

public:
    CDBWrapper();
    ~CDBWrapper();

    CDBWrapper(const CDBWrapper&) = delete;
    CDBWrapper& operator=(const CDBWrapper&) = delete;

    /**
     * Open the store at the specified path
     * @param path Directory of the LevelDB instance
     * @param options Store options
     * @param error Set on failure
     * @return true if successful
     */
    bool Open(const std::string& path, const DBOptions& options, std::string& error);

    void Close();
    bool IsOpen() const;

    const std::string& GetPath() const { return m_path; }

    /**
     * Get a handle to a named region
     * @throws std::invalid_argument if the name is empty or contains ':'
     */
    CDBBucket CreateBucket(const std::string& name);

    /**
     * Start a read-write transaction, blocking while another one is open
     * @return the transaction, or nullptr with error set if the store is closed
     */
    std::unique_ptr<CDBTransaction> BeginTransaction(std::string& error);

    /**
     * Run handlers inside one transaction and commit it.
     *
     * Handlers run in order. If a handler fails or throws, or the commit
     * fails, the undo actions collected so far are invoked in reverse order
     * and the transaction is discarded. The undo actions run while the writer
     * lock is still held.
     */
    bool Update(const std::vector<TxHandler>& handlers, std::string& error);
};

#endif // UXLEDGER_DB_DBWRAPPER_H
