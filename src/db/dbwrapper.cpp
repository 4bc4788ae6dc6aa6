// Copyright (c) 2025 The Uxledger Core developers
// Distributed under the MIT software license

#include <db/dbwrapper.h>
#include <db/db_errors.h>
#include <util/logging.h>
#include <leveldb/iterator.h>
#include <leveldb/options.h>
#include <filesystem>
#include <stdexcept>

// CDBBucket implementation
CDBBucket::CDBBucket(CDBWrapper* parent, const std::string& name)
    : m_parent(parent), m_name(name), m_prefix(name + ":") {
}

bool CDBBucket::Get(const std::string& key, std::string& value, bool& found, std::string& error) const {
    if (m_parent == nullptr) {
        error = "bucket not attached to a database";
        return false;
    }
    return m_parent->ReadKey(Key(key), value, found, error);
}

bool CDBBucket::ForEach(const std::function<bool(const std::string& key, const std::string& value,
                                                 std::string& error)>& fn,
                        std::string& error) const {
    if (m_parent == nullptr) {
        error = "bucket not attached to a database";
        return false;
    }

    std::lock_guard<std::mutex> lock(m_parent->cs_db);

    if (m_parent->db == nullptr) {
        error = "database not open";
        return false;
    }

    std::unique_ptr<leveldb::Iterator> it(m_parent->db->NewIterator(leveldb::ReadOptions()));
    for (it->Seek(m_prefix); it->Valid() && it->key().starts_with(m_prefix); it->Next()) {
        std::string key = it->key().ToString().substr(m_prefix.size());
        if (!fn(key, it->value().ToString(), error)) {
            return false;
        }
    }

    if (!it->status().ok()) {
        DBErrorType error_type = ClassifyDBError(it->status());
        error = GetDBErrorMessage(it->status(), error_type);
        LogPrintDB(ERROR, "Iteration of bucket %s failed: %s", m_name.c_str(), error.c_str());
        return false;
    }

    return true;
}

// CDBTransaction implementation
CDBTransaction::CDBTransaction(CDBWrapper& parent, std::unique_lock<std::mutex> writeLock)
    : m_parent(parent), m_writeLock(std::move(writeLock)), m_committed(false) {
}

CDBTransaction::~CDBTransaction() {
    if (!m_committed && !m_overlay.empty()) {
        LogPrintDB(DEBUG, "Discarding uncommitted transaction (%zu writes)", m_overlay.size());
    }
}

bool CDBTransaction::Get(const CDBBucket& bucket, const std::string& key, std::string& value,
                         bool& found, std::string& error) const {
    auto it = m_overlay.find(bucket.Key(key));
    if (it != m_overlay.end()) {
        found = it->second.has_value();
        if (found) {
            value = *it->second;
        }
        return true;
    }

    return m_parent.ReadKey(bucket.Key(key), value, found, error);
}

bool CDBTransaction::Put(const CDBBucket& bucket, const std::string& key, const std::string& value,
                         std::string& error) {
    if (m_committed) {
        error = "write to committed transaction";
        return false;
    }
    if (!bucket.BelongsTo(m_parent)) {
        throw std::invalid_argument("CDBTransaction: bucket " + bucket.GetName() + " belongs to another database");
    }

    std::string full_key = bucket.Key(key);
    m_batch.Put(full_key, value);
    m_overlay[full_key] = value;
    return true;
}

bool CDBTransaction::Delete(const CDBBucket& bucket, const std::string& key, std::string& error) {
    if (m_committed) {
        error = "delete in committed transaction";
        return false;
    }
    if (!bucket.BelongsTo(m_parent)) {
        throw std::invalid_argument("CDBTransaction: bucket " + bucket.GetName() + " belongs to another database");
    }

    std::string full_key = bucket.Key(key);
    m_batch.Delete(full_key);
    m_overlay[full_key] = std::nullopt;
    return true;
}

bool CDBTransaction::Commit(std::string& error) {
    if (m_committed) {
        error = "transaction already committed";
        return false;
    }

    std::lock_guard<std::mutex> lock(m_parent.cs_db);

    if (m_parent.db == nullptr) {
        error = "database not open";
        return false;
    }

    leveldb::WriteOptions options;
    options.sync = m_parent.m_options.sync;

    leveldb::Status status = m_parent.db->Write(options, &m_batch);
    if (!status.ok()) {
        DBErrorType error_type = ClassifyDBError(status);
        error = GetDBErrorMessage(status, error_type);
        LogPrintDB(ERROR, "Commit of %zu writes failed: %s", m_overlay.size(), error.c_str());

        if (options.sync && error_type == DBErrorType::IO_ERROR) {
            LogPrintDB(ERROR, "Fsync failed - batch may not be persisted");
        }
        return false;
    }

    m_committed = true;
    LogPrintDB(DEBUG, "Committed transaction (%zu writes)", m_overlay.size());
    return true;
}

// CDBWrapper implementation
CDBWrapper::CDBWrapper() : db(nullptr) {}

CDBWrapper::~CDBWrapper() {
    Close();
}

bool CDBWrapper::Open(const std::string& path, const DBOptions& options, std::string& error) {
    std::lock_guard<std::mutex> lock(cs_db);

    if (db != nullptr) {
        return true;  // Already open
    }

    if (options.create_if_missing) {
        try {
            std::filesystem::create_directories(path);
        } catch (const std::filesystem::filesystem_error& e) {
            error = std::string("cannot create database directory: ") + e.what();
            LogPrintDB(ERROR, "Failed to create %s: %s", path.c_str(), e.what());
            return false;
        }
    }

    leveldb::Options db_options;
    db_options.create_if_missing = options.create_if_missing;
    db_options.compression = leveldb::kSnappyCompression;
    db_options.max_open_files = 100;
    db_options.write_buffer_size = options.write_buffer_size;
    db_options.max_file_size = 2 * 1024 * 1024;  // 2 MB per SSTable file

    leveldb::DB* raw_db = nullptr;
    leveldb::Status status = leveldb::DB::Open(db_options, path, &raw_db);

    if (!status.ok()) {
        DBErrorType error_type = ClassifyDBError(status);
        error = GetDBErrorMessage(status, error_type);
        LogPrintDB(ERROR, "Failed to open database %s: %s", path.c_str(), error.c_str());
        return false;
    }

    db.reset(raw_db);
    m_path = path;
    m_options = options;
    LogPrintDB(INFO, "Opened database %s (sync=%d)", path.c_str(), options.sync ? 1 : 0);
    return true;
}

void CDBWrapper::Close() {
    std::lock_guard<std::mutex> lock(cs_db);
    if (db != nullptr) {
        LogPrintDB(INFO, "Closing database %s", m_path.c_str());
    }
    db.reset();
}

bool CDBWrapper::IsOpen() const {
    std::lock_guard<std::mutex> lock(cs_db);
    return db != nullptr;
}

bool CDBWrapper::ReadKey(const std::string& key, std::string& value, bool& found, std::string& error) const {
    std::lock_guard<std::mutex> lock(cs_db);

    found = false;
    if (db == nullptr) {
        error = "database not open";
        return false;
    }

    leveldb::Status status = db->Get(leveldb::ReadOptions(), key, &value);
    if (status.IsNotFound()) {
        return true;
    }

    if (!status.ok()) {
        DBErrorType error_type = ClassifyDBError(status);
        error = GetDBErrorMessage(status, error_type);
        LogPrintDB(ERROR, "Read failed: %s", error.c_str());
        return false;
    }

    found = true;
    return true;
}

CDBBucket CDBWrapper::CreateBucket(const std::string& name) {
    if (name.empty() || name.find(':') != std::string::npos) {
        throw std::invalid_argument("CDBWrapper: invalid bucket name '" + name + "'");
    }
    return CDBBucket(this, name);
}

std::unique_ptr<CDBTransaction> CDBWrapper::BeginTransaction(std::string& error) {
    std::unique_lock<std::mutex> writeLock(cs_write);

    if (!IsOpen()) {
        error = "database not open";
        return nullptr;
    }

    return std::unique_ptr<CDBTransaction>(new CDBTransaction(*this, std::move(writeLock)));
}

bool CDBWrapper::Update(const std::vector<TxHandler>& handlers, std::string& error) {
    std::unique_ptr<CDBTransaction> tx = BeginTransaction(error);
    if (!tx) {
        return false;
    }

    std::vector<UndoAction> undos;
    bool ok = true;

    for (size_t i = 0; i < handlers.size(); i++) {
        UndoAction undo;
        try {
            ok = handlers[i](*tx, undo, error);
        } catch (const std::exception& e) {
            error = std::string("transaction handler threw: ") + e.what();
            ok = false;
        }

        // A failing handler leaves nothing to undo; its own state is untouched
        if (!ok) {
            LogPrintDB(WARN, "Transaction handler %zu failed: %s", i, error.c_str());
            break;
        }

        if (undo) {
            undos.push_back(std::move(undo));
        }
    }

    if (ok) {
        ok = tx->Commit(error);
    }

    if (!ok) {
        // Undo before tx is destroyed: the writer lock must still be held
        for (auto it = undos.rbegin(); it != undos.rend(); ++it) {
            (*it)();
        }
        if (!undos.empty()) {
            LogPrintDB(INFO, "Rolled back %zu transaction participants", undos.size());
        }
        return false;
    }

    return true;
}
