// Copyright (c) 2025 The Uxledger Core developers
// Distributed under the MIT software license

#ifndef UXLEDGER_DB_DB_ERRORS_H
#define UXLEDGER_DB_DB_ERRORS_H

#include <leveldb/status.h>
#include <string>

/**
 * Durable store error classification
 *
 * Every LevelDB status that reaches the ledger is classified here before it
 * is turned into an error string, so callers can tell a corrupt store from
 * a full disk.
 */

/**
 * Database error types
 */
enum class DBErrorType {
    OK,                    // No error
    CORRUPTION,            // Data corruption detected
    IO_ERROR,              // I/O error (disk full, permission denied, etc.)
    NOT_FOUND,             // Key not found (normal for some operations)
    INVALID_ARGUMENT,      // Invalid argument passed to DB operation
    NOT_SUPPORTED,         // Operation not supported
    UNKNOWN                // Unknown error type
};

/**
 * Classify LevelDB status into error type
 *
 * @param status LevelDB status to classify
 * @return Error type classification
 */
DBErrorType ClassifyDBError(const leveldb::Status& status);

/**
 * Check if error is recoverable
 *
 * @param error_type Error type to check
 * @return true if the store can keep being used after this error
 */
bool IsRecoverableError(DBErrorType error_type);

/**
 * Get human-readable error message
 *
 * @param status LevelDB status
 * @param error_type Classified error type
 * @return Human-readable error message
 */
std::string GetDBErrorMessage(const leveldb::Status& status, DBErrorType error_type);

/**
 * Short name of an error type ("CORRUPTION", "IO_ERROR", ...)
 */
const char* DBErrorTypeName(DBErrorType error_type);

#endif // UXLEDGER_DB_DB_ERRORS_H
