// Copyright (c) 2025 The Uxledger Core developers
// Distributed under the MIT software license

#include <db/db_errors.h>

DBErrorType ClassifyDBError(const leveldb::Status& status) {
    if (status.ok()) {
        return DBErrorType::OK;
    }

    if (status.IsCorruption()) {
        return DBErrorType::CORRUPTION;
    }

    if (status.IsIOError()) {
        return DBErrorType::IO_ERROR;
    }

    if (status.IsNotFound()) {
        return DBErrorType::NOT_FOUND;
    }

    if (status.IsInvalidArgument()) {
        return DBErrorType::INVALID_ARGUMENT;
    }

    if (status.IsNotSupportedError()) {
        return DBErrorType::NOT_SUPPORTED;
    }

    return DBErrorType::UNKNOWN;
}

bool IsRecoverableError(DBErrorType error_type) {
    switch (error_type) {
        case DBErrorType::OK:
        case DBErrorType::NOT_FOUND:
            return true;

        case DBErrorType::CORRUPTION:
            return false;  // Requires rebuilding the data directory

        case DBErrorType::IO_ERROR:
            // Disk full and permission problems need an operator
            return false;

        case DBErrorType::INVALID_ARGUMENT:
        case DBErrorType::NOT_SUPPORTED:
        case DBErrorType::UNKNOWN:
            return false;
    }
    return false;
}

std::string GetDBErrorMessage(const leveldb::Status& status, DBErrorType error_type) {
    std::string message;

    switch (error_type) {
        case DBErrorType::OK:
            message = "Success";
            break;

        case DBErrorType::CORRUPTION:
            message = "Database corruption detected: " + status.ToString();
            message += " (run uxledger-inspect -verify, rebuild the data directory if it fails)";
            break;

        case DBErrorType::IO_ERROR:
            message = "I/O error: " + status.ToString();
            message += " (check disk space and permissions)";
            break;

        case DBErrorType::NOT_FOUND:
            message = "Key not found";
            break;

        case DBErrorType::INVALID_ARGUMENT:
            message = "Invalid argument: " + status.ToString();
            break;

        case DBErrorType::NOT_SUPPORTED:
            message = "Operation not supported: " + status.ToString();
            break;

        case DBErrorType::UNKNOWN:
            message = "Unknown database error: " + status.ToString();
            break;
    }

    return message;
}

const char* DBErrorTypeName(DBErrorType error_type) {
    switch (error_type) {
        case DBErrorType::OK: return "OK";
        case DBErrorType::CORRUPTION: return "CORRUPTION";
        case DBErrorType::IO_ERROR: return "IO_ERROR";
        case DBErrorType::NOT_FOUND: return "NOT_FOUND";
        case DBErrorType::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        case DBErrorType::NOT_SUPPORTED: return "NOT_SUPPORTED";
        case DBErrorType::UNKNOWN: return "UNKNOWN";
    }
    return "UNKNOWN";
}
