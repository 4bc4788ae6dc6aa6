// Copyright (c) 2025 The Uxledger Core developers
// Distributed under the MIT software license

#include <util/error_format.h>
#include <sstream>

std::string CErrorFormatter::FormatForUser(const ErrorMessage& error) {
    std::ostringstream oss;

    // Color coding based on severity
    const char* color = "";
    switch (error.severity) {
        case ErrorSeverity::INFO:
            color = "\033[0;36m";  // Cyan
            break;
        case ErrorSeverity::WARNING:
            color = "\033[0;33m";  // Yellow
            break;
        case ErrorSeverity::ERROR:
            color = "\033[0;31m";  // Red
            break;
        case ErrorSeverity::CRITICAL:
            color = "\033[1;31m";  // Bold Red
            break;
    }
    const char* reset = "\033[0m";

    oss << color << error.title << reset << std::endl;
    oss << "  " << error.description << std::endl;

    if (!error.cause.empty()) {
        oss << std::endl << "  Cause: " << error.cause << std::endl;
    }

    if (!error.recovery_steps.empty()) {
        oss << std::endl << "  To resolve:" << std::endl;
        for (size_t i = 0; i < error.recovery_steps.size(); ++i) {
            oss << "    " << (i + 1) << ". " << error.recovery_steps[i] << std::endl;
        }
    }

    if (!error.error_code.empty()) {
        oss << std::endl << "  Error code: " << error.error_code << std::endl;
    }

    return oss.str();
}

std::string CErrorFormatter::FormatForLog(const ErrorMessage& error) {
    std::ostringstream oss;

    const char* severity_str = "";
    switch (error.severity) {
        case ErrorSeverity::INFO: severity_str = "INFO"; break;
        case ErrorSeverity::WARNING: severity_str = "WARNING"; break;
        case ErrorSeverity::ERROR: severity_str = "ERROR"; break;
        case ErrorSeverity::CRITICAL: severity_str = "CRITICAL"; break;
    }

    oss << "[" << severity_str << "] " << error.title;
    if (!error.error_code.empty()) {
        oss << " (code: " << error.error_code << ")";
    }
    oss << ": " << error.description;

    if (!error.cause.empty()) {
        oss << " Cause: " << error.cause;
    }

    return oss.str();
}

ErrorMessage CErrorFormatter::DatabaseError(const std::string& operation, const std::string& details) {
    ErrorMessage error(ErrorSeverity::ERROR,
                      "Database Operation Failed",
                      "Failed to " + operation + ": " + details);
    error.cause = "Database I/O error or corruption";
    error.recovery_steps = {
        "Check disk space and permissions on the data directory",
        "Make sure no other process has the database open",
        "If problem persists, move the data directory aside and rebuild it"
    };
    error.error_code = "DB_" + operation;
    return error;
}

ErrorMessage CErrorFormatter::ConfigError(const std::string& option, const std::string& details) {
    ErrorMessage error(ErrorSeverity::ERROR,
                      "Configuration Error",
                      "Invalid configuration for '" + option + "': " + details);
    error.cause = "Invalid or malformed configuration value";
    error.recovery_steps = {
        "Check uxledger.conf for syntax errors",
        "Check UXLEDGER_* environment variables",
        "Run with -help to see command-line options"
    };
    error.error_code = "CONFIG_" + option;
    return error;
}

ErrorMessage CErrorFormatter::ConsistencyError(const std::string& object, const std::string& details) {
    ErrorMessage error(ErrorSeverity::CRITICAL,
                      "Ledger Inconsistent",
                      "Consistency check of " + object + " failed: " + details);
    error.cause = "Stored unspent outputs and cached state disagree";
    error.recovery_steps = {
        "Stop every process using the data directory",
        "Run uxledger-inspect -verify again to confirm",
        "Rebuild the data directory from blocks if the check keeps failing"
    };
    error.error_code = "LEDGER_" + object;
    return error;
}
