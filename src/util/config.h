// Copyright (c) 2025 The Uxledger Core developers
// Distributed under the MIT software license

/**
 * Configuration file and environment variable support.
 * Reads uxledger.conf and allows UXLEDGER_* environment variable overrides.
 */

#ifndef UXLEDGER_UTIL_CONFIG_H
#define UXLEDGER_UTIL_CONFIG_H

#include <string>
#include <map>
#include <vector>
#include <optional>
#include <cstdint>

/**
 * Configuration file parser
 *
 * Supports:
 * - Key=value pairs
 * - Comments (# and ;)
 * - Section headers [section] (ignored)
 * - Repeated keys, read back with GetList()
 * - Environment variable overrides (UXLEDGER_*)
 */
class CConfigParser {
private:
    std::map<std::string, std::string> m_settings;              // last value per key
    std::map<std::string, std::vector<std::string>> m_lists;    // every value per key
    std::string m_config_file_path;
    bool m_loaded;

    static std::string Trim(const std::string& str);

    bool ParseLine(const std::string& line, std::string& key, std::string& value);

    static std::optional<std::string> GetEnv(const std::string& name);

public:
    CConfigParser();

    /**
     * Load configuration from file
     * @param file_path Path to uxledger.conf
     * @return true if loaded successfully (or file doesn't exist), false on read error
     */
    bool LoadConfigFile(const std::string& file_path);

    /**
     * Set a value directly (command-line arguments override the file)
     */
    void Set(const std::string& key, const std::string& value);

    /**
     * Get string value
     * Priority: Environment variable > Config file > Default
     * @param key Configuration key (e.g., "datadir")
     * @param default_value Default value if not found
     * @return Configuration value or default
     */
    std::string GetString(const std::string& key, const std::string& default_value = "") const;

    /**
     * Get integer value
     * @param key Configuration key
     * @param default_value Default value if not found or not an integer
     * @return Configuration value or default
     */
    int64_t GetInt64(const std::string& key, int64_t default_value = 0) const;

    /**
     * Get boolean value
     * Supports: 1, 0, true, false, yes, no, on, off
     * @param key Configuration key
     * @param default_value Default value if not found or not a boolean
     * @return Configuration value or default
     */
    bool GetBool(const std::string& key, bool default_value = false) const;

    /**
     * Get list of values for a repeated key
     * The environment form is comma-separated and replaces the file values.
     */
    std::vector<std::string> GetList(const std::string& key) const;

    bool IsLoaded() const { return m_loaded; }

    std::string GetConfigFilePath() const { return m_config_file_path; }
};

/**
 * Get default config file path
 * @param datadir Data directory (if empty, uses default)
 * @return Path to uxledger.conf
 */
std::string GetConfigFilePath(const std::string& datadir = "");

/**
 * Get default data directory ($HOME/.uxledger)
 */
std::string GetDefaultDataDir();

/**
 * Configure CLoggingConfig from the debug, printtoconsole and logfile settings.
 * logfile=1 selects debug.log in the data directory.
 */
void ApplyLoggingSettings(const CConfigParser& config);

#endif // UXLEDGER_UTIL_CONFIG_H
