// Copyright (c) 2025 The Trustmesh Core developers
// Distributed under the MIT software license

/**
 * Configuration file and environment variable support.
 * Reads trustmesh.conf and allows TRUSTMESH_* environment overrides.
 */

#ifndef TRUSTMESH_UTIL_CONFIG_H
#define TRUSTMESH_UTIL_CONFIG_H

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

/**
 * Configuration file parser
 *
 * Supports:
 * - Key=value pairs
 * - Comments (# and ;)
 * - Section headers [section] (ignored)
 * - Environment variable overrides (TRUSTMESH_*)
 */
class CConfigParser {
private:
    // Last value wins for scalar lookups; every value is kept for GetList()
    std::map<std::string, std::string> m_settings;
    std::map<std::string, std::vector<std::string>> m_multiSettings;
    std::string m_config_file_path;
    bool m_loaded;

    static std::string Trim(const std::string& str);

    bool ParseLine(const std::string& line, std::string& key, std::string& value);

    static std::optional<std::string> GetEnv(const std::string& name);

public:
    CConfigParser();
    ~CConfigParser();

    /**
     * Load configuration from file
     * @param file_path Path to trustmesh.conf
     * @return true if loaded successfully (or file doesn't exist), false on error
     */
    bool LoadConfigFile(const std::string& file_path);

    /**
     * Get string value
     * Priority: Environment variable > Config file > Default
     * @param key Configuration key (e.g., "datadir")
     * @param default_value Default value if not found
     * @return Configuration value or default
     */
    std::string GetString(const std::string& key, const std::string& default_value = "") const;

    int64_t GetInt64(const std::string& key, int64_t default_value = 0) const;

    double GetDouble(const std::string& key, double default_value = 0.0) const;

    /**
     * Get boolean value
     * Supports: 1, 0, true, false, yes, no, on, off
     */
    bool GetBool(const std::string& key, bool default_value = false) const;

    /**
     * Get list of values (repeated keys, or a comma-separated environment override)
     */
    std::vector<std::string> GetList(const std::string& key) const;

    bool IsSet(const std::string& key) const;

    bool IsLoaded() const { return m_loaded; }

    std::string GetConfigFilePath() const { return m_config_file_path; }
};

/**
 * Get default config file path
 * @param datadir Data directory (if empty, uses default)
 * @return Path to trustmesh.conf
 */
std::string GetConfigFilePath(const std::string& datadir = "");

/**
 * Get default data directory (~/.trustmesh)
 */
std::string GetDefaultDataDir();

#endif // TRUSTMESH_UTIL_CONFIG_H
