/**
 * Build Fetch - Configuration Manager
 *
 * Loads and saves config.json from the configuration directory.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <filesystem>
#include <string>

#include "AuthConfig.hpp"
#include "FetchConfig.hpp"

namespace buildfetch {

/**
 * Program-wide settings
 */
struct ProgramConfig {
    std::string logVerbosity = "info";    // debug, info, warning, error
    std::string downloadDirectory;        // Empty = <data dir>/builds
};

/**
 * Central configuration manager
 *
 * config.json layout:
 * {
 *   "program":    { "logVerbosity": "info", "downloadDirectory": "" },
 *   "repository": { "maxDepth": 6, ... },
 *   "transfer":   { "requestTimeoutMs": 30000, ... },
 *   "auth":       { "username": "", "password": "", "apiKey": "", ... }
 * }
 */
class ConfigManager {
public:
    static ConfigManager& instance();

    // Lifecycle
    bool initialize(const std::filesystem::path& configDirectory);
    bool save();

    // State queries
    bool isFirstRun() const { return m_isFirstRun; }
    const std::filesystem::path& configDirectory() const { return m_configDirectory; }
    std::filesystem::path configFilePath() const;

    // Program config
    const ProgramConfig& programConfig() const { return m_programConfig; }
    void setProgramConfig(const ProgramConfig& config);

    /**
     * Effective download directory (configured value or the platform default)
     */
    std::filesystem::path downloadDirectory() const;

    // Engine config
    const FetchConfig& fetchConfig() const { return m_fetchConfig; }
    void setFetchConfig(const FetchConfig& config);

    // Credentials, with environment overrides applied
    const AuthConfig& authConfig() const { return m_authConfig; }

private:
    ConfigManager() = default;
    ~ConfigManager() = default;
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    bool load();

    std::filesystem::path m_configDirectory;
    bool m_isFirstRun = true;

    ProgramConfig m_programConfig;
    FetchConfig m_fetchConfig;
    AuthConfig m_authConfig;
    AuthConfig m_fileAuthConfig;      // As read from disk, without env overrides
};

} // namespace buildfetch
