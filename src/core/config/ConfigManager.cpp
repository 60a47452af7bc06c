/**
 * Build Fetch - Configuration Manager Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "ConfigManager.hpp"
#include "core/platform/Platform.hpp"

#include <fstream>

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

namespace buildfetch {

namespace {
    constexpr const char* CONFIG_FILE = "config.json";
}

ConfigManager& ConfigManager::instance() {
    static ConfigManager instance;
    return instance;
}

bool ConfigManager::initialize(const std::filesystem::path& configDirectory) {
    m_configDirectory = configDirectory;
    m_programConfig = ProgramConfig{};
    m_fetchConfig = FetchConfig{};
    m_fileAuthConfig = AuthConfig{};

    try {
        std::filesystem::create_directories(m_configDirectory);
    } catch (const std::exception& e) {
        spdlog::error("Failed to create config directory: {}", e.what());
        return false;
    }

    m_isFirstRun = !std::filesystem::exists(configFilePath());

    if (!m_isFirstRun) {
        if (!load()) {
            spdlog::warn("Failed to load config, using defaults");
        }
    }

    m_authConfig = m_fileAuthConfig;
    m_authConfig.applyEnvironmentOverrides();

    spdlog::info("ConfigManager initialized at: {}", m_configDirectory.string());
    return true;
}

std::filesystem::path ConfigManager::configFilePath() const {
    return m_configDirectory / CONFIG_FILE;
}

void ConfigManager::setProgramConfig(const ProgramConfig& config) {
    m_programConfig = config;
    save();
}

void ConfigManager::setFetchConfig(const FetchConfig& config) {
    m_fetchConfig = config;
    save();
}

std::filesystem::path ConfigManager::downloadDirectory() const {
    if (!m_programConfig.downloadDirectory.empty()) {
        return m_programConfig.downloadDirectory;
    }
    return Platform::getDataPath() / "builds";
}

bool ConfigManager::load() {
    try {
        std::ifstream file(configFilePath());
        if (!file.is_open()) {
            return false;
        }

        nlohmann::json j = nlohmann::json::parse(file);

        if (j.contains("program")) {
            const auto& program = j["program"];
            if (program.contains("logVerbosity")) {
                m_programConfig.logVerbosity = program["logVerbosity"].get<std::string>();
            }
            if (program.contains("downloadDirectory")) {
                m_programConfig.downloadDirectory = program["downloadDirectory"].get<std::string>();
            }
        }

        // FetchConfig reads the "repository" and "transfer" sections itself
        m_fetchConfig = FetchConfig::fromJson(j.dump());

        if (j.contains("auth")) {
            m_fileAuthConfig = AuthConfig::fromJson(j["auth"].dump());
        }

        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to load config: {}", e.what());
        return false;
    }
}

bool ConfigManager::save() {
    try {
        nlohmann::json j = nlohmann::json::parse(m_fetchConfig.toJson());
        j["program"]["logVerbosity"] = m_programConfig.logVerbosity;
        j["program"]["downloadDirectory"] = m_programConfig.downloadDirectory;
        j["auth"] = nlohmann::json::parse(m_fileAuthConfig.toJson());

        std::ofstream file(configFilePath());
        if (!file.is_open()) {
            spdlog::error("Cannot write config: {}", configFilePath().string());
            return false;
        }
        file << j.dump(2);

        m_isFirstRun = false;
        spdlog::debug("Saved config -> {}", configFilePath().string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to save config: {}", e.what());
        return false;
    }
}

} // namespace buildfetch
