/**
 * Build Fetch - Authentication Configuration Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "AuthConfig.hpp"

#include <cstdlib>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace buildfetch {

namespace {

void overrideFromEnv(const char* name, std::string& field) {
    const char* value = std::getenv(name);
    if (value && value[0] != '\0') {
        field = value;
        spdlog::debug("Using {} from environment", name);
    }
}

} // anonymous namespace

void AuthConfig::applyEnvironmentOverrides() {
    overrideFromEnv("BUILDFETCH_USERNAME", username);
    overrideFromEnv("BUILDFETCH_PASSWORD", password);
    overrideFromEnv("BUILDFETCH_API_KEY", apiKey);
}

AuthConfig AuthConfig::fromJson(const std::string& json) {
    AuthConfig config;

    try {
        auto j = nlohmann::json::parse(json);

        if (j.contains("username")) {
            config.username = j["username"].get<std::string>();
        }
        if (j.contains("password")) {
            config.password = j["password"].get<std::string>();
        }
        if (j.contains("apiKey")) {
            config.apiKey = j["apiKey"].get<std::string>();
        }
        if (j.contains("apiKeyHeader")) {
            config.apiKeyHeader = j["apiKeyHeader"].get<std::string>();
        }

    } catch (const std::exception& e) {
        spdlog::warn("Invalid auth configuration, ignoring: {}", e.what());
        return AuthConfig{};
    }

    return config;
}

std::string AuthConfig::toJson() const {
    nlohmann::json j;

    j["username"] = username;
    j["password"] = password;
    j["apiKey"] = apiKey;
    j["apiKeyHeader"] = apiKeyHeader;

    return j.dump(2);
}

} // namespace buildfetch
