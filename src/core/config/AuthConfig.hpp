/**
 * Build Fetch - Authentication Configuration
 *
 * Credentials handed to the HTTP transport. Storing them securely is
 * outside this project; they are read from config.json or the environment.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <string>

namespace buildfetch {

/**
 * Authentication scheme derived from the configured fields
 */
enum class AuthScheme {
    None,
    Basic,      // username + password
    ApiKey      // API key sent in apiKeyHeader
};

/**
 * Repository credentials
 *
 * Basic authentication wins when both a username/password pair and an API
 * key are present.
 */
struct AuthConfig {
    std::string username;
    std::string password;
    std::string apiKey;
    std::string apiKeyHeader = "X-JFrog-Art-Api";

    AuthScheme scheme() const {
        if (!username.empty() && !password.empty()) return AuthScheme::Basic;
        if (!apiKey.empty()) return AuthScheme::ApiKey;
        return AuthScheme::None;
    }

    /**
     * Override fields from BUILDFETCH_USERNAME, BUILDFETCH_PASSWORD and
     * BUILDFETCH_API_KEY when they are set and non-empty
     */
    void applyEnvironmentOverrides();

    // Serialization (the password and API key are written back as-is)
    static AuthConfig fromJson(const std::string& json);
    std::string toJson() const;
};

} // namespace buildfetch
