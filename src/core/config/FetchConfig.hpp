/**
 * Build Fetch - Fetch Configuration
 *
 * Repository traversal and transfer tuning.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace buildfetch {

/**
 * Remote tree traversal settings
 */
struct RepositorySettings {
    int maxDepth = 6;                     // daily/<date>/<user>/<packages> fits comfortably
    int listingConcurrency = 4;           // Parallel sibling listing fetches
    std::vector<std::string> preferredDirectories = {"user", "gms"};
    std::vector<std::string> packageExtensions = {".zip"};
};

/**
 * Byte transfer settings
 */
struct TransferSettings {
    int requestTimeoutMs = 30000;         // Listing fetches and metadata probes
    int stallTimeoutMs = 60000;           // Max silence while streaming a body
    int maxAttempts = 3;
    int retryDelayMs = 5000;
    int64_t flushIntervalBytes = 8 * 1024 * 1024;
    int progressLogIntervalMs = 2000;
};

/**
 * Engine configuration
 */
struct FetchConfig {
    RepositorySettings repository;
    TransferSettings transfer;

    // Serialization
    static FetchConfig fromJson(const std::string& json);
    std::string toJson() const;
};

} // namespace buildfetch
