/**
 * Build Fetch - Fetch Configuration Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "FetchConfig.hpp"

#include <algorithm>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace buildfetch {

FetchConfig FetchConfig::fromJson(const std::string& json) {
    FetchConfig config;

    try {
        auto j = nlohmann::json::parse(json);

        if (j.contains("repository")) {
            const auto& repo = j["repository"];
            if (repo.contains("maxDepth")) {
                config.repository.maxDepth = std::max(0, repo["maxDepth"].get<int>());
            }
            if (repo.contains("listingConcurrency")) {
                config.repository.listingConcurrency = std::max(1, repo["listingConcurrency"].get<int>());
            }
            if (repo.contains("preferredDirectories")) {
                config.repository.preferredDirectories =
                    repo["preferredDirectories"].get<std::vector<std::string>>();
            }
            if (repo.contains("packageExtensions")) {
                config.repository.packageExtensions =
                    repo["packageExtensions"].get<std::vector<std::string>>();
            }
        }

        if (j.contains("transfer")) {
            const auto& transfer = j["transfer"];
            if (transfer.contains("requestTimeoutMs")) {
                config.transfer.requestTimeoutMs = std::max(1, transfer["requestTimeoutMs"].get<int>());
            }
            if (transfer.contains("stallTimeoutMs")) {
                config.transfer.stallTimeoutMs = std::max(1, transfer["stallTimeoutMs"].get<int>());
            }
            if (transfer.contains("maxAttempts")) {
                config.transfer.maxAttempts = std::max(1, transfer["maxAttempts"].get<int>());
            }
            if (transfer.contains("retryDelayMs")) {
                config.transfer.retryDelayMs = std::max(0, transfer["retryDelayMs"].get<int>());
            }
            if (transfer.contains("flushIntervalBytes")) {
                config.transfer.flushIntervalBytes =
                    std::max<int64_t>(1, transfer["flushIntervalBytes"].get<int64_t>());
            }
            if (transfer.contains("progressLogIntervalMs")) {
                config.transfer.progressLogIntervalMs = std::max(1, transfer["progressLogIntervalMs"].get<int>());
            }
        }

    } catch (const std::exception& e) {
        spdlog::warn("Invalid fetch configuration, using defaults: {}", e.what());
        return FetchConfig{};
    }

    return config;
}

std::string FetchConfig::toJson() const {
    nlohmann::json j;

    j["repository"]["maxDepth"] = repository.maxDepth;
    j["repository"]["listingConcurrency"] = repository.listingConcurrency;
    j["repository"]["preferredDirectories"] = repository.preferredDirectories;
    j["repository"]["packageExtensions"] = repository.packageExtensions;

    j["transfer"]["requestTimeoutMs"] = transfer.requestTimeoutMs;
    j["transfer"]["stallTimeoutMs"] = transfer.stallTimeoutMs;
    j["transfer"]["maxAttempts"] = transfer.maxAttempts;
    j["transfer"]["retryDelayMs"] = transfer.retryDelayMs;
    j["transfer"]["flushIntervalBytes"] = transfer.flushIntervalBytes;
    j["transfer"]["progressLogIntervalMs"] = transfer.progressLogIntervalMs;

    return j.dump(2);
}

} // namespace buildfetch
