/**
 * Build Fetch - Transfer Manager
 *
 * Resumable single-file download with durable progress.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

#include <QUrl>

#include "TransferState.hpp"
#include "core/CancellationToken.hpp"
#include "core/config/FetchConfig.hpp"

namespace buildfetch {

class HttpClient;

/**
 * A fully downloaded, size-checked file
 */
struct AcquiredFile {
    std::filesystem::path localPath;
    int64_t totalBytes = 0;
    std::string sourceUrl;
    bool fromCache = false;        // Already complete, no bytes moved
};

/**
 * Transfer progress snapshot
 */
struct TransferProgress {
    int64_t bytesTransferred = 0;
    std::optional<int64_t> totalBytes;
    TransferStatus status = TransferStatus::Pending;

    /**
     * 0-100, or -1 when the total is unknown
     */
    int percentage() const {
        if (!totalBytes || *totalBytes <= 0) {
            return -1;
        }
        return static_cast<int>((bytesTransferred * 100) / *totalBytes);
    }
};

using TransferProgressCallback = std::function<void(const TransferProgress&)>;

/**
 * Resumable transfer manager
 *
 * Protocol for one call:
 * 1. Completed sidecar and a final file of the recorded size: return
 *    immediately without touching the network
 * 2. HEAD for size and change identifier (ETag, else Last-Modified)
 * 3. Changed upstream, no sidecar, or a different source URL: discard
 *    the partial file and start from zero. Otherwise resume from the
 *    recorded offset with a ranged GET.
 * 4. Stream into <name>.part, flushing and updating the sidecar every
 *    flushIntervalBytes
 * 5. Verify the size, rename to the final name, mark Completed
 *
 * A transport failure or cancellation flushes what arrived, persists
 * Paused and rethrows. A size mismatch discards the partial file and
 * raises IntegrityError.
 *
 * A lock file (<name>.lock) keeps a second process from writing the
 * same target.
 */
class TransferManager {
public:
    TransferManager(HttpClient& http, TransferSettings settings);

    AcquiredFile transfer(
        const QUrl& sourceUrl,
        const std::filesystem::path& localPath,
        const TransferProgressCallback& progress = nullptr,
        const CancellationToken& cancel = CancellationToken()
    );

    /**
     * Persisted state of a target, if any
     */
    static std::optional<TransferState> readState(const std::filesystem::path& localPath);

private:
    HttpClient& m_http;
    TransferSettings m_settings;
};

} // namespace buildfetch
