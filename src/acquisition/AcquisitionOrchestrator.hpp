/**
 * Build Fetch - Acquisition Orchestrator
 *
 * Public entry point: find the best build under a repository URL and
 * download it, resumably.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <QString>
#include <QUrl>

#include "core/AcquisitionError.hpp"
#include "core/CancellationToken.hpp"
#include "core/config/FetchConfig.hpp"
#include "repository/RemoteEntry.hpp"
#include "transfer/TransferManager.hpp"

namespace buildfetch {

class HttpClient;

/**
 * Where an acquisition currently is
 */
enum class AcquisitionPhase {
    Queued,
    Navigating,
    Selecting,
    Transferring,
    Completed,
    Failed,
    Cancelled
};

const char* acquisitionPhaseLabel(AcquisitionPhase phase);

/**
 * Progress snapshot for queryProgress()
 */
struct AcquisitionProgress {
    AcquisitionPhase phase = AcquisitionPhase::Queued;
    int64_t bytesTransferred = 0;
    std::optional<int64_t> totalBytes;
    TransferStatus transferStatus = TransferStatus::Pending;
    QString currentFile;             // Selected file name once known
    int candidatesFound = 0;
    int attempt = 0;

    int percentage() const {
        if (!totalBytes || *totalBytes <= 0) {
            return -1;
        }
        return static_cast<int>((bytesTransferred * 100) / *totalBytes);
    }
};

using AcquisitionProgressCallback = std::function<void(const AcquisitionProgress&)>;

/**
 * Outcome of an asynchronous acquisition
 */
struct AcquisitionResult {
    bool success = false;
    std::optional<AcquiredFile> file;
    std::optional<AcquisitionError> error;
};

/**
 * Opaque identifier of a started acquisition. 0 is never issued.
 */
using AcquisitionHandle = uint64_t;

/**
 * Acquisition orchestrator
 *
 * Walks the repository, selects one candidate and transfers it into a
 * local directory. Selection errors (NotFound, Ambiguous) fail fast before
 * any byte is transferred. Retryable transport failures are retried up to
 * TransferSettings::maxAttempts times, resuming from the persisted offset.
 *
 * Concurrent requests for the same target path share one transfer: the
 * second caller waits for the first writer and receives its result.
 *
 * A rootUrl whose last path segment looks like a file name (has an
 * extension and no trailing slash) is downloaded directly.
 */
class AcquisitionOrchestrator {
public:
    AcquisitionOrchestrator(HttpClient& http, FetchConfig config);
    ~AcquisitionOrchestrator();

    AcquisitionOrchestrator(const AcquisitionOrchestrator&) = delete;
    AcquisitionOrchestrator& operator=(const AcquisitionOrchestrator&) = delete;

    /**
     * Acquire synchronously
     *
     * @throws AcquisitionError subclasses on failure
     */
    AcquiredFile acquire(
        const QString& rootUrl,
        const std::filesystem::path& localDir,
        const CancellationToken& cancel = CancellationToken(),
        const AcquisitionProgressCallback& progress = nullptr
    );

    /**
     * Start an acquisition on the worker pool
     *
     * Starting the same (rootUrl, localDir) pair while an earlier one is
     * still running returns the earlier handle.
     */
    AcquisitionHandle start(const QString& rootUrl, const std::filesystem::path& localDir);

    /**
     * Request cancellation. Partial progress stays on disk.
     *
     * @return false for an unknown handle
     */
    bool cancel(AcquisitionHandle handle);

    /**
     * Snapshot of a started acquisition, nullopt for an unknown handle
     */
    std::optional<AcquisitionProgress> queryProgress(AcquisitionHandle handle) const;

    bool isFinished(AcquisitionHandle handle) const;

    /**
     * Block until the acquisition finishes
     *
     * @throws std::invalid_argument for an unknown handle
     */
    AcquisitionResult wait(AcquisitionHandle handle);

    /**
     * Forget a finished acquisition
     */
    void release(AcquisitionHandle handle);

    /**
     * Walk the repository and rank every candidate, best first, without
     * downloading anything
     */
    std::vector<CandidateFile> discover(
        const QString& rootUrl,
        const CancellationToken& cancel = CancellationToken()
    );

    /**
     * Does this URL name a file rather than a directory?
     */
    static bool isDirectFileUrl(const QUrl& url);

    /**
     * File name safe to create inside the target directory
     */
    static QString sanitizeFileName(const QString& name);

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace buildfetch
