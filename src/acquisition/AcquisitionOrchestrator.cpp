/**
 * Build Fetch - Acquisition Orchestrator Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "AcquisitionOrchestrator.hpp"
#include "network/HttpClient.hpp"
#include "repository/TreeNavigator.hpp"
#include "selection/CandidateSelector.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <map>
#include <mutex>
#include <stdexcept>
#include <thread>

#include <QFuture>
#include <QRegularExpression>
#include <QThreadPool>
#include <QtConcurrent/QtConcurrent>

#include <spdlog/spdlog.h>

namespace buildfetch {

namespace {
    constexpr int CANCEL_POLL_MS = 100;

QUrl parseRootUrl(const QString& rootUrl) {
    QUrl url(rootUrl.trimmed(), QUrl::StrictMode);
    if (!url.isValid() || url.host().isEmpty() ||
        (url.scheme() != "http" && url.scheme() != "https")) {
        NotFoundError error("Invalid repository URL: " + rootUrl.toStdString());
        error.withUrl(rootUrl.toStdString());
        throw error;
    }
    return url;
}

/**
 * @return false if cancelled before the delay elapsed
 */
bool sleepCancellable(int delayMs, const CancellationToken& cancel) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(delayMs);
    while (std::chrono::steady_clock::now() < deadline) {
        if (cancel.isCancelled()) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(CANCEL_POLL_MS));
    }
    return !cancel.isCancelled();
}

void throwIfCancelled(const CancellationToken& cancel, const std::string& url) {
    if (cancel.isCancelled()) {
        CancelledError error("Acquisition cancelled");
        error.withUrl(url);
        throw error;
    }
}

struct Job {
    QString rootUrl;
    std::filesystem::path localDir;
    CancellationToken cancel;
    QFuture<AcquisitionResult> future;
    std::atomic<bool> finished{false};

    mutable std::mutex mutex;
    AcquisitionProgress progress;
};

struct InFlightTransfer {
    std::string sourceUrl;
    std::shared_future<AcquiredFile> result;
};

} // anonymous namespace

const char* acquisitionPhaseLabel(AcquisitionPhase phase) {
    switch (phase) {
        case AcquisitionPhase::Queued:       return "queued";
        case AcquisitionPhase::Navigating:   return "navigating";
        case AcquisitionPhase::Selecting:    return "selecting";
        case AcquisitionPhase::Transferring: return "transferring";
        case AcquisitionPhase::Completed:    return "completed";
        case AcquisitionPhase::Failed:       return "failed";
        case AcquisitionPhase::Cancelled:    return "cancelled";
    }
    return "unknown";
}

class AcquisitionOrchestrator::Impl {
public:
    Impl(HttpClient& http, FetchConfig config)
        : m_http(http)
        , m_config(std::move(config))
    {
    }

    ~Impl() {
        {
            std::lock_guard<std::mutex> lock(m_jobsMutex);
            for (auto& entry : m_jobs) {
                entry.second->cancel.cancel();
            }
        }
        m_pool.waitForDone();
    }

    AcquiredFile acquire(
        const QString& rootUrl,
        const std::filesystem::path& localDir,
        const CancellationToken& cancel,
        const AcquisitionProgressCallback& progress
    ) {
        AcquisitionProgress state;
        auto publish = [&]() {
            if (progress) {
                progress(state);
            }
        };

        const QUrl root = parseRootUrl(rootUrl);
        const std::string rootString = root.toString().toStdString();
        spdlog::info("Acquiring build from {} into {}", rootString, localDir.string());

        std::error_code ec;
        std::filesystem::create_directories(localDir, ec);
        if (ec || !std::filesystem::is_directory(localDir)) {
            StorageError error("Cannot create target directory" +
                               (ec ? ": " + ec.message() : std::string()));
            error.withUrl(rootString).withLocalPath(localDir.string());
            throw error;
        }

        CandidateFile selected;
        if (isDirectFileUrl(root)) {
            spdlog::info("Direct file URL, skipping traversal");
            selected = candidateFromUrl(root);
        } else {
            state.phase = AcquisitionPhase::Navigating;
            publish();

            std::vector<CandidateFile> candidates;
            TreeNavigator navigator(m_http, m_config.repository);
            TreeWalk walk = navigator.walk(root, cancel);
            while (auto candidate = walk.next()) {
                candidates.push_back(std::move(*candidate));
                state.candidatesFound = static_cast<int>(candidates.size());
            }
            spdlog::info("Found {} candidate(s) under {}", candidates.size(), rootString);

            state.phase = AcquisitionPhase::Selecting;
            publish();

            try {
                selected = CandidateSelector::select(candidates);
            } catch (AcquisitionError& e) {
                if (e.kind() == ErrorKind::NotFound && !walk.skippedBranches().empty()) {
                    spdlog::warn("{} branch(es) could not be listed and were skipped",
                                 walk.skippedBranches().size());
                }
                e.withUrl(rootString);
                throw;
            }
        }

        throwIfCancelled(cancel, rootString);

        std::filesystem::path target = localDir / sanitizeFileName(selected.name).toStdString();
        state.currentFile = selected.name;
        state.phase = AcquisitionPhase::Transferring;
        publish();

        AcquiredFile file = transferShared(selected.url, target, cancel,
            [&](const TransferProgress& transfer) {
                state.bytesTransferred = transfer.bytesTransferred;
                state.totalBytes = transfer.totalBytes;
                state.transferStatus = transfer.status;
                publish();
            },
            [&](int attempt) {
                state.attempt = attempt;
                publish();
            });

        state.phase = AcquisitionPhase::Completed;
        state.transferStatus = TransferStatus::Completed;
        state.bytesTransferred = file.totalBytes;
        state.totalBytes = file.totalBytes;
        publish();

        spdlog::info("Build available at {}", file.localPath.string());
        return file;
    }

    std::vector<CandidateFile> discover(const QString& rootUrl, const CancellationToken& cancel) {
        const QUrl root = parseRootUrl(rootUrl);
        if (isDirectFileUrl(root)) {
            return {candidateFromUrl(root)};
        }

        TreeNavigator navigator(m_http, m_config.repository);
        TreeWalk walk = navigator.walk(root, cancel);
        return CandidateSelector::rank(walk.collect());
    }

    AcquisitionHandle start(const QString& rootUrl, const std::filesystem::path& localDir) {
        std::lock_guard<std::mutex> lock(m_jobsMutex);

        for (const auto& entry : m_jobs) {
            const auto& job = entry.second;
            if (!job->finished && job->rootUrl == rootUrl && job->localDir == localDir) {
                spdlog::info("Acquisition of {} already running as #{}",
                             rootUrl.toStdString(), entry.first);
                return entry.first;
            }
        }

        auto job = std::make_shared<Job>();
        job->rootUrl = rootUrl;
        job->localDir = localDir;

        AcquisitionHandle handle = ++m_nextHandle;
        job->future = QtConcurrent::run(&m_pool, [this, job]() {
            return runJob(*job);
        });
        m_jobs[handle] = job;

        spdlog::debug("Started acquisition #{} for {}", handle, rootUrl.toStdString());
        return handle;
    }

    bool cancel(AcquisitionHandle handle) {
        auto job = findJob(handle);
        if (!job) {
            return false;
        }
        spdlog::info("Cancelling acquisition #{}", handle);
        job->cancel.cancel();
        return true;
    }

    std::optional<AcquisitionProgress> queryProgress(AcquisitionHandle handle) const {
        auto job = findJob(handle);
        if (!job) {
            return std::nullopt;
        }
        std::lock_guard<std::mutex> lock(job->mutex);
        return job->progress;
    }

    bool isFinished(AcquisitionHandle handle) const {
        auto job = findJob(handle);
        return job && job->finished;
    }

    AcquisitionResult wait(AcquisitionHandle handle) {
        auto job = findJob(handle);
        if (!job) {
            throw std::invalid_argument("Unknown acquisition handle " + std::to_string(handle));
        }
        job->future.waitForFinished();
        return job->future.result();
    }

    void release(AcquisitionHandle handle) {
        std::lock_guard<std::mutex> lock(m_jobsMutex);
        auto it = m_jobs.find(handle);
        if (it != m_jobs.end() && it->second->finished) {
            m_jobs.erase(it);
        }
    }

private:
    std::shared_ptr<Job> findJob(AcquisitionHandle handle) const {
        std::lock_guard<std::mutex> lock(m_jobsMutex);
        auto it = m_jobs.find(handle);
        return it != m_jobs.end() ? it->second : nullptr;
    }

    AcquisitionResult runJob(Job& job) {
        AcquisitionResult result;
        auto setPhase = [&job](AcquisitionPhase phase) {
            std::lock_guard<std::mutex> lock(job.mutex);
            job.progress.phase = phase;
        };

        try {
            result.file = acquire(job.rootUrl, job.localDir, job.cancel,
                [&job](const AcquisitionProgress& progress) {
                    std::lock_guard<std::mutex> lock(job.mutex);
                    job.progress = progress;
                });
            result.success = true;
        } catch (const AcquisitionError& e) {
            spdlog::error("Acquisition of {} failed: {}", job.rootUrl.toStdString(), e.describe());
            result.error = e;
            setPhase(e.kind() == ErrorKind::Cancelled
                ? AcquisitionPhase::Cancelled
                : AcquisitionPhase::Failed);
        } catch (const std::exception& e) {
            // Filesystem and allocation failures outside the engine's own checks
            spdlog::error("Acquisition of {} failed: {}", job.rootUrl.toStdString(), e.what());
            result.error = StorageError(e.what());
            setPhase(AcquisitionPhase::Failed);
        }

        job.finished = true;
        return result;
    }

    /**
     * Transfer with one writer per target path
     */
    AcquiredFile transferShared(
        const QUrl& url,
        const std::filesystem::path& target,
        const CancellationToken& cancel,
        const TransferProgressCallback& onBytes,
        const std::function<void(int)>& onAttempt
    ) {
        std::error_code ec;
        std::filesystem::path absolute = std::filesystem::absolute(target, ec);
        const std::string key = (ec ? target : absolute).lexically_normal().string();
        const std::string source = url.toString().toStdString();

        while (true) {
            std::promise<AcquiredFile> promise;
            std::shared_future<AcquiredFile> joined;
            std::string joinedSource;
            bool owner = false;

            {
                std::lock_guard<std::mutex> lock(m_inFlightMutex);
                auto it = m_inFlight.find(key);
                if (it == m_inFlight.end()) {
                    m_inFlight[key] = InFlightTransfer{source, promise.get_future().share()};
                    owner = true;
                } else {
                    joined = it->second.result;
                    joinedSource = it->second.sourceUrl;
                }
            }

            if (owner) {
                try {
                    AcquiredFile file = transferWithRetry(url, target, cancel, onBytes, onAttempt);
                    promise.set_value(file);
                    finishInFlight(key);
                    return file;
                } catch (...) {
                    promise.set_exception(std::current_exception());
                    finishInFlight(key);
                    throw;
                }
            }

            spdlog::info("Waiting for the transfer already writing {}", key);
            while (joined.wait_for(std::chrono::milliseconds(CANCEL_POLL_MS)) !=
                   std::future_status::ready) {
                throwIfCancelled(cancel, source);
            }

            try {
                AcquiredFile file = joined.get();
                if (joinedSource == source) {
                    return file;
                }
                spdlog::info("{} was written from another source, fetching {}", key, source);
            } catch (const CancelledError&) {
                throwIfCancelled(cancel, source);
                spdlog::info("Previous writer of {} was cancelled, taking over", key);
            }
        }
    }

    void finishInFlight(const std::string& key) {
        std::lock_guard<std::mutex> lock(m_inFlightMutex);
        m_inFlight.erase(key);
    }

    AcquiredFile transferWithRetry(
        const QUrl& url,
        const std::filesystem::path& target,
        const CancellationToken& cancel,
        const TransferProgressCallback& onBytes,
        const std::function<void(int)>& onAttempt
    ) {
        TransferManager manager(m_http, m_config.transfer);
        const int maxAttempts = std::max(1, m_config.transfer.maxAttempts);

        for (int attempt = 1; ; ++attempt) {
            if (onAttempt) {
                onAttempt(attempt);
            }

            try {
                return manager.transfer(url, target, onBytes, cancel);
            } catch (const AcquisitionError& e) {
                if (!e.isRetryable() || attempt >= maxAttempts) {
                    throw;
                }
                spdlog::warn("Download interrupted: {}. Retrying in {} ms (attempt {}/{})",
                             e.what(), m_config.transfer.retryDelayMs, attempt + 1, maxAttempts);

                if (!sleepCancellable(m_config.transfer.retryDelayMs, cancel)) {
                    CancelledError cancelled("Acquisition cancelled while waiting to retry");
                    cancelled.withUrl(e.url()).withLocalPath(e.localPath())
                             .withOffsets(e.bytesOnDisk(), e.totalBytes());
                    throw cancelled;
                }
            }
        }
    }

    static CandidateFile candidateFromUrl(const QUrl& url) {
        RemoteEntry entry;
        entry.url = url;
        entry.name = url.fileName();
        return CandidateFile::fromEntry(entry);
    }

    HttpClient& m_http;
    FetchConfig m_config;

    QThreadPool m_pool;
    mutable std::mutex m_jobsMutex;
    std::map<AcquisitionHandle, std::shared_ptr<Job>> m_jobs;
    AcquisitionHandle m_nextHandle = 0;

    std::mutex m_inFlightMutex;
    std::map<std::string, InFlightTransfer> m_inFlight;
};

// AcquisitionOrchestrator

AcquisitionOrchestrator::AcquisitionOrchestrator(HttpClient& http, FetchConfig config)
    : m_impl(std::make_unique<Impl>(http, std::move(config)))
{
}

AcquisitionOrchestrator::~AcquisitionOrchestrator() = default;

AcquiredFile AcquisitionOrchestrator::acquire(
    const QString& rootUrl,
    const std::filesystem::path& localDir,
    const CancellationToken& cancel,
    const AcquisitionProgressCallback& progress
) {
    return m_impl->acquire(rootUrl, localDir, cancel, progress);
}

AcquisitionHandle AcquisitionOrchestrator::start(
    const QString& rootUrl,
    const std::filesystem::path& localDir
) {
    return m_impl->start(rootUrl, localDir);
}

bool AcquisitionOrchestrator::cancel(AcquisitionHandle handle) {
    return m_impl->cancel(handle);
}

std::optional<AcquisitionProgress> AcquisitionOrchestrator::queryProgress(
    AcquisitionHandle handle
) const {
    return m_impl->queryProgress(handle);
}

bool AcquisitionOrchestrator::isFinished(AcquisitionHandle handle) const {
    return m_impl->isFinished(handle);
}

AcquisitionResult AcquisitionOrchestrator::wait(AcquisitionHandle handle) {
    return m_impl->wait(handle);
}

void AcquisitionOrchestrator::release(AcquisitionHandle handle) {
    m_impl->release(handle);
}

std::vector<CandidateFile> AcquisitionOrchestrator::discover(
    const QString& rootUrl,
    const CancellationToken& cancel
) {
    return m_impl->discover(rootUrl, cancel);
}

bool AcquisitionOrchestrator::isDirectFileUrl(const QUrl& url) {
    QString path = url.path();
    if (path.isEmpty() || path.endsWith('/')) {
        return false;
    }

    QString segment = path.mid(path.lastIndexOf('/') + 1);
    int dot = segment.lastIndexOf('.');
    if (dot <= 0 || dot == segment.length() - 1) {
        return false;
    }

    // "1.2.3" is a version directory, "build.zip" is a file
    static const QRegularExpression extension("^(?=[A-Za-z0-9]{1,8}$)[0-9]*[A-Za-z]");
    return extension.match(segment.mid(dot + 1)).hasMatch();
}

QString AcquisitionOrchestrator::sanitizeFileName(const QString& name) {
    QString result;
    result.reserve(name.size());
    for (QChar ch : name) {
        if (ch.unicode() < 0x20 || QStringLiteral("/\\:*?\"<>|").contains(ch)) {
            result.append('_');
        } else {
            result.append(ch);
        }
    }
    result = result.trimmed();
    if (result.isEmpty() || result == "." || result == "..") {
        return QStringLiteral("download");
    }
    return result;
}

} // namespace buildfetch
