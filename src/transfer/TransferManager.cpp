/**
 * Build Fetch - Transfer Manager Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "TransferManager.hpp"
#include "core/AcquisitionError.hpp"
#include "network/HttpClient.hpp"

#include <algorithm>

#include <QElapsedTimer>
#include <QFile>
#include <QLockFile>
#include <QRegularExpression>

#include <spdlog/spdlog.h>

#include <unistd.h>

namespace buildfetch {

namespace {
    constexpr double BYTES_PER_MB = 1024.0 * 1024.0;

/**
 * The .part file being appended to
 */
class PartialFile {
public:
    explicit PartialFile(const std::filesystem::path& path)
        : m_file(QString::fromStdString(path.string()))
    {
    }

    bool open(int64_t offset) {
        return m_file.open(QIODevice::ReadWrite) &&
               m_file.resize(offset) &&
               m_file.seek(offset);
    }

    bool write(const QByteArray& data) {
        return m_file.write(data) == data.size();
    }

    bool reset() {
        return m_file.resize(0) && m_file.seek(0);
    }

    /**
     * Flush Qt's buffer and force the bytes to stable storage
     */
    bool sync() {
        return m_file.flush() && ::fsync(m_file.handle()) == 0;
    }

    void close() { m_file.close(); }

    std::string errorString() const { return m_file.errorString().toStdString(); }

private:
    QFile m_file;
};

std::optional<int64_t> rangeStart(const HttpResponse& response) {
    static const QRegularExpression pattern(R"(bytes\s+(\d+)-)");
    QRegularExpressionMatch match = pattern.match(response.contentRange);
    if (!match.hasMatch()) {
        return std::nullopt;
    }
    return match.captured(1).toLongLong();
}

/**
 * Has the remote file changed since the saved state was written?
 *
 * Without a change identifier on either side only the sizes are compared.
 */
bool remoteChanged(const TransferState& saved, const HttpResponse& probe,
                   std::optional<int64_t> remoteTotal) {
    std::string remoteId = !probe.etag.isEmpty()
        ? probe.etag.toStdString()
        : probe.lastModified.toStdString();

    if ((!remoteId.empty() || !saved.changeIdentifier().empty()) &&
        remoteId != saved.changeIdentifier()) {
        return true;
    }

    return saved.totalBytes && remoteTotal && *saved.totalBytes != *remoteTotal;
}

/**
 * Does a ranged response carry validators different from the ones resumed against?
 *
 * ETags are compared when both sides have one, else Last-Modified.
 */
bool validatorChanged(const TransferState& state, const HttpResponse& response) {
    if (!state.etag.empty() && !response.etag.isEmpty()) {
        return response.etag.toStdString() != state.etag;
    }
    if (state.etag.empty() && response.etag.isEmpty() &&
        !state.lastModified.empty() && !response.lastModified.isEmpty()) {
        return response.lastModified.toStdString() != state.lastModified;
    }
    return false;
}

/**
 * If-Range value for a resume. Weak ETags are not allowed there.
 */
QString ifRangeValidator(const TransferState& state) {
    if (!state.etag.empty() && state.etag.rfind("W/", 0) != 0) {
        return QString::fromStdString(state.etag);
    }
    return QString::fromStdString(state.lastModified);
}

void report(const TransferProgressCallback& progress, int64_t bytes,
            std::optional<int64_t> total, TransferStatus status) {
    if (progress) {
        TransferProgress snapshot;
        snapshot.bytesTransferred = bytes;
        snapshot.totalBytes = total;
        snapshot.status = status;
        progress(snapshot);
    }
}

} // anonymous namespace

TransferManager::TransferManager(HttpClient& http, TransferSettings settings)
    : m_http(http)
    , m_settings(std::move(settings))
{
}

std::optional<TransferState> TransferManager::readState(const std::filesystem::path& localPath) {
    return TransferFiles::load(localPath);
}

AcquiredFile TransferManager::transfer(
    const QUrl& sourceUrl,
    const std::filesystem::path& localPath,
    const TransferProgressCallback& progress,
    const CancellationToken& cancel
) {
    const std::string source = sourceUrl.toString().toStdString();
    const std::string target = localPath.string();
    const std::filesystem::path partPath = TransferFiles::partialPath(localPath);

    auto withContext = [&](AcquisitionError& error, int64_t bytes,
                           std::optional<int64_t> total) -> AcquisitionError& {
        return error.withUrl(source).withLocalPath(target).withOffsets(bytes, total);
    };

    std::error_code ec;
    if (localPath.has_parent_path()) {
        std::filesystem::create_directories(localPath.parent_path(), ec);
        if (ec) {
            StorageError error("Cannot create directory: " + ec.message());
            withContext(error, 0, std::nullopt);
            throw error;
        }
    }

    QLockFile lock(QString::fromStdString(TransferFiles::lockPath(localPath).string()));
    lock.setStaleLockTime(0);
    if (!lock.tryLock(m_settings.requestTimeoutMs)) {
        StorageError error(lock.error() == QLockFile::LockFailedError
            ? "Target is being written by another process"
            : "Cannot create lock file");
        withContext(error, 0, std::nullopt);
        throw error;
    }

    std::optional<TransferState> saved = TransferFiles::load(localPath);

    // Already complete: no network traffic at all
    if (saved && saved->status == TransferStatus::Completed && saved->sourceUrl == source) {
        std::error_code sizeEc;
        auto size = static_cast<int64_t>(std::filesystem::file_size(localPath, sizeEc));
        if (!sizeEc && (!saved->totalBytes || size == *saved->totalBytes)) {
            spdlog::info("Already downloaded: {} ({} bytes)", target, size);
            report(progress, size, size, TransferStatus::Completed);
            return AcquiredFile{localPath, size, source, true};
        }
        spdlog::warn("Recorded download does not match {}, fetching again", target);
    }

    if (cancel.isCancelled()) {
        CancelledError error("Transfer cancelled before start");
        withContext(error, saved ? saved->bytesTransferred : 0,
                    saved ? saved->totalBytes : std::nullopt);
        throw error;
    }

    // Metadata probe
    HttpResponse probe;
    try {
        probe = m_http.head(sourceUrl, cancel);
        if (probe.statusCode == 405 || probe.statusCode == 501) {
            spdlog::debug("HEAD not supported for {}, continuing without metadata", source);
            probe = HttpResponse{};
        } else {
            raiseForStatus(probe.statusCode, source);
        }
    } catch (AcquisitionError& e) {
        withContext(e, saved ? saved->bytesTransferred : 0, saved ? saved->totalBytes : std::nullopt);
        throw;
    }

    std::optional<int64_t> total;
    if (probe.contentLength) {
        total = *probe.contentLength;
    }

    // Resume decision
    std::error_code partEc;
    int64_t partSize = std::filesystem::exists(partPath, partEc)
        ? static_cast<int64_t>(std::filesystem::file_size(partPath, partEc))
        : 0;
    if (partEc) {
        partSize = 0;
    }

    int64_t offset = 0;
    bool resumable = saved && saved->sourceUrl == source &&
                     (saved->status == TransferStatus::InProgress ||
                      saved->status == TransferStatus::Paused ||
                      saved->status == TransferStatus::Pending);
    if (resumable) {
        if (remoteChanged(*saved, probe, total)) {
            spdlog::warn("{} changed upstream, restarting from zero", source);
        } else {
            offset = std::min(saved->bytesTransferred, partSize);
            if (total && offset > *total) {
                offset = 0;
            }
            if (offset > 0) {
                spdlog::info("Resuming {} at {:.1f} MB", target, offset / BYTES_PER_MB);
            }
        }
    } else if (partSize > 0) {
        spdlog::info("Discarding partial data without a matching transfer record: {}",
                     partPath.string());
    }

    TransferState state;
    state.sourceUrl = source;
    state.localPath = target;
    state.totalBytes = total;
    state.bytesTransferred = offset;
    state.etag = probe.etag.toStdString();
    state.lastModified = probe.lastModified.toStdString();
    state.status = TransferStatus::InProgress;

    // Anything past the recorded offset was never confirmed; drop it
    PartialFile part(partPath);
    if (!part.open(offset)) {
        StorageError error("Cannot open partial file: " + part.errorString());
        withContext(error, offset, total);
        throw error;
    }
    TransferFiles::save(state);

    int64_t written = offset;
    int64_t sinceCheckpoint = 0;
    bool firstChunk = true;
    std::optional<AcquisitionError> sinkError;
    QElapsedTimer logTimer;
    logTimer.start();

    auto checkpoint = [&](TransferStatus status) {
        if (!part.sync()) {
            StorageError error("Cannot flush partial file: " + part.errorString());
            withContext(error, state.bytesTransferred, state.totalBytes);
            throw error;
        }
        state.bytesTransferred = written;
        state.status = status;
        TransferFiles::save(state);
        sinceCheckpoint = 0;
    };

    // Used while another error is already propagating
    auto pause = [&]() {
        try {
            checkpoint(TransferStatus::Paused);
        } catch (const AcquisitionError& e) {
            spdlog::error("Failed to persist progress for {}: {}", target, e.describe());
        }
    };

    report(progress, written, state.totalBytes, TransferStatus::InProgress);

    BodySink sink = [&](const HttpResponse& response, const QByteArray& chunk) {
        if (cancel.isCancelled()) {
            return false;
        }

        if (firstChunk) {
            firstChunk = false;
            auto start = rangeStart(response);

            if (written > 0 && (response.statusCode != 206 || (start && *start == 0))) {
                // Range ignored, or If-Range did not match: the body is a whole file
                spdlog::warn("Server sent the whole body for {}, restarting from zero", source);
                if (!part.reset()) {
                    sinkError = StorageError("Cannot truncate partial file: " + part.errorString());
                    return false;
                }
                written = 0;
                state.totalBytes.reset();
            } else if (response.statusCode == 206 && start && *start != written) {
                written = 0;
                if (!part.reset()) {
                    sinkError = StorageError("Cannot truncate partial file: " + part.errorString());
                    return false;
                }
                sinkError = TransportError("Server returned a range starting at " +
                                           std::to_string(*start) + ", expected " +
                                           std::to_string(offset));
                return false;
            } else if (written > 0 && validatorChanged(state, response)) {
                spdlog::warn("{} changed between probe and resume, discarding {} bytes",
                             source, written);
                written = 0;
                state.etag = response.etag.toStdString();
                state.lastModified = response.lastModified.toStdString();
                if (!part.reset()) {
                    sinkError = StorageError("Cannot truncate partial file: " + part.errorString());
                    return false;
                }
                sinkError = IntegrityError("Remote file changed during resume, restart from zero");
                return false;
            }

            if (written == 0) {
                if (!response.etag.isEmpty()) {
                    state.etag = response.etag.toStdString();
                }
                if (!response.lastModified.isEmpty()) {
                    state.lastModified = response.lastModified.toStdString();
                }
            }

            if (!state.totalBytes) {
                if (auto rangeTotal = response.rangeTotal()) {
                    state.totalBytes = *rangeTotal;
                } else if (response.contentLength) {
                    state.totalBytes = written + *response.contentLength;
                }
            }
        }

        if (!part.write(chunk)) {
            sinkError = StorageError("Write failed: " + part.errorString());
            return false;
        }
        written += chunk.size();
        sinceCheckpoint += chunk.size();

        if (sinceCheckpoint >= m_settings.flushIntervalBytes) {
            try {
                checkpoint(TransferStatus::InProgress);
            } catch (const AcquisitionError& e) {
                sinkError = e;
                return false;
            }
        }

        report(progress, written, state.totalBytes, TransferStatus::InProgress);

        if (logTimer.elapsed() >= m_settings.progressLogIntervalMs) {
            if (state.totalBytes && *state.totalBytes > 0) {
                spdlog::info("Downloading {}: {:.1f}/{:.1f} MB ({}%)",
                             localPath.filename().string(), written / BYTES_PER_MB,
                             *state.totalBytes / BYTES_PER_MB,
                             (written * 100) / *state.totalBytes);
            } else {
                spdlog::info("Downloading {}: {:.1f} MB",
                             localPath.filename().string(), written / BYTES_PER_MB);
            }
            logTimer.restart();
        }
        return true;
    };

    bool alreadyComplete = state.totalBytes && offset > 0 && offset == *state.totalBytes;
    if (!alreadyComplete) {
        HttpResponse response;
        try {
            response = m_http.get(sourceUrl, offset, ifRangeValidator(state), sink, cancel);
        } catch (const CancelledError&) {
            pause();
            if (sinkError) {
                withContext(*sinkError, written, state.totalBytes);
                rethrowError(*sinkError);
            }
            spdlog::info("Transfer of {} paused at {} bytes", target, written);
            CancelledError error("Transfer cancelled");
            withContext(error, written, state.totalBytes);
            throw error;
        } catch (AcquisitionError& e) {
            pause();
            spdlog::warn("Transfer of {} interrupted at {:.1f} MB: {}",
                         target, written / BYTES_PER_MB, e.what());
            withContext(e, written, state.totalBytes);
            throw;
        }

        if (!response.isSuccess()) {
            if (response.statusCode == 416) {
                part.close();
                TransferFiles::discard(localPath);
                IntegrityError error("Requested range not satisfiable, partial data discarded");
                withContext(error, 0, state.totalBytes).withHttpStatus(416);
                throw error;
            }
            pause();
            try {
                raiseForStatus(response.statusCode, source);
            } catch (AcquisitionError& e) {
                withContext(e, written, state.totalBytes);
                throw;
            }
        }
    }

    checkpoint(TransferStatus::InProgress);
    part.close();

    if (state.totalBytes && written != *state.totalBytes) {
        spdlog::error("Size mismatch for {}: expected {} bytes, received {}",
                      target, *state.totalBytes, written);
        std::optional<int64_t> expected = state.totalBytes;
        std::filesystem::remove(partPath, ec);
        state.status = TransferStatus::Failed;
        state.bytesTransferred = 0;
        try {
            TransferFiles::save(state);
        } catch (const AcquisitionError& e) {
            spdlog::error("Failed to record failed transfer for {}: {}", target, e.describe());
        }
        IntegrityError error("Downloaded size does not match the advertised size");
        withContext(error, written, expected);
        throw error;
    }

    std::filesystem::rename(partPath, localPath, ec);
    if (ec) {
        StorageError error("Cannot move completed download into place: " + ec.message());
        withContext(error, written, state.totalBytes);
        throw error;
    }

    state.status = TransferStatus::Completed;
    state.bytesTransferred = written;
    state.totalBytes = written;
    TransferFiles::save(state);

    report(progress, written, written, TransferStatus::Completed);
    spdlog::info("Downloaded {} ({:.1f} MB)", target, written / BYTES_PER_MB);
    return AcquiredFile{localPath, written, source, false};
}

} // namespace buildfetch
