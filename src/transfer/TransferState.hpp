/**
 * Build Fetch - Transfer State
 *
 * Durable record of one download, persisted next to the target file as
 * <name>.transfer.json while the bytes accumulate in <name>.part.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace buildfetch {

/**
 * Transfer lifecycle
 *
 *   Pending -> InProgress -> Completed
 *                  |  ^
 *                  v  |
 *                 Paused          (transport failure or cancellation)
 *
 *   InProgress -> Failed          (size mismatch; restarts from zero)
 */
enum class TransferStatus {
    Pending,
    InProgress,
    Paused,
    Completed,
    Failed
};

const char* transferStatusLabel(TransferStatus status);
std::optional<TransferStatus> parseTransferStatus(const std::string& label);

/**
 * Persisted transfer record
 *
 * Invariant: bytesTransferred never exceeds the bytes on disk in the
 * partial file, and never exceeds totalBytes when that is known.
 */
struct TransferState {
    std::string sourceUrl;
    std::string localPath;                 // Final destination
    std::optional<int64_t> totalBytes;
    int64_t bytesTransferred = 0;
    std::string etag;
    std::string lastModified;
    TransferStatus status = TransferStatus::Pending;
    int64_t updatedAt = 0;                 // Unix epoch, milliseconds

    /**
     * ETag when present, otherwise Last-Modified
     */
    const std::string& changeIdentifier() const {
        return etag.empty() ? lastModified : etag;
    }

    // Serialization
    static TransferState fromJson(const std::string& json);
    std::string toJson() const;
};

/**
 * Files belonging to one transfer
 */
class TransferFiles {
public:
    static std::filesystem::path partialPath(const std::filesystem::path& localPath);
    static std::filesystem::path sidecarPath(const std::filesystem::path& localPath);
    static std::filesystem::path lockPath(const std::filesystem::path& localPath);

    /**
     * Read the sidecar. A missing or unreadable sidecar yields nullopt.
     */
    static std::optional<TransferState> load(const std::filesystem::path& localPath);

    /**
     * Atomically replace the sidecar (write to a temporary file, then rename)
     *
     * Stamps updatedAt.
     *
     * @throws StorageError when the sidecar cannot be written
     */
    static void save(TransferState& state);

    /**
     * Remove the partial file and the sidecar
     */
    static void discard(const std::filesystem::path& localPath);
};

} // namespace buildfetch
