/**
 * Build Fetch - Acquisition Errors
 *
 * Error taxonomy shared by the navigator, selector, transfer manager and
 * orchestrator.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace buildfetch {

/**
 * Error classification
 */
enum class ErrorKind {
    Transport,     // Network failure, timeout, unexpected HTTP status (retryable)
    Auth,          // 401/403, surfaced to the caller, never retried
    NotFound,      // No candidate after traversal
    Ambiguous,     // Selection could not produce a single winner
    Integrity,     // Size mismatch after transfer
    Cancelled,     // Caller-initiated
    Storage        // Local filesystem failure
};

const char* errorKindLabel(ErrorKind kind);

/**
 * Base class for every failure raised by the acquisition engine
 *
 * Carries enough context (URL, local path, byte offsets) for a manual
 * retry without re-deriving state.
 */
class AcquisitionError : public std::runtime_error {
public:
    AcquisitionError(ErrorKind kind, const std::string& message, bool retryable = false);

    ErrorKind kind() const { return m_kind; }
    bool isRetryable() const { return m_retryable; }

    const std::string& url() const { return m_url; }
    const std::string& localPath() const { return m_localPath; }
    int64_t bytesOnDisk() const { return m_bytesOnDisk; }
    std::optional<int64_t> totalBytes() const { return m_totalBytes; }
    int httpStatus() const { return m_httpStatus; }

    /**
     * Candidate URLs involved in the failure (filled for Ambiguous)
     */
    const std::vector<std::string>& candidates() const { return m_candidates; }

    AcquisitionError& withUrl(const std::string& url);
    AcquisitionError& withLocalPath(const std::string& path);
    AcquisitionError& withOffsets(int64_t bytesOnDisk, std::optional<int64_t> totalBytes);
    AcquisitionError& withHttpStatus(int status);
    AcquisitionError& withCandidates(std::vector<std::string> candidates);

    /**
     * One-line description including all available context
     */
    std::string describe() const;

private:
    ErrorKind m_kind;
    bool m_retryable;
    std::string m_url;
    std::string m_localPath;
    int64_t m_bytesOnDisk = 0;
    std::optional<int64_t> m_totalBytes;
    int m_httpStatus = 0;
    std::vector<std::string> m_candidates;
};

class TransportError : public AcquisitionError {
public:
    explicit TransportError(const std::string& message)
        : AcquisitionError(ErrorKind::Transport, message, true) {}
};

class AuthError : public AcquisitionError {
public:
    explicit AuthError(const std::string& message)
        : AcquisitionError(ErrorKind::Auth, message) {}
};

class NotFoundError : public AcquisitionError {
public:
    explicit NotFoundError(const std::string& message)
        : AcquisitionError(ErrorKind::NotFound, message) {}
};

class AmbiguousError : public AcquisitionError {
public:
    explicit AmbiguousError(const std::string& message)
        : AcquisitionError(ErrorKind::Ambiguous, message) {}
};

class IntegrityError : public AcquisitionError {
public:
    explicit IntegrityError(const std::string& message)
        : AcquisitionError(ErrorKind::Integrity, message) {}
};

class CancelledError : public AcquisitionError {
public:
    explicit CancelledError(const std::string& message)
        : AcquisitionError(ErrorKind::Cancelled, message) {}
};

class StorageError : public AcquisitionError {
public:
    explicit StorageError(const std::string& message)
        : AcquisitionError(ErrorKind::Storage, message) {}
};

/**
 * Throw the matching error for a non-success HTTP status
 *
 * 401/403 raise AuthError, anything else outside 2xx raises TransportError.
 * Does nothing for 2xx.
 */
void raiseForStatus(int statusCode, const std::string& url);

/**
 * Throw a copy of a stored error as its concrete subclass
 *
 * Used where errors cross a thread boundary by value.
 */
[[noreturn]] void rethrowError(const AcquisitionError& error);

} // namespace buildfetch
