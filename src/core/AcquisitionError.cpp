/**
 * Build Fetch - Acquisition Errors Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "AcquisitionError.hpp"

#include <sstream>
#include <utility>

namespace buildfetch {

const char* errorKindLabel(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Transport: return "TransportError";
        case ErrorKind::Auth:      return "AuthError";
        case ErrorKind::NotFound:  return "NotFoundError";
        case ErrorKind::Ambiguous: return "AmbiguousError";
        case ErrorKind::Integrity: return "IntegrityError";
        case ErrorKind::Cancelled: return "CancelledError";
        case ErrorKind::Storage:   return "StorageError";
    }
    return "UnknownError";
}

AcquisitionError::AcquisitionError(ErrorKind kind, const std::string& message, bool retryable)
    : std::runtime_error(message)
    , m_kind(kind)
    , m_retryable(retryable)
{
}

AcquisitionError& AcquisitionError::withUrl(const std::string& url) {
    m_url = url;
    return *this;
}

AcquisitionError& AcquisitionError::withLocalPath(const std::string& path) {
    m_localPath = path;
    return *this;
}

AcquisitionError& AcquisitionError::withOffsets(int64_t bytesOnDisk, std::optional<int64_t> totalBytes) {
    m_bytesOnDisk = bytesOnDisk;
    m_totalBytes = totalBytes;
    return *this;
}

AcquisitionError& AcquisitionError::withHttpStatus(int status) {
    m_httpStatus = status;
    return *this;
}

AcquisitionError& AcquisitionError::withCandidates(std::vector<std::string> candidates) {
    m_candidates = std::move(candidates);
    return *this;
}

std::string AcquisitionError::describe() const {
    std::ostringstream out;
    out << errorKindLabel(m_kind) << ": " << what();
    if (m_httpStatus != 0) {
        out << " (HTTP " << m_httpStatus << ")";
    }
    if (!m_url.empty()) {
        out << " [url=" << m_url << "]";
    }
    if (!m_localPath.empty()) {
        out << " [path=" << m_localPath << "]";
    }
    if (m_bytesOnDisk > 0 || m_totalBytes) {
        out << " [bytes=" << m_bytesOnDisk;
        if (m_totalBytes) {
            out << "/" << *m_totalBytes;
        }
        out << "]";
    }
    if (!m_candidates.empty()) {
        out << " [candidates:";
        for (const auto& candidate : m_candidates) {
            out << " " << candidate;
        }
        out << "]";
    }
    if (m_retryable) {
        out << " (retryable)";
    }
    return out.str();
}

void raiseForStatus(int statusCode, const std::string& url) {
    if (statusCode >= 200 && statusCode < 300) {
        return;
    }

    if (statusCode == 401 || statusCode == 403) {
        AuthError error(statusCode == 401 ? "Authentication failed" : "Access denied");
        error.withUrl(url).withHttpStatus(statusCode);
        throw error;
    }

    TransportError error(statusCode == 0
        ? std::string("No HTTP response")
        : "Unexpected HTTP status " + std::to_string(statusCode));
    error.withUrl(url).withHttpStatus(statusCode);
    throw error;
}

namespace {

template<typename T>
[[noreturn]] void throwAs(const AcquisitionError& error) {
    T typed(error.what());
    static_cast<AcquisitionError&>(typed) = error;
    throw typed;
}

} // anonymous namespace

void rethrowError(const AcquisitionError& error) {
    switch (error.kind()) {
        case ErrorKind::Transport: throwAs<TransportError>(error);
        case ErrorKind::Auth:      throwAs<AuthError>(error);
        case ErrorKind::NotFound:  throwAs<NotFoundError>(error);
        case ErrorKind::Ambiguous: throwAs<AmbiguousError>(error);
        case ErrorKind::Integrity: throwAs<IntegrityError>(error);
        case ErrorKind::Cancelled: throwAs<CancelledError>(error);
        case ErrorKind::Storage:   throwAs<StorageError>(error);
    }
    throw error;
}

} // namespace buildfetch
