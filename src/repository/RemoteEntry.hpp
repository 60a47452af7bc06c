/**
 * Build Fetch - Remote Entries
 *
 * Records produced while walking a remote build repository.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <optional>

#include <QDateTime>
#include <QString>
#include <QUrl>

#include "PackageKind.hpp"

namespace buildfetch {

/**
 * One link found on a directory listing page
 */
struct RemoteEntry {
    QUrl url;                                  // Absolute
    QString name;                              // Last path segment, decoded
    bool isDirectory = false;
    std::optional<qint64> sizeHint;            // Bytes, as printed by the server
    std::optional<QDateTime> lastModifiedHint;
};

/**
 * A downloadable file that passed the package filters
 */
struct CandidateFile {
    QUrl url;
    QString name;
    PackageKind kind = PackageKind::Unrecognized;
    std::optional<qint64> sizeHint;

    static CandidateFile fromEntry(const RemoteEntry& entry) {
        CandidateFile candidate;
        candidate.url = entry.url;
        candidate.name = entry.name;
        candidate.kind = inferPackageKind(entry.name);
        candidate.sizeHint = entry.sizeHint;
        return candidate;
    }
};

} // namespace buildfetch
