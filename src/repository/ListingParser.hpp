/**
 * Build Fetch - Listing Parser
 *
 * Extracts entries from the HTML index pages served by Artifactory and
 * Apache-style autoindex repositories.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <optional>
#include <vector>

#include <QByteArray>
#include <QString>
#include <QUrl>

#include "RemoteEntry.hpp"

namespace buildfetch {

/**
 * Directory listing parser
 *
 * Recognized layouts:
 *
 *   <pre><a href="build_FULL_UPDATE.zip">build_FULL_UPDATE.zip</a>  19-Nov-2025 10:12  524288000
 *   <a href="nightly/">nightly/</a>                                  19-Nov-2025 09:01  -</pre>
 *
 *   <tr><td><a href="x.zip">x.zip</a></td><td>2025-11-19 10:12</td><td>500M</td></tr>
 *
 * Entries are returned in document order. Links that leave the listed
 * directory (parent links, absolute links elsewhere, sort links, other
 * hosts) are dropped. A link is a directory when its target ends with '/';
 * anything ambiguous is treated as a file.
 *
 * Parsing never fails: malformed input yields fewer entries.
 */
class ListingParser {
public:
    static std::vector<RemoteEntry> parse(const QString& html, const QUrl& baseUrl);
    static std::vector<RemoteEntry> parse(const QByteArray& html, const QUrl& baseUrl);

    /**
     * Parse a size column ("524288000", "500M", "1.5 GB", "-")
     */
    static std::optional<qint64> parseSize(const QString& text);

    /**
     * Parse a date column ("19-Nov-2025 10:12" or "2025-11-19 10:12")
     */
    static std::optional<QDateTime> parseDate(const QString& text);

    /**
     * Directory form of a URL (path ends with '/')
     */
    static QUrl directoryUrl(const QUrl& url);
};

} // namespace buildfetch
