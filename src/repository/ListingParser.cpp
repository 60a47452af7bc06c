/**
 * Build Fetch - Listing Parser Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "ListingParser.hpp"

#include <map>

#include <QRegularExpression>
#include <QTimeZone>

#include <spdlog/spdlog.h>

namespace buildfetch {

namespace {

// Link text ends at </a>, or at the next <a when the closing tag is missing
const QRegularExpression& anchorPattern() {
    static const QRegularExpression pattern(
        R"(<a\s[^>]*?href\s*=\s*(?:"([^"]*)"|'([^']*)'|([^\s>]+))[^>]*>(.*?)(?:</a\s*>|(?=<a\s)|$))",
        QRegularExpression::CaseInsensitiveOption |
        QRegularExpression::DotMatchesEverythingOption);
    return pattern;
}

const QRegularExpression& apacheDatePattern() {
    static const QRegularExpression pattern(
        R"((\d{1,2})-([A-Za-z]{3})-(\d{4})\s+(\d{1,2}):(\d{2})(?::(\d{2}))?)");
    return pattern;
}

const QRegularExpression& isoDatePattern() {
    static const QRegularExpression pattern(
        R"((\d{4})-(\d{2})-(\d{2})[ T](\d{1,2}):(\d{2})(?::(\d{2}))?)");
    return pattern;
}

QString decodeEntities(QString text) {
    text.replace("&nbsp;", " ");
    text.replace("&lt;", "<");
    text.replace("&gt;", ">");
    text.replace("&quot;", "\"");
    text.replace("&#39;", "'");
    text.replace("&amp;", "&");
    return text;
}

QString stripTags(const QString& html) {
    static const QRegularExpression tags("<[^>]*>");
    QString text = html;
    text.replace(tags, " ");
    return decodeEntities(text);
}

int monthFromName(const QString& name) {
    static const char* months[] = {
        "jan", "feb", "mar", "apr", "may", "jun",
        "jul", "aug", "sep", "oct", "nov", "dec"
    };
    QString lower = name.toLower();
    for (int i = 0; i < 12; ++i) {
        if (lower == QLatin1String(months[i])) {
            return i + 1;
        }
    }
    return 0;
}

struct DateMatch {
    QDateTime value;
    int start = -1;
    int length = 0;
};

std::optional<DateMatch> findDate(const QString& text) {
    auto build = [](int year, int month, int day, int hour, int minute, int second)
        -> std::optional<QDateTime> {
        QDate date(year, month, day);
        QTime time(hour, minute, second);
        if (!date.isValid() || !time.isValid()) {
            return std::nullopt;
        }
        return QDateTime(date, time, QTimeZone::utc());
    };

    QRegularExpressionMatch match = apacheDatePattern().match(text);
    if (match.hasMatch()) {
        auto value = build(match.captured(3).toInt(), monthFromName(match.captured(2)),
                           match.captured(1).toInt(), match.captured(4).toInt(),
                           match.captured(5).toInt(), match.captured(6).toInt());
        if (value) {
            return DateMatch{*value, static_cast<int>(match.capturedStart()),
                             static_cast<int>(match.capturedLength())};
        }
    }

    match = isoDatePattern().match(text);
    if (match.hasMatch()) {
        auto value = build(match.captured(1).toInt(), match.captured(2).toInt(),
                           match.captured(3).toInt(), match.captured(4).toInt(),
                           match.captured(5).toInt(), match.captured(6).toInt());
        if (value) {
            return DateMatch{*value, static_cast<int>(match.capturedStart()),
                             static_cast<int>(match.capturedLength())};
        }
    }

    return std::nullopt;
}

/**
 * Size and date columns from the text following a link
 */
void parseHints(const QString& trailing, RemoteEntry& entry) {
    QString text = stripTags(trailing);

    if (auto date = findDate(text)) {
        entry.lastModifiedHint = date->value;
        text.remove(date->start, date->length);
    }

    static const QRegularExpression sizeToken(
        R"((?:^|\s)(\d+(?:\.\d+)?\s*(?:[KMGT](?:i?B)?|B|bytes)?)(?=\s|$))",
        QRegularExpression::CaseInsensitiveOption);

    std::optional<qint64> size;
    auto it = sizeToken.globalMatch(text);
    while (it.hasNext()) {
        QRegularExpressionMatch match = it.next();
        size = ListingParser::parseSize(match.captured(1));
    }
    entry.sizeHint = size;
}

bool sameOrigin(const QUrl& a, const QUrl& b) {
    return a.scheme().compare(b.scheme(), Qt::CaseInsensitive) == 0 &&
           a.host().compare(b.host(), Qt::CaseInsensitive) == 0 &&
           a.port() == b.port();
}

} // anonymous namespace

QUrl ListingParser::directoryUrl(const QUrl& url) {
    QUrl result = url.adjusted(QUrl::RemoveQuery | QUrl::RemoveFragment);
    QString path = result.path();
    if (!path.endsWith('/')) {
        result.setPath(path + '/');
    }
    return result;
}

std::optional<qint64> ListingParser::parseSize(const QString& text) {
    static const QRegularExpression pattern(
        R"(^(\d+(?:\.\d+)?)\s*(?:([KMGT])(?:i?B)?|B|bytes)?$)",
        QRegularExpression::CaseInsensitiveOption);

    QRegularExpressionMatch match = pattern.match(text.trimmed());
    if (!match.hasMatch()) {
        return std::nullopt;
    }

    bool ok = false;
    double value = match.captured(1).toDouble(&ok);
    if (!ok) {
        return std::nullopt;
    }

    QString unit = match.captured(2).toUpper();
    double multiplier = 1.0;
    if (unit == "K") multiplier = 1024.0;
    else if (unit == "M") multiplier = 1024.0 * 1024.0;
    else if (unit == "G") multiplier = 1024.0 * 1024.0 * 1024.0;
    else if (unit == "T") multiplier = 1024.0 * 1024.0 * 1024.0 * 1024.0;

    return static_cast<qint64>(value * multiplier);
}

std::optional<QDateTime> ListingParser::parseDate(const QString& text) {
    if (auto date = findDate(text)) {
        return date->value;
    }
    return std::nullopt;
}

std::vector<RemoteEntry> ListingParser::parse(const QByteArray& html, const QUrl& baseUrl) {
    return parse(QString::fromUtf8(html), baseUrl);
}

std::vector<RemoteEntry> ListingParser::parse(const QString& html, const QUrl& baseUrl) {
    std::vector<RemoteEntry> entries;
    std::map<QString, size_t> seen;

    const QUrl base = directoryUrl(baseUrl);
    const QString basePath = base.path();

    std::vector<QRegularExpressionMatch> anchors;
    auto it = anchorPattern().globalMatch(html);
    while (it.hasNext()) {
        anchors.push_back(it.next());
    }

    for (size_t i = 0; i < anchors.size(); ++i) {
        const QRegularExpressionMatch& anchor = anchors[i];

        QString href = anchor.captured(1);
        if (href.isEmpty()) href = anchor.captured(2);
        if (href.isEmpty()) href = anchor.captured(3);
        href = decodeEntities(href.trimmed());

        // Sort links, in-page anchors and non-navigational schemes
        if (href.isEmpty() || href.startsWith('?') || href.startsWith('#') ||
            href.startsWith("mailto:", Qt::CaseInsensitive) ||
            href.startsWith("javascript:", Qt::CaseInsensitive)) {
            continue;
        }

        QUrl target(href);
        if (!target.isValid()) {
            spdlog::debug("Skipping malformed link: {}", href.toStdString());
            continue;
        }

        QUrl resolved = base.resolved(target).adjusted(QUrl::RemoveFragment);
        if (!sameOrigin(resolved, base)) {
            continue;
        }

        // Parent links and anything outside the listed directory
        QString path = resolved.path();
        if (!path.startsWith(basePath) || path.length() <= basePath.length()) {
            continue;
        }

        QString linkText = stripTags(anchor.captured(4)).trimmed();
        bool isDirectory = path.endsWith('/') || linkText.endsWith('/');
        if (isDirectory && !path.endsWith('/')) {
            path += '/';
            resolved.setPath(path);
        }

        QString trimmed = resolved.path(QUrl::FullyEncoded);
        while (trimmed.endsWith('/')) {
            trimmed.chop(1);
        }
        QString name = QUrl::fromPercentEncoding(trimmed.mid(trimmed.lastIndexOf('/') + 1).toUtf8());
        if (name.isEmpty()) {
            continue;
        }

        RemoteEntry entry;
        entry.url = resolved;
        entry.name = name;
        entry.isDirectory = isDirectory;

        int trailingStart = anchor.capturedEnd();
        int trailingEnd = (i + 1 < anchors.size()) ? anchors[i + 1].capturedStart() : html.length();
        parseHints(html.mid(trailingStart, trailingEnd - trailingStart), entry);

        // Fancy indexes link each entry twice (icon and name)
        QString key = resolved.toString();
        auto existing = seen.find(key);
        if (existing != seen.end()) {
            RemoteEntry& first = entries[existing->second];
            if (!first.sizeHint) first.sizeHint = entry.sizeHint;
            if (!first.lastModifiedHint) first.lastModifiedHint = entry.lastModifiedHint;
            continue;
        }

        seen[key] = entries.size();
        entries.push_back(std::move(entry));
    }

    spdlog::debug("Parsed {} entries from {}", entries.size(), base.toString().toStdString());
    return entries;
}

} // namespace buildfetch
