/**
 * Build Fetch - Package Kind Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "PackageKind.hpp"

#include <QRegularExpression>
#include <QStringList>

namespace buildfetch {

namespace {

QStringList tokenize(const QString& fileName) {
    QString base = fileName.toUpper();
    int dot = base.lastIndexOf('.');
    if (dot > 0) {
        base.truncate(dot);
    }
    static const QRegularExpression separators("[^A-Z0-9]+");
    return base.split(separators, Qt::SkipEmptyParts);
}

bool isOtaToken(const QString& token) {
    static const QRegularExpression ota("^OTA\\d*$");
    return ota.match(token).hasMatch();
}

} // anonymous namespace

PackageKind inferPackageKind(const QString& fileName) {
    const QStringList tokens = tokenize(fileName);

    bool full = false;
    bool ota = false;
    bool update = false;

    for (int i = 0; i < tokens.size(); ++i) {
        const QString& token = tokens[i];
        if (token == "FULLUPDATE") {
            return PackageKind::FullUpdate;
        }
        if (token == "FULL") {
            if (i + 1 < tokens.size() && tokens[i + 1] == "UPDATE") {
                return PackageKind::FullUpdate;
            }
            full = true;
        } else if (isOtaToken(token)) {
            ota = true;
        } else if (token == "UPDATE" || token == "PACKAGE" ||
                   token == "BUILD" || token == "RELEASE") {
            update = true;
        }
    }

    if (ota) return PackageKind::Ota;
    if (full) return PackageKind::Full;
    if (update) return PackageKind::Update;
    return PackageKind::Unrecognized;
}

int packageKindRank(PackageKind kind) {
    switch (kind) {
        case PackageKind::FullUpdate:   return 4;
        case PackageKind::Ota:          return 3;
        case PackageKind::Full:         return 2;
        case PackageKind::Update:       return 1;
        case PackageKind::Unrecognized: return 0;
    }
    return 0;
}

const char* packageKindLabel(PackageKind kind) {
    switch (kind) {
        case PackageKind::FullUpdate:   return "FULL_UPDATE";
        case PackageKind::Ota:          return "OTA";
        case PackageKind::Full:         return "FULL";
        case PackageKind::Update:       return "UPDATE";
        case PackageKind::Unrecognized: return "UNRECOGNIZED";
    }
    return "UNRECOGNIZED";
}

bool hasPackageExtension(const QString& fileName, const std::vector<std::string>& extensions) {
    if (extensions.empty()) {
        return true;
    }
    for (const auto& extension : extensions) {
        if (fileName.endsWith(QString::fromStdString(extension), Qt::CaseInsensitive)) {
            return true;
        }
    }
    return false;
}

} // namespace buildfetch
