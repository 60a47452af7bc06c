/**
 * Build Fetch - Package Kind
 *
 * Classification of build packages by the keywords in their file names.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <string>
#include <vector>

#include <QString>

namespace buildfetch {

/**
 * Package classification, best first
 */
enum class PackageKind {
    FullUpdate,    // FULL_UPDATE, FULL-UPDATE, FULLUPDATE
    Ota,           // OTA
    Full,          // FULL without UPDATE
    Update,        // UPDATE, PACKAGE, BUILD, RELEASE
    Unrecognized
};

/**
 * Classify a file name
 *
 * Matching is case-insensitive on alphanumeric tokens of the base name,
 * so "ROTATE" is not an OTA.
 */
PackageKind inferPackageKind(const QString& fileName);

/**
 * Higher is better. Unrecognized is 0.
 */
int packageKindRank(PackageKind kind);

const char* packageKindLabel(PackageKind kind);

/**
 * Does the name end with one of the extensions (case-insensitive)?
 * An empty list accepts every name.
 */
bool hasPackageExtension(const QString& fileName, const std::vector<std::string>& extensions);

} // namespace buildfetch
