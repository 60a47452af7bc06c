/**
 * Build Fetch - Tree Navigator
 *
 * Lazy depth-first walk over a remote build repository.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <memory>
#include <optional>
#include <vector>

#include <QString>
#include <QUrl>

#include "RemoteEntry.hpp"
#include "core/CancellationToken.hpp"
#include "core/config/FetchConfig.hpp"

namespace buildfetch {

class HttpClient;

/**
 * A subtree that could not be listed
 */
struct SkippedBranch {
    QUrl url;
    QString reason;
};

/**
 * One traversal of a repository tree
 *
 * Pulls candidates on demand: listings are only fetched as next() needs
 * them, with sibling directories listed ahead on a bounded worker pool.
 * Children are visited in listing order, except that preferred
 * directories (RepositorySettings::preferredDirectories) are descended
 * before their siblings.
 *
 * Guarantees:
 * - No URL is listed twice within one walk
 * - Nothing deeper than maxDepth below the root is listed
 * - Only URLs under the root are followed
 * - A failing subdirectory is logged and skipped; a failing root throws
 *
 * Not thread-safe; a walk belongs to one caller.
 */
class TreeWalk {
public:
    ~TreeWalk();
    TreeWalk(TreeWalk&& other) noexcept;
    TreeWalk& operator=(TreeWalk&& other) noexcept;

    /**
     * Next candidate, or nullopt when the tree is exhausted
     *
     * @throws CancelledError when the token is cancelled
     * @throws AcquisitionError when the root listing fails
     */
    std::optional<CandidateFile> next();

    /**
     * Start again from the root with fresh state
     */
    void restart();

    /**
     * Drain the remaining candidates
     */
    std::vector<CandidateFile> collect();

    const std::vector<SkippedBranch>& skippedBranches() const;
    int directoriesListed() const;

private:
    friend class TreeNavigator;

    TreeWalk(HttpClient& http, const QUrl& rootUrl, int maxDepth,
             const RepositorySettings& settings, const CancellationToken& cancel);

    class Impl;
    std::unique_ptr<Impl> m_impl;
};

/**
 * Factory for tree walks over one HTTP client
 */
class TreeNavigator {
public:
    TreeNavigator(HttpClient& http, RepositorySettings settings);

    /**
     * Begin a walk. No request is made until next() is called.
     */
    TreeWalk walk(const QUrl& rootUrl, int maxDepth,
                  const CancellationToken& cancel = CancellationToken()) const;

    /**
     * Walk with the configured maximum depth
     */
    TreeWalk walk(const QUrl& rootUrl,
                  const CancellationToken& cancel = CancellationToken()) const;

private:
    HttpClient& m_http;
    RepositorySettings m_settings;
};

} // namespace buildfetch
