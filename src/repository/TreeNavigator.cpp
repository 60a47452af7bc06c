/**
 * Build Fetch - Tree Navigator Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "TreeNavigator.hpp"
#include "ListingParser.hpp"
#include "core/AcquisitionError.hpp"
#include "network/HttpClient.hpp"

#include <algorithm>
#include <map>
#include <set>

#include <QFuture>
#include <QThreadPool>
#include <QtConcurrent/QtConcurrent>

#include <spdlog/spdlog.h>

namespace buildfetch {

namespace {

struct Listing {
    std::vector<RemoteEntry> entries;
    std::optional<AcquisitionError> error;
};

Listing fetchListing(HttpClient& http, const QUrl& url, const CancellationToken& cancel) {
    Listing listing;
    try {
        HttpResponse response = http.fetchText(url, cancel);
        raiseForStatus(response.statusCode, url.toString().toStdString());
        listing.entries = ListingParser::parse(response.body, url);
    } catch (const AcquisitionError& e) {
        listing.error = e;
    }
    return listing;
}

QString visitKey(const QUrl& url) {
    return ListingParser::directoryUrl(url)
        .adjusted(QUrl::NormalizePathSegments)
        .toString(QUrl::FullyEncoded);
}

} // anonymous namespace

class TreeWalk::Impl {
public:
    Impl(HttpClient& http, const QUrl& rootUrl, int maxDepth,
         const RepositorySettings& settings, const CancellationToken& cancel)
        : m_http(http)
        , m_rootUrl(ListingParser::directoryUrl(rootUrl))
        , m_maxDepth(std::max(0, maxDepth))
        , m_settings(settings)
        , m_cancel(cancel)
    {
        m_pool.setMaxThreadCount(std::max(1, settings.listingConcurrency));
    }

    ~Impl() {
        abandonPrefetches();
    }

    std::optional<CandidateFile> next() {
        if (!m_started) {
            m_started = true;
            enterRoot();
        }

        while (!m_stack.empty()) {
            checkCancelled();

            Frame& frame = m_stack.back();
            if (frame.index >= frame.entries.size()) {
                m_stack.pop_back();
                continue;
            }

            RemoteEntry entry = frame.entries[frame.index++];
            int childDepth = frame.depth + 1;

            if (!entry.isDirectory) {
                if (hasPackageExtension(entry.name, m_settings.packageExtensions)) {
                    return CandidateFile::fromEntry(entry);
                }
                continue;
            }

            if (childDepth > m_maxDepth || !isUnderRoot(entry.url)) {
                continue;
            }

            descend(entry.url, childDepth);
        }

        if (!m_finished) {
            m_finished = true;
            spdlog::info("Traversal of {} finished: {} directories listed, {} skipped",
                         m_rootUrl.toString().toStdString(), m_listed, m_skipped.size());
        }
        return std::nullopt;
    }

    void restart() {
        abandonPrefetches();
        m_abandon = CancellationToken();
        m_stack.clear();
        m_visited.clear();
        m_skipped.clear();
        m_listed = 0;
        m_started = false;
        m_finished = false;
    }

    const std::vector<SkippedBranch>& skipped() const { return m_skipped; }
    int listed() const { return m_listed; }

private:
    struct Frame {
        QUrl url;
        int depth = 0;
        std::vector<RemoteEntry> entries;
        size_t index = 0;
    };

    void checkCancelled() const {
        if (m_cancel.isCancelled()) {
            CancelledError error("Traversal cancelled");
            error.withUrl(m_rootUrl.toString().toStdString());
            throw error;
        }
    }

    bool isUnderRoot(const QUrl& url) const {
        return url.scheme() == m_rootUrl.scheme() &&
               url.host().compare(m_rootUrl.host(), Qt::CaseInsensitive) == 0 &&
               url.port() == m_rootUrl.port() &&
               url.path().startsWith(m_rootUrl.path());
    }

    void enterRoot() {
        checkCancelled();
        m_visited.insert(visitKey(m_rootUrl));

        spdlog::info("Listing repository root: {}", m_rootUrl.toString().toStdString());
        Listing listing = fetchListing(m_http, m_rootUrl, m_cancel);
        ++m_listed;

        if (listing.error) {
            listing.error->withUrl(m_rootUrl.toString().toStdString());
            rethrowError(*listing.error);
        }

        pushFrame(m_rootUrl, 0, std::move(listing.entries));
    }

    void descend(const QUrl& url, int depth) {
        QString key = visitKey(url);
        Listing listing;

        auto prefetched = m_prefetched.find(key);
        if (prefetched != m_prefetched.end()) {
            QFuture<Listing> future = prefetched->second;
            m_prefetched.erase(prefetched);
            listing = future.result();
        } else {
            if (!m_visited.insert(key).second) {
                spdlog::debug("Already visited: {}", url.toString().toStdString());
                return;
            }
            checkCancelled();
            listing = fetchListing(m_http, url, m_cancel);
        }
        ++m_listed;

        if (listing.error) {
            if (listing.error->kind() == ErrorKind::Cancelled) {
                checkCancelled();
                rethrowError(*listing.error);
            }
            spdlog::warn("Skipping {}: {}", url.toString().toStdString(),
                         listing.error->describe());
            m_skipped.push_back({url, QString::fromStdString(listing.error->what())});
            return;
        }

        spdlog::debug("Listed {} ({} entries, depth {})",
                      url.toString().toStdString(), listing.entries.size(), depth);
        pushFrame(url, depth, std::move(listing.entries));
    }

    void pushFrame(const QUrl& url, int depth, std::vector<RemoteEntry> entries) {
        orderPreferredFirst(entries);

        Frame frame;
        frame.url = url;
        frame.depth = depth;
        frame.entries = std::move(entries);
        m_stack.push_back(std::move(frame));

        prefetchChildren(m_stack.back());
    }

    void orderPreferredFirst(std::vector<RemoteEntry>& entries) const {
        const auto& preferred = m_settings.preferredDirectories;
        if (preferred.empty()) {
            return;
        }

        auto rank = [&preferred](const RemoteEntry& entry) -> size_t {
            if (entry.isDirectory) {
                for (size_t i = 0; i < preferred.size(); ++i) {
                    if (entry.name.compare(QString::fromStdString(preferred[i]),
                                           Qt::CaseInsensitive) == 0) {
                        return i;
                    }
                }
            }
            return preferred.size();
        };

        std::stable_sort(entries.begin(), entries.end(),
            [&rank](const RemoteEntry& a, const RemoteEntry& b) {
                return rank(a) < rank(b);
            });
    }

    /**
     * List sibling directories ahead on the pool
     */
    void prefetchChildren(const Frame& frame) {
        if (m_settings.listingConcurrency <= 1 || frame.depth + 1 > m_maxDepth) {
            return;
        }

        for (const auto& entry : frame.entries) {
            if (!entry.isDirectory || !isUnderRoot(entry.url)) {
                continue;
            }
            QString key = visitKey(entry.url);
            if (!m_visited.insert(key).second) {
                continue;
            }

            QUrl url = entry.url;
            m_prefetched[key] = QtConcurrent::run(&m_pool,
                [&http = m_http, url, cancel = m_cancel, abandon = m_abandon]() {
                    if (abandon.isCancelled()) {
                        Listing listing;
                        listing.error = CancelledError("Listing abandoned");
                        return listing;
                    }
                    return fetchListing(http, url, cancel);
                });
        }
    }

    void abandonPrefetches() {
        m_abandon.cancel();
        m_pool.waitForDone();
        m_prefetched.clear();
    }

    HttpClient& m_http;
    QUrl m_rootUrl;
    int m_maxDepth;
    RepositorySettings m_settings;
    CancellationToken m_cancel;
    CancellationToken m_abandon;

    QThreadPool m_pool;
    std::vector<Frame> m_stack;
    std::set<QString> m_visited;
    std::map<QString, QFuture<Listing>> m_prefetched;
    std::vector<SkippedBranch> m_skipped;
    int m_listed = 0;
    bool m_started = false;
    bool m_finished = false;
};

// TreeWalk

TreeWalk::TreeWalk(HttpClient& http, const QUrl& rootUrl, int maxDepth,
                   const RepositorySettings& settings, const CancellationToken& cancel)
    : m_impl(std::make_unique<Impl>(http, rootUrl, maxDepth, settings, cancel))
{
}

TreeWalk::~TreeWalk() = default;
TreeWalk::TreeWalk(TreeWalk&& other) noexcept = default;
TreeWalk& TreeWalk::operator=(TreeWalk&& other) noexcept = default;

std::optional<CandidateFile> TreeWalk::next() {
    return m_impl->next();
}

void TreeWalk::restart() {
    m_impl->restart();
}

std::vector<CandidateFile> TreeWalk::collect() {
    std::vector<CandidateFile> candidates;
    while (auto candidate = m_impl->next()) {
        candidates.push_back(std::move(*candidate));
    }
    return candidates;
}

const std::vector<SkippedBranch>& TreeWalk::skippedBranches() const {
    return m_impl->skipped();
}

int TreeWalk::directoriesListed() const {
    return m_impl->listed();
}

// TreeNavigator

TreeNavigator::TreeNavigator(HttpClient& http, RepositorySettings settings)
    : m_http(http)
    , m_settings(std::move(settings))
{
}

TreeWalk TreeNavigator::walk(const QUrl& rootUrl, int maxDepth,
                             const CancellationToken& cancel) const {
    return TreeWalk(m_http, rootUrl, maxDepth, m_settings, cancel);
}

TreeWalk TreeNavigator::walk(const QUrl& rootUrl, const CancellationToken& cancel) const {
    return walk(rootUrl, m_settings.maxDepth, cancel);
}

} // namespace buildfetch
