/**
 * Build Fetch - Tree Navigator Tests
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <gtest/gtest.h>

#include "FakeHttpClient.hpp"
#include "core/AcquisitionError.hpp"
#include "repository/TreeNavigator.hpp"

using namespace buildfetch;
using buildfetch::test::FakeHttpClient;

namespace {

const QString ROOT = "https://repo.example.com/builds/";

/**
 * Artifactory-style listing. Entries ending in '/' are directories,
 * "name:size" gives a file with a size column.
 */
QString listing(const QStringList& entries) {
    QString html = "<html><body><pre><a href=\"../\">../</a>\n";
    for (const QString& entry : entries) {
        QString name = entry.section(':', 0, 0);
        QString size = entry.contains(':') ? entry.section(':', 1) : QString("-");
        html += QString("<a href=\"%1\">%1</a>    19-Nov-2025 10:00    %2\n").arg(name, size);
    }
    html += "</pre></body></html>";
    return html;
}

QStringList names(const std::vector<CandidateFile>& candidates) {
    QStringList result;
    for (const auto& candidate : candidates) {
        result << candidate.name;
    }
    return result;
}

} // anonymous namespace

class TreeNavigatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        http.addDirectory(ROOT, listing({"daily/", "user/", "readme.txt:10", "root_OTA.zip:100"}));
        http.addDirectory(ROOT + "user/", listing({"u_FULL_UPDATE.zip:500"}));
        http.addDirectory(ROOT + "daily/", listing({"2025-11-19/", "d_OTA.zip:200"}));
        http.addDirectory(ROOT + "daily/2025-11-19/", listing({"deep_FULL.zip:300"}));
    }

    TreeNavigator navigator(int concurrency = 4) {
        RepositorySettings settings;
        settings.listingConcurrency = concurrency;
        return TreeNavigator(http, settings);
    }

    FakeHttpClient http;
};

TEST_F(TreeNavigatorTest, WalksDepthFirstWithPreferredDirectoriesFirst) {
    auto walk = navigator().walk(QUrl(ROOT), 6);
    auto candidates = walk.collect();

    EXPECT_EQ(names(candidates), QStringList({
        "u_FULL_UPDATE.zip", "deep_FULL.zip", "d_OTA.zip", "root_OTA.zip"
    }));
    ASSERT_EQ(candidates.size(), 4u);
    EXPECT_EQ(candidates[0].kind, PackageKind::FullUpdate);
    EXPECT_EQ(candidates[0].sizeHint, 500);
    EXPECT_EQ(walk.directoriesListed(), 4);
    EXPECT_TRUE(walk.skippedBranches().empty());
}

TEST_F(TreeNavigatorTest, SequentialAndConcurrentListingAgree) {
    auto sequential = navigator(1).walk(QUrl(ROOT), 6).collect();
    auto concurrent = navigator(8).walk(QUrl(ROOT), 6).collect();
    EXPECT_EQ(names(sequential), names(concurrent));
}

TEST_F(TreeNavigatorTest, ListsEachDirectoryOnce) {
    navigator().walk(QUrl(ROOT), 6).collect();

    EXPECT_EQ(http.requestCount(ROOT), 1);
    EXPECT_EQ(http.requestCount(ROOT + "user/"), 1);
    EXPECT_EQ(http.requestCount(ROOT + "daily/"), 1);
    EXPECT_EQ(http.requestCount(ROOT + "daily/2025-11-19/"), 1);
}

TEST_F(TreeNavigatorTest, RespectsDepthBound) {
    auto candidates = navigator().walk(QUrl(ROOT), 1).collect();

    EXPECT_EQ(names(candidates), QStringList({"u_FULL_UPDATE.zip", "d_OTA.zip", "root_OTA.zip"}));
    EXPECT_EQ(http.requestCount(ROOT + "daily/2025-11-19/"), 0);

    http.resetCounters();
    auto rootOnly = navigator().walk(QUrl(ROOT), 0).collect();
    EXPECT_EQ(names(rootOnly), QStringList({"root_OTA.zip"}));
    EXPECT_EQ(http.totalCalls(), 1);
}

TEST_F(TreeNavigatorTest, DoesNotRequestAnythingUntilPulled) {
    auto walk = navigator().walk(QUrl(ROOT), 6);
    EXPECT_EQ(http.totalCalls(), 0);

    auto first = walk.next();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->name, "u_FULL_UPDATE.zip");
}

TEST_F(TreeNavigatorTest, SkipsFailingSubdirectories) {
    http.setStatus(ROOT + "daily/", 500);

    auto walk = navigator().walk(QUrl(ROOT), 6);
    auto candidates = walk.collect();

    EXPECT_EQ(names(candidates), QStringList({"u_FULL_UPDATE.zip", "root_OTA.zip"}));
    ASSERT_EQ(walk.skippedBranches().size(), 1u);
    EXPECT_EQ(walk.skippedBranches()[0].url.toString(), ROOT + "daily/");
}

TEST_F(TreeNavigatorTest, SkipsForbiddenSubdirectories) {
    http.setStatus(ROOT + "user/", 403);

    auto walk = navigator().walk(QUrl(ROOT), 6);
    auto candidates = walk.collect();

    EXPECT_EQ(candidates.size(), 3u);
    EXPECT_EQ(walk.skippedBranches().size(), 1u);
}

TEST_F(TreeNavigatorTest, RootFailureIsRaised) {
    http.setStatus(ROOT, 401);
    auto walk = navigator().walk(QUrl(ROOT), 6);
    EXPECT_THROW(walk.next(), AuthError);

    auto missing = navigator().walk(QUrl("https://repo.example.com/nothing/"), 6);
    EXPECT_THROW(missing.next(), TransportError);
}

TEST_F(TreeNavigatorTest, EmptyTreeYieldsNothing) {
    http.addDirectory(ROOT + "empty/", listing({"notes.txt"}));
    auto walk = navigator().walk(QUrl(ROOT + "empty/"), 6);
    EXPECT_FALSE(walk.next().has_value());
}

TEST_F(TreeNavigatorTest, CancellationStopsTheWalk) {
    CancellationToken cancel;
    auto walk = navigator().walk(QUrl(ROOT), 6, cancel);

    ASSERT_TRUE(walk.next().has_value());
    cancel.cancel();
    EXPECT_THROW(walk.next(), CancelledError);
}

TEST_F(TreeNavigatorTest, RestartBeginsAgainFromTheRoot) {
    auto walk = navigator().walk(QUrl(ROOT), 6);
    walk.next();
    walk.next();

    walk.restart();
    auto again = walk.collect();
    EXPECT_EQ(again.size(), 4u);
    EXPECT_EQ(again.front().name, "u_FULL_UPDATE.zip");
}

TEST_F(TreeNavigatorTest, DirectoryReachableTwiceIsListedOnce) {
    // daily/2025-11-19/ is linked from the root and from daily/
    http.addDirectory(ROOT, listing({"daily/", "user/", "daily/2025-11-19/", "root_OTA.zip:100"}));

    for (int concurrency : {1, 8}) {
        http.resetCounters();
        auto walk = navigator(concurrency).walk(QUrl(ROOT), 6);
        auto candidates = walk.collect();

        EXPECT_EQ(http.requestCount(ROOT + "daily/2025-11-19/"), 1) << "concurrency " << concurrency;
        EXPECT_EQ(names(candidates), QStringList({
            "u_FULL_UPDATE.zip", "deep_FULL.zip", "d_OTA.zip", "root_OTA.zip"
        })) << "concurrency " << concurrency;
        EXPECT_EQ(walk.directoriesListed(), 4);
    }
}
