/**
 * Build Fetch - Acquisition Orchestrator Tests
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <future>
#include <thread>

#include "FakeHttpClient.hpp"
#include "acquisition/AcquisitionOrchestrator.hpp"

using namespace buildfetch;
using buildfetch::test::FakeHttpClient;

namespace {

const QString ROOT = "https://repo.example.com/builds/";

QString listing(const QStringList& entries) {
    QString html = "<pre>";
    for (const QString& entry : entries) {
        QString name = entry.section(':', 0, 0);
        QString size = entry.contains(':') ? entry.section(':', 1) : QString("-");
        html += QString("<a href=\"%1\">%1</a>    19-Nov-2025 10:00    %2\n").arg(name, size);
    }
    return html + "</pre>";
}

} // anonymous namespace

class AcquisitionOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir = std::filesystem::temp_directory_path() / "build-fetch-test" /
                  ::testing::UnitTest::GetInstance()->current_test_info()->name();
        std::filesystem::remove_all(testDir);

        config.transfer.retryDelayMs = 0;
        config.transfer.maxAttempts = 3;
        config.transfer.requestTimeoutMs = 200;

        http.addDirectory(ROOT, listing({"daily/", "user/", "root_OTA.zip:300"}));
        http.addDirectory(ROOT + "user/", listing({"u_FULL_UPDATE.zip:500"}));
        http.addDirectory(ROOT + "daily/", listing({"d_OTA.zip:200"}));
        http.addSyntheticFile(ROOT + "root_OTA.zip", 300);
        http.addSyntheticFile(ROOT + "user/u_FULL_UPDATE.zip", 500);
        http.addSyntheticFile(ROOT + "daily/d_OTA.zip", 200);
    }

    void TearDown() override {
        std::filesystem::remove_all(testDir);
    }

    FakeHttpClient http;
    FetchConfig config;
    std::filesystem::path testDir;
};

TEST_F(AcquisitionOrchestratorTest, AcquiresBestCandidate) {
    AcquisitionOrchestrator orchestrator(http, config);

    std::vector<AcquisitionPhase> phases;
    AcquiredFile file = orchestrator.acquire(ROOT, testDir / "out", CancellationToken(),
        [&phases](const AcquisitionProgress& progress) {
            if (phases.empty() || phases.back() != progress.phase) {
                phases.push_back(progress.phase);
            }
        });

    EXPECT_EQ(file.localPath, testDir / "out" / "u_FULL_UPDATE.zip");
    EXPECT_EQ(file.totalBytes, 500);
    EXPECT_EQ(static_cast<int64_t>(std::filesystem::file_size(file.localPath)), 500);
    EXPECT_EQ(http.requestCount(ROOT + "root_OTA.zip"), 0);

    EXPECT_EQ(phases, std::vector<AcquisitionPhase>({
        AcquisitionPhase::Navigating, AcquisitionPhase::Selecting,
        AcquisitionPhase::Transferring, AcquisitionPhase::Completed
    }));
}

TEST_F(AcquisitionOrchestratorTest, CreatesMissingLocalDirectory) {
    AcquisitionOrchestrator orchestrator(http, config);
    auto nested = testDir / "a" / "b" / "c";

    orchestrator.acquire(ROOT, nested);
    EXPECT_TRUE(std::filesystem::is_directory(nested));
}

TEST_F(AcquisitionOrchestratorTest, NotFoundFailsBeforeAnyTransfer) {
    http.addDirectory(ROOT + "docs/", listing({"readme.txt:10", "old/"}));
    http.addDirectory(ROOT + "docs/old/", listing({"changelog.txt"}));
    AcquisitionOrchestrator orchestrator(http, config);

    try {
        orchestrator.acquire(ROOT + "docs/", testDir);
        FAIL() << "Expected NotFoundError";
    } catch (const NotFoundError& e) {
        EXPECT_EQ(e.url(), (ROOT + "docs/").toStdString());
    }
    EXPECT_EQ(http.headCount(), 0);
}

TEST_F(AcquisitionOrchestratorTest, AmbiguityFailsBeforeAnyTransfer) {
    http.addDirectory(ROOT + "twins/", listing({"a/", "b/"}));
    http.addDirectory(ROOT + "twins/a/", listing({"pkg_OTA.zip:100"}));
    http.addDirectory(ROOT + "twins/b/", listing({"pkg_OTA.zip:100"}));
    AcquisitionOrchestrator orchestrator(http, config);

    try {
        orchestrator.acquire(ROOT + "twins/", testDir);
        FAIL() << "Expected AmbiguousError";
    } catch (const AmbiguousError& e) {
        EXPECT_EQ(e.candidates().size(), 2u);
    }
    EXPECT_EQ(http.headCount(), 0);
    EXPECT_FALSE(std::filesystem::exists(testDir / "pkg_OTA.zip"));
}

TEST_F(AcquisitionOrchestratorTest, RetriesAndResumesTransportFailures) {
    http.failNextGetAt(ROOT + "user/u_FULL_UPDATE.zip", 120);
    AcquisitionOrchestrator orchestrator(http, config);

    AcquiredFile file = orchestrator.acquire(ROOT, testDir);

    EXPECT_EQ(file.totalBytes, 500);
    EXPECT_EQ(http.requestCount(ROOT + "user/u_FULL_UPDATE.zip"), 4);    // 2 x (HEAD + GET)
    EXPECT_EQ(http.rangeStarts().back(), 120);
}

TEST_F(AcquisitionOrchestratorTest, GivesUpAfterMaxAttempts) {
    http.setStatus(ROOT + "user/u_FULL_UPDATE.zip", 503);
    AcquisitionOrchestrator orchestrator(http, config);

    try {
        orchestrator.acquire(ROOT, testDir);
        FAIL() << "Expected TransportError";
    } catch (const TransportError& e) {
        EXPECT_EQ(e.httpStatus(), 503);
    }
    EXPECT_EQ(http.headCount(), 3);
}

TEST_F(AcquisitionOrchestratorTest, AuthFailureIsNotRetried) {
    http.setStatus(ROOT + "user/u_FULL_UPDATE.zip", 401);
    AcquisitionOrchestrator orchestrator(http, config);

    EXPECT_THROW(orchestrator.acquire(ROOT, testDir), AuthError);
    EXPECT_EQ(http.headCount(), 1);
}

TEST_F(AcquisitionOrchestratorTest, DownloadsDirectFileUrl) {
    AcquisitionOrchestrator orchestrator(http, config);

    AcquiredFile file = orchestrator.acquire(ROOT + "daily/d_OTA.zip", testDir);

    EXPECT_EQ(file.localPath, testDir / "d_OTA.zip");
    EXPECT_EQ(http.requestCount(ROOT), 0);
    EXPECT_EQ(http.requestCount(ROOT + "daily/"), 0);
}

TEST_F(AcquisitionOrchestratorTest, RejectsInvalidUrl) {
    AcquisitionOrchestrator orchestrator(http, config);
    EXPECT_THROW(orchestrator.acquire("not a url", testDir), NotFoundError);
    EXPECT_THROW(orchestrator.acquire("ftp://repo.example.com/x/", testDir), NotFoundError);
}

TEST_F(AcquisitionOrchestratorTest, AsyncAcquisitionReportsProgress) {
    AcquisitionOrchestrator orchestrator(http, config);

    AcquisitionHandle handle = orchestrator.start(ROOT, testDir);
    AcquisitionResult result = orchestrator.wait(handle);

    ASSERT_TRUE(result.success);
    ASSERT_TRUE(result.file.has_value());
    EXPECT_EQ(result.file->totalBytes, 500);

    auto progress = orchestrator.queryProgress(handle);
    ASSERT_TRUE(progress.has_value());
    EXPECT_EQ(progress->phase, AcquisitionPhase::Completed);
    EXPECT_EQ(progress->bytesTransferred, 500);
    EXPECT_EQ(progress->percentage(), 100);
    EXPECT_EQ(progress->currentFile, "u_FULL_UPDATE.zip");
    EXPECT_TRUE(orchestrator.isFinished(handle));

    orchestrator.release(handle);
    EXPECT_FALSE(orchestrator.queryProgress(handle).has_value());
}

TEST_F(AcquisitionOrchestratorTest, CancelPausesRunningTransfer) {
    constexpr qint64 SIZE = 20 * FakeHttpClient::CHUNK_SIZE;
    http.addSyntheticFile(ROOT + "user/u_FULL_UPDATE.zip", SIZE);
    http.setChunkDelayMs(20);
    AcquisitionOrchestrator orchestrator(http, config);

    AcquisitionHandle handle = orchestrator.start(ROOT, testDir);

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (std::chrono::steady_clock::now() < deadline) {
        auto progress = orchestrator.queryProgress(handle);
        if (progress && progress->bytesTransferred > 0) {
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    EXPECT_TRUE(orchestrator.cancel(handle));

    AcquisitionResult result = orchestrator.wait(handle);
    EXPECT_FALSE(result.success);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind(), ErrorKind::Cancelled);
    EXPECT_EQ(orchestrator.queryProgress(handle)->phase, AcquisitionPhase::Cancelled);

    auto state = TransferManager::readState(testDir / "u_FULL_UPDATE.zip");
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->status, TransferStatus::Paused);
    EXPECT_GT(state->bytesTransferred, 0);
    EXPECT_LT(state->bytesTransferred, SIZE);
}

TEST_F(AcquisitionOrchestratorTest, StartingSamePairTwiceSharesHandle) {
    http.addSyntheticFile(ROOT + "user/u_FULL_UPDATE.zip", 10 * FakeHttpClient::CHUNK_SIZE);
    http.setChunkDelayMs(20);
    AcquisitionOrchestrator orchestrator(http, config);

    AcquisitionHandle first = orchestrator.start(ROOT, testDir);
    AcquisitionHandle second = orchestrator.start(ROOT, testDir);
    EXPECT_EQ(first, second);

    EXPECT_TRUE(orchestrator.wait(first).success);
    EXPECT_FALSE(orchestrator.cancel(0));
}

TEST_F(AcquisitionOrchestratorTest, ConcurrentRequestsShareOneWriter) {
    http.addSyntheticFile(ROOT + "user/u_FULL_UPDATE.zip", 8 * FakeHttpClient::CHUNK_SIZE);
    http.setChunkDelayMs(10);
    AcquisitionOrchestrator orchestrator(http, config);

    auto run = [&]() { return orchestrator.acquire(ROOT, testDir); };
    auto a = std::async(std::launch::async, run);
    auto b = std::async(std::launch::async, run);

    AcquiredFile fileA = a.get();
    AcquiredFile fileB = b.get();

    EXPECT_EQ(fileA.localPath, fileB.localPath);
    EXPECT_EQ(fileA.totalBytes, 8 * FakeHttpClient::CHUNK_SIZE);
    EXPECT_EQ(fileB.totalBytes, 8 * FakeHttpClient::CHUNK_SIZE);

    // One HEAD and one GET: the second caller joined the first or found it complete
    EXPECT_EQ(http.requestCount(ROOT + "user/u_FULL_UPDATE.zip"), 2);
}

TEST_F(AcquisitionOrchestratorTest, DiscoverRanksWithoutDownloading) {
    AcquisitionOrchestrator orchestrator(http, config);

    auto ranked = orchestrator.discover(ROOT);

    ASSERT_EQ(ranked.size(), 3u);
    EXPECT_EQ(ranked[0].name, "u_FULL_UPDATE.zip");
    EXPECT_EQ(ranked[1].name, "root_OTA.zip");
    EXPECT_EQ(ranked[2].name, "d_OTA.zip");
    EXPECT_EQ(http.headCount(), 0);
}

TEST(AcquisitionOrchestratorStaticTest, DetectsDirectFileUrls) {
    EXPECT_TRUE(AcquisitionOrchestrator::isDirectFileUrl(QUrl("https://h/builds/pkg.zip")));
    EXPECT_TRUE(AcquisitionOrchestrator::isDirectFileUrl(QUrl("https://h/builds/pkg.tar.gz")));
    EXPECT_FALSE(AcquisitionOrchestrator::isDirectFileUrl(QUrl("https://h/builds/")));
    EXPECT_FALSE(AcquisitionOrchestrator::isDirectFileUrl(QUrl("https://h/builds/daily")));
    EXPECT_FALSE(AcquisitionOrchestrator::isDirectFileUrl(QUrl("https://h/builds/1.2.3")));
    EXPECT_FALSE(AcquisitionOrchestrator::isDirectFileUrl(QUrl("https://h/builds/pkg.zip/")));
    EXPECT_TRUE(AcquisitionOrchestrator::isDirectFileUrl(QUrl("https://h/builds/pkg.7z")));
    EXPECT_FALSE(AcquisitionOrchestrator::isDirectFileUrl(QUrl("https://h/builds/release.2025")));
    EXPECT_FALSE(AcquisitionOrchestrator::isDirectFileUrl(QUrl("https://h/builds/pkg.notanextension")));
}

TEST(AcquisitionOrchestratorStaticTest, SanitizesFileNames) {
    EXPECT_EQ(AcquisitionOrchestrator::sanitizeFileName("pkg.zip"), "pkg.zip");
    EXPECT_EQ(AcquisitionOrchestrator::sanitizeFileName("a/b:c.zip"), "a_b_c.zip");
    EXPECT_EQ(AcquisitionOrchestrator::sanitizeFileName(".."), "download");
    EXPECT_EQ(AcquisitionOrchestrator::sanitizeFileName("  "), "download");
}
