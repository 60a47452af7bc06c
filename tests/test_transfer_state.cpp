/**
 * Build Fetch - Transfer State Tests
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "transfer/TransferState.hpp"

using namespace buildfetch;

class TransferStateTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir = std::filesystem::temp_directory_path() / "build-fetch-test" /
                  ::testing::UnitTest::GetInstance()->current_test_info()->name();
        std::filesystem::remove_all(testDir);
        std::filesystem::create_directories(testDir);
        target = testDir / "pkg.zip";
    }

    void TearDown() override {
        std::filesystem::remove_all(testDir);
    }

    std::filesystem::path testDir;
    std::filesystem::path target;
};

TEST_F(TransferStateTest, NamesCompanionFiles) {
    EXPECT_EQ(TransferFiles::partialPath(target), testDir / "pkg.zip.part");
    EXPECT_EQ(TransferFiles::sidecarPath(target), testDir / "pkg.zip.transfer.json");
    EXPECT_EQ(TransferFiles::lockPath(target), testDir / "pkg.zip.lock");
}

TEST_F(TransferStateTest, SavesAndLoadsSidecar) {
    TransferState state;
    state.sourceUrl = "https://repo.example.com/pkg.zip";
    state.localPath = target.string();
    state.totalBytes = 1000;
    state.bytesTransferred = 400;
    state.lastModified = "Wed, 19 Nov 2025 10:12:00 GMT";
    state.status = TransferStatus::Paused;
    TransferFiles::save(state);

    EXPECT_GT(state.updatedAt, 0);

    auto loaded = TransferFiles::load(target);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->sourceUrl, state.sourceUrl);
    EXPECT_EQ(loaded->totalBytes, 1000);
    EXPECT_EQ(loaded->bytesTransferred, 400);
    EXPECT_EQ(loaded->status, TransferStatus::Paused);
    EXPECT_EQ(loaded->updatedAt, state.updatedAt);
    EXPECT_EQ(loaded->changeIdentifier(), state.lastModified);
}

TEST_F(TransferStateTest, UnknownTotalIsNull) {
    TransferState state;
    state.localPath = target.string();
    TransferFiles::save(state);

    auto loaded = TransferFiles::load(target);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_FALSE(loaded->totalBytes.has_value());
}

TEST_F(TransferStateTest, EtagTakesPrecedenceOverLastModified) {
    TransferState state;
    state.etag = "\"abc\"";
    state.lastModified = "yesterday";
    EXPECT_EQ(state.changeIdentifier(), "\"abc\"");
}

TEST_F(TransferStateTest, MissingSidecarLoadsNothing) {
    EXPECT_FALSE(TransferFiles::load(target).has_value());
}

TEST_F(TransferStateTest, CorruptSidecarIsIgnored) {
    std::ofstream(TransferFiles::sidecarPath(target)) << "{ not json";
    EXPECT_FALSE(TransferFiles::load(target).has_value());

    std::ofstream(TransferFiles::sidecarPath(target))
        << R"({"totalBytes": 10, "bytesTransferred": 20, "status": "paused"})";
    EXPECT_FALSE(TransferFiles::load(target).has_value());

    std::ofstream(TransferFiles::sidecarPath(target)) << R"({"status": "exploded"})";
    EXPECT_FALSE(TransferFiles::load(target).has_value());
}

TEST_F(TransferStateTest, DiscardRemovesPartialAndSidecar) {
    TransferState state;
    state.localPath = target.string();
    TransferFiles::save(state);
    std::ofstream(TransferFiles::partialPath(target)) << "partial";

    TransferFiles::discard(target);

    EXPECT_FALSE(std::filesystem::exists(TransferFiles::sidecarPath(target)));
    EXPECT_FALSE(std::filesystem::exists(TransferFiles::partialPath(target)));
}

TEST(TransferStatusTest, LabelsRoundTrip) {
    for (auto status : {TransferStatus::Pending, TransferStatus::InProgress, TransferStatus::Paused,
                        TransferStatus::Completed, TransferStatus::Failed}) {
        EXPECT_EQ(parseTransferStatus(transferStatusLabel(status)), status);
    }
    EXPECT_FALSE(parseTransferStatus("bogus").has_value());
}
