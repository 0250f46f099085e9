#include <gtest/gtest.h>

#include <depfetch/cache/cache_store.h>
#include <depfetch/downloader/file_transfer.h>
#include <depfetch/ledger/verification_ledger.h>

#include "common/fake_http_adapter.h"
#include "common/temp_dir_scope.hpp"
#include "common/test_helpers.h"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>

#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

using namespace depfetch;
using namespace depfetch::downloader;
using test_support::FakeHttpAdapter;
using test_support::FakeResponse;

namespace {

class RecordingObserver final : public IProgressObserver {
public:
    void onStatus(const DownloadItem&, TransferStatus status) override {
        std::lock_guard<std::mutex> lock(mutex_);
        statuses.push_back(status);
    }
    void onBytes(const DownloadItem&, std::uint64_t onDisk, std::uint64_t) override {
        std::lock_guard<std::mutex> lock(mutex_);
        lastOnDisk = onDisk;
    }
    void onVerifyProgress(const DownloadItem&, integrity::VerifyPhase, double fraction) override {
        std::lock_guard<std::mutex> lock(mutex_);
        lastVerifyFraction = fraction;
    }

    std::vector<TransferStatus> statuses;
    std::uint64_t lastOnDisk{0};
    double lastVerifyFraction{0.0};

private:
    std::mutex mutex_;
};

// Equal-length payloads so both stored gzip streams have the same size
const std::string kPayload(4096, 'a');
const std::string kOtherPayload(4096, 'b');

} // namespace

class FileTransferTest : public ::testing::Test {
protected:
    void SetUp() override {
        cache::CacheConfig cacheConfig;
        cacheConfig.root = dir_.path() / "cache";
        cache_ = std::make_unique<cache::CacheStore>(cacheConfig);
        ASSERT_TRUE(cache_->initialize().has_value());

        ledger::LedgerConfig ledgerConfig;
        ledgerConfig.root = cacheConfig.root;
        ledger_ = std::make_unique<ledger::VerificationLedger>(ledgerConfig);
        ASSERT_TRUE(ledger_->initialize().has_value());
        auto session = ledger_->openSession();
        ASSERT_TRUE(session.has_value());
        session_ = std::move(session).value();

        config_.retry.maxRetries = 3;
        config_.retry.initialBackoff = std::chrono::milliseconds(0);
        config_.chunkSizeBytes = 512;

        compressed_ = test_support::gzipBytes(kPayload, 0);
        otherCompressed_ = test_support::gzipBytes(kOtherPayload, 0);
        ASSERT_EQ(compressed_.size(), otherCompressed_.size());
        item_ = test_support::makeItem("win", kPayload, compressed_);
        http_.setBlockSize(700);
    }

    std::filesystem::path localPath() const { return cache_->absolutePath(item_.destination); }

    ItemOutcome runTransfer(CancellationToken cancel = {}, bool withLedger = true) {
        TransferServices services{http_, *cache_, withLedger ? session_.get() : nullptr,
                                  &observer_, cancel};
        FileTransfer transfer(item_, config_, services);
        boost::asio::io_context io;
        auto future = boost::asio::co_spawn(io, transfer.run(), boost::asio::use_future);
        io.run();
        return future.get();
    }

    std::optional<ledger::VerificationStatus> ledgerStatus() {
        auto record = session_->lookup(localPath());
        if (!record || !record.value())
            return std::nullopt;
        return record.value()->status;
    }

    std::vector<std::uint64_t> requestedOffsets() const {
        std::vector<std::uint64_t> offsets;
        for (const auto& r : http_.requests())
            offsets.push_back(r.offset);
        return offsets;
    }

    test_support::TempDirScope dir_ = test_support::TempDirScope::unique_under("depfetch-xfer");
    std::unique_ptr<cache::CacheStore> cache_;
    std::unique_ptr<ledger::VerificationLedger> ledger_;
    std::unique_ptr<ledger::LedgerSession> session_;
    FakeHttpAdapter http_;
    RecordingObserver observer_;
    DownloaderConfig config_;
    DownloadItem item_;
    std::string compressed_;
    std::string otherCompressed_;
};

TEST(RetryPolicyTest, BackoffIsExponential) {
    RetryPolicy policy;
    policy.initialBackoff = std::chrono::milliseconds(100);
    policy.multiplier = 2.0;
    EXPECT_EQ(policy.backoffFor(0), std::chrono::milliseconds(100));
    EXPECT_EQ(policy.backoffFor(1), std::chrono::milliseconds(200));
    EXPECT_EQ(policy.backoffFor(3), std::chrono::milliseconds(800));
}

TEST(TransferStatusTest, DisplayTextCoversEveryState) {
    EXPECT_EQ(toDisplayText(TransferStatus::New), "NEW");
    EXPECT_EQ(toDisplayText(TransferStatus::Resume), "RESUME");
    EXPECT_EQ(toDisplayText(TransferStatus::Redownload), "REDOWNLOAD");
    EXPECT_EQ(toDisplayText(TransferStatus::Downloading), "DOWNLOADING");
    EXPECT_EQ(toDisplayText(TransferStatus::Verifying), "VERIFYING");
    EXPECT_EQ(toDisplayText(TransferStatus::Valid), "VALID");
    EXPECT_EQ(toDisplayText(TransferStatus::Corrupt), "CORRUPT");
    EXPECT_EQ(toDisplayText(TransferStatus::HashMismatch), "HASH_MISMATCH");
    EXPECT_EQ(toDisplayText(TransferStatus::Error), "ERROR");
    EXPECT_TRUE(isTerminal(TransferStatus::Valid));
    EXPECT_TRUE(isTerminal(TransferStatus::Error));
    EXPECT_FALSE(isTerminal(TransferStatus::Verifying));
}

TEST(ChunkedFileWriterTest, AppendAndTruncate) {
    auto dir = test_support::TempDirScope::unique_under("depfetch-writer");
    auto path = dir.path() / "out";
    const std::string first = "hello ";
    const std::string second = "world";
    auto bytes = [](const std::string& s) {
        return std::span<const std::byte>(reinterpret_cast<const std::byte*>(s.data()), s.size());
    };

    {
        ChunkedFileWriter writer(4);
        ASSERT_TRUE(writer.open(path, false).has_value());
        ASSERT_TRUE(writer.write(bytes(first)).has_value());
        ASSERT_TRUE(writer.close().has_value());
    }
    {
        ChunkedFileWriter writer(4);
        ASSERT_TRUE(writer.open(path, true).has_value());
        ASSERT_TRUE(writer.write(bytes(second)).has_value());
        EXPECT_EQ(writer.bytesAccepted(), second.size());
        ASSERT_TRUE(writer.close().has_value());
    }
    EXPECT_EQ(test_support::readFile(path), "hello world");

    {
        ChunkedFileWriter writer(4);
        ASSERT_TRUE(writer.open(path, false).has_value());
        ASSERT_TRUE(writer.write(bytes(second)).has_value());
    }
    EXPECT_EQ(test_support::readFile(path), "world");
}

TEST_F(FileTransferTest, FreshDownloadIsVerifiedAndRecorded) {
    http_.serve(item_.url, compressed_);

    auto outcome = runTransfer();

    ASSERT_TRUE(outcome.success) << (outcome.error ? outcome.error->message : "");
    EXPECT_EQ(outcome.finalStatus, TransferStatus::Valid);
    EXPECT_EQ(outcome.history,
              (std::vector<TransferStatus>{TransferStatus::New, TransferStatus::Downloading,
                                           TransferStatus::Verifying, TransferStatus::Valid}));
    EXPECT_EQ(observer_.statuses, outcome.history);
    EXPECT_EQ(outcome.attempts, 1);
    EXPECT_EQ(outcome.bytesTransferred, compressed_.size());
    EXPECT_EQ(test_support::readFile(localPath()), compressed_);
    EXPECT_EQ(requestedOffsets(), (std::vector<std::uint64_t>{0}));
    EXPECT_EQ(ledgerStatus(), ledger::VerificationStatus::Valid);
    EXPECT_EQ(observer_.lastOnDisk, compressed_.size());
    EXPECT_DOUBLE_EQ(observer_.lastVerifyFraction, 1.0);
}

TEST_F(FileTransferTest, LedgerHitSkipsNetworkAndHashing) {
    http_.serve(item_.url, compressed_);
    ASSERT_TRUE(runTransfer().success);
    ASSERT_EQ(http_.requestCount(), 1u);

    auto again = runTransfer();
    EXPECT_TRUE(again.success);
    EXPECT_EQ(again.history, (std::vector<TransferStatus>{TransferStatus::Valid}));
    EXPECT_EQ(again.attempts, 0);
    EXPECT_EQ(http_.requestCount(), 1u);
}

TEST_F(FileTransferTest, CompleteFileWithoutLedgerIsVerifiedLocally) {
    test_support::writeFile(localPath(), compressed_);

    auto outcome = runTransfer({}, /*withLedger=*/false);

    EXPECT_TRUE(outcome.success);
    EXPECT_EQ(outcome.history, (std::vector<TransferStatus>{TransferStatus::Verifying,
                                                            TransferStatus::Valid}));
    EXPECT_EQ(http_.requestCount(), 0u);
}

TEST_F(FileTransferTest, CorruptLocalFileIsReplaced) {
    test_support::writeFile(localPath(), std::string(compressed_.size(), 'z'));
    http_.serve(item_.url, compressed_);

    auto outcome = runTransfer();

    ASSERT_TRUE(outcome.success);
    EXPECT_EQ(outcome.history,
              (std::vector<TransferStatus>{TransferStatus::Verifying, TransferStatus::Corrupt,
                                           TransferStatus::Redownload, TransferStatus::Downloading,
                                           TransferStatus::Verifying, TransferStatus::Valid}));
    EXPECT_EQ(requestedOffsets(), (std::vector<std::uint64_t>{0}));
    EXPECT_EQ(ledgerStatus(), ledger::VerificationStatus::Valid);
}

TEST_F(FileTransferTest, WellFormedLocalFileWithWrongContentIsReplaced) {
    test_support::writeFile(localPath(), otherCompressed_);
    http_.serve(item_.url, compressed_);

    auto outcome = runTransfer();

    ASSERT_TRUE(outcome.success) << (outcome.error ? outcome.error->message : "");
    EXPECT_EQ(outcome.history,
              (std::vector<TransferStatus>{TransferStatus::Verifying, TransferStatus::HashMismatch,
                                           TransferStatus::Redownload, TransferStatus::Downloading,
                                           TransferStatus::Verifying, TransferStatus::Valid}));
    EXPECT_EQ(outcome.attempts, 1);
    EXPECT_EQ(requestedOffsets(), (std::vector<std::uint64_t>{0}));
    EXPECT_EQ(test_support::readFile(localPath()), compressed_);
    EXPECT_EQ(ledgerStatus(), ledger::VerificationStatus::Valid);
}

TEST_F(FileTransferTest, HashMismatchTriggersRedownload) {
    http_.script(item_.url, FakeResponse{200, otherCompressed_, std::nullopt});
    http_.serve(item_.url, compressed_);

    auto outcome = runTransfer();

    ASSERT_TRUE(outcome.success);
    EXPECT_EQ(outcome.history,
              (std::vector<TransferStatus>{TransferStatus::New, TransferStatus::Downloading,
                                           TransferStatus::Verifying, TransferStatus::HashMismatch,
                                           TransferStatus::Redownload, TransferStatus::Downloading,
                                           TransferStatus::Verifying, TransferStatus::Valid}));
    EXPECT_EQ(outcome.attempts, 2);
    EXPECT_EQ(requestedOffsets(), (std::vector<std::uint64_t>{0, 0}));
    EXPECT_EQ(test_support::readFile(localPath()), compressed_);
    EXPECT_EQ(ledgerStatus(), ledger::VerificationStatus::Valid);
}

TEST_F(FileTransferTest, PersistentHashMismatchEndsInError) {
    config_.retry.maxRetries = 2;
    http_.serve(item_.url, otherCompressed_);

    auto outcome = runTransfer();

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.finalStatus, TransferStatus::Error);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error->code, ErrorCode::HashMismatch);
    EXPECT_EQ(outcome.attempts, 2);
    EXPECT_FALSE(std::filesystem::exists(localPath()));
}

TEST_F(FileTransferTest, UndecompressableDownloadIsFetchedAgain) {
    http_.script(item_.url, FakeResponse{200, std::string(compressed_.size(), 'z'), std::nullopt});
    http_.serve(item_.url, compressed_);

    auto outcome = runTransfer();

    ASSERT_TRUE(outcome.success) << (outcome.error ? outcome.error->message : "");
    EXPECT_EQ(outcome.history,
              (std::vector<TransferStatus>{TransferStatus::New, TransferStatus::Downloading,
                                           TransferStatus::Verifying, TransferStatus::Corrupt,
                                           TransferStatus::Redownload, TransferStatus::Downloading,
                                           TransferStatus::Verifying, TransferStatus::Valid}));
    EXPECT_EQ(outcome.attempts, 2);
    EXPECT_EQ(requestedOffsets(), (std::vector<std::uint64_t>{0, 0}));
    EXPECT_EQ(test_support::readFile(localPath()), compressed_);
    EXPECT_EQ(ledgerStatus(), ledger::VerificationStatus::Valid);
}

TEST_F(FileTransferTest, PersistentCorruptionEndsInDecompressionFailure) {
    config_.retry.maxRetries = 2;
    http_.serve(item_.url, std::string(compressed_.size(), 'z'));

    auto outcome = runTransfer();

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.finalStatus, TransferStatus::Error);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error->code, ErrorCode::DecompressionFailure);
    EXPECT_EQ(outcome.attempts, 2);
    EXPECT_EQ(std::count(outcome.history.begin(), outcome.history.end(), TransferStatus::Corrupt),
              2);
    EXPECT_FALSE(std::filesystem::exists(localPath()));
    // The record outlives the deleted file so the next run knows it was bad
    EXPECT_EQ(ledgerStatus(), ledger::VerificationStatus::Corrupt);
}

TEST_F(FileTransferTest, PartialFileResumesWithRange) {
    const auto half = compressed_.size() / 2;
    test_support::writeFile(localPath(), compressed_.substr(0, half));
    http_.serve(item_.url, compressed_);

    auto outcome = runTransfer();

    ASSERT_TRUE(outcome.success);
    EXPECT_EQ(outcome.history.front(), TransferStatus::Resume);
    EXPECT_EQ(requestedOffsets(), (std::vector<std::uint64_t>{half}));
    EXPECT_EQ(outcome.bytesTransferred, compressed_.size() - half);
    EXPECT_EQ(test_support::readFile(localPath()), compressed_);
}

TEST_F(FileTransferTest, IgnoredRangeRestartsWithoutConsumingRetry) {
    config_.retry.maxRetries = 1;
    const auto half = compressed_.size() / 2;
    test_support::writeFile(localPath(), compressed_.substr(0, half));
    http_.serve(item_.url, compressed_, /*honorRange=*/false);

    auto outcome = runTransfer();

    ASSERT_TRUE(outcome.success) << (outcome.error ? outcome.error->message : "");
    EXPECT_EQ(requestedOffsets(), (std::vector<std::uint64_t>{half, 0}));
    EXPECT_EQ(outcome.history,
              (std::vector<TransferStatus>{TransferStatus::Resume, TransferStatus::Downloading,
                                           TransferStatus::Redownload, TransferStatus::Downloading,
                                           TransferStatus::Verifying, TransferStatus::Valid}));
    EXPECT_EQ(test_support::readFile(localPath()), compressed_);
}

TEST_F(FileTransferTest, IgnoredRangeWithUndeletablePartialConsumesRetries) {
    if (::geteuid() == 0)
        GTEST_SKIP() << "directory permissions do not bind root";

    config_.retry.maxRetries = 2;
    const auto half = compressed_.size() / 2;
    test_support::writeFile(localPath(), compressed_.substr(0, half));
    http_.serve(item_.url, compressed_, /*honorRange=*/false);

    const auto parent = localPath().parent_path();
    std::filesystem::permissions(parent,
                                 std::filesystem::perms::owner_read |
                                     std::filesystem::perms::owner_exec,
                                 std::filesystem::perm_options::replace);
    auto outcome = runTransfer();
    std::filesystem::permissions(parent, std::filesystem::perms::owner_all,
                                 std::filesystem::perm_options::replace);

    EXPECT_FALSE(outcome.success);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error->code, ErrorCode::RangeNotSatisfied);
    EXPECT_EQ(outcome.attempts, 2);
    EXPECT_EQ(requestedOffsets(), (std::vector<std::uint64_t>{half, half}));
    EXPECT_EQ(std::count(outcome.history.begin(), outcome.history.end(),
                         TransferStatus::Redownload),
              0);
    EXPECT_TRUE(std::filesystem::exists(localPath()));
}

TEST_F(FileTransferTest, RangeNotSatisfiableRestartsFromZero) {
    config_.retry.maxRetries = 1;
    test_support::writeFile(localPath(), compressed_.substr(0, 10));
    http_.script(item_.url, FakeResponse{416, "", std::nullopt});
    http_.serve(item_.url, compressed_);

    auto outcome = runTransfer();

    ASSERT_TRUE(outcome.success);
    EXPECT_EQ(requestedOffsets(), (std::vector<std::uint64_t>{10, 0}));
}

TEST_F(FileTransferTest, OversizedLocalFileIsDiscarded) {
    test_support::writeFile(localPath(), compressed_ + "trailing junk");
    http_.serve(item_.url, compressed_);

    auto outcome = runTransfer();

    ASSERT_TRUE(outcome.success);
    EXPECT_EQ(outcome.history.front(), TransferStatus::Redownload);
    EXPECT_EQ(requestedOffsets(), (std::vector<std::uint64_t>{0}));
    EXPECT_EQ(test_support::readFile(localPath()), compressed_);
}

TEST_F(FileTransferTest, TransientStatusIsRetried) {
    http_.script(item_.url, FakeResponse{503, "busy", std::nullopt});
    http_.serve(item_.url, compressed_);

    auto outcome = runTransfer();

    ASSERT_TRUE(outcome.success);
    EXPECT_EQ(outcome.attempts, 2);
    EXPECT_EQ(requestedOffsets(), (std::vector<std::uint64_t>{0, 0}));
}

TEST_F(FileTransferTest, InterruptedTransfersResumeFromLastByte) {
    http_.script(item_.url,
                 FakeResponse{200, compressed_.substr(0, 100),
                              Error{ErrorCode::TransportError, "connection reset"}});
    http_.script(item_.url,
                 FakeResponse{206, compressed_.substr(100, 100),
                              Error{ErrorCode::Timeout, "timed out"}});
    http_.serve(item_.url, compressed_);

    auto outcome = runTransfer();

    ASSERT_TRUE(outcome.success);
    EXPECT_EQ(requestedOffsets(), (std::vector<std::uint64_t>{0, 100, 200}));
    EXPECT_EQ(outcome.bytesTransferred, compressed_.size());
    EXPECT_EQ(test_support::readFile(localPath()), compressed_);
}

TEST_F(FileTransferTest, RetriesExhaustedKeepPartialFile) {
    for (int i = 0; i < 3; ++i) {
        http_.script(item_.url, FakeResponse{i == 0 ? 200L : 206L,
                                             compressed_.substr(i * 10, 10),
                                             Error{ErrorCode::TransportError, "reset"}});
    }

    auto outcome = runTransfer();

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.history.back(), TransferStatus::Error);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error->code, ErrorCode::TransportError);
    EXPECT_EQ(outcome.attempts, 3);
    EXPECT_EQ(requestedOffsets(), (std::vector<std::uint64_t>{0, 10, 20}));
    EXPECT_EQ(std::filesystem::file_size(localPath()), 30u);
    EXPECT_FALSE(ledgerStatus().has_value());
}

TEST_F(FileTransferTest, MissingResourceEndsInError) {
    auto outcome = runTransfer();

    EXPECT_FALSE(outcome.success);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error->code, ErrorCode::UnexpectedStatus);
    EXPECT_EQ(outcome.attempts, 3);
    EXPECT_FALSE(std::filesystem::exists(localPath()));
}

TEST_F(FileTransferTest, SizeMismatchIsNotRetried) {
    item_.expectedCompressedSize = compressed_.size() + 5;
    http_.serve(item_.url, compressed_);

    auto outcome = runTransfer();

    EXPECT_FALSE(outcome.success);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error->code, ErrorCode::SizeMismatch);
    EXPECT_EQ(outcome.attempts, 1);
    EXPECT_FALSE(ledgerStatus().has_value());
}

TEST_F(FileTransferTest, CancelledTransferStopsBeforeRequest) {
    http_.serve(item_.url, compressed_);
    CancellationToken cancel;
    cancel.cancel();

    auto outcome = runTransfer(cancel);

    EXPECT_FALSE(outcome.success);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error->code, ErrorCode::OperationCancelled);
    EXPECT_EQ(http_.requestCount(), 0u);
}

TEST_F(FileTransferTest, CancelDuringBackoffReturnsPromptly) {
    config_.retry.initialBackoff = std::chrono::milliseconds(3000);
    http_.script(item_.url, FakeResponse{503, "busy", std::nullopt});
    http_.serve(item_.url, compressed_);

    CancellationToken cancel;
    std::thread canceller([cancel]() mutable {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        cancel.cancel();
    });

    const auto started = std::chrono::steady_clock::now();
    auto outcome = runTransfer(cancel);
    const auto waited = std::chrono::steady_clock::now() - started;
    canceller.join();

    EXPECT_LT(waited, std::chrono::milliseconds(1000));
    EXPECT_FALSE(outcome.success);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error->code, ErrorCode::OperationCancelled);
    EXPECT_EQ(outcome.attempts, 1);
    EXPECT_EQ(http_.requestCount(), 1u);
}
