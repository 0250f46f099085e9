#include <gtest/gtest.h>

#include <depfetch/cache/cache_store.h>
#include <depfetch/downloader/download_orchestrator.h>
#include <depfetch/ledger/verification_ledger.h>

#include "common/fake_http_adapter.h"
#include "common/temp_dir_scope.hpp"
#include "common/test_helpers.h"

#include <algorithm>
#include <mutex>
#include <string>
#include <vector>

using namespace depfetch;
using namespace depfetch::downloader;
using test_support::FakeHttpAdapter;

namespace {

class TallyObserver final : public IProgressObserver {
public:
    void onItemFinished(const ItemOutcome&, const BatchTally& tally) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++finished;
        if (tally.completed > last.completed)
            last = tally;
    }

    std::size_t finished{0};
    BatchTally last{};

private:
    std::mutex mutex_;
};

} // namespace

class DownloadOrchestratorTest : public ::testing::Test {
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

        config_.workers = 3;
        config_.retry.maxRetries = 2;
        config_.retry.initialBackoff = std::chrono::milliseconds(0);
    }

    // Items with distinct payloads; all served unless listed in `missing`
    std::vector<DownloadItem> makeItems(std::size_t count,
                                        const std::vector<std::size_t>& missing = {}) {
        std::vector<DownloadItem> items;
        for (std::size_t i = 0; i < count; ++i) {
            const std::string payload(2048 + i, static_cast<char>('a' + i));
            const auto compressed = test_support::gzipBytes(payload);
            auto item = test_support::makeItem(i % 2 ? "linux" : "win", payload, compressed);
            if (std::find(missing.begin(), missing.end(), i) == missing.end())
                http_.serve(item.url, compressed);
            items.push_back(std::move(item));
        }
        return items;
    }

    test_support::TempDirScope dir_ =
        test_support::TempDirScope::unique_under("depfetch-orchestrator");
    std::unique_ptr<cache::CacheStore> cache_;
    std::unique_ptr<ledger::VerificationLedger> ledger_;
    FakeHttpAdapter http_;
    DownloaderConfig config_;
};

TEST_F(DownloadOrchestratorTest, EmptyBatch) {
    DownloadOrchestrator orchestrator(config_, http_, *cache_, ledger_.get());
    auto report = orchestrator.run({});
    EXPECT_EQ(report.total, 0u);
    EXPECT_TRUE(report.outcomes.empty());
    EXPECT_TRUE(report.allSucceeded());
}

TEST_F(DownloadOrchestratorTest, AllItemsSucceedInInputOrder) {
    auto items = makeItems(6);
    TallyObserver observer;
    DownloadOrchestrator orchestrator(config_, http_, *cache_, ledger_.get(), &observer);

    auto report = orchestrator.run(items);

    EXPECT_EQ(report.total, 6u);
    EXPECT_EQ(report.successful, 6u);
    EXPECT_EQ(report.failed(), 0u);
    EXPECT_TRUE(report.allSucceeded());
    ASSERT_EQ(report.outcomes.size(), items.size());
    for (std::size_t i = 0; i < items.size(); ++i) {
        EXPECT_EQ(report.outcomes[i].item.url, items[i].url);
        EXPECT_EQ(report.outcomes[i].finalStatus, TransferStatus::Valid);
        EXPECT_TRUE(cache_->locate(items[i].destination).has_value());
    }
    EXPECT_EQ(observer.finished, 6u);
    EXPECT_EQ(observer.last.completed, 6u);
    EXPECT_EQ(observer.last.succeeded, 6u);
    EXPECT_EQ(observer.last.total, 6u);
}

TEST_F(DownloadOrchestratorTest, OneFailureDoesNotStopTheBatch) {
    auto items = makeItems(5, {2});
    DownloadOrchestrator orchestrator(config_, http_, *cache_, ledger_.get());

    auto report = orchestrator.run(items);

    EXPECT_EQ(report.successful, 4u);
    EXPECT_EQ(report.failed(), 1u);
    EXPECT_FALSE(report.allSucceeded());
    EXPECT_FALSE(report.outcomes[2].success);
    EXPECT_EQ(report.outcomes[2].finalStatus, TransferStatus::Error);
    ASSERT_TRUE(report.outcomes[2].error.has_value());
    EXPECT_EQ(report.outcomes[2].error->code, ErrorCode::UnexpectedStatus);
    for (std::size_t i : {0u, 1u, 3u, 4u}) {
        EXPECT_TRUE(report.outcomes[i].success) << "item " << i;
    }
}

TEST_F(DownloadOrchestratorTest, ConcurrencyIsBoundedByWorkers) {
    auto items = makeItems(8);
    http_.setLatency(std::chrono::milliseconds(25));
    DownloadOrchestrator orchestrator(config_, http_, *cache_, ledger_.get());

    auto report = orchestrator.run(items, 2);

    EXPECT_EQ(report.successful, 8u);
    EXPECT_LE(http_.maxConcurrent(), 2);
    EXPECT_GE(http_.maxConcurrent(), 1);
}

TEST_F(DownloadOrchestratorTest, SecondRunIsServedFromLedger) {
    auto items = makeItems(4);
    DownloadOrchestrator orchestrator(config_, http_, *cache_, ledger_.get());
    ASSERT_TRUE(orchestrator.run(items).allSucceeded());
    const auto requestsAfterFirst = http_.requestCount();

    auto report = orchestrator.run(items);

    EXPECT_TRUE(report.allSucceeded());
    EXPECT_EQ(http_.requestCount(), requestsAfterFirst);
    for (const auto& outcome : report.outcomes) {
        EXPECT_EQ(outcome.history, (std::vector<TransferStatus>{TransferStatus::Valid}));
    }
}

TEST_F(DownloadOrchestratorTest, RunsWithoutLedger) {
    auto items = makeItems(3);
    DownloadOrchestrator orchestrator(config_, http_, *cache_);

    auto report = orchestrator.run(items);
    EXPECT_TRUE(report.allSucceeded());
}

TEST_F(DownloadOrchestratorTest, CancelledBatchDispatchesNothing) {
    auto items = makeItems(4);
    DownloadOrchestrator orchestrator(config_, http_, *cache_, ledger_.get());
    CancellationToken cancel;
    cancel.cancel();

    auto report = orchestrator.run(items, cancel);

    EXPECT_TRUE(report.cancelled);
    EXPECT_EQ(report.successful, 0u);
    ASSERT_EQ(report.outcomes.size(), items.size());
    for (const auto& outcome : report.outcomes) {
        ASSERT_TRUE(outcome.error.has_value());
        EXPECT_EQ(outcome.error->code, ErrorCode::OperationCancelled);
    }
    EXPECT_EQ(http_.requestCount(), 0u);
}
