#pragma once

#include <depfetch/cache/cache_store.h>
#include <depfetch/core/cancellation.h>
#include <depfetch/downloader/downloader.hpp>
#include <depfetch/ledger/verification_ledger.h>

#include <vector>

namespace depfetch::downloader {

/**
 * @brief Runs a batch of items with bounded concurrency.
 *
 * Each item runs as a coroutine on a thread pool of `workers` threads; a
 * counting semaphore acquired before dispatch keeps at most `workers` items
 * active. One item's failure never stops the others, and run() returns only
 * after every dispatched item reached a terminal state.
 *
 * Each active item borrows a LedgerSession from a pool of `workers` sessions,
 * so no SQLite connection is ever used by two items at once.
 */
class DownloadOrchestrator {
public:
    DownloadOrchestrator(DownloaderConfig config, IHttpAdapter& http, cache::CacheStore& cache,
                         ledger::VerificationLedger* ledger = nullptr,
                         IProgressObserver* observer = nullptr);

    /**
     * @brief Process every item with config().workers concurrent items
     */
    BatchReport run(const std::vector<DownloadItem>& items, CancellationToken cancel = {});

    /**
     * @brief Process every item with at most `workers` concurrent items
     */
    BatchReport run(const std::vector<DownloadItem>& items, int workers,
                    CancellationToken cancel = {});

    [[nodiscard]] const DownloaderConfig& config() const { return config_; }

private:
    DownloaderConfig config_;
    IHttpAdapter& http_;
    cache::CacheStore& cache_;
    ledger::VerificationLedger* ledger_;
    IProgressObserver* observer_;
};

} // namespace depfetch::downloader
