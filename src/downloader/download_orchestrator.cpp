/*
 * depfetch/src/downloader/download_orchestrator.cpp
 *
 * Batch driver:
 * - thread_pool of W threads, counting_semaphore of W slots
 * - slot acquired on the dispatching thread, released by the item coroutine
 * - continue-on-error; results collected through use_future in input order
 */

#include <depfetch/downloader/download_orchestrator.h>
#include <depfetch/downloader/file_transfer.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/use_future.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <future>
#include <memory>
#include <mutex>
#include <semaphore>

namespace depfetch::downloader {

namespace {

// Fixed set of ledger sessions handed to active items
class SessionPool {
public:
    SessionPool(const ledger::VerificationLedger* ledger, int size) {
        if (!ledger)
            return;
        for (int i = 0; i < size; ++i) {
            auto session = ledger->openSession();
            if (!session) {
                spdlog::warn("Ledger session unavailable, items will always verify: {}",
                             session.error().message);
                break;
            }
            free_.push_back(session.value().get());
            owned_.push_back(std::move(session).value());
        }
    }

    ledger::LedgerSession* acquire() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (free_.empty())
            return nullptr;
        auto* s = free_.back();
        free_.pop_back();
        return s;
    }

    void release(ledger::LedgerSession* session) {
        if (!session)
            return;
        std::lock_guard<std::mutex> lock(mutex_);
        free_.push_back(session);
    }

private:
    std::mutex mutex_;
    std::vector<std::unique_ptr<ledger::LedgerSession>> owned_;
    std::vector<ledger::LedgerSession*> free_;
};

struct TallyState {
    std::mutex mutex;
    BatchTally tally;
};

boost::asio::awaitable<ItemOutcome> runItem(std::shared_ptr<FileTransfer> transfer,
                                            std::counting_semaphore<>* slots,
                                            SessionPool* sessions,
                                            ledger::LedgerSession* session, TallyState* state,
                                            IProgressObserver* observer) {
    // RAII guards - release on any exit path, session before slot
    struct SemaphoreGuard {
        std::counting_semaphore<>* sem;
        ~SemaphoreGuard() {
            if (sem)
                sem->release();
        }
    } slotGuard{slots};
    struct SessionGuard {
        SessionPool* pool;
        ledger::LedgerSession* session;
        ~SessionGuard() { pool->release(session); }
    } sessionGuard{sessions, session};

    auto outcome = co_await transfer->run();

    BatchTally snapshot;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        ++state->tally.completed;
        if (outcome.success)
            ++state->tally.succeeded;
        snapshot = state->tally;
    }
    if (observer)
        observer->onItemFinished(outcome, snapshot);

    co_return outcome;
}

ItemOutcome notRun(const DownloadItem& item, Error error) {
    ItemOutcome outcome;
    outcome.item = item;
    outcome.success = false;
    outcome.finalStatus = TransferStatus::Error;
    outcome.error = std::move(error);
    return outcome;
}

} // namespace

DownloadOrchestrator::DownloadOrchestrator(DownloaderConfig config, IHttpAdapter& http,
                                           cache::CacheStore& cache,
                                           ledger::VerificationLedger* ledger,
                                           IProgressObserver* observer)
    : config_(std::move(config)), http_(http), cache_(cache), ledger_(ledger),
      observer_(observer) {}

BatchReport DownloadOrchestrator::run(const std::vector<DownloadItem>& items,
                                      CancellationToken cancel) {
    return run(items, config_.workers, std::move(cancel));
}

BatchReport DownloadOrchestrator::run(const std::vector<DownloadItem>& items, int workers,
                                      CancellationToken cancel) {
    const int width = std::max(1, workers);

    BatchReport report;
    report.total = items.size();
    report.outcomes.reserve(items.size());
    if (items.empty())
        return report;

    spdlog::info("Processing {} items with {} workers", items.size(), width);

    boost::asio::thread_pool pool(static_cast<std::size_t>(width));
    std::counting_semaphore<> slots(width);
    SessionPool sessions(ledger_, width);
    TallyState state;
    state.tally.total = items.size();

    std::vector<std::future<ItemOutcome>> futures;
    futures.reserve(items.size());

    std::size_t dispatched = 0;
    for (const auto& item : items) {
        slots.acquire();
        if (cancel.isCancelled()) {
            slots.release();
            break;
        }

        auto* session = sessions.acquire();
        auto transfer = std::make_shared<FileTransfer>(
            item, config_, TransferServices{http_, cache_, session, observer_, cancel});

        futures.push_back(boost::asio::co_spawn(
            pool, runItem(std::move(transfer), &slots, &sessions, session, &state, observer_),
            boost::asio::use_future));
        ++dispatched;
    }

    for (std::size_t i = 0; i < futures.size(); ++i) {
        try {
            report.outcomes.push_back(futures[i].get());
        } catch (const std::exception& e) {
            spdlog::error("Item {} -> {} raised: {}", items[i].url,
                          items[i].destination.string(), e.what());
            report.outcomes.push_back(notRun(items[i], Error{ErrorCode::Unknown, e.what()}));
        }
    }
    pool.join();

    for (std::size_t i = dispatched; i < items.size(); ++i) {
        report.outcomes.push_back(
            notRun(items[i], Error{ErrorCode::OperationCancelled, "Not started: batch cancelled"}));
    }

    report.cancelled = cancel.isCancelled();
    report.successful = static_cast<std::size_t>(
        std::count_if(report.outcomes.begin(), report.outcomes.end(),
                      [](const ItemOutcome& o) { return o.success; }));

    spdlog::info("Batch finished: {}/{} successful{}", report.successful, report.total,
                 report.cancelled ? " (cancelled)" : "");
    return report;
}

} // namespace depfetch::downloader
