#pragma once

#include <depfetch/cache/cache_store.h>
#include <depfetch/core/cancellation.h>
#include <depfetch/downloader/downloader.hpp>
#include <depfetch/ledger/verification_ledger.h>

#include <boost/asio/awaitable.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <vector>

namespace depfetch::downloader {

/**
 * @brief Buffered file writer that hits the disk in fixed-size chunks.
 *
 * Opens in append mode for a resume, truncating otherwise.
 */
class ChunkedFileWriter {
public:
    explicit ChunkedFileWriter(std::size_t chunkSize);
    ~ChunkedFileWriter();

    ChunkedFileWriter(const ChunkedFileWriter&) = delete;
    ChunkedFileWriter& operator=(const ChunkedFileWriter&) = delete;

    Result<void> open(const std::filesystem::path& path, bool append);
    Result<void> write(std::span<const std::byte> data);
    Result<void> close();

    [[nodiscard]] bool isOpen() const { return out_.is_open(); }
    [[nodiscard]] std::uint64_t bytesAccepted() const { return accepted_; }

private:
    Result<void> flushBuffer();

    std::size_t chunkSize_;
    std::vector<char> buffer_;
    std::ofstream out_;
    std::filesystem::path path_;
    std::uint64_t accepted_{0};
};

/**
 * @brief Collaborators for one item's transfer
 */
struct TransferServices {
    IHttpAdapter& http;
    cache::CacheStore& cache;
    ledger::LedgerSession* ledger{nullptr}; ///< null disables ledger lookups and writes
    IProgressObserver* observer{nullptr};
    CancellationToken cancel{};
};

/**
 * @brief Per-file resumable transfer state machine.
 *
 * Inspects the local file, then loops DOWNLOADING -> VERIFYING until the item
 * is VALID or retries are exhausted. Backoff waits suspend the coroutine;
 * HTTP and hashing run on the calling executor's thread.
 */
class FileTransfer {
public:
    FileTransfer(DownloadItem item, const DownloaderConfig& config, TransferServices services);

    boost::asio::awaitable<ItemOutcome> run();

private:
    enum class VerifyVerdict { Valid, Corrupt, HashMismatch, Unreadable };

    void enter(TransferStatus status);
    VerifyVerdict verifyOnDisk(std::string& detail);
    void record(ledger::VerificationStatus status);
    bool removeLocal();
    std::uint64_t onDiskSize() const;
    ItemOutcome finish(bool success, std::optional<Error> error);

    DownloadItem item_;
    const DownloaderConfig& config_;
    TransferServices services_;
    std::filesystem::path path_;
    ItemOutcome outcome_;
    std::chrono::steady_clock::time_point started_;
};

} // namespace depfetch::downloader
