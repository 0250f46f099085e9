#pragma once

/*
 * depfetch Downloader - public types and service interfaces (C++20)
 *
 * Data types shared by the HTTP adapter, the per-file transfer state machine
 * and the batch orchestrator. Implementations live in src/downloader/.
 *
 * Design principles:
 * - One GET per attempt, resumed with an open-ended Range when bytes exist on disk
 * - Integrity is a property of the decompressed payload, checked after transfer
 * - Per-item failures are contained; a batch always runs to completion
 */

#include <depfetch/core/cancellation.h>
#include <depfetch/core/types.h>
#include <depfetch/integrity/integrity_verifier.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace depfetch::downloader {

// ================================
// Fundamental enums and constants
// ================================

/**
 * Per-item transfer state. VALID and ERROR are terminal.
 */
enum class TransferStatus {
    New,
    Resume,
    Redownload,
    Downloading,
    Verifying,
    Valid,
    Corrupt,
    HashMismatch,
    Error
};

[[nodiscard]] constexpr std::string_view toDisplayText(TransferStatus status) noexcept {
    switch (status) {
        case TransferStatus::New:
            return "NEW";
        case TransferStatus::Resume:
            return "RESUME";
        case TransferStatus::Redownload:
            return "REDOWNLOAD";
        case TransferStatus::Downloading:
            return "DOWNLOADING";
        case TransferStatus::Verifying:
            return "VERIFYING";
        case TransferStatus::Valid:
            return "VALID";
        case TransferStatus::Corrupt:
            return "CORRUPT";
        case TransferStatus::HashMismatch:
            return "HASH_MISMATCH";
        case TransferStatus::Error:
            return "ERROR";
    }
    return "ERROR";
}

[[nodiscard]] constexpr bool isTerminal(TransferStatus status) noexcept {
    return status == TransferStatus::Valid || status == TransferStatus::Error;
}

// ===================
// Small data objects
// ===================

/**
 * One artifact to fetch. Destination is relative to the cache root.
 */
struct DownloadItem {
    std::string url;
    std::filesystem::path destination; // <remotePath>/<contentHash>
    std::uint64_t expectedSize{0};     // decompressed length
    std::uint64_t expectedCompressedSize{0};
    std::string expectedHash;          // digest of the decompressed payload

    /**
     * Size of the artifact as stored on disk (the compressed stream when known).
     */
    [[nodiscard]] std::uint64_t storedSize() const noexcept {
        return expectedCompressedSize != 0 ? expectedCompressedSize : expectedSize;
    }
};

/**
 * Retry/backoff policy. maxRetries bounds the attempts made for one item.
 */
struct RetryPolicy {
    int maxRetries{5};
    std::chrono::milliseconds initialBackoff{1000};
    double multiplier{2.0};

    [[nodiscard]] std::chrono::milliseconds backoffFor(int attempt) const;
};

/**
 * TLS configuration.
 */
struct TlsConfig {
    bool insecure{false};
    std::string caPath; // empty = system default
};

/**
 * Downloader configuration.
 */
struct DownloaderConfig {
    int workers{5};
    std::size_t chunkSizeBytes{DEFAULT_CHUNK_SIZE};
    std::chrono::milliseconds timeout{30000};
    RetryPolicy retry{};
    integrity::HashAlgo hashAlgo{integrity::HashAlgo::Sha1};
    std::optional<std::string> proxy;
    TlsConfig tls{};
    bool followRedirects{true};
};

/**
 * One GET request. offset > 0 adds `Range: bytes=<offset>-`.
 */
struct HttpGetRequest {
    std::string url;
    std::uint64_t offset{0};
    std::chrono::milliseconds timeout{30000};
    TlsConfig tls{};
    std::optional<std::string> proxy;
    bool followRedirects{true};
    std::size_t bufferSize{DEFAULT_CHUNK_SIZE};
};

/**
 * Completed GET (transport succeeded; status may still be unacceptable).
 */
struct HttpGetResult {
    long status{0};
    std::uint64_t bodyBytes{0};
};

/**
 * Body sink. Receives the response status with every block. Returning an error
 * aborts the transfer and the adapter returns that error unchanged.
 */
using BodySink = std::function<Result<void>(long status, std::span<const std::byte>)>;

/**
 * Final outcome of one item.
 */
struct ItemOutcome {
    DownloadItem item;
    bool success{false};
    TransferStatus finalStatus{TransferStatus::Error};
    std::vector<TransferStatus> history; // every state entered, in order
    int attempts{0};                     // GET requests issued
    std::uint64_t bytesTransferred{0};   // body bytes written this run
    std::optional<Error> error{};
    std::chrono::milliseconds elapsed{0};
};

/**
 * Running tally for a batch.
 */
struct BatchTally {
    std::size_t completed{0};
    std::size_t succeeded{0};
    std::size_t total{0};
};

/**
 * Batch result. Outcomes are in input order.
 */
struct BatchReport {
    std::vector<ItemOutcome> outcomes;
    std::size_t total{0};
    std::size_t successful{0};
    bool cancelled{false};

    [[nodiscard]] std::size_t failed() const { return total - successful; }
    [[nodiscard]] bool allSucceeded() const { return successful == total && !cancelled; }
};

// ==========================
// Service interface classes
// ==========================

/**
 * HTTP adapter abstraction (libcurl implementation in http_adapter_curl.cpp).
 */
class IHttpAdapter {
public:
    virtual ~IHttpAdapter() = default;

    /**
     * Issue a GET and stream the body to sink. Transport failures map to
     * ErrorCode::TransportError / ErrorCode::Timeout, cancellation to
     * ErrorCode::OperationCancelled.
     */
    virtual Result<HttpGetResult> get(const HttpGetRequest& request, const BodySink& sink,
                                      const ShouldCancel& shouldCancel) = 0;
};

/**
 * Progress observer. Called concurrently from worker threads; implementations
 * must be thread-safe. All callbacks are optional.
 */
class IProgressObserver {
public:
    virtual ~IProgressObserver() = default;

    virtual void onItemStarted(const DownloadItem&) {}
    virtual void onStatus(const DownloadItem&, TransferStatus) {}
    virtual void onBytes(const DownloadItem&, std::uint64_t /*onDisk*/,
                         std::uint64_t /*target*/) {}
    virtual void onVerifyProgress(const DownloadItem&, integrity::VerifyPhase, double) {}
    virtual void onItemFinished(const ItemOutcome&, const BatchTally&) {}
};

/**
 * Factory for the libcurl adapter.
 */
std::unique_ptr<IHttpAdapter> makeCurlHttpAdapter();

} // namespace depfetch::downloader
