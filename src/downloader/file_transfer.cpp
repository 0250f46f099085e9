/*
 * depfetch/src/downloader/file_transfer.cpp
 *
 * Per-file state machine:
 *   inspect local file -> (NEW | RESUME | REDOWNLOAD | VALID)
 *   DOWNLOADING -> VERIFYING -> VALID, looping through REDOWNLOAD/RESUME on
 *   retryable failures until the retry budget is spent.
 *
 * A ranged request answered with a full 2xx body is discarded before any byte
 * is written and restarted from offset 0 without consuming a retry.
 */

#include <depfetch/downloader/file_transfer.h>

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <system_error>

namespace depfetch::downloader {

namespace fs = std::filesystem;

namespace {
// Longest stretch a backoff sleeps before looking at the cancellation token again
constexpr auto kCancelPollInterval = std::chrono::milliseconds(50);
} // namespace

std::chrono::milliseconds RetryPolicy::backoffFor(int attempt) const {
    const double factor = std::pow(multiplier, std::max(0, attempt));
    return std::chrono::milliseconds(
        static_cast<std::int64_t>(static_cast<double>(initialBackoff.count()) * factor));
}

// ---------- ChunkedFileWriter ----------

ChunkedFileWriter::ChunkedFileWriter(std::size_t chunkSize)
    : chunkSize_(std::max<std::size_t>(chunkSize, 1)) {
    buffer_.reserve(chunkSize_);
}

ChunkedFileWriter::~ChunkedFileWriter() {
    if (out_.is_open()) {
        auto r = close();
        if (!r) {
            spdlog::debug("ChunkedFileWriter: close on destruction failed: {}", r.error().message);
        }
    }
}

Result<void> ChunkedFileWriter::open(const fs::path& path, bool append) {
    path_ = path;
    auto mode = std::ios::binary | std::ios::out | (append ? std::ios::app : std::ios::trunc);
    out_.open(path, mode);
    if (!out_.is_open()) {
        return Error{ErrorCode::IoError, "Cannot open " + path.string() + " for writing"};
    }
    return {};
}

Result<void> ChunkedFileWriter::write(std::span<const std::byte> data) {
    const char* src = reinterpret_cast<const char*>(data.data());
    std::size_t pos = 0;
    while (pos < data.size()) {
        const std::size_t n = std::min(chunkSize_ - buffer_.size(), data.size() - pos);
        buffer_.insert(buffer_.end(), src + pos, src + pos + n);
        pos += n;
        if (buffer_.size() >= chunkSize_) {
            auto r = flushBuffer();
            if (!r)
                return r;
        }
    }
    accepted_ += data.size();
    return {};
}

Result<void> ChunkedFileWriter::flushBuffer() {
    if (buffer_.empty())
        return {};
    out_.write(buffer_.data(), static_cast<std::streamsize>(buffer_.size()));
    buffer_.clear();
    if (!out_.good()) {
        return Error{ErrorCode::IoError, "write failed on: " + path_.string()};
    }
    return {};
}

Result<void> ChunkedFileWriter::close() {
    if (!out_.is_open())
        return {};
    auto r = flushBuffer();
    out_.flush();
    const bool ok = out_.good();
    out_.close();
    if (!r)
        return r;
    if (!ok) {
        return Error{ErrorCode::IoError, "flush failed on: " + path_.string()};
    }
    return {};
}

// ---------- FileTransfer ----------

FileTransfer::FileTransfer(DownloadItem item, const DownloaderConfig& config,
                           TransferServices services)
    : item_(std::move(item)), config_(config), services_(std::move(services)),
      path_(services_.cache.absolutePath(item_.destination)),
      started_(std::chrono::steady_clock::now()) {
    outcome_.item = item_;
}

void FileTransfer::enter(TransferStatus status) {
    outcome_.history.push_back(status);
    spdlog::debug("{}: {}", item_.destination.string(), toDisplayText(status));
    if (services_.observer)
        services_.observer->onStatus(item_, status);
}

std::uint64_t FileTransfer::onDiskSize() const {
    std::error_code ec;
    auto sz = fs::file_size(path_, ec);
    return ec ? 0 : sz;
}

bool FileTransfer::removeLocal() {
    std::error_code ec;
    fs::remove(path_, ec);
    if (ec) {
        spdlog::warn("Failed to delete {}: {}", path_.string(), ec.message());
        return false;
    }
    return true;
}

void FileTransfer::record(ledger::VerificationStatus status) {
    if (services_.ledger)
        services_.ledger->upsert(path_, item_.expectedHash, status);
}

FileTransfer::VerifyVerdict FileTransfer::verifyOnDisk(std::string& detail) {
    auto verifier = integrity::makeGzipStreamVerifier(config_.hashAlgo);
    integrity::PhaseProgress progress;
    if (services_.observer) {
        progress = [this](integrity::VerifyPhase phase, double fraction) {
            services_.observer->onVerifyProgress(item_, phase, fraction);
        };
    }

    auto result = verifier->verify(path_, progress);
    if (!result) {
        detail = result.error().message;
        return result.error().code == ErrorCode::DecompressionFailure ? VerifyVerdict::Corrupt
                                                                       : VerifyVerdict::Unreadable;
    }

    const auto& v = result.value();
    if (item_.expectedSize > 0 && v.decompressedBytes != item_.expectedSize) {
        detail = fmt::format("decompressed {} bytes, expected {}", v.decompressedBytes,
                             item_.expectedSize);
        return VerifyVerdict::HashMismatch;
    }
    if (!integrity::digestEquals(v.digest, item_.expectedHash)) {
        detail = fmt::format("{} {} != expected {}", integrity::hashAlgoName(config_.hashAlgo),
                             v.digest, item_.expectedHash);
        return VerifyVerdict::HashMismatch;
    }
    return VerifyVerdict::Valid;
}

ItemOutcome FileTransfer::finish(bool success, std::optional<Error> error) {
    if (success) {
        if (outcome_.history.empty() || outcome_.history.back() != TransferStatus::Valid)
            enter(TransferStatus::Valid);
    } else {
        const auto last = outcome_.history.empty() ? TransferStatus::New : outcome_.history.back();
        enter(TransferStatus::Error);
        spdlog::error("Failed {} -> {} (last state {}): {}", item_.url,
                      item_.destination.string(), toDisplayText(last),
                      error ? error->message : std::string{"unknown error"});
    }
    outcome_.success = success;
    outcome_.finalStatus = success ? TransferStatus::Valid : TransferStatus::Error;
    outcome_.error = std::move(error);
    outcome_.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started_);
    return std::move(outcome_);
}

boost::asio::awaitable<ItemOutcome> FileTransfer::run() {
    auto executor = co_await boost::asio::this_coro::executor;
    cache::CacheStore::PinGuard pin(services_.cache, path_);
    if (services_.observer)
        services_.observer->onItemStarted(item_);

    const std::uint64_t target = item_.storedSize();
    const int maxAttempts = std::max(1, config_.retry.maxRetries);
    int failures = 0;

    // Inspect what is already on disk
    std::error_code ec;
    if (!fs::is_regular_file(path_, ec)) {
        enter(TransferStatus::New);
    } else {
        const auto size = onDiskSize();
        if (target > 0 && size > target) {
            spdlog::info("{} is larger than expected ({} > {}), redownloading", path_.string(),
                         size, target);
            removeLocal();
            enter(TransferStatus::Redownload);
        } else if (target == 0 || size == target) {
            if (services_.ledger &&
                !services_.ledger->needsVerification(path_, item_.expectedHash)) {
                spdlog::debug("{} already verified, skipping", path_.string());
                enter(TransferStatus::Valid);
                co_return finish(true, std::nullopt);
            }

            enter(TransferStatus::Verifying);
            std::string detail;
            switch (verifyOnDisk(detail)) {
                case VerifyVerdict::Valid:
                    record(ledger::VerificationStatus::Valid);
                    enter(TransferStatus::Valid);
                    co_return finish(true, std::nullopt);
                case VerifyVerdict::Corrupt:
                    spdlog::warn("{} is corrupt ({}), redownloading", path_.string(), detail);
                    enter(TransferStatus::Corrupt);
                    record(ledger::VerificationStatus::Corrupt);
                    removeLocal();
                    enter(TransferStatus::Redownload);
                    break;
                case VerifyVerdict::HashMismatch:
                    spdlog::warn("{} hash mismatch ({}), redownloading", path_.string(), detail);
                    enter(TransferStatus::HashMismatch);
                    record(ledger::VerificationStatus::HashMismatch);
                    removeLocal();
                    enter(TransferStatus::Redownload);
                    break;
                case VerifyVerdict::Unreadable:
                    spdlog::warn("{} unreadable ({}), redownloading", path_.string(), detail);
                    removeLocal();
                    enter(TransferStatus::Redownload);
                    break;
            }
        } else {
            enter(TransferStatus::Resume);
        }
    }

    while (true) {
        if (services_.cancel.isCancelled()) {
            co_return finish(false, Error{ErrorCode::OperationCancelled, "Batch cancelled"});
        }

        std::uint64_t offset = onDiskSize();
        if (target > 0 && offset > target) {
            removeLocal();
            offset = 0;
        }
        const bool complete = target > 0 && offset == target;

        if (!complete) {
            if (offset == 0) {
                auto prepared = services_.cache.prepare(item_.destination);
                if (!prepared) {
                    co_return finish(false, prepared.error());
                }
            }

            enter(TransferStatus::Downloading);

            ChunkedFileWriter writer(config_.chunkSizeBytes);
            BodySink sink = [&](long status, std::span<const std::byte> bytes) -> Result<void> {
                if (offset > 0) {
                    if ((status >= 200 && status < 300 && status != 206) || status == 416) {
                        return Error{ErrorCode::RangeNotSatisfied,
                                     fmt::format("HTTP {} for ranged request", status)};
                    }
                    if (status != 206) {
                        return Error{ErrorCode::UnexpectedStatus, fmt::format("HTTP {}", status)};
                    }
                } else if (status != 200) {
                    return Error{ErrorCode::UnexpectedStatus, fmt::format("HTTP {}", status)};
                }
                if (!writer.isOpen()) {
                    auto opened = writer.open(path_, offset > 0);
                    if (!opened)
                        return opened;
                }
                auto written = writer.write(bytes);
                if (!written)
                    return written;
                if (services_.observer)
                    services_.observer->onBytes(item_, offset + writer.bytesAccepted(), target);
                return {};
            };

            HttpGetRequest request;
            request.url = item_.url;
            request.offset = offset;
            request.timeout = config_.timeout;
            request.tls = config_.tls;
            request.proxy = config_.proxy;
            request.followRedirects = config_.followRedirects;
            request.bufferSize = config_.chunkSizeBytes;

            ++outcome_.attempts;
            auto response = services_.http.get(request, sink, services_.cancel.asCallback());
            auto closed = writer.close();
            outcome_.bytesTransferred += writer.bytesAccepted();

            std::optional<Error> failure;
            if (!response) {
                failure = response.error();
            } else if (!closed) {
                failure = closed.error();
            } else {
                const long status = response.value().status;
                if (offset > 0 && ((status >= 200 && status < 300 && status != 206) ||
                                   status == 416)) {
                    failure = Error{ErrorCode::RangeNotSatisfied,
                                    fmt::format("HTTP {} for ranged request", status)};
                } else if (offset > 0 ? status != 206 : status != 200) {
                    failure = Error{ErrorCode::UnexpectedStatus, fmt::format("HTTP {}", status)};
                } else if (!writer.isOpen() && offset == 0 && response.value().bodyBytes == 0) {
                    // Empty body: make the (empty) file exist so the size check sees it
                    auto created = writer.open(path_, false);
                    auto finished = created ? writer.close() : created;
                    if (!finished)
                        failure = finished.error();
                }
            }

            if (failure) {
                if (failure->code == ErrorCode::OperationCancelled) {
                    co_return finish(false, std::move(failure));
                }
                if (failure->code == ErrorCode::RangeNotSatisfied) {
                    spdlog::info("{}: server did not honor Range at offset {} ({}), restarting",
                                 item_.url, offset, failure->message);
                    if (removeLocal()) {
                        enter(TransferStatus::Redownload);
                        continue;
                    }
                    // The stale prefix is still on disk; asking again would loop forever
                }
                if (failures + 1 >= maxAttempts) {
                    spdlog::warn("{}: giving up after {} attempts", item_.url, failures + 1);
                    co_return finish(false, std::move(failure));
                }
                const auto delay = config_.retry.backoffFor(failures);
                ++failures;
                spdlog::warn("{}: attempt {}/{} failed ({}), retrying in {} ms", item_.url,
                             failures, maxAttempts, failure->message, delay.count());

                const auto deadline = std::chrono::steady_clock::now() + delay;
                boost::asio::steady_timer timer(executor);
                for (auto now = std::chrono::steady_clock::now();
                     now < deadline && !services_.cancel.isCancelled();
                     now = std::chrono::steady_clock::now()) {
                    timer.expires_after(std::min<std::chrono::steady_clock::duration>(
                        deadline - now, kCancelPollInterval));
                    boost::system::error_code waitEc;
                    co_await timer.async_wait(
                        boost::asio::redirect_error(boost::asio::use_awaitable, waitEc));
                }
                if (services_.cancel.isCancelled()) {
                    co_return finish(false,
                                     Error{ErrorCode::OperationCancelled, "Batch cancelled"});
                }

                if (onDiskSize() > 0)
                    enter(TransferStatus::Resume);
                continue;
            }
        }

        const auto size = onDiskSize();
        if (target > 0 && size != target) {
            co_return finish(false,
                             Error{ErrorCode::SizeMismatch,
                                   fmt::format("{} bytes on disk, expected {}", size, target)});
        }

        enter(TransferStatus::Verifying);
        std::string detail;
        const auto verdict = verifyOnDisk(detail);
        if (verdict == VerifyVerdict::Valid) {
            record(ledger::VerificationStatus::Valid);
            enter(TransferStatus::Valid);
            co_return finish(true, std::nullopt);
        }

        ErrorCode code = ErrorCode::IoError;
        if (verdict == VerifyVerdict::Corrupt) {
            enter(TransferStatus::Corrupt);
            record(ledger::VerificationStatus::Corrupt);
            code = ErrorCode::DecompressionFailure;
        } else if (verdict == VerifyVerdict::HashMismatch) {
            enter(TransferStatus::HashMismatch);
            record(ledger::VerificationStatus::HashMismatch);
            code = ErrorCode::HashMismatch;
        }
        removeLocal();

        if (failures + 1 >= maxAttempts) {
            co_return finish(false, Error{code, detail});
        }
        ++failures;
        spdlog::warn("{}: verification failed ({}), redownloading (attempt {}/{})",
                     item_.destination.string(), detail, failures + 1, maxAttempts);
        enter(TransferStatus::Redownload);
    }
}

} // namespace depfetch::downloader
