#include "console_progress.h"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace depfetch::cli {

ConsoleProgress::ConsoleProgress(bool enabled, std::FILE* out) : enabled_(enabled), out_(out) {}

void ConsoleProgress::onItemFinished(const downloader::ItemOutcome& outcome,
                                     const downloader::BatchTally& tally) {
    spdlog::info("[{}/{}] {} {} ({} attempts, {} bytes)", tally.completed, tally.total,
                 downloader::toDisplayText(outcome.finalStatus),
                 outcome.item.destination.string(), outcome.attempts, outcome.bytesTransferred);

    if (!enabled_)
        return;
    std::lock_guard<std::mutex> lock(mutex_);
    fmt::print(out_, "\rTotal Progress ({} files): {}/{} (success {}/{})", tally.total,
               tally.completed, tally.total, tally.succeeded, tally.total);
    std::fflush(out_);
    dirty_ = true;
}

void ConsoleProgress::onVerifyProgress(const downloader::DownloadItem& item,
                                       integrity::VerifyPhase phase, double fraction) {
    spdlog::debug("{}: {} {:.0f}%", item.destination.string(),
                  phase == integrity::VerifyPhase::Decompression ? "decompress" : "hash",
                  fraction * 100.0);
}

void ConsoleProgress::finish() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (dirty_) {
        fmt::print(out_, "\n");
        std::fflush(out_);
        dirty_ = false;
    }
}

} // namespace depfetch::cli
