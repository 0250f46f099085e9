#pragma once

#include <depfetch/downloader/downloader.hpp>

#include <cstdio>
#include <mutex>

namespace depfetch::cli {

/**
 * @brief Terminal rendering of batch progress.
 *
 * Keeps a single "Total Progress" line on stderr refreshed on every finished
 * item. Per-item completion lines go to the log at info level, verifier phase
 * progress at debug.
 */
class ConsoleProgress final : public downloader::IProgressObserver {
public:
    explicit ConsoleProgress(bool enabled, std::FILE* out = stderr);

    void onItemFinished(const downloader::ItemOutcome& outcome,
                        const downloader::BatchTally& tally) override;
    void onVerifyProgress(const downloader::DownloadItem& item, integrity::VerifyPhase phase,
                          double fraction) override;

    /**
     * @brief Terminate the progress line
     */
    void finish();

private:
    bool enabled_;
    std::FILE* out_;
    std::mutex mutex_;
    bool dirty_{false};
};

} // namespace depfetch::cli
