#pragma once

#include <depfetch/cache/cache_store.h>
#include <depfetch/core/types.h>
#include <depfetch/downloader/downloader.hpp>
#include <depfetch/ledger/verification_ledger.h>

#include <filesystem>
#include <map>
#include <string>

namespace depfetch::config {

/**
 * @brief Everything a run needs, assembled from defaults, the config file and flags
 */
struct DepfetchConfig {
    downloader::DownloaderConfig download{};
    cache::CacheConfig cache{};
    ledger::LedgerConfig ledger{};
    std::string logLevel{"warn"};

    /**
     * @brief Point cache and ledger at the same root
     */
    void setRoot(const std::filesystem::path& root) {
        cache.root = root;
        ledger.root = root;
    }
};

/**
 * @brief Apply "section.key" values on top of cfg. Unknown keys are ignored with a debug log.
 */
Result<void> applyConfigValues(DepfetchConfig& cfg,
                               const std::map<std::string, std::string>& values);

/**
 * @brief Defaults overlaid with the config file at path (a missing file is not an error)
 */
Result<DepfetchConfig> loadConfig(const std::filesystem::path& path);

} // namespace depfetch::config
