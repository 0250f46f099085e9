#include "console_progress.h"

#include <depfetch/cache/cache_store.h>
#include <depfetch/config/config_helpers.h>
#include <depfetch/config/depfetch_config.h>
#include <depfetch/core/cancellation.h>
#include <depfetch/downloader/download_orchestrator.h>
#include <depfetch/ledger/verification_ledger.h>
#include <depfetch/manifest/gitdeps_manifest.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <CLI/CLI.hpp>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <atomic>
#include <cctype>
#include <csignal>
#include <cstdlib>
#include <cstdio>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitInterrupted = 130;

std::optional<spdlog::level::level_enum> parseLevel(const std::string& s) {
    std::string v;
    v.reserve(s.size());
    for (char c : s)
        v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (v == "trace")
        return spdlog::level::trace;
    if (v == "debug")
        return spdlog::level::debug;
    if (v == "info")
        return spdlog::level::info;
    if (v == "warn" || v == "warning")
        return spdlog::level::warn;
    if (v == "error" || v == "err")
        return spdlog::level::err;
    if (v == "off" || v == "none")
        return spdlog::level::off;
    return std::nullopt;
}

json statsToJson(const depfetch::ledger::LedgerStatistics& stats) {
    json byStatus = json::object();
    for (const auto& [status, count] : stats.byStatus)
        byStatus[status] = count;
    return json{{"total_files", stats.totalFiles},
                {"by_status", byStatus},
                {"verified_today", stats.verifiedToday},
                {"storage_bytes", stats.storageBytes}};
}

void printStats(const depfetch::ledger::LedgerStatistics& stats) {
    std::cout << "Verification statistics:\n";
    std::cout << fmt::format("  Total verified files: {}\n", stats.totalFiles);
    for (const auto& [status, count] : stats.byStatus)
        std::cout << fmt::format("  {}: {}\n", status, count);
    std::cout << fmt::format("  Verified today: {}\n", stats.verifiedToday);
    std::cout << fmt::format("  Database size: {} bytes\n", stats.storageBytes);
}

json outcomeToJson(const depfetch::downloader::ItemOutcome& o) {
    json j{{"url", o.item.url},
           {"destination", o.item.destination.generic_string()},
           {"status", std::string(depfetch::downloader::toDisplayText(o.finalStatus))},
           {"success", o.success},
           {"attempts", o.attempts},
           {"bytes", o.bytesTransferred},
           {"elapsed_ms", o.elapsed.count()}};
    if (o.error) {
        j["error"] = {{"code", depfetch::errorToString(o.error->code)},
                      {"message", o.error->message}};
    }
    return j;
}

// Shared setup for commands touching the cache root
struct Runtime {
    depfetch::config::DepfetchConfig cfg;
    std::unique_ptr<depfetch::cache::CacheStore> cache;
    std::unique_ptr<depfetch::ledger::VerificationLedger> ledger;

    depfetch::Result<void> open(bool withLedger) {
        cache = std::make_unique<depfetch::cache::CacheStore>(cfg.cache);
        if (auto r = cache->initialize(); !r)
            return r;
        if (!withLedger)
            return {};
        ledger = std::make_unique<depfetch::ledger::VerificationLedger>(cfg.ledger);
        return ledger->initialize();
    }
};

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::warn);
    spdlog::set_pattern("[%H:%M:%S] [%l] %v");

    CLI::App app{"Fetch, verify and cache content-addressed dependency packs", "depfetch"};
    app.require_subcommand(1);
    app.fallthrough();

    std::string configPath;
    int verbosity = 0;
    bool emitJson = false;
    std::string outputDir;
    std::string maxCacheSize;
    std::string cleanupThreshold;

    app.add_option("--config", configPath, "Config file (default: ~/.config/depfetch/config.toml)");
    app.add_flag("-v,--verbose", verbosity, "Increase log verbosity (-v info, -vv debug)");
    app.add_flag("--json", emitJson, "Emit machine-readable JSON");
    auto* outputOpt =
        app.add_option("-o,--output-dir", outputDir, "Cache root directory (default: ./output)");
    auto* maxSizeOpt = app.add_option("--max-cache-size", maxCacheSize,
                                      "Maximum cache size, e.g. 100GB (default: 100GB)");
    auto* thresholdOpt = app.add_option("--cleanup-threshold", cleanupThreshold,
                                        "Evict when usage exceeds this fraction (default: 0.9)");

    // fetch
    auto* fetchCmd = app.add_subcommand("fetch", "Download and verify every pack in a manifest");
    std::string manifestPath;
    int workers = 0;
    int maxRetries = 0;
    int timeoutSec = 0;
    std::string chunkSize;
    bool forceVerify = false;
    std::string proxy;
    bool showStats = false;
    fetchCmd->add_option("manifest", manifestPath, "Path to Commit.gitdeps.xml")->required();
    auto* workersOpt =
        fetchCmd->add_option("-w,--workers", workers, "Concurrent downloads (default: 5)")
            ->check(CLI::PositiveNumber);
    auto* retriesOpt =
        fetchCmd->add_option("--max-retries", maxRetries, "Attempts per file (default: 5)")
            ->check(CLI::PositiveNumber);
    auto* timeoutOpt =
        fetchCmd->add_option("--timeout", timeoutSec, "Per-request timeout in seconds (default: 30)")
            ->check(CLI::PositiveNumber);
    auto* chunkOpt =
        fetchCmd->add_option("--chunk-size", chunkSize, "Disk write chunk size (default: 8192)");
    fetchCmd->add_flag("--force-verify", forceVerify, "Re-hash files even if the ledger says valid");
    auto* proxyOpt = fetchCmd->add_option("--proxy", proxy, "HTTP(S) proxy URL");
    fetchCmd->add_flag("--stats", showStats, "Print verification statistics afterwards");

    // stats
    auto* statsCmd = app.add_subcommand("stats", "Show verification ledger statistics");

    // import
    auto* importCmd =
        app.add_subcommand("import", "Seed the cache from a directory holding manifest packs");
    std::string importManifest;
    std::string importSource;
    importCmd->add_option("manifest", importManifest, "Path to Commit.gitdeps.xml")->required();
    importCmd->add_option("source", importSource, "Directory laid out as <RemotePath>/<Hash>")
        ->required()
        ->check(CLI::ExistingDirectory);

    // evict
    auto* evictCmd = app.add_subcommand("evict", "Evict least recently used files over the limit");

    CLI11_PARSE(app, argc, argv);

    // Configuration: defaults < config file < flags
    auto loaded = depfetch::config::loadConfig(depfetch::config::get_config_path(configPath));
    if (!loaded) {
        spdlog::error("{}", loaded.error().message);
        return kExitFailure;
    }
    Runtime rt;
    rt.cfg = std::move(loaded).value();

    if (const char* envLvl = std::getenv("DEPFETCH_LOG_LEVEL"); envLvl && *envLvl) {
        if (auto lvl = parseLevel(envLvl))
            spdlog::set_level(*lvl);
    } else if (verbosity >= 2) {
        spdlog::set_level(spdlog::level::debug);
    } else if (verbosity == 1) {
        spdlog::set_level(spdlog::level::info);
    } else if (auto lvl = parseLevel(rt.cfg.logLevel)) {
        spdlog::set_level(*lvl);
    }

    std::map<std::string, std::string> overrides;
    if (outputOpt->count())
        overrides["cache.root"] = outputDir;
    if (maxSizeOpt->count())
        overrides["cache.max_size"] = maxCacheSize;
    if (thresholdOpt->count())
        overrides["cache.cleanup_threshold"] = cleanupThreshold;
    if (workersOpt->count())
        overrides["download.workers"] = std::to_string(workers);
    if (retriesOpt->count())
        overrides["download.max_retries"] = std::to_string(maxRetries);
    if (timeoutOpt->count())
        overrides["download.timeout"] = std::to_string(timeoutSec);
    if (chunkOpt->count())
        overrides["download.chunk_size"] = chunkSize;
    if (proxyOpt->count())
        overrides["download.proxy"] = proxy;
    if (auto applied = depfetch::config::applyConfigValues(rt.cfg, overrides); !applied) {
        spdlog::error("{}", applied.error().message);
        return kExitFailure;
    }
    if (forceVerify)
        rt.cfg.ledger.forceVerify = true;

    try {
        if (*statsCmd) {
            if (auto r = rt.open(true); !r) {
                spdlog::error("{}", r.error().message);
                return kExitFailure;
            }
            auto stats = rt.ledger->statistics();
            if (!stats) {
                spdlog::error("{}", stats.error().message);
                return kExitFailure;
            }
            if (emitJson)
                std::cout << statsToJson(stats.value()).dump(2) << std::endl;
            else
                printStats(stats.value());
            return kExitOk;
        }

        if (*evictCmd) {
            if (auto r = rt.open(false); !r) {
                spdlog::error("{}", r.error().message);
                return kExitFailure;
            }
            auto evicted = rt.cache->evictIfOverThreshold();
            if (!evicted) {
                spdlog::error("{}", evicted.error().message);
                return kExitFailure;
            }
            const auto& e = evicted.value();
            if (emitJson) {
                std::cout << json{{"files_removed", e.filesRemoved},
                                  {"bytes_removed", e.bytesRemoved},
                                  {"size_before", e.sizeBefore},
                                  {"size_after", e.sizeAfter}}
                                 .dump(2)
                          << std::endl;
            } else {
                std::cout << fmt::format("Evicted {} files ({} bytes); cache now {} bytes\n",
                                         e.filesRemoved, e.bytesRemoved, e.sizeAfter);
            }
            return kExitOk;
        }

        if (*importCmd) {
            auto items = depfetch::manifest::GitDepsManifest::load(importManifest);
            if (!items) {
                spdlog::error("{}", items.error().message);
                return kExitFailure;
            }
            if (auto r = rt.open(false); !r) {
                spdlog::error("{}", r.error().message);
                return kExitFailure;
            }
            std::size_t imported = 0;
            std::size_t missing = 0;
            for (const auto& item : items.value()) {
                auto source = fs::path(importSource) / item.destination;
                std::error_code ec;
                if (!fs::is_regular_file(source, ec)) {
                    ++missing;
                    continue;
                }
                auto placed = rt.cache->materialize(source, item.destination, /*keepSource=*/true);
                if (!placed) {
                    spdlog::warn("Import of {} failed: {}", source.string(),
                                 placed.error().message);
                    continue;
                }
                ++imported;
            }
            std::cout << fmt::format("Imported {}/{} files ({} not found in source)\n", imported,
                                     items.value().size(), missing);
            return imported + missing == items.value().size() ? kExitOk : kExitFailure;
        }

        // fetch
        auto items = depfetch::manifest::GitDepsManifest::load(manifestPath);
        if (!items) {
            spdlog::error("{}", items.error().message);
            return kExitFailure;
        }
        if (auto r = rt.open(true); !r) {
            spdlog::error("Cannot initialize cache at {}: {}", rt.cfg.cache.root.string(),
                          r.error().message);
            return kExitFailure;
        }

        depfetch::CancellationToken cancel;
        std::atomic<bool> interrupted{false};

        // SIGINT/SIGTERM: stop dispatching, abort transfers, flush the ledger
        boost::asio::io_context signalContext;
        boost::asio::signal_set signals(signalContext, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int signo) {
            if (ec)
                return;
            interrupted.store(true);
            cancel.cancel();
            spdlog::warn("Received signal {}, flushing verification ledger", signo);
            if (auto flushed = rt.ledger->flush(); !flushed) {
                spdlog::warn("Ledger flush failed: {}", flushed.error().message);
            }
        });
        std::thread signalThread([&signalContext] { signalContext.run(); });

        auto http = depfetch::downloader::makeCurlHttpAdapter();
        depfetch::cli::ConsoleProgress progress(!emitJson && ::isatty(STDERR_FILENO));
        depfetch::downloader::DownloadOrchestrator orchestrator(rt.cfg.download, *http, *rt.cache,
                                                               rt.ledger.get(), &progress);

        auto report = orchestrator.run(items.value(), cancel);
        progress.finish();

        signals.cancel();
        signalContext.stop();
        signalThread.join();

        if (auto flushed = rt.ledger->flush(); !flushed) {
            spdlog::warn("Ledger flush failed: {}", flushed.error().message);
        }

        std::optional<depfetch::ledger::LedgerStatistics> stats;
        if (showStats) {
            auto s = rt.ledger->statistics();
            if (s)
                stats = s.value();
            else
                spdlog::warn("Statistics unavailable: {}", s.error().message);
        }

        if (emitJson) {
            json out{{"total", report.total},
                     {"successful", report.successful},
                     {"failed", report.failed()},
                     {"cancelled", report.cancelled},
                     {"items", json::array()}};
            for (const auto& o : report.outcomes)
                out["items"].push_back(outcomeToJson(o));
            if (stats)
                out["stats"] = statsToJson(*stats);
            std::cout << out.dump(2) << std::endl;
        } else {
            std::cout << fmt::format("\nDownload complete: {}/{} files downloaded successfully\n",
                                     report.successful, report.total);
            if (stats)
                printStats(*stats);
        }

        if (interrupted.load())
            return kExitInterrupted;
        return report.allSucceeded() ? kExitOk : kExitFailure;
    } catch (const std::exception& e) {
        spdlog::error("Fatal: {}", e.what());
        return kExitFailure;
    }
}
