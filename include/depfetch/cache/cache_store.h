#pragma once

#include <depfetch/core/types.h>

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace depfetch::cache {

/**
 * @brief Size-bounded content-addressed cache configuration
 */
struct CacheConfig {
    std::filesystem::path root{"./output"};
    std::uint64_t maxSizeBytes{100ull * 1024 * 1024 * 1024}; // 100GB
    double cleanupThreshold{0.9};                             // fraction of maxSizeBytes
    std::string ledgerFileName{".verification.db"};           // reserved, never an entry
};

/**
 * @brief Result of one eviction pass
 */
struct EvictionResult {
    std::size_t filesRemoved{0};
    std::uint64_t bytesRemoved{0};
    std::uint64_t sizeBefore{0};
    std::uint64_t sizeAfter{0};
};

/**
 * @brief Cache tree rooted at CacheConfig::root
 *
 * Entries are regular files at `<root>/<remotePath>/<contentHash>`. Eviction is
 * least-recently-accessed first, serialized by an internal mutex, and never
 * touches a pinned (in-flight) file. Sizes are always recomputed from disk.
 */
class CacheStore {
public:
    explicit CacheStore(CacheConfig config);

    CacheStore(const CacheStore&) = delete;
    CacheStore& operator=(const CacheStore&) = delete;

    /**
     * @brief Create the cache root directory. Failure is fatal to a run.
     */
    Result<void> initialize();

    [[nodiscard]] const CacheConfig& config() const { return config_; }
    [[nodiscard]] const std::filesystem::path& root() const { return config_.root; }

    /**
     * @brief Absolute path for an entry, whether or not it exists
     */
    [[nodiscard]] std::filesystem::path absolutePath(const std::filesystem::path& relative) const;

    /**
     * @brief Locate an existing entry
     */
    [[nodiscard]] std::optional<std::filesystem::path>
    locate(const std::filesystem::path& relative) const;

    /**
     * @brief Move (or copy, when keepSource is set) a file into the cache.
     *
     * No-op returning the existing path when the entry is already present.
     * Runs eviction and creates parent directories before inserting.
     */
    Result<std::filesystem::path> materialize(const std::filesystem::path& source,
                                              const std::filesystem::path& relative,
                                              bool keepSource = false);

    /**
     * @brief Make room for, and create the parent directory of, an entry about to be written
     */
    Result<std::filesystem::path> prepare(const std::filesystem::path& relative);

    /**
     * @brief Total bytes of regular files under the root, reserved files excluded
     */
    [[nodiscard]] std::uint64_t currentSize() const;

    /**
     * @brief Evict least-recently-accessed entries until at or below maxSize * threshold
     */
    Result<EvictionResult> evictIfOverThreshold(std::uint64_t maxSize, double thresholdFraction);
    Result<EvictionResult> evictIfOverThreshold();

    /**
     * @brief True for the ledger database and its -wal / -shm companions
     */
    [[nodiscard]] bool isReserved(const std::filesystem::path& path) const;

    void pin(const std::filesystem::path& absolute);
    void unpin(const std::filesystem::path& absolute);
    [[nodiscard]] bool isPinned(const std::filesystem::path& absolute) const;

    /**
     * @brief RAII pin for a file being written
     */
    class PinGuard {
    public:
        PinGuard(CacheStore& store, std::filesystem::path absolute)
            : store_(&store), path_(std::move(absolute)) {
            store_->pin(path_);
        }
        ~PinGuard() {
            if (store_)
                store_->unpin(path_);
        }
        PinGuard(const PinGuard&) = delete;
        PinGuard& operator=(const PinGuard&) = delete;
        PinGuard(PinGuard&& other) noexcept
            : store_(other.store_), path_(std::move(other.path_)) {
            other.store_ = nullptr;
        }
        PinGuard& operator=(PinGuard&&) = delete;

    private:
        CacheStore* store_;
        std::filesystem::path path_;
    };

private:
    CacheConfig config_;
    mutable std::mutex evictionMutex_;
    mutable std::mutex pinMutex_;
    std::unordered_map<std::string, int> pinned_;

    static std::string pinKey(const std::filesystem::path& absolute);
};

} // namespace depfetch::cache
