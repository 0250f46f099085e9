/*
 * depfetch/src/cache/cache_store.cpp
 *
 * Content-addressed cache tree with LRU (access time) eviction.
 * - Rename into place; EXDEV falls back to copy + remove
 * - Reserved ledger files are neither counted nor evicted
 * - Pinned files (transfers in flight) are never evicted
 */

#include <depfetch/cache/cache_store.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <system_error>
#include <vector>

#include <sys/stat.h>

namespace depfetch::cache {

namespace fs = std::filesystem;

namespace {

struct CandidateEntry {
    fs::path path;
    std::uint64_t size{0};
    struct timespec atime {};
};

bool accessedBefore(const CandidateEntry& a, const CandidateEntry& b) {
    if (a.atime.tv_sec != b.atime.tv_sec)
        return a.atime.tv_sec < b.atime.tv_sec;
    if (a.atime.tv_nsec != b.atime.tv_nsec)
        return a.atime.tv_nsec < b.atime.tv_nsec;
    return a.path < b.path;
}

Result<void> copyThenRemove(const fs::path& src, const fs::path& dst, bool keepSource) {
    std::error_code ec;
    fs::copy_file(src, dst, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return Error{ErrorCode::IoError, "copy failed (" + ec.message() + ") from " +
                                             src.string() + " to " + dst.string()};
    }
    if (!keepSource) {
        fs::remove(src, ec);
        if (ec) {
            spdlog::debug("materialize: failed to remove source {}: {}", src.string(),
                          ec.message());
        }
    }
    return {};
}

} // namespace

CacheStore::CacheStore(CacheConfig config) : config_(std::move(config)) {}

Result<void> CacheStore::initialize() {
    std::error_code ec;
    fs::create_directories(config_.root, ec);
    if (ec || !fs::is_directory(config_.root, ec)) {
        return Error{ErrorCode::IoError, "Failed to create cache root " + config_.root.string() +
                                             (ec ? ": " + ec.message() : std::string{})};
    }
    spdlog::debug("Cache root ready at {}", config_.root.string());
    return {};
}

fs::path CacheStore::absolutePath(const fs::path& relative) const {
    return config_.root / relative;
}

std::optional<fs::path> CacheStore::locate(const fs::path& relative) const {
    std::error_code ec;
    auto full = absolutePath(relative);
    if (fs::is_regular_file(full, ec)) {
        return full;
    }
    return std::nullopt;
}

bool CacheStore::isReserved(const fs::path& path) const {
    const auto name = path.filename().string();
    const auto& base = config_.ledgerFileName;
    return name == base || name == base + "-wal" || name == base + "-shm" ||
           name == base + "-journal";
}

std::string CacheStore::pinKey(const fs::path& absolute) {
    return absolute.lexically_normal().string();
}

void CacheStore::pin(const fs::path& absolute) {
    std::lock_guard<std::mutex> lock(pinMutex_);
    ++pinned_[pinKey(absolute)];
}

void CacheStore::unpin(const fs::path& absolute) {
    std::lock_guard<std::mutex> lock(pinMutex_);
    auto it = pinned_.find(pinKey(absolute));
    if (it == pinned_.end())
        return;
    if (--it->second <= 0)
        pinned_.erase(it);
}

bool CacheStore::isPinned(const fs::path& absolute) const {
    std::lock_guard<std::mutex> lock(pinMutex_);
    return pinned_.contains(pinKey(absolute));
}

std::uint64_t CacheStore::currentSize() const {
    std::uint64_t total = 0;
    std::error_code ec;
    if (!fs::exists(config_.root, ec))
        return 0;

    fs::recursive_directory_iterator it(config_.root,
                                        fs::directory_options::skip_permission_denied, ec);
    fs::recursive_directory_iterator end;
    for (; !ec && it != end; it.increment(ec)) {
        std::error_code fec;
        if (!it->is_regular_file(fec) || isReserved(it->path()))
            continue;
        auto sz = it->file_size(fec);
        if (!fec)
            total += sz;
    }
    if (ec) {
        spdlog::debug("currentSize: walk of {} stopped early: {}", config_.root.string(),
                      ec.message());
    }
    return total;
}

Result<EvictionResult> CacheStore::evictIfOverThreshold() {
    return evictIfOverThreshold(config_.maxSizeBytes, config_.cleanupThreshold);
}

Result<EvictionResult> CacheStore::evictIfOverThreshold(std::uint64_t maxSize,
                                                        double thresholdFraction) {
    if (thresholdFraction < 0.0 || thresholdFraction > 1.0) {
        return Error{ErrorCode::InvalidArgument, "cleanup threshold must be within [0, 1]"};
    }

    std::lock_guard<std::mutex> lock(evictionMutex_);

    EvictionResult result;
    result.sizeBefore = currentSize();
    result.sizeAfter = result.sizeBefore;

    const auto threshold =
        static_cast<std::uint64_t>(static_cast<long double>(maxSize) * thresholdFraction);
    if (result.sizeBefore <= threshold) {
        return result;
    }

    spdlog::info("Cache size {} exceeds threshold {}, evicting least recently used files",
                 result.sizeBefore, threshold);

    std::vector<CandidateEntry> entries;
    std::error_code ec;
    fs::recursive_directory_iterator it(config_.root,
                                        fs::directory_options::skip_permission_denied, ec);
    fs::recursive_directory_iterator end;
    for (; !ec && it != end; it.increment(ec)) {
        std::error_code fec;
        if (!it->is_regular_file(fec) || isReserved(it->path()))
            continue;
        struct stat st {};
        if (::stat(it->path().c_str(), &st) != 0)
            continue;
        entries.push_back(CandidateEntry{it->path(), static_cast<std::uint64_t>(st.st_size),
                                         st.st_atim});
    }
    if (ec) {
        return Error{ErrorCode::IoError,
                     "Failed to scan cache root " + config_.root.string() + ": " + ec.message()};
    }

    std::sort(entries.begin(), entries.end(), accessedBefore);

    std::uint64_t running = result.sizeBefore;
    for (const auto& entry : entries) {
        if (running <= threshold)
            break;
        if (isPinned(entry.path)) {
            spdlog::debug("Skipping in-flight file during eviction: {}", entry.path.string());
            continue;
        }
        std::error_code rec;
        if (!fs::remove(entry.path, rec) || rec) {
            spdlog::warn("Failed to evict {}: {}", entry.path.string(),
                         rec ? rec.message() : "not removed");
            continue;
        }
        running -= std::min(running, entry.size);
        ++result.filesRemoved;
        result.bytesRemoved += entry.size;
        spdlog::debug("Evicted {} ({} bytes)", entry.path.string(), entry.size);
    }

    result.sizeAfter = running;
    if (running > threshold) {
        spdlog::warn("Cache still above threshold after eviction ({} > {})", running, threshold);
    }
    return result;
}

Result<fs::path> CacheStore::prepare(const fs::path& relative) {
    auto evicted = evictIfOverThreshold();
    if (!evicted) {
        spdlog::warn("Eviction before insert failed: {}", evicted.error().message);
    }

    auto full = absolutePath(relative);
    std::error_code ec;
    fs::create_directories(full.parent_path(), ec);
    if (ec) {
        return Error{ErrorCode::IoError, "Failed to create directory " +
                                             full.parent_path().string() + ": " + ec.message()};
    }
    return full;
}

Result<fs::path> CacheStore::materialize(const fs::path& source, const fs::path& relative,
                                         bool keepSource) {
    if (auto existing = locate(relative)) {
        spdlog::debug("Cache entry already present, leaving source untouched: {}",
                      existing->string());
        return *existing;
    }

    std::error_code ec;
    if (!fs::is_regular_file(source, ec)) {
        return Error{ErrorCode::FileNotFound, "Source file not found: " + source.string()};
    }

    auto prepared = prepare(relative);
    if (!prepared)
        return prepared.error();
    const auto& dest = prepared.value();

    if (keepSource) {
        auto copied = copyThenRemove(source, dest, /*keepSource=*/true);
        if (!copied)
            return copied.error();
        return dest;
    }

    fs::rename(source, dest, ec);
    if (ec) {
        if (ec == std::errc::cross_device_link) {
            spdlog::debug("Cross-device rename; copying {} into cache", source.string());
            auto copied = copyThenRemove(source, dest, /*keepSource=*/false);
            if (!copied)
                return copied.error();
        } else {
            return Error{ErrorCode::IoError, "rename() failed (" + ec.message() + ") from " +
                                                 source.string() + " to " + dest.string()};
        }
    }
    return dest;
}

} // namespace depfetch::cache
