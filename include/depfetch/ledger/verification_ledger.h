#pragma once

#include <depfetch/core/types.h>
#include <depfetch/metadata/database.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace depfetch::ledger {

/**
 * @brief Outcome of the last verification of a cached file
 */
enum class VerificationStatus { Valid, Corrupt, HashMismatch };

[[nodiscard]] constexpr std::string_view toString(VerificationStatus status) noexcept {
    switch (status) {
        case VerificationStatus::Valid:
            return "VALID";
        case VerificationStatus::Corrupt:
            return "CORRUPT";
        case VerificationStatus::HashMismatch:
            return "HASH_MISMATCH";
    }
    return "CORRUPT";
}

std::optional<VerificationStatus> parseVerificationStatus(std::string_view text);

/**
 * @brief Ledger configuration
 */
struct LedgerConfig {
    std::filesystem::path root{"./output"};        ///< Cache root; records are keyed relative to it
    std::string fileName{".verification.db"};      ///< Database file under root
    bool forceVerify{false};                       ///< Always report "verification needed"
    std::chrono::milliseconds busyTimeout{5000};
    double mtimeTolerance{0.001};                  ///< Seconds
};

/**
 * @brief Persisted verification result for one cached file
 */
struct VerificationRecord {
    std::string filePath;     ///< Relative to the cache root
    std::uint64_t fileSize{0};
    double modifiedTime{0.0}; ///< Seconds since epoch
    std::string expectedHash;
    std::string verifiedAt;   ///< ISO-8601 local time
    VerificationStatus status{VerificationStatus::Corrupt};
};

/**
 * @brief Operator report
 */
struct LedgerStatistics {
    std::uint64_t totalFiles{0};
    std::map<std::string, std::uint64_t> byStatus;
    std::uint64_t verifiedToday{0};
    std::uint64_t storageBytes{0}; ///< Database plus WAL
};

class VerificationLedger;

/**
 * @brief Per-worker ledger handle owning its own SQLite connection.
 *
 * Not thread-safe; a session is used by one in-flight item at a time.
 * Storage failures never surface as errors here: lookups fail open to
 * "verification needed" and writes are logged and dropped.
 */
class LedgerSession {
public:
    ~LedgerSession();

    LedgerSession(const LedgerSession&) = delete;
    LedgerSession& operator=(const LedgerSession&) = delete;

    /**
     * @brief True unless a VALID record matches the live file's hash, size and mtime
     */
    bool needsVerification(const std::filesystem::path& file, std::string_view expectedHash);

    /**
     * @brief Insert or replace the record for a file, capturing its current size and mtime
     */
    void upsert(const std::filesystem::path& file, std::string_view expectedHash,
                VerificationStatus status);

    /**
     * @brief Fetch the stored record for a file, if any
     */
    Result<std::optional<VerificationRecord>> lookup(const std::filesystem::path& file);

private:
    friend class VerificationLedger;
    LedgerSession(const VerificationLedger& ledger, metadata::Database db);

    const VerificationLedger& ledger_;
    metadata::Database db_;
};

/**
 * @brief Durable record of which cached files were verified, and when.
 *
 * Lives at `<root>/.verification.db` in WAL mode. The ledger itself holds a
 * control connection used for schema setup, checkpoints and statistics;
 * workers use sessions from openSession().
 */
class VerificationLedger {
public:
    explicit VerificationLedger(LedgerConfig config);
    ~VerificationLedger();

    VerificationLedger(const VerificationLedger&) = delete;
    VerificationLedger& operator=(const VerificationLedger&) = delete;

    /**
     * @brief Open the control connection, create the schema and enable WAL.
     * Failure is fatal to a run.
     */
    Result<void> initialize();

    /**
     * @brief Open a new connection for one worker
     */
    Result<std::unique_ptr<LedgerSession>> openSession() const;

    /**
     * @brief Checkpoint the WAL into the main database. Idempotent.
     */
    Result<void> flush();

    /**
     * @brief Totals, per-status counts, verifications since local midnight and storage size
     */
    Result<LedgerStatistics> statistics();

    [[nodiscard]] std::filesystem::path databasePath() const;
    [[nodiscard]] const LedgerConfig& config() const { return config_; }

    /**
     * @brief Record key for a file: its path relative to the cache root
     */
    [[nodiscard]] std::string relativeKey(const std::filesystem::path& file) const;

private:
    LedgerConfig config_;
    std::mutex controlMutex_;
    metadata::Database control_;
    bool initialized_{false};
};

/**
 * @brief Current local time as "YYYY-MM-DDTHH:MM:SS.ffffff"
 */
std::string localIsoTimestamp();

/**
 * @brief Today's local midnight as "YYYY-MM-DDT00:00:00"
 */
std::string localMidnightIso();

} // namespace depfetch::ledger
