/*
 * depfetch/src/ledger/verification_ledger.cpp
 *
 * SQLite-backed verification ledger. One row per cached file, replaced on
 * every verification. Readers never block the writer (WAL).
 */

#include <depfetch/ledger/verification_ledger.h>

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cmath>
#include <ctime>
#include <system_error>

namespace depfetch::ledger {

namespace fs = std::filesystem;

namespace {

constexpr const char* kSchema = R"(
    CREATE TABLE IF NOT EXISTS verified_files (
        file_path TEXT PRIMARY KEY,
        file_size INTEGER,
        modified_time REAL,
        expected_hash TEXT,
        verified_at TEXT,
        verification_status TEXT
    );
    CREATE INDEX IF NOT EXISTS idx_verified_at ON verified_files(verified_at);
    CREATE INDEX IF NOT EXISTS idx_verification_status ON verified_files(verification_status);
)";

struct LiveStat {
    std::uint64_t size{0};
    double mtime{0.0};
};

Result<LiveStat> statFile(const fs::path& file) {
    std::error_code ec;
    LiveStat st;
    st.size = fs::file_size(file, ec);
    if (ec) {
        return Error{ErrorCode::IoError, "stat failed for " + file.string() + ": " + ec.message()};
    }
    auto ftime = fs::last_write_time(file, ec);
    if (ec) {
        return Error{ErrorCode::IoError,
                     "mtime failed for " + file.string() + ": " + ec.message()};
    }
    auto sys = std::chrono::file_clock::to_sys(ftime);
    st.mtime = std::chrono::duration<double>(sys.time_since_epoch()).count();
    return st;
}

std::tm localNow(long& micros) {
    auto now = std::chrono::system_clock::now();
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(now);
    micros = static_cast<long>(
        std::chrono::duration_cast<std::chrono::microseconds>(now - secs).count());
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&t, &tm);
    return tm;
}

} // namespace

std::optional<VerificationStatus> parseVerificationStatus(std::string_view text) {
    if (text == "VALID")
        return VerificationStatus::Valid;
    if (text == "CORRUPT")
        return VerificationStatus::Corrupt;
    if (text == "HASH_MISMATCH")
        return VerificationStatus::HashMismatch;
    return std::nullopt;
}

std::string localIsoTimestamp() {
    long micros = 0;
    auto tm = localNow(micros);
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:06d}", tm, micros);
}

std::string localMidnightIso() {
    long micros = 0;
    auto tm = localNow(micros);
    return fmt::format("{:%Y-%m-%d}T00:00:00", tm);
}

// LedgerSession

LedgerSession::LedgerSession(const VerificationLedger& ledger, metadata::Database db)
    : ledger_(ledger), db_(std::move(db)) {}

LedgerSession::~LedgerSession() = default;

Result<std::optional<VerificationRecord>> LedgerSession::lookup(const fs::path& file) {
    auto stmtResult = db_.prepare(
        "SELECT file_path, file_size, modified_time, expected_hash, verified_at, "
        "verification_status FROM verified_files WHERE file_path = ?");
    if (!stmtResult)
        return stmtResult.error();

    auto stmt = std::move(stmtResult).value();
    auto bound = stmt.bind(1, ledger_.relativeKey(file));
    if (!bound)
        return bound.error();

    auto row = stmt.step();
    if (!row)
        return row.error();
    if (!row.value())
        return std::optional<VerificationRecord>{};

    VerificationRecord rec;
    rec.filePath = stmt.getString(0);
    rec.fileSize = static_cast<std::uint64_t>(stmt.getInt64(1));
    rec.modifiedTime = stmt.getDouble(2);
    rec.expectedHash = stmt.getString(3);
    rec.verifiedAt = stmt.getString(4);
    auto status = parseVerificationStatus(stmt.getString(5));
    if (!status) {
        return Error{ErrorCode::LedgerStorageError,
                     "Unknown verification status '" + stmt.getString(5) + "' for " +
                         rec.filePath};
    }
    rec.status = *status;
    return std::optional<VerificationRecord>{std::move(rec)};
}

bool LedgerSession::needsVerification(const fs::path& file, std::string_view expectedHash) {
    const auto& cfg = ledger_.config();
    if (cfg.forceVerify)
        return true;

    auto record = lookup(file);
    if (!record) {
        spdlog::warn("Ledger lookup failed for {}: {}", file.string(), record.error().message);
        return true;
    }
    if (!record.value())
        return true;

    const auto& rec = *record.value();
    if (rec.expectedHash != expectedHash)
        return true;
    if (rec.status != VerificationStatus::Valid)
        return true;

    auto live = statFile(file);
    if (!live) {
        spdlog::debug("{}", live.error().message);
        return true;
    }
    if (live.value().size != rec.fileSize)
        return true;
    if (std::fabs(live.value().mtime - rec.modifiedTime) > cfg.mtimeTolerance)
        return true;

    return false;
}

void LedgerSession::upsert(const fs::path& file, std::string_view expectedHash,
                           VerificationStatus status) {
    auto live = statFile(file);
    if (!live) {
        spdlog::warn("Ledger update skipped for {}: {}", file.string(), live.error().message);
        return;
    }

    auto stmtResult = db_.prepare(
        "INSERT OR REPLACE INTO verified_files "
        "(file_path, file_size, modified_time, expected_hash, verified_at, verification_status) "
        "VALUES (?, ?, ?, ?, ?, ?)");
    if (!stmtResult) {
        spdlog::warn("Ledger update failed for {}: {}", file.string(),
                     stmtResult.error().message);
        return;
    }

    auto stmt = std::move(stmtResult).value();
    auto bound = stmt.bindAll(ledger_.relativeKey(file), static_cast<int64_t>(live.value().size),
                              live.value().mtime, expectedHash, localIsoTimestamp(),
                              toString(status));
    if (!bound) {
        spdlog::warn("Ledger update failed for {}: {}", file.string(), bound.error().message);
        return;
    }
    auto executed = stmt.execute();
    if (!executed) {
        spdlog::warn("Ledger update failed for {}: {}", file.string(),
                     executed.error().message);
        return;
    }
    spdlog::debug("Ledger: {} -> {}", ledger_.relativeKey(file), toString(status));
}

// VerificationLedger

VerificationLedger::VerificationLedger(LedgerConfig config) : config_(std::move(config)) {}

VerificationLedger::~VerificationLedger() {
    if (initialized_) {
        auto flushed = flush();
        if (!flushed) {
            spdlog::warn("Ledger flush on shutdown failed: {}", flushed.error().message);
        }
    }
}

fs::path VerificationLedger::databasePath() const {
    return config_.root / config_.fileName;
}

std::string VerificationLedger::relativeKey(const fs::path& file) const {
    auto rel = file.lexically_normal().lexically_relative(config_.root.lexically_normal());
    if (rel.empty() || *rel.begin() == "..") {
        return file.generic_string();
    }
    return rel.generic_string();
}

Result<void> VerificationLedger::initialize() {
    std::lock_guard<std::mutex> lock(controlMutex_);
    if (initialized_)
        return {};

    std::error_code ec;
    fs::create_directories(config_.root, ec);
    if (ec) {
        return Error{ErrorCode::LedgerStorageError,
                     "Cannot create ledger directory " + config_.root.string()};
    }

    auto opened = control_.open(databasePath().string(), metadata::OpenMode::Create);
    if (!opened) {
        return Error{ErrorCode::LedgerStorageError, opened.error().message};
    }
    if (auto r = control_.setBusyTimeout(config_.busyTimeout); !r) {
        return Error{ErrorCode::LedgerStorageError, r.error().message};
    }
    if (auto r = control_.enableWAL(); !r) {
        return Error{ErrorCode::LedgerStorageError, r.error().message};
    }
    if (auto r = control_.execute(kSchema); !r) {
        return Error{ErrorCode::LedgerStorageError, r.error().message};
    }

    initialized_ = true;
    spdlog::debug("Verification ledger ready at {} (SQLite {})", databasePath().string(),
                  metadata::Database::version());
    return {};
}

Result<std::unique_ptr<LedgerSession>> VerificationLedger::openSession() const {
    if (!initialized_) {
        return Error{ErrorCode::NotInitialized, "Verification ledger not initialized"};
    }

    metadata::Database db;
    auto opened = db.open(databasePath().string(), metadata::OpenMode::Existing);
    if (!opened) {
        return Error{ErrorCode::LedgerStorageError, opened.error().message};
    }
    if (auto r = db.setBusyTimeout(config_.busyTimeout); !r) {
        return Error{ErrorCode::LedgerStorageError, r.error().message};
    }
    return std::unique_ptr<LedgerSession>(new LedgerSession(*this, std::move(db)));
}

Result<void> VerificationLedger::flush() {
    std::lock_guard<std::mutex> lock(controlMutex_);
    if (!initialized_ || !control_.isOpen())
        return {};
    auto r = control_.checkpoint();
    if (!r) {
        return Error{ErrorCode::LedgerStorageError, r.error().message};
    }
    return {};
}

Result<LedgerStatistics> VerificationLedger::statistics() {
    std::lock_guard<std::mutex> lock(controlMutex_);
    if (!initialized_) {
        return Error{ErrorCode::NotInitialized, "Verification ledger not initialized"};
    }

    LedgerStatistics stats;

    {
        auto stmt = control_.prepare("SELECT COUNT(*) FROM verified_files");
        if (!stmt)
            return stmt.error();
        auto row = stmt.value().step();
        if (!row)
            return row.error();
        stats.totalFiles = static_cast<std::uint64_t>(stmt.value().getInt64(0));
    }

    {
        auto stmt = control_.prepare("SELECT verification_status, COUNT(*) FROM verified_files "
                                     "GROUP BY verification_status");
        if (!stmt)
            return stmt.error();
        while (true) {
            auto row = stmt.value().step();
            if (!row)
                return row.error();
            if (!row.value())
                break;
            stats.byStatus[stmt.value().getString(0)] =
                static_cast<std::uint64_t>(stmt.value().getInt64(1));
        }
    }

    {
        auto stmt =
            control_.prepare("SELECT COUNT(*) FROM verified_files WHERE verified_at >= ?");
        if (!stmt)
            return stmt.error();
        if (auto b = stmt.value().bind(1, localMidnightIso()); !b)
            return b.error();
        auto row = stmt.value().step();
        if (!row)
            return row.error();
        stats.verifiedToday = static_cast<std::uint64_t>(stmt.value().getInt64(0));
    }

    std::error_code ec;
    auto dbPath = databasePath();
    auto walPath = dbPath;
    walPath += "-wal";
    for (const auto& p : {dbPath, walPath}) {
        auto sz = fs::file_size(p, ec);
        if (!ec)
            stats.storageBytes += sz;
        ec.clear();
    }
    return stats;
}

} // namespace depfetch::ledger
