#include <spdlog/spdlog.h>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <utility>
#include <depfetch/metadata/database.h>

namespace depfetch::metadata {

namespace {

constexpr int kLockedAttempts = 5;
constexpr auto kLockedBackoff = std::chrono::milliseconds(10);
constexpr int kDefaultBusyTimeoutMs = 5000;

bool isLockContention(int rc) {
    return rc == SQLITE_BUSY || rc == SQLITE_LOCKED;
}

Error stepError(sqlite3_stmt* stmt, int rc) {
    std::string message = std::string("SQLite step failed: ") + sqlite3_errstr(rc);
    if (const char* sql = stmt ? sqlite3_sql(stmt) : nullptr) {
        std::string_view text(sql);
        message += " [" + std::string(text.substr(0, 80)) + (text.size() > 80 ? "...]" : "]");
    }
    return Error{ErrorCode::DatabaseError, std::move(message)};
}

} // namespace

Statement::Statement(sqlite3* db, std::string_view sql) {
    int rc = sqlite3_prepare_v2(db, sql.data(), static_cast<int>(sql.size()), &stmt_, nullptr);
    if (rc != SQLITE_OK) {
        sqlite3_finalize(stmt_);
        stmt_ = nullptr;
        throw std::runtime_error(std::string("Cannot prepare ledger query: ") +
                                 sqlite3_errmsg(db));
    }
}

Statement::~Statement() {
    sqlite3_finalize(stmt_);
}

Statement::Statement(Statement&& other) noexcept : stmt_(std::exchange(other.stmt_, nullptr)) {}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        sqlite3_finalize(stmt_);
        stmt_ = std::exchange(other.stmt_, nullptr);
    }
    return *this;
}

Result<void> Statement::bind(int index, int64_t value) {
    if (sqlite3_bind_int64(stmt_, index, value) != SQLITE_OK)
        return Error{ErrorCode::DatabaseError, "Cannot bind integer parameter " +
                                                   std::to_string(index)};
    return {};
}

Result<void> Statement::bind(int index, double value) {
    if (sqlite3_bind_double(stmt_, index, value) != SQLITE_OK)
        return Error{ErrorCode::DatabaseError, "Cannot bind real parameter " +
                                                   std::to_string(index)};
    return {};
}

Result<void> Statement::bind(int index, std::string_view text) {
    if (sqlite3_bind_text(stmt_, index, text.data(), static_cast<int>(text.size()),
                          SQLITE_TRANSIENT) != SQLITE_OK)
        return Error{ErrorCode::DatabaseError, "Cannot bind text parameter " +
                                                   std::to_string(index)};
    return {};
}

int Statement::stepUnlocked() {
    auto backoff = kLockedBackoff;
    int rc = sqlite3_step(stmt_);
    for (int attempt = 1; isLockContention(rc) && attempt < kLockedAttempts; ++attempt) {
        sqlite3_reset(stmt_);
        std::this_thread::sleep_for(backoff);
        backoff *= 2;
        rc = sqlite3_step(stmt_);
    }
    return rc;
}

Result<void> Statement::execute() {
    int rc = stepUnlocked();
    if (rc == SQLITE_DONE || rc == SQLITE_ROW)
        return {};
    return stepError(stmt_, rc);
}

Result<bool> Statement::step() {
    switch (int rc = stepUnlocked()) {
        case SQLITE_ROW:
            return true;
        case SQLITE_DONE:
            return false;
        default:
            return stepError(stmt_, rc);
    }
}

int64_t Statement::getInt64(int column) const {
    return sqlite3_column_int64(stmt_, column);
}

double Statement::getDouble(int column) const {
    return sqlite3_column_double(stmt_, column);
}

std::string Statement::getString(int column) const {
    const auto* text = sqlite3_column_text(stmt_, column);
    if (!text)
        return {};
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<std::size_t>(sqlite3_column_bytes(stmt_, column)));
}

Database::~Database() {
    close();
}

Database::Database(Database&& other) noexcept
    : db_(std::exchange(other.db_, nullptr)), path_(std::move(other.path_)) {}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        close();
        db_ = std::exchange(other.db_, nullptr);
        path_ = std::move(other.path_);
    }
    return *this;
}

Result<void> Database::open(const std::string& path, OpenMode mode) {
    close();

    // Connections stay on the worker that opened them.
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_NOMUTEX;
    if (mode == OpenMode::Create)
        flags |= SQLITE_OPEN_CREATE;

    int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string reason = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        sqlite3_close(db_);
        db_ = nullptr;
        return Error{ErrorCode::DatabaseError, "Cannot open ledger database " + path + ": " +
                                                   reason};
    }

    sqlite3_busy_timeout(db_, kDefaultBusyTimeoutMs);
    path_ = path;
    return {};
}

void Database::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
    path_.clear();
}

Result<Statement> Database::prepare(std::string_view sql) {
    if (!db_)
        return Error{ErrorCode::InvalidState, "Ledger database not open"};
    try {
        return Statement(db_, sql);
    } catch (const std::runtime_error& e) {
        return Error{ErrorCode::DatabaseError, e.what()};
    }
}

Result<void> Database::execute(const std::string& sql) {
    if (!db_)
        return Error{ErrorCode::InvalidState, "Ledger database not open"};

    char* message = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &message) != SQLITE_OK) {
        std::string reason = message ? message : sqlite3_errmsg(db_);
        sqlite3_free(message);
        spdlog::error("Ledger SQL failed on {}: {}", path_, reason);
        return Error{ErrorCode::DatabaseError, "Ledger SQL failed: " + reason};
    }
    return {};
}

Result<void> Database::setBusyTimeout(std::chrono::milliseconds timeout) {
    if (!db_)
        return Error{ErrorCode::InvalidState, "Ledger database not open"};
    if (sqlite3_busy_timeout(db_, static_cast<int>(timeout.count())) != SQLITE_OK)
        return failure("Cannot set busy timeout");
    return {};
}

Result<void> Database::enableWAL() {
    return execute("PRAGMA journal_mode=WAL");
}

Result<void> Database::checkpoint() {
    if (!db_)
        return Error{ErrorCode::InvalidState, "Ledger database not open"};

    int walFrames = 0;
    int copied = 0;
    if (sqlite3_wal_checkpoint_v2(db_, nullptr, SQLITE_CHECKPOINT_TRUNCATE, &walFrames,
                                  &copied) != SQLITE_OK)
        return failure("WAL checkpoint failed");
    spdlog::debug("Ledger checkpoint {}: {}/{} WAL frames copied", path_, copied, walFrames);
    return {};
}

std::string Database::version() {
    return sqlite3_libversion();
}

Error Database::failure(std::string_view what) const {
    return Error{ErrorCode::DatabaseError, std::string(what) + ": " + sqlite3_errmsg(db_)};
}

} // namespace depfetch::metadata
