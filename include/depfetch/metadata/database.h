#pragma once

#include <depfetch/core/types.h>
#include <sqlite3.h>
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace depfetch::metadata {

/**
 * @brief How the ledger database file is opened
 */
enum class OpenMode {
    Existing, ///< File must already exist
    Create    ///< Create the file when absent
};

/**
 * @brief Owning handle for one prepared SQLite statement
 *
 * Parameters are bound with SQLITE_TRANSIENT, so temporaries passed to
 * bind() may die before the statement runs.
 */
class Statement {
public:
    Statement() = default;
    Statement(sqlite3* db, std::string_view sql);
    ~Statement();

    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Result<void> bind(int index, int64_t value);
    Result<void> bind(int index, double value);
    Result<void> bind(int index, std::string_view text);

    /**
     * @brief Bind every argument in order, starting at parameter 1
     */
    template <typename... Args> Result<void> bindAll(Args&&... args) {
        int index = 0;
        Result<void> status;
        ((status ? void(status = bind(++index, std::forward<Args>(args))) : void()), ...);
        return status;
    }

    /**
     * @brief Run a statement that returns no rows
     */
    Result<void> execute();

    /**
     * @brief Advance to the next row
     * @return false once the result set is exhausted
     */
    Result<bool> step();

    int64_t getInt64(int column) const;
    double getDouble(int column) const;
    std::string getString(int column) const;

private:
    /// sqlite3_step, retried with backoff while another connection holds the lock
    int stepUnlocked();

    sqlite3_stmt* stmt_ = nullptr;
};

/**
 * @brief One SQLite connection to the verification ledger
 *
 * A connection is never shared between threads; every download worker opens
 * its own and the file itself runs in WAL mode.
 */
class Database {
public:
    Database() = default;
    ~Database();

    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;
    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    Result<void> open(const std::string& path, OpenMode mode = OpenMode::Existing);
    void close();

    [[nodiscard]] bool isOpen() const { return db_ != nullptr; }
    [[nodiscard]] const std::string& path() const { return path_; }

    Result<Statement> prepare(std::string_view sql);

    /**
     * @brief Run one or more SQL statements that return no rows
     */
    Result<void> execute(const std::string& sql);

    Result<void> setBusyTimeout(std::chrono::milliseconds timeout);

    /**
     * @brief Switch the journal to WAL so readers never block the writer
     */
    Result<void> enableWAL();

    /**
     * @brief Fold the WAL back into the main file and truncate it
     */
    Result<void> checkpoint();

    static std::string version();

private:
    Error failure(std::string_view what) const;

    sqlite3* db_ = nullptr;
    std::string path_;
};

} // namespace depfetch::metadata
