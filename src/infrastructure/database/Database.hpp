#pragma once

#include <mutex>
#include <sqlite3.h>
#include <string>

namespace hostkeeper::infra {

/**
 * @brief RAII wrapper for SQLite prepared statements.
 *
 * @note This class is non-copyable but moveable.
 */
class Statement {
public:
    /**
     * @brief Takes ownership of a prepared statement handle.
     */
    explicit Statement(sqlite3_stmt* stmt);
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;
    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;

    /**
     * @brief Binds a text parameter (1-based index).
     */
    void bind(int index, const std::string& value);

    /**
     * @brief Executes the statement and advances to the next row.
     * @return True if a row is available, false if done.
     * @throws std::runtime_error on SQLite errors.
     */
    bool step();

    /// @name Column access (0-based index)
    /// @{
    int columnInt(int index) const;
    std::string columnText(int index) const;
    bool columnIsNull(int index) const;
    /// @}

private:
    sqlite3_stmt* stmt_{nullptr};
};

/**
 * @brief SQLite connection holding the persisted state cache.
 *
 * Opens the database in WAL mode and applies versioned schema migrations.
 * Pass ":memory:" for a private in-memory database.
 *
 * @note This class is non-copyable.
 */
class Database {
public:
    /**
     * @brief Opens or creates a database at the specified path.
     * @throws std::runtime_error if the database cannot be opened.
     */
    explicit Database(const std::string& path);
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    /**
     * @brief Executes SQL without results.
     * @throws std::runtime_error on SQL error.
     */
    void execute(const std::string& sql);

    /**
     * @brief Prepares a SQL statement.
     * @throws std::runtime_error if preparation fails.
     */
    Statement prepare(const std::string& sql);

    int changes() const;

    /**
     * @brief Executes a function within a transaction.
     *
     * Commits on success, rolls back and rethrows on exception. Transactions
     * are serialized against each other.
     */
    template <typename Func>
    void transaction(Func&& func) {
        std::lock_guard lock(transactionMutex_);
        execute("BEGIN TRANSACTION");
        try {
            func();
            execute("COMMIT");
        } catch (...) {
            execute("ROLLBACK");
            throw;
        }
    }

    /**
     * @brief Applies pending schema migrations.
     */
    void runMigrations();

    /**
     * @brief Returns the applied schema version, 0 for a fresh database.
     */
    int schemaVersion();

private:
    void configureConnection(bool inMemory);
    void createMigrationsTable();
    void setVersion(int version);

    sqlite3* db_{nullptr};
    mutable std::mutex mutex_;
    std::mutex transactionMutex_;
};

} // namespace hostkeeper::infra
