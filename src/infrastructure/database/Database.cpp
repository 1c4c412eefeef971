#include "infrastructure/database/Database.hpp"

#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>

namespace hostkeeper::infra {

// Statement implementation
Statement::Statement(sqlite3_stmt* stmt) : stmt_(stmt) {}

Statement::~Statement() {
    if (stmt_) {
        sqlite3_finalize(stmt_);
    }
}

Statement::Statement(Statement&& other) noexcept : stmt_(other.stmt_) {
    other.stmt_ = nullptr;
}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
        stmt_ = other.stmt_;
        other.stmt_ = nullptr;
    }
    return *this;
}

void Statement::bind(int index, const std::string& value) {
    if (sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()),
                          SQLITE_TRANSIENT) != SQLITE_OK) {
        throw std::runtime_error("Failed to bind text parameter");
    }
}

bool Statement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc == SQLITE_DONE) {
        return false;
    }
    throw std::runtime_error(std::string("SQLite step failed: ") + sqlite3_errstr(rc));
}

int Statement::columnInt(int index) const {
    return sqlite3_column_int(stmt_, index);
}

std::string Statement::columnText(int index) const {
    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, index));
    return text ? text : "";
}

bool Statement::columnIsNull(int index) const {
    return sqlite3_column_type(stmt_, index) == SQLITE_NULL;
}

// Database implementation
Database::Database(const std::string& path) {
    spdlog::info("Opening database: {}", path);

    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(path.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
        std::string error = sqlite3_errmsg(db_);
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open database: " + error);
    }

    configureConnection(path == ":memory:");
    createMigrationsTable();
}

Database::~Database() {
    if (db_) {
        sqlite3_close(db_);
    }
}

void Database::configureConnection(bool inMemory) {
    if (!inMemory) {
        execute("PRAGMA journal_mode=WAL");
    }
    execute("PRAGMA synchronous=NORMAL");
    sqlite3_busy_timeout(db_, 2000);
}

void Database::execute(const std::string& sql) {
    std::lock_guard lock(mutex_);
    char* errMsg = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errMsg) != SQLITE_OK) {
        std::string error = errMsg ? errMsg : "Unknown error";
        sqlite3_free(errMsg);
        throw std::runtime_error("SQL execution failed: " + error);
    }
}

Statement Database::prepare(const std::string& sql) {
    std::lock_guard lock(mutex_);
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("Failed to prepare statement: ") +
                                 sqlite3_errmsg(db_));
    }
    return Statement(stmt);
}

int Database::changes() const {
    return sqlite3_changes(db_);
}

void Database::createMigrationsTable() {
    execute(R"(
        CREATE TABLE IF NOT EXISTS schema_migrations (
            version INTEGER PRIMARY KEY,
            applied_at TEXT DEFAULT CURRENT_TIMESTAMP
        )
    )");
}

int Database::schemaVersion() {
    auto stmt = prepare("SELECT MAX(version) FROM schema_migrations");
    if (stmt.step() && !stmt.columnIsNull(0)) {
        return stmt.columnInt(0);
    }
    return 0;
}

void Database::setVersion(int version) {
    execute("INSERT INTO schema_migrations (version) VALUES (" + std::to_string(version) + ")");
}

void Database::runMigrations() {
    int currentVersion = schemaVersion();
    spdlog::debug("Current schema version: {}", currentVersion);

    // Migration 1: host state cache
    if (currentVersion < 1) {
        spdlog::info("Applying migration 1: host state cache");
        execute(R"(
            CREATE TABLE IF NOT EXISTS host_cache (
                host_id TEXT PRIMARY KEY,
                data TEXT NOT NULL,
                updated_at TEXT NOT NULL
            )
        )");

        setVersion(1);
    }

    // Migration 2: index for age-based pruning
    if (currentVersion < 2) {
        spdlog::info("Applying migration 2: host_cache updated_at index");
        execute("CREATE INDEX IF NOT EXISTS idx_host_cache_updated_at ON host_cache(updated_at)");

        setVersion(2);
    }

    spdlog::debug("Database migrations complete. Version: {}", schemaVersion());
}

} // namespace hostkeeper::infra
