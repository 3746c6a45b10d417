/**
 * @file connection.hpp
 * @brief RAII SQLite connection shared by the ledger and SQL scripts
 *
 * A Connection is handed to every component that touches the database
 * (SqliteLedgerStore, FileScriptStore, MigrationLock). Nothing in the
 * library opens a connection on its own.
 */

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <sqlite3.h>
#include "exceptions.hpp"

namespace sqlmigrate {

/**
 * @brief Configuration options for a database connection
 *
 *   ConnectionOptions opts;
 *   opts.busyTimeoutMs = 10000;
 *   auto conn = Connection::open("app.sqlite", opts);
 */
struct ConnectionOptions {
    // Write-Ahead Logging; ignored for in-memory databases
    bool enableWAL = true;

    // How long to wait on a locked database before SQLITE_BUSY
    int busyTimeoutMs = 5000;

    bool enableForeignKeys = true;

    bool readOnly = false;

    bool createIfNotExists = true;

    bool extendedResultCodes = true;
};

class Statement;
class Transaction;

/**
 * @brief Owns one sqlite3 handle; closed on destruction
 */
class Connection {
public:
    /**
     * @brief Open a database connection
     * @param dbPath Path to database file, or ":memory:"
     * @param options Connection configuration
     * @throws ConnectionException if opening fails
     */
    explicit Connection(const std::string& dbPath,
                        const ConnectionOptions& options = ConnectionOptions{});

    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    Connection(Connection&& other) noexcept;
    Connection& operator=(Connection&& other) noexcept;

    static std::unique_ptr<Connection> open(
        const std::string& dbPath,
        const ConnectionOptions& options = ConnectionOptions{});

    /**
     * @brief Fresh private in-memory database (tests, dry runs)
     */
    static std::unique_ptr<Connection> inMemory(
        const ConnectionOptions& options = ConnectionOptions{});

    /**
     * @brief Execute SQL without results
     *
     * Accepts several statements separated by semicolons, which is how
     * migration script sections are run.
     *
     * @throws ConstraintException on constraint violations
     * @throws QueryException on any other failure
     */
    void execute(const std::string& sql);

    /**
     * @brief Compile a statement with ? placeholders
     */
    Statement prepare(const std::string& sql);

    Transaction beginTransaction();

    int64_t lastInsertRowId() const;

    /**
     * @brief Rows changed by the most recent INSERT/UPDATE/DELETE
     */
    int changes() const;

    bool tableExists(const std::string& tableName);

    sqlite3* handle() const { return db_; }

    const std::string& path() const { return dbPath_; }

    bool isOpen() const { return db_ != nullptr; }

private:
    void applyOptions(const ConnectionOptions& options);
    void close();

    sqlite3* db_ = nullptr;
    std::string dbPath_;
};

} // namespace sqlmigrate
