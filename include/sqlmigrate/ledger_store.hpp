/**
 * @file ledger_store.hpp
 * @brief Durable record of applied migrations
 */

#pragma once

#include <string>
#include <vector>
#include "connection.hpp"

namespace sqlmigrate {

/**
 * @brief Storage for the applied-migration ledger
 *
 * An identifier appears at most once; listApplied() returns identifiers
 * in the order they were recorded.
 */
class LedgerStore {
public:
    virtual ~LedgerStore() = default;

    /**
     * @brief Whether the ledger medium has been created
     */
    virtual bool exists() = 0;

    /**
     * @brief Create the ledger medium
     *
     * Callers check exists() first; calling this twice is an error.
     */
    virtual void initialize() = 0;

    virtual std::vector<std::string> listApplied() = 0;

    /**
     * @brief Append an identifier
     * @throws LedgerWriteException if the write fails
     */
    virtual void recordApplied(const std::string& identifier) = 0;

    /**
     * @brief Remove an identifier; absent identifiers are ignored
     * @throws LedgerWriteException if the write fails
     */
    virtual void removeApplied(const std::string& identifier) = 0;
};

/**
 * @brief Ledger kept in a SQLite table
 *
 *   CREATE TABLE migrations (
 *       id INTEGER PRIMARY KEY AUTOINCREMENT,
 *       migration TEXT NOT NULL
 *   );
 *   CREATE UNIQUE INDEX migrations_migration_index ON migrations (migration);
 *
 * Rows are ordered by id, which is application order.
 */
class SqliteLedgerStore : public LedgerStore {
public:
    static constexpr const char* DEFAULT_TABLE = "migrations";

    /**
     * @param conn Connection holding the ledger table; must outlive the store
     * @param table Ledger table name
     * @throws ConfigException if table is not a plain SQL identifier
     */
    explicit SqliteLedgerStore(Connection& conn, std::string table = DEFAULT_TABLE);

    bool exists() override;
    void initialize() override;
    std::vector<std::string> listApplied() override;
    void recordApplied(const std::string& identifier) override;
    void removeApplied(const std::string& identifier) override;

    const std::string& table() const { return table_; }

private:
    Connection& conn_;
    std::string table_;
};

/**
 * @brief True for [A-Za-z_][A-Za-z0-9_]*
 *
 * Table names are spliced into SQL text, so only plain identifiers are
 * accepted.
 */
bool isValidTableName(const std::string& name);

} // namespace sqlmigrate
