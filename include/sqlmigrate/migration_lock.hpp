/**
 * @file migration_lock.hpp
 * @brief Single-runner guard for the migration ledger
 *
 * The Migrator assumes a single writer. Runners that may race (two
 * deploys against one database) hold a MigrationLock for the duration
 * of a migrate or rollback:
 *
 *   MigrationLock lock(*conn, ledger.table());   // throws LockException if held
 *   migrator.runPending();
 *                                                // released on scope exit
 *
 * The lock is a single row in "<ledger table>_lock". A runner killed
 * while holding it leaves the row behind; clear() removes it.
 */

#pragma once

#include <optional>
#include <string>
#include "connection.hpp"

namespace sqlmigrate {

class MigrationLock {
public:
    /**
     * @brief Acquire the lock
     * @param conn Connection to the ledger database; must outlive the lock
     * @param ledgerTable Ledger table name the lock table is named after
     * @param owner Free-form description of the holder
     * @throws LockException if another runner holds the lock
     * @throws ConfigException if ledgerTable is not a valid table name
     */
    MigrationLock(Connection& conn, const std::string& ledgerTable,
                  const std::string& owner = defaultOwner());

    /**
     * @brief Releases the lock if still held; never throws
     */
    ~MigrationLock();

    MigrationLock(const MigrationLock&) = delete;
    MigrationLock& operator=(const MigrationLock&) = delete;

    void release();

    bool isHeld() const { return held_; }

    const std::string& lockTable() const { return lockTable_; }

    /**
     * @brief Current holder, if the lock is taken
     */
    static std::optional<std::string> holder(Connection& conn, const std::string& ledgerTable);

    /**
     * @brief Remove a stale lock
     * @return true if a lock row was removed
     */
    static bool clear(Connection& conn, const std::string& ledgerTable);

    /**
     * @brief "pid <n>"
     */
    static std::string defaultOwner();

private:
    static std::string lockTableFor(const std::string& ledgerTable);
    static void ensureLockTable(Connection& conn, const std::string& lockTable);

    Connection& conn_;
    std::string lockTable_;
    bool held_ = false;
};

} // namespace sqlmigrate
