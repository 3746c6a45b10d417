/**
 * @file migration_lock.cpp
 * @brief MigrationLock implementation
 */

#include "sqlmigrate/migration_lock.hpp"
#include "sqlmigrate/ledger_store.hpp"
#include "sqlmigrate/statement.hpp"
#include "sqlmigrate/transaction.hpp"
#include "sqlmigrate/log.hpp"
#include <unistd.h>

namespace sqlmigrate {

std::string MigrationLock::defaultOwner() {
    return "pid " + std::to_string(static_cast<long>(::getpid()));
}

std::string MigrationLock::lockTableFor(const std::string& ledgerTable) {
    if (!isValidTableName(ledgerTable)) {
        throw ConfigException("Invalid ledger table name '" + ledgerTable + "'");
    }
    return ledgerTable + "_lock";
}

void MigrationLock::ensureLockTable(Connection& conn, const std::string& lockTable) {
    conn.execute(
        "CREATE TABLE IF NOT EXISTS " + lockTable + " ("
        "id INTEGER PRIMARY KEY CHECK (id = 1), "
        "owner TEXT NOT NULL, "
        "acquired_at INTEGER NOT NULL DEFAULT (strftime('%s', 'now')))");
}

MigrationLock::MigrationLock(Connection& conn, const std::string& ledgerTable,
                             const std::string& owner)
    : conn_(conn)
    , lockTable_(lockTableFor(ledgerTable))
{
    // IMMEDIATE takes the write lock up front so two runners cannot both
    // see an empty lock table
    Transaction txn(conn_, TransactionType::Immediate);
    ensureLockTable(conn_, lockTable_);

    try {
        auto stmt = conn_.prepare("INSERT INTO " + lockTable_ + " (id, owner) VALUES (1, ?)");
        stmt.bind(1, owner).execute();
    } catch (const ConstraintException&) {
        auto current = conn_.prepare("SELECT owner FROM " + lockTable_ + " WHERE id = 1");
        std::string heldBy = current.step() ? current.columnString(0) : "unknown";
        throw LockException("migrations are locked by " + heldBy +
                            " (remove a stale lock with 'unlock')");
    }

    txn.commit();
    held_ = true;
    log::debug("Acquired migration lock {} as {}", lockTable_, owner);
}

MigrationLock::~MigrationLock() {
    if (!held_) {
        return;
    }
    try {
        release();
    } catch (const std::exception& e) {
        log::warn("Failed to release migration lock {}: {}", lockTable_, e.what());
    }
}

void MigrationLock::release() {
    if (!held_) {
        return;
    }
    conn_.execute("DELETE FROM " + lockTable_ + " WHERE id = 1");
    held_ = false;
    log::debug("Released migration lock {}", lockTable_);
}

std::optional<std::string> MigrationLock::holder(Connection& conn, const std::string& ledgerTable) {
    std::string lockTable = lockTableFor(ledgerTable);
    if (!conn.tableExists(lockTable)) {
        return std::nullopt;
    }
    auto stmt = conn.prepare("SELECT owner FROM " + lockTable + " WHERE id = 1");
    if (!stmt.step()) {
        return std::nullopt;
    }
    return stmt.columnString(0);
}

bool MigrationLock::clear(Connection& conn, const std::string& ledgerTable) {
    std::string lockTable = lockTableFor(ledgerTable);
    if (!conn.tableExists(lockTable)) {
        return false;
    }
    conn.execute("DELETE FROM " + lockTable + " WHERE id = 1");
    bool removed = conn.changes() > 0;
    if (removed) {
        log::warn("Cleared migration lock {}", lockTable);
    }
    return removed;
}

} // namespace sqlmigrate
