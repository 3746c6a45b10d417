/**
 * @file ledger_store.cpp
 * @brief SqliteLedgerStore implementation
 */

#include "sqlmigrate/ledger_store.hpp"
#include "sqlmigrate/statement.hpp"
#include "sqlmigrate/transaction.hpp"
#include "sqlmigrate/log.hpp"
#include <cctype>

namespace sqlmigrate {

bool isValidTableName(const std::string& name) {
    if (name.empty()) {
        return false;
    }
    if (!std::isalpha(static_cast<unsigned char>(name[0])) && name[0] != '_') {
        return false;
    }
    for (char c : name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') {
            return false;
        }
    }
    return true;
}

SqliteLedgerStore::SqliteLedgerStore(Connection& conn, std::string table)
    : conn_(conn)
    , table_(std::move(table))
{
    if (!isValidTableName(table_)) {
        throw ConfigException("Invalid ledger table name '" + table_ + "'");
    }
}

bool SqliteLedgerStore::exists() {
    return conn_.tableExists(table_);
}

void SqliteLedgerStore::initialize() {
    Transaction txn(conn_);
    conn_.execute(
        "CREATE TABLE " + table_ + " ("
        "id INTEGER PRIMARY KEY AUTOINCREMENT, "
        "migration TEXT NOT NULL)");
    conn_.execute(
        "CREATE UNIQUE INDEX " + table_ + "_migration_index ON " + table_ + " (migration)");
    txn.commit();

    log::info("Created migration ledger table {}", table_);
}

std::vector<std::string> SqliteLedgerStore::listApplied() {
    auto stmt = conn_.prepare("SELECT migration FROM " + table_ + " ORDER BY id ASC");

    std::vector<std::string> applied;
    while (stmt.step()) {
        applied.push_back(stmt.columnString(0));
    }
    return applied;
}

void SqliteLedgerStore::recordApplied(const std::string& identifier) {
    try {
        auto stmt = conn_.prepare("INSERT INTO " + table_ + " (migration) VALUES (?)");
        stmt.bind(1, identifier).execute();
    } catch (const DatabaseException& e) {
        throw LedgerWriteException(e.message(), identifier, e.errorCode());
    }

    log::debug("Ledger: recorded {}", identifier);
}

void SqliteLedgerStore::removeApplied(const std::string& identifier) {
    try {
        auto stmt = conn_.prepare("DELETE FROM " + table_ + " WHERE migration = ?");
        stmt.bind(1, identifier).execute();
    } catch (const DatabaseException& e) {
        throw LedgerWriteException(e.message(), identifier, e.errorCode());
    }

    if (conn_.changes() == 0) {
        log::debug("Ledger: {} was not recorded, nothing removed", identifier);
    } else {
        log::debug("Ledger: removed {}", identifier);
    }
}

} // namespace sqlmigrate
