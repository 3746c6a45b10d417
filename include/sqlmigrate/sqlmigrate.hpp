/**
 * @file sqlmigrate.hpp
 * @brief Main include file for the sqlmigrate library
 *
 * Include everything:
 *   #include <sqlmigrate/sqlmigrate.hpp>
 * Or only what is needed:
 *   #include <sqlmigrate/migrator.hpp>
 */

#pragma once

#include "exceptions.hpp"
#include "log.hpp"
#include "connection.hpp"
#include "statement.hpp"
#include "transaction.hpp"
#include "migration.hpp"
#include "ledger_store.hpp"
#include "sql_script.hpp"
#include "script_store.hpp"
#include "migrator.hpp"
#include "migration_lock.hpp"
#include "scaffolder.hpp"
#include "config.hpp"
#include "cli.hpp"

/**
 * @namespace sqlmigrate
 * @brief Timestamped schema migrations for SQLite
 */
namespace sqlmigrate {

constexpr int VERSION_MAJOR = 1;
constexpr int VERSION_MINOR = 0;
constexpr int VERSION_PATCH = 0;
constexpr const char* VERSION_STRING = "1.0.0";

/**
 * @brief Get SQLite library version
 */
inline const char* sqliteVersion() {
    return sqlite3_libversion();
}

} // namespace sqlmigrate
