/**
 * @file config.hpp
 * @brief Migrator configuration
 *
 *   MigratorConfig config = MigratorConfig::fromEnvironment();
 *   config.migrationsDir = "db/migrations";
 *   config.validate();
 */

#pragma once

#include <string>
#include "connection.hpp"

namespace sqlmigrate {

struct MigratorConfig {
    // SQLite database holding both the ledger and the migrated schema
    std::string databasePath = "migrations.sqlite";

    std::string migrationsDir = "migrations";

    // Ledger table; the lock table is "<table>_lock"
    std::string table = "migrations";

    // Extra *.template files; empty means built-in templates only
    std::string templatesDir;

    std::string extension = ".sql";

    ConnectionOptions connection;

    /**
     * @brief Defaults overridden by environment variables
     *
     * SQLMIGRATE_DATABASE, SQLMIGRATE_DIR, SQLMIGRATE_TABLE,
     * SQLMIGRATE_TEMPLATES_DIR
     */
    static MigratorConfig fromEnvironment();

    /**
     * @throws ConfigException describing the first invalid field
     */
    void validate() const;
};

} // namespace sqlmigrate
