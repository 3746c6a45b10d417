/**
 * @file config.cpp
 * @brief MigratorConfig loading and validation
 */

#include "sqlmigrate/config.hpp"
#include "sqlmigrate/ledger_store.hpp"
#include <cstdlib>

namespace sqlmigrate {

namespace {

void overrideFromEnv(const char* name, std::string& field) {
    const char* value = std::getenv(name);
    if (value != nullptr && *value != '\0') {
        field = value;
    }
}

} // anonymous namespace

MigratorConfig MigratorConfig::fromEnvironment() {
    MigratorConfig config;
    overrideFromEnv("SQLMIGRATE_DATABASE", config.databasePath);
    overrideFromEnv("SQLMIGRATE_DIR", config.migrationsDir);
    overrideFromEnv("SQLMIGRATE_TABLE", config.table);
    overrideFromEnv("SQLMIGRATE_TEMPLATES_DIR", config.templatesDir);
    return config;
}

void MigratorConfig::validate() const {
    if (databasePath.empty()) {
        throw ConfigException("database path must not be empty");
    }
    if (migrationsDir.empty()) {
        throw ConfigException("migrations directory must not be empty");
    }
    if (!isValidTableName(table)) {
        throw ConfigException("invalid ledger table name '" + table + "'");
    }
    if (extension.size() < 2 || extension[0] != '.') {
        throw ConfigException("migration file extension must start with '.', got '" + extension + "'");
    }
    if (connection.busyTimeoutMs < 0) {
        throw ConfigException("busy timeout must not be negative");
    }
}

} // namespace sqlmigrate
