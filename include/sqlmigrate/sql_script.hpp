/**
 * @file sql_script.hpp
 * @brief Migrations written as plain SQL files
 *
 *   -- +migrate up
 *   CREATE TABLE users (id INTEGER PRIMARY KEY, name TEXT NOT NULL);
 *
 *   -- +migrate down
 *   DROP TABLE users;
 *
 * Markers are matched case-insensitively on their own line. Text before
 * the first marker is ignored.
 */

#pragma once

#include <optional>
#include <string>
#include "migration.hpp"

namespace sqlmigrate {

struct SqlSections {
    std::string up;
    std::string down;
};

/**
 * @brief Split a migration file into its up and down sections
 * @return std::nullopt if the up marker is missing or a marker repeats
 */
std::optional<SqlSections> parseSqlSections(const std::string& content);

/**
 * @brief MigrationScript that executes SQL sections
 *
 * Each direction runs in its own transaction. SQL errors roll the
 * transaction back and propagate as QueryException. A blank section is
 * a successful no-op.
 */
class SqlScript : public MigrationScript {
public:
    SqlScript(Connection& conn, SqlSections sections);

    bool up() override;
    bool down() override;

    const SqlSections& sections() const { return sections_; }

private:
    void run(const std::string& sql);

    Connection& conn_;
    SqlSections sections_;
};

} // namespace sqlmigrate
