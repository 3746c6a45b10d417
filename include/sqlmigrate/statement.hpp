/**
 * @file statement.hpp
 * @brief Prepared statement with chained parameter binding
 *
 *   auto stmt = conn.prepare("INSERT INTO migrations (migration) VALUES (?)");
 *   stmt.bind(1, identifier).execute();
 */

#pragma once

#include <cstdint>
#include <string>
#include <sqlite3.h>
#include "exceptions.hpp"

namespace sqlmigrate {

class Connection;

/**
 * @brief RAII wrapper for sqlite3_stmt
 *
 * Parameters are 1-indexed, columns 0-indexed (SQLite convention).
 * The parent Connection must outlive the statement.
 */
class Statement {
public:
    /**
     * @throws QueryException if the SQL does not compile
     */
    Statement(Connection& conn, const std::string& sql);

    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;

    Statement& bind(int index, int value);
    Statement& bind(int index, int64_t value);
    Statement& bind(int index, const std::string& value);
    Statement& bind(int index, const char* value);
    Statement& bindNull(int index);

    /**
     * @brief Run a statement that returns no rows, then reset it
     * @throws ConstraintException on constraint violations
     * @throws QueryException on any other failure
     */
    void execute();

    /**
     * @brief Advance to the next row
     * @return true if a row is available, false when done
     */
    bool step();

    Statement& reset();

    bool isNull(int index) const;
    int columnInt(int index) const;
    int64_t columnInt64(int index) const;
    std::string columnString(int index) const;

    const std::string& sql() const { return sql_; }

private:
    void checkResult(int result, const std::string& operation);
    void finalize();

    sqlite3_stmt* stmt_ = nullptr;
    Connection* conn_;
    std::string sql_;
};

} // namespace sqlmigrate
