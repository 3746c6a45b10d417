/**
 * @file migration.hpp
 * @brief Migration scripts, the type registry and identifier naming
 *
 * A migration is identified by a sortable token of the form
 *
 *   2023_05_01_101112_123456_add_users_table
 *   └─ date ─┘ └time┘ └usec┘ └──── name ────┘
 *
 * Lexical order of identifiers is creation order. The executable unit
 * behind an identifier is a MigrationScript. Compiled migrations are made
 * available through a MigrationRegistry keyed by the type name derived
 * from the identifier (see migrationTypeName()):
 *
 *   MigrationRegistry registry;
 *   registry.add<AddUsersTable2023_05_01_101112_123456>(
 *       "AddUsersTable2023_05_01_101112_123456");
 */

#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "connection.hpp"

namespace sqlmigrate {

/**
 * @brief One executable migration
 *
 * up() and down() return false to report an explicit failure. Throwing
 * is also treated as failure by the Migrator.
 */
class MigrationScript {
public:
    virtual ~MigrationScript() = default;

    virtual bool up() = 0;

    virtual bool down() = 0;
};

/**
 * @brief MigrationScript built from two callables
 *
 *   registry.add("AddEmail2024_01_02_030405_000001", [](Connection& db) {
 *       return std::make_unique<FunctionMigration>(db,
 *           [](Connection& c) { c.execute("ALTER TABLE users ADD COLUMN email TEXT"); return true; },
 *           [](Connection& c) { c.execute("ALTER TABLE users DROP COLUMN email"); return true; });
 *   });
 *
 * A missing down function makes down() report failure, so the migration
 * stays applied.
 */
class FunctionMigration : public MigrationScript {
public:
    using Step = std::function<bool(Connection&)>;

    FunctionMigration(Connection& conn, Step up, Step down = nullptr)
        : conn_(conn)
        , up_(std::move(up))
        , down_(std::move(down)) {}

    bool up() override {
        return up_ ? up_(conn_) : false;
    }

    bool down() override {
        return down_ ? down_(conn_) : false;
    }

private:
    Connection& conn_;
    Step up_;
    Step down_;
};

using MigrationFactory = std::function<std::unique_ptr<MigrationScript>(Connection&)>;

/**
 * @brief Maps migration type names to factories
 *
 * Filled explicitly by the application before the script store resolves
 * anything; the library never looks up types by name on its own.
 */
class MigrationRegistry {
public:
    MigrationRegistry() = default;

    /**
     * @brief Register a factory under a type name
     * @throws ConfigException on an empty name, null factory or duplicate
     */
    void add(const std::string& typeName, MigrationFactory factory);

    /**
     * @brief Register a MigrationScript subclass constructible from Connection&
     */
    template<typename T>
    void add(const std::string& typeName) {
        add(typeName, [](Connection& conn) -> std::unique_ptr<MigrationScript> {
            return std::make_unique<T>(conn);
        });
    }

    bool contains(const std::string& typeName) const;

    /**
     * @brief Instantiate the script registered under typeName
     * @return nullptr if nothing is registered under that name
     */
    std::unique_ptr<MigrationScript> create(const std::string& typeName, Connection& conn) const;

    std::vector<std::string> names() const;

    size_t size() const { return factories_.size(); }

private:
    std::map<std::string, MigrationFactory> factories_;
};

/**
 * @brief Number of leading identifier segments that form the timestamp
 */
constexpr size_t IDENTIFIER_DATE_SEGMENTS = 5;

/**
 * @brief Derive the migration type name from an identifier
 *
 * The timestamp segments move to the end and the name words are joined
 * with their first letters upper-cased:
 *
 *   2023_05_01_101112_123456_add_users_table
 *     -> AddUsersTable2023_05_01_101112_123456
 *
 * @throws UnresolvableMigrationException if the identifier has no
 *         numeric timestamp prefix or no name part
 */
std::string migrationTypeName(const std::string& identifier);

/**
 * @brief True if name is usable as the name part of an identifier
 *
 * Letters, digits and underscores, with at least one letter or digit.
 */
bool isValidMigrationName(const std::string& name);

/**
 * @brief Timestamp prefix for a point in time, in UTC
 *
 * Format: YYYY_MM_DD_HHMMSS_UUUUUU
 */
std::string formatIdentifierTimestamp(std::chrono::system_clock::time_point when);

/**
 * @brief Parse the timestamp prefix of an identifier back into a time point
 * @return false if the identifier does not start with a valid timestamp
 */
bool parseIdentifierTimestamp(const std::string& identifier,
                              std::chrono::system_clock::time_point& when);

/**
 * @brief Build an identifier from a name and a point in time
 */
std::string constructIdentifier(const std::string& name,
                                 std::chrono::system_clock::time_point when);

} // namespace sqlmigrate
