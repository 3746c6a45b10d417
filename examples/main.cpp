/**
 * @file main.cpp
 * @brief Embedding sqlmigrate in an application
 *
 * This example shows:
 * 1. Compiled migrations registered under their derived type names
 * 2. SQL migrations scaffolded from templates
 * 3. Running pending migrations and reading the ledger
 * 4. Fail-fast behavior and resuming after a fix
 * 5. Rollback
 * 6. Reusing the command-line front end with the application's registry
 *
 * Run without arguments for the demo. With arguments the program acts
 * as the sqlmigrate tool, with the compiled migrations below available:
 *
 *   sqlmigrate_example -d app.sqlite -m migrations status
 */

#include <filesystem>
#include <fstream>
#include <iostream>
#include <unistd.h>
#include "sqlmigrate/sqlmigrate.hpp"

using namespace sqlmigrate;
namespace fs = std::filesystem;

// ========== Compiled Migrations ==========
// Each class name is the type name derived from its file's identifier.

const char* const SEED_ROLES_ID = "2024_03_01_090000_000000_seed_roles";

class SeedRoles2024_03_01_090000_000000 : public MigrationScript {
public:
    explicit SeedRoles2024_03_01_090000_000000(Connection& conn) : conn_(conn) {}

    bool up() override {
        Transaction txn = conn_.beginTransaction();
        auto stmt = conn_.prepare("INSERT INTO roles (name) VALUES (?)");
        for (const char* role : {"admin", "editor", "viewer"}) {
            stmt.bind(1, role).execute();
        }
        txn.commit();
        return true;
    }

    bool down() override {
        conn_.execute("DELETE FROM roles WHERE name IN ('admin', 'editor', 'viewer')");
        return true;
    }

private:
    Connection& conn_;
};

const char* const BACKFILL_ID = "2024_03_02_090000_000000_backfill_role_ids";

// Fails until the application has a default role configured
bool g_defaultRoleConfigured = false;

MigrationRegistry createRegistry() {
    MigrationRegistry registry;

    registry.add<SeedRoles2024_03_01_090000_000000>(migrationTypeName(SEED_ROLES_ID));

    registry.add(migrationTypeName(BACKFILL_ID), [](Connection& conn) -> std::unique_ptr<MigrationScript> {
        return std::make_unique<FunctionMigration>(conn,
            [](Connection& db) {
                if (!g_defaultRoleConfigured) {
                    return false;
                }
                db.execute("UPDATE users SET role_id = (SELECT id FROM roles WHERE name = 'viewer') "
                           "WHERE role_id IS NULL");
                return true;
            },
            [](Connection& db) {
                db.execute("UPDATE users SET role_id = NULL");
                return true;
            });
    });

    return registry;
}

// ========== Demo Functions ==========

void printSection(const std::string& title) {
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << " " << title << "\n";
    std::cout << std::string(60, '=') << "\n\n";
}

void printStatus(Migrator& migrator) {
    for (const auto& entry : migrator.status()) {
        std::cout << "  [" << (entry.applied ? "applied" : "pending") << "] "
                  << entry.identifier << "\n";
    }
}

void touch(const std::string& path) {
    std::ofstream file(path);
    file << "-- compiled into the application\n";
}

void scaffoldMigrations(const std::string& directory) {
    printSection("Scaffolding");

    TemplateCollection templates;
    Scaffolder scaffolder(templates);
    MigrationCreator creator(scaffolder, directory);

    auto base = std::chrono::system_clock::from_time_t(1709283600);  // 2024-03-01 09:00:00 UTC

    auto roles = creator.create("create_roles_table", "create_table", {{"table", "roles"}},
                                base - std::chrono::hours(2));
    std::ofstream rolesFile(creator.pathFor(roles));
    rolesFile <<
        "-- +migrate up\n"
        "CREATE TABLE roles (id INTEGER PRIMARY KEY AUTOINCREMENT, name TEXT NOT NULL UNIQUE);\n"
        "-- +migrate down\n"
        "DROP TABLE roles;\n";
    rolesFile.close();

    auto users = creator.create("create_users_table", "create_table", {{"table", "users"}},
                                base - std::chrono::hours(1));
    auto roleColumn = creator.create("add_role_id", "add_column",
                                     {{"table", "users"}, {"column", "role_id"}, {"type", "INTEGER"}},
                                     base - std::chrono::minutes(30));

    touch(migrationFilePath(directory, SEED_ROLES_ID, FileScriptStore::DEFAULT_EXTENSION));
    touch(migrationFilePath(directory, BACKFILL_ID, FileScriptStore::DEFAULT_EXTENSION));

    for (const auto& id : {roles, users, roleColumn}) {
        std::cout << "  created " << id << "\n";
    }
    std::cout << "\n  add_role_id was rendered as:\n\n" << scaffolder.render("add_column",
        {{"className", migrationTypeName(roleColumn)}, {"table", "users"},
         {"column", "role_id"}, {"type", "INTEGER"}});
}

void demonstrateMigrate(Migrator& migrator) {
    printSection("Running Pending Migrations");

    std::cout << "Before:\n";
    printStatus(migrator);

    try {
        migrator.runPending();
    } catch (const MigrationFailedException& e) {
        std::cout << "\n  Stopped: " << e.what() << "\n";
        std::cout << "  Applied before the failure: " << e.completed().size() << "\n";
    }

    std::cout << "\nConfiguring the default role and running again:\n";
    g_defaultRoleConfigured = true;
    for (const auto& id : migrator.runPending()) {
        std::cout << "  Migrated: " << id << "\n";
    }

    std::cout << "\nAfter:\n";
    printStatus(migrator);
}

void demonstrateRollback(Connection& conn, Migrator& migrator) {
    printSection("Rollback");

    auto last = migrator.lastApplied();
    if (!last) {
        std::cout << "  Nothing to rollback\n";
        return;
    }

    migrator.rollback(*last);
    std::cout << "  Rolled back: " << *last << "\n";

    auto stmt = conn.prepare("SELECT COUNT(*) FROM users WHERE role_id IS NOT NULL");
    stmt.step();
    std::cout << "  Users with a role after rollback: " << stmt.columnInt64(0) << "\n";

    std::cout << "\n  Pending again:\n";
    for (const auto& id : migrator.computePending()) {
        std::cout << "    " << id << "\n";
    }
}

void demonstrateErrorHandling(Migrator& migrator) {
    printSection("Error Handling");

    try {
        migrator.apply("nonexistent_id");
    } catch (const UnresolvableMigrationException& e) {
        std::cout << "  UnresolvableMigrationException caught:\n";
        std::cout << "    " << e.what() << "\n\n";
    }

    try {
        migrator.rollback("2020_01_01_000000_000000_never_applied");
    } catch (const MigrationException& e) {
        std::cout << "  MigrationException caught (base class) for " << e.identifier() << ":\n";
        std::cout << "    " << e.what() << "\n";
    }
}

int main(int argc, char* argv[]) {
    MigrationRegistry registry = createRegistry();

    if (argc > 1) {
        return cliMain(argc, argv, registry);
    }

    log::init_from_env();

    std::cout << "sqlmigrate embedding demo\n";
    std::cout << "SQLite version: " << sqliteVersion() << "\n";
    std::cout << "Library version: " << VERSION_STRING << "\n";

    fs::path workDir = fs::temp_directory_path() / ("sqlmigrate_demo_" + std::to_string(::getpid()));
    int status = 0;

    try {
        fs::create_directories(workDir);
        std::string migrationsDir = (workDir / "migrations").string();

        scaffoldMigrations(migrationsDir);

        auto conn = Connection::open((workDir / "app.sqlite").string());
        SqliteLedgerStore ledger(*conn);
        FileScriptStore scripts(*conn, registry, migrationsDir);
        Migrator migrator(ledger, scripts);

        MigrationLock lock(*conn, ledger.table(), "sqlmigrate demo");

        demonstrateMigrate(migrator);

        // Give the backfill some rows to work on
        conn->execute("INSERT INTO users DEFAULT VALUES");
        conn->execute("INSERT INTO users DEFAULT VALUES");
        migrator.rollback(BACKFILL_ID);
        migrator.apply(BACKFILL_ID);

        demonstrateRollback(*conn, migrator);
        demonstrateErrorHandling(migrator);

        std::cout << "\nDemo completed successfully!\n";

    } catch (const DatabaseException& e) {
        std::cerr << "Database error: " << e.what() << "\n";
        status = 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        status = 1;
    }

    std::error_code ec;
    fs::remove_all(workDir, ec);
    log::flush();
    return status;
}
