/**
 * @file test_main.cpp
 * @brief Unit tests for the sqlmigrate library
 *
 * Database tests use in-memory connections; file-backed tests get a
 * fresh temporary directory each. Engine tests run against the fakes in
 * fake_script_store.hpp.
 */

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <unistd.h>
#include "sqlmigrate/sqlmigrate.hpp"
#include "fake_script_store.hpp"

using namespace sqlmigrate;
namespace fs = std::filesystem;

// Simple test framework macros
#define TEST(name) void test_##name()
#define RUN_TEST(name) do { \
    std::cout << "  Running " #name "... "; \
    try { \
        test_##name(); \
        std::cout << "PASSED\n"; \
        passed++; \
    } catch (const std::exception& e) { \
        std::cout << "FAILED: " << e.what() << "\n"; \
        failed++; \
    } \
} while(0)

#define ASSERT_TRUE(expr) do { \
    if (!(expr)) throw std::runtime_error("Assertion failed: " #expr); \
} while(0)

#define ASSERT_EQ(a, b) do { \
    if ((a) != (b)) { \
        std::ostringstream oss; \
        oss << "Assertion failed: " << (a) << " != " << (b); \
        throw std::runtime_error(oss.str()); \
    } \
} while(0)

#define ASSERT_THROWS(expr, ExceptionType) do { \
    bool caught = false; \
    try { expr; } catch (const ExceptionType&) { caught = true; } \
    if (!caught) throw std::runtime_error("Expected " #ExceptionType " not thrown"); \
} while(0)

namespace {

// Removed with its contents when the test ends
class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        path_ = fs::temp_directory_path() /
                ("sqlmigrate_test_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
        fs::remove_all(path_);
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    std::string path() const { return path_.string(); }
    std::string file(const std::string& name) const { return (path_ / name).string(); }

private:
    fs::path path_;
};

void writeFile(const std::string& path, const std::string& content) {
    std::ofstream file(path, std::ios::binary);
    file << content;
}

std::string readFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    std::ostringstream content;
    content << file.rdbuf();
    return content.str();
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

std::string join(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += ",";
        out += item;
    }
    return out;
}

int64_t countRows(Connection& conn, const std::string& table) {
    auto stmt = conn.prepare("SELECT COUNT(*) FROM " + table);
    stmt.step();
    return stmt.columnInt64(0);
}

std::chrono::system_clock::time_point at(std::time_t seconds, int64_t micros = 0) {
    return std::chrono::system_clock::from_time_t(seconds) + std::chrono::microseconds(micros);
}

const std::string USERS_ID = "2023_05_01_101112_123456_add_users_table";
const std::string USERS_SQL =
    "-- +migrate up\n"
    "CREATE TABLE users (id INTEGER PRIMARY KEY, name TEXT NOT NULL);\n"
    "-- +migrate down\n"
    "DROP TABLE users;\n";

class AddEmailColumn : public MigrationScript {
public:
    explicit AddEmailColumn(Connection& conn) : conn_(conn) {}

    bool up() override {
        conn_.execute("ALTER TABLE users ADD COLUMN email TEXT");
        return true;
    }

    bool down() override {
        return false;
    }

private:
    Connection& conn_;
};

} // anonymous namespace

// ========== Connection Tests ==========

TEST(connection_open_memory) {
    auto conn = Connection::inMemory();
    ASSERT_TRUE(conn->isOpen());
    ASSERT_EQ(conn->path(), ":memory:");
}

TEST(connection_execute_basic) {
    auto conn = Connection::inMemory();
    conn->execute("CREATE TABLE test (id INTEGER PRIMARY KEY, value TEXT)");
    ASSERT_TRUE(conn->tableExists("test"));
    ASSERT_TRUE(!conn->tableExists("other"));
}

TEST(connection_open_missing_readonly) {
    TempDir dir;
    ConnectionOptions opts;
    opts.readOnly = true;
    opts.createIfNotExists = false;
    ASSERT_THROWS(Connection::open(dir.file("absent.sqlite"), opts), ConnectionException);
}

// ========== Statement Tests ==========

TEST(statement_bind_and_execute) {
    auto conn = Connection::inMemory();
    conn->execute("CREATE TABLE test (id INTEGER PRIMARY KEY, name TEXT)");

    auto stmt = conn->prepare("INSERT INTO test (name) VALUES (?)");
    stmt.bind(1, "Hello").execute();

    ASSERT_EQ(conn->lastInsertRowId(), 1);
    ASSERT_EQ(conn->changes(), 1);
}

TEST(statement_query_results) {
    auto conn = Connection::inMemory();
    conn->execute("CREATE TABLE test (id INTEGER PRIMARY KEY, name TEXT, value INTEGER)");
    conn->execute("INSERT INTO test (name, value) VALUES ('test', 42)");

    auto stmt = conn->prepare("SELECT * FROM test WHERE id = ?");
    stmt.bind(1, 1);

    ASSERT_TRUE(stmt.step());
    ASSERT_EQ(stmt.columnInt64(0), 1);
    ASSERT_EQ(stmt.columnString(1), "test");
    ASSERT_EQ(stmt.columnInt(2), 42);
    ASSERT_TRUE(!stmt.step());
}

TEST(statement_null_handling) {
    auto conn = Connection::inMemory();
    conn->execute("CREATE TABLE test (id INTEGER PRIMARY KEY, value TEXT)");

    auto stmt = conn->prepare("INSERT INTO test (value) VALUES (?)");
    stmt.bindNull(1).execute();

    stmt = conn->prepare("SELECT value FROM test WHERE id = 1");
    stmt.step();
    ASSERT_TRUE(stmt.isNull(0));
}

// ========== Transaction Tests ==========

TEST(transaction_commit) {
    auto conn = Connection::inMemory();
    conn->execute("CREATE TABLE test (id INTEGER PRIMARY KEY)");

    {
        Transaction txn = conn->beginTransaction();
        conn->execute("INSERT INTO test DEFAULT VALUES");
        txn.commit();
    }

    ASSERT_EQ(countRows(*conn, "test"), 1);
}

TEST(transaction_rollback) {
    auto conn = Connection::inMemory();
    conn->execute("CREATE TABLE test (id INTEGER PRIMARY KEY)");

    {
        Transaction txn = conn->beginTransaction();
        conn->execute("INSERT INTO test DEFAULT VALUES");
        // No commit - destructor will rollback
    }

    ASSERT_EQ(countRows(*conn, "test"), 0);
}

TEST(transaction_explicit_rollback) {
    auto conn = Connection::inMemory();
    conn->execute("CREATE TABLE test (id INTEGER PRIMARY KEY)");

    Transaction txn(*conn, TransactionType::Immediate);
    conn->execute("INSERT INTO test DEFAULT VALUES");
    txn.rollback();

    ASSERT_TRUE(!txn.isActive());
    ASSERT_EQ(countRows(*conn, "test"), 0);
}

// ========== Naming Tests ==========

TEST(type_name_from_identifier) {
    ASSERT_EQ(migrationTypeName(USERS_ID), "AddUsersTable2023_05_01_101112_123456");
    ASSERT_EQ(migrationTypeName("2024_01_02_030405_000001_x"), "X2024_01_02_030405_000001");
}

TEST(type_name_rejects_bad_identifiers) {
    ASSERT_THROWS(migrationTypeName("nonexistent_id"), UnresolvableMigrationException);
    ASSERT_THROWS(migrationTypeName("2023_05_01_101112_123456"), UnresolvableMigrationException);
    ASSERT_THROWS(migrationTypeName("2023_5_01_101112_123456_short_month"), UnresolvableMigrationException);
}

TEST(identifier_timestamp_utc) {
    // 2023-05-01 10:11:12 UTC
    auto when = at(1682935872, 123456);
    ASSERT_EQ(formatIdentifierTimestamp(when), "2023_05_01_101112_123456");
    ASSERT_EQ(constructIdentifier("add_users_table", when), USERS_ID);

    std::chrono::system_clock::time_point parsed;
    ASSERT_TRUE(parseIdentifierTimestamp(USERS_ID, parsed));
    ASSERT_TRUE(parsed == when);
    ASSERT_TRUE(!parseIdentifierTimestamp("nonexistent_id", parsed));
}

TEST(migration_name_validation) {
    ASSERT_TRUE(isValidMigrationName("add_users_table"));
    ASSERT_TRUE(isValidMigrationName("v2"));
    ASSERT_TRUE(!isValidMigrationName(""));
    ASSERT_TRUE(!isValidMigrationName("___"));
    ASSERT_TRUE(!isValidMigrationName("add-users"));
    ASSERT_TRUE(!isValidMigrationName("../escape"));
}

// ========== Registry Tests ==========

TEST(registry_add_and_create) {
    auto conn = Connection::inMemory();
    MigrationRegistry registry;
    registry.add<AddEmailColumn>("AddEmail2024_01_01_000000_000000");
    registry.add("Noop2024_01_02_000000_000000", [](Connection& c) -> std::unique_ptr<MigrationScript> {
        return std::make_unique<FunctionMigration>(c, [](Connection&) { return true; });
    });

    ASSERT_EQ(registry.size(), 2u);
    ASSERT_TRUE(registry.contains("AddEmail2024_01_01_000000_000000"));
    ASSERT_TRUE(registry.create("Missing2024_01_01_000000_000000", *conn) == nullptr);

    auto noop = registry.create("Noop2024_01_02_000000_000000", *conn);
    ASSERT_TRUE(noop != nullptr);
    ASSERT_TRUE(noop->up());
    ASSERT_TRUE(!noop->down());  // no down step
}

TEST(registry_rejects_duplicates) {
    MigrationRegistry registry;
    registry.add<AddEmailColumn>("AddEmail2024_01_01_000000_000000");
    ASSERT_THROWS(registry.add<AddEmailColumn>("AddEmail2024_01_01_000000_000000"), ConfigException);
    ASSERT_THROWS(registry.add("", MigrationFactory{}), ConfigException);
    ASSERT_THROWS(registry.add("Null2024_01_01_000000_000000", MigrationFactory{}), ConfigException);
}

// ========== Ledger Store Tests ==========

TEST(ledger_initialize) {
    auto conn = Connection::inMemory();
    SqliteLedgerStore ledger(*conn);

    ASSERT_TRUE(!ledger.exists());
    ledger.initialize();
    ASSERT_TRUE(ledger.exists());
    ASSERT_TRUE(conn->tableExists("migrations"));
    ASSERT_TRUE(ledger.listApplied().empty());
}

TEST(ledger_application_order) {
    auto conn = Connection::inMemory();
    SqliteLedgerStore ledger(*conn, "schema_log");
    ledger.initialize();

    // Application order, not lexical order
    ledger.recordApplied("2024_02_01_000000_000000_b");
    ledger.recordApplied("2024_01_01_000000_000000_a");
    ASSERT_EQ(join(ledger.listApplied()), "2024_02_01_000000_000000_b,2024_01_01_000000_000000_a");

    ledger.removeApplied("2024_02_01_000000_000000_b");
    ledger.removeApplied("never_recorded");
    ASSERT_EQ(join(ledger.listApplied()), "2024_01_01_000000_000000_a");
}

TEST(ledger_duplicate_write_fails) {
    auto conn = Connection::inMemory();
    SqliteLedgerStore ledger(*conn);
    ledger.initialize();
    ledger.recordApplied(USERS_ID);

    ASSERT_THROWS(ledger.recordApplied(USERS_ID), LedgerWriteException);
    ASSERT_EQ(ledger.listApplied().size(), 1u);
}

TEST(ledger_write_without_table_fails) {
    auto conn = Connection::inMemory();
    SqliteLedgerStore ledger(*conn);
    ASSERT_THROWS(ledger.recordApplied(USERS_ID), LedgerWriteException);
}

TEST(ledger_rejects_bad_table_name) {
    auto conn = Connection::inMemory();
    ASSERT_THROWS(SqliteLedgerStore(*conn, "migrations; DROP TABLE users"), ConfigException);
    ASSERT_TRUE(isValidTableName("_schema_2"));
    ASSERT_TRUE(!isValidTableName("2schema"));
    ASSERT_TRUE(!isValidTableName(""));
}

// ========== Engine Tests ==========

TEST(pending_is_scripts_minus_applied) {
    FakeScriptStore scripts;
    FakeLedgerStore ledger;
    scripts.add("a");
    scripts.add("b");
    scripts.add("c");
    scripts.add("d");
    ledger.created = true;
    ledger.rows = {"c", "a"};

    Migrator migrator(ledger, scripts);
    auto first = migrator.computePending();
    ASSERT_EQ(join(first), "b,d");

    // Repeatable and side-effect free
    ASSERT_TRUE(migrator.computePending() == first);
    ASSERT_EQ(join(ledger.rows), "c,a");
    ASSERT_EQ(scripts.load_calls, 0);
}

TEST(pending_without_ledger) {
    FakeScriptStore scripts;
    FakeLedgerStore ledger;
    scripts.add("a");

    Migrator migrator(ledger, scripts);
    ASSERT_EQ(join(migrator.computePending()), "a");
    ASSERT_EQ(ledger.initialize_calls, 0);
}

TEST(install_once) {
    FakeScriptStore scripts;
    FakeLedgerStore ledger;
    Migrator migrator(ledger, scripts);

    ASSERT_TRUE(migrator.install());
    ASSERT_TRUE(!migrator.install());
    ASSERT_EQ(ledger.initialize_calls, 1);
}

TEST(apply_success) {
    FakeScriptStore scripts;
    FakeLedgerStore ledger;
    scripts.add("a");
    Migrator migrator(ledger, scripts);

    migrator.apply("a");

    ASSERT_EQ(join(migrator.listApplied()), "a");
    ASSERT_TRUE(migrator.computePending().empty());
    ASSERT_EQ(join(scripts.calls), "up:a");
    ASSERT_EQ(*migrator.lastApplied(), "a");
}

TEST(apply_failure_leaves_ledger) {
    FakeScriptStore scripts;
    FakeLedgerStore ledger;
    scripts.add("a", {Outcome::ReturnFalse});
    scripts.add("b", {Outcome::Throw});
    Migrator migrator(ledger, scripts);

    ASSERT_THROWS(migrator.apply("a"), MigrationFailedException);
    ASSERT_THROWS(migrator.apply("b"), MigrationFailedException);

    ASSERT_TRUE(migrator.listApplied().empty());
    ASSERT_EQ(join(migrator.computePending()), "a,b");
}

TEST(apply_already_applied) {
    FakeScriptStore scripts;
    FakeLedgerStore ledger;
    scripts.add("a");
    Migrator migrator(ledger, scripts);
    migrator.apply("a");

    ASSERT_THROWS(migrator.apply("a"), MigrationFailedException);
    ASSERT_EQ(join(ledger.rows), "a");
    ASSERT_EQ(join(scripts.calls), "up:a");
}

TEST(apply_ledger_write_error_propagates) {
    FakeScriptStore scripts;
    FakeLedgerStore ledger;
    scripts.add("a");
    ledger.created = true;
    ledger.fail_writes = true;
    Migrator migrator(ledger, scripts);

    ASSERT_THROWS(migrator.apply("a"), LedgerWriteException);
    ASSERT_EQ(join(scripts.calls), "up:a");
}

TEST(rollback_success) {
    FakeScriptStore scripts;
    FakeLedgerStore ledger;
    scripts.add("a");
    scripts.add("b");
    Migrator migrator(ledger, scripts);
    migrator.runPending();

    migrator.rollback("b");

    ASSERT_EQ(join(migrator.listApplied()), "a");
    ASSERT_EQ(join(migrator.computePending()), "b");
    ASSERT_EQ(join(scripts.calls), "up:a,up:b,down:b");
}

TEST(rollback_failure_keeps_entry) {
    FakeScriptStore scripts;
    FakeLedgerStore ledger;
    scripts.add("a", {Outcome::Succeed, Outcome::ReturnFalse});
    scripts.add("b", {Outcome::Succeed, Outcome::Throw});
    Migrator migrator(ledger, scripts);
    migrator.runPending();

    ASSERT_THROWS(migrator.rollback("a"), RollbackFailedException);
    ASSERT_THROWS(migrator.rollback("b"), RollbackFailedException);
    ASSERT_EQ(join(migrator.listApplied()), "a,b");
}

TEST(rollback_not_applied) {
    FakeScriptStore scripts;
    FakeLedgerStore ledger;
    scripts.add("a");
    Migrator migrator(ledger, scripts);

    ASSERT_THROWS(migrator.rollback("a"), RollbackFailedException);
    ASSERT_TRUE(scripts.calls.empty());
}

TEST(run_pending_fail_fast_then_resume) {
    FakeScriptStore scripts;
    FakeLedgerStore ledger;
    scripts.add("A");
    scripts.add("B", {Outcome::ReturnFalse});
    scripts.add("C");
    Migrator migrator(ledger, scripts);

    bool caught = false;
    try {
        migrator.runPending();
    } catch (const MigrationFailedException& e) {
        caught = true;
        ASSERT_EQ(e.identifier(), "B");
        ASSERT_EQ(join(e.completed()), "A");
    }
    ASSERT_TRUE(caught);
    ASSERT_EQ(join(ledger.rows), "A");
    ASSERT_EQ(join(scripts.calls), "up:A,up:B");

    scripts.add("B");
    scripts.calls.clear();
    auto ran = migrator.runPending();

    ASSERT_EQ(join(ran), "B,C");
    ASSERT_EQ(join(scripts.calls), "up:B,up:C");
    ASSERT_EQ(join(ledger.rows), "A,B,C");
    ASSERT_TRUE(migrator.runPending().empty());
}

TEST(resolve_unresolvable) {
    FakeScriptStore scripts;
    FakeLedgerStore ledger;
    scripts.add("a");
    scripts.unloadable = {"a"};
    Migrator migrator(ledger, scripts);

    ASSERT_THROWS(migrator.resolveScript("nonexistent_id"), UnresolvableMigrationException);
    ASSERT_THROWS(migrator.apply("nonexistent_id"), UnresolvableMigrationException);
    ASSERT_THROWS(migrator.resolveScript("a"), UnresolvableMigrationException);

    ASSERT_TRUE(!ledger.created);
    ASSERT_TRUE(ledger.rows.empty());
}

TEST(run_pending_unresolvable_reports_progress) {
    FakeScriptStore scripts;
    FakeLedgerStore ledger;
    scripts.add("a");
    scripts.add("b");
    scripts.unloadable = {"b"};
    Migrator migrator(ledger, scripts);

    bool caught = false;
    try {
        migrator.runPending();
    } catch (const UnresolvableMigrationException& e) {
        caught = true;
        ASSERT_EQ(join(e.completed()), "a");
    }
    ASSERT_TRUE(caught);
    ASSERT_EQ(join(ledger.rows), "a");
}

TEST(status_lists_missing_scripts) {
    FakeScriptStore scripts;
    FakeLedgerStore ledger;
    scripts.add("a");
    scripts.add("b");
    ledger.created = true;
    ledger.rows = {"a", "gone"};
    Migrator migrator(ledger, scripts);

    auto entries = migrator.status();
    ASSERT_EQ(entries.size(), 3u);
    ASSERT_TRUE(entries[0].identifier == "a" && entries[0].applied && entries[0].fileExists);
    ASSERT_TRUE(entries[1].identifier == "b" && !entries[1].applied);
    ASSERT_TRUE(entries[2].identifier == "gone" && entries[2].applied && !entries[2].fileExists);
    ASSERT_TRUE(!migrator.doesMigrationFileExist("gone"));
}

// ========== SQL Script Tests ==========

TEST(sql_sections_parse) {
    auto sections = parseSqlSections(
        "-- AddUsersTable2023_05_01_101112_123456\n"
        "--   +MIGRATE Up  \n"
        "CREATE TABLE users (id INTEGER);\n"
        "-- +migrate down\n"
        "DROP TABLE users;\n");

    ASSERT_TRUE(sections.has_value());
    ASSERT_EQ(sections->up, "CREATE TABLE users (id INTEGER);\n");
    ASSERT_EQ(sections->down, "DROP TABLE users;\n");
}

TEST(sql_sections_malformed) {
    ASSERT_TRUE(!parseSqlSections("CREATE TABLE users (id INTEGER);\n").has_value());
    ASSERT_TRUE(!parseSqlSections("-- +migrate down\nDROP TABLE users;\n").has_value());
    ASSERT_TRUE(!parseSqlSections("-- +migrate up\n-- +migrate up\n").has_value());

    auto upOnly = parseSqlSections("-- +migrate up\nSELECT 1;\n");
    ASSERT_TRUE(upOnly.has_value());
    ASSERT_TRUE(upOnly->down.empty());
}

TEST(sql_script_runs_in_transaction) {
    auto conn = Connection::inMemory();
    SqlScript script(*conn, {
        "CREATE TABLE t (id INTEGER);\nINSERT INTO t VALUES (1);\nINSERT INTO missing VALUES (1);\n",
        ""});

    ASSERT_THROWS(script.up(), QueryException);
    ASSERT_TRUE(!conn->tableExists("t"));
    ASSERT_TRUE(script.down());  // blank section
}

// ========== File Script Store Tests ==========

TEST(file_store_lists_sorted) {
    TempDir dir;
    writeFile(dir.file("2024_01_02_000000_000000_second.sql"), USERS_SQL);
    writeFile(dir.file("2024_01_01_000000_000000_first.sql"), USERS_SQL);
    writeFile(dir.file("README.md"), "not a migration");

    auto conn = Connection::inMemory();
    MigrationRegistry registry;
    FileScriptStore scripts(*conn, registry, dir.path());

    ASSERT_EQ(join(scripts.listAll()),
              "2024_01_01_000000_000000_first,2024_01_02_000000_000000_second");
    ASSERT_TRUE(scripts.exists("2024_01_01_000000_000000_first"));
    ASSERT_TRUE(!scripts.exists("README"));

    FileScriptStore missing(*conn, registry, dir.file("nowhere"));
    ASSERT_TRUE(missing.listAll().empty());
}

TEST(file_store_loads_sql) {
    TempDir dir;
    writeFile(dir.file(USERS_ID + ".sql"), USERS_SQL);

    auto conn = Connection::inMemory();
    MigrationRegistry registry;
    FileScriptStore scripts(*conn, registry, dir.path());

    auto script = scripts.load(USERS_ID);
    ASSERT_TRUE(script->up());
    ASSERT_TRUE(conn->tableExists("users"));
    ASSERT_TRUE(script->down());
    ASSERT_TRUE(!conn->tableExists("users"));
}

TEST(file_store_prefers_registered_type) {
    TempDir dir;
    const std::string id = "2023_05_02_000000_000000_add_email_column";
    writeFile(dir.file(id + ".sql"), "-- compiled into the application\n");

    auto conn = Connection::inMemory();
    conn->execute("CREATE TABLE users (id INTEGER PRIMARY KEY)");
    MigrationRegistry registry;
    registry.add<AddEmailColumn>("AddEmailColumn2023_05_02_000000_000000");
    FileScriptStore scripts(*conn, registry, dir.path());

    auto script = scripts.load(id);
    ASSERT_TRUE(script->up());
    conn->execute("INSERT INTO users (email) VALUES ('a@example.com')");
}

TEST(file_store_unresolvable) {
    TempDir dir;
    writeFile(dir.file("2023_05_02_000000_000000_plain.sql"), "SELECT 1;\n");
    writeFile(dir.file("no_timestamp.sql"), USERS_SQL);

    auto conn = Connection::inMemory();
    MigrationRegistry registry;
    FileScriptStore scripts(*conn, registry, dir.path());

    ASSERT_THROWS(scripts.load("2023_05_02_000000_000000_plain"), UnresolvableMigrationException);
    ASSERT_THROWS(scripts.load("no_timestamp"), UnresolvableMigrationException);
    ASSERT_THROWS(scripts.load("2023_05_02_000000_000000_absent"), UnresolvableMigrationException);
}

TEST(migrator_end_to_end) {
    TempDir dir;
    writeFile(dir.file(USERS_ID + ".sql"), USERS_SQL);
    writeFile(dir.file("2023_05_02_000000_000000_add_email_column.sql"), "");

    auto conn = Connection::inMemory();
    MigrationRegistry registry;
    registry.add<AddEmailColumn>("AddEmailColumn2023_05_02_000000_000000");
    SqliteLedgerStore ledger(*conn);
    FileScriptStore scripts(*conn, registry, dir.path());
    Migrator migrator(ledger, scripts);

    auto ran = migrator.runPending();
    ASSERT_EQ(ran.size(), 2u);
    ASSERT_EQ(countRows(*conn, "migrations"), 2);

    // AddEmailColumn cannot be reverted
    ASSERT_THROWS(migrator.rollback(ran[1]), RollbackFailedException);
    ASSERT_EQ(countRows(*conn, "migrations"), 2);
}

// ========== Scaffolder Tests ==========

TEST(placeholders_replaced_verbatim) {
    std::string out = Scaffolder::replacePlaceholders(
        "CREATE TABLE __table__ (__column__ __type__); -- __table__",
        {{"table", "users"}, {"column", "name"}});
    ASSERT_EQ(out, "CREATE TABLE users (name __type__); -- users");
}

TEST(templates_select) {
    TemplateCollection templates;
    ASSERT_EQ(templates.selectTemplate(""), "default");
    ASSERT_EQ(templates.selectTemplate("create_table"), "create_table");
    ASSERT_THROWS(templates.selectTemplate("nope"), TemplateException);
    ASSERT_EQ(templates.list().size(), 4u);
}

TEST(templates_load_directory) {
    TempDir dir;
    writeFile(dir.file("seed.template"), "-- Seed rows\n-- +migrate up\nINSERT INTO __table__ DEFAULT VALUES;\n");
    writeFile(dir.file("default.template"), "-- +migrate up\n-- custom\n");
    writeFile(dir.file("ignored.txt"), "x");

    TemplateCollection templates;
    templates.loadDirectory(dir.path());

    ASSERT_EQ(templates.list().size(), 5u);
    ASSERT_EQ(templates.get("seed").description, "Seed rows");
    ASSERT_TRUE(contains(templates.get("default").content, "custom"));
    ASSERT_THROWS(templates.loadDirectory(dir.file("absent")), TemplateException);
}

TEST(creator_writes_rendered_file) {
    TempDir dir;
    TemplateCollection templates;
    Scaffolder scaffolder(templates);
    MigrationCreator creator(scaffolder, dir.file("migrations"));

    auto id = creator.create("add_users_table", "create_table", {{"table", "users"}},
                             at(1682935872, 123456));
    ASSERT_EQ(id, USERS_ID);

    std::string content = readFile(creator.pathFor(id));
    ASSERT_TRUE(contains(content, "-- AddUsersTable2023_05_01_101112_123456"));
    ASSERT_TRUE(contains(content, "CREATE TABLE users ("));
    ASSERT_TRUE(contains(content, "DROP TABLE users;"));

    // The generated file is a valid SQL migration
    ASSERT_TRUE(parseSqlSections(content).has_value());
}

TEST(creator_identifiers_monotonic) {
    TempDir dir;
    TemplateCollection templates;
    Scaffolder scaffolder(templates);
    MigrationCreator creator(scaffolder, dir.path());

    auto now = at(1682935872, 123456);
    auto first = creator.create("first", "", {}, now);
    auto second = creator.create("second", "", {}, now);
    auto third = creator.create("third", "", {}, now - std::chrono::hours(1));

    ASSERT_EQ(first, "2023_05_01_101112_123456_first");
    ASSERT_EQ(second, "2023_05_01_101112_123457_second");
    ASSERT_EQ(third, "2023_05_01_101112_123458_third");
}

TEST(creator_rejects_bad_input) {
    TempDir dir;
    TemplateCollection templates;
    Scaffolder scaffolder(templates);
    MigrationCreator creator(scaffolder, dir.path());

    ASSERT_THROWS(creator.create("bad name"), ConfigException);
    ASSERT_THROWS(creator.create("ok", "missing_template"), TemplateException);
    ASSERT_TRUE(listMigrationFiles(dir.path(), ".sql").empty());
}

// ========== Lock Tests ==========

TEST(lock_excludes_second_runner) {
    TempDir dir;
    auto first = Connection::open(dir.file("app.sqlite"));
    auto second = Connection::open(dir.file("app.sqlite"));

    {
        MigrationLock lock(*first, "migrations", "deploy-1");
        ASSERT_TRUE(lock.isHeld());
        ASSERT_EQ(lock.lockTable(), "migrations_lock");
        ASSERT_EQ(*MigrationLock::holder(*second, "migrations"), "deploy-1");
        ASSERT_THROWS(MigrationLock(*second, "migrations", "deploy-2"), LockException);
    }

    ASSERT_TRUE(!MigrationLock::holder(*second, "migrations").has_value());
    MigrationLock again(*second, "migrations", "deploy-2");
    ASSERT_TRUE(again.isHeld());
}

TEST(lock_clear_stale) {
    auto conn = Connection::inMemory();
    ASSERT_TRUE(!MigrationLock::clear(*conn, "migrations"));

    conn->execute("CREATE TABLE migrations_lock (id INTEGER PRIMARY KEY CHECK (id = 1), "
                  "owner TEXT NOT NULL, acquired_at INTEGER NOT NULL DEFAULT 0)");
    conn->execute("INSERT INTO migrations_lock (id, owner) VALUES (1, 'pid 1')");

    ASSERT_THROWS(MigrationLock(*conn, "migrations"), LockException);
    ASSERT_TRUE(MigrationLock::clear(*conn, "migrations"));

    MigrationLock lock(*conn, "migrations");
    lock.release();
    ASSERT_TRUE(!lock.isHeld());
    ASSERT_EQ(countRows(*conn, "migrations_lock"), 0);
}

// ========== Config Tests ==========

TEST(config_validate) {
    MigratorConfig config;
    config.validate();

    config.table = "bad table";
    ASSERT_THROWS(config.validate(), ConfigException);

    config = MigratorConfig{};
    config.extension = "sql";
    ASSERT_THROWS(config.validate(), ConfigException);

    config = MigratorConfig{};
    config.databasePath.clear();
    ASSERT_THROWS(config.validate(), ConfigException);
}

TEST(config_from_environment) {
    ::setenv("SQLMIGRATE_DIR", "db/migrate", 1);
    ::setenv("SQLMIGRATE_TABLE", "", 1);
    auto config = MigratorConfig::fromEnvironment();
    ::unsetenv("SQLMIGRATE_DIR");
    ::unsetenv("SQLMIGRATE_TABLE");

    ASSERT_EQ(config.migrationsDir, "db/migrate");
    ASSERT_EQ(config.table, "migrations");
}

TEST(log_parse_level) {
    ASSERT_TRUE(log::parse_level("debug") == log::Level::Debug);
    ASSERT_TRUE(log::parse_level("warning") == log::Level::Warn);
    ASSERT_TRUE(log::parse_level("off") == log::Level::Off);
    ASSERT_TRUE(log::parse_level("loud") == log::Level::Info);
}

TEST(log_file_sink) {
    TempDir dir;
    log::LogConfig config;
    config.level = log::Level::Debug;
    config.console = false;
    config.file_path = dir.file("sqlmigrate.log");
    log::init(config);

    ASSERT_TRUE(log::get_level() == log::Level::Debug);
    log::info("Migrated: {}", USERS_ID);
    log::flush();
    ASSERT_TRUE(contains(readFile(config.file_path), "Migrated: " + USERS_ID));

    log::shutdown();

    log::LogConfig quiet;
    quiet.level = log::Level::Off;
    log::init(quiet);
}

// ========== CLI Tests ==========

TEST(cli_parse_arguments) {
    auto options = parseArguments({"make", "add_users_table", "-t", "create_table",
                                   "-r", "table=users", "--replace", "note=a=b",
                                   "-m", "db/migrations"});
    ASSERT_EQ(options.command, "make");
    ASSERT_EQ(join(options.arguments), "add_users_table");
    ASSERT_EQ(options.templateName, "create_table");
    ASSERT_EQ(options.replacements.at("table"), "users");
    ASSERT_EQ(options.replacements.at("note"), "a=b");
    ASSERT_EQ(options.config.migrationsDir, "db/migrations");

    ASSERT_TRUE(parseArguments({}).help);
    ASSERT_TRUE(parseArguments({"status", "--help"}).help);
}

TEST(cli_parse_errors) {
    ASSERT_THROWS(parseArguments({"explode"}), ConfigException);
    ASSERT_THROWS(parseArguments({"migrate", "--bogus"}), ConfigException);
    ASSERT_THROWS(parseArguments({"make"}), ConfigException);
    ASSERT_THROWS(parseArguments({"migrate", "extra"}), ConfigException);
    ASSERT_THROWS(parseArguments({"make", "x", "-r", "novalue"}), ConfigException);
    ASSERT_THROWS(parseArguments({"status", "-d"}), ConfigException);
    ASSERT_THROWS(parseArguments({"status", "--table", "no good"}), ConfigException);
}

TEST(cli_make_migrate_rollback) {
    TempDir dir;
    MigrationRegistry registry;
    std::vector<std::string> common = {"-d", dir.file("app.sqlite"), "-m", dir.file("migrations")};
    auto run = [&](std::vector<std::string> args, std::string& out, std::string& err) {
        args.insert(args.end(), common.begin(), common.end());
        std::ostringstream o, e;
        int code = runCli(parseArguments(args), registry, o, e);
        out = o.str();
        err = e.str();
        return code;
    };
    std::string out, err;

    ASSERT_EQ(run({"make", "add_users_table", "-t", "create_table", "-r", "table=users"}, out, err), EXIT_OK);
    ASSERT_TRUE(contains(out, "Migration created: "));

    ASSERT_EQ(run({"status"}, out, err), EXIT_OK);
    ASSERT_TRUE(contains(out, "[pending] "));

    ASSERT_EQ(run({"migrate"}, out, err), EXIT_OK);
    ASSERT_TRUE(contains(out, "Migrated: "));
    ASSERT_TRUE(contains(out, "_add_users_table"));

    ASSERT_EQ(run({"migrate"}, out, err), EXIT_OK);
    ASSERT_TRUE(contains(out, "Nothing to migrate"));

    ASSERT_EQ(run({"rollback"}, out, err), EXIT_OK);
    ASSERT_TRUE(contains(out, "Rolled back: "));

    ASSERT_EQ(run({"rollback"}, out, err), EXIT_OK);
    ASSERT_TRUE(contains(out, "Nothing to rollback"));

    ASSERT_EQ(run({"unlock"}, out, err), EXIT_OK);
    ASSERT_TRUE(contains(out, "not locked"));
}

TEST(cli_migrate_failure_exit_code) {
    TempDir dir;
    fs::create_directories(dir.file("migrations"));
    writeFile(dir.file("migrations/2024_01_01_000000_000000_good.sql"),
              "-- +migrate up\nCREATE TABLE good (id INTEGER);\n");
    writeFile(dir.file("migrations/2024_01_02_000000_000000_bad.sql"),
              "-- +migrate up\nINSERT INTO missing VALUES (1);\n");

    MigrationRegistry registry;
    std::ostringstream out, err;
    int code = runCli(parseArguments({"migrate", "-d", dir.file("app.sqlite"),
                                      "-m", dir.file("migrations")}),
                      registry, out, err);

    ASSERT_EQ(code, EXIT_FAILED);
    ASSERT_TRUE(contains(out.str(), "Migrated: 2024_01_01_000000_000000_good"));
    ASSERT_TRUE(contains(err.str(), "2024_01_02_000000_000000_bad"));

    // The lock was released on failure
    auto conn = Connection::open(dir.file("app.sqlite"));
    ASSERT_TRUE(!MigrationLock::holder(*conn, "migrations").has_value());
}

TEST(cli_templates_lists_builtins) {
    MigrationRegistry registry;
    std::ostringstream out, err;
    ASSERT_EQ(runCli(parseArguments({"templates"}), registry, out, err), EXIT_OK);
    ASSERT_TRUE(contains(out.str(), "create_table - "));
    ASSERT_TRUE(contains(out.str(), "add_index - "));
}

int main() {
    int passed = 0;
    int failed = 0;

    log::set_level(log::Level::Off);

    std::cout << "\nRunning sqlmigrate tests...\n\n";

    std::cout << "Connection tests:\n";
    RUN_TEST(connection_open_memory);
    RUN_TEST(connection_execute_basic);
    RUN_TEST(connection_open_missing_readonly);

    std::cout << "\nStatement tests:\n";
    RUN_TEST(statement_bind_and_execute);
    RUN_TEST(statement_query_results);
    RUN_TEST(statement_null_handling);

    std::cout << "\nTransaction tests:\n";
    RUN_TEST(transaction_commit);
    RUN_TEST(transaction_rollback);
    RUN_TEST(transaction_explicit_rollback);

    std::cout << "\nNaming tests:\n";
    RUN_TEST(type_name_from_identifier);
    RUN_TEST(type_name_rejects_bad_identifiers);
    RUN_TEST(identifier_timestamp_utc);
    RUN_TEST(migration_name_validation);

    std::cout << "\nRegistry tests:\n";
    RUN_TEST(registry_add_and_create);
    RUN_TEST(registry_rejects_duplicates);

    std::cout << "\nLedger store tests:\n";
    RUN_TEST(ledger_initialize);
    RUN_TEST(ledger_application_order);
    RUN_TEST(ledger_duplicate_write_fails);
    RUN_TEST(ledger_write_without_table_fails);
    RUN_TEST(ledger_rejects_bad_table_name);

    std::cout << "\nEngine tests:\n";
    RUN_TEST(pending_is_scripts_minus_applied);
    RUN_TEST(pending_without_ledger);
    RUN_TEST(install_once);
    RUN_TEST(apply_success);
    RUN_TEST(apply_failure_leaves_ledger);
    RUN_TEST(apply_already_applied);
    RUN_TEST(apply_ledger_write_error_propagates);
    RUN_TEST(rollback_success);
    RUN_TEST(rollback_failure_keeps_entry);
    RUN_TEST(rollback_not_applied);
    RUN_TEST(run_pending_fail_fast_then_resume);
    RUN_TEST(resolve_unresolvable);
    RUN_TEST(run_pending_unresolvable_reports_progress);
    RUN_TEST(status_lists_missing_scripts);

    std::cout << "\nSQL script tests:\n";
    RUN_TEST(sql_sections_parse);
    RUN_TEST(sql_sections_malformed);
    RUN_TEST(sql_script_runs_in_transaction);

    std::cout << "\nFile script store tests:\n";
    RUN_TEST(file_store_lists_sorted);
    RUN_TEST(file_store_loads_sql);
    RUN_TEST(file_store_prefers_registered_type);
    RUN_TEST(file_store_unresolvable);
    RUN_TEST(migrator_end_to_end);

    std::cout << "\nScaffolder tests:\n";
    RUN_TEST(placeholders_replaced_verbatim);
    RUN_TEST(templates_select);
    RUN_TEST(templates_load_directory);
    RUN_TEST(creator_writes_rendered_file);
    RUN_TEST(creator_identifiers_monotonic);
    RUN_TEST(creator_rejects_bad_input);

    std::cout << "\nLock tests:\n";
    RUN_TEST(lock_excludes_second_runner);
    RUN_TEST(lock_clear_stale);

    std::cout << "\nConfig tests:\n";
    RUN_TEST(config_validate);
    RUN_TEST(config_from_environment);
    RUN_TEST(log_parse_level);
    RUN_TEST(log_file_sink);

    std::cout << "\nCLI tests:\n";
    RUN_TEST(cli_parse_arguments);
    RUN_TEST(cli_parse_errors);
    RUN_TEST(cli_make_migrate_rollback);
    RUN_TEST(cli_migrate_failure_exit_code);
    RUN_TEST(cli_templates_lists_builtins);

    std::cout << "\n" << std::string(40, '=') << "\n";
    std::cout << "Results: " << passed << " passed, " << failed << " failed\n";
    std::cout << std::string(40, '=') << "\n";

    return failed > 0 ? 1 : 0;
}
