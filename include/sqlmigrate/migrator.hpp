/**
 * @file migrator.hpp
 * @brief Migration engine: pending computation, apply and rollback
 *
 * The Migrator owns no state of its own. It diffs the ScriptStore's
 * identifiers against the LedgerStore's applied list, runs scripts and
 * keeps the ledger in step with what actually succeeded.
 *
 *   auto conn = Connection::open("app.sqlite");
 *   MigrationRegistry registry;
 *   SqliteLedgerStore ledger(*conn);
 *   FileScriptStore scripts(*conn, registry, "migrations");
 *
 *   Migrator migrator(ledger, scripts);
 *   auto ran = migrator.runPending();
 *
 * Per identifier the lifecycle is
 *
 *   Pending --apply ok--> Applied --rollback ok--> Pending
 *      ^                     |
 *      +-- apply failed      +-- rollback failed (stays Applied)
 *
 * A failed apply records nothing, so the migration is pending again on
 * the next run.
 *
 * Running a script and writing its ledger entry are two separate steps.
 * If the process dies between them the script's effects exist without a
 * ledger entry and the migration will run again; recovery is manual.
 * The Migrator assumes it is the only writer (see MigrationLock).
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "ledger_store.hpp"
#include "script_store.hpp"

namespace sqlmigrate {

struct MigrationStatus {
    std::string identifier;
    bool applied = false;
    // false for ledger entries whose script has disappeared
    bool fileExists = true;
};

class Migrator {
public:
    /**
     * @param ledger Applied-migration ledger; must outlive the Migrator
     * @param scripts Script source; must outlive the Migrator
     */
    Migrator(LedgerStore& ledger, ScriptStore& scripts);

    /**
     * @brief Create the ledger if it does not exist yet
     * @return true if the ledger was created by this call
     */
    bool install();

    /**
     * @brief Script identifiers not yet in the ledger, in script order
     *
     * Read-only: an uninitialized ledger counts as empty.
     */
    std::vector<std::string> computePending();

    /**
     * @brief Ledger contents in application order (empty if not installed)
     */
    std::vector<std::string> listApplied();

    /**
     * @brief Most recently applied identifier, if any
     */
    std::optional<std::string> lastApplied();

    /**
     * @brief Run one migration's up() and record it
     *
     * @throws UnresolvableMigrationException if no script can be built
     * @throws MigrationFailedException if up() returns false or throws,
     *         or the identifier is already applied; the ledger is untouched
     * @throws LedgerWriteException if recording fails after up() succeeded
     */
    void apply(const std::string& identifier);

    /**
     * @brief Apply every pending migration in order, stopping at the first failure
     * @return Identifiers applied by this call
     *
     * A MigrationException escaping this call carries the identifiers
     * applied before the failure in completed(). Calling again resumes
     * at the failed migration.
     */
    std::vector<std::string> runPending();

    /**
     * @brief Run one migration's down() and remove it from the ledger
     *
     * Any applied identifier may be targeted; restricting rollback to
     * the latest migration is left to the caller (see lastApplied()).
     *
     * @throws UnresolvableMigrationException if no script can be built
     * @throws RollbackFailedException if down() returns false or throws,
     *         or the identifier is not applied; the ledger is untouched
     * @throws LedgerWriteException if removal fails after down() succeeded
     */
    void rollback(const std::string& identifier);

    /**
     * @brief Build the script for an identifier
     * @throws UnresolvableMigrationException
     */
    std::unique_ptr<MigrationScript> resolveScript(const std::string& identifier);

    bool doesMigrationFileExist(const std::string& identifier);

    /**
     * @brief Every known migration with its applied flag
     *
     * Scripts in script order, followed by ledger entries that have no
     * script, in ledger order.
     */
    std::vector<MigrationStatus> status();

private:
    bool isApplied(const std::string& identifier);

    LedgerStore& ledger_;
    ScriptStore& scripts_;
};

} // namespace sqlmigrate
