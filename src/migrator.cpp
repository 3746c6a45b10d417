/**
 * @file migrator.cpp
 * @brief Implementation of the migration engine
 */

#include "sqlmigrate/migrator.hpp"
#include "sqlmigrate/log.hpp"
#include <algorithm>
#include <unordered_set>

namespace sqlmigrate {

Migrator::Migrator(LedgerStore& ledger, ScriptStore& scripts)
    : ledger_(ledger)
    , scripts_(scripts) {}

bool Migrator::install() {
    if (ledger_.exists()) {
        return false;
    }
    ledger_.initialize();
    return true;
}

std::vector<std::string> Migrator::listApplied() {
    if (!ledger_.exists()) {
        return {};
    }
    return ledger_.listApplied();
}

std::optional<std::string> Migrator::lastApplied() {
    auto applied = listApplied();
    if (applied.empty()) {
        return std::nullopt;
    }
    return applied.back();
}

bool Migrator::isApplied(const std::string& identifier) {
    auto applied = listApplied();
    return std::find(applied.begin(), applied.end(), identifier) != applied.end();
}

std::vector<std::string> Migrator::computePending() {
    auto all = scripts_.listAll();
    auto applied = listApplied();
    std::unordered_set<std::string> appliedSet(applied.begin(), applied.end());

    std::vector<std::string> pending;
    for (const auto& identifier : all) {
        if (appliedSet.count(identifier) == 0) {
            pending.push_back(identifier);
        }
    }
    return pending;
}

std::unique_ptr<MigrationScript> Migrator::resolveScript(const std::string& identifier) {
    std::unique_ptr<MigrationScript> script;
    try {
        if (!scripts_.exists(identifier)) {
            throw UnresolvableMigrationException("no such migration", identifier);
        }
        script = scripts_.load(identifier);
    } catch (const UnresolvableMigrationException&) {
        throw;
    } catch (const std::exception& e) {
        throw UnresolvableMigrationException(e.what(), identifier);
    }

    if (!script) {
        throw UnresolvableMigrationException("script store returned no script", identifier);
    }
    return script;
}

void Migrator::apply(const std::string& identifier) {
    auto script = resolveScript(identifier);

    if (isApplied(identifier)) {
        throw MigrationFailedException("already applied", identifier);
    }

    install();

    bool succeeded = false;
    try {
        succeeded = script->up();
    } catch (const std::exception& e) {
        log::error("Migration {} threw: {}", identifier, e.what());
        throw MigrationFailedException(e.what(), identifier);
    }

    if (!succeeded) {
        log::error("Migration {} reported failure", identifier);
        throw MigrationFailedException("up() reported failure", identifier);
    }

    ledger_.recordApplied(identifier);
    log::info("Migrated: {}", identifier);
}

std::vector<std::string> Migrator::runPending() {
    install();

    auto pending = computePending();
    std::vector<std::string> ran;

    if (pending.empty()) {
        log::info("Nothing to migrate");
        return ran;
    }

    log::debug("{} pending migration(s)", pending.size());

    for (const auto& identifier : pending) {
        try {
            apply(identifier);
        } catch (MigrationException& e) {
            log::error("Stopped at {} after {} migration(s)", identifier, ran.size());
            e.setCompleted(ran);
            throw;
        }
        ran.push_back(identifier);
    }

    return ran;
}

void Migrator::rollback(const std::string& identifier) {
    if (!isApplied(identifier)) {
        throw RollbackFailedException("not applied", identifier);
    }

    auto script = resolveScript(identifier);

    bool succeeded = false;
    try {
        succeeded = script->down();
    } catch (const std::exception& e) {
        log::error("Rollback of {} threw: {}", identifier, e.what());
        throw RollbackFailedException(e.what(), identifier);
    }

    if (!succeeded) {
        log::error("Rollback of {} reported failure", identifier);
        throw RollbackFailedException("down() reported failure", identifier);
    }

    ledger_.removeApplied(identifier);
    log::info("Rolled back: {}", identifier);
}

bool Migrator::doesMigrationFileExist(const std::string& identifier) {
    return scripts_.exists(identifier);
}

std::vector<MigrationStatus> Migrator::status() {
    auto all = scripts_.listAll();
    auto applied = listApplied();
    std::unordered_set<std::string> appliedSet(applied.begin(), applied.end());
    std::unordered_set<std::string> scriptSet(all.begin(), all.end());

    std::vector<MigrationStatus> result;
    for (const auto& identifier : all) {
        result.push_back({identifier, appliedSet.count(identifier) > 0, true});
    }
    for (const auto& identifier : applied) {
        if (scriptSet.count(identifier) == 0) {
            result.push_back({identifier, true, false});
        }
    }
    return result;
}

} // namespace sqlmigrate
