/**
 * @file script_store.hpp
 * @brief Discovery and loading of migration scripts
 */

#pragma once

#include <memory>
#include <string>
#include <vector>
#include "migration.hpp"

namespace sqlmigrate {

/**
 * @brief Source of migration scripts
 *
 * listAll() must be deterministic; implementations sort identifiers
 * lexically, which is creation order.
 */
class ScriptStore {
public:
    virtual ~ScriptStore() = default;

    virtual std::vector<std::string> listAll() = 0;

    virtual bool exists(const std::string& identifier) = 0;

    /**
     * @brief Materialize the script for an identifier
     * @throws UnresolvableMigrationException if missing or malformed
     */
    virtual std::unique_ptr<MigrationScript> load(const std::string& identifier) = 0;
};

/**
 * @brief Identifiers of the migration files in a directory, sorted
 *
 * A missing directory yields an empty list.
 *
 * @throws ConfigException if the directory cannot be read
 */
std::vector<std::string> listMigrationFiles(const std::string& directory,
                                            const std::string& extension);

/**
 * @brief <directory>/<identifier><extension>
 */
std::string migrationFilePath(const std::string& directory,
                              const std::string& identifier,
                              const std::string& extension);

/**
 * @brief Scripts stored one per file in a directory
 *
 * File base name is the identifier. load() picks the implementation by
 * the identifier's derived type name: a factory registered under that
 * name wins, otherwise the file is read as a SqlScript.
 *
 *   MigrationRegistry registry;
 *   FileScriptStore scripts(conn, registry, "db/migrations");
 *   for (const auto& id : scripts.listAll()) { ... }
 */
class FileScriptStore : public ScriptStore {
public:
    static constexpr const char* DEFAULT_EXTENSION = ".sql";

    /**
     * @param conn Connection handed to every loaded script
     * @param registry Compiled migrations; must outlive the store
     * @param directory Directory holding migration files
     * @param extension File extension including the dot
     */
    FileScriptStore(Connection& conn,
                    const MigrationRegistry& registry,
                    std::string directory,
                    std::string extension = DEFAULT_EXTENSION);

    std::vector<std::string> listAll() override;

    bool exists(const std::string& identifier) override;

    std::unique_ptr<MigrationScript> load(const std::string& identifier) override;

    /**
     * @brief Path of the file backing an identifier
     */
    std::string pathFor(const std::string& identifier) const;

    const std::string& directory() const { return directory_; }
    const std::string& extension() const { return extension_; }

private:
    Connection& conn_;
    const MigrationRegistry& registry_;
    std::string directory_;
    std::string extension_;
};

} // namespace sqlmigrate
