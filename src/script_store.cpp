/**
 * @file script_store.cpp
 * @brief FileScriptStore implementation
 */

#include "sqlmigrate/script_store.hpp"
#include "sqlmigrate/sql_script.hpp"
#include "sqlmigrate/log.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace sqlmigrate {

FileScriptStore::FileScriptStore(Connection& conn,
                                 const MigrationRegistry& registry,
                                 std::string directory,
                                 std::string extension)
    : conn_(conn)
    , registry_(registry)
    , directory_(std::move(directory))
    , extension_(std::move(extension)) {}

std::vector<std::string> listMigrationFiles(const std::string& directory,
                                            const std::string& extension) {
    std::vector<std::string> identifiers;

    std::error_code ec;
    if (!fs::is_directory(directory, ec)) {
        log::debug("Migrations directory {} does not exist", directory);
        return identifiers;
    }

    fs::directory_iterator it(directory, ec);
    if (ec) {
        throw ConfigException("Cannot read migrations directory '" + directory + "': " + ec.message());
    }

    for (const auto& entry : it) {
        if (!entry.is_regular_file(ec) || entry.path().extension() != extension) {
            continue;
        }
        identifiers.push_back(entry.path().stem().string());
    }

    std::sort(identifiers.begin(), identifiers.end());
    return identifiers;
}

std::string migrationFilePath(const std::string& directory,
                              const std::string& identifier,
                              const std::string& extension) {
    return (fs::path(directory) / (identifier + extension)).string();
}

std::string FileScriptStore::pathFor(const std::string& identifier) const {
    return migrationFilePath(directory_, identifier, extension_);
}

std::vector<std::string> FileScriptStore::listAll() {
    return listMigrationFiles(directory_, extension_);
}

bool FileScriptStore::exists(const std::string& identifier) {
    std::error_code ec;
    return fs::is_regular_file(pathFor(identifier), ec);
}

std::unique_ptr<MigrationScript> FileScriptStore::load(const std::string& identifier) {
    std::string path = pathFor(identifier);
    if (!exists(identifier)) {
        throw UnresolvableMigrationException("file " + path + " not found", identifier);
    }

    std::string typeName = migrationTypeName(identifier);

    if (registry_.contains(typeName)) {
        log::debug("Resolved {} to registered type {}", identifier, typeName);
        auto script = registry_.create(typeName, conn_);
        if (!script) {
            throw UnresolvableMigrationException(
                "factory for " + typeName + " returned no script", identifier);
        }
        return script;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw UnresolvableMigrationException("cannot open " + path, identifier);
    }
    std::ostringstream content;
    content << file.rdbuf();

    auto sections = parseSqlSections(content.str());
    if (!sections) {
        throw UnresolvableMigrationException(
            path + " has no registered type " + typeName +
            " and is not a SQL script with a single '-- +migrate up' section",
            identifier);
    }

    log::debug("Resolved {} to SQL script {}", identifier, path);
    return std::make_unique<SqlScript>(conn_, std::move(*sections));
}

} // namespace sqlmigrate
