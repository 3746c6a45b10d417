/**
 * @file scaffolder.hpp
 * @brief Templates and creation of new migration files
 *
 * Templates contain __placeholder__ tokens that are replaced verbatim.
 * Tokens without a substitution are left as they are.
 *
 *   TemplateCollection templates;
 *   Scaffolder scaffolder(templates);
 *   MigrationCreator creator(scaffolder, "migrations");
 *   auto id = creator.create("add_users_table", "create_table", {{"table", "users"}});
 */

#pragma once

#include <chrono>
#include <map>
#include <string>
#include <vector>
#include "script_store.hpp"

namespace sqlmigrate {

using Substitutions = std::map<std::string, std::string>;

struct MigrationTemplate {
    std::string name;
    std::string description;
    std::string content;
};

/**
 * @brief Named migration templates
 *
 * Built-ins: default, create_table, add_column, add_index.
 */
class TemplateCollection {
public:
    static constexpr const char* DEFAULT_TEMPLATE = "default";
    static constexpr const char* TEMPLATE_EXTENSION = ".template";

    TemplateCollection();

    /**
     * @brief Add a template, replacing any template with the same name
     */
    void add(MigrationTemplate tmpl);

    /**
     * @brief Register every *.template file in a directory
     *
     * The template name is the file's base name. The first line is used
     * as the description when it is a SQL comment.
     *
     * @throws TemplateException if the directory or a file is unreadable
     */
    void loadDirectory(const std::string& directory);

    /**
     * @brief Resolve a requested template name
     * @return "default" for an empty name, otherwise name itself
     * @throws TemplateException if no such template exists
     */
    std::string selectTemplate(const std::string& name) const;

    /**
     * @throws TemplateException if no such template exists
     */
    const MigrationTemplate& get(const std::string& name) const;

    bool contains(const std::string& name) const;

    /**
     * @brief All templates ordered by name
     */
    std::vector<MigrationTemplate> list() const;

private:
    std::map<std::string, MigrationTemplate> templates_;
};

/**
 * @brief Renders templates with placeholder substitution
 */
class Scaffolder {
public:
    explicit Scaffolder(const TemplateCollection& templates);

    /**
     * @throws TemplateException if the template does not exist
     */
    std::string render(const std::string& templateName,
                       const Substitutions& substitutions) const;

    /**
     * @brief Replace each __key__ in content with its value
     */
    static std::string replacePlaceholders(std::string content,
                                           const Substitutions& substitutions);

    const TemplateCollection& templates() const { return templates_; }

private:
    const TemplateCollection& templates_;
};

/**
 * @brief Writes new migration files into a migrations directory
 */
class MigrationCreator {
public:
    MigrationCreator(const Scaffolder& scaffolder,
                     std::string directory,
                     std::string extension = FileScriptStore::DEFAULT_EXTENSION);

    /**
     * @brief Create a migration file from a template
     *
     * The identifier's timestamp is taken from now, advanced if needed so
     * that it sorts after every existing migration. The derived type name
     * is available to the template as __className__.
     *
     * @return The new identifier
     * @throws ConfigException if name is not a valid migration name
     * @throws TemplateException if the template is unknown or the file
     *         cannot be written or already exists
     */
    std::string create(const std::string& name,
                       const std::string& templateName = "",
                       const Substitutions& substitutions = {},
                       std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

    /**
     * @brief Identifier for name that sorts after every existing migration
     */
    std::string nextIdentifier(const std::string& name,
                               std::chrono::system_clock::time_point now);

    std::string pathFor(const std::string& identifier) const;

private:
    const Scaffolder& scaffolder_;
    std::string directory_;
    std::string extension_;
};

} // namespace sqlmigrate
