/**
 * @file cli.hpp
 * @brief Command-line front end
 *
 *   sqlmigrate install
 *   sqlmigrate make add_users_table -t create_table -r table=users
 *   sqlmigrate migrate
 *   sqlmigrate rollback [identifier]
 *   sqlmigrate status
 *   sqlmigrate templates
 *   sqlmigrate unlock
 *
 * Kept in the library so applications with compiled migrations can
 * embed it with their own MigrationRegistry.
 */

#pragma once

#include <ostream>
#include <string>
#include <vector>
#include "config.hpp"
#include "migration.hpp"
#include "scaffolder.hpp"

namespace sqlmigrate {

constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILED = 1;
constexpr int EXIT_USAGE = 2;

struct CliOptions {
    std::string command;
    std::vector<std::string> arguments;
    std::string templateName;
    Substitutions replacements;
    MigratorConfig config;
    bool help = false;
};

/**
 * @brief Parse argv (without the program name)
 * @param defaults Values used where no flag is given
 * @throws ConfigException on unknown options or malformed values
 */
CliOptions parseArguments(const std::vector<std::string>& args,
                          const MigratorConfig& defaults = MigratorConfig{});

void printUsage(std::ostream& out, const std::string& program);

/**
 * @brief Execute a parsed command
 * @return EXIT_OK, EXIT_FAILED, or EXIT_USAGE
 *
 * Results go to out, errors to err. Library failures are reported and
 * turned into EXIT_FAILED.
 */
int runCli(const CliOptions& options,
           const MigrationRegistry& registry,
           std::ostream& out,
           std::ostream& err);

/**
 * @brief parseArguments() + runCli() for a main() function
 */
int cliMain(int argc, char* argv[], const MigrationRegistry& registry);

} // namespace sqlmigrate
