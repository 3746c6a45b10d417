/**
 * @file sqlmigrate.cpp
 * @brief sqlmigrate command-line tool
 *
 * Runs SQL file migrations only. Applications with compiled migrations
 * call cliMain() with their own registry instead.
 */

#include "sqlmigrate/cli.hpp"

int main(int argc, char* argv[]) {
    sqlmigrate::MigrationRegistry registry;
    return sqlmigrate::cliMain(argc, argv, registry);
}
