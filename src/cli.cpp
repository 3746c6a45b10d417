/**
 * @file cli.cpp
 * @brief Command-line front end
 */

#include "sqlmigrate/cli.hpp"
#include "sqlmigrate/ledger_store.hpp"
#include "sqlmigrate/log.hpp"
#include "sqlmigrate/migration_lock.hpp"
#include "sqlmigrate/migrator.hpp"
#include "sqlmigrate/script_store.hpp"
#include <iostream>

namespace sqlmigrate {

namespace {

const std::vector<std::string> COMMANDS = {
    "install", "make", "migrate", "rollback", "status", "templates", "unlock", "help"
};

bool isCommand(const std::string& name) {
    for (const auto& command : COMMANDS) {
        if (command == name) {
            return true;
        }
    }
    return false;
}

const std::string& requireValue(const std::vector<std::string>& args, size_t& i) {
    if (i + 1 >= args.size()) {
        throw ConfigException("option " + args[i] + " requires a value");
    }
    return args[++i];
}

void addReplacement(Substitutions& replacements, const std::string& pair) {
    auto eq = pair.find('=');
    if (eq == std::string::npos || eq == 0) {
        throw ConfigException("expected key=value for --replace, got '" + pair + "'");
    }
    replacements[pair.substr(0, eq)] = pair.substr(eq + 1);
}

size_t expectedArguments(const std::string& command, size_t& maxArgs) {
    if (command == "make") {
        maxArgs = 1;
        return 1;
    }
    if (command == "rollback") {
        maxArgs = 1;
        return 0;
    }
    maxArgs = 0;
    return 0;
}

// Database-backed commands share one connection for ledger, scripts and lock
struct Session {
    explicit Session(const MigratorConfig& config, const MigrationRegistry& registry)
        : conn(Connection::open(config.databasePath, config.connection))
        , ledger(*conn, config.table)
        , scripts(*conn, registry, config.migrationsDir, config.extension)
        , migrator(ledger, scripts) {}

    std::unique_ptr<Connection> conn;
    SqliteLedgerStore ledger;
    FileScriptStore scripts;
    Migrator migrator;
};

int cmdInstall(Session& session, std::ostream& out) {
    if (session.migrator.install()) {
        out << "Created migration table " << session.ledger.table() << "\n";
    } else {
        out << "Migration table " << session.ledger.table() << " already exists\n";
    }
    return EXIT_OK;
}

int cmdMigrate(Session& session, std::ostream& out, std::ostream& err) {
    MigrationLock lock(*session.conn, session.ledger.table());

    try {
        auto ran = session.migrator.runPending();
        if (ran.empty()) {
            out << "Nothing to migrate\n";
        }
        for (const auto& identifier : ran) {
            out << "Migrated: " << identifier << "\n";
        }
    } catch (const MigrationException& e) {
        for (const auto& identifier : e.completed()) {
            out << "Migrated: " << identifier << "\n";
        }
        err << "Error: " << e.what() << "\n";
        return EXIT_FAILED;
    }
    return EXIT_OK;
}

int cmdRollback(Session& session, const CliOptions& options, std::ostream& out) {
    MigrationLock lock(*session.conn, session.ledger.table());

    std::string identifier;
    if (!options.arguments.empty()) {
        identifier = options.arguments[0];
    } else {
        auto last = session.migrator.lastApplied();
        if (!last) {
            out << "Nothing to rollback\n";
            return EXIT_OK;
        }
        identifier = *last;
    }

    session.migrator.rollback(identifier);
    out << "Rolled back: " << identifier << "\n";
    return EXIT_OK;
}

int cmdStatus(Session& session, std::ostream& out) {
    auto entries = session.migrator.status();
    if (entries.empty()) {
        out << "No migrations found in " << session.scripts.directory() << "\n";
        return EXIT_OK;
    }

    size_t pending = 0;
    for (const auto& entry : entries) {
        const char* state = !entry.fileExists ? "missing" : entry.applied ? "applied" : "pending";
        if (!entry.applied) {
            ++pending;
        }
        out << "[" << state << "] " << entry.identifier << "\n";
    }
    out << pending << " pending, " << (entries.size() - pending) << " applied\n";
    return EXIT_OK;
}

int cmdUnlock(Session& session, std::ostream& out) {
    if (MigrationLock::clear(*session.conn, session.ledger.table())) {
        out << "Migration lock removed\n";
    } else {
        out << "Migrations are not locked\n";
    }
    return EXIT_OK;
}

TemplateCollection loadTemplates(const MigratorConfig& config) {
    TemplateCollection templates;
    if (!config.templatesDir.empty()) {
        templates.loadDirectory(config.templatesDir);
    }
    return templates;
}

int cmdMake(const CliOptions& options, std::ostream& out) {
    TemplateCollection templates = loadTemplates(options.config);
    Scaffolder scaffolder(templates);
    MigrationCreator creator(scaffolder, options.config.migrationsDir, options.config.extension);

    std::string identifier = creator.create(options.arguments[0], options.templateName,
                                            options.replacements);
    out << "Migration created: " << creator.pathFor(identifier) << "\n";
    return EXIT_OK;
}

int cmdTemplates(const CliOptions& options, std::ostream& out) {
    for (const auto& tmpl : loadTemplates(options.config).list()) {
        out << tmpl.name;
        if (!tmpl.description.empty()) {
            out << " - " << tmpl.description;
        }
        out << "\n";
    }
    return EXIT_OK;
}

} // anonymous namespace

CliOptions parseArguments(const std::vector<std::string>& args, const MigratorConfig& defaults) {
    CliOptions options;
    options.config = defaults;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "-h" || arg == "--help") {
            options.help = true;
        } else if (arg == "-d" || arg == "--database") {
            options.config.databasePath = requireValue(args, i);
        } else if (arg == "-m" || arg == "--dir") {
            options.config.migrationsDir = requireValue(args, i);
        } else if (arg == "--table") {
            options.config.table = requireValue(args, i);
        } else if (arg == "--templates-dir") {
            options.config.templatesDir = requireValue(args, i);
        } else if (arg == "-t" || arg == "--template") {
            options.templateName = requireValue(args, i);
        } else if (arg == "-r" || arg == "--replace") {
            addReplacement(options.replacements, requireValue(args, i));
        } else if (!arg.empty() && arg[0] == '-') {
            throw ConfigException("unknown option " + arg);
        } else if (options.command.empty()) {
            if (!isCommand(arg)) {
                throw ConfigException("unknown command " + arg);
            }
            options.command = arg;
        } else {
            options.arguments.push_back(arg);
        }
    }

    if (options.command.empty() || options.command == "help") {
        options.help = true;
        return options;
    }

    size_t maxArgs = 0;
    size_t minArgs = expectedArguments(options.command, maxArgs);
    if (options.arguments.size() < minArgs || options.arguments.size() > maxArgs) {
        throw ConfigException("wrong number of arguments for " + options.command);
    }

    options.config.validate();
    return options;
}

void printUsage(std::ostream& out, const std::string& program) {
    out << "Usage: " << program << " [options] <command> [arguments]\n"
        << "\n"
        << "Commands:\n"
        << "  install               Create the migration ledger table\n"
        << "  make <name>           Create a new migration from a template\n"
        << "  migrate               Run all pending migrations\n"
        << "  rollback [id]         Roll back the latest (or the given) migration\n"
        << "  status                List migrations and whether they are applied\n"
        << "  templates             List available templates\n"
        << "  unlock                Remove a stale migration lock\n"
        << "\n"
        << "Options:\n"
        << "  -d, --database <path>     SQLite database (SQLMIGRATE_DATABASE)\n"
        << "  -m, --dir <path>          Migrations directory (SQLMIGRATE_DIR)\n"
        << "      --table <name>        Ledger table (SQLMIGRATE_TABLE)\n"
        << "      --templates-dir <p>   Extra *.template files (SQLMIGRATE_TEMPLATES_DIR)\n"
        << "  -t, --template <name>     Template for make (default: default)\n"
        << "  -r, --replace <key=value> Template substitution, repeatable\n"
        << "  -h, --help                Show this help\n"
        << "\n"
        << "Logging: SQLMIGRATE_LOG_LEVEL, SQLMIGRATE_LOG_FILE\n";
}

int runCli(const CliOptions& options,
           const MigrationRegistry& registry,
           std::ostream& out,
           std::ostream& err) {
    if (options.help) {
        printUsage(out, "sqlmigrate");
        return EXIT_OK;
    }

    try {
        if (options.command == "make") {
            return cmdMake(options, out);
        }
        if (options.command == "templates") {
            return cmdTemplates(options, out);
        }

        Session session(options.config, registry);
        if (options.command == "install") {
            return cmdInstall(session, out);
        }
        if (options.command == "migrate") {
            return cmdMigrate(session, out, err);
        }
        if (options.command == "rollback") {
            return cmdRollback(session, options, out);
        }
        if (options.command == "status") {
            return cmdStatus(session, out);
        }
        if (options.command == "unlock") {
            return cmdUnlock(session, out);
        }
    } catch (const ConfigException& e) {
        err << "Error: " << e.what() << "\n";
        return EXIT_USAGE;
    } catch (const DatabaseException& e) {
        err << "Error: " << e.what() << "\n";
        return EXIT_FAILED;
    }

    err << "Error: unknown command " << options.command << "\n";
    return EXIT_USAGE;
}

int cliMain(int argc, char* argv[], const MigrationRegistry& registry) {
    log::init_from_env();

    std::string program = argc > 0 ? argv[0] : "sqlmigrate";
    std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);

    CliOptions options;
    try {
        options = parseArguments(args, MigratorConfig::fromEnvironment());
    } catch (const ConfigException& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        printUsage(std::cerr, program);
        return EXIT_USAGE;
    }

    if (options.help) {
        printUsage(std::cout, program);
        return EXIT_OK;
    }

    int status = runCli(options, registry, std::cout, std::cerr);
    log::flush();
    return status;
}

} // namespace sqlmigrate
