/**
 * @file scaffolder.cpp
 * @brief Templates, rendering and migration file creation
 */

#include "sqlmigrate/scaffolder.hpp"
#include "sqlmigrate/log.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace sqlmigrate {

namespace {

const char* const DEFAULT_CONTENT = R"(-- __className__
-- +migrate up


-- +migrate down

)";

const char* const CREATE_TABLE_CONTENT = R"(-- __className__
-- +migrate up
CREATE TABLE __table__ (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    created_at INTEGER NOT NULL DEFAULT (strftime('%s', 'now'))
);

-- +migrate down
DROP TABLE __table__;
)";

const char* const ADD_COLUMN_CONTENT = R"(-- __className__
-- +migrate up
ALTER TABLE __table__ ADD COLUMN __column__ __type__;

-- +migrate down
ALTER TABLE __table__ DROP COLUMN __column__;
)";

const char* const ADD_INDEX_CONTENT = R"(-- __className__
-- +migrate up
CREATE INDEX __table___by___column__ ON __table__ (__column__);

-- +migrate down
DROP INDEX __table___by___column__;
)";

std::string readFile(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw TemplateException("Cannot read template file " + path.string());
    }
    std::ostringstream content;
    content << file.rdbuf();
    return content.str();
}

std::string descriptionFrom(const std::string& content) {
    std::string firstLine = content.substr(0, content.find('\n'));
    if (firstLine.compare(0, 2, "--") != 0) {
        return "";
    }
    auto start = firstLine.find_first_not_of(" \t", 2);
    if (start == std::string::npos) {
        return "";
    }
    auto end = firstLine.find_last_not_of(" \t\r");
    return firstLine.substr(start, end - start + 1);
}

} // anonymous namespace

// ========== TemplateCollection ==========

TemplateCollection::TemplateCollection() {
    add({DEFAULT_TEMPLATE, "Empty up and down sections", DEFAULT_CONTENT});
    add({"create_table", "Create a table (__table__)", CREATE_TABLE_CONTENT});
    add({"add_column", "Add a column (__table__, __column__, __type__)", ADD_COLUMN_CONTENT});
    add({"add_index", "Index a column (__table__, __column__)", ADD_INDEX_CONTENT});
}

void TemplateCollection::add(MigrationTemplate tmpl) {
    std::string name = tmpl.name;
    templates_[name] = std::move(tmpl);
}

void TemplateCollection::loadDirectory(const std::string& directory) {
    std::error_code ec;
    fs::directory_iterator it(directory, ec);
    if (ec) {
        throw TemplateException("Cannot read templates directory '" + directory + "': " + ec.message());
    }

    for (const auto& entry : it) {
        if (!entry.is_regular_file(ec) || entry.path().extension() != TEMPLATE_EXTENSION) {
            continue;
        }
        std::string content = readFile(entry.path());
        std::string name = entry.path().stem().string();
        add({name, descriptionFrom(content), content});
        log::debug("Loaded template {} from {}", name, entry.path().string());
    }
}

std::string TemplateCollection::selectTemplate(const std::string& name) const {
    std::string selected = name.empty() ? DEFAULT_TEMPLATE : name;
    if (!contains(selected)) {
        throw TemplateException("Unknown template '" + selected + "'");
    }
    return selected;
}

const MigrationTemplate& TemplateCollection::get(const std::string& name) const {
    auto it = templates_.find(name);
    if (it == templates_.end()) {
        throw TemplateException("Unknown template '" + name + "'");
    }
    return it->second;
}

bool TemplateCollection::contains(const std::string& name) const {
    return templates_.count(name) > 0;
}

std::vector<MigrationTemplate> TemplateCollection::list() const {
    std::vector<MigrationTemplate> result;
    result.reserve(templates_.size());
    for (const auto& [_, tmpl] : templates_) {
        result.push_back(tmpl);
    }
    return result;
}

// ========== Scaffolder ==========

Scaffolder::Scaffolder(const TemplateCollection& templates)
    : templates_(templates) {}

std::string Scaffolder::render(const std::string& templateName,
                               const Substitutions& substitutions) const {
    return replacePlaceholders(templates_.get(templateName).content, substitutions);
}

std::string Scaffolder::replacePlaceholders(std::string content,
                                            const Substitutions& substitutions) {
    for (const auto& [key, value] : substitutions) {
        const std::string token = "__" + key + "__";
        size_t pos = 0;
        while ((pos = content.find(token, pos)) != std::string::npos) {
            content.replace(pos, token.size(), value);
            pos += value.size();
        }
    }
    return content;
}

// ========== MigrationCreator ==========

MigrationCreator::MigrationCreator(const Scaffolder& scaffolder,
                                   std::string directory,
                                   std::string extension)
    : scaffolder_(scaffolder)
    , directory_(std::move(directory))
    , extension_(std::move(extension)) {}

std::string MigrationCreator::pathFor(const std::string& identifier) const {
    return migrationFilePath(directory_, identifier, extension_);
}

std::string MigrationCreator::nextIdentifier(const std::string& name,
                                             std::chrono::system_clock::time_point now) {
    using namespace std::chrono;

    system_clock::time_point candidate = time_point_cast<microseconds>(now);

    for (const auto& identifier : listMigrationFiles(directory_, extension_)) {
        system_clock::time_point existing;
        if (parseIdentifierTimestamp(identifier, existing) && candidate <= existing) {
            candidate = existing + microseconds(1);
        }
    }

    return constructIdentifier(name, candidate);
}

std::string MigrationCreator::create(const std::string& name,
                                     const std::string& templateName,
                                     const Substitutions& substitutions,
                                     std::chrono::system_clock::time_point now) {
    if (!isValidMigrationName(name)) {
        throw ConfigException("Invalid migration name '" + name +
                              "': use letters, digits and underscores");
    }

    std::string selected = scaffolder_.templates().selectTemplate(templateName);
    std::string identifier = nextIdentifier(name, now);

    Substitutions values = substitutions;
    values["className"] = migrationTypeName(identifier);
    std::string content = scaffolder_.render(selected, values);

    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        throw TemplateException("Cannot create directory '" + directory_ + "': " + ec.message());
    }

    std::string path = pathFor(identifier);
    if (fs::exists(path, ec)) {
        throw TemplateException("Migration file " + path + " already exists");
    }

    std::ofstream file(path, std::ios::binary);
    file << content;
    file.close();
    if (!file) {
        throw TemplateException("Failed to write migration file " + path);
    }

    log::info("Created migration {} from template {}", identifier, selected);
    return identifier;
}

} // namespace sqlmigrate
