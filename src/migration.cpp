/**
 * @file migration.cpp
 * @brief MigrationRegistry and identifier naming
 */

#include "sqlmigrate/migration.hpp"
#include <cctype>
#include <cstdio>
#include <ctime>
#include <sstream>

namespace sqlmigrate {

namespace {

std::vector<std::string> splitSegments(const std::string& identifier) {
    std::vector<std::string> segments;
    std::string segment;
    std::istringstream stream(identifier);
    while (std::getline(stream, segment, '_')) {
        segments.push_back(segment);
    }
    return segments;
}

bool isDigits(const std::string& s) {
    if (s.empty()) {
        return false;
    }
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

// Expected widths: YYYY MM DD HHMMSS UUUUUU
constexpr size_t SEGMENT_WIDTHS[IDENTIFIER_DATE_SEGMENTS] = {4, 2, 2, 6, 6};

bool hasTimestampPrefix(const std::vector<std::string>& segments) {
    if (segments.size() < IDENTIFIER_DATE_SEGMENTS) {
        return false;
    }
    for (size_t i = 0; i < IDENTIFIER_DATE_SEGMENTS; ++i) {
        if (!isDigits(segments[i]) || segments[i].size() != SEGMENT_WIDTHS[i]) {
            return false;
        }
    }
    return true;
}

} // anonymous namespace

// ========== MigrationRegistry ==========

void MigrationRegistry::add(const std::string& typeName, MigrationFactory factory) {
    if (typeName.empty()) {
        throw ConfigException("Migration type name must not be empty");
    }
    if (!factory) {
        throw ConfigException("Null factory registered for migration type " + typeName);
    }
    if (factories_.count(typeName) > 0) {
        throw ConfigException("Duplicate migration type " + typeName);
    }
    factories_.emplace(typeName, std::move(factory));
}

bool MigrationRegistry::contains(const std::string& typeName) const {
    return factories_.count(typeName) > 0;
}

std::unique_ptr<MigrationScript> MigrationRegistry::create(const std::string& typeName,
                                                           Connection& conn) const {
    auto it = factories_.find(typeName);
    if (it == factories_.end()) {
        return nullptr;
    }
    return it->second(conn);
}

std::vector<std::string> MigrationRegistry::names() const {
    std::vector<std::string> result;
    result.reserve(factories_.size());
    for (const auto& [name, _] : factories_) {
        result.push_back(name);
    }
    return result;
}

// ========== Naming ==========

std::string migrationTypeName(const std::string& identifier) {
    auto segments = splitSegments(identifier);

    if (!hasTimestampPrefix(segments)) {
        throw UnresolvableMigrationException(
            "identifier does not start with a YYYY_MM_DD_HHMMSS_UUUUUU timestamp", identifier);
    }

    std::string namePart;
    for (size_t i = IDENTIFIER_DATE_SEGMENTS; i < segments.size(); ++i) {
        std::string word = segments[i];
        if (word.empty()) {
            continue;
        }
        word[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(word[0])));
        namePart += word;
    }

    if (namePart.empty()) {
        throw UnresolvableMigrationException("identifier has no name part", identifier);
    }

    std::string datePart;
    for (size_t i = 0; i < IDENTIFIER_DATE_SEGMENTS; ++i) {
        if (i > 0) {
            datePart += '_';
        }
        datePart += segments[i];
    }

    return namePart + datePart;
}

bool isValidMigrationName(const std::string& name) {
    bool hasWordChar = false;
    for (char c : name) {
        if (std::isalnum(static_cast<unsigned char>(c))) {
            hasWordChar = true;
        } else if (c != '_') {
            return false;
        }
    }
    return hasWordChar;
}

std::string formatIdentifierTimestamp(std::chrono::system_clock::time_point when) {
    using namespace std::chrono;

    auto sinceEpoch = duration_cast<microseconds>(when.time_since_epoch());
    auto secs = duration_cast<seconds>(sinceEpoch);
    auto usec = (sinceEpoch - secs).count();
    if (usec < 0) {
        secs -= seconds(1);
        usec += 1000000;
    }

    std::time_t t = static_cast<std::time_t>(secs.count());
    std::tm tm{};
    gmtime_r(&t, &tm);

    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%04d_%02d_%02d_%02d%02d%02d_%06lld",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec,
                  static_cast<long long>(usec));
    return buffer;
}

bool parseIdentifierTimestamp(const std::string& identifier,
                              std::chrono::system_clock::time_point& when) {
    auto segments = splitSegments(identifier);
    if (!hasTimestampPrefix(segments)) {
        return false;
    }

    std::tm tm{};
    tm.tm_year = std::stoi(segments[0]) - 1900;
    tm.tm_mon = std::stoi(segments[1]) - 1;
    tm.tm_mday = std::stoi(segments[2]);
    tm.tm_hour = std::stoi(segments[3].substr(0, 2));
    tm.tm_min = std::stoi(segments[3].substr(2, 2));
    tm.tm_sec = std::stoi(segments[3].substr(4, 2));

    std::time_t t = timegm(&tm);
    if (t == static_cast<std::time_t>(-1)) {
        return false;
    }

    when = std::chrono::system_clock::from_time_t(t)
         + std::chrono::microseconds(std::stoll(segments[4]));
    return true;
}

std::string constructIdentifier(const std::string& name,
                                std::chrono::system_clock::time_point when) {
    return formatIdentifierTimestamp(when) + "_" + name;
}

} // namespace sqlmigrate
