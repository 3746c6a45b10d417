/**
 * @file sql_script.cpp
 * @brief SQL file parsing and execution
 */

#include "sqlmigrate/sql_script.hpp"
#include "sqlmigrate/transaction.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace sqlmigrate {

namespace {

enum class Marker { None, Up, Down };

std::string trim(const std::string& s) {
    auto begin = std::find_if_not(s.begin(), s.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

Marker markerOf(const std::string& line) {
    std::string text = lower(trim(line));
    if (text.compare(0, 2, "--") != 0) {
        return Marker::None;
    }
    text = trim(text.substr(2));
    if (text == "+migrate up") {
        return Marker::Up;
    }
    if (text == "+migrate down") {
        return Marker::Down;
    }
    return Marker::None;
}

} // anonymous namespace

std::optional<SqlSections> parseSqlSections(const std::string& content) {
    SqlSections sections;
    Marker current = Marker::None;
    bool seenUp = false;
    bool seenDown = false;

    std::istringstream stream(content);
    std::string line;
    while (std::getline(stream, line)) {
        Marker marker = markerOf(line);
        if (marker == Marker::Up) {
            if (seenUp) {
                return std::nullopt;
            }
            seenUp = true;
            current = marker;
            continue;
        }
        if (marker == Marker::Down) {
            if (seenDown) {
                return std::nullopt;
            }
            seenDown = true;
            current = marker;
            continue;
        }

        if (current == Marker::Up) {
            sections.up += line + "\n";
        } else if (current == Marker::Down) {
            sections.down += line + "\n";
        }
    }

    if (!seenUp) {
        return std::nullopt;
    }
    return sections;
}

SqlScript::SqlScript(Connection& conn, SqlSections sections)
    : conn_(conn)
    , sections_(std::move(sections)) {}

bool SqlScript::up() {
    run(sections_.up);
    return true;
}

bool SqlScript::down() {
    run(sections_.down);
    return true;
}

void SqlScript::run(const std::string& sql) {
    if (trim(sql).empty()) {
        return;
    }

    Transaction txn(conn_);
    conn_.execute(sql);
    txn.commit();
}

} // namespace sqlmigrate
