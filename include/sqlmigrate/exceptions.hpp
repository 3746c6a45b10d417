/**
 * @file exceptions.hpp
 * @brief Exception hierarchy for sqlmigrate
 *
 * Everything thrown by the library derives from DatabaseException, so
 * callers can catch broadly or pick out a single failure mode:
 *
 *   DatabaseException
 *   ├── ConnectionException, QueryException, ConstraintException,
 *   │   TransactionException          (SQLite layer)
 *   ├── ConfigException, TemplateException, LockException
 *   └── MigrationException            (carries the migration identifier)
 *       ├── UnresolvableMigrationException
 *       ├── MigrationFailedException
 *       ├── RollbackFailedException
 *       └── LedgerWriteException
 */

#pragma once

#include <exception>
#include <string>
#include <vector>

namespace sqlmigrate {

/**
 * @brief Base exception for all library errors
 */
class DatabaseException : public std::exception {
public:
    explicit DatabaseException(std::string message, int errorCode = 0)
        : message_(std::move(message))
        , errorCode_(errorCode)
    {
        if (errorCode_ != 0) {
            fullMessage_ = message_ + " (SQLite error code: " + std::to_string(errorCode_) + ")";
        } else {
            fullMessage_ = message_;
        }
    }

    const char* what() const noexcept override {
        return fullMessage_.c_str();
    }

    int errorCode() const noexcept {
        return errorCode_;
    }

    const std::string& message() const noexcept {
        return message_;
    }

protected:
    std::string message_;
    std::string fullMessage_;
    int errorCode_;
};

// ========== SQLite layer ==========

class ConnectionException : public DatabaseException {
public:
    explicit ConnectionException(const std::string& message, int errorCode = 0)
        : DatabaseException("Connection error: " + message, errorCode) {}
};

/**
 * @brief A statement failed to prepare or execute; keeps the offending SQL
 */
class QueryException : public DatabaseException {
public:
    QueryException(const std::string& message, const std::string& sql, int errorCode = 0)
        : DatabaseException("Query error: " + message, errorCode)
        , sql_(sql)
    {
        fullMessage_ += "\nSQL: " + sql_;
    }

    const std::string& sql() const noexcept {
        return sql_;
    }

private:
    std::string sql_;
};

class ConstraintException : public DatabaseException {
public:
    explicit ConstraintException(const std::string& message, int errorCode = 0)
        : DatabaseException("Constraint violation: " + message, errorCode) {}
};

class TransactionException : public DatabaseException {
public:
    explicit TransactionException(const std::string& message, int errorCode = 0)
        : DatabaseException("Transaction error: " + message, errorCode) {}
};

// ========== Configuration and tooling ==========

/**
 * @brief Invalid configuration value or command-line usage
 */
class ConfigException : public DatabaseException {
public:
    explicit ConfigException(const std::string& message)
        : DatabaseException("Configuration error: " + message) {}
};

/**
 * @brief Template lookup, rendering or file write failed
 */
class TemplateException : public DatabaseException {
public:
    explicit TemplateException(const std::string& message)
        : DatabaseException("Template error: " + message) {}
};

/**
 * @brief Another runner holds the migration lock
 */
class LockException : public DatabaseException {
public:
    explicit LockException(const std::string& message)
        : DatabaseException("Lock error: " + message) {}
};

// ========== Migration engine ==========

/**
 * @brief Base for failures tied to one migration identifier
 *
 * When raised out of Migrator::runPending(), completed() lists the
 * migrations that were applied and logged before the failure.
 */
class MigrationException : public DatabaseException {
public:
    MigrationException(const std::string& message, const std::string& identifier)
        : DatabaseException("Migration error at " + identifier + ": " + message)
        , identifier_(identifier) {}

    const std::string& identifier() const noexcept {
        return identifier_;
    }

    const std::vector<std::string>& completed() const noexcept {
        return completed_;
    }

    void setCompleted(std::vector<std::string> completed) {
        completed_ = std::move(completed);
    }

private:
    std::string identifier_;
    std::vector<std::string> completed_;
};

/**
 * @brief No script could be located or constructed for an identifier
 *
 * Authoring or configuration error. Never retried.
 */
class UnresolvableMigrationException : public MigrationException {
public:
    UnresolvableMigrationException(const std::string& message, const std::string& identifier)
        : MigrationException("Unresolvable migration: " + message, identifier) {}
};

/**
 * @brief A migration's up() reported failure or threw; nothing was logged
 */
class MigrationFailedException : public MigrationException {
public:
    MigrationFailedException(const std::string& message, const std::string& identifier)
        : MigrationException("Migration failed: " + message, identifier) {}
};

/**
 * @brief A migration's down() reported failure or threw; ledger untouched
 */
class RollbackFailedException : public MigrationException {
public:
    RollbackFailedException(const std::string& message, const std::string& identifier)
        : MigrationException("Rollback failed: " + message, identifier) {}
};

/**
 * @brief Recording or removing a ledger entry failed at the storage level
 */
class LedgerWriteException : public MigrationException {
public:
    LedgerWriteException(const std::string& message, const std::string& identifier, int errorCode = 0)
        : MigrationException("Ledger write failed: " + message, identifier)
    {
        errorCode_ = errorCode;
        if (errorCode_ != 0) {
            fullMessage_ += " (SQLite error code: " + std::to_string(errorCode_) + ")";
        }
    }
};

} // namespace sqlmigrate
