/**
 * @file transaction.cpp
 * @brief Implementation of Transaction
 */

#include "sqlmigrate/transaction.hpp"
#include "sqlmigrate/connection.hpp"
#include "sqlmigrate/log.hpp"

namespace sqlmigrate {

Transaction::Transaction(Connection& conn, TransactionType type)
    : conn_(&conn)
{
    std::string sql;
    switch (type) {
        case TransactionType::Deferred:
            sql = "BEGIN DEFERRED TRANSACTION";
            break;
        case TransactionType::Immediate:
            sql = "BEGIN IMMEDIATE TRANSACTION";
            break;
        case TransactionType::Exclusive:
            sql = "BEGIN EXCLUSIVE TRANSACTION";
            break;
    }

    try {
        conn_->execute(sql);
    } catch (const DatabaseException& e) {
        throw TransactionException("Failed to begin transaction: " + std::string(e.what()), e.errorCode());
    }
}

Transaction::~Transaction() {
    rollbackQuietly();
}

Transaction::Transaction(Transaction&& other) noexcept
    : conn_(other.conn_)
    , active_(other.active_)
{
    other.conn_ = nullptr;
    other.active_ = false;
}

Transaction& Transaction::operator=(Transaction&& other) noexcept {
    if (this != &other) {
        rollbackQuietly();

        conn_ = other.conn_;
        active_ = other.active_;
        other.conn_ = nullptr;
        other.active_ = false;
    }
    return *this;
}

void Transaction::rollbackQuietly() noexcept {
    if (active_ && conn_) {
        active_ = false;
        try {
            conn_->execute("ROLLBACK");
        } catch (const std::exception& e) {
            log::warn("Implicit rollback failed: {}", e.what());
        }
    }
}

void Transaction::commit() {
    if (!active_) {
        throw TransactionException("Transaction already ended");
    }

    try {
        conn_->execute("COMMIT");
        active_ = false;
    } catch (const DatabaseException& e) {
        throw TransactionException("Failed to commit: " + std::string(e.what()), e.errorCode());
    }
}

void Transaction::rollback() {
    if (!active_) {
        throw TransactionException("Transaction already ended");
    }

    try {
        conn_->execute("ROLLBACK");
        active_ = false;
    } catch (const DatabaseException& e) {
        throw TransactionException("Failed to rollback: " + std::string(e.what()), e.errorCode());
    }
}

} // namespace sqlmigrate
