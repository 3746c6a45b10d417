/**
 * @file transaction.hpp
 * @brief RAII transaction guard
 *
 *   {
 *       Transaction txn(conn);
 *       conn.execute("CREATE TABLE ...");
 *       txn.commit();
 *   }  // without commit(), the destructor rolls back
 *
 * Each migration direction and each ledger write runs in its own
 * Transaction; there is no batching across migrations.
 */

#pragma once

#include <string>
#include "exceptions.hpp"

namespace sqlmigrate {

class Connection;

/**
 * @brief SQLite locking strategy for BEGIN
 */
enum class TransactionType {
    Deferred,   // locks on first access
    Immediate,  // reserved (write) lock taken at BEGIN
    Exclusive
};

class Transaction {
public:
    /**
     * @throws TransactionException if BEGIN fails
     */
    explicit Transaction(Connection& conn,
                         TransactionType type = TransactionType::Deferred);

    /**
     * @brief Rolls back if neither commit() nor rollback() ran
     *
     * Never throws; a failed ROLLBACK is logged.
     */
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    Transaction(Transaction&& other) noexcept;
    Transaction& operator=(Transaction&& other) noexcept;

    /**
     * @throws TransactionException if COMMIT fails or the transaction ended
     */
    void commit();

    /**
     * @throws TransactionException if ROLLBACK fails or the transaction ended
     */
    void rollback();

    bool isActive() const { return active_; }

private:
    void rollbackQuietly() noexcept;

    Connection* conn_;
    bool active_ = true;
};

} // namespace sqlmigrate
