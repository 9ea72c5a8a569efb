// SqlDriver/Source/sqlite/sqlite_driver_transaction.cpp
#include <sqlite3.h>

#include "cppquery_sqldriver/sqlite/sqlite_driver.h"
#include "cppquery_sqldriver/sqlite/sqlite_driver_helper.h"

namespace cppquery_sqldriver {

    bool SqliteDriver::beginTransaction() {
        if (!isOpen()) {
            m_last_error_cache = SqlError(ErrorCategory::Connectivity, "Connection is not open.", "beginTransaction");
            return false;
        }
        return executeSimple(sqlite_helper::isolationBeginStatement(m_isolation_level), "beginTransaction");
    }

    bool SqliteDriver::commitTransaction() {
        if (!isOpen()) {
            m_last_error_cache = SqlError(ErrorCategory::Connectivity, "Connection is not open.", "commitTransaction");
            return false;
        }
        return executeSimple("COMMIT", "commitTransaction");
    }

    bool SqliteDriver::rollbackTransaction() {
        if (!isOpen()) {
            m_last_error_cache = SqlError(ErrorCategory::Connectivity, "Connection is not open.", "rollbackTransaction");
            return false;
        }
        return executeSimple("ROLLBACK", "rollbackTransaction");
    }

    // SQLite 只区分两种行为: SERIALIZABLE 用 BEGIN IMMEDIATE 抢占写锁,
    // READ UNCOMMITTED 打开 read_uncommitted (仅共享缓存模式下有效果)
    bool SqliteDriver::setTransactionIsolationLevel(TransactionIsolationLevel level) {
        if (!isOpen()) {
            m_last_error_cache = SqlError(ErrorCategory::Connectivity, "Connection is not open.", "setTransactionIsolationLevel");
            return false;
        }
        switch (level) {
            case TransactionIsolationLevel::Default:
            case TransactionIsolationLevel::Serializable:
                if (!executeSimple("PRAGMA read_uncommitted = 0", "setTransactionIsolationLevel")) return false;
                break;
            case TransactionIsolationLevel::ReadUncommitted:
                if (!executeSimple("PRAGMA read_uncommitted = 1", "setTransactionIsolationLevel")) return false;
                break;
            default:
                m_last_error_cache = SqlError(ErrorCategory::FeatureNotSupported, std::string("Isolation level ") + isolationLevelName(level) + " is not supported by SQLite.", "setTransactionIsolationLevel");
                return false;
        }
        m_isolation_level = level;
        return true;
    }

    TransactionIsolationLevel SqliteDriver::transactionIsolationLevel() const {
        return m_isolation_level;
    }

    bool SqliteDriver::setSavepoint(const std::string& name) {
        if (!isOpen()) {
            m_last_error_cache = SqlError(ErrorCategory::Connectivity, "Connection is not open.", "setSavepoint");
            return false;
        }
        return executeSimple("SAVEPOINT " + sqlite_helper::quoteIdentifier(name), "setSavepoint");
    }

    bool SqliteDriver::rollbackToSavepoint(const std::string& name) {
        if (!isOpen()) {
            m_last_error_cache = SqlError(ErrorCategory::Connectivity, "Connection is not open.", "rollbackToSavepoint");
            return false;
        }
        return executeSimple("ROLLBACK TO SAVEPOINT " + sqlite_helper::quoteIdentifier(name), "rollbackToSavepoint");
    }

    bool SqliteDriver::releaseSavepoint(const std::string& name) {
        if (!isOpen()) {
            m_last_error_cache = SqlError(ErrorCategory::Connectivity, "Connection is not open.", "releaseSavepoint");
            return false;
        }
        return executeSimple("RELEASE SAVEPOINT " + sqlite_helper::quoteIdentifier(name), "releaseSavepoint");
    }

    bool SqliteDriver::isInTransaction() const {
        std::lock_guard<std::mutex> lock(m_handle_mutex);
        return m_db != nullptr && sqlite3_get_autocommit(m_db) == 0;
    }

}  // namespace cppquery_sqldriver
