// cppquery/Source/backend/storage_backend_transaction.cpp
#include "cppquery/backend/storage_backend.h"

namespace cppquery {

    namespace {
        Error notConnected(const std::string& dialect, const char* operation) {
            return Error(ErrorCode::ConnectionNotOpen, std::string(operation) + " requires an open connection").withDialect(dialect);
        }
    }  // namespace

    std::expected<void, Error> StorageBackend::beginTransaction(std::optional<cppquery_sqldriver::TransactionIsolationLevel> isolation) {
        if (!isConnected()) return std::unexpected(notConnected(dialect_->name(), "beginTransaction"));
        return transactions_->begin(isolation);
    }

    std::expected<void, Error> StorageBackend::commit() {
        if (!isConnected()) return std::unexpected(notConnected(dialect_->name(), "commit"));
        return transactions_->commit();
    }

    std::expected<void, Error> StorageBackend::rollback() {
        if (!isConnected()) return std::unexpected(notConnected(dialect_->name(), "rollback"));
        return transactions_->rollback();
    }

    std::expected<void, Error> StorageBackend::setIsolationLevel(cppquery_sqldriver::TransactionIsolationLevel level) {
        if (!isConnected()) return std::unexpected(notConnected(dialect_->name(), "setIsolationLevel"));
        return transactions_->setIsolationLevel(level);
    }

    int StorageBackend::transactionLevel() const {
        return transactions_->level();
    }

    bool StorageBackend::inTransaction() const {
        return transactions_->isActive();
    }

    std::expected<void, Error> StorageBackend::runInTransaction(const std::function<std::expected<void, Error>(StorageBackend&)>& work, std::optional<cppquery_sqldriver::TransactionIsolationLevel> isolation) {
        if (auto begun = beginTransaction(isolation); !begun) {
            return begun;
        }
        const int level = transactions_->level();

        std::expected<void, Error> outcome;
        try {
            outcome = work(*this);
        } catch (const std::exception& ex) {
            if (logger_) logger_->error("[StorageBackend] exception inside transaction: {}", ex.what());
            if (transactions_->level() == level) {
                if (auto rolled_back = transactions_->rollback(); !rolled_back && logger_) {
                    logger_->error("[StorageBackend] rollback after exception failed: {}", rolled_back.error().toString());
                }
            }
            throw;
        }

        // work 内部的超时或引擎回滚可能已经结束了这一层
        if (transactions_->level() < level) {
            if (!outcome) return outcome;
            return std::unexpected(Error(ErrorCode::TransactionError, "Transaction ended before the work completed").withDialect(dialect_->name()));
        }

        if (!outcome) {
            if (auto rolled_back = transactions_->rollback(); !rolled_back && logger_) {
                logger_->error("[StorageBackend] rollback failed: {}", rolled_back.error().toString());
            }
            return outcome;
        }
        return transactions_->commit();
    }

}  // namespace cppquery
