// cppquery/Source/backend/transaction_manager.cpp
#include "cppquery/backend/transaction_manager.h"

#include "cppquery/backend/error_translation.h"

namespace cppquery {

    TransactionManager::TransactionManager(cppquery_sqldriver::ISqlDriver& driver, std::string dialect_name, bool supports_savepoint, std::shared_ptr<spdlog::logger> logger)
        : driver_(driver), dialect_name_(std::move(dialect_name)), supports_savepoint_(supports_savepoint), logger_(std::move(logger)) {
    }

    std::string TransactionManager::savepointName(int level) {
        return "sp_" + std::to_string(level);
    }

    Error TransactionManager::driverError_(const char* operation, ErrorCode fallback) const {
        Error err = translateSqlError(driver_.lastError(), dialect_name_);
        if (err.code == ErrorCode::InternalError || err.code == ErrorCode::UnknownError || err.code == ErrorCode::StatementPreparationError) {
            err.code = fallback;
        }
        err.message = std::string(operation) + " failed: " + err.message;
        return err;
    }

    std::expected<void, Error> TransactionManager::setIsolationLevel(cppquery_sqldriver::TransactionIsolationLevel level) {
        if (isActive()) {
            return std::unexpected(Error(ErrorCode::IsolationLevelError, "Isolation level cannot be changed inside an active transaction").withDialect(dialect_name_));
        }
        if (!driver_.setTransactionIsolationLevel(level)) {
            Error err = driverError_("setIsolationLevel", ErrorCode::IsolationLevelError);
            if (err.code == ErrorCode::UnsupportedFeature) err.code = ErrorCode::IsolationLevelError;
            return std::unexpected(err);
        }
        isolation_ = level;
        if (logger_) logger_->debug("[Transaction] isolation level set to {}", cppquery_sqldriver::isolationLevelName(level));
        return {};
    }

    std::expected<void, Error> TransactionManager::begin(std::optional<cppquery_sqldriver::TransactionIsolationLevel> isolation) {
        if (level_ == 0) {
            if (isolation) {
                if (auto applied = setIsolationLevel(*isolation); !applied) {
                    return std::unexpected(applied.error());
                }
            }
            if (!driver_.beginTransaction()) {
                return std::unexpected(driverError_("BEGIN", ErrorCode::TransactionError));
            }
            level_ = 1;
            statements_in_transaction_ = 0;
            if (logger_) logger_->debug("[Transaction] BEGIN (level 1)");
            return {};
        }

        if (isolation) {
            return std::unexpected(Error(ErrorCode::IsolationLevelError, "A nested transaction cannot change the isolation level").withDialect(dialect_name_));
        }
        if (!supports_savepoint_) {
            return std::unexpected(Error(ErrorCode::TransactionError, "Nested transactions are unsupported by this dialect").withDialect(dialect_name_));
        }
        const std::string name = savepointName(level_);
        if (!driver_.setSavepoint(name)) {
            return std::unexpected(driverError_("SAVEPOINT", ErrorCode::TransactionError));
        }
        ++level_;
        if (logger_) logger_->debug("[Transaction] SAVEPOINT {} (level {})", name, level_);
        return {};
    }

    std::expected<void, Error> TransactionManager::commit() {
        if (level_ == 0) {
            return std::unexpected(Error(ErrorCode::TransactionError, "commit() called without an active transaction").withDialect(dialect_name_));
        }
        if (level_ > 1) {
            const std::string name = savepointName(level_ - 1);
            if (!driver_.releaseSavepoint(name)) {
                Error err = driverError_("RELEASE SAVEPOINT", ErrorCode::TransactionError);
                resynchronize();
                return std::unexpected(err);
            }
            --level_;
            if (logger_) logger_->debug("[Transaction] RELEASE {} (level {})", name, level_);
            return {};
        }

        if (!driver_.commitTransaction()) {
            Error err = driverError_("COMMIT", ErrorCode::TransactionError);
            // 例如约束延迟检查失败后引擎已经回滚
            resynchronize();
            return std::unexpected(err);
        }
        level_ = 0;
        if (logger_) logger_->debug("[Transaction] COMMIT ({} statements)", statements_in_transaction_);
        statements_in_transaction_ = 0;
        return {};
    }

    std::expected<void, Error> TransactionManager::rollback() {
        if (level_ == 0) {
            return std::unexpected(Error(ErrorCode::TransactionError, "rollback() called without an active transaction").withDialect(dialect_name_));
        }
        if (level_ > 1) {
            const std::string name = savepointName(level_ - 1);
            if (!driver_.rollbackToSavepoint(name) || !driver_.releaseSavepoint(name)) {
                Error err = driverError_("ROLLBACK TO SAVEPOINT", ErrorCode::TransactionError);
                resynchronize();
                return std::unexpected(err);
            }
            --level_;
            if (logger_) logger_->debug("[Transaction] ROLLBACK TO {} (level {})", name, level_);
            return {};
        }

        const bool ok = driver_.rollbackTransaction();
        // 无论 ROLLBACK 是否成功, 外层事务都视为结束
        level_ = 0;
        statements_in_transaction_ = 0;
        if (!ok) {
            if (!driver_.isInTransaction()) {
                if (logger_) logger_->warn("[Transaction] ROLLBACK failed but engine has no open transaction: {}", driver_.lastError().describe());
                return {};
            }
            return std::unexpected(driverError_("ROLLBACK", ErrorCode::TransactionError));
        }
        if (logger_) logger_->debug("[Transaction] ROLLBACK");
        return {};
    }

    std::expected<void, Error> TransactionManager::rollbackAll() {
        if (level_ == 0) {
            return {};
        }
        level_ = 1;
        return rollback();
    }

    void TransactionManager::noteStatementExecuted() {
        if (level_ > 0) {
            ++statements_in_transaction_;
        }
    }

    bool TransactionManager::resynchronize() {
        if (level_ > 0 && !driver_.isInTransaction()) {
            if (logger_) logger_->warn("[Transaction] engine ended the transaction on its own, discarding {} nesting level(s)", level_);
            level_ = 0;
            statements_in_transaction_ = 0;
            return true;
        }
        return false;
    }

    void TransactionManager::reset() {
        level_ = 0;
        statements_in_transaction_ = 0;
        isolation_.reset();
    }

}  // namespace cppquery
