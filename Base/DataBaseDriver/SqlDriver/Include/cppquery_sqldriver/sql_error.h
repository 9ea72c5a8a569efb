// cppquery_sqldriver/sql_error.h
#pragma once
#include <string>
#include <utility>

namespace cppquery_sqldriver {

    // 驱动层错误分类, 由后端统一转换为 cppquery::ErrorCode
    enum class ErrorCategory { NoError, Connectivity, Syntax, Constraint, Permissions, DataRelated, Resource, LockTimeout, Deadlock, Transaction, DriverInternal, DatabaseInternal, OperationCancelled, OperationTimedOut, FeatureNotSupported, Unknown };

    const char* errorCategoryName(ErrorCategory category);

    // 一次驱动调用失败的描述.
    // message 是引擎给出的原文, context 是失败的驱动动作 ("prepare", "exec", "open 'x.db'" ...).
    // result_code 保存扩展结果码 (例如 SQLITE_CONSTRAINT_UNIQUE), 低 8 位为主结果码
    class SqlError {
      public:
        SqlError() = default;
        SqlError(ErrorCategory category, std::string message, std::string context = "", int result_code = 0, std::string failed_query = "", std::string constraint_name = "");

        ErrorCategory category() const {
            return category_;
        }
        const std::string& message() const {
            return message_;
        }
        const std::string& context() const {
            return context_;
        }
        int resultCode() const {
            return result_code_;
        }
        int primaryResultCode() const {
            return result_code_ & 0xFF;
        }
        const std::string& failedQuery() const {
            return failed_query_;
        }
        const std::string& constraintName() const {
            return constraint_name_;
        }

        bool isValid() const {
            return category_ != ErrorCategory::NoError;
        }
        // 锁等待超时与死锁可以由调用方重试
        bool isRetryable() const {
            return category_ == ErrorCategory::LockTimeout || category_ == ErrorCategory::Deadlock;
        }

        // "context: message"
        std::string text() const;
        // "[Category] context: message (code N)", 用于日志
        std::string describe() const;

        void setCategory(ErrorCategory category) {
            category_ = category;
        }
        void setMessage(std::string message) {
            message_ = std::move(message);
        }
        void setFailedQuery(std::string query) {
            failed_query_ = std::move(query);
        }
        void clear() {
            *this = SqlError();
        }

      private:
        ErrorCategory category_ = ErrorCategory::NoError;
        std::string message_;
        std::string context_;
        int result_code_ = 0;
        std::string failed_query_;
        std::string constraint_name_;
    };

}  // namespace cppquery_sqldriver
