// cppquery/Source/backend/error_translation.cpp
#include "cppquery/backend/error_translation.h"

namespace cppquery {

    ErrorCode errorCodeForCategory(cppquery_sqldriver::ErrorCategory category) {
        using cppquery_sqldriver::ErrorCategory;
        switch (category) {
            case ErrorCategory::NoError:
                return ErrorCode::Ok;
            case ErrorCategory::Connectivity:
                return ErrorCode::ConnectionFailed;
            case ErrorCategory::Syntax:
                return ErrorCode::StatementPreparationError;
            case ErrorCategory::Constraint:
                return ErrorCode::ConstraintViolation;
            case ErrorCategory::Permissions:
            case ErrorCategory::DataRelated:
            case ErrorCategory::Resource:
                return ErrorCode::QueryExecutionError;
            case ErrorCategory::LockTimeout:
                return ErrorCode::LockTimeout;
            case ErrorCategory::Deadlock:
                return ErrorCode::Deadlock;
            case ErrorCategory::Transaction:
                return ErrorCode::TransactionError;
            case ErrorCategory::DriverInternal:
            case ErrorCategory::DatabaseInternal:
                return ErrorCode::InternalError;
            case ErrorCategory::OperationCancelled:
                return ErrorCode::OperationCancelled;
            case ErrorCategory::OperationTimedOut:
                return ErrorCode::Timeout;
            case ErrorCategory::FeatureNotSupported:
                return ErrorCode::UnsupportedFeature;
            case ErrorCategory::Unknown:
                return ErrorCode::UnknownError;
        }
        return ErrorCode::UnknownError;
    }

    Error translateSqlError(const cppquery_sqldriver::SqlError& sql_error, const std::string& dialect, const std::string& failed_query) {
        if (!sql_error.isValid()) {
            // 驱动报告失败却没有留下错误信息
            Error err(ErrorCode::InternalError, "Driver reported a failure without error details");
            err.dialect = dialect;
            err.failed_query = failed_query;
            return err;
        }
        Error err(errorCodeForCategory(sql_error.category()), sql_error.text(), sql_error.resultCode());
        err.dialect = dialect;
        err.constraint_name = sql_error.constraintName();
        err.failed_query = failed_query.empty() ? sql_error.failedQuery() : failed_query;
        return err;
    }

}  // namespace cppquery
