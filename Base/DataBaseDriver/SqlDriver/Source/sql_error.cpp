// SqlDriver/Source/sql_error.cpp
#include "cppquery_sqldriver/sql_error.h"

#include <utility>

namespace cppquery_sqldriver {

    const char* errorCategoryName(ErrorCategory category) {
        switch (category) {
            case ErrorCategory::NoError:
                return "NoError";
            case ErrorCategory::Connectivity:
                return "Connectivity";
            case ErrorCategory::Syntax:
                return "Syntax";
            case ErrorCategory::Constraint:
                return "Constraint";
            case ErrorCategory::Permissions:
                return "Permissions";
            case ErrorCategory::DataRelated:
                return "DataRelated";
            case ErrorCategory::Resource:
                return "Resource";
            case ErrorCategory::LockTimeout:
                return "LockTimeout";
            case ErrorCategory::Deadlock:
                return "Deadlock";
            case ErrorCategory::Transaction:
                return "Transaction";
            case ErrorCategory::DriverInternal:
                return "DriverInternal";
            case ErrorCategory::DatabaseInternal:
                return "DatabaseInternal";
            case ErrorCategory::OperationCancelled:
                return "OperationCancelled";
            case ErrorCategory::OperationTimedOut:
                return "OperationTimedOut";
            case ErrorCategory::FeatureNotSupported:
                return "FeatureNotSupported";
            case ErrorCategory::Unknown:
                break;
        }
        return "Unknown";
    }

    SqlError::SqlError(ErrorCategory category, std::string message, std::string context, int result_code, std::string failed_query, std::string constraint_name)
        : category_(category), message_(std::move(message)), context_(std::move(context)), result_code_(result_code), failed_query_(std::move(failed_query)), constraint_name_(std::move(constraint_name)) {
    }

    std::string SqlError::text() const {
        if (context_.empty()) return message_;
        if (message_.empty()) return context_;
        return context_ + ": " + message_;
    }

    std::string SqlError::describe() const {
        std::string out = "[";
        out += errorCategoryName(category_);
        out += "] ";
        out += text();
        if (result_code_ != 0) {
            out += " (code " + std::to_string(result_code_) + ")";
        }
        return out;
    }

}  // namespace cppquery_sqldriver
