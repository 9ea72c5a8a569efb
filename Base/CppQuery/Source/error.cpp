// cppquery/error.cpp
#include "cppquery/error.h"

namespace cppquery {

    const char* errorCodeName(ErrorCode code) {
        switch (code) {
            case ErrorCode::Ok:
                return "Ok";
            case ErrorCode::InvalidConfiguration:
                return "InvalidConfiguration";
            case ErrorCode::ConstructionError:
                return "ConstructionError";
            case ErrorCode::UnsupportedFeature:
                return "UnsupportedFeature";
            case ErrorCode::ConnectionFailed:
                return "ConnectionFailed";
            case ErrorCode::ConnectionAlreadyOpen:
                return "ConnectionAlreadyOpen";
            case ErrorCode::ConnectionNotOpen:
                return "ConnectionNotOpen";
            case ErrorCode::DriverNotFound:
                return "DriverNotFound";
            case ErrorCode::ConstraintViolation:
                return "ConstraintViolation";
            case ErrorCode::LockTimeout:
                return "LockTimeout";
            case ErrorCode::Deadlock:
                return "Deadlock";
            case ErrorCode::VersionConflict:
                return "VersionConflict";
            case ErrorCode::TypeConversionError:
                return "TypeConversionError";
            case ErrorCode::StatementPreparationError:
                return "StatementPreparationError";
            case ErrorCode::QueryExecutionError:
                return "QueryExecutionError";
            case ErrorCode::TransactionError:
                return "TransactionError";
            case ErrorCode::IsolationLevelError:
                return "IsolationLevelError";
            case ErrorCode::RecursionLimitExceeded:
                return "RecursionLimitExceeded";
            case ErrorCode::QueryAlreadyConsumed:
                return "QueryAlreadyConsumed";
            case ErrorCode::OperationCancelled:
                return "OperationCancelled";
            case ErrorCode::Timeout:
                return "Timeout";
            case ErrorCode::InternalError:
                return "InternalError";
            case ErrorCode::UnknownError:
                return "UnknownError";
        }
        return "UnknownError";
    }

    const char* errorKindName(ErrorKind kind) {
        switch (kind) {
            case ErrorKind::None:
                return "none";
            case ErrorKind::Construction:
                return "construction";
            case ErrorKind::Capability:
                return "capability";
            case ErrorKind::Connection:
                return "connection";
            case ErrorKind::Integrity:
                return "integrity";
            case ErrorKind::Concurrency:
                return "concurrency";
            case ErrorKind::TypeConversion:
                return "type-conversion";
            case ErrorKind::Execution:
                return "execution";
            case ErrorKind::Transaction:
                return "transaction";
            case ErrorKind::Cancellation:
                return "cancellation";
            case ErrorKind::Timeout:
                return "timeout";
            case ErrorKind::Internal:
                return "internal";
        }
        return "internal";
    }

    ErrorKind errorKindOf(ErrorCode code) {
        switch (code) {
            case ErrorCode::Ok:
                return ErrorKind::None;
            case ErrorCode::InvalidConfiguration:
            case ErrorCode::ConstructionError:
            case ErrorCode::QueryAlreadyConsumed:
                return ErrorKind::Construction;
            case ErrorCode::UnsupportedFeature:
                return ErrorKind::Capability;
            case ErrorCode::ConnectionFailed:
            case ErrorCode::ConnectionAlreadyOpen:
            case ErrorCode::ConnectionNotOpen:
            case ErrorCode::DriverNotFound:
                return ErrorKind::Connection;
            case ErrorCode::ConstraintViolation:
                return ErrorKind::Integrity;
            case ErrorCode::LockTimeout:
            case ErrorCode::Deadlock:
            case ErrorCode::VersionConflict:
                return ErrorKind::Concurrency;
            case ErrorCode::TypeConversionError:
                return ErrorKind::TypeConversion;
            case ErrorCode::StatementPreparationError:
            case ErrorCode::QueryExecutionError:
            case ErrorCode::RecursionLimitExceeded:
                return ErrorKind::Execution;
            case ErrorCode::TransactionError:
            case ErrorCode::IsolationLevelError:
                return ErrorKind::Transaction;
            case ErrorCode::OperationCancelled:
                return ErrorKind::Cancellation;
            case ErrorCode::Timeout:
                return ErrorKind::Timeout;
            case ErrorCode::InternalError:
            case ErrorCode::UnknownError:
                return ErrorKind::Internal;
        }
        return ErrorKind::Internal;
    }

    std::string Error::toString() const {
        std::string err_str = std::string("[") + errorKindName(kind()) + "] " + errorCodeName(code);
        err_str += " (dialect: " + (dialect.empty() ? std::string("n/a") : dialect) + ")";
        if (!clause.empty()) {
            err_str += " in " + clause;
        }
        if (!message.empty()) {
            err_str += ": " + message;
        }
        if (!constraint_name.empty()) {
            err_str += ", Constraint: " + constraint_name;
        }
        if (native_db_error_code != 0) {
            err_str += ", DB Error: " + std::to_string(native_db_error_code);
        }
        if (!sql_state.empty()) {
            err_str += ", SQLState: " + sql_state;
        }
        return err_str;
    }

    Error makeConstructionError(std::string message, std::string clause, std::string dialect) {
        Error err(ErrorCode::ConstructionError, std::move(message));
        err.clause = std::move(clause);
        err.dialect = std::move(dialect);
        return err;
    }

    Error makeCapabilityError(std::string message, std::string clause, std::string dialect) {
        Error err(ErrorCode::UnsupportedFeature, std::move(message));
        err.clause = std::move(clause);
        err.dialect = std::move(dialect);
        return err;
    }

}  // namespace cppquery
