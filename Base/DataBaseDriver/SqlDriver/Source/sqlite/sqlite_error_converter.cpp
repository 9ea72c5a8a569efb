// SqlDriver/Source/sqlite/sqlite_error_converter.cpp
#include <sqlite3.h>

#include "cppquery_sqldriver/sqlite/sqlite_driver_helper.h"

namespace cppquery_sqldriver {

    namespace sqlite_helper {

        ErrorCategory categoryForResultCode(int extended_rc, const std::string& message) {
            const int primary = extended_rc & 0xFF;
            switch (primary) {
                case SQLITE_OK:
                case SQLITE_ROW:
                case SQLITE_DONE:
                    return ErrorCategory::NoError;
                case SQLITE_CONSTRAINT:
                    return ErrorCategory::Constraint;
                case SQLITE_BUSY:
                case SQLITE_LOCKED:
                    return ErrorCategory::LockTimeout;
                case SQLITE_INTERRUPT:
                    return ErrorCategory::OperationCancelled;
                case SQLITE_CANTOPEN:
                case SQLITE_NOTADB:
                    return ErrorCategory::Connectivity;
                case SQLITE_AUTH:
                case SQLITE_PERM:
                case SQLITE_READONLY:
                    return ErrorCategory::Permissions;
                case SQLITE_MISMATCH:
                case SQLITE_RANGE:
                case SQLITE_TOOBIG:
                    return ErrorCategory::DataRelated;
                case SQLITE_NOMEM:
                case SQLITE_FULL:
                case SQLITE_IOERR:
                    return ErrorCategory::Resource;
                case SQLITE_CORRUPT:
                    return ErrorCategory::DatabaseInternal;
                case SQLITE_MISUSE:
                    return ErrorCategory::DriverInternal;
                case SQLITE_ERROR:
                    // SQLITE_ERROR 覆盖了语法错误与对象不存在, 只能依靠消息文本细分
                    if (message.find("syntax error") != std::string::npos || message.find("no such ") != std::string::npos || message.find("incomplete input") != std::string::npos ||
                        message.find("unrecognized token") != std::string::npos) {
                        return ErrorCategory::Syntax;
                    }
                    if (message.find("cannot start a transaction within a transaction") != std::string::npos || message.find("no transaction is active") != std::string::npos) {
                        return ErrorCategory::Transaction;
                    }
                    return ErrorCategory::Syntax;
                default:
                    return ErrorCategory::Unknown;
            }
        }

        std::string extractConstraintName(const std::string& message) {
            static const std::string marker = "constraint failed: ";
            auto pos = message.find(marker);
            if (pos == std::string::npos) {
                return {};
            }
            std::string rest = message.substr(pos + marker.size());
            // 复合约束形如 "t.a, t.b", 保留完整列表
            while (!rest.empty() && (rest.back() == ' ' || rest.back() == '\n')) {
                rest.pop_back();
            }
            return rest;
        }

        SqlError makeSqlError(sqlite3* db, int rc, const std::string& context, const std::string& failed_query) {
            int extended_rc = rc;
            std::string message;
            if (db) {
                extended_rc = sqlite3_extended_errcode(db);
                if ((extended_rc & 0xFF) != (rc & 0xFF)) {
                    extended_rc = rc;
                }
                message = sqlite3_errmsg(db);
            } else {
                message = sqlite3_errstr(rc);
            }

            ErrorCategory category = categoryForResultCode(extended_rc, message);
            std::string constraint;
            if (category == ErrorCategory::Constraint) {
                constraint = extractConstraintName(message);
            }
            return SqlError(category, message, context, extended_rc, failed_query, constraint);
        }

    }  // namespace sqlite_helper
}  // namespace cppquery_sqldriver
