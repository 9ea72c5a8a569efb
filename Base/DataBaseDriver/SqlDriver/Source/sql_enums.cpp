// Source/sql_enums.cpp
#include "cppquery_sqldriver/sql_enums.h"

namespace cppquery_sqldriver {

    const char* isolationLevelName(TransactionIsolationLevel level) {
        switch (level) {
            case TransactionIsolationLevel::ReadUncommitted:
                return "READ UNCOMMITTED";
            case TransactionIsolationLevel::ReadCommitted:
                return "READ COMMITTED";
            case TransactionIsolationLevel::RepeatableRead:
                return "REPEATABLE READ";
            case TransactionIsolationLevel::Serializable:
                return "SERIALIZABLE";
            case TransactionIsolationLevel::Snapshot:
                return "SNAPSHOT";
            case TransactionIsolationLevel::Default:
                return "DEFAULT";
        }
        return "DEFAULT";
    }

}  // namespace cppquery_sqldriver
