// cppquery_sqldriver/sql_enums.h
#pragma once

namespace cppquery_sqldriver {

    // 驱动自身的能力, 与方言的 SQL 能力 (cppquery::DialectFeature) 分开报告
    enum class DriverFeature { Transactions, NamedSavepoints, IsolationLevels, LastInsertId, Returning, CancelQuery, QueryTimeout, ThreadSafe };

    enum class TransactionIsolationLevel { ReadUncommitted, ReadCommitted, RepeatableRead, Serializable, Snapshot, Default };

    const char* isolationLevelName(TransactionIsolationLevel level);

}  // namespace cppquery_sqldriver
