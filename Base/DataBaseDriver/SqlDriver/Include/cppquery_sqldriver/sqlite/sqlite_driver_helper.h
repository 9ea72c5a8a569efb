// cppquery_sqldriver/sqlite/sqlite_driver_helper.h
#pragma once

#include <string>

#include "cppquery_sqldriver/sql_enums.h"
#include "cppquery_sqldriver/sql_error.h"
#include "cppquery_sqldriver/sql_field.h"
#include "cppquery_sqldriver/sql_value.h"

struct sqlite3;
struct sqlite3_stmt;

namespace cppquery_sqldriver {

    namespace sqlite_helper {

        // --- 在 sqlite_error_converter.cpp 中实现 ---
        // 按主/扩展结果码与错误文本归类
        ErrorCategory categoryForResultCode(int extended_rc, const std::string& message);
        // 从 "UNIQUE constraint failed: users.email" 之类的消息中提取约束对象
        std::string extractConstraintName(const std::string& message);
        SqlError makeSqlError(sqlite3* db, int rc, const std::string& context, const std::string& failed_query = "");

        // --- 在 sqlite_value_converter.cpp 中实现 ---
        // 返回 sqlite3_bind_* 的结果码
        int bindValue(sqlite3_stmt* stmt, int one_based_index, const SqlValue& value);
        SqlValue columnValue(sqlite3_stmt* stmt, int column_index);
        SqlField columnField(sqlite3_stmt* stmt, int column_index);

        // --- 在 sqlite_driver_utility.cpp 中实现 ---
        std::string quoteIdentifier(const std::string& identifier);
        std::string isolationBeginStatement(TransactionIsolationLevel level);

    }  // namespace sqlite_helper
}  // namespace cppquery_sqldriver
