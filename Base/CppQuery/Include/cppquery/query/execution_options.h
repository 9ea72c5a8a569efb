#ifndef cppquery_EXECUTION_OPTIONS_H
#define cppquery_EXECUTION_OPTIONS_H

#include <chrono>
#include <map>
#include <optional>
#include <string>

#include "cppquery/logical_type.h"
#include "cppquery/query/query_result.h"

namespace cppquery {

    struct ExecutionOptions {
        // 未设置时由后端根据 SQL 文本分类
        std::optional<StatementKind> classification;
        // DML 是否带 RETURNING (会返回行)
        bool returning = false;
        // 结果列名 -> 逻辑类型; 未给出的列按声明类型或存储类别推断
        std::map<std::string, LogicalType> column_types;
        // 覆盖后端配置的语句超时
        std::optional<std::chrono::milliseconds> timeout;
        // 允许在显式事务中执行 DDL
        bool allow_ddl_in_transaction = false;
    };

}  // namespace cppquery

#endif  // cppquery_EXECUTION_OPTIONS_H
