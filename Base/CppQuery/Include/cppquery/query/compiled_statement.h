#ifndef cppquery_COMPILED_STATEMENT_H
#define cppquery_COMPILED_STATEMENT_H

#include <string>
#include <vector>

#include "cppquery_sqldriver/sql_value.h"

namespace cppquery {

    // 终结调用的渲染结果: 只含方言占位符的 SQL 与按出现顺序排列的绑定值
    struct CompiledStatement {
        std::string sql;
        std::vector<cppquery_sqldriver::SqlValue> params;

        bool operator==(const CompiledStatement& other) const {
            return sql == other.sql && params == other.params;
        }
    };

}  // namespace cppquery

#endif  // cppquery_COMPILED_STATEMENT_H
