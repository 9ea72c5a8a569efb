#ifndef cppquery_STATEMENT_CLASSIFIER_H
#define cppquery_STATEMENT_CLASSIFIER_H

#include <string_view>

#include "cppquery/query/query_result.h"

namespace cppquery {

    struct StatementClassification {
        StatementKind kind = StatementKind::Other;
        bool returns_rows = false;   // SELECT, 带 RETURNING 的 DML, PRAGMA / EXPLAIN 等
        bool has_returning = false;  // DML ... RETURNING
    };

    // 基于首个关键字的语句分类. 跳过注释、引号内文本与前导 WITH 子句
    class StatementClassifier {
      public:
        static StatementClassification classify(std::string_view sql);
    };

}  // namespace cppquery

#endif  // cppquery_STATEMENT_CLASSIFIER_H
