#ifndef cppquery_ACTIVE_QUERY_STATE_H
#define cppquery_ACTIVE_QUERY_STATE_H

#include <optional>
#include <string>
#include <vector>

#include "cppquery/expression/expression.h"
#include "cppquery/expression/operators.h"

namespace cppquery {

    // FROM / JOIN 的数据源: 普通表, CTE 引用, 或带别名的子查询
    struct TableSource {
        enum class Kind { None, Table, Cte, Subquery };

        Kind kind = Kind::None;
        std::string name;                  // 表名或 CTE 名
        std::optional<std::string> alias;  // 子查询必须有别名
        QuerySourcePtr subquery;

        static TableSource table(std::string table_name, std::optional<std::string> alias = std::nullopt) {
            return TableSource{Kind::Table, std::move(table_name), std::move(alias), nullptr};
        }
        static TableSource cte(std::string cte_name, std::optional<std::string> alias = std::nullopt) {
            return TableSource{Kind::Cte, std::move(cte_name), std::move(alias), nullptr};
        }
        static TableSource fromSubquery(QuerySourcePtr query, std::string alias) {
            return TableSource{Kind::Subquery, std::string(), std::move(alias), std::move(query)};
        }

        bool empty() const {
            return kind == Kind::None;
        }
        // 在 SQL 中引用这个数据源时使用的名字
        std::string referenceName() const {
            return alias ? *alias : name;
        }
    };

    struct SelectItem {
        ExprPtr expr;
        std::optional<std::string> alias;
    };

    struct JoinClause {
        JoinType type = JoinType::Inner;
        TableSource source;
        ExprPtr on;  // CROSS JOIN 为空
    };

    // ActiveQuery 的全部可变状态. 各子句按调用顺序追加
    struct ActiveQueryState {
        TableSource from;
        std::vector<SelectItem> select_items;  // 为空表示 SELECT *
        bool distinct = false;
        std::vector<JoinClause> joins;
        ExprPtr where;  // 累积的 WHERE 树, 为空表示无条件
        std::vector<ExprPtr> group_by;
        ExprPtr having;
        std::vector<OrderTerm> order_by;
        std::optional<long long> limit;
        std::optional<long long> offset;
        LockMode lock = LockMode::None;
    };

}  // namespace cppquery

#endif  // cppquery_ACTIVE_QUERY_STATE_H
