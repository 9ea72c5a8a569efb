// cppquery/query/builder_parts/active_query_lifecycle.cpp
#include <QDebug>

#include "cppquery/query/active_query.h"

namespace cppquery {

    ActiveQuery::ActiveQuery(DialectPtr dialect, std::string table) : QueryBase(std::move(dialect)) {
        if (!table.empty()) {
            state_.from = TableSource::table(std::move(table));
        }
    }

    ActiveQuery::ActiveQuery(IQueryExecutor* executor, std::string table) : QueryBase(executor) {
        if (!table.empty()) {
            state_.from = TableSource::table(std::move(table));
        }
    }

    ActiveQuery::ActiveQuery(IAsyncQueryExecutor* executor, std::string table) : QueryBase(executor) {
        if (!table.empty()) {
            state_.from = TableSource::table(std::move(table));
        }
    }

    ActiveQuery& ActiveQuery::From(std::string table, std::optional<std::string> alias) {
        if (table.empty()) {
            qWarning("cppquery ActiveQuery::From: empty table name ignored.");
            return *this;
        }
        state_.from = TableSource::table(std::move(table), std::move(alias));
        return *this;
    }

    ActiveQuery& ActiveQuery::FromCte(std::string cte_name, std::optional<std::string> alias) {
        if (cte_name.empty()) {
            qWarning("cppquery ActiveQuery::FromCte: empty CTE name ignored.");
            return *this;
        }
        state_.from = TableSource::cte(std::move(cte_name), std::move(alias));
        return *this;
    }

    // 缺少别名在编译语句时报告
    ActiveQuery& ActiveQuery::FromSubquery(const QueryBase& subquery, std::string alias) {
        state_.from = TableSource::fromSubquery(subquery.clone(), std::move(alias));
        return *this;
    }

    ActiveQuery& ActiveQuery::ColumnTypes(std::map<std::string, LogicalType> types) {
        for (auto& [name, type] : types) {
            column_types_[name] = type;
        }
        return *this;
    }

    ActiveQuery& ActiveQuery::ColumnType(const std::string& column, LogicalType type) {
        column_types_[column] = type;
        return *this;
    }

    std::shared_ptr<const QueryBase> ActiveQuery::clone() const {
        return snapshot();
    }

    std::shared_ptr<const ActiveQuery> ActiveQuery::snapshot() const {
        return std::make_shared<const ActiveQuery>(*this);
    }

}  // namespace cppquery
