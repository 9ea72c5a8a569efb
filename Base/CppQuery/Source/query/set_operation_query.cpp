// cppquery/query/set_operation_query.cpp
#include "cppquery/query/set_operation_query.h"

#include <QDebug>

#include "cppquery/dialect/render_context.h"
#include "cppquery/expression/expression_builders.h"

namespace cppquery {

    SetOperationQuery::SetOperationQuery(const QueryBase& first) : QueryBase(first) {
        // 继承第一个操作数的方言、执行器与列类型
        resetConsumed_();
        column_types_ = first.columnTypes();
        operands_.push_back(first.clone());
    }

    std::expected<void, Error> SetOperationQuery::checkCompatible_(const QueryBase& current, const QueryBase& next, SetOperator op) {
        const std::string clause = setOperatorName(op);
        if (!current.dialect() || !next.dialect()) {
            return std::unexpected(makeConstructionError("Set operation operand has no dialect", clause));
        }
        if (current.dialect()->name() != next.dialect()->name()) {
            return std::unexpected(makeConstructionError("Set operation operands use different dialects: " + current.dialect()->name() + " and " + next.dialect()->name(), clause, current.dialect()->name()));
        }
        auto left_count = current.projectedColumnCount();
        auto right_count = next.projectedColumnCount();
        if (left_count && right_count && *left_count != *right_count) {
            return std::unexpected(makeConstructionError("Set operation operands project " + std::to_string(*left_count) + " and " + std::to_string(*right_count) + " columns", clause, current.dialect()->name()));
        }
        return {};
    }

    std::expected<SetOperationQuery, Error> SetOperationQuery::Create(const QueryBase& left, SetOperator op, const QueryBase& right) {
        auto compatible = checkCompatible_(left, right, op);
        if (!compatible) {
            return std::unexpected(compatible.error());
        }
        SetOperationQuery query(left);
        query.operands_.push_back(right.clone());
        query.operators_.push_back(op);
        return query;
    }

    std::expected<SetOperationQuery, Error> SetOperationQuery::Append(SetOperator op, const QueryBase& next) const {
        auto compatible = checkCompatible_(*this, next, op);
        if (!compatible) {
            return std::unexpected(compatible.error());
        }
        SetOperationQuery query(*this);
        if (!query.order_by_.empty() || query.limit_ || query.offset_) {
            // 已带 ORDER BY / LIMIT 的复合查询整体作为左操作数
            SetOperationQuery nested(*this);
            query.operands_.clear();
            query.operators_.clear();
            query.order_by_.clear();
            query.limit_.reset();
            query.offset_.reset();
            query.operands_.push_back(std::make_shared<const SetOperationQuery>(std::move(nested)));
        }
        query.operands_.push_back(next.clone());
        query.operators_.push_back(op);
        return query;
    }

    std::expected<SetOperationQuery, Error> SetOperationQuery::Union(const QueryBase& next) const {
        return Append(SetOperator::Union, next);
    }

    std::expected<SetOperationQuery, Error> SetOperationQuery::UnionAll(const QueryBase& next) const {
        return Append(SetOperator::UnionAll, next);
    }

    std::expected<SetOperationQuery, Error> SetOperationQuery::Intersect(const QueryBase& next) const {
        return Append(SetOperator::Intersect, next);
    }

    std::expected<SetOperationQuery, Error> SetOperationQuery::Except(const QueryBase& next) const {
        return Append(SetOperator::Except, next);
    }

    SetOperationQuery& SetOperationQuery::OrderBy(const std::string& column, SortDirection direction) {
        return OrderBy(OrderTerm{col(column), direction, NullsOrder::Default});
    }

    SetOperationQuery& SetOperationQuery::OrderBy(OrderTerm term) {
        if (!term.expr) {
            qWarning("cppquery SetOperationQuery::OrderBy: null expression ignored.");
            return *this;
        }
        order_by_.push_back(std::move(term));
        return *this;
    }

    SetOperationQuery& SetOperationQuery::Limit(long long limit) {
        limit_ = limit;
        return *this;
    }

    SetOperationQuery& SetOperationQuery::Offset(long long offset) {
        offset_ = offset;
        return *this;
    }

    SetOperationQuery& SetOperationQuery::ColumnTypes(std::map<std::string, LogicalType> types) {
        for (auto& [column, type] : types) {
            column_types_[column] = type;
        }
        return *this;
    }

    std::shared_ptr<const QueryBase> SetOperationQuery::clone() const {
        return std::make_shared<const SetOperationQuery>(*this);
    }

    std::expected<std::string, Error> SetOperationQuery::renderInto(RenderContext& ctx) const {
        std::string sql;
        for (std::size_t i = 0; i < operands_.size(); ++i) {
            if (i > 0) {
                const SetOperator op = operators_[i - 1];
                ClauseScope scope(ctx, setOperatorName(op));
                if (i > 1 && operators_[i - 2] != op) {
                    sql = ctx.dialect().formatSetOperationGroup(sql);
                }
                auto keyword = ctx.dialect().formatSetOperation(op);
                if (!keyword) return keyword;
                sql += " " + *keyword + " ";
            }
            auto operand = operands_[i]->renderInto(ctx);
            if (!operand) return operand;
            sql += ctx.dialect().formatSetOperationOperand(*operand, operands_[i]->hasTrailingClauses());
        }

        if (!order_by_.empty()) {
            ClauseScope scope(ctx, "ORDER BY");
            std::string terms;
            for (const auto& term : order_by_) {
                auto rendered = ctx.renderOrderTerm(term);
                if (!rendered) return rendered;
                if (!terms.empty()) terms += ", ";
                terms += *rendered;
            }
            sql += " ORDER BY " + terms;
        }

        if (limit_ || offset_) {
            ClauseScope scope(ctx, "LIMIT");
            auto limit = ctx.dialect().formatLimitOffset(ctx, limit_, offset_);
            if (!limit) return limit;
            if (!limit->empty()) sql += " " + *limit;
        }
        return sql;
    }

    std::optional<std::size_t> SetOperationQuery::projectedColumnCount() const {
        for (const auto& operand : operands_) {
            if (auto count = operand->projectedColumnCount()) {
                return count;
            }
        }
        return std::nullopt;
    }

    std::vector<std::string> SetOperationQuery::projectedColumnNames() const {
        // 第一个操作数的列名决定复合结果的列名
        return operands_.empty() ? std::vector<std::string>() : operands_.front()->projectedColumnNames();
    }

    bool SetOperationQuery::hasTrailingClauses() const {
        // 作为其他复合查询的操作数时总是需要包裹
        return true;
    }

    void SetOperationQuery::collectCteReferences(std::set<std::string>& names) const {
        for (const auto& operand : operands_) {
            operand->collectCteReferences(names);
        }
    }

}  // namespace cppquery
