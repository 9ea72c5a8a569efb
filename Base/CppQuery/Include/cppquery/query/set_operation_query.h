#ifndef cppquery_SET_OPERATION_QUERY_H
#define cppquery_SET_OPERATION_QUERY_H

#include <expected>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "cppquery/query/query_base.h"

namespace cppquery {

    // a UNION b [INTERSECT c ...], 从左到右结合.
    // 所有操作数必须使用同一方言; 能静态确定投影列数时必须一致
    class SetOperationQuery : public QueryBase {
      public:
        // 操作数列数不一致或方言不同时返回构造错误, 此时还没有渲染任何东西
        static std::expected<SetOperationQuery, Error> Create(const QueryBase& left, SetOperator op, const QueryBase& right);

        std::expected<SetOperationQuery, Error> Union(const QueryBase& next) const;
        std::expected<SetOperationQuery, Error> UnionAll(const QueryBase& next) const;
        std::expected<SetOperationQuery, Error> Intersect(const QueryBase& next) const;
        std::expected<SetOperationQuery, Error> Except(const QueryBase& next) const;
        std::expected<SetOperationQuery, Error> Append(SetOperator op, const QueryBase& next) const;

        // 作用于整个复合结果; 只能引用结果列名 (第一个操作数的列名)
        SetOperationQuery& OrderBy(const std::string& column, SortDirection direction = SortDirection::Asc);
        SetOperationQuery& OrderBy(OrderTerm term);
        SetOperationQuery& Limit(long long limit);
        SetOperationQuery& Offset(long long offset);
        SetOperationQuery& ColumnTypes(std::map<std::string, LogicalType> types);

        std::size_t operandCount() const {
            return operands_.size();
        }
        const std::vector<SetOperator>& operators() const {
            return operators_;
        }

        std::shared_ptr<const QueryBase> clone() const override;

        // QuerySource
        std::expected<std::string, Error> renderInto(RenderContext& ctx) const override;
        std::optional<std::size_t> projectedColumnCount() const override;
        std::vector<std::string> projectedColumnNames() const override;
        bool hasTrailingClauses() const override;
        void collectCteReferences(std::set<std::string>& names) const override;

      private:
        explicit SetOperationQuery(const QueryBase& first);

        static std::expected<void, Error> checkCompatible_(const QueryBase& current, const QueryBase& next, SetOperator op);

        std::vector<std::shared_ptr<const QueryBase>> operands_;
        std::vector<SetOperator> operators_;  // operators_[i] 连接 operands_[i] 与 operands_[i + 1]
        std::vector<OrderTerm> order_by_;
        std::optional<long long> limit_;
        std::optional<long long> offset_;
    };

}  // namespace cppquery

#endif  // cppquery_SET_OPERATION_QUERY_H
