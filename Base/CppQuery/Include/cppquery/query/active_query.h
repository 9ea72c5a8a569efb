#ifndef cppquery_ACTIVE_QUERY_H
#define cppquery_ACTIVE_QUERY_H

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "cppquery/query/builder_parts/active_query_clauses_mixin.h"
#include "cppquery/query/builder_parts/active_query_conditions_mixin.h"
#include "cppquery/query/builder_parts/active_query_joins_mixin.h"
#include "cppquery/query/builder_parts/active_query_state.h"
#include "cppquery/query/query_base.h"

namespace cppquery {

    // 流式 SELECT 装配器.
    //   ActiveQuery(&backend, "users").Where(ge(col("age"), lit(18))).OrderBy("name").Limit(10).All();
    // 子句按调用顺序累积; 渲染是纯函数, 执行型终结调用只能调用一次
    class ActiveQuery : public QueryBase, public ActiveQueryConditionsMixin<ActiveQuery>, public ActiveQueryClausesMixin<ActiveQuery>, public ActiveQueryJoinsMixin<ActiveQuery> {
      public:
        explicit ActiveQuery(DialectPtr dialect, std::string table = "");
        explicit ActiveQuery(IQueryExecutor* executor, std::string table = "");
        explicit ActiveQuery(IAsyncQueryExecutor* executor, std::string table = "");
        ActiveQuery(const ActiveQuery& other) = default;
        ActiveQuery& operator=(const ActiveQuery& other) = default;
        ActiveQuery(ActiveQuery&& other) = default;
        ActiveQuery& operator=(ActiveQuery&& other) = default;
        ~ActiveQuery() override = default;

        ActiveQuery& From(std::string table, std::optional<std::string> alias = std::nullopt);
        ActiveQuery& FromCte(std::string cte_name, std::optional<std::string> alias = std::nullopt);
        ActiveQuery& FromSubquery(const QueryBase& subquery, std::string alias);

        // 结果列的逻辑类型提示, 用于把数据库值还原成应用值
        ActiveQuery& ColumnTypes(std::map<std::string, LogicalType> types);
        ActiveQuery& ColumnType(const std::string& column, LogicalType type);

        const TableSource& getFrom() const {
            return state_.from;
        }
        bool isDistinct() const {
            return state_.distinct;
        }
        LockMode getLockMode() const {
            return state_.lock;
        }

        std::shared_ptr<const QueryBase> clone() const override;
        std::shared_ptr<const ActiveQuery> snapshot() const;

        // QuerySource
        std::expected<std::string, Error> renderInto(RenderContext& ctx) const override;
        std::optional<std::size_t> projectedColumnCount() const override;
        std::vector<std::string> projectedColumnNames() const override;
        bool hasTrailingClauses() const override;
        void collectCteReferences(std::set<std::string>& names) const override;

      protected:
        std::expected<CompiledStatement, Error> compileOne() const override;
        std::expected<CompiledStatement, Error> compileCount() const override;
        std::expected<CompiledStatement, Error> compileExists() const override;

      private:
        friend class ActiveQueryConditionsMixin<ActiveQuery>;
        friend class ActiveQueryClausesMixin<ActiveQuery>;
        friend class ActiveQueryJoinsMixin<ActiveQuery>;
        friend class CTEQuery;

        ActiveQueryState& getState_() {
            return state_;
        }
        const ActiveQueryState& getState_() const {
            return state_;
        }

        // projection 非空时替换 SELECT 列表 (COUNT / EXISTS 使用)
        static std::expected<std::string, Error> renderState_(RenderContext& ctx, const ActiveQueryState& state, const std::optional<std::string>& projection);
        static std::expected<std::string, Error> renderSource_(RenderContext& ctx, const TableSource& source);

        ActiveQueryState state_;
    };

}  // namespace cppquery

#endif  // cppquery_ACTIVE_QUERY_H
