#ifndef cppquery_CTE_QUERY_H
#define cppquery_CTE_QUERY_H

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "cppquery/query/active_query.h"
#include "cppquery/query/query_base.h"

namespace cppquery {

    // 递归 CTE 的深度守卫. 锚点行深度为 0, 每次递归 +1
    struct RecursionGuard {
        enum class Policy {
            Truncate,  // 丢弃深度超过 max_depth 的行
            Fail,      // 存在超过 max_depth 的行时报告 RecursionLimitExceeded
        };

        long long max_depth = 100;
        std::string depth_column = "cte_depth";
        Policy policy = Policy::Truncate;
    };

    // WITH [RECURSIVE] ... 主查询.
    // CTE 按定义顺序渲染, 只能引用在它之前定义的 CTE (递归 CTE 可以引用自身)
    class CTEQuery : public QueryBase {
      public:
        explicit CTEQuery(DialectPtr dialect);
        explicit CTEQuery(IQueryExecutor* executor);
        explicit CTEQuery(IAsyncQueryExecutor* executor);
        CTEQuery(const CTEQuery&) = default;
        CTEQuery& operator=(const CTEQuery&) = default;
        CTEQuery(CTEQuery&&) = default;
        CTEQuery& operator=(CTEQuery&&) = default;
        ~CTEQuery() override = default;

        CTEQuery& With(const std::string& name, const QueryBase& query, std::vector<std::string> columns = {});
        // anchor UNION ALL recursive. recursive 必须通过 FromCte / JoinCte 引用 name
        CTEQuery& WithRecursive(const std::string& name, const ActiveQuery& anchor, const ActiveQuery& recursive, std::vector<std::string> columns = {}, RecursionGuard guard = {});
        // 主查询, 其列类型提示会被合并
        CTEQuery& Query(const QueryBase& main);
        CTEQuery& ColumnTypes(std::map<std::string, LogicalType> types);

        std::vector<std::string> cteNames() const;
        // 第一个构造错误 (重复名称、未定义引用等), 在渲染时返回
        const std::optional<Error>& constructionError() const {
            return pending_error_;
        }

        std::shared_ptr<const QueryBase> clone() const override;

        // QuerySource
        std::expected<std::string, Error> renderInto(RenderContext& ctx) const override;
        std::optional<std::size_t> projectedColumnCount() const override;
        std::vector<std::string> projectedColumnNames() const override;
        bool hasTrailingClauses() const override;
        void collectCteReferences(std::set<std::string>& names) const override;

      protected:
        std::expected<CompiledStatement, Error> compileCount() const override;
        std::expected<CompiledStatement, Error> compileExists() const override;
        std::expected<std::optional<CompiledStatement>, Error> compileGuardCheck() const override;
        Error guardCheckFailure() const override;

      private:
        struct CteDefinition {
            std::string name;
            std::vector<std::string> columns;
            bool recursive = false;
            std::shared_ptr<const QueryBase> body;              // 非递归
            std::shared_ptr<const ActiveQuery> anchor;          // 递归: 已注入深度列
            std::shared_ptr<const ActiveQuery> recursive_part;  // 递归: 已注入深度列与深度条件
            RecursionGuard guard;
        };

        bool isDefined_(const std::string& name) const;
        void fail_(Error error, const char* method);
        std::expected<void, Error> validate_(const Dialect& dialect) const;
        // "WITH ..." 前缀, 没有 CTE 时为空
        std::expected<std::string, Error> renderWithClause_(RenderContext& ctx) const;
        std::expected<std::string, Error> renderMain_(RenderContext& ctx) const;

        std::vector<CteDefinition> ctes_;
        std::shared_ptr<const QueryBase> main_;
        std::optional<Error> pending_error_;
    };

}  // namespace cppquery

#endif  // cppquery_CTE_QUERY_H
