#ifndef cppquery_DIALECT_H
#define cppquery_DIALECT_H

#include <compare>
#include <cstddef>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "cppquery/error.h"
#include "cppquery/expression/expression.h"
#include "cppquery/expression/operators.h"
#include "cppquery/logical_type.h"

namespace cppquery {

    class RenderContext;
    class TypeMappingRegistry;

    struct DialectVersion {
        int major_version = 0;
        int minor_version = 0;
        int patch_version = 0;

        // "3.45.1" / "8.0" / "16"; 无法解析返回 nullopt
        static std::optional<DialectVersion> parse(const std::string& text);
        std::string toString() const;

        auto operator<=>(const DialectVersion&) const = default;
    };

    enum class PlaceholderStyle {
        QuestionMark,  // ?
        Format,        // %s
        Numbered,      // $1 .. $N
    };

    enum class DialectFeature { Cte, RecursiveCte, WindowFunctions, AggregateFilter, NullsOrdering, Returning, Savepoint, RowLocking, RightJoin, FullJoin, IntersectExcept, JsonFunctions, Upsert };

    const char* dialectFeatureName(DialectFeature feature);

    // 已渲染的子表达式及其优先级, 由方言决定是否加括号
    struct RenderedOperand {
        std::string sql;
        Precedence precedence = Precedence::Primary;
    };

    // 方言: 无状态的渲染策略. 同一 (节点, 方言) 的渲染结果确定且不产生副作用,
    // 因此一个实例可以被并发的渲染共享
    class Dialect {
      public:
        virtual ~Dialect() = default;

        virtual std::string name() const = 0;
        virtual DialectVersion version() const = 0;
        virtual PlaceholderStyle placeholderStyle() const = 0;
        virtual const TypeMappingRegistry& typeMappings() const = 0;

        // --- 能力查询 ---
        virtual bool supports(DialectFeature feature) const = 0;
        bool supportsCte() const {
            return supports(DialectFeature::Cte);
        }
        bool supportsRecursiveCte() const {
            return supports(DialectFeature::RecursiveCte);
        }
        bool supportsWindowFunctions() const {
            return supports(DialectFeature::WindowFunctions);
        }
        bool supportsReturning() const {
            return supports(DialectFeature::Returning);
        }
        bool supportsSavepoint() const {
            return supports(DialectFeature::Savepoint);
        }
        bool supportsRowLocking() const {
            return supports(DialectFeature::RowLocking);
        }
        virtual bool requiresLimitForOffset() const = 0;

        // --- 标识符与占位符 ---
        virtual std::string formatIdentifier(const std::string& identifier) const = 0;
        virtual std::string formatColumnReference(const std::string& table, const std::string& column) const = 0;
        virtual std::string formatTableReference(const std::string& table, const std::optional<std::string>& alias) const = 0;
        // one_based_index 为该占位符在整条语句中的序号
        virtual std::string formatLiteralPlaceholder(std::size_t one_based_index) const = 0;

        // --- 表达式 ---
        virtual std::string formatComparison(const RenderedOperand& left, ComparisonOp op, const RenderedOperand& right) const = 0;
        virtual std::string formatLogical(LogicalOp op, const std::vector<RenderedOperand>& children) const = 0;
        virtual std::string formatAggregate(AggregateFunc func, const std::optional<std::string>& arg, bool distinct, const std::optional<std::string>& filter) const = 0;
        virtual std::expected<std::string, Error> formatFunctionCall(const std::string& name, const std::vector<std::string>& args) const = 0;
        virtual std::string formatWindow(const std::string& function_sql, const std::vector<std::string>& partition_by, const std::vector<std::string>& order_by, const std::optional<WindowFrame>& frame) const = 0;
        virtual std::string formatOrderTerm(const std::string& expr_sql, SortDirection direction, NullsOrder nulls) const = 0;
        virtual std::string formatIn(const RenderedOperand& expr, const std::vector<std::string>& values, bool negated) const = 0;
        virtual std::string formatInSubquery(const RenderedOperand& expr, const std::string& subquery_sql, bool negated) const = 0;
        virtual std::string formatBetween(const RenderedOperand& expr, const RenderedOperand& low, const RenderedOperand& high, bool negated) const = 0;
        virtual std::string formatIsNull(const RenderedOperand& expr, bool negated) const = 0;
        virtual std::string formatCase(const std::vector<std::pair<std::string, std::string>>& whens, const std::optional<std::string>& else_sql) const = 0;
        virtual std::expected<std::string, Error> formatCast(const std::string& expr_sql, LogicalType target) const = 0;
        virtual std::string formatArithmetic(const RenderedOperand& left, ArithmeticOp op, const RenderedOperand& right) const = 0;
        virtual std::string formatSubquery(const std::string& query_sql) const = 0;

        // --- 语句级子句 ---
        virtual std::expected<std::string, Error> formatJoin(JoinType type, const std::string& table_sql, const std::optional<std::string>& on_sql) const = 0;
        // 通过 ctx 绑定 LIMIT / OFFSET 参数; 两者都为空时返回空串
        virtual std::expected<std::string, Error> formatLimitOffset(RenderContext& ctx, std::optional<long long> limit, std::optional<long long> offset) const = 0;
        virtual std::expected<std::string, Error> formatReturningClause(const std::vector<std::string>& columns) const = 0;
        // INSERT 的冲突处理子句. assignments 为已渲染的 "col = expr", do_nothing 时为空
        virtual std::expected<std::string, Error> formatOnConflictClause(const std::vector<std::string>& target_columns, bool do_nothing, const std::vector<std::string>& assignments, const std::optional<std::string>& where_sql) const = 0;
        // 冲突时引用被拒绝插入的那一行的列
        virtual std::string formatExcludedColumn(const std::string& column) const = 0;
        // "INSERT INTO", 冲突忽略需要改写动词的方言返回各自的形式
        virtual std::string formatInsertVerb(bool ignore_conflicts) const = 0;
        virtual std::expected<std::string, Error> formatLockClause(LockMode mode) const = 0;
        // name[(col, ...)] AS (body)
        virtual std::string formatCte(const std::string& name, bool recursive, const std::vector<std::string>& columns, const std::string& body_sql) const = 0;
        virtual std::string formatWithClause(bool recursive, const std::vector<std::string>& cte_definitions) const = 0;
        virtual std::expected<std::string, Error> formatSetOperation(SetOperator op) const = 0;
        virtual std::string formatSetOperationOperand(const std::string& operand_sql, bool has_trailing_clauses) const = 0;
        // 运算符变化时把左侧已累积的复合查询整体分组, 保证从左到右结合
        virtual std::string formatSetOperationGroup(const std::string& compound_sql) const = 0;
        // EXISTS 检查使用的投影
        virtual std::string formatExistsProjection() const = 0;
    };

    using DialectPtr = std::shared_ptr<const Dialect>;

}  // namespace cppquery

#endif  // cppquery_DIALECT_H
