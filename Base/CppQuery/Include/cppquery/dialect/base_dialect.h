#ifndef cppquery_BASE_DIALECT_H
#define cppquery_BASE_DIALECT_H

#include <memory>

#include "cppquery/dialect/dialect.h"
#include "cppquery/type_mapping.h"

namespace cppquery {

    // ANSI 风格的默认实现, 具体方言只覆盖差异部分
    class BaseDialect : public Dialect {
      public:
        std::string name() const override {
            return name_;
        }
        DialectVersion version() const override {
            return version_;
        }
        PlaceholderStyle placeholderStyle() const override {
            return placeholder_style_;
        }
        const TypeMappingRegistry& typeMappings() const override {
            return *registry_;
        }

        bool requiresLimitForOffset() const override;

        std::string formatIdentifier(const std::string& identifier) const override;
        std::string formatColumnReference(const std::string& table, const std::string& column) const override;
        std::string formatTableReference(const std::string& table, const std::optional<std::string>& alias) const override;
        std::string formatLiteralPlaceholder(std::size_t one_based_index) const override;

        std::string formatComparison(const RenderedOperand& left, ComparisonOp op, const RenderedOperand& right) const override;
        std::string formatLogical(LogicalOp op, const std::vector<RenderedOperand>& children) const override;
        std::string formatAggregate(AggregateFunc func, const std::optional<std::string>& arg, bool distinct, const std::optional<std::string>& filter) const override;
        std::expected<std::string, Error> formatFunctionCall(const std::string& name, const std::vector<std::string>& args) const override;
        std::string formatWindow(const std::string& function_sql, const std::vector<std::string>& partition_by, const std::vector<std::string>& order_by, const std::optional<WindowFrame>& frame) const override;
        std::string formatOrderTerm(const std::string& expr_sql, SortDirection direction, NullsOrder nulls) const override;
        std::string formatIn(const RenderedOperand& expr, const std::vector<std::string>& values, bool negated) const override;
        std::string formatInSubquery(const RenderedOperand& expr, const std::string& subquery_sql, bool negated) const override;
        std::string formatBetween(const RenderedOperand& expr, const RenderedOperand& low, const RenderedOperand& high, bool negated) const override;
        std::string formatIsNull(const RenderedOperand& expr, bool negated) const override;
        std::string formatCase(const std::vector<std::pair<std::string, std::string>>& whens, const std::optional<std::string>& else_sql) const override;
        std::expected<std::string, Error> formatCast(const std::string& expr_sql, LogicalType target) const override;
        std::string formatArithmetic(const RenderedOperand& left, ArithmeticOp op, const RenderedOperand& right) const override;
        std::string formatSubquery(const std::string& query_sql) const override;

        std::expected<std::string, Error> formatJoin(JoinType type, const std::string& table_sql, const std::optional<std::string>& on_sql) const override;
        std::expected<std::string, Error> formatLimitOffset(RenderContext& ctx, std::optional<long long> limit, std::optional<long long> offset) const override;
        std::expected<std::string, Error> formatReturningClause(const std::vector<std::string>& columns) const override;
        std::expected<std::string, Error> formatOnConflictClause(const std::vector<std::string>& target_columns, bool do_nothing, const std::vector<std::string>& assignments, const std::optional<std::string>& where_sql) const override;
        std::string formatExcludedColumn(const std::string& column) const override;
        std::string formatInsertVerb(bool ignore_conflicts) const override;
        std::expected<std::string, Error> formatLockClause(LockMode mode) const override;
        std::string formatCte(const std::string& name, bool recursive, const std::vector<std::string>& columns, const std::string& body_sql) const override;
        std::string formatWithClause(bool recursive, const std::vector<std::string>& cte_definitions) const override;
        std::expected<std::string, Error> formatSetOperation(SetOperator op) const override;
        std::string formatSetOperationOperand(const std::string& operand_sql, bool has_trailing_clauses) const override;
        std::string formatSetOperationGroup(const std::string& compound_sql) const override;
        std::string formatExistsProjection() const override;

      protected:
        BaseDialect(std::string name, DialectVersion version, std::shared_ptr<const TypeMappingRegistry> registry, PlaceholderStyle placeholder_style);

        // 注册表必须为该方言的每个逻辑类型提供映射
        static std::expected<void, Error> validateRegistry(const std::string& dialect_name, const std::shared_ptr<const TypeMappingRegistry>& registry);

        virtual char identifierQuote() const {
            return '"';
        }
        // CAST(x AS ...) 的目标类型名
        virtual std::expected<std::string, Error> castTypeName(LogicalType target) const;

        Error capabilityError(DialectFeature feature, const std::string& clause) const;

        static const char* comparisonOperatorSql(ComparisonOp op);
        static const char* arithmeticOperatorSql(ArithmeticOp op);
        static std::string frameBoundSql(const FrameBound& bound);

      private:
        std::string name_;
        DialectVersion version_;
        std::shared_ptr<const TypeMappingRegistry> registry_;
        PlaceholderStyle placeholder_style_;
    };

}  // namespace cppquery

#endif  // cppquery_BASE_DIALECT_H
