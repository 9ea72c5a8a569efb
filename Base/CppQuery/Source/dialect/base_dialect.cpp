// cppquery/dialect/base_dialect.cpp
#include "cppquery/dialect/base_dialect.h"

#include <cctype>
#include <sstream>

#include "cppquery/dialect/render_context.h"

namespace cppquery {

    namespace {
        std::string join(const std::vector<std::string>& parts, const char* separator) {
            std::ostringstream oss;
            for (size_t i = 0; i < parts.size(); ++i) {
                if (i > 0) oss << separator;
                oss << parts[i];
            }
            return oss.str();
        }

        std::string wrapIf(const RenderedOperand& operand, bool wrap) {
            return wrap ? "(" + operand.sql + ")" : operand.sql;
        }

        // 比较类运算的操作数: 同级或更低优先级都需要括号
        std::string comparisonOperand(const RenderedOperand& operand) {
            return wrapIf(operand, operand.precedence <= Precedence::Comparison);
        }

        bool isValidFunctionName(const std::string& name) {
            if (name.empty() || !(std::isalpha(static_cast<unsigned char>(name[0])) || name[0] == '_')) {
                return false;
            }
            for (char c : name) {
                if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_')) return false;
            }
            return true;
        }
    }  // namespace

    BaseDialect::BaseDialect(std::string name, DialectVersion version, std::shared_ptr<const TypeMappingRegistry> registry, PlaceholderStyle placeholder_style)
        : name_(std::move(name)), version_(version), registry_(std::move(registry)), placeholder_style_(placeholder_style) {
    }

    std::expected<void, Error> BaseDialect::validateRegistry(const std::string& dialect_name, const std::shared_ptr<const TypeMappingRegistry>& registry) {
        if (!registry) {
            return std::unexpected(makeConstructionError("A type mapping registry is required", "", dialect_name));
        }
        auto missing = registry->missingTypes(dialect_name);
        if (!missing.empty()) {
            std::string names;
            for (LogicalType type : missing) {
                if (!names.empty()) names += ", ";
                names += logicalTypeName(type);
            }
            return std::unexpected(makeConstructionError("Type mapping registry has no entry for: " + names, "", dialect_name));
        }
        return {};
    }

    Error BaseDialect::capabilityError(DialectFeature feature, const std::string& clause) const {
        return makeCapabilityError(std::string(dialectFeatureName(feature)) + " is not supported by " + name_ + " " + version_.toString(), clause, name_);
    }

    bool BaseDialect::requiresLimitForOffset() const {
        return false;
    }

    // --- 标识符与占位符 ---

    std::string BaseDialect::formatIdentifier(const std::string& identifier) const {
        const char quote = identifierQuote();
        std::string quoted;
        quoted.reserve(identifier.size() + 2);
        quoted.push_back(quote);
        for (char c : identifier) {
            if (c == quote) quoted.push_back(quote);
            quoted.push_back(c);
        }
        quoted.push_back(quote);
        return quoted;
    }

    std::string BaseDialect::formatColumnReference(const std::string& table, const std::string& column) const {
        std::string column_sql = column == "*" ? std::string("*") : formatIdentifier(column);
        if (table.empty()) {
            return column_sql;
        }
        return formatIdentifier(table) + "." + column_sql;
    }

    std::string BaseDialect::formatTableReference(const std::string& table, const std::optional<std::string>& alias) const {
        std::string sql = formatIdentifier(table);
        if (alias && !alias->empty() && *alias != table) {
            sql += " AS " + formatIdentifier(*alias);
        }
        return sql;
    }

    std::string BaseDialect::formatLiteralPlaceholder(std::size_t one_based_index) const {
        switch (placeholder_style_) {
            case PlaceholderStyle::QuestionMark:
                return "?";
            case PlaceholderStyle::Format:
                return "%s";
            case PlaceholderStyle::Numbered:
                return "$" + std::to_string(one_based_index);
        }
        return "?";
    }

    // --- 表达式 ---

    const char* BaseDialect::comparisonOperatorSql(ComparisonOp op) {
        switch (op) {
            case ComparisonOp::Eq:
                return "=";
            case ComparisonOp::Ne:
                return "<>";
            case ComparisonOp::Lt:
                return "<";
            case ComparisonOp::Le:
                return "<=";
            case ComparisonOp::Gt:
                return ">";
            case ComparisonOp::Ge:
                return ">=";
            case ComparisonOp::Like:
                return "LIKE";
            case ComparisonOp::NotLike:
                return "NOT LIKE";
        }
        return "=";
    }

    const char* BaseDialect::arithmeticOperatorSql(ArithmeticOp op) {
        switch (op) {
            case ArithmeticOp::Add:
                return "+";
            case ArithmeticOp::Subtract:
                return "-";
            case ArithmeticOp::Multiply:
                return "*";
            case ArithmeticOp::Divide:
                return "/";
            case ArithmeticOp::Modulo:
                return "%";
            case ArithmeticOp::Concat:
                return "||";
        }
        return "+";
    }

    std::string BaseDialect::formatComparison(const RenderedOperand& left, ComparisonOp op, const RenderedOperand& right) const {
        return comparisonOperand(left) + " " + comparisonOperatorSql(op) + " " + comparisonOperand(right);
    }

    std::string BaseDialect::formatLogical(LogicalOp op, const std::vector<RenderedOperand>& children) const {
        if (op == LogicalOp::Not) {
            return "NOT (" + children.front().sql + ")";
        }
        const Precedence self = op == LogicalOp::And ? Precedence::And : Precedence::Or;
        const char* separator = op == LogicalOp::And ? " AND " : " OR ";
        std::vector<std::string> parts;
        parts.reserve(children.size());
        for (const auto& child : children) {
            parts.push_back(wrapIf(child, child.precedence < self));
        }
        return join(parts, separator);
    }

    std::string BaseDialect::formatAggregate(AggregateFunc func, const std::optional<std::string>& arg, bool distinct, const std::optional<std::string>& filter) const {
        static const char* names[] = {"COUNT", "SUM", "AVG", "MIN", "MAX"};
        std::string sql = names[static_cast<int>(func)];
        sql += "(";
        if (!arg) {
            sql += "*";
        } else {
            if (distinct) sql += "DISTINCT ";
            sql += *arg;
        }
        sql += ")";
        if (filter) {
            sql += " FILTER (WHERE " + *filter + ")";
        }
        return sql;
    }

    std::expected<std::string, Error> BaseDialect::formatFunctionCall(const std::string& name, const std::vector<std::string>& args) const {
        // 函数名会原样进入 SQL, 只接受标识符字符
        if (!isValidFunctionName(name)) {
            return std::unexpected(makeConstructionError("Invalid function name '" + name + "'", "", name_));
        }
        return name + "(" + join(args, ", ") + ")";
    }

    std::string BaseDialect::frameBoundSql(const FrameBound& bound) {
        switch (bound.kind) {
            case FrameBoundKind::UnboundedPreceding:
                return "UNBOUNDED PRECEDING";
            case FrameBoundKind::Preceding:
                return std::to_string(bound.offset) + " PRECEDING";
            case FrameBoundKind::CurrentRow:
                return "CURRENT ROW";
            case FrameBoundKind::Following:
                return std::to_string(bound.offset) + " FOLLOWING";
            case FrameBoundKind::UnboundedFollowing:
                return "UNBOUNDED FOLLOWING";
        }
        return "CURRENT ROW";
    }

    std::string BaseDialect::formatWindow(const std::string& function_sql, const std::vector<std::string>& partition_by, const std::vector<std::string>& order_by, const std::optional<WindowFrame>& frame) const {
        std::vector<std::string> parts;
        if (!partition_by.empty()) {
            parts.push_back("PARTITION BY " + join(partition_by, ", "));
        }
        if (!order_by.empty()) {
            parts.push_back("ORDER BY " + join(order_by, ", "));
        }
        if (frame) {
            std::string unit = frame->unit == FrameUnit::Rows ? "ROWS" : "RANGE";
            parts.push_back(unit + " BETWEEN " + frameBoundSql(frame->start) + " AND " + frameBoundSql(frame->end));
        }
        return function_sql + " OVER (" + join(parts, " ") + ")";
    }

    std::string BaseDialect::formatOrderTerm(const std::string& expr_sql, SortDirection direction, NullsOrder nulls) const {
        std::string sql = expr_sql + (direction == SortDirection::Asc ? " ASC" : " DESC");
        if (nulls == NullsOrder::First) {
            sql += " NULLS FIRST";
        } else if (nulls == NullsOrder::Last) {
            sql += " NULLS LAST";
        }
        return sql;
    }

    std::string BaseDialect::formatIn(const RenderedOperand& expr, const std::vector<std::string>& values, bool negated) const {
        return comparisonOperand(expr) + (negated ? " NOT IN (" : " IN (") + join(values, ", ") + ")";
    }

    std::string BaseDialect::formatInSubquery(const RenderedOperand& expr, const std::string& subquery_sql, bool negated) const {
        return comparisonOperand(expr) + (negated ? " NOT IN (" : " IN (") + subquery_sql + ")";
    }

    std::string BaseDialect::formatBetween(const RenderedOperand& expr, const RenderedOperand& low, const RenderedOperand& high, bool negated) const {
        return comparisonOperand(expr) + (negated ? " NOT BETWEEN " : " BETWEEN ") + comparisonOperand(low) + " AND " + comparisonOperand(high);
    }

    std::string BaseDialect::formatIsNull(const RenderedOperand& expr, bool negated) const {
        return comparisonOperand(expr) + (negated ? " IS NOT NULL" : " IS NULL");
    }

    std::string BaseDialect::formatCase(const std::vector<std::pair<std::string, std::string>>& whens, const std::optional<std::string>& else_sql) const {
        std::string sql = "CASE";
        for (const auto& [when, then] : whens) {
            sql += " WHEN " + when + " THEN " + then;
        }
        if (else_sql) {
            sql += " ELSE " + *else_sql;
        }
        return sql + " END";
    }

    std::expected<std::string, Error> BaseDialect::castTypeName(LogicalType target) const {
        return registry_->nativeColumnType(name_, target);
    }

    std::expected<std::string, Error> BaseDialect::formatCast(const std::string& expr_sql, LogicalType target) const {
        auto type_name = castTypeName(target);
        if (!type_name) {
            return std::unexpected(type_name.error());
        }
        return "CAST(" + expr_sql + " AS " + *type_name + ")";
    }

    std::string BaseDialect::formatArithmetic(const RenderedOperand& left, ArithmeticOp op, const RenderedOperand& right) const {
        const Precedence self = (op == ArithmeticOp::Multiply || op == ArithmeticOp::Divide || op == ArithmeticOp::Modulo) ? Precedence::Multiplicative : Precedence::Additive;
        // 右操作数同级时, 只有满足结合律的运算可以省略括号
        const bool associative = op == ArithmeticOp::Add || op == ArithmeticOp::Multiply || op == ArithmeticOp::Concat;
        const bool wrap_right = right.precedence < self || (right.precedence == self && !associative);
        return wrapIf(left, left.precedence < self) + " " + arithmeticOperatorSql(op) + " " + wrapIf(right, wrap_right);
    }

    std::string BaseDialect::formatSubquery(const std::string& query_sql) const {
        return "(" + query_sql + ")";
    }

    // --- 语句级子句 ---

    std::expected<std::string, Error> BaseDialect::formatJoin(JoinType type, const std::string& table_sql, const std::optional<std::string>& on_sql) const {
        if (type == JoinType::Right && !supports(DialectFeature::RightJoin)) {
            return std::unexpected(capabilityError(DialectFeature::RightJoin, "JOIN"));
        }
        if (type == JoinType::Full && !supports(DialectFeature::FullJoin)) {
            return std::unexpected(capabilityError(DialectFeature::FullJoin, "JOIN"));
        }
        if (type == JoinType::Cross) {
            if (on_sql) {
                return std::unexpected(makeConstructionError("CROSS JOIN does not take an ON condition", "JOIN", name_));
            }
            return std::string(joinTypeName(type)) + " " + table_sql;
        }
        if (!on_sql) {
            return std::unexpected(makeConstructionError(std::string(joinTypeName(type)) + " requires an ON condition", "JOIN", name_));
        }
        return std::string(joinTypeName(type)) + " " + table_sql + " ON " + *on_sql;
    }

    std::expected<std::string, Error> BaseDialect::formatLimitOffset(RenderContext& ctx, std::optional<long long> limit, std::optional<long long> offset) const {
        if (limit && *limit < 0) {
            return std::unexpected(ctx.constructionError("LIMIT must be non-negative"));
        }
        if (offset && *offset < 0) {
            return std::unexpected(ctx.constructionError("OFFSET must be non-negative"));
        }
        if (offset && !limit && requiresLimitForOffset()) {
            return std::unexpected(ctx.constructionError("OFFSET without LIMIT is not valid on " + name_));
        }
        std::string sql;
        if (limit) {
            sql += "LIMIT " + ctx.bindRaw(cppquery_sqldriver::SqlValue(*limit));
        }
        if (offset) {
            if (!sql.empty()) sql += " ";
            sql += "OFFSET " + ctx.bindRaw(cppquery_sqldriver::SqlValue(*offset));
        }
        return sql;
    }

    std::expected<std::string, Error> BaseDialect::formatReturningClause(const std::vector<std::string>& columns) const {
        if (!supports(DialectFeature::Returning)) {
            return std::unexpected(capabilityError(DialectFeature::Returning, "RETURNING"));
        }
        if (columns.empty()) {
            return std::string("RETURNING *");
        }
        std::vector<std::string> quoted;
        for (const auto& c : columns) {
            quoted.push_back(c == "*" ? c : formatIdentifier(c));
        }
        return "RETURNING " + join(quoted, ", ");
    }

    std::expected<std::string, Error> BaseDialect::formatOnConflictClause(const std::vector<std::string>& target_columns, bool do_nothing, const std::vector<std::string>& assignments, const std::optional<std::string>& where_sql) const {
        if (!supports(DialectFeature::Upsert)) {
            return std::unexpected(capabilityError(DialectFeature::Upsert, "ON CONFLICT"));
        }
        std::string sql = "ON CONFLICT";
        if (!target_columns.empty()) {
            std::vector<std::string> quoted;
            for (const auto& c : target_columns) quoted.push_back(formatIdentifier(c));
            sql += " (" + join(quoted, ", ") + ")";
        }
        if (do_nothing) {
            return sql + " DO NOTHING";
        }
        if (target_columns.empty()) {
            return std::unexpected(makeConstructionError("ON CONFLICT DO UPDATE requires conflict target columns", "ON CONFLICT", name_));
        }
        if (assignments.empty()) {
            return std::unexpected(makeConstructionError("ON CONFLICT DO UPDATE has no assignments", "ON CONFLICT", name_));
        }
        sql += " DO UPDATE SET " + join(assignments, ", ");
        if (where_sql) {
            sql += " WHERE " + *where_sql;
        }
        return sql;
    }

    std::string BaseDialect::formatExcludedColumn(const std::string& column) const {
        return "excluded." + formatIdentifier(column);
    }

    std::string BaseDialect::formatInsertVerb(bool /*ignore_conflicts*/) const {
        return "INSERT INTO";
    }

    std::expected<std::string, Error> BaseDialect::formatLockClause(LockMode mode) const {
        if (mode == LockMode::None) {
            return std::string();
        }
        if (!supports(DialectFeature::RowLocking)) {
            return std::unexpected(capabilityError(DialectFeature::RowLocking, "LOCK"));
        }
        return std::string(mode == LockMode::ForUpdate ? "FOR UPDATE" : "FOR SHARE");
    }

    std::string BaseDialect::formatCte(const std::string& name, bool /*recursive*/, const std::vector<std::string>& columns, const std::string& body_sql) const {
        std::string sql = formatIdentifier(name);
        if (!columns.empty()) {
            std::vector<std::string> quoted;
            for (const auto& c : columns) quoted.push_back(formatIdentifier(c));
            sql += "(" + join(quoted, ", ") + ")";
        }
        return sql + " AS (" + body_sql + ")";
    }

    std::string BaseDialect::formatWithClause(bool recursive, const std::vector<std::string>& cte_definitions) const {
        return std::string(recursive ? "WITH RECURSIVE " : "WITH ") + join(cte_definitions, ", ");
    }

    std::expected<std::string, Error> BaseDialect::formatSetOperation(SetOperator op) const {
        if ((op == SetOperator::Intersect || op == SetOperator::Except) && !supports(DialectFeature::IntersectExcept)) {
            return std::unexpected(capabilityError(DialectFeature::IntersectExcept, setOperatorName(op)));
        }
        return std::string(setOperatorName(op));
    }

    std::string BaseDialect::formatSetOperationOperand(const std::string& operand_sql, bool /*has_trailing_clauses*/) const {
        return "(" + operand_sql + ")";
    }

    std::string BaseDialect::formatSetOperationGroup(const std::string& compound_sql) const {
        return "(" + compound_sql + ")";
    }

    std::string BaseDialect::formatExistsProjection() const {
        return "1";
    }

}  // namespace cppquery
