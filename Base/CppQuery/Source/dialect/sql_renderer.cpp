// cppquery/dialect/sql_renderer.cpp
#include "cppquery/dialect/sql_renderer.h"

#include "cppquery/dialect/render_context.h"
#include "cppquery/query/query_source.h"

namespace cppquery {

    std::expected<std::string, Error> SqlRenderer::render(const ExprPtr& expr) {
        if (!expr) {
            return std::unexpected(ctx_.constructionError("Expression tree contains a null node"));
        }
        SqlRenderer child(ctx_);
        expr->accept(child);
        if (child.error_) {
            return std::unexpected(*child.error_);
        }
        return child.result_;
    }

    std::expected<RenderedOperand, Error> SqlRenderer::operand(const ExprPtr& expr) {
        auto sql = render(expr);
        if (!sql) {
            return std::unexpected(sql.error());
        }
        return RenderedOperand{std::move(*sql), expr->precedence()};
    }

    void SqlRenderer::fail(Error error) {
        if (!error_) {
            error_ = std::move(error);
        }
    }

    void SqlRenderer::visit(const ColumnExpression& node) {
        if (node.name().empty()) {
            fail(ctx_.constructionError("Column reference without a name"));
            return;
        }
        result_ = ctx_.dialect().formatColumnReference(node.table(), node.name());
    }

    void SqlRenderer::visit(const LiteralExpression& node) {
        auto placeholder = ctx_.bind(node.value(), node.logicalType());
        if (!placeholder) {
            fail(placeholder.error());
            return;
        }
        result_ = std::move(*placeholder);
    }

    void SqlRenderer::visit(const ComparisonExpression& node) {
        auto left = operand(node.left());
        if (!left) return fail(left.error());
        auto right = operand(node.right());
        if (!right) return fail(right.error());
        result_ = ctx_.dialect().formatComparison(*left, node.op(), *right);
    }

    void SqlRenderer::visit(const LogicalExpression& node) {
        if (node.children().empty()) {
            fail(ctx_.constructionError("Logical expression without operands"));
            return;
        }
        if (node.op() == LogicalOp::Not && node.children().size() != 1) {
            fail(ctx_.constructionError("NOT takes exactly one operand"));
            return;
        }
        std::vector<RenderedOperand> children;
        children.reserve(node.children().size());
        for (const auto& child : node.children()) {
            auto rendered = operand(child);
            if (!rendered) return fail(rendered.error());
            children.push_back(std::move(*rendered));
        }
        result_ = ctx_.dialect().formatLogical(node.op(), children);
    }

    void SqlRenderer::visit(const AggregateExpression& node) {
        std::optional<std::string> arg;
        if (node.arg()) {
            auto rendered = render(node.arg());
            if (!rendered) return fail(rendered.error());
            arg = std::move(*rendered);
        } else if (node.func() != AggregateFunc::Count || node.distinct()) {
            fail(ctx_.constructionError("Only COUNT accepts '*' as its argument"));
            return;
        }
        std::optional<std::string> filter;
        if (node.filter()) {
            auto supported = ctx_.requireFeature(DialectFeature::AggregateFilter);
            if (!supported) return fail(supported.error());
            auto rendered = render(node.filter());
            if (!rendered) return fail(rendered.error());
            filter = std::move(*rendered);
        }
        result_ = ctx_.dialect().formatAggregate(node.func(), arg, node.distinct(), filter);
    }

    void SqlRenderer::visit(const WindowExpression& node) {
        auto supported = ctx_.requireFeature(DialectFeature::WindowFunctions);
        if (!supported) return fail(supported.error());

        auto function_sql = render(node.function());
        if (!function_sql) return fail(function_sql.error());

        std::vector<std::string> partitions;
        for (const auto& p : node.partitionBy()) {
            auto rendered = render(p);
            if (!rendered) return fail(rendered.error());
            partitions.push_back(std::move(*rendered));
        }
        std::vector<std::string> orders;
        for (const auto& term : node.orderBy()) {
            auto rendered = ctx_.renderOrderTerm(term);
            if (!rendered) return fail(rendered.error());
            orders.push_back(std::move(*rendered));
        }
        if (node.frame()) {
            const auto& frame = *node.frame();
            if (frame.start.offset < 0 || frame.end.offset < 0) {
                fail(ctx_.constructionError("Window frame offsets must be non-negative"));
                return;
            }
        }
        result_ = ctx_.dialect().formatWindow(*function_sql, partitions, orders, node.frame());
    }

    void SqlRenderer::visit(const CteRefExpression& node) {
        result_ = ctx_.dialect().formatTableReference(node.name(), node.alias());
    }

    void SqlRenderer::visit(const ExcludedColumnExpression& node) {
        if (node.name().empty()) {
            fail(ctx_.constructionError("Excluded column reference without a name"));
            return;
        }
        result_ = ctx_.dialect().formatExcludedColumn(node.name());
    }

    void SqlRenderer::visit(const SubqueryExpression& node) {
        if (!node.query()) {
            fail(ctx_.constructionError("Subquery expression without a query"));
            return;
        }
        auto sql = node.query()->renderInto(ctx_);
        if (!sql) return fail(sql.error());
        result_ = ctx_.dialect().formatSubquery(*sql);
    }

    void SqlRenderer::visit(const FunctionCallExpression& node) {
        std::vector<std::string> args;
        args.reserve(node.args().size());
        for (const auto& arg : node.args()) {
            auto rendered = render(arg);
            if (!rendered) return fail(rendered.error());
            args.push_back(std::move(*rendered));
        }
        auto sql = ctx_.dialect().formatFunctionCall(node.name(), args);
        if (!sql) {
            Error err = sql.error();
            err.clause = ctx_.clause();
            return fail(err);
        }
        result_ = std::move(*sql);
    }

    void SqlRenderer::visit(const InExpression& node) {
        auto expr = operand(node.expr());
        if (!expr) return fail(expr.error());
        if (node.subquery()) {
            auto sql = node.subquery()->renderInto(ctx_);
            if (!sql) return fail(sql.error());
            result_ = ctx_.dialect().formatInSubquery(*expr, *sql, node.negated());
            return;
        }
        if (node.values().empty()) {
            fail(ctx_.constructionError("IN requires at least one value"));
            return;
        }
        std::vector<std::string> values;
        values.reserve(node.values().size());
        for (const auto& v : node.values()) {
            auto rendered = render(v);
            if (!rendered) return fail(rendered.error());
            values.push_back(std::move(*rendered));
        }
        result_ = ctx_.dialect().formatIn(*expr, values, node.negated());
    }

    void SqlRenderer::visit(const BetweenExpression& node) {
        auto expr = operand(node.expr());
        if (!expr) return fail(expr.error());
        auto low = operand(node.low());
        if (!low) return fail(low.error());
        auto high = operand(node.high());
        if (!high) return fail(high.error());
        result_ = ctx_.dialect().formatBetween(*expr, *low, *high, node.negated());
    }

    void SqlRenderer::visit(const IsNullExpression& node) {
        auto expr = operand(node.expr());
        if (!expr) return fail(expr.error());
        result_ = ctx_.dialect().formatIsNull(*expr, node.negated());
    }

    void SqlRenderer::visit(const CaseExpression& node) {
        if (node.whens().empty()) {
            fail(ctx_.constructionError("CASE requires at least one WHEN branch"));
            return;
        }
        std::vector<std::pair<std::string, std::string>> whens;
        for (const auto& [condition, result] : node.whens()) {
            auto when_sql = render(condition);
            if (!when_sql) return fail(when_sql.error());
            auto then_sql = render(result);
            if (!then_sql) return fail(then_sql.error());
            whens.emplace_back(std::move(*when_sql), std::move(*then_sql));
        }
        std::optional<std::string> else_sql;
        if (node.elseResult()) {
            auto rendered = render(node.elseResult());
            if (!rendered) return fail(rendered.error());
            else_sql = std::move(*rendered);
        }
        result_ = ctx_.dialect().formatCase(whens, else_sql);
    }

    void SqlRenderer::visit(const CastExpression& node) {
        auto expr = render(node.expr());
        if (!expr) return fail(expr.error());
        auto sql = ctx_.dialect().formatCast(*expr, node.target());
        if (!sql) {
            Error err = sql.error();
            err.clause = ctx_.clause();
            return fail(err);
        }
        result_ = std::move(*sql);
    }

    void SqlRenderer::visit(const ArithmeticExpression& node) {
        auto left = operand(node.left());
        if (!left) return fail(left.error());
        auto right = operand(node.right());
        if (!right) return fail(right.error());
        result_ = ctx_.dialect().formatArithmetic(*left, node.op(), *right);
    }

}  // namespace cppquery
