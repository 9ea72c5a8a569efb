// cppquery/expression/expression_builders.cpp
#include "cppquery/expression/expression_builders.h"

#include <QDebug>

namespace cppquery {

    namespace {
        ExprPtr makeAggregate(AggregateFunc func, ExprPtr arg, bool distinct = false) {
            return std::make_shared<AggregateExpression>(func, std::move(arg), distinct);
        }

        ExprPtr makeLogical(LogicalOp op, std::vector<ExprPtr> children) {
            // 单个子节点的 AND / OR 等价于该子节点本身
            if (op != LogicalOp::Not && children.size() == 1) {
                return children.front();
            }
            return std::make_shared<LogicalExpression>(op, std::move(children));
        }
    }  // namespace

    ExprPtr col(const std::string& name) {
        return std::make_shared<ColumnExpression>("", name);
    }
    ExprPtr col(const std::string& table, const std::string& name) {
        return std::make_shared<ColumnExpression>(table, name);
    }
    ExprPtr colAs(const std::string& table, const std::string& name, const std::string& alias) {
        return std::make_shared<ColumnExpression>(table, name, alias);
    }
    ExprPtr star(const std::string& table) {
        return std::make_shared<ColumnExpression>(table, "*");
    }

    ExprPtr lit(Value value) {
        return std::make_shared<LiteralExpression>(std::move(value));
    }
    ExprPtr lit(bool value) {
        return std::make_shared<LiteralExpression>(Value(value));
    }
    ExprPtr lit(int value) {
        return std::make_shared<LiteralExpression>(Value(static_cast<long long>(value)));
    }
    ExprPtr lit(long long value) {
        return std::make_shared<LiteralExpression>(Value(value));
    }
    ExprPtr lit(double value) {
        return std::make_shared<LiteralExpression>(Value(value));
    }
    ExprPtr lit(const char* text) {
        return std::make_shared<LiteralExpression>(Value(std::string(text ? text : "")));
    }
    ExprPtr lit(std::string text) {
        return std::make_shared<LiteralExpression>(Value(std::move(text)));
    }
    ExprPtr lit(Value value, LogicalType type) {
        return std::make_shared<LiteralExpression>(std::move(value), type);
    }

    ExprPtr eq(ExprPtr left, ExprPtr right) {
        return std::make_shared<ComparisonExpression>(std::move(left), ComparisonOp::Eq, std::move(right));
    }
    ExprPtr ne(ExprPtr left, ExprPtr right) {
        return std::make_shared<ComparisonExpression>(std::move(left), ComparisonOp::Ne, std::move(right));
    }
    ExprPtr lt(ExprPtr left, ExprPtr right) {
        return std::make_shared<ComparisonExpression>(std::move(left), ComparisonOp::Lt, std::move(right));
    }
    ExprPtr le(ExprPtr left, ExprPtr right) {
        return std::make_shared<ComparisonExpression>(std::move(left), ComparisonOp::Le, std::move(right));
    }
    ExprPtr gt(ExprPtr left, ExprPtr right) {
        return std::make_shared<ComparisonExpression>(std::move(left), ComparisonOp::Gt, std::move(right));
    }
    ExprPtr ge(ExprPtr left, ExprPtr right) {
        return std::make_shared<ComparisonExpression>(std::move(left), ComparisonOp::Ge, std::move(right));
    }
    ExprPtr like(ExprPtr left, ExprPtr pattern) {
        return std::make_shared<ComparisonExpression>(std::move(left), ComparisonOp::Like, std::move(pattern));
    }
    ExprPtr notLike(ExprPtr left, ExprPtr pattern) {
        return std::make_shared<ComparisonExpression>(std::move(left), ComparisonOp::NotLike, std::move(pattern));
    }

    ExprPtr and_(std::vector<ExprPtr> children) {
        return makeLogical(LogicalOp::And, std::move(children));
    }
    ExprPtr and_(ExprPtr a, ExprPtr b) {
        return makeLogical(LogicalOp::And, {std::move(a), std::move(b)});
    }
    ExprPtr or_(std::vector<ExprPtr> children) {
        return makeLogical(LogicalOp::Or, std::move(children));
    }
    ExprPtr or_(ExprPtr a, ExprPtr b) {
        return makeLogical(LogicalOp::Or, {std::move(a), std::move(b)});
    }
    ExprPtr not_(ExprPtr child) {
        return makeLogical(LogicalOp::Not, {std::move(child)});
    }

    ExprPtr in(ExprPtr expr, std::vector<ExprPtr> values) {
        return std::make_shared<InExpression>(std::move(expr), std::move(values));
    }
    ExprPtr in(ExprPtr expr, std::initializer_list<Value> values) {
        std::vector<ExprPtr> literals;
        literals.reserve(values.size());
        for (const auto& v : values) {
            literals.push_back(lit(v));
        }
        return std::make_shared<InExpression>(std::move(expr), std::move(literals));
    }
    ExprPtr inSubquery(ExprPtr expr, QuerySourcePtr query) {
        return std::make_shared<InExpression>(std::move(expr), std::move(query));
    }
    ExprPtr notIn(ExprPtr expr, std::vector<ExprPtr> values) {
        return std::make_shared<InExpression>(std::move(expr), std::move(values), true);
    }
    ExprPtr notInSubquery(ExprPtr expr, QuerySourcePtr query) {
        return std::make_shared<InExpression>(std::move(expr), std::move(query), true);
    }
    ExprPtr between(ExprPtr expr, ExprPtr low, ExprPtr high) {
        return std::make_shared<BetweenExpression>(std::move(expr), std::move(low), std::move(high));
    }
    ExprPtr notBetween(ExprPtr expr, ExprPtr low, ExprPtr high) {
        return std::make_shared<BetweenExpression>(std::move(expr), std::move(low), std::move(high), true);
    }
    ExprPtr isNull(ExprPtr expr) {
        return std::make_shared<IsNullExpression>(std::move(expr));
    }
    ExprPtr isNotNull(ExprPtr expr) {
        return std::make_shared<IsNullExpression>(std::move(expr), true);
    }

    ExprPtr count() {
        return makeAggregate(AggregateFunc::Count, nullptr);
    }
    ExprPtr count(ExprPtr arg) {
        return makeAggregate(AggregateFunc::Count, std::move(arg));
    }
    ExprPtr countDistinct(ExprPtr arg) {
        return makeAggregate(AggregateFunc::Count, std::move(arg), true);
    }
    ExprPtr sum(ExprPtr arg) {
        return makeAggregate(AggregateFunc::Sum, std::move(arg));
    }
    ExprPtr avg(ExprPtr arg) {
        return makeAggregate(AggregateFunc::Avg, std::move(arg));
    }
    ExprPtr min(ExprPtr arg) {
        return makeAggregate(AggregateFunc::Min, std::move(arg));
    }
    ExprPtr max(ExprPtr arg) {
        return makeAggregate(AggregateFunc::Max, std::move(arg));
    }

    ExprPtr filtered(ExprPtr aggregate, ExprPtr condition) {
        const auto* agg = dynamic_cast<const AggregateExpression*>(aggregate.get());
        if (!agg) {
            qWarning("cppquery filtered: FILTER can only be attached to an aggregate expression, returning it unchanged.");
            return aggregate;
        }
        return std::make_shared<AggregateExpression>(agg->func(), agg->arg(), agg->distinct(), std::move(condition));
    }

    ExprPtr rowNumber() {
        return std::make_shared<FunctionCallExpression>("ROW_NUMBER", std::vector<ExprPtr>{});
    }
    ExprPtr rank() {
        return std::make_shared<FunctionCallExpression>("RANK", std::vector<ExprPtr>{});
    }
    ExprPtr denseRank() {
        return std::make_shared<FunctionCallExpression>("DENSE_RANK", std::vector<ExprPtr>{});
    }
    ExprPtr over(ExprPtr function, std::vector<ExprPtr> partition_by, std::vector<OrderTerm> order_by, std::optional<WindowFrame> frame) {
        return std::make_shared<WindowExpression>(std::move(function), std::move(partition_by), std::move(order_by), std::move(frame));
    }

    ExprPtr fn(const std::string& name, std::vector<ExprPtr> args) {
        return std::make_shared<FunctionCallExpression>(name, std::move(args));
    }
    ExprPtr cteRef(const std::string& name, std::optional<std::string> alias) {
        return std::make_shared<CteRefExpression>(name, std::move(alias));
    }
    ExprPtr excluded(const std::string& column) {
        return std::make_shared<ExcludedColumnExpression>(column);
    }
    ExprPtr subquery(QuerySourcePtr query) {
        return std::make_shared<SubqueryExpression>(std::move(query));
    }
    ExprPtr caseWhen(std::vector<CaseExpression::WhenClause> whens, ExprPtr else_result) {
        return std::make_shared<CaseExpression>(std::move(whens), std::move(else_result));
    }
    ExprPtr cast(ExprPtr expr, LogicalType target) {
        return std::make_shared<CastExpression>(std::move(expr), target);
    }
    ExprPtr add(ExprPtr left, ExprPtr right) {
        return std::make_shared<ArithmeticExpression>(std::move(left), ArithmeticOp::Add, std::move(right));
    }
    ExprPtr sub(ExprPtr left, ExprPtr right) {
        return std::make_shared<ArithmeticExpression>(std::move(left), ArithmeticOp::Subtract, std::move(right));
    }
    ExprPtr mul(ExprPtr left, ExprPtr right) {
        return std::make_shared<ArithmeticExpression>(std::move(left), ArithmeticOp::Multiply, std::move(right));
    }
    ExprPtr div(ExprPtr left, ExprPtr right) {
        return std::make_shared<ArithmeticExpression>(std::move(left), ArithmeticOp::Divide, std::move(right));
    }
    ExprPtr mod(ExprPtr left, ExprPtr right) {
        return std::make_shared<ArithmeticExpression>(std::move(left), ArithmeticOp::Modulo, std::move(right));
    }
    ExprPtr concat(ExprPtr left, ExprPtr right) {
        return std::make_shared<ArithmeticExpression>(std::move(left), ArithmeticOp::Concat, std::move(right));
    }

    OrderTerm asc(ExprPtr expr, NullsOrder nulls) {
        return OrderTerm{std::move(expr), SortDirection::Asc, nulls};
    }
    OrderTerm desc(ExprPtr expr, NullsOrder nulls) {
        return OrderTerm{std::move(expr), SortDirection::Desc, nulls};
    }

}  // namespace cppquery
