// cppquery/expression/expression.cpp
#include "cppquery/expression/expression.h"

namespace cppquery {

    const char* setOperatorName(SetOperator op) {
        switch (op) {
            case SetOperator::Union:
                return "UNION";
            case SetOperator::UnionAll:
                return "UNION ALL";
            case SetOperator::Intersect:
                return "INTERSECT";
            case SetOperator::Except:
                return "EXCEPT";
        }
        return "UNION";
    }

    const char* joinTypeName(JoinType type) {
        switch (type) {
            case JoinType::Inner:
                return "INNER JOIN";
            case JoinType::Left:
                return "LEFT JOIN";
            case JoinType::Right:
                return "RIGHT JOIN";
            case JoinType::Full:
                return "FULL JOIN";
            case JoinType::Cross:
                return "CROSS JOIN";
        }
        return "JOIN";
    }

    ColumnExpression::ColumnExpression(std::string table, std::string name, std::optional<std::string> alias) : table_(std::move(table)), name_(std::move(name)), alias_(std::move(alias)) {
    }
    void ColumnExpression::accept(ExpressionVisitor& visitor) const {
        visitor.visit(*this);
    }

    LiteralExpression::LiteralExpression(Value value, std::optional<LogicalType> type) : value_(std::move(value)), type_(type ? type : inferLogicalType(value_)) {
    }
    void LiteralExpression::accept(ExpressionVisitor& visitor) const {
        visitor.visit(*this);
    }

    ComparisonExpression::ComparisonExpression(ExprPtr left, ComparisonOp op, ExprPtr right) : left_(std::move(left)), op_(op), right_(std::move(right)) {
    }
    void ComparisonExpression::accept(ExpressionVisitor& visitor) const {
        visitor.visit(*this);
    }

    LogicalExpression::LogicalExpression(LogicalOp op, std::vector<ExprPtr> children) : op_(op), children_(std::move(children)) {
    }
    void LogicalExpression::accept(ExpressionVisitor& visitor) const {
        visitor.visit(*this);
    }
    Precedence LogicalExpression::precedence() const {
        switch (op_) {
            case LogicalOp::Or:
                return Precedence::Or;
            case LogicalOp::And:
                return Precedence::And;
            case LogicalOp::Not:
                return Precedence::Not;
        }
        return Precedence::Lowest;
    }

    AggregateExpression::AggregateExpression(AggregateFunc func, ExprPtr arg, bool distinct, ExprPtr filter) : func_(func), arg_(std::move(arg)), distinct_(distinct), filter_(std::move(filter)) {
    }
    void AggregateExpression::accept(ExpressionVisitor& visitor) const {
        visitor.visit(*this);
    }

    WindowExpression::WindowExpression(ExprPtr function, std::vector<ExprPtr> partition_by, std::vector<OrderTerm> order_by, std::optional<WindowFrame> frame)
        : function_(std::move(function)), partition_by_(std::move(partition_by)), order_by_(std::move(order_by)), frame_(std::move(frame)) {
    }
    void WindowExpression::accept(ExpressionVisitor& visitor) const {
        visitor.visit(*this);
    }

    CteRefExpression::CteRefExpression(std::string name, std::optional<std::string> alias) : name_(std::move(name)), alias_(std::move(alias)) {
    }
    void CteRefExpression::accept(ExpressionVisitor& visitor) const {
        visitor.visit(*this);
    }

    ExcludedColumnExpression::ExcludedColumnExpression(std::string name) : name_(std::move(name)) {
    }
    void ExcludedColumnExpression::accept(ExpressionVisitor& visitor) const {
        visitor.visit(*this);
    }

    SubqueryExpression::SubqueryExpression(QuerySourcePtr query) : query_(std::move(query)) {
    }
    void SubqueryExpression::accept(ExpressionVisitor& visitor) const {
        visitor.visit(*this);
    }

    FunctionCallExpression::FunctionCallExpression(std::string name, std::vector<ExprPtr> args) : name_(std::move(name)), args_(std::move(args)) {
    }
    void FunctionCallExpression::accept(ExpressionVisitor& visitor) const {
        visitor.visit(*this);
    }

    InExpression::InExpression(ExprPtr expr, std::vector<ExprPtr> values, bool negated) : expr_(std::move(expr)), values_(std::move(values)), negated_(negated) {
    }
    InExpression::InExpression(ExprPtr expr, QuerySourcePtr subquery, bool negated) : expr_(std::move(expr)), subquery_(std::move(subquery)), negated_(negated) {
    }
    void InExpression::accept(ExpressionVisitor& visitor) const {
        visitor.visit(*this);
    }

    BetweenExpression::BetweenExpression(ExprPtr expr, ExprPtr low, ExprPtr high, bool negated) : expr_(std::move(expr)), low_(std::move(low)), high_(std::move(high)), negated_(negated) {
    }
    void BetweenExpression::accept(ExpressionVisitor& visitor) const {
        visitor.visit(*this);
    }

    IsNullExpression::IsNullExpression(ExprPtr expr, bool negated) : expr_(std::move(expr)), negated_(negated) {
    }
    void IsNullExpression::accept(ExpressionVisitor& visitor) const {
        visitor.visit(*this);
    }

    CaseExpression::CaseExpression(std::vector<WhenClause> whens, ExprPtr else_result) : whens_(std::move(whens)), else_(std::move(else_result)) {
    }
    void CaseExpression::accept(ExpressionVisitor& visitor) const {
        visitor.visit(*this);
    }

    CastExpression::CastExpression(ExprPtr expr, LogicalType target) : expr_(std::move(expr)), target_(target) {
    }
    void CastExpression::accept(ExpressionVisitor& visitor) const {
        visitor.visit(*this);
    }

    ArithmeticExpression::ArithmeticExpression(ExprPtr left, ArithmeticOp op, ExprPtr right) : left_(std::move(left)), op_(op), right_(std::move(right)) {
    }
    void ArithmeticExpression::accept(ExpressionVisitor& visitor) const {
        visitor.visit(*this);
    }
    Precedence ArithmeticExpression::precedence() const {
        switch (op_) {
            case ArithmeticOp::Multiply:
            case ArithmeticOp::Divide:
            case ArithmeticOp::Modulo:
                return Precedence::Multiplicative;
            case ArithmeticOp::Add:
            case ArithmeticOp::Subtract:
            case ArithmeticOp::Concat:
                return Precedence::Additive;
        }
        return Precedence::Additive;
    }

}  // namespace cppquery
