// cppquery/expression/cte_reference_collector.cpp
#include "cppquery/expression/cte_reference_collector.h"

#include "cppquery/query/query_source.h"

namespace cppquery {

    void CteReferenceCollector::collect(const ExprPtr& expr) {
        if (expr) {
            expr->accept(*this);
        }
    }

    void CteReferenceCollector::visit(const ColumnExpression&) {
    }

    void CteReferenceCollector::visit(const LiteralExpression&) {
    }

    void CteReferenceCollector::visit(const ComparisonExpression& node) {
        collect(node.left());
        collect(node.right());
    }

    void CteReferenceCollector::visit(const LogicalExpression& node) {
        for (const auto& child : node.children()) {
            collect(child);
        }
    }

    void CteReferenceCollector::visit(const AggregateExpression& node) {
        collect(node.arg());
        collect(node.filter());
    }

    void CteReferenceCollector::visit(const WindowExpression& node) {
        collect(node.function());
        for (const auto& p : node.partitionBy()) collect(p);
        for (const auto& o : node.orderBy()) collect(o.expr);
    }

    void CteReferenceCollector::visit(const CteRefExpression& node) {
        names_.insert(node.name());
    }

    void CteReferenceCollector::visit(const ExcludedColumnExpression&) {
    }

    void CteReferenceCollector::visit(const SubqueryExpression& node) {
        if (node.query()) {
            node.query()->collectCteReferences(names_);
        }
    }

    void CteReferenceCollector::visit(const FunctionCallExpression& node) {
        for (const auto& arg : node.args()) {
            collect(arg);
        }
    }

    void CteReferenceCollector::visit(const InExpression& node) {
        collect(node.expr());
        for (const auto& v : node.values()) collect(v);
        if (node.subquery()) {
            node.subquery()->collectCteReferences(names_);
        }
    }

    void CteReferenceCollector::visit(const BetweenExpression& node) {
        collect(node.expr());
        collect(node.low());
        collect(node.high());
    }

    void CteReferenceCollector::visit(const IsNullExpression& node) {
        collect(node.expr());
    }

    void CteReferenceCollector::visit(const CaseExpression& node) {
        for (const auto& [when, then] : node.whens()) {
            collect(when);
            collect(then);
        }
        collect(node.elseResult());
    }

    void CteReferenceCollector::visit(const CastExpression& node) {
        collect(node.expr());
    }

    void CteReferenceCollector::visit(const ArithmeticExpression& node) {
        collect(node.left());
        collect(node.right());
    }

}  // namespace cppquery
