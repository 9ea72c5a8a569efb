#ifndef cppquery_CTE_REFERENCE_COLLECTOR_H
#define cppquery_CTE_REFERENCE_COLLECTOR_H

#include <set>
#include <string>

#include "cppquery/expression/expression.h"

namespace cppquery {

    // 收集表达式树 (含子查询) 中引用到的 CTE 名称
    class CteReferenceCollector : public ExpressionVisitor {
      public:
        explicit CteReferenceCollector(std::set<std::string>& names) : names_(names) {
        }

        void collect(const ExprPtr& expr);

        void visit(const ColumnExpression& node) override;
        void visit(const LiteralExpression& node) override;
        void visit(const ComparisonExpression& node) override;
        void visit(const LogicalExpression& node) override;
        void visit(const AggregateExpression& node) override;
        void visit(const WindowExpression& node) override;
        void visit(const CteRefExpression& node) override;
        void visit(const ExcludedColumnExpression& node) override;
        void visit(const SubqueryExpression& node) override;
        void visit(const FunctionCallExpression& node) override;
        void visit(const InExpression& node) override;
        void visit(const BetweenExpression& node) override;
        void visit(const IsNullExpression& node) override;
        void visit(const CaseExpression& node) override;
        void visit(const CastExpression& node) override;
        void visit(const ArithmeticExpression& node) override;

      private:
        std::set<std::string>& names_;
    };

}  // namespace cppquery

#endif  // cppquery_CTE_REFERENCE_COLLECTOR_H
