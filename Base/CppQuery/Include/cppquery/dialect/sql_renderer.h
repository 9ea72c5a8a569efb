#ifndef cppquery_SQL_RENDERER_H
#define cppquery_SQL_RENDERER_H

#include <expected>
#include <optional>
#include <string>

#include "cppquery/dialect/dialect.h"
#include "cppquery/error.h"
#include "cppquery/expression/expression.h"

namespace cppquery {

    class RenderContext;

    // 把表达式树翻译为方言调用. 节点本身从不拼接 SQL 文本
    class SqlRenderer : public ExpressionVisitor {
      public:
        explicit SqlRenderer(RenderContext& ctx) : ctx_(ctx) {
        }

        std::expected<std::string, Error> render(const ExprPtr& expr);

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
        std::expected<RenderedOperand, Error> operand(const ExprPtr& expr);
        void fail(Error error);

        RenderContext& ctx_;
        std::string result_;
        std::optional<Error> error_;
    };

}  // namespace cppquery

#endif  // cppquery_SQL_RENDERER_H
