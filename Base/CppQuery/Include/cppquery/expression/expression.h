#ifndef cppquery_EXPRESSION_H
#define cppquery_EXPRESSION_H

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "cppquery/expression/operators.h"
#include "cppquery/logical_type.h"
#include "cppquery/value.h"

namespace cppquery {

    class Expression;
    class ExpressionVisitor;
    class QuerySource;

    // 表达式节点构造后不可变, 因此可以在 SELECT / ORDER BY 等多个分支间共享
    using ExprPtr = std::shared_ptr<const Expression>;
    using QuerySourcePtr = std::shared_ptr<const QuerySource>;

    // 节点只描述结构, 不保存任何 SQL 文本; 渲染由方言完成
    class Expression {
      public:
        virtual ~Expression() = default;
        virtual void accept(ExpressionVisitor& visitor) const = 0;
        virtual Precedence precedence() const {
            return Precedence::Primary;
        }
    };

    struct OrderTerm {
        ExprPtr expr;
        SortDirection direction = SortDirection::Asc;
        NullsOrder nulls = NullsOrder::Default;
    };

    struct FrameBound {
        FrameBoundKind kind = FrameBoundKind::CurrentRow;
        long long offset = 0;  // 仅 Preceding / Following 使用

        static FrameBound unboundedPreceding() {
            return {FrameBoundKind::UnboundedPreceding, 0};
        }
        static FrameBound preceding(long long n) {
            return {FrameBoundKind::Preceding, n};
        }
        static FrameBound currentRow() {
            return {FrameBoundKind::CurrentRow, 0};
        }
        static FrameBound following(long long n) {
            return {FrameBoundKind::Following, n};
        }
        static FrameBound unboundedFollowing() {
            return {FrameBoundKind::UnboundedFollowing, 0};
        }
    };

    struct WindowFrame {
        FrameUnit unit = FrameUnit::Rows;
        FrameBound start = FrameBound::unboundedPreceding();
        FrameBound end = FrameBound::currentRow();
    };

    // --- 节点定义 ---

    class ColumnExpression : public Expression {
      public:
        ColumnExpression(std::string table, std::string name, std::optional<std::string> alias = std::nullopt);
        void accept(ExpressionVisitor& visitor) const override;

        const std::string& table() const {
            return table_;
        }
        const std::string& name() const {
            return name_;
        }
        const std::optional<std::string>& alias() const {
            return alias_;
        }
        bool isWildcard() const {
            return name_ == "*";
        }

      private:
        std::string table_;  // 可为空
        std::string name_;
        std::optional<std::string> alias_;
    };

    class LiteralExpression : public Expression {
      public:
        // 未指定逻辑类型时按值推断
        explicit LiteralExpression(Value value, std::optional<LogicalType> type = std::nullopt);
        void accept(ExpressionVisitor& visitor) const override;

        const Value& value() const {
            return value_;
        }
        std::optional<LogicalType> logicalType() const {
            return type_;
        }

      private:
        Value value_;
        std::optional<LogicalType> type_;
    };

    class ComparisonExpression : public Expression {
      public:
        ComparisonExpression(ExprPtr left, ComparisonOp op, ExprPtr right);
        void accept(ExpressionVisitor& visitor) const override;
        Precedence precedence() const override {
            return Precedence::Comparison;
        }

        const ExprPtr& left() const {
            return left_;
        }
        ComparisonOp op() const {
            return op_;
        }
        const ExprPtr& right() const {
            return right_;
        }

      private:
        ExprPtr left_;
        ComparisonOp op_;
        ExprPtr right_;
    };

    class LogicalExpression : public Expression {
      public:
        // NOT 只接受一个子节点
        LogicalExpression(LogicalOp op, std::vector<ExprPtr> children);
        void accept(ExpressionVisitor& visitor) const override;
        Precedence precedence() const override;

        LogicalOp op() const {
            return op_;
        }
        const std::vector<ExprPtr>& children() const {
            return children_;
        }

      private:
        LogicalOp op_;
        std::vector<ExprPtr> children_;
    };

    class AggregateExpression : public Expression {
      public:
        // arg 为空表示 COUNT(*)
        AggregateExpression(AggregateFunc func, ExprPtr arg, bool distinct = false, ExprPtr filter = nullptr);
        void accept(ExpressionVisitor& visitor) const override;

        AggregateFunc func() const {
            return func_;
        }
        const ExprPtr& arg() const {
            return arg_;
        }
        bool distinct() const {
            return distinct_;
        }
        const ExprPtr& filter() const {
            return filter_;
        }

      private:
        AggregateFunc func_;
        ExprPtr arg_;
        bool distinct_;
        ExprPtr filter_;
    };

    class WindowExpression : public Expression {
      public:
        WindowExpression(ExprPtr function, std::vector<ExprPtr> partition_by, std::vector<OrderTerm> order_by, std::optional<WindowFrame> frame = std::nullopt);
        void accept(ExpressionVisitor& visitor) const override;

        const ExprPtr& function() const {
            return function_;
        }
        const std::vector<ExprPtr>& partitionBy() const {
            return partition_by_;
        }
        const std::vector<OrderTerm>& orderBy() const {
            return order_by_;
        }
        const std::optional<WindowFrame>& frame() const {
            return frame_;
        }

      private:
        ExprPtr function_;
        std::vector<ExprPtr> partition_by_;
        std::vector<OrderTerm> order_by_;
        std::optional<WindowFrame> frame_;
    };

    // 对 WITH 子句中已命名 CTE 的引用
    class CteRefExpression : public Expression {
      public:
        explicit CteRefExpression(std::string name, std::optional<std::string> alias = std::nullopt);
        void accept(ExpressionVisitor& visitor) const override;

        const std::string& name() const {
            return name_;
        }
        const std::optional<std::string>& alias() const {
            return alias_;
        }

      private:
        std::string name_;
        std::optional<std::string> alias_;
    };

    // INSERT 冲突处理中被拒绝插入的那一行的列
    class ExcludedColumnExpression : public Expression {
      public:
        explicit ExcludedColumnExpression(std::string name);
        void accept(ExpressionVisitor& visitor) const override;

        const std::string& name() const {
            return name_;
        }

      private:
        std::string name_;
    };

    class SubqueryExpression : public Expression {
      public:
        explicit SubqueryExpression(QuerySourcePtr query);
        void accept(ExpressionVisitor& visitor) const override;

        const QuerySourcePtr& query() const {
            return query_;
        }

      private:
        QuerySourcePtr query_;
    };

    class FunctionCallExpression : public Expression {
      public:
        FunctionCallExpression(std::string name, std::vector<ExprPtr> args);
        void accept(ExpressionVisitor& visitor) const override;

        const std::string& name() const {
            return name_;
        }
        const std::vector<ExprPtr>& args() const {
            return args_;
        }

      private:
        std::string name_;
        std::vector<ExprPtr> args_;
    };

    class InExpression : public Expression {
      public:
        InExpression(ExprPtr expr, std::vector<ExprPtr> values, bool negated = false);
        InExpression(ExprPtr expr, QuerySourcePtr subquery, bool negated = false);
        void accept(ExpressionVisitor& visitor) const override;
        Precedence precedence() const override {
            return Precedence::Comparison;
        }

        const ExprPtr& expr() const {
            return expr_;
        }
        const std::vector<ExprPtr>& values() const {
            return values_;
        }
        const QuerySourcePtr& subquery() const {
            return subquery_;
        }
        bool negated() const {
            return negated_;
        }

      private:
        ExprPtr expr_;
        std::vector<ExprPtr> values_;
        QuerySourcePtr subquery_;
        bool negated_;
    };

    class BetweenExpression : public Expression {
      public:
        BetweenExpression(ExprPtr expr, ExprPtr low, ExprPtr high, bool negated = false);
        void accept(ExpressionVisitor& visitor) const override;
        Precedence precedence() const override {
            return Precedence::Comparison;
        }

        const ExprPtr& expr() const {
            return expr_;
        }
        const ExprPtr& low() const {
            return low_;
        }
        const ExprPtr& high() const {
            return high_;
        }
        bool negated() const {
            return negated_;
        }

      private:
        ExprPtr expr_;
        ExprPtr low_;
        ExprPtr high_;
        bool negated_;
    };

    class IsNullExpression : public Expression {
      public:
        explicit IsNullExpression(ExprPtr expr, bool negated = false);
        void accept(ExpressionVisitor& visitor) const override;
        Precedence precedence() const override {
            return Precedence::Comparison;
        }

        const ExprPtr& expr() const {
            return expr_;
        }
        bool negated() const {
            return negated_;
        }

      private:
        ExprPtr expr_;
        bool negated_;
    };

    class CaseExpression : public Expression {
      public:
        using WhenClause = std::pair<ExprPtr, ExprPtr>;  // (条件, 结果)

        CaseExpression(std::vector<WhenClause> whens, ExprPtr else_result = nullptr);
        void accept(ExpressionVisitor& visitor) const override;

        const std::vector<WhenClause>& whens() const {
            return whens_;
        }
        const ExprPtr& elseResult() const {
            return else_;
        }

      private:
        std::vector<WhenClause> whens_;
        ExprPtr else_;
    };

    class CastExpression : public Expression {
      public:
        CastExpression(ExprPtr expr, LogicalType target);
        void accept(ExpressionVisitor& visitor) const override;

        const ExprPtr& expr() const {
            return expr_;
        }
        LogicalType target() const {
            return target_;
        }

      private:
        ExprPtr expr_;
        LogicalType target_;
    };

    class ArithmeticExpression : public Expression {
      public:
        ArithmeticExpression(ExprPtr left, ArithmeticOp op, ExprPtr right);
        void accept(ExpressionVisitor& visitor) const override;
        Precedence precedence() const override;

        const ExprPtr& left() const {
            return left_;
        }
        ArithmeticOp op() const {
            return op_;
        }
        const ExprPtr& right() const {
            return right_;
        }

      private:
        ExprPtr left_;
        ArithmeticOp op_;
        ExprPtr right_;
    };

    // 每个节点类型一个纯虚方法, 新增节点时所有访问者都必须更新
    class ExpressionVisitor {
      public:
        virtual ~ExpressionVisitor() = default;

        virtual void visit(const ColumnExpression& node) = 0;
        virtual void visit(const LiteralExpression& node) = 0;
        virtual void visit(const ComparisonExpression& node) = 0;
        virtual void visit(const LogicalExpression& node) = 0;
        virtual void visit(const AggregateExpression& node) = 0;
        virtual void visit(const WindowExpression& node) = 0;
        virtual void visit(const CteRefExpression& node) = 0;
        virtual void visit(const ExcludedColumnExpression& node) = 0;
        virtual void visit(const SubqueryExpression& node) = 0;
        virtual void visit(const FunctionCallExpression& node) = 0;
        virtual void visit(const InExpression& node) = 0;
        virtual void visit(const BetweenExpression& node) = 0;
        virtual void visit(const IsNullExpression& node) = 0;
        virtual void visit(const CaseExpression& node) = 0;
        virtual void visit(const CastExpression& node) = 0;
        virtual void visit(const ArithmeticExpression& node) = 0;
    };

}  // namespace cppquery

#endif  // cppquery_EXPRESSION_H
