#ifndef cppquery_EXPRESSION_OPERATORS_H
#define cppquery_EXPRESSION_OPERATORS_H

namespace cppquery {

    enum class ComparisonOp { Eq, Ne, Lt, Le, Gt, Ge, Like, NotLike };
    enum class LogicalOp { And, Or, Not };
    enum class ArithmeticOp { Add, Subtract, Multiply, Divide, Modulo, Concat };
    enum class AggregateFunc { Count, Sum, Avg, Min, Max };

    enum class SortDirection { Asc, Desc };
    enum class NullsOrder { Default, First, Last };

    enum class FrameUnit { Rows, Range };
    enum class FrameBoundKind { UnboundedPreceding, Preceding, CurrentRow, Following, UnboundedFollowing };

    enum class JoinType { Inner, Left, Right, Full, Cross };
    enum class SetOperator { Union, UnionAll, Intersect, Except };
    enum class LockMode { None, ForUpdate, ForShare };

    // 数值越大绑定越紧
    enum class Precedence : int { Lowest = 0, Or = 1, And = 2, Not = 3, Comparison = 4, Additive = 5, Multiplicative = 6, Primary = 10 };

    const char* setOperatorName(SetOperator op);
    const char* joinTypeName(JoinType type);

}  // namespace cppquery

#endif  // cppquery_EXPRESSION_OPERATORS_H
