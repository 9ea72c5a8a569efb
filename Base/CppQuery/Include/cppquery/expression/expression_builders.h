#ifndef cppquery_EXPRESSION_BUILDERS_H
#define cppquery_EXPRESSION_BUILDERS_H

#include <initializer_list>
#include <string>
#include <vector>

#include "cppquery/expression/expression.h"

namespace cppquery {

    // --- 列与字面量 ---
    ExprPtr col(const std::string& name);
    ExprPtr col(const std::string& table, const std::string& name);
    ExprPtr colAs(const std::string& table, const std::string& name, const std::string& alias);
    ExprPtr star(const std::string& table = "");
    ExprPtr lit(Value value);
    ExprPtr lit(bool value);
    ExprPtr lit(int value);
    ExprPtr lit(long long value);
    ExprPtr lit(double value);
    ExprPtr lit(const char* text);
    ExprPtr lit(std::string text);
    ExprPtr lit(Value value, LogicalType type);

    // --- 比较 ---
    ExprPtr eq(ExprPtr left, ExprPtr right);
    ExprPtr ne(ExprPtr left, ExprPtr right);
    ExprPtr lt(ExprPtr left, ExprPtr right);
    ExprPtr le(ExprPtr left, ExprPtr right);
    ExprPtr gt(ExprPtr left, ExprPtr right);
    ExprPtr ge(ExprPtr left, ExprPtr right);
    ExprPtr like(ExprPtr left, ExprPtr pattern);
    ExprPtr notLike(ExprPtr left, ExprPtr pattern);

    // --- 逻辑组合 ---
    ExprPtr and_(std::vector<ExprPtr> children);
    ExprPtr and_(ExprPtr a, ExprPtr b);
    ExprPtr or_(std::vector<ExprPtr> children);
    ExprPtr or_(ExprPtr a, ExprPtr b);
    ExprPtr not_(ExprPtr child);

    // --- 谓词 ---
    ExprPtr in(ExprPtr expr, std::vector<ExprPtr> values);
    ExprPtr in(ExprPtr expr, std::initializer_list<Value> values);
    ExprPtr inSubquery(ExprPtr expr, QuerySourcePtr query);
    ExprPtr notIn(ExprPtr expr, std::vector<ExprPtr> values);
    ExprPtr notInSubquery(ExprPtr expr, QuerySourcePtr query);
    ExprPtr between(ExprPtr expr, ExprPtr low, ExprPtr high);
    ExprPtr notBetween(ExprPtr expr, ExprPtr low, ExprPtr high);
    ExprPtr isNull(ExprPtr expr);
    ExprPtr isNotNull(ExprPtr expr);

    // --- 聚合 ---
    ExprPtr count();  // COUNT(*)
    ExprPtr count(ExprPtr arg);
    ExprPtr countDistinct(ExprPtr arg);
    ExprPtr sum(ExprPtr arg);
    ExprPtr avg(ExprPtr arg);
    ExprPtr min(ExprPtr arg);
    ExprPtr max(ExprPtr arg);
    // 为聚合追加 FILTER (WHERE ...), 传入的必须是聚合节点
    ExprPtr filtered(ExprPtr aggregate, ExprPtr condition);

    // --- 窗口函数 ---
    ExprPtr rowNumber();
    ExprPtr rank();
    ExprPtr denseRank();
    ExprPtr over(ExprPtr function, std::vector<ExprPtr> partition_by, std::vector<OrderTerm> order_by, std::optional<WindowFrame> frame = std::nullopt);

    // --- 其他 ---
    ExprPtr fn(const std::string& name, std::vector<ExprPtr> args = {});
    ExprPtr cteRef(const std::string& name, std::optional<std::string> alias = std::nullopt);
    // 只在 InsertQuery 的冲突更新中有意义
    ExprPtr excluded(const std::string& column);
    ExprPtr subquery(QuerySourcePtr query);
    ExprPtr caseWhen(std::vector<CaseExpression::WhenClause> whens, ExprPtr else_result = nullptr);
    ExprPtr cast(ExprPtr expr, LogicalType target);
    ExprPtr add(ExprPtr left, ExprPtr right);
    ExprPtr sub(ExprPtr left, ExprPtr right);
    ExprPtr mul(ExprPtr left, ExprPtr right);
    ExprPtr div(ExprPtr left, ExprPtr right);
    ExprPtr mod(ExprPtr left, ExprPtr right);
    ExprPtr concat(ExprPtr left, ExprPtr right);

    OrderTerm asc(ExprPtr expr, NullsOrder nulls = NullsOrder::Default);
    OrderTerm desc(ExprPtr expr, NullsOrder nulls = NullsOrder::Default);

}  // namespace cppquery

#endif  // cppquery_EXPRESSION_BUILDERS_H
