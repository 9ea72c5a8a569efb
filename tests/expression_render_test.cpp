#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "cppquery/dialect/render_context.h"
#include "cppquery/expression/expression_builders.h"
#include "test_support.h"

using namespace cppquery;
using cppquery_sqldriver::SqlValue;
using cppquery_sqldriver::SqlValueType;

namespace {

    struct Rendered {
        std::string sql;
        std::vector<SqlValue> params;
    };

    Rendered renderOk(const DialectPtr& dialect, const ExprPtr& expr) {
        RenderContext ctx(*dialect);
        auto sql = ctx.render(expr);
        EXPECT_TRUE(sql.has_value()) << sql.error().toString();
        if (!sql) return {};
        return {*sql, ctx.takeParams()};
    }

    Error renderError(const DialectPtr& dialect, const ExprPtr& expr, const std::string& clause = "WHERE") {
        RenderContext ctx(*dialect);
        ClauseScope scope(ctx, clause);
        auto sql = ctx.render(expr);
        EXPECT_FALSE(sql.has_value()) << "unexpected SQL: " << (sql ? *sql : std::string());
        return sql ? Error() : sql.error();
    }

}  // namespace

class ExpressionRenderTest : public ::testing::Test {
  protected:
    DialectPtr sqlite_ = test::sqliteDialect();
    DialectPtr mysql_ = test::mysqlDialect();
    DialectPtr postgres_ = test::postgresDialect();
};

TEST_F(ExpressionRenderTest, ComparisonBindsLiteralAsParameter) {
    auto r = renderOk(sqlite_, eq(col("users", "age"), lit(18)));
    EXPECT_EQ(r.sql, "\"users\".\"age\" = ?");
    ASSERT_EQ(r.params.size(), 1u);
    EXPECT_EQ(r.params[0], SqlValue(18LL));
}

TEST_F(ExpressionRenderTest, PlaceholderStylePerDialect) {
    auto expr = and_(eq(col("a"), lit(1)), eq(col("b"), lit("x")));
    EXPECT_EQ(renderOk(sqlite_, expr).sql, "\"a\" = ? AND \"b\" = ?");
    EXPECT_EQ(renderOk(mysql_, expr).sql, "`a` = %s AND `b` = %s");
    EXPECT_EQ(renderOk(postgres_, expr).sql, "\"a\" = $1 AND \"b\" = $2");
}

TEST_F(ExpressionRenderTest, ParametersFollowPlaceholderOrder) {
    auto expr = or_(between(col("n"), lit(1), lit(5)), in(col("s"), {Value(std::string("p")), Value(std::string("q"))}));
    auto r = renderOk(postgres_, expr);
    EXPECT_EQ(r.sql, "\"n\" BETWEEN $1 AND $2 OR \"s\" IN ($3, $4)");
    ASSERT_EQ(r.params.size(), 4u);
    EXPECT_EQ(r.params[0], SqlValue(1LL));
    EXPECT_EQ(r.params[1], SqlValue(5LL));
    EXPECT_EQ(r.params[2].toString(), "p");
    EXPECT_EQ(r.params[3].toString(), "q");
}

TEST_F(ExpressionRenderTest, OrInsideAndIsParenthesized) {
    auto expr = and_(or_(eq(col("a"), lit(1)), eq(col("b"), lit(2))), eq(col("c"), lit(3)));
    EXPECT_EQ(renderOk(sqlite_, expr).sql, "(\"a\" = ? OR \"b\" = ?) AND \"c\" = ?");
}

TEST_F(ExpressionRenderTest, AndInsideOrNeedsNoParentheses) {
    auto expr = or_(and_(eq(col("a"), lit(1)), eq(col("b"), lit(2))), eq(col("c"), lit(3)));
    EXPECT_EQ(renderOk(sqlite_, expr).sql, "\"a\" = ? AND \"b\" = ? OR \"c\" = ?");
}

TEST_F(ExpressionRenderTest, NotWrapsItsOperand) {
    auto expr = not_(or_(isNull(col("a")), isNotNull(col("b"))));
    EXPECT_EQ(renderOk(sqlite_, expr).sql, "NOT (\"a\" IS NULL OR \"b\" IS NOT NULL)");
}

TEST_F(ExpressionRenderTest, SingleChildConjunctionCollapses) {
    auto expr = and_(std::vector<ExprPtr>{gt(col("x"), lit(0))});
    EXPECT_EQ(renderOk(sqlite_, expr).sql, "\"x\" > ?");
}

TEST_F(ExpressionRenderTest, ArithmeticPrecedence) {
    EXPECT_EQ(renderOk(sqlite_, add(col("a"), add(col("b"), col("c")))).sql, "\"a\" + \"b\" + \"c\"");
    EXPECT_EQ(renderOk(sqlite_, sub(col("a"), sub(col("b"), col("c")))).sql, "\"a\" - (\"b\" - \"c\")");
    EXPECT_EQ(renderOk(sqlite_, mul(add(col("a"), col("b")), col("c"))).sql, "(\"a\" + \"b\") * \"c\"");
    EXPECT_EQ(renderOk(sqlite_, gt(add(col("a"), lit(1)), lit(2))).sql, "\"a\" + ? > ?");
}

TEST_F(ExpressionRenderTest, ConcatFollowsDialect) {
    EXPECT_EQ(renderOk(sqlite_, concat(col("first"), col("last"))).sql, "\"first\" || \"last\"");
    EXPECT_EQ(renderOk(mysql_, concat(col("first"), col("last"))).sql, "CONCAT(`first`, `last`)");
}

TEST_F(ExpressionRenderTest, IdentifiersAreQuotedAndEscaped) {
    EXPECT_EQ(renderOk(sqlite_, col("we\"ird")).sql, "\"we\"\"ird\"");
    EXPECT_EQ(renderOk(mysql_, col("we`ird")).sql, "`we``ird`");
    EXPECT_EQ(renderOk(sqlite_, star("t")).sql, "\"t\".*");
}

TEST_F(ExpressionRenderTest, HostileTextNeverReachesSql) {
    const std::string hostile = "x'; DROP TABLE users; --";
    auto r = renderOk(sqlite_, eq(col("name"), lit(hostile)));
    EXPECT_EQ(r.sql, "\"name\" = ?");
    EXPECT_EQ(r.sql.find("DROP"), std::string::npos);
    ASSERT_EQ(r.params.size(), 1u);
    EXPECT_EQ(r.params[0].toString(), hostile);
}

TEST_F(ExpressionRenderTest, NullLiteralBindsNull) {
    auto r = renderOk(sqlite_, eq(col("a"), lit(Value(nullptr))));
    EXPECT_EQ(r.sql, "\"a\" = ?");
    ASSERT_EQ(r.params.size(), 1u);
    EXPECT_TRUE(r.params[0].isNull());
}

TEST_F(ExpressionRenderTest, BooleanLiteralUsesDialectEncoding) {
    auto on_sqlite = renderOk(sqlite_, eq(col("flag"), lit(true)));
    ASSERT_EQ(on_sqlite.params.size(), 1u);
    EXPECT_EQ(on_sqlite.params[0].type(), SqlValueType::Int64);
    EXPECT_EQ(on_sqlite.params[0].toInt64(), 1);

    auto on_postgres = renderOk(postgres_, eq(col("flag"), lit(true)));
    ASSERT_EQ(on_postgres.params.size(), 1u);
    EXPECT_EQ(on_postgres.params[0].type(), SqlValueType::Bool);
}

TEST_F(ExpressionRenderTest, RenderingIsRepeatable) {
    auto expr = and_({ge(col("age"), lit(18)), like(col("name"), lit("A%")), notIn(col("id"), {lit(1), lit(2)})});
    auto first = renderOk(postgres_, expr);
    auto second = renderOk(postgres_, expr);
    EXPECT_EQ(first.sql, second.sql);
    EXPECT_EQ(first.params, second.params);
    EXPECT_EQ(first.sql, "\"age\" >= $1 AND \"name\" LIKE $2 AND \"id\" NOT IN ($3, $4)");
}

TEST_F(ExpressionRenderTest, Aggregates) {
    EXPECT_EQ(renderOk(sqlite_, count()).sql, "COUNT(*)");
    EXPECT_EQ(renderOk(sqlite_, countDistinct(col("dept"))).sql, "COUNT(DISTINCT \"dept\")");
    EXPECT_EQ(renderOk(sqlite_, sum(col("salary"))).sql, "SUM(\"salary\")");
    EXPECT_EQ(renderOk(sqlite_, cppquery::max(col("salary"))).sql, "MAX(\"salary\")");
}

TEST_F(ExpressionRenderTest, AggregateWithoutArgumentIsRejectedExceptCount) {
    Error err = renderError(sqlite_, sum(nullptr), "SELECT");
    EXPECT_EQ(err.code, ErrorCode::ConstructionError);
    EXPECT_EQ(err.clause, "SELECT");
}

TEST_F(ExpressionRenderTest, AggregateFilterNeedsDialectSupport) {
    auto expr = filtered(count(), gt(col("x"), lit(0)));
    EXPECT_EQ(renderOk(sqlite_, expr).sql, "COUNT(*) FILTER (WHERE \"x\" > ?)");

    Error err = renderError(mysql_, expr, "SELECT");
    EXPECT_EQ(err.code, ErrorCode::UnsupportedFeature);
    EXPECT_EQ(err.kind(), ErrorKind::Capability);
    EXPECT_EQ(err.dialect, "mysql");
}

TEST_F(ExpressionRenderTest, WindowFunction) {
    auto expr = over(rowNumber(), {col("dept")}, {desc(col("salary"))});
    EXPECT_EQ(renderOk(sqlite_, expr).sql, "ROW_NUMBER() OVER (PARTITION BY \"dept\" ORDER BY \"salary\" DESC)");

    WindowFrame frame;
    frame.unit = FrameUnit::Rows;
    frame.start = FrameBound{FrameBoundKind::Preceding, 2};
    frame.end = FrameBound{FrameBoundKind::CurrentRow, 0};
    auto framed = over(sum(col("amount")), {}, {asc(col("day"))}, frame);
    EXPECT_EQ(renderOk(postgres_, framed).sql, "SUM(\"amount\") OVER (ORDER BY \"day\" ASC ROWS BETWEEN 2 PRECEDING AND CURRENT ROW)");
}

TEST_F(ExpressionRenderTest, WindowFunctionOnOldSqliteIsCapabilityError) {
    auto old_sqlite = test::sqliteDialect({3, 20, 0});
    Error err = renderError(old_sqlite, over(rank(), {}, {asc(col("score"))}), "SELECT");
    EXPECT_EQ(err.kind(), ErrorKind::Capability);
    EXPECT_EQ(err.clause, "SELECT");
    EXPECT_NE(err.message.find("3.20.0"), std::string::npos) << err.message;
}

TEST_F(ExpressionRenderTest, NullsOrderingNeedsDialectSupport) {
    auto term = asc(col("name"), NullsOrder::Last);
    RenderContext sqlite_ctx(*sqlite_);
    auto ok = sqlite_ctx.renderOrderTerm(term);
    ASSERT_TRUE(ok.has_value()) << ok.error().toString();
    EXPECT_EQ(*ok, "\"name\" ASC NULLS LAST");

    RenderContext mysql_ctx(*mysql_);
    auto rejected = mysql_ctx.renderOrderTerm(term);
    ASSERT_FALSE(rejected.has_value());
    EXPECT_EQ(rejected.error().kind(), ErrorKind::Capability);
}

TEST_F(ExpressionRenderTest, CaseExpression) {
    auto expr = caseWhen({{gt(col("a"), lit(10)), lit("big")}}, lit("small"));
    auto r = renderOk(sqlite_, expr);
    EXPECT_EQ(r.sql, "CASE WHEN \"a\" > ? THEN ? ELSE ? END");
    EXPECT_EQ(r.params.size(), 3u);

    Error err = renderError(sqlite_, caseWhen({}));
    EXPECT_EQ(err.code, ErrorCode::ConstructionError);
}

TEST_F(ExpressionRenderTest, CastTargetsFollowDialect) {
    EXPECT_EQ(renderOk(sqlite_, cast(col("a"), LogicalType::Integer)).sql, "CAST(\"a\" AS INTEGER)");
    EXPECT_EQ(renderOk(mysql_, cast(col("a"), LogicalType::Integer)).sql, "CAST(`a` AS SIGNED)");
    EXPECT_EQ(renderOk(sqlite_, cast(col("doc"), LogicalType::Json)).sql, "json(\"doc\")");
}

TEST_F(ExpressionRenderTest, FunctionCalls) {
    EXPECT_EQ(renderOk(sqlite_, fn("lower", {col("name")})).sql, "lower(\"name\")");
    EXPECT_EQ(renderOk(sqlite_, fn("coalesce", {col("a"), lit(0)})).sql, "coalesce(\"a\", ?)");

    Error err = renderError(sqlite_, fn("lower(x); DROP TABLE t; --", {}), "SELECT");
    EXPECT_EQ(err.code, ErrorCode::ConstructionError);
    EXPECT_EQ(err.clause, "SELECT");
}

TEST_F(ExpressionRenderTest, CteReference) {
    EXPECT_EQ(renderOk(sqlite_, cteRef("tree", "t")).sql, "\"tree\" AS \"t\"");
    EXPECT_EQ(renderOk(sqlite_, cteRef("tree")).sql, "\"tree\"");
}

TEST_F(ExpressionRenderTest, EmptyInListIsConstructionError) {
    Error err = renderError(sqlite_, in(col("id"), std::vector<ExprPtr>{}));
    EXPECT_EQ(err.code, ErrorCode::ConstructionError);
    EXPECT_EQ(err.clause, "WHERE");
    EXPECT_EQ(err.dialect, "sqlite");
}

TEST_F(ExpressionRenderTest, NullChildIsConstructionError) {
    Error err = renderError(sqlite_, eq(nullptr, lit(1)));
    EXPECT_EQ(err.code, ErrorCode::ConstructionError);
    EXPECT_EQ(err.kind(), ErrorKind::Construction);
}

TEST_F(ExpressionRenderTest, TypedLiteralValidatesValue) {
    Error err = renderError(sqlite_, eq(col("flag"), lit(Value(std::string("yes")), LogicalType::Boolean)));
    EXPECT_EQ(err.kind(), ErrorKind::Construction);
    EXPECT_EQ(err.clause, "WHERE");
}
