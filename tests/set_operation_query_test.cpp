#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "cppquery/expression/expression_builders.h"
#include "cppquery/query/active_query.h"
#include "cppquery/query/set_operation_query.h"
#include "test_support.h"

using namespace cppquery;
using cppquery_sqldriver::SqlValue;

namespace {

    template <typename Source>
    ActiveQuery names(Source source, const std::string& table) {
        ActiveQuery q(source, table);
        q.Select({col("name")});
        return q;
    }

}  // namespace

class SetOperationRenderTest : public ::testing::Test {
  protected:
    DialectPtr sqlite_ = test::sqliteDialect();
    DialectPtr postgres_ = test::postgresDialect();
};

TEST_F(SetOperationRenderTest, ArityMismatchFailsBeforeRendering) {
    ActiveQuery two(sqlite_, "a");
    two.Select({col("name"), col("id")});
    auto set = SetOperationQuery::Create(two, SetOperator::Union, names(sqlite_, "b"));
    ASSERT_FALSE(set.has_value());
    EXPECT_EQ(set.error().code, ErrorCode::ConstructionError);
    EXPECT_EQ(set.error().clause, "UNION");
    EXPECT_EQ(set.error().dialect, "sqlite");
    EXPECT_NE(set.error().message.find("2 and 1"), std::string::npos) << set.error().message;
}

TEST_F(SetOperationRenderTest, UnknownArityIsAccepted) {
    ActiveQuery everything(sqlite_, "a");
    auto set = SetOperationQuery::Create(everything, SetOperator::UnionAll, names(sqlite_, "b"));
    ASSERT_TRUE(set.has_value()) << set.error().toString();
    EXPECT_EQ(set->projectedColumnCount(), std::optional<std::size_t>(1));
}

TEST_F(SetOperationRenderTest, MixedDialectsAreRejected) {
    auto set = SetOperationQuery::Create(names(sqlite_, "a"), SetOperator::Union, names(postgres_, "b"));
    ASSERT_FALSE(set.has_value());
    EXPECT_EQ(set.error().kind(), ErrorKind::Construction);
}

TEST_F(SetOperationRenderTest, SqliteOperandsAreBare) {
    auto set = SetOperationQuery::Create(names(sqlite_, "a"), SetOperator::Union, names(sqlite_, "b"));
    ASSERT_TRUE(set.has_value());
    set->OrderBy("name").Limit(10);
    auto stmt = set->ToSql();
    ASSERT_TRUE(stmt.has_value()) << stmt.error().toString();
    EXPECT_EQ(stmt->sql, "SELECT \"name\" FROM \"a\" UNION SELECT \"name\" FROM \"b\" ORDER BY \"name\" ASC LIMIT ?");
    ASSERT_EQ(stmt->params.size(), 1u);
    EXPECT_EQ(stmt->params[0], SqlValue(10LL));
}

TEST_F(SetOperationRenderTest, NegativeLimitIsConstructionError) {
    auto set = SetOperationQuery::Create(names(sqlite_, "a"), SetOperator::Union, names(sqlite_, "b"));
    ASSERT_TRUE(set.has_value());
    set->Limit(-2);
    auto stmt = set->ToSql();
    ASSERT_FALSE(stmt.has_value());
    EXPECT_EQ(stmt.error().code, ErrorCode::ConstructionError);
    EXPECT_EQ(stmt.error().clause, "LIMIT");
}

TEST_F(SetOperationRenderTest, PostgresOperandsAreParenthesized) {
    ActiveQuery left = names(postgres_, "a");
    left.Where(eq(col("kind"), lit("x")));
    ActiveQuery right = names(postgres_, "b");
    right.Where(eq(col("kind"), lit("y")));
    auto set = SetOperationQuery::Create(left, SetOperator::Except, right);
    ASSERT_TRUE(set.has_value());
    set->Limit(5);
    auto stmt = set->ToSql();
    ASSERT_TRUE(stmt.has_value()) << stmt.error().toString();
    EXPECT_EQ(stmt->sql, "(SELECT \"name\" FROM \"a\" WHERE \"kind\" = $1) EXCEPT (SELECT \"name\" FROM \"b\" WHERE \"kind\" = $2) LIMIT $3");
}

TEST_F(SetOperationRenderTest, OperandWithTrailingClausesIsWrappedOnSqlite) {
    ActiveQuery top = names(sqlite_, "a");
    top.OrderBy("name").Limit(5);
    auto set = SetOperationQuery::Create(top, SetOperator::Union, names(sqlite_, "b"));
    ASSERT_TRUE(set.has_value());
    auto stmt = set->ToSql();
    ASSERT_TRUE(stmt.has_value()) << stmt.error().toString();
    EXPECT_EQ(stmt->sql, "SELECT * FROM (SELECT \"name\" FROM \"a\" ORDER BY \"name\" ASC LIMIT ?) UNION SELECT \"name\" FROM \"b\"");
}

TEST_F(SetOperationRenderTest, ChainIsLeftAssociative) {
    auto set = SetOperationQuery::Create(names(postgres_, "a"), SetOperator::Union, names(postgres_, "b"));
    ASSERT_TRUE(set.has_value());
    auto chained = set->Intersect(names(postgres_, "c"));
    ASSERT_TRUE(chained.has_value()) << chained.error().toString();
    EXPECT_EQ(chained->operandCount(), 3u);
    EXPECT_EQ(chained->ToSql()->sql, "((SELECT \"name\" FROM \"a\") UNION (SELECT \"name\" FROM \"b\")) INTERSECT (SELECT \"name\" FROM \"c\")");

    auto same_op = set->Union(names(postgres_, "c"));
    ASSERT_TRUE(same_op.has_value());
    EXPECT_EQ(same_op->ToSql()->sql, "(SELECT \"name\" FROM \"a\") UNION (SELECT \"name\" FROM \"b\") UNION (SELECT \"name\" FROM \"c\")");

    auto on_sqlite = SetOperationQuery::Create(names(sqlite_, "a"), SetOperator::Union, names(sqlite_, "b"))->Intersect(names(sqlite_, "c"));
    ASSERT_TRUE(on_sqlite.has_value());
    EXPECT_EQ(on_sqlite->ToSql()->sql, "SELECT \"name\" FROM \"a\" UNION SELECT \"name\" FROM \"b\" INTERSECT SELECT \"name\" FROM \"c\"");
}

TEST_F(SetOperationRenderTest, AppendingToLimitedCompoundNestsIt) {
    auto set = SetOperationQuery::Create(names(sqlite_, "a"), SetOperator::Union, names(sqlite_, "b"));
    ASSERT_TRUE(set.has_value());
    set->Limit(3);
    auto extended = set->UnionAll(names(sqlite_, "c"));
    ASSERT_TRUE(extended.has_value());
    EXPECT_EQ(extended->operandCount(), 2u);
    EXPECT_EQ(extended->ToSql()->sql, "SELECT * FROM (SELECT \"name\" FROM \"a\" UNION SELECT \"name\" FROM \"b\" LIMIT ?) UNION ALL SELECT \"name\" FROM \"c\"");
}

TEST_F(SetOperationRenderTest, IntersectNeedsDialectSupport) {
    auto old_mysql = test::mysqlDialect({8, 0, 20});
    auto set = SetOperationQuery::Create(names(old_mysql, "a"), SetOperator::Intersect, names(old_mysql, "b"));
    ASSERT_TRUE(set.has_value());
    auto stmt = set->ToSql();
    ASSERT_FALSE(stmt.has_value());
    EXPECT_EQ(stmt.error().kind(), ErrorKind::Capability);
    EXPECT_EQ(stmt.error().clause, "INTERSECT");
}

TEST_F(SetOperationRenderTest, OperandsAreSnapshots) {
    ActiveQuery left = names(sqlite_, "a");
    auto set = SetOperationQuery::Create(left, SetOperator::Union, names(sqlite_, "b"));
    ASSERT_TRUE(set.has_value());
    left.Where(eq(col("name"), lit("late")));
    EXPECT_EQ(set->ToSql()->sql, "SELECT \"name\" FROM \"a\" UNION SELECT \"name\" FROM \"b\"");
}

class SetOperationExecutionTest : public test::SqliteBackendTest {
  protected:
    void SetUp() override {
        test::SqliteBackendTest::SetUp();
        if (HasFatalFailure()) return;
        exec("CREATE TABLE a (name TEXT)");
        exec("CREATE TABLE b (name TEXT)");
        exec("INSERT INTO a VALUES ('ann'), ('bob'), ('cid')");
        exec("INSERT INTO b VALUES ('bob'), ('cid'), ('dan')");
    }

    std::vector<std::string> namesOf(SetOperationQuery& set) {
        std::vector<std::string> out;
        auto rows = set.All();
        EXPECT_TRUE(rows.has_value()) << rows.error().toString();
        if (!rows) return out;
        for (const auto& row : *rows) {
            out.push_back(row.get<std::string>("name").value_or("<missing>"));
        }
        return out;
    }
};

TEST_F(SetOperationExecutionTest, EachOperator) {
    auto backend = backend_.get();
    auto run = [&](SetOperator op) {
        auto set = SetOperationQuery::Create(names(backend, "a"), op, names(backend, "b"));
        EXPECT_TRUE(set.has_value());
        if (!set) return std::vector<std::string>();
        set->OrderBy("name");
        return namesOf(*set);
    };
    EXPECT_EQ(run(SetOperator::Union), (std::vector<std::string>{"ann", "bob", "cid", "dan"}));
    EXPECT_EQ(run(SetOperator::UnionAll), (std::vector<std::string>{"ann", "bob", "bob", "cid", "cid", "dan"}));
    EXPECT_EQ(run(SetOperator::Intersect), (std::vector<std::string>{"bob", "cid"}));
    EXPECT_EQ(run(SetOperator::Except), (std::vector<std::string>{"ann"}));
}

TEST_F(SetOperationExecutionTest, CountOverCompound) {
    auto set = SetOperationQuery::Create(names(backend_.get(), "a"), SetOperator::Union, names(backend_.get(), "b"));
    ASSERT_TRUE(set.has_value());
    auto count = set->Count();
    ASSERT_TRUE(count.has_value()) << count.error().toString();
    EXPECT_EQ(*count, 4);
    EXPECT_TRUE(set->isConsumed());
}

TEST_F(SetOperationExecutionTest, CompoundFromConsumedOperandIsFresh) {
    ActiveQuery left = names(backend_.get(), "a");
    ASSERT_TRUE(left.All().has_value());
    ASSERT_TRUE(left.isConsumed());
    auto set = SetOperationQuery::Create(left, SetOperator::UnionAll, names(backend_.get(), "b"));
    ASSERT_TRUE(set.has_value());
    EXPECT_FALSE(set->isConsumed());
    auto rows = set->All();
    ASSERT_TRUE(rows.has_value()) << rows.error().toString();
    EXPECT_EQ(rows->size(), 6u);
}
