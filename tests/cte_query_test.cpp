#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "cppquery/expression/expression_builders.h"
#include "cppquery/query/active_query.h"
#include "cppquery/query/cte_query.h"
#include "test_support.h"

using namespace cppquery;
using cppquery_sqldriver::SqlValue;

namespace {

    ActiveQuery rootsOf(DialectPtr dialect) {
        ActiveQuery anchor(std::move(dialect), "employees");
        anchor.Select({col("id"), col("name"), col("manager_id")}).Where(isNull(col("manager_id")));
        return anchor;
    }

    ActiveQuery reportsOf(DialectPtr dialect, const std::string& cte_name = "tree") {
        ActiveQuery recursive(std::move(dialect), "employees");
        recursive.Select({col("employees", "id"), col("employees", "name"), col("employees", "manager_id")})
            .JoinCte(JoinType::Inner, cte_name, eq(col("employees", "manager_id"), col("s", "id")), "s");
        return recursive;
    }

    template <typename Executor>
    ActiveQuery treeMain(Executor executor) {
        ActiveQuery main(executor);
        main.FromCte("tree").Select({col("id"), col("name"), col("cte_depth")}).OrderBy("id");
        return main;
    }

}  // namespace

class CTEQueryRenderTest : public ::testing::Test {
  protected:
    DialectPtr sqlite_ = test::sqliteDialect();
};

TEST_F(CTEQueryRenderTest, NonRecursiveCte) {
    ActiveQuery adults(sqlite_, "users");
    adults.Where(ge(col("age"), lit(18)));
    ActiveQuery main(sqlite_);
    main.FromCte("adults").OrderBy("name");

    CTEQuery q(sqlite_);
    q.With("adults", adults).Query(main);
    auto stmt = q.ToSql();
    ASSERT_TRUE(stmt.has_value()) << stmt.error().toString();
    EXPECT_EQ(stmt->sql, "WITH \"adults\" AS (SELECT * FROM \"users\" WHERE \"age\" >= ?) SELECT * FROM \"adults\" ORDER BY \"name\" ASC");
    ASSERT_EQ(stmt->params.size(), 1u);
    EXPECT_EQ(stmt->params[0], SqlValue(18LL));
}

TEST_F(CTEQueryRenderTest, LaterCteMayReferenceEarlierOne) {
    ActiveQuery adults(sqlite_, "users");
    adults.Where(ge(col("age"), lit(18)));
    ActiveQuery named(sqlite_);
    named.FromCte("adults").Select({col("name")});
    ActiveQuery main(sqlite_);
    main.FromCte("names");

    CTEQuery q(sqlite_);
    q.With("adults", adults).With("names", named, {"who"}).Query(main);
    auto stmt = q.ToSql();
    ASSERT_TRUE(stmt.has_value()) << stmt.error().toString();
    EXPECT_EQ(stmt->sql, "WITH \"adults\" AS (SELECT * FROM \"users\" WHERE \"age\" >= ?), \"names\"(\"who\") AS (SELECT \"name\" FROM \"adults\") SELECT * FROM \"names\"");
    EXPECT_EQ(q.cteNames(), (std::vector<std::string>{"adults", "names"}));
}

TEST_F(CTEQueryRenderTest, RecursiveCteInjectsDepthGuard) {
    CTEQuery q(sqlite_);
    q.WithRecursive("tree", rootsOf(sqlite_), reportsOf(sqlite_), {"id", "name", "manager_id"}, RecursionGuard{10, "cte_depth", RecursionGuard::Policy::Truncate})
        .Query(treeMain(sqlite_));
    ASSERT_FALSE(q.constructionError().has_value());

    auto stmt = q.ToSql();
    ASSERT_TRUE(stmt.has_value()) << stmt.error().toString();
    EXPECT_EQ(stmt->sql,
              "WITH RECURSIVE \"tree\"(\"id\", \"name\", \"manager_id\", \"cte_depth\") AS ("
              "SELECT \"id\", \"name\", \"manager_id\", ? AS \"cte_depth\" FROM \"employees\" WHERE \"manager_id\" IS NULL "
              "UNION ALL "
              "SELECT \"employees\".\"id\", \"employees\".\"name\", \"employees\".\"manager_id\", \"s\".\"cte_depth\" + ? AS \"cte_depth\" "
              "FROM \"employees\" INNER JOIN \"tree\" AS \"s\" ON \"employees\".\"manager_id\" = \"s\".\"id\" WHERE \"s\".\"cte_depth\" < ?) "
              "SELECT \"id\", \"name\", \"cte_depth\" FROM \"tree\" ORDER BY \"id\" ASC");
    std::vector<SqlValue> expected{SqlValue(0LL), SqlValue(1LL), SqlValue(10LL)};
    EXPECT_EQ(stmt->params, expected);
}

TEST_F(CTEQueryRenderTest, FailPolicyComputesOneExtraLevel) {
    CTEQuery q(sqlite_);
    q.WithRecursive("tree", rootsOf(sqlite_), reportsOf(sqlite_), {}, RecursionGuard{3, "lvl", RecursionGuard::Policy::Fail});
    ActiveQuery main(sqlite_);
    main.FromCte("tree");
    q.Query(main);
    auto stmt = q.ToSql();
    ASSERT_TRUE(stmt.has_value()) << stmt.error().toString();
    EXPECT_NE(stmt->sql.find("WHERE \"s\".\"lvl\" <= ?"), std::string::npos) << stmt->sql;
    EXPECT_NE(stmt->sql.find("WITH RECURSIVE \"tree\" AS ("), std::string::npos) << stmt->sql;
}

TEST_F(CTEQueryRenderTest, DuplicateNameIsRejected) {
    ActiveQuery body(sqlite_, "users");
    CTEQuery q(sqlite_);
    q.With("x", body).With("x", body).Query(body);
    ASSERT_TRUE(q.constructionError().has_value());
    auto stmt = q.ToSql();
    ASSERT_FALSE(stmt.has_value());
    EXPECT_EQ(stmt.error().code, ErrorCode::ConstructionError);
    EXPECT_EQ(stmt.error().clause, "WITH");
    EXPECT_EQ(stmt.error().dialect, "sqlite");
}

TEST_F(CTEQueryRenderTest, ForwardReferenceIsRejected) {
    ActiveQuery uses_later(sqlite_);
    uses_later.FromCte("later");
    CTEQuery q(sqlite_);
    q.With("early", uses_later);
    auto stmt = q.Query(uses_later).ToSql();
    ASSERT_FALSE(stmt.has_value());
    EXPECT_NE(stmt.error().message.find("later"), std::string::npos);
}

TEST_F(CTEQueryRenderTest, MainQueryMustReferenceDefinedCtes) {
    ActiveQuery body(sqlite_, "users");
    ActiveQuery main(sqlite_);
    main.FromCte("missing");
    CTEQuery q(sqlite_);
    q.With("present", body).Query(main);
    auto stmt = q.ToSql();
    ASSERT_FALSE(stmt.has_value());
    EXPECT_EQ(stmt.error().code, ErrorCode::ConstructionError);
}

TEST_F(CTEQueryRenderTest, MissingMainQueryIsRejected) {
    ActiveQuery body(sqlite_, "users");
    CTEQuery q(sqlite_);
    q.With("x", body);
    EXPECT_FALSE(q.ToSql().has_value());
}

TEST_F(CTEQueryRenderTest, RecursiveBranchMustReferenceItself) {
    ActiveQuery unrelated(sqlite_, "employees");
    unrelated.Select({col("id"), col("name"), col("manager_id")});
    CTEQuery q(sqlite_);
    q.WithRecursive("tree", rootsOf(sqlite_), unrelated);
    ASSERT_TRUE(q.constructionError().has_value());
    EXPECT_EQ(q.constructionError()->code, ErrorCode::ConstructionError);
}

TEST_F(CTEQueryRenderTest, AnchorMustNotReferenceItself) {
    ActiveQuery anchor(sqlite_);
    anchor.FromCte("tree").Select({col("id"), col("name"), col("manager_id")});
    CTEQuery q(sqlite_);
    q.WithRecursive("tree", anchor, reportsOf(sqlite_));
    ASSERT_TRUE(q.constructionError().has_value());
}

TEST_F(CTEQueryRenderTest, BranchArityMustMatch) {
    ActiveQuery narrow(sqlite_, "employees");
    narrow.Select({col("employees", "id")}).JoinCte(JoinType::Inner, "tree", eq(col("employees", "manager_id"), col("tree", "id")));
    CTEQuery q(sqlite_);
    q.WithRecursive("tree", rootsOf(sqlite_), narrow);
    ASSERT_TRUE(q.constructionError().has_value());
    EXPECT_NE(q.constructionError()->message.find("3 and 1"), std::string::npos) << q.constructionError()->message;
}

TEST_F(CTEQueryRenderTest, RecursiveBranchNeedsExplicitColumns) {
    ActiveQuery everything(sqlite_, "employees");
    everything.JoinCte(JoinType::Inner, "tree", eq(col("employees", "manager_id"), col("tree", "id")));
    CTEQuery q(sqlite_);
    q.WithRecursive("tree", rootsOf(sqlite_), everything);
    ASSERT_TRUE(q.constructionError().has_value());
    EXPECT_EQ(q.constructionError()->code, ErrorCode::ConstructionError);
    EXPECT_EQ(q.constructionError()->clause, "WITH");

    ActiveQuery starred(sqlite_, "employees");
    starred.Select({star("employees")}).JoinCte(JoinType::Inner, "tree", eq(col("employees", "manager_id"), col("tree", "id")));
    CTEQuery q2(sqlite_);
    q2.WithRecursive("tree", rootsOf(sqlite_), starred);
    ASSERT_TRUE(q2.constructionError().has_value());
    auto rendered = q2.ToSql();
    ASSERT_FALSE(rendered.has_value());
    EXPECT_EQ(rendered.error().kind(), ErrorKind::Construction);
}

TEST_F(CTEQueryRenderTest, BranchesMustNotCarryTrailingClauses) {
    ActiveQuery limited = reportsOf(sqlite_);
    limited.Limit(5);
    CTEQuery q(sqlite_);
    q.WithRecursive("tree", rootsOf(sqlite_), limited);
    ASSERT_TRUE(q.constructionError().has_value());
}

TEST_F(CTEQueryRenderTest, NegativeDepthBoundIsRejected) {
    CTEQuery q(sqlite_);
    q.WithRecursive("tree", rootsOf(sqlite_), reportsOf(sqlite_), {}, RecursionGuard{-1, "cte_depth", RecursionGuard::Policy::Truncate});
    ASSERT_TRUE(q.constructionError().has_value());
}

TEST_F(CTEQueryRenderTest, OldSqliteLacksCte) {
    auto old_sqlite = test::sqliteDialect({3, 7, 17});
    ActiveQuery body(old_sqlite, "users");
    ActiveQuery main(old_sqlite);
    main.FromCte("x");
    CTEQuery q(old_sqlite);
    q.With("x", body).Query(main);
    auto stmt = q.ToSql();
    ASSERT_FALSE(stmt.has_value());
    EXPECT_EQ(stmt.error().kind(), ErrorKind::Capability);
    EXPECT_EQ(stmt.error().clause, "WITH");
}

TEST(CTEQueryGuardTest, FailPolicyChecksDepthBeforeMainQuery) {
    test::RecordingExecutor executor(test::sqliteDialect());
    executor.results.push_back(test::singleValueResult(Value(1LL), "1"));

    auto dialect = executor.dialect();
    CTEQuery q(&executor);
    q.WithRecursive("tree", rootsOf(dialect), reportsOf(dialect), {"id", "name", "manager_id"}, RecursionGuard{4, "cte_depth", RecursionGuard::Policy::Fail})
        .Query(treeMain(dialect));

    auto rows = q.All();
    ASSERT_FALSE(rows.has_value());
    EXPECT_EQ(rows.error().code, ErrorCode::RecursionLimitExceeded);
    EXPECT_EQ(rows.error().clause, "WITH");
    ASSERT_EQ(executor.executed.size(), 1u);
    const auto& guard = executor.executed[0];
    const std::string tail = "SELECT 1 FROM \"tree\" WHERE \"tree\".\"cte_depth\" > ? LIMIT ?";
    ASSERT_GE(guard.sql.size(), tail.size());
    EXPECT_EQ(guard.sql.substr(guard.sql.size() - tail.size()), tail);
    EXPECT_EQ(guard.params.back(), SqlValue(1LL));
    EXPECT_EQ(guard.params[guard.params.size() - 2], SqlValue(4LL));
}

TEST(CTEQueryGuardTest, TruncatePolicyNeedsNoGuardQuery) {
    test::RecordingExecutor executor(test::sqliteDialect());
    auto dialect = executor.dialect();
    CTEQuery q(&executor);
    q.WithRecursive("tree", rootsOf(dialect), reportsOf(dialect), {"id", "name", "manager_id"}).Query(treeMain(dialect));
    ASSERT_TRUE(q.All().has_value());
    ASSERT_EQ(executor.executed.size(), 1u);
    EXPECT_EQ(executor.executed[0].sql.rfind("WITH RECURSIVE", 0), 0u);
}

class CTEQueryExecutionTest : public test::SqliteBackendTest {
  protected:
    void SetUp() override {
        test::SqliteBackendTest::SetUp();
        if (HasFatalFailure()) return;
        exec("CREATE TABLE employees (id INTEGER PRIMARY KEY, name TEXT NOT NULL, manager_id INTEGER)");
    }

    DialectPtr dialect() const {
        return backend_->dialect();
    }

    void seedTree() {
        exec("INSERT INTO employees VALUES (1, 'ceo', NULL), (2, 'cto', 1), (3, 'cfo', 1), (4, 'lead', 2), (5, 'dev', 4)");
    }

    // 1 -> 3 -> 2 -> 1 的管理环, 没有根节点
    void seedCycle() {
        exec("INSERT INTO employees VALUES (1, 'a', 3), (2, 'b', 1), (3, 'c', 2)");
    }

    ActiveQuery cycleAnchor() const {
        ActiveQuery anchor(dialect(), "employees");
        anchor.Select({col("id"), col("name"), col("manager_id")}).Where(eq(col("id"), lit(1)));
        return anchor;
    }
};

TEST_F(CTEQueryExecutionTest, WalksTreeWithDepth) {
    seedTree();
    CTEQuery q(backend_.get());
    q.WithRecursive("tree", rootsOf(dialect()), reportsOf(dialect()), {"id", "name", "manager_id"}, RecursionGuard{10, "cte_depth", RecursionGuard::Policy::Truncate})
        .Query(treeMain(backend_.get()));

    auto rows = q.All();
    ASSERT_TRUE(rows.has_value()) << rows.error().toString();
    ASSERT_EQ(rows->size(), 5u);
    const std::vector<long long> expected_depths{0, 1, 1, 2, 3};
    for (std::size_t i = 0; i < rows->size(); ++i) {
        EXPECT_EQ((*rows)[i].get<long long>("id"), std::optional<long long>(static_cast<long long>(i + 1)));
        EXPECT_EQ((*rows)[i].get<long long>("cte_depth"), std::optional<long long>(expected_depths[i]));
    }
}

TEST_F(CTEQueryExecutionTest, FailPolicyAcceptsTreeWithinBound) {
    seedTree();
    CTEQuery q(backend_.get());
    q.WithRecursive("tree", rootsOf(dialect()), reportsOf(dialect()), {"id", "name", "manager_id"}, RecursionGuard{3, "cte_depth", RecursionGuard::Policy::Fail})
        .Query(treeMain(backend_.get()));
    auto rows = q.All();
    ASSERT_TRUE(rows.has_value()) << rows.error().toString();
    EXPECT_EQ(rows->size(), 5u);
}

TEST_F(CTEQueryExecutionTest, TruncateBoundsCyclicData) {
    seedCycle();
    CTEQuery q(backend_.get());
    q.WithRecursive("tree", cycleAnchor(), reportsOf(dialect()), {"id", "name", "manager_id"}, RecursionGuard{5, "cte_depth", RecursionGuard::Policy::Truncate})
        .Query(treeMain(backend_.get()));
    auto count = q.Count();
    ASSERT_TRUE(count.has_value()) << count.error().toString();
    // 深度 0..5 各一行
    EXPECT_EQ(*count, 6);
}

TEST_F(CTEQueryExecutionTest, FailReportsCyclicData) {
    seedCycle();
    CTEQuery q(backend_.get());
    q.WithRecursive("tree", cycleAnchor(), reportsOf(dialect()), {"id", "name", "manager_id"}, RecursionGuard{5, "cte_depth", RecursionGuard::Policy::Fail})
        .Query(treeMain(backend_.get()));
    auto rows = q.All();
    ASSERT_FALSE(rows.has_value());
    EXPECT_EQ(rows.error().code, ErrorCode::RecursionLimitExceeded);
    EXPECT_NE(rows.error().message.find("tree"), std::string::npos);
}

TEST_F(CTEQueryExecutionTest, ExistsOverCte) {
    seedTree();
    ActiveQuery devs(dialect(), "employees");
    devs.Where(eq(col("name"), lit("dev")));
    ActiveQuery main(backend_.get());
    main.FromCte("devs");
    CTEQuery q(backend_.get());
    q.With("devs", devs).Query(main);
    auto exists = q.Exists();
    ASSERT_TRUE(exists.has_value()) << exists.error().toString();
    EXPECT_TRUE(*exists);
}
