// Copyright 2026 The SQLGen Authors
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "sqlgen/ast/sql_ast.h"

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "sqlgen/ast/dialect.h"
#include "sqlgen/ast/errors.h"
#include "sqlgen/ast/operator_kind.h"
#include "sqlgen/ast/render_context.h"
#include "sqlgen/common/status/matchers.h"
#include "sqlgen/common/status/status_macros.h"

namespace sqlgen {
namespace {

using status_testing::IsOkAndHolds;
using status_testing::StatusIs;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::Optional;

absl::StatusOr<std::string> RenderText(
    const SqlNode* node, const Dialect& dialect = Dialect::Sqlite()) {
  SQLGEN_ASSIGN_OR_RETURN(RenderedSql sql, RenderSql(node, dialect));
  return sql.text;
}

absl::StatusOr<std::string> RewriteAndRenderText(
    SqlNode* node, const Dialect& dialect = Dialect::Sqlite()) {
  SQLGEN_ASSIGN_OR_RETURN(RenderedSql sql, RewriteAndRenderSql(node, dialect));
  return sql.text;
}

TEST(SqlAstTest, Literals) {
  SqlBuilder b;
  EXPECT_THAT(RenderText(b.Int(42)), IsOkAndHolds("42"));
  EXPECT_THAT(RenderText(b.Int(-7)), IsOkAndHolds("-7"));
  EXPECT_THAT(RenderText(b.Double(1.5)), IsOkAndHolds("1.5"));
  EXPECT_THAT(RenderText(b.String("it's")), IsOkAndHolds("'it''s'"));
  EXPECT_THAT(RenderText(b.Bool(true)), IsOkAndHolds("TRUE"));
  EXPECT_THAT(RenderText(b.Bool(false)), IsOkAndHolds("FALSE"));
  EXPECT_THAT(RenderText(b.Null()), IsOkAndHolds("NULL"));
  EXPECT_THAT(RenderText(b.Verbatim("now() - interval '1 day'")),
              IsOkAndHolds("now() - interval '1 day'"));
}

TEST(SqlAstTest, Identifiers) {
  SqlBuilder b;
  EXPECT_THAT(RenderText(b.Column("name")), IsOkAndHolds("name"));
  EXPECT_THAT(RenderText(b.Column("u", "name")), IsOkAndHolds("u.name"));
  EXPECT_THAT(RenderText(b.Column("U", "Name"), Dialect::Postgres()),
              IsOkAndHolds("\"U\".\"Name\""));
  EXPECT_THAT(RenderText(b.Column("Order"), Dialect::MySql()),
              IsOkAndHolds("`Order`"));
  EXPECT_THAT(RenderText(b.Table("public", "users")),
              IsOkAndHolds("public.users"));
  EXPECT_THAT(RenderText(b.LabeledTable("users", "u")),
              IsOkAndHolds("users u"));
  EXPECT_THAT(RenderText(b.LabeledTable("app", "Users", "u"),
                         Dialect::Postgres()),
              IsOkAndHolds("app.\"Users\" u"));
}

TEST(SqlAstTest, Types) {
  SqlBuilder b;
  EXPECT_THAT(RenderText(b.DoublePrecisionType()),
              IsOkAndHolds("DOUBLE PRECISION"));
  EXPECT_THAT(RenderText(b.DecimalType(10, 2)), IsOkAndHolds("DECIMAL(10,2)"));
  EXPECT_THAT(RenderText(b.Cast(b.Column("price"), b.DecimalType(10, 2))),
              IsOkAndHolds("CAST(price AS DECIMAL(10,2))"));
  EXPECT_THAT(RenderText(b.TypeCast(b.Column("id"), b.TextType())),
              IsOkAndHolds("id::TEXT"));
  EXPECT_THAT(RenderText(b.TypeCast(b.Add(b.Column("a"), b.Column("b")),
                                    b.BigintType())),
              IsOkAndHolds("(a + b)::BIGINT"));
}

TEST(SqlAstTest, FunctionCalls) {
  SqlBuilder b;
  EXPECT_THAT(RenderText(b.Func("coalesce", {b.Column("a"), b.Int(0)})),
              IsOkAndHolds("coalesce(a,0)"));
  EXPECT_THAT(RenderText(b.Func("now", {})), IsOkAndHolds("now()"));
  EXPECT_THAT(RenderText(b.Func0("CURRENT_TIMESTAMP")),
              IsOkAndHolds("CURRENT_TIMESTAMP"));
  EXPECT_THAT(RenderText(b.Func("pg_catalog.lower", {b.Column("s")})),
              IsOkAndHolds("pg_catalog.lower(s)"));
  // Arguments are never parenthesized.
  EXPECT_THAT(
      RenderText(b.Func("abs", {b.Sub(b.Column("a"), b.Column("b"))})),
      IsOkAndHolds("abs(a - b)"));
}

TEST(SqlAstTest, TupleAndCase) {
  SqlBuilder b;
  EXPECT_THAT(
      RenderText(b.In(b.Column("x"), b.Tuple({b.Int(1), b.Int(2), b.Int(3)}))),
      IsOkAndHolds("x IN (1,2,3)"));

  Expression* x = b.Column("x");
  CaseExpression* sign = b.Case(b.Gt(x, b.Int(0)), b.String("pos"))
                             ->When(b.Lt(x, b.Int(0)), b.String("neg"))
                             ->Else(b.String("zero"));
  EXPECT_THAT(RenderText(sign),
              IsOkAndHolds("CASE WHEN x > 0 THEN 'pos' WHEN x < 0 THEN 'neg' "
                           "ELSE 'zero' END"));
  EXPECT_THAT(RenderText(b.Case(b.IsNull(x), b.Int(0))),
              IsOkAndHolds("CASE WHEN x IS NULL THEN 0 END"));
}

TEST(SqlAstTest, LooserOperandIsParenthesized) {
  SqlBuilder b;
  Expression* a = b.Column("a");
  Expression* c = b.Column("c");
  EXPECT_THAT(RenderText(b.Mul(b.Add(a, b.Column("b")), c)),
              IsOkAndHolds("(a + b) * c"));
  EXPECT_THAT(RenderText(b.Add(b.Mul(a, b.Column("b")), c)),
              IsOkAndHolds("a * b + c"));
  EXPECT_THAT(RenderText(b.Add(a, b.Mul(b.Column("b"), c))),
              IsOkAndHolds("a + b * c"));
}

TEST(SqlAstTest, AndOverOr) {
  SqlBuilder b;
  Expression* e =
      b.And(b.Eq(b.Column("a"), b.Int(1)),
            b.Or(b.Eq(b.Column("b"), b.Int(2)), b.Eq(b.Column("c"), b.Int(3))));
  EXPECT_THAT(RenderText(e), IsOkAndHolds("a = 1 AND (b = 2 OR c = 3)"));

  Expression* f =
      b.Or(b.And(b.Column("p"), b.Column("q")), b.Column("r"));
  EXPECT_THAT(RenderText(f), IsOkAndHolds("p AND q OR r"));
}

TEST(SqlAstTest, LeftAssociativeChains) {
  SqlBuilder b;
  Expression* a = b.Column("a");
  Expression* bb = b.Column("b");
  Expression* c = b.Column("c");
  EXPECT_THAT(RenderText(b.Sub(b.Sub(a, bb), c)), IsOkAndHolds("a - b - c"));
  EXPECT_THAT(RenderText(b.Sub(a, b.Sub(bb, c))), IsOkAndHolds("a - (b - c)"));
  EXPECT_THAT(RenderText(b.Div(a, b.Mul(bb, c))), IsOkAndHolds("a / (b * c)"));
  EXPECT_THAT(RenderText(b.Add(b.Sub(a, bb), c)), IsOkAndHolds("a - b + c"));
}

TEST(SqlAstTest, RightAssociativityOverride) {
  SqlBuilder b;
  Expression* a = b.Column("a");
  Expression* bb = b.Column("b");
  Expression* c = b.Column("c");
  Operator* left_nested = b.Concat(b.Concat(a, bb), c);
  left_nested->set_associativity(Associativity::kRight);
  EXPECT_THAT(RenderText(left_nested), IsOkAndHolds("(a || b) || c"));

  Operator* right_nested = b.Concat(a, b.Concat(bb, c));
  right_nested->set_associativity(Associativity::kRight);
  EXPECT_THAT(RenderText(right_nested), IsOkAndHolds("a || b || c"));
}

TEST(SqlAstTest, NonAssociativeTiesAreParenthesized) {
  SqlBuilder b;
  Expression* a = b.Column("a");
  Expression* bb = b.Column("b");
  Expression* c = b.Column("c");
  EXPECT_THAT(RenderText(b.Eq(b.Eq(a, bb), c)), IsOkAndHolds("(a = b) = c"));
  EXPECT_THAT(RenderText(b.Eq(a, b.Lt(bb, c))), IsOkAndHolds("a = (b < c)"));
  EXPECT_THAT(RenderText(b.Like(b.Concat(a, bb), c)),
              IsOkAndHolds("a || b LIKE c"));
}

TEST(SqlAstTest, UnaryOperators) {
  SqlBuilder b;
  Expression* a = b.Column("a");
  Expression* bb = b.Column("b");
  EXPECT_THAT(RenderText(b.Not(a)), IsOkAndHolds("NOT a"));
  EXPECT_THAT(RenderText(b.Not(b.And(a, bb))), IsOkAndHolds("NOT (a AND b)"));
  EXPECT_THAT(RenderText(b.Not(b.Eq(a, bb))), IsOkAndHolds("NOT a = b"));
  EXPECT_THAT(RenderText(b.Not(b.Not(a))), IsOkAndHolds("NOT NOT a"));
  EXPECT_THAT(RenderText(b.Negate(a)), IsOkAndHolds("- a"));
  EXPECT_THAT(RenderText(b.Negate(b.Add(a, bb))), IsOkAndHolds("- (a + b)"));
  EXPECT_THAT(RenderText(b.Mul(b.Negate(a), bb)), IsOkAndHolds("- a * b"));

  EXPECT_THAT(RenderText(b.IsNull(a)), IsOkAndHolds("a IS NULL"));
  EXPECT_THAT(RenderText(b.IsNotTrue(b.Eq(a, bb))),
              IsOkAndHolds("a = b IS NOT TRUE"));
  EXPECT_THAT(RenderText(b.IsFalse(b.Or(a, bb))),
              IsOkAndHolds("(a OR b) IS FALSE"));
}

TEST(SqlAstTest, TernaryOperators) {
  SqlBuilder b;
  Expression* x = b.Column("x");
  EXPECT_THAT(RenderText(b.Between(x, b.Int(1), b.Int(10))),
              IsOkAndHolds("x BETWEEN 1 AND 10"));
  EXPECT_THAT(RenderText(b.NotBetween(b.Add(x, b.Int(1)), b.Int(1),
                                      b.Int(10))),
              IsOkAndHolds("x + 1 NOT BETWEEN 1 AND 10"));
  EXPECT_THAT(RenderText(b.Between(x, b.And(b.Column("p"), b.Column("q")),
                                   b.Int(1))),
              IsOkAndHolds("x BETWEEN (p AND q) AND 1"));
}

TEST(SqlAstTest, TernaryParenthesizesOperandOfEqualPrecedence) {
  SqlBuilder b;
  Expression* x = b.Column("x");
  Operator* sum = b.Add(x, b.Int(1));
  sum->set_precedence(7);
  EXPECT_THAT(RenderText(b.Between(sum, b.Int(1), b.Int(10))),
              IsOkAndHolds("(x + 1) BETWEEN 1 AND 10"));

  // A binary operator does not parenthesize a same-precedence left operand.
  Operator* outer = b.Add(sum, b.Int(2));
  outer->set_precedence(7);
  EXPECT_THAT(RenderText(outer), IsOkAndHolds("x + 1 + 2"));
}

TEST(SqlAstTest, PrecedenceOverridesOnTheInstance) {
  SqlBuilder b;
  Expression* a = b.Column("a");
  Expression* bb = b.Column("b");
  Expression* c = b.Column("c");
  Operator* tight_or = b.Or(a, bb);
  tight_or->set_precedence(20);
  EXPECT_THAT(RenderText(b.And(tight_or, c)), IsOkAndHolds("a OR b AND c"));
  EXPECT_THAT(tight_or->precedence(), Optional(20));
}

TEST(SqlAstTest, EmptyDialectWithOverrides) {
  SqlBuilder b;
  Dialect empty;
  Operator* sum = b.Add(b.Column("a"), b.Column("b"));
  sum->set_precedence(1)->set_associativity(Associativity::kLeft);
  Operator* product = b.Mul(sum, b.Column("c"));
  product->set_precedence(2)->set_associativity(Associativity::kLeft);
  EXPECT_THAT(RenderText(product, empty), IsOkAndHolds("(a + b) * c"));
}

TEST(SqlAstTest, AssociativityUndefined) {
  SqlBuilder b;
  Expression* e = b.And(b.Column("a"), b.Column("b"));
  absl::StatusOr<std::string> result = RenderText(e, Dialect());
  EXPECT_THAT(result, StatusIs(absl::StatusCode::kInvalidArgument,
                               HasSubstr("AssociativityUndefinedError")));
  EXPECT_THAT(GetSqlErrorKind(result.status()),
              Optional(SqlErrorKind::kAssociativityUndefined));
}

TEST(SqlAstTest, PrecedenceUndefined) {
  SqlBuilder b;
  Operator* e = b.And(b.Column("a"), b.Column("b"));
  e->set_associativity(Associativity::kLeft);
  EXPECT_THAT(RenderText(e, Dialect()),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("PrecedenceUndefinedError")));

  EXPECT_THAT(RenderText(b.Between(b.Column("x"), b.Int(1), b.Int(2)),
                         Dialect()),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("PrecedenceUndefinedError")));
}

TEST(SqlAstTest, OperandPrecedenceUndefined) {
  SqlBuilder b;
  Dialect dialect;
  dialect.SetOperatorLevel({OperatorKind::kAnd}, 3, Associativity::kLeft);
  Expression* e = b.And(b.Or(b.Column("a"), b.Column("b")), b.Column("c"));
  EXPECT_THAT(RenderText(e, dialect),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("PrecedenceUndefinedError: no precedence for "
                                 "operator `or`")));
}

TEST(SqlAstTest, NonAssociativeUnary) {
  SqlBuilder b;
  Operator* e = b.Not(b.Column("a"));
  e->set_associativity(Associativity::kNonAssociative);
  EXPECT_THAT(RenderText(e), StatusIs(absl::StatusCode::kInvalidArgument,
                                      HasSubstr("NonAssociativeUnaryError")));
}

TEST(SqlAstTest, UnaryPlacementFollowsAssociativity) {
  SqlBuilder b;
  Operator* e = b.IsNull(b.Column("a"));
  e->set_associativity(Associativity::kRight);
  EXPECT_THAT(RenderText(e), IsOkAndHolds("IS NULL a"));
}

TEST(SqlAstTest, RewriteCollapsesNot) {
  SqlBuilder b;
  Expression* x = b.Column("x");
  Expression* a = b.Column("a");
  Expression* bb = b.Column("b");

  EXPECT_THAT(RewriteAndRenderText(b.Not(b.IsNull(x))),
              IsOkAndHolds("x IS NOT NULL"));
  EXPECT_THAT(RewriteAndRenderText(b.Not(b.IsNotNull(x))),
              IsOkAndHolds("x IS NULL"));
  EXPECT_THAT(RewriteAndRenderText(b.Not(b.IsTrue(x))),
              IsOkAndHolds("x IS NOT TRUE"));
  EXPECT_THAT(RewriteAndRenderText(b.Not(b.IsNotFalse(x))),
              IsOkAndHolds("x IS FALSE"));
  EXPECT_THAT(RewriteAndRenderText(b.Not(b.Eq(a, bb))),
              IsOkAndHolds("a <> b"));
  EXPECT_THAT(RewriteAndRenderText(b.Not(b.Ne(a, bb))), IsOkAndHolds("a = b"));
  EXPECT_THAT(RewriteAndRenderText(b.Not(b.In(a, b.Tuple({b.Int(1)})))),
              IsOkAndHolds("a NOT IN (1)"));
  EXPECT_THAT(RewriteAndRenderText(b.Not(b.Like(a, b.String("x%")))),
              IsOkAndHolds("a NOT LIKE 'x%'"));
  EXPECT_THAT(RewriteAndRenderText(b.Not(b.NotILike(a, b.String("x%")))),
              IsOkAndHolds("a ILIKE 'x%'"));
  EXPECT_THAT(RewriteAndRenderText(b.Not(b.Between(x, a, bb))),
              IsOkAndHolds("x NOT BETWEEN a AND b"));
  EXPECT_THAT(RewriteAndRenderText(b.Not(b.NotBetween(x, a, bb))),
              IsOkAndHolds("x BETWEEN a AND b"));
}

TEST(SqlAstTest, RewriteDoubleNegation) {
  SqlBuilder b;
  Expression* eq = b.Eq(b.Column("a"), b.Column("b"));
  EXPECT_THAT(RewriteAndRenderText(b.Not(b.Not(eq))), IsOkAndHolds("a = b"));
  EXPECT_THAT(RewriteAndRenderText(b.Not(b.Not(b.Column("p")))),
              IsOkAndHolds("p"));
  EXPECT_THAT(RewriteAndRenderText(b.Not(b.Not(b.Not(eq)))),
              IsOkAndHolds("a <> b"));
}

TEST(SqlAstTest, RewriteKeepsNonNegatableOperators) {
  SqlBuilder b;
  Expression* e = b.Not(b.And(b.Column("a"), b.Lt(b.Column("b"), b.Int(1))));
  EXPECT_THAT(RewriteAndRenderText(e), IsOkAndHolds("NOT (a AND b < 1)"));
  EXPECT_THAT(RewriteAndRenderText(b.Not(b.Func("f", {}))),
              IsOkAndHolds("NOT f()"));
}

TEST(SqlAstTest, RewriteReachesNestedExpressions) {
  SqlBuilder b;
  Expression* x = b.Column("x");
  Expression* e = b.Or(b.Not(b.IsNull(x)),
                       b.Func("coalesce", {b.Case(b.Not(b.Eq(x, b.Int(1))),
                                                  b.Int(2))}));
  EXPECT_THAT(RewriteAndRenderText(e),
              IsOkAndHolds("x IS NOT NULL OR coalesce(CASE WHEN x <> 1 THEN 2 "
                           "END)"));
}

TEST(SqlAstTest, RewriteIsPure) {
  SqlBuilder b;
  Expression* original = b.Not(b.IsNull(b.Column("x")));
  Expression* rewritten = original->Rewrite();
  EXPECT_NE(rewritten, original);
  EXPECT_THAT(RenderText(original), IsOkAndHolds("NOT x IS NULL"));
  EXPECT_THAT(RenderText(rewritten), IsOkAndHolds("x IS NOT NULL"));
}

TEST(SqlAstTest, RewriteIsIdempotent) {
  SqlBuilder b;
  Expression* x = b.Column("x");
  Expression* e = b.And(b.Not(b.Not(b.Ge(x, b.Int(0)))),
                        b.Not(b.Or(b.IsTrue(x), b.Not(b.IsFalse(x)))));
  Expression* once = e->Rewrite();
  Expression* twice = once->Rewrite();
  SQLGEN_ASSERT_OK_AND_ASSIGN(std::string once_text, RenderText(once));
  EXPECT_EQ(once_text, "x >= 0 AND NOT (x IS TRUE OR x IS NOT FALSE)");
  EXPECT_THAT(RenderText(twice), IsOkAndHolds(once_text));
}

TEST(SqlAstTest, OverridesSurviveNegation) {
  SqlBuilder b;
  Operator* is_null = b.IsNull(b.Column("x"));
  is_null->set_precedence(1);
  Expression* rewritten = b.Not(is_null)->Rewrite();
  ASSERT_NE(rewritten->AsOperator(), nullptr);
  EXPECT_EQ(rewritten->AsOperator()->kind(), OperatorKind::kIsNotNull);
  EXPECT_THAT(rewritten->AsOperator()->precedence(), Optional(1));
  EXPECT_THAT(RenderText(b.And(rewritten, b.Column("y"))),
              IsOkAndHolds("(x IS NOT NULL) AND y"));
}

TEST(SqlAstTest, NegatableOperators) {
  SqlBuilder b;
  Expression* a = b.Column("a");
  EXPECT_TRUE(b.Not(a)->negatable());
  EXPECT_TRUE(b.IsNull(a)->negatable());
  EXPECT_TRUE(b.Eq(a, a)->negatable());
  EXPECT_TRUE(b.Between(a, a, a)->negatable());
  EXPECT_FALSE(b.And(a, a)->negatable());
  EXPECT_FALSE(b.Lt(a, a)->negatable());
  EXPECT_FALSE(b.Negate(a)->negatable());
  EXPECT_EQ(b.Not(a)->Negate(), a);
  EXPECT_EQ(b.Add(a, a)->arity(), OperatorArity::kBinary);
  EXPECT_EQ(a->AsOperator(), nullptr);
}

TEST(SqlAstTest, PlaceholderBinding) {
  SqlBuilder b;
  Expression* e = b.Eq(b.Column("a"), b.Placeholder("x"));
  SQLGEN_ASSERT_OK_AND_ASSIGN(RenderedSql sql, RenderSql(e, Dialect::Sqlite()));
  EXPECT_EQ(sql.text, "a = ?");
  EXPECT_THAT(sql.bindings, ElementsAre("x"));
}

TEST(SqlAstTest, SameNameSamePosition) {
  SqlBuilder b;
  Expression* e =
      b.Or(b.Eq(b.Column("a"), b.Placeholder("x")),
           b.And(b.Eq(b.Column("b"), b.Placeholder("y")),
                 b.Eq(b.Column("c"), b.Placeholder("x"))));

  SQLGEN_ASSERT_OK_AND_ASSIGN(RenderedSql pg, RenderSql(e, Dialect::Postgres()));
  EXPECT_EQ(pg.text, "a = $1 OR b = $2 AND c = $1");
  EXPECT_THAT(pg.bindings, ElementsAre("x", "y"));

  SQLGEN_ASSERT_OK_AND_ASSIGN(RenderedSql named, RenderSql(e, Dialect::Named()));
  EXPECT_EQ(named.text, "a = :x OR b = :y AND c = :x");

  SQLGEN_ASSERT_OK_AND_ASSIGN(RenderedSql anonymous,
                              RenderSql(e, Dialect::MySql()));
  EXPECT_EQ(anonymous.text, "a = ? OR b = ? AND c = ?");
  EXPECT_THAT(anonymous.occurrences, ElementsAre("x", "y", "x"));
}

TEST(SqlAstTest, EachRenderHasItsOwnBindings) {
  SqlBuilder b;
  Expression* e = b.Add(b.Placeholder("p"), b.Placeholder("q"));
  EXPECT_THAT(RenderText(e, Dialect::Postgres()), IsOkAndHolds("$1 + $2"));
  EXPECT_THAT(RenderText(e, Dialect::Postgres()), IsOkAndHolds("$1 + $2"));
}

TEST(SqlAstTest, SelectStatement) {
  SqlBuilder b;
  FromItem* users = b.From(b.LabeledTable("users", "u"));
  FromItem* orders = b.From(b.LabeledTable("orders", "o"));
  Expression* count = b.Func("count", {b.Column("o", "id")});
  SelectStatement* select =
      b.Select({b.Item(b.Column("u", "id")), b.Item(count, "total")})
          ->From(b.From(b.LeftJoin(
              users, orders,
              b.Eq(b.Column("u", "id"), b.Column("o", "user_id")))))
          ->Where(b.Gt(b.Column("u", "age"), b.Placeholder("min_age")))
          ->GroupBy({b.Column("u", "id")})
          ->Having(b.Gt(count, b.Int(1)))
          ->OrderBy({b.NullsLast(b.Desc(b.Column("total"))),
                     b.Asc(b.Column("u", "id"))})
          ->Limit(b.Int(10))
          ->Offset(b.Int(20));
  EXPECT_THAT(RenderText(select, Dialect::Postgres()),
              IsOkAndHolds("SELECT u.id,count(o.id) total FROM users u LEFT "
                           "JOIN orders o ON u.id = o.user_id WHERE u.age > $1 "
                           "GROUP BY u.id HAVING count(o.id) > 1 ORDER BY "
                           "total DESC NULLS LAST,u.id LIMIT 10 OFFSET 20"));
}

TEST(SqlAstTest, MinimalSelect) {
  SqlBuilder b;
  EXPECT_THAT(RenderText(b.Select({b.Item(b.Int(1))})),
              IsOkAndHolds("SELECT 1"));
}

TEST(SqlAstTest, ClauseSettersReplace) {
  SqlBuilder b;
  SelectStatement* select = b.Select({b.Item(b.Column("a"))})
                                ->Limit(b.Int(5))
                                ->From(b.From(b.Table("t")))
                                ->Limit(b.Int(10));
  EXPECT_THAT(RenderText(select), IsOkAndHolds("SELECT a FROM t LIMIT 10"));
}

TEST(SqlAstTest, Joins) {
  SqlBuilder b;
  FromItem* t = b.From(b.Table("t"));
  FromItem* s = b.From(b.Table("s"));
  Expression* on = b.Eq(b.Column("t", "id"), b.Column("s", "id"));
  EXPECT_THAT(RenderText(b.Join(t, s, on)),
              IsOkAndHolds("t JOIN s ON t.id = s.id"));
  EXPECT_THAT(RenderText(b.RightJoin(t, s, on)),
              IsOkAndHolds("t RIGHT JOIN s ON t.id = s.id"));

  FromItem* joined = b.From(b.FullJoin(t, s, on));
  FromItem* r = b.From(b.Table("r"));
  EXPECT_THAT(
      RenderText(b.Join(joined, r, b.Eq(b.Column("r", "id"), b.Column("t", "id")))),
      IsOkAndHolds("t FULL JOIN s ON t.id = s.id JOIN r ON r.id = t.id"));
}

TEST(SqlAstTest, Subquery) {
  SqlBuilder b;
  SelectStatement* inner =
      b.Select({b.Item(b.Column("x"))})
          ->From(b.From(b.Table("t")))
          ->Where(b.Not(b.IsNull(b.Column("x"))));
  SelectStatement* outer = b.Select({b.Item(b.Column("sub", "x"))})
                               ->From(b.From(b.Subquery(inner, "sub")));
  EXPECT_THAT(RenderText(outer),
              IsOkAndHolds("SELECT sub.x FROM (SELECT x FROM t WHERE NOT x "
                           "IS NULL) sub"));
  EXPECT_THAT(RewriteAndRenderText(outer),
              IsOkAndHolds("SELECT sub.x FROM (SELECT x FROM t WHERE x IS NOT "
                           "NULL) sub"));
}

TEST(SqlAstTest, OrderingHints) {
  SqlBuilder b;
  Expression* a = b.Column("a");
  EXPECT_THAT(RenderText(b.Asc(a)), IsOkAndHolds("a"));
  EXPECT_THAT(RenderText(b.Desc(a)), IsOkAndHolds("a DESC"));
  EXPECT_THAT(RenderText(b.NullsFirst(b.Asc(a))), IsOkAndHolds("a NULLS FIRST"));
  EXPECT_THAT(RenderText(b.NullsLast(b.Asc(a))), IsOkAndHolds("a"));
  EXPECT_THAT(RenderText(b.NullsLast(b.Desc(a))),
              IsOkAndHolds("a DESC NULLS LAST"));
  EXPECT_THAT(RenderText(b.NullsFirst(b.Desc(a))), IsOkAndHolds("a DESC"));
}

TEST(SqlAstTest, EmptyFromItem) {
  SqlBuilder b;
  FromItem* empty = b.Make<FromItem>(FromItem::Alternative());
  SelectStatement* select = b.Select({b.Item(b.Column("a"))})->From(empty);
  absl::StatusOr<std::string> result = RenderText(select);
  EXPECT_THAT(result, StatusIs(absl::StatusCode::kInvalidArgument,
                               HasSubstr("UnknownStructuralVariantError")));
  EXPECT_THAT(GetSqlErrorKind(result.status()),
              Optional(SqlErrorKind::kUnknownStructuralVariant));
}

TEST(SqlAstTest, NestingLimit) {
  SqlBuilder b;
  Expression* e =
      b.Add(b.Add(b.Add(b.Column("a"), b.Column("b")), b.Column("c")),
            b.Column("d"));
  Dialect shallow = Dialect::Sqlite();
  shallow.max_nesting_depth(4);
  EXPECT_THAT(RenderText(e, shallow), IsOkAndHolds("a + b + c + d"));
  shallow.max_nesting_depth(3);
  EXPECT_THAT(RenderText(e, shallow),
              StatusIs(absl::StatusCode::kResourceExhausted,
                       HasSubstr("NestingTooDeepError")));
}

TEST(SqlAstTest, DeepTreeHitsDefaultLimit) {
  SqlBuilder b;
  Expression* e = b.Column("x");
  for (int64_t i = 0; i < 2 * Dialect::kDefaultMaxNestingDepth; ++i) {
    e = b.Negate(e);
  }
  EXPECT_THAT(RenderText(e), StatusIs(absl::StatusCode::kResourceExhausted,
                                      HasSubstr("limit of 1000")));
}

TEST(SqlAstTest, DeepTreeIsRejectedBeforeRewrite) {
  SqlBuilder b;
  Expression* e = b.Column("d");
  for (int64_t i = 0; i < 100000; ++i) {
    e = b.Not(b.And(e, b.Column("y")));
  }
  EXPECT_THAT(RewriteAndRenderText(e),
              StatusIs(absl::StatusCode::kResourceExhausted,
                       HasSubstr("limit of 1000")));
}

TEST(SqlAstTest, RewriteDepthLimitCountsTheTreeAsBuilt) {
  SqlBuilder b;
  // Three levels as built; NOT collapses it to two.
  Expression* e = b.Not(b.IsNull(b.Column("x")));
  EXPECT_THAT(RewriteAndRenderText(e, Dialect::Sqlite().max_nesting_depth(3)),
              IsOkAndHolds("x IS NOT NULL"));
  EXPECT_THAT(RewriteAndRenderText(e, Dialect::Sqlite().max_nesting_depth(2)),
              StatusIs(absl::StatusCode::kResourceExhausted,
                       HasSubstr("limit of 2")));
}

TEST(SqlAstTest, ChildrenFollowRenderOrder) {
  SqlBuilder b;
  Expression* x = b.Column("x");
  Expression* lo = b.Int(1);
  Expression* hi = b.Int(2);
  EXPECT_THAT(b.Between(x, lo, hi)->children(), ElementsAre(x, lo, hi));
  EXPECT_THAT(x->children(), ElementsAre());

  Expression* cond = b.IsNull(x);
  CaseExpression* c = b.Case(cond, lo)->Else(hi);
  EXPECT_THAT(c->children(), ElementsAre(cond, lo, hi));

  SelectItem* item = b.Item(x);
  FromItem* from = b.From(b.Table("t"));
  SelectStatement* select = b.Select({item})->From(from)->Limit(lo);
  std::vector<SqlNode*> clauses = select->children();
  ASSERT_EQ(clauses.size(), 3);
  EXPECT_EQ(clauses[0], item);
  EXPECT_THAT(clauses[1]->children(), ElementsAre(from));
  EXPECT_THAT(clauses[2]->children(), ElementsAre(lo));
}

TEST(SqlAstTest, NodesAreOwnedByTheBuilder) {
  SqlBuilder b;
  EXPECT_EQ(b.node_count(), 0);
  Expression* e = b.Not(b.IsNull(b.Column("x")));
  EXPECT_EQ(b.node_count(), 3);
  e->Rewrite();
  EXPECT_GT(b.node_count(), 3);
  EXPECT_EQ(e->builder(), &b);
}

TEST(SqlAstDeathTest, IllegalFunctionName) {
  SqlBuilder b;
  EXPECT_DEATH(b.Func("1abc", {}), "Illegal function name");
  EXPECT_DEATH(b.Func0("drop table; --"), "Illegal function name");
}

TEST(SqlAstDeathTest, ZeroPrecedenceOverride) {
  SqlBuilder b;
  Operator* e = b.And(b.Column("a"), b.Column("b"));
  EXPECT_DEATH(e->set_precedence(0), "must be positive");
}

TEST(SqlAstDeathTest, NegateNonNegatable) {
  SqlBuilder b;
  Operator* e = b.Or(b.Column("a"), b.Column("b"));
  EXPECT_DEATH(e->Negate(), "not negatable");
}

TEST(SqlAstDeathTest, EmptyLists) {
  SqlBuilder b;
  EXPECT_DEATH(b.Select({}), "at least one item");
  EXPECT_DEATH(b.Tuple({}), "at least one element");
}

TEST(SqlAstDeathTest, NullListElements) {
  SqlBuilder b;
  EXPECT_DEATH(b.Func("f", {nullptr}), "Null element in function arguments");
  EXPECT_DEATH(b.Func("f", {b.Int(1), nullptr}), "Null element");
  EXPECT_DEATH(b.Tuple({nullptr}), "Null element in tuple");
  EXPECT_DEATH(b.Select({nullptr}), "Null element in SELECT list");
  SelectStatement* select = b.Select({b.Item(b.Column("a"))});
  EXPECT_DEATH(select->GroupBy({nullptr}), "Null element in GROUP BY");
  EXPECT_DEATH(select->OrderBy({nullptr}), "Null element in ORDER BY");
}

TEST(SqlAstDeathTest, NonFiniteDouble) {
  SqlBuilder b;
  EXPECT_DEATH(b.Double(std::numeric_limits<double>::infinity()),
               "Non-finite double");
  EXPECT_DEATH(b.Double(-std::numeric_limits<double>::infinity()),
               "Non-finite double");
  EXPECT_DEATH(b.Double(std::nan("")), "Non-finite double");
}

}  // namespace
}  // namespace sqlgen
