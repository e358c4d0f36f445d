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

// SQL expression and statement AST, suitable for composing as data structures
// before rendering to parameterized SQL text.
//
// Nodes are created through a SqlBuilder, which owns them. A tree is rewritten
// into canonical form once (SqlNode::Rewrite) and may then be rendered any
// number of times against independent RenderContexts.

#ifndef SQLGEN_AST_SQL_AST_H_
#define SQLGEN_AST_SQL_AST_H_

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "absl/log/die_if_null.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/types/span.h"
#include "sqlgen/ast/dialect.h"
#include "sqlgen/ast/operator_kind.h"
#include "sqlgen/ast/render_context.h"

namespace sqlgen {

// Forward declarations.
class SqlBuilder;
class Operator;
class SelectStatement;

// Base type for a SQL AST node. All nodes are owned by a SqlBuilder.
class SqlNode {
 public:
  explicit SqlNode(SqlBuilder* builder) : builder_(builder) {}
  virtual ~SqlNode() = default;

  SqlNode(const SqlNode&) = delete;
  SqlNode& operator=(const SqlNode&) = delete;

  // The builder which owns this node.
  SqlBuilder* builder() const { return builder_; }

  // Returns the canonical form of this node, with children canonicalized
  // first. Nodes that change are rebuilt in builder(); this node and its
  // children are never modified. Rewriting a canonical tree yields an
  // equivalent tree.
  virtual SqlNode* Rewrite() = 0;

  // Appends this node's text to `ctx`. On error the context's partial text is
  // meaningless and should be discarded.
  virtual absl::Status Render(RenderContext* ctx) const = 0;

  // The nodes this node renders nested inside itself, in render order.
  virtual std::vector<SqlNode*> children() const { return {}; }

 private:
  SqlBuilder* builder_;
};

// Represents a SQL value expression.
class Expression : public SqlNode {
 public:
  using SqlNode::SqlNode;

  Expression* Rewrite() override = 0;

  // Returns this expression as an operator, or nullptr when it is a leaf or a
  // structural expression. Only operators take part in parenthesization;
  // everything else binds tightest.
  virtual Operator* AsOperator() { return nullptr; }
  virtual const Operator* AsOperator() const { return nullptr; }
};

// The operator shapes. The set is closed: Unary, Binary and Ternary are the
// only Operator subclasses.
enum class OperatorArity : int8_t { kUnary, kBinary, kTernary };

// Represents an operator whose precedence and associativity come from the
// dialect unless overridden on the instance.
class Operator : public Expression {
 public:
  Operator(OperatorKind kind, SqlBuilder* builder)
      : Expression(builder), kind_(kind) {}

  OperatorKind kind() const { return kind_; }
  virtual OperatorArity arity() const = 0;

  // Per-instance precedence; larger binds tighter. CHECK-fails unless
  // positive.
  Operator* set_precedence(int64_t precedence);
  std::optional<int64_t> precedence() const { return precedence_; }

  // Per-instance associativity.
  Operator* set_associativity(Associativity associativity);
  std::optional<Associativity> associativity() const {
    return associativity_;
  }

  absl::StatusOr<int64_t> ResolvePrecedence(const RenderContext& ctx) const;
  absl::StatusOr<Associativity> ResolveAssociativity(
      const RenderContext& ctx) const;

  // Whether Negate() can express the logical negation of this operator without
  // a NOT wrapper.
  virtual bool negatable() const = 0;

  // Returns the negated counterpart, sharing this operator's operands and
  // overrides. CHECK-fails unless negatable().
  virtual Expression* Negate() const = 0;

  Operator* AsOperator() override { return this; }
  const Operator* AsOperator() const override { return this; }

 protected:
  // Copies this operator's overrides onto `other`, which must be a freshly
  // built counterpart of this operator.
  void CopyOverridesTo(Operator* other) const;

 private:
  OperatorKind kind_;
  std::optional<int64_t> precedence_;
  std::optional<Associativity> associativity_;
};

// Kind and symbol of the counterpart an operator negates into.
struct NegatedSymbol {
  OperatorKind kind;
  std::string symbol;
};

// Represents a unary operator. Right-associative operators are rendered prefix
// ("NOT x"), left-associative ones suffix ("x IS NULL").
//
// The logical NOT is special: it is always negatable, and negating it yields
// its operand.
class Unary final : public Operator {
 public:
  Unary(OperatorKind kind, std::string_view symbol, Expression* arg,
        std::optional<NegatedSymbol> negated, SqlBuilder* builder)
      : Operator(kind, builder),
        symbol_(symbol),
        arg_(ABSL_DIE_IF_NULL(arg)),
        negated_(std::move(negated)) {}

  OperatorArity arity() const override { return OperatorArity::kUnary; }
  bool IsLogicalNot() const { return kind() == OperatorKind::kNot; }

  bool negatable() const override;
  Expression* Negate() const override;

  // Collapses NOT over a negatable operator into that operator's negation.
  Expression* Rewrite() override;
  absl::Status Render(RenderContext* ctx) const override;

  std::vector<SqlNode*> children() const override { return {arg_}; }

  const std::string& symbol() const { return symbol_; }
  Expression* arg() const { return arg_; }

 private:
  std::string symbol_;
  Expression* arg_;
  std::optional<NegatedSymbol> negated_;
};

// Represents a binary infix operator; e.g.
//
//    lhs SYMBOL rhs
//
// With `suppress_space` the symbol is glued to both operands ("x::TEXT").
class Binary final : public Operator {
 public:
  Binary(OperatorKind kind, Expression* lhs, std::string_view symbol,
         Expression* rhs, std::optional<NegatedSymbol> negated,
         bool suppress_space, SqlBuilder* builder)
      : Operator(kind, builder),
        symbol_(symbol),
        lhs_(ABSL_DIE_IF_NULL(lhs)),
        rhs_(ABSL_DIE_IF_NULL(rhs)),
        negated_(std::move(negated)),
        suppress_space_(suppress_space) {}

  OperatorArity arity() const override { return OperatorArity::kBinary; }

  bool negatable() const override { return negated_.has_value(); }
  Expression* Negate() const override;

  Expression* Rewrite() override;
  absl::Status Render(RenderContext* ctx) const override;

  std::vector<SqlNode*> children() const override { return {lhs_, rhs_}; }

  const std::string& symbol() const { return symbol_; }
  Expression* lhs() const { return lhs_; }
  Expression* rhs() const { return rhs_; }
  bool suppress_space() const { return suppress_space_; }

 private:
  std::string symbol_;
  Expression* lhs_;
  Expression* rhs_;
  std::optional<NegatedSymbol> negated_;
  bool suppress_space_;
};

// Kind and symbol pair of the counterpart a ternary operator negates into.
struct NegatedSymbols {
  OperatorKind kind;
  std::string symbol1;
  std::string symbol2;
};

// Represents a two-symbol infix operator over three operands; e.g.
//
//    x BETWEEN lo AND hi
//
// Ternary operators have a precedence but no associativity.
class Ternary final : public Operator {
 public:
  Ternary(OperatorKind kind, Expression* first, std::string_view symbol1,
          Expression* second, std::string_view symbol2, Expression* third,
          std::optional<NegatedSymbols> negated, SqlBuilder* builder)
      : Operator(kind, builder),
        symbol1_(symbol1),
        symbol2_(symbol2),
        first_(ABSL_DIE_IF_NULL(first)),
        second_(ABSL_DIE_IF_NULL(second)),
        third_(ABSL_DIE_IF_NULL(third)),
        negated_(std::move(negated)) {}

  OperatorArity arity() const override { return OperatorArity::kTernary; }

  bool negatable() const override { return negated_.has_value(); }
  Expression* Negate() const override;

  Expression* Rewrite() override;
  absl::Status Render(RenderContext* ctx) const override;

  std::vector<SqlNode*> children() const override {
    return {first_, second_, third_};
  }

  const std::string& symbol1() const { return symbol1_; }
  const std::string& symbol2() const { return symbol2_; }
  Expression* first() const { return first_; }
  Expression* second() const { return second_; }
  Expression* third() const { return third_; }

 private:
  std::string symbol1_;
  std::string symbol2_;
  Expression* first_;
  Expression* second_;
  Expression* third_;
  std::optional<NegatedSymbols> negated_;
};

// Text emitted exactly as given: numbers, quoted strings, keywords such as
// NULL or TRUE, or raw SQL fragments.
class Literal : public Expression {
 public:
  Literal(std::string_view text, SqlBuilder* builder)
      : Expression(builder), text_(text) {}

  Expression* Rewrite() override { return this; }
  absl::Status Render(RenderContext* ctx) const override;

  const std::string& text() const { return text_; }

 private:
  std::string text_;
};

// Represents a SQL type name; e.g. INTEGER or DECIMAL(10,2).
class SqlType : public Expression {
 public:
  SqlType(std::string_view name, SqlBuilder* builder)
      : Expression(builder), name_(name) {}

  SqlType* Rewrite() override { return this; }
  absl::Status Render(RenderContext* ctx) const override;

  const std::string& name() const { return name_; }

 private:
  std::string name_;
};

// Represents a column reference, optionally qualified by a table label; e.g.
//
//    t.name
class Column : public Expression {
 public:
  Column(std::optional<std::string> table, std::string_view name,
         SqlBuilder* builder)
      : Expression(builder), table_(std::move(table)), name_(name) {}

  Expression* Rewrite() override { return this; }
  absl::Status Render(RenderContext* ctx) const override;

  const std::optional<std::string>& table() const { return table_; }
  const std::string& name() const { return name_; }

 private:
  std::optional<std::string> table_;
  std::string name_;
};

// A named parameter. Every placeholder with the same name binds to the same
// position within one render pass.
class Placeholder : public Expression {
 public:
  Placeholder(std::string_view name, SqlBuilder* builder)
      : Expression(builder), name_(name) {}

  Expression* Rewrite() override { return this; }
  absl::Status Render(RenderContext* ctx) const override;

  const std::string& name() const { return name_; }

 private:
  std::string name_;
};

// Represents a function call; e.g.
//
//    coalesce(a,b)
//    now()
//    CURRENT_TIMESTAMP      (omit_parentheses)
class FunctionCall : public Expression {
 public:
  FunctionCall(std::string_view name, absl::Span<Expression* const> args,
               bool omit_parentheses, SqlBuilder* builder);

  Expression* Rewrite() override;
  absl::Status Render(RenderContext* ctx) const override;
  std::vector<SqlNode*> children() const override {
    return std::vector<SqlNode*>(args_.begin(), args_.end());
  }

  const std::string& name() const { return name_; }
  absl::Span<Expression* const> args() const { return args_; }

 private:
  std::string name_;
  std::vector<Expression*> args_;
  bool omit_parentheses_;
};

// CAST(expr AS type)
class Cast : public Expression {
 public:
  Cast(Expression* expr, SqlType* type, SqlBuilder* builder)
      : Expression(builder),
        expr_(ABSL_DIE_IF_NULL(expr)),
        type_(ABSL_DIE_IF_NULL(type)) {}

  Expression* Rewrite() override;
  absl::Status Render(RenderContext* ctx) const override;
  std::vector<SqlNode*> children() const override { return {expr_, type_}; }

 private:
  Expression* expr_;
  SqlType* type_;
};

// A parenthesized, comma-separated list of expressions; e.g. the right-hand
// side of IN.
class Tuple : public Expression {
 public:
  Tuple(absl::Span<Expression* const> elements, SqlBuilder* builder);

  Expression* Rewrite() override;
  absl::Status Render(RenderContext* ctx) const override;
  std::vector<SqlNode*> children() const override {
    return std::vector<SqlNode*>(elements_.begin(), elements_.end());
  }

  absl::Span<Expression* const> elements() const { return elements_; }

 private:
  std::vector<Expression*> elements_;
};

// Represents a searched CASE expression; e.g.
//
//    CASE WHEN cond THEN result ... ELSE other END
class CaseExpression : public Expression {
 public:
  CaseExpression(Expression* condition, Expression* result,
                 SqlBuilder* builder);

  // Adds a WHEN arm.
  CaseExpression* When(Expression* condition, Expression* result);

  // Sets the ELSE arm.
  CaseExpression* Else(Expression* result);

  Expression* Rewrite() override;
  absl::Status Render(RenderContext* ctx) const override;
  std::vector<SqlNode*> children() const override;

 private:
  struct Arm {
    Expression* condition;
    Expression* result;
  };

  std::vector<Arm> arms_;
  Expression* else_ = nullptr;
};

// An item of a select list, optionally labeled; e.g.
//
//    count(x) total
class SelectItem : public SqlNode {
 public:
  SelectItem(Expression* expr, std::optional<std::string> label,
             SqlBuilder* builder)
      : SqlNode(builder),
        expr_(ABSL_DIE_IF_NULL(expr)),
        label_(std::move(label)) {}

  SelectItem* Rewrite() override;
  absl::Status Render(RenderContext* ctx) const override;
  std::vector<SqlNode*> children() const override { return {expr_}; }

 private:
  Expression* expr_;
  std::optional<std::string> label_;
};

// A table reference, optionally schema-qualified and labeled; e.g.
//
//    public.users u
class TableRef : public SqlNode {
 public:
  TableRef(std::optional<std::string> schema, std::string_view name,
           std::optional<std::string> label, SqlBuilder* builder)
      : SqlNode(builder),
        schema_(std::move(schema)),
        name_(name),
        label_(std::move(label)) {}

  TableRef* Rewrite() override { return this; }
  absl::Status Render(RenderContext* ctx) const override;

 private:
  std::optional<std::string> schema_;
  std::string name_;
  std::optional<std::string> label_;
};

// A labeled subquery in a FROM clause; e.g.
//
//    (SELECT ...) sub
class LabeledSubquery : public SqlNode {
 public:
  LabeledSubquery(SelectStatement* select, std::string_view label,
                  SqlBuilder* builder)
      : SqlNode(builder), select_(ABSL_DIE_IF_NULL(select)), label_(label) {}

  LabeledSubquery* Rewrite() override;
  absl::Status Render(RenderContext* ctx) const override;
  std::vector<SqlNode*> children() const override;

 private:
  SelectStatement* select_;
  std::string label_;
};

class FromItem;

enum class JoinKind : int8_t { kInner, kLeft, kRight, kFull };

std::string_view JoinKindToString(JoinKind kind);

// left [LEFT|RIGHT|FULL] JOIN right ON condition
class Join : public SqlNode {
 public:
  Join(JoinKind kind, FromItem* left, FromItem* right, Expression* on,
       SqlBuilder* builder)
      : SqlNode(builder),
        kind_(kind),
        left_(ABSL_DIE_IF_NULL(left)),
        right_(ABSL_DIE_IF_NULL(right)),
        on_(ABSL_DIE_IF_NULL(on)) {}

  Join* Rewrite() override;
  absl::Status Render(RenderContext* ctx) const override;
  std::vector<SqlNode*> children() const override;

 private:
  JoinKind kind_;
  FromItem* left_;
  FromItem* right_;
  Expression* on_;
};

// One of a table, a labeled subquery or a join. An item holding none of these
// fails to render with an UnknownStructuralVariant error.
class FromItem : public SqlNode {
 public:
  using Alternative =
      std::variant<std::monostate, TableRef*, LabeledSubquery*, Join*>;

  FromItem(Alternative alternative, SqlBuilder* builder)
      : SqlNode(builder), alternative_(alternative) {}

  FromItem* Rewrite() override;
  absl::Status Render(RenderContext* ctx) const override;
  std::vector<SqlNode*> children() const override;

  const Alternative& alternative() const { return alternative_; }

 private:
  Alternative alternative_;
};

// FROM item
class FromClause : public SqlNode {
 public:
  FromClause(FromItem* item, SqlBuilder* builder)
      : SqlNode(builder), item_(ABSL_DIE_IF_NULL(item)) {}

  FromClause* Rewrite() override;
  absl::Status Render(RenderContext* ctx) const override;
  std::vector<SqlNode*> children() const override;

 private:
  FromItem* item_;
};

// WHERE condition
class WhereClause : public SqlNode {
 public:
  WhereClause(Expression* condition, SqlBuilder* builder)
      : SqlNode(builder), condition_(ABSL_DIE_IF_NULL(condition)) {}

  WhereClause* Rewrite() override;
  absl::Status Render(RenderContext* ctx) const override;
  std::vector<SqlNode*> children() const override { return {condition_}; }

 private:
  Expression* condition_;
};

// GROUP BY a,b
class GroupByClause : public SqlNode {
 public:
  GroupByClause(absl::Span<Expression* const> exprs, SqlBuilder* builder);

  GroupByClause* Rewrite() override;
  absl::Status Render(RenderContext* ctx) const override;
  std::vector<SqlNode*> children() const override {
    return std::vector<SqlNode*>(exprs_.begin(), exprs_.end());
  }

 private:
  std::vector<Expression*> exprs_;
};

// HAVING condition
class HavingClause : public SqlNode {
 public:
  HavingClause(Expression* condition, SqlBuilder* builder)
      : SqlNode(builder), condition_(ABSL_DIE_IF_NULL(condition)) {}

  HavingClause* Rewrite() override;
  absl::Status Render(RenderContext* ctx) const override;
  std::vector<SqlNode*> children() const override { return {condition_}; }

 private:
  Expression* condition_;
};

enum class SortDirection : int8_t { kAscending, kDescending };
enum class NullsOrder : int8_t { kFirst, kLast };

// An ORDER BY item. Only a nulls order that differs from the default for the
// direction is spelled out: NULLS FIRST for ascending items, NULLS LAST for
// descending ones.
class OrderByItem : public SqlNode {
 public:
  OrderByItem(Expression* expr, SortDirection direction,
              std::optional<NullsOrder> nulls, SqlBuilder* builder)
      : SqlNode(builder),
        expr_(ABSL_DIE_IF_NULL(expr)),
        direction_(direction),
        nulls_(nulls) {}

  OrderByItem* Rewrite() override;
  absl::Status Render(RenderContext* ctx) const override;
  std::vector<SqlNode*> children() const override { return {expr_}; }

  Expression* expr() const { return expr_; }
  SortDirection direction() const { return direction_; }
  std::optional<NullsOrder> nulls() const { return nulls_; }

 private:
  Expression* expr_;
  SortDirection direction_;
  std::optional<NullsOrder> nulls_;
};

// ORDER BY item,item
class OrderByClause : public SqlNode {
 public:
  OrderByClause(absl::Span<OrderByItem* const> items, SqlBuilder* builder);

  OrderByClause* Rewrite() override;
  absl::Status Render(RenderContext* ctx) const override;
  std::vector<SqlNode*> children() const override {
    return std::vector<SqlNode*>(items_.begin(), items_.end());
  }

 private:
  std::vector<OrderByItem*> items_;
};

// LIMIT count
class LimitClause : public SqlNode {
 public:
  LimitClause(Expression* count, SqlBuilder* builder)
      : SqlNode(builder), count_(ABSL_DIE_IF_NULL(count)) {}

  LimitClause* Rewrite() override;
  absl::Status Render(RenderContext* ctx) const override;
  std::vector<SqlNode*> children() const override { return {count_}; }

 private:
  Expression* count_;
};

// OFFSET count
class OffsetClause : public SqlNode {
 public:
  OffsetClause(Expression* count, SqlBuilder* builder)
      : SqlNode(builder), count_(ABSL_DIE_IF_NULL(count)) {}

  OffsetClause* Rewrite() override;
  absl::Status Render(RenderContext* ctx) const override;
  std::vector<SqlNode*> children() const override { return {count_}; }

 private:
  Expression* count_;
};

// Represents a SELECT statement:
//
//    SELECT items [FROM ..] [WHERE ..] [GROUP BY ..] [HAVING ..]
//      [ORDER BY ..] [LIMIT ..] [OFFSET ..]
//
// Clauses are set with the fluent methods below, which replace any clause of
// the same kind set earlier.
class SelectStatement : public SqlNode {
 public:
  SelectStatement(absl::Span<SelectItem* const> items, SqlBuilder* builder);

  SelectStatement* From(FromItem* item);
  SelectStatement* Where(Expression* condition);
  SelectStatement* GroupBy(absl::Span<Expression* const> exprs);
  SelectStatement* Having(Expression* condition);
  SelectStatement* OrderBy(absl::Span<OrderByItem* const> items);
  SelectStatement* Limit(Expression* count);
  SelectStatement* Offset(Expression* count);

  SelectStatement* Rewrite() override;
  absl::Status Render(RenderContext* ctx) const override;
  std::vector<SqlNode*> children() const override;

 private:
  std::vector<SelectItem*> items_;
  FromClause* from_ = nullptr;
  WhereClause* where_ = nullptr;
  GroupByClause* group_by_ = nullptr;
  HavingClause* having_ = nullptr;
  OrderByClause* order_by_ = nullptr;
  LimitClause* limit_ = nullptr;
  OffsetClause* offset_ = nullptr;
};

// Owns AST nodes and provides a constructor for each node kind.
class SqlBuilder {
 public:
  SqlBuilder() = default;

  SqlBuilder(const SqlBuilder&) = delete;
  SqlBuilder& operator=(const SqlBuilder&) = delete;

  template <typename T, typename... Args>
  T* Make(Args&&... args) {
    std::unique_ptr<T> value =
        std::make_unique<T>(std::forward<Args>(args)..., this);
    T* ptr = value.get();
    nodes_.push_back(std::move(value));
    return ptr;
  }

  // Number of nodes owned by this builder.
  int64_t node_count() const { return nodes_.size(); }

  // Leaves.
  Literal* Int(int64_t value);
  // CHECK-fails on NaN and infinities, which have no literal spelling; pass
  // those through Verbatim() in the dialect's own syntax.
  Literal* Double(double value);
  // A single-quoted string literal; embedded quotes are doubled.
  Literal* String(std::string_view value);
  Literal* Bool(bool value);
  Literal* Null();
  Literal* Verbatim(std::string_view text);
  sqlgen::Column* Column(std::string_view name);
  sqlgen::Column* Column(std::string_view table, std::string_view name);
  sqlgen::Placeholder* Placeholder(std::string_view name);

  // Types.
  SqlType* SmallintType() { return Make<SqlType>("SMALLINT"); }
  SqlType* IntegerType() { return Make<SqlType>("INTEGER"); }
  SqlType* BigintType() { return Make<SqlType>("BIGINT"); }
  SqlType* BooleanType() { return Make<SqlType>("BOOLEAN"); }
  SqlType* RealType() { return Make<SqlType>("REAL"); }
  SqlType* DoublePrecisionType() { return Make<SqlType>("DOUBLE PRECISION"); }
  SqlType* TextType() { return Make<SqlType>("TEXT"); }
  SqlType* TimestampType() { return Make<SqlType>("TIMESTAMP"); }
  SqlType* DecimalType(int64_t precision, int64_t scale);

  // Unary operators.
  Unary* Not(Expression* arg);
  Unary* Negate(Expression* arg);
  Unary* IsNull(Expression* arg);
  Unary* IsNotNull(Expression* arg);
  Unary* IsTrue(Expression* arg);
  Unary* IsNotTrue(Expression* arg);
  Unary* IsFalse(Expression* arg);
  Unary* IsNotFalse(Expression* arg);

  // Binary operators.
  Binary* And(Expression* lhs, Expression* rhs);
  Binary* Or(Expression* lhs, Expression* rhs);
  Binary* Add(Expression* lhs, Expression* rhs);
  Binary* Sub(Expression* lhs, Expression* rhs);
  Binary* Mul(Expression* lhs, Expression* rhs);
  Binary* Div(Expression* lhs, Expression* rhs);
  Binary* Mod(Expression* lhs, Expression* rhs);
  Binary* Concat(Expression* lhs, Expression* rhs);
  Binary* Lt(Expression* lhs, Expression* rhs);
  Binary* Le(Expression* lhs, Expression* rhs);
  Binary* Gt(Expression* lhs, Expression* rhs);
  Binary* Ge(Expression* lhs, Expression* rhs);
  Binary* Eq(Expression* lhs, Expression* rhs);
  Binary* Ne(Expression* lhs, Expression* rhs);
  Binary* In(Expression* lhs, Expression* rhs);
  Binary* NotIn(Expression* lhs, Expression* rhs);
  Binary* Like(Expression* lhs, Expression* rhs);
  Binary* NotLike(Expression* lhs, Expression* rhs);
  Binary* ILike(Expression* lhs, Expression* rhs);
  Binary* NotILike(Expression* lhs, Expression* rhs);
  // expr::type
  Binary* TypeCast(Expression* expr, SqlType* type);

  // Ternary operators.
  Ternary* Between(Expression* expr, Expression* lo, Expression* hi);
  Ternary* NotBetween(Expression* expr, Expression* lo, Expression* hi);

  // Function calls. The name must match [A-Za-z][A-Za-z0-9_.]*; anything else
  // is a programming error and CHECK-fails.
  FunctionCall* Func(std::string_view name,
                     absl::Span<Expression* const> args);
  // A niladic function rendered without parentheses; e.g. CURRENT_DATE.
  FunctionCall* Func0(std::string_view name);

  // Structural expressions.
  sqlgen::Cast* Cast(Expression* expr, SqlType* type);
  sqlgen::Tuple* Tuple(absl::Span<Expression* const> elements);
  CaseExpression* Case(Expression* condition, Expression* result);

  // Statement parts.
  SelectItem* Item(Expression* expr);
  SelectItem* Item(Expression* expr, std::string_view label);
  TableRef* Table(std::string_view name);
  TableRef* Table(std::string_view schema, std::string_view name);
  TableRef* LabeledTable(std::string_view name, std::string_view label);
  TableRef* LabeledTable(std::string_view schema, std::string_view name,
                         std::string_view label);
  LabeledSubquery* Subquery(SelectStatement* select, std::string_view label);
  FromItem* From(TableRef* table);
  FromItem* From(LabeledSubquery* subquery);
  FromItem* From(sqlgen::Join* join);
  sqlgen::Join* Join(FromItem* left, FromItem* right, Expression* on);
  sqlgen::Join* LeftJoin(FromItem* left, FromItem* right, Expression* on);
  sqlgen::Join* RightJoin(FromItem* left, FromItem* right, Expression* on);
  sqlgen::Join* FullJoin(FromItem* left, FromItem* right, Expression* on);

  // Ordering hints.
  OrderByItem* Asc(Expression* expr);
  OrderByItem* Desc(Expression* expr);
  OrderByItem* NullsFirst(OrderByItem* item);
  OrderByItem* NullsLast(OrderByItem* item);

  // SELECT items; at least one item is required.
  SelectStatement* Select(absl::Span<SelectItem* const> items);

 private:
  std::vector<std::unique_ptr<SqlNode>> nodes_;
};

// Renders `node`, which should already be canonical, against a fresh context
// for `dialect`.
absl::StatusOr<RenderedSql> RenderSql(const SqlNode* node,
                                      const Dialect& dialect);

// Rewrites `node` into canonical form and renders the result. A tree deeper
// than the dialect's nesting limit fails with NestingTooDeep before it is
// rewritten.
absl::StatusOr<RenderedSql> RewriteAndRenderSql(SqlNode* node,
                                                const Dialect& dialect);

}  // namespace sqlgen

#endif  // SQLGEN_AST_SQL_AST_H_
