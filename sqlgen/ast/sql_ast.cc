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
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "absl/cleanup/cleanup.h"
#include "absl/log/check.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_replace.h"
#include "absl/types/span.h"
#include "re2/re2.h"
#include "sqlgen/ast/dialect.h"
#include "sqlgen/ast/errors.h"
#include "sqlgen/ast/operator_kind.h"
#include "sqlgen/ast/precedence.h"
#include "sqlgen/ast/render_context.h"
#include "sqlgen/common/status/status_macros.h"
#include "sqlgen/common/visitor.h"

namespace sqlgen {

namespace {

// Renders a child node one nesting level down.
absl::Status RenderNested(const SqlNode* node, RenderContext* ctx) {
  SQLGEN_RETURN_IF_ERROR(ctx->EnterNested());
  absl::Cleanup exit_nested = [ctx] { ctx->ExitNested(); };
  return node->Render(ctx);
}

absl::Status RenderOperand(const Expression* operand, bool parenthesize,
                           RenderContext* ctx) {
  if (!parenthesize) {
    return RenderNested(operand, ctx);
  }
  ctx->AppendLiteral("(");
  SQLGEN_RETURN_IF_ERROR(RenderNested(operand, ctx));
  ctx->AppendLiteral(")");
  return absl::OkStatus();
}

template <typename T>
absl::Status RenderCommaSeparated(const std::vector<T*>& nodes,
                                  RenderContext* ctx) {
  for (int64_t i = 0; i < nodes.size(); ++i) {
    if (i != 0) {
      ctx->AppendLiteral(",");
    }
    SQLGEN_RETURN_IF_ERROR(RenderNested(nodes[i], ctx));
  }
  return absl::OkStatus();
}

// Rewrites each node; Rewrite() of every node type returns that same type.
template <typename T>
std::vector<T*> RewriteAll(const std::vector<T*>& nodes) {
  std::vector<T*> result;
  result.reserve(nodes.size());
  for (T* node : nodes) {
    result.push_back(node->Rewrite());
  }
  return result;
}

// Returns the resolved precedence of `operand`, or std::nullopt if it is not
// an operator.
absl::StatusOr<std::optional<int64_t>> OperandPrecedence(
    const Expression* operand, const RenderContext& ctx) {
  const Operator* op = operand->AsOperator();
  if (op == nullptr) {
    return std::optional<int64_t>();
  }
  SQLGEN_ASSIGN_OR_RETURN(int64_t precedence, op->ResolvePrecedence(ctx));
  return std::optional<int64_t>(precedence);
}

void CheckFunctionName(std::string_view name) {
  static const LazyRE2 kFunctionName = {R"([A-Za-z][A-Za-z0-9_.]*)"};
  CHECK(RE2::FullMatch(name, *kFunctionName))
      << "Illegal function name: `" << name << "`";
}

template <typename T>
void CheckNoNullElements(absl::Span<T* const> nodes, std::string_view what) {
  for (T* node : nodes) {
    CHECK(node != nullptr) << "Null element in " << what;
  }
}

// Walks the tree under `root` with an explicit stack and fails if any node
// sits deeper than `limit`, counting `root` as depth 1. Depths match the
// nesting levels RenderNested() enters.
absl::Status CheckNestingDepth(const SqlNode* root,
                               std::optional<int64_t> limit) {
  if (!limit.has_value()) {
    return absl::OkStatus();
  }
  std::vector<std::pair<const SqlNode*, int64_t>> worklist = {{root, 1}};
  while (!worklist.empty()) {
    auto [node, depth] = worklist.back();
    worklist.pop_back();
    if (depth > *limit) {
      return NestingTooDeepErrorStatus(*limit);
    }
    for (const SqlNode* child : node->children()) {
      worklist.push_back({child, depth + 1});
    }
  }
  return absl::OkStatus();
}

}  // namespace

Operator* Operator::set_precedence(int64_t precedence) {
  CHECK_GT(precedence, 0) << "Precedence of " << kind()
                          << " must be positive; zero means unset";
  precedence_ = precedence;
  return this;
}

Operator* Operator::set_associativity(Associativity associativity) {
  associativity_ = associativity;
  return this;
}

absl::StatusOr<int64_t> Operator::ResolvePrecedence(
    const RenderContext& ctx) const {
  return sqlgen::ResolvePrecedence(kind_, precedence_, ctx);
}

absl::StatusOr<Associativity> Operator::ResolveAssociativity(
    const RenderContext& ctx) const {
  return sqlgen::ResolveAssociativity(kind_, associativity_, ctx);
}

void Operator::CopyOverridesTo(Operator* other) const {
  other->precedence_ = precedence_;
  other->associativity_ = associativity_;
}

bool Unary::negatable() const {
  return IsLogicalNot() || negated_.has_value();
}

Expression* Unary::Negate() const {
  if (IsLogicalNot()) {
    return arg_;
  }
  CHECK(negated_.has_value()) << "Operator " << kind() << " is not negatable";
  Unary* negated = builder()->Make<Unary>(negated_->kind, negated_->symbol,
                                          arg_, NegatedSymbol{kind(), symbol_});
  CopyOverridesTo(negated);
  return negated;
}

Expression* Unary::Rewrite() {
  // The operand is inspected before it is rewritten: NOT (NOT p) must unwrap
  // through the inner NOT rather than through whatever p rewrites into.
  if (IsLogicalNot()) {
    Operator* op = arg_->AsOperator();
    if (op != nullptr && op->negatable()) {
      VLOG(2) << "Collapsing NOT over " << op->kind();
      return op->Negate()->Rewrite();
    }
  }
  Unary* rewritten =
      builder()->Make<Unary>(kind(), symbol_, arg_->Rewrite(), negated_);
  CopyOverridesTo(rewritten);
  return rewritten;
}

absl::Status Unary::Render(RenderContext* ctx) const {
  SQLGEN_ASSIGN_OR_RETURN(Associativity associativity,
                          ResolveAssociativity(*ctx));
  if (associativity == Associativity::kNonAssociative) {
    return NonAssociativeUnaryErrorStatus(kind());
  }
  SQLGEN_ASSIGN_OR_RETURN(int64_t precedence, ResolvePrecedence(*ctx));
  SQLGEN_ASSIGN_OR_RETURN(std::optional<int64_t> arg_precedence,
                          OperandPrecedence(arg_, *ctx));
  bool parenthesize =
      arg_precedence.has_value() &&
      UnaryOperandNeedsParentheses(precedence, *arg_precedence);
  VLOG(3) << kind() << " operand: parenthesize=" << parenthesize;

  if (associativity == Associativity::kRight) {
    ctx->AppendLiteral(absl::StrCat(symbol_, " "));
  }
  SQLGEN_RETURN_IF_ERROR(RenderOperand(arg_, parenthesize, ctx));
  if (associativity == Associativity::kLeft) {
    ctx->AppendLiteral(absl::StrCat(" ", symbol_));
  }
  return absl::OkStatus();
}

Expression* Binary::Negate() const {
  CHECK(negated_.has_value()) << "Operator " << kind() << " is not negatable";
  Binary* negated = builder()->Make<Binary>(
      negated_->kind, lhs_, negated_->symbol, rhs_,
      NegatedSymbol{kind(), symbol_}, suppress_space_);
  CopyOverridesTo(negated);
  return negated;
}

Expression* Binary::Rewrite() {
  Binary* rewritten =
      builder()->Make<Binary>(kind(), lhs_->Rewrite(), symbol_,
                              rhs_->Rewrite(), negated_, suppress_space_);
  CopyOverridesTo(rewritten);
  return rewritten;
}

absl::Status Binary::Render(RenderContext* ctx) const {
  SQLGEN_ASSIGN_OR_RETURN(Associativity associativity,
                          ResolveAssociativity(*ctx));
  SQLGEN_ASSIGN_OR_RETURN(int64_t precedence, ResolvePrecedence(*ctx));

  auto needs_parentheses = [&](const Expression* operand,
                               OperandSide side) -> absl::StatusOr<bool> {
    SQLGEN_ASSIGN_OR_RETURN(std::optional<int64_t> operand_precedence,
                            OperandPrecedence(operand, *ctx));
    if (!operand_precedence.has_value()) {
      return false;
    }
    bool result = BinaryOperandNeedsParentheses(associativity, precedence,
                                                *operand_precedence, side);
    VLOG(3) << kind() << (side == OperandSide::kLeft ? " lhs" : " rhs")
            << ": precedence " << *operand_precedence << " vs " << precedence
            << " (" << associativity << "), parenthesize=" << result;
    return result;
  };

  SQLGEN_ASSIGN_OR_RETURN(bool lhs_parenthesized,
                          needs_parentheses(lhs_, OperandSide::kLeft));
  SQLGEN_RETURN_IF_ERROR(RenderOperand(lhs_, lhs_parenthesized, ctx));
  if (suppress_space_) {
    ctx->AppendLiteral(symbol_);
  } else {
    ctx->AppendLiteral(absl::StrCat(" ", symbol_, " "));
  }
  SQLGEN_ASSIGN_OR_RETURN(bool rhs_parenthesized,
                          needs_parentheses(rhs_, OperandSide::kRight));
  return RenderOperand(rhs_, rhs_parenthesized, ctx);
}

Expression* Ternary::Negate() const {
  CHECK(negated_.has_value()) << "Operator " << kind() << " is not negatable";
  Ternary* negated = builder()->Make<Ternary>(
      negated_->kind, first_, negated_->symbol1, second_, negated_->symbol2,
      third_, NegatedSymbols{kind(), symbol1_, symbol2_});
  CopyOverridesTo(negated);
  return negated;
}

Expression* Ternary::Rewrite() {
  Ternary* rewritten = builder()->Make<Ternary>(
      kind(), first_->Rewrite(), symbol1_, second_->Rewrite(), symbol2_,
      third_->Rewrite(), negated_);
  CopyOverridesTo(rewritten);
  return rewritten;
}

absl::Status Ternary::Render(RenderContext* ctx) const {
  SQLGEN_ASSIGN_OR_RETURN(int64_t precedence, ResolvePrecedence(*ctx));

  auto render_operand = [&](const Expression* operand) -> absl::Status {
    SQLGEN_ASSIGN_OR_RETURN(std::optional<int64_t> operand_precedence,
                            OperandPrecedence(operand, *ctx));
    bool parenthesize =
        operand_precedence.has_value() &&
        TernaryOperandNeedsParentheses(precedence, *operand_precedence);
    if (operand_precedence.has_value()) {
      VLOG(3) << kind() << " operand: precedence " << *operand_precedence
              << " vs " << precedence << ", parenthesize=" << parenthesize;
    }
    return RenderOperand(operand, parenthesize, ctx);
  };

  SQLGEN_RETURN_IF_ERROR(render_operand(first_));
  ctx->AppendLiteral(absl::StrCat(" ", symbol1_, " "));
  SQLGEN_RETURN_IF_ERROR(render_operand(second_));
  ctx->AppendLiteral(absl::StrCat(" ", symbol2_, " "));
  return render_operand(third_);
}

absl::Status Literal::Render(RenderContext* ctx) const {
  ctx->AppendLiteral(text_);
  return absl::OkStatus();
}

absl::Status SqlType::Render(RenderContext* ctx) const {
  ctx->AppendLiteral(name_);
  return absl::OkStatus();
}

absl::Status Column::Render(RenderContext* ctx) const {
  if (table_.has_value()) {
    ctx->AppendIdentifier(*table_);
    ctx->AppendLiteral(".");
  }
  ctx->AppendIdentifier(name_);
  return absl::OkStatus();
}

absl::Status Placeholder::Render(RenderContext* ctx) const {
  int64_t position = ctx->BindPlaceholder(name_);
  ctx->AppendLiteral(ctx->RenderPlaceholder(name_, position));
  return absl::OkStatus();
}

FunctionCall::FunctionCall(std::string_view name,
                           absl::Span<Expression* const> args,
                           bool omit_parentheses, SqlBuilder* builder)
    : Expression(builder),
      name_(name),
      args_(args.begin(), args.end()),
      omit_parentheses_(omit_parentheses) {
  CheckNoNullElements(args, "function arguments");
}

Expression* FunctionCall::Rewrite() {
  return builder()->Make<FunctionCall>(name_, RewriteAll(args_),
                                       omit_parentheses_);
}

absl::Status FunctionCall::Render(RenderContext* ctx) const {
  ctx->AppendLiteral(name_);
  if (args_.empty()) {
    if (!omit_parentheses_) {
      ctx->AppendLiteral("()");
    }
    return absl::OkStatus();
  }
  ctx->AppendLiteral("(");
  SQLGEN_RETURN_IF_ERROR(RenderCommaSeparated(args_, ctx));
  ctx->AppendLiteral(")");
  return absl::OkStatus();
}

Expression* Cast::Rewrite() {
  return builder()->Make<sqlgen::Cast>(expr_->Rewrite(), type_->Rewrite());
}

absl::Status Cast::Render(RenderContext* ctx) const {
  ctx->AppendLiteral("CAST(");
  SQLGEN_RETURN_IF_ERROR(RenderNested(expr_, ctx));
  ctx->AppendLiteral(" AS ");
  SQLGEN_RETURN_IF_ERROR(RenderNested(type_, ctx));
  ctx->AppendLiteral(")");
  return absl::OkStatus();
}

Tuple::Tuple(absl::Span<Expression* const> elements, SqlBuilder* builder)
    : Expression(builder), elements_(elements.begin(), elements.end()) {
  CHECK(!elements_.empty()) << "A tuple needs at least one element";
  CheckNoNullElements(elements, "tuple");
}

Expression* Tuple::Rewrite() {
  return builder()->Make<sqlgen::Tuple>(RewriteAll(elements_));
}

absl::Status Tuple::Render(RenderContext* ctx) const {
  ctx->AppendLiteral("(");
  SQLGEN_RETURN_IF_ERROR(RenderCommaSeparated(elements_, ctx));
  ctx->AppendLiteral(")");
  return absl::OkStatus();
}

CaseExpression::CaseExpression(Expression* condition, Expression* result,
                               SqlBuilder* builder)
    : Expression(builder) {
  When(condition, result);
}

CaseExpression* CaseExpression::When(Expression* condition,
                                     Expression* result) {
  arms_.push_back(Arm{ABSL_DIE_IF_NULL(condition), ABSL_DIE_IF_NULL(result)});
  return this;
}

CaseExpression* CaseExpression::Else(Expression* result) {
  else_ = ABSL_DIE_IF_NULL(result);
  return this;
}

Expression* CaseExpression::Rewrite() {
  CaseExpression* rewritten = builder()->Make<CaseExpression>(
      arms_.front().condition->Rewrite(), arms_.front().result->Rewrite());
  for (int64_t i = 1; i < arms_.size(); ++i) {
    rewritten->When(arms_[i].condition->Rewrite(), arms_[i].result->Rewrite());
  }
  if (else_ != nullptr) {
    rewritten->Else(else_->Rewrite());
  }
  return rewritten;
}

std::vector<SqlNode*> CaseExpression::children() const {
  std::vector<SqlNode*> result;
  for (const Arm& arm : arms_) {
    result.push_back(arm.condition);
    result.push_back(arm.result);
  }
  if (else_ != nullptr) {
    result.push_back(else_);
  }
  return result;
}

absl::Status CaseExpression::Render(RenderContext* ctx) const {
  ctx->AppendLiteral("CASE");
  for (const Arm& arm : arms_) {
    ctx->AppendLiteral(" WHEN ");
    SQLGEN_RETURN_IF_ERROR(RenderNested(arm.condition, ctx));
    ctx->AppendLiteral(" THEN ");
    SQLGEN_RETURN_IF_ERROR(RenderNested(arm.result, ctx));
  }
  if (else_ != nullptr) {
    ctx->AppendLiteral(" ELSE ");
    SQLGEN_RETURN_IF_ERROR(RenderNested(else_, ctx));
  }
  ctx->AppendLiteral(" END");
  return absl::OkStatus();
}

SelectItem* SelectItem::Rewrite() {
  return builder()->Make<SelectItem>(expr_->Rewrite(), label_);
}

absl::Status SelectItem::Render(RenderContext* ctx) const {
  SQLGEN_RETURN_IF_ERROR(RenderNested(expr_, ctx));
  if (label_.has_value()) {
    ctx->AppendLiteral(" ");
    ctx->AppendIdentifier(*label_);
  }
  return absl::OkStatus();
}

absl::Status TableRef::Render(RenderContext* ctx) const {
  if (schema_.has_value()) {
    ctx->AppendIdentifier(*schema_);
    ctx->AppendLiteral(".");
  }
  ctx->AppendIdentifier(name_);
  if (label_.has_value()) {
    ctx->AppendLiteral(" ");
    ctx->AppendIdentifier(*label_);
  }
  return absl::OkStatus();
}

LabeledSubquery* LabeledSubquery::Rewrite() {
  return builder()->Make<LabeledSubquery>(select_->Rewrite(), label_);
}

std::vector<SqlNode*> LabeledSubquery::children() const { return {select_}; }

absl::Status LabeledSubquery::Render(RenderContext* ctx) const {
  ctx->AppendLiteral("(");
  SQLGEN_RETURN_IF_ERROR(RenderNested(select_, ctx));
  ctx->AppendLiteral(") ");
  ctx->AppendIdentifier(label_);
  return absl::OkStatus();
}

std::string_view JoinKindToString(JoinKind kind) {
  switch (kind) {
    case JoinKind::kInner:
      return "JOIN";
    case JoinKind::kLeft:
      return "LEFT JOIN";
    case JoinKind::kRight:
      return "RIGHT JOIN";
    case JoinKind::kFull:
      return "FULL JOIN";
  }
  LOG(FATAL) << "Invalid join kind: " << static_cast<int>(kind);
}

Join* Join::Rewrite() {
  return builder()->Make<sqlgen::Join>(kind_, left_->Rewrite(),
                                       right_->Rewrite(), on_->Rewrite());
}

std::vector<SqlNode*> Join::children() const { return {left_, right_, on_}; }

absl::Status Join::Render(RenderContext* ctx) const {
  SQLGEN_RETURN_IF_ERROR(RenderNested(left_, ctx));
  ctx->AppendLiteral(absl::StrCat(" ", JoinKindToString(kind_), " "));
  SQLGEN_RETURN_IF_ERROR(RenderNested(right_, ctx));
  ctx->AppendLiteral(" ON ");
  return RenderNested(on_, ctx);
}

FromItem* FromItem::Rewrite() {
  Alternative rewritten = std::visit(
      Visitor{
          [](std::monostate) -> Alternative { return std::monostate(); },
          [](TableRef* table) -> Alternative { return table->Rewrite(); },
          [](LabeledSubquery* subquery) -> Alternative {
            return subquery->Rewrite();
          },
          [](sqlgen::Join* join) -> Alternative { return join->Rewrite(); },
      },
      alternative_);
  return builder()->Make<FromItem>(rewritten);
}

std::vector<SqlNode*> FromItem::children() const {
  return std::visit(
      Visitor{
          [](std::monostate) { return std::vector<SqlNode*>(); },
          [](SqlNode* node) { return std::vector<SqlNode*>{node}; },
      },
      alternative_);
}

absl::Status FromItem::Render(RenderContext* ctx) const {
  return std::visit(
      Visitor{
          [](std::monostate) -> absl::Status {
            return UnknownStructuralVariantErrorStatus("FROM item");
          },
          [ctx](const SqlNode* node) -> absl::Status {
            return RenderNested(node, ctx);
          },
      },
      alternative_);
}

FromClause* FromClause::Rewrite() {
  return builder()->Make<FromClause>(item_->Rewrite());
}

std::vector<SqlNode*> FromClause::children() const { return {item_}; }

absl::Status FromClause::Render(RenderContext* ctx) const {
  ctx->AppendLiteral("FROM ");
  return RenderNested(item_, ctx);
}

WhereClause* WhereClause::Rewrite() {
  return builder()->Make<WhereClause>(condition_->Rewrite());
}

absl::Status WhereClause::Render(RenderContext* ctx) const {
  ctx->AppendLiteral("WHERE ");
  return RenderNested(condition_, ctx);
}

GroupByClause::GroupByClause(absl::Span<Expression* const> exprs,
                             SqlBuilder* builder)
    : SqlNode(builder), exprs_(exprs.begin(), exprs.end()) {
  CHECK(!exprs_.empty()) << "GROUP BY needs at least one expression";
  CheckNoNullElements(exprs, "GROUP BY");
}

GroupByClause* GroupByClause::Rewrite() {
  return builder()->Make<GroupByClause>(RewriteAll(exprs_));
}

absl::Status GroupByClause::Render(RenderContext* ctx) const {
  ctx->AppendLiteral("GROUP BY ");
  return RenderCommaSeparated(exprs_, ctx);
}

HavingClause* HavingClause::Rewrite() {
  return builder()->Make<HavingClause>(condition_->Rewrite());
}

absl::Status HavingClause::Render(RenderContext* ctx) const {
  ctx->AppendLiteral("HAVING ");
  return RenderNested(condition_, ctx);
}

OrderByItem* OrderByItem::Rewrite() {
  return builder()->Make<OrderByItem>(expr_->Rewrite(), direction_, nulls_);
}

absl::Status OrderByItem::Render(RenderContext* ctx) const {
  SQLGEN_RETURN_IF_ERROR(RenderNested(expr_, ctx));
  bool descending = direction_ == SortDirection::kDescending;
  if (descending) {
    ctx->AppendLiteral(" DESC");
  }
  if (nulls_.has_value()) {
    if (descending && *nulls_ == NullsOrder::kLast) {
      ctx->AppendLiteral(" NULLS LAST");
    }
    if (!descending && *nulls_ == NullsOrder::kFirst) {
      ctx->AppendLiteral(" NULLS FIRST");
    }
  }
  return absl::OkStatus();
}

OrderByClause::OrderByClause(absl::Span<OrderByItem* const> items,
                             SqlBuilder* builder)
    : SqlNode(builder), items_(items.begin(), items.end()) {
  CHECK(!items_.empty()) << "ORDER BY needs at least one item";
  CheckNoNullElements(items, "ORDER BY");
}

OrderByClause* OrderByClause::Rewrite() {
  return builder()->Make<OrderByClause>(RewriteAll(items_));
}

absl::Status OrderByClause::Render(RenderContext* ctx) const {
  ctx->AppendLiteral("ORDER BY ");
  return RenderCommaSeparated(items_, ctx);
}

LimitClause* LimitClause::Rewrite() {
  return builder()->Make<LimitClause>(count_->Rewrite());
}

absl::Status LimitClause::Render(RenderContext* ctx) const {
  ctx->AppendLiteral("LIMIT ");
  return RenderNested(count_, ctx);
}

OffsetClause* OffsetClause::Rewrite() {
  return builder()->Make<OffsetClause>(count_->Rewrite());
}

absl::Status OffsetClause::Render(RenderContext* ctx) const {
  ctx->AppendLiteral("OFFSET ");
  return RenderNested(count_, ctx);
}

SelectStatement::SelectStatement(absl::Span<SelectItem* const> items,
                                 SqlBuilder* builder)
    : SqlNode(builder), items_(items.begin(), items.end()) {
  CHECK(!items_.empty()) << "SELECT needs at least one item";
  CheckNoNullElements(items, "SELECT list");
}

SelectStatement* SelectStatement::From(FromItem* item) {
  from_ = builder()->Make<FromClause>(item);
  return this;
}

SelectStatement* SelectStatement::Where(Expression* condition) {
  where_ = builder()->Make<WhereClause>(condition);
  return this;
}

SelectStatement* SelectStatement::GroupBy(
    absl::Span<Expression* const> exprs) {
  group_by_ = builder()->Make<GroupByClause>(exprs);
  return this;
}

SelectStatement* SelectStatement::Having(Expression* condition) {
  having_ = builder()->Make<HavingClause>(condition);
  return this;
}

SelectStatement* SelectStatement::OrderBy(
    absl::Span<OrderByItem* const> items) {
  order_by_ = builder()->Make<OrderByClause>(items);
  return this;
}

SelectStatement* SelectStatement::Limit(Expression* count) {
  limit_ = builder()->Make<LimitClause>(count);
  return this;
}

SelectStatement* SelectStatement::Offset(Expression* count) {
  offset_ = builder()->Make<OffsetClause>(count);
  return this;
}

SelectStatement* SelectStatement::Rewrite() {
  SelectStatement* rewritten =
      builder()->Make<SelectStatement>(RewriteAll(items_));
  auto rewrite_clause = [](auto* clause) -> decltype(clause) {
    return clause == nullptr ? nullptr : clause->Rewrite();
  };
  rewritten->from_ = rewrite_clause(from_);
  rewritten->where_ = rewrite_clause(where_);
  rewritten->group_by_ = rewrite_clause(group_by_);
  rewritten->having_ = rewrite_clause(having_);
  rewritten->order_by_ = rewrite_clause(order_by_);
  rewritten->limit_ = rewrite_clause(limit_);
  rewritten->offset_ = rewrite_clause(offset_);
  return rewritten;
}

std::vector<SqlNode*> SelectStatement::children() const {
  std::vector<SqlNode*> result(items_.begin(), items_.end());
  for (SqlNode* clause : std::vector<SqlNode*>{
           from_, where_, group_by_, having_, order_by_, limit_, offset_}) {
    if (clause != nullptr) {
      result.push_back(clause);
    }
  }
  return result;
}

absl::Status SelectStatement::Render(RenderContext* ctx) const {
  ctx->AppendLiteral("SELECT ");
  SQLGEN_RETURN_IF_ERROR(RenderCommaSeparated(items_, ctx));
  for (const SqlNode* clause :
       std::vector<const SqlNode*>{from_, where_, group_by_, having_,
                                   order_by_, limit_, offset_}) {
    if (clause == nullptr) {
      continue;
    }
    ctx->AppendLiteral(" ");
    SQLGEN_RETURN_IF_ERROR(RenderNested(clause, ctx));
  }
  return absl::OkStatus();
}

Literal* SqlBuilder::Int(int64_t value) {
  return Make<Literal>(absl::StrCat(value));
}

Literal* SqlBuilder::Double(double value) {
  CHECK(std::isfinite(value)) << "Non-finite double " << value
                              << " has no SQL literal; use Verbatim()";
  return Make<Literal>(absl::StrFormat("%.17g", value));
}

Literal* SqlBuilder::String(std::string_view value) {
  return Make<Literal>(
      absl::StrCat("'", absl::StrReplaceAll(value, {{"'", "''"}}), "'"));
}

Literal* SqlBuilder::Bool(bool value) {
  return Make<Literal>(value ? "TRUE" : "FALSE");
}

Literal* SqlBuilder::Null() { return Make<Literal>("NULL"); }

Literal* SqlBuilder::Verbatim(std::string_view text) {
  return Make<Literal>(text);
}

sqlgen::Column* SqlBuilder::Column(std::string_view name) {
  return Make<sqlgen::Column>(std::nullopt, name);
}

sqlgen::Column* SqlBuilder::Column(std::string_view table,
                                   std::string_view name) {
  return Make<sqlgen::Column>(std::string(table), name);
}

sqlgen::Placeholder* SqlBuilder::Placeholder(std::string_view name) {
  return Make<sqlgen::Placeholder>(name);
}

SqlType* SqlBuilder::DecimalType(int64_t precision, int64_t scale) {
  return Make<SqlType>(absl::StrFormat("DECIMAL(%d,%d)", precision, scale));
}

Unary* SqlBuilder::Not(Expression* arg) {
  return Make<Unary>(OperatorKind::kNot, "NOT", arg, std::nullopt);
}

Unary* SqlBuilder::Negate(Expression* arg) {
  return Make<Unary>(OperatorKind::kNegate, "-", arg, std::nullopt);
}

Unary* SqlBuilder::IsNull(Expression* arg) {
  return Make<Unary>(OperatorKind::kIsNull, "IS NULL", arg,
                     NegatedSymbol{OperatorKind::kIsNotNull, "IS NOT NULL"});
}

Unary* SqlBuilder::IsNotNull(Expression* arg) {
  return Make<Unary>(OperatorKind::kIsNotNull, "IS NOT NULL", arg,
                     NegatedSymbol{OperatorKind::kIsNull, "IS NULL"});
}

Unary* SqlBuilder::IsTrue(Expression* arg) {
  return Make<Unary>(OperatorKind::kIsTrue, "IS TRUE", arg,
                     NegatedSymbol{OperatorKind::kIsNotTrue, "IS NOT TRUE"});
}

Unary* SqlBuilder::IsNotTrue(Expression* arg) {
  return Make<Unary>(OperatorKind::kIsNotTrue, "IS NOT TRUE", arg,
                     NegatedSymbol{OperatorKind::kIsTrue, "IS TRUE"});
}

Unary* SqlBuilder::IsFalse(Expression* arg) {
  return Make<Unary>(OperatorKind::kIsFalse, "IS FALSE", arg,
                     NegatedSymbol{OperatorKind::kIsNotFalse, "IS NOT FALSE"});
}

Unary* SqlBuilder::IsNotFalse(Expression* arg) {
  return Make<Unary>(OperatorKind::kIsNotFalse, "IS NOT FALSE", arg,
                     NegatedSymbol{OperatorKind::kIsFalse, "IS FALSE"});
}

Binary* SqlBuilder::And(Expression* lhs, Expression* rhs) {
  return Make<Binary>(OperatorKind::kAnd, lhs, "AND", rhs, std::nullopt,
                      /*suppress_space=*/false);
}

Binary* SqlBuilder::Or(Expression* lhs, Expression* rhs) {
  return Make<Binary>(OperatorKind::kOr, lhs, "OR", rhs, std::nullopt,
                      /*suppress_space=*/false);
}

Binary* SqlBuilder::Add(Expression* lhs, Expression* rhs) {
  return Make<Binary>(OperatorKind::kAdd, lhs, "+", rhs, std::nullopt,
                      /*suppress_space=*/false);
}

Binary* SqlBuilder::Sub(Expression* lhs, Expression* rhs) {
  return Make<Binary>(OperatorKind::kSub, lhs, "-", rhs, std::nullopt,
                      /*suppress_space=*/false);
}

Binary* SqlBuilder::Mul(Expression* lhs, Expression* rhs) {
  return Make<Binary>(OperatorKind::kMul, lhs, "*", rhs, std::nullopt,
                      /*suppress_space=*/false);
}

Binary* SqlBuilder::Div(Expression* lhs, Expression* rhs) {
  return Make<Binary>(OperatorKind::kDiv, lhs, "/", rhs, std::nullopt,
                      /*suppress_space=*/false);
}

Binary* SqlBuilder::Mod(Expression* lhs, Expression* rhs) {
  return Make<Binary>(OperatorKind::kMod, lhs, "%", rhs, std::nullopt,
                      /*suppress_space=*/false);
}

Binary* SqlBuilder::Concat(Expression* lhs, Expression* rhs) {
  return Make<Binary>(OperatorKind::kConcat, lhs, "||", rhs, std::nullopt,
                      /*suppress_space=*/false);
}

Binary* SqlBuilder::Lt(Expression* lhs, Expression* rhs) {
  return Make<Binary>(OperatorKind::kLt, lhs, "<", rhs, std::nullopt,
                      /*suppress_space=*/false);
}

Binary* SqlBuilder::Le(Expression* lhs, Expression* rhs) {
  return Make<Binary>(OperatorKind::kLe, lhs, "<=", rhs, std::nullopt,
                      /*suppress_space=*/false);
}

Binary* SqlBuilder::Gt(Expression* lhs, Expression* rhs) {
  return Make<Binary>(OperatorKind::kGt, lhs, ">", rhs, std::nullopt,
                      /*suppress_space=*/false);
}

Binary* SqlBuilder::Ge(Expression* lhs, Expression* rhs) {
  return Make<Binary>(OperatorKind::kGe, lhs, ">=", rhs, std::nullopt,
                      /*suppress_space=*/false);
}

Binary* SqlBuilder::Eq(Expression* lhs, Expression* rhs) {
  return Make<Binary>(OperatorKind::kEq, lhs, "=", rhs,
                      NegatedSymbol{OperatorKind::kNe, "<>"},
                      /*suppress_space=*/false);
}

Binary* SqlBuilder::Ne(Expression* lhs, Expression* rhs) {
  return Make<Binary>(OperatorKind::kNe, lhs, "<>", rhs,
                      NegatedSymbol{OperatorKind::kEq, "="},
                      /*suppress_space=*/false);
}

Binary* SqlBuilder::In(Expression* lhs, Expression* rhs) {
  return Make<Binary>(OperatorKind::kIn, lhs, "IN", rhs,
                      NegatedSymbol{OperatorKind::kNotIn, "NOT IN"},
                      /*suppress_space=*/false);
}

Binary* SqlBuilder::NotIn(Expression* lhs, Expression* rhs) {
  return Make<Binary>(OperatorKind::kNotIn, lhs, "NOT IN", rhs,
                      NegatedSymbol{OperatorKind::kIn, "IN"},
                      /*suppress_space=*/false);
}

Binary* SqlBuilder::Like(Expression* lhs, Expression* rhs) {
  return Make<Binary>(OperatorKind::kLike, lhs, "LIKE", rhs,
                      NegatedSymbol{OperatorKind::kNotLike, "NOT LIKE"},
                      /*suppress_space=*/false);
}

Binary* SqlBuilder::NotLike(Expression* lhs, Expression* rhs) {
  return Make<Binary>(OperatorKind::kNotLike, lhs, "NOT LIKE", rhs,
                      NegatedSymbol{OperatorKind::kLike, "LIKE"},
                      /*suppress_space=*/false);
}

Binary* SqlBuilder::ILike(Expression* lhs, Expression* rhs) {
  return Make<Binary>(OperatorKind::kILike, lhs, "ILIKE", rhs,
                      NegatedSymbol{OperatorKind::kNotILike, "NOT ILIKE"},
                      /*suppress_space=*/false);
}

Binary* SqlBuilder::NotILike(Expression* lhs, Expression* rhs) {
  return Make<Binary>(OperatorKind::kNotILike, lhs, "NOT ILIKE", rhs,
                      NegatedSymbol{OperatorKind::kILike, "ILIKE"},
                      /*suppress_space=*/false);
}

Binary* SqlBuilder::TypeCast(Expression* expr, SqlType* type) {
  return Make<Binary>(OperatorKind::kTypeCast, expr, "::", type, std::nullopt,
                      /*suppress_space=*/true);
}

Ternary* SqlBuilder::Between(Expression* expr, Expression* lo,
                             Expression* hi) {
  return Make<Ternary>(
      OperatorKind::kBetween, expr, "BETWEEN", lo, "AND", hi,
      NegatedSymbols{OperatorKind::kNotBetween, "NOT BETWEEN", "AND"});
}

Ternary* SqlBuilder::NotBetween(Expression* expr, Expression* lo,
                                Expression* hi) {
  return Make<Ternary>(OperatorKind::kNotBetween, expr, "NOT BETWEEN", lo,
                       "AND", hi,
                       NegatedSymbols{OperatorKind::kBetween, "BETWEEN", "AND"});
}

FunctionCall* SqlBuilder::Func(std::string_view name,
                               absl::Span<Expression* const> args) {
  CheckFunctionName(name);
  return Make<FunctionCall>(name, args, /*omit_parentheses=*/false);
}

FunctionCall* SqlBuilder::Func0(std::string_view name) {
  CheckFunctionName(name);
  return Make<FunctionCall>(name, absl::Span<Expression* const>(),
                            /*omit_parentheses=*/true);
}

sqlgen::Cast* SqlBuilder::Cast(Expression* expr, SqlType* type) {
  return Make<sqlgen::Cast>(expr, type);
}

sqlgen::Tuple* SqlBuilder::Tuple(absl::Span<Expression* const> elements) {
  return Make<sqlgen::Tuple>(elements);
}

CaseExpression* SqlBuilder::Case(Expression* condition, Expression* result) {
  return Make<CaseExpression>(condition, result);
}

SelectItem* SqlBuilder::Item(Expression* expr) {
  return Make<SelectItem>(expr, std::nullopt);
}

SelectItem* SqlBuilder::Item(Expression* expr, std::string_view label) {
  return Make<SelectItem>(expr, std::string(label));
}

TableRef* SqlBuilder::Table(std::string_view name) {
  return Make<TableRef>(std::nullopt, name, std::nullopt);
}

TableRef* SqlBuilder::Table(std::string_view schema, std::string_view name) {
  return Make<TableRef>(std::string(schema), name, std::nullopt);
}

TableRef* SqlBuilder::LabeledTable(std::string_view name,
                                   std::string_view label) {
  return Make<TableRef>(std::nullopt, name, std::string(label));
}

TableRef* SqlBuilder::LabeledTable(std::string_view schema,
                                   std::string_view name,
                                   std::string_view label) {
  return Make<TableRef>(std::string(schema), name, std::string(label));
}

LabeledSubquery* SqlBuilder::Subquery(SelectStatement* select,
                                      std::string_view label) {
  return Make<LabeledSubquery>(select, label);
}

FromItem* SqlBuilder::From(TableRef* table) {
  return Make<FromItem>(ABSL_DIE_IF_NULL(table));
}

FromItem* SqlBuilder::From(LabeledSubquery* subquery) {
  return Make<FromItem>(ABSL_DIE_IF_NULL(subquery));
}

FromItem* SqlBuilder::From(sqlgen::Join* join) {
  return Make<FromItem>(ABSL_DIE_IF_NULL(join));
}

sqlgen::Join* SqlBuilder::Join(FromItem* left, FromItem* right,
                               Expression* on) {
  return Make<sqlgen::Join>(JoinKind::kInner, left, right, on);
}

sqlgen::Join* SqlBuilder::LeftJoin(FromItem* left, FromItem* right,
                                   Expression* on) {
  return Make<sqlgen::Join>(JoinKind::kLeft, left, right, on);
}

sqlgen::Join* SqlBuilder::RightJoin(FromItem* left, FromItem* right,
                                    Expression* on) {
  return Make<sqlgen::Join>(JoinKind::kRight, left, right, on);
}

sqlgen::Join* SqlBuilder::FullJoin(FromItem* left, FromItem* right,
                                   Expression* on) {
  return Make<sqlgen::Join>(JoinKind::kFull, left, right, on);
}

OrderByItem* SqlBuilder::Asc(Expression* expr) {
  return Make<OrderByItem>(expr, SortDirection::kAscending, std::nullopt);
}

OrderByItem* SqlBuilder::Desc(Expression* expr) {
  return Make<OrderByItem>(expr, SortDirection::kDescending, std::nullopt);
}

OrderByItem* SqlBuilder::NullsFirst(OrderByItem* item) {
  return Make<OrderByItem>(item->expr(), item->direction(), NullsOrder::kFirst);
}

OrderByItem* SqlBuilder::NullsLast(OrderByItem* item) {
  return Make<OrderByItem>(item->expr(), item->direction(), NullsOrder::kLast);
}

SelectStatement* SqlBuilder::Select(absl::Span<SelectItem* const> items) {
  return Make<SelectStatement>(items);
}

absl::StatusOr<RenderedSql> RenderSql(const SqlNode* node,
                                      const Dialect& dialect) {
  RenderContext ctx(dialect);
  SQLGEN_RETURN_IF_ERROR(RenderNested(node, &ctx));
  return std::move(ctx).Finish();
}

absl::StatusOr<RenderedSql> RewriteAndRenderSql(SqlNode* node,
                                                const Dialect& dialect) {
  // Rewrite() recurses, so deep trees are rejected before it runs.
  SQLGEN_RETURN_IF_ERROR(
      CheckNestingDepth(node, dialect.max_nesting_depth()));
  return RenderSql(node->Rewrite(), dialect);
}

}  // namespace sqlgen
