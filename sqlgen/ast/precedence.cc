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

#include "sqlgen/ast/precedence.h"

#include <cstdint>
#include <optional>

#include "absl/log/check.h"
#include "absl/status/statusor.h"
#include "sqlgen/ast/errors.h"
#include "sqlgen/ast/operator_kind.h"
#include "sqlgen/ast/render_context.h"

namespace sqlgen {

absl::StatusOr<int64_t> ResolvePrecedence(
    OperatorKind kind, std::optional<int64_t> own_precedence,
    const RenderContext& ctx) {
  if (own_precedence.has_value()) {
    DCHECK_GT(*own_precedence, 0);
    return *own_precedence;
  }
  std::optional<int64_t> precedence = ctx.PrecedenceFor(kind);
  if (precedence.has_value()) {
    DCHECK_GT(*precedence, 0);
    return *precedence;
  }
  return PrecedenceUndefinedErrorStatus(kind);
}

absl::StatusOr<Associativity> ResolveAssociativity(
    OperatorKind kind, std::optional<Associativity> own_associativity,
    const RenderContext& ctx) {
  if (own_associativity.has_value()) {
    return *own_associativity;
  }
  std::optional<Associativity> associativity = ctx.AssociativityFor(kind);
  if (associativity.has_value()) {
    return *associativity;
  }
  return AssociativityUndefinedErrorStatus(kind);
}

bool UnaryOperandNeedsParentheses(int64_t precedence,
                                  int64_t operand_precedence) {
  return operand_precedence < precedence;
}

bool BinaryOperandNeedsParentheses(Associativity associativity,
                                   int64_t precedence,
                                   int64_t operand_precedence,
                                   OperandSide side) {
  if (associativity == Associativity::kNonAssociative) {
    return operand_precedence <= precedence;
  }
  if (operand_precedence != precedence) {
    return operand_precedence < precedence;
  }
  // Equal precedence: a left-associative operator keeps parentheses on its
  // right operand and vice versa.
  Associativity opposite = side == OperandSide::kLeft ? Associativity::kRight
                                                      : Associativity::kLeft;
  return associativity == opposite;
}

bool TernaryOperandNeedsParentheses(int64_t precedence,
                                    int64_t operand_precedence) {
  return operand_precedence <= precedence;
}

}  // namespace sqlgen
