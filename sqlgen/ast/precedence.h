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

// Precedence resolution and the parenthesization rules used when operators are
// nested inside one another.

#ifndef SQLGEN_AST_PRECEDENCE_H_
#define SQLGEN_AST_PRECEDENCE_H_

#include <cstdint>
#include <optional>

#include "absl/status/statusor.h"
#include "sqlgen/ast/operator_kind.h"
#include "sqlgen/ast/render_context.h"

namespace sqlgen {

// Returns the operator's own precedence if it has one, else the context's
// table entry for `kind`. Fails with PrecedenceUndefined when neither exists.
absl::StatusOr<int64_t> ResolvePrecedence(
    OperatorKind kind, std::optional<int64_t> own_precedence,
    const RenderContext& ctx);

// Returns the operator's own associativity if it has one, else the context's
// table entry for `kind`. Fails with AssociativityUndefined when neither
// exists.
absl::StatusOr<Associativity> ResolveAssociativity(
    OperatorKind kind, std::optional<Associativity> own_associativity,
    const RenderContext& ctx);

// Which operand of a binary operator is being considered.
enum class OperandSide : int8_t { kLeft, kRight };

// The operand of a unary operator needs parentheses only when it binds
// strictly looser than the operator.
bool UnaryOperandNeedsParentheses(int64_t precedence,
                                  int64_t operand_precedence);

// Operands of a non-associative binary operator need parentheses when they
// bind no tighter than the operator. Otherwise a looser operand always needs
// them, and an operand of equal precedence needs them only on the side
// opposite the operator's associativity:
//
//   a - b - c        left operand of equal precedence, no parentheses
//   a - (b - c)      right operand of equal precedence, kept
bool BinaryOperandNeedsParentheses(Associativity associativity,
                                   int64_t precedence,
                                   int64_t operand_precedence,
                                   OperandSide side);

// Ternary operators have no associativity to break ties with, so any operand
// that binds no tighter than the operator is parenthesized.
bool TernaryOperandNeedsParentheses(int64_t precedence,
                                    int64_t operand_precedence);

}  // namespace sqlgen

#endif  // SQLGEN_AST_PRECEDENCE_H_
