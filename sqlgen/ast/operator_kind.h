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

#ifndef SQLGEN_AST_OPERATOR_KIND_H_
#define SQLGEN_AST_OPERATOR_KIND_H_

#include <cstdint>
#include <ostream>
#include <string_view>

namespace sqlgen {

// Identifies an operator independently of the symbol it is spelled with. The
// dialect's precedence and associativity tables are keyed by this value.
enum class OperatorKind : int8_t {
  kTypeCast,
  kNegate,
  kMul,
  kDiv,
  kMod,
  kAdd,
  kSub,
  kConcat,
  kIsNull,
  kIsNotNull,
  kIsTrue,
  kIsNotTrue,
  kIsFalse,
  kIsNotFalse,
  kIn,
  kNotIn,
  kBetween,
  kNotBetween,
  kLike,
  kNotLike,
  kILike,
  kNotILike,
  kLt,
  kLe,
  kGt,
  kGe,
  kEq,
  kNe,
  kNot,
  kAnd,
  kOr,
};

// All operator kinds, in declaration order.
inline constexpr OperatorKind kAllOperatorKinds[] = {
    OperatorKind::kTypeCast,   OperatorKind::kNegate,
    OperatorKind::kMul,        OperatorKind::kDiv,
    OperatorKind::kMod,        OperatorKind::kAdd,
    OperatorKind::kSub,        OperatorKind::kConcat,
    OperatorKind::kIsNull,     OperatorKind::kIsNotNull,
    OperatorKind::kIsTrue,     OperatorKind::kIsNotTrue,
    OperatorKind::kIsFalse,    OperatorKind::kIsNotFalse,
    OperatorKind::kIn,         OperatorKind::kNotIn,
    OperatorKind::kBetween,    OperatorKind::kNotBetween,
    OperatorKind::kLike,       OperatorKind::kNotLike,
    OperatorKind::kILike,      OperatorKind::kNotILike,
    OperatorKind::kLt,         OperatorKind::kLe,
    OperatorKind::kGt,         OperatorKind::kGe,
    OperatorKind::kEq,         OperatorKind::kNe,
    OperatorKind::kNot,        OperatorKind::kAnd,
    OperatorKind::kOr,
};

std::string_view OperatorKindToString(OperatorKind kind);

inline std::ostream& operator<<(std::ostream& os, OperatorKind kind) {
  os << OperatorKindToString(kind);
  return os;
}

// Governs how operators of equal precedence group. For unary operators the
// associativity also selects the placement of the symbol: right-associative
// operators are prefix ("NOT x"), left-associative ones are suffix
// ("x IS NULL").
enum class Associativity : int8_t {
  kLeft,
  kRight,
  kNonAssociative,
};

std::string_view AssociativityToString(Associativity associativity);

inline std::ostream& operator<<(std::ostream& os, Associativity a) {
  os << AssociativityToString(a);
  return os;
}

}  // namespace sqlgen

#endif  // SQLGEN_AST_OPERATOR_KIND_H_
