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

#include "sqlgen/ast/operator_kind.h"

#include <string_view>

#include "absl/log/log.h"

namespace sqlgen {

std::string_view OperatorKindToString(OperatorKind kind) {
  switch (kind) {
    case OperatorKind::kTypeCast:
      return "type_cast";
    case OperatorKind::kNegate:
      return "negate";
    case OperatorKind::kMul:
      return "mul";
    case OperatorKind::kDiv:
      return "div";
    case OperatorKind::kMod:
      return "mod";
    case OperatorKind::kAdd:
      return "add";
    case OperatorKind::kSub:
      return "sub";
    case OperatorKind::kConcat:
      return "concat";
    case OperatorKind::kIsNull:
      return "is_null";
    case OperatorKind::kIsNotNull:
      return "is_not_null";
    case OperatorKind::kIsTrue:
      return "is_true";
    case OperatorKind::kIsNotTrue:
      return "is_not_true";
    case OperatorKind::kIsFalse:
      return "is_false";
    case OperatorKind::kIsNotFalse:
      return "is_not_false";
    case OperatorKind::kIn:
      return "in";
    case OperatorKind::kNotIn:
      return "not_in";
    case OperatorKind::kBetween:
      return "between";
    case OperatorKind::kNotBetween:
      return "not_between";
    case OperatorKind::kLike:
      return "like";
    case OperatorKind::kNotLike:
      return "not_like";
    case OperatorKind::kILike:
      return "ilike";
    case OperatorKind::kNotILike:
      return "not_ilike";
    case OperatorKind::kLt:
      return "lt";
    case OperatorKind::kLe:
      return "le";
    case OperatorKind::kGt:
      return "gt";
    case OperatorKind::kGe:
      return "ge";
    case OperatorKind::kEq:
      return "eq";
    case OperatorKind::kNe:
      return "ne";
    case OperatorKind::kNot:
      return "not";
    case OperatorKind::kAnd:
      return "and";
    case OperatorKind::kOr:
      return "or";
  }
  LOG(FATAL) << "Invalid operator kind: " << static_cast<int>(kind);
}

std::string_view AssociativityToString(Associativity associativity) {
  switch (associativity) {
    case Associativity::kLeft:
      return "left";
    case Associativity::kRight:
      return "right";
    case Associativity::kNonAssociative:
      return "non-associative";
  }
  LOG(FATAL) << "Invalid associativity: " << static_cast<int>(associativity);
}

}  // namespace sqlgen
