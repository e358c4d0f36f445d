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

#ifndef SQLGEN_AST_ERRORS_H_
#define SQLGEN_AST_ERRORS_H_

#include <cstdint>
#include <optional>
#include <ostream>
#include <string_view>

#include "absl/status/status.h"
#include "sqlgen/ast/operator_kind.h"

// Specialized error types that can be encountered while rendering SQL.
//
// Each error is an absl::Status whose message starts with "<Kind>Error: " so
// callers can distinguish them with GetSqlErrorKind().

namespace sqlgen {

enum class SqlErrorKind : int8_t {
  kPrecedenceUndefined,
  kAssociativityUndefined,
  kNonAssociativeUnary,
  kUnknownStructuralVariant,
  kZeroLengthPlaceholderRequest,
  kUnboundPlaceholder,
  kUnknownInputKey,
  kNestingTooDeep,
};

std::string_view SqlErrorKindToString(SqlErrorKind kind);

inline std::ostream& operator<<(std::ostream& os, SqlErrorKind kind) {
  os << SqlErrorKindToString(kind);
  return os;
}

// Returned when neither the operator nor the dialect provides a precedence.
absl::Status PrecedenceUndefinedErrorStatus(OperatorKind kind);

// Returned when neither the operator nor the dialect provides an
// associativity.
absl::Status AssociativityUndefinedErrorStatus(OperatorKind kind);

// Returned when a unary operator resolves to non-associative; unary operators
// must be prefix (right) or suffix (left).
absl::Status NonAssociativeUnaryErrorStatus(OperatorKind kind);

// Returned when a container node has none of its alternatives populated.
absl::Status UnknownStructuralVariantErrorStatus(std::string_view node_name);

// Returned when a batch of zero or fewer placeholders is requested.
absl::Status ZeroLengthPlaceholderRequestErrorStatus(int64_t length);

// Returned when a placeholder that appears in rendered text has no argument.
absl::Status UnboundPlaceholderErrorStatus(std::string_view name);

// Returned when an argument is supplied for a name no placeholder uses.
absl::Status UnknownInputKeyErrorStatus(std::string_view name);

// Returned when rendering descends past the dialect's nesting limit.
absl::Status NestingTooDeepErrorStatus(int64_t limit);

// Extracts the error kind from a status produced by one of the functions
// above. Returns std::nullopt for OK statuses and foreign errors.
std::optional<SqlErrorKind> GetSqlErrorKind(const absl::Status& status);

}  // namespace sqlgen

#endif  // SQLGEN_AST_ERRORS_H_
