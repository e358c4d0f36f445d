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

#include "sqlgen/ast/errors.h"

#include <cstdint>
#include <optional>
#include <string_view>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "sqlgen/ast/operator_kind.h"

namespace sqlgen {

std::string_view SqlErrorKindToString(SqlErrorKind kind) {
  switch (kind) {
    case SqlErrorKind::kPrecedenceUndefined:
      return "PrecedenceUndefined";
    case SqlErrorKind::kAssociativityUndefined:
      return "AssociativityUndefined";
    case SqlErrorKind::kNonAssociativeUnary:
      return "NonAssociativeUnary";
    case SqlErrorKind::kUnknownStructuralVariant:
      return "UnknownStructuralVariant";
    case SqlErrorKind::kZeroLengthPlaceholderRequest:
      return "ZeroLengthPlaceholderRequest";
    case SqlErrorKind::kUnboundPlaceholder:
      return "UnboundPlaceholder";
    case SqlErrorKind::kUnknownInputKey:
      return "UnknownInputKey";
    case SqlErrorKind::kNestingTooDeep:
      return "NestingTooDeep";
  }
  LOG(FATAL) << "Invalid error kind: " << static_cast<int>(kind);
}

absl::Status PrecedenceUndefinedErrorStatus(OperatorKind kind) {
  return absl::InvalidArgumentError(absl::StrFormat(
      "PrecedenceUndefinedError: no precedence for operator `%s`; set one on "
      "the operator or in the dialect",
      OperatorKindToString(kind)));
}

absl::Status AssociativityUndefinedErrorStatus(OperatorKind kind) {
  return absl::InvalidArgumentError(absl::StrFormat(
      "AssociativityUndefinedError: no associativity for operator `%s`; set "
      "one on the operator or in the dialect",
      OperatorKindToString(kind)));
}

absl::Status NonAssociativeUnaryErrorStatus(OperatorKind kind) {
  return absl::InvalidArgumentError(absl::StrFormat(
      "NonAssociativeUnaryError: unary operator `%s` resolved to "
      "non-associative; it must be left (suffix) or right (prefix)",
      OperatorKindToString(kind)));
}

absl::Status UnknownStructuralVariantErrorStatus(std::string_view node_name) {
  return absl::InvalidArgumentError(absl::StrFormat(
      "UnknownStructuralVariantError: %s has no alternative populated",
      node_name));
}

absl::Status ZeroLengthPlaceholderRequestErrorStatus(int64_t length) {
  return absl::InvalidArgumentError(absl::StrFormat(
      "ZeroLengthPlaceholderRequestError: requested %d placeholders; at least "
      "one is required",
      length));
}

absl::Status UnboundPlaceholderErrorStatus(std::string_view name) {
  return absl::NotFoundError(absl::StrFormat(
      "UnboundPlaceholderError: no argument supplied for placeholder `%s`",
      name));
}

absl::Status UnknownInputKeyErrorStatus(std::string_view name) {
  return absl::InvalidArgumentError(absl::StrFormat(
      "UnknownInputKeyError: argument `%s` does not name any placeholder in "
      "the rendered statement",
      name));
}

absl::Status NestingTooDeepErrorStatus(int64_t limit) {
  return absl::ResourceExhaustedError(absl::StrFormat(
      "NestingTooDeepError: expression nesting exceeds the limit of %d",
      limit));
}

std::optional<SqlErrorKind> GetSqlErrorKind(const absl::Status& status) {
  if (status.ok()) {
    return std::nullopt;
  }
  for (SqlErrorKind kind :
       {SqlErrorKind::kPrecedenceUndefined,
        SqlErrorKind::kAssociativityUndefined,
        SqlErrorKind::kNonAssociativeUnary,
        SqlErrorKind::kUnknownStructuralVariant,
        SqlErrorKind::kZeroLengthPlaceholderRequest,
        SqlErrorKind::kUnboundPlaceholder, SqlErrorKind::kUnknownInputKey,
        SqlErrorKind::kNestingTooDeep}) {
    if (absl::StartsWith(status.message(),
                         absl::StrCat(SqlErrorKindToString(kind), "Error: "))) {
      return kind;
    }
  }
  return std::nullopt;
}

}  // namespace sqlgen
