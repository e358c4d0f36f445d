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

#include "sqlgen/ast/placeholders.h"

#include <cstdint>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/types/span.h"
#include "sqlgen/ast/errors.h"
#include "sqlgen/ast/sql_ast.h"
#include "sqlgen/common/status/status_macros.h"

namespace sqlgen {

absl::StatusOr<std::vector<Placeholder*>> GeneratePlaceholders(
    SqlBuilder* builder, std::string_view prefix, int64_t length) {
  if (length <= 0) {
    return ZeroLengthPlaceholderRequestErrorStatus(length);
  }
  std::vector<Placeholder*> placeholders;
  placeholders.reserve(length);
  for (int64_t i = 1; i <= length; ++i) {
    placeholders.push_back(builder->Placeholder(absl::StrCat(prefix, i)));
  }
  return placeholders;
}

absl::StatusOr<Tuple*> PlaceholderTupleOf(
    SqlBuilder* builder, absl::Span<Placeholder* const> placeholders) {
  if (placeholders.empty()) {
    return ZeroLengthPlaceholderRequestErrorStatus(0);
  }
  std::vector<Expression*> elements(placeholders.begin(), placeholders.end());
  return builder->Tuple(elements);
}

absl::StatusOr<PlaceholderTuple> MakePlaceholderTuple(SqlBuilder* builder,
                                                      std::string_view prefix,
                                                      int64_t length) {
  SQLGEN_ASSIGN_OR_RETURN(std::vector<Placeholder*> placeholders,
                          GeneratePlaceholders(builder, prefix, length));
  SQLGEN_ASSIGN_OR_RETURN(Tuple * tuple,
                          PlaceholderTupleOf(builder, placeholders));
  return PlaceholderTuple{std::move(placeholders), tuple};
}

}  // namespace sqlgen
