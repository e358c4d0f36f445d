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

// Helpers for creating batches of placeholders, e.g. for the right-hand side
// of `x IN ($1,$2,$3)`.

#ifndef SQLGEN_AST_PLACEHOLDERS_H_
#define SQLGEN_AST_PLACEHOLDERS_H_

#include <cstdint>
#include <string_view>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/types/span.h"
#include "sqlgen/ast/sql_ast.h"

namespace sqlgen {

// Returns `length` placeholders named prefix1, prefix2, ... prefixN.
//
// Fails with a ZeroLengthPlaceholderRequest error if `length` is not positive.
absl::StatusOr<std::vector<Placeholder*>> GeneratePlaceholders(
    SqlBuilder* builder, std::string_view prefix, int64_t length);

// Wraps `placeholders` in a tuple. Fails with a ZeroLengthPlaceholderRequest
// error if `placeholders` is empty.
absl::StatusOr<Tuple*> PlaceholderTupleOf(
    SqlBuilder* builder, absl::Span<Placeholder* const> placeholders);

struct PlaceholderTuple {
  std::vector<Placeholder*> placeholders;
  Tuple* tuple;
};

// GeneratePlaceholders() followed by PlaceholderTupleOf().
absl::StatusOr<PlaceholderTuple> MakePlaceholderTuple(SqlBuilder* builder,
                                                      std::string_view prefix,
                                                      int64_t length);

}  // namespace sqlgen

#endif  // SQLGEN_AST_PLACEHOLDERS_H_
