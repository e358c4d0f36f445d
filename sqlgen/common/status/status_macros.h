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

#ifndef SQLGEN_COMMON_STATUS_STATUS_MACROS_H_
#define SQLGEN_COMMON_STATUS_STATUS_MACROS_H_

#include <utility>

#include "absl/base/optimization.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"

// Evaluates an expression that produces an `absl::Status`. If the status is not
// ok, returns it from the current function.
//
// Example:
//   absl::Status MultiStepFunction() {
//     SQLGEN_RETURN_IF_ERROR(Function(args...));
//     SQLGEN_RETURN_IF_ERROR(foo.Method(args...));
//     return absl::OkStatus();
//   }
#define SQLGEN_RETURN_IF_ERROR(expr)                                   \
  do {                                                                 \
    const ::absl::Status sqlgen_status_macro_status_ = (expr);         \
    if (ABSL_PREDICT_FALSE(!sqlgen_status_macro_status_.ok())) {       \
      return sqlgen_status_macro_status_;                              \
    }                                                                  \
  } while (false)

// Executes an expression `rexpr` that returns an `absl::StatusOr<T>`. On OK,
// moves its value into the variable defined by `lhs`, otherwise returns the
// error status from the current function.
//
// Example:
//   SQLGEN_ASSIGN_OR_RETURN(int64_t precedence, ResolvePrecedence(op, ctx));
//
// WARNING: expands into multiple statements; it cannot be used in a single
// statement (e.g. as the body of an if statement without {})!
#define SQLGEN_ASSIGN_OR_RETURN(lhs, rexpr)                                  \
  SQLGEN_ASSIGN_OR_RETURN_IMPL_(                                             \
      SQLGEN_STATUS_MACROS_CONCAT_NAME_(sqlgen_statusor_, __LINE__), lhs,    \
      rexpr)

// Internal helpers.
#define SQLGEN_ASSIGN_OR_RETURN_IMPL_(statusor, lhs, rexpr) \
  auto statusor = (rexpr);                                  \
  if (ABSL_PREDICT_FALSE(!statusor.ok())) {                 \
    return std::move(statusor).status();                    \
  }                                                         \
  lhs = std::move(statusor).value()

#define SQLGEN_STATUS_MACROS_CONCAT_NAME_(x, y) \
  SQLGEN_STATUS_MACROS_CONCAT_IMPL_(x, y)
#define SQLGEN_STATUS_MACROS_CONCAT_IMPL_(x, y) x##y

#endif  // SQLGEN_COMMON_STATUS_STATUS_MACROS_H_
