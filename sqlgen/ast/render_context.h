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

#ifndef SQLGEN_AST_RENDER_CONTEXT_H_
#define SQLGEN_AST_RENDER_CONTEXT_H_

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "sqlgen/ast/dialect.h"
#include "sqlgen/ast/errors.h"
#include "sqlgen/ast/operator_kind.h"

namespace sqlgen {

// The product of one render pass.
struct RenderedSql {
  std::string text;

  // Distinct placeholder names in order of first appearance. The name at index
  // i is bound to position i + 1.
  std::vector<std::string> bindings;

  // The name of every placeholder marker emitted, in text order. Differs from
  // `bindings` when a name is used more than once.
  std::vector<std::string> occurrences;

  // Whether the markers are anonymous ("?"), in which case each occurrence
  // consumes its own argument.
  bool anonymous_placeholders = false;

  // Orders named argument values the way the database expects them: one per
  // occurrence for anonymous markers, one per binding otherwise.
  //
  // Returns an UnboundPlaceholder error if a placeholder has no value in
  // `inputs`, and an UnknownInputKey error if `inputs` holds a name that no
  // placeholder uses.
  template <typename T>
  absl::StatusOr<std::vector<T>> ArrangeArguments(
      const absl::flat_hash_map<std::string, T>& inputs) const;
};

// The output context for one render pass: owns the text buffer and the
// placeholder bindings, and answers precedence, associativity, quoting and
// placeholder syntax questions from its dialect.
//
// The dialect must outlive the context. A context is not reusable; call
// Finish() once rendering is complete.
class RenderContext {
 public:
  explicit RenderContext(const Dialect& dialect) : dialect_(dialect) {}

  RenderContext(const RenderContext&) = delete;
  RenderContext& operator=(const RenderContext&) = delete;

  const Dialect& dialect() const { return dialect_; }

  // Appends text verbatim.
  void AppendLiteral(std::string_view text);

  // Appends a dialect-quoted identifier.
  void AppendIdentifier(std::string_view name);

  std::optional<int64_t> PrecedenceFor(OperatorKind kind) const {
    return dialect_.precedence(kind);
  }
  std::optional<Associativity> AssociativityFor(OperatorKind kind) const {
    return dialect_.associativity(kind);
  }

  // Returns the 1-based position of the named placeholder, binding the next
  // free position if the name has not been seen in this pass.
  int64_t BindPlaceholder(std::string_view name);

  std::string RenderPlaceholder(std::string_view name, int64_t position) const {
    return dialect_.RenderPlaceholder(name, position);
  }

  // Depth accounting for nested nodes. EnterNested() fails with a
  // NestingTooDeep error once the dialect's limit would be exceeded; every
  // successful EnterNested() must be paired with an ExitNested().
  absl::Status EnterNested();
  void ExitNested();
  int64_t depth() const { return depth_; }

  std::string_view text() const { return text_; }
  const std::vector<std::string>& bindings() const { return bindings_; }

  // Moves the rendered text and bindings out of the context.
  RenderedSql Finish() &&;

 private:
  const Dialect& dialect_;
  std::string text_;
  std::vector<std::string> bindings_;
  absl::flat_hash_map<std::string, int64_t> positions_;
  std::vector<std::string> occurrences_;
  int64_t depth_ = 0;
};

template <typename T>
absl::StatusOr<std::vector<T>> RenderedSql::ArrangeArguments(
    const absl::flat_hash_map<std::string, T>& inputs) const {
  absl::flat_hash_set<std::string_view> used(bindings.begin(), bindings.end());
  for (const auto& [name, value] : inputs) {
    if (!used.contains(name)) {
      return UnknownInputKeyErrorStatus(name);
    }
  }
  const std::vector<std::string>& order =
      anonymous_placeholders ? occurrences : bindings;
  std::vector<T> arguments;
  arguments.reserve(order.size());
  for (const std::string& name : order) {
    auto it = inputs.find(name);
    if (it == inputs.end()) {
      return UnboundPlaceholderErrorStatus(name);
    }
    arguments.push_back(it->second);
  }
  return arguments;
}

}  // namespace sqlgen

#endif  // SQLGEN_AST_RENDER_CONTEXT_H_
