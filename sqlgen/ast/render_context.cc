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

#include "sqlgen/ast/render_context.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "absl/log/check.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "sqlgen/ast/errors.h"

namespace sqlgen {

void RenderContext::AppendLiteral(std::string_view text) {
  absl::StrAppend(&text_, text);
}

void RenderContext::AppendIdentifier(std::string_view name) {
  absl::StrAppend(&text_, dialect_.QuoteIdentifier(name));
}

int64_t RenderContext::BindPlaceholder(std::string_view name) {
  occurrences_.push_back(std::string(name));
  auto [it, inserted] = positions_.try_emplace(
      std::string(name), static_cast<int64_t>(bindings_.size()) + 1);
  if (inserted) {
    bindings_.push_back(std::string(name));
    VLOG(3) << "Bound placeholder `" << name << "` to position " << it->second;
  }
  return it->second;
}

absl::Status RenderContext::EnterNested() {
  std::optional<int64_t> limit = dialect_.max_nesting_depth();
  if (limit.has_value() && depth_ >= *limit) {
    return NestingTooDeepErrorStatus(*limit);
  }
  ++depth_;
  return absl::OkStatus();
}

void RenderContext::ExitNested() {
  CHECK_GT(depth_, 0) << "ExitNested() without matching EnterNested()";
  --depth_;
}

RenderedSql RenderContext::Finish() && {
  CHECK_EQ(depth_, 0) << "Finish() called in the middle of rendering";
  RenderedSql result;
  result.text = std::move(text_);
  result.bindings = std::move(bindings_);
  result.occurrences = std::move(occurrences_);
  result.anonymous_placeholders = dialect_.anonymous_placeholders();
  return result;
}

}  // namespace sqlgen
