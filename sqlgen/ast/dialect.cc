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

#include "sqlgen/ast/dialect.h"

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "absl/log/check.h"
#include "absl/log/log.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_replace.h"
#include "re2/re2.h"
#include "sqlgen/ast/operator_kind.h"

namespace sqlgen {

Dialect Dialect::Postgres() {
  Dialect dialect;
  dialect.SetStandardOperatorTable()
      .identifier_quoting(IdentifierQuoting::kWhenNeeded)
      .quote_chars('"', '"')
      .placeholder_style(PlaceholderStyle::kDollarNumbered);
  return dialect;
}

Dialect Dialect::MySql() {
  Dialect dialect;
  dialect.SetStandardOperatorTable()
      .identifier_quoting(IdentifierQuoting::kWhenNeeded)
      .quote_chars('`', '`')
      .placeholder_style(PlaceholderStyle::kQuestionMark);
  return dialect;
}

Dialect Dialect::Sqlite() {
  Dialect dialect;
  dialect.SetStandardOperatorTable()
      .identifier_quoting(IdentifierQuoting::kWhenNeeded)
      .quote_chars('"', '"')
      .placeholder_style(PlaceholderStyle::kQuestionMark);
  return dialect;
}

Dialect Dialect::Named() {
  Dialect dialect;
  dialect.SetStandardOperatorTable()
      .identifier_quoting(IdentifierQuoting::kWhenNeeded)
      .quote_chars('"', '"')
      .placeholder_style(PlaceholderStyle::kColonNamed);
  return dialect;
}

// Operator precedence of the presets (larger binds tighter):
//   (14)  ::                              left
//   (13)  - (unary)                       right (prefix)
//   (11)  * / %                           left
//   (10)  + - ||                          left
//    (7)  [NOT] IN, [NOT] [I]LIKE         non-associative
//    (7)  [NOT] BETWEEN ... AND ...
//    (6)  < <= > >= = <>                  non-associative
//    (5)  IS [NOT] NULL/TRUE/FALSE        left (suffix)
//    (4)  NOT                             right (prefix)
//    (3)  AND                             left
//    (2)  OR                              left
Dialect& Dialect::SetStandardOperatorTable() {
  SetOperatorLevel({OperatorKind::kTypeCast}, 14, Associativity::kLeft);
  SetOperatorLevel({OperatorKind::kNegate}, 13, Associativity::kRight);
  SetOperatorLevel({OperatorKind::kMul, OperatorKind::kDiv, OperatorKind::kMod},
                   11, Associativity::kLeft);
  SetOperatorLevel(
      {OperatorKind::kAdd, OperatorKind::kSub, OperatorKind::kConcat}, 10,
      Associativity::kLeft);
  SetOperatorLevel({OperatorKind::kIn, OperatorKind::kNotIn,
                    OperatorKind::kLike, OperatorKind::kNotLike,
                    OperatorKind::kILike, OperatorKind::kNotILike},
                   7, Associativity::kNonAssociative);
  SetOperatorLevel({OperatorKind::kBetween, OperatorKind::kNotBetween}, 7,
                   std::nullopt);
  SetOperatorLevel({OperatorKind::kLt, OperatorKind::kLe, OperatorKind::kGt,
                    OperatorKind::kGe, OperatorKind::kEq, OperatorKind::kNe},
                   6, Associativity::kNonAssociative);
  SetOperatorLevel({OperatorKind::kIsNull, OperatorKind::kIsNotNull,
                    OperatorKind::kIsTrue, OperatorKind::kIsNotTrue,
                    OperatorKind::kIsFalse, OperatorKind::kIsNotFalse},
                   5, Associativity::kLeft);
  SetOperatorLevel({OperatorKind::kNot}, 4, Associativity::kRight);
  SetOperatorLevel({OperatorKind::kAnd}, 3, Associativity::kLeft);
  SetOperatorLevel({OperatorKind::kOr}, 2, Associativity::kLeft);
  return *this;
}

Dialect& Dialect::SetPrecedence(OperatorKind kind, int64_t precedence) {
  CHECK_GT(precedence, 0) << "Precedence of " << kind
                          << " must be positive; zero means unset";
  precedences_[kind] = precedence;
  return *this;
}

Dialect& Dialect::SetAssociativity(OperatorKind kind,
                                   Associativity associativity) {
  associativities_[kind] = associativity;
  return *this;
}

Dialect& Dialect::SetOperatorLevel(std::initializer_list<OperatorKind> kinds,
                                   int64_t precedence,
                                   std::optional<Associativity> associativity) {
  for (OperatorKind kind : kinds) {
    SetPrecedence(kind, precedence);
    if (associativity.has_value()) {
      SetAssociativity(kind, *associativity);
    }
  }
  return *this;
}

std::optional<int64_t> Dialect::precedence(OperatorKind kind) const {
  auto it = precedences_.find(kind);
  if (it == precedences_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<Associativity> Dialect::associativity(OperatorKind kind) const {
  auto it = associativities_.find(kind);
  if (it == associativities_.end()) {
    return std::nullopt;
  }
  return it->second;
}

Dialect& Dialect::identifier_quoting(IdentifierQuoting value) {
  identifier_quoting_ = value;
  return *this;
}

Dialect& Dialect::quote_chars(char open, char close) {
  open_quote_ = open;
  close_quote_ = close;
  return *this;
}

Dialect& Dialect::placeholder_style(PlaceholderStyle value) {
  CHECK(value != PlaceholderStyle::kCustom || placeholder_renderer_)
      << "Use placeholder_renderer() to select a custom placeholder style";
  placeholder_style_ = value;
  return *this;
}

Dialect& Dialect::placeholder_renderer(PlaceholderRenderer renderer) {
  CHECK(renderer) << "Placeholder renderer must be callable";
  placeholder_renderer_ = std::move(renderer);
  placeholder_style_ = PlaceholderStyle::kCustom;
  return *this;
}

Dialect& Dialect::max_nesting_depth(std::optional<int64_t> value) {
  CHECK(!value.has_value() || *value > 0)
      << "Nesting depth limit must be positive";
  max_nesting_depth_ = value;
  return *this;
}

std::string Dialect::QuoteIdentifier(std::string_view name) const {
  static const LazyRE2 kPlainIdentifier = {R"([a-z_][a-z0-9_]*)"};
  switch (identifier_quoting_) {
    case IdentifierQuoting::kNever:
      return std::string(name);
    case IdentifierQuoting::kWhenNeeded:
      if (RE2::FullMatch(name, *kPlainIdentifier)) {
        return std::string(name);
      }
      break;
    case IdentifierQuoting::kAlways:
      break;
  }
  // A closing quote inside the identifier is escaped by doubling it.
  std::string escaped = absl::StrReplaceAll(
      name, {{std::string(1, close_quote_), std::string(2, close_quote_)}});
  return absl::StrCat(std::string(1, open_quote_), escaped,
                      std::string(1, close_quote_));
}

std::string Dialect::RenderPlaceholder(std::string_view name,
                                       int64_t position) const {
  switch (placeholder_style_) {
    case PlaceholderStyle::kQuestionMark:
      return "?";
    case PlaceholderStyle::kDollarNumbered:
      return absl::StrCat("$", position);
    case PlaceholderStyle::kColonNamed:
      return absl::StrCat(":", name);
    case PlaceholderStyle::kAtNamed:
      return absl::StrCat("@", name);
    case PlaceholderStyle::kCustom:
      return placeholder_renderer_(name, position);
  }
  LOG(FATAL) << "Invalid placeholder style: "
             << static_cast<int>(placeholder_style_);
}

}  // namespace sqlgen
