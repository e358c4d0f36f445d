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

#ifndef SQLGEN_AST_DIALECT_H_
#define SQLGEN_AST_DIALECT_H_

#include <cstdint>
#include <functional>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>

#include "absl/container/flat_hash_map.h"
#include "sqlgen/ast/operator_kind.h"

namespace sqlgen {

// How identifiers (column, table, schema and label names) are quoted.
enum class IdentifierQuoting : int8_t {
  // Identifiers are emitted verbatim.
  kNever,
  // Every identifier is quoted.
  kAlways,
  // Only identifiers that are not plain lower-case words ([a-z_][a-z0-9_]*)
  // are quoted.
  kWhenNeeded,
};

// Syntax of the parameter markers spliced into rendered text.
enum class PlaceholderStyle : int8_t {
  kQuestionMark,    // ?
  kDollarNumbered,  // $1
  kColonNamed,      // :name
  kAtNamed,         // @name
  kCustom,          // see Dialect::placeholder_renderer
};

// Produces placeholder text from the placeholder's name and its 1-based bound
// position.
using PlaceholderRenderer =
    std::function<std::string(std::string_view name, int64_t position)>;

// Describes the flavor of SQL being generated: operator precedence and
// associativity tables, identifier quoting and placeholder syntax.
//
// A default-constructed Dialect has empty operator tables; every operator
// rendered against it must then carry its own precedence (and associativity,
// where applicable). The named presets share a PostgreSQL-style table.
class Dialect {
 public:
  static constexpr int64_t kDefaultMaxNestingDepth = 1000;

  Dialect() = default;

  // $1-style placeholders, double-quoted identifiers.
  static Dialect Postgres();
  // ?-style placeholders, backtick-quoted identifiers.
  static Dialect MySql();
  // ?-style placeholders, double-quoted identifiers.
  static Dialect Sqlite();
  // :name-style placeholders, double-quoted identifiers.
  static Dialect Named();

  // Sets the precedence used for operators of the given kind which do not
  // carry their own. Larger values bind tighter. CHECK-fails unless
  // `precedence` is positive; zero is never a usable precedence.
  Dialect& SetPrecedence(OperatorKind kind, int64_t precedence);
  Dialect& SetAssociativity(OperatorKind kind, Associativity associativity);

  // Sets precedence and associativity for each of the given kinds.
  Dialect& SetOperatorLevel(std::initializer_list<OperatorKind> kinds,
                            int64_t precedence,
                            std::optional<Associativity> associativity);

  std::optional<int64_t> precedence(OperatorKind kind) const;
  std::optional<Associativity> associativity(OperatorKind kind) const;

  Dialect& identifier_quoting(IdentifierQuoting value);
  IdentifierQuoting identifier_quoting() const { return identifier_quoting_; }

  // Characters opening and closing a quoted identifier, e.g. '"' and '"', or
  // '[' and ']'.
  Dialect& quote_chars(char open, char close);
  char open_quote() const { return open_quote_; }
  char close_quote() const { return close_quote_; }

  Dialect& placeholder_style(PlaceholderStyle value);
  PlaceholderStyle placeholder_style() const { return placeholder_style_; }

  // Installs a caller-supplied placeholder renderer and switches the style to
  // kCustom.
  Dialect& placeholder_renderer(PlaceholderRenderer renderer);

  // Maximum expression nesting depth accepted by the renderer; std::nullopt
  // disables the check.
  Dialect& max_nesting_depth(std::optional<int64_t> value);
  std::optional<int64_t> max_nesting_depth() const {
    return max_nesting_depth_;
  }

  // Returns the identifier quoted according to this dialect.
  std::string QuoteIdentifier(std::string_view name) const;

  // Returns the placeholder text for the given name and 1-based position.
  std::string RenderPlaceholder(std::string_view name, int64_t position) const;

  // Whether every placeholder occurrence consumes its own positional
  // argument, i.e. markers carry neither a name nor a number.
  bool anonymous_placeholders() const {
    return placeholder_style_ == PlaceholderStyle::kQuestionMark;
  }

 private:
  // Installs the precedence and associativity table shared by the presets.
  Dialect& SetStandardOperatorTable();

  absl::flat_hash_map<OperatorKind, int64_t> precedences_;
  absl::flat_hash_map<OperatorKind, Associativity> associativities_;
  IdentifierQuoting identifier_quoting_ = IdentifierQuoting::kNever;
  char open_quote_ = '"';
  char close_quote_ = '"';
  PlaceholderStyle placeholder_style_ = PlaceholderStyle::kQuestionMark;
  PlaceholderRenderer placeholder_renderer_;
  std::optional<int64_t> max_nesting_depth_ = kDefaultMaxNestingDepth;
};

}  // namespace sqlgen

#endif  // SQLGEN_AST_DIALECT_H_
