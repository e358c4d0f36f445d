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

#ifndef SQLGEN_COMMON_VISITOR_H_
#define SQLGEN_COMMON_VISITOR_H_

namespace sqlgen {

// Combines lambdas into one overload set for std::visit. FromItem dispatches
// on its table, subquery or join alternative this way; a lambda taking
// `const SqlNode*` covers every pointer alternative at once:
//
//   std::visit(Visitor{
//     [](std::monostate) { ... },
//     [](const SqlNode* node) { ... },
//   }, from_item->alternative());
template <class... Ts>
struct Visitor : Ts... {
  using Ts::operator()...;
};

template <class... Ts>
Visitor(Ts...) -> Visitor<Ts...>;

}  // namespace sqlgen

#endif  // SQLGEN_COMMON_VISITOR_H_
