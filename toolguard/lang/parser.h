// Copyright 2024 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     https://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

// Recursive-descent parser for the tool language.
//
// The accepted grammar is a superset of what the validator allows: classes,
// exception handling, lambdas and similar constructs are parsed so that they
// can be reported with their position instead of failing as syntax errors.

#ifndef TOOLGUARD_LANG_PARSER_H_
#define TOOLGUARD_LANG_PARSER_H_

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "toolguard/lang/ast.h"

namespace toolguard {

// Maximum nesting of expressions and blocks accepted by the parser.
inline constexpr int kMaxNestingDepth = 200;

struct SourceLocation {
  int line = 0;
  int column = 0;
};

// Parses `source` into a kModule node. On syntax errors returns
// InvalidArgument and, if `error_location` is not null, stores the position
// of the offending token there.
absl::StatusOr<NodePtr> Parse(absl::string_view source,
                              SourceLocation* error_location = nullptr);

}  // namespace toolguard

#endif  // TOOLGUARD_LANG_PARSER_H_
