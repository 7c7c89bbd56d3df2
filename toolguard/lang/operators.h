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

// Arithmetic, comparison, indexing and formatting semantics of runtime
// objects. Integer arithmetic is checked: results that do not fit in 64 bits
// raise OverflowError instead of wrapping.

#ifndef TOOLGUARD_LANG_OPERATORS_H_
#define TOOLGUARD_LANG_OPERATORS_H_

#include <cstdint>
#include <optional>
#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "toolguard/lang/ast.h"
#include "toolguard/lang/object.h"

namespace toolguard {

// Upper bound on the length of strings and lists built by a single
// operation. Larger results raise MemoryError.
inline constexpr int64_t kMaxSequenceLength = int64_t{1} << 24;

absl::StatusOr<Object> ApplyBinary(Operator op, const Object& left,
                                   const Object& right);

absl::StatusOr<Object> ApplyUnary(Operator op, const Object& operand);

absl::StatusOr<bool> ApplyCompare(Operator op, const Object& left,
                                  const Object& right);

// container[index]
absl::StatusOr<Object> GetItem(const Object& container, const Object& index);

// container[index] = value
absl::Status SetItem(const Object& container, const Object& index,
                     Object value);

// container[lower:upper:step]; absent bounds are nullopt.
absl::StatusOr<Object> GetSlice(const Object& container,
                                const std::optional<Object>& lower,
                                const std::optional<Object>& upper,
                                const std::optional<Object>& step);

// Applies a format specification as used in f-strings:
// [[fill]align][sign][0][width][,][.precision][type] with type one of
// "s", "d", "f", "e", "g", "x", "%".
absl::StatusOr<std::string> FormatWithSpec(const Object& value,
                                           absl::string_view spec);

}  // namespace toolguard

#endif  // TOOLGUARD_LANG_OPERATORS_H_
