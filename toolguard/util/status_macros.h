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

// Status propagation helpers used throughout toolguard.

#ifndef TOOLGUARD_UTIL_STATUS_MACROS_H_
#define TOOLGUARD_UTIL_STATUS_MACROS_H_

#include <utility>

#include "absl/base/optimization.h"
#include "absl/status/status.h"

// Internal helper for concatenating macro values.
#define TOOLGUARD_MACROS_IMPL_CONCAT_INNER_(x, y) x##y
#define TOOLGUARD_MACROS_IMPL_CONCAT(x, y) \
  TOOLGUARD_MACROS_IMPL_CONCAT_INNER_(x, y)

#define TOOLGUARD_RETURN_IF_ERROR(expr) \
  TOOLGUARD_RETURN_IF_ERROR_IMPL(       \
      TOOLGUARD_MACROS_IMPL_CONCAT(_toolguard_status, __LINE__), expr)

#define TOOLGUARD_RETURN_IF_ERROR_IMPL(status, expr) \
  do {                                               \
    const auto status = (expr);                      \
    if (ABSL_PREDICT_FALSE(!status.ok())) {          \
      return status;                                 \
    }                                                \
  } while (0)

#define TOOLGUARD_ASSIGN_OR_RETURN(lhs, rexpr) \
  TOOLGUARD_ASSIGN_OR_RETURN_IMPL(             \
      TOOLGUARD_MACROS_IMPL_CONCAT(_toolguard_statusor, __LINE__), lhs, rexpr)

#define TOOLGUARD_ASSIGN_OR_RETURN_IMPL(statusor, lhs, rexpr) \
  auto statusor = (rexpr);                                    \
  if (ABSL_PREDICT_FALSE(!statusor.ok())) {                   \
    return statusor.status();                                 \
  }                                                           \
  lhs = std::move(statusor).value()

#endif  // TOOLGUARD_UTIL_STATUS_MACROS_H_
