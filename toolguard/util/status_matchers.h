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

#ifndef TOOLGUARD_UTIL_STATUS_MATCHERS_H_
#define TOOLGUARD_UTIL_STATUS_MATCHERS_H_

#include <utility>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "absl/status/status_matchers.h"  // IWYU pragma: export
#include "absl/status/statusor.h"         // IWYU pragma: keep
#include "toolguard/util/status_macros.h"  // IWYU pragma: keep

#define TOOLGUARD_ASSERT_OK(expr) ASSERT_THAT(expr, ::absl_testing::IsOk())

#define TOOLGUARD_ASSERT_OK_AND_ASSIGN(lhs, rexpr)                          \
  TOOLGUARD_ASSERT_OK_AND_ASSIGN_IMPL(                                      \
      TOOLGUARD_MACROS_IMPL_CONCAT(_toolguard_statusor, __LINE__), lhs, \
      rexpr)

#define TOOLGUARD_ASSERT_OK_AND_ASSIGN_IMPL(statusor, lhs, rexpr) \
  auto statusor = (rexpr);                                        \
  ASSERT_THAT(statusor.status(), ::absl_testing::IsOk());         \
  lhs = std::move(statusor).value()

namespace toolguard {

using ::absl_testing::IsOk;
using ::absl_testing::IsOkAndHolds;
using ::absl_testing::StatusIs;

}  // namespace toolguard

#endif  // TOOLGUARD_UTIL_STATUS_MATCHERS_H_
