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

#include "toolguard/sandbox/limits.h"

#include <cstdint>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/flags/flag.h"
#include "absl/flags/reflection.h"
#include "absl/time/time.h"
#include "toolguard/flags.h"

namespace toolguard {
namespace {

using ::testing::Eq;

TEST(LimitsTest, DefaultsMatchTheDocumentedBudget) {
  Limits limits;
  EXPECT_THAT(limits.wall_time_limit(), Eq(absl::Seconds(5)));
  EXPECT_THAT(limits.cpu_time_limit(), Eq(absl::Seconds(5)));
  EXPECT_THAT(limits.memory_limit_bytes(), Eq(uint64_t{50} << 20));
  EXPECT_THAT(limits.kill_grace(), Eq(absl::Milliseconds(100)));
  EXPECT_THAT(limits.nice_level(), Eq(10));
}

TEST(LimitsTest, CpuShareMapsToNiceLevel) {
  EXPECT_THAT(Limits().set_cpu_share_percent(100).nice_level(), Eq(0));
  EXPECT_THAT(Limits().set_cpu_share_percent(50).nice_level(), Eq(6));
  EXPECT_THAT(Limits().set_cpu_share_percent(0).nice_level(), Eq(13));
  EXPECT_THAT(Limits().set_cpu_share_percent(500).nice_level(), Eq(0));
}

TEST(LimitsTest, FromFlags) {
  absl::FlagSaver flag_saver;
  absl::SetFlag(&FLAGS_toolguard_wall_time_limit, absl::Seconds(2));
  absl::SetFlag(&FLAGS_toolguard_memory_limit_mb, 16);
  absl::SetFlag(&FLAGS_toolguard_cpu_share_percent, 100);
  Limits limits = Limits::FromFlags();
  EXPECT_THAT(limits.wall_time_limit(), Eq(absl::Seconds(2)));
  EXPECT_THAT(limits.memory_limit_bytes(), Eq(uint64_t{16} << 20));
  EXPECT_THAT(limits.nice_level(), Eq(0));
}

}  // namespace
}  // namespace toolguard
