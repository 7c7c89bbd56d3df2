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

#include <algorithm>
#include <cstdint>

#include "absl/flags/flag.h"
#include "toolguard/flags.h"

namespace toolguard {

Limits Limits::FromFlags() {
  Limits limits;
  limits.set_wall_time_limit(absl::GetFlag(FLAGS_toolguard_wall_time_limit))
      .set_cpu_time_limit(absl::GetFlag(FLAGS_toolguard_cpu_time_limit))
      .set_memory_limit_bytes(
          static_cast<uint64_t>(absl::GetFlag(FLAGS_toolguard_memory_limit_mb))
          << 20)
      .set_cpu_share_percent(absl::GetFlag(FLAGS_toolguard_cpu_share_percent))
      .set_kill_grace(absl::GetFlag(FLAGS_toolguard_kill_grace));
  return limits;
}

int Limits::nice_level() const {
  const int share = std::clamp(cpu_share_percent_, 1, 100);
  return std::min(19, (100 - share) * 10 / 75);
}

}  // namespace toolguard
