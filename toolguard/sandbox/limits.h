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

// The toolguard::Limits class holds the resource ceilings applied to a single
// tool execution: the host-side wall-clock and memory watchdog, and the
// rlimits the sandboxee applies to itself before running tool code.

#ifndef TOOLGUARD_SANDBOX_LIMITS_H_
#define TOOLGUARD_SANDBOX_LIMITS_H_

#include <cstdint>

#include "absl/time/time.h"

namespace toolguard {

class Limits final {
 public:
  Limits() = default;

  // Defaults taken from the --toolguard_* flags.
  static Limits FromFlags();

  // Wall-clock budget, enforced by the host. The walltime limit is a timeout
  // duration, not a deadline.
  Limits& set_wall_time_limit(absl::Duration value) {
    wall_time_limit_ = value;
    return *this;
  }
  absl::Duration wall_time_limit() const { return wall_time_limit_; }

  // CPU-time budget, enforced with RLIMIT_CPU (rounded up to whole seconds).
  Limits& set_cpu_time_limit(absl::Duration value) {
    cpu_time_limit_ = value;
    return *this;
  }
  absl::Duration cpu_time_limit() const { return cpu_time_limit_; }

  // Heap budget on top of the sandboxee's footprint at fork time. Enforced
  // with RLIMIT_AS in the sandboxee and by resident-memory sampling on the
  // host.
  Limits& set_memory_limit_bytes(uint64_t value) {
    memory_limit_bytes_ = value;
    return *this;
  }
  uint64_t memory_limit_bytes() const { return memory_limit_bytes_; }

  // Share of one CPU the sandboxee should get under contention, 1-100.
  Limits& set_cpu_share_percent(int value) {
    cpu_share_percent_ = value;
    return *this;
  }
  int cpu_share_percent() const { return cpu_share_percent_; }

  // Upper bound on how long the host waits for a killed sandboxee to be
  // reaped.
  Limits& set_kill_grace(absl::Duration value) {
    kill_grace_ = value;
    return *this;
  }
  absl::Duration kill_grace() const { return kill_grace_; }

  // Nice increment implementing the CPU share: 100% maps to 0 and 25% to 10.
  int nice_level() const;

 private:
  absl::Duration wall_time_limit_ = absl::Seconds(5);
  absl::Duration cpu_time_limit_ = absl::Seconds(5);
  uint64_t memory_limit_bytes_ = uint64_t{50} << 20;
  int cpu_share_percent_ = 25;
  absl::Duration kill_grace_ = absl::Milliseconds(100);
};

}  // namespace toolguard

#endif  // TOOLGUARD_SANDBOX_LIMITS_H_
