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

// The toolguard::Governor supervises one running sandboxee: it races the
// process against its wall-clock deadline, samples its resident memory,
// forwards channel traffic to the executor and kills the process on the first
// breach. Cancellation is always SIGKILL; the sandboxee is never asked to
// stop.

#ifndef TOOLGUARD_SANDBOX_GOVERNOR_H_
#define TOOLGUARD_SANDBOX_GOVERNOR_H_

#include <sys/resource.h>
#include <sys/types.h>

#include <cstdint>
#include <functional>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/time/time.h"
#include "toolguard/sandbox/comms.h"
#include "toolguard/sandbox/limits.h"

namespace toolguard {

// Which ceiling a sandboxee crossed.
enum class Breach { kNone, kTime, kMemory, kCpu };

absl::string_view BreachName(Breach breach);

// Exit codes a sandboxee uses to report failures it detects itself.
inline constexpr int kSandboxeeOutOfMemoryExitCode = 120;
inline constexpr int kSandboxeeSetupFailedExitCode = 121;
inline constexpr int kSandboxeeSendFailedExitCode = 122;

// How supervision ended.
struct Termination {
  Breach breach = Breach::kNone;
  // True once the process was collected with wait4(). A process that could
  // not be reaped within the grace period is left to a background reaper.
  bool reaped = false;
  int wait_status = 0;
  rusage usage = {};
  absl::Duration wall_time;
  // Largest resident-memory growth observed over the fork-time baseline.
  int64_t peak_memory_bytes = 0;
  // Error returned by the channel handler; the process was killed for it.
  absl::Status channel_status;
  // Set when the governor itself failed (kill or wait errors).
  absl::Status internal_status;
};

class Governor {
 public:
  static constexpr absl::Duration kDefaultPollInterval = absl::Milliseconds(10);

  // Called whenever the channel becomes readable. Returns false once the
  // executor is no longer interested in the channel (outcome received or the
  // peer hung up). An error kills the sandboxee.
  using ChannelHandler = std::function<absl::StatusOr<bool>()>;

  Governor(pid_t pid, const Limits& limits,
           absl::Duration poll_interval = kDefaultPollInterval)
      : pid_(pid), limits_(limits), poll_interval_(poll_interval) {}

  Governor(const Governor&) = delete;
  Governor& operator=(const Governor&) = delete;

  // Supervises the process until it exits or is killed. `comms` may be null.
  // Returns in at most the wall-time limit plus the kill grace period (plus
  // one poll interval).
  Termination Run(Comms* comms, const ChannelHandler& handler);

  struct MemoryUsage {
    int64_t virtual_bytes = 0;
    int64_t resident_bytes = 0;
  };

  // Memory footprint of `pid`, from /proc/<pid>/statm.
  static absl::StatusOr<MemoryUsage> ReadMemoryUsage(pid_t pid);

 private:
  // Samples memory and returns true if the ceiling was crossed.
  bool SampleMemory(Termination* termination);
  // Non-blocking reap. Returns true once the process is gone.
  bool TryReap(Termination* termination);
  // SIGKILLs the process and waits for it at most the grace period.
  void KillAndReap(Breach breach, Termination* termination);
  // Derives the breach of a process that exited on its own.
  void ClassifyExit(Termination* termination) const;

  pid_t pid_;
  Limits limits_;
  absl::Duration poll_interval_;
  int64_t baseline_rss_bytes_ = -1;
};

}  // namespace toolguard

#endif  // TOOLGUARD_SANDBOX_GOVERNOR_H_
