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

// Per-principal admission control for tool registration and execution. Each
// (principal, action) pair has a fixed window that opens with its first
// admitted action; once the ceiling is reached further actions are rejected
// with kRateLimited until the window closes.

#ifndef TOOLGUARD_RATELIMIT_RATE_LIMITER_H_
#define TOOLGUARD_RATELIMIT_RATE_LIMITER_H_

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"
#include "toolguard/util/clock.h"

namespace toolguard {

enum class RateAction { kCreate, kExecute };

absl::string_view RateActionName(RateAction action);

class RateLimiter {
 public:
  struct Options {
    int create_limit = 5;
    int execute_limit = 200;
    absl::Duration window = absl::Hours(24);

    // Values of the --toolguard_create_limit, --toolguard_execute_limit and
    // --toolguard_rate_window flags.
    static Options FromFlags();
  };

  struct WindowSnapshot {
    std::string principal_id;
    RateAction action;
    absl::Time window_start;
    int count;
    // Ceiling in force at snapshot time, tightening included.
    int limit;
    std::optional<absl::Time> tightened_until;
  };

  // `clock` must outlive the limiter.
  RateLimiter(Options options, util::Clock* clock)
      : options_(std::move(options)), clock_(clock) {}

  RateLimiter(const RateLimiter&) = delete;
  RateLimiter& operator=(const RateLimiter&) = delete;

  // Counts one action for `principal_id`, or returns a kRateLimited error
  // carrying the time until the window closes. Rejected actions are not
  // counted.
  absl::Status Admit(absl::string_view principal_id, RateAction action);

  // Lowers the ceiling for one principal until `until`. A tightening never
  // raises the configured ceiling.
  void Tighten(absl::string_view principal_id, RateAction action, int limit,
               absl::Time until);

  // Forgets all windows and tightenings of `principal_id`.
  void Reset(absl::string_view principal_id);

  // Forgets everything.
  void ResetAll();

  std::vector<WindowSnapshot> Snapshot();

  // Drops windows that closed and tightenings that expired. Returns the
  // number of entries removed. Admit() calls this periodically.
  int CollectGarbage();

 private:
  struct Window {
    absl::Time start = absl::InfinitePast();
    int count = 0;
    std::optional<int> tightened_limit;
    absl::Time tightened_until = absl::InfinitePast();
  };
  using Key = std::pair<std::string, RateAction>;

  int ConfiguredLimit(RateAction action) const;
  int EffectiveLimit(const Window& window, RateAction action,
                     absl::Time now) const;
  bool Expired(const Window& window, absl::Time now) const;
  int CollectGarbageLocked(absl::Time now) ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);

  const Options options_;
  util::Clock* clock_;

  absl::Mutex mutex_;
  absl::flat_hash_map<Key, Window> windows_ ABSL_GUARDED_BY(mutex_);
  int admissions_since_gc_ ABSL_GUARDED_BY(mutex_) = 0;
};

}  // namespace toolguard

#endif  // TOOLGUARD_RATELIMIT_RATE_LIMITER_H_
