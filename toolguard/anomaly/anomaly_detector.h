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

// Behavioural anomaly detection over a principal's recent executions and
// security events. AnomalyDetector is a pure function of its inputs;
// AnomalyMonitor feeds it from a background thread so the execution path only
// ever enqueues observations.

#ifndef TOOLGUARD_ANOMALY_ANOMALY_DETECTOR_H_
#define TOOLGUARD_ANOMALY_ANOMALY_DETECTOR_H_

#include <cstddef>
#include <deque>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/container/flat_hash_map.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"
#include "absl/types/span.h"
#include "toolguard/ratelimit/rate_limiter.h"
#include "toolguard/toolguard.pb.h"
#include "toolguard/util/clock.h"
#include "toolguard/util/thread.h"

namespace toolguard {

absl::string_view AnomalyKindName(AnomalyKind kind);

class AnomalyDetector {
 public:
  struct Options {
    // Recent window all three checks look at.
    absl::Duration window = absl::Minutes(10);
    // History the execution rate baseline is computed from; includes the
    // recent window.
    absl::Duration baseline_window = absl::Hours(24);
    // Recent rate must exceed the baseline rate by this factor...
    double burst_factor = 5.0;
    // ...with at least this many recent executions.
    int min_burst_count = 20;
    // Failure share of recent executions that counts as a spike...
    double error_ratio = 0.5;
    // ...once at least this many failures (or security events) occurred.
    int min_errors = 5;
    // Share of a limit an execution must reach to count as probing.
    double near_limit_fraction = 0.9;
    int near_limit_count = 3;

    static Options FromFlags();
  };

  explicit AnomalyDetector(Options options) : options_(std::move(options)) {}

  const Options& options() const { return options_; }

  // Flags raised for `principal_id` at `now`. Inputs may contain other
  // principals' entries; those are ignored.
  std::vector<AnomalyFlag> Analyze(absl::string_view principal_id,
                                   absl::Span<const SecurityEvent> events,
                                   absl::Span<const ExecutionRecord> executions,
                                   absl::Time now) const;

  // True if the execution used at least the near-limit fraction of its wall
  // time, CPU time or memory budget.
  bool NearLimit(const ExecutionRecord& record) const;

 private:
  Options options_;
};

class AnomalyMonitor {
 public:
  struct Options {
    AnomalyDetector::Options detector;
    // Tighten the execute ceiling of flagged principals.
    bool feedback = false;
    int tightened_execute_limit = 20;
    // Observations kept per principal and kind.
    size_t max_history = 4096;
    // Raised flags are kept this long, and at most `max_flags` of them.
    absl::Duration flag_retention = absl::Hours(24);
    size_t max_flags = 4096;

    static Options FromFlags();
  };

  // `clock` must outlive the monitor. `rate_limiter` is only used for
  // feedback and may be null.
  AnomalyMonitor(Options options, util::Clock* clock,
                 RateLimiter* rate_limiter);

  AnomalyMonitor(const AnomalyMonitor&) = delete;
  AnomalyMonitor& operator=(const AnomalyMonitor&) = delete;

  ~AnomalyMonitor();

  // Queue an observation for analysis. Never blocks on analysis.
  void ObserveExecution(ExecutionRecord record);
  void ObserveEvent(SecurityEvent event);

  // Flags raised so far, oldest first. Empty `principal_id` returns all.
  std::vector<AnomalyFlag> Flags(absl::string_view principal_id = "") const;

  // Blocks until every queued observation has been analyzed.
  void Drain();

  // Drops histories that aged out of the baseline window, flags past their
  // retention and flag suppressions whose window closed. Returns the number of
  // entries removed. The worker calls this periodically.
  int CollectGarbage();

  // Principals with retained observations.
  size_t TrackedPrincipals() const;

 private:
  struct Observation {
    std::optional<ExecutionRecord> execution;
    std::optional<SecurityEvent> event;
  };
  struct History {
    std::deque<ExecutionRecord> executions;
    std::deque<SecurityEvent> events;
  };

  void Enqueue(Observation observation);
  void Run();
  bool HasWork() const ABSL_SHARED_LOCKS_REQUIRED(queue_mutex_);
  bool Idle() const ABSL_SHARED_LOCKS_REQUIRED(queue_mutex_);
  // Adds a batch to the history and returns the principals it touched.
  std::vector<std::string> Absorb(std::vector<Observation> batch,
                                  absl::Time now);
  void Evaluate(const std::string& principal_id, absl::Time now);
  // Drops observations older than the baseline window; true if none remain.
  bool TrimLocked(History& history, absl::Time now) const
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(state_mutex_);
  int CollectGarbageLocked(absl::Time now)
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(state_mutex_);

  const Options options_;
  const AnomalyDetector detector_;
  util::Clock* clock_;
  RateLimiter* rate_limiter_;

  mutable absl::Mutex queue_mutex_;
  std::vector<Observation> queue_ ABSL_GUARDED_BY(queue_mutex_);
  bool busy_ ABSL_GUARDED_BY(queue_mutex_) = false;
  bool stopping_ ABSL_GUARDED_BY(queue_mutex_) = false;

  mutable absl::Mutex state_mutex_;
  absl::flat_hash_map<std::string, History> history_
      ABSL_GUARDED_BY(state_mutex_);
  std::vector<AnomalyFlag> flags_ ABSL_GUARDED_BY(state_mutex_);
  // Last time each (principal, kind) was flagged.
  absl::flat_hash_map<std::pair<std::string, int>, absl::Time> last_flagged_
      ABSL_GUARDED_BY(state_mutex_);
  int batches_since_gc_ ABSL_GUARDED_BY(state_mutex_) = 0;

  util::Thread worker_;
};

}  // namespace toolguard

#endif  // TOOLGUARD_ANOMALY_ANOMALY_DETECTOR_H_
