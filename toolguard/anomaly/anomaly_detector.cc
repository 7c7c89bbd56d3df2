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

#include "toolguard/anomaly/anomaly_detector.h"

#include <algorithm>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "absl/flags/flag.h"
#include "absl/log/log.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"
#include "absl/types/span.h"
#include "toolguard/flags.h"
#include "toolguard/ratelimit/rate_limiter.h"
#include "toolguard/toolguard.pb.h"
#include "toolguard/util/thread.h"

namespace toolguard {
namespace {

// Batches between full sweeps of the monitor state.
constexpr int kGarbageCollectionPeriod = 64;

bool IsFailure(ExecutionOutcome outcome) {
  switch (outcome) {
    case ExecutionOutcome::FAILED:
    case ExecutionOutcome::VIOLATED:
    case ExecutionOutcome::TIMED_OUT:
    case ExecutionOutcome::MEMORY_EXCEEDED:
    case ExecutionOutcome::CPU_EXCEEDED:
      return true;
    default:
      return false;
  }
}

bool Reached(int64_t used, int64_t limit, double fraction) {
  return limit > 0 && static_cast<double>(used) >= fraction * limit;
}

AnomalyFlag MakeFlag(absl::string_view principal_id, AnomalyKind kind,
                     absl::Time window_start, absl::Time now) {
  AnomalyFlag flag;
  flag.set_principal_id(std::string(principal_id));
  flag.set_kind(kind);
  flag.set_window_start_unix_micros(absl::ToUnixMicros(window_start));
  flag.set_window_end_unix_micros(absl::ToUnixMicros(now));
  flag.set_generate_time_unix_micros(absl::ToUnixMicros(now));
  return flag;
}

}  // namespace

absl::string_view AnomalyKindName(AnomalyKind kind) {
  switch (kind) {
    case EXECUTION_BURST:
      return "execution_burst";
    case ERROR_SPIKE:
      return "error_spike";
    case NEAR_LIMIT_PROBING:
      return "near_limit_probing";
    default:
      return "unspecified";
  }
}

AnomalyDetector::Options AnomalyDetector::Options::FromFlags() {
  Options options;
  options.window = absl::GetFlag(FLAGS_toolguard_anomaly_window);
  options.baseline_window =
      absl::GetFlag(FLAGS_toolguard_anomaly_baseline_window);
  options.burst_factor = absl::GetFlag(FLAGS_toolguard_anomaly_burst_factor);
  options.min_burst_count =
      absl::GetFlag(FLAGS_toolguard_anomaly_min_burst_count);
  options.error_ratio = absl::GetFlag(FLAGS_toolguard_anomaly_error_ratio);
  options.min_errors = absl::GetFlag(FLAGS_toolguard_anomaly_min_errors);
  options.near_limit_fraction =
      absl::GetFlag(FLAGS_toolguard_anomaly_near_limit_fraction);
  options.near_limit_count =
      absl::GetFlag(FLAGS_toolguard_anomaly_near_limit_count);
  return options;
}

bool AnomalyDetector::NearLimit(const ExecutionRecord& record) const {
  const double fraction = options_.near_limit_fraction;
  return Reached(record.wall_time_micros(), record.wall_time_limit_micros(),
                 fraction) ||
         Reached(record.cpu_time_micros(), record.cpu_time_limit_micros(),
                 fraction) ||
         Reached(record.peak_memory_bytes(), record.memory_limit_bytes(),
                 fraction);
}

std::vector<AnomalyFlag> AnomalyDetector::Analyze(
    absl::string_view principal_id, absl::Span<const SecurityEvent> events,
    absl::Span<const ExecutionRecord> executions, absl::Time now) const {
  const absl::Time window_start = now - options_.window;
  const absl::Time baseline_start = now - options_.baseline_window;

  int64_t recent = 0;
  int64_t baseline = 0;
  int64_t attempted = 0;
  int64_t failures = 0;
  int64_t near_limit = 0;
  for (const ExecutionRecord& record : executions) {
    if (record.principal_id() != principal_id) {
      continue;
    }
    const absl::Time start =
        absl::FromUnixMicros(record.start_time_unix_micros());
    if (start > now || start < baseline_start) {
      continue;
    }
    if (start < window_start) {
      ++baseline;
      continue;
    }
    ++recent;
    if (record.outcome() == ExecutionOutcome::RATE_REJECTED) {
      continue;
    }
    ++attempted;
    if (IsFailure(record.outcome())) {
      ++failures;
    }
    if (NearLimit(record)) {
      ++near_limit;
    }
  }

  int64_t security_events = 0;
  int64_t resource_events = 0;
  for (const SecurityEvent& event : events) {
    if (event.principal_id() != principal_id) {
      continue;
    }
    const absl::Time time = absl::FromUnixMicros(event.time_unix_micros());
    if (time > now || time < window_start) {
      continue;
    }
    switch (event.type()) {
      case VALIDATION_FAILURE:
      case SANDBOX_VIOLATION:
        ++security_events;
        break;
      case RESOURCE_EXCEEDED:
        ++security_events;
        ++resource_events;
        break;
      default:
        break;
    }
  }

  std::vector<AnomalyFlag> flags;

  // Rates per second; the baseline excludes the recent window.
  const double recent_rate =
      static_cast<double>(recent) / absl::ToDoubleSeconds(options_.window);
  const absl::Duration baseline_span = options_.baseline_window - options_.window;
  const double baseline_rate =
      baseline_span > absl::ZeroDuration()
          ? static_cast<double>(baseline) / absl::ToDoubleSeconds(baseline_span)
          : 0.0;
  if (recent >= options_.min_burst_count &&
      recent_rate > options_.burst_factor * baseline_rate) {
    AnomalyFlag flag =
        MakeFlag(principal_id, EXECUTION_BURST, window_start, now);
    (*flag.mutable_evidence())["recent_executions"] = recent;
    (*flag.mutable_evidence())["baseline_executions"] = baseline;
    flags.push_back(std::move(flag));
  }

  const bool failure_spike =
      failures >= options_.min_errors &&
      static_cast<double>(failures) >= options_.error_ratio * attempted;
  if (failure_spike || security_events >= options_.min_errors) {
    AnomalyFlag flag = MakeFlag(principal_id, ERROR_SPIKE, window_start, now);
    (*flag.mutable_evidence())["failures"] = failures;
    (*flag.mutable_evidence())["executions"] = attempted;
    (*flag.mutable_evidence())["security_events"] = security_events;
    flags.push_back(std::move(flag));
  }

  if (near_limit >= options_.near_limit_count ||
      resource_events >= options_.near_limit_count) {
    AnomalyFlag flag =
        MakeFlag(principal_id, NEAR_LIMIT_PROBING, window_start, now);
    (*flag.mutable_evidence())["near_limit_executions"] = near_limit;
    (*flag.mutable_evidence())["resource_exceeded_events"] = resource_events;
    flags.push_back(std::move(flag));
  }
  return flags;
}

AnomalyMonitor::Options AnomalyMonitor::Options::FromFlags() {
  Options options;
  options.detector = AnomalyDetector::Options::FromFlags();
  options.feedback = absl::GetFlag(FLAGS_toolguard_anomaly_feedback);
  options.tightened_execute_limit =
      absl::GetFlag(FLAGS_toolguard_anomaly_tightened_execute_limit);
  return options;
}

AnomalyMonitor::AnomalyMonitor(Options options, util::Clock* clock,
                               RateLimiter* rate_limiter)
    : options_(std::move(options)),
      detector_(options_.detector),
      clock_(clock),
      rate_limiter_(rate_limiter) {
  worker_ = util::Thread(this, &AnomalyMonitor::Run, "toolguard-anom");
}

AnomalyMonitor::~AnomalyMonitor() {
  {
    absl::MutexLock lock(&queue_mutex_);
    stopping_ = true;
  }
  worker_.Join();
}

void AnomalyMonitor::ObserveExecution(ExecutionRecord record) {
  Observation observation;
  observation.execution = std::move(record);
  Enqueue(std::move(observation));
}

void AnomalyMonitor::ObserveEvent(SecurityEvent event) {
  Observation observation;
  observation.event = std::move(event);
  Enqueue(std::move(observation));
}

void AnomalyMonitor::Enqueue(Observation observation) {
  absl::MutexLock lock(&queue_mutex_);
  if (queue_.size() >= options_.max_history) {
    // The worker fell behind; analysis is best-effort.
    VLOG(1) << "Anomaly queue full, dropping an observation";
    return;
  }
  queue_.push_back(std::move(observation));
}

bool AnomalyMonitor::HasWork() const { return stopping_ || !queue_.empty(); }

bool AnomalyMonitor::Idle() const { return queue_.empty() && !busy_; }

void AnomalyMonitor::Drain() {
  absl::MutexLock lock(&queue_mutex_);
  queue_mutex_.Await(absl::Condition(this, &AnomalyMonitor::Idle));
}

void AnomalyMonitor::Run() {
  for (;;) {
    std::vector<Observation> batch;
    {
      absl::MutexLock lock(&queue_mutex_);
      queue_mutex_.Await(absl::Condition(this, &AnomalyMonitor::HasWork));
      if (stopping_) {
        return;
      }
      batch.swap(queue_);
      busy_ = true;
    }
    const absl::Time now = clock_->Now();
    for (const std::string& principal_id : Absorb(std::move(batch), now)) {
      Evaluate(principal_id, now);
    }
    absl::MutexLock lock(&queue_mutex_);
    busy_ = false;
  }
}

std::vector<std::string> AnomalyMonitor::Absorb(
    std::vector<Observation> batch, absl::Time now) {
  absl::flat_hash_set<std::string> touched;
  absl::MutexLock lock(&state_mutex_);
  for (Observation& observation : batch) {
    if (observation.execution.has_value()) {
      History& history = history_[observation.execution->principal_id()];
      touched.insert(observation.execution->principal_id());
      history.executions.push_back(*std::move(observation.execution));
    } else if (observation.event.has_value()) {
      History& history = history_[observation.event->principal_id()];
      touched.insert(observation.event->principal_id());
      history.events.push_back(*std::move(observation.event));
    }
  }
  std::vector<std::string> principals;
  for (const std::string& principal_id : touched) {
    auto it = history_.find(principal_id);
    if (TrimLocked(it->second, now)) {
      // Observations that arrive already outside the baseline window.
      history_.erase(it);
      continue;
    }
    principals.push_back(principal_id);
  }
  if (++batches_since_gc_ >= kGarbageCollectionPeriod) {
    CollectGarbageLocked(now);
  }
  std::sort(principals.begin(), principals.end());
  return principals;
}

bool AnomalyMonitor::TrimLocked(History& history, absl::Time now) const {
  const absl::Time horizon = now - options_.detector.baseline_window;
  while (!history.executions.empty() &&
         (history.executions.size() > options_.max_history ||
          absl::FromUnixMicros(
              history.executions.front().start_time_unix_micros()) <
              horizon)) {
    history.executions.pop_front();
  }
  while (!history.events.empty() &&
         (history.events.size() > options_.max_history ||
          absl::FromUnixMicros(history.events.front().time_unix_micros()) <
              horizon)) {
    history.events.pop_front();
  }
  return history.executions.empty() && history.events.empty();
}

int AnomalyMonitor::CollectGarbage() {
  const absl::Time now = clock_->Now();
  absl::MutexLock lock(&state_mutex_);
  return CollectGarbageLocked(now);
}

int AnomalyMonitor::CollectGarbageLocked(absl::Time now) {
  batches_since_gc_ = 0;
  int removed = 0;
  for (auto it = history_.begin(); it != history_.end();) {
    if (TrimLocked(it->second, now)) {
      history_.erase(it++);
      ++removed;
    } else {
      ++it;
    }
  }
  for (auto it = last_flagged_.begin(); it != last_flagged_.end();) {
    if (now - it->second >= options_.detector.window) {
      last_flagged_.erase(it++);
      ++removed;
    } else {
      ++it;
    }
  }
  // Flags are kept oldest first.
  const absl::Time retention_start = now - options_.flag_retention;
  auto first_kept = std::find_if(
      flags_.begin(), flags_.end(), [retention_start](const AnomalyFlag& flag) {
        return absl::FromUnixMicros(flag.generate_time_unix_micros()) >=
               retention_start;
      });
  size_t drop = first_kept - flags_.begin();
  if (flags_.size() - drop > options_.max_flags) {
    drop = flags_.size() - options_.max_flags;
  }
  flags_.erase(flags_.begin(), flags_.begin() + drop);
  removed += static_cast<int>(drop);
  if (removed > 0) {
    VLOG(1) << "Collected " << removed << " expired anomaly entries";
  }
  return removed;
}

size_t AnomalyMonitor::TrackedPrincipals() const {
  absl::MutexLock lock(&state_mutex_);
  return history_.size();
}

void AnomalyMonitor::Evaluate(const std::string& principal_id,
                              absl::Time now) {
  std::vector<AnomalyFlag> raised;
  {
    absl::MutexLock lock(&state_mutex_);
    auto it = history_.find(principal_id);
    if (it == history_.end()) {
      return;
    }
    const History& history = it->second;
    const std::vector<SecurityEvent> events(history.events.begin(),
                                            history.events.end());
    const std::vector<ExecutionRecord> executions(history.executions.begin(),
                                                  history.executions.end());
    for (AnomalyFlag& flag :
         detector_.Analyze(principal_id, events, executions, now)) {
      // One flag per kind and principal per window.
      auto key = std::make_pair(principal_id, static_cast<int>(flag.kind()));
      auto it = last_flagged_.find(key);
      if (it != last_flagged_.end() &&
          now - it->second < options_.detector.window) {
        continue;
      }
      last_flagged_[key] = now;
      LOG(WARNING) << "Anomaly " << AnomalyKindName(flag.kind())
                   << " for principal " << principal_id;
      if (!flags_.empty() && flags_.size() >= options_.max_flags) {
        flags_.erase(flags_.begin());
      }
      flags_.push_back(flag);
      raised.push_back(std::move(flag));
    }
  }
  if (options_.feedback && rate_limiter_ != nullptr && !raised.empty()) {
    rate_limiter_->Tighten(principal_id, RateAction::kExecute,
                           options_.tightened_execute_limit,
                           now + options_.detector.window);
  }
}

std::vector<AnomalyFlag> AnomalyMonitor::Flags(
    absl::string_view principal_id) const {
  absl::MutexLock lock(&state_mutex_);
  std::vector<AnomalyFlag> flags;
  for (const AnomalyFlag& flag : flags_) {
    if (principal_id.empty() || flag.principal_id() == principal_id) {
      flags.push_back(flag);
    }
  }
  return flags;
}

}  // namespace toolguard
