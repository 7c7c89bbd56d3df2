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

#include "toolguard/ratelimit/rate_limiter.h"

#include <algorithm>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"
#include "toolguard/errors.h"
#include "toolguard/flags.h"

namespace toolguard {
namespace {

// Admissions between two garbage collection sweeps.
constexpr int kGarbageCollectionPeriod = 1024;

}  // namespace

absl::string_view RateActionName(RateAction action) {
  switch (action) {
    case RateAction::kCreate:
      return "create";
    case RateAction::kExecute:
      return "execute";
  }
  return "unknown";
}

RateLimiter::Options RateLimiter::Options::FromFlags() {
  Options options;
  options.create_limit = absl::GetFlag(FLAGS_toolguard_create_limit);
  options.execute_limit = absl::GetFlag(FLAGS_toolguard_execute_limit);
  options.window = absl::GetFlag(FLAGS_toolguard_rate_window);
  return options;
}

int RateLimiter::ConfiguredLimit(RateAction action) const {
  return action == RateAction::kCreate ? options_.create_limit
                                       : options_.execute_limit;
}

int RateLimiter::EffectiveLimit(const Window& window, RateAction action,
                                absl::Time now) const {
  int limit = ConfiguredLimit(action);
  if (window.tightened_limit.has_value() && now < window.tightened_until) {
    limit = std::min(limit, *window.tightened_limit);
  }
  return limit;
}

bool RateLimiter::Expired(const Window& window, absl::Time now) const {
  return now >= window.start + options_.window &&
         now >= window.tightened_until;
}

absl::Status RateLimiter::Admit(absl::string_view principal_id,
                                RateAction action) {
  const absl::Time now = clock_->Now();
  absl::MutexLock lock(&mutex_);
  if (++admissions_since_gc_ >= kGarbageCollectionPeriod) {
    CollectGarbageLocked(now);
  }
  Window& window = windows_[Key(std::string(principal_id), action)];
  if (now >= window.start + options_.window) {
    window.start = now;
    window.count = 0;
  }
  const int limit = EffectiveLimit(window, action, now);
  if (window.count >= limit) {
    absl::Time reopens = window.start + options_.window;
    if (window.count < ConfiguredLimit(action)) {
      // Only the tightening is in the way.
      reopens = std::min(reopens, window.tightened_until);
    }
    const absl::Duration retry_after = reopens - now;
    VLOG(1) << "Rate limited " << principal_id << " ("
            << RateActionName(action) << ", " << window.count << "/" << limit
            << ")";
    return RateLimitExceededError(
        absl::StrCat(RateActionName(action), " limit of ", limit, " per ",
                     absl::FormatDuration(options_.window), " reached"),
        retry_after);
  }
  ++window.count;
  return absl::OkStatus();
}

void RateLimiter::Tighten(absl::string_view principal_id, RateAction action,
                          int limit, absl::Time until) {
  absl::MutexLock lock(&mutex_);
  Window& window = windows_[Key(std::string(principal_id), action)];
  window.tightened_limit = std::max(0, limit);
  window.tightened_until = until;
  LOG(INFO) << "Tightened " << RateActionName(action) << " limit of "
            << principal_id << " to " << limit << " until " << until;
}

void RateLimiter::Reset(absl::string_view principal_id) {
  absl::MutexLock lock(&mutex_);
  for (RateAction action : {RateAction::kCreate, RateAction::kExecute}) {
    windows_.erase(Key(std::string(principal_id), action));
  }
}

void RateLimiter::ResetAll() {
  absl::MutexLock lock(&mutex_);
  windows_.clear();
}

std::vector<RateLimiter::WindowSnapshot> RateLimiter::Snapshot() {
  const absl::Time now = clock_->Now();
  absl::MutexLock lock(&mutex_);
  std::vector<WindowSnapshot> snapshot;
  snapshot.reserve(windows_.size());
  for (const auto& [key, window] : windows_) {
    if (Expired(window, now)) {
      continue;
    }
    WindowSnapshot entry;
    entry.principal_id = key.first;
    entry.action = key.second;
    entry.window_start = window.start;
    entry.count = now < window.start + options_.window ? window.count : 0;
    entry.limit = EffectiveLimit(window, key.second, now);
    if (window.tightened_limit.has_value() && now < window.tightened_until) {
      entry.tightened_until = window.tightened_until;
    }
    snapshot.push_back(std::move(entry));
  }
  std::sort(snapshot.begin(), snapshot.end(),
            [](const WindowSnapshot& a, const WindowSnapshot& b) {
              return std::tie(a.principal_id, a.action) <
                     std::tie(b.principal_id, b.action);
            });
  return snapshot;
}

int RateLimiter::CollectGarbage() {
  const absl::Time now = clock_->Now();
  absl::MutexLock lock(&mutex_);
  return CollectGarbageLocked(now);
}

int RateLimiter::CollectGarbageLocked(absl::Time now) {
  admissions_since_gc_ = 0;
  int removed = 0;
  for (auto it = windows_.begin(); it != windows_.end();) {
    if (Expired(it->second, now)) {
      windows_.erase(it++);
      ++removed;
    } else {
      ++it;
    }
  }
  if (removed > 0) {
    VLOG(1) << "Collected " << removed << " expired rate windows";
  }
  return removed;
}

}  // namespace toolguard
