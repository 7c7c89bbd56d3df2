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

// The toolguard::AuditLog keeps the security event history: an in-memory
// index for operator queries plus an optional append-only file of
// length-delimited SecurityEvent records.
//
// Critical events are written and synced before Record() returns; a failure
// to persist one is reported to the caller, which must fail closed. Other
// events are buffered and flushed by a background thread.

#ifndef TOOLGUARD_AUDIT_AUDIT_LOG_H_
#define TOOLGUARD_AUDIT_AUDIT_LOG_H_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"
#include "toolguard/toolguard.pb.h"
#include "toolguard/util/clock.h"
#include "toolguard/util/record_file.h"
#include "toolguard/util/thread.h"

namespace toolguard {

// Longest code excerpt stored with an event, in bytes.
inline constexpr size_t kMaxExcerptSize = 500;

// Severity policy.
Severity ValidationFailureSeverity(bool high_risk);
Severity SandboxViolationSeverity(bool killed_by_syscall_filter);
// `prior_exceedances` counts earlier resource breaches of the same tool.
Severity ResourceExceededSeverity(int prior_exceedances);
// Severity used when an event is recorded without one.
Severity DefaultSeverity(EventType type);

absl::string_view EventTypeName(EventType type);
absl::string_view SeverityName(Severity severity);

// Cuts `excerpt` to kMaxExcerptSize bytes on a UTF-8 boundary. An empty
// excerpt is replaced by a placeholder.
std::string NormalizeExcerpt(absl::string_view excerpt);

struct EventQuery {
  std::optional<std::string> principal_id;
  std::optional<std::string> tool_id;
  std::optional<EventType> type;
  Severity min_severity = SEVERITY_UNSPECIFIED;
  // Half-open time range [start, end).
  absl::Time start = absl::InfinitePast();
  absl::Time end = absl::InfiniteFuture();
  // Keeps only the most recent `limit` matches; 0 keeps all.
  size_t limit = 0;
};

class AuditLog {
 public:
  struct Options {
    // Append-only event file. Required unless `memory_only` is set.
    std::string path;
    // Keeps events in memory only, so critical events are not durable.
    bool memory_only = false;
    absl::Duration flush_interval = absl::Seconds(1);
    // Number of buffered events that triggers an early flush.
    int buffer_size = 256;

    static Options FromFlags();
  };

  // Opens the log, loading previously persisted events into the index. Fails
  // without a path unless the options ask for a memory-only log. `clock` must
  // outlive the log.
  static absl::StatusOr<std::unique_ptr<AuditLog>> Create(Options options,
                                                         util::Clock* clock);

  AuditLog(const AuditLog&) = delete;
  AuditLog& operator=(const AuditLog&) = delete;

  // Drains buffered events.
  ~AuditLog();

  // Assigns id, timestamp and default severity where missing, normalizes the
  // excerpt and appends the event. Returns the stored event. Event ids follow
  // the order of the file and of Query() results.
  absl::StatusOr<SecurityEvent> Record(SecurityEvent event);

  // Matching events in recording order.
  std::vector<SecurityEvent> Query(const EventQuery& query) const;

  // Writes and syncs every buffered event.
  absl::Status Flush();

  size_t size() const;

  // Reads every event of an event file.
  static absl::StatusOr<std::vector<SecurityEvent>> ReadEventFile(
      const std::string& path);

 private:
  AuditLog(Options options, util::Clock* clock,
           std::unique_ptr<util::RecordWriter> writer)
      : options_(std::move(options)),
        clock_(clock),
        writer_(std::move(writer)) {}

  void FlushLoop();
  void AssignId(SecurityEvent& event, absl::Time now)
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);
  // Writes `batch` without syncing. On failure the unwritten tail goes back
  // to the front of the buffer.
  absl::Status WriteEvents(std::vector<SecurityEvent> batch)
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(flush_mutex_);
  // Moves buffered events to the file without syncing it.
  absl::Status WritePending() ABSL_EXCLUSIVE_LOCKS_REQUIRED(flush_mutex_);
  bool FlushDue() const ABSL_SHARED_LOCKS_REQUIRED(mutex_);

  const Options options_;
  util::Clock* clock_;
  // Null for memory-only logs.
  const std::unique_ptr<util::RecordWriter> writer_;

  mutable absl::Mutex mutex_;
  std::vector<SecurityEvent> events_ ABSL_GUARDED_BY(mutex_);
  std::vector<SecurityEvent> pending_ ABSL_GUARDED_BY(mutex_);
  uint64_t next_sequence_ ABSL_GUARDED_BY(mutex_) = 0;
  bool stopping_ ABSL_GUARDED_BY(mutex_) = false;

  // Serializes writers so buffered events reach the file in order.
  absl::Mutex flush_mutex_ ABSL_ACQUIRED_BEFORE(mutex_);

  util::Thread flusher_;
};

}  // namespace toolguard

#endif  // TOOLGUARD_AUDIT_AUDIT_LOG_H_
