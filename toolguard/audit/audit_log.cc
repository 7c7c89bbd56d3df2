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

#include "toolguard/audit/audit_log.h"

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/log/log.h"
#include "absl/memory/memory.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"
#include "toolguard/flags.h"
#include "toolguard/toolguard.pb.h"
#include "toolguard/util/record_file.h"
#include "toolguard/util/status_macros.h"
#include "toolguard/util/thread.h"

namespace toolguard {
namespace {

constexpr absl::string_view kMissingExcerpt = "<no code excerpt>";

bool Matches(const SecurityEvent& event, const EventQuery& query) {
  if (query.principal_id.has_value() &&
      event.principal_id() != *query.principal_id) {
    return false;
  }
  if (query.tool_id.has_value() && event.tool_id() != *query.tool_id) {
    return false;
  }
  if (query.type.has_value() && event.type() != *query.type) {
    return false;
  }
  if (event.severity() < query.min_severity) {
    return false;
  }
  const absl::Time time = absl::FromUnixMicros(event.time_unix_micros());
  return time >= query.start && time < query.end;
}

}  // namespace

Severity ValidationFailureSeverity(bool high_risk) {
  return high_risk ? MEDIUM : LOW;
}

Severity SandboxViolationSeverity(bool killed_by_syscall_filter) {
  return killed_by_syscall_filter ? CRITICAL : HIGH;
}

Severity ResourceExceededSeverity(int prior_exceedances) {
  return prior_exceedances > 0 ? HIGH : MEDIUM;
}

Severity DefaultSeverity(EventType type) {
  switch (type) {
    case VALIDATION_FAILURE:
    case RATE_LIMITED:
      return LOW;
    case RESOURCE_EXCEEDED:
      return MEDIUM;
    case SANDBOX_VIOLATION:
      return HIGH;
    case TOOL_DISABLED:
      return CRITICAL;
    default:
      return MEDIUM;
  }
}

absl::string_view EventTypeName(EventType type) {
  switch (type) {
    case VALIDATION_FAILURE:
      return "validation_failure";
    case SANDBOX_VIOLATION:
      return "sandbox_violation";
    case RESOURCE_EXCEEDED:
      return "resource_exceeded";
    case RATE_LIMITED:
      return "rate_limited";
    case TOOL_DISABLED:
      return "tool_disabled";
    default:
      return "unspecified";
  }
}

absl::string_view SeverityName(Severity severity) {
  switch (severity) {
    case LOW:
      return "low";
    case MEDIUM:
      return "medium";
    case HIGH:
      return "high";
    case CRITICAL:
      return "critical";
    default:
      return "unspecified";
  }
}

std::string NormalizeExcerpt(absl::string_view excerpt) {
  if (excerpt.size() > kMaxExcerptSize) {
    size_t size = kMaxExcerptSize;
    // Back off over UTF-8 continuation bytes.
    while (size > 0 && (static_cast<unsigned char>(excerpt[size]) & 0xC0) ==
                           0x80) {
      --size;
    }
    excerpt = excerpt.substr(0, size);
  }
  if (excerpt.empty()) {
    return std::string(kMissingExcerpt);
  }
  return std::string(excerpt);
}

AuditLog::Options AuditLog::Options::FromFlags() {
  Options options;
  options.path = absl::GetFlag(FLAGS_toolguard_audit_log_path);
  options.memory_only = absl::GetFlag(FLAGS_toolguard_audit_memory_only);
  options.flush_interval = absl::GetFlag(FLAGS_toolguard_audit_flush_interval);
  options.buffer_size = absl::GetFlag(FLAGS_toolguard_audit_buffer_size);
  return options;
}

absl::StatusOr<std::unique_ptr<AuditLog>> AuditLog::Create(
    Options options, util::Clock* clock) {
  if (options.path.empty() && !options.memory_only) {
    return absl::FailedPreconditionError(
        "the audit log needs a file to persist critical events to");
  }
  std::vector<SecurityEvent> existing;
  std::unique_ptr<util::RecordWriter> writer;
  if (!options.path.empty()) {
    TOOLGUARD_ASSIGN_OR_RETURN(existing, ReadEventFile(options.path));
    TOOLGUARD_ASSIGN_OR_RETURN(writer, util::RecordWriter::Open(options.path));
  }
  auto log = absl::WrapUnique(
      new AuditLog(std::move(options), clock, std::move(writer)));
  {
    absl::MutexLock lock(&log->mutex_);
    log->events_ = std::move(existing);
    log->next_sequence_ = log->events_.size();
  }
  if (log->writer_ != nullptr) {
    log->flusher_ =
        util::Thread(log.get(), &AuditLog::FlushLoop, "toolguard-audit");
    LOG(INFO) << "Audit log " << log->writer_->path() << " opened with "
              << log->size() << " existing events";
  } else {
    LOG(WARNING) << "Audit log is memory-only; critical events are not "
                    "durable";
  }
  return log;
}

AuditLog::~AuditLog() {
  {
    absl::MutexLock lock(&mutex_);
    stopping_ = true;
  }
  if (flusher_.IsJoinable()) {
    flusher_.Join();
  }
  if (absl::Status status = Flush(); !status.ok()) {
    LOG(ERROR) << "Dropping buffered security events: " << status;
  }
}

bool AuditLog::FlushDue() const {
  return stopping_ ||
         pending_.size() >= static_cast<size_t>(options_.buffer_size);
}

void AuditLog::FlushLoop() {
  for (;;) {
    {
      absl::MutexLock lock(&mutex_);
      mutex_.AwaitWithTimeout(absl::Condition(this, &AuditLog::FlushDue),
                              options_.flush_interval);
      if (stopping_) {
        return;
      }
    }
    if (absl::Status status = Flush(); !status.ok()) {
      LOG(ERROR) << "Flushing security events failed: " << status;
    }
  }
}

void AuditLog::AssignId(SecurityEvent& event, absl::Time now) {
  event.set_event_id(
      absl::StrCat("ev-", absl::ToUnixMicros(now), "-", next_sequence_++));
}

absl::StatusOr<SecurityEvent> AuditLog::Record(SecurityEvent event) {
  const absl::Time now = clock_->Now();
  if (event.time_unix_micros() == 0) {
    event.set_time_unix_micros(absl::ToUnixMicros(now));
  }
  if (event.severity() == SEVERITY_UNSPECIFIED) {
    event.set_severity(DefaultSeverity(event.type()));
  }
  event.set_code_excerpt(NormalizeExcerpt(event.code_excerpt()));

  absl::Status persisted = absl::OkStatus();
  if (writer_ != nullptr && event.severity() == CRITICAL) {
    // Holding flush_mutex_ from id assignment to the write keeps later events
    // behind this one in the file.
    absl::MutexLock flush_lock(&flush_mutex_);
    std::vector<SecurityEvent> batch;
    {
      absl::MutexLock lock(&mutex_);
      AssignId(event, now);
      events_.push_back(event);
      // Earlier buffered events go first.
      batch.swap(pending_);
    }
    batch.push_back(event);
    persisted = WriteEvents(std::move(batch));
    if (persisted.ok()) {
      persisted = writer_->Sync();
    }
  } else {
    absl::MutexLock lock(&mutex_);
    AssignId(event, now);
    events_.push_back(event);
    if (writer_ != nullptr) {
      pending_.push_back(event);
    }
  }

  if (event.severity() >= HIGH) {
    LOG(WARNING) << "Security event " << event.event_id() << ": "
                 << EventTypeName(event.type()) << " ("
                 << SeverityName(event.severity()) << ") principal="
                 << event.principal_id() << " tool=" << event.tool_id();
  } else {
    VLOG(1) << "Security event " << event.event_id() << ": "
            << EventTypeName(event.type());
  }
  if (!persisted.ok()) {
    LOG(ERROR) << "Critical security event " << event.event_id()
               << " not persisted: " << persisted;
    return persisted;
  }
  return event;
}

absl::Status AuditLog::WriteEvents(std::vector<SecurityEvent> batch) {
  for (size_t i = 0; i < batch.size(); ++i) {
    if (absl::Status status = writer_->Append(batch[i], /*sync=*/false);
        !status.ok()) {
      // Keep the unwritten tail for the next attempt.
      absl::MutexLock lock(&mutex_);
      pending_.insert(pending_.begin(),
                      std::make_move_iterator(batch.begin() + i),
                      std::make_move_iterator(batch.end()));
      return status;
    }
  }
  return absl::OkStatus();
}

absl::Status AuditLog::WritePending() {
  std::vector<SecurityEvent> pending;
  {
    absl::MutexLock lock(&mutex_);
    pending.swap(pending_);
  }
  const size_t count = pending.size();
  TOOLGUARD_RETURN_IF_ERROR(WriteEvents(std::move(pending)));
  if (count > 0) {
    VLOG(2) << "Wrote " << count << " buffered security events";
  }
  return absl::OkStatus();
}

absl::Status AuditLog::Flush() {
  if (writer_ == nullptr) {
    return absl::OkStatus();
  }
  absl::MutexLock flush_lock(&flush_mutex_);
  TOOLGUARD_RETURN_IF_ERROR(WritePending());
  return writer_->Sync();
}

std::vector<SecurityEvent> AuditLog::Query(const EventQuery& query) const {
  absl::ReaderMutexLock lock(&mutex_);
  std::vector<SecurityEvent> matches;
  for (const SecurityEvent& event : events_) {
    if (Matches(event, query)) {
      matches.push_back(event);
    }
  }
  if (query.limit > 0 && matches.size() > query.limit) {
    matches.erase(matches.begin(), matches.end() - query.limit);
  }
  return matches;
}

size_t AuditLog::size() const {
  absl::ReaderMutexLock lock(&mutex_);
  return events_.size();
}

absl::StatusOr<std::vector<SecurityEvent>> AuditLog::ReadEventFile(
    const std::string& path) {
  std::vector<SecurityEvent> events;
  TOOLGUARD_RETURN_IF_ERROR(util::ReadRecordsAs<SecurityEvent>(
      path, [&events](SecurityEvent event) {
        events.push_back(std::move(event));
        return absl::OkStatus();
      }));
  return events;
}

}  // namespace toolguard
