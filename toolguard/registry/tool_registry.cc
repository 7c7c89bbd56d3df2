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

#include "toolguard/registry/tool_registry.h"

#include <algorithm>
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
#include "toolguard/errors.h"
#include "toolguard/flags.h"
#include "toolguard/toolguard.pb.h"
#include "toolguard/util/record_file.h"
#include "toolguard/util/status_macros.h"

namespace toolguard {

ToolRegistry::Options ToolRegistry::Options::FromFlags() {
  Options options;
  options.journal_path = absl::GetFlag(FLAGS_toolguard_registry_journal_path);
  options.violation_disable_threshold =
      absl::GetFlag(FLAGS_toolguard_violation_disable_threshold);
  options.resource_disable_threshold =
      absl::GetFlag(FLAGS_toolguard_resource_disable_threshold);
  options.require_write_approval =
      absl::GetFlag(FLAGS_toolguard_require_write_approval);
  return options;
}

absl::StatusOr<std::unique_ptr<ToolRegistry>> ToolRegistry::Create(
    Options options, util::Clock* clock) {
  std::unique_ptr<util::RecordWriter> journal;
  const std::string path = options.journal_path;
  if (!path.empty()) {
    TOOLGUARD_ASSIGN_OR_RETURN(journal, util::RecordWriter::Open(path));
  }
  auto registry = absl::WrapUnique(
      new ToolRegistry(std::move(options), clock, std::move(journal)));
  if (!path.empty()) {
    absl::MutexLock lock(&registry->mutex_);
    TOOLGUARD_RETURN_IF_ERROR(util::ReadRecordsAs<ToolDefinition>(
        path, [&](ToolDefinition definition) {
          registry->mutex_.AssertHeld();
          return registry->Replay(std::move(definition));
        }));
    registry->next_sequence_ = registry->tools_.size();
    LOG(INFO) << "Tool registry " << path << " replayed "
              << registry->tools_.size() << " tools";
  }
  return registry;
}

absl::Status ToolRegistry::Replay(ToolDefinition definition) {
  Entry& entry = tools_[definition.tool_id()];
  const int current =
      entry.versions.empty() ? 0 : entry.versions.back().version();
  if (definition.version() == current + 1) {
    names_[{definition.principal_id(), definition.name()}] =
        definition.tool_id();
    entry.versions.push_back(std::move(definition));
  } else if (definition.version() == current && current > 0) {
    // Status change of the current version.
    entry.versions.back() = std::move(definition);
  } else {
    return absl::DataLossError(absl::StrCat(
        "journal has version ", definition.version(), " of ",
        definition.tool_id(), " after version ", current));
  }
  return absl::OkStatus();
}

absl::Status ToolRegistry::Journal(const ToolDefinition& definition) {
  if (journal_ == nullptr) {
    return absl::OkStatus();
  }
  return journal_->Append(definition, /*sync=*/true);
}

ToolStatus ToolRegistry::InitialStatus(
    CapabilityClass capability_class) const {
  return options_.require_write_approval && capability_class == READ_WRITE
             ? PENDING_APPROVAL
             : ACTIVE;
}

absl::StatusOr<ToolRegistry::Entry*> ToolRegistry::Find(
    absl::string_view tool_id) {
  auto it = tools_.find(tool_id);
  if (it == tools_.end()) {
    return ToolNotFoundError(absl::StrCat("no tool ", tool_id));
  }
  return &it->second;
}

absl::StatusOr<const ToolRegistry::Entry*> ToolRegistry::Find(
    absl::string_view tool_id) const {
  auto it = tools_.find(tool_id);
  if (it == tools_.end()) {
    return ToolNotFoundError(absl::StrCat("no tool ", tool_id));
  }
  return &it->second;
}

absl::StatusOr<ToolDefinition> ToolRegistry::AddVersion(
    Entry& entry, absl::string_view source, CapabilityClass capability_class) {
  ToolDefinition definition = entry.versions.back();
  if (definition.status() == DISABLED) {
    return ToolDisabledError(absl::StrCat(definition.tool_id(),
                                          " is disabled: ",
                                          definition.disabled_reason()));
  }
  definition.set_source(std::string(source));
  definition.set_capability_class(capability_class);
  definition.set_version(definition.version() + 1);
  definition.set_create_time_unix_micros(absl::ToUnixMicros(clock_->Now()));
  definition.set_status(InitialStatus(capability_class));
  definition.clear_disabled_reason();
  definition.clear_reviewed_by();
  definition.clear_review_time_unix_micros();
  TOOLGUARD_RETURN_IF_ERROR(Journal(definition));
  entry.versions.push_back(definition);
  LOG(INFO) << "Tool " << definition.tool_id() << " updated to version "
            << definition.version();
  return definition;
}

absl::StatusOr<ToolDefinition> ToolRegistry::Register(
    absl::string_view principal_id, absl::string_view name,
    absl::string_view source, CapabilityClass capability_class) {
  absl::MutexLock lock(&mutex_);
  auto key = std::make_pair(std::string(principal_id), std::string(name));
  if (auto it = names_.find(key); it != names_.end()) {
    TOOLGUARD_ASSIGN_OR_RETURN(Entry * entry, Find(it->second));
    return AddVersion(*entry, source, capability_class);
  }

  const absl::Time now = clock_->Now();
  ToolDefinition definition;
  definition.set_tool_id(
      absl::StrCat("tool-", absl::ToUnixMicros(now), "-", next_sequence_));
  definition.set_principal_id(key.first);
  definition.set_name(key.second);
  definition.set_source(std::string(source));
  definition.set_capability_class(capability_class);
  definition.set_version(1);
  definition.set_create_time_unix_micros(absl::ToUnixMicros(now));
  definition.set_status(InitialStatus(capability_class));
  TOOLGUARD_RETURN_IF_ERROR(Journal(definition));

  ++next_sequence_;
  names_[key] = definition.tool_id();
  tools_[definition.tool_id()].versions.push_back(definition);
  LOG(INFO) << "Registered tool " << definition.tool_id() << " (" << name
            << ") for " << principal_id
            << (definition.status() == PENDING_APPROVAL ? ", pending approval"
                                                        : "");
  return definition;
}

absl::StatusOr<ToolDefinition> ToolRegistry::Update(
    absl::string_view tool_id, absl::string_view principal_id,
    absl::string_view source, CapabilityClass capability_class) {
  absl::MutexLock lock(&mutex_);
  TOOLGUARD_ASSIGN_OR_RETURN(Entry * entry, Find(tool_id));
  if (entry->versions.back().principal_id() != principal_id) {
    // Other principals' tools are indistinguishable from missing ones.
    return ToolNotFoundError(absl::StrCat("no tool ", tool_id));
  }
  return AddVersion(*entry, source, capability_class);
}

absl::StatusOr<ToolDefinition> ToolRegistry::Get(
    absl::string_view tool_id) const {
  absl::ReaderMutexLock lock(&mutex_);
  TOOLGUARD_ASSIGN_OR_RETURN(const Entry* entry, Find(tool_id));
  return entry->versions.back();
}

absl::StatusOr<std::vector<ToolDefinition>> ToolRegistry::History(
    absl::string_view tool_id) const {
  absl::ReaderMutexLock lock(&mutex_);
  TOOLGUARD_ASSIGN_OR_RETURN(const Entry* entry, Find(tool_id));
  return entry->versions;
}

std::vector<ToolDefinition> ToolRegistry::List(
    absl::string_view principal_id) const {
  absl::ReaderMutexLock lock(&mutex_);
  std::vector<ToolDefinition> tools;
  for (const auto& [id, entry] : tools_) {
    if (entry.versions.back().principal_id() == principal_id) {
      tools.push_back(entry.versions.back());
    }
  }
  std::sort(tools.begin(), tools.end(),
            [](const ToolDefinition& a, const ToolDefinition& b) {
              return a.tool_id() < b.tool_id();
            });
  return tools;
}

absl::StatusOr<ToolDefinition> ToolRegistry::SetStatus(
    Entry& entry, ToolStatus status, absl::string_view reason) {
  ToolDefinition definition = entry.versions.back();
  definition.set_status(status);
  definition.set_disabled_reason(std::string(reason));
  TOOLGUARD_RETURN_IF_ERROR(Journal(definition));
  entry.versions.back() = definition;
  return definition;
}

absl::StatusOr<ToolDefinition> ToolRegistry::Disable(
    absl::string_view tool_id, absl::string_view reason) {
  absl::MutexLock lock(&mutex_);
  TOOLGUARD_ASSIGN_OR_RETURN(Entry * entry, Find(tool_id));
  TOOLGUARD_ASSIGN_OR_RETURN(ToolDefinition definition,
                             SetStatus(*entry, DISABLED, reason));
  LOG(WARNING) << "Tool " << tool_id << " disabled: " << reason;
  return definition;
}

absl::StatusOr<ToolDefinition> ToolRegistry::Enable(absl::string_view tool_id) {
  absl::MutexLock lock(&mutex_);
  TOOLGUARD_ASSIGN_OR_RETURN(Entry * entry, Find(tool_id));
  if (entry->versions.back().status() != DISABLED) {
    return absl::FailedPreconditionError(
        absl::StrCat(tool_id, " is not disabled"));
  }
  TOOLGUARD_ASSIGN_OR_RETURN(ToolDefinition definition,
                             SetStatus(*entry, ACTIVE, ""));
  entry->stats.violations = 0;
  entry->stats.resource_exceedances = 0;
  LOG(INFO) << "Tool " << tool_id << " enabled";
  return definition;
}

absl::StatusOr<ToolDefinition> ToolRegistry::Review(
    absl::string_view tool_id, ToolStatus status, absl::string_view reviewer,
    absl::string_view reason) {
  const absl::Time now = clock_->Now();
  absl::MutexLock lock(&mutex_);
  TOOLGUARD_ASSIGN_OR_RETURN(Entry * entry, Find(tool_id));
  ToolDefinition definition = entry->versions.back();
  if (definition.status() != PENDING_APPROVAL) {
    return absl::FailedPreconditionError(
        absl::StrCat(tool_id, " is not awaiting approval"));
  }
  definition.set_status(status);
  definition.set_disabled_reason(std::string(reason));
  definition.set_reviewed_by(std::string(reviewer));
  definition.set_review_time_unix_micros(absl::ToUnixMicros(now));
  TOOLGUARD_RETURN_IF_ERROR(Journal(definition));
  entry->versions.back() = definition;
  LOG(INFO) << "Tool " << tool_id << " v" << definition.version() << " "
            << (status == ACTIVE ? "approved" : "rejected") << " by "
            << reviewer;
  return definition;
}

absl::StatusOr<ToolDefinition> ToolRegistry::Approve(
    absl::string_view tool_id, absl::string_view reviewer) {
  return Review(tool_id, ACTIVE, reviewer, "");
}

absl::StatusOr<ToolDefinition> ToolRegistry::Reject(
    absl::string_view tool_id, absl::string_view reviewer,
    absl::string_view reason) {
  return Review(tool_id, REJECTED, reviewer, reason);
}

std::vector<ToolDefinition> ToolRegistry::PendingApprovals() const {
  absl::ReaderMutexLock lock(&mutex_);
  std::vector<ToolDefinition> pending;
  for (const auto& [id, entry] : tools_) {
    if (entry.versions.back().status() == PENDING_APPROVAL) {
      pending.push_back(entry.versions.back());
    }
  }
  std::sort(pending.begin(), pending.end(),
            [](const ToolDefinition& a, const ToolDefinition& b) {
              if (a.create_time_unix_micros() != b.create_time_unix_micros()) {
                return a.create_time_unix_micros() <
                       b.create_time_unix_micros();
              }
              return a.tool_id() < b.tool_id();
            });
  return pending;
}

absl::StatusOr<ToolStats> ToolRegistry::Stats(absl::string_view tool_id) const {
  absl::ReaderMutexLock lock(&mutex_);
  TOOLGUARD_ASSIGN_OR_RETURN(const Entry* entry, Find(tool_id));
  return entry->stats;
}

absl::Status ToolRegistry::RecordInvocation(absl::string_view tool_id,
                                            bool failed) {
  const absl::Time now = clock_->Now();
  absl::MutexLock lock(&mutex_);
  TOOLGUARD_ASSIGN_OR_RETURN(Entry * entry, Find(tool_id));
  ++entry->stats.invocations;
  if (failed) {
    ++entry->stats.failures;
  }
  entry->stats.last_used = now;
  return absl::OkStatus();
}

absl::StatusOr<Strike> ToolRegistry::RecordViolation(
    absl::string_view tool_id) {
  return AddStrike(tool_id, /*violation=*/true);
}

absl::StatusOr<Strike> ToolRegistry::RecordResourceExceeded(
    absl::string_view tool_id) {
  return AddStrike(tool_id, /*violation=*/false);
}

absl::StatusOr<Strike> ToolRegistry::AddStrike(absl::string_view tool_id,
                                               bool violation) {
  absl::MutexLock lock(&mutex_);
  TOOLGUARD_ASSIGN_OR_RETURN(Entry * entry, Find(tool_id));
  int& counter = violation ? entry->stats.violations
                           : entry->stats.resource_exceedances;
  const int threshold = violation ? options_.violation_disable_threshold
                                  : options_.resource_disable_threshold;
  Strike strike;
  strike.count = ++counter;
  strike.tool = entry->versions.back();
  if (strike.tool.status() == ACTIVE && threshold > 0 &&
      strike.count >= threshold) {
    const std::string reason = absl::StrCat(
        "auto-disabled after ", strike.count,
        violation ? " sandbox violations" : " resource limit breaches");
    strike.tool.set_status(DISABLED);
    strike.tool.set_disabled_reason(reason);
    // Fail closed: the tool stays disabled for this process even if the
    // journal cannot record it.
    strike.journaled = Journal(strike.tool);
    entry->versions.back() = strike.tool;
    strike.disabled = true;
    LOG(WARNING) << "Tool " << tool_id << " " << reason;
    if (!strike.journaled.ok()) {
      LOG(ERROR) << "Disabling " << tool_id
                 << " was not journaled: " << strike.journaled;
    }
  }
  return strike;
}

size_t ToolRegistry::size() const {
  absl::ReaderMutexLock lock(&mutex_);
  return tools_.size();
}

}  // namespace toolguard
