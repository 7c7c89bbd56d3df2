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

// The toolguard::ToolRegistry owns tool definitions and their version
// history, tracks per-tool strike counters and disables tools that keep
// misbehaving. Definitions can be journaled to an append-only file and
// replayed on open.

#ifndef TOOLGUARD_REGISTRY_TOOL_REGISTRY_H_
#define TOOLGUARD_REGISTRY_TOOL_REGISTRY_H_

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"
#include "toolguard/toolguard.pb.h"
#include "toolguard/util/clock.h"
#include "toolguard/util/record_file.h"

namespace toolguard {

// Usage of one tool since it was registered or last enabled.
struct ToolStats {
  int violations = 0;
  int resource_exceedances = 0;
  int64_t invocations = 0;
  int64_t failures = 0;
  absl::Time last_used = absl::InfinitePast();
};

// Outcome of counting a violation or resource breach against a tool.
struct Strike {
  // Strikes of this kind so far, this one included.
  int count = 0;
  // True if this strike disabled the tool.
  bool disabled = false;
  // Current definition after the strike.
  ToolDefinition tool;
  // Outcome of journaling the disable. The tool is disabled in memory even
  // when this is an error.
  absl::Status journaled;
};

class ToolRegistry {
 public:
  struct Options {
    // Journal file. Empty keeps definitions in memory only.
    std::string journal_path;
    int violation_disable_threshold = 3;
    int resource_disable_threshold = 3;
    // Holds read-write versions in PENDING_APPROVAL until an operator
    // approves them.
    bool require_write_approval = true;

    static Options FromFlags();
  };

  // Opens the registry, replaying the journal if there is one. `clock` must
  // outlive the registry.
  static absl::StatusOr<std::unique_ptr<ToolRegistry>> Create(
      Options options, util::Clock* clock);

  ToolRegistry(const ToolRegistry&) = delete;
  ToolRegistry& operator=(const ToolRegistry&) = delete;

  // Registers `source` under `name` for `principal_id`. If the principal
  // already owns a tool of that name, a new version of it supersedes the
  // current one; otherwise a new tool id is assigned.
  absl::StatusOr<ToolDefinition> Register(absl::string_view principal_id,
                                          absl::string_view name,
                                          absl::string_view source,
                                          CapabilityClass capability_class);

  // Adds a new version of an existing tool. Only the owner may update it and
  // a disabled tool has to be enabled first. A read-write version needs
  // approval again even if an earlier version had it.
  absl::StatusOr<ToolDefinition> Update(absl::string_view tool_id,
                                        absl::string_view principal_id,
                                        absl::string_view source,
                                        CapabilityClass capability_class);

  // Current version.
  absl::StatusOr<ToolDefinition> Get(absl::string_view tool_id) const;

  // Every version, oldest first.
  absl::StatusOr<std::vector<ToolDefinition>> History(
      absl::string_view tool_id) const;

  // Current versions of the tools owned by `principal_id`, ordered by id.
  std::vector<ToolDefinition> List(absl::string_view principal_id) const;

  // Operator controls. Enabling clears the strike counters and only applies
  // to disabled tools.
  absl::StatusOr<ToolDefinition> Disable(absl::string_view tool_id,
                                         absl::string_view reason);
  absl::StatusOr<ToolDefinition> Enable(absl::string_view tool_id);

  // Decide on a version in PENDING_APPROVAL.
  absl::StatusOr<ToolDefinition> Approve(absl::string_view tool_id,
                                         absl::string_view reviewer);
  absl::StatusOr<ToolDefinition> Reject(absl::string_view tool_id,
                                        absl::string_view reviewer,
                                        absl::string_view reason);

  // Tools waiting for approval, oldest first.
  std::vector<ToolDefinition> PendingApprovals() const;

  absl::StatusOr<ToolStats> Stats(absl::string_view tool_id) const;

  // Counts a finished invocation.
  absl::Status RecordInvocation(absl::string_view tool_id, bool failed);

  // Count strikes against a tool, disabling it once a threshold is reached.
  absl::StatusOr<Strike> RecordViolation(absl::string_view tool_id);
  absl::StatusOr<Strike> RecordResourceExceeded(absl::string_view tool_id);

  size_t size() const;

 private:
  struct Entry {
    // Oldest first; back() is current.
    std::vector<ToolDefinition> versions;
    ToolStats stats;
  };

  ToolRegistry(Options options, util::Clock* clock,
               std::unique_ptr<util::RecordWriter> journal)
      : options_(std::move(options)),
        clock_(clock),
        journal_(std::move(journal)) {}

  absl::Status Replay(ToolDefinition definition)
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);
  absl::StatusOr<Entry*> Find(absl::string_view tool_id)
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);
  absl::StatusOr<const Entry*> Find(absl::string_view tool_id) const
      ABSL_SHARED_LOCKS_REQUIRED(mutex_);
  // Appends a new current version to `entry`.
  absl::StatusOr<ToolDefinition> AddVersion(Entry& entry,
                                            absl::string_view source,
                                            CapabilityClass capability_class)
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);
  absl::StatusOr<ToolDefinition> SetStatus(Entry& entry, ToolStatus status,
                                           absl::string_view reason)
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);
  absl::Status Journal(const ToolDefinition& definition)
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);
  // Status a newly stored version starts in.
  ToolStatus InitialStatus(CapabilityClass capability_class) const;
  absl::StatusOr<ToolDefinition> Review(absl::string_view tool_id,
                                        ToolStatus status,
                                        absl::string_view reviewer,
                                        absl::string_view reason);
  absl::StatusOr<Strike> AddStrike(absl::string_view tool_id, bool violation);

  const Options options_;
  util::Clock* clock_;
  // Null for memory-only registries.
  const std::unique_ptr<util::RecordWriter> journal_;

  mutable absl::Mutex mutex_;
  absl::flat_hash_map<std::string, Entry> tools_ ABSL_GUARDED_BY(mutex_);
  // (principal, name) -> tool id.
  absl::flat_hash_map<std::pair<std::string, std::string>, std::string>
      names_ ABSL_GUARDED_BY(mutex_);
  uint64_t next_sequence_ ABSL_GUARDED_BY(mutex_) = 0;
};

}  // namespace toolguard

#endif  // TOOLGUARD_REGISTRY_TOOL_REGISTRY_H_
