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

// The toolguard::ToolService is the function-shaped boundary collaborators
// use: it registers tools through the validator, admits every action through
// the rate limiter, runs tools in the sandbox, records every safety-relevant
// failure in the audit log and feeds the anomaly monitor.
//
// Only an active tool whose execution the rate limiter admitted ever reaches
// the sandbox. Read-write tools stay pending until an operator approves them.
// A critical security event that cannot be persisted fails the request that
// triggered it.

#ifndef TOOLGUARD_SERVICE_TOOL_SERVICE_H_
#define TOOLGUARD_SERVICE_TOOL_SERVICE_H_

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "toolguard/anomaly/anomaly_detector.h"
#include "toolguard/audit/audit_log.h"
#include "toolguard/capabilities.h"
#include "toolguard/lang/validator.h"
#include "toolguard/ratelimit/rate_limiter.h"
#include "toolguard/registry/tool_registry.h"
#include "toolguard/sandbox/executor.h"
#include "toolguard/sandbox/limits.h"
#include "toolguard/sandbox/result.h"
#include "toolguard/toolguard.pb.h"
#include "toolguard/util/clock.h"
#include "toolguard/util/record_file.h"

namespace toolguard {

struct InvokeRequest {
  std::string tool_id;
  std::string principal_id;
  Arguments arguments;
  // Operations granted to this invocation. May be null.
  const CapabilitySet* capabilities = nullptr;
  // Tracing id; one is assigned when empty.
  std::string request_id;
};

class ToolService {
 public:
  struct Options {
    Limits limits;
    RateLimiter::Options rate_limiter;
    AuditLog::Options audit_log;
    ToolRegistry::Options registry;
    AnomalyMonitor::Options anomaly;
    // If set, every ExecutionRecord is appended to this file.
    std::string execution_log_path;

    static Options FromFlags();
  };

  // `catalog` and `clock` must outlive the service.
  static absl::StatusOr<std::unique_ptr<ToolService>> Create(
      Options options, const CapabilityCatalog* catalog, util::Clock* clock);

  ToolService(const ToolService&) = delete;
  ToolService& operator=(const ToolService&) = delete;

  // Validates `source` and registers it under `name` (the entry point name
  // when empty). Re-registering a name creates a new version.
  absl::StatusOr<ToolDefinition> RegisterTool(absl::string_view principal_id,
                                              absl::string_view source,
                                              absl::string_view name);

  // Validates `source` and stores it as the next version of `tool_id`.
  absl::StatusOr<ToolDefinition> UpdateTool(absl::string_view tool_id,
                                            absl::string_view principal_id,
                                            absl::string_view source);

  // Runs the current version of a tool owned by the principal.
  absl::StatusOr<Value> InvokeTool(const InvokeRequest& request);

  std::vector<SecurityEvent> QuerySecurityEvents(
      const EventQuery& query) const;

  absl::StatusOr<ToolDefinition> DisableTool(absl::string_view tool_id,
                                             absl::string_view reason);
  absl::StatusOr<ToolDefinition> EnableTool(absl::string_view tool_id);
  absl::StatusOr<ToolDefinition> GetTool(absl::string_view tool_id) const;

  // Operator decisions on read-write tools waiting for approval.
  absl::StatusOr<ToolDefinition> ApproveTool(absl::string_view tool_id,
                                             absl::string_view operator_id);
  absl::StatusOr<ToolDefinition> RejectTool(absl::string_view tool_id,
                                            absl::string_view operator_id,
                                            absl::string_view reason);
  std::vector<ToolDefinition> PendingApprovals() const;

  // Flags raised so far. Empty `principal_id` returns all.
  std::vector<AnomalyFlag> AnomalyFlags(
      absl::string_view principal_id = "") const;

  ToolRegistry* registry() { return registry_.get(); }
  AuditLog* audit_log() { return audit_log_.get(); }
  RateLimiter* rate_limiter() { return &rate_limiter_; }
  AnomalyMonitor* anomaly_monitor() { return anomaly_monitor_.get(); }

  // Reads every record of an execution log file.
  static absl::StatusOr<std::vector<ExecutionRecord>> ReadExecutionLog(
      const std::string& path);

 private:
  ToolService(Options options, const CapabilityCatalog* catalog,
              util::Clock* clock, std::unique_ptr<AuditLog> audit_log,
              std::unique_ptr<ToolRegistry> registry,
              std::unique_ptr<util::RecordWriter> execution_log);

  // Rate check shared by registration and updates.
  absl::Status AdmitCreate(absl::string_view principal_id);
  // Validates `source`, recording a validation failure if it is rejected.
  absl::StatusOr<ValidatedTool> ValidateSource(absl::string_view principal_id,
                                               absl::string_view tool_id,
                                               absl::string_view source);
  // Records `event` and hands it to the anomaly monitor.
  absl::Status RecordEvent(SecurityEvent event);
  // Records the events and strikes that follow from a failed execution.
  absl::Status RecordFailure(const InvokeRequest& request,
                             const ToolDefinition& tool, const Result& result);
  // `journaled` is the registry's result of persisting the disable.
  absl::Status RecordDisabled(const InvokeRequest& request,
                              const ToolDefinition& tool,
                              const absl::Status& journaled);
  ExecutionRecord MakeRecord(const InvokeRequest& request,
                             absl::Time start) const;
  // Hands `record` to the anomaly monitor and the execution log.
  void LogExecution(ExecutionRecord record);
  std::string NextRequestId();

  const Options options_;
  util::Clock* clock_;
  const Validator validator_;
  const Executor executor_;
  RateLimiter rate_limiter_;
  const std::unique_ptr<AuditLog> audit_log_;
  const std::unique_ptr<ToolRegistry> registry_;
  // Null unless an execution log path is configured.
  const std::unique_ptr<util::RecordWriter> execution_log_;
  // Destroyed first so its worker never outlives the rate limiter.
  std::unique_ptr<AnomalyMonitor> anomaly_monitor_;
  std::atomic<uint64_t> next_request_{0};
};

}  // namespace toolguard

#endif  // TOOLGUARD_SERVICE_TOOL_SERVICE_H_
