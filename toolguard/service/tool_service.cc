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

#include "toolguard/service/tool_service.h"

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
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"
#include "absl/time/time.h"
#include "toolguard/anomaly/anomaly_detector.h"
#include "toolguard/audit/audit_log.h"
#include "toolguard/errors.h"
#include "toolguard/flags.h"
#include "toolguard/lang/ast.h"
#include "toolguard/lang/validator.h"
#include "toolguard/ratelimit/rate_limiter.h"
#include "toolguard/registry/tool_registry.h"
#include "toolguard/sandbox/executor.h"
#include "toolguard/sandbox/result.h"
#include "toolguard/toolguard.pb.h"
#include "toolguard/util/record_file.h"
#include "toolguard/util/status_macros.h"

namespace toolguard {
namespace {

// The source lines around `line`, or the whole source when the line is not
// known.
std::string Excerpt(absl::string_view source, int line) {
  if (line <= 0) {
    return std::string(source);
  }
  std::vector<absl::string_view> lines = absl::StrSplit(source, '\n');
  const int first = std::max(1, line - 1);
  const int last = std::min(static_cast<int>(lines.size()), line + 1);
  if (first > last) {
    return std::string(source);
  }
  return absl::StrJoin(lines.begin() + (first - 1), lines.begin() + last,
                       "\n");
}

// Why a tool that is not ACTIVE cannot run.
std::string NotRunnableReason(const ToolDefinition& tool) {
  switch (tool.status()) {
    case PENDING_APPROVAL:
      return absl::StrCat(tool.tool_id(), " is awaiting operator approval");
    case REJECTED:
      return absl::StrCat(tool.tool_id(),
                          " was rejected: ", tool.disabled_reason());
    default:
      return absl::StrCat(tool.tool_id(),
                          " is disabled: ", tool.disabled_reason());
  }
}

absl::string_view BreachKind(const Result& result) {
  switch (result.final_status()) {
    case Result::TIMEOUT:
      return "time";
    case Result::MEMORY_EXCEEDED:
      return "memory";
    case Result::CPU_EXCEEDED:
      return "cpu";
    default:
      return "none";
  }
}

}  // namespace

ToolService::Options ToolService::Options::FromFlags() {
  Options options;
  options.limits = Limits::FromFlags();
  options.rate_limiter = RateLimiter::Options::FromFlags();
  options.audit_log = AuditLog::Options::FromFlags();
  options.registry = ToolRegistry::Options::FromFlags();
  options.anomaly = AnomalyMonitor::Options::FromFlags();
  options.execution_log_path =
      absl::GetFlag(FLAGS_toolguard_execution_log_path);
  return options;
}

absl::StatusOr<std::unique_ptr<ToolService>> ToolService::Create(
    Options options, const CapabilityCatalog* catalog, util::Clock* clock) {
  TOOLGUARD_ASSIGN_OR_RETURN(std::unique_ptr<AuditLog> audit_log,
                             AuditLog::Create(options.audit_log, clock));
  TOOLGUARD_ASSIGN_OR_RETURN(std::unique_ptr<ToolRegistry> registry,
                             ToolRegistry::Create(options.registry, clock));
  std::unique_ptr<util::RecordWriter> execution_log;
  if (!options.execution_log_path.empty()) {
    TOOLGUARD_ASSIGN_OR_RETURN(
        execution_log, util::RecordWriter::Open(options.execution_log_path));
  }
  return absl::WrapUnique(new ToolService(
      std::move(options), catalog, clock, std::move(audit_log),
      std::move(registry), std::move(execution_log)));
}

ToolService::ToolService(Options options, const CapabilityCatalog* catalog,
                         util::Clock* clock,
                         std::unique_ptr<AuditLog> audit_log,
                         std::unique_ptr<ToolRegistry> registry,
                         std::unique_ptr<util::RecordWriter> execution_log)
    : options_(std::move(options)),
      clock_(clock),
      validator_(catalog),
      executor_(catalog),
      rate_limiter_(options_.rate_limiter, clock),
      audit_log_(std::move(audit_log)),
      registry_(std::move(registry)),
      execution_log_(std::move(execution_log)),
      anomaly_monitor_(std::make_unique<AnomalyMonitor>(
          options_.anomaly, clock, &rate_limiter_)) {}

std::string ToolService::NextRequestId() {
  return absl::StrCat("req-", absl::ToUnixMicros(clock_->Now()), "-",
                      next_request_.fetch_add(1));
}

absl::Status ToolService::RecordEvent(SecurityEvent event) {
  TOOLGUARD_ASSIGN_OR_RETURN(SecurityEvent stored,
                             audit_log_->Record(std::move(event)));
  VLOG(1) << "Recorded " << EventTypeName(stored.type()) << " event "
          << stored.event_id() << " (" << SeverityName(stored.severity())
          << ")";
  anomaly_monitor_->ObserveEvent(std::move(stored));
  return absl::OkStatus();
}

absl::Status ToolService::AdmitCreate(absl::string_view principal_id) {
  absl::Status admitted = rate_limiter_.Admit(principal_id, RateAction::kCreate);
  if (admitted.ok()) {
    return admitted;
  }
  SecurityEvent event;
  event.set_type(RATE_LIMITED);
  event.set_principal_id(std::string(principal_id));
  event.set_severity(LOW);
  (*event.mutable_detail())["action"] = std::string(RateActionName(RateAction::kCreate));
  (*event.mutable_detail())["message"] = std::string(admitted.message());
  TOOLGUARD_RETURN_IF_ERROR(RecordEvent(std::move(event)));
  return admitted;
}

absl::StatusOr<ValidatedTool> ToolService::ValidateSource(
    absl::string_view principal_id, absl::string_view tool_id,
    absl::string_view source) {
  ValidationReport report = validator_.Analyze(source);
  if (report.ok()) {
    return report.tool;
  }
  const Finding& first = report.findings.front();
  SecurityEvent event;
  event.set_type(VALIDATION_FAILURE);
  event.set_principal_id(std::string(principal_id));
  event.set_tool_id(std::string(tool_id));
  event.set_code_excerpt(Excerpt(source, first.line));
  event.set_severity(ValidationFailureSeverity(report.HighRisk()));
  auto& detail = *event.mutable_detail();
  detail["node_kind"] = std::string(NodeKindName(first.kind));
  detail["line"] = absl::StrCat(first.line);
  detail["column"] = absl::StrCat(first.column);
  detail["reason"] = first.message;
  detail["findings"] = absl::StrCat(report.findings.size());
  TOOLGUARD_RETURN_IF_ERROR(RecordEvent(std::move(event)));
  LOG(INFO) << "Rejected tool source from " << principal_id << ": "
            << first.ToString();
  return report.ToStatus();
}

absl::StatusOr<ToolDefinition> ToolService::RegisterTool(
    absl::string_view principal_id, absl::string_view source,
    absl::string_view name) {
  TOOLGUARD_RETURN_IF_ERROR(AdmitCreate(principal_id));
  TOOLGUARD_ASSIGN_OR_RETURN(ValidatedTool tool,
                             ValidateSource(principal_id, "", source));
  return registry_->Register(principal_id,
                             name.empty() ? tool.entry_point : name, source,
                             tool.capability_class);
}

absl::StatusOr<ToolDefinition> ToolService::UpdateTool(
    absl::string_view tool_id, absl::string_view principal_id,
    absl::string_view source) {
  TOOLGUARD_RETURN_IF_ERROR(AdmitCreate(principal_id));
  TOOLGUARD_ASSIGN_OR_RETURN(ValidatedTool tool,
                             ValidateSource(principal_id, tool_id, source));
  return registry_->Update(tool_id, principal_id, source,
                           tool.capability_class);
}

ExecutionRecord ToolService::MakeRecord(const InvokeRequest& request,
                                        absl::Time start) const {
  ExecutionRecord record;
  record.set_request_id(request.request_id);
  record.set_tool_id(request.tool_id);
  record.set_principal_id(request.principal_id);
  record.set_start_time_unix_micros(absl::ToUnixMicros(start));
  record.set_wall_time_limit_micros(
      absl::ToInt64Microseconds(options_.limits.wall_time_limit()));
  record.set_cpu_time_limit_micros(
      absl::ToInt64Microseconds(options_.limits.cpu_time_limit()));
  record.set_memory_limit_bytes(options_.limits.memory_limit_bytes());
  return record;
}

void ToolService::LogExecution(ExecutionRecord record) {
  if (execution_log_ != nullptr) {
    if (absl::Status status = execution_log_->Append(record, /*sync=*/false);
        !status.ok()) {
      LOG(ERROR) << "Execution record of request " << record.request_id()
                 << " not logged: " << status;
    }
  }
  anomaly_monitor_->ObserveExecution(std::move(record));
}

absl::StatusOr<Value> ToolService::InvokeTool(const InvokeRequest& original) {
  InvokeRequest request = original;
  if (request.request_id.empty()) {
    request.request_id = NextRequestId();
  }
  const absl::Time start = clock_->Now();

  // RECEIVED -> RATE_CHECKED, or RATE_REJECTED.
  if (absl::Status admitted =
          rate_limiter_.Admit(request.principal_id, RateAction::kExecute);
      !admitted.ok()) {
    SecurityEvent event;
    event.set_type(RATE_LIMITED);
    event.set_tool_id(request.tool_id);
    event.set_principal_id(request.principal_id);
    event.set_request_id(request.request_id);
    event.set_severity(LOW);
    (*event.mutable_detail())["action"] =
        std::string(RateActionName(RateAction::kExecute));
    (*event.mutable_detail())["message"] = std::string(admitted.message());
    TOOLGUARD_RETURN_IF_ERROR(RecordEvent(std::move(event)));
    ExecutionRecord record = MakeRecord(request, start);
    record.set_outcome(ExecutionOutcome::RATE_REJECTED);
    record.set_error_message(std::string(admitted.message()));
    LogExecution(std::move(record));
    return admitted;
  }

  TOOLGUARD_ASSIGN_OR_RETURN(ToolDefinition tool,
                             registry_->Get(request.tool_id));
  if (tool.principal_id() != request.principal_id) {
    return ToolNotFoundError(absl::StrCat("no tool ", request.tool_id));
  }
  if (tool.status() != ACTIVE) {
    return ToolDisabledError(NotRunnableReason(tool));
  }
  // Validation is deterministic, so this only fails if the allow-list
  // changed since the tool was registered.
  TOOLGUARD_ASSIGN_OR_RETURN(ValidatedTool validated,
                             validator_.Validate(tool.source()));

  // SANDBOXED.
  ExecutionRequest execution;
  execution.source = tool.source();
  execution.tool = std::move(validated);
  execution.arguments = request.arguments;
  execution.principal_id = request.principal_id;
  execution.capabilities = request.capabilities;
  execution.limits = options_.limits;
  VLOG(1) << "Executing " << tool.tool_id() << " v" << tool.version()
          << " for request " << request.request_id;
  Result result = executor_.Execute(execution);
  VLOG(1) << "Request " << request.request_id << " finished: "
          << result.ToString();

  if (result.final_status() == Result::SETUP_ERROR ||
      result.final_status() == Result::INTERNAL_ERROR) {
    LOG(ERROR) << "Could not execute " << tool.tool_id() << " for request "
               << request.request_id << ": " << result.ToString();
    return result.ToStatus();
  }

  ExecutionRecord record = MakeRecord(request, start);
  record.set_tool_version(tool.version());
  record.set_outcome(result.ToOutcome());
  record.set_wall_time_micros(absl::ToInt64Microseconds(result.wall_time()));
  record.set_cpu_time_micros(absl::ToInt64Microseconds(result.cpu_time()));
  record.set_peak_memory_bytes(result.peak_memory_bytes());
  if (result.final_status() != Result::OK) {
    record.set_error_message(result.message());
  }
  LogExecution(std::move(record));

  const bool completed = result.final_status() == Result::OK;
  TOOLGUARD_RETURN_IF_ERROR(
      registry_->RecordInvocation(tool.tool_id(), !completed));
  if (completed) {
    return result.value();
  }
  TOOLGUARD_RETURN_IF_ERROR(RecordFailure(request, tool, result));
  return result.ToStatus();
}

absl::Status ToolService::RecordFailure(const InvokeRequest& request,
                                        const ToolDefinition& tool,
                                        const Result& result) {
  SecurityEvent event;
  event.set_tool_id(tool.tool_id());
  event.set_tool_version(tool.version());
  event.set_principal_id(request.principal_id);
  event.set_request_id(request.request_id);
  event.set_code_excerpt(Excerpt(tool.source(), result.error_line()));
  auto& detail = *event.mutable_detail();
  detail["status"] = Result::StatusEnumToString(result.final_status());
  detail["reason"] = Result::ReasonCodeEnumToString(result.reason_code());
  detail["message"] = result.message();
  detail["wall_time_ms"] =
      absl::StrCat(absl::ToInt64Milliseconds(result.wall_time()));
  detail["peak_memory_bytes"] = absl::StrCat(result.peak_memory_bytes());

  // Severity depends on earlier strikes, counted before this one is added.
  absl::StatusOr<ToolStats> stats = registry_->Stats(tool.tool_id());
  const bool violation = result.final_status() == Result::VIOLATION;
  int prior_strikes = 0;
  if (violation) {
    event.set_type(SANDBOX_VIOLATION);
    event.set_severity(SandboxViolationSeverity(
        result.reason_code() == Result::VIOLATION_SYSCALL));
    prior_strikes = stats.ok() ? stats->violations : 0;
  } else if (result.IsResourceBreach()) {
    event.set_type(RESOURCE_EXCEEDED);
    detail["breach"] = std::string(BreachKind(result));
    prior_strikes = stats.ok() ? stats->resource_exceedances : 0;
    event.set_severity(ResourceExceededSeverity(prior_strikes));
  } else {
    // A tool runtime error is not a safety event.
    return absl::OkStatus();
  }
  detail["strikes"] = absl::StrCat(prior_strikes + 1);
  // The event is recorded before the strike so that a registry failure
  // cannot suppress it.
  TOOLGUARD_RETURN_IF_ERROR(RecordEvent(std::move(event)));

  absl::StatusOr<Strike> strike =
      violation ? registry_->RecordViolation(tool.tool_id())
                : registry_->RecordResourceExceeded(tool.tool_id());
  if (!strike.ok()) {
    LOG(ERROR) << "Strike against " << tool.tool_id()
               << " not counted: " << strike.status();
    return absl::OkStatus();
  }
  if (strike->disabled) {
    TOOLGUARD_RETURN_IF_ERROR(
        RecordDisabled(request, strike->tool, strike->journaled));
  }
  return absl::OkStatus();
}

absl::Status ToolService::RecordDisabled(const InvokeRequest& request,
                                         const ToolDefinition& tool,
                                         const absl::Status& journaled) {
  SecurityEvent event;
  event.set_type(TOOL_DISABLED);
  event.set_tool_id(tool.tool_id());
  event.set_tool_version(tool.version());
  event.set_principal_id(tool.principal_id());
  event.set_request_id(request.request_id);
  event.set_code_excerpt(tool.source());
  event.set_severity(CRITICAL);
  (*event.mutable_detail())["reason"] = tool.disabled_reason();
  if (!journaled.ok()) {
    (*event.mutable_detail())["journal_error"] =
        std::string(journaled.message());
  }
  return RecordEvent(std::move(event));
}

std::vector<SecurityEvent> ToolService::QuerySecurityEvents(
    const EventQuery& query) const {
  return audit_log_->Query(query);
}

absl::StatusOr<ToolDefinition> ToolService::DisableTool(
    absl::string_view tool_id, absl::string_view reason) {
  return registry_->Disable(tool_id, reason);
}

absl::StatusOr<ToolDefinition> ToolService::EnableTool(
    absl::string_view tool_id) {
  return registry_->Enable(tool_id);
}

absl::StatusOr<ToolDefinition> ToolService::GetTool(
    absl::string_view tool_id) const {
  return registry_->Get(tool_id);
}

absl::StatusOr<ToolDefinition> ToolService::ApproveTool(
    absl::string_view tool_id, absl::string_view operator_id) {
  return registry_->Approve(tool_id, operator_id);
}

absl::StatusOr<ToolDefinition> ToolService::RejectTool(
    absl::string_view tool_id, absl::string_view operator_id,
    absl::string_view reason) {
  return registry_->Reject(tool_id, operator_id, reason);
}

std::vector<ToolDefinition> ToolService::PendingApprovals() const {
  return registry_->PendingApprovals();
}

absl::StatusOr<std::vector<ExecutionRecord>> ToolService::ReadExecutionLog(
    const std::string& path) {
  std::vector<ExecutionRecord> records;
  TOOLGUARD_RETURN_IF_ERROR(util::ReadRecordsAs<ExecutionRecord>(
      path, [&records](ExecutionRecord record) {
        records.push_back(std::move(record));
        return absl::OkStatus();
      }));
  return records;
}

std::vector<AnomalyFlag> ToolService::AnomalyFlags(
    absl::string_view principal_id) const {
  return anomaly_monitor_->Flags(principal_id);
}

}  // namespace toolguard
