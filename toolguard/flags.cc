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

#include "toolguard/flags.h"

#include <cstdint>
#include <string>

#include "absl/flags/flag.h"
#include "absl/time/time.h"

// toolguard:sandbox
ABSL_FLAG(absl::Duration, toolguard_wall_time_limit, absl::Seconds(5),
          "Wall-clock limit for one tool execution");
ABSL_FLAG(absl::Duration, toolguard_cpu_time_limit, absl::Seconds(5),
          "CPU-time limit for one tool execution (rounded up to seconds)");
ABSL_FLAG(int64_t, toolguard_memory_limit_mb, 50,
          "Heap ceiling for one tool execution, in MiB, on top of the "
          "footprint the isolated unit starts with");
ABSL_FLAG(int, toolguard_cpu_share_percent, 25,
          "CPU share ceiling for the isolated unit, mapped to a nice level");
ABSL_FLAG(absl::Duration, toolguard_kill_grace, absl::Milliseconds(100),
          "How long to wait for a killed unit to be reaped");
ABSL_FLAG(bool, toolguard_danger_disable_syscall_filter, false,
          "Do not install the seccomp filter in the isolated unit. Only for "
          "debugging on kernels without seccomp support");

// toolguard:rate_limiter
ABSL_FLAG(int, toolguard_create_limit, 5,
          "Tool registrations allowed per principal per window");
ABSL_FLAG(int, toolguard_execute_limit, 200,
          "Tool executions allowed per principal per window");
ABSL_FLAG(absl::Duration, toolguard_rate_window, absl::Hours(24),
          "Length of the fixed rate-limit window");

// toolguard:tool_registry
ABSL_FLAG(int, toolguard_violation_disable_threshold, 3,
          "Sandbox violations after which a tool is disabled automatically");
ABSL_FLAG(int, toolguard_resource_disable_threshold, 3,
          "Resource-limit breaches after which a tool is disabled "
          "automatically");
ABSL_FLAG(std::string, toolguard_registry_journal_path, "",
          "If set, tool definitions are journaled to and replayed from this "
          "file");
ABSL_FLAG(bool, toolguard_require_write_approval, true,
          "Hold read-write tools until an operator approves them");

// toolguard:audit_log
ABSL_FLAG(std::string, toolguard_audit_log_path, "",
          "File security events are persisted to. Required unless "
          "--toolguard_audit_memory_only is set");
ABSL_FLAG(bool, toolguard_audit_memory_only, false,
          "Keep security events in memory only. Critical events are then "
          "not durable; for tests and local experiments");
ABSL_FLAG(absl::Duration, toolguard_audit_flush_interval, absl::Seconds(1),
          "How often buffered (non-critical) security events are flushed");
ABSL_FLAG(int, toolguard_audit_buffer_size, 256,
          "Buffered security events that trigger an early flush");

// toolguard:tool_service
ABSL_FLAG(std::string, toolguard_execution_log_path, "",
          "If set, one record per tool execution is appended to this file");

// toolguard:anomaly_detector
ABSL_FLAG(absl::Duration, toolguard_anomaly_window, absl::Minutes(10),
          "Recent window analysed for bursts, spikes and probing");
ABSL_FLAG(absl::Duration, toolguard_anomaly_baseline_window, absl::Hours(24),
          "History used to compute a principal's baseline execution rate");
ABSL_FLAG(double, toolguard_anomaly_burst_factor, 5.0,
          "Recent rate over baseline rate that counts as a burst");
ABSL_FLAG(int, toolguard_anomaly_min_burst_count, 20,
          "Minimum executions in the recent window for a burst flag");
ABSL_FLAG(double, toolguard_anomaly_error_ratio, 0.5,
          "Failure ratio in the recent window that counts as a spike");
ABSL_FLAG(int, toolguard_anomaly_min_errors, 5,
          "Minimum failures in the recent window for an error-spike flag");
ABSL_FLAG(double, toolguard_anomaly_near_limit_fraction, 0.9,
          "Fraction of a limit above which usage counts as near-limit");
ABSL_FLAG(int, toolguard_anomaly_near_limit_count, 3,
          "Near-limit executions in the recent window that count as probing");
ABSL_FLAG(bool, toolguard_anomaly_feedback, false,
          "Tighten the execute ceiling of flagged principals (advisory)");
ABSL_FLAG(int, toolguard_anomaly_tightened_execute_limit, 20,
          "Execute ceiling applied to flagged principals when feedback is "
          "enabled");
