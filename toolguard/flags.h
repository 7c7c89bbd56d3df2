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

// Process-wide defaults for toolguard components. Components never read these
// directly; they go through their Options::FromFlags() helpers.

#ifndef TOOLGUARD_FLAGS_H_
#define TOOLGUARD_FLAGS_H_

#include <cstdint>
#include <string>

#include "absl/flags/declare.h"
#include "absl/time/time.h"

// toolguard:sandbox
ABSL_DECLARE_FLAG(absl::Duration, toolguard_wall_time_limit);
ABSL_DECLARE_FLAG(absl::Duration, toolguard_cpu_time_limit);
ABSL_DECLARE_FLAG(int64_t, toolguard_memory_limit_mb);
ABSL_DECLARE_FLAG(int, toolguard_cpu_share_percent);
ABSL_DECLARE_FLAG(absl::Duration, toolguard_kill_grace);
ABSL_DECLARE_FLAG(bool, toolguard_danger_disable_syscall_filter);

// toolguard:rate_limiter
ABSL_DECLARE_FLAG(int, toolguard_create_limit);
ABSL_DECLARE_FLAG(int, toolguard_execute_limit);
ABSL_DECLARE_FLAG(absl::Duration, toolguard_rate_window);

// toolguard:tool_registry
ABSL_DECLARE_FLAG(int, toolguard_violation_disable_threshold);
ABSL_DECLARE_FLAG(int, toolguard_resource_disable_threshold);
ABSL_DECLARE_FLAG(std::string, toolguard_registry_journal_path);
ABSL_DECLARE_FLAG(bool, toolguard_require_write_approval);

// toolguard:audit_log
ABSL_DECLARE_FLAG(std::string, toolguard_audit_log_path);
ABSL_DECLARE_FLAG(bool, toolguard_audit_memory_only);
ABSL_DECLARE_FLAG(absl::Duration, toolguard_audit_flush_interval);
ABSL_DECLARE_FLAG(int, toolguard_audit_buffer_size);

// toolguard:tool_service
ABSL_DECLARE_FLAG(std::string, toolguard_execution_log_path);

// toolguard:anomaly_detector
ABSL_DECLARE_FLAG(absl::Duration, toolguard_anomaly_window);
ABSL_DECLARE_FLAG(absl::Duration, toolguard_anomaly_baseline_window);
ABSL_DECLARE_FLAG(double, toolguard_anomaly_burst_factor);
ABSL_DECLARE_FLAG(int, toolguard_anomaly_min_burst_count);
ABSL_DECLARE_FLAG(double, toolguard_anomaly_error_ratio);
ABSL_DECLARE_FLAG(int, toolguard_anomaly_min_errors);
ABSL_DECLARE_FLAG(double, toolguard_anomaly_near_limit_fraction);
ABSL_DECLARE_FLAG(int, toolguard_anomaly_near_limit_count);
ABSL_DECLARE_FLAG(bool, toolguard_anomaly_feedback);
ABSL_DECLARE_FLAG(int, toolguard_anomaly_tightened_execute_limit);

#endif  // TOOLGUARD_FLAGS_H_
