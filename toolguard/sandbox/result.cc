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

// Implementation of the toolguard::Result class.

#include "toolguard/sandbox/result.h"

#include <string>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/time/time.h"
#include "toolguard/errors.h"
#include "toolguard/toolguard.pb.h"

namespace toolguard {

absl::Duration Result::cpu_time() const {
  return absl::DurationFromTimeval(rusage_.ru_utime) +
         absl::DurationFromTimeval(rusage_.ru_stime);
}

absl::Status Result::ToStatus() const {
  switch (final_status()) {
    case OK:
      return absl::OkStatus();
    case RUNTIME_ERROR:
      return ExecutionFailedError(ToString());
    case VIOLATION:
      return SandboxViolationError(ToString());
    case TIMEOUT:
      return TimeoutError(ToString());
    case MEMORY_EXCEEDED:
      return MemoryExceededError(ToString());
    case CPU_EXCEEDED:
      return CpuExceededError(ToString());
    default:
      return absl::InternalError(ToString());
  }
}

ExecutionOutcome Result::ToOutcome() const {
  switch (final_status()) {
    case OK:
      return ExecutionOutcome::COMPLETED;
    case RUNTIME_ERROR:
      return ExecutionOutcome::FAILED;
    case VIOLATION:
      return ExecutionOutcome::VIOLATED;
    case TIMEOUT:
      return ExecutionOutcome::TIMED_OUT;
    case MEMORY_EXCEEDED:
      return ExecutionOutcome::MEMORY_EXCEEDED;
    case CPU_EXCEEDED:
      return ExecutionOutcome::CPU_EXCEEDED;
    default:
      return ExecutionOutcome::FAILED;
  }
}

std::string Result::ToString() const {
  switch (final_status()) {
    case UNSET:
      return "UNSET";
    case OK:
      return "OK";
    case RUNTIME_ERROR:
      if (error_line_ > 0) {
        return absl::StrCat("tool raised ", message_, " at line ",
                            error_line_);
      }
      return absl::StrCat("tool raised ", message_);
    case VIOLATION:
      return absl::StrCat("sandbox violation (",
                          ReasonCodeEnumToString(reason_code()),
                          "): ", message_);
    case TIMEOUT:
    case MEMORY_EXCEEDED:
    case CPU_EXCEEDED:
      return message_;
    case SETUP_ERROR:
    case INTERNAL_ERROR:
      return absl::StrCat(StatusEnumToString(final_status()), " - Code: ",
                          ReasonCodeEnumToString(reason_code()),
                          message_.empty() ? "" : ": ", message_);
  }
  return absl::StrCat("<UNKNOWN>(", final_status(), ")");
}

std::string Result::StatusEnumToString(StatusEnum value) {
  switch (value) {
    case UNSET:
      return "UNSET";
    case OK:
      return "OK";
    case RUNTIME_ERROR:
      return "RUNTIME_ERROR";
    case VIOLATION:
      return "VIOLATION";
    case TIMEOUT:
      return "TIMEOUT";
    case MEMORY_EXCEEDED:
      return "MEMORY_EXCEEDED";
    case CPU_EXCEEDED:
      return "CPU_EXCEEDED";
    case SETUP_ERROR:
      return "SETUP_ERROR";
    case INTERNAL_ERROR:
      return "INTERNAL_ERROR";
  }
  return "UNKNOWN";
}

std::string Result::ReasonCodeEnumToString(ReasonCodeEnum value) {
  switch (value) {
    case NO_REASON:
      return "NO_REASON";
    case VIOLATION_SYSCALL:
      return "VIOLATION_SYSCALL";
    case VIOLATION_CAPABILITY:
      return "VIOLATION_CAPABILITY";
    case VIOLATION_PROTOCOL:
      return "VIOLATION_PROTOCOL";
    case VIOLATION_CRASH:
      return "VIOLATION_CRASH";
    case MEMORY_RSS_SAMPLE:
      return "MEMORY_RSS_SAMPLE";
    case MEMORY_ALLOCATION_FAILED:
      return "MEMORY_ALLOCATION_FAILED";
    case CPU_RLIMIT:
      return "CPU_RLIMIT";
    case FAILED_COMMS:
      return "FAILED_COMMS";
    case FAILED_FORK:
      return "FAILED_FORK";
    case FAILED_LIMITS:
      return "FAILED_LIMITS";
    case FAILED_POLICY:
      return "FAILED_POLICY";
    case FAILED_WAIT:
      return "FAILED_WAIT";
    case FAILED_KILL:
      return "FAILED_KILL";
  }
  return absl::StrCat("UNKNOWN: ", value);
}

}  // namespace toolguard
