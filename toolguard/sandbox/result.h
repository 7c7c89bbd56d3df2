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

// The toolguard::Result class describes how a single sandboxed execution
// ended: its final status, the value the tool returned, and the resources it
// consumed.

#ifndef TOOLGUARD_SANDBOX_RESULT_H_
#define TOOLGUARD_SANDBOX_RESULT_H_

#include <sys/resource.h>

#include <cstdint>
#include <string>
#include <utility>

#include "absl/status/status.h"
#include "absl/time/time.h"
#include "toolguard/toolguard.pb.h"

namespace toolguard {

class Result {
 public:
  // Final execution status.
  enum StatusEnum {
    // Not set yet
    UNSET = 0,
    // The tool returned a value
    OK,
    // The tool raised an error
    RUNTIME_ERROR,
    // A safety boundary was hit (syscall filter, capability grant, protocol)
    VIOLATION,
    // Wall-clock limit
    TIMEOUT,
    // Memory limit
    MEMORY_EXCEEDED,
    // CPU-time limit
    CPU_EXCEEDED,
    // The sandboxee could not be started
    SETUP_ERROR,
    // The supervisor failed
    INTERNAL_ERROR,
  };

  // Detailed reason codes
  enum ReasonCodeEnum {
    NO_REASON = 0,

    // Codes used by status=`VIOLATION`:
    // Killed by the seccomp filter (SIGSYS).
    VIOLATION_SYSCALL,
    // Called a capability that was not granted or not permitted by the
    // tool's capability class.
    VIOLATION_CAPABILITY,
    // Sent a malformed or unexpected message.
    VIOLATION_PROTOCOL,
    // Terminated by an unexpected signal or exit code.
    VIOLATION_CRASH,

    // Codes used by status=`MEMORY_EXCEEDED`:
    MEMORY_RSS_SAMPLE,
    MEMORY_ALLOCATION_FAILED,

    // Codes used by status=`CPU_EXCEEDED`:
    CPU_RLIMIT,

    // Codes used by status=`SETUP_ERROR` and `INTERNAL_ERROR`:
    FAILED_COMMS,
    FAILED_FORK,
    FAILED_LIMITS,
    FAILED_POLICY,
    FAILED_WAIT,
    FAILED_KILL,
  };

  Result() = default;

  // The first final status wins; later calls are ignored.
  void SetExitStatusCode(StatusEnum final_status, ReasonCodeEnum reason_code) {
    if (final_status_ != UNSET) {
      return;
    }
    final_status_ = final_status;
    reason_code_ = reason_code;
  }

  StatusEnum final_status() const { return final_status_; }
  ReasonCodeEnum reason_code() const { return reason_code_; }

  // Value returned by the tool, set when final_status() == OK.
  const Value& value() const { return value_; }
  void set_value(Value value) { value_ = std::move(value); }

  // Caller-safe detail: the tool error class, the denied capability, or the
  // breached limit. Never contains host state.
  const std::string& message() const { return message_; }
  void set_message(std::string message) { message_ = std::move(message); }

  // Source line of a tool runtime error, 0 when unknown.
  int error_line() const { return error_line_; }
  void set_error_line(int line) { error_line_ = line; }

  absl::Duration wall_time() const { return wall_time_; }
  void set_wall_time(absl::Duration value) { wall_time_ = value; }

  // Highest resident set size observed by the supervisor.
  int64_t peak_memory_bytes() const { return peak_memory_bytes_; }
  void set_peak_memory_bytes(int64_t value) { peak_memory_bytes_ = value; }

  // User plus system time from the sandboxee's rusage.
  absl::Duration cpu_time() const;
  rusage* GetRUsage() { return &rusage_; }
  const rusage& rusage_sandboxee() const { return rusage_; }

  bool IsResourceBreach() const {
    return final_status_ == TIMEOUT || final_status_ == MEMORY_EXCEEDED ||
           final_status_ == CPU_EXCEEDED;
  }

  // Maps the final status onto the typed errors of errors.h. Only an OK
  // status converts to absl::OkStatus().
  absl::Status ToStatus() const;

  // Outcome recorded on ExecutionRecord.
  ExecutionOutcome ToOutcome() const;

  // Returns a descriptive string for final result.
  std::string ToString() const;

  // Converts StatusEnum to a string.
  static std::string StatusEnumToString(StatusEnum value);

  // Converts ReasonCodeEnum to a string.
  static std::string ReasonCodeEnumToString(ReasonCodeEnum value);

 private:
  StatusEnum final_status_ = UNSET;
  ReasonCodeEnum reason_code_ = NO_REASON;
  Value value_;
  std::string message_;
  int error_line_ = 0;
  absl::Duration wall_time_;
  int64_t peak_memory_bytes_ = 0;
  rusage rusage_ = {};
};

}  // namespace toolguard

#endif  // TOOLGUARD_SANDBOX_RESULT_H_
