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

// Typed error kinds returned across the toolguard boundary. Each kind is an
// absl::Status with a canonical code plus a payload naming the kind, so
// callers can branch on GetErrorKind() without parsing messages.

#ifndef TOOLGUARD_ERRORS_H_
#define TOOLGUARD_ERRORS_H_

#include <optional>
#include <string>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "absl/time/time.h"

namespace toolguard {

enum class ErrorKind {
  kUnknown = 0,
  // Source rejected at registration; safe to show to the author.
  kValidation,
  // A runtime safety boundary was hit.
  kSandboxViolation,
  // Wall-clock limit breached.
  kTimeout,
  // Memory limit breached.
  kMemoryExceeded,
  // CPU-time limit breached.
  kCpuExceeded,
  // Principal exceeded its create/execute ceiling.
  kRateLimited,
  // The tool raised an error; the message carries no host details.
  kExecutionFailed,
  // The tool exists but is disabled.
  kToolDisabled,
  // No such tool.
  kNotFound,
};

absl::Status ValidationError(absl::string_view message);
absl::Status SandboxViolationError(absl::string_view message);
absl::Status TimeoutError(absl::string_view message);
absl::Status MemoryExceededError(absl::string_view message);
absl::Status CpuExceededError(absl::string_view message);
absl::Status RateLimitExceededError(absl::string_view message,
                                    absl::Duration retry_after);
absl::Status ExecutionFailedError(absl::string_view message);
absl::Status ToolDisabledError(absl::string_view message);
absl::Status ToolNotFoundError(absl::string_view message);

// Returns kUnknown for OK statuses and statuses not produced above.
ErrorKind GetErrorKind(const absl::Status& status);

// Remaining cooldown of a kRateLimited status.
std::optional<absl::Duration> GetRetryAfter(const absl::Status& status);

// True for the resource breach kinds (time, memory, cpu).
bool IsResourceExceeded(ErrorKind kind);

absl::string_view ErrorKindName(ErrorKind kind);

}  // namespace toolguard

#endif  // TOOLGUARD_ERRORS_H_
