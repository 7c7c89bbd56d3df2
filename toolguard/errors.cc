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

#include "toolguard/errors.h"

#include <cstdint>
#include <optional>
#include <string>

#include "absl/status/status.h"
#include "absl/strings/cord.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/time/time.h"

namespace toolguard {
namespace {

constexpr absl::string_view kErrorKindUrl = "type.toolguard/ErrorKind";
constexpr absl::string_view kRetryAfterUrl = "type.toolguard/RetryAfterMillis";

constexpr ErrorKind kAllKinds[] = {
    ErrorKind::kValidation,     ErrorKind::kSandboxViolation,
    ErrorKind::kTimeout,        ErrorKind::kMemoryExceeded,
    ErrorKind::kCpuExceeded,    ErrorKind::kRateLimited,
    ErrorKind::kExecutionFailed, ErrorKind::kToolDisabled,
    ErrorKind::kNotFound,
};

absl::Status WithKind(absl::Status status, ErrorKind kind) {
  status.SetPayload(kErrorKindUrl, absl::Cord(ErrorKindName(kind)));
  return status;
}

}  // namespace

absl::Status ValidationError(absl::string_view message) {
  return WithKind(absl::InvalidArgumentError(message), ErrorKind::kValidation);
}

absl::Status SandboxViolationError(absl::string_view message) {
  return WithKind(absl::PermissionDeniedError(message),
                  ErrorKind::kSandboxViolation);
}

absl::Status TimeoutError(absl::string_view message) {
  return WithKind(absl::DeadlineExceededError(message), ErrorKind::kTimeout);
}

absl::Status MemoryExceededError(absl::string_view message) {
  return WithKind(absl::ResourceExhaustedError(message),
                  ErrorKind::kMemoryExceeded);
}

absl::Status CpuExceededError(absl::string_view message) {
  return WithKind(absl::ResourceExhaustedError(message),
                  ErrorKind::kCpuExceeded);
}

absl::Status RateLimitExceededError(absl::string_view message,
                                    absl::Duration retry_after) {
  absl::Status status = WithKind(absl::ResourceExhaustedError(message),
                                 ErrorKind::kRateLimited);
  status.SetPayload(
      kRetryAfterUrl,
      absl::Cord(absl::StrCat(absl::ToInt64Milliseconds(retry_after))));
  return status;
}

absl::Status ExecutionFailedError(absl::string_view message) {
  return WithKind(absl::AbortedError(message), ErrorKind::kExecutionFailed);
}

absl::Status ToolDisabledError(absl::string_view message) {
  return WithKind(absl::FailedPreconditionError(message),
                  ErrorKind::kToolDisabled);
}

absl::Status ToolNotFoundError(absl::string_view message) {
  return WithKind(absl::NotFoundError(message), ErrorKind::kNotFound);
}

ErrorKind GetErrorKind(const absl::Status& status) {
  std::optional<absl::Cord> payload = status.GetPayload(kErrorKindUrl);
  if (!payload.has_value()) {
    return ErrorKind::kUnknown;
  }
  std::string name(*payload);
  for (ErrorKind kind : kAllKinds) {
    if (ErrorKindName(kind) == name) {
      return kind;
    }
  }
  return ErrorKind::kUnknown;
}

std::optional<absl::Duration> GetRetryAfter(const absl::Status& status) {
  std::optional<absl::Cord> payload = status.GetPayload(kRetryAfterUrl);
  if (!payload.has_value()) {
    return std::nullopt;
  }
  int64_t millis;
  if (!absl::SimpleAtoi(std::string(*payload), &millis)) {
    return std::nullopt;
  }
  return absl::Milliseconds(millis);
}

bool IsResourceExceeded(ErrorKind kind) {
  return kind == ErrorKind::kTimeout || kind == ErrorKind::kMemoryExceeded ||
         kind == ErrorKind::kCpuExceeded;
}

absl::string_view ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kUnknown:
      return "unknown";
    case ErrorKind::kValidation:
      return "validation_error";
    case ErrorKind::kSandboxViolation:
      return "sandbox_violation";
    case ErrorKind::kTimeout:
      return "timeout";
    case ErrorKind::kMemoryExceeded:
      return "memory_exceeded";
    case ErrorKind::kCpuExceeded:
      return "cpu_exceeded";
    case ErrorKind::kRateLimited:
      return "rate_limit_exceeded";
    case ErrorKind::kExecutionFailed:
      return "execution_failed";
    case ErrorKind::kToolDisabled:
      return "tool_disabled";
    case ErrorKind::kNotFound:
      return "not_found";
  }
  return "unknown";
}

}  // namespace toolguard
