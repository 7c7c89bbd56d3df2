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

// The toolguard::Executor runs one validated tool invocation in a freshly
// forked process. The process is confined with rlimits and a seccomp filter,
// supervised by a Governor, and can only reach the host through capability
// calls on its comms channel.

#ifndef TOOLGUARD_SANDBOX_EXECUTOR_H_
#define TOOLGUARD_SANDBOX_EXECUTOR_H_

#include <string>

#include "absl/strings/string_view.h"
#include "toolguard/capabilities.h"
#include "toolguard/lang/validator.h"
#include "toolguard/sandbox/limits.h"
#include "toolguard/sandbox/result.h"
#include "toolguard/toolguard.pb.h"

namespace toolguard {

struct ExecutionRequest {
  // Source of a tool that passed validation.
  std::string source;
  // What validation decided about `source`.
  ValidatedTool tool;
  Arguments arguments;
  // Value of `ctx.principal_id`.
  std::string principal_id;
  // Operations the caller grants to this invocation. May be null.
  const CapabilitySet* capabilities = nullptr;
  Limits limits;
};

class Executor {
 public:
  // `catalog` must outlive the executor.
  explicit Executor(const CapabilityCatalog* catalog) : catalog_(catalog) {}

  Executor(const Executor&) = delete;
  Executor& operator=(const Executor&) = delete;

  // Runs the tool's entry point to completion or until a limit is hit. Never
  // blocks longer than the wall-time limit plus the kill grace period.
  // Capability handlers run on threads of their own; one still running at the
  // deadline is abandoned and its reply dropped. Thread-safe.
  Result Execute(const ExecutionRequest& request) const;

 private:
  const CapabilityCatalog* catalog_;
};

}  // namespace toolguard

#endif  // TOOLGUARD_SANDBOX_EXECUTOR_H_
