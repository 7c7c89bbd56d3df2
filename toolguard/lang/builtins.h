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

// Built-in functions, methods and module members available to tool code.
// The names mirror the allow-list in allowlist.h.

#ifndef TOOLGUARD_LANG_BUILTINS_H_
#define TOOLGUARD_LANG_BUILTINS_H_

#include <optional>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "toolguard/lang/object.h"

namespace toolguard {

// Returns the builtin function bound to `name`, or nullopt.
std::optional<Object> LookupBuiltin(absl::string_view name);

// Calls `receiver.method(*args)` for str, list, tuple and dict receivers.
// AttributeError when the receiver type has no such method.
absl::StatusOr<Object> CallMethod(const Object& receiver,
                                  absl::string_view method, CallArgs& args);

// Resolves `module.member` for the importable modules (math, json).
absl::StatusOr<Object> LoadModuleMember(absl::string_view module,
                                        absl::string_view member);

}  // namespace toolguard

#endif  // TOOLGUARD_LANG_BUILTINS_H_
