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

// Fixed allow- and block-lists shared by the validator and the interpreter.

#ifndef TOOLGUARD_LANG_ALLOWLIST_H_
#define TOOLGUARD_LANG_ALLOWLIST_H_

#include "absl/strings/string_view.h"

namespace toolguard {

// Why a name is blocked. Used to grade validation failures.
enum class BlockReason {
  kNone,
  kDynamicEvaluation,
  kReflection,
  kSystemPrimitive,
};

BlockReason BlockedNameReason(absl::string_view name);

bool IsAllowedBuiltin(absl::string_view name);

// Method names callable on str, list and dict values.
bool IsAllowedMethod(absl::string_view name);

bool IsAllowedModule(absl::string_view module);

// Functions and constants of an allowed module.
bool IsAllowedModuleMember(absl::string_view module, absl::string_view member);

// True for module members that are values rather than functions (math.pi).
bool IsModuleConstant(absl::string_view module, absl::string_view member);

}  // namespace toolguard

#endif  // TOOLGUARD_LANG_ALLOWLIST_H_
