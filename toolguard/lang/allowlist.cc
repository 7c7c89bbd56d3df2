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

#include "toolguard/lang/allowlist.h"

#include <string>

#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "absl/strings/string_view.h"

namespace toolguard {
namespace {

using NameSet = absl::flat_hash_set<std::string>;

const NameSet& Builtins() {
  static const auto* const kBuiltins = new NameSet{
      "abs",   "all",     "any",      "bool",  "dict", "enumerate", "float",
      "int",   "len",     "list",     "max",   "min",  "range",     "reversed",
      "round", "sorted",  "str",      "sum",   "tuple", "zip",
  };
  return *kBuiltins;
}

const NameSet& Methods() {
  static const auto* const kMethods = new NameSet{
      // str
      "upper", "lower", "strip", "lstrip", "rstrip", "split", "join",
      "replace", "startswith", "endswith", "find", "count", "title",
      "capitalize", "isdigit", "isalpha",
      // list
      "append", "extend", "pop", "insert", "remove", "index", "sort", "copy",
      // dict
      "get", "keys", "values", "items", "update", "setdefault",
  };
  return *kMethods;
}

const absl::flat_hash_map<std::string, NameSet>& Modules() {
  static const auto* const kModules =
      new absl::flat_hash_map<std::string, NameSet>{
          {"math",
           {"sqrt", "floor", "ceil", "fabs", "log", "exp", "pow", "pi", "e",
            "inf"}},
          {"json", {"dumps", "loads"}},
      };
  return *kModules;
}

}  // namespace

BlockReason BlockedNameReason(absl::string_view name) {
  static const auto* const kReasons =
      new absl::flat_hash_map<std::string, BlockReason>{
          {"eval", BlockReason::kDynamicEvaluation},
          {"exec", BlockReason::kDynamicEvaluation},
          {"compile", BlockReason::kDynamicEvaluation},
          {"__import__", BlockReason::kDynamicEvaluation},
          {"globals", BlockReason::kReflection},
          {"locals", BlockReason::kReflection},
          {"vars", BlockReason::kReflection},
          {"getattr", BlockReason::kReflection},
          {"setattr", BlockReason::kReflection},
          {"delattr", BlockReason::kReflection},
          {"dir", BlockReason::kReflection},
          {"type", BlockReason::kReflection},
          {"object", BlockReason::kReflection},
          {"super", BlockReason::kReflection},
          {"memoryview", BlockReason::kReflection},
          {"open", BlockReason::kSystemPrimitive},
          {"input", BlockReason::kSystemPrimitive},
          {"breakpoint", BlockReason::kSystemPrimitive},
          {"help", BlockReason::kSystemPrimitive},
          {"exit", BlockReason::kSystemPrimitive},
          {"quit", BlockReason::kSystemPrimitive},
          {"print", BlockReason::kSystemPrimitive},
          {"os", BlockReason::kSystemPrimitive},
          {"sys", BlockReason::kSystemPrimitive},
          {"subprocess", BlockReason::kSystemPrimitive},
          {"socket", BlockReason::kSystemPrimitive},
          {"shutil", BlockReason::kSystemPrimitive},
          {"pathlib", BlockReason::kSystemPrimitive},
          {"io", BlockReason::kSystemPrimitive},
          {"builtins", BlockReason::kSystemPrimitive},
          {"importlib", BlockReason::kSystemPrimitive},
          {"ctypes", BlockReason::kSystemPrimitive},
          {"multiprocessing", BlockReason::kSystemPrimitive},
          {"threading", BlockReason::kSystemPrimitive},
          {"signal", BlockReason::kSystemPrimitive},
          {"pickle", BlockReason::kSystemPrimitive},
          {"marshal", BlockReason::kSystemPrimitive},
      };
  auto it = kReasons->find(name);
  return it != kReasons->end() ? it->second : BlockReason::kNone;
}

bool IsAllowedBuiltin(absl::string_view name) {
  return Builtins().contains(name);
}

bool IsAllowedMethod(absl::string_view name) {
  return Methods().contains(name);
}

bool IsAllowedModule(absl::string_view module) {
  return Modules().contains(module);
}

bool IsAllowedModuleMember(absl::string_view module,
                           absl::string_view member) {
  auto it = Modules().find(module);
  return it != Modules().end() && it->second.contains(member);
}

bool IsModuleConstant(absl::string_view module, absl::string_view member) {
  return module == "math" &&
         (member == "pi" || member == "e" || member == "inf");
}

}  // namespace toolguard
