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

#include "toolguard/capabilities.h"

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"

namespace toolguard {

absl::Status CapabilityCatalog::Register(CapabilitySpec spec) {
  if (spec.name.empty()) {
    return absl::InvalidArgumentError("capability name must not be empty");
  }
  if (specs_.contains(spec.name)) {
    return absl::AlreadyExistsError(
        absl::StrCat("capability '", spec.name, "' already registered"));
  }
  std::string name = spec.name;
  specs_.emplace(std::move(name), std::move(spec));
  return absl::OkStatus();
}

const CapabilitySpec* CapabilityCatalog::Find(absl::string_view name) const {
  auto it = specs_.find(name);
  return it != specs_.end() ? &it->second : nullptr;
}

std::vector<std::string> CapabilityCatalog::Names() const {
  std::vector<std::string> names;
  names.reserve(specs_.size());
  for (const auto& [name, spec] : specs_) {
    names.push_back(name);
  }
  std::sort(names.begin(), names.end());
  return names;
}

}  // namespace toolguard
